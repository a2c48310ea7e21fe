/**
 * @file HumanArbitrationService.cpp
 * @brief Implementation of HumanArbitrationService.
 */

#include "application/HumanArbitrationService.hpp"
#include "infrastructure/CanonicalSerializer.hpp"
#include "infrastructure/TimeUtils.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace medoracle::application {

HumanArbitrationService::HumanArbitrationService(std::shared_ptr<domain::HumanReviewer> reviewer,
                                                 std::string reviewerId,
                                                 double confidenceThreshold)
    : m_reviewer(std::move(reviewer)),
      m_reviewerId(std::move(reviewerId)),
      m_confidenceThreshold(confidenceThreshold) {
    if (!m_reviewer) {
        throw std::invalid_argument("HumanArbitrationService: reviewer is required.");
    }
    const std::string prefix = ReviewerPrefix;
    if (m_reviewerId.size() <= prefix.size() || m_reviewerId.compare(0, prefix.size(), prefix) != 0) {
        throw std::invalid_argument("HumanArbitrationService: reviewer id must start with HITL_, got '" +
                                    m_reviewerId + "'.");
    }
}

void HumanArbitrationService::logDiscrepancies(
    const std::string& originalText,
    const std::vector<std::optional<domain::NodeAttestation>>& attestations) const {
    std::cout << "[Arbitration] Consensus failed. Escalating to " << m_reviewerId << "." << std::endl;
    std::cout << "[Arbitration] Original text: " << originalText << std::endl;
    for (std::size_t i = 0; i < attestations.size(); ++i) {
        const auto& a = attestations[i];
        if (!a) {
            std::cout << "[Arbitration]   node #" << i << ": abstained or did not respond" << std::endl;
            continue;
        }
        std::ostringstream ents;
        for (std::size_t k = 0; k < a->package.entities.size(); ++k) {
            const auto& e = a->package.entities[k];
            if (k > 0) ents << ", ";
            ents << e.text << "(" << e.label << ")";
        }
        std::cout << "[Arbitration]   " << a->nodeId << ": " << ents.str() << std::endl;
    }
}

domain::CorrectedRecord HumanArbitrationService::Arbitrate(
    const std::string& originalText,
    const std::vector<std::optional<domain::NodeAttestation>>& attestations) {
    logDiscrepancies(originalText, attestations);

    domain::ArbitrationCase arbitrationCase{originalText, attestations};
    domain::ReviewDecision decision = m_reviewer->Review(arbitrationCase);

    if (decision.reason.empty()) {
        throw std::invalid_argument("HumanArbitrationService: correction reason cannot be empty.");
    }
    if (!infrastructure::CanonicalSerializer::IsEncodable(decision.reason)) {
        throw std::invalid_argument("HumanArbitrationService: correction reason is not valid UTF-8.");
    }
    for (const auto& e : decision.entities) {
        if (e.text.empty() || e.label.empty()) {
            throw std::invalid_argument("HumanArbitrationService: corrected entity needs text and label.");
        }
        if (!infrastructure::CanonicalSerializer::IsEncodable(e.text) ||
            !infrastructure::CanonicalSerializer::IsEncodable(e.label)) {
            throw std::invalid_argument("HumanArbitrationService: corrected entity is not valid UTF-8.");
        }
        // Written so that NaN fails the range check.
        if (!(e.confidence >= m_confidenceThreshold && e.confidence <= 1.0)) {
            throw std::invalid_argument("HumanArbitrationService: confidence of '" + e.text +
                                        "' outside [threshold, 1].");
        }
    }

    domain::CorrectedRecord corrected;
    corrected.entities = std::move(decision.entities);
    corrected.correctionReason = std::move(decision.reason);
    corrected.validatorId = m_reviewerId;
    corrected.timestamp = infrastructure::TimeUtils::NowIso8601();

    std::cout << "[Arbitration] Correction applied by " << m_reviewerId << " ("
              << corrected.entities.size() << " entities)." << std::endl;
    return corrected;
}

} // namespace medoracle::application
