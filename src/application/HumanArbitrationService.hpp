/**
 * @file HumanArbitrationService.hpp
 * @brief Human-in-the-loop fallback invoked after consensus failure.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/CanonicalRecord.hpp"
#include "domain/HumanReviewer.hpp"

namespace medoracle::application {

/**
 * @class HumanArbitrationService
 * @brief Produces the authoritative CorrectedRecord for a failed round.
 *
 * The correction replaces all oracle output; nothing from the attestations
 * is merged into it.
 */
class HumanArbitrationService {
public:
    static constexpr const char* ReviewerPrefix = "HITL_";

    /**
     * @param reviewerId Identity stamped on every correction; must start with "HITL_".
     * @param confidenceThreshold Corrections may not carry entities below this.
     * @throws std::invalid_argument on a reviewer id outside the HITL_ namespace.
     */
    HumanArbitrationService(std::shared_ptr<domain::HumanReviewer> reviewer,
                            std::string reviewerId,
                            double confidenceThreshold = 0.7);

    domain::CorrectedRecord Arbitrate(const std::string& originalText,
                                      const std::vector<std::optional<domain::NodeAttestation>>& attestations);

private:
    void logDiscrepancies(const std::string& originalText,
                          const std::vector<std::optional<domain::NodeAttestation>>& attestations) const;

    std::shared_ptr<domain::HumanReviewer> m_reviewer;
    std::string m_reviewerId;
    double m_confidenceThreshold;
};

} // namespace medoracle::application
