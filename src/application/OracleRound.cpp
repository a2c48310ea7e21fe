/**
 * @file OracleRound.cpp
 * @brief Implementation of OracleRound.
 */

#include "application/OracleRound.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CanonicalSerializer.hpp"

#include <future>
#include <iostream>
#include <stdexcept>

namespace medoracle::application {

OracleRound::OracleRound(PipelineServices services, RoundSettings settings, domain::Rule rule)
    : m_services(std::move(services)), m_settings(settings), m_rule(std::move(rule)) {
    if (!m_services.extractor || !m_services.vocabulary || !m_services.coordinator ||
        !m_services.arbitration || !m_services.ledger || !m_services.recordStore ||
        !m_services.ruleEngine) {
        throw std::invalid_argument("OracleRound: missing pipeline service.");
    }
    if (!m_services.taskManager) {
        m_services.taskManager = std::make_shared<AsyncTaskManager>();
    }
    if (m_settings.threshold < 1 || m_settings.threshold > static_cast<int>(m_services.validators.size())) {
        throw std::invalid_argument("OracleRound: threshold must be between 1 and the number of validators.");
    }
}

std::vector<domain::AnnotatedToken> OracleRound::extract(const std::string& text) const {
    try {
        return m_services.extractor->Extract(text);
    } catch (const domain::ExtractionUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        throw domain::ExtractionUnavailableError(std::string("Entity extractor failed: ") + e.what());
    }
}

std::vector<std::optional<domain::NodeAttestation>> OracleRound::CollectAttestations(
    const std::vector<domain::AnnotatedToken>& tokens) const {
    using Result = std::optional<domain::NodeAttestation>;

    // Shared, immutable inputs; a timed-out task may outlive this call.
    auto sharedTokens = std::make_shared<const std::vector<domain::AnnotatedToken>>(tokens);
    auto vocabulary = m_services.vocabulary;

    std::vector<std::future<Result>> futures;
    futures.reserve(m_services.validators.size());
    for (const auto& validator : m_services.validators) {
        auto promise = std::make_shared<std::promise<Result>>();
        futures.push_back(promise->get_future());
        m_services.taskManager->SubmitTask(TaskType::NodeValidation, "Validate on " + validator->getNodeId(),
            [validator, sharedTokens, vocabulary, promise](std::shared_ptr<TaskStatus>) {
                promise->set_value(validator->Attest(*sharedTokens, *vocabulary));
            });
    }

    const auto deadline = std::chrono::steady_clock::now() + m_settings.nodeTimeout;
    std::vector<Result> attestations;
    attestations.reserve(futures.size());
    for (std::size_t i = 0; i < futures.size(); ++i) {
        const std::string& nodeId = m_services.validators[i]->getNodeId();
        if (futures[i].wait_until(deadline) != std::future_status::ready) {
            std::cerr << "[OracleRound] " << nodeId << " did not respond within "
                      << m_settings.nodeTimeout.count() << " ms; counted as abstain." << std::endl;
            attestations.emplace_back(std::nullopt);
            continue;
        }
        try {
            attestations.push_back(futures[i].get());
        } catch (const std::exception& e) {
            std::cerr << "[OracleRound] " << nodeId << " task failed: " << e.what() << "; counted as abstain." << std::endl;
            attestations.emplace_back(std::nullopt);
        }
    }
    return attestations;
}

RoundReport OracleRound::Run(const std::string& runId, const std::string& text) {
    std::cout << "[OracleRound] Starting round '" << runId << "' with "
              << m_services.validators.size() << " nodes." << std::endl;

    if (!m_services.recordStore->IsValidKey(runId)) {
        throw std::invalid_argument("OracleRound: run id '" + runId + "' is not a valid record key.");
    }

    RoundReport report;
    report.runId = runId;

    const std::vector<domain::AnnotatedToken> tokens = extract(text);
    report.attestations = CollectAttestations(tokens);

    domain::ConsensusOutcome outcome = m_services.coordinator->Reconcile(report.attestations, m_settings.threshold);
    if (outcome.isApproved()) {
        const auto& approved = outcome.approved();
        report.record = domain::CanonicalRecord::FromConsensus(
            approved.canonicalPackage,
            approved.unanimous ? domain::Provenance::Consensus : domain::Provenance::ConsensusPlurality);
        std::cout << "[OracleRound] Data approved by consensus. Ready for the ledger." << std::endl;
    } else {
        domain::CorrectedRecord corrected = m_services.arbitration->Arbitrate(text, report.attestations);
        report.record = domain::CanonicalRecord::FromCorrection(corrected);
        report.correction = std::move(corrected);
    }
    report.outcome = std::move(outcome);

    // Everything that can be rejected is checked before the ledger sees the record.
    domain::PersistedRecord persisted;
    persisted.record = report.record;
    persisted.digest = infrastructure::CanonicalSerializer::DigestOf(report.record);
    if (report.outcome->isApproved()) {
        persisted.signatures = report.outcome->approved().contributingSignatures;
    }
    persisted.commitment.storeKey = runId;
    infrastructure::CanonicalSerializer::Serialize(persisted);

    report.digest = persisted.digest;
    report.commitment = m_services.ledger->Commit(report.record, runId);
    persisted.commitment = report.commitment;

    try {
        m_services.recordStore->Put(runId, persisted);
    } catch (const std::exception& e) {
        std::cerr << "[OracleRound] Run '" << runId << "' is committed to the ledger but its record was not stored: "
                  << e.what() << std::endl;
        throw;
    }

    report.evaluation = m_services.ruleEngine->Evaluate(report.record, report.commitment, m_rule);
    return report;
}

std::optional<domain::RuleEvaluationResult> OracleRound::EvaluateStored(const std::string& runId) const {
    auto persisted = m_services.recordStore->Get(runId);
    if (!persisted) {
        std::cerr << "[OracleRound] No stored record for '" << runId << "'." << std::endl;
        return std::nullopt;
    }
    // The ledger, not the stored copy, is the authority for the commitment.
    auto commitment = m_services.ledger->Find(runId);
    if (!commitment) {
        std::cerr << "[OracleRound] No ledger commitment for '" << runId << "'." << std::endl;
        return std::nullopt;
    }
    return m_services.ruleEngine->Evaluate(persisted->record, *commitment, m_rule);
}

} // namespace medoracle::application
