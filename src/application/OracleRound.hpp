/**
 * @file OracleRound.hpp
 * @brief One end-to-end run: extraction, node attestation, consensus or arbitration, commit, rule.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "application/PipelineServices.hpp"
#include "domain/ConsensusOutcome.hpp"
#include "domain/Rule.hpp"

namespace medoracle::application {

struct RoundSettings {
    int threshold = 2;
    std::chrono::milliseconds nodeTimeout{2000};
};

/**
 * @struct RoundReport
 * @brief Everything a round produced. Exactly one of approved consensus or correction is present.
 */
struct RoundReport {
    std::string runId;
    std::vector<std::optional<domain::NodeAttestation>> attestations;
    std::optional<domain::ConsensusOutcome> outcome;
    std::optional<domain::CorrectedRecord> correction;
    domain::CanonicalRecord record;
    domain::Digest digest{};
    domain::LedgerCommitment commitment;
    domain::RuleEvaluationResult evaluation;
};

/**
 * @class OracleRound
 * @brief Orchestrates a round over the injected services.
 *
 * A round is final once a canonical record is chosen: consensus failure
 * goes to arbitration and is never retried with the same inputs.
 */
class OracleRound {
public:
    OracleRound(PipelineServices services, RoundSettings settings, domain::Rule rule);

    /**
     * @brief Runs a round over the text and files the result under runId.
     *
     * The record is digested and serialized before it is committed, so a
     * record that cannot be stored never reaches the ledger. If the record
     * store itself fails after the commit, the commitment stays (the ledger
     * is append-only), the error is rethrown and no rule is evaluated.
     * runId is then spent: EvaluateStored() reports no stored record for it.
     *
     * @throws std::invalid_argument when runId is not a valid record key or the
     *         record is not valid UTF-8; nothing is committed.
     * @throws domain::ExtractionUnavailableError when the entity extractor fails.
     * @throws domain::StoreCorruptionError when runId is already committed with another digest.
     */
    RoundReport Run(const std::string& runId, const std::string& text);

    /**
     * @brief Re-evaluates a previously persisted record against the ledger's commitment for runId.
     * @return nullopt if the record store or the ledger knows nothing about runId.
     */
    std::optional<domain::RuleEvaluationResult> EvaluateStored(const std::string& runId) const;

    /** @brief Runs every validator concurrently and waits at most nodeTimeout for each. */
    std::vector<std::optional<domain::NodeAttestation>> CollectAttestations(
        const std::vector<domain::AnnotatedToken>& tokens) const;

private:
    std::vector<domain::AnnotatedToken> extract(const std::string& text) const;

    PipelineServices m_services;
    RoundSettings m_settings;
    domain::Rule m_rule;
};

} // namespace medoracle::application
