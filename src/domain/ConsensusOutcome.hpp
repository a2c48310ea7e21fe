/**
 * @file ConsensusOutcome.hpp
 * @brief Result of one consensus round.
 */

#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "ValidationPackage.hpp"

namespace medoracle::domain {

/**
 * @enum ConsensusPolicy
 * @brief How the canonical package is chosen once enough nodes participate.
 */
enum class ConsensusPolicy {
    FirstValid, ///< k-of-n participation; first valid attestation wins.
    Plurality   ///< k-of-n must agree byte-for-byte on the entity list.
};

inline std::string PolicyToString(ConsensusPolicy policy) {
    switch (policy) {
        case ConsensusPolicy::FirstValid: return "first_valid";
        case ConsensusPolicy::Plurality: return "plurality";
    }
    return "first_valid";
}

struct ConsensusApproved {
    ValidationPackage canonicalPackage;
    std::string canonicalNodeId;
    std::vector<Digest> contributingDigests;
    std::vector<Signature> contributingSignatures;
    std::vector<std::string> contributingNodes;
    bool unanimous = true; ///< False when the plurality policy approved over dissent.
};

struct ConsensusFailed {
    std::vector<std::optional<NodeAttestation>> attestations; ///< Everything received, nulls included.
    std::string reason;
};

/**
 * @class ConsensusOutcome
 * @brief Either Approved or Failed; produced exactly once per round.
 */
class ConsensusOutcome {
public:
    explicit ConsensusOutcome(ConsensusApproved approved) : m_value(std::move(approved)) {}
    explicit ConsensusOutcome(ConsensusFailed failed) : m_value(std::move(failed)) {}

    bool isApproved() const { return std::holds_alternative<ConsensusApproved>(m_value); }

    const ConsensusApproved& approved() const { return std::get<ConsensusApproved>(m_value); }
    const ConsensusFailed& failed() const { return std::get<ConsensusFailed>(m_value); }

private:
    std::variant<ConsensusApproved, ConsensusFailed> m_value;
};

} // namespace medoracle::domain
