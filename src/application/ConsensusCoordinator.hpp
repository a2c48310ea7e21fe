/**
 * @file ConsensusCoordinator.hpp
 * @brief k-of-n reconciliation of node attestations.
 */

#pragma once
#include <memory>
#include <optional>
#include <vector>
#include "domain/ConsensusOutcome.hpp"
#include "domain/SigningPrimitive.hpp"

namespace medoracle::application {

/**
 * @class ConsensusCoordinator
 * @brief Applies the agreement rule to the attestations of one round.
 *
 * A "valid" attestation is non-null with a non-empty entity list. When a
 * signing primitive is supplied, attestations whose digest or signature do
 * not check out are excluded from the valid set as well.
 */
class ConsensusCoordinator {
public:
    explicit ConsensusCoordinator(domain::ConsensusPolicy policy = domain::ConsensusPolicy::FirstValid,
                                  std::shared_ptr<const domain::SigningPrimitive> verifier = nullptr);

    /**
     * @brief Reconciles attestations in node-submission order.
     * @param threshold Minimum number of valid (or, under Plurality, agreeing) attestations.
     * @throws std::invalid_argument if threshold < 1.
     */
    domain::ConsensusOutcome Reconcile(const std::vector<std::optional<domain::NodeAttestation>>& attestations,
                                       int threshold) const;

private:
    bool isValid(const std::optional<domain::NodeAttestation>& attestation) const;
    bool checkIntegrity(const domain::NodeAttestation& attestation) const;

    domain::ConsensusPolicy m_policy;
    std::shared_ptr<const domain::SigningPrimitive> m_verifier;
};

} // namespace medoracle::application
