/**
 * @file ConsensusCoordinator.cpp
 * @brief Implementation of ConsensusCoordinator.
 */

#include "application/ConsensusCoordinator.hpp"
#include "infrastructure/CanonicalSerializer.hpp"
#include "infrastructure/Crypto.hpp"

#include <iostream>
#include <map>
#include <stdexcept>

namespace medoracle::application {

using infrastructure::CanonicalSerializer;

namespace {

domain::ConsensusApproved Approve(const std::vector<const domain::NodeAttestation*>& valid,
                                  const domain::NodeAttestation& canonical,
                                  bool unanimous) {
    domain::ConsensusApproved approved;
    approved.canonicalPackage = canonical.package;
    approved.canonicalNodeId = canonical.nodeId;
    approved.unanimous = unanimous;
    for (const auto* a : valid) {
        approved.contributingDigests.push_back(a->digest);
        approved.contributingSignatures.push_back(a->signature);
        approved.contributingNodes.push_back(a->nodeId);
    }
    return approved;
}

} // namespace

ConsensusCoordinator::ConsensusCoordinator(domain::ConsensusPolicy policy,
                                           std::shared_ptr<const domain::SigningPrimitive> verifier)
    : m_policy(policy), m_verifier(std::move(verifier)) {}

bool ConsensusCoordinator::checkIntegrity(const domain::NodeAttestation& attestation) const {
    domain::Digest recomputed = CanonicalSerializer::DigestOf(attestation.package);
    if (!infrastructure::Crypto::ConstantTimeEquals(recomputed.data(), recomputed.size(),
                                                    attestation.digest.data(), attestation.digest.size())) {
        std::cerr << "[Consensus] Digest mismatch in attestation from " << attestation.nodeId << std::endl;
        return false;
    }
    if (attestation.package.sourceNodeId != attestation.nodeId) {
        std::cerr << "[Consensus] Package of " << attestation.nodeId << " claims node "
                  << attestation.package.sourceNodeId << std::endl;
        return false;
    }
    if (!m_verifier->Verify(attestation.digest, attestation.signature, attestation.nodeId)) {
        std::cerr << "[Consensus] Signature rejected for " << attestation.nodeId << std::endl;
        return false;
    }
    return true;
}

bool ConsensusCoordinator::isValid(const std::optional<domain::NodeAttestation>& attestation) const {
    if (!attestation || attestation->package.isEmpty()) {
        return false;
    }
    try {
        CanonicalSerializer::Serialize(attestation->package);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Consensus] Attestation from " << attestation->nodeId << " has no canonical form: "
                  << e.what() << std::endl;
        return false;
    }
    return !m_verifier || checkIntegrity(*attestation);
}

domain::ConsensusOutcome ConsensusCoordinator::Reconcile(
    const std::vector<std::optional<domain::NodeAttestation>>& attestations, int threshold) const {
    if (threshold < 1) {
        throw std::invalid_argument("ConsensusCoordinator: threshold must be at least 1.");
    }

    std::cout << "[Consensus] Reconciling " << attestations.size() << " attestations (threshold = "
              << threshold << ", policy = " << domain::PolicyToString(m_policy) << ")..." << std::endl;

    std::vector<const domain::NodeAttestation*> valid;
    for (const auto& a : attestations) {
        if (isValid(a)) valid.push_back(&*a);
    }

    if (static_cast<int>(valid.size()) < threshold) {
        std::string reason = "Only " + std::to_string(valid.size()) + " valid attestations, " +
                             std::to_string(threshold) + " required.";
        std::cout << "[Consensus] Failed: " << reason << std::endl;
        return domain::ConsensusOutcome(domain::ConsensusFailed{attestations, reason});
    }

    if (m_policy == domain::ConsensusPolicy::FirstValid) {
        std::cout << "[Consensus] Approved with " << valid.size() << " valid attestations; canonical from "
                  << valid.front()->nodeId << "." << std::endl;
        return domain::ConsensusOutcome(Approve(valid, *valid.front(), true));
    }

    // Plurality: group by entity content, keeping first-seen order for ties.
    std::map<domain::Digest, std::vector<const domain::NodeAttestation*>> groups;
    std::vector<domain::Digest> order;
    for (const auto* a : valid) {
        domain::Digest contentDigest = CanonicalSerializer::DigestOf(a->package.entities);
        auto& members = groups[contentDigest];
        if (members.empty()) order.push_back(contentDigest);
        members.push_back(a);
    }

    const std::vector<const domain::NodeAttestation*>* best = nullptr;
    for (const auto& key : order) {
        const auto& members = groups[key];
        if (!best || members.size() > best->size()) best = &members;
    }

    if (static_cast<int>(best->size()) < threshold) {
        std::string reason = "Largest agreeing group has " + std::to_string(best->size()) + " of " +
                             std::to_string(valid.size()) + " valid attestations, " +
                             std::to_string(threshold) + " required.";
        std::cout << "[Consensus] Failed: " << reason << std::endl;
        return domain::ConsensusOutcome(domain::ConsensusFailed{attestations, reason});
    }

    bool unanimous = best->size() == valid.size();
    std::cout << "[Consensus] Approved by " << best->size() << "/" << valid.size()
              << " agreeing nodes" << (unanimous ? "" : " (non-unanimous)") << "; canonical from "
              << best->front()->nodeId << "." << std::endl;
    return domain::ConsensusOutcome(Approve(valid, *best->front(), unanimous));
}

} // namespace medoracle::application
