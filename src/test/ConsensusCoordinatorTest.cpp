#undef NDEBUG
#include <cassert>
#include <iostream>
#include <stdexcept>

#include "application/ConsensusCoordinator.hpp"
#include "application/Validator.hpp"
#include "infrastructure/CanonicalSerializer.hpp"
#include "test/TestSupport.hpp"

using namespace medoracle;
using medoracle::application::ConsensusCoordinator;
using medoracle::application::Validator;
using Attestations = std::vector<std::optional<domain::NodeAttestation>>;

namespace {

struct Network {
    std::shared_ptr<infrastructure::HmacSigner> signer = test::MakeSigner();
    Validator a{"Oracle_A", "priv_key_A_123", signer};
    Validator b{"Oracle_B", "priv_key_B_456", signer};
    Validator c{"Oracle_C", "priv_key_C_789", signer};
    domain::Vocabulary vocab{{"ibuprofen"}, {"headache"}};
};

const auto ReportTokens = test::MakeTokens({{"headache", ""}, {"ibuprofen", ""}});
const auto HeadacheOnly = test::MakeTokens({{"headache", ""}});

void testFirstValidApproves() {
    std::cout << "[Test] First valid attestation becomes canonical..." << std::endl;
    Network net;
    Attestations all{net.a.Attest(ReportTokens, net.vocab),
                     net.b.Attest(ReportTokens, net.vocab),
                     net.c.Attest(ReportTokens, net.vocab)};

    ConsensusCoordinator coordinator;
    auto outcome = coordinator.Reconcile(all, 2);
    assert(outcome.isApproved());
    const auto& approved = outcome.approved();
    assert(approved.canonicalNodeId == "Oracle_A");
    assert(infrastructure::CanonicalSerializer::DigestOf(approved.canonicalPackage) == all[0]->digest);
    assert(approved.contributingDigests.size() == 3);
    assert(approved.contributingSignatures.size() == 3);
    assert((approved.contributingNodes == std::vector<std::string>{"Oracle_A", "Oracle_B", "Oracle_C"}));
    assert(approved.unanimous);
    std::cout << "  [PASS]" << std::endl;
}

void testNullsAndEmptiesAreSkipped() {
    std::cout << "[Test] Null and empty attestations are not valid..." << std::endl;
    Network net;
    ConsensusCoordinator coordinator;

    Attestations leadingNull{std::nullopt, net.b.Attest(ReportTokens, net.vocab), net.c.Attest(ReportTokens, net.vocab)};
    auto outcome = coordinator.Reconcile(leadingNull, 2);
    assert(outcome.isApproved());
    assert(outcome.approved().canonicalNodeId == "Oracle_B");
    assert(outcome.approved().contributingDigests.size() == 2);

    // An empty package signed anyway still does not count.
    auto emptySigned = net.c.Sign(net.c.Validate({}, net.vocab));
    Attestations mostlyEmpty{net.a.Attest(ReportTokens, net.vocab), std::nullopt, emptySigned};
    auto failed = coordinator.Reconcile(mostlyEmpty, 2);
    assert(!failed.isApproved());
    assert(failed.failed().attestations.size() == 3);
    assert(!failed.failed().attestations[1].has_value());
    assert(!failed.failed().reason.empty());
    std::cout << "  [PASS]" << std::endl;
}

void testThresholdBounds() {
    std::cout << "[Test] Threshold below one is rejected..." << std::endl;
    Network net;
    ConsensusCoordinator coordinator;
    Attestations one{net.a.Attest(ReportTokens, net.vocab)};

    bool threw = false;
    try {
        coordinator.Reconcile(one, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(coordinator.Reconcile(one, 1).isApproved());
    assert(!coordinator.Reconcile(one, 2).isApproved());
    assert(!coordinator.Reconcile({}, 1).isApproved());
    std::cout << "  [PASS]" << std::endl;
}

void testTamperedAttestationsExcluded() {
    std::cout << "[Test] Tampered or forged attestations are excluded..." << std::endl;
    Network net;
    auto tampered = net.c.Attest(ReportTokens, net.vocab);
    tampered->package.entities[0].confidence = 0.99;

    Attestations withTampered{net.a.Attest(ReportTokens, net.vocab), net.b.Attest(ReportTokens, net.vocab), tampered};
    ConsensusCoordinator unchecked;
    assert(unchecked.Reconcile(withTampered, 3).isApproved());

    ConsensusCoordinator checked(domain::ConsensusPolicy::FirstValid, net.signer);
    auto outcome = checked.Reconcile(withTampered, 3);
    assert(!outcome.isApproved());
    assert(checked.Reconcile(withTampered, 2).isApproved());

    // Oracle_C's package signed with Oracle_A's key.
    auto forged = net.c.Attest(ReportTokens, net.vocab);
    forged->signature = net.a.Sign(forged->package).signature;
    Attestations withForged{net.a.Attest(ReportTokens, net.vocab), net.b.Attest(ReportTokens, net.vocab), forged};
    assert(!checked.Reconcile(withForged, 3).isApproved());

    // Oracle_C relaying Oracle_A's package under its own name.
    auto relayed = net.a.Attest(ReportTokens, net.vocab);
    relayed->nodeId = "Oracle_C";
    relayed->signature = net.c.Sign(relayed->package).signature;
    Attestations withRelayed{net.a.Attest(ReportTokens, net.vocab), net.b.Attest(ReportTokens, net.vocab), relayed};
    assert(!checked.Reconcile(withRelayed, 3).isApproved());
    std::cout << "  [PASS]" << std::endl;
}

void testPluralityPolicy() {
    std::cout << "[Test] Plurality requires agreeing entity lists..." << std::endl;
    Network net;
    ConsensusCoordinator plurality(domain::ConsensusPolicy::Plurality, net.signer);

    Attestations split{net.a.Attest(ReportTokens, net.vocab),
                       net.b.Attest(HeadacheOnly, net.vocab),
                       net.c.Attest(HeadacheOnly, net.vocab)};
    auto approved = plurality.Reconcile(split, 2);
    assert(approved.isApproved());
    assert(approved.approved().canonicalNodeId == "Oracle_B");
    assert(!approved.approved().unanimous);
    assert(approved.approved().contributingDigests.size() == 3);
    assert(!plurality.Reconcile(split, 3).isApproved());

    // First-valid only counts participation.
    ConsensusCoordinator firstValid(domain::ConsensusPolicy::FirstValid, net.signer);
    assert(firstValid.Reconcile(split, 3).isApproved());
    assert(firstValid.Reconcile(split, 3).approved().canonicalNodeId == "Oracle_A");

    Attestations agreeing{net.a.Attest(ReportTokens, net.vocab),
                          net.b.Attest(ReportTokens, net.vocab),
                          net.c.Attest(ReportTokens, net.vocab)};
    auto unanimous = plurality.Reconcile(agreeing, 3);
    assert(unanimous.isApproved());
    assert(unanimous.approved().unanimous);
    assert(unanimous.approved().canonicalNodeId == "Oracle_A");
    std::cout << "  [PASS]" << std::endl;
}

} // namespace

int main() {
    testFirstValidApproves();
    testNullsAndEmptiesAreSkipped();
    testThresholdBounds();
    testTamperedAttestationsExcluded();
    testPluralityPolicy();
    std::cout << "[PASS] Consensus coordinator tests." << std::endl;
    return 0;
}
