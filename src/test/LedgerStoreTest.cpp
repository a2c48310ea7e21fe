#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "application/LedgerStore.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CanonicalSerializer.hpp"
#include "infrastructure/LedgerJournalFs.hpp"

using namespace medoracle;
using medoracle::application::LedgerStore;
using medoracle::infrastructure::CanonicalSerializer;
namespace fs = std::filesystem;

namespace {

domain::CanonicalRecord SampleRecord() {
    domain::ValidationPackage package;
    package.entities = {{"headache", "SYMPTOM", 0.90}, {"ibuprofen", "DRUG", 0.95}};
    package.timestamp = "2025-01-01T10:00:00.000000Z";
    package.sourceNodeId = "Oracle_A";
    package.source = "NLP Module";
    return domain::CanonicalRecord::FromConsensus(package, domain::Provenance::Consensus);
}

void testCommitThenVerify() {
    std::cout << "[Test] Commit then verify..." << std::endl;
    LedgerStore ledger;
    auto record = SampleRecord();
    auto commitment = ledger.Commit(record, "run_1");

    assert(commitment.storeKey == "run_1");
    assert(commitment.contractAddress == domain::DefaultContractAddress);
    assert(commitment.digest == CanonicalSerializer::DigestOf(record));
    assert(!commitment.timestamp.empty());
    assert(ledger.Verify(CanonicalSerializer::DigestOf(record), commitment));
    assert(ledger.Size() == 1);
    std::cout << "  [PASS]" << std::endl;
}

void testAnyMutationFailsVerification() {
    std::cout << "[Test] Mutated records fail verification..." << std::endl;
    LedgerStore ledger("0xfeed");
    auto record = SampleRecord();
    auto commitment = ledger.Commit(record, "run_1");
    assert(commitment.contractAddress == "0xfeed");

    auto confidence = record;
    confidence.entities[1].confidence = 0.5;
    auto text = record;
    text.entities[0].text = "migraine";
    auto label = record;
    label.entities[0].label = "DRUG";
    auto provenance = record;
    provenance.provenance = domain::Provenance::Human;

    for (const auto& mutated : {confidence, text, label, provenance}) {
        assert(!ledger.Verify(CanonicalSerializer::DigestOf(mutated), commitment));
    }
    std::cout << "  [PASS]" << std::endl;
}

void testForgedCommitmentRejected() {
    std::cout << "[Test] Forged commitments are rejected..." << std::endl;
    LedgerStore ledger;
    auto record = SampleRecord();
    auto commitment = ledger.Commit(record, "run_1");

    auto mutated = record;
    mutated.entities[0].confidence = 0.99;
    auto forged = commitment;
    forged.digest = CanonicalSerializer::DigestOf(mutated);
    assert(!ledger.Verify(forged.digest, forged));

    auto unknown = commitment;
    unknown.storeKey = "run_never_committed";
    assert(!ledger.Verify(commitment.digest, unknown));
    assert(!ledger.Find("run_never_committed").has_value());
    std::cout << "  [PASS]" << std::endl;
}

void testNoOverwrite() {
    std::cout << "[Test] Keys are never overwritten..." << std::endl;
    LedgerStore ledger;
    auto record = SampleRecord();
    auto first = ledger.Commit(record, "run_1");
    auto again = ledger.Commit(record, "run_1");
    assert(first == again);
    assert(ledger.Size() == 1);

    auto other = record;
    other.entities.pop_back();
    bool threw = false;
    try {
        ledger.Commit(other, "run_1");
    } catch (const domain::StoreCorruptionError&) {
        threw = true;
    }
    assert(threw);
    assert(*ledger.Find("run_1") == first);

    // The same record may be filed under another key.
    auto second = ledger.Commit(record, "run_2");
    assert(second.digest == first.digest);
    assert(ledger.Size() == 2);

    threw = false;
    try {
        ledger.Commit(record, "");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS]" << std::endl;
}

void testJournalReplay() {
    std::cout << "[Test] Journal replay restores commitments..." << std::endl;
    fs::path root = fs::temp_directory_path() / "medoracle_ledger_store_test";
    fs::remove_all(root);
    const std::string journalPath = (root / "ledger.ndjson").string();

    auto record = SampleRecord();
    domain::LedgerCommitment first;
    {
        LedgerStore ledger("0xabc", std::make_shared<infrastructure::LedgerJournalFs>(journalPath));
        first = ledger.Commit(record, "run_1");
        ledger.Commit(record, "run_1"); // idempotent, not journaled twice
        ledger.Commit(record, "run_2");
    }

    auto journal = std::make_shared<infrastructure::LedgerJournalFs>(journalPath);
    assert(journal->readAll().size() == 2);

    LedgerStore reopened("0xabc", journal);
    assert(reopened.Size() == 2);
    assert(*reopened.Find("run_1") == first);
    assert(reopened.Verify(CanonicalSerializer::DigestOf(record), first));

    auto other = record;
    other.entities.pop_back();
    bool threw = false;
    try {
        reopened.Commit(other, "run_1");
    } catch (const domain::StoreCorruptionError&) {
        threw = true;
    }
    assert(threw);
    fs::remove_all(root);
    std::cout << "  [PASS]" << std::endl;
}

void testCorruptJournalRefused() {
    std::cout << "[Test] Corrupt journal is refused..." << std::endl;
    fs::path root = fs::temp_directory_path() / "medoracle_ledger_corrupt_test";
    fs::remove_all(root);
    fs::create_directories(root);
    const std::string journalPath = (root / "ledger.ndjson").string();

    auto record = SampleRecord();
    auto other = record;
    other.entities.pop_back();

    domain::LedgerCommitment a;
    a.digest = CanonicalSerializer::DigestOf(record);
    a.timestamp = "2025-01-01T10:00:00.000000Z";
    a.storeKey = "run_1";
    a.contractAddress = "0xabc";
    auto b = a;
    b.digest = CanonicalSerializer::DigestOf(other);

    {
        std::ofstream out(journalPath);
        out << CanonicalSerializer::ToJson(a).dump() << "\n" << CanonicalSerializer::ToJson(b).dump() << "\n";
    }
    bool threw = false;
    try {
        LedgerStore ledger("0xabc", std::make_shared<infrastructure::LedgerJournalFs>(journalPath));
    } catch (const domain::StoreCorruptionError&) {
        threw = true;
    }
    assert(threw);

    {
        std::ofstream out(journalPath);
        out << CanonicalSerializer::ToJson(a).dump() << "\n{not json\n";
    }
    threw = false;
    try {
        LedgerStore ledger("0xabc", std::make_shared<infrastructure::LedgerJournalFs>(journalPath));
    } catch (const domain::StoreCorruptionError&) {
        threw = true;
    }
    assert(threw);
    fs::remove_all(root);
    std::cout << "  [PASS]" << std::endl;
}

} // namespace

void testRecordWithInvalidUtf8Refused() {
    std::cout << "[Test] Records that are not valid UTF-8 are never committed..." << std::endl;
    LedgerStore ledger;
    auto clean = SampleRecord();
    auto commitment = ledger.Commit(clean, "run_1");

    for (const std::string& text : {std::string("headache\xa0"), std::string("headache\xfe")}) {
        auto record = clean;
        record.entities[0].text = text;
        bool threw = false;
        try {
            ledger.Commit(record, "run_2");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    assert(ledger.Size() == 1);
    assert(!ledger.Find("run_2").has_value());
    assert(*ledger.Find("run_1") == commitment);
    std::cout << "  [PASS]" << std::endl;
}

int main() {
    testCommitThenVerify();
    testAnyMutationFailsVerification();
    testForgedCommitmentRejected();
    testNoOverwrite();
    testJournalReplay();
    testCorruptJournalRefused();
    testRecordWithInvalidUtf8Refused();
    std::cout << "[PASS] Ledger store tests." << std::endl;
    return 0;
}
