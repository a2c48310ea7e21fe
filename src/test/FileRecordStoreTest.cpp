#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "application/LedgerStore.hpp"
#include "infrastructure/CanonicalSerializer.hpp"
#include "infrastructure/FileRecordStore.hpp"

using namespace medoracle;
using medoracle::infrastructure::CanonicalSerializer;
using medoracle::infrastructure::FileRecordStore;
namespace fs = std::filesystem;

namespace {

domain::PersistedRecord Persist(application::LedgerStore& ledger, const domain::CanonicalRecord& record,
                                const std::string& key, std::vector<domain::Signature> signatures) {
    domain::PersistedRecord persisted;
    persisted.record = record;
    persisted.digest = CanonicalSerializer::DigestOf(record);
    persisted.signatures = std::move(signatures);
    persisted.commitment = ledger.Commit(record, key);
    return persisted;
}

void testRecordsSurviveReload(const fs::path& root) {
    std::cout << "[Test] Records reload with identical digests..." << std::endl;
    application::LedgerStore ledger;
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    FileRecordStore store(root.string(), persistence);

    domain::ValidationPackage package;
    package.entities = {{"headaches", "SYMPTOM", 0.9}, {"ibuprofen", "DRUG", 0.95}, {"400mg", "QUANTITY", 0.85}};
    package.timestamp = "2025-01-01T10:00:00.123456Z";
    package.sourceNodeId = "Oracle_B";
    package.source = "NLP Module";
    package.institution = "St. Mary";
    auto consensus = domain::CanonicalRecord::FromConsensus(package, domain::Provenance::ConsensusPlurality);
    auto stored = Persist(ledger, consensus, "run_consensus", {{0x01, 0xab}, {0xff, 0x00, 0x10}});
    store.Put("run_consensus", stored);
    assert(fs::exists(root / "run_consensus.json"));

    domain::CorrectedRecord corrected;
    corrected.entities = {{"MRI", "PROCEDURE", 0.98}};
    corrected.correctionReason = "Low confidence in NLP extraction for 'MRI'";
    corrected.validatorId = "HITL_001";
    corrected.timestamp = "2025-01-01T10:00:01.000000Z";
    auto human = domain::CanonicalRecord::FromCorrection(corrected);
    store.Put("run_human", Persist(ledger, human, "run_human", {}));

    FileRecordStore reopened(root.string(), persistence);
    auto loaded = reopened.Get("run_consensus");
    assert(loaded.has_value());
    assert(loaded->digest == stored.digest);
    assert(CanonicalSerializer::DigestOf(loaded->record) == stored.digest);
    assert(loaded->record.provenance == domain::Provenance::ConsensusPlurality);
    assert(loaded->record.institution == "St. Mary");
    assert(loaded->signatures == stored.signatures);
    assert(loaded->commitment == stored.commitment);
    assert(ledger.Verify(CanonicalSerializer::DigestOf(loaded->record), loaded->commitment));

    auto loadedHuman = reopened.Get("run_human");
    assert(loadedHuman.has_value());
    assert(loadedHuman->record.validatorId == "HITL_001");
    assert(loadedHuman->record.nodeId.empty());
    assert(loadedHuman->signatures.empty());
    assert(CanonicalSerializer::DigestOf(loadedHuman->record) == CanonicalSerializer::DigestOf(human));

    assert(!reopened.Get("run_missing").has_value());
    std::cout << "  [PASS]" << std::endl;
}

void testKeysStayInsideRoot(const fs::path& root) {
    std::cout << "[Test] Keys cannot escape the store root..." << std::endl;
    FileRecordStore store(root.string(), std::make_shared<infrastructure::PersistenceService>());
    for (const std::string key : {"../escape", "a/b", "", "..", "run_\xfe"}) {
        assert(!store.IsValidKey(key));
        bool threw = false;
        try {
            store.Get(key);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    assert(store.IsValidKey("run_2025-01-01.a"));
    std::cout << "  [PASS]" << std::endl;
}

void testMalformedRecordReported(const fs::path& root) {
    std::cout << "[Test] Malformed record files are reported..." << std::endl;
    {
        std::ofstream out(root / "run_broken.json");
        out << "{\"entities\": [";
    }
    FileRecordStore store(root.string(), std::make_shared<infrastructure::PersistenceService>());
    bool threw = false;
    try {
        store.Get("run_broken");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS]" << std::endl;
}

} // namespace

int main() {
    fs::path root = fs::temp_directory_path() / "medoracle_record_store_test";
    fs::remove_all(root);

    testRecordsSurviveReload(root);
    testKeysStayInsideRoot(root);
    testMalformedRecordReported(root);

    fs::remove_all(root);
    std::cout << "[PASS] File record store tests." << std::endl;
    return 0;
}
