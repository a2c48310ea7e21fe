/**
 * @file RecordStore.hpp
 * @brief Keyed persistence of final canonical records.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "CanonicalRecord.hpp"
#include "LedgerCommitment.hpp"

namespace medoracle::domain {

/**
 * @struct PersistedRecord
 * @brief What is kept for a run: the record, its digest, node signatures and commitment.
 */
struct PersistedRecord {
    CanonicalRecord record;
    Digest digest{};
    std::vector<Signature> signatures; ///< Contributing node signatures; empty for human records.
    LedgerCommitment commitment;
};

/**
 * @class RecordStore
 * @brief Abstract key/value store for persisted records, keyed by run identifier.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual void Put(const std::string& key, const PersistedRecord& record) = 0;
    virtual std::optional<PersistedRecord> Get(const std::string& key) = 0;

    /** @brief True when Put() would accept the key. */
    virtual bool IsValidKey(const std::string& key) const { return !key.empty(); }
};

} // namespace medoracle::domain
