/**
 * @file LedgerStore.hpp
 * @brief Local append-only commitment store standing in for the on-chain contract.
 */

#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "domain/CanonicalRecord.hpp"
#include "domain/LedgerCommitment.hpp"
#include "domain/LedgerJournal.hpp"

namespace medoracle::application {

/**
 * @class LedgerStore
 * @brief Commits record digests under a store key and verifies candidates against them.
 *
 * An explicit instance with its own lifecycle; inject it where it is needed.
 * Commits are serialized, so the no-overwrite invariant holds under
 * concurrent callers.
 */
class LedgerStore {
public:
    /**
     * @param journal Optional durable log; replayed here when present.
     * @throws domain::StoreCorruptionError if the journal holds conflicting digests for a key.
     */
    explicit LedgerStore(std::string contractAddress = domain::DefaultContractAddress,
                         std::shared_ptr<domain::LedgerJournal> journal = nullptr);

    /**
     * @brief Stores the canonical digest of the record under storeKey.
     *
     * Re-committing the same digest under the same key returns the original
     * commitment unchanged.
     * @throws domain::StoreCorruptionError if the key already holds a different digest.
     * @throws std::invalid_argument if the record is not valid UTF-8; nothing is stored.
     */
    domain::LedgerCommitment Commit(const domain::CanonicalRecord& record, const std::string& storeKey);

    /**
     * @brief True when the commitment is the one stored for its key and its digest equals candidate.
     */
    bool Verify(const domain::Digest& candidateDigest, const domain::LedgerCommitment& commitment) const;

    std::optional<domain::LedgerCommitment> Find(const std::string& storeKey) const;
    std::size_t Size() const;

private:
    std::string m_contractAddress;
    std::shared_ptr<domain::LedgerJournal> m_journal;

    mutable std::mutex m_mutex;
    std::map<std::string, domain::LedgerCommitment> m_commitments;
};

} // namespace medoracle::application
