/**
 * @file LedgerStore.cpp
 * @brief Implementation of LedgerStore.
 */

#include "application/LedgerStore.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CanonicalSerializer.hpp"
#include "infrastructure/Crypto.hpp"
#include "infrastructure/TimeUtils.hpp"

#include <iostream>
#include <stdexcept>

namespace medoracle::application {

LedgerStore::LedgerStore(std::string contractAddress, std::shared_ptr<domain::LedgerJournal> journal)
    : m_contractAddress(std::move(contractAddress)), m_journal(std::move(journal)) {
    if (!m_journal) return;

    for (const auto& c : m_journal->readAll()) {
        auto it = m_commitments.find(c.storeKey);
        if (it == m_commitments.end()) {
            m_commitments.emplace(c.storeKey, c);
        } else if (it->second.digest != c.digest) {
            throw domain::StoreCorruptionError("Ledger journal holds two digests for key '" + c.storeKey + "'.");
        }
    }
    std::cout << "[Ledger] Replayed " << m_commitments.size() << " commitments from journal." << std::endl;
}

domain::LedgerCommitment LedgerStore::Commit(const domain::CanonicalRecord& record, const std::string& storeKey) {
    if (storeKey.empty()) {
        throw std::invalid_argument("LedgerStore: store key cannot be empty.");
    }
    const domain::Digest digest = infrastructure::CanonicalSerializer::DigestOf(record);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_commitments.find(storeKey);
    if (it != m_commitments.end()) {
        if (it->second.digest == digest) {
            return it->second;
        }
        std::cerr << "[Ledger] STORE CORRUPTION: key '" << storeKey << "' already committed with digest "
                  << domain::ToHex(it->second.digest) << ", refusing " << domain::ToHex(digest) << std::endl;
        throw domain::StoreCorruptionError("Second commit under key '" + storeKey + "' with a different digest.");
    }

    domain::LedgerCommitment commitment;
    commitment.digest = digest;
    commitment.timestamp = infrastructure::TimeUtils::NowIso8601();
    commitment.storeKey = storeKey;
    commitment.contractAddress = m_contractAddress;

    if (m_journal) {
        m_journal->append(commitment);
    }
    m_commitments.emplace(storeKey, commitment);

    std::cout << "[Ledger] Committed " << domain::ToHex(digest).substr(0, 16) << "... under '" << storeKey
              << "' at " << m_contractAddress << std::endl;
    return commitment;
}

bool LedgerStore::Verify(const domain::Digest& candidateDigest, const domain::LedgerCommitment& commitment) const {
    domain::LedgerCommitment stored;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_commitments.find(commitment.storeKey);
        if (it == m_commitments.end()) {
            return false;
        }
        stored = it->second;
    }

    using infrastructure::Crypto;
    // The caller's copy must be the one the ledger holds.
    if (!Crypto::ConstantTimeEquals(stored.digest.data(), stored.digest.size(),
                                    commitment.digest.data(), commitment.digest.size())) {
        return false;
    }
    return Crypto::ConstantTimeEquals(stored.digest.data(), stored.digest.size(),
                                      candidateDigest.data(), candidateDigest.size());
}

std::optional<domain::LedgerCommitment> LedgerStore::Find(const std::string& storeKey) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_commitments.find(storeKey);
    if (it == m_commitments.end()) return std::nullopt;
    return it->second;
}

std::size_t LedgerStore::Size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_commitments.size();
}

} // namespace medoracle::application
