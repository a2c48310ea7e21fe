/**
 * @file LedgerCommitment.hpp
 * @brief Immutable digest commitment held by the ledger.
 */

#pragma once
#include <string>
#include "Digest.hpp"

namespace medoracle::domain {

/** @brief Address of the simulated contract when none is configured. */
inline constexpr const char* DefaultContractAddress = "0x1234567890abcdef1234567890abcdef12345678";

/**
 * @struct LedgerCommitment
 * @brief Stored digest of a canonical record; the sole authority for later verification.
 */
struct LedgerCommitment {
    Digest digest{};
    std::string timestamp;
    std::string storeKey;        ///< Run identifier the commitment is filed under.
    std::string contractAddress; ///< Address of the simulated contract holding the store.

    bool operator==(const LedgerCommitment& other) const {
        return digest == other.digest && timestamp == other.timestamp &&
               storeKey == other.storeKey && contractAddress == other.contractAddress;
    }
    bool operator!=(const LedgerCommitment& other) const { return !(*this == other); }
};

} // namespace medoracle::domain
