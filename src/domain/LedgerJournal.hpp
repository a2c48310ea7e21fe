/**
 * @file LedgerJournal.hpp
 * @brief Durable append-only log behind the ledger store.
 */

#pragma once
#include <vector>
#include "LedgerCommitment.hpp"

namespace medoracle::domain {

class LedgerJournal {
public:
    virtual ~LedgerJournal() = default;

    /** @brief Durably appends one commitment; returns only after it is written. */
    virtual void append(const LedgerCommitment& commitment) = 0;

    /** @brief Reads every commitment in append order. */
    virtual std::vector<LedgerCommitment> readAll() = 0;
};

} // namespace medoracle::domain
