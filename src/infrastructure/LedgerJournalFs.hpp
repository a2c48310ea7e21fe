/**
 * @file LedgerJournalFs.hpp
 * @brief NDJSON file journal for ledger commitments.
 */

#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "domain/LedgerJournal.hpp"

namespace medoracle::infrastructure {

/**
 * @class LedgerJournalFs
 * @brief One JSON commitment per line, appended and flushed synchronously.
 */
class LedgerJournalFs : public domain::LedgerJournal {
public:
    explicit LedgerJournalFs(std::string path);

    void append(const domain::LedgerCommitment& commitment) override;
    std::vector<domain::LedgerCommitment> readAll() override;

private:
    std::string m_path;
    std::mutex m_mutex;
};

} // namespace medoracle::infrastructure
