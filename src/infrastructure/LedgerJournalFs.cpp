/**
 * @file LedgerJournalFs.cpp
 * @brief Implementation of LedgerJournalFs.
 */

#include "infrastructure/LedgerJournalFs.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CanonicalSerializer.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace medoracle::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

LedgerJournalFs::LedgerJournalFs(std::string path) : m_path(std::move(path)) {
    fs::path p(m_path);
    if (p.has_parent_path() && !fs::exists(p.parent_path())) {
        fs::create_directories(p.parent_path());
    }
}

void LedgerJournalFs::append(const domain::LedgerCommitment& commitment) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::ofstream out(m_path, std::ios::app);
    if (!out) {
        throw std::runtime_error("LedgerJournalFs: cannot open " + m_path);
    }
    out << CanonicalSerializer::ToJson(commitment).dump() << "\n";
    out.flush();
    if (out.fail()) {
        throw std::runtime_error("LedgerJournalFs: write failed for " + m_path);
    }
}

std::vector<domain::LedgerCommitment> LedgerJournalFs::readAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::LedgerCommitment> results;
    if (!fs::exists(m_path)) return results;

    std::ifstream in(m_path);
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) continue;
        try {
            results.push_back(CanonicalSerializer::CommitmentFromJson(json::parse(line)));
        } catch (const std::exception& e) {
            // A damaged append-only log cannot be trusted past this point.
            throw domain::StoreCorruptionError("Ledger journal " + m_path + " line " +
                                               std::to_string(lineNo) + ": " + e.what());
        }
    }
    return results;
}

} // namespace medoracle::infrastructure
