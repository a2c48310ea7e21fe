/**
 * @file FileRecordStore.cpp
 * @brief Implementation of FileRecordStore.
 */

#include "infrastructure/FileRecordStore.hpp"
#include "infrastructure/CanonicalSerializer.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace medoracle::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

FileRecordStore::FileRecordStore(std::string root, std::shared_ptr<PersistenceService> persistence)
    : m_root(std::move(root)), m_persistence(std::move(persistence)) {
    if (!m_persistence) {
        throw std::invalid_argument("FileRecordStore: persistence service is required.");
    }
    if (!fs::exists(m_root)) fs::create_directories(m_root);
}

bool FileRecordStore::IsValidKey(const std::string& key) const {
    if (key.empty() || key == "." || key == "..") return false;
    for (unsigned char c : key) {
        if (!std::isalnum(c) && c != '_' && c != '-' && c != '.') return false;
    }
    return true;
}

std::string FileRecordStore::pathFor(const std::string& key) const {
    if (!IsValidKey(key)) {
        throw std::invalid_argument("FileRecordStore: invalid key '" + key + "'.");
    }
    return (fs::path(m_root) / (key + ".json")).string();
}

void FileRecordStore::Put(const std::string& key, const domain::PersistedRecord& record) {
    const std::string path = pathFor(key);
    m_persistence->saveTextAsync(path, CanonicalSerializer::ToJson(record).dump(2));
    if (!m_persistence->flush()) {
        throw std::runtime_error("FileRecordStore: failed to persist record '" + key + "'.");
    }
    std::cout << "[RecordStore] Saved record '" << key << "' to " << path << std::endl;
}

std::optional<domain::PersistedRecord> FileRecordStore::Get(const std::string& key) {
    const std::string path = pathFor(key);
    if (!fs::exists(path)) {
        return std::nullopt;
    }

    std::ifstream f(path);
    if (!f) {
        throw std::runtime_error("FileRecordStore: cannot open " + path);
    }
    try {
        json j;
        f >> j;
        return CanonicalSerializer::PersistedFromJson(j);
    } catch (const json::exception& e) {
        throw std::runtime_error("FileRecordStore: malformed record " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("FileRecordStore: invalid field in " + path + ": " + e.what());
    }
}

} // namespace medoracle::infrastructure
