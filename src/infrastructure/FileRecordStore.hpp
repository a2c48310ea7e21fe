/**
 * @file FileRecordStore.hpp
 * @brief Record store keeping one JSON document per run under a root directory.
 */

#pragma once

#include <memory>
#include <string>
#include "domain/RecordStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace medoracle::infrastructure {

/**
 * @class FileRecordStore
 * @brief Writes <root>/<key>.json through the PersistenceService.
 *
 * Keys are restricted to [A-Za-z0-9_.-] so they cannot escape the root.
 */
class FileRecordStore : public domain::RecordStore {
public:
    FileRecordStore(std::string root, std::shared_ptr<PersistenceService> persistence);

    void Put(const std::string& key, const domain::PersistedRecord& record) override;
    std::optional<domain::PersistedRecord> Get(const std::string& key) override;
    bool IsValidKey(const std::string& key) const override;

private:
    std::string pathFor(const std::string& key) const;

    std::string m_root;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace medoracle::infrastructure
