/**
 * @file CanonicalSerializer.hpp
 * @brief Stable JSON serialization and digests of packages and records.
 *
 * nlohmann::json objects keep their keys in lexicographic order, so dump()
 * of equal values is byte-identical. Entities keep token order.
 *
 * Serialize() and DigestOf() throw std::invalid_argument when a string is
 * not valid UTF-8.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/CanonicalRecord.hpp"
#include "domain/RecordStore.hpp"
#include "domain/ValidationPackage.hpp"

namespace medoracle::infrastructure {

class CanonicalSerializer {
public:
    static nlohmann::json ToJson(const domain::ValidatedEntity& entity);
    static nlohmann::json ToJson(const std::vector<domain::ValidatedEntity>& entities);
    static nlohmann::json ToJson(const domain::ValidationPackage& package);
    static nlohmann::json ToJson(const domain::CanonicalRecord& record);
    static nlohmann::json ToJson(const domain::LedgerCommitment& commitment);

    /** @brief Full record-store shape: record fields plus digest, signatures and commitment. */
    static nlohmann::json ToJson(const domain::PersistedRecord& persisted);

    static domain::ValidatedEntity EntityFromJson(const nlohmann::json& j);
    static domain::CanonicalRecord RecordFromJson(const nlohmann::json& j);
    static domain::LedgerCommitment CommitmentFromJson(const nlohmann::json& j);
    static domain::PersistedRecord PersistedFromJson(const nlohmann::json& j);

    static std::string Serialize(const domain::ValidationPackage& package);
    static std::string Serialize(const domain::CanonicalRecord& record);
    static std::string Serialize(const domain::PersistedRecord& persisted);

    static domain::Digest DigestOf(const domain::ValidationPackage& package);
    static domain::Digest DigestOf(const domain::CanonicalRecord& record);

    /** @brief Digest of the entity list alone; used to compare node outputs by content. */
    static domain::Digest DigestOf(const std::vector<domain::ValidatedEntity>& entities);

    /** @brief True when the text is valid UTF-8 and can enter a canonical form. */
    static bool IsEncodable(const std::string& text);
};

} // namespace medoracle::infrastructure
