/**
 * @file CanonicalSerializer.cpp
 * @brief Implementation of CanonicalSerializer.
 */

#include "infrastructure/CanonicalSerializer.hpp"
#include "infrastructure/Crypto.hpp"

#include <stdexcept>

namespace medoracle::infrastructure {

using json = nlohmann::json;

namespace {

// Compact, no ASCII escaping. Invalid UTF-8 is rejected so that distinct
// byte strings never share a digest.
std::string CanonicalDump(const json& j) {
    try {
        return j.dump(-1, ' ', false, json::error_handler_t::strict);
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("Canonical form requires valid UTF-8: ") + e.what());
    }
}

} // namespace

json CanonicalSerializer::ToJson(const domain::ValidatedEntity& entity) {
    return json{
        {"text", entity.text},
        {"label", entity.label},
        {"confidence", entity.confidence}
    };
}

json CanonicalSerializer::ToJson(const std::vector<domain::ValidatedEntity>& entities) {
    json arr = json::array();
    for (const auto& e : entities) {
        arr.push_back(ToJson(e));
    }
    return arr;
}

json CanonicalSerializer::ToJson(const domain::ValidationPackage& package) {
    json j = {
        {"entities", ToJson(package.entities)},
        {"timestamp", package.timestamp},
        {"node_id", package.sourceNodeId},
        {"source", package.source},
        {"status", package.status}
    };
    if (!package.institution.empty()) j["institution"] = package.institution;
    if (!package.patientId.empty()) j["patient_id"] = package.patientId;
    return j;
}

json CanonicalSerializer::ToJson(const domain::CanonicalRecord& record) {
    json j = {
        {"entities", ToJson(record.entities)},
        {"timestamp", record.timestamp},
        {"provenance", domain::ProvenanceToString(record.provenance)}
    };
    if (record.provenance == domain::Provenance::Human) {
        j["correction_reason"] = record.correctionReason;
        j["validator_id"] = record.validatorId;
    } else {
        j["node_id"] = record.nodeId;
        j["source"] = record.source;
        j["status"] = record.status;
        if (!record.institution.empty()) j["institution"] = record.institution;
        if (!record.patientId.empty()) j["patient_id"] = record.patientId;
    }
    return j;
}

json CanonicalSerializer::ToJson(const domain::LedgerCommitment& commitment) {
    return json{
        {"digest", domain::ToHex(commitment.digest)},
        {"timestamp", commitment.timestamp},
        {"store_key", commitment.storeKey},
        {"contract_address", commitment.contractAddress}
    };
}

json CanonicalSerializer::ToJson(const domain::PersistedRecord& persisted) {
    json j = ToJson(persisted.record);
    j["digest"] = domain::ToHex(persisted.digest);
    j["signatures"] = json::array();
    for (const auto& sig : persisted.signatures) {
        j["signatures"].push_back(domain::ToHex(sig));
    }
    j["commitment"] = ToJson(persisted.commitment);
    return j;
}

domain::ValidatedEntity CanonicalSerializer::EntityFromJson(const json& j) {
    domain::ValidatedEntity e;
    e.text = j.at("text").get<std::string>();
    e.label = j.at("label").get<std::string>();
    e.confidence = j.at("confidence").get<double>();
    return e;
}

domain::CanonicalRecord CanonicalSerializer::RecordFromJson(const json& j) {
    domain::CanonicalRecord record;
    record.provenance = domain::ProvenanceFromString(j.at("provenance").get<std::string>());
    record.timestamp = j.at("timestamp").get<std::string>();
    for (const auto& e : j.at("entities")) {
        record.entities.push_back(EntityFromJson(e));
    }
    if (record.provenance == domain::Provenance::Human) {
        record.correctionReason = j.value("correction_reason", "");
        record.validatorId = j.value("validator_id", "");
    } else {
        record.nodeId = j.value("node_id", "");
        record.source = j.value("source", "");
        record.status = j.value("status", "");
        record.institution = j.value("institution", "");
        record.patientId = j.value("patient_id", "");
    }
    return record;
}

domain::LedgerCommitment CanonicalSerializer::CommitmentFromJson(const json& j) {
    domain::LedgerCommitment c;
    c.digest = domain::DigestFromHex(j.at("digest").get<std::string>());
    c.timestamp = j.at("timestamp").get<std::string>();
    c.storeKey = j.at("store_key").get<std::string>();
    c.contractAddress = j.value("contract_address", "");
    return c;
}

domain::PersistedRecord CanonicalSerializer::PersistedFromJson(const json& j) {
    domain::PersistedRecord persisted;
    persisted.record = RecordFromJson(j);
    persisted.digest = domain::DigestFromHex(j.at("digest").get<std::string>());
    if (j.contains("signatures")) {
        for (const auto& sig : j["signatures"]) {
            persisted.signatures.push_back(domain::BytesFromHex(sig.get<std::string>()));
        }
    }
    persisted.commitment = CommitmentFromJson(j.at("commitment"));
    return persisted;
}

std::string CanonicalSerializer::Serialize(const domain::ValidationPackage& package) {
    return CanonicalDump(ToJson(package));
}

std::string CanonicalSerializer::Serialize(const domain::CanonicalRecord& record) {
    return CanonicalDump(ToJson(record));
}

std::string CanonicalSerializer::Serialize(const domain::PersistedRecord& persisted) {
    return CanonicalDump(ToJson(persisted));
}

domain::Digest CanonicalSerializer::DigestOf(const domain::ValidationPackage& package) {
    return Crypto::Sha256(Serialize(package));
}

domain::Digest CanonicalSerializer::DigestOf(const domain::CanonicalRecord& record) {
    return Crypto::Sha256(Serialize(record));
}

domain::Digest CanonicalSerializer::DigestOf(const std::vector<domain::ValidatedEntity>& entities) {
    return Crypto::Sha256(CanonicalDump(ToJson(entities)));
}

bool CanonicalSerializer::IsEncodable(const std::string& text) {
    try {
        CanonicalDump(json(text));
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

} // namespace medoracle::infrastructure
