/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "domain/Errors.hpp"
#include "domain/LedgerCommitment.hpp"
#include "domain/ValidatedEntity.hpp"
#include "infrastructure/CanonicalSerializer.hpp"
#include "infrastructure/Reviewers.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

namespace medoracle::infrastructure {

using json = nlohmann::json;

namespace {

std::string Lower(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::vector<std::string> LowerTerms(const json& arr) {
    std::vector<std::string> terms;
    for (const auto& t : arr) {
        terms.push_back(Lower(t.get<std::string>()));
    }
    return terms;
}

domain::ConsensusPolicy ParsePolicy(const std::string& s) {
    if (s == "first_valid") return domain::ConsensusPolicy::FirstValid;
    if (s == "plurality") return domain::ConsensusPolicy::Plurality;
    throw domain::ConfigError("Unknown consensus policy: " + s);
}

} // namespace

NetworkConfig ConfigLoader::Defaults() {
    NetworkConfig config;
    config.nodes = {
        {"Oracle_A", "priv_key_A_123"},
        {"Oracle_B", "priv_key_B_456"},
        {"Oracle_C", "priv_key_C_789"}
    };
    config.vocabulary.drugs = {"ibuprofen", "paracetamol", "aspirin", "naproxen", "penicillin"};
    config.vocabulary.symptoms = {"headache", "fever", "cough", "fatigue", "nausea"};
    config.contractAddress = domain::DefaultContractAddress;

    config.rule.description = "Reimburse analgesic prescribed for headache";
    config.rule.predicates = {
        {domain::labels::Symptom, {"headache", "headaches", "pain", "migraine"}},
        {domain::labels::Drug, {"ibuprofen", "paracetamol", "aspirin"}}
    };

    config.correction = ScriptedReviewer::DefaultCorrection();
    return config;
}

NetworkConfig ConfigLoader::FromJson(const json& j) {
    NetworkConfig config = Defaults();

    try {
        if (j.contains("consensus")) {
            const auto& c = j["consensus"];
            config.threshold = c.value("threshold", config.threshold);
            if (c.contains("policy")) config.policy = ParsePolicy(c["policy"].get<std::string>());
            if (c.contains("node_timeout_ms")) {
                config.nodeTimeout = std::chrono::milliseconds(c["node_timeout_ms"].get<long long>());
            }
        }

        if (j.contains("validation")) {
            config.confidenceThreshold = j["validation"].value("confidence_threshold", config.confidenceThreshold);
        }

        if (j.contains("nodes")) {
            config.nodes.clear();
            for (const auto& n : j["nodes"]) {
                config.nodes.push_back({n.at("id").get<std::string>(), n.at("secret").get<std::string>()});
            }
        }

        if (j.contains("vocabulary")) {
            const auto& v = j["vocabulary"];
            if (v.contains("drugs")) config.vocabulary.drugs = LowerTerms(v["drugs"]);
            if (v.contains("symptoms")) config.vocabulary.symptoms = LowerTerms(v["symptoms"]);
        }

        if (j.contains("metadata")) {
            const auto& m = j["metadata"];
            config.source = m.value("source", config.source);
            config.institution = m.value("institution", config.institution);
            config.patientId = m.value("patient_id", config.patientId);
        }

        if (j.contains("extractor") && j["extractor"].contains("labels")) {
            config.extractorLabels = j["extractor"]["labels"].get<std::map<std::string, std::string>>();
        }

        if (j.contains("ledger")) {
            config.contractAddress = j["ledger"].value("contract_address", config.contractAddress);
            config.ledgerJournal = j["ledger"].value("journal", config.ledgerJournal);
        }

        if (j.contains("rule")) {
            const auto& r = j["rule"];
            config.rule.description = r.value("description", config.rule.description);
            if (r.contains("predicates")) {
                config.rule.predicates.clear();
                for (const auto& p : r["predicates"]) {
                    config.rule.predicates.push_back({p.at("label").get<std::string>(),
                                                      p.at("terms").get<std::vector<std::string>>()});
                }
            }
        }

        if (j.contains("arbitration")) {
            const auto& a = j["arbitration"];
            config.reviewerId = a.value("reviewer_id", config.reviewerId);
            config.reviewerMode = a.value("mode", config.reviewerMode);
            if (a.contains("correction")) {
                const auto& c = a["correction"];
                config.correction.reason = c.value("reason", config.correction.reason);
                if (c.contains("entities")) {
                    config.correction.entities.clear();
                    for (const auto& e : c["entities"]) {
                        config.correction.entities.push_back(CanonicalSerializer::EntityFromJson(e));
                    }
                }
            }
        }

        if (j.contains("store")) {
            config.storeRoot = j["store"].value("root", config.storeRoot);
        }
    } catch (const json::exception& e) {
        throw domain::ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    Validate(config);
    return config;
}

NetworkConfig ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] " << path << " not found, using built-in defaults." << std::endl;
        NetworkConfig config = Defaults();
        Validate(config);
        return config;
    }

    json j;
    try {
        std::ifstream f(path);
        f >> j;
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
        throw domain::ConfigError("Malformed configuration file " + path + ": " + e.what());
    }
    return FromJson(j);
}

void ConfigLoader::Validate(const NetworkConfig& config) {
    if (config.nodes.empty()) {
        throw domain::ConfigError("At least one oracle node is required.");
    }
    std::set<std::string> ids;
    for (const auto& n : config.nodes) {
        if (n.id.empty() || n.secret.empty()) {
            throw domain::ConfigError("Every node needs a non-empty id and secret.");
        }
        if (n.id.rfind("HITL_", 0) == 0) {
            throw domain::ConfigError("Node id '" + n.id + "' is in the reserved HITL_ namespace.");
        }
        if (!ids.insert(n.id).second) {
            throw domain::ConfigError("Duplicate node id: " + n.id);
        }
    }
    if (config.threshold < 1 || config.threshold > static_cast<int>(config.nodes.size())) {
        throw domain::ConfigError("Consensus threshold must be between 1 and " +
                                  std::to_string(config.nodes.size()) + ".");
    }
    if (config.nodeTimeout.count() <= 0) {
        throw domain::ConfigError("node_timeout_ms must be positive.");
    }
    if (config.confidenceThreshold < 0.0 || config.confidenceThreshold > 1.0) {
        throw domain::ConfigError("confidence_threshold must be within [0, 1].");
    }
    if (config.reviewerId.rfind("HITL_", 0) != 0 || config.reviewerId.size() <= 5) {
        throw domain::ConfigError("reviewer_id must start with HITL_.");
    }
    if (config.reviewerMode != "scripted" && config.reviewerMode != "console") {
        throw domain::ConfigError("arbitration mode must be 'scripted' or 'console'.");
    }
    for (const auto& p : config.rule.predicates) {
        if (p.label.empty() || p.terms.empty()) {
            throw domain::ConfigError("Rule predicates need a label and at least one term.");
        }
    }
}

} // namespace medoracle::infrastructure
