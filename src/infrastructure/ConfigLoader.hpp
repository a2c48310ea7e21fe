/**
 * @file ConfigLoader.hpp
 * @brief Loading of the oracle network configuration (oracle.json).
 *
 * Provides a unified way to access network settings without scattering JSON
 * parsing logic throughout the codebase.
 */

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/ConsensusOutcome.hpp"
#include "domain/HumanReviewer.hpp"
#include "domain/Rule.hpp"
#include "domain/Vocabulary.hpp"

namespace medoracle::infrastructure {

struct NodeConfig {
    std::string id;
    std::string secret;
};

/**
 * @struct NetworkConfig
 * @brief Everything needed to wire one oracle network.
 */
struct NetworkConfig {
    // consensus
    int threshold = 2;
    domain::ConsensusPolicy policy = domain::ConsensusPolicy::FirstValid;
    std::chrono::milliseconds nodeTimeout{2000};

    // validation
    double confidenceThreshold = 0.7;
    std::vector<NodeConfig> nodes;
    domain::Vocabulary vocabulary;

    // package metadata
    std::string source = "NLP Module";
    std::string institution;
    std::string patientId;

    std::map<std::string, std::string> extractorLabels;

    // ledger
    std::string contractAddress;
    std::string ledgerJournal = "ledger.ndjson"; ///< Empty: in-memory ledger only.

    domain::Rule rule;

    // arbitration
    std::string reviewerId = "HITL_001";
    std::string reviewerMode = "scripted"; ///< "scripted" or "console".
    domain::ReviewDecision correction;

    std::string storeRoot = "records";
};

class ConfigLoader {
public:
    /** @brief The reference network: three nodes, 2-of-3, the medical vocabularies. */
    static NetworkConfig Defaults();

    /**
     * @brief Reads the configuration file, falling back to Defaults() if it does not exist.
     * @throws domain::ConfigError on malformed JSON or invalid values.
     */
    static NetworkConfig Load(const std::string& path);

    /** @brief Overlays the keys present in j onto Defaults() and validates the result. */
    static NetworkConfig FromJson(const nlohmann::json& j);

    /** @throws domain::ConfigError describing the first invalid value. */
    static void Validate(const NetworkConfig& config);
};

} // namespace medoracle::infrastructure
