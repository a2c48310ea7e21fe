/**
 * @file OracleNetworkApp.hpp
 * @brief Command-line application running one oracle round.
 */

#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include "application/OracleRound.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace medoracle::app {

/**
 * @struct AppOptions
 * @brief Parsed command-line options.
 */
struct AppOptions {
    std::string configPath = "oracle.json";
    std::optional<std::string> textPath;   ///< Defaults to the sample medical report.
    std::optional<std::string> runId;      ///< Generated when absent.
    std::optional<std::string> verifyRunId;///< Re-evaluate a stored record instead of running a round.
    std::optional<std::string> reviewerMode;
    bool showHelp = false;
};

/**
 * @class OracleNetworkApp
 * @brief Wires the pipeline from configuration and drives a round.
 */
class OracleNetworkApp {
public:
    static constexpr int ExitOk = 0;
    static constexpr int ExitError = 1;
    static constexpr int ExitIntegrityFailure = 2;

    /**
     * @brief Parses argv.
     * @throws std::invalid_argument on unknown flags or missing values.
     */
    static AppOptions ParseArguments(int argc, char** argv);

    static std::string Usage();

    /** @brief The report used when no --text file is given. */
    static std::string SampleReport();

    explicit OracleNetworkApp(AppOptions options, std::istream& reviewerInput);

    /**
     * @brief Starts the application.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /** @brief Builds every service from the configuration. */
    void Init();

    int runRound();
    int verifyStored(const std::string& runId);
    std::string loadText() const;

    AppOptions m_options;
    std::istream& m_reviewerInput;
    infrastructure::NetworkConfig m_config;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    std::unique_ptr<application::OracleRound> m_round;
};

} // namespace medoracle::app
