/**
 * @file OracleNetworkApp.cpp
 * @brief Implementation of the OracleNetworkApp class.
 */
#include "app/OracleNetworkApp.hpp"

#include "domain/Errors.hpp"
#include "infrastructure/FileRecordStore.hpp"
#include "infrastructure/GazetteerEntityExtractor.hpp"
#include "infrastructure/HmacSigner.hpp"
#include "infrastructure/LedgerJournalFs.hpp"
#include "infrastructure/LoggingActionTrigger.hpp"
#include "infrastructure/Reviewers.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace medoracle::app {

namespace {

std::string GenerateRunId() {
    static const char alphanum[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphanum) - 2);
    std::string s = "run_";
    for (int i = 0; i < 16; ++i) {
        s += alphanum[pick(gen)];
    }
    return s;
}

std::string RequireValue(int& i, int argc, char** argv) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
    }
    return argv[++i];
}

} // namespace

AppOptions OracleNetworkApp::ParseArguments(int argc, char** argv) {
    AppOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            options.configPath = RequireValue(i, argc, argv);
        } else if (arg == "--text") {
            options.textPath = RequireValue(i, argc, argv);
        } else if (arg == "--run-id") {
            options.runId = RequireValue(i, argc, argv);
        } else if (arg == "--verify") {
            options.verifyRunId = RequireValue(i, argc, argv);
        } else if (arg == "--reviewer") {
            options.reviewerMode = RequireValue(i, argc, argv);
        } else if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return options;
}

std::string OracleNetworkApp::Usage() {
    return "Usage: medoracle [--config FILE] [--text FILE] [--run-id ID] [--reviewer scripted|console]\n"
           "       medoracle [--config FILE] --verify RUN_ID\n";
}

std::string OracleNetworkApp::SampleReport() {
    return "The patient underwent an MRI scan due to persistent headaches and fatigue. "
           "No critical condition was found. The doctor prescribed ibuprofen 400mg twice daily for pain relief.";
}

OracleNetworkApp::OracleNetworkApp(AppOptions options, std::istream& reviewerInput)
    : m_options(std::move(options)), m_reviewerInput(reviewerInput) {}

void OracleNetworkApp::Init() {
    m_config = infrastructure::ConfigLoader::Load(m_options.configPath);
    if (m_options.reviewerMode) {
        m_config.reviewerMode = *m_options.reviewerMode;
        infrastructure::ConfigLoader::Validate(m_config);
    }

    auto signer = std::make_shared<infrastructure::HmacSigner>();
    for (const auto& node : m_config.nodes) {
        signer->registerNode(node.id, node.secret);
    }

    application::ValidatorSettings validatorSettings;
    validatorSettings.confidenceThreshold = m_config.confidenceThreshold;
    validatorSettings.source = m_config.source;
    validatorSettings.institution = m_config.institution;
    validatorSettings.patientId = m_config.patientId;

    application::PipelineServices services;
    services.extractor = std::make_shared<infrastructure::GazetteerEntityExtractor>(m_config.extractorLabels);
    for (const auto& node : m_config.nodes) {
        services.validators.push_back(
            std::make_shared<const application::Validator>(node.id, node.secret, signer, validatorSettings));
    }
    services.vocabulary = std::make_shared<const domain::Vocabulary>(m_config.vocabulary);
    services.coordinator = std::make_shared<application::ConsensusCoordinator>(m_config.policy, signer);

    std::shared_ptr<domain::HumanReviewer> reviewer;
    if (m_config.reviewerMode == "console") {
        reviewer = std::make_shared<infrastructure::ConsoleReviewer>(m_reviewerInput, std::cout);
    } else {
        reviewer = std::make_shared<infrastructure::ScriptedReviewer>(m_config.correction);
    }
    services.arbitration = std::make_shared<application::HumanArbitrationService>(
        reviewer, m_config.reviewerId, m_config.confidenceThreshold);

    std::shared_ptr<domain::LedgerJournal> journal;
    if (!m_config.ledgerJournal.empty()) {
        journal = std::make_shared<infrastructure::LedgerJournalFs>(m_config.ledgerJournal);
    }
    services.ledger = std::make_shared<application::LedgerStore>(m_config.contractAddress, journal);

    m_persistence = std::make_shared<infrastructure::PersistenceService>();
    services.recordStore = std::make_shared<infrastructure::FileRecordStore>(m_config.storeRoot, m_persistence);
    services.ruleEngine = std::make_shared<application::RuleEngine>(
        services.ledger, std::make_shared<infrastructure::LoggingActionTrigger>());
    services.taskManager = std::make_shared<application::AsyncTaskManager>();

    application::RoundSettings roundSettings;
    roundSettings.threshold = m_config.threshold;
    roundSettings.nodeTimeout = m_config.nodeTimeout;

    m_round = std::make_unique<application::OracleRound>(std::move(services), roundSettings, m_config.rule);
}

std::string OracleNetworkApp::loadText() const {
    if (!m_options.textPath) {
        return SampleReport();
    }
    std::ifstream in(*m_options.textPath);
    if (!in) {
        throw std::runtime_error("Cannot read text file: " + *m_options.textPath);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

int OracleNetworkApp::runRound() {
    const std::string runId = m_options.runId.value_or(GenerateRunId());
    const std::string text = loadText();

    application::RoundReport report = m_round->Run(runId, text);

    std::cout << "\n[OracleNetworkApp] Run " << report.runId << " ("
              << domain::ProvenanceToString(report.record.provenance) << ")" << std::endl;
    std::cout << "[OracleNetworkApp]   digest     " << domain::ToHex(report.digest) << std::endl;
    std::cout << "[OracleNetworkApp]   committed  " << report.commitment.timestamp << " at "
              << report.commitment.contractAddress << std::endl;
    std::cout << "[OracleNetworkApp]   rule       " << domain::ReasonToString(report.evaluation.reason)
              << (report.evaluation.actionTriggered ? ", action triggered" : ", no action") << std::endl;

    return report.evaluation.reason == domain::EvaluationReason::IntegrityMismatch ? ExitIntegrityFailure : ExitOk;
}

int OracleNetworkApp::verifyStored(const std::string& runId) {
    auto result = m_round->EvaluateStored(runId);
    if (!result) {
        return ExitError;
    }
    std::cout << "[OracleNetworkApp] Stored run " << runId << ": " << domain::ReasonToString(result->reason)
              << (result->actionTriggered ? ", action triggered" : ", no action") << std::endl;
    return result->reason == domain::EvaluationReason::IntegrityMismatch ? ExitIntegrityFailure : ExitOk;
}

int OracleNetworkApp::Run() {
    if (m_options.showHelp) {
        std::cout << Usage();
        return ExitOk;
    }

    try {
        Init();
        int code = m_options.verifyRunId ? verifyStored(*m_options.verifyRunId) : runRound();
        m_persistence->stop();
        return code;
    } catch (const domain::StoreCorruptionError& e) {
        std::cerr << "[OracleNetworkApp] FATAL store corruption: " << e.what() << std::endl;
        return ExitError;
    } catch (const domain::ExtractionUnavailableError& e) {
        std::cerr << "[OracleNetworkApp] Extraction unavailable: " << e.what() << std::endl;
        return ExitError;
    } catch (const std::exception& e) {
        std::cerr << "[OracleNetworkApp] Error: " << e.what() << std::endl;
        return ExitError;
    }
}

} // namespace medoracle::app
