/**
 * @file PipelineServices.hpp
 * @brief Container for the collaborators of an oracle round, to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include <vector>
#include "application/AsyncTaskManager.hpp"
#include "application/ConsensusCoordinator.hpp"
#include "application/HumanArbitrationService.hpp"
#include "application/LedgerStore.hpp"
#include "application/RuleEngine.hpp"
#include "application/Validator.hpp"
#include "domain/EntityExtractor.hpp"
#include "domain/RecordStore.hpp"
#include "domain/Vocabulary.hpp"

namespace medoracle::application {

struct PipelineServices {
    std::shared_ptr<domain::EntityExtractor> extractor;
    std::vector<std::shared_ptr<const Validator>> validators;
    std::shared_ptr<const domain::Vocabulary> vocabulary;
    std::shared_ptr<ConsensusCoordinator> coordinator;
    std::shared_ptr<HumanArbitrationService> arbitration;
    std::shared_ptr<LedgerStore> ledger;
    std::shared_ptr<domain::RecordStore> recordStore;
    std::shared_ptr<RuleEngine> ruleEngine;
    std::shared_ptr<AsyncTaskManager> taskManager;
};

} // namespace medoracle::application
