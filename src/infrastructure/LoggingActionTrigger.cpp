/**
 * @file LoggingActionTrigger.cpp
 * @brief Implementation of LoggingActionTrigger.
 */

#include "infrastructure/LoggingActionTrigger.hpp"

#include <iostream>

namespace medoracle::infrastructure {

LoggingActionTrigger::LoggingActionTrigger(std::string actionName)
    : m_actionName(std::move(actionName)) {}

void LoggingActionTrigger::Trigger(const domain::RuleEvaluationResult& result, const domain::CanonicalRecord& record) {
    ++m_count;
    std::cout << "[Action] Triggering " << m_actionName << " process ("
              << result.matchedCondition.value_or("unconditional") << ", provenance "
              << domain::ProvenanceToString(record.provenance) << ")." << std::endl;
}

} // namespace medoracle::infrastructure
