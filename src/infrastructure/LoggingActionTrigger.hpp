/**
 * @file LoggingActionTrigger.hpp
 * @brief Action trigger that records the reimbursement decision in the log.
 */

#pragma once

#include <atomic>
#include <string>
#include "domain/ActionTrigger.hpp"

namespace medoracle::infrastructure {

class LoggingActionTrigger : public domain::ActionTrigger {
public:
    explicit LoggingActionTrigger(std::string actionName = "reimbursement");

    void Trigger(const domain::RuleEvaluationResult& result, const domain::CanonicalRecord& record) override;

    int getTriggerCount() const { return m_count.load(); }

private:
    std::string m_actionName;
    std::atomic<int> m_count{0};
};

} // namespace medoracle::infrastructure
