/**
 * @file ActionTrigger.hpp
 * @brief Downstream action invoked when a rule matches.
 */

#pragma once
#include "CanonicalRecord.hpp"
#include "Rule.hpp"

namespace medoracle::domain {

/**
 * @class ActionTrigger
 * @brief Side-effecting collaborator (e.g. reimbursement). The engine only decides whether to call it.
 */
class ActionTrigger {
public:
    virtual ~ActionTrigger() = default;
    virtual void Trigger(const RuleEvaluationResult& result, const CanonicalRecord& record) = 0;
};

} // namespace medoracle::domain
