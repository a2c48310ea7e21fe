/**
 * @file RuleEngine.hpp
 * @brief Integrity-gated evaluation of declarative rules over canonical records.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include "application/LedgerStore.hpp"
#include "domain/ActionTrigger.hpp"
#include "domain/CanonicalRecord.hpp"
#include "domain/Rule.hpp"

namespace medoracle::application {

/**
 * @class RuleEngine
 * @brief Re-verifies a record against its ledger commitment, then evaluates the rule.
 *
 * Business logic never runs over a record whose digest was not recomputed
 * here and matched against the ledger.
 */
class RuleEngine {
public:
    RuleEngine(std::shared_ptr<const LedgerStore> ledger,
               std::shared_ptr<domain::ActionTrigger> action = nullptr);

    domain::RuleEvaluationResult Evaluate(const domain::CanonicalRecord& record,
                                          const domain::LedgerCommitment& commitment,
                                          const domain::Rule& rule) const;

private:
    std::optional<std::string> findTerm(const domain::CanonicalRecord& record,
                                        const domain::EntityPredicate& predicate) const;

    std::shared_ptr<const LedgerStore> m_ledger;
    std::shared_ptr<domain::ActionTrigger> m_action;
};

} // namespace medoracle::application
