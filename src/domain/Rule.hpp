/**
 * @file Rule.hpp
 * @brief Declarative condition evaluated over a canonical record, and its result.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace medoracle::domain {

/**
 * @struct EntityPredicate
 * @brief "There exists an entity with this label whose text is one of these terms."
 *
 * Terms keep their configured order; the first one found is reported.
 */
struct EntityPredicate {
    std::string label;
    std::vector<std::string> terms;
};

/**
 * @struct Rule
 * @brief Conjunction of entity predicates.
 */
struct Rule {
    std::string description;
    std::vector<EntityPredicate> predicates;
};

enum class EvaluationReason {
    Matched,
    NoMatch,
    IntegrityMismatch
};

inline std::string ReasonToString(EvaluationReason reason) {
    switch (reason) {
        case EvaluationReason::Matched: return "matched";
        case EvaluationReason::NoMatch: return "no_match";
        case EvaluationReason::IntegrityMismatch: return "integrity_mismatch";
    }
    return "no_match";
}

struct RuleEvaluationResult {
    bool matched = false;
    std::optional<std::string> matchedCondition; ///< e.g. "headache + ibuprofen".
    std::vector<std::string> matchedTerms;       ///< One per predicate, in predicate order.
    bool actionTriggered = false;
    EvaluationReason reason = EvaluationReason::NoMatch;
};

} // namespace medoracle::domain
