/**
 * @file RuleEngine.cpp
 * @brief Implementation of RuleEngine.
 */

#include "application/RuleEngine.hpp"
#include "infrastructure/CanonicalSerializer.hpp"

#include <cctype>
#include <iostream>
#include <stdexcept>

namespace medoracle::application {

namespace {

std::string Normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

} // namespace

RuleEngine::RuleEngine(std::shared_ptr<const LedgerStore> ledger, std::shared_ptr<domain::ActionTrigger> action)
    : m_ledger(std::move(ledger)), m_action(std::move(action)) {
    if (!m_ledger) {
        throw std::invalid_argument("RuleEngine: ledger is required.");
    }
}

std::optional<std::string> RuleEngine::findTerm(const domain::CanonicalRecord& record,
                                                const domain::EntityPredicate& predicate) const {
    for (const auto& term : predicate.terms) {
        const std::string wanted = Normalize(term);
        for (const auto& e : record.entities) {
            if (e.label == predicate.label && Normalize(e.text) == wanted) {
                return term;
            }
        }
    }
    return std::nullopt;
}

domain::RuleEvaluationResult RuleEngine::Evaluate(const domain::CanonicalRecord& record,
                                                  const domain::LedgerCommitment& commitment,
                                                  const domain::Rule& rule) const {
    domain::RuleEvaluationResult result;

    // 1. Integrity gate
    domain::Digest recomputed;
    try {
        recomputed = infrastructure::CanonicalSerializer::DigestOf(record);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[RuleEngine] Record '" << commitment.storeKey << "' cannot be digested: " << e.what()
                  << ". Execution halted." << std::endl;
        result.reason = domain::EvaluationReason::IntegrityMismatch;
        return result;
    }
    if (!m_ledger->Verify(recomputed, commitment)) {
        std::cerr << "[RuleEngine] Integrity mismatch for '" << commitment.storeKey << "': record digest "
                  << domain::ToHex(recomputed) << " does not match the ledger. Execution halted." << std::endl;
        result.reason = domain::EvaluationReason::IntegrityMismatch;
        return result;
    }

    // 2. Rule evaluation
    if (rule.predicates.empty()) {
        std::cout << "[RuleEngine] Rule '" << rule.description << "' has no predicates; nothing to match." << std::endl;
        return result;
    }
    for (const auto& predicate : rule.predicates) {
        auto term = findTerm(record, predicate);
        if (!term) {
            std::cout << "[RuleEngine] No " << predicate.label << " entity satisfies '" << rule.description
                      << "'. No action triggered." << std::endl;
            result.matchedTerms.clear();
            return result;
        }
        result.matchedTerms.push_back(*term);
    }

    std::string condition;
    for (std::size_t i = 0; i < result.matchedTerms.size(); ++i) {
        if (i > 0) condition += " + ";
        condition += result.matchedTerms[i];
    }
    result.matched = true;
    result.matchedCondition = condition;
    result.actionTriggered = true;
    result.reason = domain::EvaluationReason::Matched;
    std::cout << "[RuleEngine] Condition matched: " << condition << std::endl;

    if (m_action) {
        m_action->Trigger(result, record);
    }
    return result;
}

} // namespace medoracle::application
