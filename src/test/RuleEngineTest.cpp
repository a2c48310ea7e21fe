#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>

#include "application/RuleEngine.hpp"
#include "infrastructure/CanonicalSerializer.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/LoggingActionTrigger.hpp"

using namespace medoracle;
using medoracle::application::LedgerStore;
using medoracle::application::RuleEngine;

namespace {

domain::CanonicalRecord RecordOf(std::vector<domain::ValidatedEntity> entities) {
    domain::ValidationPackage package;
    package.entities = std::move(entities);
    package.timestamp = "2025-01-01T10:00:00.000000Z";
    package.sourceNodeId = "Oracle_A";
    package.source = "NLP Module";
    return domain::CanonicalRecord::FromConsensus(package, domain::Provenance::Consensus);
}

struct Fixture {
    std::shared_ptr<LedgerStore> ledger = std::make_shared<LedgerStore>();
    std::shared_ptr<infrastructure::LoggingActionTrigger> action =
        std::make_shared<infrastructure::LoggingActionTrigger>();
    RuleEngine engine{ledger, action};
    domain::Rule rule = infrastructure::ConfigLoader::Defaults().rule;
    int runs = 0;

    domain::RuleEvaluationResult commitAndEvaluate(const domain::CanonicalRecord& record) {
        auto commitment = ledger->Commit(record, "run_" + std::to_string(++runs));
        return engine.Evaluate(record, commitment, rule);
    }
};

void testMatchTriggersAction() {
    std::cout << "[Test] Matching record triggers the action..." << std::endl;
    Fixture f;
    auto result = f.commitAndEvaluate(RecordOf({{"headache", "SYMPTOM", 0.90}, {"ibuprofen", "DRUG", 0.95}}));
    assert(result.matched);
    assert(result.actionTriggered);
    assert(result.reason == domain::EvaluationReason::Matched);
    assert(result.matchedCondition && *result.matchedCondition == "headache + ibuprofen");
    assert((result.matchedTerms == std::vector<std::string>{"headache", "ibuprofen"}));
    assert(f.action->getTriggerCount() == 1);
    std::cout << "  [PASS]" << std::endl;
}

void testCaseInsensitiveTokens() {
    std::cout << "[Test] Term match ignores case..." << std::endl;
    Fixture f;
    auto result = f.commitAndEvaluate(RecordOf({{"Headache", "SYMPTOM", 0.90}, {"IBUPROFEN", "DRUG", 0.95}}));
    assert(result.matched);
    assert((result.matchedTerms == std::vector<std::string>{"headache", "ibuprofen"}));
    std::cout << "  [PASS]" << std::endl;
}

void testExactTokenNotSubstring() {
    std::cout << "[Test] Terms match whole entity text only..." << std::endl;
    Fixture f;
    auto result = f.commitAndEvaluate(RecordOf({{"tension-headache", "SYMPTOM", 0.90}, {"ibuprofen", "DRUG", 0.95}}));
    assert(!result.matched);
    assert(!result.actionTriggered);
    assert(!result.matchedCondition.has_value());
    assert(result.matchedTerms.empty());
    assert(result.reason == domain::EvaluationReason::NoMatch);
    assert(f.action->getTriggerCount() == 0);
    std::cout << "  [PASS]" << std::endl;
}

void testLabelMustAgree() {
    std::cout << "[Test] Entity label must match the predicate..." << std::endl;
    Fixture f;
    auto result = f.commitAndEvaluate(RecordOf({{"headache", "DRUG", 0.95}, {"ibuprofen", "DRUG", 0.95}}));
    assert(!result.matched);
    assert(result.reason == domain::EvaluationReason::NoMatch);
    std::cout << "  [PASS]" << std::endl;
}

void testFirstConfiguredTermReported() {
    std::cout << "[Test] First configured term is reported..." << std::endl;
    Fixture f;
    auto result = f.commitAndEvaluate(RecordOf({{"pain", "SYMPTOM", 0.90},
                                                {"headaches", "SYMPTOM", 0.90},
                                                {"aspirin", "DRUG", 0.95},
                                                {"paracetamol", "DRUG", 0.95}}));
    assert(result.matched);
    assert(*result.matchedCondition == "headaches + paracetamol");
    std::cout << "  [PASS]" << std::endl;
}

void testIntegrityGate() {
    std::cout << "[Test] Altered record halts evaluation..." << std::endl;
    Fixture f;
    auto record = RecordOf({{"headache", "SYMPTOM", 0.90}, {"ibuprofen", "DRUG", 0.95}});
    auto commitment = f.ledger->Commit(record, "run_gate");

    auto altered = record;
    altered.entities[1].confidence = 0.40;
    auto result = f.engine.Evaluate(altered, commitment, f.rule);
    assert(result.reason == domain::EvaluationReason::IntegrityMismatch);
    assert(!result.matched);
    assert(!result.actionTriggered);
    assert(f.action->getTriggerCount() == 0);

    // A commitment the ledger never issued is no better.
    auto forged = commitment;
    forged.storeKey = "run_other";
    assert(f.engine.Evaluate(record, forged, f.rule).reason == domain::EvaluationReason::IntegrityMismatch);

    assert(f.engine.Evaluate(record, commitment, f.rule).reason == domain::EvaluationReason::Matched);
    assert(f.action->getTriggerCount() == 1);
    std::cout << "  [PASS]" << std::endl;
}

void testEmptyRule() {
    std::cout << "[Test] Rule without predicates never matches..." << std::endl;
    Fixture f;
    f.rule.predicates.clear();
    auto result = f.commitAndEvaluate(RecordOf({{"headache", "SYMPTOM", 0.90}}));
    assert(!result.matched);
    assert(result.reason == domain::EvaluationReason::NoMatch);
    std::cout << "  [PASS]" << std::endl;
}

} // namespace

void testInvalidUtf8RecordHalts() {
    std::cout << "[Test] Record altered with invalid UTF-8 fails the integrity gate..." << std::endl;
    Fixture f;
    auto record = RecordOf({{"headache", "SYMPTOM", 0.90}, {"ibuprofen", "DRUG", 0.95}});
    auto commitment = f.ledger->Commit(record, "run_bytes");

    for (const std::string& text : {std::string("headache\xa0"), std::string("headache\xfe")}) {
        auto altered = record;
        altered.entities[0].text = text;
        auto result = f.engine.Evaluate(altered, commitment, f.rule);
        assert(result.reason == domain::EvaluationReason::IntegrityMismatch);
        assert(!result.matched);
        assert(!result.actionTriggered);
    }
    assert(f.action->getTriggerCount() == 0);

    auto untouched = f.engine.Evaluate(record, commitment, f.rule);
    assert(untouched.reason == domain::EvaluationReason::Matched);
    std::cout << "  [PASS]" << std::endl;
}

int main() {
    testMatchTriggersAction();
    testCaseInsensitiveTokens();
    testExactTokenNotSubstring();
    testLabelMustAgree();
    testFirstConfiguredTermReported();
    testIntegrityGate();
    testEmptyRule();
    testInvalidUtf8RecordHalts();
    std::cout << "[PASS] Rule engine tests." << std::endl;
    return 0;
}
