/**
 * @file Reviewers.cpp
 * @brief Implementation of ScriptedReviewer and ConsoleReviewer.
 */

#include "infrastructure/Reviewers.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

namespace medoracle::infrastructure {

ScriptedReviewer::ScriptedReviewer(domain::ReviewDecision decision)
    : m_decision(std::move(decision)) {}

domain::ReviewDecision ScriptedReviewer::Review(const domain::ArbitrationCase&) {
    return m_decision;
}

domain::ReviewDecision ScriptedReviewer::DefaultCorrection() {
    domain::ReviewDecision decision;
    decision.entities = {
        {"MRI", "PROCEDURE", 0.98},
        {"headache", domain::labels::Symptom, 0.95},
        {"fatigue", domain::labels::Symptom, 0.93},
        {"ibuprofen", domain::labels::Drug, 0.97}
    };
    decision.reason = "Low confidence in NLP extraction for 'MRI'";
    return decision;
}

ConsoleReviewer::ConsoleReviewer(std::istream& in, std::ostream& out)
    : m_in(in), m_out(out) {}

domain::ReviewDecision ConsoleReviewer::Review(const domain::ArbitrationCase& arbitrationCase) {
    m_out << "=== Human review required ===\n";
    m_out << "Text: " << arbitrationCase.originalText << "\n";
    for (const auto& a : arbitrationCase.attestations) {
        if (!a) continue;
        m_out << "  " << a->nodeId << ":";
        for (const auto& e : a->package.entities) {
            m_out << " " << e.text << "(" << e.label << ")";
        }
        m_out << "\n";
    }

    domain::ReviewDecision decision;
    m_out << "Correction reason: " << std::flush;
    if (!std::getline(m_in, decision.reason) || decision.reason.empty()) {
        throw std::runtime_error("ConsoleReviewer: no correction reason provided.");
    }

    m_out << "Entities as '<text> <LABEL> <confidence>', empty line to finish:" << std::endl;
    std::string line;
    while (std::getline(m_in, line) && !line.empty()) {
        std::istringstream fields(line);
        domain::ValidatedEntity entity;
        if (!(fields >> entity.text >> entity.label >> entity.confidence)) {
            throw std::runtime_error("ConsoleReviewer: malformed entity line '" + line + "'.");
        }
        decision.entities.push_back(std::move(entity));
    }
    return decision;
}

} // namespace medoracle::infrastructure
