/**
 * @file Reviewers.hpp
 * @brief HumanReviewer implementations: scripted fixture and interactive console.
 */

#pragma once

#include <istream>
#include <ostream>
#include "domain/HumanReviewer.hpp"

namespace medoracle::infrastructure {

/**
 * @class ScriptedReviewer
 * @brief Returns a fixed, pre-agreed correction. Used for unattended runs.
 */
class ScriptedReviewer : public domain::HumanReviewer {
public:
    explicit ScriptedReviewer(domain::ReviewDecision decision);

    domain::ReviewDecision Review(const domain::ArbitrationCase& arbitrationCase) override;

    /** @brief The correction used by the reference medical-report scenario. */
    static domain::ReviewDecision DefaultCorrection();

private:
    domain::ReviewDecision m_decision;
};

/**
 * @class ConsoleReviewer
 * @brief Shows the case on an output stream and reads the correction from an input stream.
 *
 * Input: one line with the correction reason, then one entity per line as
 * "<text> <LABEL> <confidence>", ended by an empty line or end of input.
 */
class ConsoleReviewer : public domain::HumanReviewer {
public:
    ConsoleReviewer(std::istream& in, std::ostream& out);

    domain::ReviewDecision Review(const domain::ArbitrationCase& arbitrationCase) override;

private:
    std::istream& m_in;
    std::ostream& m_out;
};

} // namespace medoracle::infrastructure
