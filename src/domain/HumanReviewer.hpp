/**
 * @file HumanReviewer.hpp
 * @brief Interface to the human validator consulted after consensus failure.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "ValidationPackage.hpp"

namespace medoracle::domain {

/**
 * @struct ArbitrationCase
 * @brief Everything shown to the reviewer: the source text and every node's output.
 */
struct ArbitrationCase {
    std::string originalText;
    std::vector<std::optional<NodeAttestation>> attestations; ///< Nulls are abstaining or silent nodes.
};

/**
 * @struct ReviewDecision
 * @brief The reviewer's corrected entity list and justification.
 */
struct ReviewDecision {
    std::vector<ValidatedEntity> entities;
    std::string reason;
};

/**
 * @class HumanReviewer
 * @brief Source of human corrections (web form, console, scripted fixture).
 */
class HumanReviewer {
public:
    virtual ~HumanReviewer() = default;
    virtual ReviewDecision Review(const ArbitrationCase& arbitrationCase) = 0;
};

} // namespace medoracle::domain
