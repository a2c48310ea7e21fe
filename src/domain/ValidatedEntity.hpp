/**
 * @file ValidatedEntity.hpp
 * @brief Entity retained by a validator, with its label and confidence.
 */

#pragma once
#include <string>

namespace medoracle::domain {

/**
 * @brief Well-known labels assigned from the custom vocabularies.
 *
 * Any other label string is an extractor label carried through unchanged.
 */
namespace labels {
inline constexpr const char* Drug = "DRUG";
inline constexpr const char* Symptom = "SYMPTOM";
} // namespace labels

/**
 * @struct ValidatedEntity
 * @brief Immutable classification of one token.
 */
struct ValidatedEntity {
    std::string text;
    std::string label;
    double confidence = 0.0; ///< 0.0 to 1.0.

    bool operator==(const ValidatedEntity& other) const {
        return text == other.text && label == other.label && confidence == other.confidence;
    }
    bool operator!=(const ValidatedEntity& other) const { return !(*this == other); }
};

} // namespace medoracle::domain
