/**
 * @file Vocabulary.hpp
 * @brief Custom drug and symptom vocabularies consumed by every validator.
 */

#pragma once
#include <string>
#include <vector>

namespace medoracle::domain {

/**
 * @struct Vocabulary
 * @brief Immutable term lists. Terms are stored lowercased.
 */
struct Vocabulary {
    std::vector<std::string> drugs;
    std::vector<std::string> symptoms;
};

} // namespace medoracle::domain
