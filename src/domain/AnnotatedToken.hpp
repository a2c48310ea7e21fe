/**
 * @file AnnotatedToken.hpp
 * @brief Token produced by the external entity extractor.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace medoracle::domain {

/**
 * @struct AnnotatedToken
 * @brief One token of the source text with the extractor's label, if any.
 */
struct AnnotatedToken {
    std::string text;
    std::optional<std::string> recognizedLabel; ///< e.g. "ORG", "QUANTITY"; empty when unlabeled.
    std::size_t position = 0;                   ///< Index in the token stream.
};

} // namespace medoracle::domain
