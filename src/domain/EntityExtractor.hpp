/**
 * @file EntityExtractor.hpp
 * @brief Interface of the upstream entity extractor.
 */

#pragma once
#include <string>
#include <vector>
#include "AnnotatedToken.hpp"

namespace medoracle::domain {

/**
 * @class EntityExtractor
 * @brief Maps raw text to an ordered sequence of annotated tokens.
 */
class EntityExtractor {
public:
    virtual ~EntityExtractor() = default;

    /**
     * @brief Tokenizes and annotates the text.
     * @throws ExtractionUnavailableError if the extractor cannot run.
     */
    virtual std::vector<AnnotatedToken> Extract(const std::string& text) = 0;
};

} // namespace medoracle::domain
