/**
 * @file GazetteerEntityExtractor.hpp
 * @brief Minimal entity extractor: word tokenizer plus a label gazetteer.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "domain/EntityExtractor.hpp"

namespace medoracle::infrastructure {

/**
 * @class GazetteerEntityExtractor
 * @brief Splits text on whitespace, trims punctuation and labels tokens found in the gazetteer.
 *
 * Stands in for a statistical NER model; lookups are case-insensitive.
 */
class GazetteerEntityExtractor : public domain::EntityExtractor {
public:
    explicit GazetteerEntityExtractor(std::map<std::string, std::string> gazetteer = {});

    std::vector<domain::AnnotatedToken> Extract(const std::string& text) override;

private:
    std::map<std::string, std::string> m_gazetteer; ///< Lowercased token -> label.
};

} // namespace medoracle::infrastructure
