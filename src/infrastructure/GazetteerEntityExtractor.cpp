/**
 * @file GazetteerEntityExtractor.cpp
 * @brief Implementation of GazetteerEntityExtractor.
 */

#include "infrastructure/GazetteerEntityExtractor.hpp"

#include <cctype>
#include <sstream>

namespace medoracle::infrastructure {

namespace {

std::string Lower(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

bool IsTrimmable(unsigned char c) {
    return std::ispunct(c) && c != '-' && c != '%';
}

std::string TrimPunctuation(const std::string& word) {
    std::size_t begin = 0;
    std::size_t end = word.size();
    while (begin < end && IsTrimmable(static_cast<unsigned char>(word[begin]))) ++begin;
    while (end > begin && IsTrimmable(static_cast<unsigned char>(word[end - 1]))) --end;
    return word.substr(begin, end - begin);
}

} // namespace

GazetteerEntityExtractor::GazetteerEntityExtractor(std::map<std::string, std::string> gazetteer) {
    for (auto& [term, label] : gazetteer) {
        m_gazetteer[Lower(term)] = label;
    }
}

std::vector<domain::AnnotatedToken> GazetteerEntityExtractor::Extract(const std::string& text) {
    std::vector<domain::AnnotatedToken> tokens;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        std::string cleaned = TrimPunctuation(word);
        if (cleaned.empty()) continue;

        domain::AnnotatedToken token;
        token.text = cleaned;
        token.position = tokens.size();
        auto it = m_gazetteer.find(Lower(cleaned));
        if (it != m_gazetteer.end()) {
            token.recognizedLabel = it->second;
        }
        tokens.push_back(std::move(token));
    }
    return tokens;
}

} // namespace medoracle::infrastructure
