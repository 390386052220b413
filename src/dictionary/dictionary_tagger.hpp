#ifndef PHISCAN_DICTIONARY_DICTIONARY_TAGGER_HPP
#define PHISCAN_DICTIONARY_DICTIONARY_TAGGER_HPP

#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "fuzzy_dictionary_matcher.hpp"
#include "../core/span.hpp"

namespace phiscan {
namespace dictionary {

struct Token
{
    std::string text;
    std::size_t start = 0;
    std::size_t end = 0;
};

inline bool isWordByte(unsigned char c)
{
    // Bytes >= 0x80 belong to multi-byte UTF-8 letters.
    return std::isalpha(c) || c >= 0x80;
}

/**
 * @brief Split text into word tokens with byte offsets. An apostrophe or
 *        hyphen stays inside a token when a letter follows it ("O'Brien",
 *        "Smith-Jones").
 */
inline std::vector<Token> tokenize(const std::string &text)
{
    std::vector<Token> tokens;
    std::size_t i = 0;
    const std::size_t n = text.size();

    while (i < n) {
        if (!isWordByte(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        const std::size_t start = i;
        while (i < n) {
            const unsigned char c = static_cast<unsigned char>(text[i]);
            if (isWordByte(c)) {
                ++i;
            } else if ((c == '\'' || c == '-') && i + 1 < n &&
                       isWordByte(static_cast<unsigned char>(text[i + 1]))) {
                ++i;
            } else {
                break;
            }
        }
        tokens.push_back({text.substr(start, i - start), start, i});
    }
    return tokens;
}

struct TaggerConfig
{
    std::size_t minTokenLength = 3;
    double minConfidence = 0.5;
};

/**
 * @class DictionaryTagger
 * @brief Turns fuzzy dictionary hits on word tokens into candidate spans.
 *
 * Each registered dictionary has a category and a base confidence. A token
 * that matches yields a Span of that category with confidence
 * match.confidence * baseConfidence and pattern id FUZZY_<CATEGORY>_<TYPE>.
 * Spans below minConfidence are dropped. Output is in token order, then
 * dictionary registration order.
 */
class DictionaryTagger
{
public:
    explicit DictionaryTagger(TaggerConfig config = TaggerConfig())
        : config_(config)
    {
    }

    void addDictionary(const std::string &category,
                       std::shared_ptr<const FuzzyDictionaryMatcher> matcher,
                       double baseConfidence = 0.85)
    {
        if (!matcher) {
            throw std::runtime_error("DictionaryTagger: null matcher for category " + category);
        }
        entries_.push_back({category, std::move(matcher), core::clampConfidence(baseConfidence)});
    }

    std::size_t dictionaryCount() const { return entries_.size(); }

    const TaggerConfig &config() const { return config_; }

    std::vector<core::Span> tag(const std::string &text) const
    {
        std::vector<core::Span> spans;
        if (entries_.empty()) {
            return spans;
        }

        for (const auto &token : tokenize(text)) {
            if (token.text.size() < config_.minTokenLength) {
                continue;
            }
            for (const auto &entry : entries_) {
                const FuzzyMatch match = entry.matcher->lookup(token.text);
                if (!match.matched) {
                    continue;
                }
                const double confidence = match.confidence * entry.baseConfidence;
                if (confidence < config_.minConfidence) {
                    continue;
                }
                spans.emplace_back(entry.category, token.text, token.start, token.end, confidence,
                                   "FUZZY_" + entry.category + "_" + toString(match.matchType));
            }
        }

        util::logger::debug("[DictionaryTagger] " + std::to_string(spans.size()) + " spans");
        return spans;
    }

private:
    struct Entry
    {
        std::string category;
        std::shared_ptr<const FuzzyDictionaryMatcher> matcher;
        double baseConfidence;
    };

    TaggerConfig config_;
    std::vector<Entry> entries_;
};

} // namespace dictionary
} // namespace phiscan

#endif // PHISCAN_DICTIONARY_DICTIONARY_TAGGER_HPP
