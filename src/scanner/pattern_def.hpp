#ifndef PHISCAN_SCANNER_PATTERN_DEF_HPP
#define PHISCAN_SCANNER_PATTERN_DEF_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/span.hpp"
#include "../util/logger.hpp"

/**
 * @file pattern_def.hpp
 * @brief Compiled pattern definitions and the match records they produce.
 *
 * DESIGN:
 *   - A PatternDef compiles its expression once, at construction. A bad
 *     expression is a corpus-loading error and throws there, never mid-scan.
 *   - Matching is stateless: every call walks its own std::sregex_iterator,
 *     so one PatternDef can be used from any number of threads at once.
 *   - Expressions use the ECMAScript grammar. The accelerated backend feeds
 *     the same expression text to its prefilter, so corpora should stay within
 *     the syntax both understand (classes, \b, \d, \s, groups, alternation,
 *     bounded repeats).
 *   - Every repeat in a corpus expression must be bounded ({0,8}, {1,64}).
 *     The std::regex executor recurses once per character a repeat consumes,
 *     so `*`, `+` or `{n,}` over a long run of text overflows the stack, and
 *     that is not a std::regex_error collectMatches() can catch.
 */

namespace phiscan {
namespace scanner {

/// Returns true when a raw match should be kept (e.g. a checksum passes).
using Validator = std::function<bool(const std::string &)>;

/**
 * @class PatternDef
 * @brief One entry of the pattern corpus: id, category, compiled matcher,
 *        base confidence and optional validator.
 */
class PatternDef
{
public:
    /**
     * @throw std::runtime_error if the expression does not compile.
     */
    PatternDef(std::string id,
               std::string filterType,
               std::string expression,
               double confidence,
               std::string description = std::string(),
               Validator validator = nullptr,
               bool caseInsensitive = false)
        : id_(std::move(id)),
          filterType_(std::move(filterType)),
          expression_(std::move(expression)),
          confidence_(core::clampConfidence(confidence)),
          description_(std::move(description)),
          validator_(std::move(validator)),
          caseInsensitive_(caseInsensitive)
    {
        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (caseInsensitive_) {
            flags |= std::regex::icase;
        }
        try {
            regex_ = std::make_shared<const std::regex>(expression_, flags);
        } catch (const std::regex_error &ex) {
            throw std::runtime_error("PatternDef: pattern '" + id_ +
                                     "' failed to compile: " + ex.what());
        }
    }

    const std::string &id() const { return id_; }
    const std::string &filterType() const { return filterType_; }
    const std::string &expression() const { return expression_; }
    double confidence() const { return confidence_; }
    const std::string &description() const { return description_; }
    bool caseInsensitive() const { return caseInsensitive_; }
    bool hasValidator() const { return static_cast<bool>(validator_); }
    const std::regex &regex() const { return *regex_; }

    /**
     * @brief Run the validator, if any. A validator that throws rejects the match.
     */
    bool accepts(const std::string &matched) const
    {
        if (!validator_) {
            return true;
        }
        try {
            return validator_(matched);
        } catch (const std::exception &ex) {
            util::logger::warn("[PatternDef] validator for '" + id_ + "' threw on '" +
                               matched + "': " + ex.what() + " (match dropped)");
            return false;
        }
    }

private:
    std::string id_;
    std::string filterType_;
    std::string expression_;
    double confidence_;
    std::string description_;
    Validator validator_;
    bool caseInsensitive_;
    std::shared_ptr<const std::regex> regex_;
};

using PatternList = std::vector<PatternDef>;

/**
 * @struct ScanMatch
 * @brief A raw candidate produced by one pattern.
 */
struct ScanMatch
{
    std::string patternId;
    std::string filterType;
    std::string text;
    std::size_t start = 0;
    std::size_t end = 0;
    double confidence = 0.0;
    std::vector<std::string> groups;

    core::Span toSpan() const
    {
        core::Span span(filterType, text, start, end, confidence, patternId);
        span.groups = groups;
        return span;
    }
};

/**
 * @brief Append every accepted match of one pattern over text to out.
 *
 * A std::regex_error raised mid-iteration (e.g. error_complexity on
 * pathological input) stops this pattern only; matches already collected for
 * it are kept and the caller moves on to the next pattern.
 *
 * @return The number of matches appended.
 */
inline std::size_t collectMatches(const PatternDef &pattern,
                                  const std::string &text,
                                  std::vector<ScanMatch> &out)
{
    std::size_t appended = 0;
    try {
        auto begin = std::sregex_iterator(text.begin(), text.end(), pattern.regex());
        const auto end = std::sregex_iterator();
        for (auto it = begin; it != end; ++it) {
            const std::smatch &m = *it;
            std::string matched = m.str(0);
            if (!pattern.accepts(matched)) {
                continue;
            }

            ScanMatch sm;
            sm.patternId = pattern.id();
            sm.filterType = pattern.filterType();
            sm.start = static_cast<std::size_t>(m.position(0));
            sm.end = sm.start + matched.size();
            sm.text = std::move(matched);
            sm.confidence = pattern.confidence();
            sm.groups.reserve(m.size() > 0 ? m.size() - 1 : 0);
            for (std::size_t g = 1; g < m.size(); ++g) {
                sm.groups.push_back(m[g].matched ? m[g].str() : std::string());
            }
            out.push_back(std::move(sm));
            ++appended;
        }
    } catch (const std::regex_error &ex) {
        util::logger::warn("[PatternDef] pattern '" + pattern.id() +
                           "' aborted during matching: " + ex.what());
    }
    return appended;
}

} // namespace scanner
} // namespace phiscan

#endif // PHISCAN_SCANNER_PATTERN_DEF_HPP
