#ifndef PHISCAN_CORE_SPAN_HPP
#define PHISCAN_CORE_SPAN_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

/**
 * @file span.hpp
 * @brief The Span record shared by the pattern scanner, the dictionary tagger
 *        and every confidence pipeline stage.
 *
 * A Span is created by a detector, mutated in place by pipeline stages, and
 * discarded at the end of one document. Offsets are byte offsets into the
 * document string, half-open: [characterStart, characterEnd).
 */

namespace phiscan {
namespace core {

/**
 * Category labels used by the default pattern corpus and the pipeline's
 * default rules. Categories are open-ended strings so externally supplied
 * corpora may introduce their own.
 */
namespace category {
    inline const std::string NAME          = "NAME";
    inline const std::string PROVIDER_NAME = "PROVIDER_NAME";
    inline const std::string EMAIL         = "EMAIL";
    inline const std::string SSN           = "SSN";
    inline const std::string PHONE         = "PHONE";
    inline const std::string FAX           = "FAX";
    inline const std::string ADDRESS       = "ADDRESS";
    inline const std::string ZIPCODE       = "ZIPCODE";
    inline const std::string CITY          = "CITY";
    inline const std::string DATE          = "DATE";
    inline const std::string AGE_90_PLUS   = "AGE_90_PLUS";
    inline const std::string CREDIT_CARD   = "CREDIT_CARD";
    inline const std::string ACCOUNT       = "ACCOUNT";
    inline const std::string MRN           = "MRN";
    inline const std::string IP            = "IP";
    inline const std::string URL           = "URL";
    inline const std::string LOCATION      = "LOCATION";
    inline const std::string HOSPITAL      = "HOSPITAL";
} // namespace category

/**
 * @brief Clamp a confidence into [0,1]. NaN becomes 0.
 */
inline double clampConfidence(double value)
{
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::min(1.0, std::max(0.0, value));
}

struct Span
{
    std::string filterType;                 ///< Category label, e.g. "SSN"
    std::string text;                       ///< Matched text
    std::size_t characterStart = 0;
    std::size_t characterEnd = 0;
    double confidence = 0.0;                ///< Always within [0,1]
    std::string pattern;                    ///< Originating pattern or matcher id
    std::vector<std::string> ambiguousWith; ///< Other categories overlapping this span, first-seen order
    std::vector<std::string> groups;        ///< Capture groups of the originating match

    Span() = default;

    Span(std::string type, std::string matched, std::size_t start, std::size_t end,
         double conf, std::string patternId = std::string())
        : filterType(std::move(type)),
          text(std::move(matched)),
          characterStart(start),
          characterEnd(std::max(start, end)),
          confidence(clampConfidence(conf)),
          pattern(std::move(patternId))
    {
    }

    std::size_t length() const { return characterEnd - characterStart; }

    bool overlaps(const Span &other) const
    {
        return characterStart < other.characterEnd && other.characterStart < characterEnd;
    }

    bool sameOffsets(const Span &other) const
    {
        return characterStart == other.characterStart && characterEnd == other.characterEnd;
    }

    bool isAmbiguousWith(const std::string &type) const
    {
        return std::find(ambiguousWith.begin(), ambiguousWith.end(), type) != ambiguousWith.end();
    }

    /**
     * @brief Record another category this span competes with. Idempotent.
     */
    void addAmbiguity(const std::string &type)
    {
        if (!isAmbiguousWith(type)) {
            ambiguousWith.push_back(type);
        }
    }

    /**
     * @brief Multiply confidence by factor, clamped to [0,1].
     */
    void scaleConfidence(double factor)
    {
        confidence = clampConfidence(confidence * factor);
    }

    void setConfidence(double value)
    {
        confidence = clampConfidence(value);
    }
};

} // namespace core
} // namespace phiscan

#endif // PHISCAN_CORE_SPAN_HPP
