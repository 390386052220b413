#ifndef PHISCAN_SCANNER_DEFAULT_PATTERNS_HPP
#define PHISCAN_SCANNER_DEFAULT_PATTERNS_HPP

#include <cstddef>
#include <map>
#include <string>

#include "pattern_def.hpp"
#include "validators.hpp"
#include "../core/span.hpp"

/**
 * @file default_patterns.hpp
 * @brief A baseline identifier corpus for the pattern scanner.
 *
 * Deployments normally load their own corpus; this one exists so the engine
 * and the CLI work out of the box. Each group function returns patterns in
 * the order the scanner reports them. Ids containing "LABELED" are boosted
 * by the span enhancer stage.
 */

namespace phiscan {
namespace scanner {

inline PatternList ssnPatterns()
{
    using core::category::SSN;
    return {
        PatternDef("SSN_DASHED", SSN, R"(\b(\d{3})-(\d{2})-(\d{4})\b)", 0.95,
                   "SSN with dashes: 123-45-6789", validators::validateSSN),
        PatternDef("SSN_SPACED", SSN, R"(\b(\d{3})\s(\d{2})\s(\d{4})\b)", 0.90,
                   "SSN with spaces: 123 45 6789", validators::validateSSN),
        PatternDef("SSN_SOLID", SSN, R"(\b(\d{9})\b)", 0.60,
                   "SSN without delimiters: 123456789", validators::validateSSN),
        PatternDef("SSN_LABELED", SSN,
                   R"(\b(?:ssn|social\s{0,8}security(?:\s{0,8}(?:number|#|no\.?))?)\s{0,8}[:\s#]?\s{0,8}(\d{3})[- ]?(\d{2})[- ]?(\d{4})\b)",
                   0.98, "Labeled SSN: SSN: 123-45-6789", validators::validateSSN, true),
        PatternDef("SSN_LAST4", SSN, R"(\b(?:ssn|social\s{0,8}security)[^\n]{0,40}?(\d{4})\b)", 0.85,
                   "Last 4 of SSN: SSN ending in 6789", nullptr, true),
    };
}

inline PatternList phonePatterns()
{
    using core::category::PHONE;
    return {
        PatternDef("PHONE_US_PARENS", PHONE, R"(\((\d{3})\)\s{0,8}(\d{3})[- .]?(\d{4})\b)", 0.95,
                   "US phone with parens: (555) 123-4567"),
        PatternDef("PHONE_US_DASHED", PHONE, R"(\b(\d{3})-(\d{3})-(\d{4})\b)", 0.90,
                   "US phone dashed: 555-123-4567"),
        PatternDef("PHONE_US_DOTTED", PHONE, R"(\b(\d{3})\.(\d{3})\.(\d{4})\b)", 0.90,
                   "US phone dotted: 555.123.4567"),
        PatternDef("PHONE_US_SPACED", PHONE, R"(\b(\d{3})\s(\d{3})\s(\d{4})\b)", 0.85,
                   "US phone spaced: 555 123 4567"),
        PatternDef("PHONE_US_SOLID", PHONE, R"(\b(\d{10})\b)", 0.50,
                   "US phone solid: 5551234567"),
        PatternDef("PHONE_INTL_PLUS", PHONE, R"(\+1[- .]?(\d{3})[- .]?(\d{3})[- .]?(\d{4})\b)", 0.95,
                   "International +1: +1-555-123-4567"),
        PatternDef("PHONE_INTL_PARENS", PHONE, R"(\+1[- .]?\((\d{3})\)\s{0,8}(\d{3})[- .]?(\d{4})\b)", 0.95,
                   "International +1 with parens: +1 (555) 123-4567"),
        PatternDef("PHONE_EXT", PHONE,
                   R"(\b(\d{3})[- .]?(\d{3})[- .]?(\d{4})\s{0,8}(?:ext|x|extension)[.:]?\s{0,8}(\d{1,6})\b)", 0.95,
                   "Phone with extension: 555-123-4567 ext 123", nullptr, true),
        PatternDef("PHONE_LABELED", PHONE,
                   R"(\b(?:phone|tel|telephone|cell|mobile|contact)[:\s#]{0,8}\s{0,8}\(?(\d{3})\)?[- .]?(\d{3})[- .]?(\d{4})\b)",
                   0.98, "Labeled phone: Phone: 555-123-4567", nullptr, true),
    };
}

inline PatternList emailPatterns()
{
    using core::category::EMAIL;
    return {
        PatternDef("EMAIL_STANDARD", EMAIL, R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,63}\b)", 0.95,
                   "Standard email format"),
        PatternDef("EMAIL_LABELED", EMAIL,
                   R"(\b(?:email|e-mail)[:\s]{0,8}\s{0,8}([A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,63})\b)", 0.98,
                   "Labeled email: Email: user@example.com", nullptr, true),
    };
}

inline PatternList datePatterns()
{
    using core::category::DATE;
    return {
        PatternDef("DATE_MMDDYYYY_SLASH", DATE, R"(\b(0?[1-9]|1[0-2])/(0?[1-9]|[12]\d|3[01])/(\d{4}|\d{2})\b)", 0.90,
                   "MM/DD/YYYY or MM/DD/YY"),
        PatternDef("DATE_MMDDYYYY_DASH", DATE, R"(\b(0?[1-9]|1[0-2])-(0?[1-9]|[12]\d|3[01])-(\d{4}|\d{2})\b)", 0.90,
                   "MM-DD-YYYY or MM-DD-YY"),
        PatternDef("DATE_YYYYMMDD", DATE, R"(\b(\d{4})[-/](0?[1-9]|1[0-2])[-/](0?[1-9]|[12]\d|3[01])\b)", 0.92,
                   "YYYY-MM-DD (ISO format)"),
        PatternDef("DATE_WRITTEN_FULL", DATE,
                   R"(\b(January|February|March|April|May|June|July|August|September|October|November|December)\s{1,8}(0?[1-9]|[12]\d|3[01])(?:st|nd|rd|th)?,?\s{1,8}(\d{4})\b)",
                   0.95, "Written date: January 15, 2024", nullptr, true),
        PatternDef("DATE_WRITTEN_ABBREV", DATE,
                   R"(\b(Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sep|Oct|Nov|Dec)\.?\s{1,8}(0?[1-9]|[12]\d|3[01])(?:st|nd|rd|th)?,?\s{1,8}(\d{4}|\d{2})\b)",
                   0.92, "Abbreviated date: Jan 15, 2024", nullptr, true),
        PatternDef("DATE_DAY_WRITTEN", DATE,
                   R"(\b(0?[1-9]|[12]\d|3[01])(?:st|nd|rd|th)?\s{1,8}(January|February|March|April|May|June|July|August|September|October|November|December)\s{1,8}(\d{4})\b)",
                   0.95, "Day first: 15 January 2024", nullptr, true),
    };
}

inline PatternList mrnPatterns()
{
    using core::category::MRN;
    return {
        PatternDef("MRN_LABELED", MRN,
                   R"(\b(?:mrn|medical\s{0,8}record(?:\s{0,8}(?:number|#|no\.?))?|chart(?:\s{0,8}(?:number|#|no\.?))?)\s{0,8}[:\s#]?\s{0,8}([A-Z]?\d{5,10})\b)",
                   0.98, "Labeled MRN: MRN: 12345678", nullptr, true),
        PatternDef("MRN_PREFIX", MRN, R"(\b(MRN|MR|PT)[- ]?(\d{6,10})\b)", 0.90,
                   "Prefixed MRN: MRN-12345678"),
        PatternDef("MRN_NUMERIC_CONTEXT", MRN, R"(\b(?:patient\s{0,8}(?:id|#|number)?)[:\s#]{0,8}\s{0,8}(\d{5,10})\b)", 0.85,
                   "Patient ID context: Patient ID: 12345678", nullptr, true),
    };
}

inline PatternList creditCardPatterns()
{
    using core::category::CREDIT_CARD;
    return {
        PatternDef("CC_VISA", CREDIT_CARD, R"(\b(4\d{3})[- ]?(\d{4})[- ]?(\d{4})[- ]?(\d{4})\b)", 0.95,
                   "Visa: 4xxx-xxxx-xxxx-xxxx", validators::validateLuhn),
        PatternDef("CC_MASTERCARD", CREDIT_CARD, R"(\b(5[1-5]\d{2})[- ]?(\d{4})[- ]?(\d{4})[- ]?(\d{4})\b)", 0.95,
                   "Mastercard: 5[1-5]xx-xxxx-xxxx-xxxx", validators::validateLuhn),
        PatternDef("CC_AMEX", CREDIT_CARD, R"(\b(3[47]\d{2})[- ]?(\d{6})[- ]?(\d{5})\b)", 0.95,
                   "Amex: 3[47]xx-xxxxxx-xxxxx", validators::validateLuhn),
        PatternDef("CC_DISCOVER", CREDIT_CARD, R"(\b(6011)[- ]?(\d{4})[- ]?(\d{4})[- ]?(\d{4})\b)", 0.95,
                   "Discover: 6011-xxxx-xxxx-xxxx", validators::validateLuhn),
        PatternDef("CC_GENERIC_16", CREDIT_CARD, R"(\b(\d{4})[- ](\d{4})[- ](\d{4})[- ](\d{4})\b)", 0.80,
                   "Generic 16-digit card", validators::validateLuhn),
    };
}

inline PatternList ipPatterns()
{
    using core::category::IP;
    return {
        PatternDef("IP_V4", IP, R"(\b((?:25[0-5]|2[0-4]\d|[01]?\d\d?)\.){3}(?:25[0-5]|2[0-4]\d|[01]?\d\d?)\b)", 0.90,
                   "IPv4 address: 192.168.1.1", validators::validateIPv4),
        PatternDef("IP_V6", IP, R"(\b([0-9a-fA-F]{1,4}:){7}[0-9a-fA-F]{1,4}\b)", 0.95,
                   "IPv6 address"),
    };
}

inline PatternList zipcodePatterns()
{
    using core::category::ZIPCODE;
    return {
        PatternDef("ZIP_5", ZIPCODE, R"(\b(\d{5})\b)", 0.50, "5-digit ZIP"),
        PatternDef("ZIP_PLUS4", ZIPCODE, R"(\b(\d{5})-(\d{4})\b)", 0.90, "ZIP+4: 12345-6789"),
        PatternDef("ZIP_LABELED", ZIPCODE, R"(\b(?:zip(?:\s{0,8}code)?|postal\s{0,8}code)[:\s]{0,8}\s{0,8}(\d{5})(?:-(\d{4}))?\b)", 0.98,
                   "Labeled ZIP: Zip Code: 12345", nullptr, true),
    };
}

/**
 * @brief The full baseline corpus, group by group.
 */
inline PatternList defaultPatterns()
{
    PatternList all;
    for (auto group : {ssnPatterns(), phonePatterns(), emailPatterns(), datePatterns(),
                       mrnPatterns(), creditCardPatterns(), ipPatterns(), zipcodePatterns()}) {
        all.insert(all.end(), group.begin(), group.end());
    }
    return all;
}

/**
 * @struct PatternStats
 * @brief Corpus size, total and per category.
 */
struct PatternStats
{
    std::size_t total = 0;
    std::map<std::string, std::size_t> byType;
};

inline PatternStats patternStats(const PatternList &patterns)
{
    PatternStats stats;
    stats.total = patterns.size();
    for (const auto &p : patterns) {
        ++stats.byType[p.filterType()];
    }
    return stats;
}

} // namespace scanner
} // namespace phiscan

#endif // PHISCAN_SCANNER_DEFAULT_PATTERNS_HPP
