#ifndef PHISCAN_DICTIONARY_FUZZY_TYPES_HPP
#define PHISCAN_DICTIONARY_FUZZY_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace phiscan {
namespace dictionary {

/// DELETE_1 is an edit distance of exactly 1, DELETE_2 anything from 2 up to
/// maxEditDistance. PHONETIC may sit one edit beyond maxEditDistance.
enum class MatchType {
    EXACT,
    DELETE_1,
    DELETE_2,
    PHONETIC,
    NONE
};

inline std::string toString(MatchType type)
{
    switch (type) {
        case MatchType::EXACT:    return "EXACT";
        case MatchType::DELETE_1: return "DELETE_1";
        case MatchType::DELETE_2: return "DELETE_2";
        case MatchType::PHONETIC: return "PHONETIC";
        case MatchType::NONE:     return "NONE";
    }
    return "NONE";
}

/**
 * @struct FuzzyMatch
 * @brief Result of one dictionary lookup. A miss has matched=false, an empty
 *        term, confidence 0 and distance set to the int maximum.
 */
struct FuzzyMatch
{
    bool matched = false;
    std::string term;
    int distance = std::numeric_limits<int>::max();
    double confidence = 0.0;
    MatchType matchType = MatchType::NONE;

    static FuzzyMatch miss() { return FuzzyMatch(); }
};

/**
 * @struct FuzzyConfig
 * @brief Build and lookup parameters of a fuzzy dictionary.
 *
 *   maxEditDistance: deletion depth of the index and the accept threshold.
 *   minTermLength:   terms shorter than this are not indexed at all, and
 *                    shorter queries only get the exact check.
 *   enablePhonetic:  build and consult the Soundex index.
 *   cacheSize:       LRU entries per matcher; 0 disables the cache.
 */
struct FuzzyConfig
{
    int maxEditDistance = 2;
    std::size_t minTermLength = 3;
    bool enablePhonetic = true;
    std::size_t cacheSize = 10000;

    static FuzzyConfig forFirstNames()
    {
        FuzzyConfig c;
        c.maxEditDistance = 2;
        c.minTermLength = 2;
        c.enablePhonetic = true;
        c.cacheSize = 5000;
        return c;
    }

    static FuzzyConfig forSurnames()
    {
        return forFirstNames();
    }

    static FuzzyConfig forLocations()
    {
        FuzzyConfig c;
        c.maxEditDistance = 2;
        c.minTermLength = 3;
        c.enablePhonetic = false;
        c.cacheSize = 2000;
        return c;
    }

    /// Exact matching only.
    static FuzzyConfig strict()
    {
        FuzzyConfig c;
        c.maxEditDistance = 0;
        c.minTermLength = 1;
        c.enablePhonetic = false;
        c.cacheSize = 1000;
        return c;
    }
};

/**
 * @struct FuzzyStats
 * @brief Snapshot of a matcher's counters. Approximate under concurrent use.
 */
struct FuzzyStats
{
    std::size_t terms = 0;
    std::size_t indexEntries = 0;
    std::size_t cacheEntries = 0;
    uint64_t exactHits = 0;
    uint64_t deletionHits = 0;
    uint64_t phoneticHits = 0;
    uint64_t cacheHits = 0;
    uint64_t misses = 0;
    std::string backend;
};

} // namespace dictionary
} // namespace phiscan

#endif // PHISCAN_DICTIONARY_FUZZY_TYPES_HPP
