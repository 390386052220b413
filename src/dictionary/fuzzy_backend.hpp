#ifndef PHISCAN_DICTIONARY_FUZZY_BACKEND_HPP
#define PHISCAN_DICTIONARY_FUZZY_BACKEND_HPP

#include <deque>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "edit_distance.hpp"
#include "fuzzy_types.hpp"
#include "soundex.hpp"

/**
 * @file fuzzy_backend.hpp
 * @brief Strategy interface for fuzzy dictionary indexes, plus the SymSpell
 *        lookup shared by every implementation.
 *
 * A backend owns an index built once from normalized terms and is read-only
 * afterwards. Caching, statistics and query normalization belong to
 * FuzzyDictionaryMatcher, not to the backend.
 *
 * Index requirements for symspellLookup():
 *   const std::string *findTerm(const std::string &) const;
 *   void forEachPosting(const std::string &key, F f) const;   // f(const std::string &term)
 *   void forEachPhonetic(const std::string &code, F f) const; // f(const std::string &term)
 * Postings and phonetic buckets are visited in term insertion order, and the
 * references handed to f stay valid for the index lifetime.
 */

namespace phiscan {
namespace dictionary {

class FuzzyBackend
{
public:
    virtual ~FuzzyBackend() = default;

    /// Lookup of an already normalized query.
    virtual FuzzyMatch lookup(const std::string &query) const = 0;

    /// Exact membership of an already normalized term.
    virtual bool contains(const std::string &term) const = 0;

    /// Number of indexed terms.
    virtual std::size_t size() const = 0;

    /// Number of distinct deletion keys.
    virtual std::size_t indexSize() const = 0;

    virtual std::string name() const = 0;
};

struct Deletion
{
    std::string text;
    int distance = 0;
};

/**
 * @brief Breadth-first deletion neighborhood of a word, excluding the word
 *        itself, deduplicated, in discovery order.
 *
 * Strings shorter than minTermLength - maxDistance are not generated.
 */
inline std::vector<Deletion> generateDeletions(const std::string &word, int maxDistance,
                                               std::size_t minTermLength)
{
    std::vector<Deletion> result;
    if (maxDistance <= 0) {
        return result;
    }

    const long floorLength = static_cast<long>(minTermLength) - maxDistance;
    std::unordered_set<std::string> seen;
    std::deque<Deletion> queue;
    queue.push_back({word, 0});

    while (!queue.empty()) {
        Deletion current = std::move(queue.front());
        queue.pop_front();

        if (current.distance > 0) {
            result.push_back(current);
        }
        if (current.distance >= maxDistance) {
            continue;
        }

        for (std::size_t i = 0; i < current.text.size(); ++i) {
            std::string shorter = current.text.substr(0, i) + current.text.substr(i + 1);
            if (static_cast<long>(shorter.size()) >= floorLength && seen.insert(shorter).second) {
                queue.push_back({std::move(shorter), current.distance + 1});
            }
        }
    }
    return result;
}

/**
 * @brief SymSpell lookup against any index shape (see file comment).
 *
 * Order: exact term, then deletion candidates within maxEditDistance (first
 * found wins ties), then the Soundex bucket within maxEditDistance + 1 at
 * 0.9x confidence, then a miss. Queries without ASCII letters skip the
 * Soundex step.
 */
template<typename Index>
FuzzyMatch symspellLookup(const Index &index, const std::string &query, const FuzzyConfig &config)
{
    if (index.findTerm(query) != nullptr) {
        FuzzyMatch exact;
        exact.matched = true;
        exact.term = query;
        exact.distance = 0;
        exact.confidence = 1.0;
        exact.matchType = MatchType::EXACT;
        return exact;
    }

    if (query.size() < config.minTermLength) {
        return FuzzyMatch::miss();
    }

    std::vector<const std::string *> candidates;
    std::unordered_set<std::string_view> seen;
    auto collect = [&](const std::string &term) {
        if (seen.insert(term).second) {
            candidates.push_back(&term);
        }
    };

    index.forEachPosting(query, collect);
    for (const auto &deletion : generateDeletions(query, config.maxEditDistance, config.minTermLength)) {
        if (const std::string *term = index.findTerm(deletion.text)) {
            collect(*term);
        }
        index.forEachPosting(deletion.text, collect);
    }

    const std::string *best = nullptr;
    int bestDistance = 0;
    for (const std::string *candidate : candidates) {
        const int distance = damerauLevenshtein(query, *candidate, config.maxEditDistance);
        if (distance <= config.maxEditDistance && (best == nullptr || distance < bestDistance)) {
            best = candidate;
            bestDistance = distance;
        }
    }

    if (best != nullptr) {
        FuzzyMatch match;
        match.matched = true;
        match.term = *best;
        match.distance = bestDistance;
        match.confidence = matchConfidence(query, *best, bestDistance);
        match.matchType = bestDistance == 1 ? MatchType::DELETE_1 : MatchType::DELETE_2;
        return match;
    }

    const std::string code = config.enablePhonetic ? soundex(query) : kNoSoundex;
    if (hasSoundex(code)) {
        const std::string *closest = nullptr;
        int closestDistance = 0;
        index.forEachPhonetic(code, [&](const std::string &term) {
            const int distance = damerauLevenshtein(query, term, config.maxEditDistance);
            if (closest == nullptr || distance < closestDistance) {
                closest = &term;
                closestDistance = distance;
            }
        });

        if (closest != nullptr && closestDistance <= config.maxEditDistance + 1) {
            FuzzyMatch match;
            match.matched = true;
            match.term = *closest;
            match.distance = closestDistance;
            match.confidence = matchConfidence(query, *closest, closestDistance) * 0.9;
            match.matchType = MatchType::PHONETIC;
            return match;
        }
    }

    return FuzzyMatch::miss();
}

} // namespace dictionary
} // namespace phiscan

#endif // PHISCAN_DICTIONARY_FUZZY_BACKEND_HPP
