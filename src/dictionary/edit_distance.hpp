#ifndef PHISCAN_DICTIONARY_EDIT_DISTANCE_HPP
#define PHISCAN_DICTIONARY_EDIT_DISTANCE_HPP

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string_view>
#include <vector>

namespace phiscan {
namespace dictionary {

/**
 * @brief Damerau-Levenshtein distance (optimal string alignment) between a and b.
 *
 * Insertion, deletion, substitution and adjacent transposition each cost 1.
 * When the lengths differ by more than maxEdit the answer is known to exceed
 * it and maxEdit + 1 is returned without filling the matrix.
 */
inline int damerauLevenshtein(std::string_view a, std::string_view b, int maxEdit)
{
    const int lenA = static_cast<int>(a.size());
    const int lenB = static_cast<int>(b.size());

    if (lenA == 0) return lenB;
    if (lenB == 0) return lenA;

    if (std::abs(lenA - lenB) > maxEdit) {
        return maxEdit + 1;
    }

    // Three rolling rows: i-2, i-1, i.
    std::vector<int> prevPrev(lenB + 1, 0);
    std::vector<int> prev(lenB + 1, 0);
    std::vector<int> curr(lenB + 1, 0);

    for (int j = 0; j <= lenB; ++j) {
        prev[j] = j;
    }

    for (int i = 1; i <= lenA; ++i) {
        curr[0] = i;
        for (int j = 1; j <= lenB; ++j) {
            const int cost = a[i - 1] == b[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1,          // deletion
                                curr[j - 1] + 1,      // insertion
                                prev[j - 1] + cost}); // substitution

            if (i > 1 && j > 1 && a[i - 1] == b[j - 2] && a[i - 2] == b[j - 1]) {
                curr[j] = std::min(curr[j], prevPrev[j - 2] + cost);
            }
        }
        std::swap(prevPrev, prev);
        std::swap(prev, curr);
    }

    return prev[lenB];
}

/**
 * @brief Confidence of a non-exact dictionary match.
 *
 *   similarity  = 1 - distance / max(len(query), len(match))
 *   prefixBonus = min(4, common leading chars) * 0.1 * (1 - similarity)
 *   confidence  = min(0.99, similarity + prefixBonus) * 0.92^distance
 */
inline double matchConfidence(std::string_view query, std::string_view matched, int distance)
{
    if (distance == 0) {
        return 1.0;
    }

    const double maxLen = static_cast<double>(std::max(query.size(), matched.size()));
    const double similarity = 1.0 - static_cast<double>(distance) / maxLen;

    const std::size_t maxPrefix = std::min<std::size_t>(4, std::min(query.size(), matched.size()));
    std::size_t prefixLen = 0;
    while (prefixLen < maxPrefix && query[prefixLen] == matched[prefixLen]) {
        ++prefixLen;
    }
    const double prefixBonus = static_cast<double>(prefixLen) * 0.1 * (1.0 - similarity);

    const double confidence = std::min(0.99, similarity + prefixBonus);
    return confidence * std::pow(0.92, distance);
}

} // namespace dictionary
} // namespace phiscan

#endif // PHISCAN_DICTIONARY_EDIT_DISTANCE_HPP
