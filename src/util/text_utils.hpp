#ifndef PHISCAN_UTIL_TEXT_UTILS_HPP
#define PHISCAN_UTIL_TEXT_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

/**
 * @file text_utils.hpp
 * @brief Small ASCII string helpers used across the scanner, the dictionary
 *        matchers and the confidence pipeline.
 *
 * All helpers operate on bytes. Non-ASCII UTF-8 bytes pass through unchanged.
 */

namespace phiscan {
namespace util {

inline std::string toLower(const std::string &s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string toUpper(const std::string &s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

/**
 * @brief Copy of s with leading/trailing whitespace removed.
 */
inline std::string trim(const std::string &s)
{
    static const char *whitespace = " \t\r\n\f\v";
    auto first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

/**
 * @brief Number of whitespace-separated words in s. An all-whitespace
 *        string counts as one (empty) word.
 */
inline std::size_t countWords(const std::string &s)
{
    std::istringstream in(s);
    std::size_t count = 0;
    std::string word;
    while (in >> word) {
        ++count;
    }
    return std::max<std::size_t>(1, count);
}

inline bool containsIgnoreCase(const std::string &haystack, const std::string &needle)
{
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

/**
 * @brief Keep only the digits of s ("123-45-6789" -> "123456789").
 */
inline std::string digitsOnly(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isdigit(c)) {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

inline std::vector<std::string> split(const std::string &s, char delim)
{
    std::vector<std::string> parts;
    std::string current;
    std::istringstream in(s);
    while (std::getline(in, current, delim)) {
        parts.push_back(current);
    }
    if (!s.empty() && s.back() == delim) {
        parts.emplace_back();
    }
    return parts;
}

} // namespace util
} // namespace phiscan

#endif // PHISCAN_UTIL_TEXT_UTILS_HPP
