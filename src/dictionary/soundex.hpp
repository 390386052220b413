#ifndef PHISCAN_DICTIONARY_SOUNDEX_HPP
#define PHISCAN_DICTIONARY_SOUNDEX_HPP

#include <cctype>
#include <string>

namespace phiscan {
namespace dictionary {

/**
 * @brief Digit class of an uppercase letter; '0' for vowels, H, W, Y and
 *        anything else. '0' letters separate runs of the same class.
 */
inline char soundexClass(char upper)
{
    switch (upper) {
        case 'B': case 'F': case 'P': case 'V':
            return '1';
        case 'C': case 'G': case 'J': case 'K': case 'Q': case 'S': case 'X': case 'Z':
            return '2';
        case 'D': case 'T':
            return '3';
        case 'L':
            return '4';
        case 'M': case 'N':
            return '5';
        case 'R':
            return '6';
        default:
            return '0';
    }
}

/// Code of a word without ASCII letters. It carries no phonetic information,
/// so such words are never indexed or looked up by sound.
const std::string kNoSoundex = "0000";

inline bool hasSoundex(const std::string &code)
{
    return code != kNoSoundex;
}

/**
 * @brief American Soundex code of a word ("Robert" -> "R163").
 *
 * Non-letters are ignored. The first letter is kept, following letters are
 * replaced by their class digit, adjacent duplicate classes collapse, and the
 * result is padded with '0' or truncated to four characters. A word with no
 * ASCII letters encodes as kNoSoundex.
 */
inline std::string soundex(const std::string &word)
{
    std::string letters;
    letters.reserve(word.size());
    for (unsigned char c : word) {
        if (std::isalpha(c) && c < 0x80) {
            letters.push_back(static_cast<char>(std::toupper(c)));
        }
    }
    if (letters.empty()) {
        return kNoSoundex;
    }

    std::string code(1, letters[0]);
    char previous = soundexClass(letters[0]);

    for (std::size_t i = 1; i < letters.size() && code.size() < 4; ++i) {
        const char current = soundexClass(letters[i]);
        if (current != '0' && current != previous) {
            code.push_back(current);
        }
        previous = current;
    }

    code.append(4 - code.size(), '0');
    return code;
}

} // namespace dictionary
} // namespace phiscan

#endif // PHISCAN_DICTIONARY_SOUNDEX_HPP
