#ifndef PHISCAN_SCANNER_VALIDATORS_HPP
#define PHISCAN_SCANNER_VALIDATORS_HPP

#include <string>

#include "../util/text_utils.hpp"

namespace phiscan {
namespace scanner {
namespace validators {

/**
 * @brief Structural SSN check on the digits of a match.
 *
 * Rejects area 000, 666 and 900-999, group 00, serial 0000, and the
 * well-known placeholder numbers 123-45-6789 and 111-11-1111.
 */
inline bool validateSSN(const std::string &ssn)
{
    const std::string digits = util::digitsOnly(ssn);
    if (digits.size() != 9) {
        return false;
    }

    const int area = std::stoi(digits.substr(0, 3));
    const int group = std::stoi(digits.substr(3, 2));
    const int serial = std::stoi(digits.substr(5, 4));

    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }
    if (group == 0 || serial == 0) {
        return false;
    }
    if (digits == "123456789" || digits == "111111111") {
        return false;
    }
    return true;
}

/**
 * @brief Luhn (mod 10) checksum over the digits of a card number.
 */
inline bool validateLuhn(const std::string &cardNumber)
{
    const std::string digits = util::digitsOnly(cardNumber);
    if (digits.empty()) {
        return false;
    }

    int sum = 0;
    bool doubleIt = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';
        if (doubleIt) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        doubleIt = !doubleIt;
    }
    return sum % 10 == 0;
}

/**
 * @brief Dotted-quad with four octets in 0..255.
 */
inline bool validateIPv4(const std::string &ip)
{
    const auto octets = util::split(ip, '.');
    if (octets.size() != 4) {
        return false;
    }
    for (const auto &octet : octets) {
        if (octet.empty() || octet.size() > 3 || util::digitsOnly(octet) != octet) {
            return false;
        }
        if (std::stoi(octet) > 255) {
            return false;
        }
    }
    return true;
}

} // namespace validators
} // namespace scanner
} // namespace phiscan

#endif // PHISCAN_SCANNER_VALIDATORS_HPP
