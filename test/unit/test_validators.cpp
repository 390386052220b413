// test/unit/test_validators.cpp
// -----------------------------------------------------------
// Checksum and range validators attached to scanner patterns.

#include <gtest/gtest.h>

#include "scanner/validators.hpp"

namespace {

using namespace phiscan::scanner::validators;

TEST(ValidatorsTest, SSNAcceptsIssuedNumbers) {
    EXPECT_TRUE(validateSSN("219-09-9999"));
    EXPECT_TRUE(validateSSN("219 09 9999"));
    EXPECT_TRUE(validateSSN("219099999"));
}

TEST(ValidatorsTest, SSNRejectsReservedAndPlaceholderNumbers) {
    EXPECT_FALSE(validateSSN("000-12-3456"));
    EXPECT_FALSE(validateSSN("666-12-3456"));
    EXPECT_FALSE(validateSSN("912-12-3456"));
    EXPECT_FALSE(validateSSN("219-00-3456"));
    EXPECT_FALSE(validateSSN("219-12-0000"));
    EXPECT_FALSE(validateSSN("123-45-6789"));
    EXPECT_FALSE(validateSSN("111-11-1111"));
    EXPECT_FALSE(validateSSN("12-345-678"));
}

TEST(ValidatorsTest, LuhnChecksum) {
    EXPECT_TRUE(validateLuhn("4111 1111 1111 1111"));
    EXPECT_TRUE(validateLuhn("5555-5555-5555-4444"));
    EXPECT_TRUE(validateLuhn("378282246310005"));
    EXPECT_FALSE(validateLuhn("4111 1111 1111 1112"));
    EXPECT_FALSE(validateLuhn(""));
}

TEST(ValidatorsTest, IPv4OctetRange) {
    EXPECT_TRUE(validateIPv4("192.168.1.1"));
    EXPECT_TRUE(validateIPv4("0.0.0.0"));
    EXPECT_FALSE(validateIPv4("256.1.1.1"));
    EXPECT_FALSE(validateIPv4("1.2.3"));
    EXPECT_FALSE(validateIPv4("1..2.3"));
    EXPECT_FALSE(validateIPv4("1.2.3.4.5"));
}

} // anonymous namespace
