/**
 * @file fingerprint_utils_test.cpp
 * @brief Tests for FingerprintUtils normalization, comparison and formatting
 */

#include <gtest/gtest.h>

#include "securexfer/FingerprintUtils.h"

using SecureXfer::FingerprintUtils;

TEST(FingerprintUtilsTest, NormalizeAcceptsColonSeparatedAndLowercase) {
    const std::string normalized =
        "0123456789ABCDEF0123456789ABCDEF0123456789ABCDEF0123456789ABCDEF";

    const std::string withColons =
        "01:23:45:67:89:ab:cd:ef:01:23:45:67:89:ab:cd:ef:"
        "01:23:45:67:89:ab:cd:ef:01:23:45:67:89:ab:cd:ef";

    EXPECT_EQ(FingerprintUtils::normalizeSha256Hex(withColons), normalized);
}

TEST(FingerprintUtilsTest, NormalizeRejectsInvalidLengthOrChars) {
    EXPECT_TRUE(FingerprintUtils::normalizeSha256Hex("").empty());
    EXPECT_TRUE(FingerprintUtils::normalizeSha256Hex("123").empty());
    EXPECT_TRUE(FingerprintUtils::normalizeSha256Hex(std::string(64, 'g')).empty());
    EXPECT_TRUE(FingerprintUtils::normalizeSha256Hex(std::string(66, 'A')).empty());
}

TEST(FingerprintUtilsTest, MatchesIgnoresCase) {
    const std::string upper(64, 'A');
    const std::string lower(64, 'a');
    EXPECT_TRUE(FingerprintUtils::matches(lower, upper));
    EXPECT_TRUE(FingerprintUtils::matches(upper, upper));
}

TEST(FingerprintUtilsTest, MatchesRejectsDifferentOrEmptyPins) {
    const std::string a(64, 'A');
    std::string b = a;
    b[63] = 'B';
    EXPECT_FALSE(FingerprintUtils::matches(a, b));
    EXPECT_FALSE(FingerprintUtils::matches(a, ""));
    EXPECT_FALSE(FingerprintUtils::matches("", ""));
}

TEST(FingerprintUtilsTest, ToUpperHexEncodesDigest) {
    const uint8_t digest[] = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(FingerprintUtils::toUpperHex(digest, sizeof(digest)), "000FA5FF");
}

TEST(FingerprintUtilsTest, FormatForDisplayAddsColons) {
    const std::string normalized =
        "FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF";
    const std::string formatted = FingerprintUtils::formatForDisplay(normalized);
    EXPECT_EQ(formatted.size(), 95u);
    EXPECT_EQ(formatted.substr(0, 2), "FF");
    EXPECT_EQ(formatted.substr(2, 1), ":");
    EXPECT_EQ(formatted.substr(93, 2), "FF");
}
