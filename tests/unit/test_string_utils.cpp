#include <gtest/gtest.h>
#include "codecell/utils/string_utils.hpp"

#include <stdexcept>
#include <string>

namespace codecell {
namespace utils {
namespace {

// ============================================================================
// String Manipulation Tests
// ============================================================================

TEST(StringUtilsTest, Trim_RemovesSurroundingWhitespace) {
    EXPECT_EQ(StringUtils::Trim("  hello \n"), "hello");
    EXPECT_EQ(StringUtils::Trim("\t\t"), "");
    EXPECT_EQ(StringUtils::Trim(""), "");
    EXPECT_EQ(StringUtils::Trim("a b"), "a b") << "Inner whitespace must survive";
}

TEST(StringUtilsTest, ToLower_OnlyAffectsLetters) {
    EXPECT_EQ(StringUtils::ToLower("Sales_Q3.CSV"), "sales_q3.csv");
}

TEST(StringUtilsTest, SplitAndJoin) {
    auto parts = StringUtils::Split("numpy,pandas,requests", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "pandas");
    EXPECT_EQ(StringUtils::Join(parts, "\n"), "numpy\npandas\nrequests");
    EXPECT_EQ(StringUtils::Join({}, ","), "");
}

TEST(StringUtilsTest, PrefixSuffixContains) {
    EXPECT_TRUE(StringUtils::StartsWith("data:text/plain", "data:"));
    EXPECT_FALSE(StringUtils::StartsWith("da", "data:"));
    EXPECT_TRUE(StringUtils::EndsWith("report.pdf", ".pdf"));
    EXPECT_TRUE(StringUtils::Contains("q3_revenue.csv", "revenue"));
    EXPECT_FALSE(StringUtils::Contains("q3.csv", "revenue"));
}

// ============================================================================
// Base64 Tests
// ============================================================================

TEST(StringUtilsTest, Base64_KnownVectors) {
    // Given: RFC 4648 test vectors
    // When: Encoding them
    // Then: Output matches the published encodings
    EXPECT_EQ(StringUtils::ToBase64(""), "");
    EXPECT_EQ(StringUtils::ToBase64("f"), "Zg==");
    EXPECT_EQ(StringUtils::ToBase64("fo"), "Zm8=");
    EXPECT_EQ(StringUtils::ToBase64("foo"), "Zm9v");
    EXPECT_EQ(StringUtils::ToBase64("foobar"), "Zm9vYmFy");

    EXPECT_EQ(StringUtils::FromBase64("Zg=="), "f");
    EXPECT_EQ(StringUtils::FromBase64("Zm8="), "fo");
    EXPECT_EQ(StringUtils::FromBase64("Zm9vYmFy"), "foobar");
}

TEST(StringUtilsTest, Base64_BinarySafe) {
    // Given: Bytes including NUL and high-bit values
    std::string bytes{'\x00', '\xff', '\x10', '\x80', '\x00', 'A'};

    // When/Then: Decoding the encoding returns the same bytes
    EXPECT_EQ(StringUtils::FromBase64(StringUtils::ToBase64(bytes)), bytes);
}

TEST(StringUtilsTest, Base64_IgnoresWhitespace) {
    EXPECT_EQ(StringUtils::FromBase64("Zm9v\nYmFy\n"), "foobar");
}

TEST(StringUtilsTest, Base64_RejectsMalformedPayloads) {
    EXPECT_THROW(StringUtils::FromBase64("Zm9"), std::invalid_argument) << "Bad length";
    EXPECT_THROW(StringUtils::FromBase64("Zm9!"), std::invalid_argument) << "Bad character";
    EXPECT_THROW(StringUtils::FromBase64("Z=9v"), std::invalid_argument) << "Misplaced padding";
}

// ============================================================================
// Data URI Tests
// ============================================================================

TEST(StringUtilsTest, DataUri_Format) {
    EXPECT_EQ(StringUtils::ToDataUri("hi"), "data:application/octet-stream;base64,aGk=");
    EXPECT_EQ(StringUtils::ToDataUri("hi", "text/plain"), "data:text/plain;base64,aGk=");
}

TEST(StringUtilsTest, DataUri_DecodeAnyMimeType) {
    EXPECT_TRUE(StringUtils::HasBase64Marker("data:image/png;base64,AAAA"));
    EXPECT_FALSE(StringUtils::HasBase64Marker("plain text with base64 in it"));
    EXPECT_EQ(StringUtils::DecodeDataUri("data:text/plain;base64,aGk="), "hi");
    EXPECT_THROW(StringUtils::DecodeDataUri("no marker"), std::invalid_argument);
    EXPECT_THROW(StringUtils::DecodeDataUri("data:x;base64,@@@@"), std::invalid_argument);
}

} // namespace
} // namespace utils
} // namespace codecell
