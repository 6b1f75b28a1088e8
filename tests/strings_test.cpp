#include "statuskit/strings.hpp"

#include <gtest/gtest.h>

namespace {

    TEST(TrimView, TrimsBothEnds) {
        EXPECT_EQ(statuskit::trim_view("  hello \t"), "hello");
    }

    TEST(TrimView, ReturnsEmptyForWhitespaceOnly) {
        EXPECT_EQ(statuskit::trim_view("   "), "");
        EXPECT_EQ(statuskit::trim_view(""), "");
    }

    TEST(TrimCopy, ReturnsTrimmedCopy) {
        std::string result = statuskit::trim_copy("  hello  ");
        EXPECT_EQ(result, "hello");
    }

    TEST(ToLowerCopy, LowersAscii) {
        EXPECT_EQ(statuskit::to_lower_copy("Rounded"), "rounded");
    }

    TEST(Split, KeepsEmptyFields) {
        const auto parts = statuskit::split("cpu::active", ':');

        ASSERT_EQ(parts.size(), 3u);
        EXPECT_EQ(parts[0], "cpu");
        EXPECT_EQ(parts[1], "");
        EXPECT_EQ(parts[2], "active");
    }

    TEST(Split, ReturnsSingleFieldWithoutDelimiter) {
        const auto parts = statuskit::split("cpu", ';');

        ASSERT_EQ(parts.size(), 1u);
        EXPECT_EQ(parts[0], "cpu");
    }

    TEST(IsInteger, AcceptsSignedDigits) {
        EXPECT_TRUE(statuskit::is_integer("42"));
        EXPECT_TRUE(statuskit::is_integer("-7"));
        EXPECT_FALSE(statuskit::is_integer("-"));
        EXPECT_FALSE(statuskit::is_integer("4.2"));
        EXPECT_FALSE(statuskit::is_integer(""));
        EXPECT_FALSE(statuskit::is_integer("abc"));
    }

    TEST(ParseInt, ParsesValidIntegers) {
        EXPECT_EQ(statuskit::parse_int("80"), 80);
        EXPECT_EQ(statuskit::parse_int("-3"), -3);
        EXPECT_EQ(statuskit::parse_int("8O"), std::nullopt);
    }

    TEST(ParseInt, RejectsOverflow) {
        EXPECT_EQ(statuskit::parse_int("99999999999999999999999"), std::nullopt);
    }

    TEST(ExtractFirstNumber, FindsLeadingDigits) {
        EXPECT_EQ(statuskit::extract_first_number(" 73%"), 73);
        EXPECT_EQ(statuskit::extract_first_number("load 12 of 40"), 12);
        EXPECT_EQ(statuskit::extract_first_number("N/A"), std::nullopt);
    }

    TEST(Fnv1aHash, MatchesKnownVectors) {
        EXPECT_EQ(statuskit::fnv1a_hash(""), 2166136261u);
        EXPECT_EQ(statuskit::fnv1a_hash("a"), 0xe40c292cu);
    }

}
