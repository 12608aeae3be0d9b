// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog
// (https://www.datadoghq.com/). Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <limits>
#include <string_view>

#include "utils.hpp"

#include "common/gtest_utils.hpp"

using namespace cardgen;

namespace {
constexpr char char_min = std::numeric_limits<char>::min();
constexpr char char_max = std::numeric_limits<char>::max();

TEST(TestUtils, IsDigit)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c >= '0' && c <= '9') {
            EXPECT_TRUE(cardgen::isdigit(c));
        } else {
            EXPECT_FALSE(cardgen::isdigit(c));
        }
    }
}

TEST(TestUtils, IsSpace)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v') {
            EXPECT_TRUE(cardgen::isspace(c));
        } else {
            EXPECT_FALSE(cardgen::isspace(c));
        }
    }
}

TEST(TestUtils, IsAllDigits)
{
    EXPECT_TRUE(is_all_digits("0123456789"));
    EXPECT_FALSE(is_all_digits(""));
    EXPECT_FALSE(is_all_digits("12 3"));
    EXPECT_FALSE(is_all_digits("12*"));
}

TEST(TestUtils, RemoveWhitespace)
{
    EXPECT_STR(remove_whitespace(" 4111 1111\t1111\n1111 "), "4111111111111111");
    EXPECT_STR(remove_whitespace("    "), "");
    EXPECT_STR(remove_whitespace("4111|12"), "4111|12");
}

TEST(TestUtils, Split)
{
    {
        auto components = split("4111|12/26:123-x", "|/:-");
        ASSERT_EQ(components.size(), 5);
        EXPECT_STR(components[0], "4111");
        EXPECT_STR(components[1], "12");
        EXPECT_STR(components[2], "26");
        EXPECT_STR(components[3], "123");
        EXPECT_STR(components[4], "x");
    }

    {
        auto components = split("||a||b|", "|");
        ASSERT_EQ(components.size(), 2);
        EXPECT_STR(components[0], "a");
        EXPECT_STR(components[1], "b");
    }

    EXPECT_TRUE(split("", "|").empty());
    EXPECT_TRUE(split("|/|", "|/").empty());
    EXPECT_EQ(split("abc", "|").size(), 1);
}

TEST(TestUtils, StringIequals)
{
    EXPECT_TRUE(string_iequals("json", "JSON"));
    EXPECT_TRUE(string_iequals("Visa Electron", "visa electron"));
    EXPECT_FALSE(string_iequals("json", "jsonl"));
    EXPECT_FALSE(string_iequals("csv", "tsv"));
}

TEST(TestUtils, PadLeft)
{
    EXPECT_STR(pad_left("7", 2), "07");
    EXPECT_STR(pad_left("", 2), "00");
    EXPECT_STR(pad_left("12", 2), "12");
    EXPECT_STR(pad_left("123", 2), "123");
    EXPECT_STR(pad_left("1", 3, ' '), "  1");
}

TEST(TestUtils, FromString)
{
    {
        auto [res, value] = from_string<unsigned>("07");
        EXPECT_TRUE(res);
        EXPECT_EQ(value, 7);
    }

    {
        auto [res, value] = from_string<int>("2029");
        EXPECT_TRUE(res);
        EXPECT_EQ(value, 2029);
    }

    {
        auto [res, value] = from_string<uint64_t>("18446744073709551615");
        EXPECT_TRUE(res);
        EXPECT_EQ(value, std::numeric_limits<uint64_t>::max());
    }

    EXPECT_FALSE(from_string<unsigned>("").first);
    EXPECT_FALSE(from_string<unsigned>("12a").first);
    EXPECT_FALSE(from_string<unsigned>("-1").first);
    EXPECT_FALSE(from_string<int>(" 1").first);
}

} // namespace
