// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>

#include "checksum/luhn_checksum.hpp"
#include "random.hpp"

#include "common/gtest_utils.hpp"

using namespace cardgen;

namespace {

TEST(TestLuhnChecksum, Luhn)
{
    // Random mastercard
    EXPECT_TRUE(luhn_checksum{}.validate("5425233430109903"));
    EXPECT_TRUE(luhn_checksum{}.validate("54252334 30109903"));
    EXPECT_TRUE(luhn_checksum{}.validate("5425 2334 3010 9903"));
    EXPECT_TRUE(luhn_checksum{}.validate("5425-2334-3010-9903"));
    EXPECT_TRUE(luhn_checksum{}.validate("5425_2334_3010_9903"));

    // Random visa
    EXPECT_TRUE(luhn_checksum{}.validate("4000000000001000"));
    EXPECT_TRUE(luhn_checksum{}.validate("4000 0000 0000 1000"));
    EXPECT_TRUE(luhn_checksum{}.validate("4111111111111111"));

    // American Express and Diners Club
    EXPECT_TRUE(luhn_checksum{}.validate("378282246310005"));
    EXPECT_TRUE(luhn_checksum{}.validate("30569309025904"));

    // Edge case
    EXPECT_TRUE(luhn_checksum{}.validate("0000000000000000"));
    EXPECT_TRUE(luhn_checksum{}.validate("0"));

    // Invalid
    EXPECT_FALSE(luhn_checksum{}.validate("5427625793410839"));
    EXPECT_FALSE(luhn_checksum{}.validate("4111111111111112"));
    EXPECT_FALSE(luhn_checksum{}.validate("1"));
    EXPECT_FALSE(luhn_checksum{}.validate("1213981928372"));
    EXPECT_FALSE(luhn_checksum{}.validate("              "));
    EXPECT_FALSE(luhn_checksum{}.validate(""));
}

TEST(TestLuhnChecksum, ComputeCheckDigit)
{
    EXPECT_EQ(luhn_checksum{}.compute_check_digit("7992739871"), '3');
    EXPECT_EQ(luhn_checksum{}.compute_check_digit("411111111111111"), '1');
    EXPECT_EQ(luhn_checksum{}.compute_check_digit("542523343010990"), '3');
    EXPECT_EQ(luhn_checksum{}.compute_check_digit("000000000000000"), '0');
    EXPECT_EQ(luhn_checksum{}.compute_check_digit(""), '0');
}

TEST(TestLuhnChecksum, AppendCheckDigit)
{
    EXPECT_STR(luhn_checksum{}.append_check_digit("411111111111111"), "4111111111111111");
    EXPECT_STR(luhn_checksum{}.append_check_digit("400000000000100"), "4000000000001000");

    // Shorter payloads keep their length plus one
    EXPECT_STR(luhn_checksum{}.append_check_digit("37828224631000"), "378282246310005");
    EXPECT_STR(luhn_checksum{}.append_check_digit("3056930902590"), "30569309025904");
}

TEST(TestLuhnChecksum, AppendedCheckDigitAlwaysValidates)
{
    pseudo_random_source rng{1729};
    const luhn_checksum checksum;

    for (unsigned i = 0; i < 1000; ++i) {
        std::string payload;
        for (unsigned j = 0; j < 15; ++j) { payload.push_back(rng.digit()); }

        auto number = checksum.append_check_digit(payload);
        ASSERT_EQ(number.size(), 16);
        EXPECT_TRUE(checksum.validate(number)) << number;
    }
}

TEST(TestLuhnChecksum, RecomputingValidCheckDigitIsIdempotent)
{
    const luhn_checksum checksum;
    for (const auto *number : {"4111111111111111", "5425233430109903", "4000000000001000"}) {
        const std::string str{number};
        EXPECT_STR(checksum.append_check_digit(str.substr(0, 15)), str);
    }
}

TEST(TestLuhnChecksum, CardNumber)
{
    EXPECT_TRUE(is_valid_card_number("4111111111111111"));
    EXPECT_TRUE(is_valid_card_number("4111 1111 1111 1111"));
    EXPECT_TRUE(is_valid_card_number("4111-1111-1111-1111"));
    EXPECT_TRUE(is_valid_card_number("378282246310005"));
    EXPECT_TRUE(is_valid_card_number("30569309025904"));
    EXPECT_TRUE(is_valid_card_number("4222222222222"));

    // Too short or too long despite a valid checksum
    EXPECT_FALSE(is_valid_card_number("79927398713"));
    EXPECT_FALSE(is_valid_card_number("00000000000000000000"));

    EXPECT_FALSE(is_valid_card_number("4111111111111112"));
    EXPECT_FALSE(is_valid_card_number(""));
    EXPECT_FALSE(is_valid_card_number("not a card number"));
}

} // namespace
