// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <variant>

#include "brand/brand_classifier.hpp"
#include "brand/card_brand.hpp"
#include "checksum/luhn_checksum.hpp"
#include "configuration.hpp"
#include "exception.hpp"
#include "generator/card_generator.hpp"
#include "random.hpp"

#include "common/gtest_utils.hpp"

using namespace cardgen;

namespace {

const test::fixed_calendar test_calendar{2026, 10};

class failing_generator : public card_generator {
public:
    failing_generator(random_source &rng, const calendar &cal, std::size_t fail_on)
        : card_generator(rng, cal), fail_on_(fail_on)
    {}

    card_record generate(std::string_view pattern) override
    {
        if (++calls_ == fail_on_) {
            throw std::runtime_error("synthetic failure");
        }
        return card_generator::generate(pattern);
    }

protected:
    std::size_t fail_on_;
    std::size_t calls_{0};
};

TEST(TestCardGenerator, CardLength)
{
    EXPECT_EQ(card_length_for("34"), 15);
    EXPECT_EQ(card_length_for("3712"), 15);
    EXPECT_EQ(card_length_for("30"), 14);
    EXPECT_EQ(card_length_for("36"), 14);
    EXPECT_EQ(card_length_for("3800"), 14);
    EXPECT_EQ(card_length_for("35"), 16);
    EXPECT_EQ(card_length_for("4111"), 16);
    EXPECT_EQ(card_length_for("3"), 16);
    EXPECT_EQ(card_length_for(""), 16);
}

TEST(TestCardGenerator, ValidVisaIsPreserved)
{
    test::constant_random_source rng{0};
    card_generator generator{rng, test_calendar};

    auto card = generator.generate("4111111111111111");
    EXPECT_STR(card.card_number, "4111111111111111");
    EXPECT_EQ(card.brand, card_brand::visa);
    EXPECT_STR(card.card_type(), "Visa");
    EXPECT_STR(card.month, "01");
    EXPECT_STR(card.year, "27");
    EXPECT_STR(card.cvv, "000");
    EXPECT_STR(card.formatted, "4111111111111111|01|27|000");
}

TEST(TestCardGenerator, CheckDigitIsRecomputed)
{
    test::constant_random_source rng{0};
    card_generator generator{rng, test_calendar};

    auto card = generator.generate("4111111111111112");
    EXPECT_STR(card.card_number, "4111111111111111");
}

TEST(TestCardGenerator, Mastercard)
{
    test::constant_random_source rng{0};
    card_generator generator{rng, test_calendar};

    auto card = generator.generate("5500000000000000");
    EXPECT_EQ(card.brand, card_brand::mastercard);
    EXPECT_EQ(card.card_number.size(), 16);
    EXPECT_TRUE(card.card_number.starts_with("550000000000000"));
    EXPECT_TRUE(luhn_checksum{}.validate(card.card_number));
}

TEST(TestCardGenerator, AmericanExpress)
{
    test::constant_random_source rng{0};
    card_generator generator{rng, test_calendar};

    auto card = generator.generate("340000000000000");
    EXPECT_STR(card.card_number, "340000000000009");
    EXPECT_EQ(card.brand, card_brand::american_express);
    EXPECT_STR(card.card_type(), "American Express");
    EXPECT_EQ(card.cvv.size(), 4);
}

TEST(TestCardGenerator, DinersClub)
{
    test::constant_random_source rng{0};
    card_generator generator{rng, test_calendar};

    auto card = generator.generate("3056930902590");
    EXPECT_STR(card.card_number, "30569309025904");
    EXPECT_EQ(card.brand, card_brand::diners_club);
    EXPECT_EQ(card.cvv.size(), 3);
}

TEST(TestCardGenerator, ShortBinIsPadded)
{
    test::constant_random_source rng{7};
    card_generator generator{rng, test_calendar};

    auto card = generator.generate("4532");
    EXPECT_EQ(card.card_number.size(), 16);
    EXPECT_TRUE(card.card_number.starts_with("453277777777777"));
    EXPECT_TRUE(luhn_checksum{}.validate(card.card_number));
}

TEST(TestCardGenerator, LongBinIsTruncated)
{
    test::constant_random_source rng{0};
    card_generator generator{rng, test_calendar};

    auto card = generator.generate("41111111111111119999");
    EXPECT_STR(card.card_number, "4111111111111111");

    auto amex = generator.generate("3782822463100059999");
    EXPECT_STR(amex.card_number, "378282246310005");
}

TEST(TestCardGenerator, FullPattern)
{
    test::constant_random_source rng{5};
    card_generator generator{rng, test_calendar};

    auto card = generator.generate("434769805926XXXX|10|2029|XXX");
    EXPECT_STR(card.card_number, "4347698059265558");
    EXPECT_EQ(card.brand, card_brand::visa);
    EXPECT_STR(card.month, "10");
    EXPECT_STR(card.year, "29");
    EXPECT_STR(card.cvv, "555");
    EXPECT_STR(card.formatted, "4347698059265558|10|29|555");
}

TEST(TestCardGenerator, WildcardExpiry)
{
    test::constant_random_source rng{9};
    card_generator generator{rng, test_calendar};

    auto card = generator.generate("4111111111111111|**|**|123");
    EXPECT_STR(card.month, "09");
    EXPECT_STR(card.year, "35");
    EXPECT_STR(card.cvv, "123");
}

TEST(TestCardGenerator, MonthWithoutYearIsRegenerated)
{
    test::constant_random_source rng{0};
    card_generator generator{rng, test_calendar};

    auto card = generator.generate("4111111111111111|05");
    EXPECT_STR(card.month, "01");
    EXPECT_STR(card.year, "27");
}

TEST(TestCardGenerator, MonthWithoutYearIsHonored)
{
    test::constant_random_source rng{0};
    card_generator generator{
        rng, test_calendar, generator_config{.partial_expiry = partial_expiry_policy::honor}};

    auto card = generator.generate("4111111111111111|05");
    EXPECT_STR(card.month, "05");
    EXPECT_STR(card.year, "27");
}

TEST(TestCardGenerator, WildcardCvvWithWrongLength)
{
    test::constant_random_source rng{3};
    card_generator generator{rng, test_calendar};

    auto card = generator.generate("340000000000000|12|30|***");
    EXPECT_EQ(card.brand, card_brand::american_express);
    EXPECT_STR(card.cvv, "3333");

    auto visa = generator.generate("4111111111111111|12|30|**");
    EXPECT_STR(visa.cvv, "333");

    auto exact = generator.generate("4111111111111111|12|30|12*");
    EXPECT_STR(exact.cvv, "123");
}

TEST(TestCardGenerator, LiteralCvv)
{
    test::constant_random_source rng{0};

    {
        card_generator generator{rng, test_calendar};
        auto card = generator.generate("4111111111111111|12|30|12345");
        EXPECT_STR(card.cvv, "12345");
        EXPECT_STR(card.formatted, "4111111111111111|12|30|12345");
    }

    {
        card_generator generator{
            rng, test_calendar, generator_config{.validate_literal_cvv = true}};
        EXPECT_STR(generator.generate("4111111111111111|12|30|12345").cvv, "000");
        EXPECT_STR(generator.generate("4111111111111111|12|30|987").cvv, "987");
    }
}

TEST(TestCardGenerator, InvalidPattern)
{
    test::constant_random_source rng{0};
    card_generator generator{rng, test_calendar};

    EXPECT_THROW(generator.generate("4111abcd"), invalid_pattern_characters);
    EXPECT_THROW(generator.generate("4111|1Q|26"), invalid_pattern_characters);
    EXPECT_THROW(generator.generate(""), invalid_pattern);
    EXPECT_THROW(generator.generate("|||"), invalid_pattern);
}

TEST(TestCardGenerator, RandomPatternsProduceValidCards)
{
    pseudo_random_source rng{2025};
    card_generator generator{rng, test_calendar};

    for (unsigned i = 0; i < 1000; ++i) {
        auto card = generator.generate("******|**|****|***");
        EXPECT_EQ(card.card_number.size(), card_length_for(card.card_number)) << card.formatted;
        EXPECT_TRUE(luhn_checksum{}.validate(card.card_number)) << card.formatted;
        EXPECT_EQ(card.brand, classify(card.card_number));
        EXPECT_EQ(card.month.size(), 2);
        EXPECT_EQ(card.year.size(), 2);
        EXPECT_EQ(card.cvv.size(), cvv_length(card.brand)) << card.formatted;
    }
}

TEST(TestCardGenerator, SeededGeneratorsAreDeterministic)
{
    pseudo_random_source first_rng{1234};
    pseudo_random_source second_rng{1234};
    card_generator first{first_rng, test_calendar};
    card_generator second{second_rng, test_calendar};

    for (unsigned i = 0; i < 10; ++i) {
        EXPECT_STR(first.generate("4532********").formatted,
            second.generate("4532********").formatted);
    }
}

TEST(TestCardGenerator, Batch)
{
    pseudo_random_source rng{5};
    card_generator generator{rng, test_calendar};

    auto entries = generator.generate_batch("4532********|12|30", 5);
    ASSERT_EQ(entries.size(), 5);
    for (const auto &entry : entries) {
        ASSERT_TRUE(std::holds_alternative<card_record>(entry));
        const auto &card = std::get<card_record>(entry);
        EXPECT_TRUE(card.card_number.starts_with("4532"));
        EXPECT_STR(card.month, "12");
        EXPECT_STR(card.year, "30");
    }

    EXPECT_EQ(successful(std::move(entries)).size(), 5);
    EXPECT_TRUE(generator.generate_batch("4532", 0).empty());
}

TEST(TestCardGenerator, BatchIsolatesFailures)
{
    pseudo_random_source rng{5};
    failing_generator generator{rng, test_calendar, 3};

    auto entries = generator.generate_batch("4111********", 5);
    ASSERT_EQ(entries.size(), 5);

    ASSERT_TRUE(std::holds_alternative<generation_failure>(entries[2]));
    const auto &failure = std::get<generation_failure>(entries[2]);
    EXPECT_EQ(failure.index, 2);
    EXPECT_STR(failure.reason, "synthetic failure");

    auto cards = successful(std::move(entries));
    EXPECT_EQ(cards.size(), 4);
    for (const auto &card : cards) { EXPECT_TRUE(luhn_checksum{}.validate(card.card_number)); }
}

TEST(TestCardGenerator, BatchWithInvalidPattern)
{
    test::constant_random_source rng{0};
    card_generator generator{rng, test_calendar};

    auto entries = generator.generate_batch("4111-abc", 3);
    ASSERT_EQ(entries.size(), 3);
    for (const auto &entry : entries) {
        EXPECT_TRUE(std::holds_alternative<generation_failure>(entry));
    }
    EXPECT_TRUE(successful(std::move(entries)).empty());
}

TEST(TestCardGenerator, BatchSizeIsLimited)
{
    test::constant_random_source rng{0};
    card_generator generator{rng, test_calendar, generator_config{.max_batch_size = 3}};

    EXPECT_EQ(generator.generate_batch("4111", 10).size(), 3);
    EXPECT_EQ(generator.config().max_batch_size, 3);
}

} // namespace
