// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>

#include "brand/brand_classifier.hpp"
#include "brand/card_brand.hpp"
#include "utils.hpp"

namespace cardgen {

namespace {

constexpr std::array<std::string_view, 5> mastercard_prefixes{"51", "52", "53", "54", "55"};
constexpr std::array<std::string_view, 2> amex_prefixes{"34", "37"};
constexpr std::array<std::string_view, 3> diners_prefixes{"30", "36", "38"};
constexpr std::array<std::string_view, 7> visa_electron_prefixes{
    "4026", "4175", "4405", "4508", "4844", "4913", "4917"};

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
const std::array<brand_rule, 11> rules{{
    {prefix_equals{"4"}, card_brand::visa},
    {prefix_in{mastercard_prefixes}, card_brand::mastercard},
    {prefix_range{4, 2221, 2720}, card_brand::mastercard},
    {prefix_in{amex_prefixes}, card_brand::american_express},
    {prefix_equals{"6011"}, card_brand::discover},
    {prefix_equals{"65"}, card_brand::discover},
    {prefix_range{6, 644000, 649999}, card_brand::discover},
    {prefix_in{diners_prefixes}, card_brand::diners_club},
    {prefix_equals{"35"}, card_brand::jcb},
    {prefix_equals{"5019"}, card_brand::dankort},
    {prefix_in{visa_electron_prefixes}, card_brand::visa_electron},
}};
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

struct rule_matcher {
    std::string_view number;

    bool operator()(const prefix_equals &p) const { return number.starts_with(p.prefix); }

    bool operator()(const prefix_in &p) const
    {
        for (auto prefix : p.prefixes) {
            if (number.starts_with(prefix)) {
                return true;
            }
        }
        return false;
    }

    bool operator()(const prefix_range &p) const
    {
        if (number.size() < p.length) {
            return false;
        }

        auto [res, value] = from_string<unsigned>(number.substr(0, p.length));
        return res && value >= p.low && value <= p.high;
    }
};

} // namespace

bool rule_matches(const brand_rule &rule, std::string_view number)
{
    return std::visit(rule_matcher{number}, rule.predicate);
}

std::span<const brand_rule> brand_rules() { return rules; }

card_brand classify(std::string_view number)
{
    for (const auto &rule : rules) {
        if (rule_matches(rule, number)) {
            return rule.brand;
        }
    }
    return card_brand::unknown;
}

card_brand brand_from_string(std::string_view str)
{
    constexpr std::array<card_brand, 8> brands{card_brand::visa, card_brand::mastercard,
        card_brand::american_express, card_brand::discover, card_brand::diners_club,
        card_brand::jcb, card_brand::dankort, card_brand::visa_electron};

    for (auto brand : brands) {
        if (string_iequals(str, brand_to_string(brand))) {
            return brand;
        }
    }
    return card_brand::unknown;
}

} // namespace cardgen
