// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "brand/brand_classifier.hpp"
#include "brand/card_brand.hpp"
#include "calendar.hpp"
#include "generator/card_generator.hpp"
#include "generator/cvv_generator.hpp"
#include "generator/expiry_generator.hpp"
#include "log.hpp"
#include "pattern/pattern_parser.hpp"
#include "pattern/wildcard.hpp"

namespace cardgen {

namespace {

constexpr std::size_t default_card_length = 16;
constexpr std::size_t amex_card_length = 15;
constexpr std::size_t diners_card_length = 14;

} // namespace

std::size_t card_length_for(std::string_view bin)
{
    if (bin.starts_with("34") || bin.starts_with("37")) {
        return amex_card_length;
    }

    if (bin.starts_with("30") || bin.starts_with("36") || bin.starts_with("38")) {
        return diners_card_length;
    }

    return default_card_length;
}

card_record card_generator::generate(std::string_view pattern)
{
    validate_pattern(pattern);

    const auto parsed = parse_pattern(pattern);
    const auto today = calendar_.today();

    card_record card;
    card.card_number = generate_card_number(parsed.bin);
    card.brand = classify(card.card_number);

    auto [month, year] = generate_expiry(parsed, today);
    card.month = std::move(month);
    card.year = std::move(year);
    card.cvv = generate_cvv(parsed, card.brand);

    card.formatted =
        fmt::format("{}|{}|{}|{}", card.card_number, card.month, card.year, card.cvv);

    CARDGEN_TRACE("Generated {} card {}", card.brand, card.formatted);

    return card;
}

std::string card_generator::generate_card_number(std::string_view bin)
{
    auto number = expand_wildcards(bin, rng_);

    const auto length = card_length_for(number);
    if (number.size() > length) {
        number.resize(length);
    } else {
        while (number.size() < length) { number.push_back(rng_.digit()); }
    }

    // The last digit is always replaced with the check digit
    return checksum_.append_check_digit(std::string_view{number}.substr(0, length - 1));
}

expiry card_generator::generate_expiry(const card_pattern &pattern, calendar_date today)
{
    if (pattern.month.has_value() && pattern.year.has_value()) {
        return {resolve_month(*pattern.month, rng_), resolve_year(*pattern.year, rng_, today)};
    }

    // Segments are positional, so a year is never provided without a month
    auto result = random_expiry(rng_, today);
    if (pattern.month.has_value()) {
        if (config_.partial_expiry == partial_expiry_policy::honor) {
            result.month = resolve_month(*pattern.month, rng_);
        } else {
            CARDGEN_DEBUG("Expiry month provided without a year, generating a random expiry");
        }
    }

    return result;
}

std::string card_generator::generate_cvv(const card_pattern &pattern, card_brand brand)
{
    if (!pattern.cvv.has_value()) {
        return random_cvv(rng_, brand);
    }

    const auto &cvv = *pattern.cvv;
    if (contains_wildcards(cvv)) {
        auto expanded = expand_wildcards(cvv, rng_);
        if (!is_valid_cvv(expanded, brand)) {
            CARDGEN_DEBUG("Expanded CVV '{}' not valid for {}, replacing", expanded, brand);
            return random_cvv(rng_, brand);
        }
        return expanded;
    }

    if (config_.validate_literal_cvv && !is_valid_cvv(cvv, brand)) {
        CARDGEN_DEBUG("Literal CVV '{}' not valid for {}, replacing", cvv, brand);
        return random_cvv(rng_, brand);
    }

    return cvv;
}

std::vector<batch_entry> card_generator::generate_batch(std::string_view pattern, std::size_t count)
{
    if (count > config_.max_batch_size) {
        CARDGEN_WARN("Requested {} cards, limiting batch to {}", count, config_.max_batch_size);
        count = config_.max_batch_size;
    }

    std::vector<batch_entry> entries;
    entries.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        try {
            entries.emplace_back(generate(pattern));
        } catch (const std::exception &e) {
            CARDGEN_WARN("Failed to generate card {}: {}", i + 1, e.what());
            entries.emplace_back(generation_failure{i, e.what()});
        } catch (...) {
            CARDGEN_WARN("Failed to generate card {}: unknown exception", i + 1);
            entries.emplace_back(generation_failure{i, "unknown exception"});
        }
    }

    return entries;
}

std::vector<card_record> successful(std::vector<batch_entry> entries)
{
    std::vector<card_record> cards;
    cards.reserve(entries.size());
    for (auto &entry : entries) {
        if (auto *card = std::get_if<card_record>(&entry); card != nullptr) {
            cards.emplace_back(std::move(*card));
        }
    }
    return cards;
}

} // namespace cardgen
