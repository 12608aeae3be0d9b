// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>

#include <fmt/format.h>

#include "calendar.hpp"
#include "generator/expiry_generator.hpp"
#include "log.hpp"
#include "pattern/wildcard.hpp"
#include "random.hpp"
#include "utils.hpp"

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
namespace cardgen {

namespace {

constexpr unsigned months_per_year = 12;
constexpr int max_years_ahead = 20;
constexpr int random_years_span = 10;
constexpr int pivot_year = 49;

std::string two_digit_year(int year) { return fmt::format("{:02}", year % 100); }

std::string two_digit_month(unsigned month) { return fmt::format("{:02}", month); }

int random_year_from(int current_year, random_source &rng)
{
    return current_year + static_cast<int>(rng.uniform(0, random_years_span - 1));
}

int expand_two_digit_year(int value, int current_year)
{
    const int century = (current_year / 100) * 100;
    if (value <= pivot_year) {
        return century + value;
    }
    return century - 100 + value;
}

} // namespace

expiry random_expiry(random_source &rng, calendar_date today)
{
    int year = today.year + static_cast<int>(rng.uniform(1, random_years_span));
    unsigned month = rng.uniform(1, months_per_year);

    if (year == today.year && month <= today.month) {
        month = today.month < months_per_year
                    ? today.month + rng.uniform(1, months_per_year - today.month)
                    : today.month + 1;
    }

    if (month > months_per_year) {
        month -= months_per_year;
        ++year;
    }

    return {two_digit_month(month), two_digit_year(year)};
}

std::string resolve_month(std::string_view month, random_source &rng)
{
    if (!contains_wildcards(month)) {
        return pad_left(month, 2);
    }

    const auto expanded = expand_wildcards(month, rng);
    auto [res, value] = from_string<unsigned>(expanded);
    if (!res || value < 1 || value > months_per_year) {
        CARDGEN_DEBUG("Expanded month '{}' out of range, replacing", expanded);
        value = rng.uniform(1, months_per_year);
    }

    return two_digit_month(value);
}

std::string resolve_year(std::string_view year, random_source &rng, calendar_date today)
{
    if (!contains_wildcards(year)) {
        if (year.size() == 4) {
            return std::string{year.substr(2)};
        }
        return pad_left(year, 2);
    }

    const auto expanded = expand_wildcards(year, rng);
    auto [res, value] = from_string<int>(expanded);

    int resolved = 0;
    if (expanded.size() == 2 && res) {
        resolved = expand_two_digit_year(value, today.year);
        if (resolved < today.year) {
            resolved = random_year_from(today.year, rng);
        }
    } else if (expanded.size() == 4 && res && value >= today.year &&
               value <= today.year + max_years_ahead) {
        resolved = value;
    } else {
        CARDGEN_DEBUG("Expanded year '{}' not usable, replacing", expanded);
        resolved = random_year_from(today.year, rng);
    }

    return two_digit_year(resolved);
}

} // namespace cardgen
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
