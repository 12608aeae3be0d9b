// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "checksum/luhn_checksum.hpp"
#include "utils.hpp"

namespace cardgen {

namespace {

// Precomputed doubled values
//   for num from 0 to 9: (2 * num) / 10 + (2 * num) % 10
constexpr std::array<uint8_t, 10> lut = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

constexpr std::size_t min_card_number_length = 13;
constexpr std::size_t max_card_number_length = 19;

// Sums the digits of str from right to left, doubling every other digit
// starting with the rightmost one when double_first is set.
uint32_t luhn_sum(std::string_view str, bool double_first, bool &digits_seen) noexcept
{
    uint32_t sum = 0;
    bool should_double = double_first;
    for (std::size_t i = str.size(); i > 0; --i) {
        const auto c = str[i - 1];
        if (!cardgen::isdigit(c)) {
            continue;
        }

        digits_seen = true;
        const auto d = static_cast<uint32_t>(c - '0');
        sum += should_double ? lut[d] : d;
        should_double = !should_double;
    }
    return sum;
}

} // namespace

bool luhn_checksum::validate(std::string_view str) const noexcept
{
    bool digits_seen = false;
    const auto sum = luhn_sum(str, false, digits_seen);
    return digits_seen && (sum % 10U == 0U);
}

char luhn_checksum::compute_check_digit(std::string_view payload) const noexcept
{
    // The check digit occupies the undoubled position, so the doubling
    // starts with the rightmost payload digit.
    bool digits_seen = false;
    const auto sum = luhn_sum(payload, true, digits_seen);
    return static_cast<char>('0' + ((10U - (sum % 10U)) % 10U));
}

bool is_valid_card_number(std::string_view str) noexcept
{
    std::size_t digits = 0;
    for (auto c : str) {
        if (cardgen::isdigit(c)) {
            ++digits;
        }
    }

    if (digits < min_card_number_length || digits > max_card_number_length) {
        return false;
    }

    return luhn_checksum{}.validate(str);
}

} // namespace cardgen
