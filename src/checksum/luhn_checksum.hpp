// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string_view>

#include "checksum/base.hpp"

namespace cardgen {

class luhn_checksum : public base_checksum {
public:
    luhn_checksum() = default;
    luhn_checksum(const luhn_checksum &) = default;
    luhn_checksum &operator=(const luhn_checksum &) = default;
    luhn_checksum(luhn_checksum &&) = default;
    luhn_checksum &operator=(luhn_checksum &&) = default;
    ~luhn_checksum() override = default;

    // Non-digit characters are ignored, a string without digits is invalid
    [[nodiscard]] bool validate(std::string_view str) const noexcept override;
    [[nodiscard]] char compute_check_digit(std::string_view payload) const noexcept override;
};

// Card numbers are 13 to 19 digits long, separators are ignored
bool is_valid_card_number(std::string_view str) noexcept;

} // namespace cardgen
