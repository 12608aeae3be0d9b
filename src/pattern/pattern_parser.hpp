// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cardgen {

// Fields of a pattern such as "434769805926XXXX|10|2029|XXX", each of them may
// still contain wildcards.
struct card_pattern {
    std::string bin;
    std::optional<std::string> month;
    std::optional<std::string> year;
    std::optional<std::string> cvv;
};

inline constexpr std::string_view pattern_separators = "|/:-";

inline bool is_separator(char c) { return pattern_separators.find(c) != std::string_view::npos; }

// Whitespace is stripped and the remainder split on any separator, empty
// segments are dropped. No character validation is performed.
card_pattern parse_pattern(std::string_view raw);

// Throws invalid_pattern_characters on characters other than digits,
// wildcards, separators and whitespace, and invalid_pattern when the
// pattern has no BIN.
void validate_pattern(std::string_view raw);

bool is_valid_pattern(std::string_view raw) noexcept;

} // namespace cardgen
