// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>

#include "brand/card_brand.hpp"

namespace cardgen {

struct prefix_equals {
    std::string_view prefix;
};

struct prefix_in {
    std::span<const std::string_view> prefixes;
};

// Numeric value of the first `length` digits within [low, high]
struct prefix_range {
    std::size_t length;
    uint32_t low;
    uint32_t high;
};

struct brand_rule {
    std::variant<prefix_equals, prefix_in, prefix_range> predicate;
    card_brand brand;
};

bool rule_matches(const brand_rule &rule, std::string_view number);

// Rules in evaluation order, the first matching rule determines the brand
std::span<const brand_rule> brand_rules();

card_brand classify(std::string_view number);

} // namespace cardgen
