// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cardgen {

// What to do with a pattern which provides a month or a year, but not both
enum class partial_expiry_policy : uint8_t {
    // Discard the provided field and generate a random expiry
    regenerate,
    // Keep the provided field and only generate the missing one
    honor,
};

inline std::string_view partial_expiry_policy_to_string(partial_expiry_policy policy)
{
    switch (policy) {
    case partial_expiry_policy::honor:
        return "honor";
    case partial_expiry_policy::regenerate:
        break;
    }
    return "regenerate";
}

struct generator_config {
    static constexpr std::size_t default_max_batch_size = 10000;

    std::size_t max_batch_size{default_max_batch_size};
    partial_expiry_policy partial_expiry{partial_expiry_policy::regenerate};
    // Apply the length and numeric checks of wildcard CVVs to literal ones
    bool validate_literal_cvv{false};
};

} // namespace cardgen
