// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "random.hpp"

namespace cardgen {

inline bool is_wildcard(char c)
{
    return c == '*' || c == 'X' || c == 'x' || c == '?' || c == '#' || c == '_';
}

bool contains_wildcards(std::string_view str);

// Replaces each wildcard with an independently drawn digit, the length of the
// string is preserved.
std::string expand_wildcards(std::string_view str, random_source &rng);

} // namespace cardgen
