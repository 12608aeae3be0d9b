// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <string>
#include <string_view>

#include "pattern/wildcard.hpp"
#include "random.hpp"

namespace cardgen {

bool contains_wildcards(std::string_view str)
{
    return std::any_of(str.begin(), str.end(), [](char c) { return is_wildcard(c); });
}

std::string expand_wildcards(std::string_view str, random_source &rng)
{
    std::string result;
    result.reserve(str.size());
    for (auto c : str) { result.push_back(is_wildcard(c) ? rng.digit() : c); }
    return result;
}

} // namespace cardgen
