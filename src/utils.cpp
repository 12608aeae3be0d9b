// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "utils.hpp"

namespace cardgen {

template <typename T> std::pair<bool, T> from_string(std::string_view str)
{
    T result;
    const auto *end = str.data() + str.size();
    auto [endConv, err] = std::from_chars(str.data(), end, result);
    if (err == std::errc{} && endConv == end) {
        return {true, result};
    }

    return {false, {}};
}

std::string remove_whitespace(std::string_view str)
{
    std::string result;
    result.reserve(str.size());
    for (auto c : str) {
        if (!isspace(c)) {
            result.push_back(c);
        }
    }
    return result;
}

std::vector<std::string_view> split(std::string_view str, std::string_view seps)
{
    std::vector<std::string_view> components;

    std::size_t start = 0;
    while (start < str.size()) {
        const std::size_t end = str.find_first_of(seps, start);

        if (end == start) {
            // Ignore zero-sized strings
            start = end + 1;
            continue;
        }

        if (end == std::string_view::npos) {
            // Last element
            components.emplace_back(str.substr(start));
            start = str.size();
        } else {
            components.emplace_back(str.substr(start, end - start));
            start = end + 1;
        }
    }

    return components;
}

bool string_iequals(std::string_view left, std::string_view right)
{
    return left.size() == right.size() &&
           std::equal(left.begin(), left.end(), right.begin(),
               [](char l, char r) { return tolower(l) == tolower(r); });
}

std::string pad_left(std::string_view str, std::size_t length, char fill)
{
    if (str.size() >= length) {
        return std::string{str};
    }

    std::string result(length - str.size(), fill);
    result.append(str);
    return result;
}

template std::pair<bool, unsigned> from_string<unsigned>(std::string_view str);
template std::pair<bool, int> from_string<int>(std::string_view str);
template std::pair<bool, uint64_t> from_string<uint64_t>(std::string_view str);

} // namespace cardgen
