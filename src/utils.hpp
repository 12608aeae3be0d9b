// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cardgen {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isspace(char c)
{
    return c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v';
}
inline bool isupper(char c) { return static_cast<unsigned>(c) - 'A' < 26; }
inline char tolower(char c) { return isupper(c) ? static_cast<char>(c | 32) : c; }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

inline bool is_all_digits(std::string_view str)
{
    return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) { return isdigit(c); });
}

template <typename T> std::pair<bool, T> from_string(std::string_view str);

std::string remove_whitespace(std::string_view str);

// Splits on any of the characters in seps, zero-sized components are dropped
std::vector<std::string_view> split(std::string_view str, std::string_view seps);

bool string_iequals(std::string_view left, std::string_view right);

std::string pad_left(std::string_view str, std::size_t length, char fill = '0');

} // namespace cardgen
