// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "generator/card_generator.hpp"

namespace cardgen {

enum class export_format : uint8_t { pipe, json, csv, formatted };

// Case insensitive, unknown formats map to pipe
export_format export_format_from_string(std::string_view name);

std::string_view export_format_to_string(export_format format);

std::string export_card(const card_record &card, export_format format);

inline std::string export_card(const card_record &card, std::string_view format)
{
    return export_card(card, export_format_from_string(format));
}

// Newline separated records, csv output is preceded by a header and json
// output is a single array.
std::string export_batch(std::span<const card_record> cards, export_format format);

} // namespace cardgen
