// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "exception.hpp"
#include "log.hpp"
#include "pattern/pattern_parser.hpp"
#include "pattern/wildcard.hpp"
#include "utils.hpp"

namespace cardgen {

namespace {

std::optional<std::string> segment_or_null(
    const std::vector<std::string_view> &segments, std::size_t index)
{
    if (index < segments.size()) {
        return std::string{segments[index]};
    }
    return std::nullopt;
}

} // namespace

card_pattern parse_pattern(std::string_view raw)
{
    const auto cleaned = remove_whitespace(raw);
    const auto segments = split(cleaned, pattern_separators);

    card_pattern pattern;
    if (!segments.empty()) {
        pattern.bin = segments[0];
    }
    pattern.month = segment_or_null(segments, 1);
    pattern.year = segment_or_null(segments, 2);
    pattern.cvv = segment_or_null(segments, 3);

    if (segments.size() > 4) {
        CARDGEN_DEBUG("Ignoring {} trailing pattern segments", segments.size() - 4);
    }

    return pattern;
}

void validate_pattern(std::string_view raw)
{
    bool bin_found = false;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const auto c = raw[i];
        if (isspace(c) || is_separator(c)) {
            continue;
        }

        if (!isdigit(c) && !is_wildcard(c)) {
            throw invalid_pattern_characters(
                fmt::format("invalid character '{}' at position {}", c, i), i);
        }
        bin_found = true;
    }

    if (!bin_found) {
        throw invalid_pattern("pattern contains no BIN");
    }
}

bool is_valid_pattern(std::string_view raw) noexcept
{
    try {
        validate_pattern(raw);
        return true;
    } catch (const invalid_pattern &e) {
        CARDGEN_DEBUG("Rejected pattern: {}", e.what());
    } catch (const std::exception &e) {
        CARDGEN_ERROR("{}", e.what());
    }
    return false;
}

} // namespace cardgen
