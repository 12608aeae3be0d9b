// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "calendar.hpp"
#include "random.hpp"

namespace cardgen {

// Two-digit month and two-digit year
struct expiry {
    std::string month;
    std::string year;
};

// A month within the next one to ten years
expiry random_expiry(random_source &rng, calendar_date today);

// Literal months are only zero-padded, months with wildcards are expanded and
// replaced by a random month if they don't fall within 1 to 12.
std::string resolve_month(std::string_view month, random_source &rng);

// Literal years are reduced or padded to two digits, years with wildcards are
// expanded and replaced by a random year when they are in the past or, for
// four-digit years, more than twenty years in the future.
std::string resolve_year(std::string_view year, random_source &rng, calendar_date today);

} // namespace cardgen
