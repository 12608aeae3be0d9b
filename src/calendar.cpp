// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <ctime>
#include <stdexcept>

#include "calendar.hpp"
#include "log.hpp"

namespace cardgen {

calendar_date system_calendar::today() const
{
    const std::time_t now = std::time(nullptr);

    std::tm local{};
#ifdef _WIN32
    const bool success = localtime_s(&local, &now) == 0;
#else
    const bool success = localtime_r(&now, &local) != nullptr;
#endif
    if (!success) {
        // UTC is at most a day off
        CARDGEN_WARN("localtime failed, using UTC date");
#ifdef _WIN32
        const bool utc_success = gmtime_s(&local, &now) == 0;
#else
        const bool utc_success = gmtime_r(&now, &local) != nullptr;
#endif
        if (!utc_success) {
            throw std::runtime_error("unable to determine the current date");
        }
    }

    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    return {local.tm_year + 1900, static_cast<unsigned>(local.tm_mon + 1)};
}

} // namespace cardgen
