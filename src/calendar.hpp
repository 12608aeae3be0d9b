// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>

namespace cardgen {

struct calendar_date {
    int year;
    // 1 to 12
    unsigned month;
};

class calendar {
public:
    calendar() = default;
    calendar(const calendar &) = default;
    calendar &operator=(const calendar &) = default;
    calendar(calendar &&) = default;
    calendar &operator=(calendar &&) = default;
    virtual ~calendar() = default;

    [[nodiscard]] virtual calendar_date today() const = 0;
};

// Local wall-clock date
class system_calendar : public calendar {
public:
    system_calendar() = default;
    system_calendar(const system_calendar &) = default;
    system_calendar &operator=(const system_calendar &) = default;
    system_calendar(system_calendar &&) = default;
    system_calendar &operator=(system_calendar &&) = default;
    ~system_calendar() override = default;

    [[nodiscard]] calendar_date today() const override;
};

} // namespace cardgen
