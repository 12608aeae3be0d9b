// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

namespace cardgen {

class base_checksum {
public:
    base_checksum() = default;
    base_checksum(const base_checksum &) = default;
    base_checksum &operator=(const base_checksum &) = default;
    base_checksum(base_checksum &&) = default;
    base_checksum &operator=(base_checksum &&) = default;
    virtual ~base_checksum() = default;

    [[nodiscard]] virtual bool validate(std::string_view str) const noexcept = 0;

    // Digit which, appended to the payload, makes the whole sequence valid
    [[nodiscard]] virtual char compute_check_digit(std::string_view payload) const noexcept = 0;

    [[nodiscard]] std::string append_check_digit(std::string_view payload) const
    {
        std::string result{payload};
        result.push_back(compute_check_digit(payload));
        return result;
    }
};

} // namespace cardgen
