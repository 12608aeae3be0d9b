// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <utility>

namespace cardgen {

class invalid_pattern : public std::exception {
public:
    explicit invalid_pattern(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    std::string what_;
};

// The pattern contains characters other than digits, wildcards, separators
// and whitespace.
class invalid_pattern_characters : public invalid_pattern {
public:
    invalid_pattern_characters(std::string what, std::size_t position)
        : invalid_pattern(std::move(what)), position_(position)
    {}

    [[nodiscard]] std::size_t position() const noexcept { return position_; }

protected:
    std::size_t position_;
};

} // namespace cardgen
