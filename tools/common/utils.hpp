// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <yaml-cpp/yaml.h>

#include "configuration.hpp"
#include "exporter/exporter.hpp"
#include "log.hpp"

namespace YAML {

class parsing_error : public std::exception {
public:
    explicit parsing_error(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    const std::string what_;
};

template <> struct as_if<cardgen::generator_config, void> {
    explicit as_if(const Node &node_) : node(node_) {}
    cardgen::generator_config operator()() const;
    const Node &node;
};

} // namespace YAML

struct runner_options {
    std::string pattern;
    uint64_t count{1};
    uint64_t seed{0};
    cardgen::export_format format{cardgen::export_format::pipe};
    cardgen::generator_config config{};
};

// Applies the settings found in a YAML document on top of the given options
void load_options(const YAML::Node &node, runner_options &options);

cardgen::log_level str_to_level(std::string_view str);

void log_cb(cardgen::log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t length);

std::string read_file(std::string_view filename);
