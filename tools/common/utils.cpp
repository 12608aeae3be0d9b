// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <yaml-cpp/yaml.h>

#include "common/utils.hpp"
#include "configuration.hpp"
#include "exporter/exporter.hpp"
#include "log.hpp"

using namespace std::literals;

namespace YAML {

cardgen::generator_config as_if<cardgen::generator_config, void>::operator()() const
{
    if (!node.IsMap()) {
        throw parsing_error("generator configuration must be a map");
    }

    cardgen::generator_config config;
    if (auto max_batch_size = node["max_batch_size"]; max_batch_size.IsDefined()) {
        config.max_batch_size = max_batch_size.as<std::size_t>();
    }

    if (auto partial_expiry = node["partial_expiry"]; partial_expiry.IsDefined()) {
        auto policy = partial_expiry.as<std::string>();
        if (policy == "honor") {
            config.partial_expiry = cardgen::partial_expiry_policy::honor;
        } else if (policy == "regenerate") {
            config.partial_expiry = cardgen::partial_expiry_policy::regenerate;
        } else {
            throw parsing_error("unknown partial_expiry policy: " + policy);
        }
    }

    if (auto validate_cvv = node["validate_literal_cvv"]; validate_cvv.IsDefined()) {
        config.validate_literal_cvv = validate_cvv.as<bool>();
    }

    return config;
}

} // namespace YAML

void load_options(const YAML::Node &node, runner_options &options)
{
    if (!node.IsMap()) {
        throw YAML::parsing_error("configuration must be a map");
    }

    if (auto pattern = node["pattern"]; pattern.IsDefined()) {
        options.pattern = pattern.as<std::string>();
    }

    if (auto count = node["count"]; count.IsDefined()) {
        options.count = count.as<uint64_t>();
    }

    if (auto seed = node["seed"]; seed.IsDefined()) {
        options.seed = seed.as<uint64_t>();
    }

    if (auto format = node["format"]; format.IsDefined()) {
        options.format = cardgen::export_format_from_string(format.as<std::string>());
    }

    options.config = node.as<cardgen::generator_config>();
}

cardgen::log_level str_to_level(std::string_view str)
{
    if (str == "trace"sv || str == "TRACE"sv) {
        return cardgen::log_level::trace;
    }

    if (str == "debug"sv || str == "DEBUG"sv) {
        return cardgen::log_level::debug;
    }

    if (str == "error"sv || str == "ERROR"sv) {
        return cardgen::log_level::error;
    }

    if (str == "warn"sv || str == "WARN"sv) {
        return cardgen::log_level::warn;
    }

    if (str == "info"sv || str == "INFO"sv) {
        return cardgen::log_level::info;
    }

    return cardgen::log_level::off;
}

void log_cb(cardgen::log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t /*length*/)
{
    // Logs go to stderr, stdout is reserved for the exported cards
    std::cerr << "[" << cardgen::log_level_to_str(level) << "][" << file << ":" << function
              << ":" << line << "]: " << message << '\n';
}

std::string read_file(std::string_view filename)
{
    std::ifstream config_file(std::string{filename}, std::ios::in);
    if (!config_file) {
        throw std::system_error(errno, std::generic_category());
    }

    // Create a buffer equal to the file size
    std::string buffer;
    config_file.seekg(0, std::ios::end);
    buffer.resize(config_file.tellg());
    config_file.seekg(0, std::ios::beg);

    config_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    config_file.close();
    return buffer;
}
