// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <stdexcept>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "calendar.hpp"
#include "checksum/luhn_checksum.hpp"
#include "common/utils.hpp"
#include "configuration.hpp"
#include "exception.hpp"
#include "exporter/exporter.hpp"
#include "generator/card_generator.hpp"
#include "log.hpp"
#include "random.hpp"
#include "utils.hpp"

namespace {
// NOLINTNEXTLINE
auto parse_args(int argc, char *argv[])
{
    const std::map<std::string, std::string, std::less<>> arg_mapping{{"-p", "--pattern"},
        {"--pattern", "--pattern"}, {"-n", "--count"}, {"--count", "--count"},
        {"-f", "--format"}, {"--format", "--format"}, {"-s", "--seed"}, {"--seed", "--seed"},
        {"-c", "--config"}, {"--config", "--config"}, {"--validate", "--validate"},
        {"-v", "--verbose"}, {"--verbose", "--verbose"}, {"--log-level", "--log-level"}};

    std::unordered_map<std::string, std::vector<std::string>> args;
    auto last_arg = args.end();
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg.starts_with('-')) {
            if (auto long_arg = arg_mapping.find(arg); long_arg != arg_mapping.end()) {
                arg = long_arg->second;
            } else {
                continue; // Unknown option
            }

            auto [it, res] = args.emplace(arg, std::vector<std::string>{});
            last_arg = it;
        } else if (last_arg != args.end()) {
            last_arg->second.emplace_back(arg);
        }
    }
    return args;
}

template <typename T> T numeric_arg(const std::vector<std::string> &values, std::string_view name)
{
    if (values.empty()) {
        throw std::invalid_argument(std::string{name} + " requires a value");
    }

    auto [res, value] = cardgen::from_string<T>(values.front());
    if (!res) {
        throw std::invalid_argument("invalid value for " + std::string{name});
    }
    return value;
}

int validate_numbers(const std::vector<std::string> &numbers)
{
    bool all_valid = true;
    for (const auto &number : numbers) {
        const bool valid = cardgen::is_valid_card_number(number);
        std::cout << number << ": " << (valid ? "valid" : "invalid") << '\n';
        all_valid = all_valid && valid;
    }
    return all_valid ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace

int main(int argc, char *argv[])
{
    auto args = parse_args(argc, argv);

    auto level = cardgen::log_level::warn;
    if (args.contains("--verbose")) {
        level = cardgen::log_level::trace;
    } else if (const auto &levels = args["--log-level"]; !levels.empty()) {
        level = str_to_level(levels.front());
    }
    cardgen::logger::init(log_cb, level);

    if (args.contains("--validate")) {
        return validate_numbers(args["--validate"]);
    }

    runner_options options;
    try {
        if (const auto &configs = args["--config"]; !configs.empty()) {
            load_options(YAML::Load(read_file(configs.front())), options);
        }

        if (const auto &patterns = args["--pattern"]; !patterns.empty()) {
            options.pattern = patterns.front();
        }

        if (args.contains("--count")) {
            options.count = numeric_arg<uint64_t>(args["--count"], "--count");
        }

        if (args.contains("--seed")) {
            options.seed = numeric_arg<uint64_t>(args["--seed"], "--seed");
        }

        if (const auto &formats = args["--format"]; !formats.empty()) {
            options.format = cardgen::export_format_from_string(formats.front());
        }
    } catch (const std::exception &e) {
        std::cerr << "Failed to load options: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    if (options.pattern.empty()) {
        std::cout << "Usage: " << argv[0] << " --pattern <pattern> [--count <n>]"
                  << " [--format pipe|json|csv|formatted] [--seed <n>]"
                  << " [--config <yaml file>] [--verbose | --log-level <level>]\n"
                  << "       " << argv[0] << " --validate <card number> [<card number>..]\n";
        return EXIT_FAILURE;
    }

    CARDGEN_DEBUG("Generating {} cards as {}, max batch size {}, partial expiry {}", options.count,
        cardgen::export_format_to_string(options.format), options.config.max_batch_size,
        cardgen::partial_expiry_policy_to_string(options.config.partial_expiry));

    cardgen::pseudo_random_source rng{options.seed};
    cardgen::system_calendar calendar;
    cardgen::card_generator generator{rng, calendar, options.config};

    try {
        cardgen::validate_pattern(options.pattern);
    } catch (const cardgen::invalid_pattern &e) {
        std::cerr << "Invalid pattern: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    auto entries = generator.generate_batch(options.pattern, options.count);
    const auto total = entries.size();
    auto cards = cardgen::successful(std::move(entries));

    std::cout << cardgen::export_batch(cards, options.format) << '\n';

    if (cards.size() != total) {
        std::cerr << total - cards.size() << " of " << total << " cards failed to generate\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
