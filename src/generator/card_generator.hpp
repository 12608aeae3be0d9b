// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "brand/card_brand.hpp"
#include "calendar.hpp"
#include "checksum/luhn_checksum.hpp"
#include "configuration.hpp"
#include "generator/expiry_generator.hpp"
#include "pattern/pattern_parser.hpp"
#include "random.hpp"

namespace cardgen {

struct card_record {
    std::string card_number;
    std::string month;
    std::string year;
    std::string cvv;
    card_brand brand{card_brand::unknown};
    // card_number|month|year|cvv
    std::string formatted;

    [[nodiscard]] std::string_view card_type() const { return brand_to_string(brand); }
};

struct generation_failure {
    // Position of the failed element within its batch
    std::size_t index;
    std::string reason;
};

using batch_entry = std::variant<card_record, generation_failure>;

// Number of digits of a card starting with the given BIN
std::size_t card_length_for(std::string_view bin);

class card_generator {
public:
    card_generator(random_source &rng, const calendar &cal, generator_config config = {})
        : rng_(rng), calendar_(cal), config_(config)
    {}
    card_generator(const card_generator &) = delete;
    card_generator &operator=(const card_generator &) = delete;
    card_generator(card_generator &&) = delete;
    card_generator &operator=(card_generator &&) = delete;
    virtual ~card_generator() = default;

    // Throws invalid_pattern if the pattern is malformed
    virtual card_record generate(std::string_view pattern);

    // One entry per requested card, in order. A failure doesn't interrupt the
    // batch, it's logged and reported as a generation_failure instead.
    std::vector<batch_entry> generate_batch(std::string_view pattern, std::size_t count);

    [[nodiscard]] const generator_config &config() const { return config_; }

protected:
    std::string generate_card_number(std::string_view bin);
    expiry generate_expiry(const card_pattern &pattern, calendar_date today);
    std::string generate_cvv(const card_pattern &pattern, card_brand brand);

    random_source &rng_;
    const calendar &calendar_;
    generator_config config_;
    luhn_checksum checksum_;
};

std::vector<card_record> successful(std::vector<batch_entry> entries);

} // namespace cardgen
