// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.
#pragma once

#include <cstdint>

#include "calendar.hpp"
#include "configuration.hpp"
#include "generator/card_generator.hpp"
#include "random.hpp"

namespace cardgen {

// Generator bundled with the random source and calendar it refers to
class instance {
public:
    explicit instance(uint64_t seed, generator_config config = {})
        : rng_(seed), generator_(rng_, calendar_, config)
    {}
    instance(const instance &) = delete;
    instance(instance &&) = delete;
    instance &operator=(const instance &) = delete;
    instance &operator=(instance &&) = delete;
    ~instance() = default;

    card_generator &generator() { return generator_; }

protected:
    pseudo_random_source rng_;
    system_calendar calendar_;
    card_generator generator_;
};

} // namespace cardgen
