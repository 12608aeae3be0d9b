// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <chrono>
#include <cstdint>
#include <random>

#include "random.hpp"

namespace cardgen {

namespace {
using clock = std::chrono::system_clock;

uint64_t init_seed(uint64_t seed)
{
    if (seed != 0) {
        return seed;
    }
    return static_cast<uint64_t>(clock::now().time_since_epoch().count());
}

} // namespace

pseudo_random_source::pseudo_random_source(uint64_t seed) : rng_(init_seed(seed)) {}

uint32_t pseudo_random_source::uniform(uint32_t lower, uint32_t upper)
{
    std::uniform_int_distribution<uint32_t> dist{lower, upper};
    return dist(rng_);
}

} // namespace cardgen
