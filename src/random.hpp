// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <random>

namespace cardgen {

// Source of test-data quality randomness, not suitable for anything secret.
class random_source {
public:
    random_source() = default;
    random_source(const random_source &) = default;
    random_source &operator=(const random_source &) = default;
    random_source(random_source &&) = default;
    random_source &operator=(random_source &&) = default;
    virtual ~random_source() = default;

    // Uniformly distributed value within [lower, upper], lower <= upper
    virtual uint32_t uniform(uint32_t lower, uint32_t upper) = 0;

    char digit() { return static_cast<char>('0' + uniform(0, 9)); }
};

class pseudo_random_source : public random_source {
public:
    // A seed of zero results in a time-based seed
    explicit pseudo_random_source(uint64_t seed = 0);
    pseudo_random_source(const pseudo_random_source &) = delete;
    pseudo_random_source &operator=(const pseudo_random_source &) = delete;
    pseudo_random_source(pseudo_random_source &&) = default;
    pseudo_random_source &operator=(pseudo_random_source &&) = default;
    ~pseudo_random_source() override = default;

    uint32_t uniform(uint32_t lower, uint32_t upper) override;

protected:
    std::mt19937_64 rng_;
};

} // namespace cardgen
