// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>

#include "brand/card_brand.hpp"
#include "generator/cvv_generator.hpp"
#include "random.hpp"
#include "utils.hpp"

namespace cardgen {

std::string random_cvv(random_source &rng, card_brand brand)
{
    const auto length = cvv_length(brand);

    std::string cvv;
    cvv.reserve(length);
    for (std::size_t i = 0; i < length; ++i) { cvv.push_back(rng.digit()); }
    return cvv;
}

bool is_valid_cvv(std::string_view cvv, card_brand brand)
{
    return cvv.size() == cvv_length(brand) && is_all_digits(cvv);
}

} // namespace cardgen
