// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "brand/card_brand.hpp"
#include "random.hpp"

namespace cardgen {

std::string random_cvv(random_source &rng, card_brand brand);

// True if the CVV is numeric and as long as required by the brand
bool is_valid_cvv(std::string_view cvv, card_brand brand);

} // namespace cardgen
