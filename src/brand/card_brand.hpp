// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <fmt/format.h>

namespace cardgen {

enum class card_brand : uint8_t {
    unknown,
    visa,
    mastercard,
    american_express,
    discover,
    diners_club,
    jcb,
    dankort,
    visa_electron,
};

inline std::string_view brand_to_string(card_brand brand)
{
    switch (brand) {
    case card_brand::visa:
        return "Visa";
    case card_brand::mastercard:
        return "Mastercard";
    case card_brand::american_express:
        return "American Express";
    case card_brand::discover:
        return "Discover";
    case card_brand::diners_club:
        return "Diners Club";
    case card_brand::jcb:
        return "JCB";
    case card_brand::dankort:
        return "Dankort";
    case card_brand::visa_electron:
        return "Visa Electron";
    case card_brand::unknown:
        break;
    }
    return "Unknown";
}

card_brand brand_from_string(std::string_view str);

// Length of the security code printed on cards of the given brand
inline std::size_t cvv_length(card_brand brand)
{
    return brand == card_brand::american_express ? 4 : 3;
}

} // namespace cardgen

template <> struct fmt::formatter<cardgen::card_brand> : fmt::formatter<std::string_view> {
    // Use the parse method from the base class formatter
    template <typename FormatContext>
    auto format(cardgen::card_brand b, FormatContext &ctx) const
    {
        return fmt::formatter<std::string_view>::format(cardgen::brand_to_string(b), ctx);
    }
};
