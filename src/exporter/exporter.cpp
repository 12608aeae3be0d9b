// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "exporter/exporter.hpp"
#include "generator/card_generator.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace cardgen {

namespace {

constexpr std::string_view csv_header = "cardNumber,month,year,cvv,cardType";
constexpr std::size_t digit_group_size = 4;

template <typename Writer> void write_string(Writer &writer, std::string_view str)
{
    writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
}

template <typename Writer> void write_card(Writer &writer, const card_record &card)
{
    writer.StartObject();
    writer.Key("cardNumber");
    write_string(writer, card.card_number);
    writer.Key("month");
    write_string(writer, card.month);
    writer.Key("year");
    write_string(writer, card.year);
    writer.Key("cvv");
    write_string(writer, card.cvv);
    writer.Key("cardType");
    write_string(writer, card.card_type());
    writer.Key("formatted");
    write_string(writer, card.formatted);
    writer.EndObject();
}

std::string to_pipe(const card_record &card)
{
    return fmt::format("{}|{}|{}|{}", card.card_number, card.month, card.year, card.cvv);
}

std::string to_csv(const card_record &card)
{
    return fmt::format(
        "{},{},{},{},{}", card.card_number, card.month, card.year, card.cvv, card.card_type());
}

std::string to_json(const card_record &card)
{
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    write_card(writer, card);
    return {buffer.GetString(), buffer.GetSize()};
}

std::string to_formatted(const card_record &card)
{
    std::string grouped;
    const std::string_view number = card.card_number;
    for (std::size_t i = 0; i < number.size(); i += digit_group_size) {
        if (i > 0) {
            grouped.push_back(' ');
        }
        grouped.append(number.substr(i, digit_group_size));
    }

    return fmt::format("{} {}/{} {}", grouped, card.month, card.year, card.cvv);
}

} // namespace

export_format export_format_from_string(std::string_view name)
{
    if (string_iequals(name, "json")) {
        return export_format::json;
    }

    if (string_iequals(name, "csv")) {
        return export_format::csv;
    }

    if (string_iequals(name, "formatted")) {
        return export_format::formatted;
    }

    if (!string_iequals(name, "pipe")) {
        CARDGEN_DEBUG("Unknown export format '{}', using pipe", name);
    }

    return export_format::pipe;
}

std::string_view export_format_to_string(export_format format)
{
    switch (format) {
    case export_format::json:
        return "json";
    case export_format::csv:
        return "csv";
    case export_format::formatted:
        return "formatted";
    case export_format::pipe:
        break;
    }
    return "pipe";
}

std::string export_card(const card_record &card, export_format format)
{
    switch (format) {
    case export_format::json:
        return to_json(card);
    case export_format::csv:
        return to_csv(card);
    case export_format::formatted:
        return to_formatted(card);
    case export_format::pipe:
        break;
    }
    return to_pipe(card);
}

std::string export_batch(std::span<const card_record> cards, export_format format)
{
    if (format == export_format::json) {
        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        writer.StartArray();
        for (const auto &card : cards) { write_card(writer, card); }
        writer.EndArray();
        return {buffer.GetString(), buffer.GetSize()};
    }

    std::string output;
    if (format == export_format::csv) {
        output.append(csv_header);
    }

    for (const auto &card : cards) {
        if (!output.empty()) {
            output.push_back('\n');
        }
        output.append(export_card(card, format));
    }

    return output;
}

} // namespace cardgen
