// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <new>
#include <string>
#include <string_view>
#include <utility>

#include "cardgen.h"
#include "checksum/luhn_checksum.hpp"
#include "configuration.hpp"
#include "exception.hpp"
#include "exporter/exporter.hpp"
#include "generator/card_generator.hpp"
#include "instance.hpp"
#include "log.hpp"
#include "pattern/pattern_parser.hpp"
#include "version.hpp"

using namespace cardgen;

// Log level compatibility
static_assert(static_cast<uint32_t>(log_level::trace) == CARDGEN_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == CARDGEN_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == CARDGEN_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == CARDGEN_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == CARDGEN_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == CARDGEN_LOG_OFF);

namespace {

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
cardgen_log_cb binding_log_cb = nullptr;

void forward_log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, uint64_t message_len)
{
    if (binding_log_cb != nullptr) {
        binding_log_cb(
            static_cast<CARDGEN_LOG_LEVEL>(level), function, file, line, message, message_len);
    }
}

char *to_cstring(std::string_view str)
{
    // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,hicpp-no-malloc)
    auto *copy = static_cast<char *>(malloc(str.size() + 1));
    if (copy == nullptr) {
        throw std::bad_alloc();
    }
    memcpy(copy, str.data(), str.size());
    copy[str.size()] = '\0';
    return copy;
}

void card_to_c(const card_record &card, cardgen_card &output)
{
    output = {};
    try {
        output.card_number = to_cstring(card.card_number);
        output.month = to_cstring(card.month);
        output.year = to_cstring(card.year);
        output.cvv = to_cstring(card.cvv);
        output.card_type = to_cstring(card.card_type());
        output.formatted = to_cstring(card.formatted);
    } catch (...) {
        cardgen_card_free(&output);
        throw;
    }
}

card_record card_from_c(const cardgen_card &card)
{
    auto view = [](const char *str) { return str != nullptr ? std::string{str} : std::string{}; };

    card_record record;
    record.card_number = view(card.card_number);
    record.month = view(card.month);
    record.year = view(card.year);
    record.cvv = view(card.cvv);
    record.brand = brand_from_string(view(card.card_type));
    record.formatted = view(card.formatted);
    return record;
}

generator_config config_from_c(const cardgen_config *config)
{
    generator_config result;
    if (config == nullptr) {
        return result;
    }

    if (config->max_batch_size > 0) {
        result.max_batch_size = static_cast<std::size_t>(config->max_batch_size);
    }

    result.partial_expiry = config->honor_partial_expiry ? partial_expiry_policy::honor
                                                         : partial_expiry_policy::regenerate;
    result.validate_literal_cvv = config->validate_literal_cvv;
    return result;
}

} // namespace

cardgen::instance *cardgen_init(const cardgen_config *config)
{
    try {
        const uint64_t seed = config != nullptr ? config->seed : 0;
        return new cardgen::instance(seed, config_from_c(config));
    } catch (const std::exception &e) {
        CARDGEN_ERROR("{}", e.what());
    } catch (...) {
        CARDGEN_ERROR("unknown exception");
    }

    return nullptr;
}

void cardgen_destroy(cardgen::instance *handle)
{
    try {
        delete handle;
    } catch (const std::exception &e) {
        CARDGEN_ERROR("{}", e.what());
    } catch (...) {
        CARDGEN_ERROR("unknown exception");
    }
}

CARDGEN_RET_CODE cardgen_generate(
    cardgen::instance *handle, const char *pattern, size_t length, cardgen_card *card)
{
    if (handle == nullptr || pattern == nullptr || card == nullptr) {
        CARDGEN_WARN("Illegal arguments given to cardgen_generate");
        return CARDGEN_ERR_INVALID_ARGUMENT;
    }

    *card = {};
    try {
        auto record = handle->generator().generate(std::string_view{pattern, length});
        card_to_c(record, *card);
        return CARDGEN_OK;
    } catch (const invalid_pattern &e) {
        CARDGEN_DEBUG("Invalid pattern: {}", e.what());
        return CARDGEN_ERR_INVALID_PATTERN;
    } catch (const std::exception &e) {
        CARDGEN_ERROR("{}", e.what());
    } catch (...) {
        CARDGEN_ERROR("unknown exception");
    }

    return CARDGEN_ERR_INTERNAL;
}

CARDGEN_RET_CODE cardgen_generate_batch(cardgen::instance *handle, const char *pattern,
    size_t length, uint64_t count, cardgen_card_list *list)
{
    if (handle == nullptr || pattern == nullptr || list == nullptr) {
        CARDGEN_WARN("Illegal arguments given to cardgen_generate_batch");
        return CARDGEN_ERR_INVALID_ARGUMENT;
    }

    *list = {};
    const std::string_view pattern_sv{pattern, length};
    if (!is_valid_pattern(pattern_sv)) {
        return CARDGEN_ERR_INVALID_PATTERN;
    }

    try {
        auto entries =
            handle->generator().generate_batch(pattern_sv, static_cast<std::size_t>(count));
        const auto total = entries.size();
        auto cards = successful(std::move(entries));
        list->failures = total - cards.size();

        if (cards.empty()) {
            return CARDGEN_OK;
        }

        // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,hicpp-no-malloc)
        list->cards = static_cast<cardgen_card *>(calloc(cards.size(), sizeof(cardgen_card)));
        if (list->cards == nullptr) {
            throw std::bad_alloc();
        }

        for (const auto &card : cards) {
            card_to_c(card, list->cards[list->size]);
            ++list->size;
        }
        return CARDGEN_OK;
    } catch (const std::exception &e) {
        CARDGEN_ERROR("{}", e.what());
    } catch (...) {
        CARDGEN_ERROR("unknown exception");
    }

    cardgen_card_list_free(list);
    return CARDGEN_ERR_INTERNAL;
}

char *cardgen_export(const cardgen_card *card, const char *format, size_t *length)
{
    if (card == nullptr) {
        return nullptr;
    }

    try {
        const auto output_format = export_format_from_string(format != nullptr ? format : "pipe");
        auto output = export_card(card_from_c(*card), output_format);
        if (length != nullptr) {
            *length = output.size();
        }
        return to_cstring(output);
    } catch (const std::exception &e) {
        CARDGEN_ERROR("{}", e.what());
    } catch (...) {
        CARDGEN_ERROR("unknown exception");
    }

    return nullptr;
}

bool cardgen_validate_pattern(const char *pattern, size_t length)
{
    if (pattern == nullptr) {
        return false;
    }
    return is_valid_pattern(std::string_view{pattern, length});
}

bool cardgen_validate_card_number(const char *number, size_t length)
{
    if (number == nullptr) {
        return false;
    }
    return is_valid_card_number(std::string_view{number, length});
}

void cardgen_card_free(cardgen_card *card)
{
    if (card == nullptr) {
        return;
    }

    // NOLINTBEGIN(cppcoreguidelines-no-malloc,hicpp-no-malloc)
    free(card->card_number);
    free(card->month);
    free(card->year);
    free(card->cvv);
    free(card->card_type);
    free(card->formatted);
    // NOLINTEND(cppcoreguidelines-no-malloc,hicpp-no-malloc)

    *card = {};
}

void cardgen_card_list_free(cardgen_card_list *list)
{
    if (list == nullptr) {
        return;
    }

    if (list->cards != nullptr) {
        for (uint64_t i = 0; i < list->size; ++i) { cardgen_card_free(&list->cards[i]); }
        // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,hicpp-no-malloc)
        free(list->cards);
    }

    *list = {};
}

void cardgen_string_free(char *str)
{
    // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,hicpp-no-malloc)
    free(str);
}

const char *cardgen_get_version() { return cardgen::current_version; }

bool cardgen_set_log_cb(cardgen_log_cb cb, CARDGEN_LOG_LEVEL min_level)
{
    binding_log_cb = cb;
    cardgen::logger::init(cb != nullptr ? forward_log : nullptr,
        static_cast<cardgen::log_level>(min_level));
    CARDGEN_INFO("Sending log messages to binding, min level {}",
        log_level_to_str(static_cast<cardgen::log_level>(min_level)));
    return true;
}
