// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef CARDGEN_H
#define CARDGEN_H

#ifdef __cplusplus
#include <cstddef>

namespace cardgen{
class instance;
} // namespace cardgen

using cardgen_handle = cardgen::instance *;

extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum CARDGEN_RET_CODE
 *
 * Codes returned by the generation functions.
 **/
typedef enum
{
    /** The argument provided to the function was invalid. */
    CARDGEN_ERR_INVALID_ARGUMENT = -3,
    /** The pattern contained invalid characters or no BIN. */
    CARDGEN_ERR_INVALID_PATTERN = -2,
    /** An unexpected error occurred while generating. */
    CARDGEN_ERR_INTERNAL = -1,
    /** The card(s) were generated successfully. */
    CARDGEN_OK = 0,
} CARDGEN_RET_CODE;

/**
 * @enum CARDGEN_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    CARDGEN_LOG_TRACE,
    CARDGEN_LOG_DEBUG,
    CARDGEN_LOG_INFO,
    CARDGEN_LOG_WARN,
    CARDGEN_LOG_ERROR,
    CARDGEN_LOG_OFF,
} CARDGEN_LOG_LEVEL;

#ifndef __cplusplus
typedef struct _cardgen_handle* cardgen_handle;
#endif

typedef struct _cardgen_config cardgen_config;
typedef struct _cardgen_card cardgen_card;
typedef struct _cardgen_card_list cardgen_card_list;

/**
 * @struct cardgen_config
 *
 * Generator configuration, a zero-initialised structure provides the defaults
 * except for max_batch_size, where zero means the library default.
 **/
struct _cardgen_config
{
    /** Seed of the random source, 0 for a time-based seed. */
    uint64_t seed;
    /** Maximum number of cards per batch, 0 for the default. */
    uint64_t max_batch_size;
    /** Keep a month or year provided without its counterpart. */
    bool honor_partial_expiry;
    /** Validate the length and content of literal CVVs. */
    bool validate_literal_cvv;
};

/**
 * @struct cardgen_card
 *
 * Generated card, all strings are NUL-terminated and owned by the structure.
 **/
struct _cardgen_card
{
    char *card_number;
    char *month;
    char *year;
    char *cvv;
    /** Brand name, e.g. "Visa", or "Unknown" */
    char *card_type;
    /** card_number|month|year|cvv */
    char *formatted;
};

/**
 * @struct cardgen_card_list
 *
 * Successfully generated cards of a batch.
 **/
struct _cardgen_card_list
{
    cardgen_card *cards;
    uint64_t size;
    /** Number of cards which failed to generate */
    uint64_t failures;
};

/**
 * @typedef cardgen_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The size of the logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*cardgen_log_cb)(
    CARDGEN_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * cardgen_init
 *
 * Initialize a generator instance.
 *
 * @param config Optional configuration of the generator. (nullable)
 *
 * @return Handle to the generator, or NULL on failure.
 **/
cardgen_handle cardgen_init(const cardgen_config *config);

/**
 * cardgen_destroy
 *
 * Destroy a generator instance.
 *
 * @param handle Handle to destroy. (nullable)
 **/
void cardgen_destroy(cardgen_handle handle);

/**
 * cardgen_generate
 *
 * Generate a single card from a pattern, e.g. "434769805926XXXX|10|2029|XXX".
 *
 * @param handle Generator instance. (nonnull)
 * @param pattern The pattern. (nonnull)
 * @param length Length of the pattern.
 * @param card Structure to populate, must be freed with cardgen_card_free. (nonnull)
 *
 * @return CARDGEN_OK or an error code.
 **/
CARDGEN_RET_CODE cardgen_generate(
    cardgen_handle handle, const char *pattern, size_t length, cardgen_card *card);

/**
 * cardgen_generate_batch
 *
 * Generate count cards from the same pattern. Cards which fail to generate are
 * skipped and counted in cardgen_card_list::failures.
 *
 * @param handle Generator instance. (nonnull)
 * @param pattern The pattern. (nonnull)
 * @param length Length of the pattern.
 * @param count Number of cards to generate, limited by max_batch_size.
 * @param list Structure to populate, must be freed with cardgen_card_list_free. (nonnull)
 *
 * @return CARDGEN_OK or an error code.
 **/
CARDGEN_RET_CODE cardgen_generate_batch(cardgen_handle handle, const char *pattern,
    size_t length, uint64_t count, cardgen_card_list *list);

/**
 * cardgen_export
 *
 * Render a card in one of the export formats: pipe, json, csv or formatted.
 * Unknown formats fall back to pipe.
 *
 * @param card The card to export. (nonnull)
 * @param format Name of the format, NUL-terminated. (nullable)
 * @param length Output length of the string, excluding NUL terminator. (nullable)
 *
 * @return NUL-terminated string to be freed with cardgen_string_free, or NULL.
 **/
char *cardgen_export(const cardgen_card *card, const char *format, size_t *length);

/**
 * cardgen_validate_pattern
 *
 * @param pattern The pattern. (nullable)
 * @param length Length of the pattern.
 *
 * @return Whether the pattern can be used to generate cards.
 **/
bool cardgen_validate_pattern(const char *pattern, size_t length);

/**
 * cardgen_validate_card_number
 *
 * @param number The card number, separators are ignored. (nullable)
 * @param length Length of the number.
 *
 * @return Whether the number has 13 to 19 digits and passes the Luhn check.
 **/
bool cardgen_validate_card_number(const char *number, size_t length);

/**
 * cardgen_card_free
 *
 * @param card Card to release, the structure itself isn't freed. (nullable)
 **/
void cardgen_card_free(cardgen_card *card);

/**
 * cardgen_card_list_free
 *
 * @param list List to release, the structure itself isn't freed. (nullable)
 **/
void cardgen_card_list_free(cardgen_card_list *list);

/**
 * cardgen_string_free
 *
 * @param str String returned by cardgen_export. (nullable)
 **/
void cardgen_string_free(char *str);

/**
 * cardgen_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *cardgen_get_version();

/**
 * cardgen_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool cardgen_set_log_cb(cardgen_log_cb cb, CARDGEN_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*CARDGEN_H */
