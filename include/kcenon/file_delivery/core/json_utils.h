/**
 * @file json_utils.h
 * @brief Minimal JSON helpers for lock tokens, reports and service responses
 *
 * The agent exchanges small, flat JSON documents. These helpers locate keys
 * by name rather than building a document tree; nested objects are handled by
 * extracting the object text first and searching within it.
 */

#ifndef KCENON_FILE_DELIVERY_CORE_JSON_UTILS_H
#define KCENON_FILE_DELIVERY_CORE_JSON_UTILS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::file_delivery::json {

/**
 * @brief Escape a string for embedding between JSON quotes
 */
[[nodiscard]] auto escape(std::string_view input) -> std::string;

/**
 * @brief Reverse escape() for a raw string value
 */
[[nodiscard]] auto unescape(std::string_view input) -> std::string;

/**
 * @brief Find the raw text of a top-level or nested key's value
 *
 * String values are returned without quotes and still escaped; objects
 * and arrays are returned including their brackets; scalars are trimmed.
 *
 * @return std::nullopt when the key is absent or the value is malformed
 */
[[nodiscard]] auto find_raw(std::string_view json, std::string_view key)
    -> std::optional<std::string>;

/**
 * @brief Get an unescaped string value
 *
 * Returns std::nullopt when absent or when the value is null.
 */
[[nodiscard]] auto get_string(std::string_view json, std::string_view key)
    -> std::optional<std::string>;

/**
 * @brief Get an integer value (quoted integers are accepted)
 */
[[nodiscard]] auto get_int(std::string_view json, std::string_view key)
    -> std::optional<int64_t>;

/**
 * @brief Get a boolean value ("true"/"false", quoted or not)
 */
[[nodiscard]] auto get_bool(std::string_view json, std::string_view key)
    -> std::optional<bool>;

/**
 * @brief Get the text of a nested object value, braces included
 */
[[nodiscard]] auto get_object(std::string_view json, std::string_view key)
    -> std::optional<std::string>;

/**
 * @brief Check that the text is a single JSON object
 *
 * Verifies bracket balance outside of strings; it is not a full validator.
 */
[[nodiscard]] auto looks_like_object(std::string_view json) -> bool;

}  // namespace kcenon::file_delivery::json

#endif  // KCENON_FILE_DELIVERY_CORE_JSON_UTILS_H
