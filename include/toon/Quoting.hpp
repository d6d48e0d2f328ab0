/**
 * @file Quoting.hpp
 * @brief Quoting and escaping rules for strings and keys
 *
 * A string value is written bare unless reading it back would change its
 * meaning. It is quoted when any of these holds:
 * - it is empty, or starts or ends with a space
 * - it contains ':', '"', '\\', newline, carriage return, tab or NUL
 * - it contains the active delimiter
 * - it is "true", "false" or "null"
 * - it reads as a number (including inf/nan spellings) or a BigInt
 *   literal such as "42n"
 * - it starts with "- "
 * - it starts with '[' and contains ']', or starts with '{' and contains '}'
 */

#ifndef TOON_QUOTING_HPP
#define TOON_QUOTING_HPP

#include "toon/Options.hpp"

#include <string>
#include <string_view>

namespace toon {

/**
 * @brief Decide whether a string value must be quoted
 * @param s The raw string
 * @param active The delimiter in effect; other delimiters do not force quoting
 */
bool needs_quotes(std::string_view s, Delimiter active);

/**
 * @brief True if the whole string parses as an integer or a float
 *
 * "inf", "infinity" and "nan" spellings count as floats.
 */
bool looks_numeric(std::string_view s);

/// True for `-?digits n`, the BigInt literal shape.
bool looks_like_bigint(std::string_view s);

/**
 * @brief Escape '"', '\\', newline, carriage return, tab, backspace,
 *        form feed and NUL to their two-character forms
 */
std::string escape_string(std::string_view s);

/// `"` + escape_string(s) + `"`
std::string quote(std::string_view s);

/// quote(s) if needs_quotes(s, active), otherwise s unchanged.
std::string quote_if_needed(std::string_view s, Delimiter active);

/**
 * @brief True if key matches `[A-Za-z_][A-Za-z0-9_.]*`
 */
bool is_bare_key(std::string_view key);

/// Key as written: bare when is_bare_key(), otherwise quoted.
std::string format_key(std::string_view key);

} // namespace toon

#endif // TOON_QUOTING_HPP
