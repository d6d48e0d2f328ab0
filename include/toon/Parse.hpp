/**
 * @file Parse.hpp
 * @brief Typing of unquoted scalar tokens
 *
 * An unquoted token read by the parser is typed by the first matching
 * rule; the whole token must match:
 * - "true" / "false" (case-sensitive) -> Bool
 * - "null" -> Null
 * - Integer (matches ^-?[0-9]+$) -> Number::Integer
 * - Float (matches ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$) -> Number::Float
 * - BigInt (matches ^-?[0-9]+n$) -> BigInt
 * - "Infinity" / "-Infinity" / "NaN" -> special Number
 * - anything else -> String, unchanged
 */

#ifndef TOON_PARSE_HPP
#define TOON_PARSE_HPP

#include "toon/Value.hpp"

#include <string_view>

namespace toon {

/**
 * @brief Type an unquoted token
 *
 * @param token Trimmed token text (never empty)
 * @return Typed Value
 * @throws std::out_of_range if an integer literal does not fit 64 bits or
 *         a float literal overflows a double (underflow rounds to zero)
 *
 * Examples:
 * ```cpp
 * coerce_scalar("true")        // -> true (bool)
 * coerce_scalar("42")          // -> 42 (integer)
 * coerce_scalar("-2.5")        // -> -2.5 (float)
 * coerce_scalar("123n")        // -> BigInt 123
 * coerce_scalar("NaN")         // -> Number::nan()
 * coerce_scalar("3 apples")    // -> "3 apples" (string)
 * coerce_scalar("True")        // -> "True" (string)
 * ```
 */
Value coerce_scalar(std::string_view token);

} // namespace toon

#endif // TOON_PARSE_HPP
