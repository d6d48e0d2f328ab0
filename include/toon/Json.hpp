/**
 * @file Json.hpp
 * @brief Conversion between Value and nlohmann::json
 *
 * JSON -> Value:
 * - object key order is preserved (for ordered_json input)
 * - unsigned integers above the int64 range become BigInt
 * - binary values raise UnsupportedType
 *
 * Value -> JSON:
 * - Table becomes an array of objects
 * - Date becomes its ISO-8601 string
 * - BigInt becomes a number when it fits 64 bits, otherwise a digit string
 * - Infinity / -Infinity / NaN become null
 */

#ifndef TOON_JSON_HPP
#define TOON_JSON_HPP

#include "toon/Value.hpp"

#include <nlohmann/json.hpp>

namespace toon {

/**
 * @brief Convert a JSON document to a Value
 * @throws UnsupportedType for binary values
 */
Value from_json(const nlohmann::json& j);

/// @copydoc from_json(const nlohmann::json&)
Value from_json(const nlohmann::ordered_json& j);

/**
 * @brief Convert a Value to JSON, keeping object field order
 */
nlohmann::ordered_json to_json(const Value& val);

} // namespace toon

#endif // TOON_JSON_HPP
