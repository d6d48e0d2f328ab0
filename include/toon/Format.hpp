/**
 * @file Format.hpp
 * @brief Array encoding selection
 *
 * Decision, in order:
 * 1. Empty array: inline (written as `[0]:`)
 * 2. All elements are objects with the same non-empty key set and only
 *    primitive values: tabular, headers sorted lexicographically
 * 3. All elements primitive: inline
 * 4. Otherwise: list
 *
 * Selection depends only on content, never on Options.
 */

#ifndef TOON_FORMAT_HPP
#define TOON_FORMAT_HPP

#include "toon/Value.hpp"

#include <optional>

namespace toon {

enum class ArrayFormat { Inline, Tabular, List };

/**
 * @brief Classify an array
 * @param elements The array to encode
 * @return The encoding the writer will use
 */
ArrayFormat select_format(const Array& elements);

/**
 * @brief Build the tabular layout of an array
 *
 * Headers are the shared keys in sorted order; each row lists one
 * object's values in header order.
 *
 * @return nullopt unless select_format(elements) is Tabular
 */
std::optional<Table> tabulate(const Array& elements);

} // namespace toon

#endif // TOON_FORMAT_HPP
