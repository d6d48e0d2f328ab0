/**
 * @file Writer.hpp
 * @brief Value to TOON text
 *
 * Layout:
 * - Object fields: `key: value`, nested objects on following lines one
 *   level deeper.
 * - Arrays: tabular, inline or list form as chosen by select_format().
 * - List entries: `- value`; an object entry starts its first field after
 *   the dash and aligns the rest two columns past it.
 */

#ifndef TOON_WRITER_HPP
#define TOON_WRITER_HPP

#include "toon/Options.hpp"
#include "toon/Value.hpp"

#include <cstddef>
#include <string>

namespace toon {

/**
 * @brief Format a number as TOON text
 *
 * Finite values use plain decimal notation, never an exponent. Whole
 * floats inside the int64 range print without a fraction, larger ones
 * with ".0" so they read back as floats. Negative zero prints "0".
 *
 * @param preserve_special Write Infinity / -Infinity / NaN instead of null
 */
std::string format_number(const Number& number, bool preserve_special = false);

/**
 * @brief Recursive emitter for one serialization pass
 */
class Writer {
public:
    /**
     * @throws std::invalid_argument if options are invalid
     */
    explicit Writer(Options options);

    /**
     * @brief Serialize a value tree
     * @return TOON text without a trailing newline
     */
    std::string write(const Value& value);

private:
    void write_fields(const Object& obj, std::size_t indent);
    void write_field(const std::string& key, const Value& value, std::size_t indent);
    void write_array(const Array& arr, std::size_t indent);
    void write_table(const Table& table, std::size_t indent);
    void write_list(const Array& arr, std::size_t indent);
    void write_list_item(const Value& item, std::size_t item_indent);
    void write_scalar(const Value& value);
    void write_length(std::size_t length);
    void newline(std::size_t indent);
    std::string row_separator() const;

    Options options_;
    std::string out_;
};

/**
 * @brief Serialize a value tree to TOON text
 *
 * @param value Tree to write
 * @param options Layout options
 * @return TOON text
 * @throws std::invalid_argument if options are invalid
 *
 * Example:
 * ```cpp
 * toon::serialize(toon::Array{1, 2, 3});   // "[3]: 1,2,3"
 * ```
 */
std::string serialize(const Value& value, const Options& options = Options{});

} // namespace toon

#endif // TOON_WRITER_HPP
