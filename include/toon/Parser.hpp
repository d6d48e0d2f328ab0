/**
 * @file Parser.hpp
 * @brief TOON text to Value
 *
 * Single-pass recursive-descent reader with bounded lookahead. The
 * delimiter of every array is read from its header, so parsing needs no
 * Options.
 *
 * Parsing aborts on the first error; there is no partial result.
 */

#ifndef TOON_PARSER_HPP
#define TOON_PARSER_HPP

#include "toon/Options.hpp"
#include "toon/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toon {

/**
 * @brief Cursor over one TOON document
 *
 * The input must outlive the parser.
 *
 * Example:
 * ```cpp
 * toon::Parser parser("[2]{id,name}:\n  1,Alice\n  2,Bob");
 * toon::Value raw = parser.parse();   // Table with two rows
 * ```
 */
class Parser {
public:
    explicit Parser(std::string_view input);

    /**
     * @brief Parse the whole document
     *
     * Tabular arrays are returned as Table values; use toon::parse() for
     * the normalized tree.
     *
     * @return Raw value tree
     * @throws SyntaxError for malformed text
     * @throws IndentationError for unexpected indentation
     * @throws InvalidFormat when counts disagree with array headers
     * @throws UnexpectedEof when input ends inside an array
     */
    Value parse();

private:
    struct Mark {
        std::size_t pos;
        std::size_t line;
        std::size_t column;
    };

    // Cursor primitives
    bool at_end() const noexcept { return pos_ >= input_.size(); }
    char peek(std::size_t ahead = 0) const noexcept;
    void advance();
    bool at_eol() const noexcept;
    void skip_spaces();
    std::size_t skip_row_spaces(Delimiter delim);
    Mark mark() const noexcept { return {pos_, line_, column_}; }

    // Line lookahead
    bool line_is_blank_from(std::size_t p) const noexcept;
    std::optional<std::size_t> next_content_pos() const noexcept;
    std::optional<std::size_t> next_content_indent() const noexcept;
    void advance_to_next_content_line();
    bool has_key_colon(std::size_t p) const noexcept;
    bool at_array_header() const noexcept;

    // Grammar
    Value parse_document();
    Value parse_block_value(std::size_t indent);
    Value parse_inline_value(std::size_t owner_indent);
    Value parse_list_item_value(std::size_t item_indent);
    Value parse_object(std::size_t base_indent);
    std::string parse_key();
    Value parse_array(std::size_t owner_indent);
    std::vector<std::string> parse_header_fields(Delimiter delim);
    Value parse_inline_values(std::size_t length, Delimiter delim, const Mark& header);
    Value parse_list_items(std::size_t length, std::size_t owner_indent);
    Value parse_table_rows(std::vector<std::string> headers, std::size_t length,
                           Delimiter delim, std::size_t owner_indent);
    Value parse_primitive(Delimiter delim);
    Value parse_scalar_to_eol();
    std::string parse_quoted_string();
    std::optional<std::uint32_t> read_hex4();
    Value coerce_token(std::string_view token, const Mark& at) const;
    void expect_end_of_line(const char* what);

    // Errors
    std::string context_at(const Mark& at) const;
    [[noreturn]] void fail(const Mark& at, const std::string& message,
                           const std::string& suggestion = {}) const;

    std::string_view input_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
    std::vector<std::size_t> indent_stack_;
};

/**
 * @brief Parse TOON text into a normalized value tree
 *
 * Tabular arrays come back as arrays of objects. Empty or blank input
 * yields an empty object.
 *
 * @param text TOON document
 * @return Parsed value
 * @throws SyntaxError, IndentationError, InvalidFormat, UnexpectedEof
 *
 * Example:
 * ```cpp
 * toon::Value v = toon::parse("x: 1\ny: 2");
 * v.at("y").as_i64();   // 2
 * ```
 */
Value parse(std::string_view text);

} // namespace toon

#endif // TOON_PARSER_HPP
