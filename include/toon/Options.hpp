/**
 * @file Options.hpp
 * @brief Serialization options
 *
 * Options is a plain configuration record passed by const reference
 * through a serialization pass. Builder methods return updated copies.
 *
 * The parser does not take Options: the delimiter of every array is read
 * from its header.
 */

#ifndef TOON_OPTIONS_HPP
#define TOON_OPTIONS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace toon {

/**
 * @brief Field separator used in inline arrays and tabular rows
 */
enum class Delimiter { Comma, Tab, Pipe };

/// The delimiter character: ',', '\t' or '|'.
char delimiter_char(Delimiter delimiter) noexcept;

/**
 * @brief Marker written inside an array header after the length
 *
 * Empty for comma, four spaces for tab, "|" for pipe.
 */
std::string_view delimiter_header_suffix(Delimiter delimiter) noexcept;

/**
 * @brief Separator between field names in a tabular header
 *
 * "," for comma, four spaces for tab, "|" for pipe.
 */
std::string_view delimiter_header_separator(Delimiter delimiter) noexcept;

/// "comma", "tab" or "pipe".
std::string delimiter_name(Delimiter delimiter);

/**
 * @brief Parse a delimiter name
 *
 * Accepts "comma", "tab", "pipe" (case-insensitive) and the literal
 * characters ",", "|" and "\t".
 */
std::optional<Delimiter> delimiter_from_name(std::string_view name);

/**
 * @brief Writer configuration
 *
 * Example:
 * ```cpp
 * auto opts = toon::Options{}
 *     .with_delimiter(toon::Delimiter::Pipe)
 *     .with_length_marker('#');
 * ```
 */
struct Options {
    /// Spaces per nesting level
    std::size_t indent_width = 2;

    /// Separator for inline arrays and tabular rows
    Delimiter delimiter = Delimiter::Comma;

    /// Optional character written before every array length ("[#3]")
    std::optional<char> length_marker;

    /// Put a space after comma/pipe delimiters in inline arrays and rows
    bool pretty = false;

    /// Write Infinity, -Infinity and NaN instead of null
    bool preserve_special_floats = false;

    static Options compact() { return Options{}; }
    static Options pretty_print();

    /**
     * @throws std::invalid_argument if width is zero
     */
    Options with_indent(std::size_t width) const;

    Options with_delimiter(Delimiter d) const;

    /**
     * @throws std::invalid_argument for digits, whitespace, ']' and '-'
     */
    Options with_length_marker(char marker) const;

    Options without_length_marker() const;
    Options with_pretty(bool enabled) const;
    Options with_special_floats(bool enabled) const;

    /**
     * @brief Check field combinations a hand-built Options may violate
     * @throws std::invalid_argument with the offending field
     */
    void validate() const;
};

} // namespace toon

#endif // TOON_OPTIONS_HPP
