/**
 * @file Parser.cpp
 * @brief TOON text to Value
 *
 * Scope rules:
 * - An object's base indentation is the column of its first key.
 * - A line indented less than the base ends the object (dedent).
 * - A line indented more than the base, where a field is expected, is an
 *   IndentationError.
 * - A root object (base 0) also ends at a line without a key colon.
 * - List items and table rows must be indented deeper than the line that
 *   holds their array header.
 */

#include "toon/Parser.hpp"
#include "toon/Errors.hpp"
#include "toon/Parse.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace toon {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_blank(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_blank(s.back())) s.remove_suffix(1);
    return s;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string delimiter_display(Delimiter delim) {
    return delim == Delimiter::Tab ? std::string("\\t") : std::string(1, delimiter_char(delim));
}

} // anonymous namespace

Parser::Parser(std::string_view input)
    : input_(input)
{}

Value Parser::parse() {
    pos_ = 0;
    line_ = 1;
    column_ = 1;
    indent_stack_.clear();
    return parse_document();
}

// ============================================================================
// Cursor primitives
// ============================================================================

char Parser::peek(std::size_t ahead) const noexcept {
    std::size_t p = pos_ + ahead;
    return p < input_.size() ? input_[p] : '\0';
}

void Parser::advance() {
    if (at_end()) return;
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else if (at_end() || (static_cast<unsigned char>(input_[pos_]) & 0xC0) != 0x80) {
        // Columns count code points: continuation bytes share their lead's column.
        ++column_;
    }
}

bool Parser::at_eol() const noexcept {
    if (at_end()) return true;
    char c = peek();
    if (c == '\n') return true;
    return c == '\r' && (pos_ + 1 >= input_.size() || peek(1) == '\n');
}

void Parser::skip_spaces() {
    while (!at_end() && peek() == ' ') advance();
}

std::size_t Parser::skip_row_spaces(Delimiter delim) {
    std::size_t count = 0;
    while (!at_end() && (peek() == ' ' || (peek() == '\t' && delim != Delimiter::Tab))) {
        advance();
        ++count;
    }
    return count;
}

// ============================================================================
// Line lookahead
// ============================================================================

bool Parser::line_is_blank_from(std::size_t p) const noexcept {
    for (; p < input_.size() && input_[p] != '\n'; ++p) {
        if (!is_blank(input_[p])) return false;
    }
    return true;
}

std::optional<std::size_t> Parser::next_content_pos() const noexcept {
    std::size_t p = pos_;
    while (p < input_.size() && input_[p] != '\n') ++p;
    while (p < input_.size()) {
        ++p; // past '\n'
        std::size_t q = p;
        while (q < input_.size() && input_[q] == ' ') ++q;
        if (!line_is_blank_from(q)) return q;
        while (q < input_.size() && input_[q] != '\n') ++q;
        p = q;
    }
    return std::nullopt;
}

std::optional<std::size_t> Parser::next_content_indent() const noexcept {
    std::optional<std::size_t> q = next_content_pos();
    if (!q) return std::nullopt;
    std::size_t begin = *q;
    while (begin > 0 && input_[begin - 1] == ' ') --begin;
    return *q - begin;
}

void Parser::advance_to_next_content_line() {
    while (!at_end()) {
        while (!at_end() && peek() != '\n') advance();
        if (at_end()) return;
        advance(); // newline
        skip_spaces();
        if (!line_is_blank_from(pos_)) return;
    }
}

bool Parser::has_key_colon(std::size_t p) const noexcept {
    bool in_quotes = false;
    for (; p < input_.size() && input_[p] != '\n'; ++p) {
        char c = input_[p];
        if (in_quotes) {
            if (c == '\\' && p + 1 < input_.size() && input_[p + 1] != '\n') {
                ++p;
            } else if (c == '"') {
                in_quotes = false;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ':') {
            return true;
        }
    }
    return false;
}

bool Parser::at_array_header() const noexcept {
    std::size_t p = pos_;
    const std::size_t n = input_.size();
    if (p >= n || input_[p] != '[') return false;
    ++p;
    if (p < n && !is_digit(input_[p])) {
        char marker = input_[p];
        if (marker == ']' || is_blank(marker) || marker == '\n') return false;
        ++p;
    }
    std::size_t digits = p;
    while (p < n && is_digit(input_[p])) ++p;
    if (p == digits) return false;
    if (p < n && input_[p] == '|') {
        ++p;
    } else {
        while (p < n && input_[p] == ' ') ++p;
    }
    return p < n && input_[p] == ']';
}

// ============================================================================
// Document and values
// ============================================================================

Value Parser::parse_document() {
    skip_spaces();
    if (line_is_blank_from(pos_)) advance_to_next_content_line();
    if (at_end()) return Value::object();

    const std::size_t indent = column_ - 1;
    Value root = parse_block_value(indent);
    expect_end_of_line("value");

    if (next_content_pos()) {
        advance_to_next_content_line();
        std::string suggestion;
        if (peek() == '-' && (peek(1) == ' ' || peek(1) == '\n' || pos_ + 1 >= input_.size())) {
            suggestion = "the array header declares fewer items than are listed";
        } else if (!has_key_colon(pos_)) {
            suggestion = "did you mean `key: value`?";
        }
        fail(mark(), "Unexpected content after the end of the document", suggestion);
    }
    return root;
}

Value Parser::parse_block_value(std::size_t indent) {
    if (at_array_header()) return parse_array(indent);
    if (has_key_colon(pos_)) return parse_object(indent);
    if (peek() == '"') return Value(parse_quoted_string());
    return parse_scalar_to_eol();
}

Value Parser::parse_inline_value(std::size_t owner_indent) {
    if (at_array_header()) return parse_array(owner_indent);
    if (peek() == '"') return Value(parse_quoted_string());
    return parse_scalar_to_eol();
}

Value Parser::parse_list_item_value(std::size_t item_indent) {
    skip_spaces();
    if (at_eol()) return Value::object();
    if (at_array_header()) return parse_array(item_indent);
    // Fields of an object item align with the first key, two columns past the dash.
    if (has_key_colon(pos_)) return parse_object(column_ - 1);
    if (peek() == '"') return Value(parse_quoted_string());
    return parse_scalar_to_eol();
}

// ============================================================================
// Objects
// ============================================================================

Value Parser::parse_object(std::size_t base_indent) {
    indent_stack_.push_back(base_indent);
    Object obj;

    while (true) {
        std::string key = parse_key();
        if (at_eol() || peek() != ':') {
            fail(mark(), "Expected ':' after key '" + key + "'", "did you mean `key: value`?");
        }
        advance();
        skip_spaces();

        Value value;
        if (at_eol()) {
            std::optional<std::size_t> next = next_content_indent();
            if (next && *next > indent_stack_.back()) {
                advance_to_next_content_line();
                value = parse_block_value(*next);
            } else {
                value = Value::object();
            }
        } else {
            value = parse_inline_value(base_indent);
        }
        expect_end_of_line("value");
        obj.insert(std::move(key), std::move(value));

        std::optional<std::size_t> next_pos = next_content_pos();
        if (!next_pos) break;
        std::size_t next = *next_content_indent();
        if (next < base_indent) break;
        if (next > base_indent) {
            advance_to_next_content_line();
            Mark at = mark();
            throw IndentationError(at.line, at.column, base_indent, next, context_at(at));
        }
        if (base_indent == 0 && !has_key_colon(*next_pos)) break;
        advance_to_next_content_line();
    }

    indent_stack_.pop_back();
    return Value(std::move(obj));
}

std::string Parser::parse_key() {
    Mark start = mark();
    if (peek() == '"') {
        std::string key = parse_quoted_string();
        skip_spaces();
        return key;
    }

    std::size_t begin = pos_;
    while (!at_eol() && peek() != ':') advance();
    std::string_view key = trim(input_.substr(begin, pos_ - begin));
    if (key.empty()) {
        fail(start, "Expected a key", "did you mean `key: value`?");
    }
    return std::string(key);
}

// ============================================================================
// Arrays
// ============================================================================

Value Parser::parse_array(std::size_t owner_indent) {
    Mark header = mark();
    advance(); // '['
    if (!is_digit(peek())) advance(); // length marker

    std::size_t digits = pos_;
    while (!at_end() && is_digit(peek())) advance();
    std::size_t length = 0;
    auto [ptr, ec] = std::from_chars(input_.data() + digits, input_.data() + pos_, length);
    if (ec != std::errc() || ptr != input_.data() + pos_) {
        fail(header, "Invalid array length", "array lengths are non-negative decimal integers");
    }

    Delimiter delim = Delimiter::Comma;
    if (peek() == '|') {
        advance();
        delim = Delimiter::Pipe;
    } else if (peek() == ' ') {
        Mark spaces = mark();
        std::size_t count = 0;
        while (peek() == ' ') {
            advance();
            ++count;
        }
        if (count < 4) {
            fail(spaces, "Expected ']' to close array header",
                 "tab-delimited headers use four spaces before ']'");
        }
        delim = Delimiter::Tab;
    }
    if (peek() != ']') {
        fail(mark(), "Expected ']' to close array header");
    }
    advance();

    std::optional<std::vector<std::string>> headers;
    if (peek() == '{') headers = parse_header_fields(delim);

    if (at_eol() || peek() != ':') {
        if (length == 0 && !headers) return Value::array();
        fail(mark(), "Expected ':' after array header",
             "array headers end with ':' as in `[3]: a,b,c`");
    }
    advance();

    if (headers) {
        expect_end_of_line("tabular array header");
        return parse_table_rows(std::move(*headers), length, delim, owner_indent);
    }

    skip_spaces();
    if (at_eol()) {
        if (length == 0) return Value::array();
        return parse_list_items(length, owner_indent);
    }
    return parse_inline_values(length, delim, header);
}

std::vector<std::string> Parser::parse_header_fields(Delimiter delim) {
    Mark open = mark();
    advance(); // '{'
    const char d = delimiter_char(delim);
    std::vector<std::string> fields;

    skip_spaces();
    if (peek() == '}') {
        advance();
        return fields;
    }

    while (true) {
        skip_spaces();
        if (at_eol()) fail(open, "Unterminated field list", "close the field list with '}'");

        Mark field_mark = mark();
        if (peek() == '"') {
            fields.push_back(parse_quoted_string());
        } else {
            std::size_t begin = pos_;
            while (!at_eol() && peek() != '}' && peek() != d && peek() != ' ' && peek() != '\t') {
                advance();
            }
            if (pos_ == begin) fail(field_mark, "Expected a field name");
            fields.emplace_back(input_.substr(begin, pos_ - begin));
        }

        std::size_t gap = 0;
        while (peek() == ' ') {
            advance();
            ++gap;
        }
        if (at_eol()) fail(open, "Unterminated field list", "close the field list with '}'");
        if (peek() == '}') {
            advance();
            break;
        }
        if (peek() == d) {
            advance();
            continue;
        }
        if (delim == Delimiter::Tab && gap > 0) continue;
        fail(mark(), "Expected '" + delimiter_display(delim) + "' between field names");
    }
    return fields;
}

Value Parser::parse_inline_values(std::size_t length, Delimiter delim, const Mark& header) {
    const char d = delimiter_char(delim);
    Array values;

    while (true) {
        values.push_back(parse_primitive(delim));
        skip_row_spaces(delim);
        if (!at_eol() && peek() == d) {
            advance();
            continue;
        }
        break;
    }
    if (!at_eol()) {
        fail(mark(), "Unexpected character in inline array",
             "quote values that contain the delimiter '" + delimiter_display(delim) + "'");
    }
    if (values.size() != length) {
        throw InvalidFormat(header.line, header.column,
                            "array declares " + std::to_string(length) + " values but " +
                            std::to_string(values.size()) + " were found");
    }
    return Value(std::move(values));
}

Value Parser::parse_list_items(std::size_t length, std::size_t owner_indent) {
    Array items;

    for (std::size_t i = 0; i < length; ++i) {
        std::optional<std::size_t> next = next_content_indent();
        if (!next) {
            throw UnexpectedEof(line_, column_,
                                "list item " + std::to_string(i + 1) + " of " + std::to_string(length),
                                context_at(mark()));
        }
        if (*next <= owner_indent) {
            throw InvalidFormat(line_, column_,
                                "list declares " + std::to_string(length) + " items but " +
                                std::to_string(i) + " were found");
        }
        advance_to_next_content_line();

        Mark item = mark();
        const std::size_t item_indent = column_ - 1;
        if (peek() != '-') {
            fail(item, "Expected '- ' to start list item " + std::to_string(i + 1),
                 "list items start with `- `");
        }
        advance();
        if (!at_eol()) {
            if (peek() != ' ') fail(item, "Expected a space after '-'", "list items start with `- `");
            advance();
        }
        items.push_back(parse_list_item_value(item_indent));
        expect_end_of_line("list item");
    }
    return Value(std::move(items));
}

Value Parser::parse_table_rows(std::vector<std::string> headers, std::size_t length,
                               Delimiter delim, std::size_t owner_indent) {
    const char d = delimiter_char(delim);
    Table table;
    table.headers = std::move(headers);
    const std::size_t width = table.headers.size();

    for (std::size_t i = 0; i < length; ++i) {
        std::optional<std::size_t> next = next_content_indent();
        if (!next) {
            throw UnexpectedEof(line_, column_,
                                "row " + std::to_string(i + 1) + " of " + std::to_string(length),
                                context_at(mark()));
        }
        if (*next <= owner_indent) {
            throw InvalidFormat(line_, column_,
                                "table declares " + std::to_string(length) + " rows but " +
                                std::to_string(i) + " were found");
        }
        advance_to_next_content_line();

        std::vector<Value> row;
        row.reserve(width);
        for (std::size_t j = 0; j < width; ++j) {
            if (j > 0) {
                skip_row_spaces(delim);
                if (at_eol() || peek() != d) {
                    throw InvalidFormat(line_, column_,
                                        "row " + std::to_string(i + 1) + " has " + std::to_string(j) +
                                        " values but " + std::to_string(width) +
                                        " fields are declared");
                }
                advance();
            }
            row.push_back(parse_primitive(delim));
        }

        skip_row_spaces(delim);
        if (!at_eol()) {
            if (peek() == d) {
                throw InvalidFormat(line_, column_,
                                    "row " + std::to_string(i + 1) + " has more values than the " +
                                    std::to_string(width) + " declared fields");
            }
            fail(mark(), "Unexpected character in row",
                 "quote values that contain the delimiter '" + delimiter_display(delim) + "'");
        }
        table.rows.push_back(std::move(row));
    }
    return Value(std::move(table));
}

// ============================================================================
// Scalars
// ============================================================================

Value Parser::parse_primitive(Delimiter delim) {
    skip_row_spaces(delim);
    if (!at_end() && peek() == '"') return Value(parse_quoted_string());

    Mark start = mark();
    const char d = delimiter_char(delim);
    std::size_t begin = pos_;
    while (!at_eol() && peek() != d) advance();

    std::string_view token = trim(input_.substr(begin, pos_ - begin));
    if (token.empty()) {
        fail(start, "Expected a value", "write empty strings as \"\"");
    }
    return coerce_token(token, start);
}

Value Parser::parse_scalar_to_eol() {
    Mark start = mark();
    std::size_t begin = pos_;
    while (!at_eol()) advance();

    std::string_view token = trim(input_.substr(begin, pos_ - begin));
    if (token.empty()) {
        fail(start, "Expected a value", "write empty strings as \"\"");
    }
    return coerce_token(token, start);
}

Value Parser::coerce_token(std::string_view token, const Mark& at) const {
    try {
        return coerce_scalar(token);
    } catch (const std::out_of_range& ex) {
        const bool is_float = token.find('.') != std::string_view::npos;
        fail(at, ex.what(),
             is_float ? "quote the literal to keep it as text"
                      : "write integers beyond 64 bits as BigInt literals such as `123n`");
    }
}

std::string Parser::parse_quoted_string() {
    Mark open = mark();
    advance(); // opening quote
    std::string out;

    while (true) {
        if (at_end() || peek() == '\n') {
            fail(open, "Unterminated string", "add a closing `\"`");
        }
        char c = peek();
        if (c == '"') {
            advance();
            break;
        }
        if (c != '\\') {
            out += c;
            advance();
            continue;
        }

        Mark escape = mark();
        advance(); // backslash
        if (at_end()) fail(open, "Unterminated string", "add a closing `\"`");
        char e = peek();
        switch (e) {
            case '"': out += '"'; advance(); break;
            case '\\': out += '\\'; advance(); break;
            case 'n': out += '\n'; advance(); break;
            case 'r': out += '\r'; advance(); break;
            case 't': out += '\t'; advance(); break;
            case 'b': out += '\b'; advance(); break;
            case 'f': out += '\f'; advance(); break;
            case '0': out += '\0'; advance(); break;
            case 'u': {
                advance();
                std::optional<std::uint32_t> cp = read_hex4();
                if (!cp) {
                    fail(escape, "Invalid unicode escape", "use \\uXXXX with exactly four hex digits");
                }
                if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                    std::optional<std::uint32_t> low;
                    if (peek() == '\\' && peek(1) == 'u') {
                        advance();
                        advance();
                        low = read_hex4();
                    }
                    if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                        fail(escape, "Invalid unicode code point",
                             "a high surrogate must be followed by a \\uDC00-\\uDFFF escape");
                    }
                    cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                } else if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
                    fail(escape, "Invalid unicode code point", "unpaired low surrogate");
                }
                append_utf8(out, *cp);
                break;
            }
            default:
                // Unknown escapes are kept verbatim.
                out += '\\';
                out += e;
                advance();
                break;
        }
    }
    return out;
}

std::optional<std::uint32_t> Parser::read_hex4() {
    std::uint32_t cp = 0;
    for (int i = 0; i < 4; ++i) {
        int v = at_end() ? -1 : hex_value(peek());
        if (v < 0) return std::nullopt;
        cp = (cp << 4) | static_cast<std::uint32_t>(v);
        advance();
    }
    return cp;
}

void Parser::expect_end_of_line(const char* what) {
    skip_spaces();
    if (!at_eol()) {
        fail(mark(), std::string("Unexpected content after ") + what,
             "quote strings that contain ':' or the delimiter");
    }
}

// ============================================================================
// Errors
// ============================================================================

std::string Parser::context_at(const Mark& at) const {
    std::size_t begin = std::min(at.pos, input_.size());
    while (begin > 0 && input_[begin - 1] != '\n') --begin;
    std::size_t end = input_.find('\n', begin);
    if (end == std::string_view::npos) end = input_.size();
    std::string_view text = input_.substr(begin, end - begin);
    if (!text.empty() && text.back() == '\r') text.remove_suffix(1);

    std::string out = "  ";
    out += text;
    out += "\n  ";
    out += std::string(at.column > 0 ? at.column - 1 : 0, ' ');
    out += '^';
    return out;
}

void Parser::fail(const Mark& at, const std::string& message, const std::string& suggestion) const {
    throw SyntaxError(at.line, at.column, message, context_at(at), suggestion);
}

Value parse(std::string_view text) {
    return Parser(text).parse().normalized();
}

} // namespace toon
