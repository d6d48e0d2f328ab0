/**
 * @file Writer.cpp
 * @brief Value to TOON text
 */

#include "toon/Writer.hpp"
#include "toon/Format.hpp"
#include "toon/Quoting.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>

namespace toon {

namespace {

std::string format_float(double v) {
    if (v == 0.0) return "0";

    char buf[512];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
    std::string text = ec == std::errc() ? std::string(buf, ptr) : std::to_string(v);

    // Whole values beyond int64 would read back as an out-of-range integer.
    constexpr double kLimit = 9223372036854775808.0;
    if (text.find('.') == std::string::npos && std::fabs(v) >= kLimit) {
        text += ".0";
    }
    return text;
}

bool rows_are_primitive(const Table& table) {
    return std::all_of(table.rows.begin(), table.rows.end(), [](const std::vector<Value>& row) {
        return std::all_of(row.begin(), row.end(), [](const Value& v) { return v.is_primitive(); });
    });
}

} // anonymous namespace

std::string format_number(const Number& number, bool preserve_special) {
    switch (number.kind()) {
        case Number::Kind::Integer:
            return std::to_string(number.integer_value());
        case Number::Kind::Float:
            return format_float(number.float_value());
        case Number::Kind::Infinity:
            return preserve_special ? "Infinity" : "null";
        case Number::Kind::NegativeInfinity:
            return preserve_special ? "-Infinity" : "null";
        case Number::Kind::NaN:
            return preserve_special ? "NaN" : "null";
    }
    return "null";
}

Writer::Writer(Options options)
    : options_(std::move(options))
{
    options_.validate();
}

std::string Writer::write(const Value& value) {
    out_.clear();
    out_.reserve(256);

    switch (value.type()) {
        case Value::Type::Object:
            write_fields(*value.as_object(), 0);
            break;
        case Value::Type::Array:
            write_array(*value.as_array(), 0);
            break;
        case Value::Type::Table:
            write_table(*value.as_table(), 0);
            break;
        default:
            write_scalar(value);
            break;
    }
    return std::move(out_);
}

// ============================================================================
// Objects
// ============================================================================

void Writer::write_fields(const Object& obj, std::size_t indent) {
    bool first = true;
    for (const auto& [key, value] : obj) {
        if (!first) out_ += '\n';
        first = false;
        out_.append(indent, ' ');
        write_field(key, value, indent);
    }
}

void Writer::write_field(const std::string& key, const Value& value, std::size_t indent) {
    out_ += format_key(key);
    out_ += ':';

    switch (value.type()) {
        case Value::Type::Object: {
            const Object& nested = *value.as_object();
            if (!nested.empty()) {
                out_ += '\n';
                write_fields(nested, indent + options_.indent_width);
            }
            break;
        }
        case Value::Type::Array:
            out_ += ' ';
            write_array(*value.as_array(), indent);
            break;
        case Value::Type::Table:
            out_ += ' ';
            write_table(*value.as_table(), indent);
            break;
        default:
            out_ += ' ';
            write_scalar(value);
            break;
    }
}

// ============================================================================
// Arrays
// ============================================================================

void Writer::write_array(const Array& arr, std::size_t indent) {
    if (arr.empty()) {
        write_length(0);
        out_ += "]:";
        return;
    }

    switch (select_format(arr)) {
        case ArrayFormat::Tabular:
            write_table(*tabulate(arr), indent);
            break;
        case ArrayFormat::Inline: {
            write_length(arr.size());
            out_ += delimiter_header_suffix(options_.delimiter);
            out_ += "]: ";
            const std::string sep = row_separator();
            for (std::size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) out_ += sep;
                write_scalar(arr[i]);
            }
            break;
        }
        case ArrayFormat::List:
            write_list(arr, indent);
            break;
    }
}

void Writer::write_table(const Table& table, std::size_t indent) {
    if (table.headers.empty() || !rows_are_primitive(table)) {
        write_array(table.to_objects(), indent);
        return;
    }

    write_length(table.rows.size());
    out_ += delimiter_header_suffix(options_.delimiter);
    out_ += "]{";
    const std::string_view header_sep = delimiter_header_separator(options_.delimiter);
    for (std::size_t i = 0; i < table.headers.size(); ++i) {
        if (i > 0) out_ += header_sep;
        out_ += format_key(table.headers[i]);
    }
    out_ += "}:";

    const std::string sep = row_separator();
    for (const auto& row : table.rows) {
        newline(indent + options_.indent_width);
        for (std::size_t j = 0; j < row.size(); ++j) {
            if (j > 0) out_ += sep;
            write_scalar(row[j]);
        }
    }
}

void Writer::write_list(const Array& arr, std::size_t indent) {
    write_length(arr.size());
    out_ += "]:";

    const std::size_t item_indent = indent + options_.indent_width;
    for (const auto& item : arr) {
        newline(item_indent);
        out_ += '-';
        write_list_item(item, item_indent);
    }
}

void Writer::write_list_item(const Value& item, std::size_t item_indent) {
    switch (item.type()) {
        case Value::Type::Object: {
            const Object& obj = *item.as_object();
            // An empty object entry is a lone dash.
            if (obj.empty()) return;
            const std::size_t field_indent = item_indent + 2;
            out_ += ' ';
            bool first = true;
            for (const auto& [key, value] : obj) {
                if (!first) newline(field_indent);
                first = false;
                write_field(key, value, field_indent);
            }
            break;
        }
        case Value::Type::Array:
            out_ += ' ';
            write_array(*item.as_array(), item_indent);
            break;
        case Value::Type::Table:
            out_ += ' ';
            write_table(*item.as_table(), item_indent);
            break;
        default:
            out_ += ' ';
            write_scalar(item);
            break;
    }
}

// ============================================================================
// Scalars
// ============================================================================

void Writer::write_scalar(const Value& value) {
    switch (value.type()) {
        case Value::Type::Null:
            out_ += "null";
            break;
        case Value::Type::Bool:
            out_ += *value.as_bool() ? "true" : "false";
            break;
        case Value::Type::Number:
            out_ += format_number(*value.as_number(), options_.preserve_special_floats);
            break;
        case Value::Type::String:
            out_ += quote_if_needed(*value.as_str(), options_.delimiter);
            break;
        case Value::Type::Date:
            out_ += quote_if_needed(value.as_date()->to_iso8601(), options_.delimiter);
            break;
        case Value::Type::BigInt:
            out_ += value.as_bigint()->to_literal();
            break;
        default:
            // Containers never reach here: callers dispatch them first.
            break;
    }
}

void Writer::write_length(std::size_t length) {
    out_ += '[';
    if (options_.length_marker) out_ += *options_.length_marker;
    out_ += std::to_string(length);
}

void Writer::newline(std::size_t indent) {
    out_ += '\n';
    out_.append(indent, ' ');
}

std::string Writer::row_separator() const {
    std::string sep(1, delimiter_char(options_.delimiter));
    if (options_.pretty && options_.delimiter != Delimiter::Tab) sep += ' ';
    return sep;
}

std::string serialize(const Value& value, const Options& options) {
    return Writer(options).write(value);
}

std::ostream& operator<<(std::ostream& os, const Value& val) {
    return os << serialize(val);
}

} // namespace toon
