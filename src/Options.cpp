/**
 * @file Options.cpp
 * @brief Serialization options
 */

#include "toon/Options.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace toon {

namespace {

bool is_valid_marker(char c) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isdigit(uc) || std::isspace(uc) || !std::isprint(uc)) return false;
    return c != ']' && c != '-';
}

} // anonymous namespace

char delimiter_char(Delimiter delimiter) noexcept {
    switch (delimiter) {
        case Delimiter::Tab: return '\t';
        case Delimiter::Pipe: return '|';
        case Delimiter::Comma: break;
    }
    return ',';
}

std::string_view delimiter_header_suffix(Delimiter delimiter) noexcept {
    switch (delimiter) {
        case Delimiter::Tab: return "    ";
        case Delimiter::Pipe: return "|";
        case Delimiter::Comma: break;
    }
    return "";
}

std::string_view delimiter_header_separator(Delimiter delimiter) noexcept {
    switch (delimiter) {
        case Delimiter::Tab: return "    ";
        case Delimiter::Pipe: return "|";
        case Delimiter::Comma: break;
    }
    return ",";
}

std::string delimiter_name(Delimiter delimiter) {
    switch (delimiter) {
        case Delimiter::Tab: return "tab";
        case Delimiter::Pipe: return "pipe";
        case Delimiter::Comma: break;
    }
    return "comma";
}

std::optional<Delimiter> delimiter_from_name(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "comma" || lower == ",") return Delimiter::Comma;
    if (lower == "tab" || lower == "\t") return Delimiter::Tab;
    if (lower == "pipe" || lower == "|") return Delimiter::Pipe;
    return std::nullopt;
}

Options Options::pretty_print() {
    Options opts;
    opts.pretty = true;
    return opts;
}

Options Options::with_indent(std::size_t width) const {
    if (width == 0) {
        throw std::invalid_argument("indent_width must be at least 1");
    }
    Options copy = *this;
    copy.indent_width = width;
    return copy;
}

Options Options::with_delimiter(Delimiter d) const {
    Options copy = *this;
    copy.delimiter = d;
    return copy;
}

Options Options::with_length_marker(char marker) const {
    if (!is_valid_marker(marker)) {
        throw std::invalid_argument(std::string("invalid length marker: '") + marker + "'");
    }
    Options copy = *this;
    copy.length_marker = marker;
    return copy;
}

Options Options::without_length_marker() const {
    Options copy = *this;
    copy.length_marker.reset();
    return copy;
}

Options Options::with_pretty(bool enabled) const {
    Options copy = *this;
    copy.pretty = enabled;
    return copy;
}

Options Options::with_special_floats(bool enabled) const {
    Options copy = *this;
    copy.preserve_special_floats = enabled;
    return copy;
}

void Options::validate() const {
    if (indent_width == 0) {
        throw std::invalid_argument("indent_width must be at least 1");
    }
    if (length_marker && !is_valid_marker(*length_marker)) {
        throw std::invalid_argument(std::string("invalid length marker: '") +
                                    *length_marker + "'");
    }
}

} // namespace toon
