/**
 * @file Quoting.cpp
 * @brief Quoting and escaping rules
 */

#include "toon/Quoting.hpp"

#include <charconv>
#include <cstdint>

namespace toon {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool looks_structural(std::string_view s) {
    if (s.front() == '[') return s.find(']') != std::string_view::npos;
    if (s.front() == '{') return s.find('}') != std::string_view::npos;
    return false;
}

} // anonymous namespace

bool looks_numeric(std::string_view s) {
    if (s.empty()) return false;
    const char* first = s.data();
    const char* last = s.data() + s.size();

    std::int64_t i = 0;
    auto int_result = std::from_chars(first, last, i);
    if (int_result.ptr == last &&
        (int_result.ec == std::errc() || int_result.ec == std::errc::result_out_of_range)) {
        return true;
    }

    double d = 0.0;
    auto float_result = std::from_chars(first, last, d);
    return float_result.ptr == last &&
           (float_result.ec == std::errc() || float_result.ec == std::errc::result_out_of_range);
}

bool looks_like_bigint(std::string_view s) {
    if (s.size() < 2 || s.back() != 'n') return false;
    s.remove_suffix(1);
    if (s.front() == '-') s.remove_prefix(1);
    if (s.empty()) return false;
    for (char c : s) {
        if (!is_digit(c)) return false;
    }
    return true;
}

bool needs_quotes(std::string_view s, Delimiter active) {
    if (s.empty()) return true;
    if (s.front() == ' ' || s.back() == ' ') return true;

    const char delim = delimiter_char(active);
    for (char c : s) {
        switch (c) {
            case ':': case '"': case '\\':
            case '\n': case '\r': case '\t': case '\0':
                return true;
            default:
                if (c == delim) return true;
        }
    }

    if (s == "true" || s == "false" || s == "null") return true;
    if (looks_numeric(s) || looks_like_bigint(s)) return true;
    if (s.size() >= 2 && s[0] == '-' && s[1] == ' ') return true;
    return looks_structural(s);
}

std::string escape_string(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\0': out += "\\0"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string quote(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    out += escape_string(s);
    out += '"';
    return out;
}

std::string quote_if_needed(std::string_view s, Delimiter active) {
    return needs_quotes(s, active) ? quote(s) : std::string(s);
}

bool is_bare_key(std::string_view key) {
    if (key.empty()) return false;
    if (!is_alpha(key.front()) && key.front() != '_') return false;
    for (char c : key.substr(1)) {
        if (!is_alpha(c) && !is_digit(c) && c != '_' && c != '.') return false;
    }
    return true;
}

std::string format_key(std::string_view key) {
    return is_bare_key(key) ? std::string(key) : quote(key);
}

} // namespace toon
