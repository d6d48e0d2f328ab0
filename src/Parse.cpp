/**
 * @file Parse.cpp
 * @brief Implementation of unquoted token typing
 */

#include "toon/Parse.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <string>

namespace toon {

namespace {

const std::regex& integer_pattern() {
    static const std::regex re("^-?[0-9]+$");
    return re;
}

const std::regex& float_pattern() {
    static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
    return re;
}

const std::regex& bigint_pattern() {
    static const std::regex re("^-?[0-9]+n$");
    return re;
}

std::int64_t to_integer(const std::string& token) {
    std::int64_t value = 0;
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        throw std::out_of_range("integer literal out of range: " + token);
    }
    return value;
}

double to_float(const std::string& token) {
    double value = 0.0;
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec == std::errc::result_out_of_range && ptr == end) {
        // from_chars flags underflow too; strtod rounds it to zero or a denormal
        value = std::strtod(token.c_str(), nullptr);
        if (!std::isinf(value)) return value;
    } else if (ec == std::errc() && ptr == end) {
        return value;
    }
    throw std::out_of_range("float literal out of range: " + token);
}

} // anonymous namespace

Value coerce_scalar(std::string_view token) {
    if (token == "true") return true;
    if (token == "false") return false;
    if (token == "null") return nullptr;

    // Every numeric form starts with '-' or a digit.
    const char first = token.empty() ? '\0' : token.front();
    if (first == '-' || (first >= '0' && first <= '9')) {
        const std::string text(token);

        if (std::regex_match(text, integer_pattern())) {
            return Number::integer(to_integer(text));
        }
        if (std::regex_match(text, float_pattern())) {
            return Number::floating(to_float(text));
        }
        if (std::regex_match(text, bigint_pattern())) {
            // Pattern guarantees the parse succeeds.
            return *BigInt::parse(text);
        }
    }

    if (token == "Infinity") return Number::infinity();
    if (token == "-Infinity") return Number::negative_infinity();
    if (token == "NaN") return Number::nan();

    return std::string(token);
}

} // namespace toon
