/**
 * @file Value.cpp
 * @brief Value model implementation
 */

#include "toon/Value.hpp"

#include <charconv>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace toon {

namespace {

constexpr std::int64_t kMillisPerDay = 86400000;

// Howard Hinnant's days_from_civil / civil_from_days (proleptic Gregorian).
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct Civil {
    std::int64_t year;
    unsigned month;
    unsigned day;
};

Civil civil_from_days(std::int64_t z) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return {y + (m <= 2 ? 1 : 0), m, d};
}

bool is_leap(std::int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

/**
 * @brief Combine a day number and a millisecond offset into Unix millis
 *
 * @return nullopt if the instant does not fit in 64 bits
 */
std::optional<std::int64_t> checked_unix_millis(std::int64_t days, std::int64_t offset_ms) {
    days += floor_div(offset_ms, kMillisPerDay);
    std::int64_t tod = offset_ms % kMillisPerDay;
    if (tod < 0) tod += kMillisPerDay;

    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
    if (days >= 0) {
        if (days > (kMax - tod) / kMillisPerDay) return std::nullopt;
        return days * kMillisPerDay + tod;
    }
    // days * D + tod, formed as (days + 1) * D - (D - tod)
    if (days + 1 < kMin / kMillisPerDay) return std::nullopt;
    const std::int64_t base = (days + 1) * kMillisPerDay;
    const std::int64_t back = kMillisPerDay - tod;
    if (base < kMin + back) return std::nullopt;
    return base - back;
}

/**
 * @brief Read exactly `count` decimal digits at `pos`
 */
bool read_digits(std::string_view text, std::size_t& pos, std::size_t count, unsigned& out) {
    if (pos + count > text.size()) return false;
    unsigned value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect_char(std::string_view text, std::size_t& pos, char c) {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// Number
// ============================================================================

Number Number::integer(std::int64_t value) noexcept {
    Number n;
    n.kind_ = Kind::Integer;
    n.integer_ = value;
    return n;
}

Number Number::floating(double value) noexcept {
    if (std::isnan(value)) return nan();
    if (std::isinf(value)) return value > 0 ? infinity() : negative_infinity();
    Number n;
    n.kind_ = Kind::Float;
    n.float_ = value;
    return n;
}

Number Number::infinity() noexcept {
    Number n;
    n.kind_ = Kind::Infinity;
    return n;
}

Number Number::negative_infinity() noexcept {
    Number n;
    n.kind_ = Kind::NegativeInfinity;
    return n;
}

Number Number::nan() noexcept {
    Number n;
    n.kind_ = Kind::NaN;
    return n;
}

std::optional<std::int64_t> Number::as_i64() const noexcept {
    switch (kind_) {
        case Kind::Integer:
            return integer_;
        case Kind::Float: {
            // 2^63 is exactly representable; the int64 range is [-2^63, 2^63).
            constexpr double kLimit = 9223372036854775808.0;
            if (std::trunc(float_) != float_) return std::nullopt;
            if (float_ < -kLimit || float_ >= kLimit) return std::nullopt;
            return static_cast<std::int64_t>(float_);
        }
        default:
            return std::nullopt;
    }
}

double Number::as_f64() const noexcept {
    switch (kind_) {
        case Kind::Integer: return static_cast<double>(integer_);
        case Kind::Float: return float_;
        case Kind::Infinity: return std::numeric_limits<double>::infinity();
        case Kind::NegativeInfinity: return -std::numeric_limits<double>::infinity();
        case Kind::NaN: return std::numeric_limits<double>::quiet_NaN();
    }
    return 0.0;
}

bool operator==(const Number& lhs, const Number& rhs) noexcept {
    if (lhs.is_integer() && rhs.is_integer()) {
        return lhs.integer_ == rhs.integer_;
    }
    if (!lhs.is_special() && !rhs.is_special()) {
        return lhs.as_f64() == rhs.as_f64();
    }
    return lhs.kind_ == rhs.kind_;
}

// ============================================================================
// BigInt
// ============================================================================

BigInt::BigInt(std::int64_t value) {
    if (value < 0) {
        negative_ = true;
        // Negate through unsigned to cover INT64_MIN.
        magnitude_ = std::to_string(0 - static_cast<std::uint64_t>(value));
    } else {
        magnitude_ = std::to_string(value);
    }
}

BigInt BigInt::from_unsigned(std::uint64_t value) {
    BigInt b;
    b.magnitude_ = std::to_string(value);
    return b;
}

std::optional<BigInt> BigInt::parse(std::string_view text) {
    if (!text.empty() && text.back() == 'n') {
        text.remove_suffix(1);
    }
    bool negative = false;
    if (!text.empty() && text.front() == '-') {
        negative = true;
        text.remove_prefix(1);
    }
    if (text.empty()) return std::nullopt;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
    }

    std::size_t first = text.find_first_not_of('0');
    BigInt b;
    if (first == std::string_view::npos) {
        return b; // zero, never negative
    }
    b.magnitude_ = std::string(text.substr(first));
    b.negative_ = negative;
    return b;
}

std::string BigInt::to_string() const {
    return negative_ ? "-" + magnitude_ : magnitude_;
}

std::optional<std::int64_t> BigInt::to_i64() const noexcept {
    std::optional<std::uint64_t> magnitude = magnitude_u64();
    if (!magnitude) return std::nullopt;
    constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (negative_) {
        if (*magnitude > kMax + 1) return std::nullopt;
        // Negate through unsigned to cover INT64_MIN.
        return static_cast<std::int64_t>(0 - *magnitude);
    }
    if (*magnitude > kMax) return std::nullopt;
    return static_cast<std::int64_t>(*magnitude);
}

std::optional<std::uint64_t> BigInt::magnitude_u64() const noexcept {
    std::uint64_t value = 0;
    const char* end = magnitude_.data() + magnitude_.size();
    auto [ptr, ec] = std::from_chars(magnitude_.data(), end, value);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return value;
}

std::optional<std::uint64_t> BigInt::to_u64() const noexcept {
    if (negative_) return std::nullopt;
    return magnitude_u64();
}

// ============================================================================
// Date
// ============================================================================

Date Date::from_unix_millis(std::int64_t millis) noexcept {
    return Date(TimePoint(std::chrono::milliseconds(millis)));
}

Date Date::from_civil(int year, unsigned month, unsigned day,
                      unsigned hour, unsigned minute, unsigned second,
                      unsigned millis, int offset_minutes) {
    std::int64_t days = days_from_civil(year, month, day);
    std::int64_t offset_ms = static_cast<std::int64_t>(hour) * 3600000
                           + static_cast<std::int64_t>(minute) * 60000
                           + static_cast<std::int64_t>(second) * 1000
                           + static_cast<std::int64_t>(millis)
                           - static_cast<std::int64_t>(offset_minutes) * 60000;
    auto ms = checked_unix_millis(days, offset_ms);
    if (!ms) {
        throw std::out_of_range("date out of range: year " + std::to_string(year));
    }
    return from_unix_millis(*ms);
}

std::optional<Date> Date::parse_iso8601(std::string_view text) {
    std::size_t pos = 0;
    std::int64_t year = 0;
    unsigned month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        // Expanded year: sign and 6 to 9 digits
        const bool negative = text[pos] == '-';
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9' && digits < 9) {
            year = year * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits < 6) return std::nullopt;
        if (negative) year = -year;
    } else {
        unsigned short_year = 0;
        if (!read_digits(text, pos, 4, short_year)) return std::nullopt;
        year = short_year;
    }

    if (!expect_char(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect_char(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (!expect_char(text, pos, 'T') && !expect_char(text, pos, 't') &&
        !expect_char(text, pos, ' ')) {
        return std::nullopt;
    }
    if (!read_digits(text, pos, 2, hour) || !expect_char(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect_char(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return std::nullopt;
    }

    unsigned millis = 0;
    if (expect_char(text, pos, '.')) {
        std::size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + static_cast<unsigned>(text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (std::size_t i = digits; i < 3; ++i) millis *= 10;
    }

    int offset = 0;
    if (expect_char(text, pos, 'Z') || expect_char(text, pos, 'z')) {
        offset = 0;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        unsigned oh = 0, om = 0;
        if (!read_digits(text, pos, 2, oh) || !expect_char(text, pos, ':') ||
            !read_digits(text, pos, 2, om) || oh > 23 || om > 59) {
            return std::nullopt;
        }
        offset = sign * static_cast<int>(oh * 60 + om);
    } else {
        return std::nullopt;
    }

    if (pos != text.size()) return std::nullopt;
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    std::int64_t offset_ms = static_cast<std::int64_t>(hour) * 3600000
                           + static_cast<std::int64_t>(minute) * 60000
                           + static_cast<std::int64_t>(second) * 1000
                           + static_cast<std::int64_t>(millis)
                           - static_cast<std::int64_t>(offset) * 60000;
    auto ms = checked_unix_millis(days_from_civil(year, month, day), offset_ms);
    if (!ms) return std::nullopt;
    return from_unix_millis(*ms);
}

std::string Date::to_iso8601() const {
    std::int64_t days = floor_div(millis_, kMillisPerDay);
    std::int64_t rem = millis_ % kMillisPerDay;
    if (rem < 0) rem += kMillisPerDay;
    Civil c = civil_from_days(days);

    auto hour = static_cast<unsigned>(rem / 3600000);
    auto minute = static_cast<unsigned>((rem / 60000) % 60);
    auto second = static_cast<unsigned>((rem / 1000) % 60);
    auto millis = static_cast<unsigned>(rem % 1000);

    std::ostringstream oss;
    oss << std::setfill('0');
    if (c.year >= 0 && c.year <= 9999) {
        oss << std::setw(4) << c.year;
    } else {
        oss << (c.year < 0 ? '-' : '+') << std::setw(6) << (c.year < 0 ? -c.year : c.year);
    }
    oss << '-'
        << std::setw(2) << c.month << '-'
        << std::setw(2) << c.day << 'T'
        << std::setw(2) << hour << ':'
        << std::setw(2) << minute << ':'
        << std::setw(2) << second;
    if (millis != 0) {
        oss << '.' << std::setw(3) << millis;
    }
    oss << 'Z';
    return oss.str();
}

// ============================================================================
// Object
// ============================================================================

Object::Object(std::initializer_list<value_type> init) {
    for (const auto& [key, value] : init) {
        insert(key, value);
    }
}

Value& Object::insert(std::string key, Value value) {
    if (Value* existing = find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    entries_.emplace_back(std::move(key), std::move(value));
    return entries_.back().second;
}

Value& Object::operator[](const std::string& key) {
    if (Value* existing = find(key)) {
        return *existing;
    }
    entries_.emplace_back(key, Value());
    return entries_.back().second;
}

const Value* Object::find(std::string_view key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

Value* Object::find(std::string_view key) {
    for (auto& entry : entries_) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

bool Object::erase(std::string_view key) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == key) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

std::vector<std::string> Object::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

bool operator==(const Object& lhs, const Object& rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (const auto& [key, value] : lhs) {
        const Value* other = rhs.find(key);
        if (other == nullptr || !(*other == value)) return false;
    }
    return true;
}

// ============================================================================
// Table
// ============================================================================

Array Table::to_objects() const {
    Array result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        Object obj;
        for (std::size_t i = 0; i < headers.size(); ++i) {
            obj.insert(headers[i], i < row.size() ? row[i] : Value());
        }
        result.emplace_back(std::move(obj));
    }
    return result;
}

bool operator==(const Table& lhs, const Table& rhs) {
    return lhs.headers == rhs.headers && lhs.rows == rhs.rows;
}

// ============================================================================
// Value
// ============================================================================

std::optional<bool> Value::as_bool() const noexcept {
    if (const bool* b = std::get_if<bool>(&data_)) return *b;
    return std::nullopt;
}

std::optional<std::int64_t> Value::as_i64() const noexcept {
    if (const auto* n = as_number()) return n->as_i64();
    if (const auto* b = as_bigint()) return b->to_i64();
    return std::nullopt;
}

std::optional<double> Value::as_f64() const noexcept {
    if (const auto* n = as_number()) return n->as_f64();
    return std::nullopt;
}

std::size_t Value::size() const noexcept {
    switch (type()) {
        case Type::Array: return std::get<toon::Array>(data_).size();
        case Type::Object: return std::get<toon::Object>(data_).size();
        case Type::Table: return std::get<toon::Table>(data_).rows.size();
        default: return 0;
    }
}

const Value* Value::find(std::string_view key) const {
    if (const auto* obj = as_object()) return obj->find(key);
    return nullptr;
}

const Value& Value::at(std::string_view key) const {
    const Value* found = find(key);
    if (found == nullptr) {
        throw std::out_of_range("key not found: '" + std::string(key) + "'");
    }
    return *found;
}

const Value& Value::at(std::size_t index) const {
    const auto* arr = as_array();
    if (arr == nullptr || index >= arr->size()) {
        throw std::out_of_range("array index out of range: " + std::to_string(index));
    }
    return (*arr)[index];
}

Value Value::normalized() const {
    switch (type()) {
        case Type::Array: {
            toon::Array out;
            for (const auto& elem : std::get<toon::Array>(data_)) {
                out.push_back(elem.normalized());
            }
            return Value(std::move(out));
        }
        case Type::Object: {
            toon::Object out;
            for (const auto& [key, value] : std::get<toon::Object>(data_)) {
                out.insert(key, value.normalized());
            }
            return Value(std::move(out));
        }
        case Type::Table: {
            toon::Array out = std::get<toon::Table>(data_).to_objects();
            for (auto& elem : out) {
                elem = elem.normalized();
            }
            return Value(std::move(out));
        }
        default:
            return *this;
    }
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.data_.index() != rhs.data_.index()) return false;
    switch (lhs.type()) {
        case Value::Type::Null:
            return true;
        case Value::Type::Bool:
            return std::get<bool>(lhs.data_) == std::get<bool>(rhs.data_);
        case Value::Type::Number:
            return std::get<Number>(lhs.data_) == std::get<Number>(rhs.data_);
        case Value::Type::String:
            return std::get<std::string>(lhs.data_) == std::get<std::string>(rhs.data_);
        case Value::Type::Array:
            return std::get<Array>(lhs.data_) == std::get<Array>(rhs.data_);
        case Value::Type::Object:
            return std::get<Object>(lhs.data_) == std::get<Object>(rhs.data_);
        case Value::Type::Table:
            return std::get<Table>(lhs.data_) == std::get<Table>(rhs.data_);
        case Value::Type::Date:
            return std::get<Date>(lhs.data_) == std::get<Date>(rhs.data_);
        case Value::Type::BigInt:
            return std::get<BigInt>(lhs.data_) == std::get<BigInt>(rhs.data_);
    }
    return false;
}

std::string type_name(const Value& val) {
    switch (val.type()) {
        case Value::Type::Null: return "null";
        case Value::Type::Bool: return "bool";
        case Value::Type::Number:
            return val.as_number()->is_integer() ? "integer" : "float";
        case Value::Type::String: return "string";
        case Value::Type::Array: return "array";
        case Value::Type::Object: return "object";
        case Value::Type::Table: return "table";
        case Value::Type::Date: return "date";
        case Value::Type::BigInt: return "bigint";
    }
    return "unknown";
}

} // namespace toon
