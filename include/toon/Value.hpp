/**
 * @file Value.hpp
 * @brief Dynamic value tree shared by the parser and the writer
 *
 * A Value is a closed tagged union over:
 * - Null
 * - Bool (true | false)
 * - Number (Integer, Float, Infinity, NegativeInfinity, NaN)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object (insertion-ordered {String: Value, ...})
 * - Table (headers + rows, produced while parsing tabular arrays)
 * - Date (UTC instant, millisecond precision)
 * - BigInt (arbitrary-precision decimal integer)
 */

#ifndef TOON_VALUE_HPP
#define TOON_VALUE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace toon {

class Value;

/// Ordered sequence of values.
using Array = std::vector<Value>;

// ============================================================================
// Number
// ============================================================================

/**
 * @brief Numeric scalar with explicit special-value kinds
 *
 * Non-finite doubles are never stored as Float: they are classified into
 * Infinity, NegativeInfinity or NaN on construction.
 */
class Number {
public:
    enum class Kind { Integer, Float, Infinity, NegativeInfinity, NaN };

    Number() noexcept = default;

    static Number integer(std::int64_t value) noexcept;
    static Number floating(double value) noexcept;
    static Number infinity() noexcept;
    static Number negative_infinity() noexcept;
    static Number nan() noexcept;

    Kind kind() const noexcept { return kind_; }
    bool is_integer() const noexcept { return kind_ == Kind::Integer; }
    bool is_float() const noexcept { return kind_ == Kind::Float; }
    bool is_special() const noexcept {
        return kind_ != Kind::Integer && kind_ != Kind::Float;
    }

    /**
     * @brief Narrow to a signed 64-bit integer
     *
     * Accepts integers and whole-number floats inside the int64 range.
     * Fractional floats and special values yield nullopt.
     */
    std::optional<std::int64_t> as_i64() const noexcept;

    /**
     * @brief Widen to double
     *
     * Always succeeds; special kinds map to IEEE-754 inf, -inf and NaN.
     */
    double as_f64() const noexcept;

    /// Integer payload; only meaningful when is_integer().
    std::int64_t integer_value() const noexcept { return integer_; }

    /// Float payload; only meaningful when is_float().
    double float_value() const noexcept { return float_; }

    friend bool operator==(const Number& lhs, const Number& rhs) noexcept;
    friend bool operator!=(const Number& lhs, const Number& rhs) noexcept {
        return !(lhs == rhs);
    }

private:
    Kind kind_ = Kind::Integer;
    std::int64_t integer_ = 0;
    double float_ = 0.0;
};

// ============================================================================
// BigInt
// ============================================================================

/**
 * @brief Arbitrary-precision integer kept as normalized decimal digits
 *
 * The textual literal form carries an `n` suffix: `12345678901234567890n`.
 */
class BigInt {
public:
    BigInt() = default;
    explicit BigInt(std::int64_t value);

    static BigInt from_unsigned(std::uint64_t value);

    /**
     * @brief Parse `-?digits` with an optional trailing `n`
     * @return nullopt if text is not a decimal integer literal
     */
    static std::optional<BigInt> parse(std::string_view text);

    bool negative() const noexcept { return negative_; }
    const std::string& magnitude() const noexcept { return magnitude_; }

    /// Decimal text without suffix ("-42").
    std::string to_string() const;

    /// Literal text with suffix ("-42n").
    std::string to_literal() const { return to_string() + "n"; }

    std::optional<std::int64_t> to_i64() const noexcept;
    std::optional<std::uint64_t> to_u64() const noexcept;

    friend bool operator==(const BigInt& lhs, const BigInt& rhs) noexcept {
        return lhs.negative_ == rhs.negative_ && lhs.magnitude_ == rhs.magnitude_;
    }
    friend bool operator!=(const BigInt& lhs, const BigInt& rhs) noexcept {
        return !(lhs == rhs);
    }

private:
    std::optional<std::uint64_t> magnitude_u64() const noexcept;

    bool negative_ = false;
    std::string magnitude_ = "0";
};

// ============================================================================
// Date
// ============================================================================

/**
 * @brief UTC instant with millisecond precision
 */
class Date {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, std::chrono::milliseconds>;

    Date() = default;
    explicit Date(TimePoint tp) noexcept : millis_(tp.time_since_epoch().count()) {}

    static Date from_unix_millis(std::int64_t millis) noexcept;

    /**
     * @brief Build from calendar fields
     * @param offset_minutes Local offset east of UTC; subtracted to get UTC
     * @throws std::out_of_range if the instant does not fit in 64-bit millis
     */
    static Date from_civil(int year, unsigned month, unsigned day,
                           unsigned hour = 0, unsigned minute = 0,
                           unsigned second = 0, unsigned millis = 0,
                           int offset_minutes = 0);

    /**
     * @brief Parse `YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)`
     *
     * A space is accepted in place of `T`. Fractions beyond milliseconds
     * are truncated. Years outside 0000-9999 use the expanded form, a sign
     * followed by 6 to 9 digits (`+010000-01-01T00:00:00Z`).
     *
     * @return nullopt if text is not a valid timestamp
     */
    static std::optional<Date> parse_iso8601(std::string_view text);

    TimePoint time_point() const noexcept {
        return TimePoint(std::chrono::milliseconds(millis_));
    }
    std::int64_t unix_millis() const noexcept { return millis_; }

    /// `2024-01-15T10:30:00Z`, with `.mmm` when milliseconds are non-zero.
    /// Years outside 0000-9999 are written expanded (`-000001-...`).
    std::string to_iso8601() const;

    friend bool operator==(const Date& lhs, const Date& rhs) noexcept {
        return lhs.millis_ == rhs.millis_;
    }
    friend bool operator!=(const Date& lhs, const Date& rhs) noexcept {
        return !(lhs == rhs);
    }

private:
    std::int64_t millis_ = 0;
};

// ============================================================================
// Object
// ============================================================================

/**
 * @brief String-keyed map preserving insertion order
 *
 * Inserting an existing key replaces its value in place. Equality ignores
 * key order.
 */
class Object {
public:
    using value_type = std::pair<std::string, Value>;
    using container_type = std::vector<value_type>;
    using iterator = container_type::iterator;
    using const_iterator = container_type::const_iterator;

    Object() = default;
    Object(std::initializer_list<value_type> init);

    /**
     * @brief Insert or replace a field
     * @return Reference to the stored value
     */
    Value& insert(std::string key, Value value);

    /// Access a field, inserting null if absent.
    Value& operator[](const std::string& key);

    const Value* find(std::string_view key) const;
    Value* find(std::string_view key);
    bool contains(std::string_view key) const { return find(key) != nullptr; }
    bool erase(std::string_view key);

    /// Keys in insertion order.
    std::vector<std::string> keys() const;

    std::size_t size() const noexcept;
    bool empty() const noexcept;

    iterator begin() noexcept;
    iterator end() noexcept;
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    friend bool operator==(const Object& lhs, const Object& rhs);
    friend bool operator!=(const Object& lhs, const Object& rhs) { return !(lhs == rhs); }

private:
    container_type entries_;
};

// ============================================================================
// Table
// ============================================================================

/**
 * @brief Tabular array as read from text
 *
 * Every row holds exactly headers.size() values.
 */
struct Table {
    std::vector<std::string> headers;
    std::vector<std::vector<Value>> rows;

    /// One object per row, keyed by header.
    Array to_objects() const;
};

bool operator==(const Table& lhs, const Table& rhs);
inline bool operator!=(const Table& lhs, const Table& rhs) { return !(lhs == rhs); }

// ============================================================================
// Value
// ============================================================================

/**
 * @brief Dynamic value tree node
 *
 * Example:
 * ```cpp
 * toon::Value v = toon::Object{
 *     {"id", 1},
 *     {"tags", toon::Array{"a", "b"}},
 * };
 * v.is_object();             // true
 * v.at("id").as_i64();       // 1
 * ```
 */
class Value {
public:
    enum class Type { Null, Bool, Number, String, Array, Object, Table, Date, BigInt };

    /// Alternatives in the same order as Type.
    using Storage = std::variant<std::nullptr_t, bool, toon::Number, std::string,
                                 toon::Array, toon::Object, toon::Table,
                                 toon::Date, toon::BigInt>;

    Value() noexcept : data_(nullptr) {}
    Value(std::nullptr_t) noexcept : data_(nullptr) {}
    Value(bool b) noexcept : data_(b) {}

    /// Integers; unsigned values above the int64 range become Float.
    template <typename T,
              std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int> = 0>
    Value(T v) noexcept : data_(make_integer(v)) {}

    Value(double d) noexcept : data_(toon::Number::floating(d)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(toon::Number n) noexcept : data_(n) {}
    Value(toon::Array a) : data_(std::move(a)) {}
    Value(toon::Object o) : data_(std::move(o)) {}
    Value(toon::Table t) : data_(std::move(t)) {}
    Value(toon::Date d) noexcept : data_(d) {}
    Value(toon::BigInt b) : data_(std::move(b)) {}

    static Value array() { return Value(toon::Array{}); }
    static Value object() { return Value(toon::Object{}); }

    Type type() const noexcept { return static_cast<Type>(data_.index()); }

    bool is_null() const noexcept { return type() == Type::Null; }
    bool is_bool() const noexcept { return type() == Type::Bool; }
    bool is_number() const noexcept { return type() == Type::Number; }
    bool is_string() const noexcept { return type() == Type::String; }
    bool is_array() const noexcept { return type() == Type::Array; }
    bool is_object() const noexcept { return type() == Type::Object; }
    bool is_table() const noexcept { return type() == Type::Table; }
    bool is_date() const noexcept { return type() == Type::Date; }
    bool is_bigint() const noexcept { return type() == Type::BigInt; }

    /// Null, Bool, Number, String, Date or BigInt.
    bool is_primitive() const noexcept {
        return !is_array() && !is_object() && !is_table();
    }

    std::optional<bool> as_bool() const noexcept;

    /// Integers, whole floats and BigInts that fit in 64 bits.
    std::optional<std::int64_t> as_i64() const noexcept;

    /// Any Number.
    std::optional<double> as_f64() const noexcept;

    const std::string* as_str() const noexcept { return std::get_if<std::string>(&data_); }
    const toon::Number* as_number() const noexcept { return std::get_if<toon::Number>(&data_); }
    const toon::Array* as_array() const noexcept { return std::get_if<toon::Array>(&data_); }
    toon::Array* as_array() noexcept { return std::get_if<toon::Array>(&data_); }
    const toon::Object* as_object() const noexcept { return std::get_if<toon::Object>(&data_); }
    toon::Object* as_object() noexcept { return std::get_if<toon::Object>(&data_); }
    const toon::Table* as_table() const noexcept { return std::get_if<toon::Table>(&data_); }
    const toon::Date* as_date() const noexcept { return std::get_if<toon::Date>(&data_); }
    const toon::BigInt* as_bigint() const noexcept { return std::get_if<toon::BigInt>(&data_); }

    /// Element count of an array, object or table; 0 for scalars.
    std::size_t size() const noexcept;

    /// Object field lookup; nullptr if absent or not an object.
    const Value* find(std::string_view key) const;

    /**
     * @throws std::out_of_range if not an object or the key is absent
     */
    const Value& at(std::string_view key) const;

    /**
     * @throws std::out_of_range if not an array or index is past the end
     */
    const Value& at(std::size_t index) const;

    /**
     * @brief Copy with every Table replaced by Array(Object...)
     */
    Value normalized() const;

    const Storage& data() const noexcept { return data_; }

    friend bool operator==(const Value& lhs, const Value& rhs);
    friend bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

private:
    template <typename T>
    static toon::Number make_integer(T v) noexcept {
        if constexpr (std::is_unsigned<T>::value) {
            if (static_cast<std::uint64_t>(v) >
                static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return toon::Number::floating(static_cast<double>(v));
            }
        }
        return toon::Number::integer(static_cast<std::int64_t>(v));
    }

    Storage data_;
};

// Object members that need a complete Value.
inline std::size_t Object::size() const noexcept { return entries_.size(); }
inline bool Object::empty() const noexcept { return entries_.empty(); }
inline Object::iterator Object::begin() noexcept { return entries_.begin(); }
inline Object::iterator Object::end() noexcept { return entries_.end(); }
inline Object::const_iterator Object::begin() const noexcept { return entries_.begin(); }
inline Object::const_iterator Object::end() const noexcept { return entries_.end(); }

/**
 * @brief Human-readable type name
 * @return "null", "bool", "integer", "float", "string", "array", "object",
 *         "table", "date" or "bigint"
 */
std::string type_name(const Value& val);

/**
 * @brief Dispatch a visitor on the stored alternative
 *
 * The visitor receives one of: std::nullptr_t, bool, Number, std::string,
 * Array, Object, Table, Date, BigInt.
 */
template <typename Visitor>
decltype(auto) visit(Visitor&& vis, const Value& val) {
    return std::visit(std::forward<Visitor>(vis), val.data());
}

/// Writes the value as TOON text with default options.
std::ostream& operator<<(std::ostream& os, const Value& val);

} // namespace toon

#endif // TOON_VALUE_HPP
