/**
 * @file Binding.hpp
 * @brief Conversion between host types and Value
 *
 * Host types take part through two free functions found by
 * argument-dependent lookup:
 * - `void to_toon(toon::Value& out, const T& x)`: emit x as a Value
 * - `void from_toon(const toon::Value& in, T& x)`: fill x from a Value
 *
 * Built-in support: bool, integer and floating types, std::string,
 * const char*, Value, Date, BigInt, std::vector<T>, std::map<K, T> and
 * std::optional<T>.
 *
 * Example:
 * ```cpp
 * namespace app {
 * struct User { int id; std::string name; };
 *
 * void to_toon(toon::Value& v, const User& u) {
 *     toon::set_field(v, "id", u.id);
 *     toon::set_field(v, "name", u.name);
 * }
 *
 * void from_toon(const toon::Value& v, User& u) {
 *     toon::get_field(v, "id", u.id);
 *     toon::get_field(v, "name", u.name);
 * }
 * } // namespace app
 *
 * std::string text = toon::encode(std::vector<app::User>{{1, "Alice"}});
 * auto users = toon::decode<std::vector<app::User>>(text);
 * ```
 */

#ifndef TOON_BINDING_HPP
#define TOON_BINDING_HPP

#include "toon/Errors.hpp"
#include "toon/Options.hpp"
#include "toon/Parser.hpp"
#include "toon/Value.hpp"
#include "toon/Writer.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace toon {

namespace detail {

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

} // namespace detail

template <typename T>
Value to_value(const T& x);

template <typename T>
T from_value(const Value& v);

// ============================================================================
// Value source: host type -> Value
// ============================================================================

inline void to_toon(Value& out, const Value& x) { out = x; }
inline void to_toon(Value& out, bool x) { out = x; }
inline void to_toon(Value& out, const std::string& x) { out = x; }
inline void to_toon(Value& out, const char* x) { out = x; }
inline void to_toon(Value& out, const Date& x) { out = x; }
inline void to_toon(Value& out, const BigInt& x) { out = x; }

/// Unsigned values above the int64 range become BigInt.
template <typename T,
          std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int> = 0>
void to_toon(Value& out, T x) {
    if constexpr (std::is_unsigned<T>::value) {
        if (static_cast<std::uint64_t>(x) >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            out = BigInt::from_unsigned(static_cast<std::uint64_t>(x));
            return;
        }
    }
    out = Value(static_cast<std::int64_t>(x));
}

template <typename T, std::enable_if_t<std::is_floating_point<T>::value, int> = 0>
void to_toon(Value& out, T x) {
    out = Value(static_cast<double>(x));
}

template <typename T>
void to_toon(Value& out, const std::vector<T>& xs) {
    Array arr;
    arr.reserve(xs.size());
    for (const auto& x : xs) {
        arr.push_back(to_value(x));
    }
    out = std::move(arr);
}

/**
 * @throws UnsupportedType if K is not convertible to std::string
 */
template <typename K, typename T>
void to_toon(Value& out, const std::map<K, T>& xs) {
    if constexpr (std::is_convertible<const K&, std::string>::value) {
        Object obj;
        for (const auto& [key, x] : xs) {
            obj.insert(std::string(key), to_value(x));
        }
        out = std::move(obj);
    } else {
        throw UnsupportedType("map with non-string keys");
    }
}

template <typename T>
void to_toon(Value& out, const std::optional<T>& x) {
    if (x) {
        to_toon(out, *x);
    } else {
        out = nullptr;
    }
}

// ============================================================================
// Value sink: Value -> host type
// ============================================================================

inline void from_toon(const Value& in, Value& x) { x = in; }

inline void from_toon(const Value& in, bool& x) {
    std::optional<bool> b = in.as_bool();
    if (!b) throw TypeMismatch("", "bool", type_name(in));
    x = *b;
}

/**
 * @throws TypeMismatch if the value is not an integer or does not fit T
 */
template <typename T,
          std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int> = 0>
void from_toon(const Value& in, T& x) {
    if constexpr (std::is_unsigned<T>::value) {
        if (const BigInt* big = in.as_bigint()) {
            std::optional<std::uint64_t> u = big->to_u64();
            if (!u || *u > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                throw TypeMismatch("", "unsigned integer in range", big->to_string());
            }
            x = static_cast<T>(*u);
            return;
        }
    }

    std::optional<std::int64_t> i = in.as_i64();
    if (!i) throw TypeMismatch("", "integer", type_name(in));

    bool fits = true;
    if constexpr (std::is_unsigned<T>::value) {
        fits = *i >= 0 && static_cast<std::uint64_t>(*i) <=
                              static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    } else {
        fits = *i >= static_cast<std::int64_t>(std::numeric_limits<T>::min()) &&
               *i <= static_cast<std::int64_t>(std::numeric_limits<T>::max());
    }
    if (!fits) throw TypeMismatch("", "integer in range", std::to_string(*i));
    x = static_cast<T>(*i);
}

template <typename T, std::enable_if_t<std::is_floating_point<T>::value, int> = 0>
void from_toon(const Value& in, T& x) {
    std::optional<double> d = in.as_f64();
    if (!d) throw TypeMismatch("", "number", type_name(in));
    x = static_cast<T>(*d);
}

inline void from_toon(const Value& in, std::string& x) {
    const std::string* s = in.as_str();
    if (s == nullptr) throw TypeMismatch("", "string", type_name(in));
    x = *s;
}

/// Accepts a Date or an ISO-8601 string (dates are written as strings).
inline void from_toon(const Value& in, Date& x) {
    if (const Date* d = in.as_date()) {
        x = *d;
        return;
    }
    if (const std::string* s = in.as_str()) {
        if (std::optional<Date> parsed = Date::parse_iso8601(*s)) {
            x = *parsed;
            return;
        }
    }
    throw TypeMismatch("", "date", type_name(in));
}

/// Accepts a BigInt, an integer or a decimal string.
inline void from_toon(const Value& in, BigInt& x) {
    if (const BigInt* b = in.as_bigint()) {
        x = *b;
        return;
    }
    if (const Number* n = in.as_number(); n != nullptr && n->is_integer()) {
        x = BigInt(n->integer_value());
        return;
    }
    if (const std::string* s = in.as_str()) {
        if (std::optional<BigInt> parsed = BigInt::parse(*s)) {
            x = *parsed;
            return;
        }
    }
    throw TypeMismatch("", "bigint", type_name(in));
}

template <typename T>
void from_toon(const Value& in, std::vector<T>& xs) {
    if (const Table* table = in.as_table()) {
        from_toon(Value(table->to_objects()), xs);
        return;
    }
    const Array* arr = in.as_array();
    if (arr == nullptr) throw TypeMismatch("", "array", type_name(in));

    xs.clear();
    xs.reserve(arr->size());
    for (std::size_t i = 0; i < arr->size(); ++i) {
        T x{};
        try {
            from_toon((*arr)[i], x);
        } catch (const TypeMismatch& e) {
            throw e.nested_in(std::to_string(i));
        }
        xs.push_back(std::move(x));
    }
}

template <typename T>
void from_toon(const Value& in, std::map<std::string, T>& xs) {
    const Object* obj = in.as_object();
    if (obj == nullptr) throw TypeMismatch("", "object", type_name(in));

    xs.clear();
    for (const auto& [key, field] : *obj) {
        T x{};
        try {
            from_toon(field, x);
        } catch (const TypeMismatch& e) {
            throw e.nested_in(key);
        }
        xs.emplace(key, std::move(x));
    }
}

template <typename T>
void from_toon(const Value& in, std::optional<T>& x) {
    if (in.is_null()) {
        x.reset();
        return;
    }
    T inner{};
    from_toon(in, inner);
    x = std::move(inner);
}

// ============================================================================
// Field helpers for user types
// ============================================================================

/**
 * @brief Add or replace a field, turning `obj` into an object if needed
 */
template <typename T>
void set_field(Value& obj, std::string key, const T& x) {
    if (!obj.is_object()) obj = Object{};
    obj.as_object()->insert(std::move(key), to_value(x));
}

/**
 * @brief Read a mandatory field
 *
 * A missing std::optional field is read as nullopt.
 *
 * @throws TypeMismatch if obj is not an object or the field has the wrong type
 * @throws CustomError if the field is missing
 */
template <typename T>
void get_field(const Value& obj, std::string_view key, T& x) {
    const Object* o = obj.as_object();
    if (o == nullptr) throw TypeMismatch("", "object", type_name(obj));

    const Value* field = o->find(key);
    if (field == nullptr) {
        if constexpr (detail::is_optional<T>::value) {
            x.reset();
            return;
        } else {
            throw CustomError("missing field '" + std::string(key) + "'");
        }
    }
    try {
        from_toon(*field, x);
    } catch (const TypeMismatch& e) {
        throw e.nested_in(std::string(key));
    }
}

/**
 * @brief Read an optional field, falling back when absent
 */
template <typename T, typename U>
void get_field_or(const Value& obj, std::string_view key, T& x, U&& fallback) {
    if (obj.find(key) == nullptr) {
        x = std::forward<U>(fallback);
        return;
    }
    get_field(obj, key, x);
}

// ============================================================================
// Entry points
// ============================================================================

template <typename T>
Value to_value(const T& x) {
    Value v;
    to_toon(v, x);
    return v;
}

template <typename T>
T from_value(const Value& v) {
    T x{};
    from_toon(v, x);
    return x;
}

/**
 * @brief Serialize any supported host value to TOON text
 */
template <typename T>
std::string encode(const T& x, const Options& options = Options{}) {
    return serialize(to_value(x), options);
}

/**
 * @brief Parse TOON text straight into a host value
 * @throws SyntaxError and friends from parsing, TypeMismatch from binding
 */
template <typename T>
T decode(std::string_view text) {
    return from_value<T>(parse(text));
}

} // namespace toon

#endif // TOON_BINDING_HPP
