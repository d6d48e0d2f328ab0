/**
 * @file Json.cpp
 * @brief Conversion between Value and nlohmann::json
 */

#include "toon/Json.hpp"
#include "toon/Errors.hpp"

#include <cstdint>
#include <limits>

namespace toon {

namespace {

template <typename BasicJson>
Value json_to_value(const BasicJson& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return Value();

        case nlohmann::json::value_t::boolean:
            return Value(j.template get<bool>());

        case nlohmann::json::value_t::number_integer:
            return Value(j.template get<std::int64_t>());

        case nlohmann::json::value_t::number_unsigned: {
            auto u = j.template get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value(BigInt::from_unsigned(u));
            }
            return Value(static_cast<std::int64_t>(u));
        }

        case nlohmann::json::value_t::number_float:
            return Value(j.template get<double>());

        case nlohmann::json::value_t::string:
            return Value(j.template get<std::string>());

        case nlohmann::json::value_t::array: {
            Array arr;
            arr.reserve(j.size());
            for (const auto& elem : j) {
                arr.push_back(json_to_value(elem));
            }
            return Value(std::move(arr));
        }

        case nlohmann::json::value_t::object: {
            Object obj;
            for (auto it = j.begin(); it != j.end(); ++it) {
                obj.insert(it.key(), json_to_value(it.value()));
            }
            return Value(std::move(obj));
        }

        case nlohmann::json::value_t::binary:
            throw UnsupportedType("binary JSON value");
    }
    throw UnsupportedType("unknown JSON value type");
}

nlohmann::ordered_json number_to_json(const Number& n) {
    switch (n.kind()) {
        case Number::Kind::Integer: return n.integer_value();
        case Number::Kind::Float: return n.float_value();
        default: return nullptr;
    }
}

nlohmann::ordered_json bigint_to_json(const BigInt& b) {
    if (auto i = b.to_i64()) return *i;
    if (auto u = b.to_u64()) return *u;
    return b.to_string();
}

} // anonymous namespace

Value from_json(const nlohmann::json& j) {
    return json_to_value(j);
}

Value from_json(const nlohmann::ordered_json& j) {
    return json_to_value(j);
}

nlohmann::ordered_json to_json(const Value& val) {
    switch (val.type()) {
        case Value::Type::Null:
            return nullptr;
        case Value::Type::Bool:
            return *val.as_bool();
        case Value::Type::Number:
            return number_to_json(*val.as_number());
        case Value::Type::String:
            return *val.as_str();
        case Value::Type::Array: {
            nlohmann::ordered_json arr = nlohmann::ordered_json::array();
            for (const auto& elem : *val.as_array()) {
                arr.push_back(to_json(elem));
            }
            return arr;
        }
        case Value::Type::Object: {
            nlohmann::ordered_json obj = nlohmann::ordered_json::object();
            for (const auto& [key, field] : *val.as_object()) {
                obj[key] = to_json(field);
            }
            return obj;
        }
        case Value::Type::Table:
            return to_json(Value(val.as_table()->to_objects()));
        case Value::Type::Date:
            return val.as_date()->to_iso8601();
        case Value::Type::BigInt:
            return bigint_to_json(*val.as_bigint());
    }
    return nullptr;
}

} // namespace toon
