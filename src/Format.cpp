/**
 * @file Format.cpp
 * @brief Array encoding selection
 */

#include "toon/Format.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace toon {

namespace {

std::vector<std::string> sorted_keys(const Object& obj) {
    std::vector<std::string> keys = obj.keys();
    std::sort(keys.begin(), keys.end());
    return keys;
}

bool all_values_primitive(const Object& obj) {
    return std::all_of(obj.begin(), obj.end(),
                       [](const Object::value_type& field) { return field.second.is_primitive(); });
}

/**
 * @brief Shared sorted key set if every element qualifies for tabular form
 */
std::optional<std::vector<std::string>> uniform_keys(const Array& elements) {
    if (elements.empty()) return std::nullopt;

    const Object* first = elements.front().as_object();
    if (first == nullptr || first->empty()) return std::nullopt;
    std::vector<std::string> keys = sorted_keys(*first);

    for (const auto& elem : elements) {
        const Object* obj = elem.as_object();
        if (obj == nullptr || obj->size() != keys.size()) return std::nullopt;
        if (!all_values_primitive(*obj)) return std::nullopt;
        if (sorted_keys(*obj) != keys) return std::nullopt;
    }
    return keys;
}

} // anonymous namespace

ArrayFormat select_format(const Array& elements) {
    if (elements.empty()) return ArrayFormat::Inline;
    if (uniform_keys(elements)) return ArrayFormat::Tabular;

    bool all_primitive = std::all_of(elements.begin(), elements.end(),
                                     [](const Value& v) { return v.is_primitive(); });
    return all_primitive ? ArrayFormat::Inline : ArrayFormat::List;
}

std::optional<Table> tabulate(const Array& elements) {
    std::optional<std::vector<std::string>> keys = uniform_keys(elements);
    if (!keys) return std::nullopt;

    Table table;
    table.headers = std::move(*keys);
    table.rows.reserve(elements.size());
    for (const auto& elem : elements) {
        const Object& obj = *elem.as_object();
        std::vector<Value> row;
        row.reserve(table.headers.size());
        for (const auto& header : table.headers) {
            const Value* field = obj.find(header);
            row.push_back(field != nullptr ? *field : Value());
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}

} // namespace toon
