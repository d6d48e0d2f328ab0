/**
 * @file Loader.cpp
 * @brief File input and output
 */

#include "toon/Loader.hpp"
#include "toon/Errors.hpp"
#include "toon/Json.hpp"
#include "toon/Parser.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace toon {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

template <typename T>
std::string stream_text(const T& x) {
    std::ostringstream ss;
    ss << x;
    return ss.str();
}

Value toml_date_time(const toml::date_time& dt) {
    if (!dt.offset) {
        return Value(stream_text(dt));
    }
    return Value(Date::from_civil(
        static_cast<int>(dt.date.year), dt.date.month, dt.date.day,
        dt.time.hour, dt.time.minute, dt.time.second,
        dt.time.nanosecond / 1000000u,
        dt.offset->minutes));
}

Value toml_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return Value(stream_text(node.as_date()->get()));

        case toml::node_type::time:
            return Value(stream_text(node.as_time()->get()));

        case toml::node_type::date_time:
            return toml_date_time(node.as_date_time()->get());

        case toml::node_type::array: {
            Array arr;
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_value(elem));
            }
            return Value(std::move(arr));
        }

        case toml::node_type::table: {
            Object obj;
            for (const auto& [key, val] : *node.as_table()) {
                obj.insert(std::string(key.str()), toml_to_value(val));
            }
            return Value(std::move(obj));
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// Raw file access
// ============================================================================

std::string read_text_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void write_text_file(const std::string& path, std::string_view content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IoError(path, "cannot open for writing");
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        throw IoError(path, "write failed");
    }
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

// ============================================================================
// Document loading
// ============================================================================

Value load_json_file(const std::string& path) {
    std::string content = read_text_file(path);

    try {
        return from_json(nlohmann::ordered_json::parse(content));
    } catch (const nlohmann::ordered_json::parse_error& e) {
        throw FileParseError(path, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw FileParseError(path, details.str());
    }

    return toml_to_value(table);
}

Value load_toon_file(const std::string& path) {
    return parse(read_text_file(path));
}

Value load_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    } else if (ext == ".toml") {
        return load_toml_file(path);
    } else if (ext == ".toon") {
        return load_toon_file(path);
    }
    throw ToonError("Unsupported file type: " + ext + " (expected .json, .toml or .toon)");
}

} // namespace toon
