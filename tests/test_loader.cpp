/**
 * @file test_loader.cpp
 * @brief Tests for file loading and writing
 *
 * Tests cover:
 * - Raw file access (read, write, extension)
 * - JSON file loading with key order preserved
 * - TOML file loading, including date-time conversion
 * - TOON file loading
 * - Dispatch by extension and the error cases
 */

#include <catch2/catch_all.hpp>
#include "toon/Loader.hpp"
#include "toon/Errors.hpp"

#include <fstream>
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;

using namespace toon;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

namespace {

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("toon_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // anonymous namespace

// ============================================================================
// Raw file access
// ============================================================================

TEST_CASE("read_text_file", "[loader][io]") {
    SECTION("Bytes are returned verbatim") {
        TempFile file("a: 1\r\nb: 2\n", ".toon");
        CHECK(read_text_file(file.path()) == "a: 1\r\nb: 2\n");
    }

    SECTION("Missing file throws FileNotFoundError") {
        CHECK_THROWS_AS(read_text_file("/nonexistent/toon/file.toon"), FileNotFoundError);
    }
}

TEST_CASE("write_text_file", "[loader][io]") {
    SECTION("Existing content is truncated") {
        TempFile file("old content that is longer", ".toon");
        write_text_file(file.path(), "x: 1\n");
        CHECK(read_text_file(file.path()) == "x: 1\n");
    }

    SECTION("Unwritable path throws IoError") {
        try {
            write_text_file("/nonexistent/dir/out.toon", "x");
            FAIL("expected IoError");
        } catch (const IoError& e) {
            CHECK(e.path() == "/nonexistent/dir/out.toon");
            CHECK(e.details() == "cannot open for writing");
        }
    }
}

TEST_CASE("get_file_extension", "[loader]") {
    CHECK(get_file_extension("data.JSON") == ".json");
    CHECK(get_file_extension("/a/b.c/config.toml") == ".toml");
    CHECK(get_file_extension("noext").empty());
}

// ============================================================================
// JSON
// ============================================================================

TEST_CASE("load_json_file - basic loading", "[loader][json]") {
    SECTION("Field order follows the file") {
        TempFile file(R"({"zeta": 1, "alpha": [1, 2], "mid": {"y": null, "x": "s"}})");

        Value result = load_json_file(file.path());

        CHECK(result.as_object()->keys() == std::vector<std::string>{"zeta", "alpha", "mid"});
        CHECK(result.at("alpha") == Value(Array{1, 2}));
        CHECK(result.at("mid").at("y").is_null());
        CHECK(result.at("mid").as_object()->keys() == std::vector<std::string>{"y", "x"});
    }

    SECTION("Empty JSON object") {
        TempFile file("{}");

        Value result = load_json_file(file.path());

        CHECK(result.is_object());
        CHECK(result.size() == 0);
    }
}

TEST_CASE("load_json_file - error handling", "[loader][json]") {
    SECTION("File not found throws FileNotFoundError") {
        CHECK_THROWS_AS(load_json_file("/nonexistent/path.json"), FileNotFoundError);
    }

    SECTION("Truncated JSON throws FileParseError") {
        TempFile file(R"({"key": "value)");
        try {
            load_json_file(file.path());
            FAIL("expected FileParseError");
        } catch (const FileParseError& e) {
            CHECK(e.file() == file.path());
            CHECK_FALSE(e.details().empty());
        }
    }
}

// ============================================================================
// TOML
// ============================================================================

TEST_CASE("load_toml_file - basic loading", "[loader][toml]") {
    SECTION("Tables become nested objects") {
        TempFile file(R"(
title = "demo"
ratio = 0.5
ports = [8000, 8001]

[server]
host = "localhost"
debug = true
)", ".toml");

        Value result = load_toml_file(file.path());

        CHECK(result.at("title") == Value("demo"));
        CHECK(result.at("ratio") == Value(0.5));
        CHECK(result.at("ports") == Value(Array{8000, 8001}));
        CHECK(result.at("server").at("host") == Value("localhost"));
        CHECK(result.at("server").at("debug") == Value(true));
    }

    SECTION("Offset date-times become Date, local dates stay text") {
        TempFile file(R"(
created = 2024-01-15T10:30:00Z
shifted = 2024-01-15T12:30:00+02:00
day = 2024-01-15
)", ".toml");

        Value result = load_toml_file(file.path());

        REQUIRE(result.at("created").is_date());
        CHECK(*result.at("created").as_date() == Date::from_civil(2024, 1, 15, 10, 30, 0));
        CHECK(*result.at("shifted").as_date() == *result.at("created").as_date());
        CHECK(result.at("day") == Value("2024-01-15"));
    }
}

TEST_CASE("load_toml_file - error handling", "[loader][toml]") {
    SECTION("File not found throws FileNotFoundError") {
        CHECK_THROWS_AS(load_toml_file("/nonexistent/config.toml"), FileNotFoundError);
    }

    SECTION("Invalid TOML reports the position") {
        TempFile file("key = \n", ".toml");
        try {
            load_toml_file(file.path());
            FAIL("expected FileParseError");
        } catch (const FileParseError& e) {
            CHECK(e.details().find("(line ") != std::string::npos);
        }
    }
}

// ============================================================================
// TOON and dispatch
// ============================================================================

TEST_CASE("load_toon_file", "[loader][toon]") {
    SECTION("Tabular document") {
        TempFile file("users: [2]{id,name}:\n  1,Alice\n  2,Bob\n", ".toon");

        Value result = load_toon_file(file.path());

        CHECK(result.at("users").at(1).at("name") == Value("Bob"));
    }

    SECTION("Parser errors propagate unchanged") {
        TempFile file("a: 1\n    b: 2\n", ".toon");
        CHECK_THROWS_AS(load_toon_file(file.path()), IndentationError);
    }
}

TEST_CASE("load_file - auto-detect", "[loader]") {
    const Value expected = Object{{"x", 1}};

    SECTION("JSON, any case") {
        TempFile file(R"({"x": 1})", ".JSON");
        CHECK(load_file(file.path()) == expected);
    }

    SECTION("TOML") {
        TempFile file("x = 1\n", ".toml");
        CHECK(load_file(file.path()) == expected);
    }

    SECTION("TOON") {
        TempFile file("x: 1\n", ".toon");
        CHECK(load_file(file.path()) == expected);
    }

    SECTION("Unsupported extension") {
        TempFile file("x: 1\n", ".yaml");
        try {
            load_file(file.path());
            FAIL("expected ToonError");
        } catch (const ToonError& e) {
            CHECK(std::string(e.what()).find("Unsupported file type: .yaml") != std::string::npos);
        }
    }

    SECTION("Missing file") {
        CHECK_THROWS_AS(load_file("/nonexistent/config.json"), FileNotFoundError);
    }
}
