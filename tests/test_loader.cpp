/**
 * @file test_loader.cpp
 * @brief Tests for document loading and writing
 *
 * Tests cover:
 * - JSON documents from text and files
 * - TOML documents from files
 * - Format detection by extension
 * - Writing documents back as JSON/TOML
 */

#include <catch2/catch_all.hpp>
#include "docpath/Loader.hpp"
#include "docpath/Errors.hpp"
#include "docpath/Resolver.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

using namespace docpath;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("docpath_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_);
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

std::string read_all(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// ============================================================================
// JSON
// ============================================================================

TEST_CASE("parse_json_document - text input", "[loader][json]") {
    SECTION("Object root") {
        Value doc = parse_json_document(R"({"a": {"b": [1, 2, 3]}})");
        CHECK(get_path(doc, "a.b[2]") == 3);
    }

    SECTION("Non-object root is rejected") {
        CHECK_THROWS_AS(parse_json_document("[1, 2, 3]"), TypeError);
        CHECK_THROWS_AS(parse_json_document("\"text\""), TypeError);
    }

    SECTION("Syntax error names the source") {
        try {
            parse_json_document("{\"a\": ", "inline");
            FAIL("Should have thrown DocumentParseError");
        } catch (const DocumentParseError& e) {
            CHECK(e.file() == "inline");
            CHECK(std::string(e.what()).find("inline") != std::string::npos);
        }
    }
}

TEST_CASE("load_json_file - basic loading", "[loader][json]") {
    SECTION("Nested JSON object") {
        TempFile file(R"({
            "database": {
                "host": "localhost",
                "ports": [5432, 5433]
            },
            "debug": false
        })");

        Value result = load_json_file(file.path());

        CHECK(result["database"]["host"] == "localhost");
        CHECK(get_path(result, "database.ports[1]") == 5433);
        CHECK(result["debug"] == false);
    }

    SECTION("Missing file") {
        CHECK_THROWS_AS(load_json_file("/nonexistent/docpath/file.json"), FileNotFoundError);
    }

    SECTION("Invalid JSON") {
        TempFile file("{ invalid json }");
        CHECK_THROWS_AS(load_json_file(file.path()), DocumentParseError);
    }
}

// ============================================================================
// TOML
// ============================================================================

TEST_CASE("load_toml_file - tables and arrays", "[loader][toml]") {
    SECTION("Sections become nested objects") {
        TempFile file(R"(
title = "docs"

[server]
host = "localhost"
ports = [8080, 8081]

[[server.routes]]
path = "/a"

[[server.routes]]
path = "/b"
)", ".toml");

        Value result = load_toml_file(file.path());

        CHECK(result["title"] == "docs");
        CHECK(get_path(result, "server.ports[0]") == 8080);
        CHECK(get_path(result, "server.routes[1].path") == "/b");
    }

    SECTION("Dates become strings") {
        TempFile file("day = 2024-01-15\n", ".toml");
        Value result = load_toml_file(file.path());
        CHECK(result["day"].is_string());
        CHECK(result["day"] == "2024-01-15");
    }

    SECTION("Syntax error reports position") {
        TempFile file("key = = 1\n", ".toml");
        try {
            load_toml_file(file.path());
            FAIL("Should have thrown DocumentParseError");
        } catch (const DocumentParseError& e) {
            CHECK(e.line() == 1);
        }
    }

    SECTION("Missing file") {
        CHECK_THROWS_AS(load_toml_file("/nonexistent/docpath/file.toml"), FileNotFoundError);
    }
}

// ============================================================================
// Format detection
// ============================================================================

TEST_CASE("load_document_file - detects format by extension", "[loader]") {
    SECTION("JSON") {
        TempFile file(R"({"k": 1})", ".json");
        CHECK(load_document_file(file.path())["k"] == 1);
    }

    SECTION("TOML") {
        TempFile file("k = 1\n", ".toml");
        CHECK(load_document_file(file.path())["k"] == 1);
    }

    SECTION("Upper-case extension") {
        TempFile file(R"({"k": 2})", ".JSON");
        CHECK(load_document_file(file.path())["k"] == 2);
    }

    SECTION("Unsupported extension") {
        TempFile file("k: 1\n", ".yaml");
        CHECK_THROWS_AS(load_document_file(file.path()), UnsupportedFormatError);
    }

    SECTION("Missing file wins over extension") {
        CHECK_THROWS_AS(load_document_file("/nonexistent/docpath/file.yaml"), FileNotFoundError);
    }
}

TEST_CASE("get_file_extension", "[loader]") {
    CHECK(get_file_extension("a/b/config.JSON") == ".json");
    CHECK(get_file_extension("config.toml") == ".toml");
    CHECK(get_file_extension("Makefile").empty());
}

// ============================================================================
// Writing
// ============================================================================

TEST_CASE("write_document_file - round trips", "[loader][write]") {
    Value doc = Value::parse(R"({"a": {"b": [1, 2, {"c": "d"}]}, "flag": true})");

    SECTION("JSON") {
        TempFile file("", ".json");
        write_document_file(file.path(), doc);
        CHECK(load_json_file(file.path()) == doc);
        CHECK(read_all(file.path()).find("\n  ") != std::string::npos);
    }

    SECTION("TOML") {
        TempFile file("", ".toml");
        write_document_file(file.path(), doc);
        Value back = load_toml_file(file.path());
        CHECK(get_path(back, "a.b[2].c") == "d");
        CHECK(back["flag"] == true);
    }

    SECTION("TOML null becomes empty string") {
        CHECK(to_toml_string(Value::parse(R"({"n": null})")).find("n = ") != std::string::npos);

        TempFile file("", ".toml");
        write_toml_file(file.path(), Value::parse(R"({"n": null})"));
        CHECK(load_toml_file(file.path())["n"] == "");
    }

    SECTION("Unsupported extension") {
        CHECK_THROWS_AS(write_document_file("out.ini", doc), UnsupportedFormatError);
    }
}
