/**
 * @file Loader.cpp
 * @brief Document file loading and writing
 */

#include "docpath/Loader.hpp"
#include "docpath/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>
#include <utility>

namespace fs = std::filesystem;

namespace docpath {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Convert string to lowercase.
 */
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void require_object_root(const Value& doc, const std::string& source) {
    if (!doc.is_object()) {
        throw TypeError(source, "object", type_name(doc));
    }
}

/**
 * @brief Convert a parsed TOML node into a tree value.
 *
 * Dates and times have no JSON counterpart and become their TOML text.
 */
Value from_toml(const toml::node& node) {
    return node.visit([](const auto& n) -> Value {
        using N = std::decay_t<decltype(n)>;
        if constexpr (toml::is_table<N>) {
            Value obj = Value::object();
            for (const auto& [key, child] : n) {
                obj[std::string(key.str())] = from_toml(child);
            }
            return obj;
        } else if constexpr (toml::is_array<N>) {
            Value arr = Value::array();
            for (const auto& child : n) {
                arr.push_back(from_toml(child));
            }
            return arr;
        } else if constexpr (toml::is_date<N> || toml::is_time<N> || toml::is_date_time<N>) {
            std::ostringstream ss;
            ss << n.get();
            return Value(ss.str());
        } else {
            return Value(n.get());
        }
    });
}

toml::table to_toml_table(const Value& obj);
toml::array to_toml_array(const Value& arr);

/**
 * @brief Hand the TOML form of v to put.
 *
 * TOML has no null and no unsigned 64-bit integers: null becomes "" and an
 * unsigned value above INT64_MAX becomes a float.
 */
template <typename Put>
void put_toml(const Value& v, Put&& put) {
    switch (v.type()) {
        case Value::value_t::object:
            put(to_toml_table(v));
            return;
        case Value::value_t::array:
            put(to_toml_array(v));
            return;
        case Value::value_t::string:
            put(v.get<std::string>());
            return;
        case Value::value_t::boolean:
            put(v.get<bool>());
            return;
        case Value::value_t::number_integer:
            put(v.get<std::int64_t>());
            return;
        case Value::value_t::number_unsigned: {
            const auto u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                put(static_cast<double>(u));
            } else {
                put(static_cast<std::int64_t>(u));
            }
            return;
        }
        case Value::value_t::number_float:
            put(v.get<double>());
            return;
        case Value::value_t::null:
        case Value::value_t::discarded:
            put(std::string{});
            return;
        case Value::value_t::binary:
            put(v.dump());
            return;
    }
}

toml::table to_toml_table(const Value& obj) {
    toml::table tbl;
    for (const auto& item : obj.items()) {
        const std::string& key = item.key();
        put_toml(item.value(), [&tbl, &key](auto&& x) {
            tbl.insert_or_assign(key, std::forward<decltype(x)>(x));
        });
    }
    return tbl;
}

toml::array to_toml_array(const Value& arr) {
    toml::array out;
    for (const auto& elem : arr) {
        put_toml(elem, [&out](auto&& x) { out.push_back(std::forward<decltype(x)>(x)); });
    }
    return out;
}

/**
 * @brief TOML documents are tables; anything else is stored under "value".
 */
toml::table document_to_toml(const Value& doc) {
    if (doc.is_object()) {
        return to_toml_table(doc);
    }
    Value wrapped = Value::object();
    wrapped["value"] = doc;
    return to_toml_table(wrapped);
}

std::ofstream open_for_write(const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs) {
        throw DocpathError("Failed to open for write: " + path);
    }
    return ofs;
}

} // anonymous namespace

// ============================================================================
// Reading
// ============================================================================

Value parse_json_document(const std::string& text, const std::string& source) {
    Value doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw DocumentParseError(source, 0, 0, e.what());
    }
    require_object_root(doc, source);
    return doc;
}

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_json_document(read_file(path), path);
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return from_toml(table);
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Value load_document_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    } else if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw UnsupportedFormatError(ext);
}

// ============================================================================
// Writing
// ============================================================================

std::string to_toml_string(const Value& doc) {
    std::ostringstream oss;
    oss << document_to_toml(doc);
    return oss.str();
}

void write_json_file(const std::string& path, const Value& doc, int indent) {
    auto ofs = open_for_write(path);
    ofs << doc.dump(indent) << "\n";
}

void write_toml_file(const std::string& path, const Value& doc) {
    auto ofs = open_for_write(path);
    ofs << document_to_toml(doc) << "\n";
}

void write_document_file(const std::string& path, const Value& doc, int indent) {
    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        write_json_file(path, doc, indent);
    } else if (ext == ".toml") {
        write_toml_file(path, doc);
    } else {
        throw UnsupportedFormatError(ext);
    }
}

} // namespace docpath
