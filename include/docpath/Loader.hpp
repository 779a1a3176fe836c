/**
 * @file Loader.hpp
 * @brief Reading and writing documents as JSON or TOML
 *
 * Loads files into the mapping-rooted tree the resolver works on, and
 * serializes trees back:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * A document root must be a mapping; anything else raises TypeError.
 */

#ifndef DOCPATH_LOADER_HPP
#define DOCPATH_LOADER_HPP

#include "docpath/Value.hpp"
#include <string>

namespace docpath {

// ============================================================================
// Reading
// ============================================================================

/**
 * @brief Parse a JSON document from text.
 *
 * @param text JSON text
 * @param source Name used in error messages
 * @return Parsed mapping
 * @throws DocumentParseError if the JSON syntax is invalid
 * @throws TypeError if the root is not an object
 */
Value parse_json_document(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Load a document from a JSON file.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 * @throws TypeError if the root is not an object
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a document from a TOML file.
 *
 * Tables map to objects, arrays to arrays. Dates and times become their
 * TOML string form.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, choosing the format by extension.
 *
 * ".json" -> JSON, ".toml" -> TOML (case-insensitive).
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws UnsupportedFormatError for any other extension
 */
Value load_document_file(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

// ============================================================================
// Writing
// ============================================================================

/**
 * @brief Serialize a document as TOML text.
 *
 * TOML has no null: nulls are written as empty strings. A non-object root
 * is written under the key "value".
 */
std::string to_toml_string(const Value& doc);

/**
 * @brief Write a document as indented JSON.
 * @throws DocpathError if the file cannot be opened
 */
void write_json_file(const std::string& path, const Value& doc, int indent = 2);

/**
 * @brief Write a document as TOML.
 * @throws DocpathError if the file cannot be opened
 */
void write_toml_file(const std::string& path, const Value& doc);

/**
 * @brief Write a document, choosing the format by extension.
 * @throws UnsupportedFormatError for extensions other than .json/.toml
 */
void write_document_file(const std::string& path, const Value& doc, int indent = 2);

} // namespace docpath

#endif // DOCPATH_LOADER_HPP
