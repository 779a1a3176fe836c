/**
 * @file Resolver.hpp
 * @brief Path-addressed read, create, update and delete on a document tree
 *
 * All operations take the tree root (a mapping), a path such as
 * "one.two.three[1]" and a separator (empty means "."). Each one tokenizes
 * the path and descends the tree recursively, one frame per segment.
 *
 * Behavior:
 * - get_path() never mutates the tree and returns the addressed node by value
 * - create_path() fails with AlreadyExists if the path already resolves
 * - update_path() replaces in place when the path resolves, else creates
 * - delete_path() fails with the get_path() error if the path does not resolve
 * - Writes validate existence, kind and bounds before mutating, so a failed
 *   call leaves the tree untouched
 *
 * Indices: a read, in-place update or delete needs 0 <= index < length.
 * Writing at index == length appends.
 */

#ifndef DOCPATH_RESOLVER_HPP
#define DOCPATH_RESOLVER_HPP

#include "Value.hpp"
#include "Errors.hpp"
#include "PathTokenizer.hpp"
#include <string>

namespace docpath {

/**
 * @brief Read the value at a path
 *
 * @param tree Root mapping
 * @param path Delimited path; the bare separator addresses the root
 * @param separator Path separator ("" means ".")
 * @return Copy of the addressed node. When a non-mapping value sits above
 *         the remaining segments, the one-entry mapping {property: value}
 *         is returned instead.
 * @throws PropertyNotExist if a segment is absent
 * @throws NotAnArray if an indexed segment targets a non-sequence
 * @throws IndexOutOfRange if an index is outside [0, length)
 * @throws InvalidIndexType if an index token is not a usable integer
 * @throws TypeError if tree is not a mapping
 *
 * Examples:
 * ```cpp
 * Value doc = {{"one", {{"two", {{"three", {1, 2, 3}}}}}}};
 * get_path(doc, "one.two.three[1]");   // 2
 * get_path(doc, ".");                  // whole document
 * get_path(doc, "one.two.three[9]");   // throws IndexOutOfRange("three", 3)
 * get_path(doc, "one.two.three.four"); // {"three": [1, 2, 3]}
 * ```
 */
Value get_path(const Value& tree, const std::string& path,
               const std::string& separator = kDefaultSeparator);

/**
 * @brief Locate the node at a path without copying
 *
 * @return Pointer into tree, or nullptr if the path does not resolve to a
 *         node of the tree (including the leaf-wrapping case of get_path)
 * @throws TypeError if tree is not a mapping
 */
const Value* find_path(const Value& tree, const std::string& path,
                       const std::string& separator = kDefaultSeparator);

/**
 * @brief Check if get_path() would succeed
 *
 * Resolution failures (including malformed indices) yield false.
 *
 * @throws TypeError if tree is not a mapping
 */
bool contains_path(const Value& tree, const std::string& path,
                   const std::string& separator = kDefaultSeparator);

/**
 * @brief Create a value at a path that does not resolve yet
 *
 * Parent containers must already exist. An indexed last segment appends
 * when index == length; an index beyond the length drops the value.
 *
 * @throws AlreadyExists if get_path() on the same path succeeds
 * @throws PropertyNotExist, NotAnArray, IndexOutOfRange, InvalidIndexType
 *         for an unreachable parent
 * @throws TypeError if tree is not a mapping
 *
 * Examples:
 * ```cpp
 * create_path(doc, "one.added", "x");          // new key under "one"
 * create_path(doc, "one.two.three[3]", "x");   // appends to three
 * create_path(doc, "one", "x");                // throws AlreadyExists("one")
 * ```
 */
void create_path(Value& tree, const std::string& path, const Value& value,
                 const std::string& separator = kDefaultSeparator);

/**
 * @brief Replace the value at a path, or create it if absent
 *
 * When the path does not resolve the call behaves exactly as
 * create_path(). Writing at index == length appends.
 *
 * @throws Whatever create_path() throws when the path does not resolve
 * @throws TypeError if tree is not a mapping
 */
void update_path(Value& tree, const std::string& path, const Value& value,
                 const std::string& separator = kDefaultSeparator);

/**
 * @brief Remove the value at a path
 *
 * The root path clears the document. Removing a sequence element shifts
 * the following elements down. A mapping element of a sequence left empty
 * by a deeper delete is removed from its sequence as well.
 *
 * @throws Whatever get_path() throws for the same path
 */
void delete_path(Value& tree, const std::string& path,
                 const std::string& separator = kDefaultSeparator);

} // namespace docpath

#endif // DOCPATH_RESOLVER_HPP
