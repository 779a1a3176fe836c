/**
 * @file Value.hpp
 * @brief Tree node type for path-addressed documents
 *
 * Uses nlohmann::json as the underlying node model. A node is one of:
 * - Mapping (object: string-keyed, unique keys)
 * - Sequence (array: ordered, 0-indexed, heterogeneous)
 * - Leaf (null, boolean, integer, float, string)
 */

#ifndef DOCPATH_VALUE_HPP
#define DOCPATH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace docpath {

/**
 * @brief Dynamically-typed tree node
 *
 * Alias for nlohmann::json. Its value_t tag is the closed set of node
 * kinds the resolver switches over.
 */
using Value = nlohmann::json;

/**
 * @brief Node kinds as seen by the resolver
 */
enum class NodeKind {
    Mapping,
    Sequence,
    Leaf
};

/**
 * @brief Classify a Value into mapping, sequence or leaf
 */
inline NodeKind node_kind(const Value& val) {
    switch (val.type()) {
        case Value::value_t::object:
            return NodeKind::Mapping;
        case Value::value_t::array:
            return NodeKind::Sequence;
        case Value::value_t::null:
        case Value::value_t::boolean:
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
        case Value::value_t::string:
        case Value::value_t::binary:
        case Value::value_t::discarded:
            return NodeKind::Leaf;
    }
    return NodeKind::Leaf;
}

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace docpath

#endif // DOCPATH_VALUE_HPP
