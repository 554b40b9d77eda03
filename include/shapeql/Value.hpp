/**
 * @file Value.hpp
 * @brief Value type for payloads, results and interchange documents
 *
 * Uses nlohmann::ordered_json as the underlying value model. Object keys keep
 * their insertion order, which is how decoded and encoded objects carry the
 * canonical field order of the tree that produced them.
 */

#ifndef SHAPEQL_VALUE_HPP
#define SHAPEQL_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace shapeql {

/**
 * @brief JSON-like value type
 *
 * Alias for nlohmann::ordered_json. Supports the full JSON value model
 * (null, boolean, integer, float, string, array, object).
 *
 * See nlohmann::json documentation for the complete API.
 */
using Value = nlohmann::ordered_json;

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

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Structural equality that ignores object key order
 *
 * ordered_json's operator== compares objects as ordered sequences. Argument
 * sets and round-tripped values must compare equal regardless of the order
 * their keys were written in.
 *
 * @return true if both values hold the same content
 */
bool equivalent(const Value& a, const Value& b);

} // namespace shapeql

#endif // SHAPEQL_VALUE_HPP
