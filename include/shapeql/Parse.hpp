/**
 * @file Parse.hpp
 * @brief String-to-Value parsing for environment variables and --set overrides
 *
 * Parsing order (first match wins):
 * - Boolean ("true", "false", case insensitive)
 * - Null ("null", case insensitive)
 * - Integer (^-?[0-9]+$)
 * - Float (^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON compound ({...} or [...])
 * - Quoted string ("...")
 * - Raw string (fallback)
 */

#ifndef SHAPEQL_PARSE_HPP
#define SHAPEQL_PARSE_HPP

#include "shapeql/Value.hpp"
#include <string>
#include <utility>

namespace shapeql {

/**
 * @brief Parse string value to appropriate type
 *
 * Examples:
 * ```cpp
 * parse_value("true")       // → true (boolean)
 * parse_value("FALSE")      // → false (boolean)
 * parse_value("null")       // → null
 * parse_value("42")         // → 42 (integer)
 * parse_value("-2.5e10")    // → -2.5e10 (float)
 * parse_value("{\"a\":1}")  // → {"a": 1} (object)
 * parse_value("\"hello\"")  // → "hello" (string, unquoted)
 * parse_value("DateTime")   // → "DateTime" (string)
 * parse_value("")           // → "" (empty string)
 * ```
 */
Value parse_value(const std::string& str);

/**
 * @brief Split a "key=value" override and type its value with parse_value()
 *
 * Example:
 * ```cpp
 * auto [key, value] = parse_assignment("codec.catch_all=true");
 * // key = "codec.catch_all", value = true
 * ```
 *
 * @throws ParseError if there is no '=' or the key is empty
 */
std::pair<std::string, Value> parse_assignment(const std::string& text);

} // namespace shapeql

#endif // SHAPEQL_PARSE_HPP
