/**
 * @file ResponsePath.hpp
 * @brief Paths into decoded response trees
 *
 * A response path is a sequence of segments, each either a response key
 * (object member) or a list index. The dotted text form
 * "computers.0.screen" is used in error messages and on the command line;
 * the JSON form ["computers", 0, "screen"] is the one carried by
 * incremental patches.
 */

#ifndef SHAPEQL_RESPONSEPATH_HPP
#define SHAPEQL_RESPONSEPATH_HPP

#include "shapeql/Value.hpp"
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace shapeql {

/// Response key or list index
using PathSegment = std::variant<std::string, std::size_t>;

using ResponsePath = std::vector<PathSegment>;

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["computers", 0, "screen"] → "computers.0.screen"
 * - [] → ""
 */
std::string format_path(const ResponsePath& path);

/**
 * @brief Split a dotted path into segments
 *
 * All-digit segments (no leading zeros except "0") become list indices.
 *
 * Examples:
 * - "computers.0.screen" → ["computers", 0, "screen"]
 * - "" → []
 */
ResponsePath parse_path(const std::string& text);

/**
 * @brief Read a path from its JSON array form
 * @throws DocumentFormatError if value is not an array of strings and
 *         non-negative integers
 */
ResponsePath path_from_json(const Value& value);

/**
 * @brief Render a path as a JSON array
 */
Value path_to_json(const ResponsePath& path);

/**
 * @brief Append a key segment, returning the extended path
 */
ResponsePath child_path(const ResponsePath& parent, const std::string& key);

/**
 * @brief Append an index segment, returning the extended path
 */
ResponsePath child_path(const ResponsePath& parent, std::size_t index);

/**
 * @brief Look up the value at a path
 *
 * Key segments traverse objects, index segments traverse arrays.
 *
 * @return Pointer to the value, or nullptr if any segment is missing or
 *         addresses the wrong container kind
 */
const Value* find_by_path(const Value& root, const ResponsePath& path);

/**
 * @brief Mutable lookup of the value at a path (strict)
 *
 * @throws UnresolvablePatchPath naming the first segment that fails
 */
Value& at_path(Value& root, const ResponsePath& path);

/**
 * @brief Check whether `prefix` is a leading sub-sequence of `path`
 */
bool has_prefix(const ResponsePath& path, const ResponsePath& prefix);

} // namespace shapeql

#endif // SHAPEQL_RESPONSEPATH_HPP
