/**
 * @file Variables.hpp
 * @brief Operation variables: resolution, argument binding, cache keys
 *
 * Variable references inside arguments and directive conditions are encoded
 * as `{"kind": "Variable", "variableName": "episode"}`. They are resolved
 * against the caller-supplied map (plus operation defaults) before any
 * decode or encode work starts.
 */

#ifndef SHAPEQL_VARIABLES_HPP
#define SHAPEQL_VARIABLES_HPP

#include "shapeql/CanonicalTree.hpp"
#include "shapeql/Value.hpp"
#include <set>
#include <string>

namespace shapeql {

/**
 * @brief Check whether a value is a variable reference
 */
bool is_variable_ref(const Value& value);

/**
 * @brief Collect the names of all variable references inside a value
 */
void collect_variable_refs(const Value& value, std::set<std::string>& out);

/**
 * @brief Build the effective variable map of an operation
 *
 * Supplied values win over declared defaults. Supplied variables that the
 * operation does not declare are kept.
 *
 * @param provided Object of supplied values (null is treated as empty)
 * @throws MissingVariable if a referenced variable is neither supplied nor
 *         defaulted
 * @throws DocumentFormatError if `provided` is not an object
 */
Value resolve_variables(const CanonicalTree& tree, const Value& provided);

/**
 * @brief Replace every variable reference inside `arguments`
 * @throws MissingVariable for references missing from `variables`
 */
Value resolve_arguments(const Value& arguments, const Value& variables);

/**
 * @brief Evaluate a field's @include/@skip conditions
 * @throws MissingVariable if a condition variable is missing
 * @throws TypeMismatch if a condition variable is not a boolean
 */
bool is_included(const Field& field, const Value& variables);

/**
 * @brief Cache key of a field under a variable map
 *
 * Examples:
 * - `name` → "name"
 * - `hero(episode: $ep)` with ep = "JEDI" → "hero({\"episode\":\"JEDI\"})"
 *
 * Argument keys are sorted so equivalent argument sets give equal keys.
 */
std::string cache_key(const Field& field, const Value& variables);

} // namespace shapeql

#endif // SHAPEQL_VARIABLES_HPP
