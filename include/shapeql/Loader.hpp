/**
 * @file Loader.hpp
 * @brief File and environment loading
 *
 * Loads the inputs of the command-line tool and the configuration layers:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 * - environment variables under a prefix
 */

#ifndef SHAPEQL_LOADER_HPP
#define SHAPEQL_LOADER_HPP

#include "shapeql/Value.hpp"
#include <string>
#include <utility>
#include <vector>

namespace shapeql {

/**
 * @brief Load a JSON file
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file; tables map to nested objects
 *
 * Dates and times are converted to their TOML text form.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if TOML syntax is invalid (with line and column)
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a file, picking the format by extension
 *
 * - empty path → empty object (no file loaded)
 * - ".toml" → TOML
 * - anything else → JSON
 *
 * @throws FileNotFoundError, ParseError
 */
Value load_value_file(const std::string& path);

/**
 * @brief Get file extension (lowercase, including the dot)
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Turn an environment variable name into a dot path
 *
 * Lowercases the name, maps "_" to "." and "__" to a literal "_".
 *
 * Examples:
 * - "CODEC_CATCH__ALL" → "codec.catch_all"
 * - "LOG_LEVEL" → "log.level"
 */
std::string transform_env_name(const std::string& name);

/**
 * @brief Environment variables starting with `PREFIX_` (case-insensitive)
 *
 * @param prefix Prefix without trailing underscore ("SHAPEQL")
 * @return (name without prefix, raw value) pairs
 */
std::vector<std::pair<std::string, std::string>> collect_env_vars(const std::string& prefix);

} // namespace shapeql

#endif // SHAPEQL_LOADER_HPP
