/**
 * @file Settings.hpp
 * @brief Layered configuration for trees, codecs and logging
 *
 * Precedence (lowest to highest):
 * defaults → file (JSON or TOML) → environment (SHAPEQL_*) → overrides,
 * followed by mandatory-key enforcement.
 *
 * Keys:
 * - codec.catch_all: bool, whether polymorphic nodes accept unknown types
 * - codec.typename_field: discriminator response key ("__typename")
 * - codec.add_typename: bool, prepend the discriminator where missing (true)
 * - scalars.<Name>: built-in scalar whose coercion custom scalar <Name> reuses
 * - log.level: spdlog level name ("warn")
 */

#ifndef SHAPEQL_SETTINGS_HPP
#define SHAPEQL_SETTINGS_HPP

#include "shapeql/CanonicalTree.hpp"
#include "shapeql/Value.hpp"
#include <spdlog/spdlog.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shapeql {

/**
 * @brief Options for building Settings from multiple sources
 */
struct SettingsOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix = std::string("SHAPEQL"); // nullopt disables env loading
    std::map<std::string, Value> overrides;                     // final precedence
    Value defaults = default_values();
    std::vector<std::string> mandatory;

    /**
     * @brief Built-in defaults (codec.typename_field, codec.add_typename, log.level)
     */
    static Value default_values();
};

/**
 * @brief Configuration tree with dot-notation helpers
 */
class Settings {
public:
    Settings() = default;
    explicit Settings(Value data) : data_(std::move(data)) {}

    /**
     * @brief Load using the precedence defaults → file → env → overrides
     * @throws FileNotFoundError, ParseError from the file layer
     * @throws MissingMandatoryConfig if a mandatory key is absent
     */
    static Settings load(const SettingsOptions& opts);

    const Value& data() const noexcept { return data_; }

    /**
     * @throws DocumentFormatError if the path does not exist
     */
    const Value& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const Value& v);

    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        if (!contains(path)) return fallback;
        try {
            return at(path).get<T>();
        } catch (const nlohmann::json::type_error&) {
            return fallback;
        }
    }

    void enforce_mandatory(const std::vector<std::string>& keys) const;

    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Value>& kv);

    /**
     * @brief Tree options from the codec.* keys
     * @throws MissingMandatoryConfig if codec.catch_all is absent
     * @throws DocumentFormatError if codec.catch_all is not a boolean
     */
    TreeOptions tree_options() const;

    /**
     * @brief spdlog level from log.level
     * @throws DocumentFormatError for an unknown level name
     */
    spdlog::level::level_enum log_level() const;

private:
    Value data_ = Value::object();
};

/**
 * @brief Recursively merge `overlay` into `base`; objects merge, anything else replaces
 */
void deep_merge(Value& base, const Value& overlay);

} // namespace shapeql

#endif // SHAPEQL_SETTINGS_HPP
