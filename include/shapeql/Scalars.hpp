/**
 * @file Scalars.hpp
 * @brief Scalar and enum coercion for decode and encode
 *
 * Built-in scalars validate the JSON kind of a value:
 * - Int: integer (floats with an integral value are accepted and narrowed)
 * - Float: any number
 * - String: string
 * - Boolean: boolean
 * - ID: string or integer, decoded as string
 *
 * Enums must be strings. Custom scalars use a registered adapter, or pass
 * through unchanged when none is registered.
 */

#ifndef SHAPEQL_SCALARS_HPP
#define SHAPEQL_SCALARS_HPP

#include "shapeql/ResponsePath.hpp"
#include "shapeql/Schema.hpp"
#include "shapeql/Value.hpp"
#include <functional>
#include <map>
#include <string>

namespace shapeql {

class Settings;

/**
 * @brief Conversion pair for one custom scalar
 *
 * Either function may throw; the registry reports the failure as a
 * ScalarCoercionError carrying the field path.
 */
struct ScalarAdapter {
    std::function<Value(const Value&)> decode;
    std::function<Value(const Value&)> encode;
};

class ScalarRegistry {
public:
    ScalarRegistry() = default;

    /**
     * @brief Registry with adapters declared in settings
     *
     * Every `scalars.<Name> = "<BuiltIn>"` entry makes the custom scalar
     * `<Name>` coerce like the built-in scalar.
     *
     * @throws ScalarCoercionError if a target is not a built-in scalar
     */
    static ScalarRegistry from_settings(const Settings& settings);

    /**
     * @brief Register (or replace) the adapter of a custom scalar
     */
    void register_adapter(const std::string& scalar, ScalarAdapter adapter);

    /**
     * @brief Make a custom scalar coerce exactly like a built-in one
     * @throws ScalarCoercionError if `builtin` is not a built-in scalar
     */
    void alias(const std::string& scalar, const std::string& builtin);

    bool has_adapter(const std::string& scalar) const;

    /**
     * @brief Coerce a payload leaf
     *
     * @param type_name Named type of the field
     * @param kind Scalar or Enum
     * @throws ScalarCoercionError on failure
     */
    Value decode(const std::string& type_name, TypeKind kind, const Value& raw,
                 const ResponsePath& path) const;

    /**
     * @brief Coerce a value leaf for serialization
     * @throws ScalarCoercionError on failure
     */
    Value encode(const std::string& type_name, TypeKind kind, const Value& value,
                 const ResponsePath& path) const;

private:
    std::map<std::string, ScalarAdapter> adapters_;

    Value convert(const std::string& type_name, TypeKind kind, const Value& value,
                  const ResponsePath& path, bool decoding) const;
};

} // namespace shapeql

#endif // SHAPEQL_SCALARS_HPP
