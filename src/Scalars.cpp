/**
 * @file Scalars.cpp
 * @brief Built-in scalar checks and custom scalar adapters
 */

#include "shapeql/Scalars.hpp"
#include "shapeql/Errors.hpp"
#include "shapeql/Settings.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace shapeql {

namespace {

/**
 * @brief Check a value against a built-in scalar
 * @throws std::invalid_argument describing the mismatch
 */
Value coerce_builtin(const std::string& scalar, const Value& value) {
    auto fail = [&](const std::string& expected) {
        return std::invalid_argument("expected " + expected + ", found " + type_name(value));
    };

    if (scalar == "Int") {
        if (value.is_number_integer()) {
            return value;
        }
        if (value.is_number_float()) {
            const double d = value.get<double>();
            // 2^63 bounds the int64 range; the upper end is exclusive
            if (std::isfinite(d) && std::floor(d) == d && d >= -9223372036854775808.0 &&
                d < 9223372036854775808.0) {
                return static_cast<std::int64_t>(d);
            }
        }
        throw fail("integer");
    }
    if (scalar == "Float") {
        if (!value.is_number()) throw fail("number");
        return value.get<double>();
    }
    if (scalar == "String") {
        if (!value.is_string()) throw fail("string");
        return value;
    }
    if (scalar == "Boolean") {
        if (!value.is_boolean()) throw fail("boolean");
        return value;
    }
    // ID
    if (value.is_string()) {
        return value;
    }
    if (value.is_number_integer()) {
        return value.dump();
    }
    throw fail("string or integer");
}

} // anonymous namespace

ScalarRegistry ScalarRegistry::from_settings(const Settings& settings) {
    ScalarRegistry registry;
    if (!settings.contains("scalars")) {
        return registry;
    }
    const Value& scalars = settings.at("scalars");
    if (!scalars.is_object()) {
        throw ScalarCoercionError("scalars", "*", "expected a table of scalar names");
    }
    for (auto it = scalars.begin(); it != scalars.end(); ++it) {
        if (!it.value().is_string()) {
            throw ScalarCoercionError("scalars." + it.key(), it.key(),
                                      "expected the name of a built-in scalar");
        }
        registry.alias(it.key(), it.value().get<std::string>());
        spdlog::debug("scalars: '{}' coerced as '{}'", it.key(), it.value().get<std::string>());
    }
    return registry;
}

void ScalarRegistry::register_adapter(const std::string& scalar, ScalarAdapter adapter) {
    adapters_[scalar] = std::move(adapter);
}

void ScalarRegistry::alias(const std::string& scalar, const std::string& builtin) {
    if (!is_builtin_scalar(builtin)) {
        throw ScalarCoercionError("scalars." + scalar, scalar,
                                  "'" + builtin + "' is not a built-in scalar");
    }
    auto coerce = [builtin](const Value& value) { return coerce_builtin(builtin, value); };
    register_adapter(scalar, ScalarAdapter{coerce, coerce});
}

bool ScalarRegistry::has_adapter(const std::string& scalar) const {
    return adapters_.count(scalar) > 0;
}

Value ScalarRegistry::decode(const std::string& type_name, TypeKind kind, const Value& raw,
                             const ResponsePath& path) const {
    return convert(type_name, kind, raw, path, true);
}

Value ScalarRegistry::encode(const std::string& type_name, TypeKind kind, const Value& value,
                             const ResponsePath& path) const {
    return convert(type_name, kind, value, path, false);
}

Value ScalarRegistry::convert(const std::string& type_name, TypeKind kind, const Value& value,
                              const ResponsePath& path, bool decoding) const {
    if (kind == TypeKind::Enum) {
        if (!value.is_string()) {
            throw ScalarCoercionError(format_path(path), type_name,
                                      "expected enum value name, found " + shapeql::type_name(value));
        }
        return value;
    }

    auto adapter = adapters_.find(type_name);
    if (adapter != adapters_.end()) {
        const auto& fn = decoding ? adapter->second.decode : adapter->second.encode;
        if (!fn) {
            return value;
        }
        try {
            return fn(value);
        } catch (const std::exception& e) {
            throw ScalarCoercionError(format_path(path), type_name, e.what());
        }
    }

    if (is_builtin_scalar(type_name)) {
        try {
            return coerce_builtin(type_name, value);
        } catch (const std::invalid_argument& e) {
            throw ScalarCoercionError(format_path(path), type_name, e.what());
        }
    }
    return value;
}

} // namespace shapeql
