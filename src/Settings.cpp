/**
 * @file Settings.cpp
 * @brief Layered configuration loading
 */

#include "shapeql/Settings.hpp"
#include "shapeql/Errors.hpp"
#include "shapeql/Loader.hpp"
#include "shapeql/Parse.hpp"

#include <sstream>

namespace shapeql {

namespace {

std::vector<std::string> split_dot(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

const Value* find_dot(const Value& root, const std::string& path) {
    const Value* current = &root;
    for (const auto& part : split_dot(path)) {
        if (!current->is_object()) return nullptr;
        auto it = current->find(part);
        if (it == current->end()) return nullptr;
        current = &*it;
    }
    return current;
}

} // anonymous namespace

void deep_merge(Value& base, const Value& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        base = overlay;
        return;
    }
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto& key = it.key();
        if (base.contains(key) && base[key].is_object() && it.value().is_object()) {
            deep_merge(base[key], it.value());
        } else {
            base[key] = it.value();
        }
    }
}

Value SettingsOptions::default_values() {
    Value defaults = Value::object();
    defaults["codec"]["typename_field"] = "__typename";
    defaults["codec"]["add_typename"] = true;
    defaults["log"]["level"] = "warn";
    return defaults;
}

Settings Settings::load(const SettingsOptions& opts) {
    Value merged = Value::object();

    // 1) defaults
    deep_merge(merged, opts.defaults);

    // 2) file
    if (opts.file_path.has_value()) {
        deep_merge(merged, load_value_file(*opts.file_path));
    }

    Settings settings(merged);

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        settings.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    settings.apply_overrides(opts.overrides);

    // 5) mandatory
    settings.enforce_mandatory(opts.mandatory);

    return settings;
}

const Value& Settings::at(const std::string& path) const {
    const Value* found = find_dot(data_, path);
    if (found == nullptr) {
        throw DocumentFormatError(path, "no such configuration key");
    }
    return *found;
}

bool Settings::contains(const std::string& path) const {
    return find_dot(data_, path) != nullptr;
}

void Settings::set(const std::string& path, const Value& v) {
    Value* current = &data_;
    const auto parts = split_dot(path);
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!current->is_object()) {
            *current = Value::object();
        }
        if (i + 1 == parts.size()) {
            (*current)[parts[i]] = v;
        } else {
            current = &(*current)[parts[i]];
        }
    }
}

void Settings::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        if (!contains(k)) missing.push_back(k);
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);
}

void Settings::apply_env_prefix(const std::string& prefix) {
    for (const auto& [name, value] : collect_env_vars(prefix)) {
        const std::string key = transform_env_name(name);
        if (key.empty()) continue;
        set(key, parse_value(value));
        spdlog::debug("settings: '{}' taken from environment", key);
    }
}

void Settings::apply_overrides(const std::map<std::string, Value>& kv) {
    for (const auto& [k, v] : kv) {
        set(k, v);
    }
}

TreeOptions Settings::tree_options() const {
    enforce_mandatory({"codec.catch_all"});
    const Value& catch_all = at("codec.catch_all");
    if (!catch_all.is_boolean()) {
        throw DocumentFormatError("codec.catch_all", "expected boolean, found " + type_name(catch_all));
    }

    TreeOptions options(catch_all.get<bool>() ? TreeOptions::CatchAll::Enabled
                                              : TreeOptions::CatchAll::Disabled);
    options.typename_field = get<std::string>("codec.typename_field", options.typename_field);
    options.add_typename = get<bool>("codec.add_typename", options.add_typename);
    return options;
}

spdlog::level::level_enum Settings::log_level() const {
    const std::string name = get<std::string>("log.level", "warn");
    const auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        throw DocumentFormatError("log.level", "unknown level '" + name + "'");
    }
    return level;
}

} // namespace shapeql
