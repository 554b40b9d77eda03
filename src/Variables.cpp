/**
 * @file Variables.cpp
 * @brief Variable resolution and cache keys
 */

#include "shapeql/Variables.hpp"
#include "shapeql/Errors.hpp"

#include <nlohmann/json.hpp>

namespace shapeql {

bool is_variable_ref(const Value& value) {
    if (!value.is_object() || value.size() != 2) {
        return false;
    }
    auto kind = value.find("kind");
    auto name = value.find("variableName");
    return kind != value.end() && kind->is_string() && kind->get<std::string>() == "Variable" &&
           name != value.end() && name->is_string();
}

void collect_variable_refs(const Value& value, std::set<std::string>& out) {
    if (is_variable_ref(value)) {
        out.insert(value["variableName"].get<std::string>());
        return;
    }
    if (is_container(value)) {
        for (const auto& item : value) {
            collect_variable_refs(item, out);
        }
    }
}

Value resolve_variables(const CanonicalTree& tree, const Value& provided) {
    if (!provided.is_null() && !provided.is_object()) {
        throw DocumentFormatError("variables", "expected object, found " + type_name(provided));
    }

    Value resolved = provided.is_null() ? Value::object() : provided;
    for (const auto& def : tree.variables()) {
        if (!resolved.contains(def.name) && def.default_value) {
            resolved[def.name] = *def.default_value;
        }
    }

    for (const auto& name : tree.referenced_variables()) {
        if (!resolved.contains(name)) {
            throw MissingVariable(name);
        }
    }
    return resolved;
}

Value resolve_arguments(const Value& arguments, const Value& variables) {
    if (is_variable_ref(arguments)) {
        const std::string name = arguments["variableName"].get<std::string>();
        auto it = variables.find(name);
        if (it == variables.end()) {
            throw MissingVariable(name);
        }
        return *it;
    }

    if (arguments.is_object()) {
        Value out = Value::object();
        for (auto it = arguments.begin(); it != arguments.end(); ++it) {
            out[it.key()] = resolve_arguments(it.value(), variables);
        }
        return out;
    }
    if (arguments.is_array()) {
        Value out = Value::array();
        for (const auto& item : arguments) {
            out.push_back(resolve_arguments(item, variables));
        }
        return out;
    }
    return arguments;
}

bool is_included(const Field& field, const Value& variables) {
    if (field.conditions.empty()) {
        return true;
    }

    for (const auto& set : field.conditions) {
        bool holds = true;
        for (const auto& cond : set) {
            bool value = false;
            if (cond.literal) {
                value = *cond.literal;
            } else {
                auto it = variables.find(cond.variable);
                if (it == variables.end()) {
                    throw MissingVariable(cond.variable);
                }
                if (!it->is_boolean()) {
                    throw TypeMismatch("$" + cond.variable, "boolean", type_name(*it));
                }
                value = it->get<bool>();
            }
            if (value == cond.inverted) {
                holds = false;
                break;
            }
        }
        if (holds) {
            return true;
        }
    }
    return false;
}

std::string cache_key(const Field& field, const Value& variables) {
    if (field.arguments.is_null() || field.arguments.empty()) {
        return field.schema_field_name;
    }
    // nlohmann::json (unlike ordered_json) keeps object keys sorted
    const nlohmann::json sorted = nlohmann::json::parse(
        resolve_arguments(field.arguments, variables).dump());
    return field.schema_field_name + "(" + sorted.dump() + ")";
}

} // namespace shapeql
