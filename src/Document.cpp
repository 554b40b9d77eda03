/**
 * @file Document.cpp
 * @brief Document tree lookup and JSON interchange reader
 */

#include "shapeql/Document.hpp"
#include "shapeql/Errors.hpp"

#include <algorithm>

namespace shapeql {

namespace {

std::string read_string(const Value& obj, const std::string& key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw DocumentFormatError(where, "missing member '" + key + "'");
    }
    if (!it->is_string()) {
        throw DocumentFormatError(where + "." + key, "expected string, found " + type_name(*it));
    }
    return it->get<std::string>();
}

const Value* optional_array(const Value& obj, const std::string& key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_array()) {
        throw DocumentFormatError(where + "." + key, "expected array, found " + type_name(*it));
    }
    return &*it;
}

std::vector<Directive> read_directives(const Value& obj, const std::string& where) {
    std::vector<Directive> directives;
    const Value* list = optional_array(obj, "directives", where);
    if (list == nullptr) {
        return directives;
    }
    for (size_t i = 0; i < list->size(); ++i) {
        const auto& entry = (*list)[i];
        const std::string dwhere = where + ".directives[" + std::to_string(i) + "]";
        if (!entry.is_object()) {
            throw DocumentFormatError(dwhere, "expected object, found " + type_name(entry));
        }
        Directive directive;
        directive.name = read_string(entry, "name", dwhere);
        auto args = entry.find("arguments");
        if (args != entry.end() && !args->is_null()) {
            if (!args->is_object()) {
                throw DocumentFormatError(dwhere + ".arguments",
                                          "expected object, found " + type_name(*args));
            }
            directive.arguments = *args;
        }
        directives.push_back(std::move(directive));
    }
    return directives;
}

std::vector<SelectionNode> read_selections(const Value& obj, const std::string& where);

SelectionNode read_selection(const Value& entry, const std::string& where) {
    if (!entry.is_object()) {
        throw DocumentFormatError(where, "expected object, found " + type_name(entry));
    }

    SelectionNode node;
    if (entry.contains("field")) {
        node.kind = SelectionNode::Kind::Field;
        node.name = read_string(entry, "field", where);
        if (entry.contains("alias") && !entry["alias"].is_null()) {
            node.alias = read_string(entry, "alias", where);
        }
        auto args = entry.find("arguments");
        if (args != entry.end() && !args->is_null()) {
            if (!args->is_object()) {
                throw DocumentFormatError(where + ".arguments",
                                          "expected object, found " + type_name(*args));
            }
            node.arguments = *args;
        }
    } else if (entry.contains("spread")) {
        node.kind = SelectionNode::Kind::FragmentSpread;
        node.name = read_string(entry, "spread", where);
    } else if (entry.contains("inline")) {
        node.kind = SelectionNode::Kind::InlineFragment;
        const Value& cond = entry["inline"];
        if (cond.is_string()) {
            node.type_condition = cond.get<std::string>();
        } else if (!cond.is_null()) {
            throw DocumentFormatError(where + ".inline",
                                      "expected type name or null, found " + type_name(cond));
        }
    } else {
        throw DocumentFormatError(where, "selection needs one of 'field', 'spread', 'inline'");
    }

    node.directives = read_directives(entry, where);
    node.selections = read_selections(entry, where);
    return node;
}

std::vector<SelectionNode> read_selections(const Value& obj, const std::string& where) {
    std::vector<SelectionNode> out;
    const Value* list = optional_array(obj, "selections", where);
    if (list == nullptr) {
        return out;
    }
    out.reserve(list->size());
    for (size_t i = 0; i < list->size(); ++i) {
        out.push_back(read_selection((*list)[i], where + ".selections[" + std::to_string(i) + "]"));
    }
    return out;
}

std::vector<VariableDefinition> read_variables(const Value& obj, const std::string& where) {
    std::vector<VariableDefinition> out;
    const Value* list = optional_array(obj, "variables", where);
    if (list == nullptr) {
        return out;
    }
    for (size_t i = 0; i < list->size(); ++i) {
        const auto& entry = (*list)[i];
        const std::string vwhere = where + ".variables[" + std::to_string(i) + "]";
        if (!entry.is_object()) {
            throw DocumentFormatError(vwhere, "expected object, found " + type_name(entry));
        }
        VariableDefinition def;
        def.name = read_string(entry, "name", vwhere);
        def.type = parse_type_ref(read_string(entry, "type", vwhere));
        auto dv = entry.find("defaultValue");
        if (dv != entry.end()) {
            def.default_value = *dv;
        }
        out.push_back(std::move(def));
    }
    return out;
}

} // anonymous namespace

const OperationDefinition* Document::find_operation(const std::string& name) const {
    if (name.empty()) {
        return operations.size() == 1 ? &operations.front() : nullptr;
    }
    auto it = std::find_if(operations.begin(), operations.end(),
                           [&](const OperationDefinition& op) { return op.name == name; });
    return it == operations.end() ? nullptr : &*it;
}

const FragmentDefinition* Document::find_fragment(const std::string& name) const {
    auto it = std::find_if(fragments.begin(), fragments.end(),
                           [&](const FragmentDefinition& f) { return f.name == name; });
    return it == fragments.end() ? nullptr : &*it;
}

const Directive* find_directive(const std::vector<Directive>& directives,
                                const std::string& name) {
    auto it = std::find_if(directives.begin(), directives.end(),
                           [&](const Directive& d) { return d.name == name; });
    return it == directives.end() ? nullptr : &*it;
}

Document document_from_json(const Value& json) {
    if (!json.is_object()) {
        throw DocumentFormatError("document", "expected object, found " + type_name(json));
    }

    Document doc;
    if (const Value* ops = optional_array(json, "operations", "document")) {
        for (size_t i = 0; i < ops->size(); ++i) {
            const auto& entry = (*ops)[i];
            const std::string where = "document.operations[" + std::to_string(i) + "]";
            if (!entry.is_object()) {
                throw DocumentFormatError(where, "expected object, found " + type_name(entry));
            }
            OperationDefinition op;
            op.kind = entry.contains("kind")
                          ? parse_operation_kind(read_string(entry, "kind", where))
                          : OperationKind::Query;
            op.name = entry.contains("name") ? read_string(entry, "name", where) : "";
            op.variables = read_variables(entry, where);
            op.directives = read_directives(entry, where);
            op.selections = read_selections(entry, where);
            doc.operations.push_back(std::move(op));
        }
    }

    if (const Value* frags = optional_array(json, "fragments", "document")) {
        for (size_t i = 0; i < frags->size(); ++i) {
            const auto& entry = (*frags)[i];
            const std::string where = "document.fragments[" + std::to_string(i) + "]";
            if (!entry.is_object()) {
                throw DocumentFormatError(where, "expected object, found " + type_name(entry));
            }
            FragmentDefinition frag;
            frag.name = read_string(entry, "name", where);
            frag.type_condition = read_string(entry, "typeCondition", where);
            frag.directives = read_directives(entry, where);
            frag.selections = read_selections(entry, where);
            doc.fragments.push_back(std::move(frag));
        }
    }

    return doc;
}

} // namespace shapeql
