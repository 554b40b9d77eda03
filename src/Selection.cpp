/**
 * @file Selection.cpp
 * @brief Selection model construction
 */

#include "shapeql/Selection.hpp"
#include "shapeql/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace shapeql {

namespace {

std::string join(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

bool is_subset(const std::vector<std::string>& inner, const std::vector<std::string>& outer) {
    return std::all_of(inner.begin(), inner.end(), [&](const std::string& name) {
        return std::find(outer.begin(), outer.end(), name) != outer.end();
    });
}

/**
 * @brief Add a conjunction to every alternative of a condition disjunction
 */
void require_conditions(std::vector<ConditionSet>& conditions, const ConditionSet& required) {
    if (required.empty()) {
        return;
    }
    if (conditions.empty()) {
        conditions.push_back(required);
        return;
    }
    for (auto& set : conditions) {
        for (const auto& cond : required) {
            if (std::find(set.begin(), set.end(), cond) == set.end()) {
                set.push_back(cond);
            }
        }
        std::sort(set.begin(), set.end());
    }
}

class SelectionBuilder {
public:
    SelectionBuilder(const Schema& schema, const Document& document,
                     const SelectionOptions& options, std::string root_name)
        : schema_(schema)
        , document_(document)
        , options_(options)
        , root_name_(std::move(root_name))
    {}

    void build_set(const std::vector<SelectionNode>& nodes,
                   const std::string& parent_type,
                   const std::string& path,
                   const std::string& origin,
                   const std::optional<Deferral>& inherited,
                   std::vector<Field>& fields,
                   FragmentSet& fragments) {
        for (size_t i = 0; i < nodes.size(); ++i) {
            const SelectionNode& node = nodes[i];
            switch (node.kind) {
                case SelectionNode::Kind::Field:
                    fields.push_back(build_field(node, parent_type, path, origin, inherited));
                    break;

                case SelectionNode::Kind::FragmentSpread: {
                    const FragmentDefinition* def = document_.find_fragment(node.name);
                    if (def == nullptr) {
                        throw SchemaMismatch(path, parent_type,
                                             "unknown fragment '" + node.name + "'");
                    }
                    if (std::find(spread_stack_.begin(), spread_stack_.end(), node.name) !=
                        spread_stack_.end()) {
                        throw SchemaMismatch(path, parent_type,
                                             "fragment cycle through '" + node.name + "'");
                    }
                    require_type(def->type_condition, path, parent_type);

                    spread_stack_.push_back(node.name);
                    add_fragment(def->name, def->type_condition, def->name,
                                 node.directives, def->selections, path, inherited, fragments);
                    spread_stack_.pop_back();
                    break;
                }

                case SelectionNode::Kind::InlineFragment: {
                    const std::string cond = node.type_condition.value_or(parent_type);
                    require_type(cond, path, parent_type);
                    const std::string inline_origin =
                        origin + "/... on " + cond + "@" + join(path, std::to_string(i));
                    add_fragment(std::nullopt, cond, inline_origin, node.directives,
                                 node.selections, path, inherited, fragments);
                    break;
                }
            }
        }
    }

private:
    const Schema& schema_;
    const Document& document_;
    const SelectionOptions& options_;
    std::string root_name_;
    std::vector<std::string> spread_stack_;
    std::map<std::string, const Directive*> labels_;

    const TypeDef& require_type(const std::string& name, const std::string& path,
                                const std::string& parent_type) const {
        const TypeDef* type = schema_.find_type(name);
        if (type == nullptr) {
            throw SchemaMismatch(path, parent_type, "unknown type '" + name + "'");
        }
        return *type;
    }

    Field build_field(const SelectionNode& node,
                      const std::string& parent_type,
                      const std::string& path,
                      const std::string& origin,
                      const std::optional<Deferral>& inherited) {
        const std::string field_path = join(path, node.response_key());

        Field field;
        field.response_key = node.response_key();
        field.schema_field_name = node.name;
        field.arguments = node.arguments;
        field.origin_paths.insert(origin);

        if (node.name == "__typename") {
            field.type = TypeRef::named("String", false);
            field.kind = TypeKind::Scalar;
        } else {
            const TypeDef& parent = require_type(parent_type, field_path, parent_type);
            const FieldDef* def = parent.field(node.name);
            if (def == nullptr) {
                throw SchemaMismatch(field_path, parent_type, "no field '" + node.name + "'");
            }
            field.type = def->type;
            field.kind = require_type(def->type.named_type, field_path, parent_type).kind;
        }

        field.deferral = read_deferral(node.directives, std::nullopt);
        if (!field.deferral) {
            field.deferral = inherited;
        }
        require_conditions(field.conditions, read_conditions(node.directives));

        if (field.is_composite()) {
            if (node.selections.empty()) {
                throw SchemaMismatch(field_path, parent_type,
                                     "composite field '" + node.name + "' needs a selection set");
            }
            build_set(node.selections, field.type.named_type, field_path, origin,
                      std::nullopt, field.sub_selection, field.fragments);
        } else if (!node.selections.empty()) {
            throw SchemaMismatch(field_path, parent_type,
                                 "leaf field '" + node.name + "' cannot have a selection set");
        }
        return field;
    }

    void add_fragment(const std::optional<std::string>& name,
                      const std::string& type_condition,
                      const std::string& origin,
                      const std::vector<Directive>& directives,
                      const std::vector<SelectionNode>& selections,
                      const std::string& path,
                      const std::optional<Deferral>& inherited,
                      FragmentSet& out) {
        Fragment fragment;
        fragment.name = name;
        fragment.type_condition = type_condition;
        fragment.origin = origin;
        fragment.origin_paths.insert(origin);
        fragment.deferral = read_deferral(directives, type_condition);
        if (!fragment.deferral) {
            fragment.deferral = inherited;
        }

        FragmentSet nested;
        build_set(selections, type_condition, path, origin, fragment.deferral,
                  fragment.fields, nested);

        const ConditionSet conditions = read_conditions(directives);
        for (auto& field : fragment.fields) {
            require_conditions(field.conditions, conditions);
        }

        // Nested fragments apply only where this one applies: hoist them with
        // this fragment's fields and the narrower of the two type conditions.
        std::vector<Fragment> hoisted;
        for (auto& inner : nested.fragments) {
            const auto inner_types = schema_.possible_types(inner.type_condition);
            const auto outer_types = schema_.possible_types(type_condition);
            if (!is_subset(inner_types, outer_types) && is_subset(outer_types, inner_types)) {
                inner.type_condition = type_condition;
                if (inner.name) {
                    inner.scope = type_condition;
                }
            }
            for (auto& field : inner.fields) {
                require_conditions(field.conditions, conditions);
            }
            inner.fields.insert(inner.fields.end(), fragment.fields.begin(), fragment.fields.end());
            inner.origin_paths.insert(fragment.origin_paths.begin(), fragment.origin_paths.end());
            hoisted.push_back(std::move(inner));
        }

        register_accessor(fragment, out);
        out.fragments.push_back(std::move(fragment));
        for (auto& inner : hoisted) {
            register_accessor(inner, out);
            out.fragments.push_back(std::move(inner));
        }
    }

    static void register_accessor(const Fragment& fragment, FragmentSet& out) {
        if (out.accessors.count(fragment.identity()) > 0) {
            return;
        }
        const std::string base = accessor_name(fragment);
        std::string handle = base;
        for (int n = 1;; ++n) {
            bool taken = false;
            for (const auto& [identity, existing] : out.accessors) {
                if (existing == handle) {
                    taken = true;
                    break;
                }
            }
            if (!taken) break;
            handle = base + std::to_string(n);
        }
        out.accessors.emplace(fragment.identity(), handle);
    }

    std::optional<Deferral> read_deferral(const std::vector<Directive>& directives,
                                          const std::optional<std::string>& type_condition) {
        const Directive* directive = find_directive(directives, options_.defer_directive);
        if (directive == nullptr) {
            return std::nullopt;
        }
        auto enabled = directive->arguments.find("if");
        if (enabled != directive->arguments.end() && enabled->is_boolean() &&
            !enabled->get<bool>()) {
            return std::nullopt;
        }

        Deferral deferral;
        deferral.type_condition = type_condition;
        auto label = directive->arguments.find("label");
        if (label != directive->arguments.end() && label->is_string()) {
            const std::string text = label->get<std::string>();
            auto seen = labels_.find(text);
            if (seen != labels_.end() && seen->second != directive) {
                throw DuplicateDeferLabel(text, root_name_);
            }
            labels_.emplace(text, directive);
            deferral.label = text;
        }
        return deferral;
    }

    static ConditionSet read_conditions(const std::vector<Directive>& directives) {
        ConditionSet conditions;
        for (const auto& directive : directives) {
            const bool skip = directive.name == "skip";
            if (!skip && directive.name != "include") {
                continue;
            }
            auto arg = directive.arguments.find("if");
            if (arg == directive.arguments.end()) {
                continue;
            }
            Condition cond;
            cond.inverted = skip;
            if (arg->is_boolean()) {
                cond.literal = arg->get<bool>();
            } else if (arg->is_object() && arg->value("kind", "") == "Variable") {
                cond.variable = arg->value("variableName", "");
            } else {
                continue;
            }
            conditions.push_back(std::move(cond));
        }
        std::sort(conditions.begin(), conditions.end());
        return conditions;
    }
};

RootSelection make_root(const Schema& schema, const std::string& name,
                        const std::string& type_name) {
    const TypeDef* type = schema.find_type(type_name);
    if (type == nullptr) {
        throw SchemaMismatch("", type_name, "unknown root type");
    }
    RootSelection root;
    root.name = name;
    root.root.response_key = "data";
    root.root.schema_field_name = "data";
    root.root.type = TypeRef::named(type_name, false);
    root.root.kind = type->kind;
    root.root.origin_paths.insert(name);
    return root;
}

} // anonymous namespace

std::string accessor_name(const Fragment& fragment) {
    if (fragment.name && !fragment.name->empty()) {
        std::string handle = *fragment.name;
        handle[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(handle[0])));
        return handle;
    }
    return "as" + fragment.type_condition;
}

RootSelection build_operation(const Schema& schema, const Document& document,
                              const std::string& operation_name,
                              const SelectionOptions& options) {
    const OperationDefinition* op = document.find_operation(operation_name);
    if (op == nullptr) {
        throw SchemaMismatch("", operation_name,
                             operation_name.empty() ? "document does not have exactly one operation"
                                                    : "unknown operation");
    }

    const std::string& root_type = schema.root_type(op->kind);
    RootSelection root = make_root(schema, op->name, root_type);
    root.operation = op->kind;
    root.variables = op->variables;

    SelectionBuilder builder(schema, document, options, op->name);
    builder.build_set(op->selections, root_type, "", op->name, std::nullopt,
                      root.root.sub_selection, root.root.fragments);

    spdlog::debug("selection: built operation '{}' on '{}' ({} fields, {} fragments)",
                  op->name, root_type, root.root.sub_selection.size(),
                  root.root.fragments.fragments.size());
    return root;
}

RootSelection build_fragment(const Schema& schema, const Document& document,
                             const std::string& fragment_name,
                             const SelectionOptions& options) {
    const FragmentDefinition* def = document.find_fragment(fragment_name);
    if (def == nullptr) {
        throw SchemaMismatch("", fragment_name, "unknown fragment");
    }

    RootSelection root = make_root(schema, def->name, def->type_condition);

    SelectionBuilder builder(schema, document, options, def->name);
    builder.build_set(def->selections, def->type_condition, "", def->name, std::nullopt,
                      root.root.sub_selection, root.root.fragments);

    spdlog::debug("selection: built fragment '{}' on '{}'", def->name, def->type_condition);
    return root;
}

} // namespace shapeql
