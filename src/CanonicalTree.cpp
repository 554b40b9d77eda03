/**
 * @file CanonicalTree.cpp
 * @brief Compilation of merged selections into shape nodes
 */

#include "shapeql/CanonicalTree.hpp"
#include "shapeql/Errors.hpp"
#include "shapeql/Merge.hpp"
#include "shapeql/Variables.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace shapeql {

namespace {

std::string join(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

Field discriminator_field(const std::string& response_key) {
    Field field;
    field.response_key = response_key;
    field.schema_field_name = "__typename";
    field.type = TypeRef::named("String", false);
    field.kind = TypeKind::Scalar;
    return field;
}

void collect_field_variables(const Field& field, std::set<std::string>& out) {
    collect_variable_refs(field.arguments, out);
    for (const auto& set : field.conditions) {
        for (const auto& cond : set) {
            if (!cond.literal) out.insert(cond.variable);
        }
    }
    for (const auto& child : field.sub_selection) {
        collect_field_variables(child, out);
    }
    for (const auto& fragment : field.fragments.fragments) {
        for (const auto& child : fragment.fields) {
            collect_field_variables(child, out);
        }
    }
}

Value describe_node(const ShapeNode& node);

Value describe_field(const ShapeNode& node, std::size_t index) {
    const Field& field = node.fields()[index];
    Value out = Value::object();
    out["key"] = field.response_key;
    out["field"] = field.schema_field_name;
    out["type"] = field.type.to_string();
    if (!field.arguments.is_null() && !field.arguments.empty()) {
        out["arguments"] = field.arguments;
    }
    out["origins"] = Value(field.origin_paths);
    if (field.deferral) {
        Value deferral = Value::object();
        deferral["label"] = field.deferral->label ? Value(*field.deferral->label) : Value();
        if (field.deferral->type_condition) {
            deferral["typeCondition"] = *field.deferral->type_condition;
        }
        out["deferred"] = deferral;
    }
    if (!field.conditions.empty()) {
        Value alternatives = Value::array();
        for (const auto& set : field.conditions) {
            Value all = Value::array();
            for (const auto& cond : set) {
                std::string text = cond.inverted ? "skip:" : "include:";
                text += cond.literal ? (*cond.literal ? "true" : "false") : "$" + cond.variable;
                all.push_back(text);
            }
            alternatives.push_back(all);
        }
        out["conditions"] = alternatives;
    }
    if (const ShapeNode* child = node.child(index)) {
        out["selection"] = describe_node(*child);
    }
    return out;
}

Value describe_node(const ShapeNode& node) {
    Value out = Value::object();
    out["type"] = node.type_name();
    Value fields = Value::array();
    for (std::size_t i = 0; i < node.fields().size(); ++i) {
        fields.push_back(describe_field(node, i));
    }
    out["fields"] = fields;

    if (!node.fragments().empty()) {
        Value fragments = Value::array();
        for (const auto& shape : node.fragments()) {
            Value f = Value::object();
            f["accessor"] = shape.accessor;
            f["typeCondition"] = shape.type_condition;
            f["fields"] = Value(shape.field_keys);
            if (shape.deferral) {
                f["deferred"] = shape.deferral->label ? Value(*shape.deferral->label) : Value(true);
            }
            fragments.push_back(f);
        }
        out["fragments"] = fragments;
    }

    if (node.is_polymorphic()) {
        out["discriminator"] = node.discriminator();
        out["catchAll"] = node.catch_all();
        Value variants = Value::array();
        for (const auto& variant : node.variants()) {
            Value v = describe_node(*variant.node);
            v["types"] = Value(variant.type_names);
            v["applied"] = Value(variant.fragments);
            variants.push_back(v);
        }
        out["variants"] = variants;
    }
    return out;
}

} // anonymous namespace

// ----------------------------------------------------------------------------
// ShapeNode
// ----------------------------------------------------------------------------

std::optional<std::size_t> ShapeNode::index_of(const std::string& response_key) const {
    auto it = index_.find(response_key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const ShapeNode* ShapeNode::child(std::size_t index) const {
    return index < children_.size() ? children_[index].get() : nullptr;
}

const ShapeNode* ShapeNode::variant_for(const std::string& concrete_type) const {
    for (const auto& variant : variants_) {
        if (contains(variant.type_names, concrete_type)) {
            return variant.node.get();
        }
    }
    return nullptr;
}

const FragmentShape* ShapeNode::fragment(const std::string& accessor) const {
    for (const auto& shape : fragments_) {
        if (shape.accessor == accessor) {
            return &shape;
        }
    }
    return nullptr;
}

// ----------------------------------------------------------------------------
// TreeCompiler
// ----------------------------------------------------------------------------

class TreeCompiler {
public:
    TreeCompiler(const Schema& schema, const TreeOptions& options)
        : schema_(schema)
        , options_(options)
    {}

    std::unique_ptr<ShapeNode> compile(const std::string& type_name,
                                       const std::vector<Field>& fields,
                                       const FragmentSet& fragments,
                                       const std::string& path) {
        if (fragments.fragments.empty()) {
            return make_node(type_name, fields, path);
        }

        std::vector<Field> base = fields;
        const bool has_discriminator =
            std::any_of(base.begin(), base.end(), [&](const Field& f) {
                return f.response_key == options_.typename_field;
            });
        if (options_.add_typename && !has_discriminator) {
            base.insert(base.begin(), discriminator_field(options_.typename_field));
        }

        std::unique_ptr<ShapeNode> node = make_node(type_name, base, path);
        node->polymorphic_ = true;
        node->catch_all_ = options_.catch_all == TreeOptions::CatchAll::Enabled;
        node->discriminator_ = options_.typename_field;

        for (const auto& fragment : fragments.fragments) {
            FragmentShape shape;
            shape.identity = fragment.identity();
            auto accessor = fragments.accessors.find(shape.identity);
            shape.accessor =
                accessor != fragments.accessors.end() ? accessor->second : accessor_name(fragment);
            shape.type_condition = fragment.type_condition;
            shape.possible_types = schema_.possible_types(fragment.type_condition);
            for (const auto& field : fragment.fields) {
                shape.field_keys.push_back(field.response_key);
            }
            shape.deferral = fragment.deferral;
            node->fragments_.push_back(std::move(shape));
        }

        // Group concrete types by the fragments that apply to them. Types no
        // fragment applies to get no variant and go through the catch-all.
        for (const auto& concrete : schema_.possible_types(type_name)) {
            std::vector<std::string> applied;
            for (const auto& shape : node->fragments_) {
                if (contains(shape.possible_types, concrete)) {
                    applied.push_back(shape.identity);
                }
            }
            if (applied.empty()) {
                continue;
            }
            auto group = std::find_if(node->variants_.begin(), node->variants_.end(),
                                      [&](const Variant& v) { return v.fragments == applied; });
            if (group != node->variants_.end()) {
                group->type_names.push_back(concrete);
            } else {
                Variant variant;
                variant.type_names.push_back(concrete);
                variant.fragments = std::move(applied);
                node->variants_.push_back(std::move(variant));
            }
        }

        for (auto& variant : node->variants_) {
            std::vector<Field> merged = base;
            for (std::size_t i = 0; i < fragments.fragments.size(); ++i) {
                if (contains(variant.fragments, node->fragments_[i].identity)) {
                    merged = merge_fields(merged, fragments.fragments[i].fields);
                }
            }
            const std::string& variant_type =
                variant.type_names.size() == 1 ? variant.type_names.front() : type_name;
            variant.node = make_node(variant_type, merged, path);
            spdlog::trace("tree: variant at '{}' for [{}] with {} fields", path,
                          variant.type_names.front(), variant.node->fields_.size());
        }

        return node;
    }

private:
    const Schema& schema_;
    const TreeOptions& options_;

    std::unique_ptr<ShapeNode> make_node(const std::string& type_name,
                                         const std::vector<Field>& fields,
                                         const std::string& path) {
        const TypeDef* type = schema_.find_type(type_name);
        if (type == nullptr) {
            throw SchemaMismatch(path, type_name, "unknown type '" + type_name + "'");
        }

        auto node = std::make_unique<ShapeNode>(ShapeNode::Token());
        node->type_name_ = type_name;
        node->concrete_ = type->kind == TypeKind::Object;
        node->fields_ = fields;
        node->children_.reserve(fields.size());

        for (std::size_t i = 0; i < fields.size(); ++i) {
            const Field& field = fields[i];
            node->index_.emplace(field.response_key, i);
            if (field.is_composite()) {
                node->children_.push_back(compile(field.type.named_type, field.sub_selection,
                                                  field.fragments,
                                                  join(path, field.response_key)));
            } else {
                node->children_.push_back(nullptr);
            }
        }
        return node;
    }
};

// ----------------------------------------------------------------------------
// CanonicalTree
// ----------------------------------------------------------------------------

CanonicalTree::CanonicalTree(const Schema& schema, const RootSelection& selection,
                             const TreeOptions& options)
    : name_(selection.name)
    , operation_(selection.operation)
    , options_(options)
    , root_field_(canonicalize(selection.root))
    , variables_(selection.variables)
{
    TreeCompiler compiler(schema, options_);
    root_ = compiler.compile(root_field_.type.named_type, root_field_.sub_selection,
                             root_field_.fragments, "");
    collect_field_variables(root_field_, referenced_);

    spdlog::debug("tree: compiled '{}' ({} root fields, {} variables referenced)", name_,
                  root_->fields().size(), referenced_.size());
}

Value CanonicalTree::describe() const {
    Value out = Value::object();
    out["name"] = name_;
    if (operation_) {
        out["operation"] = to_string(*operation_);
    }
    Value vars = Value::array();
    for (const auto& def : variables_) {
        Value v = Value::object();
        v["name"] = def.name;
        v["type"] = def.type.to_string();
        if (def.default_value) {
            v["default"] = *def.default_value;
        }
        vars.push_back(v);
    }
    out["variables"] = vars;
    out["data"] = describe_node(*root_);
    return out;
}

CanonicalTree compile_operation(const Schema& schema, const Document& document,
                                const std::string& operation_name,
                                const TreeOptions& options) {
    return CanonicalTree(schema, build_operation(schema, document, operation_name, options.selection),
                         options);
}

CanonicalTree compile_fragment(const Schema& schema, const Document& document,
                               const std::string& fragment_name,
                               const TreeOptions& options) {
    return CanonicalTree(schema, build_fragment(schema, document, fragment_name, options.selection),
                         options);
}

std::optional<Value> fragment_data(const ShapeNode& node, const Value& object,
                                   const std::string& accessor) {
    const FragmentShape* shape = node.fragment(accessor);
    if (shape == nullptr || !object.is_object()) {
        return std::nullopt;
    }

    std::string concrete;
    auto discriminator = object.find(node.discriminator());
    if (discriminator != object.end() && discriminator->is_string()) {
        concrete = discriminator->get<std::string>();
    } else if (node.is_concrete()) {
        concrete = node.type_name();
    } else {
        return std::nullopt;
    }
    if (!contains(shape->possible_types, concrete)) {
        return std::nullopt;
    }

    Value out = Value::object();
    for (const auto& key : shape->field_keys) {
        auto it = object.find(key);
        if (it != object.end()) {
            out[key] = *it;
        }
    }
    return out;
}

} // namespace shapeql
