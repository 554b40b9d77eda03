/**
 * @file Schema.cpp
 * @brief Schema type graph and its JSON interchange reader
 */

#include "shapeql/Schema.hpp"
#include "shapeql/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace shapeql {

namespace {

const std::vector<std::string> BUILTIN_SCALARS = {"Int", "Float", "String", "Boolean", "ID"};

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

// ----------------------------------------------------------------------------
// Type notation parser: Type := Name '!'? | '[' Type ']' '!'?
// ----------------------------------------------------------------------------

class TypeRefParser {
public:
    explicit TypeRefParser(const std::string& text) : text_(text) {}

    TypeRef parse() {
        TypeRef ref = parse_type();
        skip_ws();
        if (pos_ != text_.size()) {
            fail("unexpected trailing characters");
        }
        return ref;
    }

private:
    const std::string& text_;
    size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& detail) const {
        throw DocumentFormatError("type '" + text_ + "'",
                                  detail + " at offset " + std::to_string(pos_));
    }

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) {
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    TypeRef parse_type() {
        if (consume('[')) {
            TypeRef inner = parse_type();
            if (!consume(']')) {
                fail("expected ']'");
            }
            const bool non_null = consume('!');
            return inner.list_of(!non_null);
        }

        skip_ws();
        const size_t start = pos_;
        while (pos_ < text_.size() &&
               (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
            ++pos_;
        }
        if (start == pos_) {
            fail("expected type name");
        }
        std::string name = text_.substr(start, pos_ - start);
        const bool non_null = consume('!');
        return TypeRef::named(std::move(name), !non_null);
    }
};

// ----------------------------------------------------------------------------
// Interchange helpers
// ----------------------------------------------------------------------------

const Value& require_member(const Value& obj, const std::string& key,
                            const std::string& location) {
    if (!obj.is_object()) {
        throw DocumentFormatError(location, "expected object, found " + type_name(obj));
    }
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw DocumentFormatError(location, "missing member '" + key + "'");
    }
    return *it;
}

std::string require_string(const Value& obj, const std::string& key,
                           const std::string& location) {
    const Value& v = require_member(obj, key, location);
    if (!v.is_string()) {
        throw DocumentFormatError(location + "." + key,
                                  "expected string, found " + type_name(v));
    }
    return v.get<std::string>();
}

std::vector<std::string> string_list(const Value& obj, const std::string& key,
                                     const std::string& location) {
    std::vector<std::string> out;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return out;
    }
    if (!it->is_array()) {
        throw DocumentFormatError(location + "." + key,
                                  "expected array, found " + type_name(*it));
    }
    for (const auto& entry : *it) {
        if (entry.is_string()) {
            out.push_back(entry.get<std::string>());
        } else if (entry.is_object() && entry.contains("name")) {
            // Introspection-style {"name": "Droid"} entries
            out.push_back(require_string(entry, "name", location + "." + key));
        } else {
            throw DocumentFormatError(location + "." + key,
                                      "expected type name, found " + type_name(entry));
        }
    }
    return out;
}

std::vector<ArgumentDef> read_arguments(const Value& field, const std::string& location) {
    std::vector<ArgumentDef> args;
    auto it = field.find("args");
    if (it == field.end() || it->is_null()) {
        return args;
    }
    if (!it->is_array()) {
        throw DocumentFormatError(location + ".args", "expected array, found " + type_name(*it));
    }
    for (size_t i = 0; i < it->size(); ++i) {
        const auto& entry = (*it)[i];
        const std::string where = location + ".args[" + std::to_string(i) + "]";
        ArgumentDef arg;
        arg.name = require_string(entry, "name", where);
        arg.type = parse_type_ref(require_string(entry, "type", where));
        auto def = entry.find("defaultValue");
        if (def != entry.end()) {
            arg.default_value = *def;
        }
        args.push_back(std::move(arg));
    }
    return args;
}

} // anonymous namespace

// ============================================================================
// Kinds
// ============================================================================

std::string to_string(TypeKind kind) {
    switch (kind) {
        case TypeKind::Scalar: return "SCALAR";
        case TypeKind::Enum: return "ENUM";
        case TypeKind::Object: return "OBJECT";
        case TypeKind::Interface: return "INTERFACE";
        case TypeKind::Union: return "UNION";
        case TypeKind::InputObject: return "INPUT_OBJECT";
    }
    return "SCALAR";
}

TypeKind parse_type_kind(const std::string& text) {
    if (text == "SCALAR") return TypeKind::Scalar;
    if (text == "ENUM") return TypeKind::Enum;
    if (text == "OBJECT") return TypeKind::Object;
    if (text == "INTERFACE") return TypeKind::Interface;
    if (text == "UNION") return TypeKind::Union;
    if (text == "INPUT_OBJECT") return TypeKind::InputObject;
    throw DocumentFormatError("kind", "unknown type kind '" + text + "'");
}

std::string to_string(OperationKind kind) {
    switch (kind) {
        case OperationKind::Query: return "query";
        case OperationKind::Mutation: return "mutation";
        case OperationKind::Subscription: return "subscription";
    }
    return "query";
}

OperationKind parse_operation_kind(const std::string& text) {
    if (text == "query") return OperationKind::Query;
    if (text == "mutation") return OperationKind::Mutation;
    if (text == "subscription") return OperationKind::Subscription;
    throw DocumentFormatError("kind", "unknown operation kind '" + text + "'");
}

// ============================================================================
// TypeRef
// ============================================================================

TypeRef TypeRef::named(std::string name, bool is_nullable) {
    TypeRef ref;
    ref.named_type = std::move(name);
    ref.nullable = {is_nullable};
    return ref;
}

TypeRef TypeRef::element() const {
    TypeRef inner = *this;
    if (inner.nullable.size() > 1) {
        inner.nullable.erase(inner.nullable.begin());
    }
    return inner;
}

TypeRef TypeRef::list_of(bool list_nullable) const {
    TypeRef outer = *this;
    outer.nullable.insert(outer.nullable.begin(), list_nullable);
    return outer;
}

std::string TypeRef::to_string() const {
    std::string text = named_type;
    if (!nullable.back()) text += '!';
    for (size_t level = nullable.size() - 1; level > 0; --level) {
        text = "[" + text + "]";
        if (!nullable[level - 1]) text += '!';
    }
    return text;
}

TypeRef parse_type_ref(const std::string& text) {
    return TypeRefParser(text).parse();
}

// ============================================================================
// TypeDef / Schema
// ============================================================================

const FieldDef* TypeDef::field(const std::string& name) const {
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const FieldDef& f) { return f.name == name; });
    return it == fields.end() ? nullptr : &*it;
}

bool is_builtin_scalar(const std::string& name) {
    return contains(BUILTIN_SCALARS, name);
}

Schema::Schema() {
    for (const auto& name : BUILTIN_SCALARS) {
        TypeDef scalar;
        scalar.name = name;
        scalar.kind = TypeKind::Scalar;
        add_type(std::move(scalar));
    }
}

void Schema::add_type(TypeDef type) {
    auto it = types_.find(type.name);
    if (it == types_.end()) {
        order_.push_back(type.name);
        std::string name = type.name;
        types_.emplace(std::move(name), std::move(type));
    } else {
        it->second = std::move(type);
    }
}

const TypeDef* Schema::find_type(const std::string& name) const {
    auto it = types_.find(name);
    return it == types_.end() ? nullptr : &it->second;
}

bool Schema::is_composite(const std::string& name) const {
    const TypeDef* type = find_type(name);
    return type != nullptr &&
           (type->kind == TypeKind::Object || type->kind == TypeKind::Interface ||
            type->kind == TypeKind::Union);
}

bool Schema::is_abstract(const std::string& name) const {
    const TypeDef* type = find_type(name);
    return type != nullptr &&
           (type->kind == TypeKind::Interface || type->kind == TypeKind::Union);
}

std::vector<std::string> Schema::possible_types(const std::string& name) const {
    const TypeDef* type = find_type(name);
    if (type == nullptr) {
        return {};
    }
    if (type->kind == TypeKind::Object) {
        return {type->name};
    }
    if (type->kind != TypeKind::Interface && type->kind != TypeKind::Union) {
        return {};
    }

    std::vector<std::string> result;
    for (const auto& member : type->possible_types) {
        if (!contains(result, member)) result.push_back(member);
    }
    if (type->kind == TypeKind::Interface) {
        for (const auto& candidate : order_) {
            const TypeDef& other = types_.at(candidate);
            if (other.kind == TypeKind::Object && contains(other.interfaces, name) &&
                !contains(result, candidate)) {
                result.push_back(candidate);
            }
        }
    }
    return result;
}

const std::string& Schema::root_type(OperationKind kind) const {
    const std::string* name = &query_type_;
    if (kind == OperationKind::Mutation) name = &mutation_type_;
    if (kind == OperationKind::Subscription) name = &subscription_type_;
    if (name->empty() || find_type(*name) == nullptr) {
        throw SchemaMismatch("", *name, "schema has no " + to_string(kind) + " root type");
    }
    return *name;
}

void Schema::set_root_type(OperationKind kind, std::string name) {
    switch (kind) {
        case OperationKind::Query: query_type_ = std::move(name); break;
        case OperationKind::Mutation: mutation_type_ = std::move(name); break;
        case OperationKind::Subscription: subscription_type_ = std::move(name); break;
    }
}

Schema Schema::from_json(const Value& json) {
    Schema schema;
    const Value& types = require_member(json, "types", "schema");
    if (!types.is_array()) {
        throw DocumentFormatError("schema.types", "expected array, found " + type_name(types));
    }

    for (size_t i = 0; i < types.size(); ++i) {
        const auto& entry = types[i];
        const std::string where = "schema.types[" + std::to_string(i) + "]";

        TypeDef type;
        type.name = require_string(entry, "name", where);
        type.kind = parse_type_kind(require_string(entry, "kind", where));
        type.interfaces = string_list(entry, "interfaces", where);
        type.possible_types = string_list(entry, "possibleTypes", where);
        type.enum_values = string_list(entry, "enumValues", where);

        auto fields = entry.find("fields");
        if (fields != entry.end() && !fields->is_null()) {
            if (!fields->is_array()) {
                throw DocumentFormatError(where + ".fields",
                                          "expected array, found " + type_name(*fields));
            }
            for (size_t j = 0; j < fields->size(); ++j) {
                const auto& f = (*fields)[j];
                const std::string fwhere = where + ".fields[" + std::to_string(j) + "]";
                FieldDef field;
                field.name = require_string(f, "name", fwhere);
                field.type = parse_type_ref(require_string(f, "type", fwhere));
                field.arguments = read_arguments(f, fwhere);
                type.fields.push_back(std::move(field));
            }
        }
        schema.add_type(std::move(type));
    }

    if (json.contains("queryType")) {
        schema.set_root_type(OperationKind::Query, require_string(json, "queryType", "schema"));
    }
    if (json.contains("mutationType")) {
        schema.set_root_type(OperationKind::Mutation,
                             require_string(json, "mutationType", "schema"));
    }
    if (json.contains("subscriptionType")) {
        schema.set_root_type(OperationKind::Subscription,
                             require_string(json, "subscriptionType", "schema"));
    }

    spdlog::debug("schema: loaded {} types", schema.type_names().size());
    return schema;
}

} // namespace shapeql
