/**
 * @file Schema.hpp
 * @brief Schema type graph consumed by the selection model
 *
 * The schema is supplied already validated. This header only models what
 * tree construction needs: named types and their kind, field types with
 * per-level nullability, and the possible concrete types of abstract types.
 *
 * Interchange form read by Schema::from_json:
 * ```json
 * {
 *   "queryType": "Query",
 *   "types": [
 *     {"name": "Query", "kind": "OBJECT",
 *      "fields": [{"name": "hero", "type": "Character",
 *                  "args": [{"name": "episode", "type": "Episode"}]}]},
 *     {"name": "Character", "kind": "INTERFACE",
 *      "fields": [{"name": "name", "type": "String!"}],
 *      "possibleTypes": ["Human", "Droid"]},
 *     {"name": "Episode", "kind": "ENUM", "enumValues": ["NEWHOPE", "JEDI"]}
 *   ]
 * }
 * ```
 */

#ifndef SHAPEQL_SCHEMA_HPP
#define SHAPEQL_SCHEMA_HPP

#include "shapeql/Value.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shapeql {

enum class TypeKind {
    Scalar,
    Enum,
    Object,
    Interface,
    Union,
    InputObject
};

enum class OperationKind {
    Query,
    Mutation,
    Subscription
};

/**
 * @brief Interchange name of a type kind ("SCALAR", "OBJECT", ...)
 */
std::string to_string(TypeKind kind);

/**
 * @brief Parse a type kind from its interchange name
 * @throws DocumentFormatError for unknown names
 */
TypeKind parse_type_kind(const std::string& text);

std::string to_string(OperationKind kind);

/**
 * @brief Parse "query" | "mutation" | "subscription"
 * @throws DocumentFormatError for unknown names
 */
OperationKind parse_operation_kind(const std::string& text);

/**
 * @brief Reference to a named type wrapped in zero or more lists
 *
 * `nullable` holds one flag per wrapping level, outermost first, and one
 * for the named type itself. `[Droid!]` is {true, false};
 * `[[Int]!]!` is {false, false, true}.
 */
struct TypeRef {
    std::string named_type;
    std::vector<bool> nullable{true};

    static TypeRef named(std::string name, bool is_nullable = true);

    std::size_t list_depth() const noexcept { return nullable.size() - 1; }
    bool is_list() const noexcept { return nullable.size() > 1; }
    bool is_nullable() const noexcept { return nullable.front(); }

    /**
     * @brief Type of the list elements
     * @pre is_list()
     */
    TypeRef element() const;

    /**
     * @brief Wrap in a list of the given nullability
     */
    TypeRef list_of(bool list_nullable) const;

    /**
     * @brief GraphQL notation, e.g. "[Droid!]!"
     */
    std::string to_string() const;

    bool operator==(const TypeRef& other) const {
        return named_type == other.named_type && nullable == other.nullable;
    }
    bool operator!=(const TypeRef& other) const { return !(*this == other); }
};

/**
 * @brief Parse GraphQL type notation ("String", "[Episode!]!", ...)
 * @throws DocumentFormatError on malformed notation
 */
TypeRef parse_type_ref(const std::string& text);

struct ArgumentDef {
    std::string name;
    TypeRef type;
    std::optional<Value> default_value;
};

struct FieldDef {
    std::string name;
    TypeRef type;
    std::vector<ArgumentDef> arguments;
};

struct TypeDef {
    std::string name;
    TypeKind kind = TypeKind::Scalar;
    std::vector<FieldDef> fields;
    std::vector<std::string> interfaces;      ///< Object/Interface: implemented interfaces
    std::vector<std::string> possible_types;  ///< Interface/Union: declared members
    std::vector<std::string> enum_values;

    const FieldDef* field(const std::string& name) const;
};

/**
 * @brief Named type graph
 *
 * Built-in scalars (Int, Float, String, Boolean, ID) are always present.
 */
class Schema {
public:
    Schema();

    /**
     * @brief Build a schema from its JSON interchange form
     * @throws DocumentFormatError on malformed input
     */
    static Schema from_json(const Value& json);

    /**
     * @brief Add or replace a type definition
     */
    void add_type(TypeDef type);

    /**
     * @return Type definition, or nullptr if unknown
     */
    const TypeDef* find_type(const std::string& name) const;

    bool is_composite(const std::string& name) const;
    bool is_abstract(const std::string& name) const;

    /**
     * @brief Concrete object types a value of the named type may have
     *
     * Object types yield themselves. Unions yield their members. Interfaces
     * yield their declared possible types plus every object type listing the
     * interface, in declaration order without duplicates.
     */
    std::vector<std::string> possible_types(const std::string& name) const;

    /**
     * @brief Root type name for an operation kind
     * @throws SchemaMismatch if the schema has no such root
     */
    const std::string& root_type(OperationKind kind) const;

    void set_root_type(OperationKind kind, std::string name);

    /**
     * @brief Type names in the order they were added
     */
    const std::vector<std::string>& type_names() const noexcept { return order_; }

private:
    std::map<std::string, TypeDef> types_;
    std::vector<std::string> order_;
    std::string query_type_ = "Query";
    std::string mutation_type_;
    std::string subscription_type_;
};

/**
 * @brief True for Int, Float, String, Boolean and ID
 */
bool is_builtin_scalar(const std::string& name);

} // namespace shapeql

#endif // SHAPEQL_SCHEMA_HPP
