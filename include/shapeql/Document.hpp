/**
 * @file Document.hpp
 * @brief Parsed operation/fragment document tree
 *
 * The document arrives already syntax-checked. These types only hold the
 * parts tree construction reads. Argument values are kept as Values;
 * variable references inside them use the descriptor form
 * `{"kind": "Variable", "variableName": "episode"}` at any depth.
 *
 * Interchange form read by document_from_json:
 * ```json
 * {
 *   "operations": [{
 *     "kind": "query", "name": "Hero",
 *     "variables": [{"name": "episode", "type": "Episode", "defaultValue": "JEDI"}],
 *     "selections": [
 *       {"field": "hero", "alias": "h",
 *        "arguments": {"episode": {"kind": "Variable", "variableName": "episode"}},
 *        "selections": [
 *          {"field": "name"},
 *          {"spread": "HeroDetails"},
 *          {"inline": "Droid", "directives": [{"name": "defer", "arguments": {"label": "d"}}],
 *           "selections": [{"field": "primaryFunction"}]}
 *        ]}
 *     ]
 *   }],
 *   "fragments": [{"name": "HeroDetails", "typeCondition": "Character",
 *                  "selections": [{"field": "id"}]}]
 * }
 * ```
 */

#ifndef SHAPEQL_DOCUMENT_HPP
#define SHAPEQL_DOCUMENT_HPP

#include "shapeql/Schema.hpp"
#include "shapeql/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace shapeql {

struct Directive {
    std::string name;
    Value arguments = Value::object();
};

/**
 * @brief One entry of a selection set: field, fragment spread or inline fragment
 */
struct SelectionNode {
    enum class Kind {
        Field,
        FragmentSpread,
        InlineFragment
    };

    Kind kind = Kind::Field;
    std::string name;                           ///< Field name or spread fragment name
    std::optional<std::string> alias;           ///< Field only
    std::optional<std::string> type_condition;  ///< Inline fragment only
    Value arguments = Value::object();          ///< Field only
    std::vector<Directive> directives;
    std::vector<SelectionNode> selections;

    /**
     * @brief Alias if present, else field name
     */
    const std::string& response_key() const { return alias ? *alias : name; }
};

struct VariableDefinition {
    std::string name;
    TypeRef type;
    std::optional<Value> default_value;
};

struct OperationDefinition {
    OperationKind kind = OperationKind::Query;
    std::string name;
    std::vector<VariableDefinition> variables;
    std::vector<Directive> directives;
    std::vector<SelectionNode> selections;
};

struct FragmentDefinition {
    std::string name;
    std::string type_condition;
    std::vector<Directive> directives;
    std::vector<SelectionNode> selections;
};

struct Document {
    std::vector<OperationDefinition> operations;
    std::vector<FragmentDefinition> fragments;

    /**
     * @brief Find an operation by name; an empty name selects the only operation
     * @return Operation, or nullptr if not found or ambiguous
     */
    const OperationDefinition* find_operation(const std::string& name) const;

    const FragmentDefinition* find_fragment(const std::string& name) const;
};

/**
 * @brief Find a directive by name
 * @return Directive, or nullptr if absent
 */
const Directive* find_directive(const std::vector<Directive>& directives,
                                const std::string& name);

/**
 * @brief Read a document from its JSON interchange form
 * @throws DocumentFormatError on malformed input
 */
Document document_from_json(const Value& json);

} // namespace shapeql

#endif // SHAPEQL_DOCUMENT_HPP
