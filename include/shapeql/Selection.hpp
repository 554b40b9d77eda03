/**
 * @file Selection.hpp
 * @brief Selection model: fields and fragments resolved against a schema
 *
 * build_operation() and build_fragment() turn a document tree into Field and
 * Fragment nodes with resolved types. No merging happens here: sibling
 * fields sharing a response key stay separate and fragments carry only
 * their own selections. See Merge.hpp for unification.
 *
 * Directive handling:
 * - @include/@skip are kept as static `conditions`, never evaluated
 * - @defer becomes `deferral` on the field or fragment it annotates; the
 *   fragment's own fields carry it too
 */

#ifndef SHAPEQL_SELECTION_HPP
#define SHAPEQL_SELECTION_HPP

#include "shapeql/Document.hpp"
#include "shapeql/Schema.hpp"
#include "shapeql/Value.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace shapeql {

/**
 * @brief Marks a field or fragment as delivered later
 */
struct Deferral {
    std::optional<std::string> label;
    std::optional<std::string> type_condition;

    bool operator==(const Deferral& other) const {
        return label == other.label && type_condition == other.type_condition;
    }
    bool operator!=(const Deferral& other) const { return !(*this == other); }
};

/**
 * @brief One @include/@skip test
 *
 * Either reads a boolean variable or carries a literal. `inverted` is set
 * for @skip.
 */
struct Condition {
    std::string variable;
    std::optional<bool> literal;
    bool inverted = false;

    bool operator==(const Condition& other) const {
        return variable == other.variable && literal == other.literal &&
               inverted == other.inverted;
    }
    bool operator<(const Condition& other) const {
        if (variable != other.variable) return variable < other.variable;
        if (literal != other.literal) return literal < other.literal;
        return inverted < other.inverted;
    }
};

/// All conditions must hold
using ConditionSet = std::vector<Condition>;

struct Fragment;

/**
 * @brief Fragments attached to a selection plus their accessor handles
 */
struct FragmentSet {
    std::vector<Fragment> fragments;
    /// Fragment identity → synthetic accessor handle ("heroDetails", "asDroid")
    std::map<std::string, std::string> accessors;
};

/**
 * @brief A selected field at some position in a tree
 */
struct Field {
    std::string response_key;
    std::string schema_field_name;
    TypeRef type;
    TypeKind kind = TypeKind::Scalar;
    Value arguments = Value::object();
    std::vector<Field> sub_selection;
    FragmentSet fragments;
    std::set<std::string> origin_paths;
    std::optional<Deferral> deferral;
    /// Field is included if any set holds; empty means unconditional
    std::vector<ConditionSet> conditions;

    bool is_composite() const noexcept {
        return kind == TypeKind::Object || kind == TypeKind::Interface ||
               kind == TypeKind::Union;
    }
};

/**
 * @brief A named fragment spread or an inline fragment
 */
struct Fragment {
    std::optional<std::string> name;  ///< Absent for inline fragments
    std::string type_condition;
    std::string origin;               ///< Source location of this fragment
    std::vector<Field> fields;
    std::set<std::string> origin_paths;
    std::optional<Deferral> deferral;
    /// Type condition a hoisted named fragment was narrowed to, empty otherwise
    std::string scope;

    /**
     * @brief Name for named fragments, source location for inline ones
     *
     * A narrowed copy of a named fragment is "<name> on <scope>", so it stays
     * distinct from the same fragment spread directly on the wider type.
     */
    std::string identity() const {
        if (!name) return origin;
        return scope.empty() ? *name : *name + " on " + scope;
    }
};

/**
 * @brief Root selection of one operation or fragment definition
 *
 * `root` is a synthetic field keyed "data" whose type is the operation root
 * type (or the fragment's type condition), non-null.
 */
struct RootSelection {
    std::string name;
    std::optional<OperationKind> operation;  ///< Absent for fragment definitions
    std::vector<VariableDefinition> variables;
    Field root;
};

struct SelectionOptions {
    /// Name of the deferral directive
    std::string defer_directive = "defer";
};

/**
 * @brief Build the selection of an operation
 *
 * @param operation_name Operation to build; empty selects the only one
 * @throws SchemaMismatch if the operation, a field, a type condition or a
 *         fragment does not resolve
 * @throws DuplicateDeferLabel if two deferrals share a label
 */
RootSelection build_operation(const Schema& schema, const Document& document,
                              const std::string& operation_name,
                              const SelectionOptions& options = {});

/**
 * @brief Build the selection of a fragment definition as its own root
 * @throws SchemaMismatch, DuplicateDeferLabel as build_operation()
 */
RootSelection build_fragment(const Schema& schema, const Document& document,
                             const std::string& fragment_name,
                             const SelectionOptions& options = {});

/**
 * @brief Accessor handle for a fragment ("HeroDetails" → "heroDetails",
 *        inline "... on Droid" → "asDroid")
 */
std::string accessor_name(const Fragment& fragment);

} // namespace shapeql

#endif // SHAPEQL_SELECTION_HPP
