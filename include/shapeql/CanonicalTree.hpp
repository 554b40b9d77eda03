/**
 * @file CanonicalTree.hpp
 * @brief Compiled, immutable field tree used by decode, encode and delivery
 *
 * A CanonicalTree is built once per operation (or fragment definition) from
 * the merged selection and consumed many times. Every ShapeNode carries:
 * - its fields in canonical order and a response key → index table
 * - a child node for each composite field
 * - for selections with fragments, a closed set of variants keyed by
 *   concrete type name, plus the tree-wide catch-all choice
 *
 * Example:
 * ```cpp
 * auto tree = shapeql::compile_operation(schema, document, "Hero",
 *     shapeql::TreeOptions(shapeql::TreeOptions::CatchAll::Disabled));
 * const shapeql::ShapeNode& root = tree.root();
 * auto index = root.index_of("hero");   // position of "hero" in root.fields()
 * ```
 */

#ifndef SHAPEQL_CANONICALTREE_HPP
#define SHAPEQL_CANONICALTREE_HPP

#include "shapeql/Selection.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace shapeql {

/**
 * @brief Per-tree compilation choices
 *
 * The catch-all choice has no default and must be stated explicitly.
 */
struct TreeOptions {
    enum class CatchAll { Enabled, Disabled };

    explicit TreeOptions(CatchAll catch_all_choice) : catch_all(catch_all_choice) {}

    CatchAll catch_all;
    /// Response key holding the concrete type name
    std::string typename_field = "__typename";
    /// Prepend the discriminator to polymorphic selections lacking it
    bool add_typename = true;
    SelectionOptions selection;
};

class ShapeNode;
class TreeCompiler;

/**
 * @brief One polymorphic alternative
 */
struct Variant {
    std::vector<std::string> type_names;  ///< Concrete types decoded with this shape
    std::vector<std::string> fragments;   ///< Identities of the fragments merged in
    std::unique_ptr<ShapeNode> node;
};

/**
 * @brief What a fragment accessor exposes at one node
 */
struct FragmentShape {
    std::string identity;
    std::string accessor;
    std::string type_condition;
    std::vector<std::string> possible_types;
    std::vector<std::string> field_keys;  ///< Response keys of the fragment's fields, in order
    std::optional<Deferral> deferral;
};

/**
 * @brief One compiled selection level
 */
class ShapeNode {
    /// Only the tree compiler can name this, so only it builds nodes
    struct Token { explicit Token() = default; };

public:
    explicit ShapeNode(Token) {}
    ShapeNode(const ShapeNode&) = delete;
    ShapeNode& operator=(const ShapeNode&) = delete;

    /// Static type of the selection (the concrete type for single-type variants)
    const std::string& type_name() const noexcept { return type_name_; }
    bool is_concrete() const noexcept { return concrete_; }

    const std::vector<Field>& fields() const noexcept { return fields_; }

    /**
     * @return Position of the field with this response key, if selected
     */
    std::optional<std::size_t> index_of(const std::string& response_key) const;

    /**
     * @return Compiled sub-selection of the field at `index`, nullptr for leaves
     */
    const ShapeNode* child(std::size_t index) const;

    bool is_polymorphic() const noexcept { return polymorphic_; }
    const std::vector<Variant>& variants() const noexcept { return variants_; }

    /**
     * @brief Variant decoding objects of a concrete type
     * @return The variant node, or nullptr if no fragment applies to the type
     */
    const ShapeNode* variant_for(const std::string& concrete_type) const;

    /// Whether unmatched type names fall back to this node's own fields
    bool catch_all() const noexcept { return catch_all_; }

    /// Response key of the discriminator
    const std::string& discriminator() const noexcept { return discriminator_; }

    const std::vector<FragmentShape>& fragments() const noexcept { return fragments_; }

    /**
     * @return Fragment reached through an accessor handle, nullptr if unknown
     */
    const FragmentShape* fragment(const std::string& accessor) const;

private:
    friend class TreeCompiler;

    std::string type_name_;
    bool concrete_ = false;
    std::vector<Field> fields_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<std::unique_ptr<ShapeNode>> children_;  ///< Parallel to fields_
    bool polymorphic_ = false;
    bool catch_all_ = false;
    std::string discriminator_;
    std::vector<Variant> variants_;
    std::vector<FragmentShape> fragments_;
};

/**
 * @brief Compiled tree for one operation or fragment definition
 */
class CanonicalTree {
public:
    /**
     * @brief Merge a selection and compile it
     *
     * @throws FieldMergeConflict, FragmentMergeConflict on incompatible selections
     * @throws SchemaMismatch if a type referenced by the selection is unknown
     */
    CanonicalTree(const Schema& schema, const RootSelection& selection,
                  const TreeOptions& options);

    CanonicalTree(CanonicalTree&&) = default;
    CanonicalTree& operator=(CanonicalTree&&) = default;

    const std::string& name() const noexcept { return name_; }
    std::optional<OperationKind> operation() const noexcept { return operation_; }
    const TreeOptions& options() const noexcept { return options_; }

    const ShapeNode& root() const noexcept { return *root_; }

    /// Merged root field (response key "data")
    const Field& root_field() const noexcept { return root_field_; }

    const std::vector<VariableDefinition>& variables() const noexcept { return variables_; }

    /// Variables referenced by arguments or @include/@skip conditions
    const std::set<std::string>& referenced_variables() const noexcept { return referenced_; }

    /**
     * @brief Render the tree as JSON for inspection
     *
     * Each node lists its fields (key, schema name, type, origins, deferral,
     * conditions, selections) and, for polymorphic nodes, its variants.
     */
    Value describe() const;

private:
    std::string name_;
    std::optional<OperationKind> operation_;
    TreeOptions options_;
    Field root_field_;
    std::unique_ptr<ShapeNode> root_;
    std::vector<VariableDefinition> variables_;
    std::set<std::string> referenced_;
};

/**
 * @brief Build, merge and compile an operation in one step
 * @throws Any error of build_operation() or CanonicalTree's constructor
 */
CanonicalTree compile_operation(const Schema& schema, const Document& document,
                                const std::string& operation_name,
                                const TreeOptions& options);

/**
 * @brief Build, merge and compile a fragment definition in one step
 */
CanonicalTree compile_fragment(const Schema& schema, const Document& document,
                               const std::string& fragment_name,
                               const TreeOptions& options);

/**
 * @brief Subset of a decoded object exposed by a fragment accessor
 *
 * @param node Node the object was decoded with (the polymorphic node, not a variant)
 * @param object Decoded object
 * @param accessor Accessor handle ("heroDetails", "asDroid")
 * @return The fragment's fields present in `object`, in fragment order, or
 *         std::nullopt when the object's concrete type does not satisfy the
 *         fragment or the accessor is unknown
 */
std::optional<Value> fragment_data(const ShapeNode& node, const Value& object,
                                   const std::string& accessor);

} // namespace shapeql

#endif // SHAPEQL_CANONICALTREE_HPP
