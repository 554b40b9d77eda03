/**
 * @file Merge.hpp
 * @brief Merge engine: unify fields and fragments sharing a response key
 *
 * Merging rules:
 * - Fields with the same response key are unified recursively
 * - Named fragments are matched by name; inline fragments only match
 *   themselves (same source location)
 * - Every fragment's fields are a superset of its parent's merged fields
 *   (parent fields are pushed down into each fragment)
 * - Result order is first-occurrence order across the inputs
 *
 * Inputs are never modified; every function returns newly built nodes.
 */

#ifndef SHAPEQL_MERGE_HPP
#define SHAPEQL_MERGE_HPP

#include "shapeql/Selection.hpp"
#include <vector>

namespace shapeql {

/**
 * @brief Merge two sibling field lists
 *
 * For each field of `a`, the first not-yet-matched field of `b` with the
 * same response key is merged into it. Unmatched fields of `b` follow in
 * their original order.
 *
 * @throws FieldMergeConflict if matched fields differ in schema field name,
 *         arguments, type or deferral
 * @throws FragmentMergeConflict from nested fragment merges
 *
 * Example:
 * ```cpp
 * // a = [id, name], b = [name { first }, cpu]
 * auto merged = merge_fields(a, b);
 * // merged = [id, name { first }, cpu]
 * ```
 */
std::vector<Field> merge_fields(const std::vector<Field>& a, const std::vector<Field>& b);

/**
 * @brief Merge two fields known to share a response key
 *
 * Sub-selections are merged with merge_fields(), fragment attachments with
 * merge_fragments(), and accessors, origin paths and conditions are unioned.
 *
 * @throws FieldMergeConflict, FragmentMergeConflict
 */
Field merge_field(const Field& a, const Field& b);

/**
 * @brief Merge fragment attachments under a (possibly grown) parent selection
 *
 * @param existing Fragments already attached to the parent
 * @param parent_fields The parent's merged fields, pushed into every fragment
 * @param incoming Fragments contributed by the other side of the merge
 * @throws FragmentMergeConflict if same-named fragments differ in type condition
 */
std::vector<Fragment> merge_fragments(const std::vector<Fragment>& existing,
                                      const std::vector<Field>& parent_fields,
                                      const std::vector<Fragment>& incoming);

/**
 * @brief Fold several field lists from left to right
 *
 * Example:
 * ```cpp
 * auto merged = merge_all({from_query, from_fragment_a, from_fragment_b});
 * ```
 */
std::vector<Field> merge_all(const std::vector<std::vector<Field>>& sources);

/**
 * @brief Canonical form of a raw selection-model field
 *
 * Folds the field's children one at a time so siblings sharing a response
 * key collapse, canonicalizes each fragment and pushes the parent fields
 * into it, and merges same-identity fragments.
 */
Field canonicalize(const Field& raw);

} // namespace shapeql

#endif // SHAPEQL_MERGE_HPP
