/**
 * @file Codec.hpp
 * @brief Decode and encode response payloads against a canonical tree
 *
 * Decoding reads an untyped, arbitrarily ordered payload and produces a
 * value whose objects list their keys in canonical field order. Encoding
 * writes a value back out in canonical order regardless of how the value
 * was built.
 *
 * Example:
 * ```cpp
 * shapeql::ScalarRegistry scalars;
 * auto result = shapeql::decode(tree, payload, scalars);
 * std::cout << result.data.dump(2);
 * for (const auto& slot : result.deferred) {
 *     // slot.path, slot.label: expected incremental patches
 * }
 * ```
 */

#ifndef SHAPEQL_CODEC_HPP
#define SHAPEQL_CODEC_HPP

#include "shapeql/CanonicalTree.hpp"
#include "shapeql/ResponsePath.hpp"
#include "shapeql/Scalars.hpp"
#include "shapeql/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace shapeql {

/**
 * @brief Deferred fields of one decoded object awaiting a patch
 *
 * Fields sharing a label at one object form a single slot.
 */
struct DeferredSlot {
    ResponsePath path;                   ///< Object owning the deferred fields
    std::optional<std::string> label;
    const ShapeNode* node = nullptr;     ///< Node the object was decoded with
    std::vector<std::size_t> fields;     ///< Indices into node->fields()

    /**
     * @brief Human-readable slot name ("slow at 'computers.0'")
     */
    std::string describe() const;
};

/**
 * @brief A failure recorded by decode_partial()
 */
struct FieldError {
    ResponsePath path;
    std::string message;
};

struct DecodedResponse {
    Value data;
    std::vector<DeferredSlot> deferred;
    std::vector<FieldError> errors;  ///< Always empty for decode()
};

/**
 * @brief Decode a payload strictly
 *
 * @param payload The response "data" object
 * @param variables Supplied variables, resolved with resolve_variables()
 * @throws MissingVariable before any decoding starts
 * @throws FieldPathError subclasses (ScalarCoercionError, NonNullViolation,
 *         UnhandledTypeCondition, MissingRequiredField, TypeMismatch)
 */
DecodedResponse decode(const CanonicalTree& tree, const Value& payload,
                       const ScalarRegistry& scalars,
                       const Value& variables = Value::object());

/**
 * @brief Decode a payload, recovering from field errors
 *
 * A failing position is recorded in `errors` and set to null; when that
 * position is non-null the null moves up to the nearest nullable ancestor
 * (ultimately `data` itself). Deferred slots inside nulled subtrees are
 * dropped.
 *
 * @throws MissingVariable before any decoding starts
 */
DecodedResponse decode_partial(const CanonicalTree& tree, const Value& payload,
                               const ScalarRegistry& scalars,
                               const Value& variables = Value::object());

/**
 * @brief Serialize a value in canonical order
 *
 * Absent deferred fields are omitted; absent nullable fields are written
 * as null.
 *
 * @throws MissingVariable, FieldPathError subclasses
 */
Value encode(const CanonicalTree& tree, const Value& value, const ScalarRegistry& scalars,
             const Value& variables = Value::object());

/**
 * @brief Decode deferred fields of one slot
 *
 * Used by the incremental delivery merger. Only the fields named by
 * `fields` are read from `data`; nested deferrals are appended to
 * `nested` with absolute paths.
 *
 * @param variables Already resolved variables
 * @return Object holding the decoded fields, keyed by response key
 * @throws FieldPathError subclasses
 */
Value decode_deferred(const ShapeNode& node, const std::vector<std::size_t>& fields,
                      const Value& data, const ResponsePath& path,
                      const ScalarRegistry& scalars, const Value& variables,
                      std::vector<DeferredSlot>& nested);

} // namespace shapeql

#endif // SHAPEQL_CODEC_HPP
