/**
 * @file Delivery.hpp
 * @brief Incremental delivery: grafting deferred payloads onto a base result
 *
 * A DeliveryMerger starts from the base decode of an operation and applies
 * incremental patches until a final patch arrives with nothing left
 * pending. Two patch forms are accepted:
 * - the path names an object owning deferred fields; `data` is an object
 *   holding those fields
 * - the path ends at a deferred field; `data` is that field's value
 *
 * Patch application is atomic: a patch that fails leaves the result and
 * the pending set untouched.
 *
 * Example:
 * ```cpp
 * shapeql::DeliveryMerger merger(tree, scalars, base_payload);
 * merger.apply(shapeql::IncrementalPatch::from_json(
 *     R"({"path": ["computers", 0, "screen"], "data": {"resolution": "640x480"},
 *         "isFinal": true})"_json));
 * merger.is_complete();   // true
 * ```
 *
 * The tree and scalar registry must outlive the merger.
 */

#ifndef SHAPEQL_DELIVERY_HPP
#define SHAPEQL_DELIVERY_HPP

#include "shapeql/CanonicalTree.hpp"
#include "shapeql/Codec.hpp"
#include "shapeql/ResponsePath.hpp"
#include "shapeql/Scalars.hpp"
#include "shapeql/Value.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace shapeql {

struct IncrementalPatch {
    ResponsePath path;
    std::optional<std::string> label;
    Value data;
    bool is_final = false;

    /**
     * @brief Read `{path, label?, data, isFinal?}`
     * @throws DocumentFormatError on malformed input
     */
    static IncrementalPatch from_json(const Value& json);
};

class DeliveryMerger {
public:
    /**
     * @brief Decode the base payload and start tracking its deferred slots
     * @throws Any error of decode()
     */
    DeliveryMerger(const CanonicalTree& tree, const ScalarRegistry& scalars,
                   const Value& base_payload, const Value& variables = Value::object());

    /**
     * @brief Graft one patch into the result
     *
     * @throws UnresolvablePatchPath if the path does not exist in the result
     * @throws DuplicatePatch if the slot was already resolved, is unknown, or
     *         the delivery is complete
     * @throws IncompleteDelivery if the patch is final and slots remain
     * @throws FieldPathError subclasses if the patch data does not decode
     */
    void apply(const IncrementalPatch& patch);

    /// True once a final patch left nothing pending, or the base had no deferrals
    bool is_complete() const noexcept { return complete_; }

    const Value& current_result() const noexcept { return result_; }

    /// Deferred slots not yet delivered
    const std::vector<DeferredSlot>& pending() const noexcept { return pending_; }

private:
    const CanonicalTree& tree_;
    const ScalarRegistry& scalars_;
    Value variables_;
    Value result_;
    std::vector<DeferredSlot> pending_;
    std::set<std::string> resolved_;
    bool complete_ = false;

    struct Match {
        std::size_t slot;
        ResponsePath object_path;
        std::vector<std::size_t> fields;
        bool whole_slot;
        bool field_form;
    };

    std::optional<Match> match_object(const IncrementalPatch& patch) const;
    std::optional<Match> match_field(const IncrementalPatch& patch) const;
    [[noreturn]] void reject(const IncrementalPatch& patch) const;
};

/**
 * @brief A patch that apply_patches() skipped
 */
struct RejectedPatch {
    std::size_t index;    ///< Position in the patch array
    std::string message;
};

/**
 * @brief Apply a JSON array of patches in order
 *
 * A patch that is malformed or fails to apply is recorded and skipped. The
 * result keeps every patch applied before and after it.
 *
 * @throws DocumentFormatError if `patches` is not an array
 */
std::vector<RejectedPatch> apply_patches(DeliveryMerger& merger, const Value& patches);

} // namespace shapeql

#endif // SHAPEQL_DELIVERY_HPP
