/**
 * @file Delivery.cpp
 * @brief Incremental patch matching and grafting
 */

#include "shapeql/Delivery.hpp"
#include "shapeql/Errors.hpp"
#include "shapeql/Variables.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace shapeql {

namespace {

std::string resolved_key(const ResponsePath& path, const std::optional<std::string>& label) {
    return format_path(path) + "#" + label.value_or("");
}

bool label_matches(const IncrementalPatch& patch, const DeferredSlot& slot) {
    return !patch.label || slot.label == patch.label;
}

} // anonymous namespace

IncrementalPatch IncrementalPatch::from_json(const Value& json) {
    if (!json.is_object()) {
        throw DocumentFormatError("patch", "expected object, found " + type_name(json));
    }

    IncrementalPatch patch;
    auto path = json.find("path");
    if (path == json.end()) {
        throw DocumentFormatError("patch", "missing member 'path'");
    }
    patch.path = path_from_json(*path);

    auto label = json.find("label");
    if (label != json.end() && !label->is_null()) {
        if (!label->is_string()) {
            throw DocumentFormatError("patch.label", "expected string, found " + type_name(*label));
        }
        patch.label = label->get<std::string>();
    }

    auto data = json.find("data");
    if (data == json.end()) {
        throw DocumentFormatError("patch", "missing member 'data'");
    }
    patch.data = *data;

    auto is_final = json.find("isFinal");
    if (is_final != json.end()) {
        if (!is_final->is_boolean()) {
            throw DocumentFormatError("patch.isFinal",
                                      "expected boolean, found " + type_name(*is_final));
        }
        patch.is_final = is_final->get<bool>();
    }
    return patch;
}

DeliveryMerger::DeliveryMerger(const CanonicalTree& tree, const ScalarRegistry& scalars,
                               const Value& base_payload, const Value& variables)
    : tree_(tree)
    , scalars_(scalars)
    , variables_(resolve_variables(tree, variables))
{
    DecodedResponse base = decode(tree_, base_payload, scalars_, variables_);
    result_ = std::move(base.data);
    pending_ = std::move(base.deferred);
    complete_ = pending_.empty();
    spdlog::debug("delivery: '{}' started with {} pending slot(s)", tree_.name(),
                  pending_.size());
}

std::optional<DeliveryMerger::Match>
DeliveryMerger::match_object(const IncrementalPatch& patch) const {
    const Value* target = find_by_path(result_, patch.path);
    if (target == nullptr || !target->is_object()) {
        return std::nullopt;
    }

    std::vector<std::size_t> candidates;
    for (std::size_t i = 0; i < pending_.size(); ++i) {
        if (pending_[i].path == patch.path && label_matches(patch, pending_[i])) {
            candidates.push_back(i);
        }
    }
    if (candidates.empty()) {
        return std::nullopt;
    }
    if (candidates.size() > 1) {
        throw DuplicatePatch(format_path(patch.path), "",
                             "several deferred selections are pending here, a label is required");
    }

    const DeferredSlot& slot = pending_[candidates.front()];
    return Match{candidates.front(), patch.path, slot.fields, true, false};
}

std::optional<DeliveryMerger::Match>
DeliveryMerger::match_field(const IncrementalPatch& patch) const {
    if (patch.path.empty()) {
        return std::nullopt;
    }
    const auto* key = std::get_if<std::string>(&patch.path.back());
    if (key == nullptr) {
        return std::nullopt;
    }
    const ResponsePath owner_path(patch.path.begin(), patch.path.end() - 1);
    const Value* owner = find_by_path(result_, owner_path);
    if (owner == nullptr || !owner->is_object()) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i < pending_.size(); ++i) {
        const DeferredSlot& slot = pending_[i];
        if (slot.path != owner_path || !label_matches(patch, slot)) {
            continue;
        }
        for (std::size_t index : slot.fields) {
            if (slot.node->fields()[index].response_key == *key) {
                return Match{i, owner_path, {index}, slot.fields.size() == 1, true};
            }
        }
    }
    return std::nullopt;
}

void DeliveryMerger::reject(const IncrementalPatch& patch) const {
    const std::string path = format_path(patch.path);
    const std::string label = patch.label.value_or("");

    // The path must name a value, or a missing member of an existing object
    bool reachable = find_by_path(result_, patch.path) != nullptr;
    if (!reachable && !patch.path.empty() &&
        std::holds_alternative<std::string>(patch.path.back())) {
        const Value* owner =
            find_by_path(result_, ResponsePath(patch.path.begin(), patch.path.end() - 1));
        reachable = owner != nullptr && owner->is_object();
    }
    if (!reachable) {
        for (std::size_t n = 1; n <= patch.path.size(); ++n) {
            const ResponsePath prefix(patch.path.begin(), patch.path.begin() + n);
            if (find_by_path(result_, prefix) == nullptr) {
                throw UnresolvablePatchPath(path, "nothing at '" + format_path(prefix) + "'");
            }
        }
        throw UnresolvablePatchPath(path, "not an object");
    }

    const bool seen = patch.label
        ? resolved_.count(path + "#" + label) > 0
        : std::any_of(resolved_.begin(), resolved_.end(), [&](const std::string& key) {
              return key.compare(0, path.size() + 1, path + "#") == 0;
          });
    if (seen) {
        throw DuplicatePatch(path, label, "already applied");
    }
    throw DuplicatePatch(path, label, "no deferred selection is pending here");
}

void DeliveryMerger::apply(const IncrementalPatch& patch) {
    if (complete_) {
        throw DuplicatePatch(format_path(patch.path), patch.label.value_or(""),
                             "delivery is already complete");
    }

    std::optional<Match> match = match_object(patch);
    if (!match) {
        match = match_field(patch);
    }
    if (!match) {
        reject(patch);
    }

    const DeferredSlot& slot = pending_[match->slot];
    const ShapeNode& node = *slot.node;

    Value data = patch.data;
    if (match->field_form) {
        data = Value::object();
        data[node.fields()[match->fields.front()].response_key] = patch.data;
    }

    // Decode and compute the next state before touching anything
    std::vector<DeferredSlot> nested;
    const Value decoded = decode_deferred(node, match->fields, data, match->object_path,
                                          scalars_, variables_, nested);

    std::vector<DeferredSlot> next;
    for (std::size_t i = 0; i < pending_.size(); ++i) {
        if (i != match->slot) {
            next.push_back(pending_[i]);
        } else if (!match->whole_slot) {
            DeferredSlot rest = pending_[i];
            rest.fields.erase(std::remove(rest.fields.begin(), rest.fields.end(),
                                          match->fields.front()),
                              rest.fields.end());
            next.push_back(std::move(rest));
        }
    }
    next.insert(next.end(), nested.begin(), nested.end());

    if (patch.is_final && !next.empty()) {
        std::vector<std::string> remaining;
        for (const auto& left : next) {
            remaining.push_back(left.describe());
        }
        throw IncompleteDelivery(remaining);
    }

    const Value* current = find_by_path(result_, match->object_path);
    Value rebuilt = Value::object();
    for (const auto& field : node.fields()) {
        const std::string& key = field.response_key;
        if (current->contains(key)) {
            rebuilt[key] = (*current)[key];
        } else if (decoded.contains(key)) {
            rebuilt[key] = decoded[key];
        }
    }
    for (auto it = current->begin(); it != current->end(); ++it) {
        if (!rebuilt.contains(it.key())) {
            rebuilt[it.key()] = it.value();
        }
    }

    for (std::size_t index : match->fields) {
        resolved_.insert(resolved_key(child_path(match->object_path,
                                                 node.fields()[index].response_key),
                                      slot.label));
    }
    if (match->whole_slot) {
        resolved_.insert(resolved_key(match->object_path, slot.label));
    }
    spdlog::debug("delivery: grafted {} field(s) at '{}'", match->fields.size(),
                  format_path(match->object_path));

    at_path(result_, match->object_path) = std::move(rebuilt);
    pending_ = std::move(next);
    complete_ = patch.is_final;
}

std::vector<RejectedPatch> apply_patches(DeliveryMerger& merger, const Value& patches) {
    if (!patches.is_array()) {
        throw DocumentFormatError("patches", "expected array, found " + type_name(patches));
    }

    std::vector<RejectedPatch> rejected;
    for (std::size_t i = 0; i < patches.size(); ++i) {
        try {
            merger.apply(IncrementalPatch::from_json(patches[i]));
        } catch (const ShapeError& e) {
            spdlog::warn("delivery: patch {} rejected: {}", i, e.what());
            rejected.push_back(RejectedPatch{i, e.what()});
        }
    }
    return rejected;
}

} // namespace shapeql
