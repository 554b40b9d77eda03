/**
 * @file Codec.cpp
 * @brief Payload decode/encode driven by shape nodes
 */

#include "shapeql/Codec.hpp"
#include "shapeql/Errors.hpp"
#include "shapeql/Variables.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace shapeql {

namespace {

/// Raised in partial mode once an error is recorded at a non-null position
struct NullPropagation {};

class Transcoder {
public:
    enum class Direction { Decode, Encode };

    Transcoder(const ScalarRegistry& scalars, const Value& variables, Direction direction,
               bool partial)
        : scalars_(scalars)
        , variables_(variables)
        , direction_(direction)
        , partial_(partial)
    {}

    std::vector<DeferredSlot>& slots() noexcept { return slots_; }
    std::vector<FieldError>& errors() noexcept { return errors_; }

    Value value(const Field& field, const ShapeNode* child, const TypeRef& type,
                const Value& input, const ResponsePath& path) {
        if (input.is_null()) {
            if (type.is_nullable()) {
                return nullptr;
            }
            throw NonNullViolation(format_path(path));
        }

        if (type.is_list()) {
            if (!input.is_array()) {
                throw TypeMismatch(format_path(path), "list", type_name(input));
            }
            const TypeRef element = type.element();
            Value out = Value::array();
            for (std::size_t i = 0; i < input.size(); ++i) {
                const ResponsePath item_path = child_path(path, i);
                out.push_back(guarded(element, item_path, [&] {
                    return value(field, child, element, input[i], item_path);
                }));
            }
            return out;
        }

        if (child != nullptr) {
            return object(*child, input, path);
        }

        if (direction_ == Direction::Decode) {
            return scalars_.decode(type.named_type, field.kind, input, path);
        }
        return scalars_.encode(type.named_type, field.kind, input, path);
    }

    /**
     * @brief Run `fn` for one position; in partial mode, turn failures into null
     */
    template <typename Fn>
    Value guarded(const TypeRef& type, const ResponsePath& path, Fn&& fn) {
        if (!partial_) {
            return fn();
        }
        try {
            return fn();
        } catch (const FieldPathError& e) {
            errors_.push_back(FieldError{parse_path(e.path()), e.what()});
        } catch (const NullPropagation&) {
            // Already recorded deeper down
        }
        if (!type.is_nullable()) {
            throw NullPropagation{};
        }
        drop_slots(path);
        return nullptr;
    }

    void drop_slots(const ResponsePath& path) {
        slots_.erase(std::remove_if(slots_.begin(), slots_.end(),
                                    [&](const DeferredSlot& slot) {
                                        return has_prefix(slot.path, path);
                                    }),
                     slots_.end());
    }

private:
    const ScalarRegistry& scalars_;
    const Value& variables_;
    Direction direction_;
    bool partial_;
    std::vector<DeferredSlot> slots_;
    std::vector<FieldError> errors_;

    Value object(const ShapeNode& node, const Value& input, const ResponsePath& path) {
        if (!input.is_object()) {
            throw TypeMismatch(format_path(path), "object", type_name(input));
        }

        const ShapeNode* shape = &node;
        std::string concrete;
        if (node.is_polymorphic()) {
            concrete = discriminate(node, input, path);
            shape = select_variant(node, concrete, path);
        }

        Value out = Value::object();
        const auto& fields = shape->fields();
        for (std::size_t i = 0; i < fields.size(); ++i) {
            const Field& field = fields[i];
            if (!is_included(field, variables_)) {
                continue;
            }
            const std::string& key = field.response_key;
            const ResponsePath field_path = child_path(path, key);

            if (field.deferral && direction_ == Direction::Decode) {
                add_slot(*shape, i, path);
                continue;
            }

            auto it = input.find(key);
            if (it == input.end()) {
                if (field.deferral) {
                    continue;
                }
                if (!concrete.empty() && key == node.discriminator()) {
                    out[key] = concrete;
                } else if (field.type.is_nullable()) {
                    out[key] = nullptr;
                } else {
                    missing(field_path, key);
                }
                continue;
            }

            out[key] = guarded(field.type, field_path, [&] {
                return value(field, shape->child(i), field.type, *it, field_path);
            });
        }
        return out;
    }

    std::string discriminate(const ShapeNode& node, const Value& input,
                             const ResponsePath& path) const {
        const std::string& key = node.discriminator();
        auto it = input.find(key);
        if (it != input.end()) {
            if (!it->is_string()) {
                throw TypeMismatch(format_path(child_path(path, key)), "string", type_name(*it));
            }
            return it->get<std::string>();
        }
        if (node.is_concrete()) {
            return node.type_name();
        }
        throw MissingRequiredField(format_path(child_path(path, key)), key);
    }

    static const ShapeNode* select_variant(const ShapeNode& node, const std::string& concrete,
                                           const ResponsePath& path) {
        if (const ShapeNode* variant = node.variant_for(concrete)) {
            spdlog::trace("codec: '{}' selects variant '{}'", format_path(path),
                          variant->type_name());
            return variant;
        }
        if (node.catch_all()) {
            spdlog::trace("codec: '{}' falls back to catch-all for '{}'", format_path(path),
                          concrete);
            return &node;
        }
        throw UnhandledTypeCondition(format_path(path), concrete);
    }

    void missing(const ResponsePath& field_path, const std::string& key) {
        MissingRequiredField error(format_path(field_path), key);
        if (!partial_) {
            throw error;
        }
        errors_.push_back(FieldError{field_path, error.what()});
        throw NullPropagation{};
    }

    void add_slot(const ShapeNode& shape, std::size_t index, const ResponsePath& path) {
        const auto& label = shape.fields()[index].deferral->label;
        for (auto& slot : slots_) {
            if (slot.node == &shape && slot.label == label && slot.path == path) {
                slot.fields.push_back(index);
                return;
            }
        }
        DeferredSlot slot;
        slot.path = path;
        slot.label = label;
        slot.node = &shape;
        slot.fields.push_back(index);
        slots_.push_back(std::move(slot));
    }
};

} // anonymous namespace

std::string DeferredSlot::describe() const {
    const std::string where = "'" + format_path(path) + "'";
    return label ? *label + " at " + where : "unlabeled at " + where;
}

DecodedResponse decode(const CanonicalTree& tree, const Value& payload,
                       const ScalarRegistry& scalars, const Value& variables) {
    const Value resolved = resolve_variables(tree, variables);
    Transcoder transcoder(scalars, resolved, Transcoder::Direction::Decode, false);

    DecodedResponse response;
    response.data = transcoder.value(tree.root_field(), &tree.root(), tree.root_field().type,
                                     payload, {});
    response.deferred = std::move(transcoder.slots());

    spdlog::debug("codec: decoded '{}' with {} deferred slot(s)", tree.name(),
                  response.deferred.size());
    return response;
}

DecodedResponse decode_partial(const CanonicalTree& tree, const Value& payload,
                               const ScalarRegistry& scalars, const Value& variables) {
    const Value resolved = resolve_variables(tree, variables);
    Transcoder transcoder(scalars, resolved, Transcoder::Direction::Decode, true);

    DecodedResponse response;
    try {
        response.data = transcoder.guarded(tree.root_field().type, {}, [&] {
            return transcoder.value(tree.root_field(), &tree.root(), tree.root_field().type,
                                    payload, {});
        });
    } catch (const NullPropagation&) {
        response.data = nullptr;
        transcoder.slots().clear();
    }
    response.deferred = std::move(transcoder.slots());
    response.errors = std::move(transcoder.errors());

    spdlog::debug("codec: partially decoded '{}' with {} error(s)", tree.name(),
                  response.errors.size());
    return response;
}

Value encode(const CanonicalTree& tree, const Value& value, const ScalarRegistry& scalars,
             const Value& variables) {
    const Value resolved = resolve_variables(tree, variables);
    Transcoder transcoder(scalars, resolved, Transcoder::Direction::Encode, false);
    return transcoder.value(tree.root_field(), &tree.root(), tree.root_field().type, value, {});
}

Value decode_deferred(const ShapeNode& node, const std::vector<std::size_t>& fields,
                      const Value& data, const ResponsePath& path,
                      const ScalarRegistry& scalars, const Value& variables,
                      std::vector<DeferredSlot>& nested) {
    if (!data.is_object()) {
        throw TypeMismatch(format_path(path), "object", type_name(data));
    }

    Transcoder transcoder(scalars, variables, Transcoder::Direction::Decode, false);
    Value out = Value::object();
    for (std::size_t index : fields) {
        const Field& field = node.fields().at(index);
        const ResponsePath field_path = child_path(path, field.response_key);
        auto it = data.find(field.response_key);
        if (it == data.end()) {
            if (!field.type.is_nullable()) {
                throw MissingRequiredField(format_path(field_path), field.response_key);
            }
            out[field.response_key] = nullptr;
            continue;
        }
        out[field.response_key] =
            transcoder.value(field, node.child(index), field.type, *it, field_path);
    }

    auto& found = transcoder.slots();
    nested.insert(nested.end(), found.begin(), found.end());
    return out;
}

} // namespace shapeql
