/**
 * @file Merge.cpp
 * @brief Implementation of the merge engine
 */

#include "shapeql/Merge.hpp"
#include "shapeql/Errors.hpp"

#include <algorithm>

namespace shapeql {

namespace {

std::string describe(const std::optional<Deferral>& deferral) {
    if (!deferral) return "not deferred";
    return deferral->label ? "deferred as '" + *deferral->label + "'" : "deferred without label";
}

/**
 * @brief A field requested without deferral anywhere is delivered up front
 */
std::optional<Deferral> merge_deferral(const std::string& key,
                                       const std::optional<Deferral>& a,
                                       const std::optional<Deferral>& b) {
    if (!a || !b) {
        return std::nullopt;
    }
    if (*a != *b) {
        throw FieldMergeConflict(key, describe(a) + " and " + describe(b));
    }
    return a;
}

std::vector<ConditionSet> merge_conditions(const std::vector<ConditionSet>& a,
                                           const std::vector<ConditionSet>& b) {
    // Unconditional on either side wins
    if (a.empty() || b.empty()) {
        return {};
    }
    std::vector<ConditionSet> result = a;
    for (const auto& set : b) {
        if (std::find(result.begin(), result.end(), set) == result.end()) {
            result.push_back(set);
        }
    }
    return result;
}

void check_compatible(const Field& a, const Field& b) {
    if (a.schema_field_name != b.schema_field_name) {
        throw FieldMergeConflict(a.response_key, "'" + a.schema_field_name + "' and '" +
                                                     b.schema_field_name +
                                                     "' are different fields");
    }
    if (!equivalent(a.arguments, b.arguments)) {
        throw FieldMergeConflict(a.response_key, "arguments " + a.arguments.dump() + " and " +
                                                     b.arguments.dump() + " differ");
    }
    if (a.type != b.type) {
        throw FieldMergeConflict(a.response_key, "types '" + a.type.to_string() + "' and '" +
                                                     b.type.to_string() + "' differ");
    }
}

bool same_identity(const Fragment& a, const Fragment& b) {
    if (a.name || b.name) {
        return a.name == b.name && a.scope == b.scope;
    }
    return a.origin == b.origin;
}

} // anonymous namespace

std::vector<Field> merge_fields(const std::vector<Field>& a, const std::vector<Field>& b) {
    std::vector<Field> result;
    result.reserve(a.size() + b.size());
    std::vector<bool> consumed(b.size(), false);

    for (const auto& field : a) {
        size_t match = b.size();
        for (size_t i = 0; i < b.size(); ++i) {
            if (!consumed[i] && b[i].response_key == field.response_key) {
                match = i;
                break;
            }
        }

        if (match == b.size()) {
            result.push_back(field);
        } else {
            consumed[match] = true;
            result.push_back(merge_field(field, b[match]));
        }
    }

    for (size_t i = 0; i < b.size(); ++i) {
        if (!consumed[i]) {
            result.push_back(b[i]);
        }
    }

    return result;
}

Field merge_field(const Field& a, const Field& b) {
    check_compatible(a, b);

    Field merged;
    merged.response_key = a.response_key;
    merged.schema_field_name = a.schema_field_name;
    merged.type = a.type;
    merged.kind = a.kind;
    merged.arguments = a.arguments;
    merged.sub_selection = merge_fields(a.sub_selection, b.sub_selection);
    merged.fragments.fragments = merge_fragments(a.fragments.fragments, merged.sub_selection,
                                                 b.fragments.fragments);
    merged.fragments.accessors = a.fragments.accessors;
    merged.fragments.accessors.insert(b.fragments.accessors.begin(),
                                      b.fragments.accessors.end());
    merged.origin_paths = a.origin_paths;
    merged.origin_paths.insert(b.origin_paths.begin(), b.origin_paths.end());
    merged.deferral = merge_deferral(a.response_key, a.deferral, b.deferral);
    merged.conditions = merge_conditions(a.conditions, b.conditions);
    return merged;
}

std::vector<Fragment> merge_fragments(const std::vector<Fragment>& existing,
                                      const std::vector<Field>& parent_fields,
                                      const std::vector<Fragment>& incoming) {
    std::vector<Fragment> result;
    result.reserve(existing.size() + incoming.size());
    std::vector<bool> consumed(incoming.size(), false);

    for (const auto& fragment : existing) {
        size_t match = incoming.size();
        for (size_t i = 0; i < incoming.size(); ++i) {
            if (!consumed[i] && same_identity(fragment, incoming[i])) {
                match = i;
                break;
            }
        }

        Fragment merged = fragment;
        if (match == incoming.size()) {
            merged.fields = merge_fields(fragment.fields, parent_fields);
        } else {
            consumed[match] = true;
            const Fragment& other = incoming[match];
            if (fragment.type_condition != other.type_condition) {
                throw FragmentMergeConflict(fragment.identity(), fragment.type_condition,
                                            other.type_condition);
            }
            merged.fields =
                merge_fields(merge_fields(fragment.fields, other.fields), parent_fields);
            merged.origin_paths.insert(other.origin_paths.begin(), other.origin_paths.end());
            if (!other.deferral) {
                merged.deferral.reset();
            }
        }
        result.push_back(std::move(merged));
    }

    // Incoming fragments only saw their own parent; the merged parent may be larger
    for (size_t i = 0; i < incoming.size(); ++i) {
        if (!consumed[i]) {
            Fragment added = incoming[i];
            added.fields = merge_fields(incoming[i].fields, parent_fields);
            result.push_back(std::move(added));
        }
    }

    return result;
}

std::vector<Field> merge_all(const std::vector<std::vector<Field>>& sources) {
    if (sources.empty()) {
        return {};
    }

    std::vector<Field> result = sources[0];
    for (size_t i = 1; i < sources.size(); ++i) {
        result = merge_fields(result, sources[i]);
    }
    return result;
}

Field canonicalize(const Field& raw) {
    Field out = raw;
    out.sub_selection.clear();
    out.fragments.fragments.clear();

    for (const auto& child : raw.sub_selection) {
        out.sub_selection = merge_fields(out.sub_selection, {canonicalize(child)});
    }

    for (const auto& fragment : raw.fragments.fragments) {
        Fragment canonical = fragment;
        canonical.fields.clear();
        for (const auto& child : fragment.fields) {
            canonical.fields = merge_fields(canonical.fields, {canonicalize(child)});
        }
        canonical.fields = merge_fields(canonical.fields, out.sub_selection);
        out.fragments.fragments =
            merge_fragments(out.fragments.fragments, out.sub_selection, {canonical});
    }

    return out;
}

} // namespace shapeql
