/**
 * @file ResponsePath.cpp
 * @brief Implementation of response path utilities
 */

#include "shapeql/ResponsePath.hpp"
#include "shapeql/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace shapeql {

namespace {
    /**
     * @brief Check if segment represents an array index
     * @return true if segment is a valid non-negative integer
     */
    bool is_array_index(const std::string& segment) {
        if (segment.empty()) return false;
        // No leading zeros except "0" itself
        if (segment[0] == '0' && segment.size() > 1) return false;
        return std::all_of(segment.begin(), segment.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    std::string segment_text(const PathSegment& seg) {
        if (const auto* key = std::get_if<std::string>(&seg)) {
            return *key;
        }
        return std::to_string(std::get<std::size_t>(seg));
    }

    const Value* step(const Value& current, const PathSegment& seg) {
        if (const auto* key = std::get_if<std::string>(&seg)) {
            if (!current.is_object()) return nullptr;
            auto it = current.find(*key);
            return it == current.end() ? nullptr : &*it;
        }
        const auto idx = std::get<std::size_t>(seg);
        if (!current.is_array() || idx >= current.size()) return nullptr;
        return &current[idx];
    }
}

std::string format_path(const ResponsePath& path) {
    if (path.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segment_text(path[i]);
    }
    return oss.str();
}

ResponsePath parse_path(const std::string& text) {
    ResponsePath segments;
    std::string current;

    auto flush = [&]() {
        if (current.empty()) return;
        if (is_array_index(current)) {
            segments.emplace_back(static_cast<std::size_t>(std::stoull(current)));
        } else {
            segments.emplace_back(current);
        }
        current.clear();
    };

    for (char c : text) {
        if (c == '.') {
            flush();
        } else {
            current += c;
        }
    }
    flush();

    return segments;
}

ResponsePath path_from_json(const Value& value) {
    if (!value.is_array()) {
        throw DocumentFormatError("path", "expected array, found " + type_name(value));
    }

    ResponsePath path;
    path.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const auto& seg = value[i];
        if (seg.is_string()) {
            path.emplace_back(seg.get<std::string>());
        } else if (seg.is_number_unsigned() ||
                   (seg.is_number_integer() && seg.get<std::int64_t>() >= 0)) {
            path.emplace_back(seg.get<std::size_t>());
        } else {
            throw DocumentFormatError("path[" + std::to_string(i) + "]",
                                      "expected string or index, found " + type_name(seg));
        }
    }
    return path;
}

Value path_to_json(const ResponsePath& path) {
    Value out = Value::array();
    for (const auto& seg : path) {
        if (const auto* key = std::get_if<std::string>(&seg)) {
            out.push_back(*key);
        } else {
            out.push_back(std::get<std::size_t>(seg));
        }
    }
    return out;
}

ResponsePath child_path(const ResponsePath& parent, const std::string& key) {
    ResponsePath out = parent;
    out.emplace_back(key);
    return out;
}

ResponsePath child_path(const ResponsePath& parent, std::size_t index) {
    ResponsePath out = parent;
    out.emplace_back(index);
    return out;
}

const Value* find_by_path(const Value& root, const ResponsePath& path) {
    const Value* current = &root;
    for (const auto& seg : path) {
        current = step(*current, seg);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

Value& at_path(Value& root, const ResponsePath& path) {
    Value* current = &root;
    for (const auto& seg : path) {
        if (step(*current, seg) == nullptr) {
            throw UnresolvablePatchPath(
                format_path(path),
                "segment '" + segment_text(seg) + "' not found in " + type_name(*current));
        }
        if (const auto* key = std::get_if<std::string>(&seg)) {
            current = &(*current)[*key];
        } else {
            current = &(*current)[std::get<std::size_t>(seg)];
        }
    }
    return *current;
}

bool has_prefix(const ResponsePath& path, const ResponsePath& prefix) {
    if (prefix.size() > path.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), path.begin());
}

} // namespace shapeql
