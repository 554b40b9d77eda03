/**
 * @file Loader.cpp
 * @brief File and environment loading implementation
 */

#include "shapeql/Loader.hpp"
#include "shapeql/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>

#ifdef _WIN32
    #include <windows.h>
#else
    extern char** environ;
#endif

namespace fs = std::filesystem;

namespace shapeql {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool is_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

template <typename T>
Value formatted(const T& temporal) {
    std::ostringstream out;
    out << temporal;
    return out.str();
}

Value from_toml(const toml::node& node) {
    return node.visit([](const auto& n) -> Value {
        using node_type = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<node_type, toml::table>) {
            Value object = Value::object();
            for (const auto& [key, child] : n) {
                object[std::string(key.str())] = from_toml(child);
            }
            return object;
        } else if constexpr (std::is_same_v<node_type, toml::array>) {
            Value array = Value::array();
            for (const auto& child : n) {
                array.push_back(from_toml(child));
            }
            return array;
        } else if constexpr (std::is_same_v<node_type, toml::value<toml::date>> ||
                             std::is_same_v<node_type, toml::value<toml::time>> ||
                             std::is_same_v<node_type, toml::value<toml::date_time>>) {
            // Settings carry temporal values as text
            return formatted(n.get());
        } else {
            return Value(n.get());
        }
    });
}

/// Every NAME=value pair of the process environment
std::vector<std::pair<std::string, std::string>> environment() {
    std::vector<std::pair<std::string, std::string>> entries;
    auto add = [&](const std::string& entry) {
        const auto eq = entry.find('=');
        if (eq != std::string::npos && eq > 0) {
            entries.emplace_back(entry.substr(0, eq), entry.substr(eq + 1));
        }
    };

#ifdef _WIN32
    LPCH block = GetEnvironmentStrings();
    if (block == nullptr) return entries;
    for (LPCH entry = block; *entry != '\0'; entry += std::strlen(entry) + 1) {
        add(entry);
    }
    FreeEnvironmentStrings(block);
#else
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        add(*entry);
    }
#endif
    return entries;
}

} // anonymous namespace

Value load_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!is_file(path) || !in) {
        throw FileNotFoundError(path);
    }

    try {
        return Value::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(path, 0, 0, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!is_file(path)) {
        throw FileNotFoundError(path);
    }

    try {
        return from_toml(toml::parse_file(path));
    } catch (const toml::parse_error& e) {
        const auto& begin = e.source().begin;
        throw ParseError(path, static_cast<int>(begin.line), static_cast<int>(begin.column),
                         std::string(e.description()));
    }
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Value load_value_file(const std::string& path) {
    if (path.empty()) {
        return Value::object();
    }
    return get_file_extension(path) == ".toml" ? load_toml_file(path) : load_json_file(path);
}

std::string transform_env_name(const std::string& name) {
    std::string key;
    const std::string lower = to_lower(name);
    for (std::size_t i = 0; i < lower.size(); ++i) {
        if (lower[i] != '_') {
            key += lower[i];
        } else if (i + 1 < lower.size() && lower[i + 1] == '_') {
            key += '_';
            ++i;
        } else {
            key += '.';
        }
    }
    return key;
}

std::vector<std::pair<std::string, std::string>> collect_env_vars(const std::string& prefix) {
    std::string head = prefix;
    while (!head.empty() && head.back() == '_') {
        head.pop_back();
    }
    head = to_lower(head) + "_";

    std::vector<std::pair<std::string, std::string>> matched;
    for (auto& [name, value] : environment()) {
        if (name.size() > head.size() && to_lower(name.substr(0, head.size())) == head) {
            matched.emplace_back(name.substr(head.size()), std::move(value));
        }
    }
    return matched;
}

} // namespace shapeql
