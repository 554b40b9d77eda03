/**
 * @file Parse.cpp
 * @brief Implementation of type parsing
 */

#include "shapeql/Parse.hpp"
#include "shapeql/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace shapeql {

namespace {
    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                      [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    const std::regex& integer_pattern() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }
}

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }
    if (lower == "null") {
        return nullptr;
    }

    if (std::regex_match(str, integer_pattern())) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // Too large for int64: keep the text
        }
    }

    if (std::regex_match(str, float_pattern())) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            // Not representable: keep the text
        }
    }

    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = Value::parse(str, nullptr, false);
        if (parsed.is_string()) {
            return parsed;
        }
    }

    return str;
}

std::pair<std::string, Value> parse_assignment(const std::string& text) {
    const auto eq = text.find('=');
    if (eq == std::string::npos) {
        throw ParseError("--set", 0, 0, "expected key=value, got '" + text + "'");
    }
    std::string key = text.substr(0, eq);
    if (key.empty()) {
        throw ParseError("--set", 0, 0, "empty key in '" + text + "'");
    }
    return {key, parse_value(text.substr(eq + 1))};
}

} // namespace shapeql
