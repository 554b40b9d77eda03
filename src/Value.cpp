/**
 * @file Value.cpp
 * @brief Order-insensitive value comparison
 */

#include "shapeql/Value.hpp"

namespace shapeql {

bool equivalent(const Value& a, const Value& b) {
    if (a.is_object() && b.is_object()) {
        if (a.size() != b.size()) return false;
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end() || !equivalent(it.value(), *other)) {
                return false;
            }
        }
        return true;
    }

    if (a.is_array() && b.is_array()) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (!equivalent(a[i], b[i])) return false;
        }
        return true;
    }

    // Scalars (numbers compare across integer/unsigned/float)
    return a == b;
}

} // namespace shapeql
