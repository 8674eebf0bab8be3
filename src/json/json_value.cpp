//! # JSON Value Implementation
//!
//! Structural equality for `JsonValue`. Objects compare
//! equal when they hold the same keys with equal values; arrays compare
//! element by element in order. A null only equals another null.

#include "json/json_value.hpp"

namespace todo::json {

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_number()) {
        return as_number() == other.as_number();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        const auto& lhs = as_array();
        const auto& rhs = other.as_array();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (!(lhs[i] == rhs[i])) {
                return false;
            }
        }
        return true;
    }

    const auto& lhs = as_object();
    const auto& rhs = other.as_object();
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (const auto& [key, val] : lhs) {
        auto it = rhs.find(key);
        if (it == rhs.end() || !(it->second == val)) {
            return false;
        }
    }
    return true;
}

} // namespace todo::json
