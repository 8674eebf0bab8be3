//! # JSON Value Types
//!
//! `JsonValue` is the in-memory form of a JSON document. The storage layer
//! converts todo items to and from it, and the logger uses it to render
//! JSON log lines.
//!
//! ## Number Handling
//!
//! Numbers keep the distinction between integers and floats, so ids and
//! Unix timestamps survive a round trip exactly:
//!
//! | JSON Input | Storage Kind | Reason |
//! |------------|--------------|--------|
//! | `42` | `Int` | No decimal point, fits in `int64_t` |
//! | `1e3` | `Float` | Has exponent |
//! | `99999999999999999999` | `Float` | Too large for `int64_t` |
//!
//! ## Example
//!
//! ```cpp
//! JsonValue item = json_object();
//! item.set("id", json_int(7));
//! item.set("text", json_string("Walk the dog"));
//!
//! if (const auto* id = item.get("id"); id && id->is_integer()) {
//!     int64_t n = id->as_i64();
//! }
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace todo::json {

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// A JSON object containing key-value pairs (ordered by key).
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// A JSON number stored either as a signed 64-bit integer or as a double.
struct JsonNumber {
    enum class Kind : uint8_t {
        Int,  ///< `i64` is active
        Float ///< `f64` is active
    };

    Kind kind;

    union {
        int64_t i64;
        double f64;
    };

    explicit JsonNumber(int64_t value) : kind(Kind::Int), i64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Float), f64(value) {}
    JsonNumber() : kind(Kind::Int), i64(0) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind == Kind::Int;
    }

    [[nodiscard]] auto is_float() const -> bool {
        return kind == Kind::Float;
    }

    /// Returns the integer value, or `std::nullopt` for floats.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (kind == Kind::Int) {
            return i64;
        }
        return std::nullopt;
    }

    /// Returns the value as `int32_t` if it is an integer in range.
    [[nodiscard]] auto try_as_i32() const -> std::optional<int32_t> {
        auto val = try_as_i64();
        if (val && *val >= std::numeric_limits<int32_t>::min() &&
            *val <= std::numeric_limits<int32_t>::max()) {
            return static_cast<int32_t>(*val);
        }
        return std::nullopt;
    }

    /// Lossy conversion to `double`. Always succeeds.
    [[nodiscard]] auto as_f64() const -> double {
        return kind == Kind::Int ? static_cast<double>(i64) : f64;
    }

    /// Numbers of different kinds are compared as doubles.
    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind != other.kind) {
            return as_f64() == other.as_f64();
        }
        return kind == Kind::Int ? i64 == other.i64 : f64 == other.f64;
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// Any JSON value: null, boolean, number, string, array or object.
///
/// Arrays and objects are boxed so the type can be recursive. Because the
/// boxes own their contents, `JsonValue` is move-only.
///
/// Accessors named `as_*` throw `std::bad_variant_access` when the value has
/// a different type. Check with the matching `is_*` query first, or use
/// `get()` / `try_as_i64()` which return null/`std::nullopt` instead.
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant =
        std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    // ------------------------------------------------------------------------
    // Constructors
    // ------------------------------------------------------------------------

    JsonValue() : data(Null{}) {}
    explicit JsonValue(std::nullptr_t) : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(double value) : data(JsonNumber(value)) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data(std::string(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}
    explicit JsonValue(JsonNumber value) : data(value) {}

    // ------------------------------------------------------------------------
    // Type Queries
    // ------------------------------------------------------------------------

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    /// Returns `true` for numbers written without decimal point or exponent.
    [[nodiscard]] auto is_integer() const -> bool {
        if (auto* num = std::get_if<JsonNumber>(&data)) {
            return num->is_integer();
        }
        return false;
    }

    // ------------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------------

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Gets an integer number.
    ///
    /// # Panics
    ///
    /// Throws `std::runtime_error` if this is a float.
    [[nodiscard]] auto as_i64() const -> int64_t {
        auto opt = as_number().try_as_i64();
        if (!opt) {
            throw std::runtime_error("JSON number is not an integer");
        }
        return *opt;
    }

    [[nodiscard]] auto as_f64() const -> double {
        return as_number().as_f64();
    }

    /// Returns the integer value, or `std::nullopt` if this is not an integer.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (auto* num = std::get_if<JsonNumber>(&data)) {
            return num->try_as_i64();
        }
        return std::nullopt;
    }

    // ------------------------------------------------------------------------
    // Containers
    // ------------------------------------------------------------------------

    /// Looks up `key` in an object. Returns `nullptr` if this is not an
    /// object or the key is missing.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    /// Element count of an array or object; `0` for scalars.
    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }

    /// Appends to an array.
    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    /// Inserts or replaces `key` in an object.
    void set(const std::string& key, JsonValue value) {
        as_object_mut()[key] = std::move(value);
    }

    // ------------------------------------------------------------------------
    // Serialization (json_serializer.cpp)
    // ------------------------------------------------------------------------

    /// Compact JSON with no whitespace between elements.
    [[nodiscard]] auto to_string() const -> std::string;

    // ------------------------------------------------------------------------
    // Comparison (json_value.cpp)
    // ------------------------------------------------------------------------

    /// Structural equality. Values of different types are never equal.
    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_int(int64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_float(double value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace todo::json
