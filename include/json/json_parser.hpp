//! # JSON Parser
//!
//! A recursive descent parser that reads RFC 8259 JSON straight from a
//! `std::string_view` into a `JsonValue` tree.
//!
//! - Numbers without decimal point or exponent become integers
//! - Errors carry the line and column of the offending character
//! - Nesting is limited to `MAX_DEPTH` levels
//! - Anything other than whitespace after the top-level value is an error
//!
//! ```cpp
//! auto result = parse_json(R"([{"id": 1, "text": "Walk the dog"}])");
//! if (is_ok(result)) {
//!     const auto& items = unwrap(result).as_array();
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string>
#include <string_view>

namespace todo::json {

class JsonParser {
public:
    /// Maximum array/object nesting accepted before failing.
    static constexpr size_t MAX_DEPTH = 512;

    explicit JsonParser(std::string_view input);

    /// Parses the whole input as exactly one JSON value.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }
    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();
    [[nodiscard]] auto error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_literal() -> Result<JsonValue, JsonError>;
    auto parse_hex4() -> Result<uint32_t, JsonError>;
};

/// Parses `input` as a single JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace todo::json
