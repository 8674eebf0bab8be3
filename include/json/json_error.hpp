//! # JSON Error Type
//!
//! Errors produced while parsing JSON, with the location of the offending
//! input so that a damaged storage file can be pointed at precisely.
//!
//! ```cpp
//! auto error = JsonError::make("Expected ',' or ']' in array", 3, 14);
//! std::cerr << error.to_string() << std::endl;
//! // line 3, column 14: Expected ',' or ']' in array
//! ```

#pragma once

#include <cstddef>
#include <string>

namespace todo::json {

/// An error encountered during JSON parsing.
///
/// `line` and `column` are 1-based; zero means the location is unknown.
struct JsonError {
    /// Human-readable error description.
    std::string message;

    /// Line number where the error occurred (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number where the error occurred (1-based, 0 if unknown).
    size_t column = 0;

    /// Byte offset in input where the error occurred.
    size_t offset = 0;

    /// Creates an error without location information.
    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    /// Creates an error located at `line`:`column`.
    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// Formats the error as `"line X, column Y: message"`, dropping the parts
    /// of the location that are unknown.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace todo::json
