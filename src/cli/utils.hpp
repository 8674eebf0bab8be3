//! # CLI Utilities Interface
//!
//! Shared helpers for the command handlers.
//!
//! ## Functions
//!
//! | Function          | Description                                   |
//! |-------------------|-----------------------------------------------|
//! | `print_usage()`   | Print CLI help text                           |
//! | `print_version()` | Print tool version                            |
//! | `load_list()`     | Load the list, reporting failures to the user |

#pragma once

#include "todo/storage.hpp"

#include <optional>
#include <ostream>
#include <string_view>

namespace todo::cli {

// Process exit codes
namespace exit_code {
constexpr int OK = 0;
constexpr int FAILURE = 1; ///< Storage or logical failure
constexpr int USAGE = 2;   ///< Bad command line
} // namespace exit_code

// Help text
void print_usage(std::ostream& out);
void print_version(std::ostream& out);

/// Loads the list from `storage`. On any failure the user-facing message is
/// written to `out`, the failure is logged under `module`, and `std::nullopt`
/// is returned.
std::optional<ToDoList> load_list(const Storage& storage, std::ostream& out,
                                  std::string_view module);

} // namespace todo::cli
