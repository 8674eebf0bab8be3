//! # Todo Items
//!
//! The in-memory data model: a `ToDoItem` is one entry of the list, and a
//! `ToDoList` is the whole list in insertion order, exactly as it is stored.
//!
//! ## Invariants
//!
//! - `completed_date` is set if and only if `done` is true.
//! - Timestamps have whole-second precision, so a list compares equal to
//!   itself after a save and load.
//!
//! ## Rendering
//!
//! ```text
//!   1. [ ] Walk the dog
//!  12. [X] Buy milk (created: 2024-03-01 09:15:00 completed: 2024-03-02 18:40:12)
//! ```

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace todo {

/// Seconds since the Unix epoch.
using Timestamp = std::chrono::sys_seconds;

/// Stored timestamps must fall within years 0000 to 9999 (UTC).
constexpr int64_t MIN_TIMESTAMP_SECONDS = -62167219200; // 0000-01-01 00:00:00
constexpr int64_t MAX_TIMESTAMP_SECONDS = 253402300799; // 9999-12-31 23:59:59

/// One entry of the todo list.
struct ToDoItem {
    int32_t id = 0;
    std::string text;
    bool done = false;
    Timestamp created_date{};
    std::optional<Timestamp> completed_date;

    [[nodiscard]] auto operator==(const ToDoItem& other) const -> bool = default;
};

/// The full list as persisted.
using ToDoList = std::vector<ToDoItem>;

/// Current time truncated to whole seconds.
[[nodiscard]] auto now_seconds() -> Timestamp;

/// Formats `when` in the local time zone as `YYYY-MM-DD HH:MM:SS`. When the
/// platform cannot convert it, returns the raw seconds as `@<seconds>`.
[[nodiscard]] auto format_local_time(Timestamp when) -> std::string;

/// Renders one line of `todo list` output (without the leading indent).
///
/// The id and a period are right-aligned in a 4-character field, followed by
/// the completion marker in brackets, the text, one space and the verbose
/// details. The trailing space is present even when `verbose` is false.
[[nodiscard]] auto render(const ToDoItem& item, bool verbose) -> std::string;

/// `max(id) + 1`, or 1 for an empty list.
[[nodiscard]] auto next_id(const ToDoList& list) -> int32_t;

/// First item with `id` that is not done yet, or `nullptr`.
[[nodiscard]] auto find_open(ToDoList& list, int32_t id) -> ToDoItem*;

/// Marks `item` done at `when`.
void complete(ToDoItem& item, Timestamp when);

} // namespace todo
