//! # Todo Storage
//!
//! Persists the whole `ToDoList` as one JSON array in `<root>/todo.json`.
//! Every command loads the full list, changes it in memory and saves it back.
//!
//! ## File Format
//!
//! ```json
//! [{"completed_date":null,"created_date":1709284500,"done":false,"id":1,"text":"Walk the dog"}]
//! ```
//!
//! Timestamps are Unix seconds. `completed_date` is `null` (or absent) for
//! open items. Unknown keys are ignored on load.
//!
//! ## Errors
//!
//! A missing file is not an error: `load()` returns `std::nullopt`, meaning
//! storage has not been initialized. Everything else that goes wrong is a
//! `StorageError`, either `Io` (the file could not be read or written) or
//! `Corrupt` (the contents are not a valid todo list).

#pragma once

#include "common.hpp"
#include "todo/item.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace todo {

/// Failure while reading, parsing or writing the storage file.
struct StorageError {
    enum class Kind {
        Io,     ///< The file could not be read or written
        Corrupt ///< The file is not a valid todo list
    };

    Kind kind;
    std::string message;
    std::filesystem::path path;

    [[nodiscard]] static auto io(std::string msg, std::filesystem::path path) -> StorageError {
        return StorageError{Kind::Io, std::move(msg), std::move(path)};
    }

    [[nodiscard]] static auto corrupt(std::string msg, std::filesystem::path path = {})
        -> StorageError {
        return StorageError{Kind::Corrupt, std::move(msg), std::move(path)};
    }

    /// `"<path>: <message>"`, or just the message when no path is known.
    [[nodiscard]] auto to_string() const -> std::string {
        if (path.empty()) {
            return message;
        }
        return path.string() + ": " + message;
    }
};

/// Serializes `list` to compact JSON.
[[nodiscard]] auto serialize_list(const ToDoList& list) -> std::string;

/// Parses the storage file format. Errors are always `Kind::Corrupt` and
/// carry no path.
[[nodiscard]] auto deserialize_list(std::string_view text) -> Result<ToDoList, StorageError>;

/// Access to the todo list stored under one root directory.
class Storage {
public:
    explicit Storage(std::filesystem::path root);

    [[nodiscard]] auto root() const -> const std::filesystem::path& {
        return root_;
    }

    /// `<root>/todo.json`
    [[nodiscard]] auto list_path() const -> std::filesystem::path {
        return root_ / "todo.json";
    }

    /// `<root>/todo.txt`, created by `todo init` and never read.
    [[nodiscard]] auto placeholder_path() const -> std::filesystem::path {
        return root_ / "todo.txt";
    }

    /// Loads the list. `std::nullopt` means the list file does not exist.
    [[nodiscard]] auto load() const -> Result<std::optional<ToDoList>, StorageError>;

    /// Replaces the list file with `list`.
    ///
    /// The data goes to `todo.json.tmp` first and is then renamed over
    /// `todo.json`, so on failure the previous file is left as it was.
    [[nodiscard]] auto save(const ToDoList& list) const -> Result<Unit, StorageError>;

private:
    std::filesystem::path root_;
};

} // namespace todo
