//! # Todo Storage Implementation
//!
//! JSON codec for `ToDoList` and the load/save cycle on `todo.json`.

#include "todo/storage.hpp"

#include "json/json.hpp"
#include "log/log.hpp"

#include <fstream>
#include <optional>
#include <sstream>

namespace fs = std::filesystem;

namespace todo {

namespace {

auto to_json(const ToDoItem& item) -> json::JsonValue {
    auto obj = json::json_object();
    obj.set("id", json::json_int(item.id));
    obj.set("text", json::json_string(item.text));
    obj.set("done", json::json_bool(item.done));
    obj.set("created_date", json::json_int(item.created_date.time_since_epoch().count()));
    if (item.completed_date) {
        obj.set("completed_date",
                json::json_int(item.completed_date->time_since_epoch().count()));
    } else {
        obj.set("completed_date", json::json_null());
    }
    return obj;
}

auto item_error(size_t index, const std::string& msg) -> StorageError {
    return StorageError::corrupt("item " + std::to_string(index) + ": " + msg);
}

/// Reads an integer timestamp, or `std::nullopt` if `value` is not an
/// integer within years 0000 to 9999.
auto read_timestamp(const json::JsonValue& value) -> std::optional<Timestamp> {
    auto seconds = value.try_as_i64();
    if (!seconds || *seconds < MIN_TIMESTAMP_SECONDS || *seconds > MAX_TIMESTAMP_SECONDS) {
        return std::nullopt;
    }
    return Timestamp{std::chrono::seconds{*seconds}};
}

auto from_json(const json::JsonValue& value, size_t index) -> Result<ToDoItem, StorageError> {
    if (!value.is_object()) {
        return item_error(index, "expected an object");
    }

    ToDoItem item;

    const auto* id = value.get("id");
    if (!id || !id->is_number() || !id->as_number().try_as_i32()) {
        return item_error(index, "'id' must be a 32-bit integer");
    }
    item.id = *id->as_number().try_as_i32();

    const auto* text = value.get("text");
    if (!text || !text->is_string()) {
        return item_error(index, "'text' must be a string");
    }
    item.text = text->as_string();

    const auto* done = value.get("done");
    if (!done || !done->is_bool()) {
        return item_error(index, "'done' must be a boolean");
    }
    item.done = done->as_bool();

    const auto* created = value.get("created_date");
    if (!created || !created->is_integer()) {
        return item_error(index, "'created_date' must be an integer timestamp");
    }
    auto created_at = read_timestamp(*created);
    if (!created_at) {
        return item_error(index, "'created_date' is outside years 0000 to 9999");
    }
    item.created_date = *created_at;

    const auto* completed = value.get("completed_date");
    if (completed && !completed->is_null()) {
        if (!completed->is_integer()) {
            return item_error(index, "'completed_date' must be an integer timestamp or null");
        }
        auto completed_at = read_timestamp(*completed);
        if (!completed_at) {
            return item_error(index, "'completed_date' is outside years 0000 to 9999");
        }
        item.completed_date = *completed_at;
    }

    if (item.done != item.completed_date.has_value()) {
        return item_error(index, "'completed_date' must be set exactly when 'done' is true");
    }

    return item;
}

} // anonymous namespace

// ============================================================================
// Codec
// ============================================================================

auto serialize_list(const ToDoList& list) -> std::string {
    auto arr = json::json_array();
    for (const auto& item : list) {
        arr.push(to_json(item));
    }
    return arr.to_string();
}

auto deserialize_list(std::string_view text) -> Result<ToDoList, StorageError> {
    auto parsed = json::parse_json(text);
    if (is_err(parsed)) {
        return StorageError::corrupt("invalid JSON at " + unwrap_err(parsed).to_string());
    }

    const auto& root = unwrap(parsed);
    if (!root.is_array()) {
        return StorageError::corrupt("expected a JSON array of todo items");
    }

    ToDoList list;
    list.reserve(root.size());
    for (size_t i = 0; i < root.size(); ++i) {
        auto item = from_json(root[i], i);
        if (is_err(item)) {
            return unwrap_err(item);
        }
        list.push_back(std::move(unwrap(item)));
    }
    return list;
}

// ============================================================================
// Storage
// ============================================================================

Storage::Storage(fs::path root) : root_(std::move(root)) {}

auto Storage::load() const -> Result<std::optional<ToDoList>, StorageError> {
    const auto path = list_path();

    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec) {
        TODO_LOG_ERROR("storage", "Cannot stat " << path.string() << ": " << ec.message());
        return StorageError::io(ec.message(), path);
    }
    if (!exists) {
        TODO_LOG_DEBUG("storage", "No list file at " << path.string());
        return std::optional<ToDoList>{};
    }
    if (fs::is_directory(path, ec)) {
        TODO_LOG_ERROR("storage", path.string() << " is a directory");
        return StorageError::io("is a directory", path);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        TODO_LOG_ERROR("storage", "Cannot open " << path.string());
        return StorageError::io("cannot open file for reading", path);
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        TODO_LOG_ERROR("storage", "Read failed on " << path.string());
        return StorageError::io("read failed", path);
    }

    auto list = deserialize_list(buffer.str());
    if (is_err(list)) {
        auto& err = unwrap_err(list);
        err.path = path;
        TODO_LOG_ERROR("storage", "Corrupt list file " << err.to_string());
        return err;
    }

    TODO_LOG_DEBUG("storage",
                   "Loaded " << unwrap(list).size() << " items from " << path.string());
    return std::optional<ToDoList>(std::move(unwrap(list)));
}

auto Storage::save(const ToDoList& list) const -> Result<Unit, StorageError> {
    const auto path = list_path();

    // Write to temp file first, then rename (atomic)
    auto temp_file = path;
    temp_file += ".tmp";

    const std::string data = serialize_list(list);
    std::error_code ec;

    {
        std::ofstream out(temp_file, std::ios::binary | std::ios::trunc);
        if (!out) {
            TODO_LOG_ERROR("storage", "Cannot create " << temp_file.string());
            return StorageError::io("cannot create temporary file", temp_file);
        }

        out << data;
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(temp_file, ec);
            TODO_LOG_ERROR("storage", "Write failed on " << temp_file.string());
            return StorageError::io("write failed", temp_file);
        }
    }

    fs::rename(temp_file, path, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(temp_file, ec);
        TODO_LOG_ERROR("storage", "Cannot replace " << path.string() << ": " << reason);
        return StorageError::io(reason, path);
    }

    TODO_LOG_DEBUG("storage", "Saved " << list.size() << " items to " << path.string());
    return Unit{};
}

} // namespace todo
