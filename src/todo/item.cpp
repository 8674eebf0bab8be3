#include "todo/item.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace todo {

auto now_seconds() -> Timestamp {
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

auto format_local_time(Timestamp when) -> std::string {
    // Straight from the seconds count: system_clock::to_time_t would go
    // through nanoseconds and overflow past year 2262.
    const auto seconds = when.time_since_epoch().count();
    const auto t = static_cast<std::time_t>(seconds);

    std::tm tm_buf{};
#ifdef _WIN32
    const bool converted = localtime_s(&tm_buf, &t) == 0;
#else
    const bool converted = localtime_r(&t, &tm_buf) != nullptr;
#endif
    if (!converted) {
        // No calendar date for this time_t (or, on Windows, a pre-1970 one)
        return "@" + std::to_string(seconds);
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

auto render(const ToDoItem& item, bool verbose) -> std::string {
    std::string details;
    if (verbose) {
        details = "(created: " + format_local_time(item.created_date);
        if (item.completed_date) {
            details += " completed: " + format_local_time(*item.completed_date);
        }
        details += ")";
    }

    std::ostringstream oss;
    oss << std::right << std::setw(4) << (std::to_string(item.id) + ".") << " ["
        << (item.done ? "X" : " ") << "] " << item.text << " " << details;
    return oss.str();
}

auto next_id(const ToDoList& list) -> int32_t {
    int32_t max_id = 0;
    for (const auto& item : list) {
        max_id = std::max(max_id, item.id);
    }
    return max_id + 1;
}

auto find_open(ToDoList& list, int32_t id) -> ToDoItem* {
    auto it = std::find_if(list.begin(), list.end(),
                           [id](const ToDoItem& item) { return item.id == id && !item.done; });
    return it == list.end() ? nullptr : &*it;
}

void complete(ToDoItem& item, Timestamp when) {
    item.done = true;
    item.completed_date = when;
}

} // namespace todo
