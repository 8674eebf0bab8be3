//! # New Item Command
//!
//! Implements `todo new <text>`.
//!
//! ```bash
//! todo new "Walk the dog"
//! todo new -- "-5 push-ups"    # text starting with a dash
//! ```

#include "cmd_new.hpp"

#include "cli/utils.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <limits>

namespace todo::cli {

namespace {

void print_new_usage(std::ostream& out) {
    out << "Usage: todo new <todo text>\n"
        << "\n"
        << "Add new item to todo list. Quote text that contains spaces.\n";
}

} // anonymous namespace

Result<NewOptions, std::string> parse_new_args(const std::vector<std::string>& args) {
    NewOptions opts;
    std::vector<std::string> positional;
    bool options_done = false;

    for (const auto& arg : args) {
        if (!options_done && arg == "--") {
            options_done = true;
        } else if (!options_done && (arg == "--help" || arg == "-h")) {
            opts.help = true;
            return opts;
        } else if (!options_done && arg.size() > 1 && arg[0] == '-') {
            return "unexpected option '" + arg + "'";
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        return std::string("missing <todo text>");
    }
    if (positional.size() > 1) {
        return "unexpected argument '" + positional[1] + "' (quote text that contains spaces)";
    }

    opts.text = std::move(positional.front());
    return opts;
}

int handle_new(const Storage& storage, const std::string& text, std::ostream& out) {
    auto list = load_list(storage, out, "new");
    if (!list) {
        return exit_code::FAILURE;
    }

    bool ids_exhausted = std::any_of(list->begin(), list->end(), [](const ToDoItem& item) {
        return item.id == std::numeric_limits<int32_t>::max();
    });
    if (ids_exhausted) {
        TODO_LOG_ERROR("new", "Item id " << std::numeric_limits<int32_t>::max()
                                         << " is taken, no higher id available");
        out << "Error: no item id left to assign\n";
        return exit_code::FAILURE;
    }

    ToDoItem item;
    item.id = next_id(*list);
    item.text = text;
    item.done = false;
    item.created_date = now_seconds();
    list->push_back(item);

    auto saved = storage.save(*list);
    if (is_err(saved)) {
        out << "Error: failed to write todo list to storage\n";
        return exit_code::FAILURE;
    }

    TODO_LOG_INFO("new", "Added item " << item.id);
    out << "New item (" << item.id << ") added to to todo list.\n";
    return exit_code::OK;
}

int run_new(const Storage& storage, const std::vector<std::string>& args, std::ostream& out,
            std::ostream& err) {
    auto parsed = parse_new_args(args);
    if (is_err(parsed)) {
        err << "error: " << unwrap_err(parsed) << "\n\n";
        print_new_usage(err);
        return exit_code::USAGE;
    }

    const auto& opts = unwrap(parsed);
    if (opts.help) {
        print_new_usage(out);
        return exit_code::OK;
    }
    return handle_new(storage, opts.text, out);
}

} // namespace todo::cli
