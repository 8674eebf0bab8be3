//! # Complete Command
//!
//! Implements `todo complete <id>`. Only items that are still open can be
//! completed; completing an item twice reports it as not found.

#include "cmd_complete.hpp"

#include "cli/utils.hpp"
#include "log/log.hpp"

#include <charconv>

namespace todo::cli {

namespace {

void print_complete_usage(std::ostream& out) {
    out << "Usage: todo complete <id>\n"
        << "\n"
        << "Mark item <id> as done.\n";
}

} // anonymous namespace

Result<CompleteOptions, std::string> parse_complete_args(const std::vector<std::string>& args) {
    CompleteOptions opts;
    std::vector<std::string> positional;
    bool options_done = false;

    for (const auto& arg : args) {
        if (!options_done && arg == "--") {
            options_done = true;
        } else if (!options_done && (arg == "--help" || arg == "-h")) {
            opts.help = true;
            return opts;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        return std::string("missing <id>");
    }
    if (positional.size() > 1) {
        return "unexpected argument '" + positional[1] + "'";
    }

    const std::string& text = positional.front();
    int32_t id = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return "invalid id '" + text + "': expected a 32-bit integer";
    }

    opts.id = id;
    return opts;
}

int handle_complete(const Storage& storage, int32_t id, std::ostream& out) {
    auto list = load_list(storage, out, "complete");
    if (!list) {
        return exit_code::FAILURE;
    }

    ToDoItem* item = find_open(*list, id);
    if (!item) {
        TODO_LOG_INFO("complete", "No open item with id " << id);
        out << "Error: item " << id << " not found.\n";
        return exit_code::FAILURE;
    }

    complete(*item, now_seconds());
    const std::string completed_text = item->text;

    auto saved = storage.save(*list);
    if (is_err(saved)) {
        out << "Error: failed to write todo list to storage\n";
        return exit_code::FAILURE;
    }

    TODO_LOG_INFO("complete", "Completed item " << id);
    out << "Item " << id << " (" << completed_text << ") completed.\n";
    return exit_code::OK;
}

int run_complete(const Storage& storage, const std::vector<std::string>& args, std::ostream& out,
                 std::ostream& err) {
    auto parsed = parse_complete_args(args);
    if (is_err(parsed)) {
        err << "error: " << unwrap_err(parsed) << "\n\n";
        print_complete_usage(err);
        return exit_code::USAGE;
    }

    const auto& opts = unwrap(parsed);
    if (opts.help) {
        print_complete_usage(out);
        return exit_code::OK;
    }
    return handle_complete(storage, opts.id, out);
}

} // namespace todo::cli
