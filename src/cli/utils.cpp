//! # CLI Utilities
//!
//! Help text and the load step every command starts with.

#include "cli/utils.hpp"

#include "common.hpp"
#include "log/log.hpp"

namespace todo::cli {

void print_usage(std::ostream& out) {
    out << "todo " << VERSION << "\n\n";
    out << "Usage: todo [options] <command> [command options]\n\n";
    out << "Commands:\n";
    out << "  init                Initialise storage for todo command to use for persistance.\n";
    out << "  new <todo text>     Add new item to todo list.\n";
    out << "  complete <id>       Mark item <id> as done.\n";
    out << "  list [-a] [-v]      Print todo list.\n";
    out << "\nOptions:\n";
    out << "  --storage-dir=<dir>     Use <dir> instead of ~/.todo\n";
    out << "  --log-level=<level>     trace, debug, info, warn, error, fatal, off (default warn)\n";
    out << "  --log-filter=<spec>     Per-module levels, e.g. storage=debug,*=warn\n";
    out << "  --log-file=<path>       Also write diagnostics to <path>\n";
    out << "  --log-format=text|json  Diagnostic output format\n";
    out << "  --quiet, -q             Only log errors\n";
    out << "  --help, -h              Show this help\n";
    out << "  --version, -V           Show version\n";
    out << "\nRun 'todo <command> --help' for command options.\n";
}

void print_version(std::ostream& out) {
    out << "todo " << VERSION << "\n";
}

std::optional<ToDoList> load_list(const Storage& storage, std::ostream& out,
                                  std::string_view module) {
    auto result = storage.load();
    if (is_err(result)) {
        const auto& err = unwrap_err(result);
        if (err.kind == StorageError::Kind::Corrupt) {
            out << "Error: todo list storage is corrupt: " << err.to_string() << "\n";
        } else {
            out << "Error: failed to read todo list from storage: " << err.to_string() << "\n";
        }
        return std::nullopt;
    }

    auto& list = unwrap(result);
    if (!list) {
        TODO_LOG_INFO(module, "Storage not initialised: " << storage.list_path().string()
                                                         << " does not exist");
        out << "Couldn't load todo list from storage\n";
        return std::nullopt;
    }
    return std::move(list);
}

} // namespace todo::cli
