//! # List Command
//!
//! Implements `todo list`.
//!
//! ## Output
//!
//! ```text
//! TODO List
//!
//!      1. [ ] Walk the dog
//!      3. [ ] Buy milk
//! ```
//!
//! Completed items are hidden unless `--all` is given.

#include "cmd_list.hpp"

#include "cli/utils.hpp"
#include "log/log.hpp"

namespace todo::cli {

namespace {

void print_list_usage(std::ostream& out) {
    out << "Usage: todo list [options]\n"
        << "\n"
        << "Print todo list.\n"
        << "\n"
        << "Options:\n"
        << "  --all, -a          Include completed items\n"
        << "  --verbose, -v      Show when items were created and completed\n"
        << "  --help, -h         Show this help message\n";
}

} // anonymous namespace

Result<ListOptions, std::string> parse_list_args(const std::vector<std::string>& args) {
    ListOptions opts;
    bool options_done = false;

    for (const auto& arg : args) {
        if (options_done) {
            return "unexpected argument '" + arg + "'";
        }
        if (arg == "--") {
            options_done = true;
        } else if (arg == "--all") {
            opts.all = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--help") {
            opts.help = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-') {
            // Short flags, possibly combined: -a, -v, -av, -va
            for (size_t i = 1; i < arg.size(); ++i) {
                switch (arg[i]) {
                case 'a':
                    opts.all = true;
                    break;
                case 'v':
                    opts.verbose = true;
                    break;
                case 'h':
                    opts.help = true;
                    break;
                default:
                    return "unexpected option '-" + std::string(1, arg[i]) + "'";
                }
            }
        } else if (arg.starts_with("-")) {
            return "unexpected option '" + arg + "'";
        } else {
            return "unexpected argument '" + arg + "'";
        }
    }

    return opts;
}

int handle_list(const Storage& storage, const ListOptions& opts, std::ostream& out) {
    auto list = load_list(storage, out, "list");
    if (!list) {
        return exit_code::FAILURE;
    }

    out << "TODO List\n\n";
    size_t shown = 0;
    for (const auto& item : *list) {
        if (!opts.all && item.done) {
            continue;
        }
        out << "   " << render(item, opts.verbose) << "\n";
        ++shown;
    }

    TODO_LOG_DEBUG("list", "Listed " << shown << " of " << list->size() << " items");
    return exit_code::OK;
}

int run_list(const Storage& storage, const std::vector<std::string>& args, std::ostream& out,
             std::ostream& err) {
    auto parsed = parse_list_args(args);
    if (is_err(parsed)) {
        err << "error: " << unwrap_err(parsed) << "\n\n";
        print_list_usage(err);
        return exit_code::USAGE;
    }

    const auto& opts = unwrap(parsed);
    if (opts.help) {
        print_list_usage(out);
        return exit_code::OK;
    }
    return handle_list(storage, opts, out);
}

} // namespace todo::cli
