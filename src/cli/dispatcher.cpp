//! # CLI Command Dispatcher
//!
//! Main entry point for the `todo` CLI. Resolves the configuration,
//! initializes logging and routes to the command handler.
//!
//! ## Architecture
//!
//! ```text
//! todo_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ init           → run_init()
//!   ├─ new            → run_new()
//!   ├─ complete       → run_complete()
//!   └─ list           → run_list()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                          |
//! |------|--------------------------------------------------|
//! | 0    | Success                                          |
//! | 1    | Storage failure, item not found, init conflict   |
//! | 2    | Usage error                                      |

#include "cli/commands/cmd_complete.hpp"
#include "cli/commands/cmd_init.hpp"
#include "cli/commands/cmd_list.hpp"
#include "cli/commands/cmd_new.hpp"
#include "cli/config.hpp"
#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace todo::cli {

int todo_main(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    auto config_result = resolve_config(argc, argv);
    if (is_err(config_result)) {
        err << "error: " << unwrap_err(config_result) << "\n";
        return exit_code::USAGE;
    }
    const auto& config = unwrap(config_result);
    log::Logger::init(config.log);

    std::vector<std::string> args = strip_global_options(argc, argv);
    if (args.empty()) {
        print_usage(err);
        return exit_code::USAGE;
    }

    const std::string command = args.front();
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "--help" || command == "-h") {
        print_usage(out);
        return exit_code::OK;
    }

    if (command == "--version" || command == "-V") {
        print_version(out);
        return exit_code::OK;
    }

    Storage storage(config.storage_dir);
    TODO_LOG_DEBUG("cli", "Running '" << command << "' with storage at "
                                      << storage.root().string());

    int result = exit_code::USAGE;
    if (command == "init") {
        result = run_init(storage, rest, out, err);
    } else if (command == "new") {
        result = run_new(storage, rest, out, err);
    } else if (command == "complete") {
        result = run_complete(storage, rest, out, err);
    } else if (command == "list") {
        result = run_list(storage, rest, out, err);
    } else {
        err << "error: unknown command '" << command << "'\n\n";
        print_usage(err);
    }

    log::Logger::instance().flush();
    return result;
}

} // namespace todo::cli

int todo_main(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    return todo::cli::todo_main(argc, argv, out, err);
}

int todo_main(int argc, char* argv[]) {
    return todo::cli::todo_main(argc, argv, std::cout, std::cerr);
}
