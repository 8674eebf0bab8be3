//! # List Command Interface
//!
//! `todo list [-a|--all] [-v|--verbose]`: print the list.

#ifndef TODO_CLI_CMD_LIST_HPP
#define TODO_CLI_CMD_LIST_HPP

#include "common.hpp"
#include "todo/storage.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace todo::cli {

struct ListOptions {
    bool all = false;     ///< Include completed items
    bool verbose = false; ///< Show creation and completion times
    bool help = false;
};

/// Accepts `-a`, `--all`, `-v`, `--verbose` and combined short flags
/// such as `-av`. A trailing `--` is accepted; `list` takes no arguments
/// after it.
Result<ListOptions, std::string> parse_list_args(const std::vector<std::string>& args);

int handle_list(const Storage& storage, const ListOptions& opts, std::ostream& out);

int run_list(const Storage& storage, const std::vector<std::string>& args, std::ostream& out,
             std::ostream& err);

} // namespace todo::cli

#endif // TODO_CLI_CMD_LIST_HPP
