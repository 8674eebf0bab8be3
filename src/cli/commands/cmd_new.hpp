//! # New Command Interface
//!
//! `todo new <text>`: append an open item to the list.

#ifndef TODO_CLI_CMD_NEW_HPP
#define TODO_CLI_CMD_NEW_HPP

#include "common.hpp"
#include "todo/storage.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace todo::cli {

struct NewOptions {
    std::string text;
    bool help = false;
};

/// Expects exactly one text argument. A leading `--` allows text that
/// starts with a dash.
Result<NewOptions, std::string> parse_new_args(const std::vector<std::string>& args);

/// Adds an item with the next free id and saves the list.
int handle_new(const Storage& storage, const std::string& text, std::ostream& out);

int run_new(const Storage& storage, const std::vector<std::string>& args, std::ostream& out,
            std::ostream& err);

} // namespace todo::cli

#endif // TODO_CLI_CMD_NEW_HPP
