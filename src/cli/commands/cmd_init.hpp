//! # Init Command Interface
//!
//! `todo init`: create the storage directory and the placeholder file.

#ifndef TODO_CLI_CMD_INIT_HPP
#define TODO_CLI_CMD_INIT_HPP

#include "todo/storage.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace todo::cli {

/**
 * Initialize storage under `storage.root()`
 *
 * @param storage Storage to initialize
 * @param out Stream for the user-facing messages
 * @return 0 on success, 1 if the directory or file could not be created
 */
int handle_init(const Storage& storage, std::ostream& out);

/// Parses the arguments following `init` and runs handle_init().
int run_init(const Storage& storage, const std::vector<std::string>& args, std::ostream& out,
             std::ostream& err);

} // namespace todo::cli

#endif // TODO_CLI_CMD_INIT_HPP
