//! # Complete Command Interface
//!
//! `todo complete <id>`: mark an open item as done.

#ifndef TODO_CLI_CMD_COMPLETE_HPP
#define TODO_CLI_CMD_COMPLETE_HPP

#include "common.hpp"
#include "todo/storage.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace todo::cli {

struct CompleteOptions {
    int32_t id = 0;
    bool help = false;
};

/// Expects exactly one argument that parses completely as a 32-bit integer.
Result<CompleteOptions, std::string> parse_complete_args(const std::vector<std::string>& args);

/// Completes the first open item with `id`. Fails without saving if there
/// is no such item.
int handle_complete(const Storage& storage, int32_t id, std::ostream& out);

int run_complete(const Storage& storage, const std::vector<std::string>& args, std::ostream& out,
                 std::ostream& err);

} // namespace todo::cli

#endif // TODO_CLI_CMD_COMPLETE_HPP
