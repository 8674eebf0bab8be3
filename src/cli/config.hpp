//! # Application Configuration
//!
//! Settings resolved once at startup from the command line and environment:
//! where the todo list lives and how diagnostics are logged.
//!
//! ## Global Options
//!
//! | Option | Effect |
//! |--------|--------|
//! | `--storage-dir=<dir>` | Storage root instead of `~/.todo` |
//! | `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`, `-q` | See `log/log.hpp` |
//!
//! Global options may appear anywhere before a `--` separator.

#ifndef TODO_CLI_CONFIG_HPP
#define TODO_CLI_CONFIG_HPP

#include "common.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace todo::cli {

struct AppConfig {
    std::filesystem::path storage_dir;
    log::LogConfig log;
};

/// `~/.todo`, using `$HOME` and then the password database (the user
/// profile directory on Windows). `std::nullopt` if neither is available.
std::optional<std::filesystem::path> default_storage_dir();

/// Builds the configuration from argv. Fails with a message when
/// `--storage-dir=` is empty or no home directory can be found.
Result<AppConfig, std::string> resolve_config(int argc, char* argv[]);

/// Returns `true` for options handled by resolve_config().
bool is_global_option(std::string_view arg);

/// argv without the program name and without global options. Everything
/// from a `--` separator on is kept as-is, separator included.
std::vector<std::string> strip_global_options(int argc, char* argv[]);

} // namespace todo::cli

#endif // TODO_CLI_CONFIG_HPP
