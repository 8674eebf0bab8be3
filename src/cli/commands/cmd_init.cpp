//! # Storage Initialization Command
//!
//! Implements `todo init`.
//!
//! ## Created Layout
//!
//! ```text
//! ~/.todo/
//!   └─ todo.txt        # Empty placeholder, created exclusively
//! ```
//!
//! Creating the directory is idempotent: an existing directory is fine.
//! Creating the placeholder is not: running `init` twice fails the second
//! time. Note that the list itself lives in `todo.json`, which `init` does
//! not create.

#include "cmd_init.hpp"

#include "cli/utils.hpp"
#include "log/log.hpp"

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace todo::cli {

namespace {

/// Creates `path` only if it does not exist yet.
std::error_code create_exclusive(const fs::path& path) {
    std::FILE* file = std::fopen(path.string().c_str(), "wx");
    if (!file) {
        return std::error_code(errno, std::generic_category());
    }
    std::fclose(file);
    return {};
}

void print_init_usage(std::ostream& out) {
    out << "Usage: todo init\n"
        << "\n"
        << "Initialise storage for todo command to use for persistance.\n";
}

} // anonymous namespace

int handle_init(const Storage& storage, std::ostream& out) {
    out << "path: " << storage.root().string() << "\n";

    std::error_code ec;
    if (fs::create_directories(storage.root(), ec)) {
        TODO_LOG_INFO("init", "Created " << storage.root().string());
    } else if (ec) {
        TODO_LOG_ERROR("init", "Cannot create " << storage.root().string() << ": "
                                                << ec.message());
        out << "Unexpected error occured initalising storage for todo: " << ec.message() << "\n";
        return exit_code::FAILURE;
    } else {
        TODO_LOG_DEBUG("init", storage.root().string() << " already exists");
    }

    const auto placeholder = storage.placeholder_path();
    ec = create_exclusive(placeholder);
    if (ec) {
        TODO_LOG_ERROR("init", "Cannot create " << placeholder.string() << ": " << ec.message());
        out << "Couldn't create storage file " << placeholder.string() << ": " << ec.message()
            << "\n";
        return exit_code::FAILURE;
    }

    out << "Successfully initalised storage for todo\n";
    return exit_code::OK;
}

int run_init(const Storage& storage, const std::vector<std::string>& args, std::ostream& out,
             std::ostream& err) {
    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            print_init_usage(out);
            return exit_code::OK;
        }
        err << "error: unexpected argument '" << arg << "'\n\n";
        print_init_usage(err);
        return exit_code::USAGE;
    }
    return handle_init(storage, out);
}

} // namespace todo::cli
