#include "cli/config.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <shlobj.h>
#include <windows.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace todo::cli {

namespace {

constexpr std::string_view STORAGE_DIR_OPTION = "--storage-dir=";

} // anonymous namespace

std::optional<fs::path> default_storage_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(NULL, CSIDL_PROFILE, NULL, 0, path))) {
        return fs::path(path) / ".todo";
    }
    return std::nullopt;
#else
    const char* home = getenv("HOME");
    if (!home || !*home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : nullptr;
    }
    if (!home) {
        return std::nullopt;
    }
    return fs::path(home) / ".todo";
#endif
}

bool is_global_option(std::string_view arg) {
    return arg.starts_with(STORAGE_DIR_OPTION) || log::is_log_option(arg);
}

Result<AppConfig, std::string> resolve_config(int argc, char* argv[]) {
    AppConfig config;
    config.log = log::parse_log_options(argc, argv);

    std::optional<fs::path> storage_dir;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--") {
            break;
        }
        if (arg.starts_with(STORAGE_DIR_OPTION)) {
            auto value = arg.substr(STORAGE_DIR_OPTION.size());
            if (value.empty()) {
                return std::string("--storage-dir requires a directory");
            }
            storage_dir = fs::path(value);
        }
    }

    if (!storage_dir) {
        storage_dir = default_storage_dir();
        if (!storage_dir) {
            return std::string("cannot determine the home directory; use --storage-dir=<dir>");
        }
    }

    config.storage_dir = std::move(*storage_dir);
    return config;
}

std::vector<std::string> strip_global_options(int argc, char* argv[]) {
    std::vector<std::string> args;
    bool passthrough = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--") {
            passthrough = true;
        }
        if (!passthrough && is_global_option(arg)) {
            continue;
        }
        args.emplace_back(arg);
    }
    return args;
}

} // namespace todo::cli
