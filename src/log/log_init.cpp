//! # Log Options
//!
//! Builds a LogConfig from the global `--log-*` options and the TODO_LOG
//! environment variable. Arguments after a `--` separator belong to the
//! command and are never read as log options.

#include "log/log.hpp"

#include <array>
#include <cstdlib>
#include <optional>
#include <string>

namespace todo::log {

namespace {

constexpr std::string_view LEVEL_PREFIX = "--log-level=";
constexpr std::string_view FILTER_PREFIX = "--log-filter=";
constexpr std::string_view FILE_PREFIX = "--log-file=";
constexpr std::string_view FORMAT_PREFIX = "--log-format=";

constexpr std::array<std::string_view, 4> VALUE_OPTIONS = {LEVEL_PREFIX, FILTER_PREFIX,
                                                           FILE_PREFIX, FORMAT_PREFIX};

std::optional<std::string> read_env(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) != 0 || !buf) {
        return std::nullopt;
    }
    std::string value(buf);
    free(buf);
    return value;
#else
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
#endif
}

LogFormat parse_format(std::string_view s) {
    return (s == "json" || s == "JSON") ? LogFormat::JSON : LogFormat::Text;
}

} // anonymous namespace

bool is_log_option(std::string_view arg) {
    if (arg == "-q" || arg == "--quiet") {
        return true;
    }
    for (auto prefix : VALUE_OPTIONS) {
        if (arg.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    config.level = LogLevel::Warn;

    // An explicit level or filter on the command line wins over TODO_LOG
    bool explicit_level = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--") {
            break;
        }

        if (arg.starts_with(LEVEL_PREFIX)) {
            config.level = parse_level(arg.substr(LEVEL_PREFIX.size()));
            explicit_level = true;
        } else if (arg.starts_with(FILTER_PREFIX)) {
            config.filter_spec = std::string(arg.substr(FILTER_PREFIX.size()));
            explicit_level = true;
        } else if (arg.starts_with(FILE_PREFIX)) {
            config.log_file = std::string(arg.substr(FILE_PREFIX.size()));
        } else if (arg.starts_with(FORMAT_PREFIX)) {
            config.format = parse_format(arg.substr(FORMAT_PREFIX.size()));
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            explicit_level = true;
        }
    }

    if (explicit_level) {
        return config;
    }

    auto env = read_env("TODO_LOG");
    if (!env || env->empty()) {
        return config;
    }
    // "storage=debug,*=warn" or "storage,cli" is a filter, "debug" a level
    if (env->find_first_of("=,") != std::string::npos) {
        config.filter_spec = *env;
    } else {
        config.level = parse_level(*env);
    }
    return config;
}

} // namespace todo::log
