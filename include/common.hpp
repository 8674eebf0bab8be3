//! # Common Definitions
//!
//! Shared by every layer of `todo`: the version string, the `Result` type
//! that fallible operations return, and the `Box` alias the JSON tree is
//! built from.
//!
//! Storage, JSON parsing and argument parsing report failures as values.
//! Nothing below the command handlers throws on expected errors.

#ifndef TODO_COMMON_HPP
#define TODO_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace todo {

/// Printed by `todo --version` and in the usage banner.
constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Result
// ============================================================================

/// The success value `T` or the error `E`.
///
/// ```cpp
/// auto loaded = storage.load();
/// if (is_err(loaded)) {
///     report(unwrap_err(loaded));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Success type for operations with nothing to return, e.g. `Storage::save()`.
using Unit = std::monostate;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return result.index() == 0;
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return result.index() == 1;
}

/// The success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<0>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<0>(result);
}

/// The error value. Throws `std::bad_variant_access` on success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<1>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<1>(result);
}

// ============================================================================
// Ownership
// ============================================================================

/// Owning pointer used for recursive JSON containers.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace todo

#endif // TODO_COMMON_HPP
