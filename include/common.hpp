//! # Common Definitions
//!
//! Types and constants shared by every pypack component.
//!
//! - **Version Information**: Tool version constants
//! - **Result Type**: Error handling without exceptions
//!
//! ## Design
//!
//! Module boundaries do not throw. Fatal failures travel as `Result<T, E>`,
//! per-unit failures are stored on the unit's result record.

#ifndef PYPACK_COMMON_HPP
#define PYPACK_COMMON_HPP

#include <cstdint>
#include <string>
#include <variant>

namespace pypack {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<DependencyGraph, PackError> graph = resolver.resolve(entry);
/// if (is_err(graph)) {
///     report(unwrap_err(graph));
///     return;
/// }
/// use(unwrap(graph));
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace pypack

#endif // PYPACK_COMMON_HPP
