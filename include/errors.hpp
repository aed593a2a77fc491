//! # Packager Errors
//!
//! | Kind                      | Scope     | Effect                              |
//! |---------------------------|-----------|-------------------------------------|
//! | `SourceUnreadable`        | per unit  | unit unresolved, traversal goes on  |
//! | `EntryUnresolvable`       | run       | fatal, nothing to build             |
//! | `UnsupportedFormat`       | run       | fatal configuration error           |
//! | `BackendUnavailable`      | run       | fatal, checked before any step      |
//! | `BackendInvocationFailed` | per unit  | collected on the unit's result      |
//! | `BannerInjectionFailed`   | artifact  | warning, artifact is kept           |
//! | `ConfigInvalid`           | run       | fatal configuration error           |
//! | `Cancelled`               | run       | user interrupt                      |

#ifndef PYPACK_ERRORS_HPP
#define PYPACK_ERRORS_HPP

#include <filesystem>
#include <string>

namespace pypack {

enum class ErrorKind {
    SourceUnreadable,
    EntryUnresolvable,
    UnsupportedFormat,
    BackendUnavailable,
    BackendInvocationFailed,
    BannerInjectionFailed,
    ConfigInvalid,
    Cancelled
};

/// Returns the taxonomy name of an error kind (e.g. "SourceUnreadable").
const char* error_kind_name(ErrorKind kind);

/// True for kinds that abort the whole run.
bool is_fatal(ErrorKind kind);

/// An error attributed to a path (source file, artifact, tool or config file).
struct PackError {
    ErrorKind kind;
    std::filesystem::path path;
    std::string message;

    /// "<Kind>: <path>: <message>" (path omitted when empty).
    std::string to_string() const;
};

inline PackError make_error(ErrorKind kind, std::filesystem::path path, std::string message) {
    return PackError{kind, std::move(path), std::move(message)};
}

} // namespace pypack

#endif // PYPACK_ERRORS_HPP
