//! # Build Request
//!
//! What the user asked for: which entry, which format, which options.
//!
//! | Spelling     | Format          | Artifact                          |
//! |--------------|-----------------|-----------------------------------|
//! | `pyd`, `so`  | DynamicLibrary  | `<stem>.so` (`<stem>.pyd` on Windows) |
//! | `exe`        | Executable      | `<stem>` (`<stem>.exe` on Windows)  |
//! | `zip`        | Archive         | `<stem>.zip`                      |

#ifndef PYPACK_BUILD_BUILD_REQUEST_HPP
#define PYPACK_BUILD_BUILD_REQUEST_HPP

#include "common.hpp"
#include "errors.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace pypack::build {

enum class TargetFormat { DynamicLibrary, Executable, Archive };

const char* target_format_name(TargetFormat format);

/// Parses "pyd", "so", "exe" or "zip". Anything else is `UnsupportedFormat`.
Result<TargetFormat, PackError> parse_target_format(std::string_view spelling);

/// ".pyd" on Windows, ".so" elsewhere.
const char* native_library_extension();

/// "pyd" on Windows, "so" elsewhere.
const char* default_format_spelling();

/// ".exe" on Windows, "" elsewhere.
const char* executable_extension();

/// Immutable description of one packaging run.
struct BuildRequest {
    fs::path entry;
    fs::path output_dir;
    fs::path project_root; ///< Empty = the entry's directory
    TargetFormat format = TargetFormat::DynamicLibrary;
    std::string requested_extension; ///< "pyd"/"so" as typed, informational
    bool include_deps = true;
    bool optimize = true;
    std::optional<fs::path> banner;
    int jobs = 0; ///< 0 = hardware concurrency
    bool use_cache = true;
    bool keep_intermediates = false;
    bool dry_run = false;
};

/// Builds a request from a format spelling. Logs a warning when a dynamic
/// library spelling differs from the platform's extension.
Result<BuildRequest, PackError> make_build_request(const fs::path& entry, const fs::path& output_dir,
                                                   std::string_view format_spelling);

} // namespace pypack::build

#endif // PYPACK_BUILD_BUILD_REQUEST_HPP
