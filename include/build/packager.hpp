//! # Packager
//!
//! Runs one packaging request end to end.
//!
//! ```text
//! resolve → plan → check backends → cache filter → invoke → install → cleanup
//! ```
//!
//! ## Exit Codes
//!
//! | Code | Meaning                                                         |
//! |------|-----------------------------------------------------------------|
//! | 0    | every attempted unit succeeded (or was up to date)              |
//! | 1    | at least one unit failed                                        |
//! | 2    | configuration error, unsupported format, unresolvable entry     |
//! | 3    | a required backend is unavailable                               |
//! | 130  | interrupted                                                     |

#ifndef PYPACK_BUILD_PACKAGER_HPP
#define PYPACK_BUILD_PACKAGER_HPP

#include "build/backend.hpp"
#include "build/build_request.hpp"
#include "build/invoker.hpp"
#include "build/subprocess.hpp"
#include "errors.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace pypack::build {

constexpr int EXIT_OK = 0;
constexpr int EXIT_UNIT_FAILED = 1;
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_BACKEND_UNAVAILABLE = 3;
constexpr int EXIT_INTERRUPTED = 130;

struct BuildReport {
    std::vector<BuildUnitResult> units; ///< Sorted by unit path
    std::vector<PackError> warnings;    ///< Non-fatal problems (unreadable units, banner)
    std::optional<PackError> fatal;
    bool cancelled = false;
    fs::path output_dir;
    fs::path scratch_dir; ///< Set when intermediates were kept
    std::string dry_run_listing;

    size_t count(UnitStatus status) const;

    int exit_code() const;
};

/// Exit code for a fatal error kind.
int exit_code_for(ErrorKind kind);

class Packager {
public:
    Packager(BuildRequest request, BackendSet backends);

    BuildReport run(const CancellationToken& cancel);

    const BuildRequest& request() const {
        return request_;
    }

private:
    BuildRequest request_;
    BackendSet backends_;
};

} // namespace pypack::build

#endif // PYPACK_BUILD_PACKAGER_HPP
