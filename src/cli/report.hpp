//! # Build Summary
//!
//! Human-readable summary of a `BuildReport`, written to stdout at the end
//! of a run.
//!
//! ```text
//! [ok]      main.py -> /out/main.so (1.2s)
//! [ok]      util.py -> /out/util.so (cached)
//! [failed]  broken.py: BackendInvocationFailed: broken.py: exited with status 1
//!     <tool output>
//! [skipped] slow.py: Cancelled: slow.py: not started
//!
//! 2 succeeded, 1 failed, 1 skipped
//! exit status 1
//! ```

#pragma once

#include "build/packager.hpp"

#include <iosfwd>
#include <string>

namespace pypack::cli {

/// Formats the per-unit lines, warnings and totals. Unit paths are shown
/// relative to `base` when they sit below it.
std::string format_report(const build::BuildReport& report, const fs::path& base = {});

void print_report(const build::BuildReport& report, std::ostream& out, const fs::path& base = {});

} // namespace pypack::cli
