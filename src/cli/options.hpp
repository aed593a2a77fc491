//! # Command-Line Options
//!
//! Turns argv into `CliOptions`, then merges them with an optional
//! `pypack.toml` into the request the packager runs.
//!
//! ## Precedence
//!
//! ```text
//! built-in defaults  <  pypack.toml  <  command line
//! ```

#pragma once

#include "build/backend.hpp"
#include "build/build_request.hpp"
#include "cli/config.hpp"
#include "common.hpp"
#include "errors.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace pypack::cli {

/// Options exactly as given on the command line. Unset means "not given".
struct CliOptions {
    fs::path entry;
    std::optional<fs::path> output;
    std::optional<std::string> format;
    std::optional<bool> include_deps;
    std::optional<bool> optimize;
    std::optional<fs::path> banner;
    std::optional<int> jobs;
    std::optional<std::string> python;
    std::optional<int> timeout;
    bool no_cache = false;
    bool keep_temp = false;
    bool dry_run = false;
    std::optional<fs::path> config;
    bool help = false;
    bool version = false;
};

/// Everything needed to run one packaging request.
struct Invocation {
    build::BuildRequest request;
    build::BackendConfig backend;
};

/// Parses argv. Logging options are accepted and ignored here. Usage
/// errors come back as `ConfigInvalid`.
Result<CliOptions, PackError> parse_arguments(int argc, char* argv[]);

/// Applies `config` (if any), then `cli` on top of the defaults.
Result<Invocation, PackError> resolve_invocation(const CliOptions& cli,
                                                 const std::optional<PackConfig>& config);

} // namespace pypack::cli
