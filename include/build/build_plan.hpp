//! # Build Plan
//!
//! Turns a request and a dependency graph into the steps to run.
//!
//! ```text
//! DynamicLibrary:  one CompileNative step per included unit
//! Executable:      one BundleExecutable step, dependencies as extra inputs
//! Archive:         one PackArchive step holding every included unit
//! ```
//!
//! Output paths are relative to the layout root: the deepest directory that
//! contains the project root and every planned unit. A unit reached through a
//! parent-relative import (`from ..shared import x`) therefore keeps its
//! directory instead of colliding with a same-named unit below the root.
//!
//! Units that could not be read are never planned. They are listed in
//! `BuildPlan::unreadable` so the packager can report them.

#ifndef PYPACK_BUILD_BUILD_PLAN_HPP
#define PYPACK_BUILD_BUILD_PLAN_HPP

#include "build/build_request.hpp"
#include "common.hpp"
#include "deps/dependency_graph.hpp"
#include "errors.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace pypack::build {

enum class StepKind { CompileNative, BundleExecutable, PackArchive };

const char* step_kind_name(StepKind kind);

struct BuildStep {
    StepKind kind;
    fs::path unit;                    ///< Primary input (canonical path)
    std::vector<fs::path> extra_inputs; ///< Dependencies bundled with the primary input
    fs::path relative_output;         ///< Artifact path relative to the output directory
    bool optimize = true;
    fs::path layout_root; ///< Base of archive entry names, empty = project root

    /// All inputs, primary first.
    std::vector<fs::path> inputs() const;
};

struct BuildPlan {
    TargetFormat format = TargetFormat::DynamicLibrary;
    fs::path project_root;
    fs::path layout_root; ///< Base of every relative_output
    std::vector<BuildStep> steps;
    std::vector<fs::path> unreadable; ///< Units left out because their scan failed

    /// Human-readable listing (for --dry-run).
    std::string describe() const;
};

/// Path of `path` relative to `root`, or just its file name when it lies outside.
fs::path relative_to_root(const fs::path& path, const fs::path& root);

/// Deepest directory containing both `a` and `b`. Empty when they share no root.
fs::path common_ancestor(const fs::path& a, const fs::path& b);

/// Selects the steps for `request` over `graph`. Two units that would install
/// to the same output path are a `ConfigInvalid` error.
Result<BuildPlan, PackError> select_build_plan(const BuildRequest& request,
                                               const deps::DependencyGraph& graph,
                                               const fs::path& project_root);

} // namespace pypack::build

#endif // PYPACK_BUILD_BUILD_PLAN_HPP
