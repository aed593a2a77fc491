//! # Artifact Assembler
//!
//! Moves finished artifacts from scratch space to the output directory.
//!
//! ```text
//! <scratch>/step-N-x/lib/x.cpython-312-x86_64-linux-gnu.so
//!     → <output>/pkg/x.so.pypack-tmp      (move, or copy across filesystems)
//!     → banner injected into the temp file
//!     → rename over <output>/pkg/x.so      (atomic replace)
//! ```
//!
//! A reader of `<output>` sees either the previous artifact or the complete
//! new one, never a partial file.

#ifndef PYPACK_BUILD_ASSEMBLER_HPP
#define PYPACK_BUILD_ASSEMBLER_HPP

#include "build/banner.hpp"
#include "build/build_plan.hpp"
#include "build/invoker.hpp"
#include "errors.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace fs = std::filesystem;

namespace pypack::build {

class ArtifactAssembler {
public:
    static constexpr const char* TEMP_SUFFIX = ".pypack-tmp";

    ArtifactAssembler(fs::path output_dir, TargetFormat format, std::optional<fs::path> banner);

    /// Creates the output directory if needed.
    std::optional<PackError> prepare_output() const;

    /// Installs a succeeded result's artifact and applies the banner. On an
    /// install failure the result becomes Failed. A banner failure is returned
    /// as a warning and leaves the result Succeeded.
    std::optional<PackError> install(BuildUnitResult& result, const BuildStep& step) const;

    /// Removes the scratch tree. Directories of failed units are kept for
    /// inspection; `keep_all` keeps everything.
    void cleanup_scratch(const fs::path& scratch_root, std::vector<BuildUnitResult>& results,
                         bool keep_all) const;

    const fs::path& output_dir() const {
        return output_dir_;
    }

private:
    fs::path output_dir_;
    std::optional<fs::path> banner_;
    std::unique_ptr<BannerInjector> injector_;

    std::optional<PackError> move_into_place(const fs::path& from, const fs::path& to) const;
};

} // namespace pypack::build

#endif // PYPACK_BUILD_ASSEMBLER_HPP
