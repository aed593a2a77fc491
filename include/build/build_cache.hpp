//! # Build Cache
//!
//! Skips steps whose artifact is already up to date.
//!
//! ## Cache Keys
//!
//! A step's fingerprint is the SHA-256 of:
//!
//! - step kind, backend name, optimize flag, relative output path
//! - for each input: its path and the SHA-256 of its content
//! - the SHA-256 of the banner file, if any
//!
//! The fingerprint is stored in `<output>/.pypack-cache/<key>.stamp`, where
//! `<key>` is the SHA-256 of the artifact's relative path. A step is up to
//! date when its artifact exists and the stamp holds the same fingerprint.

#ifndef PYPACK_BUILD_BUILD_CACHE_HPP
#define PYPACK_BUILD_BUILD_CACHE_HPP

#include "build/build_plan.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace pypack::build {

/// Hex SHA-256 of `data`.
std::string sha256_hex(std::string_view data);

/// Hex SHA-256 of a file's content, or nullopt if it cannot be read.
std::optional<std::string> sha256_file(const fs::path& path);

class BuildCache {
public:
    static constexpr const char* DIR_NAME = ".pypack-cache";

    BuildCache(const fs::path& output_dir, bool enabled);

    bool enabled() const {
        return enabled_;
    }

    /// Fingerprint of a step, or nullopt if an input cannot be hashed.
    std::optional<std::string> fingerprint(const BuildStep& step, std::string_view backend_name,
                                           const std::optional<fs::path>& banner) const;

    /// True if the artifact exists and the stored stamp matches `fingerprint`.
    bool is_up_to_date(const BuildStep& step, const std::string& fingerprint) const;

    /// Stores the stamp. Failures are logged and otherwise ignored.
    void record(const BuildStep& step, const std::string& fingerprint) const;

    /// Removes a stale stamp (before a rebuild, so a failure never looks cached).
    void invalidate(const BuildStep& step) const;

    fs::path stamp_path(const BuildStep& step) const;

private:
    fs::path output_dir_;
    fs::path cache_dir_;
    bool enabled_;
};

} // namespace pypack::build

#endif // PYPACK_BUILD_BUILD_CACHE_HPP
