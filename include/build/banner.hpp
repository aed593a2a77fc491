//! # Banner Injection
//!
//! Embeds a user-supplied text into a finished artifact.
//!
//! | Artifact               | Where the banner goes                              |
//! |------------------------|----------------------------------------------------|
//! | ZIP archive            | archive comment (at most 65535 bytes)              |
//! | extension / executable | trailer: banner, "PYPACKBN", u64 LE banner length  |
//!
//! The trailer is ignored by the dynamic loader and by PyInstaller's
//! bootloader, which locates its payload from a cookie it searches for.
//! Injecting twice replaces the previous trailer.
//!
//! Injection writes a temporary copy next to the artifact and renames it over
//! the original, so a failure leaves the artifact as it was.

#ifndef PYPACK_BUILD_BANNER_HPP
#define PYPACK_BUILD_BANNER_HPP

#include "build/build_request.hpp"
#include "common.hpp"
#include "errors.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace pypack::build {

constexpr std::string_view BANNER_MAGIC = "PYPACKBN";

class BannerInjector {
public:
    virtual ~BannerInjector() = default;

    /// Returns the artifact bytes with `banner` embedded.
    virtual auto embed(std::string_view artifact, std::string_view banner) const
        -> Result<std::string, PackError> = 0;

    /// Extracts the banner, or nullopt if none is present.
    virtual auto extract(std::string_view artifact) const -> std::optional<std::string> = 0;
};

class TrailerBannerInjector : public BannerInjector {
public:
    auto embed(std::string_view artifact, std::string_view banner) const
        -> Result<std::string, PackError> override;
    auto extract(std::string_view artifact) const -> std::optional<std::string> override;

    /// Artifact bytes without a trailing banner.
    static auto strip(std::string_view artifact) -> std::string_view;
};

class ZipCommentBannerInjector : public BannerInjector {
public:
    auto embed(std::string_view artifact, std::string_view banner) const
        -> Result<std::string, PackError> override;
    auto extract(std::string_view artifact) const -> std::optional<std::string> override;
};

auto make_banner_injector(TargetFormat format) -> std::unique_ptr<BannerInjector>;

/// Embeds the content of `banner_file` into `artifact` in place. Errors are
/// `BannerInjectionFailed`; the artifact is untouched on failure.
std::optional<PackError> inject_banner(const fs::path& artifact, const fs::path& banner_file,
                                       const BannerInjector& injector);

/// Reads the banner embedded in `artifact`, if any.
std::optional<std::string> read_banner(const fs::path& artifact, const BannerInjector& injector);

} // namespace pypack::build

#endif // PYPACK_BUILD_BANNER_HPP
