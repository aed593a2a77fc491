#include "build/banner.hpp"

#include "archive/zip.hpp"
#include "log/log.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace pypack::build {

namespace {

constexpr size_t LENGTH_SIZE = 8;

void put_u64(std::string& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

uint64_t get_u64(std::string_view in, size_t pos) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | static_cast<uint8_t>(in[pos + static_cast<size_t>(i)]);
    }
    return v;
}

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return content;
}

} // namespace

// ============================================================================
// Trailer
// ============================================================================

auto TrailerBannerInjector::strip(std::string_view artifact) -> std::string_view {
    size_t footer = BANNER_MAGIC.size() + LENGTH_SIZE;
    if (artifact.size() < footer) {
        return artifact;
    }
    size_t magic_pos = artifact.size() - footer;
    if (artifact.substr(magic_pos, BANNER_MAGIC.size()) != BANNER_MAGIC) {
        return artifact;
    }
    uint64_t len = get_u64(artifact, artifact.size() - LENGTH_SIZE);
    if (len > magic_pos) {
        return artifact;
    }
    return artifact.substr(0, magic_pos - static_cast<size_t>(len));
}

auto TrailerBannerInjector::embed(std::string_view artifact, std::string_view banner) const
    -> Result<std::string, PackError> {
    std::string out(strip(artifact));
    out.reserve(out.size() + banner.size() + BANNER_MAGIC.size() + LENGTH_SIZE);
    out += banner;
    out += BANNER_MAGIC;
    put_u64(out, banner.size());
    return out;
}

auto TrailerBannerInjector::extract(std::string_view artifact) const
    -> std::optional<std::string> {
    auto body = strip(artifact);
    if (body.size() == artifact.size()) {
        return std::nullopt;
    }
    size_t len = artifact.size() - body.size() - BANNER_MAGIC.size() - LENGTH_SIZE;
    return std::string(artifact.substr(body.size(), len));
}

// ============================================================================
// ZIP comment
// ============================================================================

auto ZipCommentBannerInjector::embed(std::string_view artifact, std::string_view banner) const
    -> Result<std::string, PackError> {
    auto replaced = archive::replace_zip_comment(artifact, banner);
    if (is_err(replaced)) {
        return make_error(ErrorKind::BannerInjectionFailed, {}, unwrap_err(replaced).message);
    }
    return std::move(unwrap(replaced));
}

auto ZipCommentBannerInjector::extract(std::string_view artifact) const
    -> std::optional<std::string> {
    auto comment = archive::read_zip_comment(artifact);
    if (is_err(comment) || unwrap(comment).empty()) {
        return std::nullopt;
    }
    return unwrap(comment);
}

auto make_banner_injector(TargetFormat format) -> std::unique_ptr<BannerInjector> {
    if (format == TargetFormat::Archive) {
        return std::make_unique<ZipCommentBannerInjector>();
    }
    return std::make_unique<TrailerBannerInjector>();
}

// ============================================================================
// File operations
// ============================================================================

std::optional<PackError> inject_banner(const fs::path& artifact, const fs::path& banner_file,
                                       const BannerInjector& injector) {
    auto banner = read_file(banner_file);
    if (!banner) {
        return make_error(ErrorKind::BannerInjectionFailed, banner_file,
                          "cannot read banner file");
    }

    auto content = read_file(artifact);
    if (!content) {
        return make_error(ErrorKind::BannerInjectionFailed, artifact, "cannot read artifact");
    }

    auto embedded = injector.embed(*content, *banner);
    if (is_err(embedded)) {
        auto err = unwrap_err(embedded);
        err.path = artifact;
        return err;
    }

    auto tmp = artifact;
    tmp += ".banner-tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        const auto& bytes = unwrap(embedded);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return make_error(ErrorKind::BannerInjectionFailed, artifact,
                              "cannot write " + tmp.filename().string());
        }
    }

    std::error_code ec;
    auto perms = fs::status(artifact, ec).permissions();
    if (!ec) {
        fs::permissions(tmp, perms, ec);
    }

    fs::rename(tmp, artifact, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return make_error(ErrorKind::BannerInjectionFailed, artifact,
                          "cannot replace artifact: " + ec.message());
    }

    PYPACK_LOG_DEBUG("banner", "Embedded " << banner->size() << " byte(s) into "
                                           << artifact.filename().string());
    return std::nullopt;
}

std::optional<std::string> read_banner(const fs::path& artifact, const BannerInjector& injector) {
    auto content = read_file(artifact);
    if (!content) {
        return std::nullopt;
    }
    return injector.extract(*content);
}

} // namespace pypack::build
