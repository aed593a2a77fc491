#include "build/build_cache.hpp"

#include "log/log.hpp"

#include <fstream>
#include <iomanip>
#include <iterator>
#include <memory>
#include <sstream>
#include <system_error>

#include <openssl/evp.h>

namespace pypack::build {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        EVP_MD_CTX_free(ctx);
    }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char* digest, unsigned int len) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string finish(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        return {};
    }
    return to_hex(digest, len);
}

} // namespace

std::string sha256_hex(std::string_view data) {
    MdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return {};
    }
    return finish(ctx.get());
}

std::optional<std::string> sha256_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    MdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::nullopt;
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            return std::nullopt;
        }
        if (file.eof()) {
            break;
        }
    }
    if (file.bad()) {
        return std::nullopt;
    }

    auto hex = finish(ctx.get());
    if (hex.empty()) {
        return std::nullopt;
    }
    return hex;
}

// ============================================================================
// BuildCache
// ============================================================================

BuildCache::BuildCache(const fs::path& output_dir, bool enabled)
    : output_dir_(output_dir), cache_dir_(output_dir / DIR_NAME), enabled_(enabled) {}

fs::path BuildCache::stamp_path(const BuildStep& step) const {
    return cache_dir_ / (sha256_hex(step.relative_output.generic_string()) + ".stamp");
}

std::optional<std::string> BuildCache::fingerprint(const BuildStep& step,
                                                   std::string_view backend_name,
                                                   const std::optional<fs::path>& banner) const {
    std::ostringstream key;
    key << "kind=" << step_kind_name(step.kind) << "\n";
    key << "backend=" << backend_name << "\n";
    key << "optimize=" << (step.optimize ? 1 : 0) << "\n";
    key << "output=" << step.relative_output.generic_string() << "\n";

    for (const auto& input : step.inputs()) {
        auto hash = sha256_file(input);
        if (!hash) {
            return std::nullopt;
        }
        key << "input=" << input.string() << ":" << *hash << "\n";
    }

    if (banner) {
        auto hash = sha256_file(*banner);
        if (!hash) {
            return std::nullopt;
        }
        key << "banner=" << *hash << "\n";
    }

    return sha256_hex(key.str());
}

bool BuildCache::is_up_to_date(const BuildStep& step, const std::string& fingerprint) const {
    if (!enabled_) {
        return false;
    }

    std::error_code ec;
    if (!fs::is_regular_file(output_dir_ / step.relative_output, ec)) {
        return false;
    }

    std::ifstream file(stamp_path(step));
    if (!file) {
        return false;
    }
    std::string stored;
    std::getline(file, stored);
    return stored == fingerprint;
}

void BuildCache::record(const BuildStep& step, const std::string& fingerprint) const {
    if (!enabled_) {
        return;
    }

    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    if (ec) {
        PYPACK_LOG_WARN("cache", "Cannot create " << cache_dir_.string() << ": " << ec.message());
        return;
    }

    std::ofstream file(stamp_path(step), std::ios::trunc);
    file << fingerprint << "\n";
    if (!file) {
        PYPACK_LOG_WARN("cache", "Cannot write stamp for " << step.relative_output.string());
    }
}

void BuildCache::invalidate(const BuildStep& step) const {
    std::error_code ec;
    fs::remove(stamp_path(step), ec);
}

} // namespace pypack::build
