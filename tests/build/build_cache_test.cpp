// Build Cache Tests
// Tests for sha256 helpers, BuildCache fingerprints and stamps

#include "build/build_cache.hpp"

#include <atomic>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace pypack::build;
namespace fs = std::filesystem;

TEST(Sha256Test, KnownDigests) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

class BuildCacheTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path out;
    BuildStep step;

    void SetUp() override {
        static std::atomic<int> counter{0};
        dir = fs::temp_directory_path() /
              ("pypack_cache_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(dir);
        fs::create_directories(dir / "src");
        out = dir / "out";
        fs::create_directories(out);

        write(dir / "src" / "main.py", "import util\n");
        write(dir / "src" / "util.py", "X = 1\n");

        step.kind = StepKind::PackArchive;
        step.unit = dir / "src" / "main.py";
        step.extra_inputs = {dir / "src" / "util.py"};
        step.relative_output = "main.zip";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write(const fs::path& path, const std::string& content) {
        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        f << content;
    }
};

TEST_F(BuildCacheTest, FileDigestMatchesContentDigest) {
    auto hash = sha256_file(dir / "src" / "util.py");
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(*hash, sha256_hex("X = 1\n"));
    EXPECT_FALSE(sha256_file(dir / "missing.py").has_value());
}

TEST_F(BuildCacheTest, FingerprintIsStable) {
    BuildCache cache(out, true);
    auto a = cache.fingerprint(step, "zip", std::nullopt);
    auto b = cache.fingerprint(step, "zip", std::nullopt);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, *b);
    EXPECT_EQ(a->size(), 64u);
}

TEST_F(BuildCacheTest, FingerprintTracksInputsAndOptions) {
    BuildCache cache(out, true);
    auto base = *cache.fingerprint(step, "zip", std::nullopt);

    EXPECT_NE(*cache.fingerprint(step, "other-backend", std::nullopt), base);

    auto unoptimized = step;
    unoptimized.optimize = false;
    EXPECT_NE(*cache.fingerprint(unoptimized, "zip", std::nullopt), base);

    write(dir / "banner.txt", "(c) example");
    EXPECT_NE(*cache.fingerprint(step, "zip", dir / "banner.txt"), base);

    write(dir / "src" / "util.py", "X = 2\n");
    EXPECT_NE(*cache.fingerprint(step, "zip", std::nullopt), base);
}

TEST_F(BuildCacheTest, UnreadableInputHasNoFingerprint) {
    BuildCache cache(out, true);
    step.extra_inputs.push_back(dir / "src" / "gone.py");
    EXPECT_FALSE(cache.fingerprint(step, "zip", std::nullopt).has_value());
    EXPECT_FALSE(cache.fingerprint(BuildStep{step.kind, step.unit, {}, "main.zip", true}, "zip",
                                   dir / "no-banner.txt")
                     .has_value());
}

TEST_F(BuildCacheTest, RecordThenUpToDate) {
    BuildCache cache(out, true);
    auto fp = *cache.fingerprint(step, "zip", std::nullopt);

    EXPECT_FALSE(cache.is_up_to_date(step, fp));

    write(out / "main.zip", "artifact");
    cache.record(step, fp);
    EXPECT_TRUE(fs::exists(cache.stamp_path(step)));
    EXPECT_EQ(cache.stamp_path(step).parent_path(), out / BuildCache::DIR_NAME);
    EXPECT_TRUE(cache.is_up_to_date(step, fp));
    EXPECT_FALSE(cache.is_up_to_date(step, "different"));
}

TEST_F(BuildCacheTest, MissingArtifactIsNotUpToDate) {
    BuildCache cache(out, true);
    auto fp = *cache.fingerprint(step, "zip", std::nullopt);
    cache.record(step, fp);

    EXPECT_FALSE(cache.is_up_to_date(step, fp));
}

TEST_F(BuildCacheTest, InvalidateRemovesStamp) {
    BuildCache cache(out, true);
    auto fp = *cache.fingerprint(step, "zip", std::nullopt);
    write(out / "main.zip", "artifact");
    cache.record(step, fp);

    cache.invalidate(step);
    EXPECT_FALSE(fs::exists(cache.stamp_path(step)));
    EXPECT_FALSE(cache.is_up_to_date(step, fp));
}

TEST_F(BuildCacheTest, DisabledCacheNeverHitsOrWrites) {
    BuildCache cache(out, false);
    auto fp = *cache.fingerprint(step, "zip", std::nullopt);
    write(out / "main.zip", "artifact");

    cache.record(step, fp);
    EXPECT_FALSE(fs::exists(out / BuildCache::DIR_NAME));
    EXPECT_FALSE(cache.is_up_to_date(step, fp));
}
