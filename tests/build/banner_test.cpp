// Banner Injection Tests
// Tests for the trailer and ZIP comment injectors and in-place injection

#include "archive/zip.hpp"
#include "build/banner.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

using namespace pypack;
using namespace pypack::build;
using pypack::test_support::read_file;
using pypack::test_support::TempDir;
using pypack::test_support::write_file;

// ============================================================================
// Trailer
// ============================================================================

TEST(TrailerBannerTest, EmbedThenExtract) {
    TrailerBannerInjector injector;
    std::string binary("\x7f" "ELF\x00\x01\x02", 7);

    auto embedded = injector.embed(binary, "Copyright 2026 Example Corp");
    ASSERT_TRUE(is_ok(embedded));
    const auto& bytes = unwrap(embedded);

    EXPECT_EQ(bytes.substr(0, binary.size()), binary);
    EXPECT_EQ(bytes.size(), binary.size() + 27 + BANNER_MAGIC.size() + 8);
    EXPECT_EQ(injector.extract(bytes), std::optional<std::string>("Copyright 2026 Example Corp"));
    EXPECT_EQ(TrailerBannerInjector::strip(bytes), binary);
}

TEST(TrailerBannerTest, ReinjectionReplacesPreviousBanner) {
    TrailerBannerInjector injector;
    std::string binary = "payload";

    auto first = unwrap(injector.embed(binary, "first banner"));
    auto second = unwrap(injector.embed(first, "second"));

    EXPECT_EQ(injector.extract(second), std::optional<std::string>("second"));
    EXPECT_EQ(TrailerBannerInjector::strip(second), binary);
}

TEST(TrailerBannerTest, NoBannerPresent) {
    TrailerBannerInjector injector;
    EXPECT_FALSE(injector.extract("plain binary content").has_value());
    EXPECT_FALSE(injector.extract("").has_value());
    EXPECT_EQ(TrailerBannerInjector::strip("short"), "short");
}

TEST(TrailerBannerTest, BogusLengthIsIgnored) {
    std::string fake = "abc";
    fake += BANNER_MAGIC;
    fake += std::string("\xff\xff\xff\xff\xff\xff\xff\x7f", 8);

    TrailerBannerInjector injector;
    EXPECT_FALSE(injector.extract(fake).has_value());
}

TEST(TrailerBannerTest, EmptyBanner) {
    TrailerBannerInjector injector;
    auto bytes = unwrap(injector.embed("bin", ""));
    EXPECT_EQ(injector.extract(bytes), std::optional<std::string>(""));
}

// ============================================================================
// ZIP comment
// ============================================================================

TEST(ZipCommentBannerTest, BannerBecomesComment) {
    archive::ZipWriter writer;
    writer.add("main.py", "print('hi')\n");
    auto zip = unwrap(writer.serialize());

    ZipCommentBannerInjector injector;
    EXPECT_FALSE(injector.extract(zip).has_value());

    auto embedded = injector.embed(zip, "Built by pypack");
    ASSERT_TRUE(is_ok(embedded));
    EXPECT_EQ(injector.extract(unwrap(embedded)),
              std::optional<std::string>("Built by pypack"));

    auto archive = archive::read_zip(unwrap(embedded));
    ASSERT_TRUE(is_ok(archive));
    EXPECT_EQ(unwrap(archive).entries[0].data, "print('hi')\n");
}

TEST(ZipCommentBannerTest, OversizeBannerFails) {
    archive::ZipWriter writer;
    auto zip = unwrap(writer.serialize());

    ZipCommentBannerInjector injector;
    auto embedded = injector.embed(zip, std::string(archive::MAX_ZIP_COMMENT + 1, 'b'));
    ASSERT_TRUE(is_err(embedded));
    EXPECT_EQ(unwrap_err(embedded).kind, ErrorKind::BannerInjectionFailed);
}

TEST(BannerInjectorFactoryTest, PicksByFormat) {
    auto zip = make_banner_injector(TargetFormat::Archive);
    auto lib = make_banner_injector(TargetFormat::DynamicLibrary);
    auto exe = make_banner_injector(TargetFormat::Executable);

    EXPECT_NE(dynamic_cast<ZipCommentBannerInjector*>(zip.get()), nullptr);
    EXPECT_NE(dynamic_cast<TrailerBannerInjector*>(lib.get()), nullptr);
    EXPECT_NE(dynamic_cast<TrailerBannerInjector*>(exe.get()), nullptr);
}

// ============================================================================
// In-place injection
// ============================================================================

class InjectBannerTest : public ::testing::Test {
protected:
    TempDir dir{"pypack_banner_test"};
};

TEST_F(InjectBannerTest, InjectsAndPreservesPermissions) {
    auto artifact = pypack::test_support::write_script(dir / "app", "echo app\n");
    auto banner = write_file(dir / "banner.txt", "(c) Example\n");
    auto before = fs::status(artifact).permissions();

    TrailerBannerInjector injector;
    EXPECT_FALSE(inject_banner(artifact, banner, injector).has_value());

    EXPECT_EQ(read_banner(artifact, injector), std::optional<std::string>("(c) Example\n"));
    EXPECT_EQ(fs::status(artifact).permissions(), before);
    EXPECT_FALSE(fs::exists(dir / "app.banner-tmp"));
}

TEST_F(InjectBannerTest, MissingBannerFileLeavesArtifact) {
    auto artifact = write_file(dir / "lib.so", "library bytes");

    TrailerBannerInjector injector;
    auto err = inject_banner(artifact, dir / "missing.txt", injector);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::BannerInjectionFailed);
    EXPECT_EQ(read_file(artifact), "library bytes");
}

TEST_F(InjectBannerTest, FailedZipInjectionLeavesArtifact) {
    archive::ZipWriter writer;
    writer.add("main.py", "x = 1\n");
    auto artifact = dir / "main.zip";
    ASSERT_FALSE(writer.write_to(artifact).has_value());
    auto original = read_file(artifact);

    auto banner = write_file(dir / "huge.txt", std::string(archive::MAX_ZIP_COMMENT + 10, 'z'));

    ZipCommentBannerInjector injector;
    auto err = inject_banner(artifact, banner, injector);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::BannerInjectionFailed);
    EXPECT_EQ(err->path, artifact);
    EXPECT_EQ(read_file(artifact), original);
}

TEST_F(InjectBannerTest, MissingArtifact) {
    auto banner = write_file(dir / "banner.txt", "b");
    TrailerBannerInjector injector;

    auto err = inject_banner(dir / "nothing.so", banner, injector);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::BannerInjectionFailed);
    EXPECT_FALSE(read_banner(dir / "nothing.so", injector).has_value());
}
