// Backend Tests
// Tests for the Cython, PyInstaller and ZIP backends and BackendSet

#include "archive/zip.hpp"
#include "build/backend.hpp"
#include "support/test_support.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace pypack;
using namespace pypack::build;
using pypack::test_support::TempDir;
using pypack::test_support::write_file;

// ============================================================================
// Module Names
// ============================================================================

TEST(ModuleNameTest, DottedFromRoot) {
    EXPECT_EQ(module_name_for("/p/main.py", "/p"), "main");
    EXPECT_EQ(module_name_for("/p/pkg/util.py", "/p"), "pkg.util");
    EXPECT_EQ(module_name_for("/p/pkg/sub/deep.py", "/p"), "pkg.sub.deep");
}

TEST(ModuleNameTest, PackageInitIsPackageName) {
    EXPECT_EQ(module_name_for("/p/pkg/__init__.py", "/p"), "pkg");
    EXPECT_EQ(module_name_for("/p/__init__.py", "/p"), "");
}

// ============================================================================
// Cython
// ============================================================================

TEST(CythonSetupScriptTest, OptimizedScript) {
    auto script = CythonBackend::generate_setup_script("fast", "fast.py", true);

    EXPECT_NE(script.find("from Cython.Build import cythonize"), std::string::npos);
    EXPECT_NE(script.find("Extension(\"fast\", [\"fast.py\"]"), std::string::npos);
    EXPECT_NE(script.find("\"-O3\""), std::string::npos);
    EXPECT_NE(script.find("\"language_level\": 3"), std::string::npos);
    EXPECT_NE(script.find("\"boundscheck\": False"), std::string::npos);
    EXPECT_EQ(script.find("\"-O0\""), std::string::npos);
}

TEST(CythonSetupScriptTest, UnoptimizedScript) {
    auto script = CythonBackend::generate_setup_script("slow", "slow.py", false);

    EXPECT_NE(script.find("\"-O0\""), std::string::npos);
    EXPECT_NE(script.find("\"language_level\": 3"), std::string::npos);
    EXPECT_EQ(script.find("boundscheck"), std::string::npos);
    EXPECT_EQ(script.find("\"-O3\""), std::string::npos);
}

TEST(CythonSetupScriptTest, QuotesNames) {
    auto script = CythonBackend::generate_setup_script("we\"ird", "we\"ird.py", true);
    EXPECT_NE(script.find("\"we\\\"ird\""), std::string::npos);
}

// ============================================================================
// PyInstaller
// ============================================================================

TEST(PyInstallerArgumentsTest, OptimizedWithHiddenImports) {
    BuildStep step{StepKind::BundleExecutable,
                   "/p/app.py",
                   {"/p/helper.py", "/p/pkg/__init__.py", "/p/pkg/util.py"},
                   "app",
                   true};
    StepContext ctx;
    ctx.scratch_dir = "/tmp/scratch";
    ctx.project_root = "/p";

    auto args = PyInstallerBackend::command_arguments(step, ctx);

    std::vector<std::string> expected = {"-m",
                                         "PyInstaller",
                                         "--noconfirm",
                                         "--onefile",
                                         "--name",
                                         "app",
                                         "--distpath",
                                         "/tmp/scratch/dist",
                                         "--workpath",
                                         "/tmp/scratch/work",
                                         "--specpath",
                                         "/tmp/scratch",
                                         "--paths",
                                         "/p",
                                         "--hidden-import",
                                         "helper",
                                         "--hidden-import",
                                         "pkg",
                                         "--hidden-import",
                                         "pkg.util",
                                         "--strip",
                                         "--optimize",
                                         "2",
                                         "/p/app.py"};
    EXPECT_EQ(args, expected);
}

TEST(PyInstallerArgumentsTest, UnoptimizedHasNoStrip) {
    BuildStep step{StepKind::BundleExecutable, "/p/app.py", {}, "app", false};
    StepContext ctx;
    ctx.scratch_dir = "/tmp/scratch";
    ctx.project_root = "/p";

    auto args = PyInstallerBackend::command_arguments(step, ctx);
    EXPECT_EQ(std::find(args.begin(), args.end(), "--strip"), args.end());
    EXPECT_EQ(std::find(args.begin(), args.end(), "--hidden-import"), args.end());
    EXPECT_EQ(args.back(), "/p/app.py");
}

// ============================================================================
// Running backends
// ============================================================================

class BackendRunTest : public ::testing::Test {
protected:
    TempDir dir{"pypack_backend_test"};
    fs::path project;
    fs::path scratch;

    void SetUp() override {
        project = dir / "project";
        scratch = dir / "scratch";
        fs::create_directories(project);
        fs::create_directories(scratch);
        write_file(project / "app.py", "import helper\nhelper.run()\n");
        write_file(project / "helper.py", "def run():\n    pass\n");
        write_file(project / "pkg" / "util.py", "VALUE = 3\n");
    }

    StepContext context() {
        StepContext ctx;
        ctx.scratch_dir = scratch;
        ctx.project_root = project;
        return ctx;
    }

    BackendConfig fake_python() {
        BackendConfig config;
        config.python = pypack::test_support::write_fake_python(dir / "fake-python").string();
        config.timeout_seconds = 30;
        return config;
    }
};

TEST_F(BackendRunTest, ArchiveUsesRootRelativeNames) {
    BuildStep step{StepKind::PackArchive,
                   project / "app.py",
                   {project / "helper.py", project / "pkg" / "util.py"},
                   "app.zip",
                   true};

    ArchiveBackend backend;
    EXPECT_FALSE(backend.check_available().has_value());

    auto outcome = backend.run(step, context());
    ASSERT_TRUE(outcome.success) << (outcome.error ? outcome.error->to_string() : "");
    EXPECT_EQ(outcome.artifact, scratch / "app.zip");

    auto archive = archive::read_zip_file(outcome.artifact);
    ASSERT_TRUE(is_ok(archive));
    const auto& entries = unwrap(archive).entries;
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "app.py");
    EXPECT_EQ(entries[0].data, "import helper\nhelper.run()\n");
    EXPECT_EQ(entries[1].name, "helper.py");
    EXPECT_EQ(entries[2].name, "pkg/util.py");
    EXPECT_EQ(entries[2].data, "VALUE = 3\n");
}

TEST_F(BackendRunTest, ArchiveNamesFollowStepLayoutRoot) {
    write_file(dir / "shared" / "helper.py", "SHARED = True\n");
    BuildStep step{StepKind::PackArchive,
                   project / "app.py",
                   {project / "helper.py", dir / "shared" / "helper.py"},
                   "app.zip",
                   true,
                   dir.path()};

    auto outcome = ArchiveBackend().run(step, context());
    ASSERT_TRUE(outcome.success) << (outcome.error ? outcome.error->to_string() : "");

    auto archive = archive::read_zip_file(outcome.artifact);
    ASSERT_TRUE(is_ok(archive));
    const auto& entries = unwrap(archive).entries;
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "project/app.py");
    EXPECT_EQ(entries[1].name, "project/helper.py");
    EXPECT_EQ(entries[2].name, "shared/helper.py");
    EXPECT_EQ(entries[2].data, "SHARED = True\n");
}

TEST_F(BackendRunTest, ArchiveWithMissingInputFails) {
    BuildStep step{StepKind::PackArchive, project / "app.py", {project / "gone.py"}, "app.zip",
                   true};

    auto outcome = ArchiveBackend().run(step, context());
    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::BackendInvocationFailed);
}

TEST_F(BackendRunTest, ArchiveHonoursCancellation) {
    BuildStep step{StepKind::PackArchive, project / "app.py", {}, "app.zip", true};
    CancellationToken token;
    token.cancel();
    auto ctx = context();
    ctx.cancel = &token;

    auto outcome = ArchiveBackend().run(step, ctx);
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(fs::exists(scratch / "app.zip"));
}

TEST_F(BackendRunTest, MissingInterpreterIsUnavailable) {
    BackendConfig config;
    config.python = "pypack-no-such-python-xyz";

    CythonBackend backend(config);
    auto err = backend.check_available();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::BackendUnavailable);
    EXPECT_NE(err->message.find("not found"), std::string::npos);

    // Second call returns the memoized answer
    auto again = backend.check_available();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->message, err->message);
}

TEST_F(BackendRunTest, UnimportableModuleIsUnavailable) {
    BackendConfig config;
    config.python = pypack::test_support::write_broken_python(dir / "broken-python").string();

    PyInstallerBackend backend(config);
    auto err = backend.check_available();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::BackendUnavailable);
    EXPECT_NE(err->message.find("PyInstaller is not importable"), std::string::npos);
}

TEST_F(BackendRunTest, FakeInterpreterIsAvailable) {
    CythonBackend cython(fake_python());
    PyInstallerBackend pyinstaller(fake_python());
    EXPECT_FALSE(cython.check_available().has_value());
    EXPECT_FALSE(pyinstaller.check_available().has_value());
}

TEST_F(BackendRunTest, CythonProducesExtension) {
    BuildStep step{StepKind::CompileNative, project / "helper.py", {}, "helper.so", true};

    CythonBackend backend(fake_python());
    auto outcome = backend.run(step, context());
    ASSERT_TRUE(outcome.success) << outcome.diagnostics;
    EXPECT_EQ(outcome.artifact.filename(), "helper.cpython-fake.so");
    EXPECT_NE(outcome.diagnostics.find("building extension"), std::string::npos);
    EXPECT_TRUE(fs::exists(scratch / "setup.py"));

    // Sources are never modified
    EXPECT_EQ(pypack::test_support::read_file(project / "helper.py"), "def run():\n    pass\n");
}

TEST_F(BackendRunTest, CythonFailureCarriesDiagnostics) {
    write_file(project / "bad.py", "FAIL_BUILD = True\n");
    BuildStep step{StepKind::CompileNative, project / "bad.py", {}, "bad.so", true};

    CythonBackend backend(fake_python());
    auto outcome = backend.run(step, context());
    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(outcome.cancelled);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->kind, ErrorKind::BackendInvocationFailed);
    EXPECT_NE(outcome.error->message.find("cython exited with status 1"), std::string::npos);
    EXPECT_NE(outcome.diagnostics.find("Error compiling Cython file: bad.py"),
              std::string::npos);
}

TEST_F(BackendRunTest, PyInstallerProducesExecutable) {
    BuildStep step{StepKind::BundleExecutable,
                   project / "app.py",
                   {project / "helper.py"},
                   "app",
                   true};

    PyInstallerBackend backend(fake_python());
    auto outcome = backend.run(step, context());
    ASSERT_TRUE(outcome.success) << outcome.diagnostics;
    EXPECT_EQ(outcome.artifact, scratch / "dist" / "app");
    EXPECT_TRUE(fs::is_regular_file(outcome.artifact));
}

// ============================================================================
// BackendSet
// ============================================================================

TEST(BackendSetTest, OneBackendPerKind) {
    BackendSet set;
    EXPECT_EQ(set.get(StepKind::PackArchive), nullptr);

    auto archive = std::make_shared<ArchiveBackend>();
    set.set(StepKind::PackArchive, archive);
    EXPECT_EQ(set.get(StepKind::PackArchive), archive.get());
    EXPECT_EQ(set.get(StepKind::CompileNative), nullptr);
}

TEST(BackendSetTest, DefaultBackends) {
    auto set = make_default_backends(BackendConfig{});
    ASSERT_NE(set.get(StepKind::CompileNative), nullptr);
    ASSERT_NE(set.get(StepKind::BundleExecutable), nullptr);
    ASSERT_NE(set.get(StepKind::PackArchive), nullptr);
    EXPECT_EQ(set.get(StepKind::CompileNative)->name(), "cython");
    EXPECT_EQ(set.get(StepKind::BundleExecutable)->name(), "pyinstaller");
    EXPECT_EQ(set.get(StepKind::PackArchive)->name(), "zip");
}
