//! # Build Backends
//!
//! Uniform interface over the tools that turn a planned step into an artifact.
//!
//! ## Architecture
//!
//! ```text
//!     Backend (abstract)
//!     ├── check_available()  → optional<PackError>   (once, before any step)
//!     └── run(step, ctx)     → StepOutcome           (artifact inside ctx.scratch_dir)
//!            │
//!   ┌────────┼──────────────────┐
//!   │        │                  │
//! Cython   PyInstaller       Archive
//! (setup.py build_ext)  (python -m PyInstaller)  (in-process ZIP)
//! ```
//!
//! Backends write only inside the scratch directory they are given. Moving the
//! artifact to its final place is the assembler's job.

#ifndef PYPACK_BUILD_BACKEND_HPP
#define PYPACK_BUILD_BACKEND_HPP

#include "build/build_plan.hpp"
#include "build/subprocess.hpp"
#include "errors.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace pypack::build {

struct BackendConfig {
    std::string python = "python3"; ///< Interpreter used to drive Cython and PyInstaller
    int timeout_seconds = 0;        ///< Per-step limit, 0 = none
};

/// Where and how a step runs.
struct StepContext {
    fs::path scratch_dir; ///< Exclusive to this step, already created
    fs::path project_root;
    const CancellationToken* cancel = nullptr;
};

struct StepOutcome {
    bool success = false;
    bool cancelled = false;
    fs::path artifact;       ///< Produced file, inside the scratch directory
    std::string diagnostics; ///< Tool stdout followed by stderr, verbatim
    std::optional<PackError> error;
};

class Backend {
public:
    virtual ~Backend() = default;

    /// Backend name (e.g. "cython").
    virtual auto name() const -> std::string_view = 0;

    /// Verifies the tool can run. Errors are `BackendUnavailable`.
    virtual auto check_available() -> std::optional<PackError> = 0;

    /// Produces the step's artifact inside `ctx.scratch_dir`.
    virtual auto run(const BuildStep& step, const StepContext& ctx) -> StepOutcome = 0;
};

/// Base for backends driven through the Python interpreter.
class PythonToolBackend : public Backend {
public:
    explicit PythonToolBackend(BackendConfig config) : config_(std::move(config)) {}

    auto check_available() -> std::optional<PackError> override;

    const BackendConfig& config() const {
        return config_;
    }

protected:
    /// Python module that must be importable ("Cython", "PyInstaller").
    virtual auto required_module() const -> std::string_view = 0;

    /// Runs the interpreter and converts failures to `BackendInvocationFailed`.
    auto invoke(const BuildStep& step, const StepContext& ctx,
                const std::vector<std::string>& args) -> StepOutcome;

    BackendConfig config_;

private:
    std::once_flag checked_;
    std::optional<PackError> availability_;
};

/// Compiles one module to a native extension with Cython.
class CythonBackend : public PythonToolBackend {
public:
    using PythonToolBackend::PythonToolBackend;

    auto name() const -> std::string_view override {
        return "cython";
    }

    auto run(const BuildStep& step, const StepContext& ctx) -> StepOutcome override;

    /// The setup.py that builds `source_name` as extension `module_name`.
    static std::string generate_setup_script(const std::string& module_name,
                                             const std::string& source_name, bool optimize);

protected:
    auto required_module() const -> std::string_view override {
        return "Cython";
    }
};

/// Bundles the entry and its local dependencies into one executable.
class PyInstallerBackend : public PythonToolBackend {
public:
    using PythonToolBackend::PythonToolBackend;

    auto name() const -> std::string_view override {
        return "pyinstaller";
    }

    auto run(const BuildStep& step, const StepContext& ctx) -> StepOutcome override;

    /// Command-line arguments after the interpreter.
    static std::vector<std::string> command_arguments(const BuildStep& step,
                                                      const StepContext& ctx);

protected:
    auto required_module() const -> std::string_view override {
        return "PyInstaller";
    }
};

/// Copies the sources verbatim into a ZIP archive.
class ArchiveBackend : public Backend {
public:
    auto name() const -> std::string_view override {
        return "zip";
    }

    auto check_available() -> std::optional<PackError> override {
        return std::nullopt;
    }

    auto run(const BuildStep& step, const StepContext& ctx) -> StepOutcome override;
};

/// One backend per step kind.
class BackendSet {
public:
    void set(StepKind kind, std::shared_ptr<Backend> backend);

    /// nullptr if no backend handles `kind`.
    Backend* get(StepKind kind) const;

private:
    std::shared_ptr<Backend> compile_;
    std::shared_ptr<Backend> bundle_;
    std::shared_ptr<Backend> archive_;
};

auto make_default_backends(const BackendConfig& config) -> BackendSet;

/// Dotted module name of a source file below `root` ("pkg/util.py" -> "pkg.util",
/// "pkg/__init__.py" -> "pkg").
std::string module_name_for(const fs::path& path, const fs::path& root);

} // namespace pypack::build

#endif // PYPACK_BUILD_BACKEND_HPP
