#include "build/backend.hpp"

#include "archive/zip.hpp"
#include "log/log.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace pypack::build {

namespace {

/// Python string literal for `text`.
std::string python_quote(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '\\' || c == '"') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

/// First file under `dir` named `<stem>.<anything><ext>` or `<stem><ext>`.
std::optional<fs::path> find_extension_artifact(const fs::path& dir, const std::string& stem,
                                                const std::string& ext) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::nullopt;
    }
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        auto filename = it->path().filename().string();
        if (filename.size() < stem.size() + ext.size() || !filename.ends_with(ext)) {
            continue;
        }
        if (filename == stem + ext || filename.starts_with(stem + ".")) {
            return it->path();
        }
    }
    return std::nullopt;
}

StepOutcome failed(const BuildStep& step, std::string message, std::string diagnostics = {}) {
    StepOutcome outcome;
    outcome.diagnostics = std::move(diagnostics);
    outcome.error = make_error(ErrorKind::BackendInvocationFailed, step.unit, std::move(message));
    return outcome;
}

} // namespace

std::string module_name_for(const fs::path& path, const fs::path& root) {
    auto rel = relative_to_root(path, root);
    std::string name;
    for (const auto& part : rel.parent_path()) {
        if (!name.empty()) {
            name += '.';
        }
        name += part.string();
    }
    auto stem = rel.stem().string();
    if (stem != "__init__") {
        if (!name.empty()) {
            name += '.';
        }
        name += stem;
    }
    return name;
}

// ============================================================================
// PythonToolBackend
// ============================================================================

auto PythonToolBackend::check_available() -> std::optional<PackError> {
    std::call_once(checked_, [this] {
        if (find_executable(config_.python).empty()) {
            availability_ = make_error(ErrorKind::BackendUnavailable, config_.python,
                                       "Python interpreter not found on PATH");
            return;
        }

        std::string module(required_module());
        SubprocessOptions options;
        options.timeout_seconds = 60;
        auto probe = run_subprocess(config_.python, {"-c", "import " + module}, options);
        if (!probe.success()) {
            availability_ =
                make_error(ErrorKind::BackendUnavailable, config_.python,
                           module + " is not importable (install it with: " + config_.python +
                               " -m pip install " + module + ")");
            return;
        }
        PYPACK_LOG_DEBUG("backend", name() << ": " << module << " available via "
                                           << config_.python);
    });
    return availability_;
}

auto PythonToolBackend::invoke(const BuildStep& step, const StepContext& ctx,
                               const std::vector<std::string>& args) -> StepOutcome {
    SubprocessOptions options;
    options.cwd = ctx.scratch_dir;
    options.timeout_seconds = config_.timeout_seconds;
    options.cancel = ctx.cancel;

    auto result = run_subprocess(config_.python, args, options);

    StepOutcome outcome;
    outcome.diagnostics = result.stdout_output + result.stderr_output;

    if (result.cancelled) {
        outcome.cancelled = true;
        outcome.error = make_error(ErrorKind::Cancelled, step.unit, "interrupted");
        return outcome;
    }
    if (!result.launched) {
        return failed(step, result.launch_error, std::move(outcome.diagnostics));
    }
    if (result.timed_out) {
        return failed(step,
                      std::string(name()) + " timed out after " +
                          std::to_string(config_.timeout_seconds) + "s",
                      std::move(outcome.diagnostics));
    }
    if (result.exit_code != 0) {
        return failed(step,
                      std::string(name()) + " exited with status " +
                          std::to_string(result.exit_code),
                      std::move(outcome.diagnostics));
    }

    outcome.success = true;
    return outcome;
}

// ============================================================================
// CythonBackend
// ============================================================================

std::string CythonBackend::generate_setup_script(const std::string& module_name,
                                                 const std::string& source_name, bool optimize) {
    std::ostringstream out;
    out << "import os\n";
    out << "from setuptools import setup, Extension\n";
    out << "from Cython.Build import cythonize\n\n";

    if (optimize) {
        out << "compile_args = [\"/O2\"] if os.name == \"nt\" else [\"-O3\"]\n";
    } else {
        out << "compile_args = [\"/Od\"] if os.name == \"nt\" else [\"-O0\"]\n";
    }

    out << "\nextensions = [\n";
    out << "    Extension(" << python_quote(module_name) << ", [" << python_quote(source_name)
        << "], extra_compile_args=compile_args),\n";
    out << "]\n\n";

    out << "directives = {\"language_level\": 3";
    if (optimize) {
        out << ", \"boundscheck\": False, \"wraparound\": False, \"optimize.use_switch\": True";
    }
    out << "}\n\n";

    out << "setup(\n";
    out << "    name=" << python_quote(module_name) << ",\n";
    out << "    ext_modules=cythonize(extensions, compiler_directives=directives, quiet=True),\n";
    out << ")\n";
    return out.str();
}

auto CythonBackend::run(const BuildStep& step, const StepContext& ctx) -> StepOutcome {
    auto module_name = step.unit.stem().string();
    auto source_name = step.unit.filename().string();

    std::error_code ec;
    fs::copy_file(step.unit, ctx.scratch_dir / source_name, fs::copy_options::overwrite_existing,
                  ec);
    if (ec) {
        return failed(step, "cannot copy source into " + ctx.scratch_dir.string() + ": " +
                                ec.message());
    }

    {
        std::ofstream setup(ctx.scratch_dir / "setup.py", std::ios::trunc);
        setup << generate_setup_script(module_name, source_name, step.optimize);
        if (!setup) {
            return failed(step, "cannot write setup.py in " + ctx.scratch_dir.string());
        }
    }

    auto build_lib = ctx.scratch_dir / "lib";
    std::vector<std::string> args = {"setup.py",
                                     "build_ext",
                                     "--build-temp",
                                     (ctx.scratch_dir / "temp").string(),
                                     "--build-lib",
                                     build_lib.string()};

    auto outcome = invoke(step, ctx, args);
    if (!outcome.success) {
        return outcome;
    }

    auto artifact = find_extension_artifact(build_lib, module_name, native_library_extension());
    if (!artifact) {
        return failed(step,
                      "build_ext succeeded but no " + module_name + "*" +
                          native_library_extension() + " was produced",
                      std::move(outcome.diagnostics));
    }
    outcome.artifact = *artifact;
    return outcome;
}

// ============================================================================
// PyInstallerBackend
// ============================================================================

std::vector<std::string> PyInstallerBackend::command_arguments(const BuildStep& step,
                                                               const StepContext& ctx) {
    std::vector<std::string> args = {"-m",
                                     "PyInstaller",
                                     "--noconfirm",
                                     "--onefile",
                                     "--name",
                                     step.unit.stem().string(),
                                     "--distpath",
                                     (ctx.scratch_dir / "dist").string(),
                                     "--workpath",
                                     (ctx.scratch_dir / "work").string(),
                                     "--specpath",
                                     ctx.scratch_dir.string(),
                                     "--paths",
                                     ctx.project_root.string()};

    for (const auto& extra : step.extra_inputs) {
        auto module = module_name_for(extra, ctx.project_root);
        if (module.empty()) {
            continue;
        }
        args.push_back("--hidden-import");
        args.push_back(module);
    }

    if (step.optimize) {
        args.push_back("--strip");
        args.push_back("--optimize");
        args.push_back("2");
    }

    args.push_back(step.unit.string());
    return args;
}

auto PyInstallerBackend::run(const BuildStep& step, const StepContext& ctx) -> StepOutcome {
    auto outcome = invoke(step, ctx, command_arguments(step, ctx));
    if (!outcome.success) {
        return outcome;
    }

    auto artifact =
        ctx.scratch_dir / "dist" / (step.unit.stem().string() + executable_extension());
    std::error_code ec;
    if (!fs::is_regular_file(artifact, ec)) {
        return failed(step, "PyInstaller succeeded but " + artifact.string() + " is missing",
                      std::move(outcome.diagnostics));
    }
    outcome.artifact = artifact;
    return outcome;
}

// ============================================================================
// ArchiveBackend
// ============================================================================

auto ArchiveBackend::run(const BuildStep& step, const StepContext& ctx) -> StepOutcome {
    if (ctx.cancel && ctx.cancel->is_cancelled()) {
        StepOutcome outcome;
        outcome.cancelled = true;
        outcome.error = make_error(ErrorKind::Cancelled, step.unit, "interrupted");
        return outcome;
    }

    const auto& base = step.layout_root.empty() ? ctx.project_root : step.layout_root;
    archive::ZipWriter writer;
    for (const auto& input : step.inputs()) {
        auto entry_name = relative_to_root(input, base).generic_string();
        if (auto err = writer.add_file(input, entry_name)) {
            return failed(step, err->message);
        }
    }

    auto artifact = ctx.scratch_dir / step.relative_output.filename();
    if (auto err = writer.write_to(artifact)) {
        return failed(step, err->message);
    }

    StepOutcome outcome;
    outcome.success = true;
    outcome.artifact = artifact;
    PYPACK_LOG_DEBUG("backend", "zip: " << writer.size() << " file(s) into "
                                        << artifact.filename().string());
    return outcome;
}

// ============================================================================
// BackendSet
// ============================================================================

void BackendSet::set(StepKind kind, std::shared_ptr<Backend> backend) {
    switch (kind) {
    case StepKind::CompileNative:
        compile_ = std::move(backend);
        break;
    case StepKind::BundleExecutable:
        bundle_ = std::move(backend);
        break;
    case StepKind::PackArchive:
        archive_ = std::move(backend);
        break;
    }
}

Backend* BackendSet::get(StepKind kind) const {
    switch (kind) {
    case StepKind::CompileNative:
        return compile_.get();
    case StepKind::BundleExecutable:
        return bundle_.get();
    case StepKind::PackArchive:
        return archive_.get();
    }
    return nullptr;
}

auto make_default_backends(const BackendConfig& config) -> BackendSet {
    BackendSet set;
    set.set(StepKind::CompileNative, std::make_shared<CythonBackend>(config));
    set.set(StepKind::BundleExecutable, std::make_shared<PyInstallerBackend>(config));
    set.set(StepKind::PackArchive, std::make_shared<ArchiveBackend>());
    return set;
}

} // namespace pypack::build
