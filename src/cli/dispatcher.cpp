//! # CLI Entry Point
//!
//! Parses the command line and runs a single packaging request.
//!
//! ## Flow
//!
//! ```text
//! pypack_main()
//!   ├─ logging options      → Logger::init()
//!   ├─ --help, -h           → print_usage()
//!   ├─ --version, -V        → print_version()
//!   ├─ --config / pypack.toml → PackConfig::load()
//!   ├─ resolve_invocation() → BuildRequest + BackendConfig
//!   ├─ Packager::run()      (SIGINT/SIGTERM cancel the run)
//!   └─ print_report()
//! ```

#include "build/packager.hpp"
#include "cli/config.hpp"
#include "cli/driver.hpp"
#include "cli/options.hpp"
#include "cli/report.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <system_error>

namespace pypack::cli {

namespace {

int report_usage_error(const PackError& error) {
    std::cerr << "pypack: error: " << error.message << "\n";
    std::cerr << "Try 'pypack --help' for more information.\n";
    return build::EXIT_CONFIG_ERROR;
}

int report_fatal(const PackError& error) {
    std::cerr << "pypack: error: " << error.to_string() << "\n";
    return build::exit_code_for(error.kind);
}

/// Explicit --config must exist; an implicit pypack.toml beside the entry is optional.
Result<std::optional<PackConfig>, PackError> load_config(const CliOptions& options) {
    std::optional<fs::path> path = options.config;
    if (!path) {
        path = PackConfig::find_beside(options.entry);
    }
    if (!path) {
        return std::optional<PackConfig>{};
    }

    auto config = PackConfig::load(*path);
    if (is_err(config)) {
        return unwrap_err(config);
    }
    PYPACK_LOG_INFO("cli", "Using config " << path->string());
    return std::optional<PackConfig>(std::move(unwrap(config)));
}

build::CancellationToken g_cancel;

} // namespace

int run_packager(int argc, char* argv[]) {
    auto parsed = parse_arguments(argc, argv);
    if (is_err(parsed)) {
        return report_usage_error(unwrap_err(parsed));
    }
    const auto& options = unwrap(parsed);

    if (options.help) {
        print_usage();
        return build::EXIT_OK;
    }
    if (options.version) {
        print_version();
        return build::EXIT_OK;
    }

    auto config = load_config(options);
    if (is_err(config)) {
        return report_fatal(unwrap_err(config));
    }

    auto invocation = resolve_invocation(options, unwrap(config));
    if (is_err(invocation)) {
        return report_fatal(unwrap_err(invocation));
    }
    auto& inv = unwrap(invocation);

    build::install_interrupt_handler(&g_cancel);
    build::Packager packager(inv.request, build::make_default_backends(inv.backend));
    auto report = packager.run(g_cancel);
    build::install_interrupt_handler(nullptr);

    std::error_code ec;
    auto cwd = fs::current_path(ec);
    print_report(report, std::cout, ec ? fs::path{} : cwd);
    return report.exit_code();
}

} // namespace pypack::cli

int pypack_main(int argc, char* argv[]) {
    pypack::log::Logger::init(pypack::log::parse_log_options(argc, argv));
    return pypack::cli::run_packager(argc, argv);
}
