#include "build/packager.hpp"

#include "build/assembler.hpp"
#include "build/build_cache.hpp"
#include "build/build_plan.hpp"
#include "deps/resolver.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <system_error>

#include <unistd.h>

namespace pypack::build {

int exit_code_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::BackendUnavailable:
        return EXIT_BACKEND_UNAVAILABLE;
    case ErrorKind::Cancelled:
        return EXIT_INTERRUPTED;
    case ErrorKind::SourceUnreadable:
    case ErrorKind::BackendInvocationFailed:
    case ErrorKind::BannerInjectionFailed:
        return EXIT_UNIT_FAILED;
    case ErrorKind::EntryUnresolvable:
    case ErrorKind::UnsupportedFormat:
    case ErrorKind::ConfigInvalid:
        return EXIT_CONFIG_ERROR;
    }
    return EXIT_CONFIG_ERROR;
}

size_t BuildReport::count(UnitStatus status) const {
    return static_cast<size_t>(std::count_if(units.begin(), units.end(),
                                             [status](const BuildUnitResult& r) {
                                                 return r.status == status;
                                             }));
}

int BuildReport::exit_code() const {
    if (fatal) {
        return exit_code_for(fatal->kind);
    }
    if (cancelled) {
        return EXIT_INTERRUPTED;
    }
    if (count(UnitStatus::Failed) > 0) {
        return EXIT_UNIT_FAILED;
    }
    return EXIT_OK;
}

Packager::Packager(BuildRequest request, BackendSet backends)
    : request_(std::move(request)), backends_(std::move(backends)) {}

namespace {

fs::path absolute_dir(const fs::path& dir) {
    std::error_code ec;
    auto abs = fs::absolute(dir.empty() ? fs::path(".") : dir, ec);
    if (ec) {
        return dir;
    }
    auto canonical = fs::weakly_canonical(abs, ec);
    return ec ? abs.lexically_normal() : canonical;
}

BuildUnitResult unreadable_result(const fs::path& path, const deps::DependencyGraph& graph,
                                  StepKind kind) {
    BuildUnitResult result;
    result.unit = path;
    result.kind = kind;
    result.status = UnitStatus::Failed;
    if (auto index = graph.find(path)) {
        result.error = graph.unit(*index).scan_error;
    }
    if (!result.error) {
        result.error = make_error(ErrorKind::SourceUnreadable, path, "cannot be read");
    }
    return result;
}

} // namespace

BuildReport Packager::run(const CancellationToken& cancel) {
    BuildReport report;
    report.output_dir = absolute_dir(request_.output_dir);

    // 1. Resolve
    deps::DependencyResolver resolver;
    auto graph_result = resolver.resolve(request_.entry, request_.project_root);
    if (is_err(graph_result)) {
        report.fatal = unwrap_err(graph_result);
        return report;
    }
    const auto& graph = unwrap(graph_result);

    fs::path root = request_.project_root.empty() ? graph.entry().path.parent_path()
                                                  : absolute_dir(request_.project_root);

    // 2. Plan
    auto plan_result = select_build_plan(request_, graph, root);
    if (is_err(plan_result)) {
        report.fatal = unwrap_err(plan_result);
        return report;
    }
    const auto& plan = unwrap(plan_result);

    if (!request_.include_deps) {
        for (const auto* unit : graph.unreadable_units()) {
            report.warnings.push_back(*unit->scan_error);
        }
    }

    if (request_.dry_run) {
        report.dry_run_listing = graph.describe(plan.layout_root) + "\n" + plan.describe();
        return report;
    }

    StepKind unit_kind = plan.steps.empty() ? StepKind::CompileNative : plan.steps.front().kind;
    for (const auto& path : plan.unreadable) {
        report.units.push_back(unreadable_result(path, graph, unit_kind));
    }

    // 3. Backends must all be usable before anything runs
    InvokerOptions invoker_options;
    invoker_options.jobs = request_.jobs;
    invoker_options.project_root = root;
    invoker_options.scratch_root =
        report.output_dir / (".pypack-build-" + std::to_string(static_cast<long>(getpid())));
    BackendInvoker invoker(backends_, invoker_options);

    if (auto err = invoker.check_availability(plan.steps)) {
        report.fatal = err;
        return report;
    }

    ArtifactAssembler assembler(report.output_dir, request_.format, request_.banner);
    if (auto err = assembler.prepare_output()) {
        report.fatal = err;
        return report;
    }

    // 4. Cache filter
    BuildCache cache(report.output_dir, request_.use_cache);
    std::vector<BuildStep> to_run;
    std::vector<std::optional<std::string>> fingerprints;
    for (const auto& step : plan.steps) {
        std::optional<std::string> fingerprint;
        if (cache.enabled()) {
            auto* backend = backends_.get(step.kind);
            fingerprint = cache.fingerprint(step, backend ? backend->name() : "", request_.banner);
            if (fingerprint && cache.is_up_to_date(step, *fingerprint)) {
                BuildUnitResult cached;
                cached.unit = step.unit;
                cached.kind = step.kind;
                cached.status = UnitStatus::Skipped;
                cached.cached = true;
                cached.artifact = report.output_dir / step.relative_output;
                report.units.push_back(std::move(cached));
                PYPACK_LOG_INFO("cache", "Up to date: " << step.relative_output.string());
                continue;
            }
            cache.invalidate(step);
        }
        to_run.push_back(step);
        fingerprints.push_back(std::move(fingerprint));
    }

    // 5. Invoke
    auto results = invoker.run(to_run, cancel);

    // 6. Install, completed steps included after an interrupt
    for (size_t i = 0; i < results.size(); ++i) {
        auto& result = results[i];
        if (auto warning = assembler.install(result, to_run[i])) {
            report.warnings.push_back(*warning);
        }
        bool banner_ok = !request_.banner || result.banner_applied;
        if (result.status == UnitStatus::Succeeded && fingerprints[i] && banner_ok) {
            cache.record(to_run[i], *fingerprints[i]);
        }
    }

    bool any_failed = std::any_of(results.begin(), results.end(), [](const BuildUnitResult& r) {
        return r.status == UnitStatus::Failed;
    });
    assembler.cleanup_scratch(invoker_options.scratch_root, results,
                              request_.keep_intermediates);
    if (request_.keep_intermediates || any_failed) {
        report.scratch_dir = invoker_options.scratch_root;
    }

    for (auto& result : results) {
        report.units.push_back(std::move(result));
    }

    std::sort(report.units.begin(), report.units.end(),
              [](const BuildUnitResult& a, const BuildUnitResult& b) { return a.unit < b.unit; });

    report.cancelled = cancel.is_cancelled();
    return report;
}

} // namespace pypack::build
