#include "build/build_plan.hpp"

#include "log/log.hpp"

#include <map>
#include <optional>
#include <sstream>
#include <utility>

namespace pypack::build {

const char* step_kind_name(StepKind kind) {
    switch (kind) {
    case StepKind::CompileNative:
        return "compile";
    case StepKind::BundleExecutable:
        return "bundle";
    case StepKind::PackArchive:
        return "archive";
    }
    return "unknown";
}

std::vector<fs::path> BuildStep::inputs() const {
    std::vector<fs::path> all;
    all.reserve(extra_inputs.size() + 1);
    all.push_back(unit);
    all.insert(all.end(), extra_inputs.begin(), extra_inputs.end());
    return all;
}

fs::path relative_to_root(const fs::path& path, const fs::path& root) {
    auto rel = path.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") {
        return path.filename();
    }
    return rel;
}

fs::path common_ancestor(const fs::path& a, const fs::path& b) {
    fs::path common;
    auto it_a = a.begin();
    auto it_b = b.begin();
    while (it_a != a.end() && it_b != b.end() && *it_a == *it_b) {
        common /= *it_a;
        ++it_a;
        ++it_b;
    }
    return common;
}

namespace {

/// Units to package, entry first, unreadable ones excluded.
std::vector<const deps::SourceUnit*> included_units(const BuildRequest& request,
                                                    const deps::DependencyGraph& graph) {
    std::vector<const deps::SourceUnit*> units;
    units.push_back(&graph.entry());
    if (!request.include_deps) {
        return units;
    }
    for (size_t i = 1; i < graph.size(); ++i) {
        const auto& unit = graph.unit(i);
        if (unit.readable()) {
            units.push_back(&unit);
        }
    }
    return units;
}

/// Deepest directory holding the project root and every unit.
fs::path layout_root_for(const fs::path& project_root,
                         const std::vector<const deps::SourceUnit*>& units) {
    fs::path root = project_root;
    for (const auto* unit : units) {
        auto common = common_ancestor(root, unit->path.parent_path());
        if (common.empty()) {
            // No shared root; such units fall back to their file name.
            continue;
        }
        root = common;
    }
    return root;
}

/// (output path, unit) pairs; the first path claimed twice is an error.
std::optional<PackError>
find_output_conflict(const std::vector<std::pair<fs::path, fs::path>>& outputs) {
    std::map<fs::path, fs::path> seen;
    for (const auto& [output, unit] : outputs) {
        auto [it, inserted] = seen.emplace(output, unit);
        if (!inserted) {
            return make_error(ErrorKind::ConfigInvalid, unit,
                              "output " + output.generic_string() + " is also produced by " +
                                  it->second.string());
        }
    }
    return std::nullopt;
}

} // namespace

Result<BuildPlan, PackError> select_build_plan(const BuildRequest& request,
                                               const deps::DependencyGraph& graph,
                                               const fs::path& project_root) {
    BuildPlan plan;
    plan.format = request.format;
    plan.project_root = project_root;

    if (request.include_deps) {
        for (const auto* unit : graph.unreadable_units()) {
            plan.unreadable.push_back(unit->path);
        }
    }

    auto units = included_units(request, graph);
    auto stem = graph.entry().path.stem().string();
    plan.layout_root = layout_root_for(project_root, units);
    if (plan.layout_root != project_root) {
        PYPACK_LOG_INFO("build", "Units outside " << project_root.string() << ", laying out from "
                                                  << plan.layout_root.string());
    }

    switch (request.format) {
    case TargetFormat::DynamicLibrary:
        for (const auto* unit : units) {
            BuildStep step;
            step.kind = StepKind::CompileNative;
            step.unit = unit->path;
            auto rel = relative_to_root(unit->path, plan.layout_root);
            step.relative_output =
                rel.parent_path() / (unit->path.stem().string() + native_library_extension());
            step.optimize = request.optimize;
            step.layout_root = plan.layout_root;
            plan.steps.push_back(std::move(step));
        }
        break;

    case TargetFormat::Executable: {
        BuildStep step;
        step.kind = StepKind::BundleExecutable;
        step.unit = units.front()->path;
        for (size_t i = 1; i < units.size(); ++i) {
            step.extra_inputs.push_back(units[i]->path);
        }
        step.relative_output = stem + executable_extension();
        step.optimize = request.optimize;
        step.layout_root = plan.layout_root;
        plan.steps.push_back(std::move(step));
        break;
    }

    case TargetFormat::Archive: {
        BuildStep step;
        step.kind = StepKind::PackArchive;
        step.unit = units.front()->path;
        for (size_t i = 1; i < units.size(); ++i) {
            step.extra_inputs.push_back(units[i]->path);
        }
        step.relative_output = stem + ".zip";
        step.optimize = request.optimize;
        step.layout_root = plan.layout_root;

        std::vector<std::pair<fs::path, fs::path>> entries;
        for (const auto& input : step.inputs()) {
            entries.emplace_back(relative_to_root(input, plan.layout_root), input);
        }
        if (auto err = find_output_conflict(entries)) {
            return *err;
        }
        plan.steps.push_back(std::move(step));
        break;
    }
    }

    std::vector<std::pair<fs::path, fs::path>> outputs;
    for (const auto& step : plan.steps) {
        outputs.emplace_back(step.relative_output, step.unit);
    }
    if (auto err = find_output_conflict(outputs)) {
        return *err;
    }

    PYPACK_LOG_DEBUG("build", "Plan: " << plan.steps.size() << " "
                                       << target_format_name(plan.format) << " step(s), "
                                       << plan.unreadable.size() << " unreadable unit(s)");
    return plan;
}

std::string BuildPlan::describe() const {
    std::ostringstream out;
    for (const auto& step : steps) {
        out << step_kind_name(step.kind) << " "
            << relative_to_root(step.unit, layout_root).generic_string() << " -> "
            << step.relative_output.generic_string() << "\n";
        for (const auto& extra : step.extra_inputs) {
            out << "    + " << relative_to_root(extra, layout_root).generic_string() << "\n";
        }
    }
    for (const auto& path : unreadable) {
        out << "skip " << path.string() << " (unreadable)\n";
    }
    return out.str();
}

} // namespace pypack::build
