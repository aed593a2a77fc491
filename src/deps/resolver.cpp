#include "deps/resolver.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace pypack::deps {

namespace {

std::vector<std::string> split_dotted(const std::string& module) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= module.size()) {
        size_t dot = module.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(module.substr(start));
            break;
        }
        parts.push_back(module.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

/// Present on disk, including dangling symlinks.
bool entry_exists(const fs::path& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) {
        return false;
    }
    return !fs::is_directory(fs::status(path, ec));
}

bool is_regular(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace

fs::path canonical_unit_path(const fs::path& path) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    auto parent = fs::weakly_canonical(absolute.parent_path(), ec);
    if (ec) {
        parent = absolute.parent_path().lexically_normal();
    }
    return parent / absolute.filename();
}

// ============================================================================
// ModuleLocator
// ============================================================================

ModuleLocator::ModuleLocator(fs::path project_root) : root_(std::move(project_root)) {}

std::optional<LocalUnit> ModuleLocator::find_in(const fs::path& base,
                                                const std::string& module) const {
    if (module.empty()) {
        auto init = base / "__init__.py";
        if (entry_exists(init)) {
            return LocalUnit{init, {}};
        }
        return std::nullopt;
    }

    auto parts = split_dotted(module);
    for (const auto& part : parts) {
        if (part.empty()) {
            return std::nullopt;
        }
    }

    fs::path dir = base;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        dir /= parts[i];
    }

    fs::path found;
    auto module_file = dir / (parts.back() + ".py");
    auto package_init = dir / parts.back() / "__init__.py";
    if (entry_exists(module_file)) {
        found = module_file;
    } else if (entry_exists(package_init)) {
        found = package_init;
    } else {
        return std::nullopt;
    }

    LocalUnit unit{found, {}};
    fs::path parent = base;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        parent /= parts[i];
        auto init = parent / "__init__.py";
        if (is_regular(init)) {
            unit.package_inits.push_back(init);
        }
    }
    return unit;
}

ResolveOutcome ModuleLocator::locate(const std::string& module, int level,
                                     const fs::path& importer_dir) const {
    if (level > 0) {
        fs::path base = importer_dir;
        for (int i = 1; i < level; ++i) {
            base = base.parent_path();
        }
        if (auto found = find_in(base, module)) {
            return *found;
        }
        return ExternalUnresolved{std::string(static_cast<size_t>(level), '.') + module};
    }

    if (auto found = find_in(importer_dir, module)) {
        return *found;
    }
    if (!root_.empty() && root_ != importer_dir) {
        if (auto found = find_in(root_, module)) {
            return *found;
        }
    }
    return ExternalUnresolved{module};
}

// ============================================================================
// DependencyResolver
// ============================================================================

Result<fs::path, PackError> validate_entry(const fs::path& entry) {
    std::error_code ec;
    if (!fs::exists(entry, ec)) {
        return make_error(ErrorKind::EntryUnresolvable, entry, "no such file");
    }
    if (!fs::is_regular_file(entry, ec)) {
        return make_error(ErrorKind::EntryUnresolvable, entry, "not a regular file");
    }
    if (entry.extension() != ".py") {
        return make_error(ErrorKind::EntryUnresolvable, entry,
                          "not a Python source file (expected .py)");
    }
    std::ifstream probe(entry, std::ios::binary);
    if (!probe) {
        return make_error(ErrorKind::EntryUnresolvable, entry, "cannot be opened for reading");
    }
    return canonical_unit_path(entry);
}

Result<DependencyGraph, PackError> DependencyResolver::resolve(const fs::path& entry,
                                                               const fs::path& project_root) {
    auto entry_result = validate_entry(entry);
    if (is_err(entry_result)) {
        return unwrap_err(entry_result);
    }
    const fs::path& entry_path = unwrap(entry_result);

    fs::path root = entry_path.parent_path();
    if (!project_root.empty()) {
        std::error_code ec;
        root = fs::weakly_canonical(fs::absolute(project_root), ec);
        if (ec) {
            root = fs::absolute(project_root).lexically_normal();
        }
    }
    ModuleLocator locator(root);

    DependencyGraph graph;
    std::vector<size_t> queue;
    queue.push_back(graph.add_unit(entry_path));

    for (size_t head = 0; head < queue.size(); ++head) {
        scan_unit(graph, queue[head], locator, queue);
    }

    if (graph.entry().scan_error) {
        const auto& err = *graph.entry().scan_error;
        return make_error(ErrorKind::EntryUnresolvable, entry_path, err.message);
    }

    PYPACK_LOG_INFO("deps", "Resolved " << graph.size() << " unit(s), " << graph.edge_count()
                                        << " edge(s) from " << entry_path.filename().string());
    return graph;
}

void DependencyResolver::link(DependencyGraph& graph, size_t from, const fs::path& target,
                              std::vector<size_t>& queue) {
    auto key = canonical_unit_path(target);
    auto existing = graph.find(key);
    size_t index;
    if (existing) {
        index = *existing;
    } else {
        index = graph.add_unit(key);
        queue.push_back(index);
        PYPACK_LOG_DEBUG("deps", "Discovered " << key.string());
    }
    if (index != from) {
        graph.add_edge(from, index);
    }
}

void DependencyResolver::scan_unit(DependencyGraph& graph, size_t index,
                                   const ModuleLocator& locator, std::vector<size_t>& queue) {
    auto path = graph.unit(index).path;
    auto scan_result = scan::scan_file(path);
    graph.unit(index).resolved = true;

    if (is_err(scan_result)) {
        PYPACK_LOG_WARN("deps", unwrap_err(scan_result).to_string());
        graph.unit(index).scan_error = unwrap_err(scan_result);
        return;
    }

    // link() may grow the graph, so iterate a copy rather than the unit's list.
    const auto imports = unwrap(scan_result);
    graph.unit(index).imported_names = std::move(unwrap(scan_result));
    auto importer_dir = path.parent_path();

    for (const auto& imported : imports) {
        auto outcome = locator.locate(imported.module, imported.level, importer_dir);
        bool module_is_local = std::holds_alternative<LocalUnit>(outcome);

        if (module_is_local) {
            const auto& local = std::get<LocalUnit>(outcome);
            for (const auto& init : local.package_inits) {
                link(graph, index, init, queue);
            }
            link(graph, index, local.path, queue);
        }

        bool member_is_local = false;
        for (const auto& member : imported.names) {
            if (member == "*") {
                continue;
            }
            auto submodule = imported.module.empty() ? member : imported.module + "." + member;
            auto sub = locator.locate(submodule, imported.level, importer_dir);
            if (auto* local = std::get_if<LocalUnit>(&sub)) {
                member_is_local = true;
                for (const auto& init : local->package_inits) {
                    link(graph, index, init, queue);
                }
                link(graph, index, local->path, queue);
            }
        }

        if (!module_is_local && !member_is_local) {
            auto& externals = graph.unit(index).externals;
            auto name = imported.display();
            if (std::find(externals.begin(), externals.end(), name) == externals.end()) {
                externals.push_back(name);
                PYPACK_LOG_TRACE("deps", path.filename().string() << ": " << name
                                                                   << " is external");
            }
        }
    }
}

} // namespace pypack::deps
