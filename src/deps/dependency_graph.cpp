#include "deps/dependency_graph.hpp"

#include <algorithm>
#include <sstream>

namespace pypack::deps {

size_t DependencyGraph::add_unit(const fs::path& path) {
    auto key = path.string();
    auto it = index_.find(key);
    if (it != index_.end()) {
        return it->second;
    }

    size_t index = units_.size();
    SourceUnit unit;
    unit.path = path;
    units_.push_back(std::move(unit));
    index_.emplace(std::move(key), index);
    return index;
}

std::optional<size_t> DependencyGraph::find(const fs::path& path) const {
    auto it = index_.find(path.string());
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DependencyGraph::add_edge(size_t from, size_t to) {
    auto& deps = units_[from].dependencies;
    if (std::find(deps.begin(), deps.end(), to) == deps.end()) {
        deps.push_back(to);
    }
}

size_t DependencyGraph::edge_count() const {
    size_t count = 0;
    for (const auto& unit : units_) {
        count += unit.dependencies.size();
    }
    return count;
}

std::vector<const SourceUnit*> DependencyGraph::unreadable_units() const {
    std::vector<const SourceUnit*> result;
    for (const auto& unit : units_) {
        if (unit.scan_error) {
            result.push_back(&unit);
        }
    }
    return result;
}

std::string DependencyGraph::describe(const fs::path& root) const {
    auto display = [&root](const fs::path& path) {
        auto rel = path.lexically_relative(root);
        if (rel.empty() || rel.native().starts_with("..")) {
            return path.string();
        }
        return rel.generic_string();
    };

    std::ostringstream out;
    for (const auto& unit : units_) {
        out << display(unit.path);
        if (unit.scan_error) {
            out << " (unreadable)";
        }
        out << "\n";
        for (size_t dep : unit.dependencies) {
            out << "  -> " << display(units_[dep].path) << "\n";
        }
        for (const auto& ext : unit.externals) {
            out << "  -> " << ext << " (external)\n";
        }
    }
    return out.str();
}

} // namespace pypack::deps
