//! # Dependency Graph
//!
//! The set of local source units reachable from an entry file, and the import
//! edges between them.
//!
//! ## Invariants
//!
//! - Unit 0 is the entry; the rest follow in discovery order.
//! - Each canonical path appears at most once.
//! - Cycles are allowed: `a -> b -> a` is two units and two edges.

#ifndef PYPACK_DEPS_DEPENDENCY_GRAPH_HPP
#define PYPACK_DEPS_DEPENDENCY_GRAPH_HPP

#include "errors.hpp"
#include "scan/import_scanner.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

namespace pypack::deps {

/// One local source file taking part in the build.
struct SourceUnit {
    fs::path path; ///< Canonical absolute path (unique key)
    std::vector<scan::ImportedName> imported_names;
    bool resolved = false;              ///< Scan finished (successfully or not)
    std::optional<PackError> scan_error; ///< Set when the file could not be read
    std::vector<std::string> externals; ///< Names that resolved to no local file
    std::vector<size_t> dependencies;   ///< Indices of units this one imports

    bool readable() const {
        return resolved && !scan_error.has_value();
    }
};

class DependencyGraph {
public:
    /// Adds a unit for `path` unless one exists. Returns its index.
    size_t add_unit(const fs::path& path);

    /// Index of the unit with this canonical path.
    std::optional<size_t> find(const fs::path& path) const;

    /// Adds the edge `from -> to` unless present.
    void add_edge(size_t from, size_t to);

    SourceUnit& unit(size_t index) {
        return units_[index];
    }
    const SourceUnit& unit(size_t index) const {
        return units_[index];
    }

    const std::vector<SourceUnit>& units() const {
        return units_;
    }

    size_t size() const {
        return units_.size();
    }

    const SourceUnit& entry() const {
        return units_.front();
    }

    /// Total number of edges.
    size_t edge_count() const;

    /// Units whose scan failed.
    std::vector<const SourceUnit*> unreadable_units() const;

    /// Prints the graph as an indented list (for --dry-run).
    std::string describe(const fs::path& root) const;

private:
    std::vector<SourceUnit> units_;
    std::unordered_map<std::string, size_t> index_; // canonical path -> unit
};

} // namespace pypack::deps

#endif // PYPACK_DEPS_DEPENDENCY_GRAPH_HPP
