//! # Dependency Resolver
//!
//! Builds the transitive closure of local imports starting at an entry file.
//!
//! ## Resolution
//!
//! | Import                 | Searched in                          | Candidates                    |
//! |------------------------|--------------------------------------|-------------------------------|
//! | `import a.b`           | importer's dir, then project root    | `a/b.py`, `a/b/__init__.py`   |
//! | `from ..a import x`    | importer's dir walked up one level   | `a.py`, `a/__init__.py`       |
//! | `from . import x`      | importer's dir                       | `__init__.py`                 |
//!
//! Members of a `from` import are also tried as submodules (`a.x`). A member
//! that does not resolve is an attribute of `a` and is not reported.
//!
//! Resolution never imports or executes anything. Names that match no local
//! file are recorded as externals of the importing unit; they are not errors.

#ifndef PYPACK_DEPS_RESOLVER_HPP
#define PYPACK_DEPS_RESOLVER_HPP

#include "common.hpp"
#include "deps/dependency_graph.hpp"
#include "errors.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

namespace pypack::deps {

/// The import names a local file.
struct LocalUnit {
    fs::path path;
    std::vector<fs::path> package_inits; ///< Parent `__init__.py` files that exist
};

/// The import names nothing local (standard library, installed package, typo).
struct ExternalUnresolved {
    std::string name;
};

using ResolveOutcome = std::variant<LocalUnit, ExternalUnresolved>;

/// Canonical form used as the unit key: the absolute path with its parent
/// directory resolved through symlinks. The file name itself is kept so that a
/// dangling symlink still names a distinct unit.
fs::path canonical_unit_path(const fs::path& path);

/// Maps one import to a local file or to an external name.
class ModuleLocator {
public:
    explicit ModuleLocator(fs::path project_root);

    /// Resolves `module` (dotted, no leading dots) imported with `level` leading
    /// dots from a file in `importer_dir`.
    ResolveOutcome locate(const std::string& module, int level, const fs::path& importer_dir) const;

    const fs::path& project_root() const {
        return root_;
    }

private:
    fs::path root_;

    /// Looks for `a/b.py` then `a/b/__init__.py` under `base`.
    std::optional<LocalUnit> find_in(const fs::path& base, const std::string& module) const;
};

/// Breadth-first traversal from the entry file.
class DependencyResolver {
public:
    /// `project_root` empty means the entry's directory.
    Result<DependencyGraph, PackError> resolve(const fs::path& entry,
                                               const fs::path& project_root = {});

private:
    void scan_unit(DependencyGraph& graph, size_t index, const ModuleLocator& locator,
                   std::vector<size_t>& queue);
    void link(DependencyGraph& graph, size_t from, const fs::path& target,
              std::vector<size_t>& queue);
};

/// Checks that `entry` exists, is a regular `.py` file and can be opened.
Result<fs::path, PackError> validate_entry(const fs::path& entry);

} // namespace pypack::deps

#endif // PYPACK_DEPS_RESOLVER_HPP
