//! # Configuration File
//!
//! Optional `pypack.toml` holding defaults for the command-line options.
//!
//! ## Example
//!
//! ```toml
//! [build]
//! format = "exe"
//! output = "dist"          # relative to this file
//! include-deps = true
//! optimize = true
//! banner = "LICENSE.txt"   # relative to this file
//! jobs = 4
//! cache = true
//!
//! [backend]
//! python = "python3.12"
//! timeout = 600
//! ```
//!
//! Values on the command line override values from the file.

#ifndef PYPACK_CLI_CONFIG_HPP
#define PYPACK_CLI_CONFIG_HPP

#include "common.hpp"
#include "errors.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace pypack::cli {

constexpr const char* CONFIG_FILE_NAME = "pypack.toml";

/**
 * [build] section
 */
struct BuildSection {
    std::optional<std::string> format;
    std::optional<fs::path> output;
    std::optional<bool> include_deps;
    std::optional<bool> optimize;
    std::optional<fs::path> banner;
    std::optional<int> jobs;
    std::optional<bool> cache;
};

/**
 * [backend] section
 */
struct BackendSection {
    std::optional<std::string> python;
    std::optional<int> timeout;
};

struct PackConfig {
    BuildSection build;
    BackendSection backend;
    fs::path source; ///< File the values came from (empty for defaults)

    /// Loads and parses `path`. Relative paths in it are made relative to its directory.
    static Result<PackConfig, PackError> load(const fs::path& path);

    /// Parses TOML text. `name` is used in error messages.
    static Result<PackConfig, PackError> parse(const std::string& content,
                                               const fs::path& name = {});

    /// `pypack.toml` beside `entry`, if present.
    static std::optional<fs::path> find_beside(const fs::path& entry);
};

/**
 * Simple TOML parser for pypack.toml
 *
 * Supports the subset the config file needs:
 * - Sections: [build], [backend]
 * - Key-value pairs: key = "value"
 * - Numbers: key = 123
 * - Booleans: key = true
 * - Comments: # ...
 */
class SimpleTomlParser {
public:
    explicit SimpleTomlParser(const std::string& content);

    /**
     * Parse TOML content into a config
     */
    std::optional<PackConfig> parse();

    /**
     * Get error message if parsing failed
     */
    std::string get_error() const {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    void skip_whitespace();
    void skip_inline_whitespace();
    void skip_comment();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    std::string parse_identifier();
    std::optional<std::string> parse_string();
    std::optional<int> parse_number();
    std::optional<bool> parse_boolean();
    bool expect_line_end();

    bool parse_build_key(const std::string& key, BuildSection& build);
    bool parse_backend_key(const std::string& key, BackendSection& backend);

    void set_error(const std::string& message);
};

} // namespace pypack::cli

#endif // PYPACK_CLI_CONFIG_HPP
