//! # Source File
//!
//! In-memory copy of one source file with a line index, used by the import
//! scanner to attribute imports to line numbers.
//!
//! ## Example
//!
//! ```cpp
//! auto result = Source::from_file("app/main.py");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result) << "\n";
//!     return;
//! }
//! const Source& source = unwrap(result);
//! uint32_t line = source.line_of(42);
//! ```

#ifndef PYPACK_SCAN_SOURCE_HPP
#define PYPACK_SCAN_SOURCE_HPP

#include "common.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pypack::scan {

/// A source file's bytes plus the offsets of its line starts.
///
/// String views returned by `content()` and `slice()` are valid as
/// long as the Source exists.
class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at `offset`, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns the bytes in [start, end), clamped to the content.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// 1-based line number containing `offset`.
    [[nodiscard]] auto line_of(size_t offset) const -> uint32_t;

    /// Reads a file from disk. Directories and unreadable files are errors.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace pypack::scan

#endif // PYPACK_SCAN_SOURCE_HPP
