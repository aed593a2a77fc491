//! # ZIP Container
//!
//! Minimal ZIP writer and reader on top of zlib's raw DEFLATE.
//!
//! ## Format
//!
//! ```text
//! [local header + data] * N  |  central directory  |  end of central directory + comment
//! ```
//!
//! Entries are DEFLATE-compressed unless that makes them larger, in which case
//! they are stored. Every entry carries the DOS timestamp 1980-01-01 00:00 so
//! the same inputs always give the same archive bytes. ZIP64 is not supported:
//! archives and entries are limited to 4 GiB, and the comment to 65535 bytes.

#ifndef PYPACK_ARCHIVE_ZIP_HPP
#define PYPACK_ARCHIVE_ZIP_HPP

#include "common.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace pypack::archive {

constexpr size_t MAX_ZIP_COMMENT = 0xFFFF;

struct ZipError {
    std::string message;
};

struct ZipEntry {
    std::string name; ///< Forward-slash path inside the archive
    std::string data; ///< Uncompressed bytes
};

struct ZipArchive {
    std::vector<ZipEntry> entries;
    std::string comment;

    const ZipEntry* find(std::string_view name) const;
};

/// CRC-32 as used by ZIP (zlib's crc32).
uint32_t zip_crc32(std::string_view data);

/// Raw DEFLATE (no zlib header).
Result<std::string, ZipError> deflate_raw(std::string_view data);

/// Inverse of deflate_raw. `expected_size` is the uncompressed length.
Result<std::string, ZipError> inflate_raw(std::string_view data, size_t expected_size);

/// Collects entries and serializes them in insertion order.
class ZipWriter {
public:
    /// Adds an entry. Names are stored as given; duplicates are rejected.
    bool add(std::string name, std::string data);

    /// Reads `source` and adds it under `name`.
    std::optional<ZipError> add_file(const fs::path& source, std::string name);

    /// Fails if the comment is longer than MAX_ZIP_COMMENT.
    bool set_comment(std::string comment);

    [[nodiscard]] Result<std::string, ZipError> serialize() const;

    /// Serializes to `path`, replacing it.
    [[nodiscard]] std::optional<ZipError> write_to(const fs::path& path) const;

    size_t size() const {
        return entries_.size();
    }

private:
    std::vector<ZipEntry> entries_;
    std::string comment_;
};

/// Parses a whole archive held in memory.
Result<ZipArchive, ZipError> read_zip(std::string_view bytes);

Result<ZipArchive, ZipError> read_zip_file(const fs::path& path);

/// Returns `bytes` with its archive comment replaced by `comment`.
Result<std::string, ZipError> replace_zip_comment(std::string_view bytes,
                                                  std::string_view comment);

/// Reads the archive comment without decoding entries.
Result<std::string, ZipError> read_zip_comment(std::string_view bytes);

} // namespace pypack::archive

#endif // PYPACK_ARCHIVE_ZIP_HPP
