//! # ZIP Container Implementation
//!
//! Record layouts follow PKWARE APPNOTE 6.3: local file header (0x04034b50),
//! central directory header (0x02014b50), end of central directory (0x06054b50).
//! All integers are little-endian.

#include "archive/zip.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>

#include <zlib.h>

namespace pypack::archive {

namespace {

constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_SIG = 0x06054b50;

constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t END_OF_CENTRAL_SIZE = 22;

constexpr uint16_t METHOD_STORED = 0;
constexpr uint16_t METHOD_DEFLATED = 8;
constexpr uint16_t VERSION_NEEDED = 20;
constexpr uint16_t VERSION_MADE_BY = (3 << 8) | 20; // Unix, 2.0
constexpr uint16_t FLAG_UTF8 = 0x0800;

// 1980-01-01 00:00:00
constexpr uint16_t DOS_TIME = 0;
constexpr uint16_t DOS_DATE = (0 << 9) | (1 << 5) | 1;

constexpr uint32_t FILE_MODE = 0100644;

void put_u16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put_u32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

uint16_t get_u16(std::string_view in, size_t pos) {
    return static_cast<uint16_t>(static_cast<uint8_t>(in[pos]) |
                                 (static_cast<uint8_t>(in[pos + 1]) << 8));
}

uint32_t get_u32(std::string_view in, size_t pos) {
    uint32_t v = 0;
    for (int i = 3; i >= 0; --i) {
        v = (v << 8) | static_cast<uint8_t>(in[pos + static_cast<size_t>(i)]);
    }
    return v;
}

/// Offset of the end-of-central-directory record, if any.
std::optional<size_t> find_end_of_central(std::string_view bytes) {
    if (bytes.size() < END_OF_CENTRAL_SIZE) {
        return std::nullopt;
    }
    size_t last = bytes.size() - END_OF_CENTRAL_SIZE;
    size_t first = last > MAX_ZIP_COMMENT ? last - MAX_ZIP_COMMENT : 0;
    for (size_t pos = last + 1; pos-- > first;) {
        if (get_u32(bytes, pos) == END_OF_CENTRAL_SIG &&
            pos + END_OF_CENTRAL_SIZE + get_u16(bytes, pos + 20) == bytes.size()) {
            return pos;
        }
    }
    return std::nullopt;
}

Result<std::string, ZipError> read_whole_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ZipError{"cannot open " + path.string()};
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return ZipError{"cannot read " + path.string()};
    }
    return content;
}

} // namespace

const ZipEntry* ZipArchive::find(std::string_view name) const {
    for (const auto& entry : entries) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

// ============================================================================
// zlib wrappers
// ============================================================================

uint32_t zip_crc32(std::string_view data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    const auto* bytes = reinterpret_cast<const Bytef*>(data.data());
    size_t remaining = data.size();
    while (remaining > 0) {
        auto chunk =
            static_cast<uInt>(std::min<size_t>(remaining, std::numeric_limits<uInt>::max()));
        crc = crc32(crc, bytes, chunk);
        bytes += chunk;
        remaining -= chunk;
    }
    return static_cast<uint32_t>(crc);
}

Result<std::string, ZipError> deflate_raw(std::string_view data) {
    z_stream strm{};
    if (deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) !=
        Z_OK) {
        return ZipError{"deflateInit2 failed"};
    }

    std::string out;
    out.resize(deflateBound(&strm, static_cast<uLong>(data.size())));

    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = reinterpret_cast<Bytef*>(out.data());
    strm.avail_out = static_cast<uInt>(out.size());

    int rc = deflate(&strm, Z_FINISH);
    size_t produced = strm.total_out;
    std::string message = strm.msg ? strm.msg : std::to_string(rc);
    deflateEnd(&strm);

    if (rc != Z_STREAM_END) {
        return ZipError{"deflate failed: " + message};
    }
    out.resize(produced);
    return out;
}

Result<std::string, ZipError> inflate_raw(std::string_view data, size_t expected_size) {
    z_stream strm{};
    if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
        return ZipError{"inflateInit2 failed"};
    }

    std::string out;
    out.resize(expected_size);

    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = reinterpret_cast<Bytef*>(out.data());
    strm.avail_out = static_cast<uInt>(out.size());

    int rc = inflate(&strm, Z_FINISH);
    size_t produced = strm.total_out;
    std::string message = strm.msg ? strm.msg : std::to_string(rc);
    inflateEnd(&strm);

    if (rc != Z_STREAM_END || produced != expected_size) {
        return ZipError{"inflate failed: " + message};
    }
    return out;
}

// ============================================================================
// ZipWriter
// ============================================================================

bool ZipWriter::add(std::string name, std::string data) {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return false;
        }
    }
    entries_.push_back(ZipEntry{std::move(name), std::move(data)});
    return true;
}

std::optional<ZipError> ZipWriter::add_file(const fs::path& source, std::string name) {
    auto content = read_whole_file(source);
    if (is_err(content)) {
        return unwrap_err(content);
    }
    if (!add(std::move(name), std::move(unwrap(content)))) {
        return ZipError{"duplicate archive entry for " + source.string()};
    }
    return std::nullopt;
}

bool ZipWriter::set_comment(std::string comment) {
    if (comment.size() > MAX_ZIP_COMMENT) {
        return false;
    }
    comment_ = std::move(comment);
    return true;
}

Result<std::string, ZipError> ZipWriter::serialize() const {
    constexpr size_t limit = std::numeric_limits<uint32_t>::max();

    std::string out;
    std::string central;

    for (const auto& entry : entries_) {
        if (entry.data.size() >= limit || entry.name.size() > 0xFFFF) {
            return ZipError{"entry too large for a ZIP archive: " + entry.name};
        }

        uint32_t crc = zip_crc32(entry.data);
        auto compressed = deflate_raw(entry.data);
        if (is_err(compressed)) {
            return ZipError{entry.name + ": " + unwrap_err(compressed).message};
        }

        uint16_t method = METHOD_DEFLATED;
        std::string_view payload = unwrap(compressed);
        if (payload.size() >= entry.data.size()) {
            method = METHOD_STORED;
            payload = entry.data;
        }

        if (out.size() >= limit) {
            return ZipError{"archive too large"};
        }
        auto offset = static_cast<uint32_t>(out.size());

        put_u32(out, LOCAL_HEADER_SIG);
        put_u16(out, VERSION_NEEDED);
        put_u16(out, FLAG_UTF8);
        put_u16(out, method);
        put_u16(out, DOS_TIME);
        put_u16(out, DOS_DATE);
        put_u32(out, crc);
        put_u32(out, static_cast<uint32_t>(payload.size()));
        put_u32(out, static_cast<uint32_t>(entry.data.size()));
        put_u16(out, static_cast<uint16_t>(entry.name.size()));
        put_u16(out, 0);
        out += entry.name;
        out += payload;

        put_u32(central, CENTRAL_HEADER_SIG);
        put_u16(central, VERSION_MADE_BY);
        put_u16(central, VERSION_NEEDED);
        put_u16(central, FLAG_UTF8);
        put_u16(central, method);
        put_u16(central, DOS_TIME);
        put_u16(central, DOS_DATE);
        put_u32(central, crc);
        put_u32(central, static_cast<uint32_t>(payload.size()));
        put_u32(central, static_cast<uint32_t>(entry.data.size()));
        put_u16(central, static_cast<uint16_t>(entry.name.size()));
        put_u16(central, 0); // extra
        put_u16(central, 0); // comment
        put_u16(central, 0); // disk
        put_u16(central, 0); // internal attributes
        put_u32(central, FILE_MODE << 16);
        put_u32(central, offset);
        central += entry.name;
    }

    if (entries_.size() > 0xFFFF || out.size() + central.size() >= limit) {
        return ZipError{"archive too large"};
    }

    auto central_offset = static_cast<uint32_t>(out.size());
    out += central;

    put_u32(out, END_OF_CENTRAL_SIG);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, static_cast<uint16_t>(entries_.size()));
    put_u16(out, static_cast<uint16_t>(entries_.size()));
    put_u32(out, static_cast<uint32_t>(central.size()));
    put_u32(out, central_offset);
    put_u16(out, static_cast<uint16_t>(comment_.size()));
    out += comment_;

    return out;
}

std::optional<ZipError> ZipWriter::write_to(const fs::path& path) const {
    auto bytes = serialize();
    if (is_err(bytes)) {
        return unwrap_err(bytes);
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return ZipError{"cannot create " + path.string()};
    }
    const auto& data = unwrap(bytes);
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
        return ZipError{"cannot write " + path.string()};
    }
    PYPACK_LOG_DEBUG("archive", "Wrote " << path.filename().string() << " (" << entries_.size()
                                         << " entries, " << data.size() << " bytes)");
    return std::nullopt;
}

// ============================================================================
// Reader
// ============================================================================

Result<ZipArchive, ZipError> read_zip(std::string_view bytes) {
    auto eocd = find_end_of_central(bytes);
    if (!eocd) {
        return ZipError{"not a ZIP archive (no end of central directory)"};
    }

    size_t count = get_u16(bytes, *eocd + 10);
    size_t central_size = get_u32(bytes, *eocd + 12);
    size_t central_offset = get_u32(bytes, *eocd + 16);
    size_t comment_len = get_u16(bytes, *eocd + 20);

    if (central_offset + central_size > *eocd) {
        return ZipError{"corrupt central directory"};
    }

    ZipArchive archive;
    archive.comment = std::string(bytes.substr(*eocd + END_OF_CENTRAL_SIZE, comment_len));

    size_t pos = central_offset;
    for (size_t i = 0; i < count; ++i) {
        if (pos + CENTRAL_HEADER_SIZE > *eocd || get_u32(bytes, pos) != CENTRAL_HEADER_SIG) {
            return ZipError{"corrupt central directory entry"};
        }
        uint16_t method = get_u16(bytes, pos + 10);
        uint32_t crc = get_u32(bytes, pos + 16);
        size_t compressed_size = get_u32(bytes, pos + 20);
        size_t size = get_u32(bytes, pos + 24);
        size_t name_len = get_u16(bytes, pos + 28);
        size_t extra_len = get_u16(bytes, pos + 30);
        size_t entry_comment_len = get_u16(bytes, pos + 32);
        size_t local_offset = get_u32(bytes, pos + 42);

        if (pos + CENTRAL_HEADER_SIZE + name_len > *eocd) {
            return ZipError{"corrupt central directory entry"};
        }
        std::string name(bytes.substr(pos + CENTRAL_HEADER_SIZE, name_len));
        pos += CENTRAL_HEADER_SIZE + name_len + extra_len + entry_comment_len;

        if (local_offset + LOCAL_HEADER_SIZE > central_offset ||
            get_u32(bytes, local_offset) != LOCAL_HEADER_SIG) {
            return ZipError{"corrupt local header for " + name};
        }
        size_t data_offset = local_offset + LOCAL_HEADER_SIZE + get_u16(bytes, local_offset + 26) +
                             get_u16(bytes, local_offset + 28);
        if (data_offset + compressed_size > central_offset) {
            return ZipError{"truncated data for " + name};
        }
        auto payload = bytes.substr(data_offset, compressed_size);

        ZipEntry entry;
        entry.name = std::move(name);
        if (method == METHOD_STORED) {
            entry.data = std::string(payload);
        } else if (method == METHOD_DEFLATED) {
            auto inflated = inflate_raw(payload, size);
            if (is_err(inflated)) {
                return ZipError{entry.name + ": " + unwrap_err(inflated).message};
            }
            entry.data = std::move(unwrap(inflated));
        } else {
            return ZipError{entry.name + ": unsupported compression method " +
                            std::to_string(method)};
        }

        if (zip_crc32(entry.data) != crc) {
            return ZipError{entry.name + ": CRC mismatch"};
        }
        archive.entries.push_back(std::move(entry));
    }

    return archive;
}

Result<ZipArchive, ZipError> read_zip_file(const fs::path& path) {
    auto content = read_whole_file(path);
    if (is_err(content)) {
        return unwrap_err(content);
    }
    return read_zip(unwrap(content));
}

Result<std::string, ZipError> replace_zip_comment(std::string_view bytes,
                                                  std::string_view comment) {
    if (comment.size() > MAX_ZIP_COMMENT) {
        return ZipError{"archive comment too long (" + std::to_string(comment.size()) +
                        " bytes, max " + std::to_string(MAX_ZIP_COMMENT) + ")"};
    }
    auto eocd = find_end_of_central(bytes);
    if (!eocd) {
        return ZipError{"not a ZIP archive (no end of central directory)"};
    }

    std::string out(bytes.substr(0, *eocd + 20));
    put_u16(out, static_cast<uint16_t>(comment.size()));
    out += comment;
    return out;
}

Result<std::string, ZipError> read_zip_comment(std::string_view bytes) {
    auto eocd = find_end_of_central(bytes);
    if (!eocd) {
        return ZipError{"not a ZIP archive (no end of central directory)"};
    }
    size_t len = get_u16(bytes, *eocd + 20);
    return std::string(bytes.substr(*eocd + END_OF_CENTRAL_SIZE, len));
}

} // namespace pypack::archive
