#include "scan/source.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace pypack::scan {

Source::Source(std::string filename, std::string content)
    : filename_(std::move(filename)), content_(std::move(content)) {
    build_line_index();
}

void Source::build_line_index() {
    line_offsets_.clear();
    line_offsets_.push_back(0);

    for (size_t i = 0; i < content_.size(); ++i) {
        if (content_[i] == '\n') {
            line_offsets_.push_back(i + 1);
        }
    }
}

auto Source::at(size_t offset) const -> char {
    if (offset >= content_.size()) {
        return '\0';
    }
    return content_[offset];
}

auto Source::slice(size_t start, size_t end) const -> std::string_view {
    if (start >= content_.size()) {
        return {};
    }
    end = std::min(end, content_.size());
    return std::string_view(content_).substr(start, end - start);
}

auto Source::line_of(size_t offset) const -> uint32_t {
    auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
    return static_cast<uint32_t>(std::distance(line_offsets_.begin(), it));
}

auto Source::from_file(const std::string& path) -> Result<Source, std::string> {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return "Is a directory: " + path;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "Failed to open file: " + path;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (file.bad()) {
        return "Failed to read file: " + path;
    }

    return Source(path, std::move(content));
}

auto Source::from_string(std::string content, std::string name) -> Source {
    return Source(std::move(name), std::move(content));
}

} // namespace pypack::scan
