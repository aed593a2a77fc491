#include "config.hpp"

#include "log/log.hpp"

#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>

namespace pypack::cli {

// ============================================================================
// PackConfig
// ============================================================================

Result<PackConfig, PackError> PackConfig::parse(const std::string& content, const fs::path& name) {
    SimpleTomlParser parser(content);
    auto config = parser.parse();
    if (!config) {
        return make_error(ErrorKind::ConfigInvalid, name, parser.get_error());
    }
    config->source = name;
    return *config;
}

Result<PackConfig, PackError> PackConfig::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return make_error(ErrorKind::ConfigInvalid, path, "config file not found");
    }

    std::ifstream file(path);
    if (!file) {
        return make_error(ErrorKind::ConfigInvalid, path, "cannot read config file");
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    auto result = parse(content, path);
    if (is_err(result)) {
        return result;
    }

    auto& config = unwrap(result);
    auto base = path.parent_path();
    if (config.build.output && config.build.output->is_relative()) {
        config.build.output = base / *config.build.output;
    }
    if (config.build.banner && config.build.banner->is_relative()) {
        config.build.banner = base / *config.build.banner;
    }

    PYPACK_LOG_DEBUG("config", "Loaded " << path.string());
    return result;
}

std::optional<fs::path> PackConfig::find_beside(const fs::path& entry) {
    auto candidate = entry.parent_path() / CONFIG_FILE_NAME;
    if (entry.parent_path().empty()) {
        candidate = CONFIG_FILE_NAME;
    }
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
        return candidate;
    }
    return std::nullopt;
}

// ============================================================================
// SimpleTomlParser
// ============================================================================

SimpleTomlParser::SimpleTomlParser(const std::string& content)
    : content_(content), pos_(0), line_(1) {}

void SimpleTomlParser::skip_whitespace() {
    while (!is_eof() && std::isspace(static_cast<unsigned char>(peek()))) {
        if (peek() == '\n')
            line_++;
        advance();
    }
}

void SimpleTomlParser::skip_inline_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t')) {
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

char SimpleTomlParser::advance() {
    if (is_eof())
        return '\0';
    return content_[pos_++];
}

std::string SimpleTomlParser::parse_identifier() {
    std::string result;
    while (!is_eof() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                         peek() == '-')) {
        result += advance();
    }
    return result;
}

std::optional<std::string> SimpleTomlParser::parse_string() {
    if (peek() != '"') {
        set_error("Expected string");
        return std::nullopt;
    }
    advance(); // Skip opening quote

    std::string result;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        if (peek() == '\\') {
            advance();
            if (is_eof())
                break;
            char escaped = advance();
            switch (escaped) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case 'r':
                result += '\r';
                break;
            case '\\':
                result += '\\';
                break;
            case '"':
                result += '"';
                break;
            default:
                result += escaped;
                break;
            }
        } else {
            result += advance();
        }
    }

    if (peek() != '"') {
        set_error("Unterminated string");
        return std::nullopt;
    }
    advance(); // Skip closing quote

    return result;
}

std::optional<int> SimpleTomlParser::parse_number() {
    std::string num_str;
    if (peek() == '-' || peek() == '+') {
        num_str += advance();
    }
    while (!is_eof() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')) {
        char c = advance();
        if (c != '_') {
            num_str += c;
        }
    }
    if (num_str.empty() || num_str == "-" || num_str == "+" || num_str.size() > 10) {
        set_error("Expected integer");
        return std::nullopt;
    }
    long long value = std::stoll(num_str);
    if (value < INT32_MIN || value > INT32_MAX) {
        set_error("Integer out of range");
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<bool> SimpleTomlParser::parse_boolean() {
    std::string value = parse_identifier();
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    set_error("Expected true or false");
    return std::nullopt;
}

bool SimpleTomlParser::expect_line_end() {
    skip_inline_whitespace();
    skip_comment();
    if (is_eof()) {
        return true;
    }
    if (peek() == '\r') {
        advance();
    }
    if (peek() != '\n') {
        set_error("Unexpected characters after value");
        return false;
    }
    return true;
}

void SimpleTomlParser::set_error(const std::string& message) {
    if (error_message_.empty()) {
        error_message_ = "Line " + std::to_string(line_) + ": " + message;
    }
}

bool SimpleTomlParser::parse_build_key(const std::string& key, BuildSection& build) {
    if (key == "format" || key == "output" || key == "banner") {
        auto value = parse_string();
        if (!value) {
            return false;
        }
        if (key == "format") {
            build.format = *value;
        } else if (key == "output") {
            build.output = fs::path(*value);
        } else {
            build.banner = fs::path(*value);
        }
        return true;
    }
    if (key == "include-deps" || key == "optimize" || key == "cache") {
        auto value = parse_boolean();
        if (!value) {
            return false;
        }
        if (key == "include-deps") {
            build.include_deps = *value;
        } else if (key == "optimize") {
            build.optimize = *value;
        } else {
            build.cache = *value;
        }
        return true;
    }
    if (key == "jobs") {
        auto value = parse_number();
        if (!value) {
            return false;
        }
        if (*value < 0) {
            set_error("jobs must not be negative");
            return false;
        }
        build.jobs = *value;
        return true;
    }
    set_error("Unknown key '" + key + "' in [build]");
    return false;
}

bool SimpleTomlParser::parse_backend_key(const std::string& key, BackendSection& backend) {
    if (key == "python") {
        auto value = parse_string();
        if (!value) {
            return false;
        }
        if (value->empty()) {
            set_error("python must not be empty");
            return false;
        }
        backend.python = *value;
        return true;
    }
    if (key == "timeout") {
        auto value = parse_number();
        if (!value) {
            return false;
        }
        if (*value < 0) {
            set_error("timeout must not be negative");
            return false;
        }
        backend.timeout = *value;
        return true;
    }
    set_error("Unknown key '" + key + "' in [backend]");
    return false;
}

std::optional<PackConfig> SimpleTomlParser::parse() {
    PackConfig config;
    std::string section;

    while (true) {
        skip_whitespace();
        skip_comment();
        skip_whitespace();
        if (is_eof()) {
            break;
        }

        if (peek() == '[') {
            advance();
            skip_inline_whitespace();
            section = parse_identifier();
            skip_inline_whitespace();
            if (peek() != ']') {
                set_error("Expected ']' after section name");
                return std::nullopt;
            }
            advance();
            if (section != "build" && section != "backend") {
                set_error("Unknown section [" + section + "]");
                return std::nullopt;
            }
            if (!expect_line_end()) {
                return std::nullopt;
            }
            continue;
        }

        std::string key = parse_identifier();
        if (key.empty()) {
            set_error("Expected key");
            return std::nullopt;
        }
        skip_inline_whitespace();

        if (peek() != '=') {
            set_error("Expected '=' after key");
            return std::nullopt;
        }
        advance();
        skip_inline_whitespace();

        bool ok = false;
        if (section == "build") {
            ok = parse_build_key(key, config.build);
        } else if (section == "backend") {
            ok = parse_backend_key(key, config.backend);
        } else {
            set_error("Key '" + key + "' outside of a section");
        }
        if (!ok || !expect_line_end()) {
            return std::nullopt;
        }
    }

    return config;
}

} // namespace pypack::cli
