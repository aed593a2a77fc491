#include "scan/import_scanner.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace pypack::scan {

std::string ImportedName::display() const {
    return std::string(static_cast<size_t>(level), '.') + module;
}

bool is_string_prefix(std::string_view text) {
    if (text.empty() || text.size() > 2) {
        return false;
    }
    std::string lower;
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower == "r" || lower == "b" || lower == "f" || lower == "u" || lower == "rb" ||
           lower == "br" || lower == "fr" || lower == "rf";
}

namespace {

bool is_ident_start(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_ident_continue(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

} // namespace

// ============================================================================
// Lexer
// ============================================================================

ImportLexer::ImportLexer(const Source& source) : source_(source) {}

void ImportLexer::skip_trivia() {
    while (!is_at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\f') {
            ++pos_;
        } else if (c == '\\' && peek(1) == '\n') {
            pos_ += 2;
        } else if (c == '\\' && peek(1) == '\r' && peek(2) == '\n') {
            pos_ += 3;
        } else if (c == '#') {
            while (!is_at_end() && peek() != '\n' && peek() != '\r') {
                ++pos_;
            }
        } else if ((c == '\n' || c == '\r') && depth_ > 0) {
            ++pos_;
        } else {
            return;
        }
    }
}

auto ImportLexer::make_token(TokenKind kind, size_t start, int depth) const -> Token {
    return Token{kind, source_.slice(start, pos_), start, depth};
}

void ImportLexer::skip_string(char quote) {
    bool triple = peek(1) == quote && peek(2) == quote;
    pos_ += triple ? 3 : 1;

    while (!is_at_end()) {
        char c = peek();
        if (c == '\\') {
            // Escapes never terminate a literal, raw or not.
            pos_ += 2;
            continue;
        }
        if (triple) {
            if (c == quote && peek(1) == quote && peek(2) == quote) {
                pos_ += 3;
                return;
            }
        } else {
            if (c == quote) {
                ++pos_;
                return;
            }
            if (c == '\n' || c == '\r') {
                return;
            }
        }
        ++pos_;
    }
    pos_ = std::min(pos_, source_.length());
}

void ImportLexer::skip_number() {
    while (!is_at_end()) {
        char c = peek();
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.') {
            ++pos_;
        } else {
            return;
        }
    }
}

auto ImportLexer::next_token() -> Token {
    skip_trivia();

    size_t start = pos_;
    int depth = depth_;

    if (is_at_end()) {
        return make_token(TokenKind::Eof, start, depth);
    }

    char c = peek();

    if (c == '\n' || c == '\r') {
        while (!is_at_end() && (peek() == '\n' || peek() == '\r')) {
            ++pos_;
            skip_trivia();
        }
        return Token{TokenKind::Newline, source_.slice(start, start + 1), start, depth};
    }

    if (is_ident_start(c)) {
        while (!is_at_end() && is_ident_continue(peek())) {
            ++pos_;
        }
        auto text = source_.slice(start, pos_);
        if ((peek() == '\'' || peek() == '"') && is_string_prefix(text)) {
            skip_string(peek());
            return make_token(TokenKind::Other, start, depth);
        }
        return make_token(TokenKind::Name, start, depth);
    }

    if (c == '\'' || c == '"') {
        skip_string(c);
        return make_token(TokenKind::Other, start, depth);
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        skip_number();
        return make_token(TokenKind::Other, start, depth);
    }

    ++pos_;
    switch (c) {
    case '.':
        return make_token(TokenKind::Dot, start, depth);
    case ',':
        return make_token(TokenKind::Comma, start, depth);
    case '*':
        return make_token(TokenKind::Star, start, depth);
    case ';':
        return make_token(TokenKind::Semicolon, start, depth);
    case ':':
        if (peek() == '=') {
            ++pos_;
            return make_token(TokenKind::Other, start, depth);
        }
        return make_token(TokenKind::Colon, start, depth);
    case '(':
        ++depth_;
        return make_token(TokenKind::LParen, start, depth);
    case '[':
    case '{':
        ++depth_;
        return make_token(TokenKind::Other, start, depth);
    case ')':
        depth_ = depth_ > 0 ? depth_ - 1 : 0;
        return make_token(TokenKind::RParen, start, depth);
    case ']':
    case '}':
        depth_ = depth_ > 0 ? depth_ - 1 : 0;
        return make_token(TokenKind::Other, start, depth);
    default:
        return make_token(TokenKind::Other, start, depth);
    }
}

auto ImportLexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (true) {
        auto token = next_token();
        tokens.push_back(token);
        if (token.kind == TokenKind::Eof) {
            break;
        }
    }
    return tokens;
}

// ============================================================================
// Statement recognition
// ============================================================================

namespace {

class ImportParser {
public:
    ImportParser(const Source& source, std::vector<Token> tokens)
        : source_(source), tokens_(std::move(tokens)) {}

    auto parse() -> std::vector<ImportedName> {
        bool at_statement_start = true;
        while (!check(TokenKind::Eof)) {
            const Token& tok = current();

            if (at_statement_start && tok.kind == TokenKind::Name) {
                if (tok.text == "import") {
                    advance();
                    parse_import();
                    at_statement_start = false;
                    continue;
                }
                if (tok.text == "from") {
                    advance();
                    parse_from();
                    at_statement_start = false;
                    continue;
                }
            }

            at_statement_start = tok.kind == TokenKind::Newline ||
                                 tok.kind == TokenKind::Semicolon ||
                                 (tok.kind == TokenKind::Colon && tok.depth == 0);
            advance();
        }
        return std::move(imports_);
    }

private:
    const Source& source_;
    std::vector<Token> tokens_;
    size_t current_ = 0;
    std::vector<ImportedName> imports_;
    std::unordered_map<std::string, size_t> index_;

    auto current() const -> const Token& {
        return tokens_[current_];
    }
    auto check(TokenKind kind) const -> bool {
        return tokens_[current_].kind == kind;
    }
    void advance() {
        if (!check(TokenKind::Eof)) {
            ++current_;
        }
    }
    auto at_statement_end() const -> bool {
        return check(TokenKind::Newline) || check(TokenKind::Semicolon) || check(TokenKind::Eof);
    }

    /// Name ('.' Name)*; empty if the current token is not a name.
    auto parse_dotted_name() -> std::string {
        std::string name;
        if (!check(TokenKind::Name)) {
            return name;
        }
        name = std::string(current().text);
        advance();
        while (check(TokenKind::Dot) && tokens_[current_ + 1].kind == TokenKind::Name) {
            advance();
            name += '.';
            name += current().text;
            advance();
        }
        return name;
    }

    void skip_alias() {
        if (check(TokenKind::Name) && current().text == "as") {
            advance();
            if (check(TokenKind::Name)) {
                advance();
            }
        }
    }

    void record(ImportedName entry) {
        auto key = entry.display();
        auto it = index_.find(key);
        if (it == index_.end()) {
            index_.emplace(key, imports_.size());
            imports_.push_back(std::move(entry));
            return;
        }
        auto& existing = imports_[it->second];
        existing.is_from = existing.is_from || entry.is_from;
        for (auto& member : entry.names) {
            bool seen = false;
            for (const auto& have : existing.names) {
                if (have == member) {
                    seen = true;
                    break;
                }
            }
            if (!seen) {
                existing.names.push_back(std::move(member));
            }
        }
    }

    // import a.b as c, d
    void parse_import() {
        while (!at_statement_end()) {
            size_t offset = current().offset;
            auto module = parse_dotted_name();
            if (module.empty()) {
                skip_statement();
                return;
            }
            ImportedName entry;
            entry.module = std::move(module);
            entry.line = source_.line_of(offset);
            record(std::move(entry));

            skip_alias();
            if (!check(TokenKind::Comma)) {
                break;
            }
            advance();
        }
    }

    // from ..a.b import (x as y, z)
    void parse_from() {
        size_t offset = current().offset;
        ImportedName entry;
        entry.is_from = true;

        while (check(TokenKind::Dot)) {
            entry.level += static_cast<int>(current().text.size());
            advance();
        }
        if (!check(TokenKind::Name) || current().text != "import") {
            entry.module = parse_dotted_name();
        }

        if (!check(TokenKind::Name) || current().text != "import") {
            skip_statement();
            return;
        }
        advance();
        if (entry.level == 0 && entry.module.empty()) {
            skip_statement();
            return;
        }

        bool parenthesized = check(TokenKind::LParen);
        if (parenthesized) {
            advance();
        }

        while (!at_statement_end()) {
            if (check(TokenKind::Star)) {
                entry.names.emplace_back("*");
                advance();
            } else if (check(TokenKind::Name)) {
                entry.names.emplace_back(current().text);
                advance();
                skip_alias();
            } else if (parenthesized && check(TokenKind::RParen)) {
                advance();
                break;
            } else {
                break;
            }
            if (!check(TokenKind::Comma)) {
                if (parenthesized && check(TokenKind::RParen)) {
                    advance();
                }
                break;
            }
            advance();
        }

        entry.line = source_.line_of(offset);
        record(std::move(entry));
    }

    void skip_statement() {
        while (!at_statement_end()) {
            advance();
        }
    }
};

} // namespace

auto scan_imports(const Source& source) -> std::vector<ImportedName> {
    ImportLexer lexer(source);
    ImportParser parser(source, lexer.tokenize());
    auto imports = parser.parse();
    PYPACK_LOG_TRACE("scan", source.filename() << ": " << imports.size() << " import(s)");
    return imports;
}

auto scan_file(const std::filesystem::path& path)
    -> Result<std::vector<ImportedName>, PackError> {
    auto source_result = Source::from_file(path.string());
    if (is_err(source_result)) {
        return make_error(ErrorKind::SourceUnreadable, path, unwrap_err(source_result));
    }
    return scan_imports(unwrap(source_result));
}

} // namespace pypack::scan
