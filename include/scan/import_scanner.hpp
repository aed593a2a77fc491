//! # Import Scanner
//!
//! Finds the modules a Python source file imports without running it.
//!
//! The scan is lexical: an `ImportLexer` reduces the file to the handful of
//! tokens import statements are made of (names, dots, commas, parentheses,
//! `*`, statement separators) and skips everything else, including string
//! literals and comments. The scanner then recognizes the two statement forms
//! wherever a statement may begin:
//!
//! ```text
//! import a.b [as c], d
//! from [.]*[a.b] import x [as y], z
//! from [.]*[a.b] import (x, y)
//! from [.]*[a.b] import *
//! ```
//!
//! Statements nested in functions, classes, `if`/`try` bodies and one-line
//! compound statements (`if x: import y`) are found as well.

#ifndef PYPACK_SCAN_IMPORT_SCANNER_HPP
#define PYPACK_SCAN_IMPORT_SCANNER_HPP

#include "common.hpp"
#include "errors.hpp"
#include "scan/source.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pypack::scan {

/// One imported module as written in the source.
struct ImportedName {
    std::string module;             ///< Dotted name without leading dots ("" for `from . import x`)
    int level = 0;                  ///< Leading dots of a relative import, 0 = absolute
    std::vector<std::string> names; ///< Members of a `from` import, in order ("*" kept)
    uint32_t line = 0;              ///< Line of the first occurrence
    bool is_from = false;           ///< Written as `from ... import`

    /// "." * level + module, e.g. "..pkg.util".
    std::string display() const;
};

enum class TokenKind {
    Name,
    Dot,
    Comma,
    LParen,
    RParen,
    Star,
    Semicolon,
    Colon,
    Newline,
    Other,
    Eof
};

struct Token {
    TokenKind kind;
    std::string_view text;
    size_t offset;
    int depth; ///< Bracket nesting depth before this token
};

/// Tokenizer for the subset of Python that import statements need.
///
/// Newlines inside brackets and after a backslash continuation are not
/// reported. String literals (any prefix, single or triple quoted) and numbers
/// become `Other` tokens. An unterminated string runs to its line end (single
/// quoted) or to the end of the file (triple quoted).
class ImportLexer {
public:
    explicit ImportLexer(const Source& source);

    [[nodiscard]] auto next_token() -> Token;

    /// All tokens including the final Eof.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

private:
    const Source& source_;
    size_t pos_ = 0;
    int depth_ = 0;

    auto peek(size_t ahead = 0) const -> char {
        return source_.at(pos_ + ahead);
    }
    auto is_at_end() const -> bool {
        return pos_ >= source_.length();
    }

    void skip_trivia();
    auto make_token(TokenKind kind, size_t start, int depth) const -> Token;
    void skip_string(char quote);
    void skip_number();
};

/// Returns the imports of an in-memory source, deduplicated by display name
/// in order of first occurrence.
[[nodiscard]] auto scan_imports(const Source& source) -> std::vector<ImportedName>;

/// Reads and scans a file. Read failures yield `SourceUnreadable`.
[[nodiscard]] auto scan_file(const std::filesystem::path& path)
    -> Result<std::vector<ImportedName>, PackError>;

/// True if `text` is a valid string-literal prefix (r, b, f, u, rb, br, fr, rf; any case).
[[nodiscard]] bool is_string_prefix(std::string_view text);

} // namespace pypack::scan

#endif // PYPACK_SCAN_IMPORT_SCANNER_HPP
