// Import Scanner Tests
// Tests for ImportLexer, scan_imports, scan_file

#include "scan/import_scanner.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace pypack;
using namespace pypack::scan;
namespace fs = std::filesystem;

namespace {

std::vector<ImportedName> scan_code(const std::string& code) {
    auto source = Source::from_string(code, "test.py");
    return scan_imports(source);
}

std::vector<std::string> displays(const std::vector<ImportedName>& imports) {
    std::vector<std::string> out;
    for (const auto& imp : imports) {
        out.push_back(imp.display());
    }
    return out;
}

} // namespace

// ============================================================================
// Lexer
// ============================================================================

TEST(ImportLexerTest, StringsAndCommentsBecomeTrivia) {
    auto source = Source::from_string("x = 'import os'  # import sys\n");
    ImportLexer lexer(source);
    auto tokens = lexer.tokenize();

    for (const auto& tok : tokens) {
        EXPECT_NE(tok.text, "import");
    }
    EXPECT_EQ(tokens.back().kind, TokenKind::Eof);
}

TEST(ImportLexerTest, NewlinesInsideBracketsAreSuppressed) {
    auto source = Source::from_string("f(a,\n  b)\n");
    ImportLexer lexer(source);
    auto tokens = lexer.tokenize();

    int newlines = 0;
    for (const auto& tok : tokens) {
        if (tok.kind == TokenKind::Newline) {
            ++newlines;
        }
    }
    EXPECT_EQ(newlines, 1);
}

TEST(ImportLexerTest, BracketDepthIsTracked) {
    auto source = Source::from_string("(a[b])");
    ImportLexer lexer(source);
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].kind, TokenKind::LParen);
    EXPECT_EQ(tokens[0].depth, 0);
    EXPECT_EQ(tokens[1].depth, 1); // a
    EXPECT_EQ(tokens[3].depth, 2); // b
    EXPECT_EQ(tokens[5].kind, TokenKind::RParen);
}

TEST(ImportLexerTest, WalrusIsNotAColon) {
    auto source = Source::from_string("if (n := 1):");
    ImportLexer lexer(source);
    auto tokens = lexer.tokenize();

    int colons = 0;
    for (const auto& tok : tokens) {
        if (tok.kind == TokenKind::Colon) {
            ++colons;
        }
    }
    EXPECT_EQ(colons, 1);
}

TEST(ImportLexerTest, StringPrefixes) {
    EXPECT_TRUE(is_string_prefix("r"));
    EXPECT_TRUE(is_string_prefix("Rb"));
    EXPECT_TRUE(is_string_prefix("fR"));
    EXPECT_TRUE(is_string_prefix("u"));
    EXPECT_FALSE(is_string_prefix("ub"));
    EXPECT_FALSE(is_string_prefix("rbx"));
    EXPECT_FALSE(is_string_prefix(""));
}

// ============================================================================
// Statement Forms
// ============================================================================

TEST(ImportScannerTest, PlainImport) {
    auto imports = scan_code("import os\nimport helper\n");

    ASSERT_EQ(imports.size(), 2u);
    EXPECT_EQ(imports[0].module, "os");
    EXPECT_EQ(imports[0].level, 0);
    EXPECT_FALSE(imports[0].is_from);
    EXPECT_EQ(imports[0].line, 1u);
    EXPECT_EQ(imports[1].module, "helper");
    EXPECT_EQ(imports[1].line, 2u);
}

TEST(ImportScannerTest, DottedAndAliasedImports) {
    auto imports = scan_code("import pkg.sub.mod as m, other as o, third\n");
    EXPECT_EQ(displays(imports), (std::vector<std::string>{"pkg.sub.mod", "other", "third"}));
}

TEST(ImportScannerTest, FromImportCollectsMembers) {
    auto imports = scan_code("from pkg.util import read, write as w\n");

    ASSERT_EQ(imports.size(), 1u);
    EXPECT_TRUE(imports[0].is_from);
    EXPECT_EQ(imports[0].module, "pkg.util");
    EXPECT_EQ(imports[0].names, (std::vector<std::string>{"read", "write"}));
}

TEST(ImportScannerTest, ParenthesizedMultilineFromImport) {
    auto imports = scan_code("from shapes import (\n"
                        "    Circle,\n"
                        "    Square as Sq,  # comment\n"
                        "    Triangle,\n"
                        ")\n"
                        "import after\n");

    ASSERT_EQ(imports.size(), 2u);
    EXPECT_EQ(imports[0].names, (std::vector<std::string>{"Circle", "Square", "Triangle"}));
    EXPECT_EQ(imports[1].module, "after");
    EXPECT_EQ(imports[1].line, 6u);
}

TEST(ImportScannerTest, StarImport) {
    auto imports = scan_code("from consts import *\n");
    ASSERT_EQ(imports.size(), 1u);
    EXPECT_EQ(imports[0].names, (std::vector<std::string>{"*"}));
}

TEST(ImportScannerTest, RelativeImports) {
    auto imports = scan_code("from . import sibling\n"
                        "from .. import parent_mod\n"
                        "from ...deep.pkg import thing\n"
                        "from .local import x\n");

    ASSERT_EQ(imports.size(), 4u);
    EXPECT_EQ(imports[0].level, 1);
    EXPECT_EQ(imports[0].module, "");
    EXPECT_EQ(imports[0].names, (std::vector<std::string>{"sibling"}));
    EXPECT_EQ(imports[1].level, 2);
    EXPECT_EQ(imports[2].level, 3);
    EXPECT_EQ(imports[2].module, "deep.pkg");
    EXPECT_EQ(imports[3].display(), ".local");
}

TEST(ImportScannerTest, BackslashContinuation) {
    auto imports = scan_code("from a import b, \\\n    c\n");
    ASSERT_EQ(imports.size(), 1u);
    EXPECT_EQ(imports[0].names, (std::vector<std::string>{"b", "c"}));
}

// ============================================================================
// Placement
// ============================================================================

TEST(ImportScannerTest, NestedImportsAreFound) {
    auto imports = scan_code("def f():\n"
                        "    import inner\n"
                        "class C:\n"
                        "    def m(self):\n"
                        "        from deep import x\n"
                        "try:\n"
                        "    import fast\n"
                        "except ImportError:\n"
                        "    import slow\n");

    EXPECT_EQ(displays(imports),
              (std::vector<std::string>{"inner", "deep", "fast", "slow"}));
}

TEST(ImportScannerTest, OneLineCompoundAndSemicolons) {
    auto imports = scan_code("if True: import a\n"
                        "x = 1; import b; from c import d\n");
    EXPECT_EQ(displays(imports), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(ImportScannerTest, IgnoresStringsAndComments) {
    auto imports = scan_code("# import commented\n"
                        "s = 'import single'\n"
                        "d = \"from x import y\"\n"
                        "doc = '''\n"
                        "import in_triple\n"
                        "'''\n"
                        "raw = rb\"import raw\"\n"
                        "f = f'{import_me}'\n"
                        "import real\n");

    EXPECT_EQ(displays(imports), (std::vector<std::string>{"real"}));
}

TEST(ImportScannerTest, KeywordInsideExpressionIsNotAStatement) {
    auto imports = scan_code("x = foo(import_thing)\n"
                        "print('a', from_value)\n");
    EXPECT_TRUE(imports.empty());
}

TEST(ImportScannerTest, DeduplicatesAndMergesMembers) {
    auto imports = scan_code("from util import a\n"
                        "import util\n"
                        "from util import b, a\n");

    ASSERT_EQ(imports.size(), 1u);
    EXPECT_EQ(imports[0].line, 1u);
    EXPECT_TRUE(imports[0].is_from);
    EXPECT_EQ(imports[0].names, (std::vector<std::string>{"a", "b"}));
}

TEST(ImportScannerTest, MalformedStatementsAreSkipped) {
    auto imports = scan_code("from import x\n"
                        "import\n"
                        "from a\n"
                        "import ok\n");
    EXPECT_EQ(displays(imports), (std::vector<std::string>{"ok"}));
}

TEST(ImportScannerTest, UnterminatedTripleStringSwallowsRest) {
    auto imports = scan_code("import before\n"
                        "x = \"\"\"never closed\n"
                        "import hidden\n");
    EXPECT_EQ(displays(imports), (std::vector<std::string>{"before"}));
}

TEST(ImportScannerTest, EmptySource) {
    EXPECT_TRUE(scan_code("").empty());
}

// ============================================================================
// scan_file
// ============================================================================

TEST(ScanFileTest, ReadsFileFromDisk) {
    auto path = fs::temp_directory_path() / "pypack_scan_file_test.py";
    {
        std::ofstream out(path);
        out << "import json\nfrom . import peer\n";
    }

    auto result = scan_file(path);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).size(), 2u);
    fs::remove(path);
}

TEST(ScanFileTest, MissingFileIsSourceUnreadable) {
    auto result = scan_file(fs::temp_directory_path() / "pypack_does_not_exist.py");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::SourceUnreadable);
}
