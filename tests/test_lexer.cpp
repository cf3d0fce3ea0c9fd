#include <sandcell/pyast/lexer.hpp>

#include <cassert>
#include <string>
#include <vector>

using sandcell::pyast::Lexer;
using sandcell::pyast::SyntaxError;
using sandcell::pyast::Token;
using sandcell::pyast::TokenType;

static std::vector<Token> lex(const std::string& src) {
    Lexer lexer(src);
    return lexer.tokenize();
}

static bool lexFails(const std::string& src, int* line = nullptr) {
    try {
        lex(src);
    } catch (const SyntaxError& e) {
        if (line) *line = e.line();
        return true;
    }
    return false;
}

static void testSimpleAssignment() {
    std::vector<Token> t = lex("x = 1\n");
    assert(t.size() == 5);
    assert(t[0].type == TokenType::Name && t[0].text == "x");
    assert(t[0].line == 1 && t[0].column == 1);
    assert(t[1].type == TokenType::Op && t[1].text == "=" && t[1].column == 3);
    assert(t[2].type == TokenType::Number && t[2].text == "1" && t[2].column == 5);
    assert(t[3].type == TokenType::Newline);
    assert(t[4].type == TokenType::EndMarker);

    // Missing trailing newline is supplied
    std::vector<Token> u = lex("y");
    assert(u.size() == 3);
    assert(u[1].type == TokenType::Newline);
}

static void testIndentation() {
    std::vector<Token> t = lex("if x:\n    y\n\n# note\nz\n");
    std::vector<TokenType> expected = {
        TokenType::Name, TokenType::Name, TokenType::Op, TokenType::Newline,
        TokenType::Indent, TokenType::Name, TokenType::Newline, TokenType::Dedent,
        TokenType::Name, TokenType::Newline, TokenType::EndMarker
    };
    assert(t.size() == expected.size());
    for (size_t i = 0; i < t.size(); ++i) assert(t[i].type == expected[i]);
    assert(t[8].text == "z" && t[8].line == 5);

    int line = 0;
    assert(lexFails("if x:\n    a\n  b\n", &line));
    assert(line == 3);
}

static void testBracketsJoinLines() {
    std::vector<Token> t = lex("f(1,\n  2)\n");
    int newlines = 0;
    for (size_t i = 0; i < t.size(); ++i) {
        if (t[i].type == TokenType::Newline) ++newlines;
    }
    assert(newlines == 1);
    assert(lexFails("f(1,\n"));
    assert(lexFails("x = 1 \\ y\n"));
}

static void testStrings() {
    std::vector<Token> t = lex("rb'a\\n' f\"{x}\" '''multi\nline'''\n");
    assert(t[0].type == TokenType::String);
    assert(t[0].prefix == "rb");
    assert(t[0].body == "a\\n");
    assert(t[1].prefix == "f");
    assert(t[1].body == "{x}");
    assert(t[2].body == "multi\nline");

    int line = 0;
    assert(lexFails("x = 'open\n", &line));
    assert(line == 1);
    assert(lexFails("s = '''never closed\n"));
}

static void testNumbersAndOperators() {
    std::vector<Token> t = lex("0x1F + 1_000.5e-3j ** 2 // 3 -> ...\n");
    assert(t[0].text == "0x1F");
    assert(t[1].text == "+");
    assert(t[2].text == "1_000.5e-3j");
    assert(t[3].text == "**");
    assert(t[5].text == "//");
    assert(t[7].text == "->");
    assert(t[8].text == "...");
    assert(lexFails("x = 1_\n"));
}

static void testNullByteRejected() {
    std::string src("a = 1\nb\0 = 2\n", 13);
    int line = 0;
    assert(lexFails(src, &line));
    assert(line == 2);
}

static void testDecodeStringBody() {
    using sandcell::pyast::decode_string_body;
    assert(decode_string_body("a\\tb", false, false) == "a\tb");
    assert(decode_string_body("a\\tb", true, false) == "a\\tb");
    assert(decode_string_body("\\x41\\101", false, false) == "AA");
    assert(decode_string_body("\\u00e9", false, false) == "\xC3\xA9");
    assert(decode_string_body("\\u00e9", false, true) == "\\u00e9");
    assert(decode_string_body("\\N{BULLET}x", false, false) == "\x01x");
    assert(decode_string_body("\\q", false, false) == "\\q");
}

static void testKeywordHelpers() {
    assert(sandcell::pyast::is_keyword("lambda"));
    assert(sandcell::pyast::is_keyword("None"));
    assert(!sandcell::pyast::is_keyword("match"));
    assert(sandcell::pyast::is_ascii_identifier("_private1"));
    assert(!sandcell::pyast::is_ascii_identifier("1abc"));
    assert(!sandcell::pyast::is_ascii_identifier("caf\xC3\xA9"));
}

int main() {
    testSimpleAssignment();
    testIndentation();
    testBracketsJoinLines();
    testStrings();
    testNumbersAndOperators();
    testNullByteRejected();
    testDecodeStringBody();
    testKeywordHelpers();
    return 0;
}
