/*
 * sandcell - Python Tokenizer
 *
 * Produces the Python 3.11 token stream: NAME, NUMBER, STRING, OP,
 * NEWLINE, INDENT, DEDENT and ENDMARKER. Blank lines and comments produce
 * no tokens; newlines inside brackets are joined.
 */
#ifndef sandcell_PYAST_LEXER_HPP
#define sandcell_PYAST_LEXER_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace sandcell {
namespace pyast {

enum class TokenType {
    Name,
    Number,
    String,
    Op,
    Newline,
    Indent,
    Dedent,
    EndMarker
};

const char* token_type_name(TokenType type);

struct Token {
    TokenType type;
    std::string text;    // exact source text (operators, names, numbers, full literal)
    std::string prefix;  // strings only: lower-cased prefix ("", "r", "b", "f", "rb", ...)
    std::string body;    // strings only: raw text between the quotes
    int line;
    int column;

    Token() : type(TokenType::EndMarker), line(0), column(0) {}
    Token(TokenType t, const std::string& s, int l, int c) : type(t), text(s), line(l), column(c) {}
};

// Raised for lexical and grammatical errors; positions are 1-based
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& msg, int line, int column)
        : std::runtime_error(msg), line_(line), column_(column) {}

    int line() const { return line_; }
    int column() const { return column_; }

private:
    int line_;
    int column_;
};

class Lexer {
public:
    explicit Lexer(const std::string& source);

    // Throws SyntaxError
    std::vector<Token> tokenize();

private:
    char peek(size_t ahead = 0) const;
    void advance(size_t count = 1);
    bool at_end() const { return pos_ >= src_.size(); }

    void read_indentation(std::vector<Token>& out);
    void read_name_or_string(std::vector<Token>& out);
    void read_string(std::vector<Token>& out, const std::string& prefix, int line, int column, size_t start);
    void read_number(std::vector<Token>& out);
    void read_operator(std::vector<Token>& out);

    [[noreturn]] void fail(const std::string& msg) const;
    [[noreturn]] void fail_at(const std::string& msg, int line, int column) const;

    std::string src_;
    size_t pos_;
    int line_;
    int column_;
    int paren_depth_;
    bool at_line_start_;
    std::vector<int> indents_;
    std::vector<char> brackets_;
};

// Python keywords (hard keywords only; match/case/_ are soft)
bool is_keyword(const std::string& word);

// True when every byte is [A-Za-z0-9_] and the first is not a digit
bool is_ascii_identifier(const std::string& word);

// Evaluate the escape sequences of a non-raw literal body. Named escapes
// (\N{...}) cannot be resolved here and become U+0001 so that callers
// never mistake them for identifier characters.
std::string decode_string_body(const std::string& body, bool raw, bool bytes);

} // namespace pyast
} // namespace sandcell

#endif // sandcell_PYAST_LEXER_HPP
