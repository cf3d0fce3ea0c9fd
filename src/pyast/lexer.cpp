/*
 * sandcell - Python Tokenizer Implementation
 */
#include <sandcell/pyast/lexer.hpp>

#include <cstdio>
#include <cstring>

namespace sandcell {
namespace pyast {

namespace {

const char* const kKeywords[] = {
    "False", "None", "True", "and", "as", "assert", "async", "await",
    "break", "class", "continue", "def", "del", "elif", "else", "except",
    "finally", "for", "from", "global", "if", "import", "in", "is",
    "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
    "while", "with", "yield", NULL
};

const char* const kOperators3[] = { "**=", "//=", ">>=", "<<=", "...", NULL };

const char* const kOperators2[] = {
    "->", ":=", "!=", "==", "<=", ">=", "**", "//", "<<", ">>",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=", NULL
};

const char kOperators1[] = "+-*/%@&|^~<>()[]{},:.;=";

bool is_ident_start(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c >= 0x80;
}

bool is_ident_char(unsigned char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_string_prefix(const std::string& lower) {
    return lower == "r" || lower == "u" || lower == "b" || lower == "f" ||
           lower == "br" || lower == "rb" || lower == "fr" || lower == "rf";
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out += "\xEF\xBF\xBD";
    }
}

// Reads up to max_digits hex digits at body[i]; returns digits consumed
size_t read_hex(const std::string& body, size_t i, size_t max_digits, unsigned long& value) {
    value = 0;
    size_t n = 0;
    while (n < max_digits && i + n < body.size()) {
        int h = hex_value(body[i + n]);
        if (h < 0) break;
        value = value * 16 + static_cast<unsigned long>(h);
        ++n;
    }
    return n;
}

} // namespace

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::Name: return "NAME";
        case TokenType::Number: return "NUMBER";
        case TokenType::String: return "STRING";
        case TokenType::Op: return "OP";
        case TokenType::Newline: return "NEWLINE";
        case TokenType::Indent: return "INDENT";
        case TokenType::Dedent: return "DEDENT";
        case TokenType::EndMarker: return "ENDMARKER";
    }
    return "UNKNOWN";
}

bool is_keyword(const std::string& word) {
    for (int i = 0; kKeywords[i] != NULL; ++i) {
        if (word == kKeywords[i]) return true;
    }
    return false;
}

bool is_ascii_identifier(const std::string& word) {
    if (word.empty() || is_digit(word[0])) return false;
    for (size_t i = 0; i < word.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(word[i]);
        if (c >= 0x80 || !is_ident_char(c)) return false;
    }
    return true;
}

std::string decode_string_body(const std::string& body, bool raw, bool bytes) {
    if (raw) return body;

    std::string out;
    out.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c != '\\' || i + 1 >= body.size()) {
            out.push_back(c);
            continue;
        }
        char e = body[++i];
        switch (e) {
            case '\n': break;
            case '\\': out.push_back('\\'); break;
            case '\'': out.push_back('\''); break;
            case '"': out.push_back('"'); break;
            case 'a': out.push_back('\a'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'v': out.push_back('\v'); break;
            case '0': case '1': case '2': case '3':
            case '4': case '5': case '6': case '7': {
                unsigned long v = 0;
                size_t n = 0;
                while (n < 3 && i + n < body.size() && body[i + n] >= '0' && body[i + n] <= '7') {
                    v = v * 8 + static_cast<unsigned long>(body[i + n] - '0');
                    ++n;
                }
                i += n - 1;
                if (bytes) out.push_back(static_cast<char>(v & 0xFF));
                else append_utf8(out, v);
                break;
            }
            case 'x': {
                unsigned long v = 0;
                size_t n = read_hex(body, i + 1, 2, v);
                if (n != 2) {
                    out.push_back('\\');
                    out.push_back('x');
                    break;
                }
                i += 2;
                if (bytes) out.push_back(static_cast<char>(v));
                else append_utf8(out, v);
                break;
            }
            case 'u':
            case 'U': {
                size_t want = (e == 'u') ? 4 : 8;
                unsigned long v = 0;
                size_t n = bytes ? 0 : read_hex(body, i + 1, want, v);
                if (n != want) {
                    out.push_back('\\');
                    out.push_back(e);
                    break;
                }
                i += want;
                append_utf8(out, v);
                break;
            }
            case 'N': {
                size_t close = body.find('}', i + 1);
                if (bytes || i + 1 >= body.size() || body[i + 1] != '{' || close == std::string::npos) {
                    out.push_back('\\');
                    out.push_back('N');
                    break;
                }
                out.push_back('\x01');
                i = close;
                break;
            }
            default:
                out.push_back('\\');
                out.push_back(e);
                break;
        }
    }
    return out;
}

// ============================================================================
// Lexer
// ============================================================================

Lexer::Lexer(const std::string& source)
    : pos_(0)
    , line_(1)
    , column_(1)
    , paren_depth_(0)
    , at_line_start_(true)
{
    src_.reserve(source.size());
    for (size_t i = 0; i < source.size(); ++i) {
        if (source[i] == '\r') {
            src_.push_back('\n');
            if (i + 1 < source.size() && source[i + 1] == '\n') ++i;
        } else {
            src_.push_back(source[i]);
        }
    }
    indents_.push_back(0);
}

char Lexer::peek(size_t ahead) const {
    size_t p = pos_ + ahead;
    return p < src_.size() ? src_[p] : '\0';
}

void Lexer::advance(size_t count) {
    for (size_t i = 0; i < count && pos_ < src_.size(); ++i) {
        if (src_[pos_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++pos_;
    }
}

void Lexer::fail(const std::string& msg) const {
    fail_at(msg, line_, column_);
}

void Lexer::fail_at(const std::string& msg, int line, int column) const {
    throw SyntaxError(msg, line, column);
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;

    size_t nul = src_.find('\0');
    if (nul != std::string::npos) {
        int line = 1, column = 1;
        for (size_t i = 0; i < nul; ++i) {
            if (src_[i] == '\n') { ++line; column = 1; } else { ++column; }
        }
        fail_at("source code cannot contain null bytes", line, column);
    }

    while (true) {
        if (at_line_start_ && paren_depth_ == 0) {
            read_indentation(out);
        }
        if (at_end()) break;

        char c = peek();
        unsigned char uc = static_cast<unsigned char>(c);

        if (c == ' ' || c == '\t' || c == '\f') {
            advance();
        } else if (c == '#') {
            while (!at_end() && peek() != '\n') advance();
        } else if (c == '\\') {
            if (peek(1) != '\n') {
                fail("unexpected character after line continuation character");
            }
            advance(2);
            if (at_end()) {
                fail("unexpected EOF while parsing");
            }
        } else if (c == '\n') {
            if (paren_depth_ == 0) {
                out.push_back(Token(TokenType::Newline, "\n", line_, column_));
                at_line_start_ = true;
            }
            advance();
        } else if (is_ident_start(uc)) {
            read_name_or_string(out);
        } else if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
            read_number(out);
        } else if (c == '\'' || c == '"') {
            read_string(out, "", line_, column_, pos_);
        } else {
            read_operator(out);
        }
    }

    if (paren_depth_ > 0) {
        std::string msg = "'";
        msg += brackets_.back();
        msg += "' was never closed";
        fail(msg);
    }

    if (!out.empty() && out.back().type != TokenType::Newline &&
        out.back().type != TokenType::Dedent && out.back().type != TokenType::Indent) {
        out.push_back(Token(TokenType::Newline, "", line_, column_));
    }
    while (indents_.size() > 1) {
        indents_.pop_back();
        out.push_back(Token(TokenType::Dedent, "", line_, column_));
    }
    out.push_back(Token(TokenType::EndMarker, "", line_, column_));
    return out;
}

void Lexer::read_indentation(std::vector<Token>& out) {
    while (true) {
        int width = 0;
        while (!at_end()) {
            char c = peek();
            if (c == ' ') {
                ++width;
            } else if (c == '\t') {
                width = (width / 8 + 1) * 8;
            } else if (c == '\f') {
                width = 0;
            } else {
                break;
            }
            advance();
        }
        if (at_end()) return;

        char c = peek();
        if (c == '\n') {
            advance();
            continue;
        }
        if (c == '#') {
            while (!at_end() && peek() != '\n') advance();
            continue;
        }

        if (width > indents_.back()) {
            if (indents_.size() > 100) {
                fail("too many levels of indentation");
            }
            indents_.push_back(width);
            out.push_back(Token(TokenType::Indent, "", line_, 1));
        } else if (width < indents_.back()) {
            while (width < indents_.back()) {
                indents_.pop_back();
                out.push_back(Token(TokenType::Dedent, "", line_, column_));
            }
            if (width != indents_.back()) {
                fail("unindent does not match any outer indentation level");
            }
        }
        at_line_start_ = false;
        return;
    }
}

void Lexer::read_name_or_string(std::vector<Token>& out) {
    size_t start = pos_;
    int line = line_;
    int column = column_;
    while (!at_end() && is_ident_char(static_cast<unsigned char>(peek()))) {
        advance();
    }
    std::string word = src_.substr(start, pos_ - start);

    char next = peek();
    if ((next == '\'' || next == '"') && word.size() <= 2) {
        std::string lower;
        for (size_t i = 0; i < word.size(); ++i) {
            char ch = word[i];
            lower.push_back((ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch);
        }
        if (is_string_prefix(lower)) {
            read_string(out, lower == "u" ? "" : lower, line, column, start);
            return;
        }
    }
    out.push_back(Token(TokenType::Name, word, line, column));
}

void Lexer::read_string(std::vector<Token>& out, const std::string& prefix,
                        int line, int column, size_t start) {
    char quote = peek();
    bool triple = peek(1) == quote && peek(2) == quote;
    advance(triple ? 3 : 1);

    size_t body_start = pos_;
    size_t body_end = pos_;
    while (true) {
        if (at_end()) {
            fail_at(triple ? "unterminated triple-quoted string literal"
                           : "unterminated string literal", line, column);
        }
        char c = peek();
        if (c == '\\') {
            advance();
            if (!at_end()) advance();
            continue;
        }
        if (c == '\n' && !triple) {
            fail_at("unterminated string literal", line, column);
        }
        if (c == quote) {
            if (!triple) {
                body_end = pos_;
                advance();
                break;
            }
            if (peek(1) == quote && peek(2) == quote) {
                body_end = pos_;
                advance(3);
                break;
            }
        }
        advance();
    }

    Token tok(TokenType::String, src_.substr(start, pos_ - start), line, column);
    tok.prefix = prefix;
    tok.body = src_.substr(body_start, body_end - body_start);
    out.push_back(tok);
}

void Lexer::read_number(std::vector<Token>& out) {
    size_t start = pos_;
    int line = line_;
    int column = column_;

    char c = peek();
    char n1 = peek(1);
    if (c == '0' && (n1 == 'x' || n1 == 'X' || n1 == 'o' || n1 == 'O' || n1 == 'b' || n1 == 'B')) {
        advance(2);
        while (!at_end() && (hex_value(peek()) >= 0 || peek() == '_')) advance();
    } else {
        while (!at_end() && (is_digit(peek()) || peek() == '_')) advance();
        if (peek() == '.') {
            advance();
            while (!at_end() && (is_digit(peek()) || peek() == '_')) advance();
        }
        if (peek() == 'e' || peek() == 'E') {
            char s = peek(1);
            if (is_digit(s) || ((s == '+' || s == '-') && is_digit(peek(2)))) {
                advance(2);
                while (!at_end() && (is_digit(peek()) || peek() == '_')) advance();
            }
        }
        if (peek() == 'j' || peek() == 'J') advance();
    }

    std::string text = src_.substr(start, pos_ - start);
    if (text[text.size() - 1] == '_') {
        fail("invalid decimal literal");
    }
    out.push_back(Token(TokenType::Number, text, line, column));
}

void Lexer::read_operator(std::vector<Token>& out) {
    int line = line_;
    int column = column_;

    for (int i = 0; kOperators3[i] != NULL; ++i) {
        if (src_.compare(pos_, 3, kOperators3[i]) == 0) {
            advance(3);
            out.push_back(Token(TokenType::Op, kOperators3[i], line, column));
            return;
        }
    }
    for (int i = 0; kOperators2[i] != NULL; ++i) {
        if (src_.compare(pos_, 2, kOperators2[i]) == 0) {
            advance(2);
            out.push_back(Token(TokenType::Op, kOperators2[i], line, column));
            return;
        }
    }

    char c = peek();
    if (c == '\0' || strchr(kOperators1, c) == NULL) {
        char buf[64];
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '!') {
            fail("invalid syntax");
        } else if (uc >= 0x20 && uc < 0x7F) {
            snprintf(buf, sizeof(buf), "invalid character '%c' (U+%04X)", c, uc);
            fail(buf);
        } else {
            snprintf(buf, sizeof(buf), "invalid non-printable character U+%04X", uc);
            fail(buf);
        }
    }

    if (c == '(' || c == '[' || c == '{') {
        if (brackets_.size() >= 200) {
            fail("too many nested parentheses");
        }
        brackets_.push_back(c);
        ++paren_depth_;
    } else if (c == ')' || c == ']' || c == '}') {
        if (brackets_.empty()) {
            std::string msg = "unmatched '";
            msg += c;
            msg += "'";
            fail(msg);
        }
        char open = brackets_.back();
        char expected = open == '(' ? ')' : (open == '[' ? ']' : '}');
        if (c != expected) {
            std::string msg = "closing parenthesis '";
            msg += c;
            msg += "' does not match opening parenthesis '";
            msg += open;
            msg += "'";
            fail(msg);
        }
        brackets_.pop_back();
        --paren_depth_;
    }

    advance();
    out.push_back(Token(TokenType::Op, std::string(1, c), line, column));
}

} // namespace pyast
} // namespace sandcell
