/*
 * sandcell - Python Parser
 *
 * Recursive-descent parser for the Python 3.11 grammar. Produces a
 * pyast::Node tree; see ast.hpp for the payload conventions.
 */
#ifndef sandcell_PYAST_PARSER_HPP
#define sandcell_PYAST_PARSER_HPP

#include <sandcell/pyast/ast.hpp>
#include <sandcell/pyast/lexer.hpp>

#include <string>
#include <vector>

namespace sandcell {
namespace pyast {

struct ParseResult {
    NodePtr module;
    bool ok;
    std::string error;
    int line;
    int column;

    ParseResult() : ok(false), line(0), column(0) {}
};

// Tokenize and parse a whole module. Never throws.
ParseResult parse_module(const std::string& source);

class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    // file: statement* ENDMARKER. Throws SyntaxError.
    NodePtr parse_file();

    // '(' star_expressions ')' NEWLINE ENDMARKER, used for f-string fields
    NodePtr parse_wrapped_expression();

private:
    // ---- token helpers ----
    const Token& cur() const { return tokens_[pos_]; }
    const Token& peek_tok(size_t ahead) const;
    bool at_type(TokenType type) const { return cur().type == type; }
    bool at_op(const char* op) const;
    bool at_keyword(const char* kw) const;
    bool at_name() const;
    bool at_soft_keyword(const char* kw) const;
    Token take();
    Token expect_op(const char* op);
    Token expect_keyword(const char* kw);
    Token expect_name();
    bool can_start_expression() const;
    bool at_comprehension() const;

    [[noreturn]] void fail(const std::string& msg) const;
    [[noreturn]] void fail_at(const std::string& msg, int line, int column) const;

    // ---- statements ----
    void parse_statement(std::vector<NodePtr>& out);
    void parse_simple_statements(std::vector<NodePtr>& out);
    NodePtr parse_simple_statement();
    NodePtr parse_expression_statement();
    NodePtr parse_import();
    NodePtr parse_from_import();
    std::string parse_dotted_name();
    void parse_block(std::vector<NodePtr>& out);
    NodePtr parse_decorated();
    NodePtr parse_function_def(std::vector<NodePtr>& decorators, bool is_async, const Token& start);
    NodePtr parse_class_def(std::vector<NodePtr>& decorators, const Token& start);
    NodePtr parse_if();
    NodePtr parse_while();
    NodePtr parse_for(bool is_async, const Token& start);
    NodePtr parse_try();
    NodePtr parse_with(bool is_async, const Token& start);
    NodePtr parse_with_item();
    bool parenthesized_with_items() const;
    NodePtr parse_async(std::vector<NodePtr>& decorators);
    NodePtr parse_parameters(const char* closing, bool annotations);

    // ---- match statement ----
    bool is_match_statement() const;
    NodePtr parse_match();
    NodePtr parse_case();
    NodePtr parse_open_sequence_pattern();
    NodePtr parse_maybe_star_pattern();
    NodePtr parse_as_pattern();
    NodePtr parse_or_pattern();
    NodePtr parse_closed_pattern();
    NodePtr parse_mapping_pattern();
    NodePtr parse_class_pattern(NodePtr cls);
    NodePtr parse_signed_number();

    // ---- expressions ----
    NodePtr parse_star_expressions();
    NodePtr parse_star_expression();
    NodePtr parse_star_named_expression();
    NodePtr parse_named_expression();
    NodePtr parse_expression();
    NodePtr parse_lambda();
    NodePtr parse_disjunction();
    NodePtr parse_conjunction();
    NodePtr parse_inversion();
    NodePtr parse_comparison();
    NodePtr parse_bitwise_or();
    NodePtr parse_binary(int level);
    NodePtr parse_factor();
    NodePtr parse_power();
    NodePtr parse_await_primary();
    NodePtr parse_primary();
    NodePtr parse_atom();
    NodePtr parse_paren();
    NodePtr parse_list();
    NodePtr parse_brace();
    void parse_dict_rest(Node* dict);
    void parse_call_arguments(Node* call);
    NodePtr parse_slices();
    NodePtr parse_slice();
    void parse_comprehension_clauses(Node* comp);
    NodePtr parse_yield_expression();
    NodePtr parse_target_list();
    NodePtr parse_star_target();

    // ---- strings ----
    NodePtr parse_strings();
    void parse_fstring_into(Node* joined, const std::string& body, size_t offset,
                            bool raw, const Token& tok);
    size_t parse_fstring_field(Node* joined, const std::string& body, size_t open,
                               size_t offset, bool raw, const Token& tok);
    NodePtr parse_fstring_expression(const std::string& text, int line, int column);
    void body_position(const Token& tok, size_t index, int& line, int& column) const;

    void check_target(const Node* node, const char* verb) const;

    std::vector<Token> tokens_;
    size_t pos_;
    int depth_;

    friend struct DepthGuard;
};

} // namespace pyast
} // namespace sandcell

#endif // sandcell_PYAST_PARSER_HPP
