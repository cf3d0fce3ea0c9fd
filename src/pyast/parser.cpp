/*
 * sandcell - Python Parser Implementation
 *
 * Follows the structure of the Python 3.11 PEG grammar, one method per
 * rule. Ambiguities the PEG parser resolves by backtracking (soft
 * keywords, parenthesized with-items) are resolved here by bounded
 * token lookahead.
 */
#include <sandcell/pyast/parser.hpp>

#include <cstring>

namespace sandcell {
namespace pyast {

namespace {

const int kMaxDepth = 1000;

const char* const kAugAssignOps[] = {
    "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=",
    ">>=", "<<=", "**=", NULL
};

// Operators that make a leading "match" an ordinary expression
const char* const kNotMatchSubjectStart[] = {
    "=", ".", ":", ",", ";", ")", "]", "}", "+=", "-=", "*=", "/=", "//=",
    "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**=", "==", "!=", "<",
    ">", "<=", ">=", "|", "&", "^", "/", "//", "%", "@", "**", "<<", ">>",
    ":=", "->", NULL
};

// Binary operator levels, loosest first
const char* const kBinaryLevels[][6] = {
    { "|", NULL },
    { "^", NULL },
    { "&", NULL },
    { "<<", ">>", NULL },
    { "+", "-", NULL },
    { "*", "/", "//", "%", "@", NULL },
};
const int kBinaryLevelCount = 6;

bool in_list(const char* const* list, const std::string& text) {
    for (int i = 0; list[i] != NULL; ++i) {
        if (text == list[i]) return true;
    }
    return false;
}

const char* describe_expression(NodeKind kind) {
    switch (kind) {
        case NodeKind::Call: return "function call";
        case NodeKind::Constant:
        case NodeKind::JoinedStr: return "literal";
        case NodeKind::Lambda: return "lambda";
        case NodeKind::Compare: return "comparison";
        case NodeKind::IfExp: return "conditional expression";
        case NodeKind::NamedExpr: return "named expression";
        case NodeKind::Await: return "await expression";
        case NodeKind::Yield:
        case NodeKind::YieldFrom: return "yield expression";
        case NodeKind::ListComp: return "list comprehension";
        case NodeKind::SetComp: return "set comprehension";
        case NodeKind::DictComp: return "dict comprehension";
        case NodeKind::GeneratorExp: return "generator expression";
        case NodeKind::Dict: return "dict literal";
        case NodeKind::Set: return "set display";
        default: return "expression";
    }
}

} // namespace

struct DepthGuard {
    explicit DepthGuard(Parser& p) : parser(p) {
        if (++parser.depth_ > kMaxDepth) {
            parser.fail("too many nested expressions");
        }
    }
    ~DepthGuard() { --parser.depth_; }

    Parser& parser;
};

ParseResult parse_module(const std::string& source) {
    ParseResult result;
    try {
        Lexer lexer(source);
        Parser parser(lexer.tokenize());
        result.module = parser.parse_file();
        result.ok = true;
    } catch (const SyntaxError& e) {
        result.ok = false;
        result.error = e.what();
        result.line = e.line();
        result.column = e.column();
    }
    return result;
}

Parser::Parser(std::vector<Token> tokens)
    : tokens_(std::move(tokens))
    , pos_(0)
    , depth_(0)
{
    if (tokens_.empty() || tokens_.back().type != TokenType::EndMarker) {
        tokens_.push_back(Token(TokenType::EndMarker, "", 1, 1));
    }
}

// ============================================================================
// Token helpers
// ============================================================================

const Token& Parser::peek_tok(size_t ahead) const {
    size_t idx = pos_ + ahead;
    if (idx >= tokens_.size()) idx = tokens_.size() - 1;
    return tokens_[idx];
}

bool Parser::at_op(const char* op) const {
    return cur().type == TokenType::Op && cur().text == op;
}

bool Parser::at_keyword(const char* kw) const {
    return cur().type == TokenType::Name && cur().text == kw;
}

bool Parser::at_name() const {
    return cur().type == TokenType::Name && !is_keyword(cur().text);
}

bool Parser::at_soft_keyword(const char* kw) const {
    return cur().type == TokenType::Name && cur().text == kw;
}

Token Parser::take() {
    Token t = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) ++pos_;
    return t;
}

Token Parser::expect_op(const char* op) {
    if (!at_op(op)) {
        std::string msg = "expected '";
        msg += op;
        msg += "'";
        fail(msg);
    }
    return take();
}

Token Parser::expect_keyword(const char* kw) {
    if (!at_keyword(kw)) {
        std::string msg = "expected '";
        msg += kw;
        msg += "'";
        fail(msg);
    }
    return take();
}

Token Parser::expect_name() {
    if (!at_name()) {
        fail("invalid syntax");
    }
    return take();
}

bool Parser::can_start_expression() const {
    const Token& t = cur();
    switch (t.type) {
        case TokenType::Number:
        case TokenType::String:
            return true;
        case TokenType::Name:
            return !is_keyword(t.text) || t.text == "not" || t.text == "lambda" ||
                   t.text == "await" || t.text == "None" || t.text == "True" ||
                   t.text == "False";
        case TokenType::Op:
            return t.text == "(" || t.text == "[" || t.text == "{" || t.text == "-" ||
                   t.text == "+" || t.text == "~" || t.text == "...";
        default:
            return false;
    }
}

bool Parser::at_comprehension() const {
    if (at_keyword("for")) return true;
    return at_keyword("async") && peek_tok(1).type == TokenType::Name && peek_tok(1).text == "for";
}

void Parser::fail(const std::string& msg) const {
    fail_at(msg, cur().line, cur().column);
}

void Parser::fail_at(const std::string& msg, int line, int column) const {
    throw SyntaxError(msg, line, column);
}

// ============================================================================
// Statements
// ============================================================================

NodePtr Parser::parse_file() {
    NodePtr module = make_node(NodeKind::Module, 1, 1);
    while (!at_type(TokenType::EndMarker)) {
        if (at_type(TokenType::Newline)) {
            take();
            continue;
        }
        if (at_type(TokenType::Indent)) {
            fail("unexpected indent");
        }
        if (at_type(TokenType::Dedent)) {
            take();
            continue;
        }
        parse_statement(module->children);
    }
    return module;
}

NodePtr Parser::parse_wrapped_expression() {
    expect_op("(");
    NodePtr expr = at_keyword("yield") ? parse_yield_expression() : parse_star_expressions();
    expect_op(")");
    if (at_type(TokenType::Newline)) take();
    if (!at_type(TokenType::EndMarker)) {
        fail("invalid syntax");
    }
    return expr;
}

void Parser::parse_statement(std::vector<NodePtr>& out) {
    DepthGuard guard(*this);

    if (at_op("@")) {
        out.push_back(parse_decorated());
        return;
    }

    std::vector<NodePtr> no_decorators;
    if (at_keyword("def")) {
        Token start = cur();
        out.push_back(parse_function_def(no_decorators, false, start));
    } else if (at_keyword("class")) {
        Token start = cur();
        out.push_back(parse_class_def(no_decorators, start));
    } else if (at_keyword("if")) {
        out.push_back(parse_if());
    } else if (at_keyword("while")) {
        out.push_back(parse_while());
    } else if (at_keyword("for")) {
        Token start = cur();
        out.push_back(parse_for(false, start));
    } else if (at_keyword("try")) {
        out.push_back(parse_try());
    } else if (at_keyword("with")) {
        Token start = cur();
        out.push_back(parse_with(false, start));
    } else if (at_keyword("async")) {
        out.push_back(parse_async(no_decorators));
    } else if (at_soft_keyword("match") && is_match_statement()) {
        out.push_back(parse_match());
    } else {
        parse_simple_statements(out);
    }
}

void Parser::parse_simple_statements(std::vector<NodePtr>& out) {
    out.push_back(parse_simple_statement());
    while (at_op(";")) {
        take();
        if (at_type(TokenType::Newline)) break;
        out.push_back(parse_simple_statement());
    }
    if (!at_type(TokenType::Newline)) {
        fail("invalid syntax");
    }
    take();
}

NodePtr Parser::parse_simple_statement() {
    const Token& t = cur();
    if (t.type != TokenType::Name) {
        return parse_expression_statement();
    }

    if (t.text == "pass") {
        Token tok = take();
        return make_node(NodeKind::Pass, tok.line, tok.column);
    }
    if (t.text == "break") {
        Token tok = take();
        return make_node(NodeKind::Break, tok.line, tok.column);
    }
    if (t.text == "continue") {
        Token tok = take();
        return make_node(NodeKind::Continue, tok.line, tok.column);
    }
    if (t.text == "return") {
        Token tok = take();
        NodePtr node = make_node(NodeKind::Return, tok.line, tok.column);
        if (can_start_expression() || at_op("*")) {
            node->add(parse_star_expressions());
        }
        return node;
    }
    if (t.text == "raise") {
        Token tok = take();
        NodePtr node = make_node(NodeKind::Raise, tok.line, tok.column);
        if (can_start_expression()) {
            node->add(parse_expression());
            if (at_keyword("from")) {
                take();
                node->add(parse_expression());
            }
        }
        return node;
    }
    if (t.text == "global" || t.text == "nonlocal") {
        Token tok = take();
        NodePtr node = make_node(tok.text == "global" ? NodeKind::Global : NodeKind::Nonlocal,
                                 tok.line, tok.column);
        while (true) {
            Token name = expect_name();
            node->add(make_node(NodeKind::Name, name.line, name.column, name.text));
            if (!at_op(",")) break;
            take();
        }
        return node;
    }
    if (t.text == "del") {
        Token tok = take();
        NodePtr node = make_node(NodeKind::Delete, tok.line, tok.column);
        NodePtr targets = parse_target_list();
        check_target(targets.get(), "delete");
        node->add(std::move(targets));
        return node;
    }
    if (t.text == "assert") {
        Token tok = take();
        NodePtr node = make_node(NodeKind::Assert, tok.line, tok.column);
        node->add(parse_expression());
        if (at_op(",")) {
            take();
            node->add(parse_expression());
        }
        return node;
    }
    if (t.text == "import") {
        return parse_import();
    }
    if (t.text == "from") {
        return parse_from_import();
    }
    return parse_expression_statement();
}

NodePtr Parser::parse_expression_statement() {
    Token start = cur();
    NodePtr first = at_keyword("yield") ? parse_yield_expression() : parse_star_expressions();

    if (at_op(":")) {
        if (first->kind == NodeKind::Tuple) {
            fail_at("only single target (not tuple) can be annotated", first->line, first->column);
        }
        if (first->kind != NodeKind::Name && first->kind != NodeKind::Attribute &&
            first->kind != NodeKind::Subscript) {
            fail_at("illegal target for annotation", first->line, first->column);
        }
        take();
        NodePtr node = make_node(NodeKind::AnnAssign, start.line, start.column);
        node->add(std::move(first));
        node->add(parse_expression());
        if (at_op("=")) {
            take();
            node->add(at_keyword("yield") ? parse_yield_expression() : parse_star_expressions());
        }
        return node;
    }

    if (cur().type == TokenType::Op && in_list(kAugAssignOps, cur().text)) {
        if (first->kind != NodeKind::Name && first->kind != NodeKind::Attribute &&
            first->kind != NodeKind::Subscript) {
            std::string msg = "'";
            msg += describe_expression(first->kind);
            msg += "' is an illegal expression for augmented assignment";
            fail_at(msg, first->line, first->column);
        }
        Token op = take();
        NodePtr node = make_node(NodeKind::AugAssign, start.line, start.column, op.text);
        node->add(std::move(first));
        node->add(at_keyword("yield") ? parse_yield_expression() : parse_star_expressions());
        return node;
    }

    if (at_op("=")) {
        NodePtr node = make_node(NodeKind::Assign, start.line, start.column);
        check_target(first.get(), "assign to");
        node->add(std::move(first));
        while (at_op("=")) {
            take();
            NodePtr next = at_keyword("yield") ? parse_yield_expression() : parse_star_expressions();
            if (at_op("=")) {
                check_target(next.get(), "assign to");
            }
            node->add(std::move(next));
        }
        return node;
    }

    NodePtr node = make_node(NodeKind::Expr, start.line, start.column);
    node->add(std::move(first));
    return node;
}

std::string Parser::parse_dotted_name() {
    std::string name = expect_name().text;
    while (at_op(".")) {
        take();
        name += ".";
        name += expect_name().text;
    }
    return name;
}

NodePtr Parser::parse_import() {
    Token tok = take();
    NodePtr node = make_node(NodeKind::Import, tok.line, tok.column);
    while (true) {
        Token start = cur();
        NodePtr alias = make_node(NodeKind::Alias, start.line, start.column, parse_dotted_name());
        if (at_keyword("as")) {
            take();
            alias->extra = expect_name().text;
        }
        node->add(std::move(alias));
        if (!at_op(",")) break;
        take();
    }
    return node;
}

NodePtr Parser::parse_from_import() {
    Token tok = take();
    int level = 0;
    while (at_op(".") || at_op("...")) {
        level += (cur().text == "...") ? 3 : 1;
        take();
    }
    std::string module;
    if (!at_keyword("import")) {
        module = parse_dotted_name();
    } else if (level == 0) {
        fail("invalid syntax");
    }
    expect_keyword("import");

    NodePtr node = make_node(NodeKind::ImportFrom, tok.line, tok.column, module);
    node->level = level;

    if (at_op("*")) {
        Token star = take();
        node->add(make_node(NodeKind::Alias, star.line, star.column, "*"));
        return node;
    }

    bool paren = at_op("(");
    if (paren) take();
    while (true) {
        Token name = expect_name();
        NodePtr alias = make_node(NodeKind::Alias, name.line, name.column, name.text);
        if (at_keyword("as")) {
            take();
            alias->extra = expect_name().text;
        }
        node->add(std::move(alias));
        if (!at_op(",")) break;
        take();
        if (paren && at_op(")")) break;
        if (!paren && !at_name()) {
            fail("trailing comma not allowed without surrounding parentheses");
        }
    }
    if (paren) expect_op(")");
    return node;
}

void Parser::parse_block(std::vector<NodePtr>& out) {
    if (!at_type(TokenType::Newline)) {
        parse_simple_statements(out);
        return;
    }
    take();
    if (!at_type(TokenType::Indent)) {
        fail("expected an indented block");
    }
    take();
    while (!at_type(TokenType::Dedent) && !at_type(TokenType::EndMarker)) {
        if (at_type(TokenType::Newline)) {
            take();
            continue;
        }
        if (at_type(TokenType::Indent)) {
            fail("unexpected indent");
        }
        parse_statement(out);
    }
    if (at_type(TokenType::Dedent)) take();
}

NodePtr Parser::parse_decorated() {
    std::vector<NodePtr> decorators;
    while (at_op("@")) {
        take();
        decorators.push_back(parse_named_expression());
        if (!at_type(TokenType::Newline)) {
            fail("invalid syntax");
        }
        take();
    }
    Token start = cur();
    if (at_keyword("def")) return parse_function_def(decorators, false, start);
    if (at_keyword("class")) return parse_class_def(decorators, start);
    if (at_keyword("async")) return parse_async(decorators);
    fail("invalid syntax");
}

NodePtr Parser::parse_function_def(std::vector<NodePtr>& decorators, bool is_async, const Token& start) {
    take(); // def
    Token name = expect_name();
    NodePtr fn = make_node(is_async ? NodeKind::AsyncFunctionDef : NodeKind::FunctionDef,
                           start.line, start.column, name.text);
    for (size_t i = 0; i < decorators.size(); ++i) {
        fn->add(std::move(decorators[i]));
    }
    expect_op("(");
    fn->add(parse_parameters(")", true));
    expect_op(")");
    if (at_op("->")) {
        take();
        fn->add(parse_expression());
    }
    expect_op(":");
    parse_block(fn->children);
    return fn;
}

NodePtr Parser::parse_class_def(std::vector<NodePtr>& decorators, const Token& start) {
    take(); // class
    Token name = expect_name();
    NodePtr cls = make_node(NodeKind::ClassDef, start.line, start.column, name.text);
    for (size_t i = 0; i < decorators.size(); ++i) {
        cls->add(std::move(decorators[i]));
    }
    if (at_op("(")) {
        take();
        parse_call_arguments(cls.get());
        expect_op(")");
    }
    expect_op(":");
    parse_block(cls->children);
    return cls;
}

NodePtr Parser::parse_if() {
    Token tok = take(); // if / elif
    NodePtr node = make_node(NodeKind::If, tok.line, tok.column);
    node->add(parse_named_expression());
    expect_op(":");
    parse_block(node->children);
    if (at_keyword("elif")) {
        node->add(parse_if());
    } else if (at_keyword("else")) {
        take();
        expect_op(":");
        parse_block(node->children);
    }
    return node;
}

NodePtr Parser::parse_while() {
    Token tok = take();
    NodePtr node = make_node(NodeKind::While, tok.line, tok.column);
    node->add(parse_named_expression());
    expect_op(":");
    parse_block(node->children);
    if (at_keyword("else")) {
        take();
        expect_op(":");
        parse_block(node->children);
    }
    return node;
}

NodePtr Parser::parse_for(bool is_async, const Token& start) {
    take(); // for
    NodePtr node = make_node(is_async ? NodeKind::AsyncFor : NodeKind::For, start.line, start.column);
    NodePtr target = parse_target_list();
    check_target(target.get(), "assign to");
    node->add(std::move(target));
    expect_keyword("in");
    node->add(parse_star_expressions());
    expect_op(":");
    parse_block(node->children);
    if (at_keyword("else")) {
        take();
        expect_op(":");
        parse_block(node->children);
    }
    return node;
}

NodePtr Parser::parse_try() {
    Token tok = take();
    expect_op(":");
    NodePtr node = make_node(NodeKind::Try, tok.line, tok.column);
    parse_block(node->children);

    bool saw_plain = false;
    bool saw_star = false;
    while (at_keyword("except")) {
        Token ex = take();
        bool star = false;
        if (at_op("*")) {
            take();
            star = true;
        }
        if ((star && saw_plain) || (!star && saw_star)) {
            fail_at("cannot have both 'except' and 'except*' on the same 'try'", ex.line, ex.column);
        }
        saw_star = saw_star || star;
        saw_plain = saw_plain || !star;

        NodePtr handler = make_node(NodeKind::ExceptHandler, ex.line, ex.column);
        if (!at_op(":")) {
            handler->add(parse_expression());
            if (at_op(",")) {
                fail("multiple exception types must be parenthesized");
            }
            if (at_keyword("as")) {
                take();
                handler->value = expect_name().text;
            }
        } else if (star) {
            fail("expected one or more exception types");
        }
        expect_op(":");
        parse_block(handler->children);
        node->add(std::move(handler));
    }

    bool has_handlers = saw_plain || saw_star;
    if (has_handlers && at_keyword("else")) {
        take();
        expect_op(":");
        parse_block(node->children);
    }
    if (at_keyword("finally")) {
        take();
        expect_op(":");
        parse_block(node->children);
    } else if (!has_handlers) {
        fail("expected 'except' or 'finally' block");
    }

    if (saw_star) {
        node->kind = NodeKind::TryStar;
    }
    return node;
}

bool Parser::parenthesized_with_items() const {
    int depth = 0;
    for (size_t i = pos_; i < tokens_.size(); ++i) {
        const Token& t = tokens_[i];
        if (t.type == TokenType::Newline || t.type == TokenType::EndMarker) return false;
        if (t.type != TokenType::Op) continue;
        if (t.text == "(" || t.text == "[" || t.text == "{") {
            ++depth;
        } else if (t.text == ")" || t.text == "]" || t.text == "}") {
            if (--depth == 0) {
                const Token& next = i + 1 < tokens_.size() ? tokens_[i + 1] : tokens_.back();
                return next.type == TokenType::Op && next.text == ":";
            }
        }
    }
    return false;
}

NodePtr Parser::parse_with_item() {
    Token start = cur();
    NodePtr item = make_node(NodeKind::WithItem, start.line, start.column);
    item->add(parse_expression());
    if (at_keyword("as")) {
        take();
        NodePtr target = parse_star_target();
        check_target(target.get(), "assign to");
        item->add(std::move(target));
    }
    return item;
}

NodePtr Parser::parse_with(bool is_async, const Token& start) {
    take(); // with
    NodePtr node = make_node(is_async ? NodeKind::AsyncWith : NodeKind::With, start.line, start.column);
    if (at_op("(") && parenthesized_with_items()) {
        take();
        while (true) {
            node->add(parse_with_item());
            if (!at_op(",")) break;
            take();
            if (at_op(")")) break;
        }
        expect_op(")");
    } else {
        while (true) {
            node->add(parse_with_item());
            if (!at_op(",")) break;
            take();
        }
    }
    expect_op(":");
    parse_block(node->children);
    return node;
}

NodePtr Parser::parse_async(std::vector<NodePtr>& decorators) {
    Token start = take(); // async
    if (at_keyword("def")) return parse_function_def(decorators, true, start);
    if (!decorators.empty()) fail("invalid syntax");
    if (at_keyword("for")) return parse_for(true, start);
    if (at_keyword("with")) return parse_with(true, start);
    fail("invalid syntax");
}

NodePtr Parser::parse_parameters(const char* closing, bool annotations) {
    Token start = cur();
    NodePtr args = make_node(NodeKind::Arguments, start.line, start.column);
    bool seen_star = false;
    bool seen_kwarg = false;
    bool seen_default = false;

    while (!at_op(closing)) {
        if (seen_kwarg) {
            fail("arguments cannot follow var-keyword argument");
        }
        if (at_op("/")) {
            if (args->children.empty() || seen_star) {
                fail("/ must be ahead of *");
            }
            take();
            for (size_t i = 0; i < args->children.size(); ++i) {
                args->children[i]->extra = "posonly";
            }
        } else if (at_op("*")) {
            if (seen_star) fail("* argument may appear only once");
            take();
            seen_star = true;
            if (at_name()) {
                Token name = take();
                NodePtr arg = make_node(NodeKind::Arg, name.line, name.column, name.text);
                arg->extra = "vararg";
                if (annotations && at_op(":")) {
                    take();
                    arg->add(parse_star_expression());
                }
                args->add(std::move(arg));
            }
        } else if (at_op("**")) {
            take();
            Token name = expect_name();
            NodePtr arg = make_node(NodeKind::Arg, name.line, name.column, name.text);
            arg->extra = "kwarg";
            if (annotations && at_op(":")) {
                take();
                arg->add(parse_expression());
            }
            args->add(std::move(arg));
            seen_kwarg = true;
        } else {
            Token name = expect_name();
            NodePtr arg = make_node(NodeKind::Arg, name.line, name.column, name.text);
            if (seen_star) arg->extra = "kwonly";
            if (annotations && at_op(":")) {
                take();
                arg->add(parse_expression());
            }
            if (at_op("=")) {
                take();
                arg->add(parse_expression());
                seen_default = true;
            } else if (seen_default && !seen_star) {
                fail_at("non-default argument follows default argument", name.line, name.column);
            }
            args->add(std::move(arg));
        }
        if (!at_op(",")) break;
        take();
    }
    return args;
}

// ============================================================================
// Match statement
// ============================================================================

bool Parser::is_match_statement() const {
    const Token& next = peek_tok(1);
    if (next.type == TokenType::Newline || next.type == TokenType::EndMarker ||
        next.type == TokenType::Indent || next.type == TokenType::Dedent) {
        return false;
    }
    if (next.type == TokenType::Op && in_list(kNotMatchSubjectStart, next.text)) {
        return false;
    }
    if (next.type == TokenType::Name && is_keyword(next.text) && next.text != "not" &&
        next.text != "lambda" && next.text != "await" && next.text != "None" &&
        next.text != "True" && next.text != "False") {
        return false;
    }

    int depth = 0;
    const Token* last = nullptr;
    for (size_t i = pos_ + 1; i < tokens_.size(); ++i) {
        const Token& t = tokens_[i];
        if (t.type == TokenType::Newline || t.type == TokenType::EndMarker) break;
        if (t.type == TokenType::Op) {
            if (t.text == "(" || t.text == "[" || t.text == "{") ++depth;
            else if (t.text == ")" || t.text == "]" || t.text == "}") --depth;
        }
        last = &t;
    }
    return depth == 0 && last != nullptr && last->type == TokenType::Op && last->text == ":";
}

NodePtr Parser::parse_match() {
    Token tok = take(); // match
    NodePtr node = make_node(NodeKind::Match, tok.line, tok.column);

    NodePtr subject = parse_star_named_expression();
    if (at_op(",")) {
        NodePtr tuple = make_node(NodeKind::Tuple, subject->line, subject->column);
        tuple->add(std::move(subject));
        while (at_op(",")) {
            take();
            if (at_op(":")) break;
            tuple->add(parse_star_named_expression());
        }
        subject = std::move(tuple);
    }
    node->add(std::move(subject));

    expect_op(":");
    if (!at_type(TokenType::Newline)) fail("invalid syntax");
    take();
    if (!at_type(TokenType::Indent)) fail("expected an indented block");
    take();
    while (!at_type(TokenType::Dedent) && !at_type(TokenType::EndMarker)) {
        if (!at_soft_keyword("case")) {
            fail("expected 'case' block");
        }
        node->add(parse_case());
    }
    if (at_type(TokenType::Dedent)) take();
    return node;
}

NodePtr Parser::parse_case() {
    Token tok = take(); // case
    NodePtr node = make_node(NodeKind::MatchCase, tok.line, tok.column);
    node->add(parse_open_sequence_pattern());
    if (at_keyword("if")) {
        take();
        node->add(parse_named_expression());
    }
    expect_op(":");
    parse_block(node->children);
    return node;
}

NodePtr Parser::parse_open_sequence_pattern() {
    NodePtr first = parse_maybe_star_pattern();
    if (!at_op(",")) return first;

    NodePtr seq = make_node(NodeKind::MatchSequence, first->line, first->column);
    seq->add(std::move(first));
    while (at_op(",")) {
        take();
        if (at_op(":") || at_keyword("if")) break;
        seq->add(parse_maybe_star_pattern());
    }
    return seq;
}

NodePtr Parser::parse_maybe_star_pattern() {
    if (at_op("*")) {
        Token star = take();
        Token name = expect_name();
        return make_node(NodeKind::MatchStar, star.line, star.column,
                         name.text == "_" ? "" : name.text);
    }
    return parse_as_pattern();
}

NodePtr Parser::parse_as_pattern() {
    NodePtr pattern = parse_or_pattern();
    if (!at_keyword("as")) return pattern;
    take();
    Token name = expect_name();
    if (name.text == "_") {
        fail_at("cannot use '_' as a target", name.line, name.column);
    }
    NodePtr as = make_node(NodeKind::MatchAs, pattern->line, pattern->column, name.text);
    as->add(std::move(pattern));
    return as;
}

NodePtr Parser::parse_or_pattern() {
    NodePtr first = parse_closed_pattern();
    if (!at_op("|")) return first;
    NodePtr alt = make_node(NodeKind::MatchOr, first->line, first->column);
    alt->add(std::move(first));
    while (at_op("|")) {
        take();
        alt->add(parse_closed_pattern());
    }
    return alt;
}

NodePtr Parser::parse_signed_number() {
    Token start = cur();
    NodePtr value;
    if (at_op("-")) {
        take();
        if (!at_type(TokenType::Number)) fail("invalid syntax");
        Token num = take();
        value = make_node(NodeKind::UnaryOp, start.line, start.column, "-");
        NodePtr c = make_node(NodeKind::Constant, num.line, num.column, num.text);
        c->extra = "number";
        value->add(std::move(c));
    } else {
        Token num = take();
        value = make_node(NodeKind::Constant, num.line, num.column, num.text);
        value->extra = "number";
    }
    if ((at_op("+") || at_op("-")) && peek_tok(1).type == TokenType::Number) {
        Token op = take();
        Token imag = take();
        NodePtr sum = make_node(NodeKind::BinOp, start.line, start.column, op.text);
        sum->add(std::move(value));
        NodePtr c = make_node(NodeKind::Constant, imag.line, imag.column, imag.text);
        c->extra = "number";
        sum->add(std::move(c));
        value = std::move(sum);
    }
    return value;
}

NodePtr Parser::parse_closed_pattern() {
    DepthGuard guard(*this);
    Token t = cur();

    if (t.type == TokenType::Number || (t.type == TokenType::Op && t.text == "-")) {
        NodePtr value = make_node(NodeKind::MatchValue, t.line, t.column);
        value->add(parse_signed_number());
        return value;
    }
    if (t.type == TokenType::String) {
        NodePtr value = make_node(NodeKind::MatchValue, t.line, t.column);
        value->add(parse_strings());
        return value;
    }
    if (t.type == TokenType::Name && (t.text == "None" || t.text == "True" || t.text == "False")) {
        take();
        return make_node(NodeKind::MatchSingleton, t.line, t.column, t.text);
    }
    if (t.type == TokenType::Name && !is_keyword(t.text)) {
        const Token& next = peek_tok(1);
        bool next_dot = next.type == TokenType::Op && next.text == ".";
        bool next_paren = next.type == TokenType::Op && next.text == "(";
        if (t.text == "_" && !next_dot && !next_paren) {
            take();
            return make_node(NodeKind::MatchAs, t.line, t.column, "");
        }
        take();
        NodePtr expr = make_node(NodeKind::Name, t.line, t.column, t.text);
        bool dotted = false;
        while (at_op(".")) {
            take();
            Token attr = expect_name();
            NodePtr a = make_node(NodeKind::Attribute, attr.line, attr.column, attr.text);
            a->add(std::move(expr));
            expr = std::move(a);
            dotted = true;
        }
        if (at_op("(")) {
            return parse_class_pattern(std::move(expr));
        }
        if (dotted) {
            NodePtr value = make_node(NodeKind::MatchValue, t.line, t.column);
            value->add(std::move(expr));
            return value;
        }
        return make_node(NodeKind::MatchAs, t.line, t.column, t.text);
    }
    if (t.type == TokenType::Op && t.text == "(") {
        take();
        if (at_op(")")) {
            take();
            return make_node(NodeKind::MatchSequence, t.line, t.column);
        }
        NodePtr first = parse_maybe_star_pattern();
        if (!at_op(",")) {
            expect_op(")");
            return first;
        }
        NodePtr seq = make_node(NodeKind::MatchSequence, t.line, t.column);
        seq->add(std::move(first));
        while (at_op(",")) {
            take();
            if (at_op(")")) break;
            seq->add(parse_maybe_star_pattern());
        }
        expect_op(")");
        return seq;
    }
    if (t.type == TokenType::Op && t.text == "[") {
        take();
        NodePtr seq = make_node(NodeKind::MatchSequence, t.line, t.column);
        while (!at_op("]")) {
            seq->add(parse_maybe_star_pattern());
            if (!at_op(",")) break;
            take();
        }
        expect_op("]");
        return seq;
    }
    if (t.type == TokenType::Op && t.text == "{") {
        return parse_mapping_pattern();
    }
    fail("invalid syntax");
}

NodePtr Parser::parse_mapping_pattern() {
    Token open = take(); // {
    NodePtr mapping = make_node(NodeKind::MatchMapping, open.line, open.column);
    while (!at_op("}")) {
        if (at_op("**")) {
            take();
            Token name = expect_name();
            NodePtr rest = make_node(NodeKind::MatchAs, name.line, name.column, name.text);
            rest->extra = "rest";
            mapping->add(std::move(rest));
        } else {
            Token k = cur();
            NodePtr key;
            if (k.type == TokenType::Name && (k.text == "None" || k.text == "True" || k.text == "False")) {
                take();
                key = make_node(NodeKind::Constant, k.line, k.column, k.text);
                key->extra = k.text;
            } else if (k.type == TokenType::Name && !is_keyword(k.text)) {
                take();
                key = make_node(NodeKind::Name, k.line, k.column, k.text);
                while (at_op(".")) {
                    take();
                    Token attr = expect_name();
                    NodePtr a = make_node(NodeKind::Attribute, attr.line, attr.column, attr.text);
                    a->add(std::move(key));
                    key = std::move(a);
                }
            } else if (k.type == TokenType::String) {
                key = parse_strings();
            } else if (k.type == TokenType::Number || (k.type == TokenType::Op && k.text == "-")) {
                key = parse_signed_number();
            } else {
                fail("invalid syntax");
            }
            expect_op(":");
            mapping->add(std::move(key));
            mapping->add(parse_as_pattern());
        }
        if (!at_op(",")) break;
        take();
    }
    expect_op("}");
    return mapping;
}

NodePtr Parser::parse_class_pattern(NodePtr cls) {
    NodePtr node = make_node(NodeKind::MatchClass, cls->line, cls->column);
    node->add(std::move(cls));
    take(); // (
    while (!at_op(")")) {
        if (at_name() && peek_tok(1).type == TokenType::Op && peek_tok(1).text == "=") {
            Token name = take();
            take();
            NodePtr kw = make_node(NodeKind::Keyword, name.line, name.column, name.text);
            kw->add(parse_as_pattern());
            node->add(std::move(kw));
        } else {
            node->add(parse_as_pattern());
        }
        if (!at_op(",")) break;
        take();
    }
    expect_op(")");
    return node;
}

// ============================================================================
// Expressions
// ============================================================================

NodePtr Parser::parse_star_expressions() {
    NodePtr first = parse_star_expression();
    if (!at_op(",")) return first;

    NodePtr tuple = make_node(NodeKind::Tuple, first->line, first->column);
    tuple->add(std::move(first));
    while (at_op(",")) {
        take();
        if (!can_start_expression() && !at_op("*")) break;
        tuple->add(parse_star_expression());
    }
    return tuple;
}

NodePtr Parser::parse_star_expression() {
    if (at_op("*")) {
        Token star = take();
        NodePtr node = make_node(NodeKind::Starred, star.line, star.column);
        node->add(parse_bitwise_or());
        return node;
    }
    return parse_expression();
}

NodePtr Parser::parse_star_named_expression() {
    if (at_op("*")) {
        Token star = take();
        NodePtr node = make_node(NodeKind::Starred, star.line, star.column);
        node->add(parse_bitwise_or());
        return node;
    }
    return parse_named_expression();
}

NodePtr Parser::parse_named_expression() {
    if (at_name() && peek_tok(1).type == TokenType::Op && peek_tok(1).text == ":=") {
        Token name = take();
        take();
        NodePtr node = make_node(NodeKind::NamedExpr, name.line, name.column);
        node->add(make_node(NodeKind::Name, name.line, name.column, name.text));
        node->add(parse_expression());
        return node;
    }
    return parse_expression();
}

NodePtr Parser::parse_expression() {
    DepthGuard guard(*this);
    if (at_keyword("lambda")) {
        return parse_lambda();
    }
    NodePtr body = parse_disjunction();
    if (!at_keyword("if")) return body;

    take();
    NodePtr node = make_node(NodeKind::IfExp, body->line, body->column);
    node->add(std::move(body));
    node->add(parse_disjunction());
    expect_keyword("else");
    node->add(parse_expression());
    return node;
}

NodePtr Parser::parse_lambda() {
    Token tok = take();
    NodePtr node = make_node(NodeKind::Lambda, tok.line, tok.column);
    node->add(parse_parameters(":", false));
    expect_op(":");
    node->add(parse_expression());
    return node;
}

NodePtr Parser::parse_disjunction() {
    NodePtr first = parse_conjunction();
    if (!at_keyword("or")) return first;
    NodePtr node = make_node(NodeKind::BoolOp, first->line, first->column, "or");
    node->add(std::move(first));
    while (at_keyword("or")) {
        take();
        node->add(parse_conjunction());
    }
    return node;
}

NodePtr Parser::parse_conjunction() {
    NodePtr first = parse_inversion();
    if (!at_keyword("and")) return first;
    NodePtr node = make_node(NodeKind::BoolOp, first->line, first->column, "and");
    node->add(std::move(first));
    while (at_keyword("and")) {
        take();
        node->add(parse_inversion());
    }
    return node;
}

NodePtr Parser::parse_inversion() {
    if (at_keyword("not")) {
        DepthGuard guard(*this);
        Token tok = take();
        NodePtr node = make_node(NodeKind::UnaryOp, tok.line, tok.column, "not");
        node->add(parse_inversion());
        return node;
    }
    return parse_comparison();
}

NodePtr Parser::parse_comparison() {
    NodePtr first = parse_bitwise_or();
    std::vector<std::string> ops;
    NodePtr node;

    while (true) {
        std::string op;
        const Token& t = cur();
        if (t.type == TokenType::Op &&
            (t.text == "<" || t.text == ">" || t.text == "==" || t.text == ">=" ||
             t.text == "<=" || t.text == "!=")) {
            op = t.text;
            take();
        } else if (at_keyword("in")) {
            op = "in";
            take();
        } else if (at_keyword("not") && peek_tok(1).type == TokenType::Name && peek_tok(1).text == "in") {
            op = "not in";
            take();
            take();
        } else if (at_keyword("is")) {
            take();
            op = "is";
            if (at_keyword("not")) {
                take();
                op = "is not";
            }
        } else {
            break;
        }

        if (!node) {
            node = make_node(NodeKind::Compare, first->line, first->column);
            node->add(std::move(first));
        }
        ops.push_back(op);
        node->add(parse_bitwise_or());
    }

    if (!node) return first;
    for (size_t i = 0; i < ops.size(); ++i) {
        if (i) node->value += ",";
        node->value += ops[i];
    }
    return node;
}

NodePtr Parser::parse_bitwise_or() {
    return parse_binary(0);
}

NodePtr Parser::parse_binary(int level) {
    if (level >= kBinaryLevelCount) {
        return parse_factor();
    }
    NodePtr left = parse_binary(level + 1);
    while (cur().type == TokenType::Op && in_list(kBinaryLevels[level], cur().text)) {
        Token op = take();
        NodePtr node = make_node(NodeKind::BinOp, left->line, left->column, op.text);
        node->add(std::move(left));
        node->add(parse_binary(level + 1));
        left = std::move(node);
    }
    return left;
}

NodePtr Parser::parse_factor() {
    DepthGuard guard(*this);
    if (at_op("+") || at_op("-") || at_op("~")) {
        Token op = take();
        NodePtr node = make_node(NodeKind::UnaryOp, op.line, op.column, op.text);
        node->add(parse_factor());
        return node;
    }
    return parse_power();
}

NodePtr Parser::parse_power() {
    NodePtr base = parse_await_primary();
    if (!at_op("**")) return base;
    take();
    NodePtr node = make_node(NodeKind::BinOp, base->line, base->column, "**");
    node->add(std::move(base));
    node->add(parse_factor());
    return node;
}

NodePtr Parser::parse_await_primary() {
    if (at_keyword("await")) {
        Token tok = take();
        NodePtr node = make_node(NodeKind::Await, tok.line, tok.column);
        node->add(parse_primary());
        return node;
    }
    return parse_primary();
}

NodePtr Parser::parse_primary() {
    NodePtr node = parse_atom();
    while (true) {
        if (at_op(".")) {
            take();
            Token attr = expect_name();
            NodePtr a = make_node(NodeKind::Attribute, attr.line, attr.column, attr.text);
            a->add(std::move(node));
            node = std::move(a);
        } else if (at_op("(")) {
            take();
            NodePtr call = make_node(NodeKind::Call, node->line, node->column);
            call->add(std::move(node));
            parse_call_arguments(call.get());
            expect_op(")");
            node = std::move(call);
        } else if (at_op("[")) {
            take();
            NodePtr sub = make_node(NodeKind::Subscript, node->line, node->column);
            sub->add(std::move(node));
            sub->add(parse_slices());
            expect_op("]");
            node = std::move(sub);
        } else {
            break;
        }
    }
    return node;
}

NodePtr Parser::parse_atom() {
    const Token& t = cur();
    switch (t.type) {
        case TokenType::Name: {
            if (t.text == "True" || t.text == "False" || t.text == "None") {
                Token tok = take();
                NodePtr c = make_node(NodeKind::Constant, tok.line, tok.column, tok.text);
                c->extra = tok.text;
                return c;
            }
            if (is_keyword(t.text)) {
                fail("invalid syntax");
            }
            Token tok = take();
            return make_node(NodeKind::Name, tok.line, tok.column, tok.text);
        }
        case TokenType::Number: {
            Token tok = take();
            NodePtr c = make_node(NodeKind::Constant, tok.line, tok.column, tok.text);
            c->extra = "number";
            return c;
        }
        case TokenType::String:
            return parse_strings();
        case TokenType::Op:
            if (t.text == "...") {
                Token tok = take();
                NodePtr c = make_node(NodeKind::Constant, tok.line, tok.column, "...");
                c->extra = "Ellipsis";
                return c;
            }
            if (t.text == "(") return parse_paren();
            if (t.text == "[") return parse_list();
            if (t.text == "{") return parse_brace();
            break;
        default:
            break;
    }
    fail("invalid syntax");
}

NodePtr Parser::parse_paren() {
    Token open = take();
    if (at_op(")")) {
        take();
        return make_node(NodeKind::Tuple, open.line, open.column);
    }
    if (at_keyword("yield")) {
        NodePtr y = parse_yield_expression();
        expect_op(")");
        return y;
    }

    NodePtr first = parse_star_named_expression();
    if (at_comprehension()) {
        NodePtr gen = make_node(NodeKind::GeneratorExp, open.line, open.column);
        gen->add(std::move(first));
        parse_comprehension_clauses(gen.get());
        expect_op(")");
        return gen;
    }
    if (at_op(",")) {
        NodePtr tuple = make_node(NodeKind::Tuple, open.line, open.column);
        tuple->add(std::move(first));
        while (at_op(",")) {
            take();
            if (at_op(")")) break;
            tuple->add(parse_star_named_expression());
        }
        expect_op(")");
        return tuple;
    }
    expect_op(")");
    return first;
}

NodePtr Parser::parse_list() {
    Token open = take();
    if (at_op("]")) {
        take();
        return make_node(NodeKind::List, open.line, open.column);
    }
    NodePtr first = parse_star_named_expression();
    if (at_comprehension()) {
        NodePtr comp = make_node(NodeKind::ListComp, open.line, open.column);
        comp->add(std::move(first));
        parse_comprehension_clauses(comp.get());
        expect_op("]");
        return comp;
    }
    NodePtr list = make_node(NodeKind::List, open.line, open.column);
    list->add(std::move(first));
    while (at_op(",")) {
        take();
        if (at_op("]")) break;
        list->add(parse_star_named_expression());
    }
    expect_op("]");
    return list;
}

NodePtr Parser::parse_brace() {
    Token open = take();
    if (at_op("}")) {
        take();
        return make_node(NodeKind::Dict, open.line, open.column);
    }

    if (at_op("**")) {
        Token star = take();
        NodePtr unpack = make_node(NodeKind::Starred, star.line, star.column);
        unpack->extra = "**";
        unpack->add(parse_bitwise_or());
        NodePtr dict = make_node(NodeKind::Dict, open.line, open.column);
        dict->add(std::move(unpack));
        parse_dict_rest(dict.get());
        return dict;
    }

    NodePtr first = parse_star_named_expression();
    if (at_op(":")) {
        if (first->kind == NodeKind::Starred) {
            fail_at("cannot use a starred expression in a dictionary key", first->line, first->column);
        }
        take();
        NodePtr value = parse_expression();
        if (at_comprehension()) {
            NodePtr comp = make_node(NodeKind::DictComp, open.line, open.column);
            comp->add(std::move(first));
            comp->add(std::move(value));
            parse_comprehension_clauses(comp.get());
            expect_op("}");
            return comp;
        }
        NodePtr dict = make_node(NodeKind::Dict, open.line, open.column);
        dict->add(std::move(first));
        dict->add(std::move(value));
        parse_dict_rest(dict.get());
        return dict;
    }

    if (at_comprehension()) {
        NodePtr comp = make_node(NodeKind::SetComp, open.line, open.column);
        comp->add(std::move(first));
        parse_comprehension_clauses(comp.get());
        expect_op("}");
        return comp;
    }
    NodePtr set = make_node(NodeKind::Set, open.line, open.column);
    set->add(std::move(first));
    while (at_op(",")) {
        take();
        if (at_op("}")) break;
        set->add(parse_star_named_expression());
    }
    expect_op("}");
    return set;
}

void Parser::parse_dict_rest(Node* dict) {
    while (at_op(",")) {
        take();
        if (at_op("}")) break;
        if (at_op("**")) {
            Token star = take();
            NodePtr unpack = make_node(NodeKind::Starred, star.line, star.column);
            unpack->extra = "**";
            unpack->add(parse_bitwise_or());
            dict->add(std::move(unpack));
            continue;
        }
        dict->add(parse_expression());
        expect_op(":");
        dict->add(parse_expression());
    }
    expect_op("}");
}

void Parser::parse_call_arguments(Node* call) {
    bool seen_keyword = false;
    while (!at_op(")")) {
        if (at_op("*")) {
            Token star = take();
            NodePtr node = make_node(NodeKind::Starred, star.line, star.column);
            node->add(parse_expression());
            call->add(std::move(node));
        } else if (at_op("**")) {
            Token star = take();
            NodePtr kw = make_node(NodeKind::Keyword, star.line, star.column);
            kw->add(parse_expression());
            call->add(std::move(kw));
            seen_keyword = true;
        } else if (at_name() && peek_tok(1).type == TokenType::Op && peek_tok(1).text == "=") {
            Token name = take();
            take();
            NodePtr kw = make_node(NodeKind::Keyword, name.line, name.column, name.text);
            kw->add(parse_expression());
            call->add(std::move(kw));
            seen_keyword = true;
        } else {
            if (seen_keyword) {
                fail("positional argument follows keyword argument");
            }
            NodePtr arg = parse_named_expression();
            if (at_comprehension()) {
                NodePtr gen = make_node(NodeKind::GeneratorExp, arg->line, arg->column);
                gen->add(std::move(arg));
                parse_comprehension_clauses(gen.get());
                arg = std::move(gen);
            }
            call->add(std::move(arg));
        }
        if (!at_op(",")) break;
        take();
    }
}

NodePtr Parser::parse_slices() {
    NodePtr first = parse_slice();
    if (!at_op(",")) return first;
    NodePtr tuple = make_node(NodeKind::Tuple, first->line, first->column);
    tuple->add(std::move(first));
    while (at_op(",")) {
        take();
        if (at_op("]")) break;
        tuple->add(parse_slice());
    }
    return tuple;
}

NodePtr Parser::parse_slice() {
    Token start = cur();
    if (at_op("*")) {
        Token star = take();
        NodePtr node = make_node(NodeKind::Starred, star.line, star.column);
        node->add(parse_bitwise_or());
        return node;
    }

    NodePtr lower;
    if (!at_op(":")) {
        lower = parse_named_expression();
        if (!at_op(":")) return lower;
    }

    NodePtr slice = make_node(NodeKind::Slice, start.line, start.column);
    if (lower) {
        slice->add(std::move(lower));
        slice->extra += "l";
    }
    take(); // :
    if (!at_op(":") && !at_op("]") && !at_op(",")) {
        slice->add(parse_expression());
        slice->extra += "u";
    }
    if (at_op(":")) {
        take();
        if (!at_op("]") && !at_op(",")) {
            slice->add(parse_expression());
            slice->extra += "s";
        }
    }
    return slice;
}

void Parser::parse_comprehension_clauses(Node* comp) {
    do {
        Token start = cur();
        NodePtr clause = make_node(NodeKind::Comprehension, start.line, start.column);
        if (at_keyword("async")) {
            take();
            clause->extra = "async";
        }
        expect_keyword("for");
        NodePtr target = parse_target_list();
        check_target(target.get(), "assign to");
        clause->add(std::move(target));
        expect_keyword("in");
        clause->add(parse_disjunction());
        while (at_keyword("if")) {
            take();
            clause->add(parse_disjunction());
        }
        comp->add(std::move(clause));
    } while (at_comprehension());
}

NodePtr Parser::parse_yield_expression() {
    Token tok = take(); // yield
    if (at_keyword("from")) {
        take();
        NodePtr node = make_node(NodeKind::YieldFrom, tok.line, tok.column);
        node->add(parse_expression());
        return node;
    }
    NodePtr node = make_node(NodeKind::Yield, tok.line, tok.column);
    if (can_start_expression() || at_op("*")) {
        node->add(parse_star_expressions());
    }
    return node;
}

NodePtr Parser::parse_target_list() {
    NodePtr first = parse_star_target();
    if (!at_op(",")) return first;
    NodePtr tuple = make_node(NodeKind::Tuple, first->line, first->column);
    tuple->add(std::move(first));
    while (at_op(",")) {
        take();
        if (!can_start_expression() && !at_op("*")) break;
        tuple->add(parse_star_target());
    }
    return tuple;
}

NodePtr Parser::parse_star_target() {
    if (at_op("*")) {
        Token star = take();
        NodePtr node = make_node(NodeKind::Starred, star.line, star.column);
        node->add(parse_star_target());
        return node;
    }
    return parse_bitwise_or();
}

void Parser::check_target(const Node* node, const char* verb) const {
    switch (node->kind) {
        case NodeKind::Name:
        case NodeKind::Attribute:
        case NodeKind::Subscript:
            return;
        case NodeKind::Tuple:
        case NodeKind::List:
            for (size_t i = 0; i < node->children.size(); ++i) {
                check_target(node->children[i].get(), verb);
            }
            return;
        case NodeKind::Starred:
            if (!node->children.empty() && node->extra.empty()) {
                check_target(node->children[0].get(), verb);
                return;
            }
            break;
        default:
            break;
    }
    std::string msg = "cannot ";
    msg += verb;
    msg += " ";
    msg += describe_expression(node->kind);
    fail_at(msg, node->line, node->column);
}

// ============================================================================
// Strings
// ============================================================================

NodePtr Parser::parse_strings() {
    Token first = cur();
    std::vector<Token> parts;
    bool any_f = false;
    bool any_bytes = false;
    bool any_text = false;
    while (at_type(TokenType::String)) {
        Token t = take();
        if (t.prefix.find('b') != std::string::npos) any_bytes = true;
        else any_text = true;
        if (t.prefix.find('f') != std::string::npos) any_f = true;
        parts.push_back(t);
    }
    if (any_bytes && any_text) {
        fail_at("cannot mix bytes and nonbytes literals", first.line, first.column);
    }

    if (!any_f) {
        NodePtr c = make_node(NodeKind::Constant, first.line, first.column);
        c->extra = any_bytes ? "bytes" : "str";
        for (size_t i = 0; i < parts.size(); ++i) {
            bool raw = parts[i].prefix.find('r') != std::string::npos;
            c->value += decode_string_body(parts[i].body, raw, any_bytes);
        }
        return c;
    }

    NodePtr joined = make_node(NodeKind::JoinedStr, first.line, first.column);
    for (size_t i = 0; i < parts.size(); ++i) {
        const Token& t = parts[i];
        bool raw = t.prefix.find('r') != std::string::npos;
        if (t.prefix.find('f') != std::string::npos) {
            parse_fstring_into(joined.get(), t.body, 0, raw, t);
        } else if (!t.body.empty()) {
            NodePtr c = make_node(NodeKind::Constant, t.line, t.column, decode_string_body(t.body, raw, false));
            c->extra = "str";
            joined->add(std::move(c));
        }
    }
    return joined;
}

void Parser::body_position(const Token& tok, size_t index, int& line, int& column) const {
    size_t quote_len = (tok.text.size() - tok.prefix.size() - tok.body.size()) / 2;
    line = tok.line;
    column = tok.column + static_cast<int>(tok.prefix.size() + quote_len);
    for (size_t i = 0; i < index && i < tok.body.size(); ++i) {
        if (tok.body[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
}

void Parser::parse_fstring_into(Node* joined, const std::string& body, size_t offset,
                                bool raw, const Token& tok) {
    std::string literal;
    size_t literal_start = 0;

    auto flush = [&]() {
        if (literal.empty()) return;
        int line, column;
        body_position(tok, offset + literal_start, line, column);
        NodePtr c = make_node(NodeKind::Constant, line, column, decode_string_body(literal, raw, false));
        c->extra = "str";
        joined->add(std::move(c));
        literal.clear();
    };

    size_t i = 0;
    const size_t n = body.size();
    while (i < n) {
        if (literal.empty()) literal_start = i;
        char c = body[i];
        if (c == '{') {
            if (i + 1 < n && body[i + 1] == '{') {
                literal += '{';
                i += 2;
                continue;
            }
            flush();
            i = parse_fstring_field(joined, body, i, offset, raw, tok);
            continue;
        }
        if (c == '}') {
            if (i + 1 < n && body[i + 1] == '}') {
                literal += '}';
                i += 2;
                continue;
            }
            int line, column;
            body_position(tok, offset + i, line, column);
            fail_at("f-string: single '}' is not allowed", line, column);
        }
        if (c == '\\' && !raw && i + 1 < n) {
            if (body[i + 1] == 'N' && i + 2 < n && body[i + 2] == '{') {
                size_t close = body.find('}', i + 3);
                if (close != std::string::npos) {
                    literal.append(body, i, close - i + 1);
                    i = close + 1;
                    continue;
                }
            }
            literal += c;
            literal += body[i + 1];
            i += 2;
            continue;
        }
        literal += c;
        ++i;
    }
    flush();
}

size_t Parser::parse_fstring_field(Node* joined, const std::string& body, size_t open,
                                   size_t offset, bool raw, const Token& tok) {
    const size_t n = body.size();
    size_t start = open + 1;
    size_t j = start;
    int depth = 0;
    char quote = 0;
    bool triple = false;
    size_t expr_end = std::string::npos;
    bool debug = false;

    auto fail_here = [&](const char* msg, size_t index) {
        int line, column;
        body_position(tok, offset + index, line, column);
        fail_at(msg, line, column);
    };

    while (j < n) {
        char c = body[j];
        if (quote) {
            if (triple) {
                if (body.compare(j, 3, std::string(3, quote)) == 0) {
                    quote = 0;
                    j += 3;
                    continue;
                }
            } else if (c == quote) {
                quote = 0;
            }
            ++j;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            triple = body.compare(j, 3, std::string(3, c)) == 0;
            j += triple ? 3 : 1;
            continue;
        }
        if (c == '\\') {
            fail_here("f-string expression part cannot include a backslash", j);
        }
        if (c == '#') {
            fail_here("f-string expression part cannot include '#'", j);
        }
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth == 0) {
                if (c == '}') {
                    expr_end = j;
                    break;
                }
                fail_here("f-string: unmatched ')'", j);
            }
            --depth;
        } else if (depth == 0) {
            if (c == '!' && (j + 1 >= n || body[j + 1] != '=')) {
                expr_end = j;
                break;
            }
            if (c == ':') {
                expr_end = j;
                break;
            }
            if (c == '=') {
                char next = j + 1 < n ? body[j + 1] : '\0';
                char prev = j > start ? body[j - 1] : '\0';
                if (next != '=' && prev != '=' && prev != '!' && prev != '<' && prev != '>') {
                    size_t k = j + 1;
                    while (k < n && (body[k] == ' ' || body[k] == '\t')) ++k;
                    if (k < n && (body[k] == '}' || body[k] == '!' || body[k] == ':')) {
                        debug = true;
                        expr_end = j;
                        break;
                    }
                }
            }
        }
        ++j;
    }
    if (expr_end == std::string::npos) {
        fail_here("f-string: expecting '}'", open);
    }

    std::string expr_text = body.substr(start, expr_end - start);
    if (expr_text.find_first_not_of(" \t\n") == std::string::npos) {
        fail_here("f-string: empty expression not allowed", open);
    }

    int line, column;
    body_position(tok, offset + start, line, column);
    NodePtr expr = parse_fstring_expression(expr_text, line, column);

    int open_line, open_column;
    body_position(tok, offset + open, open_line, open_column);
    if (debug) {
        NodePtr text = make_node(NodeKind::Constant, open_line, open_column, expr_text + "=");
        text->extra = "str";
        joined->add(std::move(text));
    }

    NodePtr value = make_node(NodeKind::FormattedValue, open_line, open_column);
    value->add(std::move(expr));

    j = expr_end;
    if (debug) {
        ++j;
        while (j < n && (body[j] == ' ' || body[j] == '\t')) ++j;
    }
    if (j < n && body[j] == '!') {
        if (j + 1 >= n || (body[j + 1] != 's' && body[j + 1] != 'r' && body[j + 1] != 'a')) {
            fail_here("f-string: invalid conversion character: expected 's', 'r', or 'a'", j);
        }
        value->extra = std::string(1, body[j + 1]);
        j += 2;
    }
    if (j < n && body[j] == ':') {
        ++j;
        size_t spec_start = j;
        int spec_depth = 0;
        while (j < n) {
            if (body[j] == '{') {
                ++spec_depth;
            } else if (body[j] == '}') {
                if (spec_depth == 0) break;
                --spec_depth;
            }
            ++j;
        }
        int spec_line, spec_column;
        body_position(tok, offset + spec_start, spec_line, spec_column);
        NodePtr spec = make_node(NodeKind::JoinedStr, spec_line, spec_column);
        parse_fstring_into(spec.get(), body.substr(spec_start, j - spec_start),
                           offset + spec_start, raw, tok);
        value->add(std::move(spec));
    } else if (debug && value->extra.empty()) {
        value->extra = "r";
    }
    if (j >= n || body[j] != '}') {
        fail_here("f-string: expecting '}'", j < n ? j : open);
    }

    joined->add(std::move(value));
    return j + 1;
}

NodePtr Parser::parse_fstring_expression(const std::string& text, int line, int column) {
    std::vector<Token> tokens;
    try {
        Lexer lexer("(" + text + ")");
        tokens = lexer.tokenize();
    } catch (const SyntaxError& e) {
        int l = line + e.line() - 1;
        int c = e.line() == 1 ? column + e.column() - 2 : e.column();
        throw SyntaxError(std::string("f-string: ") + e.what(), l, c);
    }

    // Map positions back into the enclosing source; the wrapping '(' sits
    // one column before the expression text
    for (size_t i = 0; i < tokens.size(); ++i) {
        Token& t = tokens[i];
        if (t.line == 1) {
            t.column = column + t.column - 2;
        }
        t.line = line + t.line - 1;
    }

    Parser sub(std::move(tokens));
    sub.depth_ = depth_;
    return sub.parse_wrapped_expression();
}

} // namespace pyast
} // namespace sandcell
