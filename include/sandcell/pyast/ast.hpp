/*
 * sandcell - Python Syntax Tree
 *
 * A uniform node type covering the Python 3.11 grammar. Every node keeps
 * its kind, a 1-based source position, an optional string payload and
 * ordered children. Payload conventions:
 *
 *   Name, Attribute, FunctionDef, ClassDef, Arg, Keyword  value = identifier
 *   Alias            value = dotted name, extra = "as" name
 *   ImportFrom       value = module, level = leading dots
 *   Constant         value = decoded text, extra = literal kind
 *   BinOp, UnaryOp, BoolOp, AugAssign   value = operator
 *   Compare          value = operators joined by ','
 *   FormattedValue   extra = conversion character
 *   Starred          extra = "**" for dict/keyword unpacking
 *   ExceptHandler, MatchAs, MatchStar   value = bound name (may be empty)
 */
#ifndef sandcell_PYAST_AST_HPP
#define sandcell_PYAST_AST_HPP

#include <memory>
#include <string>
#include <vector>

namespace sandcell {
namespace pyast {

enum class NodeKind {
    // Module
    Module,
    // Statements
    FunctionDef, AsyncFunctionDef, ClassDef, Return, Delete, Assign,
    AugAssign, AnnAssign, For, AsyncFor, While, If, With, AsyncWith,
    Match, Raise, Try, TryStar, Assert, Import, ImportFrom, Global,
    Nonlocal, Expr, Pass, Break, Continue,
    // Expressions
    BoolOp, NamedExpr, BinOp, UnaryOp, Lambda, IfExp, Dict, Set,
    ListComp, SetComp, DictComp, GeneratorExp, Await, Yield, YieldFrom,
    Compare, Call, JoinedStr, FormattedValue, Constant, Attribute,
    Subscript, Starred, Name, List, Tuple, Slice,
    // Helpers
    Arguments, Arg, Keyword, Alias, WithItem, ExceptHandler,
    Comprehension, MatchCase,
    // Patterns
    MatchValue, MatchSingleton, MatchSequence, MatchMapping, MatchClass,
    MatchStar, MatchAs, MatchOr
};

// "FunctionDef", "Await", ...
const char* node_kind_name(NodeKind kind);

// Inverse of node_kind_name. Returns false for unknown names.
bool parse_node_kind(const std::string& name, NodeKind& out);

struct Node;
typedef std::unique_ptr<Node> NodePtr;

struct Node {
    NodeKind kind;
    int line;
    int column;
    int level;
    std::string value;
    std::string extra;
    std::vector<NodePtr> children;

    Node(NodeKind k, int l, int c) : kind(k), line(l), column(c), level(0) {}

    // Append a child; null pointers are ignored
    Node* add(NodePtr child);

    Node* child(size_t i) const { return i < children.size() ? children[i].get() : nullptr; }
    size_t size() const { return children.size(); }
};

NodePtr make_node(NodeKind kind, int line, int column, const std::string& value = "");

// Compact s-expression rendering, e.g. (Call (Name print) (Constant "1"))
std::string dump(const Node& node);

} // namespace pyast
} // namespace sandcell

#endif // sandcell_PYAST_AST_HPP
