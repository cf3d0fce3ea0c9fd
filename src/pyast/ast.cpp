/*
 * sandcell - Python Syntax Tree Implementation
 */
#include <sandcell/pyast/ast.hpp>

#include <cstring>

namespace sandcell {
namespace pyast {

namespace {

struct KindName {
    NodeKind kind;
    const char* name;
};

const KindName kKindNames[] = {
    {NodeKind::Module, "Module"},
    {NodeKind::FunctionDef, "FunctionDef"},
    {NodeKind::AsyncFunctionDef, "AsyncFunctionDef"},
    {NodeKind::ClassDef, "ClassDef"},
    {NodeKind::Return, "Return"},
    {NodeKind::Delete, "Delete"},
    {NodeKind::Assign, "Assign"},
    {NodeKind::AugAssign, "AugAssign"},
    {NodeKind::AnnAssign, "AnnAssign"},
    {NodeKind::For, "For"},
    {NodeKind::AsyncFor, "AsyncFor"},
    {NodeKind::While, "While"},
    {NodeKind::If, "If"},
    {NodeKind::With, "With"},
    {NodeKind::AsyncWith, "AsyncWith"},
    {NodeKind::Match, "Match"},
    {NodeKind::Raise, "Raise"},
    {NodeKind::Try, "Try"},
    {NodeKind::TryStar, "TryStar"},
    {NodeKind::Assert, "Assert"},
    {NodeKind::Import, "Import"},
    {NodeKind::ImportFrom, "ImportFrom"},
    {NodeKind::Global, "Global"},
    {NodeKind::Nonlocal, "Nonlocal"},
    {NodeKind::Expr, "Expr"},
    {NodeKind::Pass, "Pass"},
    {NodeKind::Break, "Break"},
    {NodeKind::Continue, "Continue"},
    {NodeKind::BoolOp, "BoolOp"},
    {NodeKind::NamedExpr, "NamedExpr"},
    {NodeKind::BinOp, "BinOp"},
    {NodeKind::UnaryOp, "UnaryOp"},
    {NodeKind::Lambda, "Lambda"},
    {NodeKind::IfExp, "IfExp"},
    {NodeKind::Dict, "Dict"},
    {NodeKind::Set, "Set"},
    {NodeKind::ListComp, "ListComp"},
    {NodeKind::SetComp, "SetComp"},
    {NodeKind::DictComp, "DictComp"},
    {NodeKind::GeneratorExp, "GeneratorExp"},
    {NodeKind::Await, "Await"},
    {NodeKind::Yield, "Yield"},
    {NodeKind::YieldFrom, "YieldFrom"},
    {NodeKind::Compare, "Compare"},
    {NodeKind::Call, "Call"},
    {NodeKind::JoinedStr, "JoinedStr"},
    {NodeKind::FormattedValue, "FormattedValue"},
    {NodeKind::Constant, "Constant"},
    {NodeKind::Attribute, "Attribute"},
    {NodeKind::Subscript, "Subscript"},
    {NodeKind::Starred, "Starred"},
    {NodeKind::Name, "Name"},
    {NodeKind::List, "List"},
    {NodeKind::Tuple, "Tuple"},
    {NodeKind::Slice, "Slice"},
    {NodeKind::Arguments, "Arguments"},
    {NodeKind::Arg, "Arg"},
    {NodeKind::Keyword, "Keyword"},
    {NodeKind::Alias, "Alias"},
    {NodeKind::WithItem, "WithItem"},
    {NodeKind::ExceptHandler, "ExceptHandler"},
    {NodeKind::Comprehension, "Comprehension"},
    {NodeKind::MatchCase, "MatchCase"},
    {NodeKind::MatchValue, "MatchValue"},
    {NodeKind::MatchSingleton, "MatchSingleton"},
    {NodeKind::MatchSequence, "MatchSequence"},
    {NodeKind::MatchMapping, "MatchMapping"},
    {NodeKind::MatchClass, "MatchClass"},
    {NodeKind::MatchStar, "MatchStar"},
    {NodeKind::MatchAs, "MatchAs"},
    {NodeKind::MatchOr, "MatchOr"},
};

void dump_into(const Node& node, std::string& out) {
    out += '(';
    out += node_kind_name(node.kind);
    if (node.kind == NodeKind::Constant) {
        out += " \"";
        out += node.value;
        out += '"';
    } else if (!node.value.empty()) {
        out += ' ';
        out += node.value;
    }
    if (node.kind == NodeKind::Alias && !node.extra.empty()) {
        out += " as ";
        out += node.extra;
    }
    for (size_t i = 0; i < node.children.size(); ++i) {
        out += ' ';
        dump_into(*node.children[i], out);
    }
    out += ')';
}

} // namespace

const char* node_kind_name(NodeKind kind) {
    for (size_t i = 0; i < sizeof(kKindNames) / sizeof(kKindNames[0]); ++i) {
        if (kKindNames[i].kind == kind) return kKindNames[i].name;
    }
    return "Unknown";
}

bool parse_node_kind(const std::string& name, NodeKind& out) {
    for (size_t i = 0; i < sizeof(kKindNames) / sizeof(kKindNames[0]); ++i) {
        if (name == kKindNames[i].name) {
            out = kKindNames[i].kind;
            return true;
        }
    }
    return false;
}

Node* Node::add(NodePtr child) {
    if (!child) return nullptr;
    children.push_back(std::move(child));
    return children.back().get();
}

NodePtr make_node(NodeKind kind, int line, int column, const std::string& value) {
    NodePtr n(new Node(kind, line, column));
    n->value = value;
    return n;
}

std::string dump(const Node& node) {
    std::string out;
    dump_into(node, out);
    return out;
}

} // namespace pyast
} // namespace sandcell
