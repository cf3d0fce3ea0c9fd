#include <sandcell/pyast/parser.hpp>

#include <cassert>
#include <string>

using sandcell::pyast::Node;
using sandcell::pyast::NodeKind;
using sandcell::pyast::ParseResult;
using sandcell::pyast::parse_module;

static size_t countKind(const Node& node, NodeKind kind) {
    size_t n = node.kind == kind ? 1 : 0;
    for (size_t i = 0; i < node.children.size(); ++i) {
        n += countKind(*node.children[i], kind);
    }
    return n;
}

static const Node* findKind(const Node& node, NodeKind kind) {
    if (node.kind == kind) return &node;
    for (size_t i = 0; i < node.children.size(); ++i) {
        const Node* found = findKind(*node.children[i], kind);
        if (found) return found;
    }
    return nullptr;
}

static ParseResult parseOk(const std::string& src) {
    ParseResult r = parse_module(src);
    assert(r.ok);
    assert(r.module);
    return r;
}

static void testDumpShapes() {
    ParseResult r = parseOk("print(1)\n");
    assert(sandcell::pyast::dump(*r.module) == "(Module (Expr (Call (Name print) (Constant \"1\"))))");

    r = parseOk("import numpy as np, json\n");
    assert(sandcell::pyast::dump(*r.module) == "(Module (Import (Alias numpy as np) (Alias json)))");

    r = parseOk("x.y.z\n");
    assert(sandcell::pyast::dump(*r.module) == "(Module (Expr (Attribute z (Attribute y (Name x)))))");
}

static void testImports() {
    ParseResult r = parseOk("from ..pkg.mod import a as b, c\nfrom . import d\nfrom math import *\n");
    const Node& m = *r.module;
    assert(m.size() == 3);

    const Node* first = m.child(0);
    assert(first->kind == NodeKind::ImportFrom);
    assert(first->value == "pkg.mod");
    assert(first->level == 2);
    assert(first->size() == 2);
    assert(first->child(0)->value == "a" && first->child(0)->extra == "b");

    assert(m.child(1)->level == 1 && m.child(1)->value.empty());
    assert(m.child(2)->child(0)->value == "*");
}

static void testPositions() {
    ParseResult r = parseOk("x = 1\n\nif x:\n    y = x.attr\n");
    const Node* attr = findKind(*r.module, NodeKind::Attribute);
    assert(attr != nullptr);
    assert(attr->value == "attr");
    assert(attr->line == 4);
    assert(attr->column == 11);

    const Node* iff = findKind(*r.module, NodeKind::If);
    assert(iff && iff->line == 3 && iff->column == 1);
}

static void testCompoundStatements() {
    const char* src =
        "@decorator\n"
        "def f(a, /, b=1, *args, c, d=2, **kw) -> int:\n"
        "    global g\n"
        "    for i in range(3):\n"
        "        if i: continue\n"
        "        elif not i: break\n"
        "        else: pass\n"
        "    while False:\n"
        "        pass\n"
        "    try:\n"
        "        raise ValueError('x') from None\n"
        "    except (ValueError, TypeError) as e:\n"
        "        del e\n"
        "    finally:\n"
        "        pass\n"
        "    with ctx() as (a, b), other():\n"
        "        pass\n"
        "    return lambda x, *y: x\n"
        "class C(Base, metaclass=Meta):\n"
        "    x: int = 0\n"
        "    def __init__(self):\n"
        "        self.x += 1\n";
    ParseResult r = parseOk(src);
    const Node& m = *r.module;
    assert(countKind(m, NodeKind::FunctionDef) == 2);
    assert(countKind(m, NodeKind::ClassDef) == 1);
    assert(countKind(m, NodeKind::For) == 1);
    assert(countKind(m, NodeKind::While) == 1);
    assert(countKind(m, NodeKind::Try) == 1);
    assert(countKind(m, NodeKind::ExceptHandler) == 1);
    assert(countKind(m, NodeKind::With) == 1);
    assert(countKind(m, NodeKind::WithItem) == 2);
    assert(countKind(m, NodeKind::Lambda) == 1);
    assert(countKind(m, NodeKind::AnnAssign) == 1);
    assert(countKind(m, NodeKind::AugAssign) == 1);
    assert(countKind(m, NodeKind::Global) == 1);
    assert(countKind(m, NodeKind::Raise) == 1);
    assert(countKind(m, NodeKind::Delete) == 1);

    const Node* cls = findKind(m, NodeKind::ClassDef);
    assert(cls->value == "C");
    assert(countKind(*cls, NodeKind::Keyword) == 1);
}

static void testExpressions() {
    const char* src =
        "a = [x ** 2 for x in range(10) if x % 2]\n"
        "b = {k: v for k, v in zip('ab', 'cd')}\n"
        "c = {1, 2, *rest}\n"
        "d = {'k': 1, **extra}\n"
        "e = (y for y in a)\n"
        "f = a[1:2, ::3]\n"
        "g = 1 if a else 2\n"
        "h = 0 < a <= 10 != b\n"
        "i = not a and b or c\n"
        "j = (n := 5)\n"
        "k = -a @ b | c ^ d & e << 1\n"
        "print(*a, sep='', **d)\n";
    ParseResult r = parseOk(src);
    const Node& m = *r.module;
    assert(countKind(m, NodeKind::ListComp) == 1);
    assert(countKind(m, NodeKind::DictComp) == 1);
    assert(countKind(m, NodeKind::Set) == 1);
    assert(countKind(m, NodeKind::Dict) == 1);
    assert(countKind(m, NodeKind::GeneratorExp) == 1);
    assert(countKind(m, NodeKind::Slice) == 2);
    assert(countKind(m, NodeKind::IfExp) == 1);
    assert(countKind(m, NodeKind::NamedExpr) == 1);
    assert(countKind(m, NodeKind::Comprehension) == 3);

    const Node* cmp = findKind(m, NodeKind::Compare);
    assert(cmp != nullptr);
    assert(cmp->value == "<,<=,!=");
    assert(cmp->size() == 4);
}

static void testStringsAndFstrings() {
    ParseResult r = parseOk("s = 'a' \"b\" '''c'''\nt = f'{x!r:>{w}} and {y=}'\n");
    const Node& m = *r.module;

    const Node* first = m.child(0)->child(1);
    assert(first->kind == NodeKind::Constant);
    assert(first->extra == "str");
    assert(first->value == "abc");

    const Node* joined = findKind(m, NodeKind::JoinedStr);
    assert(joined != nullptr);
    assert(countKind(*joined, NodeKind::FormattedValue) >= 3);
    const Node* fv = findKind(*joined, NodeKind::FormattedValue);
    assert(fv->extra == "r");
    assert(findKind(*fv, NodeKind::Name)->value == "x");

    // Fields inside f-strings report their real position
    ParseResult p = parseOk("v = f'..{obj.attr}'\n");
    const Node* attr = findKind(*p.module, NodeKind::Attribute);
    assert(attr != nullptr);
    assert(attr->line == 1);
    assert(attr->column == 14);
}

static void testMatchStatement() {
    const char* src =
        "match command:\n"
        "    case [x, *rest]:\n"
        "        pass\n"
        "    case {'k': v, **others}:\n"
        "        pass\n"
        "    case Point(x=0, y=yy) | None:\n"
        "        pass\n"
        "    case 1 | -2 | 3.5 as num if num > 0:\n"
        "        pass\n"
        "    case _:\n"
        "        pass\n"
        "match = 5\n";
    ParseResult r = parseOk(src);
    const Node& m = *r.module;
    assert(countKind(m, NodeKind::Match) == 1);
    assert(countKind(m, NodeKind::MatchCase) == 5);
    assert(countKind(m, NodeKind::MatchSequence) == 1);
    assert(countKind(m, NodeKind::MatchStar) == 1);
    assert(countKind(m, NodeKind::MatchMapping) == 1);
    assert(countKind(m, NodeKind::MatchClass) == 1);
    assert(countKind(m, NodeKind::MatchOr) == 2);
    assert(countKind(m, NodeKind::MatchSingleton) == 1);
    // "match" stays usable as a plain name
    assert(m.child(1)->kind == NodeKind::Assign);
}

static void testAsyncConstructs() {
    ParseResult r = parseOk("async def f():\n    await g()\n    async for x in y:\n        pass\n    async with z:\n        pass\n");
    const Node& m = *r.module;
    assert(countKind(m, NodeKind::AsyncFunctionDef) == 1);
    assert(countKind(m, NodeKind::Await) == 1);
    assert(countKind(m, NodeKind::AsyncFor) == 1);
    assert(countKind(m, NodeKind::AsyncWith) == 1);
}

static void testSyntaxErrors() {
    ParseResult r = parse_module("x = = 1\n");
    assert(!r.ok);
    assert(r.line == 1);
    assert(!r.error.empty());

    r = parse_module("a = 1\ndef f(:\n    pass\n");
    assert(!r.ok);
    assert(r.line == 2);

    r = parse_module("f(a=1, 2)\n");
    assert(!r.ok);

    r = parse_module("1 = x\n");
    assert(!r.ok);

    r = parse_module("if x:\npass\n");
    assert(!r.ok);

    r = parse_module("print 'hello'\n");
    assert(!r.ok);
}

static void testDeepNestingIsAnError() {
    std::string src(3000, '-');
    src += "1\n";
    ParseResult r = parse_module(src);
    assert(!r.ok);

    std::string parens(500, '(');
    r = parse_module(parens);
    assert(!r.ok);
}

static void testEmptyModule() {
    ParseResult r = parseOk("");
    assert(r.module->kind == NodeKind::Module);
    assert(r.module->size() == 0);

    r = parseOk("# only a comment\n\n");
    assert(r.module->size() == 0);
}

int main() {
    testDumpShapes();
    testImports();
    testPositions();
    testCompoundStatements();
    testExpressions();
    testStringsAndFstrings();
    testMatchStatement();
    testAsyncConstructs();
    testSyntaxErrors();
    testDeepNestingIsAnError();
    testEmptyModule();
    return 0;
}
