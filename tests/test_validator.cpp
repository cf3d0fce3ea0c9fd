#include <sandcell/sandbox/validator.hpp>
#include <sandcell/sandbox/policy.hpp>

#include <cassert>
#include <string>
#include <vector>

using sandcell::FindingKind;
using sandcell::ValidationFinding;

static const sandcell::Policy& policy() {
    static const sandcell::Policy p = sandcell::Policy::defaults();
    return p;
}

static std::vector<ValidationFinding> check(const std::string& src) {
    return sandcell::validate(src, policy());
}

static bool only(const std::vector<ValidationFinding>& f, FindingKind kind, const std::string& location) {
    return f.size() == 1 && f[0].kind == kind && f[0].location() == location;
}

static void testAllowedProgram() {
    const char* src =
        "import numpy as np\n"
        "import pandas as pd\n"
        "import matplotlib.pyplot as plt\n"
        "from collections import Counter\n"
        "import json, math\n"
        "data = np.arange(10)\n"
        "df = pd.DataFrame({'x': data, 'y': data ** 2})\n"
        "print(df.describe())\n"
        "fig, ax = plt.subplots()\n"
        "ax.plot(df['x'], df['y'])\n"
        "plt.show()\n"
        "print(f\"{data.mean():.2f}\")\n"
        "print('{:>5} {0.real}'.format(3))\n"
        "print(json.loads('[1]'), math.sqrt(2), Counter('abc'))\n"
        "class Vec:\n"
        "    def __init__(self, x):\n"
        "        self.x = x\n"
        "    def __repr__(self):\n"
        "        return 'Vec(%r)' % self.x\n"
        "class Vec2(Vec):\n"
        "    def __init__(self, x):\n"
        "        super().__init__(x)\n";
    std::vector<ValidationFinding> f = check(src);
    assert(f.empty());
}

static void testImports() {
    std::vector<ValidationFinding> f = check("import os\n");
    assert(only(f, FindingKind::DisallowedImport, "1:8"));
    assert(f[0].detail.find("os") != std::string::npos);

    f = check("import torch\n");
    assert(only(f, FindingKind::DisallowedImport, "1:8"));
    assert(f[0].detail == "module 'torch' is not in the allow-list");

    f = check("import numpy.ctypeslib\n");
    assert(only(f, FindingKind::DisallowedImport, "1:8"));

    f = check("import numpy._core\n");
    assert(only(f, FindingKind::DisallowedImport, "1:8"));

    f = check("from os import path\n");
    assert(only(f, FindingKind::DisallowedImport, "1:1"));

    f = check("from . import helper\n");
    assert(only(f, FindingKind::DisallowedImport, "1:1"));

    f = check("from numpy import load\n");
    assert(only(f, FindingKind::DisallowedAttribute, "1:19"));

    f = check("from math import *\n");
    assert(f.empty());

    f = check("from numpy.linalg import *\n");
    assert(only(f, FindingKind::DisallowedImport, "1:26"));
}

static void testForbiddenNames() {
    std::vector<ValidationFinding> f = check("eval('1')\n");
    assert(only(f, FindingKind::ForbiddenSyntax, "1:1"));

    f = check("x = getattr(obj, 'y')\n");
    assert(only(f, FindingKind::ForbiddenSyntax, "1:5"));

    f = check("with open('f') as fh:\n    pass\n");
    assert(only(f, FindingKind::ForbiddenSyntax, "1:6"));

    f = check("b = __builtins__\n");
    assert(only(f, FindingKind::ForbiddenSyntax, "1:5"));

    f = check("caf\xC3\xA9 = 1\n");
    assert(only(f, FindingKind::ForbiddenSyntax, "1:1"));
}

static void testAttributes() {
    std::vector<ValidationFinding> f = check("x = ().__class__.__bases__[0].__subclasses__()\n");
    assert(f.size() == 3);
    for (size_t i = 0; i < f.size(); ++i) {
        assert(f[i].kind == FindingKind::DisallowedAttribute);
    }
    assert(f[0].location() == "1:8");

    f = check("import numpy as np\narr = np.load('x.npy')\n");
    assert(only(f, FindingKind::DisallowedAttribute, "2:10"));

    f = check("def g():\n    yield 1\nframe = g().gi_frame\n");
    assert(only(f, FindingKind::DisallowedAttribute, "3:13"));

    // Private names are refused even through super()
    f = check("class A:\n    def f(self):\n        return super()._secret\n");
    assert(only(f, FindingKind::DisallowedAttribute, "3:24"));
}

static void testFormatEscapes() {
    std::vector<ValidationFinding> f = check("s = '{0.__class__}'.format(1)\n");
    assert(only(f, FindingKind::DisallowedAttribute, "1:5"));

    f = check("tmpl = '{}'\nout = tmpl.format(1)\n");
    assert(only(f, FindingKind::ForbiddenSyntax, "2:12"));

    f = check("s = '{{0.__class__}}'.format()\n");
    assert(f.empty());
}

static void testDefinitions() {
    std::vector<ValidationFinding> f = check("def __getattr__(name):\n    return 1\n");
    assert(only(f, FindingKind::ForbiddenSyntax, "1:1"));

    f = check("class A:\n    def __getattribute__(self, n):\n        return 1\n");
    assert(only(f, FindingKind::ForbiddenSyntax, "2:5"));

    f = check("class A:\n    def __eq__(self, o):\n        return True\n");
    assert(f.empty());

    f = check("match p:\n    case Point(__class__=c):\n        pass\n");
    assert(f.size() == 1);
    assert(f[0].kind == FindingKind::DisallowedAttribute);
    assert(f[0].line == 2);
}

static void testForbiddenSyntaxKinds() {
    std::vector<ValidationFinding> f = check("async def f():\n    await g()\n");
    assert(f.size() == 2);
    assert(f[0].kind == FindingKind::ForbiddenSyntax && f[0].location() == "1:1");
    assert(f[1].kind == FindingKind::ForbiddenSyntax && f[1].line == 2);

    sandcell::Policy strict = sandcell::Policy::defaults();
    strict.forbidden_node_kinds.insert(sandcell::pyast::NodeKind::Lambda);
    sandcell::Validator validator(strict);
    f = validator.validate("key = lambda v: -v\n");
    assert(only(f, FindingKind::ForbiddenSyntax, "1:7"));
    assert(f[0].detail == "'Lambda' is not allowed");
}

static void testLookupsByComputedName() {
    // operator and typing stay out of the default allow-list
    std::vector<ValidationFinding> f = check(
        "import operator\ng = operator.attrgetter('_' + '_class__')\n");
    assert(f.size() == 2);
    assert(f[0].kind == FindingKind::DisallowedImport && f[0].location() == "1:8");
    assert(f[1].kind == FindingKind::DisallowedAttribute && f[1].location() == "2:14");
    assert(f[1].detail == "access to attribute 'attrgetter' is not allowed");

    f = check("import typing\n");
    assert(only(f, FindingKind::DisallowedImport, "1:8"));

    // Still refused when a deployment allows the modules themselves
    sandcell::Policy widened = sandcell::Policy::defaults();
    widened.allowed_modules.push_back("operator");
    widened.allowed_modules.push_back("typing");
    sandcell::Validator validator(widened);

    f = validator.validate("from operator import attrgetter\n");
    assert(only(f, FindingKind::DisallowedAttribute, "1:22"));
    assert(f[0].detail == "import of 'attrgetter' from 'operator' is not allowed");

    f = validator.validate("import operator\nm = operator.methodcaller('_' + '_reduce_ex__', 2)\n");
    assert(only(f, FindingKind::DisallowedAttribute, "2:14"));

    f = validator.validate("import typing\nh = typing.get_type_hints(g)\n");
    assert(only(f, FindingKind::DisallowedAttribute, "2:12"));

    f = validator.validate("from typing import ForwardRef\n");
    assert(only(f, FindingKind::DisallowedAttribute, "1:20"));

    // Annotation evaluation through functools
    f = check("from functools import singledispatch\n");
    assert(only(f, FindingKind::DisallowedAttribute, "1:23"));
}

static void testExpressionStringEvaluation() {
    std::vector<ValidationFinding> f = check("import pandas as pd\nr = pd.eval('1 + 2')\n");
    assert(only(f, FindingKind::DisallowedAttribute, "2:8"));

    f = check("import pandas as pd\ndf = pd.DataFrame({'a': [1]})\nr = df.query('a > 0')\n");
    assert(only(f, FindingKind::DisallowedAttribute, "3:8"));

    f = check("from pandas import eval\n");
    assert(only(f, FindingKind::DisallowedAttribute, "1:20"));

    f = check("import string\nv = string.Formatter().vformat('{0}', (1,), {})\n");
    assert(only(f, FindingKind::DisallowedAttribute, "2:24"));

    f = check("import string\nv = string.Formatter().get_field('0', (1,), {})\n");
    assert(only(f, FindingKind::DisallowedAttribute, "2:24"));

    // Plain string templates keep working
    f = check("import string\nt = string.Template('$x').substitute(x=1)\n");
    assert(f.empty());
}

static void testAllFindingsReportedInOrder() {
    std::vector<ValidationFinding> f = check("import subprocess\nx = 1\neval('x')\nimport os\n");
    assert(f.size() == 3);
    assert(f[0].line == 1);
    assert(f[1].line == 3);
    assert(f[2].line == 4);
    assert(std::string(sandcell::finding_kind_name(f[0].kind)) == "disallowed_import");
    assert(std::string(sandcell::finding_kind_name(f[1].kind)) == "forbidden_syntax");
}

static void testSyntaxErrorIsAFinding() {
    std::vector<ValidationFinding> f = check("def broken(:\n");
    assert(f.size() == 1);
    assert(f[0].kind == FindingKind::SyntaxError);
    assert(f[0].line == 1);
    assert(!f[0].detail.empty());
    assert(std::string(sandcell::finding_kind_name(f[0].kind)) == "syntax_error");
}

int main() {
    testAllowedProgram();
    testImports();
    testForbiddenNames();
    testAttributes();
    testFormatEscapes();
    testLookupsByComputedName();
    testExpressionStringEvaluation();
    testDefinitions();
    testForbiddenSyntaxKinds();
    testAllFindingsReportedInOrder();
    testSyntaxErrorIsAFinding();
    return 0;
}
