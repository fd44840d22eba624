#include <cinder/parser/parser.h>
#include <cinder/policy/checker.h>
#include <cinder/policy/denylist.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_allowed(const std::string& code)
{
    const auto decision = cinder::policy::check(code);
    if (const auto* rejected = std::get_if<cinder::policy::Rejected>(&decision))
    {
        fail("expected code to be allowed: " + code + "\n  got: " + cinder::policy::describe(*rejected, code));
    }
}

static cinder::policy::Rejected expect_rejected(const std::string& code, cinder::policy::RejectKind kind)
{
    const auto decision = cinder::policy::check(code);
    const auto* rejected = std::get_if<cinder::policy::Rejected>(&decision);
    if (rejected == nullptr)
    {
        fail("expected code to be rejected: " + code);
    }
    if (rejected->kind != kind)
    {
        fail("unexpected rejection kind for: " + code);
    }
    return *rejected;
}

static void expect_describe(const std::string& code, cinder::policy::RejectKind kind, const std::string& expected)
{
    const auto rejected = expect_rejected(code, kind);
    const std::string got = cinder::policy::describe(rejected, code);
    if (got != expected)
    {
        fail("describe mismatch for: " + code + "\n  got: " + got + "\n  expected: " + expected);
    }
}

int main()
{
    using cinder::policy::RejectKind;

    expect_allowed("print('hi'); 2+2");
    expect_allowed("import math\nimport json as j\nfrom statistics import mean\n");
    expect_allowed("def f(x):\n    return x * 2\nf(3)\n");
    // Only direct calls by name are inspected.
    expect_allowed("class_name = 'eval'\nprint(class_name)\n");
    expect_allowed("x = {'open': 1}\nx['open']\n");
    expect_allowed("import osmosis_helper\n");

    expect_describe("import os", RejectKind::BlockedImport, "import of blocked module 'os' (line 1)");
    expect_describe("x = 1\nimport os.path\n", RejectKind::BlockedImport, "import of blocked module 'os.path' (line 2)");
    expect_describe("from subprocess import run\n", RejectKind::BlockedImport,
                    "import of blocked module 'subprocess' (line 1)");
    expect_describe("import math, socket\n", RejectKind::BlockedImport, "import of blocked module 'socket' (line 1)");
    expect_describe("eval('1+1')", RejectKind::BlockedCall, "call to blocked function 'eval' (line 1)");
    expect_describe("with_file = open('x')\n", RejectKind::BlockedCall, "call to blocked function 'open' (line 1)");

    // Nested positions are walked too.
    expect_rejected("def f():\n    import threading\n", RejectKind::BlockedImport);
    expect_rejected("try:\n    pass\nexcept Exception:\n    exec('x')\n", RejectKind::BlockedCall);
    expect_rejected("xs = [__import__('os') for _ in range(1)]\n", RejectKind::BlockedCall);
    expect_rejected("f = lambda: globals()\n", RejectKind::BlockedCall);
    expect_rejected("print(f'{getattr(x, \"y\")}')\n", RejectKind::BlockedCall);
    expect_rejected("def f(x=input()):\n    pass\n", RejectKind::BlockedCall);
    expect_rejected("print(len(compile('1', 'f', 'eval')))\n", RejectKind::BlockedCall);

    // Unparsable code fails closed.
    {
        const std::string code = "def broken(:\n";
        const auto rejected = expect_rejected(code, RejectKind::SyntaxError);
        const std::string text = cinder::policy::describe(rejected, code);
        if (text.rfind("SyntaxError: ", 0) != 0)
        {
            fail("syntax rejection should be prefixed: " + text);
        }
    }

    // Very long operator chains are refused before the walk.
    {
        std::string code = "x = 1";
        for (int i = 0; i < 20000; ++i)
        {
            code += "+1";
        }
        const auto rejected = expect_rejected(code, RejectKind::SyntaxError);
        if (cinder::policy::describe(rejected, code).find("too many nested expressions") == std::string::npos)
        {
            fail("long chain should be rejected as too deeply nested");
        }
    }

    // check_expression walks a parsed standalone expression.
    {
        auto parsed = cinder::parser::parse_expression_source("len(open('f').read())");
        if (!std::holds_alternative<cinder::parser::Expr>(parsed))
        {
            fail("expected the expression to parse");
        }
        const auto decision = cinder::policy::check_expression(std::get<cinder::parser::Expr>(parsed));
        if (!std::holds_alternative<cinder::policy::Rejected>(decision))
        {
            fail("expected check_expression to reject open()");
        }
    }

    if (!cinder::policy::is_blocked_module("multiprocessing.pool") || cinder::policy::is_blocked_module("math"))
    {
        fail("is_blocked_module should match on the first component");
    }
    if (!cinder::policy::is_stripped_builtin("vars") || cinder::policy::is_stripped_builtin("print"))
    {
        fail("is_stripped_builtin mismatch");
    }
    if (!cinder::policy::is_blocked_callable("input") || cinder::policy::is_blocked_callable("len"))
    {
        fail("is_blocked_callable mismatch");
    }

    std::cout << "OK\n";
    return 0;
}
