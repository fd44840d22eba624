#include <algorithm>
#include <cinder/lexer/lexer.h>
#include <cinder/parser/parser.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static cinder::parser::Program parse_ok(const std::string& src)
{
    auto parsed = cinder::parser::parse_source(src);
    if (auto* diags = std::get_if<std::vector<cinder::diag::Diagnostic>>(&parsed))
    {
        fail("expected parse to succeed for: " + src + "\n  first error: " +
             (diags->empty() ? std::string("<none>") : diags->front().message));
    }
    return std::move(std::get<cinder::parser::Program>(parsed));
}

static void expect_dump(const std::string& src, const std::string& expected)
{
    const auto program = parse_ok(src);
    const std::string got = cinder::parser::dump(program);
    if (got != expected)
    {
        std::cerr << "source:\n" << src << "\ngot:\n" << got << "\nexpected:\n" << expected << "\n";
        fail("dump mismatch");
    }
}

static bool contains(const std::vector<std::string>& names, const std::string& name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}

int main()
{
    using namespace cinder;

    auto expect_parse_error_contains = [](const std::string& src, const std::string& needle) {
        const auto lexed = lexer::lex(src);
        if (!std::holds_alternative<std::vector<lexer::Token>>(lexed))
        {
            fail("lex failed on invalid program: " + src);
        }

        const auto& toks = std::get<std::vector<lexer::Token>>(lexed);
        const auto parsed = parser::parse(toks);
        if (!std::holds_alternative<std::vector<diag::Diagnostic>>(parsed))
        {
            fail("expected parse to fail: " + src);
        }

        const auto& diags = std::get<std::vector<diag::Diagnostic>>(parsed);
        bool found = false;
        for (const auto& d : diags)
        {
            if (d.message.find(needle) != std::string::npos)
            {
                found = true;
                break;
            }
        }
        if (!found)
        {
            std::cerr << "parse diags:\n";
            for (const auto& d : diags)
            {
                std::cerr << "  - " << d.message << "\n";
            }
            fail("expected parse error containing: " + needle);
        }
    };

    expect_dump("x = 1 + 2 * 3\n", "(assign x (plus 1 (star 2 3)))\n");
    expect_dump("print('hi'); 2+2", "(expr (call print \"hi\"))\n(expr (plus 2 2))\n");
    expect_dump("a = b = []\n", "(assign a b (list))\n");
    expect_dump("x += 1\n", "(augassign plus x 1)\n");
    expect_dump("items[0] -= 2\n", "(augassign minus (index items 0) 2)\n");
    expect_dump("ok = 0 < n <= 10\n", "(assign ok (compare 0 < n <= 10))\n");
    expect_dump("print(x, sep='-')\n", "(expr (call print x (kw sep \"-\")))\n");
    expect_dump("ys = [y * 2 for y in xs if y]\n", "(assign ys (listcomp (star y 2) (for y xs (if y))))\n");
    expect_dump("d = {'a': 1, **rest}\n", "(assign d (dict (\"a\" 1) (** rest)))\n");
    expect_dump("v = xs[1:]\n", "(assign v (index xs (slice 1 _ _)))\n");
    expect_dump("import math, json as j\n", "import math, json as j\n");
    expect_dump("from statistics import mean\n", "from statistics import mean\n");

    expect_dump("if a:\n    pass\nelif b:\n    x = 1\nelse:\n    x = 2\n",
                "if a\n  pass\nelif b\n  (assign x 1)\nelse\n  (assign x 2)\n");

    expect_dump("try:\n    f()\nexcept ValueError as e:\n    pass\nfinally:\n    done()\n",
                "try\n  (expr (call f))\nexcept ValueError as e\n  pass\nfinally\n  (expr (call done))\n");

    expect_dump("def f(a, b=2, *args, **kw):\n    return a\n", "def f(a b=2 *args **kw)\n  (return a)\n");

    // Function scopes record locals, globals and nonlocals.
    {
        const auto program = parse_ok("def f(a):\n    global g\n    y = a\n    g = y\n    return y\n");
        if (program.body.size() != 1)
        {
            fail("expected one top-level statement");
        }
        const auto* def = std::get_if<parser::FunctionDef>(&program.body.front().node);
        if (def == nullptr)
        {
            fail("expected a function definition");
        }
        if (!contains(def->scope.locals, "y") || !contains(def->scope.locals, "a"))
        {
            fail("expected y and a to be local");
        }
        if (contains(def->scope.locals, "g") || !contains(def->scope.globals, "g"))
        {
            fail("expected g to be global, not local");
        }
    }

    // Standalone expressions.
    {
        auto expr = parser::parse_expression_source("1 + 2");
        if (!std::holds_alternative<parser::Expr>(expr))
        {
            fail("expected expression to parse");
        }
        if (parser::dump(std::get<parser::Expr>(expr)) != "(plus 1 2)")
        {
            fail("unexpected expression dump: " + parser::dump(std::get<parser::Expr>(expr)));
        }

        auto tuple = parser::parse_expression_source("a, b");
        if (!std::holds_alternative<parser::Expr>(tuple) ||
            parser::dump(std::get<parser::Expr>(tuple)) != "(tuple a b)")
        {
            fail("expected bare tuple expression");
        }

        if (std::holds_alternative<parser::Expr>(parser::parse_expression_source("x = 1")))
        {
            fail("an assignment is not an expression");
        }
    }

    expect_parse_error_contains("def f(a, a):\n    pass\n", "duplicate argument 'a' in function definition");
    expect_parse_error_contains("def f(a=1, b):\n    pass\n", "non-default argument follows default argument");
    expect_parse_error_contains("f(x=1, 2)\n", "positional argument follows keyword argument");
    expect_parse_error_contains("from . import x\n", "relative imports are not supported");
    expect_parse_error_contains("class A:\n    pass\n", "'class' is not supported");
    expect_parse_error_contains("@wrap\ndef f():\n    pass\n", "decorators are not supported");
    expect_parse_error_contains("if x:\nprint(1)\n", "expected an indented block");
    expect_parse_error_contains("try:\n    pass\nx = 1\n", "expected 'except' or 'finally' block");
    expect_parse_error_contains("x = " + std::string(1500, '-') + "1\n", "too many nested expressions");
    expect_parse_error_contains("x = " + std::string(1100, '~') + "1\n", "too many nested expressions");

    // Left-associative chains are built in a loop but still count towards the nesting limit.
    {
        std::string sum = "x = 1";
        std::string attrs = "y = a";
        std::string subscripts = "z = [1]";
        std::string ors = "w = a";
        for (int i = 0; i < 20000; ++i)
        {
            sum += "+1";
            attrs += ".b";
            subscripts += "[0]";
            ors += " or a";
        }
        expect_parse_error_contains(sum + "\n", "too many nested expressions");
        expect_parse_error_contains(attrs + "\n", "too many nested expressions");
        expect_parse_error_contains(subscripts + "\n", "too many nested expressions");
        expect_parse_error_contains(ors + "\n", "too many nested expressions");

        // Short chains nested in parentheses add up.
        std::string nested = "1";
        for (int level = 0; level < 150; ++level)
        {
            nested = "(" + nested;
            for (int i = 0; i < 100; ++i)
            {
                nested += "+1";
            }
            nested += ")";
        }
        expect_parse_error_contains("v = " + nested + "\n", "too many nested expressions");

        std::string moderate = "x = 1";
        for (int i = 0; i < 500; ++i)
        {
            moderate += "+1";
        }
        (void)parse_ok(moderate + "\n");
    }

    // Lex errors surface through parse_source as diagnostics too.
    {
        auto parsed = parser::parse_source("s = 'open\n");
        if (!std::holds_alternative<std::vector<diag::Diagnostic>>(parsed))
        {
            fail("expected lex failure to be reported by parse_source");
        }
    }

    std::cout << "OK\n";
    return 0;
}
