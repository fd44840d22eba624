#include <cinder/json/json.h>
#include <cinder/lexer/lexer.h>
#include <cinder/parser/parser.h>
#include <cinder/policy/checker.h>
#include <cinder/sandbox/engine.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace
{

[[noreturn]] void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

/** @brief Inputs that once tripped the front end or the policy walker. */
std::vector<std::string> regression_inputs()
{
    std::vector<std::string> inputs = {
        "",
        "\n\n\n",
        "\t",
        "\\",
        "x = \\",
        "'''",
        "\"\"\"abc",
        "f'{'",
        "f'{x!'",
        "f'{x:{y:{z}}}'",
        "(((((",
        ")))",
        "[1, 2,",
        "def",
        "def f(:",
        "lambda: (yield)",
        "if x:\n  y\n z\n",
        "if x:\n\ty\n        z\n",
        "import",
        "from . import x",
        "from os import",
        "import os.",
        "x = 1 if else 2",
        "@",
        "a[1:2:3:4]",
        "0x",
        "1e",
        "1__0",
        "b'\\xff",
        "\x00\x01\x02",
        "\xff\xfe\xfd",
        "print('\xe2\x82')",
        "x = 99999999999999999999999999999",
        "try:\n    pass\n",
        "while True:\nbreak",
    };
    inputs.push_back(std::string(500, '('));
    inputs.push_back(std::string(2000, '-') + "1");
    std::string nested_if;
    for (int depth = 0; depth < 150; ++depth)
    {
        nested_if += std::string(static_cast<std::size_t>(depth), ' ') + "if x:\n";
    }
    nested_if += std::string(150, ' ') + "pass\n";
    inputs.push_back(nested_if);

    std::string sum = "x = 1";
    std::string calls = "f";
    for (int i = 0; i < 100000; ++i)
    {
        sum += "+1";
        calls += "()";
    }
    inputs.push_back(sum);
    inputs.push_back(calls);
    return inputs;
}

cinder::sandbox::ExecutionResult run_in(cinder::sandbox::Session& session, const std::string& code)
{
    return session.execute(code, 30, 256 * 1024 * 1024);
}

void expect_ok(const cinder::sandbox::ExecutionResult& result, const std::string& what)
{
    if (!result.success)
    {
        fail(what + ": " + result.error.value_or("<none>"));
    }
}

void expect_error(const cinder::sandbox::ExecutionResult& result, const std::string& prefix, const std::string& what)
{
    if (result.success || result.error.value_or("").rfind(prefix, 0) != 0)
    {
        fail(what + ": expected " + prefix + ", got " + result.error.value_or("<none>"));
    }
}

/** @brief Deeply nested script values are built, reported and freed without exhausting the stack. */
void deep_values()
{
    cinder::sandbox::EngineConfig config;
    config.limit_address_space = false;
    cinder::sandbox::Session session(config);

    auto built = run_in(session, "a = []\nfor i in range(20000):\n    a = [a]\nprint('built')\n");
    expect_ok(built, "deep list");
    if (built.output != "built\n")
    {
        fail("deep list output: " + built.output);
    }
    expect_ok(run_in(session, "a = None"), "free deep list");

    expect_ok(run_in(session, "t = ()\nfor i in range(20000):\n    t = (t,)\n"), "deep tuple");
    expect_error(run_in(session, "hash(t)"), "RecursionError", "hash of deep tuple");
    expect_error(run_in(session, "print(t)"), "RecursionError", "repr of deep tuple");

    auto dict = run_in(session, "d = {}\nfor i in range(20000):\n    d = {'k': d}\nd\n");
    expect_ok(dict, "deep dict result");
    if (!dict.result.has_value() ||
        cinder::json::serialize(*dict.result).find("<unrepresentable dict>") == std::string::npos)
    {
        fail("deep dict result should be cut off with a placeholder");
    }

    expect_ok(run_in(session, "e = Exception()\nfor i in range(20000):\n    e = Exception(e)\n"),
              "exception chain");
    expect_ok(run_in(session, "def wrap(f):\n    return lambda: f\ng = None\n"
                              "for i in range(20000):\n    g = wrap(g)\n"),
              "closure chain");

    expect_error(run_in(session, "it = iter([1])\nfor i in range(5000):\n    it = map(abs, it)\n"),
                 "RecursionError", "iterator chain");
    expect_error(run_in(session, "import json\nl = []\nfor i in range(20000):\n    l = [l]\njson.dumps(l)\n"),
                 "RecursionError", "json.dumps of deep list");

    session.reset();
    expect_ok(run_in(session, "a = []\nfor i in range(50000):\n    a = [a, {'x': a}]\n"), "deep mixed");
}

} // namespace

int main()
{
    for (const auto& input : regression_inputs())
    {
        (void)cinder::lexer::lex(input);
        (void)cinder::parser::parse_source(input);

        const auto decision = cinder::policy::check(input);
        const auto parsed = cinder::parser::parse_source(input);
        const bool parses = std::holds_alternative<cinder::parser::Program>(parsed);
        const auto* rejected = std::get_if<cinder::policy::Rejected>(&decision);
        if (!parses && rejected == nullptr)
        {
            fail("unparsable input was allowed: " + input.substr(0, 40));
        }
        if (rejected != nullptr && cinder::policy::describe(*rejected, input).empty())
        {
            fail("rejection without a description: " + input.substr(0, 40));
        }
    }

    deep_values();

    std::cout << "OK\n";
    return 0;
}
