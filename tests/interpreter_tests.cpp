#include <cinder/parser/parser.h>
#include <cinder/runtime/builtins.h>
#include <cinder/runtime/cancel.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/source/source_file.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace rt = cinder::runtime;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

struct ScriptRun
{
    std::string output;
    std::string error; // "Type: message" when the script raised
    std::string traceback;
    std::optional<rt::Value> last;
};

static std::shared_ptr<const rt::Builtins> builtins()
{
    static const auto table = std::make_shared<const rt::Builtins>(rt::make_builtins());
    return table;
}

static ScriptRun run_script(const std::string& code, const rt::CancelToken* cancel = nullptr,
                            std::size_t output_limit = 1 << 20)
{
    auto parsed = cinder::parser::parse_source(code);
    if (!std::holds_alternative<cinder::parser::Program>(parsed))
    {
        fail("script did not parse:\n" + code);
    }
    auto unit = std::make_shared<const rt::Unit>(cinder::source::from_string(code),
                                                 std::move(std::get<cinder::parser::Program>(parsed)));
    auto globals = std::make_shared<rt::Environment>();
    globals->builtins = builtins();

    rt::OutputSink sink(output_limit);
    rt::Interpreter interp(rt::InterpreterOptions{.cancel = cancel, .out = &sink, .recursion_limit = 200});
    ScriptRun run;
    try
    {
        run.last = interp.exec_program(unit, globals);
    }
    catch (const rt::ScriptError& error)
    {
        run.error = error.what();
        run.traceback = error.format_traceback();
    }
    run.output = sink.text();
    for (const auto& weak : interp.closure_scopes())
    {
        if (auto scope = weak.lock())
        {
            scope->vars.clear();
        }
    }
    globals->vars.clear();
    return run;
}

static void expect_output(const std::string& code, const std::string& expected)
{
    const ScriptRun run = run_script(code);
    if (!run.error.empty())
    {
        fail("script raised " + run.error + ":\n" + code);
    }
    if (run.output != expected)
    {
        fail("output mismatch for:\n" + code + "\ngot:\n" + run.output + "\nexpected:\n" + expected);
    }
}

static void expect_error(const std::string& code, const std::string& expected)
{
    const ScriptRun run = run_script(code);
    if (run.error != expected)
    {
        fail("expected error '" + expected + "' for:\n" + code + "\ngot: '" + run.error + "'");
    }
}

int main()
{
    // Last expression statement is the program's value.
    {
        const ScriptRun run = run_script("print('hi'); 2+2");
        if (run.output != "hi\n" || !run.last.has_value() || !run.last->is_int() || run.last->as_int() != 4)
        {
            fail("expected output hi and value 4");
        }
        const ScriptRun assign = run_script("x = 1");
        if (assign.last.has_value())
        {
            fail("an assignment has no value");
        }
    }

    expect_output("print(1, 'a', None, sep='-', end='!\\n')\n", "1-a-None!\n");

    expect_output("def fib(n):\n"
                  "    a, b = 0, 1\n"
                  "    for _ in range(n):\n"
                  "        a, b = b, a + b\n"
                  "    return a\n"
                  "print([fib(i) for i in range(10)])\n",
                  "[0, 1, 1, 2, 3, 5, 8, 13, 21, 34]\n");

    expect_output("def counter():\n"
                  "    n = 0\n"
                  "    def step(by=1):\n"
                  "        nonlocal n\n"
                  "        n += by\n"
                  "        return n\n"
                  "    return step\n"
                  "c = counter()\n"
                  "c(); c(); print(c(10))\n",
                  "12\n");

    expect_output("total = 0\n"
                  "def add(v):\n"
                  "    global total\n"
                  "    total += v\n"
                  "add(3); add(4)\n"
                  "print(total)\n",
                  "7\n");

    expect_output("def f(a, *rest, key='k', **extra):\n"
                  "    return (a, rest, key, sorted(extra.items()))\n"
                  "print(f(1, 2, 3, z=9, key='q', y=8))\n"
                  "args = [5, 6]\n"
                  "print(f(*args, **{'m': 1}))\n",
                  "(1, (2, 3), 'q', [('y', 8), ('z', 9)])\n(5, (6,), 'k', [('m', 1)])\n");

    expect_output("first, *middle, last = range(5)\n"
                  "print(first, middle, last)\n",
                  "0 [1, 2, 3] 4\n");

    expect_output("xs = [3, 1, 2]\n"
                  "print(sorted(xs, reverse=True), xs[::-1], xs[1:], max(xs, key=lambda v: -v))\n",
                  "[3, 2, 1] [2, 1, 3] [1, 2] 1\n");

    expect_output("d = {k: k * k for k in range(4) if k % 2 == 0}\n"
                  "s = {c for c in 'hello'}\n"
                  "print(d, len(s), sum(x for x in range(5)))\n",
                  "{0: 0, 2: 4} 4 10\n");

    expect_output("for i in range(3):\n"
                  "    if i == 5:\n"
                  "        break\n"
                  "else:\n"
                  "    print('no break')\n"
                  "n = 0\n"
                  "while True:\n"
                  "    n += 1\n"
                  "    if n < 3:\n"
                  "        continue\n"
                  "    break\n"
                  "print(n)\n",
                  "no break\n3\n");

    expect_output("name = 'cinder'\n"
                  "width = 8\n"
                  "print(f'{name!r:>{width}}|{3.14159:.2f}|{name.upper()}|{{x}}')\n",
                  "'cinder'|3.14|CINDER|{x}\n");

    expect_output("def parse(text):\n"
                  "    try:\n"
                  "        return int(text)\n"
                  "    except ValueError as e:\n"
                  "        print('bad:', e)\n"
                  "        return None\n"
                  "    finally:\n"
                  "        print('done', text)\n"
                  "print(parse('12'), parse('x'))\n",
                  "done 12\nbad: invalid literal for int() with base 10: 'x'\ndone x\n12 None\n");

    expect_output("try:\n"
                  "    try:\n"
                  "        {}['missing']\n"
                  "    except KeyError as e:\n"
                  "        raise RuntimeError('wrapped') from e\n"
                  "except Exception as outer:\n"
                  "    print(type(outer).__name__, outer, outer.args)\n"
                  "else:\n"
                  "    print('unreachable')\n",
                  "RuntimeError wrapped ('wrapped',)\n");

    expect_output("try:\n"
                  "    raise ValueError('x')\n"
                  "except (TypeError, ValueError):\n"
                  "    print('caught tuple')\n"
                  "try:\n"
                  "    pass\n"
                  "except Exception:\n"
                  "    pass\n"
                  "else:\n"
                  "    print('else ran')\n",
                  "caught tuple\nelse ran\n");

    expect_output("x = [1, 2, 3]\n"
                  "del x[0]\n"
                  "y = x\n"
                  "y.append(4)\n"
                  "print(x, x is y, x == [2, 3, 4], 3 in x)\n",
                  "[2, 3, 4] True True True\n");

    expect_output("print(isinstance(True, int), isinstance(1.0, (int, float)), type(1) is int)\n",
                  "True True True\n");

    expect_output("import math\n"
                  "from json import dumps as d\n"
                  "print(math.sqrt(16), d({'a': [1, None]}))\n",
                  "4.0 {\"a\": [1, null]}\n");

    expect_error("print(undefined_name)\n", "NameError: name 'undefined_name' is not defined");
    expect_error("1/0\n", "ZeroDivisionError: division by zero");
    expect_error("import numpy\n", "ModuleNotFoundError: No module named 'numpy'");
    expect_error("x = 9223372036854775807\nx + 1\n", "OverflowError: integer overflow");
    expect_error("assert 1 == 2, 'math is broken'\n", "AssertionError: math is broken");
    expect_error("def f(n):\n    return f(n + 1)\nf(0)\n", "RecursionError: maximum recursion depth exceeded");
    expect_error("None()\n", "TypeError: 'NoneType' object is not callable");
    expect_error("raise ValueError\n", "ValueError");

    // Tracebacks name the file, line and function of every frame.
    {
        const ScriptRun run = run_script("def inner():\n"
                                         "    raise KeyError('k')\n"
                                         "def outer():\n"
                                         "    inner()\n"
                                         "outer()\n");
        const std::string expected = "Traceback (most recent call last):\n"
                                     "  File \"<string>\", line 5, in <module>\n"
                                     "  File \"<string>\", line 4, in outer\n"
                                     "  File \"<string>\", line 2, in inner\n"
                                     "KeyError: 'k'\n";
        if (run.traceback != expected)
        {
            fail("traceback mismatch:\n" + run.traceback);
        }
    }

    // Output beyond the sink limit is dropped and flagged.
    {
        rt::OutputSink sink(4);
        sink.write("abc");
        sink.write("defg");
        if (sink.text() != "abcd" || !sink.truncated())
        {
            fail("sink should keep the first four bytes and flag truncation");
        }
    }

    // A cancelled run stops with Interrupted, which neither except nor finally observes.
    {
        rt::CancelToken cancel;
        cancel.cancel();
        bool interrupted = false;
        try
        {
            (void)run_script("try:\n"
                             "    while True:\n"
                             "        pass\n"
                             "except BaseException:\n"
                             "    print('caught')\n"
                             "finally:\n"
                             "    print('finally')\n",
                             &cancel);
        }
        catch (const rt::Interrupted&)
        {
            interrupted = true;
        }
        if (!interrupted)
        {
            fail("expected Interrupted to escape the script");
        }
    }

    std::cout << "OK\n";
    return 0;
}
