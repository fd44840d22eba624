#include <algorithm>
#include <cinder/parser/parser.h>
#include <cinder/runtime/builtins.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/modules.h>
#include <cinder/source/source_file.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace rt = cinder::runtime;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static std::string run(const std::string& code)
{
    static const auto builtins = std::make_shared<const rt::Builtins>(rt::make_builtins());

    auto parsed = cinder::parser::parse_source(code);
    if (!std::holds_alternative<cinder::parser::Program>(parsed))
    {
        fail("script did not parse:\n" + code);
    }
    auto unit = std::make_shared<const rt::Unit>(cinder::source::from_string(code),
                                                 std::move(std::get<cinder::parser::Program>(parsed)));
    auto globals = std::make_shared<rt::Environment>();
    globals->builtins = builtins;

    rt::OutputSink sink(1 << 16);
    rt::Interpreter interp(rt::InterpreterOptions{.cancel = nullptr, .out = &sink, .recursion_limit = 200});
    std::string out;
    try
    {
        (void)interp.exec_program(unit, globals);
        out = sink.text();
    }
    catch (const rt::ScriptError& error)
    {
        out = std::string("!") + error.what();
    }
    globals->vars.clear();
    return out;
}

static void expect_run(const std::string& code, const std::string& expected)
{
    const std::string got = run(code);
    if (got != expected)
    {
        fail("mismatch for:\n" + code + "\ngot:\n" + got + "\nexpected:\n" + expected);
    }
}

int main()
{
    {
        const auto& names = rt::native_module_names();
        for (const char* expected : {"array", "cmath", "json", "math", "random", "statistics", "string", "time"})
        {
            if (std::find(names.begin(), names.end(), expected) == names.end())
            {
                fail(std::string("missing native module ") + expected);
            }
        }
    }

    // math
    expect_run("import math\n"
               "print(math.sqrt(2) ** 2 == 2.0, math.floor(-2.5), math.ceil(2.1), math.factorial(10))\n"
               "print(math.gcd(12, 18), math.isqrt(17), math.comb(5, 2), math.pi > 3.14, math.inf)\n"
               "print(math.isclose(0.1 + 0.2, 0.3), math.fsum([0.1] * 10), math.hypot(3, 4), math.prod([2, 3, 4]))\n",
               "False -3 3 3628800\n6 4 10 True inf\nTrue 1.0 5.0 24\n");
    expect_run("import math\nmath.sqrt(-1)\n", "!ValueError: math domain error");
    expect_run("import math\nmath.factorial(-1)\n", "!ValueError: factorial() not defined for negative values");

    // cmath
    expect_run("import cmath\nprint(cmath.sqrt(-4), abs(cmath.rect(2, 0)), cmath.phase(-1+0j) == cmath.pi)\n",
               "2j 2.0 True\n");

    // json
    expect_run("import json\n"
               "text = json.dumps({'b': [1, 2.5, None, True], 'a': 'x'}, sort_keys=True)\n"
               "print(text)\n"
               "back = json.loads(text)\n"
               "print(back['b'], back == {'a': 'x', 'b': [1, 2.5, None, True]})\n"
               "print(json.dumps([1, {'k': 'v'}], indent=2))\n",
               "{\"a\": \"x\", \"b\": [1, 2.5, null, true]}\n"
               "[1, 2.5, None, True] True\n"
               "[\n  1,\n  {\n    \"k\": \"v\"\n  }\n]\n");
    expect_run("import json\n"
               "try:\n"
               "    json.loads('{\"a\": }')\n"
               "except json.JSONDecodeError as e:\n"
               "    print('decode:', e)\n"
               "except ValueError:\n"
               "    print('wrong handler')\n",
               "decode: Expecting value: line 1 column 7 (char 6)\n");
    expect_run("import json\njson.dumps({1, 2})\n", "!TypeError: Object of type set is not JSON serializable");

    // random is reproducible under a seed.
    expect_run("import random\n"
               "random.seed(42)\n"
               "a = [random.randint(1, 100) for _ in range(5)]\n"
               "random.seed(42)\n"
               "b = [random.randint(1, 100) for _ in range(5)]\n"
               "print(a == b, all(1 <= v <= 100 for v in a))\n"
               "xs = list(range(10))\n"
               "random.shuffle(xs)\n"
               "print(sorted(xs) == list(range(10)), random.choice('abc') in 'abc', len(random.sample(xs, 3)))\n"
               "r = random.random()\n"
               "print(0.0 <= r < 1.0)\n",
               "True True\nTrue True 3\nTrue\n");

    // statistics
    expect_run("import statistics as st\n"
               "print(st.mean([1, 2, 3]), st.mean([1, 2, 3, 4]), st.median([3, 1, 2]), st.median([1, 2, 3, 4]))\n"
               "print(st.mode([1, 1, 2]), st.multimode('aabbc'), st.median_low([1, 2, 3, 4]), st.median_high([1, 2, 3, 4]))\n"
               "data = [2, 4, 4, 4, 5, 5, 7, 9]\n"
               "print(round(st.stdev(data), 5), st.pstdev(data), st.quantiles(range(1, 11), n=4))\n",
               "2 2.5 2 2.5\n1 ['a', 'b'] 2 3\n2.13809 2.0 [2.75, 5.5, 8.25]\n");
    expect_run("import statistics\n"
               "try:\n"
               "    statistics.mean([])\n"
               "except statistics.StatisticsError as e:\n"
               "    print(type(e).__name__, e, isinstance(e, ValueError))\n",
               "StatisticsError mean requires at least one data point True\n");

    // string
    expect_run("import string\n"
               "print(string.ascii_lowercase[:5], string.digits, string.capwords('hello   big world'))\n",
               "abcde 0123456789 Hello Big World\n");

    // array
    expect_run("from array import array\n"
               "a = array('i', [1, 2, 3])\n"
               "a.append(4)\n"
               "print(a, a[1:3], sum(a), a.typecode, a.tolist())\n"
               "print(array('d', [1, 2.5]))\n",
               "array('i', [1, 2, 3, 4]) array('i', [2, 3]) 10 i [1, 2, 3, 4]\narray('d', [1.0, 2.5])\n");
    expect_run("import array\narray.array('z')\n",
               "!ValueError: bad typecode (must be b, B, u, h, H, i, I, l, L, q, Q, f or d)");
    expect_run("from array import array\narray('i', [1.5])\n",
               "!TypeError: 'float' object cannot be interpreted as an integer");

    // time
    expect_run("import time\n"
               "start = time.monotonic()\n"
               "time.sleep(0.01)\n"
               "print(time.monotonic() >= start, time.time() > 1600000000, type(time.time_ns()).__name__)\n",
               "True True int\n");

    // Modules are read-only.
    expect_run("import math\nmath.pi = 3\n", "!AttributeError: module 'math' attribute 'pi' is read-only");

    std::cout << "OK\n";
    return 0;
}
