#include <cinder/parser/parser.h>
#include <cinder/runtime/builtins.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/interpreter.h>
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

/** @brief Run `code` with the full builtin table; returns its output, or "!Type: message" on error. */
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
    // Conversions.
    expect_run("print(int('ff', 16), int(' 42 '), int(3.9), float('1e3'), str(2.50), bool(''))\n",
               "255 42 3 1000.0 2.5 False\n");
    expect_run("print(complex('3+4j'), abs(-7), abs(3+4j), round(2.675, 2), round(7.5), divmod(-7, 2))\n",
               "(3+4j) 7 5.0 2.67 8 (-4, 1)\n");
    expect_run("print(bin(10), hex(255), oct(8), chr(97), ord('\\u00e9'))\n", "0b1010 0xff 0o10 a 233\n");
    expect_run("print(list('abc'), tuple([1, 2]), set(), dict(a=1, b=2), list(range(2, 10, 3)))\n",
               "['a', 'b', 'c'] (1, 2) set() {'a': 1, 'b': 2} [2, 5, 8]\n");
    expect_run("print(int('x1'))\n", "!ValueError: invalid literal for int() with base 10: 'x1'");

    // Iteration helpers.
    expect_run("print(list(enumerate('ab', 1)), list(zip([1, 2, 3], 'xy')))\n",
               "[(1, 'a'), (2, 'b')] [(1, 'x'), (2, 'y')]\n");
    expect_run("print(list(map(lambda v: v * 2, [1, 2])), list(filter(None, [0, 1, '', 'a'])))\n",
               "[2, 4] [1, 'a']\n");
    expect_run("print(any([0, 0, 1]), all([]), sum([0.5, 0.25], 1), min([], default=-1), max(3, 9, 4))\n",
               "True True 1.75 -1 9\n");
    expect_run("print(list(reversed([1, 2, 3])), sorted(['b', 'A', 'c'], key=lambda s: s.lower()))\n",
               "[3, 2, 1] ['A', 'b', 'c']\n");
    expect_run("it = iter([1, 2])\nprint(next(it), next(it), next(it, 'done'))\n", "1 2 done\n");
    expect_run("print(max([]))\n", "!ValueError: max() iterable argument is empty");

    // Strings.
    expect_run("s = '  Hello, World  '\n"
               "print(s.strip().lower(), s.split(), '-'.join(['a', 'b']), s.strip().replace('l', 'L', 2))\n",
               "hello, world ['Hello,', 'World'] a-b HeLLo, World\n");
    expect_run("print('a,b,,c'.split(','), 'k=v=w'.partition('='), 'x'.center(5, '*'), '7'.zfill(3))\n",
               "['a', 'b', '', 'c'] ('k', '=', 'v=w') **x** 007\n");
    expect_run("print('{} + {} = {total}'.format(1, 2, total=3), '{0}{0}'.format('ab'), '%05.1f' % 3.14159)\n",
               "1 + 2 = 3 abab 003.1\n");
    expect_run("print('abc'.startswith(('x', 'a')), 'abc'.find('z'), 'a1'.isalnum(), 'Title Case'.istitle())\n",
               "True -1 True True\n");
    expect_run("print('abc'[1], 'abc'[-1], 'abcdef'[1:5:2], 'hé'.encode(), b'hi'.decode(), len('hé'))\n",
               "b c bd b'h\\xc3\\xa9' hi 2\n");
    expect_run("'abc'.index('z')\n", "!ValueError: substring not found");

    // Lists.
    expect_run("xs = [5, 3, 8]\n"
               "xs.append(1); xs.insert(0, 9); xs.sort()\n"
               "print(xs, xs.pop(), xs.index(5), xs.count(3))\n"
               "xs.extend((7, 7)); xs.remove(7); xs.reverse()\n"
               "print(xs)\n",
               "[1, 3, 5, 8] 9 2 1\n[7, 8, 5, 3, 1]\n");
    expect_run("xs = [1, 2, 3, 4]\nxs[1:3] = ['a']\ndel xs[-1]\nprint(xs, xs * 2 == xs + xs)\n",
               "[1, 'a'] True\n");
    expect_run("[].pop()\n", "!IndexError: pop from empty list");

    // Dicts keep insertion order.
    expect_run("d = {'b': 1}\n"
               "d['a'] = 2\n"
               "d.setdefault('c', 3)\n"
               "print(list(d), d.get('z', 0), d.pop('b'), sorted(d.items()), 'a' in d)\n"
               "d.update({'a': 9}, e=5)\n"
               "print(d, list(d.values()))\n",
               "['b', 'a', 'c'] 0 1 [('a', 2), ('c', 3)] True\n{'a': 9, 'c': 3, 'e': 5} [9, 3, 5]\n");
    expect_run("print({}['k'])\n", "!KeyError: 'k'");
    expect_run("d = {(1, 2): 'tuple key'}\nprint(d[(1, 2)])\n", "tuple key\n");
    expect_run("d = {[1]: 0}\n", "!TypeError: unhashable type: 'list'");

    // Sets.
    expect_run("a = {1, 2, 3}\n"
               "b = {2, 3, 4}\n"
               "print(sorted(a | b), sorted(a & b), sorted(a - b), sorted(a ^ b), a <= {1, 2, 3, 9})\n",
               "[1, 2, 3, 4] [2, 3] [1] [1, 4] True\n");

    // Numbers.
    expect_run("print(7 // 2, 7 % 3, 2 ** 10, 10 / 4, -3 ** 2, 1 < 2 < 3, 0.1 + 0.2 == 0.3)\n",
               "3 1 1024 2.5 -9 True False\n");
    expect_run("print((255).bit_length(), (2.5).is_integer(), (0.75).as_integer_ratio(), 1e300 * 1e10)\n",
               "8 False (3, 4) inf\n");

    expect_run("print(type(3).__name__, callable(len), isinstance([], list), hash(1) == hash(1.0))\n",
               "int True True True\n");

    std::cout << "OK\n";
    return 0;
}
