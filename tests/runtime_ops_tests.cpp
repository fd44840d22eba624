#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/ops.h>
#include <cinder/runtime/value.h>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <limits>
#include <string>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_eq(const std::string& got, const std::string& expected, const std::string& what)
{
    if (got != expected)
    {
        fail(what + ": got '" + got + "' expected '" + expected + "'");
    }
}

static void expect_raises(const std::function<void()>& body, const std::string& type, const std::string& message,
                          const std::string& what)
{
    try
    {
        body();
    }
    catch (const cinder::runtime::ScriptError& error)
    {
        if (error.type_name() != type)
        {
            fail(what + ": expected " + type + ", got " + error.type_name());
        }
        if (!message.empty() && error.message() != message)
        {
            fail(what + ": unexpected message '" + error.message() + "'");
        }
        return;
    }
    fail(what + ": expected " + type + " to be raised");
}

int main()
{
    using cinder::lexer::TokenKind;
    using cinder::runtime::Value;
    namespace rt = cinder::runtime;

    // Numeric tower.
    {
        const Value sum = rt::binary_op(TokenKind::Plus, Value::integer(2), Value::integer(2));
        if (!sum.is_int() || sum.as_int() != 4)
        {
            fail("2 + 2 should be int 4");
        }
        const Value quotient = rt::binary_op(TokenKind::Slash, Value::integer(7), Value::integer(2));
        if (!quotient.is_float() || quotient.as_float() != 3.5)
        {
            fail("7 / 2 should be float 3.5");
        }
        const Value floor = rt::binary_op(TokenKind::DoubleSlash, Value::integer(-7), Value::integer(2));
        if (!floor.is_int() || floor.as_int() != -4)
        {
            fail("-7 // 2 should floor to -4");
        }
        const Value mod = rt::binary_op(TokenKind::Percent, Value::integer(-7), Value::integer(3));
        if (!mod.is_int() || mod.as_int() != 2)
        {
            fail("-7 % 3 should take the sign of the divisor");
        }
        const Value mixed = rt::binary_op(TokenKind::Star, Value::boolean(true), Value::real(2.5));
        if (!mixed.is_float() || mixed.as_float() != 2.5)
        {
            fail("True * 2.5 should be 2.5");
        }
        const Value z = rt::binary_op(TokenKind::Plus, Value::integer(3), Value::complex({0.0, 4.0}));
        if (!z.is_complex() || z.as_complex() != std::complex<double>(3.0, 4.0))
        {
            fail("3 + 4j should be complex");
        }
        const Value p = rt::power(Value::integer(2), Value::integer(-1));
        if (!p.is_float() || p.as_float() != 0.5)
        {
            fail("2 ** -1 should be 0.5");
        }
    }

    expect_raises([] { (void)rt::binary_op(TokenKind::Slash, Value::integer(1), Value::integer(0)); },
                  "ZeroDivisionError", "division by zero", "int division by zero");
    expect_raises(
        [] {
            (void)rt::binary_op(TokenKind::Plus, Value::integer(std::numeric_limits<std::int64_t>::max()),
                                Value::integer(1));
        },
        "OverflowError", "integer overflow", "int64 overflow");
    expect_raises([] { (void)rt::binary_op(TokenKind::Plus, Value::integer(1), rt::make_str("a")); }, "TypeError",
                  "unsupported operand type(s) for +: 'int' and 'str'", "mixed operand types");

    // Sequences.
    {
        const Value joined = rt::binary_op(TokenKind::Plus, rt::make_str("ab"), rt::make_str("cd"));
        expect_eq(rt::to_str(joined), "abcd", "str concatenation");
        const Value repeated = rt::binary_op(TokenKind::Star, rt::make_list({Value::integer(0)}), Value::integer(3));
        expect_eq(rt::repr(repeated), "[0, 0, 0]", "list repetition");
        if (rt::length(rt::make_str("h\xC3\xA9llo")) != 5)
        {
            fail("len counts code points, not bytes");
        }
    }

    // repr and str.
    expect_eq(rt::repr(Value::none()), "None", "repr None");
    expect_eq(rt::repr(Value::boolean(false)), "False", "repr bool");
    expect_eq(rt::repr(rt::make_str("it's")), "\"it's\"", "repr picks double quotes around a single quote");
    expect_eq(rt::repr(rt::make_str("a\nb")), "'a\\nb'", "repr escapes newlines");
    expect_eq(rt::to_str(rt::make_str("plain")), "plain", "str of str");
    expect_eq(rt::repr(rt::make_tuple({Value::integer(1)})), "(1,)", "one-tuple repr");
    expect_eq(rt::repr(rt::make_bytes(std::string("a\x00", 2))), "b'a\\x00'", "bytes repr");
    expect_eq(rt::repr(Value::complex({3.0, 4.0})), "(3+4j)", "complex repr");
    expect_eq(rt::repr(rt::make_range(0, 5, 1)), "range(0, 5)", "range repr");
    expect_eq(rt::repr(rt::make_set()), "set()", "empty set repr");

    expect_eq(rt::float_repr(0.1), "0.1", "shortest float repr");
    expect_eq(rt::float_repr(4.0), "4.0", "whole float keeps .0");
    expect_eq(rt::float_repr(1e16), "1e+16", "large floats switch to exponent form");
    expect_eq(rt::float_repr(1e-5), "1e-05", "small floats switch to exponent form");
    expect_eq(rt::float_repr(std::nan("")), "nan", "nan repr");
    expect_eq(rt::float_repr(-std::numeric_limits<double>::infinity()), "-inf", "negative infinity repr");

    expect_eq(rt::type_name(Value::integer(1)), "int", "type name int");
    expect_eq(rt::type_name(rt::make_dict()), "dict", "type name dict");

    // Format specs.
    expect_eq(rt::format_value(Value::real(3.14159), ".2f"), "3.14", "fixed precision");
    expect_eq(rt::format_value(Value::integer(42), ">5"), "   42", "right align");
    expect_eq(rt::format_value(Value::integer(1234567), ","), "1,234,567", "thousands separator");
    expect_eq(rt::format_value(Value::integer(255), "#x"), "0xff", "alternate hex");
    expect_eq(rt::format_value(rt::make_str("ab"), "*^6"), "**ab**", "centered fill");
    expect_eq(rt::format_value(Value::real(0.5), ".0%"), "50%", "percent");
    expect_raises([] { (void)rt::format_value(rt::make_str("x"), "d"); }, "ValueError", "",
                  "integer code on a string");

    expect_eq(rt::percent_format("%d-%s", rt::make_tuple({Value::integer(7), rt::make_str("x")})), "7-x",
              "printf-style formatting");
    expect_eq(rt::percent_format("%.1f%%", Value::real(99.44)), "99.4%", "single argument and literal percent");

    // Hashing and equality across numeric types.
    if (!rt::values_equal(Value::integer(1), Value::real(1.0)) ||
        rt::hash_value(Value::integer(1)) != rt::hash_value(Value::real(1.0)) ||
        rt::hash_value(Value::boolean(true)) != rt::hash_value(Value::integer(1)))
    {
        fail("1, 1.0 and True must compare and hash equal");
    }
    if (!rt::less_than(rt::make_str("abc"), rt::make_str("abd")))
    {
        fail("strings order lexicographically");
    }
    expect_raises([] { (void)rt::less_than(Value::integer(1), rt::make_str("a")); }, "TypeError", "",
                  "ordering across unrelated types");

    // Truthiness.
    if (rt::truthy(rt::make_list({})) || !rt::truthy(rt::make_str(" ")) || rt::truthy(Value::real(0.0)))
    {
        fail("truthiness mismatch");
    }

    // Indexing helpers.
    if (rt::normalize_index(-1, 3, "list") != 2)
    {
        fail("negative index wraps");
    }
    expect_raises([] { (void)rt::normalize_index(3, 3, "list"); }, "IndexError", "list index out of range",
                  "index past the end");

    std::cout << "OK\n";
    return 0;
}
