#include <cinder/json/json.h>
#include <cinder/runtime/value.h>
#include <cinder/sandbox/normalizer.h>
#include <cinder/sandbox/runner.h>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

namespace rt = cinder::runtime;
using namespace cinder::sandbox;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_json(const rt::Value& value, const std::string& expected, const std::string& what)
{
    const std::string got = cinder::json::serialize(normalize(value));
    if (got != expected)
    {
        fail(what + ": got " + got + " expected " + expected);
    }
}

/** @brief Normalized result of the script's final expression, serialized. */
static std::string script_result(const std::string& code)
{
    const rt::CancelToken cancel;
    RawOutcome outcome = run(code, {}, RunOptions{.limit_address_space = false}, cancel);
    if (!outcome.succeeded() || !outcome.result.has_value())
    {
        fail("script produced no result: " + code + "\n" + outcome.error);
    }
    std::string text = cinder::json::serialize(*outcome.result);
    outcome.discard();
    return text;
}

static void expect_script(const std::string& code, const std::string& expected)
{
    const std::string got = script_result(code);
    if (got != expected)
    {
        fail("result of '" + code + "': got " + got + " expected " + expected);
    }
}

int main()
{
    expect_json(rt::Value::none(), "null", "None");
    expect_json(rt::Value::boolean(true), "true", "bool");
    expect_json(rt::Value::integer(-42), "-42", "int");
    expect_json(rt::Value::real(2.5), "2.5", "float");
    expect_json(rt::Value::real(std::numeric_limits<double>::infinity()), "\"inf\"", "infinite float as text");
    expect_json(rt::Value::real(std::nan("")), "\"nan\"", "nan as text");
    expect_json(rt::Value::complex({3.0, 4.0}), "[3.0,4.0]", "complex as pair");
    expect_json(rt::make_str("h\xC3\xA9"), "\"h\xC3\xA9\"", "str");
    expect_json(rt::make_bytes("text"), "\"text\"", "UTF-8 bytes decode");
    expect_json(rt::make_bytes(std::string("\xff\xfe\x00", 3)), "\"<binary data: 3 bytes>\"", "binary bytes");
    expect_json(rt::make_tuple({rt::Value::integer(1), rt::make_str("a")}), "[1,\"a\"]", "tuple as array");
    expect_json(rt::make_range(0, 6, 2), "[0,2,4]", "range as array");
    expect_json(rt::make_array('d', {rt::Value::real(1.0), rt::Value::real(0.5)}), "[1.0,0.5]", "float array");
    expect_json(rt::make_array('i', {rt::Value::integer(7)}), "[7]", "int array");
    expect_json(rt::make_set(), "[]", "empty set");

    // A list that contains itself converts the inner occurrence to its repr.
    {
        const rt::Value list = rt::make_list({rt::Value::integer(1)});
        list.as<rt::ListObject>()->items.push_back(list);
        expect_json(list, "[1,\"[1, [...]]\"]", "self-referencing list");
        list.as<rt::ListObject>()->items.clear();
    }

    // The same object seen twice side by side is not a cycle.
    {
        const rt::Value inner = rt::make_list({rt::Value::integer(2)});
        expect_json(rt::make_list({inner, inner}), "[[2],[2]]", "shared element");
    }

    expect_script("{'b': 1, 'a': [1, 2]}", "{\"b\":1,\"a\":[1,2]}");
    expect_script("{1: 'one', None: 0, True: 't', (1, 2): 'pair'}", "{\"1\":\"t\",\"null\":0,\"(1, 2)\":\"pair\"}");
    expect_script("sorted({3, 1, 2})", "[1,2,3]");
    expect_script("{5}", "[5]");
    expect_script("len", "\"<built-in function len>\"");
    if (script_result("def f():\n    pass\nf").rfind("\"<function f at ", 0) != 0)
    {
        fail("functions normalize to their repr");
    }

    // Results always carry four keys in a fixed order.
    {
        ExecutionResult ok;
        ok.success = true;
        ok.output = "hi\n";
        ok.result = cinder::json::Json{std::int64_t{4}};
        if (serialize_result(ok) != "{\"success\":true,\"output\":\"hi\\n\",\"error\":null,\"result\":4}")
        {
            fail("success result serialization: " + serialize_result(ok));
        }
        ExecutionResult failed;
        failed.error = "ValueError: x";
        if (serialize_result(failed) != "{\"success\":false,\"output\":\"\",\"error\":\"ValueError: x\",\"result\":null}")
        {
            fail("failure result serialization: " + serialize_result(failed));
        }
    }

    std::cout << "OK\n";
    return 0;
}
