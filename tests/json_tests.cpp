#include <cinder/json/json.h>
#include <cstdlib>
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

int main()
{
    using cinder::json::Json;

    {
        const auto parsed = cinder::json::parse(R"({"a": [1, 2.5, "x", null, true], "b": {"c": -3}})");
        if (!parsed.has_value() || !parsed->is_object())
        {
            fail("expected an object");
        }
        const Json* a = parsed->find("a");
        if (a == nullptr || !a->is_array() || a->as_array()->size() != 5)
        {
            fail("expected a five element array under a");
        }
        const auto& items = *a->as_array();
        if (!items[0].is_int() || !items[1].is_double() || !items[2].is_string() || !items[3].is_null() ||
            !items[4].is_bool())
        {
            fail("unexpected element kinds");
        }
        const auto inner = cinder::json::get_object(*parsed, "b");
        if (!inner.has_value() || cinder::json::get_number(*inner, "c") != -3.0)
        {
            fail("expected b.c == -3");
        }
        expect_eq(cinder::json::serialize(*parsed), R"({"a":[1,2.5,"x",null,true],"b":{"c":-3}})", "compact");
        expect_eq(cinder::json::serialize_pretty(*parsed, std::nullopt),
                  R"({"a": [1, 2.5, "x", null, true], "b": {"c": -3}})", "spaced");
    }

    // Objects keep insertion order and set() replaces in place.
    {
        Json obj = cinder::json::make_object();
        obj.set("success", Json{true});
        obj.set("output", Json{std::string("hi\n")});
        obj.set("error", Json{nullptr});
        obj.set("success", Json{false});
        expect_eq(cinder::json::serialize(obj), R"({"success":false,"output":"hi\n","error":null})", "ordered");
    }

    {
        const auto s = cinder::json::parse(R"("tab\tquote\" é 😀")");
        if (!s.has_value() || s->as_string() == nullptr)
        {
            fail("expected a string");
        }
        expect_eq(*s->as_string(), "tab\tquote\" \xC3\xA9 \xF0\x9F\x98\x80", "unicode escapes decode to UTF-8");
        expect_eq(cinder::json::escape(std::string("a\x01\n")), "a\\u0001\\n", "control characters escape");
    }

    expect_eq(cinder::json::format_double(4.0), "4.0", "whole double keeps a fraction");
    expect_eq(cinder::json::format_double(0.1), "0.1", "shortest round-trip");
    expect_eq(cinder::json::serialize(Json{std::numeric_limits<double>::infinity()}), "null", "non-finite");

    {
        const auto r = cinder::json::parse_document("[1, 2] 3");
        const auto* err = std::get_if<cinder::json::ParseError>(&r);
        if (err == nullptr || err->message != "Extra data" || err->offset != 7)
        {
            fail("expected Extra data at offset 7");
        }
    }

    {
        const auto r = cinder::json::parse_document("{\"a\": }");
        const auto* err = std::get_if<cinder::json::ParseError>(&r);
        if (err == nullptr || err->message != "Expecting value")
        {
            fail("expected Expecting value");
        }
    }

    if (cinder::json::parse("{\"a\": 1").has_value() || cinder::json::parse("").has_value())
    {
        fail("truncated documents must not parse");
    }

    {
        const auto big = cinder::json::parse("12345678901234567890");
        if (!big.has_value() || !big->is_double())
        {
            fail("integers beyond int64 should widen to double");
        }
    }

    {
        const auto obj = cinder::json::parse(R"({"name": "tools/call", "id": 7})");
        if (cinder::json::get_string(*obj, "name") != std::optional<std::string>("tools/call") ||
            cinder::json::get_string(*obj, "id").has_value())
        {
            fail("get_string mismatch");
        }
        if (obj->find("missing") != nullptr)
        {
            fail("find should return null for missing keys");
        }
    }

    std::cout << "OK\n";
    return 0;
}
