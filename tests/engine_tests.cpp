#include <cinder/json/json.h>
#include <cinder/policy/checker.h>
#include <cinder/sandbox/engine.h>
#include <cinder/sandbox/normalizer.h>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace cinder::sandbox;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static EngineConfig test_config()
{
    EngineConfig config;
    config.limit_address_space = false;
    return config;
}

static std::string result_text(const ExecutionResult& result)
{
    return result.result ? cinder::json::serialize(*result.result) : "<none>";
}

static void expect_success(const ExecutionResult& result, const std::string& output, const std::string& value,
                           const std::string& what)
{
    if (!result.success || result.error.has_value())
    {
        fail(what + ": expected success, got error " + result.error.value_or("<none>"));
    }
    if (result.output != output || result_text(result) != value)
    {
        fail(what + ": got output '" + result.output + "' result " + result_text(result));
    }
}

static void expect_failure(const ExecutionResult& result, const std::string& error_prefix, const std::string& what)
{
    if (result.success || !result.error.has_value() || result.error->rfind(error_prefix, 0) != 0)
    {
        fail(what + ": expected error starting with '" + error_prefix + "', got '" + result.error.value_or("<none>") +
             "'");
    }
    if (result.result.has_value())
    {
        fail(what + ": failed requests carry no result");
    }
}

static const std::string kSecurity(cinder::policy::kSecurityErrorMessage);

int main()
{
    {
        Session session(test_config());
        const ExecutionResult result = session.execute("print('hi'); 2+2", 5, 100 * 1024 * 1024);
        expect_success(result, "hi\n", "4", "print and value");
        if (serialize_result(result) != "{\"success\":true,\"output\":\"hi\\n\",\"error\":null,\"result\":4}")
        {
            fail("serialized result: " + serialize_result(result));
        }
    }

    // State persists across requests on one session.
    {
        Session session(test_config());
        expect_success(session.execute("x = 1"), "", "<none>", "assignment");
        expect_success(session.execute("x + 1"), "", "2", "read persisted x");
        expect_success(session.execute("import math\ndef area(r):\n    return math.pi * r * r\n"), "", "<none>",
                       "define function");
        expect_success(session.execute("round(area(2), 3)"), "", "12.566", "call persisted function");
        expect_success(session.execute("items = []\nitems.append(x)"), "", "null", "list binding");
        expect_success(session.execute("items.append(2)\nitems"), "", "[1,2]", "mutate persisted list");

        const std::vector<std::string> expected = {"area", "items", "math", "x"};
        if (session.state_names() != expected)
        {
            fail("state_names should list the persisted bindings");
        }

        // Failed requests leave state alone.
        expect_failure(session.execute("y = 5\n1/0"), "ZeroDivisionError: division by zero", "runtime fault");
        expect_failure(session.execute("import os\nz = 1"), kSecurity, "blocked import");
        if (session.state_names() != expected)
        {
            fail("failed requests must not change state");
        }

        session.reset();
        if (!session.state_names().empty())
        {
            fail("reset should clear state");
        }
        expect_failure(session.execute("x"), "NameError: name 'x' is not defined", "state after reset");
    }

    // Read-only code gives the same answer every time it runs against the same state.
    {
        Session session(test_config());
        expect_success(session.execute("data = [3, 1, 2]"), "", "<none>", "bind data");
        const std::string code = "print(sorted(data))\nsum(data) * 2";
        const ExecutionResult first = session.execute(code);
        const ExecutionResult second = session.execute(code);
        expect_success(first, "[1, 2, 3]\n", "12", "first read");
        if (second.output != first.output || result_text(second) != result_text(first) ||
            second.success != first.success)
        {
            fail("repeated read-only run should be identical: " + serialize_result(second));
        }
        expect_success(session.execute("data"), "", "[3,1,2]", "reads leave state unchanged");
    }

    // Sessions running at the same time capture only their own output.
    {
        const auto worker = [](const std::string& word, std::string& mismatch) {
            Session session(test_config());
            std::string expected;
            for (int i = 0; i < 200; ++i)
            {
                expected += word + "\n";
            }
            for (int round = 0; round < 20 && mismatch.empty(); ++round)
            {
                const ExecutionResult result =
                    session.execute("for i in range(200):\n    print('" + word + "')\n", 10);
                if (!result.success || result.output != expected)
                {
                    mismatch = word + " round " + std::to_string(round) + ": " + serialize_result(result);
                }
            }
        };
        std::string alpha_mismatch;
        std::string beta_mismatch;
        std::thread alpha(worker, std::string("alpha"), std::ref(alpha_mismatch));
        std::thread beta(worker, std::string("beta"), std::ref(beta_mismatch));
        alpha.join();
        beta.join();
        if (!alpha_mismatch.empty() || !beta_mismatch.empty())
        {
            fail("concurrent sessions mixed their output: " + alpha_mismatch + beta_mismatch);
        }
    }

    // Policy rejections name the offending construct and its line.
    {
        Session session(test_config());
        const ExecutionResult result = session.execute("total = 0\nimport os");
        if (result.error != kSecurity + "\nimport of blocked module 'os' (line 2)")
        {
            fail("rejection text: " + result.error.value_or("<none>"));
        }
        if (result.output != "")
        {
            fail("rejected code must not run");
        }
        expect_failure(session.execute("open('/etc/passwd').read()"), kSecurity, "open");
        expect_failure(session.execute("from subprocess import run"), kSecurity, "from-import");
        expect_failure(session.execute("def f():\n    return eval('1')\n"), kSecurity, "nested eval");
        expect_failure(session.execute("x = (\n"), kSecurity + "\nSyntaxError: ", "unparsable code");
    }

    // Memory and time limits.
    {
        Session session(test_config());
        const ExecutionResult big = session.execute("data = [0] * 10**8", 5, 1024 * 1024);
        if (big.error != "MemoryError: Exceeded memory limit of 1.0MB")
        {
            fail("memory limit error: " + big.error.value_or("<none>"));
        }
        expect_success(session.execute("data = [0] * 1000\nlen(data)", 5, 1024 * 1024), "", "1000",
                       "small allocation under the same limit");

        const ExecutionResult slow = session.execute("n = 0\nwhile True:\n    n += 1\n", 1);
        if (slow.success || slow.error.value_or("").find("timed out") == std::string::npos)
        {
            fail("infinite loop should time out: " + slow.error.value_or("<none>"));
        }
        if (session.last_state() != RunState::TimedOut)
        {
            fail("last_state should report the timeout");
        }
        expect_success(session.execute("data[:3]"), "", "[0,0,0]", "session usable after a timeout");
        expect_failure(session.execute("n"), "NameError", "timed-out bindings are not persisted");
    }

    // Missing or non-positive limits use the configured defaults.
    {
        EngineConfig config = test_config();
        config.default_memory_limit_bytes = 2 * 1024 * 1024;
        Session session(config);
        const ExecutionResult result = session.execute("[0] * 10**8", 0, 0);
        if (result.error != "MemoryError: Exceeded memory limit of 2.0MB")
        {
            fail("default memory limit: " + result.error.value_or("<none>"));
        }
        ExecutionRequest request;
        request.code = "6 * 7";
        expect_success(session.execute(request), "", "42", "request struct");
    }

    // Expressions run in a fresh namespace and never touch session state.
    {
        Session session(test_config());
        expect_success(session.execute("secret = 7"), "", "<none>", "bind secret");
        expect_success(session.evaluate("2 ** 10"), "", "1024", "evaluate");
        expect_success(session.evaluate("{'a': (1, 2)}"), "", "{\"a\":[1,2]}", "evaluate dict");
        expect_failure(session.evaluate("secret"), "NameError", "evaluate cannot see session state");
        expect_failure(session.evaluate("eval('1')"), kSecurity, "evaluate policy");
        expect_failure(session.evaluate("x = 1"), kSecurity + "\nSyntaxError: ", "statement is not an expression");
        if (session.state_names() != std::vector<std::string>{"secret"})
        {
            fail("evaluate must not write state");
        }
    }

    // One-shot helpers.
    expect_success(execute_code("print(sum(range(5)))"), "10\n", "null", "execute_code");
    expect_success(evaluate_expression("'ab' * 2"), "", "\"abab\"", "evaluate_expression");

    std::cout << "OK\n";
    return 0;
}
