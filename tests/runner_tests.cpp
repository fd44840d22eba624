#include <cinder/json/json.h>
#include <cinder/runtime/format.h>
#include <cinder/sandbox/runner.h>
#include <cstdlib>
#include <iostream>
#include <string>

namespace rt = cinder::runtime;
using namespace cinder::sandbox;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static RawOutcome run_code(const std::string& code, const PersistedState& state = {},
                           RunOptions options = RunOptions{.limit_address_space = false})
{
    const rt::CancelToken cancel;
    return run(code, state, options, cancel);
}

static std::string result_text(const RawOutcome& outcome)
{
    return outcome.result ? cinder::json::serialize(*outcome.result) : "<none>";
}

int main()
{
    if (last_segment("a = 1; b = 2\n  c  \n\n") != std::optional<std::string>("c") || last_segment(" ;\n ").has_value())
    {
        fail("last_segment");
    }
    if (memory_error_message(100 * 1024 * 1024) != "MemoryError: Exceeded memory limit of 100.0MB" ||
        memory_error_message(1536 * 1024) != "MemoryError: Exceeded memory limit of 1.5MB")
    {
        fail("memory_error_message: " + memory_error_message(100 * 1024 * 1024));
    }
    if (!current_address_space().has_value())
    {
        fail("/proc/self/statm should be readable");
    }

    // Output and the final expression's value.
    {
        RawOutcome outcome = run_code("print('hi'); 2+2");
        if (outcome.kind != ErrorKind::None || outcome.output != "hi\n" || result_text(outcome) != "4")
        {
            fail("print and final expression: " + outcome.output + " / " + result_text(outcome));
        }
        outcome.discard();
    }

    // A compound last statement recovers its value from the final segment.
    {
        RawOutcome outcome = run_code("x = 1\nif x:\n    x + 1");
        if (!outcome.succeeded() || result_text(outcome) != "2")
        {
            fail("final segment fallback: " + result_text(outcome));
        }
        outcome.discard();
    }
    {
        RawOutcome outcome = run_code("x = 1");
        if (!outcome.succeeded() || outcome.result.has_value())
        {
            fail("an assignment has no result");
        }
        outcome.discard();
    }

    // Top-level bindings are captured; the builder's own names are not.
    {
        RawOutcome outcome = run_code("import math\nx = 41\ndef f():\n    return x + 1\n");
        if (outcome.bindings.count("x") != 1 || outcome.bindings.count("f") != 1 ||
            outcome.bindings.count("math") != 1 || outcome.bindings.count("__name__") != 0)
        {
            fail("bindings should hold x, f and math");
        }
        // Functions keep the globals of the run that defined them, so the first run stays alive.
        PersistedState state = std::move(outcome.bindings);
        RawOutcome next = run_code("y = f()\ny", state);
        if (!next.succeeded() || result_text(next) != "42" || next.bindings.count("y") != 1)
        {
            fail("persisted bindings should be visible to the next run: " + next.error);
        }
        next.discard();
        state.clear();
        outcome.discard();
    }

    // Faults carry the type, message and traceback; output written before the fault survives.
    {
        RawOutcome outcome = run_code("print('before')\n1/0\n");
        const std::string expected = "ZeroDivisionError: division by zero\n"
                                     "Traceback:\n"
                                     "Traceback (most recent call last):\n"
                                     "  File \"<string>\", line 2, in <module>\n"
                                     "ZeroDivisionError: division by zero\n";
        if (outcome.kind != ErrorKind::RuntimeFault || outcome.error != expected || outcome.output != "before\n")
        {
            fail("runtime fault:\n" + outcome.error);
        }
        if (outcome.result.has_value() || !outcome.bindings.empty())
        {
            fail("a failed run has no result and no bindings");
        }
        outcome.discard();
    }

    {
        RawOutcome outcome = run_code("x = (");
        if (outcome.kind != ErrorKind::RuntimeFault || outcome.error.rfind("SyntaxError: ", 0) != 0)
        {
            fail("syntax errors should be reported as SyntaxError: " + outcome.error);
        }
    }

    // The per-run budget turns runaway allocation into MemoryError.
    {
        RawOutcome outcome = run_code("data = [0] * 10**8", {},
                                      RunOptions{.memory_limit_bytes = 1024 * 1024, .limit_address_space = false});
        if (outcome.kind != ErrorKind::MemoryExceeded ||
            outcome.error != "MemoryError: Exceeded memory limit of 1.0MB")
        {
            fail("memory limit: " + outcome.error);
        }
        outcome.discard();
    }
    {
        RawOutcome outcome = run_code("s = 'x'\nwhile True:\n    s = s + s\n", {},
                                      RunOptions{.memory_limit_bytes = 4 * 1024 * 1024, .limit_address_space = false});
        if (outcome.kind != ErrorKind::MemoryExceeded)
        {
            fail("doubling string should exhaust the budget: " + outcome.error);
        }
        outcome.discard();
    }

    // Output beyond the cap is cut and marked.
    {
        RawOutcome outcome = run_code("print('abcdefgh')", {},
                                      RunOptions{.max_output_bytes = 4, .limit_address_space = false});
        if (outcome.output != "abcd" + std::string(kOutputTruncatedMarker))
        {
            fail("truncated output: " + outcome.output);
        }
        outcome.discard();
    }

    // A cancelled token stops the run as a timeout.
    {
        rt::CancelToken cancel;
        cancel.cancel();
        RawOutcome outcome = run("while True:\n    pass\n", {}, RunOptions{.limit_address_space = false}, cancel);
        if (outcome.kind != ErrorKind::TimedOut || outcome.error != kInterruptedMessage)
        {
            fail("cancelled run: " + outcome.error);
        }
        outcome.discard();
    }

    // The address-space ceiling is applied and restored around a run.
    {
        rlimit before{};
        getrlimit(RLIMIT_AS, &before);
        {
            ScopedAddressLimit limit(64 * 1024 * 1024);
            rlimit during{};
            getrlimit(RLIMIT_AS, &during);
            if (limit.active() && during.rlim_cur == RLIM_INFINITY)
            {
                fail("RLIMIT_AS should be lowered while the scope is active");
            }
        }
        rlimit after{};
        getrlimit(RLIMIT_AS, &after);
        if (after.rlim_cur != before.rlim_cur)
        {
            fail("RLIMIT_AS should be restored");
        }

        RawOutcome outcome = run_code("sum(range(1000))", {}, RunOptions{});
        if (!outcome.succeeded() || result_text(outcome) != "499500")
        {
            fail("run under the address-space ceiling: " + outcome.error);
        }
        outcome.discard();
    }

    // Expressions evaluate in a fresh namespace.
    {
        const rt::CancelToken cancel;
        RawOutcome outcome = run_expression("[n * n for n in range(4)]", RunOptions{.limit_address_space = false}, cancel);
        if (!outcome.succeeded() || result_text(outcome) != "[0,1,4,9]")
        {
            fail("run_expression: " + outcome.error);
        }
        outcome.discard();

        RawOutcome missing = run_expression("x + 1", RunOptions{.limit_address_space = false}, cancel);
        if (missing.kind != ErrorKind::RuntimeFault || missing.error.rfind("NameError: name 'x' is not defined", 0) != 0)
        {
            fail("run_expression should not see other state: " + missing.error);
        }
        missing.discard();
    }

    std::cout << "OK\n";
    return 0;
}
