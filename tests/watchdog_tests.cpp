#include <chrono>
#include <cinder/sandbox/runner.h>
#include <cinder/sandbox/watchdog.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace rt = cinder::runtime;
using namespace cinder::sandbox;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static RunnerCall script(std::string code)
{
    return [code = std::move(code)](const rt::CancelToken& cancel) {
        return run(code, {}, RunOptions{.limit_address_space = false}, cancel);
    };
}

static double seconds_since(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

int main()
{
    if (run_state_name(RunState::TimedOut) != "timed-out" || run_state_name(RunState::Idle) != "idle")
    {
        fail("run_state_name");
    }
    if (timeout_message(1) != "ExecutionError: Code timed out after 1 seconds")
    {
        fail("timeout_message: " + timeout_message(1));
    }

    for (const Strategy strategy : {Strategy::Signal, Strategy::Thread})
    {
        const std::string label(strategy_name(strategy));
        Watchdog watchdog;
        if (watchdog.state() != RunState::Idle)
        {
            fail(label + ": new watchdog should be idle");
        }

        RawOutcome ok = watchdog.execute_with_deadline(script("print('fast')"), 5, strategy);
        if (ok.kind != ErrorKind::None || ok.output != "fast\n" || watchdog.state() != RunState::Completed)
        {
            fail(label + ": fast run should complete");
        }
        ok.discard();

        RawOutcome bad = watchdog.execute_with_deadline(script("1/0"), 5, strategy);
        if (bad.kind != ErrorKind::RuntimeFault || watchdog.state() != RunState::Failed)
        {
            fail(label + ": failing run should be reported as failed");
        }
        bad.discard();

        const auto start = std::chrono::steady_clock::now();
        RawOutcome slow = watchdog.execute_with_deadline(script("x = 0\nwhile True:\n    x += 1\n"), 1, strategy);
        const double elapsed = seconds_since(start);
        if (slow.kind != ErrorKind::TimedOut || slow.error.find("timed out") == std::string::npos)
        {
            fail(label + ": infinite loop should time out, got: " + slow.error);
        }
        if (elapsed < 0.9 || elapsed > 3.0)
        {
            fail(label + ": timeout fired after " + std::to_string(elapsed) + "s");
        }
        if (watchdog.state() != RunState::TimedOut || slow.result.has_value() || !slow.bindings.empty())
        {
            fail(label + ": timed-out runs carry no result or bindings");
        }
        if (watchdog.abandoned_workers() != 0)
        {
            fail(label + ": a cooperative loop should stop within the grace period");
        }
    }

    // The thread strategy reports the configured deadline in its message.
    {
        Watchdog watchdog;
        RawOutcome slow = watchdog.execute_with_deadline(script("while True:\n    pass\n"), 1, Strategy::Thread);
        if (slow.error != timeout_message(1))
        {
            fail("thread timeout message: " + slow.error);
        }
    }

    // time.sleep is interruptible.
    {
        Watchdog watchdog;
        const auto start = std::chrono::steady_clock::now();
        RawOutcome slow = watchdog.execute_with_deadline(script("import time\ntime.sleep(30)\n"), 1, Strategy::Auto);
        if (slow.kind != ErrorKind::TimedOut || seconds_since(start) > 3.0)
        {
            fail("sleep should be cut short by the deadline");
        }
    }

    // A call that ignores cancellation is abandoned after the grace period.
    {
        Watchdog watchdog(std::chrono::milliseconds(50));
        RunnerCall stubborn = [](const rt::CancelToken&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            return RawOutcome{};
        };
        RawOutcome outcome = watchdog.execute_with_deadline(std::move(stubborn), 1, Strategy::Thread);
        if (outcome.kind != ErrorKind::TimedOut || watchdog.abandoned_workers() != 1)
        {
            fail("uncooperative worker should be abandoned");
        }
        // Let the detached worker finish before the process exits.
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    }

    // Non-positive deadlines fall back to the default.
    {
        Watchdog watchdog;
        RawOutcome ok = watchdog.execute_with_deadline(script("1"), 0, Strategy::Thread);
        if (!ok.succeeded())
        {
            fail("zero timeout should use the default deadline");
        }
        ok.discard();
    }

    std::cout << "OK\n";
    return 0;
}
