#include <algorithm>
#include <chrono>
#include <cinder/runtime/args.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/modules.h>
#include <cmath>
#include <ctime>
#include <thread>

namespace cinder::runtime
{

namespace
{

constexpr auto kSleepSlice = std::chrono::milliseconds(10);

template <typename Clock> double seconds_since_epoch()
{
    return std::chrono::duration<double>(Clock::now().time_since_epoch()).count();
}

template <typename Clock> std::int64_t nanoseconds_since_epoch()
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now().time_since_epoch()).count();
}

/** @brief Sleep in short slices so a cancelled run stops waiting promptly. */
Value time_sleep(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "sleep", 1, 1);
    const double seconds = float_arg(args.positional[0], "sleep");
    if (std::isnan(seconds))
    {
        raise("ValueError", "Invalid value NaN (not a number)");
    }
    if (seconds < 0.0)
    {
        raise("ValueError", "sleep length must be non-negative");
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                                                  std::chrono::duration<double>(std::min(seconds, 1e9)));
    while (true)
    {
        interp.tick();
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            break;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, kSleepSlice));
    }
    return Value::none();
}

Value time_process_time(Interpreter&, CallArgs& args)
{
    expect_positional(args, "process_time", 0, 0);
    timespec ts{};
    if (clock_gettime(CLOCK_PROCESS_CPUTIME_ID, &ts) != 0)
    {
        raise("RuntimeError", "process_time() clock unavailable");
    }
    return Value::real(static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) * 1e-9);
}

} // namespace

std::shared_ptr<ModuleObject> make_time_module()
{
    auto module = make_module("time");
    auto& m = *module;
    define(m, "time", [](Interpreter&, CallArgs& args) {
        expect_positional(args, "time", 0, 0);
        return Value::real(seconds_since_epoch<std::chrono::system_clock>());
    });
    define(m, "time_ns", [](Interpreter&, CallArgs& args) {
        expect_positional(args, "time_ns", 0, 0);
        return Value::integer(nanoseconds_since_epoch<std::chrono::system_clock>());
    });
    define(m, "monotonic", [](Interpreter&, CallArgs& args) {
        expect_positional(args, "monotonic", 0, 0);
        return Value::real(seconds_since_epoch<std::chrono::steady_clock>());
    });
    define(m, "monotonic_ns", [](Interpreter&, CallArgs& args) {
        expect_positional(args, "monotonic_ns", 0, 0);
        return Value::integer(nanoseconds_since_epoch<std::chrono::steady_clock>());
    });
    define(m, "perf_counter", [](Interpreter&, CallArgs& args) {
        expect_positional(args, "perf_counter", 0, 0);
        return Value::real(seconds_since_epoch<std::chrono::steady_clock>());
    });
    define(m, "perf_counter_ns", [](Interpreter&, CallArgs& args) {
        expect_positional(args, "perf_counter_ns", 0, 0);
        return Value::integer(nanoseconds_since_epoch<std::chrono::steady_clock>());
    });
    define(m, "process_time", time_process_time);
    define(m, "sleep", time_sleep);
    return module;
}

} // namespace cinder::runtime
