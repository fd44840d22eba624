#pragma once

#include <atomic>
#include <chrono>
#include <cinder/runtime/cancel.h>
#include <cinder/sandbox/config.h>
#include <cinder/sandbox/result.h>
#include <cstddef>
#include <functional>
#include <string>

/**
 * @file watchdog.h
 * @brief Deadline enforcement around a runner call.
 */

namespace cinder::sandbox
{

enum class RunState
{
    Idle,
    Running,
    Completed,
    Failed,
    TimedOut,
};

[[nodiscard]] std::string_view run_state_name(RunState state);

/** @brief A runner invocation; must poll `cancel` and must not reference the caller's stack. */
using RunnerCall = std::function<RawOutcome(const cinder::runtime::CancelToken& cancel)>;

/** @brief `ExecutionError: Code timed out after T seconds`. */
[[nodiscard]] std::string timeout_message(int timeout_seconds);

/**
 * @brief Runs one call at a time against a deadline.
 *
 * The signal strategy arms a process-wide ITIMER_REAL whose SIGALRM handler cancels the run;
 * only one such run may be armed in the whole process. The thread strategy runs the call on a
 * worker, cancels it at the deadline and abandons it when it does not stop within the grace
 * period. The outcome of a timed-out run is always discarded.
 */
class Watchdog
{
  public:
    explicit Watchdog(std::chrono::milliseconds grace_period = std::chrono::milliseconds(100));

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    [[nodiscard]] RawOutcome execute_with_deadline(RunnerCall call, int timeout_seconds, Strategy strategy);

    [[nodiscard]] RunState state() const { return state_.load(); }
    /** @brief Workers that were still running when their grace period ran out. */
    [[nodiscard]] std::size_t abandoned_workers() const { return abandoned_.load(); }

  private:
    std::chrono::milliseconds grace_period_;
    std::atomic<RunState> state_{RunState::Idle};
    std::atomic<std::size_t> abandoned_{0};

    RawOutcome run_with_alarm(const RunnerCall& call, int timeout_seconds);
    RawOutcome run_on_worker(RunnerCall call, int timeout_seconds);
    void finish(const RawOutcome& outcome);
};

} // namespace cinder::sandbox
