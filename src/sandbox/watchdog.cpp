#include <cerrno>
#include <cinder/sandbox/watchdog.h>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <signal.h>
#include <sys/time.h>
#include <system_error>
#include <thread>

namespace cinder::sandbox
{

namespace
{

using cinder::runtime::CancelToken;

// The process has one ITIMER_REAL; at most one signal-based run may own it.
std::atomic<bool> g_alarm_claimed{false};
std::atomic<CancelToken*> g_alarm_target{nullptr};

static_assert(std::atomic<CancelToken*>::is_always_lock_free);

extern "C" void on_alarm(int)
{
    if (CancelToken* token = g_alarm_target.load())
    {
        token->cancel();
    }
}

/** @brief Claims the alarm slot; released on destruction. */
class AlarmSlot
{
  public:
    AlarmSlot()
    {
        bool expected = false;
        owned_ = g_alarm_claimed.compare_exchange_strong(expected, true);
    }
    ~AlarmSlot()
    {
        if (owned_)
        {
            g_alarm_claimed.store(false);
        }
    }

    AlarmSlot(const AlarmSlot&) = delete;
    AlarmSlot& operator=(const AlarmSlot&) = delete;

    [[nodiscard]] bool owned() const { return owned_; }

  private:
    bool owned_ = false;
};

/**
 * @brief Installs the SIGALRM handler and arms the timer; disarms and restores on destruction.
 */
class ArmedAlarm
{
  public:
    ArmedAlarm(CancelToken& token, int timeout_seconds)
    {
        g_alarm_target.store(&token);

        struct sigaction action{};
        action.sa_handler = on_alarm;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;
        if (sigaction(SIGALRM, &action, &previous_) != 0)
        {
            error_ = std::string("sigaction(SIGALRM) failed: ") + std::strerror(errno);
            g_alarm_target.store(nullptr);
            return;
        }
        installed_ = true;

        itimerval timer{};
        timer.it_value.tv_sec = timeout_seconds;
        if (setitimer(ITIMER_REAL, &timer, nullptr) != 0)
        {
            error_ = std::string("setitimer(ITIMER_REAL) failed: ") + std::strerror(errno);
            return;
        }
        armed_ = true;
    }

    ~ArmedAlarm()
    {
        if (armed_)
        {
            const itimerval off{};
            if (setitimer(ITIMER_REAL, &off, nullptr) != 0)
            {
                warn(std::string("could not disarm ITIMER_REAL: ") + std::strerror(errno));
            }
        }
        if (installed_ && sigaction(SIGALRM, &previous_, nullptr) != 0)
        {
            warn(std::string("could not restore the SIGALRM handler: ") + std::strerror(errno));
        }
        g_alarm_target.store(nullptr);
    }

    ArmedAlarm(const ArmedAlarm&) = delete;
    ArmedAlarm& operator=(const ArmedAlarm&) = delete;

    [[nodiscard]] bool armed() const { return armed_; }
    [[nodiscard]] const std::string& error() const { return error_; }

  private:
    struct sigaction previous_{};
    bool installed_ = false;
    bool armed_ = false;
    std::string error_;
};

RawOutcome invoke(const RunnerCall& call, const CancelToken& cancel)
{
    try
    {
        return call(cancel);
    }
    catch (const std::bad_alloc&)
    {
        return failed_outcome(ErrorKind::MemoryExceeded, "MemoryError: out of memory while running code");
    }
    catch (const std::exception& error)
    {
        return failed_outcome(ErrorKind::RuntimeFault, std::string("ExecutionError: ") + error.what());
    }
}

/** @brief State shared between the caller and a worker that may outlive it. */
struct WorkerChannel
{
    std::mutex mutex;
    std::condition_variable finished;
    bool done = false;
    bool abandoned = false;
    std::optional<RawOutcome> outcome;
    CancelToken cancel;
};

} // namespace

std::string_view run_state_name(RunState state)
{
    switch (state)
    {
    case RunState::Idle:
        return "idle";
    case RunState::Running:
        return "running";
    case RunState::Completed:
        return "completed";
    case RunState::Failed:
        return "failed";
    case RunState::TimedOut:
        return "timed-out";
    }
    return "idle";
}

std::string timeout_message(int timeout_seconds)
{
    return "ExecutionError: Code timed out after " + std::to_string(timeout_seconds) + " seconds";
}

Watchdog::Watchdog(std::chrono::milliseconds grace_period) : grace_period_(grace_period) {}

RawOutcome Watchdog::execute_with_deadline(RunnerCall call, int timeout_seconds, Strategy strategy)
{
    if (timeout_seconds <= 0)
    {
        timeout_seconds = kDefaultTimeoutSeconds;
    }
    state_.store(RunState::Running);

    if (strategy != Strategy::Thread)
    {
        AlarmSlot slot;
        if (slot.owned())
        {
            debug_log("signal strategy, deadline " + std::to_string(timeout_seconds) + "s");
            return run_with_alarm(call, timeout_seconds);
        }
        debug_log("alarm slot busy; falling back to a worker thread");
    }
    debug_log("thread strategy, deadline " + std::to_string(timeout_seconds) + "s");
    return run_on_worker(std::move(call), timeout_seconds);
}

RawOutcome Watchdog::run_with_alarm(const RunnerCall& call, int timeout_seconds)
{
    CancelToken cancel;
    std::optional<RawOutcome> outcome;
    {
        ArmedAlarm alarm(cancel, timeout_seconds);
        if (alarm.armed())
        {
            outcome = invoke(call, cancel);
        }
        else
        {
            warn(alarm.error() + "; running on a worker thread instead");
        }
    }
    if (!outcome)
    {
        return run_on_worker(call, timeout_seconds);
    }
    if (outcome->kind == ErrorKind::TimedOut)
    {
        outcome->discard();
    }
    finish(*outcome);
    return std::move(*outcome);
}

RawOutcome Watchdog::run_on_worker(RunnerCall call, int timeout_seconds)
{
    auto channel = std::make_shared<WorkerChannel>();
    std::thread worker;
    try
    {
        worker = std::thread([channel, call = std::move(call)]() {
            RawOutcome outcome = invoke(call, channel->cancel);
            std::lock_guard<std::mutex> lock(channel->mutex);
            if (channel->abandoned)
            {
                outcome.discard();
            }
            else
            {
                channel->outcome = std::move(outcome);
            }
            channel->done = true;
            channel->finished.notify_all();
        });
    }
    catch (const std::system_error& error)
    {
        auto outcome =
            failed_outcome(ErrorKind::RuntimeFault, std::string("ExecutionError: could not start worker: ") + error.what());
        finish(outcome);
        return outcome;
    }

    std::unique_lock<std::mutex> lock(channel->mutex);
    if (channel->finished.wait_for(lock, std::chrono::seconds(timeout_seconds), [&] { return channel->done; }))
    {
        RawOutcome outcome = std::move(*channel->outcome);
        lock.unlock();
        worker.join();
        finish(outcome);
        return outcome;
    }

    channel->cancel.cancel();
    const bool stopped = channel->finished.wait_for(lock, grace_period_, [&] { return channel->done; });
    if (stopped)
    {
        channel->outcome->discard();
        lock.unlock();
        worker.join();
    }
    else
    {
        channel->abandoned = true;
        lock.unlock();
        worker.detach();
        const std::size_t count = abandoned_.fetch_add(1) + 1;
        warn("worker did not stop within the grace period and was abandoned (" + std::to_string(count) +
             " so far)");
    }
    state_.store(RunState::TimedOut);
    return failed_outcome(ErrorKind::TimedOut, timeout_message(timeout_seconds));
}

void Watchdog::finish(const RawOutcome& outcome)
{
    if (outcome.kind == ErrorKind::TimedOut)
    {
        state_.store(RunState::TimedOut);
        return;
    }
    state_.store(outcome.succeeded() ? RunState::Completed : RunState::Failed);
}

} // namespace cinder::sandbox
