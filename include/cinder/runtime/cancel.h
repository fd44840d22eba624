#pragma once

#include <atomic>

/**
 * @file cancel.h
 * @brief Cancellation flag shared between a running interpreter and its watchdog.
 */

namespace cinder::runtime
{

/**
 * @brief One-shot cancellation flag.
 *
 * `cancel()` is async-signal-safe so that a SIGALRM handler may call it. The interpreter polls
 * the flag at every step and raises Interrupted once it is set.
 */
class CancelToken
{
  public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool cancelled() const noexcept
    {
        return cancelled_.load(std::memory_order_relaxed);
    }

  private:
    std::atomic<bool> cancelled_{false};

    static_assert(std::atomic<bool>::is_always_lock_free);
};

} // namespace cinder::runtime
