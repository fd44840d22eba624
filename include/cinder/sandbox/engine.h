#pragma once

#include <cinder/runtime/interpreter.h>
#include <cinder/sandbox/config.h>
#include <cinder/sandbox/result.h>
#include <cinder/sandbox/watchdog.h>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file engine.h
 * @brief Sessions: persisted state plus the check → build → run → normalize pipeline.
 */

namespace cinder::sandbox
{

/**
 * @brief One logical conversation.
 *
 * Requests on a Session are serialized. State changes only after a successful request and
 * is visible to the next one. No method throws.
 */
class Session
{
  public:
    explicit Session(EngineConfig config = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /** @brief Check and run `code`; non-positive or missing limits fall back to the config. */
    [[nodiscard]] ExecutionResult execute(std::string_view code, std::optional<int> timeout_seconds = std::nullopt,
                                          std::optional<std::size_t> memory_limit_bytes = std::nullopt);
    [[nodiscard]] ExecutionResult execute(const ExecutionRequest& request);

    /** @brief Evaluate one expression in a fresh namespace; session state is neither read nor written. */
    [[nodiscard]] ExecutionResult evaluate(std::string_view expression);

    /** @brief Drop every persisted binding. */
    void reset();

    /** @brief Sorted names of the persisted bindings. */
    [[nodiscard]] std::vector<std::string> state_names() const;

    [[nodiscard]] std::size_t abandoned_workers() const { return watchdog_.abandoned_workers(); }
    [[nodiscard]] RunState last_state() const { return watchdog_.state(); }
    [[nodiscard]] const EngineConfig& config() const { return config_; }

  private:
    EngineConfig config_;
    mutable std::mutex mutex_;
    PersistedState state_;
    std::vector<std::weak_ptr<cinder::runtime::Environment>> scopes_;
    Watchdog watchdog_;

    ExecutionResult execute_locked(std::string_view code, int timeout_seconds, std::size_t memory_limit_bytes);
    void release_scopes();
};

/** @brief One-shot execution in a fresh Session. */
[[nodiscard]] ExecutionResult execute_code(std::string_view code, int timeout_seconds = kDefaultTimeoutSeconds,
                                           std::size_t memory_limit_bytes = kDefaultMemoryLimitBytes);

/** @brief One-shot expression evaluation in a fresh Session. */
[[nodiscard]] ExecutionResult evaluate_expression(std::string_view expression);

} // namespace cinder::sandbox
