#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

/**
 * @file config.h
 * @brief Engine-wide defaults, environment overrides and sandbox logging.
 */

namespace cinder::sandbox
{

/** @brief How the watchdog enforces a deadline. */
enum class Strategy
{
    Auto,   /**< Signal when the process alarm slot is free, else thread. */
    Signal, /**< SIGALRM on the calling thread. */
    Thread, /**< Worker thread, abandoned after the grace period. */
};

inline constexpr int kDefaultTimeoutSeconds = 5;
inline constexpr std::size_t kDefaultMemoryLimitBytes = 100 * 1024 * 1024;
inline constexpr std::size_t kDefaultMaxOutputBytes = 1024 * 1024;

struct EngineConfig
{
    int default_timeout_seconds = kDefaultTimeoutSeconds;
    std::size_t default_memory_limit_bytes = kDefaultMemoryLimitBytes;
    Strategy strategy = Strategy::Auto;
    std::chrono::milliseconds grace_period{100};
    std::size_t max_output_bytes = kDefaultMaxOutputBytes;
    /** @brief Lower RLIMIT_AS around each run in addition to the per-run MemoryBudget. */
    bool limit_address_space = true;
};

struct ConfigError
{
    std::string message;
};

/** @brief Environment lookup; returns null for unset variables. */
using EnvLookup = std::function<const char*(const char*)>;

[[nodiscard]] std::optional<Strategy> parse_strategy(std::string_view text);
[[nodiscard]] std::string_view strategy_name(Strategy strategy);

/** @brief Positive whole seconds. */
[[nodiscard]] std::optional<int> parse_timeout(std::string_view text);

/** @brief Byte count with an optional K, M or G suffix (powers of 1024). */
[[nodiscard]] std::optional<std::size_t> parse_size(std::string_view text);

/**
 * @brief Apply CINDER_TIMEOUT, CINDER_MEMORY_LIMIT and CINDER_STRATEGY on top of `base`.
 *
 * `lookup` defaults to std::getenv.
 */
[[nodiscard]] std::variant<EngineConfig, ConfigError> config_from_env(EngineConfig base = {},
                                                                       const EnvLookup& lookup = {});

/** @brief True when CINDER_DEBUG_SANDBOX is set. */
[[nodiscard]] bool debug_enabled();

/** @brief Print `[sandbox] message` to stderr when debug tracing is enabled. */
void debug_log(std::string_view message);

/** @brief Print `warning: message` to stderr. */
void warn(std::string_view message);

} // namespace cinder::sandbox
