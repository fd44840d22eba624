#pragma once

#include <cinder/runtime/cancel.h>
#include <cinder/sandbox/result.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <sys/resource.h>

/**
 * @file runner.h
 * @brief Executes policy-checked code under a memory ceiling and classifies the outcome.
 */

namespace cinder::sandbox
{

struct RunOptions
{
    std::size_t memory_limit_bytes = kDefaultMemoryLimitBytes;
    std::size_t max_output_bytes = kDefaultMaxOutputBytes;
    bool limit_address_space = true;
};

/** @brief Appended to output that hit the capture cap. */
inline constexpr std::string_view kOutputTruncatedMarker = "\n[output truncated]";

/**
 * @brief Lowers the RLIMIT_AS soft limit to the current address-space size plus a headroom and
 * restores the previous limit on destruction.
 *
 * A limit the kernel refuses is logged as a warning and otherwise ignored.
 */
class ScopedAddressLimit
{
  public:
    explicit ScopedAddressLimit(std::size_t headroom_bytes);
    ~ScopedAddressLimit();

    ScopedAddressLimit(const ScopedAddressLimit&) = delete;
    ScopedAddressLimit& operator=(const ScopedAddressLimit&) = delete;

    [[nodiscard]] bool active() const { return active_; }

  private:
    rlimit previous_{};
    bool active_ = false;
};

/** @brief Bytes currently mapped by this process (VmSize); nullopt when unavailable. */
[[nodiscard]] std::optional<std::size_t> current_address_space();

/** @brief `MemoryError: Exceeded memory limit of N.NMB`. */
[[nodiscard]] std::string memory_error_message(std::size_t limit_bytes);

inline constexpr std::string_view kInterruptedMessage = "ExecutionError: Code execution timed out";

/**
 * @brief Final non-empty `;`- or newline-separated segment of `code`, trimmed.
 *
 * Used to recover a result when the last statement is not an expression statement.
 */
[[nodiscard]] std::optional<std::string> last_segment(std::string_view code);

/**
 * @brief Run `code` in a namespace built from `state`.
 *
 * `code` must already have passed the policy check. Never throws; every failure is classified
 * into the returned outcome. `state` is only read.
 */
[[nodiscard]] RawOutcome run(std::string_view code, const PersistedState& state, const RunOptions& options,
                             const cinder::runtime::CancelToken& cancel);

/** @brief Evaluate a single policy-checked expression in a fresh namespace. */
[[nodiscard]] RawOutcome run_expression(std::string_view expression, const RunOptions& options,
                                        const cinder::runtime::CancelToken& cancel);

} // namespace cinder::sandbox
