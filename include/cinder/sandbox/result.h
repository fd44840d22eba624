#pragma once

#include <cinder/json/json.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/value.h>
#include <cinder/sandbox/config.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/**
 * @file result.h
 * @brief Requests, outcomes and the caller-facing execution result.
 */

namespace cinder::sandbox
{

struct ExecutionRequest
{
    std::string code;
    int timeout_seconds = kDefaultTimeoutSeconds;
    std::size_t memory_limit_bytes = kDefaultMemoryLimitBytes;
};

/** @brief What went wrong in a run, if anything. */
enum class ErrorKind
{
    None,
    PolicyRejected,
    MemoryExceeded,
    TimedOut,
    RuntimeFault,
    /** @brief The run succeeded but its result could not be converted and was replaced by text. */
    NormalizationFallback,
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

/** @brief Top-level bindings a Session carries between requests. */
using PersistedState = std::unordered_map<std::string, cinder::runtime::Value>;

/** @brief Serializable result returned to callers. */
struct ExecutionResult
{
    bool success = false;
    std::string output;
    std::optional<std::string> error;
    std::optional<cinder::json::Json> result;
};

/** @brief Internal outcome of one run, before it is turned into an ExecutionResult. */
struct RawOutcome
{
    ErrorKind kind = ErrorKind::None;
    std::string output;
    std::string error;
    std::optional<cinder::json::Json> result;
    /** @brief Top-level bindings to merge into the session; filled on success only. */
    PersistedState bindings;
    /** @brief Scopes that may hold reference cycles, cleared when their owner lets go of them. */
    std::vector<std::weak_ptr<cinder::runtime::Environment>> scopes;

    [[nodiscard]] bool succeeded() const
    {
        return kind == ErrorKind::None || kind == ErrorKind::NormalizationFallback;
    }

    /** @brief Break the cycles held by `scopes` and drop the bindings. */
    void discard();
};

[[nodiscard]] RawOutcome failed_outcome(ErrorKind kind, std::string error);

[[nodiscard]] ExecutionResult to_result(const RawOutcome& outcome);

} // namespace cinder::sandbox
