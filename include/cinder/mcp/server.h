#pragma once

#include <cinder/json/json.h>
#include <cinder/sandbox/config.h>
#include <cinder/sandbox/engine.h>
#include <condition_variable>
#include <deque>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

/**
 * @file server.h
 * @brief MCP tool server: newline-delimited JSON-RPC 2.0 over a pair of streams.
 */

namespace cinder::mcp
{

inline constexpr std::string_view kServerName = "python-interpreter";
inline constexpr std::string_view kServerVersion = "1.0.0";
inline constexpr std::string_view kProtocolVersion = "2024-11-05";

/** @brief JSON-RPC error codes used by the server. */
enum class RpcError : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
};

/** @brief Text block produced by one tool invocation. */
struct ToolOutcome
{
    std::string text;
    bool is_error = false;
};

/** @brief Runs queued jobs one at a time on a dedicated thread. */
class Executor
{
  public:
    Executor();
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    void post(std::function<void()> job);
    /** @brief Finish every queued job, then stop the thread. */
    void drain();

  private:
    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<std::function<void()>> jobs_;
    bool stopping_ = false;
    std::thread thread_;

    void loop();
};

class Server
{
  public:
    Server(cinder::sandbox::EngineConfig config, std::istream& in, std::ostream& out);

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /** @brief Serve until the input stream ends; returns the process exit code. */
    int run();

    /**
     * @brief Answer one request synchronously; nullopt for notifications.
     *
     * `tools/call` runs in the calling thread here; `run()` routes it to the executor instead.
     */
    [[nodiscard]] std::optional<cinder::json::Json> handle(const cinder::json::Json& message);

    [[nodiscard]] ToolOutcome call_tool(std::string_view name, const cinder::json::Json& arguments);

    [[nodiscard]] static cinder::json::Json tool_descriptions();

  private:
    cinder::sandbox::Session session_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;

    void write(const cinder::json::Json& message);
    [[nodiscard]] cinder::json::Json answer_tool_call(const cinder::json::Json& id, const cinder::json::Json& params);
};

[[nodiscard]] cinder::json::Json make_response(cinder::json::Json id, cinder::json::Json result);
[[nodiscard]] cinder::json::Json make_error(cinder::json::Json id, RpcError code, std::string message);

} // namespace cinder::mcp
