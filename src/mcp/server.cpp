#include <cinder/mcp/server.h>
#include <cinder/sandbox/normalizer.h>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace cinder::mcp
{

namespace
{

using cinder::json::Json;

constexpr int kDefaultToolTimeoutSeconds = 10;

Json text(std::string_view value)
{
    return Json{std::string(value)};
}

Json object(std::initializer_list<std::pair<std::string, Json>> members)
{
    Json out = cinder::json::make_object();
    for (const auto& [key, value] : members)
    {
        out.set(key, value);
    }
    return out;
}

Json string_property(std::string_view description)
{
    return object({{"type", text("string")}, {"description", text(description)}});
}

Json tool(std::string_view name, std::string_view description, Json properties, Json::Array required)
{
    return object({{"name", text(name)},
                   {"description", text(description)},
                   {"inputSchema", object({{"type", text("object")},
                                           {"properties", std::move(properties)},
                                           {"required", Json{std::move(required)}}})}});
}

/** @brief Tool failures reported to the client as `Error executing <tool>: <message>`. */
class ToolError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

std::string required_string(const Json& arguments, std::string_view key, std::string_view label)
{
    const auto value = cinder::json::get_string(arguments, key);
    if (!value.has_value() || value->empty())
    {
        throw ToolError(std::string(label) + " parameter is required");
    }
    return *value;
}

int timeout_argument(const Json& arguments)
{
    const Json* value = arguments.find("timeout");
    if (value == nullptr || value->is_null())
    {
        return kDefaultToolTimeoutSeconds;
    }
    const auto number = value->as_number();
    if (!number.has_value() || !std::isfinite(*number) || *number != std::floor(*number) || *number > 86400.0)
    {
        throw ToolError("timeout must be an integer number of seconds");
    }
    return static_cast<int>(*number);
}

} // namespace

Json make_response(Json id, Json result)
{
    return object({{"jsonrpc", text("2.0")}, {"id", std::move(id)}, {"result", std::move(result)}});
}

Json make_error(Json id, RpcError code, std::string message)
{
    return object({{"jsonrpc", text("2.0")},
                   {"id", std::move(id)},
                   {"error", object({{"code", Json{static_cast<std::int64_t>(code)}},
                                     {"message", Json{std::move(message)}}})}});
}

Executor::Executor() : thread_([this] { loop(); }) {}

Executor::~Executor()
{
    drain();
}

void Executor::post(std::function<void()> job)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push_back(std::move(job));
    }
    ready_.notify_one();
}

void Executor::drain()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    ready_.notify_one();
    if (thread_.joinable())
    {
        thread_.join();
    }
}

void Executor::loop()
{
    while (true)
    {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ready_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty())
            {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job();
    }
}

Server::Server(cinder::sandbox::EngineConfig config, std::istream& in, std::ostream& out)
    : session_(std::move(config)), in_(in), out_(out)
{
}

Json Server::tool_descriptions()
{
    Json::Array tools;
    tools.push_back(tool("execute_python_code",
                         "This function executes Python code dynamically and returns structured results including "
                         "output, errors, and success status. It captures print statements and provides detailed "
                         "error tracebacks when code execution fails.",
                         object({{"code", string_property("Complete Python script to execute. can be multiple lines "
                                                          "of code.")},
                                 {"timeout", object({{"type", text("integer")},
                                                     {"description", text("Execution timeout in seconds (default: "
                                                                          "10).")}})}}),
                         {text("code")}));
    tools.push_back(tool("execute_python_expression",
                         "Evaluates a single Python expression and returns the computed value.",
                         object({{"expression", string_property("Python expression to evaluate. can only be a "
                                                                "single line of code.")}}),
                         {text("expression")}));
    tools.push_back(tool("reset_python_session",
                         "Clears every variable, function and import kept between execute_python_code calls.",
                         cinder::json::make_object(), {}));
    return object({{"tools", Json{std::move(tools)}}});
}

ToolOutcome Server::call_tool(std::string_view name, const Json& arguments)
{
    try
    {
        if (name == "execute_python_code")
        {
            const std::string code = required_string(arguments, "code", "Code");
            const int timeout = timeout_argument(arguments);
            return ToolOutcome{.text = cinder::sandbox::serialize_result(session_.execute(code, timeout)),
                               .is_error = false};
        }
        if (name == "execute_python_expression")
        {
            const std::string expression = required_string(arguments, "expression", "Expression");
            return ToolOutcome{.text = cinder::sandbox::serialize_result(session_.evaluate(expression)),
                               .is_error = false};
        }
        if (name == "reset_python_session")
        {
            session_.reset();
            cinder::sandbox::ExecutionResult cleared;
            cleared.success = true;
            cleared.output = "Session state cleared\n";
            return ToolOutcome{.text = cinder::sandbox::serialize_result(cleared), .is_error = false};
        }
        throw ToolError("Unknown tool: " + std::string(name));
    }
    catch (const ToolError& error)
    {
        std::cerr << "error: error executing tool " << name << ": " << error.what() << "\n";
        return ToolOutcome{.text = "Error executing " + std::string(name) + ": " + error.what(), .is_error = true};
    }
}

Json Server::answer_tool_call(const Json& id, const Json& params)
{
    const auto name = cinder::json::get_string(params, "name");
    if (!name.has_value())
    {
        return make_error(id, RpcError::InvalidParams, "tools/call requires a tool name");
    }
    const Json* arguments = params.find("arguments");
    const Json empty = cinder::json::make_object();
    const ToolOutcome outcome = call_tool(*name, arguments != nullptr && arguments->is_object() ? *arguments : empty);

    Json::Array content;
    content.push_back(object({{"type", text("text")}, {"text", Json{outcome.text}}}));
    return make_response(id, object({{"content", Json{std::move(content)}}, {"isError", Json{outcome.is_error}}}));
}

std::optional<Json> Server::handle(const Json& message)
{
    if (!message.is_object())
    {
        return make_error(Json{nullptr}, RpcError::InvalidRequest, "Invalid Request");
    }
    const Json* id_field = message.find("id");
    const bool notification = id_field == nullptr;
    const Json id = notification ? Json{nullptr} : *id_field;
    const auto method = cinder::json::get_string(message, "method");
    if (!method.has_value())
    {
        if (notification)
        {
            return std::nullopt;
        }
        return make_error(id, RpcError::InvalidRequest, "Invalid Request");
    }

    const Json* params_field = message.find("params");
    const Json params = params_field != nullptr && params_field->is_object() ? *params_field
                                                                            : cinder::json::make_object();

    if (*method == "initialize")
    {
        const auto requested = cinder::json::get_string(params, "protocolVersion");
        return make_response(
            id, object({{"protocolVersion", text(requested.value_or(std::string(kProtocolVersion)))},
                        {"capabilities", object({{"tools", cinder::json::make_object()}})},
                        {"serverInfo", object({{"name", text(kServerName)}, {"version", text(kServerVersion)}})}}));
    }
    if (method->starts_with("notifications/"))
    {
        return std::nullopt;
    }
    if (*method == "ping")
    {
        return make_response(id, cinder::json::make_object());
    }
    if (*method == "tools/list")
    {
        return make_response(id, tool_descriptions());
    }
    if (*method == "tools/call")
    {
        return answer_tool_call(id, params);
    }
    if (notification)
    {
        return std::nullopt;
    }
    return make_error(id, RpcError::MethodNotFound, "Method not found: " + *method);
}

void Server::write(const Json& message)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << cinder::json::serialize(message) << "\n";
    out_.flush();
}

int Server::run()
{
    Executor executor;
    std::string line;
    while (std::getline(in_, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos)
        {
            continue;
        }

        auto parsed = cinder::json::parse(line);
        if (!parsed.has_value())
        {
            std::cerr << "error: malformed JSON-RPC message\n";
            write(make_error(Json{nullptr}, RpcError::ParseError, "Parse error"));
            continue;
        }

        const auto method = cinder::json::get_string(*parsed, "method");
        if (method == "tools/call" && parsed->find("id") != nullptr)
        {
            executor.post([this, message = std::move(*parsed)] {
                if (auto response = handle(message))
                {
                    write(*response);
                }
            });
            continue;
        }
        if (auto response = handle(*parsed))
        {
            write(*response);
        }
    }
    executor.drain();
    return 0;
}

} // namespace cinder::mcp
