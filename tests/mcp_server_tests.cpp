#include <cinder/json/json.h>
#include <cinder/mcp/server.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using cinder::json::Json;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static Json parse_or_fail(const std::string& text)
{
    auto parsed = cinder::json::parse(text);
    if (!parsed.has_value())
    {
        fail("invalid JSON: " + text);
    }
    return *parsed;
}

static Json request(int id, const std::string& method, const std::string& params = "{}")
{
    return parse_or_fail("{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) + ",\"method\":\"" + method +
                         "\",\"params\":" + params + "}");
}

static cinder::sandbox::EngineConfig test_config()
{
    cinder::sandbox::EngineConfig config;
    config.limit_address_space = false;
    return config;
}

/** @brief The single text block of a tools/call response, with its isError flag. */
static std::pair<std::string, bool> tool_text(const Json& response)
{
    const auto result = cinder::json::get_object(response, "result");
    if (!result)
    {
        fail("tools/call response has no result: " + cinder::json::serialize(response));
    }
    const auto content = cinder::json::get_array(*result, "content");
    if (!content || content->as_array()->size() != 1)
    {
        fail("tools/call response should carry one content block");
    }
    const Json& block = content->as_array()->front();
    if (cinder::json::get_string(block, "type") != std::optional<std::string>("text"))
    {
        fail("content block should be text");
    }
    const Json* is_error = result->find("isError");
    return {cinder::json::get_string(block, "text").value_or(""), is_error != nullptr && *is_error->as_bool()};
}

int main()
{
    namespace mcp = cinder::mcp;

    std::istringstream no_input;
    std::ostringstream sink;
    mcp::Server server(test_config(), no_input, sink);

    // initialize echoes the requested protocol version.
    {
        const auto response = server.handle(request(1, "initialize", "{\"protocolVersion\":\"2025-03-26\"}"));
        if (!response)
        {
            fail("initialize needs a response");
        }
        const auto result = cinder::json::get_object(*response, "result");
        if (!result || cinder::json::get_string(*result, "protocolVersion") != std::optional<std::string>("2025-03-26"))
        {
            fail("initialize should echo the protocol version");
        }
        const auto info = cinder::json::get_object(*result, "serverInfo");
        if (!info || cinder::json::get_string(*info, "name") != std::optional<std::string>("python-interpreter"))
        {
            fail("serverInfo name");
        }
        if (cinder::json::get_number(*response, "id") != std::optional<double>(1.0))
        {
            fail("response id should match the request");
        }
    }

    // tools/list names the three tools and their required arguments.
    {
        const auto response = server.handle(request(2, "tools/list"));
        const auto result = cinder::json::get_object(*response, "result");
        const auto tools = cinder::json::get_array(*result, "tools");
        if (!tools || tools->as_array()->size() != 3)
        {
            fail("tools/list should return three tools");
        }
        const Json& first = tools->as_array()->front();
        if (cinder::json::get_string(first, "name") != std::optional<std::string>("execute_python_code"))
        {
            fail("first tool should be execute_python_code");
        }
        const auto schema = cinder::json::get_object(first, "inputSchema");
        const auto required = cinder::json::get_array(*schema, "required");
        if (!required || cinder::json::serialize(*required) != "[\"code\"]")
        {
            fail("execute_python_code should require code");
        }
    }

    if (!server.handle(request(3, "ping")).has_value())
    {
        fail("ping needs a response");
    }

    // Notifications are never answered; unknown methods with an id are.
    if (server.handle(parse_or_fail("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}")).has_value() ||
        server.handle(parse_or_fail("{\"jsonrpc\":\"2.0\",\"method\":\"whatever\"}")).has_value())
    {
        fail("notifications should not be answered");
    }
    {
        const auto response = server.handle(request(4, "resources/list"));
        const auto error = cinder::json::get_object(*response, "error");
        if (!error || cinder::json::get_number(*error, "code") != std::optional<double>(-32601))
        {
            fail("unknown method should be -32601");
        }
    }
    {
        const auto response = server.handle(parse_or_fail("[1, 2]"));
        const auto error = cinder::json::get_object(*response, "error");
        if (!error || cinder::json::get_number(*error, "code") != std::optional<double>(-32600))
        {
            fail("non-object message should be -32600");
        }
    }
    {
        const auto response = server.handle(request(5, "tools/call", "{\"arguments\":{}}"));
        const auto error = cinder::json::get_object(*response, "error");
        if (!error || cinder::json::get_number(*error, "code") != std::optional<double>(-32602))
        {
            fail("tools/call without a name should be -32602");
        }
    }

    // Tool calls run in one persistent session.
    {
        auto [text, is_error] = tool_text(*server.handle(request(
            6, "tools/call", "{\"name\":\"execute_python_code\",\"arguments\":{\"code\":\"x = 20\\nprint('set')\"}}")));
        if (is_error || text != "{\"success\":true,\"output\":\"set\\n\",\"error\":null,\"result\":null}")
        {
            fail("execute_python_code: " + text);
        }

        std::tie(text, is_error) = tool_text(*server.handle(request(
            7, "tools/call", "{\"name\":\"execute_python_code\",\"arguments\":{\"code\":\"x * 2 + 2\",\"timeout\":3}}")));
        if (is_error || text != "{\"success\":true,\"output\":\"\",\"error\":null,\"result\":42}")
        {
            fail("state should persist between tool calls: " + text);
        }

        std::tie(text, is_error) = tool_text(*server.handle(
            request(8, "tools/call", "{\"name\":\"execute_python_expression\",\"arguments\":{\"expression\":\"3 ** 2\"}}")));
        if (is_error || text != "{\"success\":true,\"output\":\"\",\"error\":null,\"result\":9}")
        {
            fail("execute_python_expression: " + text);
        }

        std::tie(text, is_error) =
            tool_text(*server.handle(request(9, "tools/call", "{\"name\":\"reset_python_session\"}")));
        if (is_error || text.find("Session state cleared") == std::string::npos)
        {
            fail("reset_python_session: " + text);
        }

        std::tie(text, is_error) = tool_text(*server.handle(
            request(10, "tools/call", "{\"name\":\"execute_python_code\",\"arguments\":{\"code\":\"x\"}}")));
        if (is_error || text.find("\"success\":false") == std::string::npos ||
            text.find("NameError: name 'x' is not defined") == std::string::npos)
        {
            fail("reset should clear state: " + text);
        }
    }

    // Failed runs are ordinary results; bad arguments are tool errors.
    {
        auto [text, is_error] = tool_text(*server.handle(
            request(11, "tools/call", "{\"name\":\"execute_python_code\",\"arguments\":{\"code\":\"import os\"}}")));
        if (is_error || text.find("SecurityError: Unsafe code detected") == std::string::npos)
        {
            fail("rejection should be a result, not a tool error: " + text);
        }

        std::tie(text, is_error) =
            tool_text(*server.handle(request(12, "tools/call", "{\"name\":\"execute_python_code\",\"arguments\":{}}")));
        if (!is_error || text != "Error executing execute_python_code: Code parameter is required")
        {
            fail("missing code: " + text);
        }

        std::tie(text, is_error) = tool_text(*server.handle(request(
            13, "tools/call", "{\"name\":\"execute_python_code\",\"arguments\":{\"code\":\"1\",\"timeout\":\"ten\"}}")));
        if (!is_error || text.find("timeout must be an integer") == std::string::npos)
        {
            fail("bad timeout: " + text);
        }

        std::tie(text, is_error) = tool_text(*server.handle(request(14, "tools/call", "{\"name\":\"rm_rf\"}")));
        if (!is_error || text != "Error executing rm_rf: Unknown tool: rm_rf")
        {
            fail("unknown tool: " + text);
        }
    }

    // run() answers every line, reports malformed JSON, and stops at end of input.
    {
        std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\r\n"
                              "\n"
                              "{not json\n"
                              "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
                              "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":"
                              "\"execute_python_code\",\"arguments\":{\"code\":\"print('served')\"}}}\n");
        std::ostringstream out;
        mcp::Server stdio(test_config(), in, out);
        if (stdio.run() != 0)
        {
            fail("run should exit cleanly at end of input");
        }

        std::vector<Json> lines;
        std::istringstream written(out.str());
        std::string line;
        while (std::getline(written, line))
        {
            lines.push_back(parse_or_fail(line));
        }
        if (lines.size() != 3)
        {
            fail("expected three responses, got:\n" + out.str());
        }
        if (cinder::json::serialize(lines[0]) != "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}")
        {
            fail("ping response: " + cinder::json::serialize(lines[0]));
        }
        const auto error = cinder::json::get_object(lines[1], "error");
        if (!error || cinder::json::get_number(*error, "code") != std::optional<double>(-32700) ||
            !lines[1].find("id")->is_null())
        {
            fail("malformed line should produce a parse error with a null id");
        }
        auto [text, is_error] = tool_text(lines[2]);
        if (is_error || text.find("\"output\":\"served\\n\"") == std::string::npos)
        {
            fail("tool call over stdio: " + text);
        }
    }

    std::cout << "OK\n";
    return 0;
}
