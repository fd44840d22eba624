#include <cinder/cli/cli.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

[[noreturn]] static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static int run_cli_capture(const std::vector<std::string>& argv_storage, std::string& out, std::string& err,
                           const std::string& input = "")
{
    std::ostringstream captured_out;
    std::ostringstream captured_err;
    std::istringstream fed_in(input);

    auto* old_out = std::cout.rdbuf(captured_out.rdbuf());
    auto* old_err = std::cerr.rdbuf(captured_err.rdbuf());
    auto* old_in = std::cin.rdbuf(fed_in.rdbuf());

    std::vector<std::string> args = argv_storage;
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& s : args)
    {
        argv.push_back(s.data());
    }

    const int rc = cinder::cli::run(static_cast<int>(argv.size()), argv.data());

    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);
    std::cin.rdbuf(old_in);
    std::cin.clear();

    out = captured_out.str();
    err = captured_err.str();
    return rc;
}

static void expect_contains(const std::string& haystack, const std::string& needle, const std::string& what)
{
    if (haystack.find(needle) == std::string::npos)
    {
        fail("expected " + what + " to contain '" + needle + "'\n---\n" + haystack + "\n---");
    }
}

static void expect_rc(int rc, int expected, const std::string& what, const std::string& err)
{
    if (rc != expected)
    {
        fail(what + ": expected exit " + std::to_string(expected) + ", got " + std::to_string(rc) + "\n" + err);
    }
}

static fs::path write_temp(const std::string& name, const std::string& contents)
{
    const fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary);
    out << contents;
    if (!out)
    {
        fail("unable to write temp file: " + path.string());
    }
    return path;
}

int main()
{
    std::string out;
    std::string err;

    // Usage errors.
    expect_rc(run_cli_capture({"cinder"}, out, err), 2, "no arguments", err);
    expect_contains(err, "usage:", "usage on stderr");

    expect_rc(run_cli_capture({"cinder", "--help"}, out, err), 0, "--help", err);
    expect_contains(out, "cinder run", "help text");

    expect_rc(run_cli_capture({"cinder", "launch"}, out, err), 2, "unknown command", err);
    expect_contains(err, "error: unknown command: launch", "unknown command message");

    expect_rc(run_cli_capture({"cinder", "check"}, out, err), 2, "check without a path", err);
    expect_rc(run_cli_capture({"cinder", "run"}, out, err), 2, "run without a path", err);
    expect_contains(err, "expected a script path", "missing path message");

    expect_rc(run_cli_capture({"cinder", "run", "--timeout", "soon", "x.py"}, out, err), 2, "bad --timeout", err);
    expect_contains(err, "--timeout", "bad timeout message");
    expect_rc(run_cli_capture({"cinder", "run", "--memory-limit=", "x.py"}, out, err), 2, "empty --memory-limit",
              err);
    expect_rc(run_cli_capture({"cinder", "run", "--strategy", "fork", "x.py"}, out, err), 2, "bad --strategy", err);
    expect_rc(run_cli_capture({"cinder", "run", "--verbose", "x.py"}, out, err), 2, "unknown option", err);
    expect_contains(err, "unknown option: --verbose", "unknown option message");
    expect_rc(run_cli_capture({"cinder", "run", "a.py", "b.py"}, out, err), 2, "two paths", err);

    expect_rc(run_cli_capture({"cinder", "run", "/nonexistent/cinder_script.py"}, out, err), 1, "missing file", err);
    expect_contains(err, "failed to open script", "missing file message");

    // check
    {
        const fs::path ok = write_temp("cinder_cli_ok.py", "total = sum(range(10))\nprint(total)\n");
        expect_rc(run_cli_capture({"cinder", "check", ok.string()}, out, err), 0, "check ok", err);
        expect_contains(out, "cinder check: ok", "check output");

        const fs::path bad = write_temp("cinder_cli_bad.py", "x = 1\nimport subprocess\n");
        expect_rc(run_cli_capture({"cinder", "check", bad.string()}, out, err), 1, "check rejects", err);
        expect_contains(err, "SecurityError: Unsafe code detected", "rejection header");
        expect_contains(err, ":2:8: error: import of blocked module 'subprocess'", "rejection diagnostic");
        fs::remove(ok);
        fs::remove(bad);
    }

    // parse
    {
        const fs::path file = write_temp("cinder_cli_parse.py", "x = 1 + 2\n");
        expect_rc(run_cli_capture({"cinder", "parse", file.string()}, out, err), 0, "parse", err);
        expect_contains(out, "(assign x (plus 1 2))", "parse dump");
        fs::remove(file);

        expect_rc(run_cli_capture({"cinder", "parse", "-"}, out, err, "x = (\n"), 1, "parse error", err);
        expect_contains(err, "error:", "parse diagnostic");
    }

    // run
    {
        const fs::path file = write_temp("cinder_cli_run.py", "print('hi')\n2 + 2\n");
        expect_rc(run_cli_capture({"cinder", "run", file.string()}, out, err), 0, "run", err);
        if (out != "hi\n4\n")
        {
            fail("run output: " + out);
        }

        expect_rc(run_cli_capture({"cinder", "run", "--json", file.string()}, out, err), 0, "run --json", err);
        if (out != "{\"success\":true,\"output\":\"hi\\n\",\"error\":null,\"result\":4}\n")
        {
            fail("run --json output: " + out);
        }
        fs::remove(file);

        expect_rc(run_cli_capture({"cinder", "run", "-"}, out, err, "print(len('abc'))\n"), 0, "run from stdin", err);
        if (out != "3\n")
        {
            fail("stdin run output: " + out);
        }

        expect_rc(run_cli_capture({"cinder", "run", "-"}, out, err, "import os\n"), 1, "run rejected", err);
        expect_contains(err, "SecurityError", "rejected run message");

        expect_rc(run_cli_capture({"cinder", "run", "--timeout=1", "--strategy", "thread", "-"}, out, err,
                                  "while True:\n    pass\n"),
                  1, "run timeout", err);
        expect_contains(err, "timed out", "timeout message");

        expect_rc(run_cli_capture({"cinder", "run", "--memory-limit", "1M", "-"}, out, err, "x = [0] * 10**8\n"), 1,
                  "run memory", err);
        expect_contains(err, "MemoryError: Exceeded memory limit of 1.0MB", "memory message");
    }

    // serve speaks JSON-RPC over stdio until stdin closes.
    {
        const std::string input =
            "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{\"protocolVersion\":\"2024-11-05\"}}\n"
            "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
            "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"execute_python_code\","
            "\"arguments\":{\"code\":\"print(6 * 7)\"}}}\n";
        expect_rc(run_cli_capture({"cinder", "serve"}, out, err, input), 0, "serve", err);
        expect_contains(out, "\"serverInfo\":{\"name\":\"python-interpreter\"", "initialize response");
        expect_contains(out, "\\\"output\\\":\\\"42\\\\n\\\"", "tool call response");
    }

    std::cout << "OK\n";
    return 0;
}
