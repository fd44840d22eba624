#include <cinder/cli/cli.h>
#include <cinder/diag/render.h>
#include <cinder/json/json.h>
#include <cinder/mcp/server.h>
#include <cinder/parser/parser.h>
#include <cinder/policy/checker.h>
#include <cinder/sandbox/config.h>
#include <cinder/sandbox/engine.h>
#include <cinder/sandbox/normalizer.h>
#include <cinder/source/source_file.h>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cinder::cli
{

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out)
{
    out << "cinder: sandboxed script execution engine\n\n";
    out << "usage:\n";
    out << "  cinder --help\n";
    out << "  cinder run [--timeout <seconds>] [--memory-limit <bytes>] [--strategy <auto|signal|thread>]\n";
    out << "             [--json] <file | ->\n";
    out << "  cinder check <file | ->\n";
    out << "  cinder parse <file | ->\n";
    out << "  cinder serve [--timeout <seconds>] [--memory-limit <bytes>] [--strategy <auto|signal|thread>]\n";
    out << "\n";
    out << "environment: CINDER_TIMEOUT, CINDER_MEMORY_LIMIT, CINDER_STRATEGY, CINDER_DEBUG_SANDBOX\n";
}

bool is_help_flag(std::string_view arg)
{
    return arg == "--help" || arg == "-h" || arg == "help";
}

struct Options
{
    cinder::sandbox::EngineConfig config;
    std::optional<std::string> path;
    bool json = false;
};

/** @brief `--name value` or `--name=value`; advances `i` past what it consumed. */
std::optional<std::string_view> flag_value(const std::vector<std::string_view>& args, std::size_t& i,
                                           std::string_view name, bool& matched)
{
    const std::string_view a = args[i];
    matched = false;
    if (a == name)
    {
        matched = true;
        if (i + 1 >= args.size())
        {
            ++i;
            return std::nullopt;
        }
        i += 2;
        return args[i - 1];
    }
    if (a.starts_with(name) && a.size() > name.size() && a[name.size()] == '=')
    {
        matched = true;
        ++i;
        const auto value = a.substr(name.size() + 1);
        if (value.empty())
        {
            return std::nullopt;
        }
        return value;
    }
    return std::nullopt;
}

/** @brief Parse the flags shared by run and serve; returns an exit code on failure. */
std::optional<int> parse_options(const std::vector<std::string_view>& args, Options& options, bool takes_path,
                                 bool takes_json)
{
    auto env = cinder::sandbox::config_from_env(options.config);
    if (auto* err = std::get_if<cinder::sandbox::ConfigError>(&env))
    {
        std::cerr << "error: " << err->message << "\n";
        return kExitUsage;
    }
    options.config = std::get<cinder::sandbox::EngineConfig>(env);

    for (std::size_t i = 0; i < args.size();)
    {
        bool matched = false;
        if (auto value = flag_value(args, i, "--timeout", matched); matched)
        {
            const auto parsed = value ? cinder::sandbox::parse_timeout(*value) : std::nullopt;
            if (!parsed)
            {
                std::cerr << "error: expected a positive number of seconds after --timeout\n\n";
                print_usage(std::cerr);
                return kExitUsage;
            }
            options.config.default_timeout_seconds = *parsed;
            continue;
        }
        if (auto value = flag_value(args, i, "--memory-limit", matched); matched)
        {
            const auto parsed = value ? cinder::sandbox::parse_size(*value) : std::nullopt;
            if (!parsed)
            {
                std::cerr << "error: expected a byte count (for example 100M) after --memory-limit\n\n";
                print_usage(std::cerr);
                return kExitUsage;
            }
            options.config.default_memory_limit_bytes = *parsed;
            continue;
        }
        if (auto value = flag_value(args, i, "--strategy", matched); matched)
        {
            const auto parsed = value ? cinder::sandbox::parse_strategy(*value) : std::nullopt;
            if (!parsed)
            {
                std::cerr << "error: expected auto, signal or thread after --strategy\n\n";
                print_usage(std::cerr);
                return kExitUsage;
            }
            options.config.strategy = *parsed;
            continue;
        }

        const std::string_view a = args[i];
        if (takes_json && a == "--json")
        {
            options.json = true;
            ++i;
            continue;
        }
        if (a.starts_with('-') && a != "-")
        {
            std::cerr << "error: unknown option: " << a << "\n\n";
            print_usage(std::cerr);
            return kExitUsage;
        }
        if (!takes_path || options.path.has_value())
        {
            std::cerr << "error: unexpected argument: " << a << "\n\n";
            print_usage(std::cerr);
            return kExitUsage;
        }
        options.path = std::string(a);
        ++i;
    }

    if (takes_path && !options.path.has_value())
    {
        std::cerr << "error: expected a script path (or - for stdin)\n\n";
        print_usage(std::cerr);
        return kExitUsage;
    }
    return std::nullopt;
}

std::optional<cinder::source::SourceFile> load(const std::string& path)
{
    const auto loaded = path == "-" ? cinder::source::load_source_stream(std::cin, "<stdin>")
                                    : cinder::source::load_source_file(path);
    if (const auto* err = std::get_if<cinder::source::LoadError>(&loaded))
    {
        std::cerr << "error: " << err->message << ": " << path << "\n";
        return std::nullopt;
    }
    return std::get<cinder::source::SourceFile>(loaded);
}

int cmd_check(const std::string& path)
{
    const auto file = load(path);
    if (!file)
    {
        return kExitError;
    }
    const auto decision = cinder::policy::check(file->contents);
    if (const auto* rejected = std::get_if<cinder::policy::Rejected>(&decision))
    {
        std::cerr << cinder::policy::kSecurityErrorMessage << "\n";
        std::cerr << cinder::diag::render(rejected->diagnostic, *file);
        return kExitError;
    }
    std::cout << "cinder check: ok\n";
    return kExitOk;
}

int cmd_parse(const std::string& path)
{
    const auto file = load(path);
    if (!file)
    {
        return kExitError;
    }
    const auto parsed = cinder::parser::parse_source(file->contents);
    if (const auto* diags = std::get_if<std::vector<cinder::diag::Diagnostic>>(&parsed))
    {
        std::cerr << cinder::diag::render_all(*diags, *file);
        return kExitError;
    }
    std::cout << cinder::parser::dump(std::get<cinder::parser::Program>(parsed));
    return kExitOk;
}

int cmd_run(const Options& options)
{
    const auto file = load(*options.path);
    if (!file)
    {
        return kExitError;
    }

    cinder::sandbox::Session session(options.config);
    const auto result = session.execute(file->contents);
    if (options.json)
    {
        std::cout << cinder::sandbox::serialize_result(result) << "\n";
        return result.success ? kExitOk : kExitError;
    }

    std::cout << result.output;
    if (!result.success)
    {
        std::cerr << "error: " << result.error.value_or("execution failed") << "\n";
        return kExitError;
    }
    if (result.result.has_value() && !result.result->is_null())
    {
        std::cout << cinder::json::serialize(*result.result) << "\n";
    }
    return kExitOk;
}

int cmd_serve(const Options& options)
{
    cinder::sandbox::debug_log("serving on stdio, strategy " +
                               std::string(cinder::sandbox::strategy_name(options.config.strategy)));
    cinder::mcp::Server server(options.config, std::cin, std::cout);
    return server.run();
}

} // namespace

int run(int argc, char** argv)
{
    if (argc <= 1)
    {
        print_usage(std::cerr);
        return kExitUsage;
    }

    const std::string_view cmd = argv[1];
    if (is_help_flag(cmd))
    {
        print_usage(std::cout);
        return kExitOk;
    }

    std::vector<std::string_view> args;
    for (int i = 2; i < argc; ++i)
    {
        args.push_back(argv[i]);
    }

    if (cmd == "check" || cmd == "parse")
    {
        if (args.size() != 1)
        {
            std::cerr << "error: expected cinder " << cmd << " <file | ->\n\n";
            print_usage(std::cerr);
            return kExitUsage;
        }
        return cmd == "check" ? cmd_check(std::string(args[0])) : cmd_parse(std::string(args[0]));
    }

    if (cmd == "run" || cmd == "serve")
    {
        Options options;
        const bool is_run = cmd == "run";
        if (auto exit_code = parse_options(args, options, is_run, is_run))
        {
            return *exit_code;
        }
        return is_run ? cmd_run(options) : cmd_serve(options);
    }

    std::cerr << "error: unknown command: " << cmd << "\n\n";
    print_usage(std::cerr);
    return kExitUsage;
}

} // namespace cinder::cli
