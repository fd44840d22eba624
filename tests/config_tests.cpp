#include <cinder/sandbox/config.h>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <string>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

using namespace cinder::sandbox;

static EnvLookup lookup_from(const std::map<std::string, std::string>& vars)
{
    return [vars](const char* name) -> const char* {
        const auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

int main()
{
    if (parse_timeout("5") != 5 || parse_timeout(" 30 ") != 30)
    {
        fail("plain timeouts should parse");
    }
    for (const char* bad : {"", "0", "-1", "1.5", "5s", "abc"})
    {
        if (parse_timeout(bad).has_value())
        {
            fail(std::string("timeout should be rejected: '") + bad + "'");
        }
    }

    if (parse_size("1024") != 1024u || parse_size("4K") != 4096u || parse_size("100M") != 100u * 1024 * 1024 ||
        parse_size("2g") != std::size_t{2} << 30)
    {
        fail("sizes with suffixes should parse");
    }
    for (const char* bad : {"", "M", "0", "12X", "-5M", "1.5G"})
    {
        if (parse_size(bad).has_value())
        {
            fail(std::string("size should be rejected: '") + bad + "'");
        }
    }

    if (parse_strategy("signal") != Strategy::Signal || parse_strategy("thread") != Strategy::Thread ||
        parse_strategy("auto") != Strategy::Auto || parse_strategy("fork").has_value())
    {
        fail("strategy names");
    }
    if (strategy_name(Strategy::Thread) != "thread")
    {
        fail("strategy_name(Thread)");
    }

    // Unset variables leave the defaults alone.
    {
        const auto config = config_from_env({}, lookup_from({}));
        const auto* value = std::get_if<EngineConfig>(&config);
        if (value == nullptr || value->default_timeout_seconds != kDefaultTimeoutSeconds ||
            value->default_memory_limit_bytes != kDefaultMemoryLimitBytes || value->strategy != Strategy::Auto)
        {
            fail("empty environment should keep defaults");
        }
    }

    {
        const auto config = config_from_env(
            {}, lookup_from({{"CINDER_TIMEOUT", "12"}, {"CINDER_MEMORY_LIMIT", "64M"}, {"CINDER_STRATEGY", "thread"}}));
        const auto* value = std::get_if<EngineConfig>(&config);
        if (value == nullptr || value->default_timeout_seconds != 12 ||
            value->default_memory_limit_bytes != 64u * 1024 * 1024 || value->strategy != Strategy::Thread)
        {
            fail("environment overrides should apply");
        }
    }

    // Overrides apply on top of the base, not the built-in defaults.
    {
        EngineConfig base;
        base.max_output_bytes = 77;
        base.default_timeout_seconds = 3;
        const auto config = config_from_env(base, lookup_from({{"CINDER_STRATEGY", "signal"}}));
        const auto* value = std::get_if<EngineConfig>(&config);
        if (value == nullptr || value->max_output_bytes != 77 || value->default_timeout_seconds != 3 ||
            value->strategy != Strategy::Signal)
        {
            fail("base configuration should survive");
        }
    }

    {
        const auto config = config_from_env({}, lookup_from({{"CINDER_TIMEOUT", "soon"}}));
        const auto* error = std::get_if<ConfigError>(&config);
        if (error == nullptr || error->message.find("CINDER_TIMEOUT") == std::string::npos ||
            error->message.find("'soon'") == std::string::npos)
        {
            fail("bad timeout should produce a ConfigError naming the variable and value");
        }
    }
    {
        const auto config = config_from_env({}, lookup_from({{"CINDER_MEMORY_LIMIT", "lots"}}));
        if (!std::holds_alternative<ConfigError>(config))
        {
            fail("bad memory limit should produce a ConfigError");
        }
    }
    {
        const auto config = config_from_env({}, lookup_from({{"CINDER_STRATEGY", "fork"}}));
        if (!std::holds_alternative<ConfigError>(config))
        {
            fail("bad strategy should produce a ConfigError");
        }
    }

    std::cout << "OK\n";
    return 0;
}
