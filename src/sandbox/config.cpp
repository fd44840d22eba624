#include <cctype>
#include <charconv>
#include <cinder/sandbox/config.h>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace cinder::sandbox
{

namespace
{

std::string_view trim(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

std::optional<Strategy> parse_strategy(std::string_view text)
{
    text = trim(text);
    if (text == "auto")
    {
        return Strategy::Auto;
    }
    if (text == "signal")
    {
        return Strategy::Signal;
    }
    if (text == "thread")
    {
        return Strategy::Thread;
    }
    return std::nullopt;
}

std::string_view strategy_name(Strategy strategy)
{
    switch (strategy)
    {
    case Strategy::Auto:
        return "auto";
    case Strategy::Signal:
        return "signal";
    case Strategy::Thread:
        return "thread";
    }
    return "auto";
}

std::optional<int> parse_timeout(std::string_view text)
{
    text = trim(text);
    int value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || value <= 0)
    {
        return std::nullopt;
    }
    return value;
}

std::optional<std::size_t> parse_size(std::string_view text)
{
    text = trim(text);
    std::size_t multiplier = 1;
    if (!text.empty())
    {
        switch (std::toupper(static_cast<unsigned char>(text.back())))
        {
        case 'K':
            multiplier = std::size_t{1} << 10;
            break;
        case 'M':
            multiplier = std::size_t{1} << 20;
            break;
        case 'G':
            multiplier = std::size_t{1} << 30;
            break;
        default:
            break;
        }
        if (multiplier != 1)
        {
            text.remove_suffix(1);
        }
    }

    std::size_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end || value == 0)
    {
        return std::nullopt;
    }
    if (value > std::numeric_limits<std::size_t>::max() / multiplier)
    {
        return std::nullopt;
    }
    return value * multiplier;
}

std::variant<EngineConfig, ConfigError> config_from_env(EngineConfig base, const EnvLookup& lookup)
{
    const auto get = [&lookup](const char* name) -> const char* {
        return lookup ? lookup(name) : std::getenv(name);
    };

    if (const char* timeout = get("CINDER_TIMEOUT"))
    {
        const auto parsed = parse_timeout(timeout);
        if (!parsed)
        {
            return ConfigError{"CINDER_TIMEOUT must be a positive number of seconds, got '" +
                               std::string(timeout) + "'"};
        }
        base.default_timeout_seconds = *parsed;
    }
    if (const char* limit = get("CINDER_MEMORY_LIMIT"))
    {
        const auto parsed = parse_size(limit);
        if (!parsed)
        {
            return ConfigError{"CINDER_MEMORY_LIMIT must be a byte count such as 104857600 or 100M, got '" +
                               std::string(limit) + "'"};
        }
        base.default_memory_limit_bytes = *parsed;
    }
    if (const char* strategy = get("CINDER_STRATEGY"))
    {
        const auto parsed = parse_strategy(strategy);
        if (!parsed)
        {
            return ConfigError{"CINDER_STRATEGY must be auto, signal or thread, got '" + std::string(strategy) + "'"};
        }
        base.strategy = *parsed;
    }
    return base;
}

bool debug_enabled()
{
    static const bool enabled = std::getenv("CINDER_DEBUG_SANDBOX") != nullptr;
    return enabled;
}

void debug_log(std::string_view message)
{
    if (debug_enabled())
    {
        std::cerr << "[sandbox] " << message << "\n";
    }
}

void warn(std::string_view message)
{
    std::cerr << "warning: " << message << "\n";
}

} // namespace cinder::sandbox
