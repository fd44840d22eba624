#include <algorithm>
#include <cinder/runtime/args.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>

namespace cinder::runtime
{

namespace
{

std::string plural(std::size_t n, const char* word)
{
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

} // namespace

std::vector<std::optional<Value>> bind_native(CallArgs& args, std::string_view function,
                                              std::initializer_list<std::string_view> names,
                                              std::size_t required)
{
    const std::vector<std::string_view> params(names);
    std::vector<std::optional<Value>> bound(params.size());

    if (args.positional.size() > params.size())
    {
        raise("TypeError", std::string(function) + "() takes at most " +
                               plural(params.size(), "argument") + " (" +
                               std::to_string(args.positional.size()) + " given)");
    }
    for (std::size_t i = 0; i < args.positional.size(); ++i)
    {
        bound[i] = std::move(args.positional[i]);
    }

    for (auto& [name, value] : args.keywords)
    {
        auto it = std::find(params.begin(), params.end(), name);
        if (it == params.end())
        {
            raise("TypeError", std::string(function) + "() got an unexpected keyword argument '" + name + "'");
        }
        const auto index = static_cast<std::size_t>(it - params.begin());
        if (bound[index].has_value())
        {
            raise("TypeError", std::string(function) + "() got multiple values for argument '" + name + "'");
        }
        bound[index] = std::move(value);
    }

    for (std::size_t i = 0; i < required; ++i)
    {
        if (!bound[i].has_value())
        {
            raise("TypeError", std::string(function) + "() missing required argument '" +
                                   std::string(params[i]) + "' (pos " + std::to_string(i + 1) + ")");
        }
    }
    return bound;
}

void expect_positional(const CallArgs& args, std::string_view function, std::size_t min,
                       std::size_t max)
{
    reject_keywords(args, function);
    const std::size_t n = args.positional.size();
    if (n >= min && n <= max)
    {
        return;
    }
    std::string name(function);
    if (min == max)
    {
        if (min == 0)
        {
            raise("TypeError", name + "() takes no arguments (" + std::to_string(n) + " given)");
        }
        if (min == 1)
        {
            raise("TypeError", name + "() takes exactly one argument (" + std::to_string(n) + " given)");
        }
        raise("TypeError", name + " expected " + plural(min, "argument") + ", got " + std::to_string(n));
    }
    if (n < min)
    {
        raise("TypeError", name + " expected at least " + plural(min, "argument") + ", got " +
                               std::to_string(n));
    }
    raise("TypeError", name + " expected at most " + plural(max, "argument") + ", got " + std::to_string(n));
}

std::optional<Value> take_keyword(CallArgs& args, std::string_view name)
{
    for (auto it = args.keywords.begin(); it != args.keywords.end(); ++it)
    {
        if (it->first == name)
        {
            Value value = std::move(it->second);
            args.keywords.erase(it);
            return value;
        }
    }
    return std::nullopt;
}

void reject_keywords(const CallArgs& args, std::string_view function)
{
    if (!args.keywords.empty())
    {
        raise("TypeError", std::string(function) + "() takes no keyword arguments");
    }
}

double float_arg(const Value& value, std::string_view /*function*/)
{
    if (value.is_real())
    {
        return value.to_double();
    }
    raise("TypeError", "must be real number, not " + type_name(value));
}

std::int64_t int_arg(const Value& value, std::string_view /*function*/)
{
    if (value.is_integral())
    {
        return value.integral();
    }
    raise("TypeError", "'" + type_name(value) + "' object cannot be interpreted as an integer");
}

const std::string& str_arg(const Value& value, std::string_view function)
{
    if (const auto* s = value.as<StrObject>())
    {
        return s->value;
    }
    raise("TypeError", std::string(function) + "() argument must be str, not " + type_name(value));
}

} // namespace cinder::runtime
