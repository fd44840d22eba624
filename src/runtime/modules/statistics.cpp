#include <algorithm>
#include <cinder/runtime/args.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/methods.h>
#include <cinder/runtime/modules.h>
#include <cinder/runtime/ops.h>
#include <cmath>

namespace cinder::runtime
{

namespace
{

[[noreturn]] void statistics_error(std::string message)
{
    raise(module_exception_type("StatisticsError", "ValueError"), std::move(message));
}

std::vector<Value> data_arg(Interpreter& interp, CallArgs& args, const char* function, std::size_t extra = 0)
{
    expect_positional(args, function, 1, 1 + extra);
    return interp.collect(args.positional[0]);
}

std::vector<double> as_doubles(const std::vector<Value>& data, const char* function)
{
    std::vector<double> out;
    out.reserve(data.size());
    for (const auto& v : data)
    {
        if (!v.is_real())
        {
            raise("TypeError", std::string("can't convert type '") + type_name(v) + "' to numerator/denominator");
        }
        out.push_back(float_arg(v, function));
    }
    return out;
}

bool all_integral(const std::vector<Value>& data)
{
    return std::all_of(data.begin(), data.end(), [](const Value& v) { return v.is_integral(); });
}

/** @brief Exact mean for ints when it divides evenly, float otherwise. */
Value mean_of(const std::vector<Value>& data, const char* function)
{
    if (all_integral(data))
    {
        std::int64_t total = 0;
        for (const auto& v : data)
        {
            total = checked_add(total, v.integral());
        }
        const auto n = static_cast<std::int64_t>(data.size());
        if (total % n == 0)
        {
            return Value::integer(total / n);
        }
        return Value::real(static_cast<double>(total) / static_cast<double>(n));
    }
    const auto values = as_doubles(data, function);
    double total = 0.0;
    for (const double x : values)
    {
        total += x;
    }
    return Value::real(total / static_cast<double>(values.size()));
}

Value stats_mean(Interpreter& interp, CallArgs& args)
{
    const auto data = data_arg(interp, args, "mean");
    if (data.empty())
    {
        statistics_error("mean requires at least one data point");
    }
    return mean_of(data, "mean");
}

Value stats_fmean(Interpreter& interp, CallArgs& args)
{
    const auto data = data_arg(interp, args, "fmean", 1);
    if (data.empty())
    {
        statistics_error("fmean requires at least one data point");
    }
    const auto values = as_doubles(data, "fmean");
    if (args.positional.size() == 2 && !args.positional[1].is_none())
    {
        const auto weights = as_doubles(interp.collect(args.positional[1]), "fmean");
        if (weights.size() != values.size())
        {
            statistics_error("data and weights must be the same length");
        }
        double total = 0.0;
        double weight_total = 0.0;
        for (std::size_t i = 0; i < values.size(); ++i)
        {
            total += values[i] * weights[i];
            weight_total += weights[i];
        }
        if (weight_total == 0.0)
        {
            statistics_error("sum of weights must be non-zero");
        }
        return Value::real(total / weight_total);
    }
    double total = 0.0;
    for (const double x : values)
    {
        total += x;
    }
    return Value::real(total / static_cast<double>(values.size()));
}

std::vector<Value> sorted_data(Interpreter& interp, CallArgs& args, const char* function)
{
    auto data = data_arg(interp, args, function);
    if (data.empty())
    {
        statistics_error("no median for empty data");
    }
    sort_values(interp, data, Value::none(), false);
    return data;
}

Value stats_median(Interpreter& interp, CallArgs& args)
{
    const auto data = sorted_data(interp, args, "median");
    const std::size_t n = data.size();
    if (n % 2 == 1)
    {
        return data[n / 2];
    }
    const Value sum = binary_op(cinder::lexer::TokenKind::Plus, data[n / 2 - 1], data[n / 2]);
    return binary_op(cinder::lexer::TokenKind::Slash, sum, Value::integer(2));
}

Value stats_median_low(Interpreter& interp, CallArgs& args)
{
    const auto data = sorted_data(interp, args, "median_low");
    const std::size_t n = data.size();
    return n % 2 == 1 ? data[n / 2] : data[n / 2 - 1];
}

Value stats_median_high(Interpreter& interp, CallArgs& args)
{
    const auto data = sorted_data(interp, args, "median_high");
    return data[data.size() / 2];
}

/** @brief Distinct values with their counts, in first-seen order. */
std::vector<std::pair<Value, std::int64_t>> tally(const std::vector<Value>& data)
{
    HashTable index;
    std::vector<std::pair<Value, std::int64_t>> counts;
    for (const auto& v : data)
    {
        if (auto* entry = index.find(v))
        {
            ++counts[static_cast<std::size_t>(entry->value.as_int())].second;
            continue;
        }
        index.insert(v, Value::integer(static_cast<std::int64_t>(counts.size())));
        counts.emplace_back(v, 1);
    }
    return counts;
}

Value stats_mode(Interpreter& interp, CallArgs& args)
{
    const auto data = data_arg(interp, args, "mode");
    if (data.empty())
    {
        statistics_error("no mode for empty data");
    }
    const auto counts = tally(data);
    auto best = counts.begin();
    for (auto it = counts.begin(); it != counts.end(); ++it)
    {
        if (it->second > best->second)
        {
            best = it;
        }
    }
    return best->first;
}

Value stats_multimode(Interpreter& interp, CallArgs& args)
{
    const auto data = data_arg(interp, args, "multimode");
    const auto counts = tally(data);
    std::int64_t top = 0;
    for (const auto& [value, count] : counts)
    {
        top = std::max(top, count);
    }
    std::vector<Value> out;
    for (const auto& [value, count] : counts)
    {
        if (count == top)
        {
            out.push_back(value);
        }
    }
    return make_list(std::move(out));
}

/** @brief Sum of squared deviations; `center` overrides the computed mean. */
double squared_deviations(const std::vector<double>& values, std::optional<double> center)
{
    double mean = 0.0;
    if (center.has_value())
    {
        mean = *center;
    }
    else
    {
        for (const double x : values)
        {
            mean += x;
        }
        mean /= static_cast<double>(values.size());
    }
    double total = 0.0;
    for (const double x : values)
    {
        total += (x - mean) * (x - mean);
    }
    return total;
}

Value variance_impl(Interpreter& interp, CallArgs& args, const char* function, bool sample, bool root)
{
    const auto data = data_arg(interp, args, function, 1);
    const std::size_t minimum = sample ? 2 : 1;
    if (data.size() < minimum)
    {
        statistics_error(std::string(function) + " requires at least " + (sample ? "two data points" : "one data point"));
    }
    std::optional<double> center;
    if (args.positional.size() == 2 && !args.positional[1].is_none())
    {
        center = float_arg(args.positional[1], function);
    }
    const auto values = as_doubles(data, function);
    const double ss = squared_deviations(values, center);
    const double variance = ss / static_cast<double>(sample ? values.size() - 1 : values.size());
    return Value::real(root ? std::sqrt(variance) : variance);
}

Value stats_harmonic_mean(Interpreter& interp, CallArgs& args)
{
    const auto data = data_arg(interp, args, "harmonic_mean");
    if (data.empty())
    {
        statistics_error("harmonic_mean requires at least one data point");
    }
    double total = 0.0;
    for (const double x : as_doubles(data, "harmonic_mean"))
    {
        if (x < 0.0)
        {
            statistics_error("harmonic mean does not support negative values");
        }
        if (x == 0.0)
        {
            return Value::integer(0);
        }
        total += 1.0 / x;
    }
    return Value::real(static_cast<double>(data.size()) / total);
}

Value stats_geometric_mean(Interpreter& interp, CallArgs& args)
{
    const auto data = data_arg(interp, args, "geometric_mean");
    if (data.empty())
    {
        statistics_error("geometric_mean requires a non-empty dataset containing positive numbers");
    }
    double total = 0.0;
    for (const double x : as_doubles(data, "geometric_mean"))
    {
        if (x <= 0.0)
        {
            statistics_error("geometric_mean requires a non-empty dataset containing positive numbers");
        }
        total += std::log(x);
    }
    return Value::real(std::exp(total / static_cast<double>(data.size())));
}

Value stats_quantiles(Interpreter& interp, CallArgs& args)
{
    auto n_arg = take_keyword(args, "n");
    auto method_arg = take_keyword(args, "method");
    auto data = data_arg(interp, args, "quantiles");
    const std::int64_t n = n_arg.has_value() ? int_arg(*n_arg, "quantiles") : 4;
    if (n < 1)
    {
        statistics_error("n must be at least 1");
    }
    if (data.size() < 2)
    {
        statistics_error("must have at least two data points");
    }
    const bool inclusive = method_arg.has_value() && to_str(*method_arg) == "inclusive";
    auto values = as_doubles(data, "quantiles");
    std::sort(values.begin(), values.end());
    const auto m = static_cast<std::int64_t>(values.size());
    std::vector<Value> out;
    for (std::int64_t i = 1; i < n; ++i)
    {
        if (inclusive)
        {
            const std::int64_t j = i * (m - 1) / n;
            const std::int64_t delta = i * (m - 1) - j * n;
            const double q = (values[static_cast<std::size_t>(j)] * static_cast<double>(n - delta) +
                              values[static_cast<std::size_t>(std::min(j + 1, m - 1))] * static_cast<double>(delta)) /
                             static_cast<double>(n);
            out.push_back(Value::real(q));
            continue;
        }
        std::int64_t j = i * (m + 1) / n;
        j = std::clamp<std::int64_t>(j, 1, m - 1);
        const std::int64_t delta = i * (m + 1) - j * n;
        const double q = (values[static_cast<std::size_t>(j - 1)] * static_cast<double>(n - delta) +
                          values[static_cast<std::size_t>(j)] * static_cast<double>(delta)) /
                         static_cast<double>(n);
        out.push_back(Value::real(q));
    }
    return make_list(std::move(out));
}

} // namespace

std::shared_ptr<ModuleObject> make_statistics_module()
{
    auto module = make_module("statistics");
    auto& m = *module;
    define(m, "mean", stats_mean);
    define(m, "fmean", stats_fmean);
    define(m, "median", stats_median);
    define(m, "median_low", stats_median_low);
    define(m, "median_high", stats_median_high);
    define(m, "mode", stats_mode);
    define(m, "multimode", stats_multimode);
    define(m, "variance", [](Interpreter& interp, CallArgs& args) {
        return variance_impl(interp, args, "variance", true, false);
    });
    define(m, "pvariance", [](Interpreter& interp, CallArgs& args) {
        return variance_impl(interp, args, "pvariance", false, false);
    });
    define(m, "stdev", [](Interpreter& interp, CallArgs& args) {
        return variance_impl(interp, args, "stdev", true, true);
    });
    define(m, "pstdev", [](Interpreter& interp, CallArgs& args) {
        return variance_impl(interp, args, "pstdev", false, true);
    });
    define(m, "harmonic_mean", stats_harmonic_mean);
    define(m, "geometric_mean", stats_geometric_mean);
    define(m, "quantiles", stats_quantiles);
    m.members["StatisticsError"] = Value::object(module_exception_type("StatisticsError", "ValueError"));
    return module;
}

} // namespace cinder::runtime
