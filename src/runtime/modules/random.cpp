#include <algorithm>
#include <cinder/runtime/args.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/memory_budget.h>
#include <cinder/runtime/modules.h>
#include <cinder/runtime/ops.h>
#include <cmath>
#include <functional>
#include <random>

namespace cinder::runtime
{

namespace
{

using Engine = std::shared_ptr<std::mt19937_64>;

double unit(std::mt19937_64& rng)
{
    return std::generate_canonical<double, 53>(rng);
}

/** @brief Uniform integer in [0, n). */
std::int64_t below(std::mt19937_64& rng, std::int64_t n)
{
    return std::uniform_int_distribution<std::int64_t>(0, n - 1)(rng);
}

std::vector<Value> population(Interpreter& interp, const Value& seq)
{
    if (seq.is(ObjectKind::Set) || seq.is(ObjectKind::Dict))
    {
        raise("TypeError", "Population must be a sequence.  For dicts or sets, use sorted(d).");
    }
    return interp.collect(seq);
}

Value random_seed(const Engine& rng, CallArgs& args)
{
    expect_positional(args, "seed", 0, 2);
    if (args.positional.empty() || args.positional[0].is_none())
    {
        rng->seed(std::random_device{}());
        return Value::none();
    }
    const Value& a = args.positional[0];
    if (a.is_integral())
    {
        const std::int64_t v = a.integral();
        rng->seed(v < 0 ? 0 - static_cast<std::uint64_t>(v) : static_cast<std::uint64_t>(v));
    }
    else if (a.is_float())
    {
        rng->seed(static_cast<std::uint64_t>(hash_value(a)));
    }
    else if (const auto* s = a.as<StrObject>())
    {
        std::seed_seq seq(s->value.begin(), s->value.end());
        rng->seed(seq);
    }
    else if (const auto* b = a.as<BytesObject>())
    {
        std::seed_seq seq(b->value.begin(), b->value.end());
        rng->seed(seq);
    }
    else
    {
        raise("TypeError", "The only supported seed types are: None, int, float, str, bytes, and bytearray.");
    }
    return Value::none();
}

Value random_randrange(const Engine& rng, CallArgs& args)
{
    expect_positional(args, "randrange", 1, 3);
    std::int64_t start = 0;
    std::int64_t stop = 0;
    std::int64_t step = 1;
    if (args.positional.size() == 1)
    {
        stop = int_arg(args.positional[0], "randrange");
    }
    else
    {
        start = int_arg(args.positional[0], "randrange");
        stop = int_arg(args.positional[1], "randrange");
        if (args.positional.size() == 3)
        {
            step = int_arg(args.positional[2], "randrange");
        }
    }
    if (step == 0)
    {
        raise("ValueError", "zero step for randrange()");
    }
    const std::int64_t n = RangeObject(start, stop, step).size();
    if (n <= 0)
    {
        raise("ValueError", "empty range in randrange(" + std::to_string(start) + ", " + std::to_string(stop) +
                                (step == 1 ? "" : ", " + std::to_string(step)) + ")");
    }
    return Value::integer(start + step * below(*rng, n));
}

Value random_randint(const Engine& rng, CallArgs& args)
{
    expect_positional(args, "randint", 2, 2);
    const std::int64_t a = int_arg(args.positional[0], "randint");
    const std::int64_t b = int_arg(args.positional[1], "randint");
    if (b < a)
    {
        raise("ValueError", "empty range in randrange(" + std::to_string(a) + ", " + std::to_string(checked_add(b, 1)) +
                                ")");
    }
    return Value::integer(std::uniform_int_distribution<std::int64_t>(a, b)(*rng));
}

Value random_choice(const Engine& rng, Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "choice", 1, 1);
    const std::vector<Value> items = population(interp, args.positional[0]);
    if (items.empty())
    {
        raise("IndexError", "Cannot choose from an empty sequence");
    }
    return items[static_cast<std::size_t>(below(*rng, static_cast<std::int64_t>(items.size())))];
}

Value random_choices(const Engine& rng, Interpreter& interp, CallArgs& args)
{
    auto bound = bind_native(args, "choices", {"population", "weights", "cum_weights", "k"}, 1);
    const std::vector<Value> items = population(interp, *bound[0]);
    const std::int64_t k = bound[3].has_value() ? int_arg(*bound[3], "choices") : 1;
    if (k < 0)
    {
        raise("ValueError", "k must be non-negative");
    }
    check_allocation(static_cast<std::size_t>(k), sizeof(Value));

    std::vector<double> cumulative;
    const bool has_weights = bound[1].has_value() && !bound[1]->is_none();
    const bool has_cumulative = bound[2].has_value() && !bound[2]->is_none();
    if (has_weights && has_cumulative)
    {
        raise("TypeError", "Cannot specify both weights and cumulative weights");
    }
    if (has_weights || has_cumulative)
    {
        double running = 0.0;
        for (const auto& w : interp.collect(has_weights ? *bound[1] : *bound[2]))
        {
            const double x = float_arg(w, "choices");
            running = has_weights ? running + x : x;
            cumulative.push_back(running);
        }
        if (cumulative.size() != items.size())
        {
            raise("ValueError", "The number of weights does not match the population");
        }
        if (cumulative.empty() || cumulative.back() <= 0.0)
        {
            raise("ValueError", "Total of weights must be greater than zero");
        }
    }
    else if (items.empty())
    {
        raise("IndexError", "Cannot choose from an empty population");
    }

    std::vector<Value> out;
    out.reserve(static_cast<std::size_t>(k));
    for (std::int64_t i = 0; i < k; ++i)
    {
        interp.tick();
        if (cumulative.empty())
        {
            out.push_back(items[static_cast<std::size_t>(below(*rng, static_cast<std::int64_t>(items.size())))]);
            continue;
        }
        const double target = unit(*rng) * cumulative.back();
        const auto it = std::upper_bound(cumulative.begin(), cumulative.end(), target);
        const auto index = std::min(static_cast<std::size_t>(it - cumulative.begin()), items.size() - 1);
        out.push_back(items[index]);
    }
    return make_list(std::move(out));
}

Value random_shuffle(const Engine& rng, Interpreter&, CallArgs& args)
{
    expect_positional(args, "shuffle", 1, 1);
    auto* list = args.positional[0].as<ListObject>();
    if (list == nullptr)
    {
        raise("TypeError", "'" + type_name(args.positional[0]) + "' object does not support item assignment");
    }
    auto& items = list->items;
    for (std::size_t i = items.size(); i > 1; --i)
    {
        const auto j = static_cast<std::size_t>(below(*rng, static_cast<std::int64_t>(i)));
        std::swap(items[i - 1], items[j]);
    }
    return Value::none();
}

Value random_sample(const Engine& rng, Interpreter& interp, CallArgs& args)
{
    auto bound = bind_native(args, "sample", {"population", "k", "counts"}, 2);
    std::vector<Value> items = population(interp, *bound[0]);
    if (bound[2].has_value() && !bound[2]->is_none())
    {
        std::vector<Value> expanded;
        const std::vector<Value> counts = interp.collect(*bound[2]);
        if (counts.size() != items.size())
        {
            raise("ValueError", "The number of counts does not match the population");
        }
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            const std::int64_t c = int_arg(counts[i], "sample");
            if (c < 0)
            {
                raise("ValueError", "Counts must be non-negative");
            }
            check_allocation(expanded.size() + static_cast<std::size_t>(c), sizeof(Value));
            expanded.insert(expanded.end(), static_cast<std::size_t>(c), items[i]);
        }
        items = std::move(expanded);
    }
    const std::int64_t k = int_arg(*bound[1], "sample");
    if (k < 0 || k > static_cast<std::int64_t>(items.size()))
    {
        raise("ValueError", "Sample larger than population or is negative");
    }
    // Partial Fisher-Yates: the first k slots become the sample.
    for (std::size_t i = 0; i < static_cast<std::size_t>(k); ++i)
    {
        const auto j = i + static_cast<std::size_t>(below(*rng, static_cast<std::int64_t>(items.size() - i)));
        std::swap(items[i], items[j]);
    }
    items.resize(static_cast<std::size_t>(k));
    return make_list(std::move(items));
}

Value random_getrandbits(const Engine& rng, CallArgs& args)
{
    expect_positional(args, "getrandbits", 1, 1);
    const std::int64_t k = int_arg(args.positional[0], "getrandbits");
    if (k < 0)
    {
        raise("ValueError", "number of bits must be non-negative");
    }
    if (k > 63)
    {
        raise("OverflowError", "getrandbits() is limited to 63 bits");
    }
    if (k == 0)
    {
        return Value::integer(0);
    }
    return Value::integer(static_cast<std::int64_t>((*rng)() >> (64 - k)));
}

/** @brief Module member bound to the module's generator state. */
using EngineFunction = std::function<Value(const Engine&, Interpreter&, CallArgs&)>;

void define_seeded(ModuleObject& module, const std::string& name, const Engine& rng, EngineFunction fn)
{
    define(module, name, [rng, fn = std::move(fn)](Interpreter& interp, CallArgs& args) { return fn(rng, interp, args); });
}

} // namespace

std::shared_ptr<ModuleObject> make_random_module()
{
    auto module = make_module("random");
    auto& m = *module;
    auto rng = std::make_shared<std::mt19937_64>(std::random_device{}());

    define_seeded(m, "seed", rng, [](const Engine& r, Interpreter&, CallArgs& args) { return random_seed(r, args); });
    define_seeded(m, "random", rng, [](const Engine& r, Interpreter&, CallArgs& args) {
        expect_positional(args, "random", 0, 0);
        return Value::real(unit(*r));
    });
    define_seeded(m, "uniform", rng, [](const Engine& r, Interpreter&, CallArgs& args) {
        expect_positional(args, "uniform", 2, 2);
        const double a = float_arg(args.positional[0], "uniform");
        const double b = float_arg(args.positional[1], "uniform");
        return Value::real(a + (b - a) * unit(*r));
    });
    define_seeded(m, "randint", rng, [](const Engine& r, Interpreter&, CallArgs& args) { return random_randint(r, args); });
    define_seeded(m, "randrange", rng,
                  [](const Engine& r, Interpreter&, CallArgs& args) { return random_randrange(r, args); });
    define_seeded(m, "choice", rng, random_choice);
    define_seeded(m, "choices", rng, random_choices);
    define_seeded(m, "shuffle", rng, random_shuffle);
    define_seeded(m, "sample", rng, random_sample);
    define_seeded(m, "getrandbits", rng,
                  [](const Engine& r, Interpreter&, CallArgs& args) { return random_getrandbits(r, args); });
    define_seeded(m, "gauss", rng, [](const Engine& r, Interpreter&, CallArgs& args) {
        auto bound = bind_native(args, "gauss", {"mu", "sigma"}, 0);
        const double mu = bound[0].has_value() ? float_arg(*bound[0], "gauss") : 0.0;
        const double sigma = bound[1].has_value() ? float_arg(*bound[1], "gauss") : 1.0;
        return Value::real(mu + sigma * std::normal_distribution<double>(0.0, 1.0)(*r));
    });
    define_seeded(m, "normalvariate", rng, [](const Engine& r, Interpreter&, CallArgs& args) {
        auto bound = bind_native(args, "normalvariate", {"mu", "sigma"}, 0);
        const double mu = bound[0].has_value() ? float_arg(*bound[0], "normalvariate") : 0.0;
        const double sigma = bound[1].has_value() ? float_arg(*bound[1], "normalvariate") : 1.0;
        return Value::real(mu + sigma * std::normal_distribution<double>(0.0, 1.0)(*r));
    });
    define_seeded(m, "expovariate", rng, [](const Engine& r, Interpreter&, CallArgs& args) {
        expect_positional(args, "expovariate", 0, 1);
        const double lambd = args.positional.empty() ? 1.0 : float_arg(args.positional[0], "expovariate");
        if (lambd == 0.0)
        {
            raise("ZeroDivisionError", "float division by zero");
        }
        return Value::real(-std::log(1.0 - unit(*r)) / lambd);
    });
    define_seeded(m, "triangular", rng, [](const Engine& r, Interpreter&, CallArgs& args) {
        expect_positional(args, "triangular", 0, 3);
        const double low = args.positional.size() > 0 ? float_arg(args.positional[0], "triangular") : 0.0;
        const double high = args.positional.size() > 1 ? float_arg(args.positional[1], "triangular") : 1.0;
        if (high == low)
        {
            return Value::real(low);
        }
        const double mode = args.positional.size() > 2 && !args.positional[2].is_none()
                                ? (float_arg(args.positional[2], "triangular") - low) / (high - low)
                                : 0.5;
        double u = unit(*r);
        double c = mode;
        double lo = low;
        double hi = high;
        if (u > c)
        {
            u = 1.0 - u;
            c = 1.0 - c;
            std::swap(lo, hi);
        }
        return Value::real(lo + (hi - lo) * std::sqrt(u * c));
    });
    return module;
}

} // namespace cinder::runtime
