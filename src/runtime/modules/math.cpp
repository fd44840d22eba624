#include <algorithm>
#include <cinder/runtime/args.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/modules.h>
#include <cinder/runtime/ops.h>
#include <cmath>
#include <limits>
#include <numbers>
#include <numeric>

namespace cinder::runtime
{

namespace
{

[[noreturn]] void domain_error()
{
    raise("ValueError", "math domain error");
}

double checked_result(double result, double input)
{
    if (std::isnan(result) && !std::isnan(input))
    {
        domain_error();
    }
    if (std::isinf(result) && std::isfinite(input))
    {
        raise("OverflowError", "math range error");
    }
    return result;
}

/** @brief Wrap a unary libm function with Python's domain and range checks. */
NativeFunction unary(const char* name, double (*fn)(double))
{
    return [name, fn](Interpreter&, CallArgs& args) {
        expect_positional(args, name, 1, 1);
        const double x = float_arg(args.positional[0], name);
        return Value::real(checked_result(fn(x), x));
    };
}

std::int64_t int_param(const Value& v, const char* function)
{
    if (v.is_float())
    {
        raise("TypeError", "'float' object cannot be interpreted as an integer");
    }
    return int_arg(v, function);
}

Value math_log(Interpreter&, CallArgs& args)
{
    expect_positional(args, "log", 1, 2);
    const double x = float_arg(args.positional[0], "log");
    if (x <= 0.0)
    {
        domain_error();
    }
    double result = std::log(x);
    if (args.positional.size() == 2)
    {
        const double base = float_arg(args.positional[1], "log");
        if (base <= 0.0)
        {
            domain_error();
        }
        const double denominator = std::log(base);
        if (denominator == 0.0)
        {
            raise("ZeroDivisionError", "float division by zero");
        }
        result /= denominator;
    }
    return Value::real(result);
}

Value positive_log(CallArgs& args, const char* name, double (*fn)(double))
{
    expect_positional(args, name, 1, 1);
    const double x = float_arg(args.positional[0], name);
    if (x <= 0.0)
    {
        domain_error();
    }
    return Value::real(fn(x));
}

Value math_sqrt(Interpreter&, CallArgs& args)
{
    expect_positional(args, "sqrt", 1, 1);
    const double x = float_arg(args.positional[0], "sqrt");
    if (x < 0.0)
    {
        domain_error();
    }
    return Value::real(std::sqrt(x));
}

Value math_pow(Interpreter&, CallArgs& args)
{
    expect_positional(args, "pow", 2, 2);
    const double x = float_arg(args.positional[0], "pow");
    const double y = float_arg(args.positional[1], "pow");
    if (x == 0.0 && y < 0.0)
    {
        domain_error();
    }
    if (x < 0.0 && std::isfinite(y) && std::trunc(y) != y)
    {
        domain_error();
    }
    const double result = std::pow(x, y);
    if (std::isinf(result) && std::isfinite(x) && std::isfinite(y))
    {
        raise("OverflowError", "math range error");
    }
    return Value::real(result);
}

Value rounding(CallArgs& args, const char* name, double (*fn)(double))
{
    expect_positional(args, name, 1, 1);
    const Value& x = args.positional[0];
    if (x.is_integral())
    {
        return Value::integer(x.integral());
    }
    return Value::integer(float_to_int(fn(float_arg(x, name))));
}

Value math_factorial(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "factorial", 1, 1);
    const std::int64_t n = int_param(args.positional[0], "factorial");
    if (n < 0)
    {
        raise("ValueError", "factorial() not defined for negative values");
    }
    std::int64_t result = 1;
    for (std::int64_t i = 2; i <= n; ++i)
    {
        interp.tick();
        result = checked_mul(result, i);
    }
    return Value::integer(result);
}

std::int64_t abs_checked(std::int64_t v)
{
    return v < 0 ? checked_sub(0, v) : v;
}

Value math_gcd(Interpreter&, CallArgs& args)
{
    reject_keywords(args, "gcd");
    std::int64_t result = 0;
    for (const auto& v : args.positional)
    {
        result = std::gcd(result, abs_checked(int_param(v, "gcd")));
    }
    return Value::integer(result);
}

Value math_lcm(Interpreter&, CallArgs& args)
{
    reject_keywords(args, "lcm");
    std::int64_t result = 1;
    for (const auto& v : args.positional)
    {
        const std::int64_t x = abs_checked(int_param(v, "lcm"));
        if (x == 0 || result == 0)
        {
            result = 0;
            continue;
        }
        result = checked_mul(result / std::gcd(result, x), x);
    }
    return Value::integer(result);
}

Value math_isqrt(Interpreter&, CallArgs& args)
{
    expect_positional(args, "isqrt", 1, 1);
    const std::int64_t n = int_param(args.positional[0], "isqrt");
    if (n < 0)
    {
        raise("ValueError", "isqrt() argument must be nonnegative");
    }
    auto root = static_cast<std::int64_t>(std::sqrt(static_cast<double>(n)));
    while (root > 0 && static_cast<__int128>(root) * root > n)
    {
        --root;
    }
    while (static_cast<__int128>(root + 1) * (root + 1) <= n)
    {
        ++root;
    }
    return Value::integer(root);
}

Value math_comb(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "comb", 2, 2);
    const std::int64_t n = int_param(args.positional[0], "comb");
    std::int64_t k = int_param(args.positional[1], "comb");
    if (n < 0 || k < 0)
    {
        raise("ValueError", n < 0 ? "n must be a non-negative integer" : "k must be a non-negative integer");
    }
    if (k > n)
    {
        return Value::integer(0);
    }
    k = std::min(k, n - k);
    std::int64_t result = 1;
    for (std::int64_t i = 1; i <= k; ++i)
    {
        interp.tick();
        // result * (n - k + i) / i stays exact because result is C(n-k+i-1, i-1).
        const std::int64_t g = std::gcd(result, i);
        result = checked_mul(result / g, (n - k + i) / (i / g));
    }
    return Value::integer(result);
}

Value math_perm(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "perm", 1, 2);
    const std::int64_t n = int_param(args.positional[0], "perm");
    const std::int64_t k = args.positional.size() == 2 && !args.positional[1].is_none()
                               ? int_param(args.positional[1], "perm")
                               : n;
    if (n < 0 || k < 0)
    {
        raise("ValueError", n < 0 ? "n must be a non-negative integer" : "k must be a non-negative integer");
    }
    if (k > n)
    {
        return Value::integer(0);
    }
    std::int64_t result = 1;
    for (std::int64_t i = 0; i < k; ++i)
    {
        interp.tick();
        result = checked_mul(result, n - i);
    }
    return Value::integer(result);
}

Value math_hypot(Interpreter&, CallArgs& args)
{
    reject_keywords(args, "hypot");
    double total = 0.0;
    for (const auto& v : args.positional)
    {
        const double x = float_arg(v, "hypot");
        total = std::hypot(total, x);
    }
    return Value::real(total);
}

Value math_isclose(Interpreter&, CallArgs& args)
{
    auto rel = take_keyword(args, "rel_tol");
    auto abs_tol = take_keyword(args, "abs_tol");
    expect_positional(args, "isclose", 2, 2);
    const double a = float_arg(args.positional[0], "isclose");
    const double b = float_arg(args.positional[1], "isclose");
    const double rel_tol = rel.has_value() ? float_arg(*rel, "isclose") : 1e-09;
    const double abs_limit = abs_tol.has_value() ? float_arg(*abs_tol, "isclose") : 0.0;
    if (rel_tol < 0.0 || abs_limit < 0.0)
    {
        raise("ValueError", "tolerances must be non-negative");
    }
    if (a == b)
    {
        return Value::boolean(true);
    }
    if (std::isinf(a) || std::isinf(b))
    {
        return Value::boolean(false);
    }
    const double diff = std::fabs(b - a);
    return Value::boolean(diff <= std::fabs(rel_tol * b) || diff <= std::fabs(rel_tol * a) || diff <= abs_limit);
}

Value predicate(CallArgs& args, const char* name, bool (*fn)(double))
{
    expect_positional(args, name, 1, 1);
    return Value::boolean(fn(float_arg(args.positional[0], name)));
}

Value math_fmod(Interpreter&, CallArgs& args)
{
    expect_positional(args, "fmod", 2, 2);
    const double x = float_arg(args.positional[0], "fmod");
    const double y = float_arg(args.positional[1], "fmod");
    if (y == 0.0 || std::isinf(x))
    {
        domain_error();
    }
    return Value::real(std::fmod(x, y));
}

Value math_remainder(Interpreter&, CallArgs& args)
{
    expect_positional(args, "remainder", 2, 2);
    const double x = float_arg(args.positional[0], "remainder");
    const double y = float_arg(args.positional[1], "remainder");
    if (y == 0.0 || std::isinf(x))
    {
        domain_error();
    }
    return Value::real(std::remainder(x, y));
}

Value math_modf(Interpreter&, CallArgs& args)
{
    expect_positional(args, "modf", 1, 1);
    double whole = 0.0;
    const double fraction = std::modf(float_arg(args.positional[0], "modf"), &whole);
    return make_tuple({Value::real(fraction), Value::real(whole)});
}

Value math_frexp(Interpreter&, CallArgs& args)
{
    expect_positional(args, "frexp", 1, 1);
    int exponent = 0;
    const double mantissa = std::frexp(float_arg(args.positional[0], "frexp"), &exponent);
    return make_tuple({Value::real(mantissa), Value::integer(exponent)});
}

Value math_ldexp(Interpreter&, CallArgs& args)
{
    expect_positional(args, "ldexp", 2, 2);
    const double x = float_arg(args.positional[0], "ldexp");
    const std::int64_t e = int_param(args.positional[1], "ldexp");
    const int clamped = static_cast<int>(std::clamp<std::int64_t>(e, -100000, 100000));
    const double result = std::ldexp(x, clamped);
    if (std::isinf(result) && std::isfinite(x))
    {
        raise("OverflowError", "math range error");
    }
    return Value::real(result);
}

Value math_copysign(Interpreter&, CallArgs& args)
{
    expect_positional(args, "copysign", 2, 2);
    return Value::real(
        std::copysign(float_arg(args.positional[0], "copysign"), float_arg(args.positional[1], "copysign")));
}

Value math_atan2(Interpreter&, CallArgs& args)
{
    expect_positional(args, "atan2", 2, 2);
    return Value::real(std::atan2(float_arg(args.positional[0], "atan2"), float_arg(args.positional[1], "atan2")));
}

Value math_fsum(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "fsum", 1, 1);
    // Neumaier compensated summation.
    double sum = 0.0;
    double compensation = 0.0;
    Value iterator = make_iter(args.positional[0]);
    while (auto item = interp.next(iterator))
    {
        const double x = float_arg(*item, "fsum");
        const double t = sum + x;
        if (std::fabs(sum) >= std::fabs(x))
        {
            compensation += (sum - t) + x;
        }
        else
        {
            compensation += (x - t) + sum;
        }
        sum = t;
    }
    return Value::real(sum + compensation);
}

Value math_prod(Interpreter& interp, CallArgs& args)
{
    auto start = take_keyword(args, "start");
    expect_positional(args, "prod", 1, 1);
    Value total = start.value_or(Value::integer(1));
    Value iterator = make_iter(args.positional[0]);
    while (auto item = interp.next(iterator))
    {
        total = binary_op(cinder::lexer::TokenKind::Star, total, *item);
    }
    return total;
}

Value math_dist(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "dist", 2, 2);
    const std::vector<Value> p = interp.collect(args.positional[0]);
    const std::vector<Value> q = interp.collect(args.positional[1]);
    if (p.size() != q.size())
    {
        raise("ValueError", "both points must have the same number of dimensions");
    }
    double total = 0.0;
    for (std::size_t i = 0; i < p.size(); ++i)
    {
        total = std::hypot(total, float_arg(p[i], "dist") - float_arg(q[i], "dist"));
    }
    return Value::real(total);
}

Value math_gamma(Interpreter&, CallArgs& args)
{
    expect_positional(args, "gamma", 1, 1);
    const double x = float_arg(args.positional[0], "gamma");
    if ((x <= 0.0 && std::trunc(x) == x) || (std::isinf(x) && x < 0.0))
    {
        domain_error();
    }
    return Value::real(checked_result(std::tgamma(x), x));
}

Value math_lgamma(Interpreter&, CallArgs& args)
{
    expect_positional(args, "lgamma", 1, 1);
    const double x = float_arg(args.positional[0], "lgamma");
    if (x <= 0.0 && std::trunc(x) == x)
    {
        domain_error();
    }
    return Value::real(checked_result(std::lgamma(x), x));
}

double degrees(double x)
{
    return x * 180.0 / std::numbers::pi;
}

double radians(double x)
{
    return x * std::numbers::pi / 180.0;
}

} // namespace

std::shared_ptr<ModuleObject> make_math_module()
{
    auto module = make_module("math");
    auto& m = *module;
    m.members["pi"] = Value::real(std::numbers::pi);
    m.members["e"] = Value::real(std::numbers::e);
    m.members["tau"] = Value::real(2.0 * std::numbers::pi);
    m.members["inf"] = Value::real(std::numeric_limits<double>::infinity());
    m.members["nan"] = Value::real(std::numeric_limits<double>::quiet_NaN());

    define(m, "sqrt", math_sqrt);
    define(m, "cbrt", unary("cbrt", [](double x) { return std::cbrt(x); }));
    define(m, "exp", unary("exp", [](double x) { return std::exp(x); }));
    define(m, "exp2", unary("exp2", [](double x) { return std::exp2(x); }));
    define(m, "expm1", unary("expm1", [](double x) { return std::expm1(x); }));
    define(m, "log", math_log);
    define(m, "log2", [](Interpreter&, CallArgs& args) {
        return positive_log(args, "log2", [](double x) { return std::log2(x); });
    });
    define(m, "log10", [](Interpreter&, CallArgs& args) {
        return positive_log(args, "log10", [](double x) { return std::log10(x); });
    });
    define(m, "log1p", unary("log1p", [](double x) {
               if (x <= -1.0)
               {
                   domain_error();
               }
               return std::log1p(x);
           }));
    define(m, "pow", math_pow);
    define(m, "sin", unary("sin", [](double x) { return std::sin(x); }));
    define(m, "cos", unary("cos", [](double x) { return std::cos(x); }));
    define(m, "tan", unary("tan", [](double x) { return std::tan(x); }));
    define(m, "asin", unary("asin", [](double x) { return std::asin(x); }));
    define(m, "acos", unary("acos", [](double x) { return std::acos(x); }));
    define(m, "atan", unary("atan", [](double x) { return std::atan(x); }));
    define(m, "atan2", math_atan2);
    define(m, "sinh", unary("sinh", [](double x) { return std::sinh(x); }));
    define(m, "cosh", unary("cosh", [](double x) { return std::cosh(x); }));
    define(m, "tanh", unary("tanh", [](double x) { return std::tanh(x); }));
    define(m, "asinh", unary("asinh", [](double x) { return std::asinh(x); }));
    define(m, "acosh", unary("acosh", [](double x) { return std::acosh(x); }));
    define(m, "atanh", unary("atanh", [](double x) {
               if (x <= -1.0 || x >= 1.0)
               {
                   domain_error();
               }
               return std::atanh(x);
           }));
    define(m, "erf", unary("erf", [](double x) { return std::erf(x); }));
    define(m, "erfc", unary("erfc", [](double x) { return std::erfc(x); }));
    define(m, "gamma", math_gamma);
    define(m, "lgamma", math_lgamma);
    define(m, "fabs", unary("fabs", [](double x) { return std::fabs(x); }));
    define(m, "degrees", unary("degrees", degrees));
    define(m, "radians", unary("radians", radians));
    define(m, "floor", [](Interpreter&, CallArgs& args) {
        return rounding(args, "floor", [](double x) { return std::floor(x); });
    });
    define(m, "ceil", [](Interpreter&, CallArgs& args) {
        return rounding(args, "ceil", [](double x) { return std::ceil(x); });
    });
    define(m, "trunc", [](Interpreter&, CallArgs& args) {
        return rounding(args, "trunc", [](double x) { return std::trunc(x); });
    });
    define(m, "factorial", math_factorial);
    define(m, "gcd", math_gcd);
    define(m, "lcm", math_lcm);
    define(m, "isqrt", math_isqrt);
    define(m, "comb", math_comb);
    define(m, "perm", math_perm);
    define(m, "hypot", math_hypot);
    define(m, "dist", math_dist);
    define(m, "isclose", math_isclose);
    define(m, "isfinite", [](Interpreter&, CallArgs& args) {
        return predicate(args, "isfinite", [](double x) { return std::isfinite(x); });
    });
    define(m, "isinf", [](Interpreter&, CallArgs& args) {
        return predicate(args, "isinf", [](double x) { return std::isinf(x); });
    });
    define(m, "isnan", [](Interpreter&, CallArgs& args) {
        return predicate(args, "isnan", [](double x) { return std::isnan(x); });
    });
    define(m, "copysign", math_copysign);
    define(m, "fmod", math_fmod);
    define(m, "remainder", math_remainder);
    define(m, "modf", math_modf);
    define(m, "frexp", math_frexp);
    define(m, "ldexp", math_ldexp);
    define(m, "fsum", math_fsum);
    define(m, "prod", math_prod);
    return module;
}

} // namespace cinder::runtime
