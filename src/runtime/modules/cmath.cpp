#include <cinder/runtime/args.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/modules.h>
#include <cmath>
#include <complex>
#include <limits>
#include <numbers>

namespace cinder::runtime
{

namespace
{

using Complex = std::complex<double>;

Complex complex_arg(const Value& v)
{
    if (v.is_complex())
    {
        return v.as_complex();
    }
    if (v.is_real())
    {
        return {v.to_double(), 0.0};
    }
    raise("TypeError", "must be real number, not " + type_name(v));
}

Complex checked(Complex result, Complex input)
{
    const bool input_finite = std::isfinite(input.real()) && std::isfinite(input.imag());
    if (input_finite && (std::isnan(result.real()) || std::isnan(result.imag())))
    {
        raise("ValueError", "math domain error");
    }
    if (input_finite && (std::isinf(result.real()) || std::isinf(result.imag())))
    {
        raise("OverflowError", "math range error");
    }
    return result;
}

NativeFunction unary(const char* name, Complex (*fn)(const Complex&))
{
    return [name, fn](Interpreter&, CallArgs& args) {
        expect_positional(args, name, 1, 1);
        const Complex z = complex_arg(args.positional[0]);
        return Value::complex(checked(fn(z), z));
    };
}

Value cmath_log(Interpreter&, CallArgs& args)
{
    expect_positional(args, "log", 1, 2);
    const Complex z = complex_arg(args.positional[0]);
    if (z == Complex(0.0, 0.0))
    {
        raise("ValueError", "math domain error");
    }
    Complex result = std::log(z);
    if (args.positional.size() == 2)
    {
        const Complex base = complex_arg(args.positional[1]);
        if (base == Complex(0.0, 0.0))
        {
            raise("ValueError", "math domain error");
        }
        const Complex denominator = std::log(base);
        if (denominator == Complex(0.0, 0.0))
        {
            raise("ZeroDivisionError", "complex division by zero");
        }
        result /= denominator;
    }
    return Value::complex(result);
}

Value cmath_phase(Interpreter&, CallArgs& args)
{
    expect_positional(args, "phase", 1, 1);
    return Value::real(std::arg(complex_arg(args.positional[0])));
}

Value cmath_polar(Interpreter&, CallArgs& args)
{
    expect_positional(args, "polar", 1, 1);
    const Complex z = complex_arg(args.positional[0]);
    return make_tuple({Value::real(std::abs(z)), Value::real(std::arg(z))});
}

Value cmath_rect(Interpreter&, CallArgs& args)
{
    expect_positional(args, "rect", 2, 2);
    const double r = float_arg(args.positional[0], "rect");
    const double phi = float_arg(args.positional[1], "rect");
    return Value::complex(std::polar(r, phi));
}

Value classify(CallArgs& args, const char* name, bool (*fn)(double, double))
{
    expect_positional(args, name, 1, 1);
    const Complex z = complex_arg(args.positional[0]);
    return Value::boolean(fn(z.real(), z.imag()));
}

Value cmath_isclose(Interpreter&, CallArgs& args)
{
    auto rel = take_keyword(args, "rel_tol");
    auto abs_tol = take_keyword(args, "abs_tol");
    expect_positional(args, "isclose", 2, 2);
    const Complex a = complex_arg(args.positional[0]);
    const Complex b = complex_arg(args.positional[1]);
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
    const double diff = std::abs(b - a);
    if (std::isinf(diff))
    {
        return Value::boolean(false);
    }
    return Value::boolean(diff <= rel_tol * std::abs(b) || diff <= rel_tol * std::abs(a) || diff <= abs_limit);
}

} // namespace

std::shared_ptr<ModuleObject> make_cmath_module()
{
    constexpr double kInf = std::numeric_limits<double>::infinity();
    constexpr double kNan = std::numeric_limits<double>::quiet_NaN();

    auto module = make_module("cmath");
    auto& m = *module;
    m.members["pi"] = Value::real(std::numbers::pi);
    m.members["e"] = Value::real(std::numbers::e);
    m.members["tau"] = Value::real(2.0 * std::numbers::pi);
    m.members["inf"] = Value::real(kInf);
    m.members["infj"] = Value::complex({0.0, kInf});
    m.members["nan"] = Value::real(kNan);
    m.members["nanj"] = Value::complex({0.0, kNan});

    define(m, "sqrt", unary("sqrt", [](const Complex& z) { return std::sqrt(z); }));
    define(m, "exp", unary("exp", [](const Complex& z) { return std::exp(z); }));
    define(m, "log", cmath_log);
    define(m, "log10", unary("log10", [](const Complex& z) {
               if (z == Complex(0.0, 0.0))
               {
                   raise("ValueError", "math domain error");
               }
               return std::log10(z);
           }));
    define(m, "sin", unary("sin", [](const Complex& z) { return std::sin(z); }));
    define(m, "cos", unary("cos", [](const Complex& z) { return std::cos(z); }));
    define(m, "tan", unary("tan", [](const Complex& z) { return std::tan(z); }));
    define(m, "asin", unary("asin", [](const Complex& z) { return std::asin(z); }));
    define(m, "acos", unary("acos", [](const Complex& z) { return std::acos(z); }));
    define(m, "atan", unary("atan", [](const Complex& z) { return std::atan(z); }));
    define(m, "sinh", unary("sinh", [](const Complex& z) { return std::sinh(z); }));
    define(m, "cosh", unary("cosh", [](const Complex& z) { return std::cosh(z); }));
    define(m, "tanh", unary("tanh", [](const Complex& z) { return std::tanh(z); }));
    define(m, "asinh", unary("asinh", [](const Complex& z) { return std::asinh(z); }));
    define(m, "acosh", unary("acosh", [](const Complex& z) { return std::acosh(z); }));
    define(m, "atanh", unary("atanh", [](const Complex& z) { return std::atanh(z); }));
    define(m, "phase", cmath_phase);
    define(m, "polar", cmath_polar);
    define(m, "rect", cmath_rect);
    define(m, "isfinite", [](Interpreter&, CallArgs& args) {
        return classify(args, "isfinite", [](double re, double im) { return std::isfinite(re) && std::isfinite(im); });
    });
    define(m, "isinf", [](Interpreter&, CallArgs& args) {
        return classify(args, "isinf", [](double re, double im) { return std::isinf(re) || std::isinf(im); });
    });
    define(m, "isnan", [](Interpreter&, CallArgs& args) {
        return classify(args, "isnan", [](double re, double im) { return std::isnan(re) || std::isnan(im); });
    });
    define(m, "isclose", cmath_isclose);
    return module;
}

} // namespace cinder::runtime
