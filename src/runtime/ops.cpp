#include <algorithm>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/memory_budget.h>
#include <cinder/runtime/ops.h>
#include <cmath>
#include <functional>
#include <limits>
#include <optional>
#include <string_view>

namespace cinder::runtime
{

using cinder::lexer::TokenKind;
using cinder::parser::CompareOp;

namespace
{

constexpr std::size_t kMaxCompareDepth = 500;
constexpr std::size_t kNoneHash = 0x9e3779b97f4a7c15ULL;

thread_local std::size_t g_compare_depth = 0;

class DepthGuard
{
  public:
    DepthGuard()
    {
        if (++g_compare_depth > kMaxCompareDepth)
        {
            --g_compare_depth;
            raise("RecursionError", "maximum recursion depth exceeded in comparison");
        }
    }
    ~DepthGuard() { --g_compare_depth; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;
};

const char* op_symbol(TokenKind op)
{
    switch (op)
    {
    case TokenKind::Plus:
        return "+";
    case TokenKind::Minus:
        return "-";
    case TokenKind::Star:
        return "*";
    case TokenKind::Slash:
        return "/";
    case TokenKind::DoubleSlash:
        return "//";
    case TokenKind::Percent:
        return "%";
    case TokenKind::DoubleStar:
        return "** or pow()";
    case TokenKind::LeftShift:
        return "<<";
    case TokenKind::RightShift:
        return ">>";
    case TokenKind::Amp:
        return "&";
    case TokenKind::Pipe:
        return "|";
    case TokenKind::Caret:
        return "^";
    case TokenKind::At:
        return "@";
    default:
        return "?";
    }
}

[[noreturn]] void unsupported(TokenKind op, const Value& lhs, const Value& rhs)
{
    raise("TypeError", std::string("unsupported operand type(s) for ") + op_symbol(op) + ": '" +
                           type_name(lhs) + "' and '" + type_name(rhs) + "'");
}

std::int64_t floor_div(std::int64_t a, std::int64_t b)
{
    if (b == 0)
    {
        raise("ZeroDivisionError", "integer division or modulo by zero");
    }
    if (a == std::numeric_limits<std::int64_t>::min() && b == -1)
    {
        raise("OverflowError", "integer overflow");
    }
    std::int64_t q = a / b;
    if (a % b != 0 && ((a < 0) != (b < 0)))
    {
        --q;
    }
    return q;
}

std::int64_t floor_mod(std::int64_t a, std::int64_t b)
{
    if (b == 0)
    {
        raise("ZeroDivisionError", "integer modulo by zero");
    }
    if (b == -1)
    {
        return 0;
    }
    std::int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0)))
    {
        r += b;
    }
    return r;
}

// Float floor division and modulo with the sign conventions of the divisor.
std::pair<double, double> float_divmod(double a, double b, const char* what)
{
    if (b == 0.0)
    {
        raise("ZeroDivisionError", what);
    }
    double mod = std::fmod(a, b);
    double div = (a - mod) / b;
    if (mod != 0.0)
    {
        if ((b < 0) != (mod < 0))
        {
            mod += b;
            div -= 1.0;
        }
    }
    else
    {
        mod = std::copysign(0.0, b);
    }
    double floordiv = 0.0;
    if (div != 0.0)
    {
        floordiv = std::floor(div);
        if (div - floordiv > 0.5)
        {
            floordiv += 1.0;
        }
    }
    else
    {
        floordiv = std::copysign(0.0, a / b);
    }
    return {floordiv, mod};
}

std::int64_t checked_shift_left(std::int64_t a, std::int64_t n)
{
    if (n < 0)
    {
        raise("ValueError", "negative shift count");
    }
    if (a == 0)
    {
        return 0;
    }
    if (n >= 63)
    {
        raise("OverflowError", "integer overflow");
    }
    const std::int64_t limit = std::numeric_limits<std::int64_t>::max() >> n;
    if (a > limit || a < -limit - 1)
    {
        raise("OverflowError", "integer overflow");
    }
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) << n);
}

std::int64_t shift_right(std::int64_t a, std::int64_t n)
{
    if (n < 0)
    {
        raise("ValueError", "negative shift count");
    }
    if (n >= 63)
    {
        return a < 0 ? -1 : 0;
    }
    return a >> n;
}

Value int_op(TokenKind op, const Value& lhs, const Value& rhs)
{
    const std::int64_t a = lhs.integral();
    const std::int64_t b = rhs.integral();
    switch (op)
    {
    case TokenKind::Plus:
        return Value::integer(checked_add(a, b));
    case TokenKind::Minus:
        return Value::integer(checked_sub(a, b));
    case TokenKind::Star:
        return Value::integer(checked_mul(a, b));
    case TokenKind::Slash:
        if (b == 0)
        {
            raise("ZeroDivisionError", "division by zero");
        }
        return Value::real(static_cast<double>(a) / static_cast<double>(b));
    case TokenKind::DoubleSlash:
        return Value::integer(floor_div(a, b));
    case TokenKind::Percent:
        return Value::integer(floor_mod(a, b));
    case TokenKind::DoubleStar:
        return power(lhs, rhs);
    case TokenKind::LeftShift:
        return Value::integer(checked_shift_left(a, b));
    case TokenKind::RightShift:
        return Value::integer(shift_right(a, b));
    case TokenKind::Amp:
        if (lhs.is_bool() && rhs.is_bool())
        {
            return Value::boolean(lhs.as_bool() && rhs.as_bool());
        }
        return Value::integer(a & b);
    case TokenKind::Pipe:
        if (lhs.is_bool() && rhs.is_bool())
        {
            return Value::boolean(lhs.as_bool() || rhs.as_bool());
        }
        return Value::integer(a | b);
    case TokenKind::Caret:
        if (lhs.is_bool() && rhs.is_bool())
        {
            return Value::boolean(lhs.as_bool() != rhs.as_bool());
        }
        return Value::integer(a ^ b);
    default:
        unsupported(op, lhs, rhs);
    }
}

Value float_op(TokenKind op, const Value& lhs, const Value& rhs)
{
    const double a = lhs.to_double();
    const double b = rhs.to_double();
    switch (op)
    {
    case TokenKind::Plus:
        return Value::real(a + b);
    case TokenKind::Minus:
        return Value::real(a - b);
    case TokenKind::Star:
        return Value::real(a * b);
    case TokenKind::Slash:
        if (b == 0.0)
        {
            raise("ZeroDivisionError", "float division by zero");
        }
        return Value::real(a / b);
    case TokenKind::DoubleSlash:
        return Value::real(float_divmod(a, b, "float floor division by zero").first);
    case TokenKind::Percent:
        return Value::real(float_divmod(a, b, "float modulo").second);
    case TokenKind::DoubleStar:
        return power(lhs, rhs);
    default:
        unsupported(op, lhs, rhs);
    }
}

std::complex<double> as_complex_number(const Value& v)
{
    return v.is_complex() ? v.as_complex() : std::complex<double>(v.to_double(), 0.0);
}

Value complex_op(TokenKind op, const Value& lhs, const Value& rhs)
{
    const auto a = as_complex_number(lhs);
    const auto b = as_complex_number(rhs);
    switch (op)
    {
    case TokenKind::Plus:
        return Value::complex(a + b);
    case TokenKind::Minus:
        return Value::complex(a - b);
    case TokenKind::Star:
        return Value::complex(a * b);
    case TokenKind::Slash:
        if (b == std::complex<double>(0.0, 0.0))
        {
            raise("ZeroDivisionError", "complex division by zero");
        }
        return Value::complex(a / b);
    case TokenKind::DoubleStar:
        return power(lhs, rhs);
    default:
        unsupported(op, lhs, rhs);
    }
}

bool is_number(const Value& v)
{
    return v.is_real() || v.is_complex();
}

std::size_t repeat_count(const Value& count)
{
    const std::int64_t n = count.integral();
    return n <= 0 ? 0 : static_cast<std::size_t>(n);
}

template <typename Seq> std::vector<Value> repeat_items(const Seq& items, std::size_t n)
{
    check_allocation(items.size() * std::min<std::size_t>(n, std::numeric_limits<std::size_t>::max() /
                                                                 std::max<std::size_t>(items.size(), 1)),
                     sizeof(Value));
    if (!items.empty() && n > std::numeric_limits<std::size_t>::max() / items.size() / sizeof(Value))
    {
        check_allocation(std::numeric_limits<std::size_t>::max());
    }
    std::vector<Value> out;
    out.reserve(items.size() * n);
    for (std::size_t i = 0; i < n; ++i)
    {
        out.insert(out.end(), items.begin(), items.end());
    }
    return out;
}

std::string repeat_text(const std::string& text, std::size_t n)
{
    if (!text.empty() && n > std::numeric_limits<std::size_t>::max() / text.size())
    {
        check_allocation(std::numeric_limits<std::size_t>::max());
    }
    check_allocation(text.size() * n);
    std::string out;
    out.reserve(text.size() * n);
    for (std::size_t i = 0; i < n; ++i)
    {
        out += text;
    }
    return out;
}

std::vector<Value> concat_items(const std::vector<Value>& a, const std::vector<Value>& b)
{
    check_allocation(a.size() + b.size(), sizeof(Value));
    std::vector<Value> out;
    out.reserve(a.size() + b.size());
    out.insert(out.end(), a.begin(), a.end());
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

void set_insert(const Value& set, const Value& key)
{
    set.as<SetObject>()->table.insert(key, Value::none());
}

Value set_op(TokenKind op, const SetObject& a, const SetObject& b)
{
    Value out = make_set();
    switch (op)
    {
    case TokenKind::Pipe:
        for (const auto& e : a.table.entries())
        {
            if (e.live)
            {
                set_insert(out, e.key);
            }
        }
        for (const auto& e : b.table.entries())
        {
            if (e.live)
            {
                set_insert(out, e.key);
            }
        }
        break;
    case TokenKind::Amp:
        for (const auto& e : a.table.entries())
        {
            if (e.live && b.table.find(e.key) != nullptr)
            {
                set_insert(out, e.key);
            }
        }
        break;
    case TokenKind::Minus:
        for (const auto& e : a.table.entries())
        {
            if (e.live && b.table.find(e.key) == nullptr)
            {
                set_insert(out, e.key);
            }
        }
        break;
    case TokenKind::Caret:
        for (const auto& e : a.table.entries())
        {
            if (e.live && b.table.find(e.key) == nullptr)
            {
                set_insert(out, e.key);
            }
        }
        for (const auto& e : b.table.entries())
        {
            if (e.live && a.table.find(e.key) == nullptr)
            {
                set_insert(out, e.key);
            }
        }
        break;
    default:
        break;
    }
    recharge(out);
    return out;
}

bool is_set_op(TokenKind op)
{
    return op == TokenKind::Pipe || op == TokenKind::Amp || op == TokenKind::Minus ||
           op == TokenKind::Caret;
}

// Exact comparison of an int with a float; nullopt when the float is NaN.
std::optional<int> compare_int_float(std::int64_t i, double d)
{
    if (std::isnan(d))
    {
        return std::nullopt;
    }
    if (d >= 9223372036854775808.0)
    {
        return -1;
    }
    if (d < -9223372036854775808.0)
    {
        return 1;
    }
    const double t = std::trunc(d);
    const auto ti = static_cast<std::int64_t>(t);
    if (i != ti)
    {
        return i < ti ? -1 : 1;
    }
    const double frac = d - t;
    if (frac > 0)
    {
        return -1;
    }
    if (frac < 0)
    {
        return 1;
    }
    return 0;
}

std::optional<int> compare_real(const Value& a, const Value& b)
{
    if (a.is_integral() && b.is_integral())
    {
        const auto x = a.integral();
        const auto y = b.integral();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_integral())
    {
        return compare_int_float(a.integral(), b.as_float());
    }
    if (b.is_integral())
    {
        auto r = compare_int_float(b.integral(), a.as_float());
        if (!r)
        {
            return r;
        }
        return -*r;
    }
    const double x = a.as_float();
    const double y = b.as_float();
    if (std::isnan(x) || std::isnan(y))
    {
        return std::nullopt;
    }
    return x < y ? -1 : (x > y ? 1 : 0);
}

[[noreturn]] void not_orderable(const char* symbol, const Value& a, const Value& b)
{
    raise("TypeError", std::string("'") + symbol + "' not supported between instances of '" +
                           type_name(a) + "' and '" + type_name(b) + "'");
}

const std::vector<Value>* sequence_items(const Value& v)
{
    if (const auto* list = v.as<ListObject>())
    {
        return &list->items;
    }
    if (const auto* tuple = v.as<TupleObject>())
    {
        return &tuple->items;
    }
    if (const auto* array = v.as<ArrayObject>())
    {
        return &array->items;
    }
    return nullptr;
}

// Total-order comparison for `<`, `<=`, `>`, `>=`; nullopt when unordered (NaN).
std::optional<int> three_way(const Value& a, const Value& b, const char* symbol)
{
    if (a.is_real() && b.is_real())
    {
        return compare_real(a, b);
    }
    if (const auto* sa = a.as<StrObject>())
    {
        if (const auto* sb = b.as<StrObject>())
        {
            const int c = sa->value.compare(sb->value);
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
    }
    if (const auto* ba = a.as<BytesObject>())
    {
        if (const auto* bb = b.as<BytesObject>())
        {
            const int c = ba->value.compare(bb->value);
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
    }
    if (a.is_object() && b.is_object() && a.as_object()->kind == b.as_object()->kind)
    {
        const auto* xa = sequence_items(a);
        const auto* xb = sequence_items(b);
        if (xa != nullptr && xb != nullptr)
        {
            DepthGuard guard;
            const std::size_t n = std::min(xa->size(), xb->size());
            for (std::size_t i = 0; i < n; ++i)
            {
                if (!identical((*xa)[i], (*xb)[i]) && !values_equal((*xa)[i], (*xb)[i]))
                {
                    return three_way((*xa)[i], (*xb)[i], symbol);
                }
            }
            return xa->size() < xb->size() ? -1 : (xa->size() > xb->size() ? 1 : 0);
        }
    }
    not_orderable(symbol, a, b);
}

bool is_subset(const SetObject& a, const SetObject& b)
{
    if (a.table.size() > b.table.size())
    {
        return false;
    }
    for (const auto& e : a.table.entries())
    {
        if (e.live && b.table.find(e.key) == nullptr)
        {
            return false;
        }
    }
    return true;
}

bool compare_sets(CompareOp op, const SetObject& a, const SetObject& b)
{
    switch (op)
    {
    case CompareOp::Less:
        return a.table.size() < b.table.size() && is_subset(a, b);
    case CompareOp::LessEqual:
        return is_subset(a, b);
    case CompareOp::Greater:
        return b.table.size() < a.table.size() && is_subset(b, a);
    case CompareOp::GreaterEqual:
        return is_subset(b, a);
    default:
        return false;
    }
}

std::size_t mix(std::size_t seed, std::size_t h)
{
    return seed ^ (h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

std::size_t hash_int(std::int64_t v)
{
    return std::hash<std::int64_t>{}(v);
}

std::size_t hash_double(double d)
{
    if (std::isfinite(d) && d == std::trunc(d) && d >= -9223372036854775808.0 &&
        d < 9223372036854775808.0)
    {
        return hash_int(static_cast<std::int64_t>(d));
    }
    return std::hash<double>{}(d);
}

const HashTable* table_of(const Value& v)
{
    if (const auto* d = v.as<DictObject>())
    {
        return &d->table;
    }
    if (const auto* s = v.as<SetObject>())
    {
        return &s->table;
    }
    return nullptr;
}

std::string code_point_at(const StrObject& s, std::size_t index)
{
    if (s.ascii)
    {
        return std::string(1, s.value[index]);
    }
    const std::size_t begin = utf8_offset(s.value, index);
    const std::size_t end = utf8_offset(s.value, index + 1);
    return s.value.substr(begin, end - begin);
}

std::string slice_text(const StrObject& s, const SliceBounds& b)
{
    std::string out;
    if (s.ascii)
    {
        if (b.step == 1)
        {
            return s.value.substr(static_cast<std::size_t>(b.start), b.count);
        }
        out.reserve(b.count);
        for (std::size_t i = 0; i < b.count; ++i)
        {
            out += s.value[static_cast<std::size_t>(b.start + static_cast<std::int64_t>(i) * b.step)];
        }
        return out;
    }
    std::vector<std::size_t> offsets;
    offsets.reserve(s.length + 1);
    for (std::size_t i = 0; i < s.value.size(); ++i)
    {
        if ((static_cast<unsigned char>(s.value[i]) & 0xC0) != 0x80)
        {
            offsets.push_back(i);
        }
    }
    offsets.push_back(s.value.size());
    for (std::size_t i = 0; i < b.count; ++i)
    {
        const auto idx = static_cast<std::size_t>(b.start + static_cast<std::int64_t>(i) * b.step);
        out.append(s.value, offsets[idx], offsets[idx + 1] - offsets[idx]);
    }
    return out;
}

template <typename Seq> std::vector<Value> slice_items(const Seq& items, const SliceBounds& b)
{
    std::vector<Value> out;
    out.reserve(b.count);
    for (std::size_t i = 0; i < b.count; ++i)
    {
        out.push_back(items[static_cast<std::size_t>(b.start + static_cast<std::int64_t>(i) * b.step)]);
    }
    return out;
}

[[noreturn]] void not_subscriptable(const Value& v)
{
    raise("TypeError", "'" + type_name(v) + "' object is not subscriptable");
}

[[noreturn]] void bad_index_type(const char* container, const Value& key)
{
    raise("TypeError", std::string(container) + " indices must be integers or slices, not " +
                           type_name(key));
}

Value hash_table_iterator(std::string type_name, std::shared_ptr<Object> owner, const HashTable* table,
                          DictViewObject::Which which, const char* changed_message)
{
    auto index = std::make_shared<std::size_t>(0);
    const std::size_t version = table->version();
    return make_iterator(std::move(type_name),
                         [owner = std::move(owner), table, which, index, version,
                          changed_message](Interpreter&) -> std::optional<Value> {
                             if (table->version() != version)
                             {
                                 raise("RuntimeError", changed_message);
                             }
                             const auto& entries = table->entries();
                             while (*index < entries.size() && !entries[*index].live)
                             {
                                 ++*index;
                             }
                             if (*index >= entries.size())
                             {
                                 return std::nullopt;
                             }
                             const HashEntry& e = entries[(*index)++];
                             switch (which)
                             {
                             case DictViewObject::Which::Keys:
                                 return e.key;
                             case DictViewObject::Which::Values:
                                 return e.value;
                             case DictViewObject::Which::Items:
                                 return make_tuple({e.key, e.value});
                             }
                             return e.key;
                         });
}

} // namespace

Value check_array_item(const ArrayObject& array, const Value& v)
{
    if (array.holds_floats())
    {
        if (!v.is_real())
        {
            raise("TypeError", "must be real number, not " + type_name(v));
        }
        return Value::real(v.to_double());
    }
    if (!v.is_integral())
    {
        raise("TypeError", "'" + type_name(v) + "' object cannot be interpreted as an integer");
    }
    return Value::integer(v.integral());
}

std::int64_t checked_add(std::int64_t a, std::int64_t b)
{
    std::int64_t out = 0;
    if (__builtin_add_overflow(a, b, &out))
    {
        raise("OverflowError", "integer overflow");
    }
    return out;
}

std::int64_t checked_sub(std::int64_t a, std::int64_t b)
{
    std::int64_t out = 0;
    if (__builtin_sub_overflow(a, b, &out))
    {
        raise("OverflowError", "integer overflow");
    }
    return out;
}

std::int64_t checked_mul(std::int64_t a, std::int64_t b)
{
    std::int64_t out = 0;
    if (__builtin_mul_overflow(a, b, &out))
    {
        raise("OverflowError", "integer overflow");
    }
    return out;
}

std::int64_t float_to_int(double value)
{
    if (std::isnan(value))
    {
        raise("ValueError", "cannot convert float NaN to integer");
    }
    if (std::isinf(value))
    {
        raise("OverflowError", "cannot convert float infinity to integer");
    }
    if (value >= 9223372036854775808.0 || value < -9223372036854775808.0)
    {
        raise("OverflowError", "integer overflow");
    }
    return static_cast<std::int64_t>(value);
}

Value power(const Value& base, const Value& exponent)
{
    if (base.is_integral() && exponent.is_integral())
    {
        std::int64_t b = base.integral();
        std::int64_t e = exponent.integral();
        if (e < 0)
        {
            if (b == 0)
            {
                raise("ZeroDivisionError", "0.0 cannot be raised to a negative power");
            }
            return Value::real(std::pow(static_cast<double>(b), static_cast<double>(e)));
        }
        std::int64_t result = 1;
        while (e > 0)
        {
            if ((e & 1) != 0)
            {
                result = checked_mul(result, b);
            }
            e >>= 1;
            if (e > 0)
            {
                b = checked_mul(b, b);
            }
        }
        return Value::integer(result);
    }
    if (base.is_real() && exponent.is_real())
    {
        const double b = base.to_double();
        const double e = exponent.to_double();
        if (b == 0.0 && e < 0.0)
        {
            raise("ZeroDivisionError", "0.0 cannot be raised to a negative power");
        }
        if (b < 0.0 && std::isfinite(e) && e != std::trunc(e))
        {
            return Value::complex(std::pow(std::complex<double>(b, 0.0), e));
        }
        const double r = std::pow(b, e);
        if (std::isinf(r) && std::isfinite(b) && std::isfinite(e))
        {
            raise("OverflowError", "(34, 'Numerical result out of range')");
        }
        return Value::real(r);
    }
    if (is_number(base) && is_number(exponent))
    {
        const auto b = as_complex_number(base);
        const auto e = as_complex_number(exponent);
        if (b == std::complex<double>(0.0, 0.0) && (e.real() < 0.0 || e.imag() != 0.0))
        {
            raise("ZeroDivisionError", "0.0 to a negative or complex power");
        }
        return Value::complex(std::pow(b, e));
    }
    unsupported(TokenKind::DoubleStar, base, exponent);
}

bool truthy(const Value& value)
{
    return std::visit(
        [&](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>)
            {
                return false;
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
                return v;
            }
            else if constexpr (std::is_same_v<T, std::int64_t>)
            {
                return v != 0;
            }
            else if constexpr (std::is_same_v<T, double>)
            {
                return v != 0.0;
            }
            else if constexpr (std::is_same_v<T, std::complex<double>>)
            {
                return v != std::complex<double>(0.0, 0.0);
            }
            else
            {
                switch (v->kind)
                {
                case ObjectKind::Str:
                case ObjectKind::Bytes:
                case ObjectKind::List:
                case ObjectKind::Tuple:
                case ObjectKind::Dict:
                case ObjectKind::Set:
                case ObjectKind::Range:
                case ObjectKind::Array:
                case ObjectKind::DictView:
                    return length(value) != 0;
                default:
                    return true;
                }
            }
        },
        value.storage());
}

Value binary_op(TokenKind op, const Value& lhs, const Value& rhs)
{
    if (lhs.is_integral() && rhs.is_integral())
    {
        return int_op(op, lhs, rhs);
    }
    if (lhs.is_real() && rhs.is_real())
    {
        return float_op(op, lhs, rhs);
    }
    if (is_number(lhs) && is_number(rhs))
    {
        return complex_op(op, lhs, rhs);
    }

    if (op == TokenKind::Percent)
    {
        if (const auto* s = lhs.as<StrObject>())
        {
            return make_str(percent_format(s->value, rhs));
        }
    }

    if (op == TokenKind::Plus && lhs.is_object() && rhs.is_object() &&
        lhs.as_object()->kind == rhs.as_object()->kind)
    {
        if (const auto* a = lhs.as<StrObject>())
        {
            const auto* b = rhs.as<StrObject>();
            check_allocation(a->value.size() + b->value.size());
            return make_str(a->value + b->value);
        }
        if (const auto* a = lhs.as<BytesObject>())
        {
            const auto* b = rhs.as<BytesObject>();
            check_allocation(a->value.size() + b->value.size());
            return make_bytes(a->value + b->value);
        }
        if (const auto* a = lhs.as<ListObject>())
        {
            return make_list(concat_items(a->items, rhs.as<ListObject>()->items));
        }
        if (const auto* a = lhs.as<TupleObject>())
        {
            return make_tuple(concat_items(a->items, rhs.as<TupleObject>()->items));
        }
    }

    if (op == TokenKind::Star)
    {
        const Value* seq = nullptr;
        const Value* count = nullptr;
        if (rhs.is_integral())
        {
            seq = &lhs;
            count = &rhs;
        }
        else if (lhs.is_integral())
        {
            seq = &rhs;
            count = &lhs;
        }
        if (seq != nullptr)
        {
            const std::size_t n = repeat_count(*count);
            if (const auto* s = seq->as<StrObject>())
            {
                return make_str(repeat_text(s->value, n));
            }
            if (const auto* b = seq->as<BytesObject>())
            {
                return make_bytes(repeat_text(b->value, n));
            }
            if (const auto* l = seq->as<ListObject>())
            {
                return make_list(repeat_items(l->items, n));
            }
            if (const auto* t = seq->as<TupleObject>())
            {
                return make_tuple(repeat_items(t->items, n));
            }
        }
    }

    if (is_set_op(op))
    {
        const auto* a = lhs.as<SetObject>();
        const auto* b = rhs.as<SetObject>();
        if (a != nullptr && b != nullptr)
        {
            return set_op(op, *a, *b);
        }
    }

    if (op == TokenKind::Pipe)
    {
        const auto* a = lhs.as<DictObject>();
        const auto* b = rhs.as<DictObject>();
        if (a != nullptr && b != nullptr)
        {
            Value out = make_dict();
            auto& table = out.as<DictObject>()->table;
            for (const auto* src : {a, b})
            {
                for (const auto& e : src->table.entries())
                {
                    if (e.live)
                    {
                        table.insert(e.key, e.value);
                    }
                }
            }
            recharge(out);
            return out;
        }
    }

    unsupported(op, lhs, rhs);
}

Value inplace_op(Interpreter& interp, TokenKind op, const Value& lhs, const Value& rhs)
{
    if (auto* list = lhs.as<ListObject>())
    {
        if (op == TokenKind::Plus)
        {
            std::vector<Value> extra = interp.collect(rhs);
            check_allocation(list->items.size() + extra.size(), sizeof(Value));
            list->items.insert(list->items.end(), extra.begin(), extra.end());
            recharge(lhs);
            return lhs;
        }
        if (op == TokenKind::Star && rhs.is_integral())
        {
            list->items = repeat_items(list->items, repeat_count(rhs));
            recharge(lhs);
            return lhs;
        }
    }
    if (auto* set = lhs.as<SetObject>(); set != nullptr && is_set_op(op))
    {
        const auto* other = rhs.as<SetObject>();
        if (other == nullptr)
        {
            unsupported(op, lhs, rhs);
        }
        if (op == TokenKind::Pipe)
        {
            for (const auto& e : other->table.entries())
            {
                if (e.live)
                {
                    set->table.insert(e.key, Value::none());
                }
            }
        }
        else
        {
            Value result = set_op(op, *set, *other);
            set->table = result.as<SetObject>()->table;
        }
        recharge(lhs);
        return lhs;
    }
    if (auto* dict = lhs.as<DictObject>(); dict != nullptr && op == TokenKind::Pipe)
    {
        if (const auto* other = rhs.as<DictObject>())
        {
            std::vector<std::pair<Value, Value>> items;
            for (const auto& e : other->table.entries())
            {
                if (e.live)
                {
                    items.emplace_back(e.key, e.value);
                }
            }
            for (auto& [k, v] : items)
            {
                dict->table.insert(k, std::move(v));
            }
            recharge(lhs);
            return lhs;
        }
    }
    return binary_op(op, lhs, rhs);
}

Value unary_op(TokenKind op, const Value& operand)
{
    switch (op)
    {
    case TokenKind::KwNot:
        return Value::boolean(!truthy(operand));
    case TokenKind::Minus:
        if (operand.is_integral())
        {
            return Value::integer(checked_sub(0, operand.integral()));
        }
        if (operand.is_float())
        {
            return Value::real(-operand.as_float());
        }
        if (operand.is_complex())
        {
            return Value::complex(-operand.as_complex());
        }
        break;
    case TokenKind::Plus:
        if (operand.is_integral())
        {
            return Value::integer(operand.integral());
        }
        if (operand.is_float() || operand.is_complex())
        {
            return operand;
        }
        break;
    case TokenKind::Tilde:
        if (operand.is_integral())
        {
            return Value::integer(~operand.integral());
        }
        break;
    default:
        break;
    }
    const char* symbol = op == TokenKind::Minus ? "-" : (op == TokenKind::Plus ? "+" : "~");
    raise("TypeError", std::string("bad operand type for unary ") + symbol + ": '" +
                           type_name(operand) + "'");
}

bool identical(const Value& lhs, const Value& rhs)
{
    if (lhs.is_object() && rhs.is_object())
    {
        return lhs.as_object() == rhs.as_object();
    }
    if (lhs.storage().index() != rhs.storage().index())
    {
        return false;
    }
    if (lhs.is_none())
    {
        return true;
    }
    if (lhs.is_bool())
    {
        return lhs.as_bool() == rhs.as_bool();
    }
    if (lhs.is_int())
    {
        return lhs.as_int() == rhs.as_int();
    }
    if (lhs.is_float())
    {
        return lhs.as_float() == rhs.as_float();
    }
    return lhs.as_complex() == rhs.as_complex();
}

bool values_equal(const Value& lhs, const Value& rhs)
{
    if (lhs.is_real() && rhs.is_real())
    {
        auto c = compare_real(lhs, rhs);
        return c && *c == 0;
    }
    if (is_number(lhs) && is_number(rhs))
    {
        return as_complex_number(lhs) == as_complex_number(rhs);
    }
    if (lhs.is_none() || rhs.is_none())
    {
        return lhs.is_none() && rhs.is_none();
    }
    if (!lhs.is_object() || !rhs.is_object())
    {
        return false;
    }
    if (lhs.as_object() == rhs.as_object())
    {
        return true;
    }
    const ObjectKind kind = lhs.as_object()->kind;
    if (kind != rhs.as_object()->kind)
    {
        return false;
    }

    switch (kind)
    {
    case ObjectKind::Str:
        return lhs.as<StrObject>()->value == rhs.as<StrObject>()->value;
    case ObjectKind::Bytes:
        return lhs.as<BytesObject>()->value == rhs.as<BytesObject>()->value;
    case ObjectKind::List:
    case ObjectKind::Tuple:
    case ObjectKind::Array: {
        const auto& a = *sequence_items(lhs);
        const auto& b = *sequence_items(rhs);
        if (a.size() != b.size())
        {
            return false;
        }
        DepthGuard guard;
        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (!identical(a[i], b[i]) && !values_equal(a[i], b[i]))
            {
                return false;
            }
        }
        return true;
    }
    case ObjectKind::Dict: {
        const auto& a = lhs.as<DictObject>()->table;
        const auto& b = rhs.as<DictObject>()->table;
        if (a.size() != b.size())
        {
            return false;
        }
        DepthGuard guard;
        for (const auto& e : a.entries())
        {
            if (!e.live)
            {
                continue;
            }
            const HashEntry* other = b.find(e.key);
            if (other == nullptr || (!identical(e.value, other->value) && !values_equal(e.value, other->value)))
            {
                return false;
            }
        }
        return true;
    }
    case ObjectKind::Set: {
        const auto& a = *lhs.as<SetObject>();
        const auto& b = *rhs.as<SetObject>();
        return a.table.size() == b.table.size() && is_subset(a, b);
    }
    case ObjectKind::Range: {
        const auto* a = lhs.as<RangeObject>();
        const auto* b = rhs.as<RangeObject>();
        const auto n = a->size();
        if (n != b->size())
        {
            return false;
        }
        if (n == 0)
        {
            return true;
        }
        return a->start == b->start && (n == 1 || a->step == b->step);
    }
    default:
        return false;
    }
}

bool less_than(const Value& lhs, const Value& rhs)
{
    const auto* a = lhs.as<SetObject>();
    const auto* b = rhs.as<SetObject>();
    if (a != nullptr && b != nullptr)
    {
        return compare_sets(CompareOp::Less, *a, *b);
    }
    auto c = three_way(lhs, rhs, "<");
    return c && *c < 0;
}

bool compare(Interpreter& interp, CompareOp op, const Value& lhs, const Value& rhs)
{
    switch (op)
    {
    case CompareOp::Equal:
        return identical(lhs, rhs) && !(lhs.is_float() && std::isnan(lhs.as_float()))
                   ? true
                   : values_equal(lhs, rhs);
    case CompareOp::NotEqual:
        return !values_equal(lhs, rhs);
    case CompareOp::In:
        return contains(interp, rhs, lhs);
    case CompareOp::NotIn:
        return !contains(interp, rhs, lhs);
    case CompareOp::Is:
        return identical(lhs, rhs);
    case CompareOp::IsNot:
        return !identical(lhs, rhs);
    default:
        break;
    }

    const auto* sa = lhs.as<SetObject>();
    const auto* sb = rhs.as<SetObject>();
    if (sa != nullptr && sb != nullptr)
    {
        return compare_sets(op, *sa, *sb);
    }

    const char* symbol = "<";
    switch (op)
    {
    case CompareOp::LessEqual:
        symbol = "<=";
        break;
    case CompareOp::Greater:
        symbol = ">";
        break;
    case CompareOp::GreaterEqual:
        symbol = ">=";
        break;
    default:
        break;
    }
    const auto c = three_way(lhs, rhs, symbol);
    if (!c)
    {
        return false;
    }
    switch (op)
    {
    case CompareOp::Less:
        return *c < 0;
    case CompareOp::LessEqual:
        return *c <= 0;
    case CompareOp::Greater:
        return *c > 0;
    case CompareOp::GreaterEqual:
        return *c >= 0;
    default:
        return false;
    }
}

std::size_t hash_value(const Value& value)
{
    return std::visit(
        [&](const auto& v) -> std::size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>)
            {
                return kNoneHash;
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
                return hash_int(v ? 1 : 0);
            }
            else if constexpr (std::is_same_v<T, std::int64_t>)
            {
                return hash_int(v);
            }
            else if constexpr (std::is_same_v<T, double>)
            {
                return hash_double(v);
            }
            else if constexpr (std::is_same_v<T, std::complex<double>>)
            {
                if (v.imag() == 0.0)
                {
                    return hash_double(v.real());
                }
                return mix(hash_double(v.real()), hash_double(v.imag()));
            }
            else
            {
                switch (v->kind)
                {
                case ObjectKind::Str:
                    return std::hash<std::string>{}(static_cast<const StrObject*>(v.get())->value);
                case ObjectKind::Bytes:
                    return mix(0xb7e151628aed2a6bULL,
                               std::hash<std::string>{}(static_cast<const BytesObject*>(v.get())->value));
                case ObjectKind::Tuple: {
                    DepthGuard guard;
                    std::size_t h = 0x345678;
                    for (const auto& item : static_cast<const TupleObject*>(v.get())->items)
                    {
                        h = mix(h, hash_value(item));
                    }
                    return h;
                }
                case ObjectKind::Range: {
                    const auto* r = static_cast<const RangeObject*>(v.get());
                    return mix(mix(hash_int(r->size()), hash_int(r->start)), hash_int(r->step));
                }
                case ObjectKind::List:
                case ObjectKind::Dict:
                case ObjectKind::Set:
                case ObjectKind::Array:
                case ObjectKind::DictView:
                    raise("TypeError", "unhashable type: '" + type_name(value) + "'");
                default:
                    return std::hash<const Object*>{}(v.get());
                }
            }
        },
        value.storage());
}

bool contains(Interpreter& interp, const Value& container, const Value& item)
{
    if (const auto* s = container.as<StrObject>())
    {
        const auto* needle = item.as<StrObject>();
        if (needle == nullptr)
        {
            raise("TypeError", "'in <string>' requires string as left operand, not " + type_name(item));
        }
        return s->value.find(needle->value) != std::string::npos;
    }
    if (const auto* b = container.as<BytesObject>())
    {
        if (item.is_integral())
        {
            const auto byte = item.integral();
            if (byte < 0 || byte > 255)
            {
                raise("ValueError", "byte must be in range(0, 256)");
            }
            return b->value.find(static_cast<char>(byte)) != std::string::npos;
        }
        if (const auto* needle = item.as<BytesObject>())
        {
            return b->value.find(needle->value) != std::string::npos;
        }
        raise("TypeError", "a bytes-like object is required, not '" + type_name(item) + "'");
    }
    if (const auto* items = sequence_items(container))
    {
        return std::any_of(items->begin(), items->end(), [&](const Value& v) {
            return identical(v, item) || values_equal(v, item);
        });
    }
    if (const auto* table = table_of(container))
    {
        return table->find(item) != nullptr;
    }
    if (const auto* r = container.as<RangeObject>())
    {
        std::int64_t x = 0;
        if (item.is_integral())
        {
            x = item.integral();
        }
        else if (item.is_float() && std::isfinite(item.as_float()) &&
                 item.as_float() == std::trunc(item.as_float()))
        {
            x = float_to_int(item.as_float());
        }
        else
        {
            return false;
        }
        if (r->step > 0 ? (x < r->start || x >= r->stop) : (x > r->start || x <= r->stop))
        {
            return false;
        }
        return (x - r->start) % r->step == 0;
    }
    if (const auto* view = container.as<DictViewObject>())
    {
        const auto& table = view->dict->table;
        switch (view->which)
        {
        case DictViewObject::Which::Keys:
            return table.find(item) != nullptr;
        case DictViewObject::Which::Items: {
            const auto* pair = item.as<TupleObject>();
            if (pair == nullptr || pair->items.size() != 2)
            {
                return false;
            }
            const HashEntry* e = table.find(pair->items[0]);
            return e != nullptr && values_equal(e->value, pair->items[1]);
        }
        case DictViewObject::Which::Values:
            for (const auto& e : table.entries())
            {
                if (e.live && (identical(e.value, item) || values_equal(e.value, item)))
                {
                    return true;
                }
            }
            return false;
        }
    }
    if (container.is(ObjectKind::Iterator))
    {
        while (auto next = interp.next(container))
        {
            if (identical(*next, item) || values_equal(*next, item))
            {
                return true;
            }
        }
        return false;
    }
    raise("TypeError", "argument of type '" + type_name(container) + "' is not iterable");
}

std::int64_t to_index(const Value& value, const char* what)
{
    if (!value.is_integral())
    {
        raise("TypeError", std::string(what) + " must be integers or slices, not " + type_name(value));
    }
    return value.integral();
}

std::size_t normalize_index(std::int64_t index, std::size_t size, const char* what)
{
    const auto n = static_cast<std::int64_t>(size);
    if (index < 0)
    {
        index += n;
    }
    if (index < 0 || index >= n)
    {
        raise("IndexError", std::string(what) + " index out of range");
    }
    return static_cast<std::size_t>(index);
}

SliceBounds resolve_slice(const Value& lower, const Value& upper, const Value& step_value,
                          std::size_t size)
{
    auto slice_int = [](const Value& v) {
        if (!v.is_integral())
        {
            raise("TypeError", "slice indices must be integers or None");
        }
        return v.integral();
    };

    SliceBounds b;
    b.step = step_value.is_none() ? 1 : slice_int(step_value);
    if (b.step == 0)
    {
        raise("ValueError", "slice step cannot be zero");
    }
    const auto n = static_cast<std::int64_t>(size);

    auto clamp = [&](const Value& v, std::int64_t fallback) {
        if (v.is_none())
        {
            return fallback;
        }
        std::int64_t x = slice_int(v);
        if (x < 0)
        {
            x = x < -n ? -n - 1 : x;
            x += n;
            if (x < 0)
            {
                return b.step < 0 ? std::int64_t{-1} : std::int64_t{0};
            }
        }
        else if (x >= n)
        {
            return b.step < 0 ? n - 1 : n;
        }
        return x;
    };

    if (b.step > 0)
    {
        b.start = clamp(lower, 0);
        b.stop = clamp(upper, n);
        b.count = b.stop > b.start ? static_cast<std::size_t>((b.stop - b.start - 1) / b.step + 1) : 0;
    }
    else
    {
        b.start = clamp(lower, n - 1);
        b.stop = clamp(upper, -1);
        b.count = b.start > b.stop ? static_cast<std::size_t>((b.start - b.stop - 1) / (-b.step) + 1) : 0;
    }
    return b;
}

Value get_item(Interpreter& interp, const Value& container, const Value& key)
{
    (void)interp;
    if (const auto* dict = container.as<DictObject>())
    {
        const HashEntry* e = dict->table.find(key);
        if (e == nullptr)
        {
            raise_with_args("KeyError", {key});
        }
        return e->value;
    }
    if (const auto* list = container.as<ListObject>())
    {
        return list->items[normalize_index(to_index(key, "list indices"), list->items.size(), "list")];
    }
    if (const auto* tuple = container.as<TupleObject>())
    {
        return tuple->items[normalize_index(to_index(key, "tuple indices"), tuple->items.size(), "tuple")];
    }
    if (const auto* s = container.as<StrObject>())
    {
        if (!key.is_integral())
        {
            bad_index_type("string", key);
        }
        return make_str(code_point_at(*s, normalize_index(key.integral(), s->length, "string")));
    }
    if (const auto* b = container.as<BytesObject>())
    {
        if (!key.is_integral())
        {
            bad_index_type("byte", key);
        }
        const auto idx = normalize_index(key.integral(), b->value.size(), "index");
        return Value::integer(static_cast<unsigned char>(b->value[idx]));
    }
    if (const auto* r = container.as<RangeObject>())
    {
        if (!key.is_integral())
        {
            bad_index_type("range", key);
        }
        const auto idx = normalize_index(key.integral(), static_cast<std::size_t>(r->size()), "range object");
        return Value::integer(r->at(static_cast<std::int64_t>(idx)));
    }
    if (const auto* a = container.as<ArrayObject>())
    {
        return a->items[normalize_index(to_index(key, "array indices"), a->items.size(), "array")];
    }
    not_subscriptable(container);
}

Value get_slice(const Value& container, const Value& lower, const Value& upper, const Value& step)
{
    if (const auto* list = container.as<ListObject>())
    {
        return make_list(slice_items(list->items, resolve_slice(lower, upper, step, list->items.size())));
    }
    if (const auto* tuple = container.as<TupleObject>())
    {
        return make_tuple(slice_items(tuple->items, resolve_slice(lower, upper, step, tuple->items.size())));
    }
    if (const auto* s = container.as<StrObject>())
    {
        return make_str(slice_text(*s, resolve_slice(lower, upper, step, s->length)));
    }
    if (const auto* b = container.as<BytesObject>())
    {
        const auto bounds = resolve_slice(lower, upper, step, b->value.size());
        std::string out;
        out.reserve(bounds.count);
        for (std::size_t i = 0; i < bounds.count; ++i)
        {
            out += b->value[static_cast<std::size_t>(bounds.start + static_cast<std::int64_t>(i) * bounds.step)];
        }
        return make_bytes(std::move(out));
    }
    if (const auto* r = container.as<RangeObject>())
    {
        const auto bounds = resolve_slice(lower, upper, step, static_cast<std::size_t>(r->size()));
        const std::int64_t new_step = checked_mul(r->step, bounds.step);
        const std::int64_t new_start = r->at(bounds.start);
        const std::int64_t new_stop =
            checked_add(new_start, checked_mul(static_cast<std::int64_t>(bounds.count), new_step));
        return make_range(new_start, new_stop, new_step);
    }
    if (const auto* a = container.as<ArrayObject>())
    {
        return make_array(a->typecode, slice_items(a->items, resolve_slice(lower, upper, step, a->items.size())));
    }
    not_subscriptable(container);
}

void set_item(const Value& container, const Value& key, Value value)
{
    if (auto* dict = container.as<DictObject>())
    {
        dict->table.insert(key, std::move(value));
        recharge(container);
        return;
    }
    if (auto* list = container.as<ListObject>())
    {
        list->items[normalize_index(to_index(key, "list indices"), list->items.size(), "list assignment")] =
            std::move(value);
        return;
    }
    if (auto* array = container.as<ArrayObject>())
    {
        const auto idx = normalize_index(to_index(key, "array indices"), array->items.size(), "array assignment");
        array->items[idx] = check_array_item(*array, value);
        return;
    }
    raise("TypeError", "'" + type_name(container) + "' object does not support item assignment");
}

void set_slice(Interpreter& interp, const Value& container, const Value& lower, const Value& upper,
               const Value& step, const Value& values)
{
    std::vector<Value>* items = nullptr;
    auto* array = container.as<ArrayObject>();
    if (auto* list = container.as<ListObject>())
    {
        items = &list->items;
    }
    else if (array != nullptr)
    {
        items = &array->items;
    }
    else
    {
        raise("TypeError", "'" + type_name(container) + "' object does not support item assignment");
    }

    std::vector<Value> replacement = interp.collect(values);
    if (array != nullptr)
    {
        for (auto& v : replacement)
        {
            v = check_array_item(*array, v);
        }
    }
    const auto b = resolve_slice(lower, upper, step, items->size());
    if (b.step == 1)
    {
        const auto start = static_cast<std::size_t>(b.start);
        const auto stop = static_cast<std::size_t>(std::max(b.stop, b.start));
        check_allocation(items->size() - (stop - start) + replacement.size(), sizeof(Value));
        items->erase(items->begin() + static_cast<std::ptrdiff_t>(start),
                     items->begin() + static_cast<std::ptrdiff_t>(stop));
        items->insert(items->begin() + static_cast<std::ptrdiff_t>(start), replacement.begin(),
                      replacement.end());
        recharge(container);
        return;
    }
    if (replacement.size() != b.count)
    {
        raise("ValueError", "attempt to assign sequence of size " + std::to_string(replacement.size()) +
                                " to extended slice of size " + std::to_string(b.count));
    }
    for (std::size_t i = 0; i < b.count; ++i)
    {
        (*items)[static_cast<std::size_t>(b.start + static_cast<std::int64_t>(i) * b.step)] = replacement[i];
    }
}

void delete_item(const Value& container, const Value& key)
{
    if (auto* dict = container.as<DictObject>())
    {
        if (!dict->table.erase(key))
        {
            raise_with_args("KeyError", {key});
        }
        return;
    }
    if (auto* list = container.as<ListObject>())
    {
        const auto idx = normalize_index(to_index(key, "list indices"), list->items.size(), "list assignment");
        list->items.erase(list->items.begin() + static_cast<std::ptrdiff_t>(idx));
        return;
    }
    if (auto* array = container.as<ArrayObject>())
    {
        const auto idx = normalize_index(to_index(key, "array indices"), array->items.size(), "array assignment");
        array->items.erase(array->items.begin() + static_cast<std::ptrdiff_t>(idx));
        return;
    }
    raise("TypeError", "'" + type_name(container) + "' object doesn't support item deletion");
}

void delete_slice(const Value& container, const Value& lower, const Value& upper, const Value& step)
{
    std::vector<Value>* items = nullptr;
    if (auto* list = container.as<ListObject>())
    {
        items = &list->items;
    }
    else if (auto* array = container.as<ArrayObject>())
    {
        items = &array->items;
    }
    else
    {
        raise("TypeError", "'" + type_name(container) + "' object doesn't support item deletion");
    }
    const auto b = resolve_slice(lower, upper, step, items->size());
    std::vector<std::size_t> doomed;
    doomed.reserve(b.count);
    for (std::size_t i = 0; i < b.count; ++i)
    {
        doomed.push_back(static_cast<std::size_t>(b.start + static_cast<std::int64_t>(i) * b.step));
    }
    std::sort(doomed.begin(), doomed.end());
    std::vector<Value> kept;
    kept.reserve(items->size() - doomed.size());
    std::size_t d = 0;
    for (std::size_t i = 0; i < items->size(); ++i)
    {
        if (d < doomed.size() && doomed[d] == i)
        {
            ++d;
            continue;
        }
        kept.push_back(std::move((*items)[i]));
    }
    *items = std::move(kept);
}

Value make_iter(const Value& iterable)
{
    if (iterable.is(ObjectKind::Iterator))
    {
        return iterable;
    }
    if (auto list = iterable.shared<ListObject>())
    {
        auto index = std::make_shared<std::size_t>(0);
        return make_iterator("list_iterator", [list, index](Interpreter&) -> std::optional<Value> {
            if (*index >= list->items.size())
            {
                return std::nullopt;
            }
            return list->items[(*index)++];
        });
    }
    if (auto tuple = iterable.shared<TupleObject>())
    {
        auto index = std::make_shared<std::size_t>(0);
        return make_iterator("tuple_iterator", [tuple, index](Interpreter&) -> std::optional<Value> {
            if (*index >= tuple->items.size())
            {
                return std::nullopt;
            }
            return tuple->items[(*index)++];
        });
    }
    if (auto array = iterable.shared<ArrayObject>())
    {
        auto index = std::make_shared<std::size_t>(0);
        return make_iterator("arrayiterator", [array, index](Interpreter&) -> std::optional<Value> {
            if (*index >= array->items.size())
            {
                return std::nullopt;
            }
            return array->items[(*index)++];
        });
    }
    if (auto s = iterable.shared<StrObject>())
    {
        auto offset = std::make_shared<std::size_t>(0);
        return make_iterator("str_iterator", [s, offset](Interpreter&) -> std::optional<Value> {
            if (*offset >= s->value.size())
            {
                return std::nullopt;
            }
            std::size_t end = *offset + 1;
            while (end < s->value.size() && (static_cast<unsigned char>(s->value[end]) & 0xC0) == 0x80)
            {
                ++end;
            }
            Value out = make_str(s->value.substr(*offset, end - *offset));
            *offset = end;
            return out;
        });
    }
    if (auto b = iterable.shared<BytesObject>())
    {
        auto index = std::make_shared<std::size_t>(0);
        return make_iterator("bytes_iterator", [b, index](Interpreter&) -> std::optional<Value> {
            if (*index >= b->value.size())
            {
                return std::nullopt;
            }
            return Value::integer(static_cast<unsigned char>(b->value[(*index)++]));
        });
    }
    if (auto r = iterable.shared<RangeObject>())
    {
        auto index = std::make_shared<std::int64_t>(0);
        const std::int64_t count = r->size();
        return make_iterator("range_iterator", [r, index, count](Interpreter&) -> std::optional<Value> {
            if (*index >= count)
            {
                return std::nullopt;
            }
            return Value::integer(r->at((*index)++));
        });
    }
    if (auto dict = iterable.shared<DictObject>())
    {
        return hash_table_iterator("dict_keyiterator", dict, &dict->table, DictViewObject::Which::Keys,
                                   "dictionary changed size during iteration");
    }
    if (auto set = iterable.shared<SetObject>())
    {
        return hash_table_iterator("set_iterator", set, &set->table, DictViewObject::Which::Keys,
                                   "Set changed size during iteration");
    }
    if (auto view = iterable.shared<DictViewObject>())
    {
        const char* name = view->which == DictViewObject::Which::Keys     ? "dict_keyiterator"
                           : view->which == DictViewObject::Which::Values ? "dict_valueiterator"
                                                                          : "dict_itemiterator";
        return hash_table_iterator(name, view->dict, &view->dict->table, view->which,
                                   "dictionary changed size during iteration");
    }
    raise("TypeError", "'" + type_name(iterable) + "' object is not iterable");
}

std::size_t length(const Value& value)
{
    if (const auto* s = value.as<StrObject>())
    {
        return s->length;
    }
    if (const auto* b = value.as<BytesObject>())
    {
        return b->value.size();
    }
    if (const auto* items = sequence_items(value))
    {
        return items->size();
    }
    if (const auto* table = table_of(value))
    {
        return table->size();
    }
    if (const auto* r = value.as<RangeObject>())
    {
        return static_cast<std::size_t>(r->size());
    }
    if (const auto* view = value.as<DictViewObject>())
    {
        return view->dict->table.size();
    }
    raise("TypeError", "object of type '" + type_name(value) + "' has no len()");
}

} // namespace cinder::runtime
