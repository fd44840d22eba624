#include <algorithm>
#include <cctype>
#include <cinder/parser/literal.h>
#include <cinder/parser/parser.h>
#include <cinder/runtime/args.h>
#include <cinder/runtime/builtins.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/memory_budget.h>
#include <cinder/runtime/methods.h>
#include <cinder/runtime/ops.h>
#include <cinder/source/source_file.h>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <mutex>

namespace cinder::runtime
{

namespace
{

// Builtins and type objects are shared by every session, so they are never charged to a budget.
Value native(std::string name, NativeFunction fn)
{
    return Value::object(std::make_shared<BuiltinObject>(std::move(name), std::move(fn)));
}

[[noreturn]] void cannot_create(const std::string& name)
{
    raise("TypeError", "cannot create '" + name + "' instances");
}

std::string_view strip(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0)
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0)
    {
        text.remove_suffix(1);
    }
    return text;
}

int digit_value(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'z')
    {
        return lower - 'a' + 10;
    }
    return 99;
}

// int(text, base) without the error reporting; nullopt on malformed text.
std::optional<std::int64_t> parse_int_text(std::string_view text, int base)
{
    text = strip(text);
    bool negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-'))
    {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    auto has_prefix = [&](char p) {
        return text.size() >= 2 && text[0] == '0' && std::tolower(static_cast<unsigned char>(text[1])) == p;
    };
    if (base == 0)
    {
        if (has_prefix('x'))
        {
            base = 16;
        }
        else if (has_prefix('o'))
        {
            base = 8;
        }
        else if (has_prefix('b'))
        {
            base = 2;
        }
        else
        {
            base = 10;
            if (text.size() > 1 && text.front() == '0' &&
                text.find_first_not_of("0_") != std::string_view::npos)
            {
                return std::nullopt;
            }
        }
        if (base != 10)
        {
            text.remove_prefix(2);
            if (!text.empty() && text.front() == '_')
            {
                text.remove_prefix(1);
            }
        }
    }
    else if ((base == 16 && has_prefix('x')) || (base == 8 && has_prefix('o')) || (base == 2 && has_prefix('b')))
    {
        text.remove_prefix(2);
        if (!text.empty() && text.front() == '_')
        {
            text.remove_prefix(1);
        }
    }

    if (text.empty() || text.front() == '_' || text.back() == '_')
    {
        return std::nullopt;
    }
    std::uint64_t magnitude = 0;
    constexpr std::uint64_t kLimit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1;
    char previous = 0;
    for (const char c : text)
    {
        if (c == '_')
        {
            if (previous == '_')
            {
                return std::nullopt;
            }
            previous = c;
            continue;
        }
        previous = c;
        const int d = digit_value(c);
        if (d >= base)
        {
            return std::nullopt;
        }
        if (magnitude > (kLimit - static_cast<std::uint64_t>(d)) / static_cast<std::uint64_t>(base))
        {
            raise("OverflowError", "integer overflow");
        }
        magnitude = magnitude * static_cast<std::uint64_t>(base) + static_cast<std::uint64_t>(d);
    }
    if (negative)
    {
        return static_cast<std::int64_t>(0 - magnitude);
    }
    if (magnitude == kLimit)
    {
        raise("OverflowError", "integer overflow");
    }
    return static_cast<std::int64_t>(magnitude);
}

std::optional<double> parse_float_text(std::string_view raw)
{
    const std::string_view text = strip(raw);
    std::string cleaned;
    char previous = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        if (c == '_')
        {
            const bool between_digits = std::isdigit(static_cast<unsigned char>(previous)) != 0 &&
                                        i + 1 < text.size() &&
                                        std::isdigit(static_cast<unsigned char>(text[i + 1])) != 0;
            if (!between_digits)
            {
                return std::nullopt;
            }
            previous = c;
            continue;
        }
        cleaned += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        previous = c;
    }

    std::string_view body = cleaned;
    double sign = 1.0;
    if (!body.empty() && (body.front() == '+' || body.front() == '-'))
    {
        sign = body.front() == '-' ? -1.0 : 1.0;
        body.remove_prefix(1);
    }
    if (body == "inf" || body == "infinity")
    {
        return sign * std::numeric_limits<double>::infinity();
    }
    if (body == "nan")
    {
        return std::copysign(std::numeric_limits<double>::quiet_NaN(), sign);
    }
    if (body.empty() || body.find_first_not_of("0123456789.e+-") != std::string_view::npos ||
        body.find_first_of("0123456789") == std::string_view::npos)
    {
        return std::nullopt;
    }
    const std::string owned(body);
    char* end = nullptr;
    const double value = std::strtod(owned.c_str(), &end);
    if (end != owned.c_str() + owned.size())
    {
        return std::nullopt;
    }
    return sign * value;
}

std::optional<std::complex<double>> parse_complex_text(std::string_view raw)
{
    std::string_view text = strip(raw);
    if (text.size() >= 2 && text.front() == '(' && text.back() == ')')
    {
        text = strip(text.substr(1, text.size() - 2));
    }
    if (text.empty())
    {
        return std::nullopt;
    }
    const char last = static_cast<char>(std::tolower(static_cast<unsigned char>(text.back())));
    if (last != 'j')
    {
        auto real = parse_float_text(text);
        if (!real)
        {
            return std::nullopt;
        }
        return std::complex<double>(*real, 0.0);
    }
    text.remove_suffix(1);
    // Split at the last sign that does not follow an exponent marker.
    std::size_t split = std::string_view::npos;
    for (std::size_t i = text.size(); i-- > 1;)
    {
        if ((text[i] == '+' || text[i] == '-') && std::tolower(static_cast<unsigned char>(text[i - 1])) != 'e')
        {
            split = i;
            break;
        }
    }
    auto imag_of = [](std::string_view part) -> std::optional<double> {
        if (part.empty() || part == "+")
        {
            return 1.0;
        }
        if (part == "-")
        {
            return -1.0;
        }
        return parse_float_text(part);
    };
    if (split == std::string_view::npos)
    {
        auto imag = imag_of(text);
        if (!imag)
        {
            return std::nullopt;
        }
        return std::complex<double>(0.0, *imag);
    }
    auto real = parse_float_text(text.substr(0, split));
    auto imag = imag_of(text.substr(split));
    if (!real || !imag)
    {
        return std::nullopt;
    }
    return std::complex<double>(*real, *imag);
}

std::size_t sequence_length(unsigned char lead)
{
    if (lead < 0x80)
    {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0)
    {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0)
    {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0)
    {
        return 4;
    }
    return 0;
}

Value decode_utf8(const std::string& bytes)
{
    std::size_t position = 0;
    while (position < bytes.size())
    {
        const auto lead = static_cast<unsigned char>(bytes[position]);
        const std::size_t n = sequence_length(lead);
        if (n == 0 || position + n > bytes.size() ||
            !utf8_valid(std::string_view(bytes).substr(position, n)))
        {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "0x%02x", lead);
            raise("UnicodeDecodeError", "'utf-8' codec can't decode byte " + std::string(hex) +
                                            " in position " + std::to_string(position) +
                                            (n == 0 ? ": invalid start byte" : ": invalid continuation byte"));
        }
        position += n;
    }
    return make_str(bytes);
}

void check_encoding(const Value& encoding)
{
    std::string name = to_str(encoding);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name != "utf-8" && name != "utf8")
    {
        raise("LookupError", "unknown encoding: " + to_str(encoding));
    }
}

// --- type constructors ---

Value construct_int(Interpreter&, CallArgs& args)
{
    auto bound = bind_native(args, "int", {"x", "base"}, 0);
    if (!bound[0].has_value())
    {
        if (bound[1].has_value())
        {
            raise("TypeError", "int() missing string argument");
        }
        return Value::integer(0);
    }
    const Value& x = *bound[0];
    if (bound[1].has_value())
    {
        const std::int64_t base = int_arg(*bound[1], "int");
        if (base != 0 && (base < 2 || base > 36))
        {
            raise("ValueError", "int() base must be >= 2 and <= 36, or 0");
        }
        const auto* s = x.as<StrObject>();
        if (s == nullptr)
        {
            raise("TypeError", "int() can't convert non-string with explicit base");
        }
        auto parsed = parse_int_text(s->value, static_cast<int>(base));
        if (!parsed)
        {
            raise("ValueError", "invalid literal for int() with base " + std::to_string(base) + ": " +
                                    quote_str(s->value));
        }
        return Value::integer(*parsed);
    }
    if (x.is_integral())
    {
        return Value::integer(x.integral());
    }
    if (x.is_float())
    {
        return Value::integer(float_to_int(std::trunc(x.as_float())));
    }
    if (const auto* s = x.as<StrObject>())
    {
        auto parsed = parse_int_text(s->value, 10);
        if (!parsed)
        {
            raise("ValueError", "invalid literal for int() with base 10: " + quote_str(s->value));
        }
        return Value::integer(*parsed);
    }
    if (const auto* b = x.as<BytesObject>())
    {
        auto parsed = parse_int_text(b->value, 10);
        if (!parsed)
        {
            raise("ValueError", "invalid literal for int() with base 10: " + repr(x));
        }
        return Value::integer(*parsed);
    }
    raise("TypeError", "int() argument must be a string, a bytes-like object or a real number, not '" +
                           type_name(x) + "'");
}

Value construct_float(Interpreter&, CallArgs& args)
{
    expect_positional(args, "float", 0, 1);
    if (args.positional.empty())
    {
        return Value::real(0.0);
    }
    const Value& x = args.positional[0];
    if (x.is_real())
    {
        return Value::real(x.to_double());
    }
    if (const auto* s = x.as<StrObject>())
    {
        auto parsed = parse_float_text(s->value);
        if (!parsed)
        {
            raise("ValueError", "could not convert string to float: " + quote_str(s->value));
        }
        return Value::real(*parsed);
    }
    raise("TypeError", "float() argument must be a string or a real number, not '" + type_name(x) + "'");
}

Value construct_complex(Interpreter&, CallArgs& args)
{
    auto bound = bind_native(args, "complex", {"real", "imag"}, 0);
    if (!bound[0].has_value())
    {
        bound[0] = Value::integer(0);
    }
    if (const auto* s = bound[0]->as<StrObject>())
    {
        if (bound[1].has_value())
        {
            raise("TypeError", "complex() can't take second arg if first is a string");
        }
        auto parsed = parse_complex_text(s->value);
        if (!parsed)
        {
            raise("ValueError", "complex() arg is a malformed string");
        }
        return Value::complex(*parsed);
    }
    auto as_complex = [](const Value& v, const char* which) -> std::complex<double> {
        if (v.is_complex())
        {
            return v.as_complex();
        }
        if (v.is_real())
        {
            return {v.to_double(), 0.0};
        }
        raise("TypeError", std::string("complex() ") + which + " must be a number, not '" + type_name(v) + "'");
    };
    std::complex<double> real = as_complex(*bound[0], "first argument");
    if (bound[1].has_value())
    {
        const std::complex<double> imag = as_complex(*bound[1], "second argument");
        real += std::complex<double>(0.0, 1.0) * imag;
    }
    return Value::complex(real);
}

Value construct_str(Interpreter&, CallArgs& args)
{
    auto bound = bind_native(args, "str", {"object", "encoding", "errors"}, 0);
    if (!bound[0].has_value())
    {
        return make_str("");
    }
    if (bound[1].has_value() || bound[2].has_value())
    {
        const auto* b = bound[0]->as<BytesObject>();
        if (b == nullptr)
        {
            raise("TypeError", "decoding to str: need a bytes-like object, " + type_name(*bound[0]) + " found");
        }
        if (bound[1].has_value())
        {
            check_encoding(*bound[1]);
        }
        return decode_utf8(b->value);
    }
    return make_str(to_str(*bound[0]));
}

Value construct_bool(Interpreter&, CallArgs& args)
{
    expect_positional(args, "bool", 0, 1);
    return Value::boolean(!args.positional.empty() && truthy(args.positional[0]));
}

Value construct_list(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "list", 0, 1);
    if (args.positional.empty())
    {
        return make_list({});
    }
    return make_list(interp.collect(args.positional[0]));
}

Value construct_tuple(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "tuple", 0, 1);
    if (args.positional.empty())
    {
        return make_tuple({});
    }
    if (args.positional[0].is(ObjectKind::Tuple))
    {
        return args.positional[0];
    }
    return make_tuple(interp.collect(args.positional[0]));
}

Value construct_set(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "set", 0, 1);
    Value set = make_set();
    if (!args.positional.empty())
    {
        auto& table = set.as<SetObject>()->table;
        Value iterator = make_iter(args.positional[0]);
        while (auto item = interp.next(iterator))
        {
            table.insert(*item, Value::none());
        }
        recharge(set);
    }
    return set;
}

Value construct_dict(Interpreter& interp, CallArgs& args)
{
    if (args.positional.size() > 1)
    {
        raise("TypeError", "dict expected at most 1 argument, got " + std::to_string(args.positional.size()));
    }
    Value dict = make_dict();
    auto& table = dict.as<DictObject>()->table;
    if (!args.positional.empty())
    {
        update_dict(interp, table, args.positional[0]);
    }
    for (auto& [name, value] : args.keywords)
    {
        table.insert(make_str(name), std::move(value));
    }
    recharge(dict);
    return dict;
}

Value construct_bytes(Interpreter& interp, CallArgs& args)
{
    auto bound = bind_native(args, "bytes", {"source", "encoding", "errors"}, 0);
    if (!bound[0].has_value())
    {
        return make_bytes("");
    }
    const Value& source = *bound[0];
    if (const auto* s = source.as<StrObject>())
    {
        if (!bound[1].has_value())
        {
            raise("TypeError", "string argument without an encoding");
        }
        check_encoding(*bound[1]);
        return make_bytes(s->value);
    }
    if (bound[1].has_value())
    {
        raise("TypeError", "encoding without a string argument");
    }
    if (source.is_integral())
    {
        const std::int64_t n = source.integral();
        if (n < 0)
        {
            raise("ValueError", "negative count");
        }
        check_allocation(static_cast<std::size_t>(n));
        return make_bytes(std::string(static_cast<std::size_t>(n), '\0'));
    }
    if (const auto* b = source.as<BytesObject>())
    {
        return make_bytes(b->value);
    }
    std::string out;
    for (const auto& item : interp.collect(source))
    {
        if (!item.is_integral())
        {
            raise("TypeError", "'" + type_name(item) + "' object cannot be interpreted as an integer");
        }
        const std::int64_t byte = item.integral();
        if (byte < 0 || byte > 255)
        {
            raise("ValueError", "bytes must be in range(0, 256)");
        }
        out += static_cast<char>(byte);
    }
    return make_bytes(std::move(out));
}

Value construct_range(Interpreter&, CallArgs& args)
{
    expect_positional(args, "range", 1, 3);
    const auto& p = args.positional;
    std::int64_t start = 0;
    std::int64_t stop = 0;
    std::int64_t step = 1;
    if (p.size() == 1)
    {
        stop = int_arg(p[0], "range");
    }
    else
    {
        start = int_arg(p[0], "range");
        stop = int_arg(p[1], "range");
        if (p.size() == 3)
        {
            step = int_arg(p[2], "range");
        }
    }
    if (step == 0)
    {
        raise("ValueError", "range() arg 3 must not be zero");
    }
    return make_range(start, stop, step);
}

Value construct_type(Interpreter&, CallArgs& args)
{
    if (args.positional.size() != 1 || !args.keywords.empty())
    {
        raise("TypeError", "type() takes 1 argument");
    }
    return type_of(args.positional[0]);
}

struct TypeRegistry
{
    std::mutex mutex;
    std::unordered_map<std::string, Value> types;

    void add(const std::string& name, NativeFunction ctor)
    {
        types.emplace(name, Value::object(std::make_shared<TypeObject>(name, std::move(ctor))));
    }

    Value get(const std::string& name)
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = types.find(name);
        if (it != types.end())
        {
            return it->second;
        }
        Value type = Value::object(std::make_shared<TypeObject>(
            name, [name](Interpreter&, CallArgs&) -> Value { cannot_create(name); }));
        types.emplace(name, type);
        return type;
    }
};

TypeRegistry& type_registry()
{
    static TypeRegistry* registry = [] {
        auto* r = new TypeRegistry();
        r->add("int", construct_int);
        r->add("float", construct_float);
        r->add("complex", construct_complex);
        r->add("str", construct_str);
        r->add("bool", construct_bool);
        r->add("list", construct_list);
        r->add("tuple", construct_tuple);
        r->add("set", construct_set);
        r->add("dict", construct_dict);
        r->add("bytes", construct_bytes);
        r->add("range", construct_range);
        r->add("type", construct_type);
        return r;
    }();
    return *registry;
}

// --- functions ---

Value builtin_print(Interpreter& interp, CallArgs& args)
{
    std::string sep = " ";
    std::string end = "\n";
    auto text_option = [](const std::optional<Value>& v, std::string& out, const char* name) {
        if (!v.has_value() || v->is_none())
        {
            return;
        }
        const auto* s = v->as<StrObject>();
        if (s == nullptr)
        {
            raise("TypeError", std::string(name) + " must be None or a string, not " + type_name(*v));
        }
        out = s->value;
    };
    text_option(take_keyword(args, "sep"), sep, "sep");
    text_option(take_keyword(args, "end"), end, "end");
    (void)take_keyword(args, "flush");
    if (auto file = take_keyword(args, "file"); file.has_value() && !file->is_none())
    {
        raise("TypeError", "print() file argument is not supported");
    }
    reject_keywords(args, "print");

    std::string line;
    for (std::size_t i = 0; i < args.positional.size(); ++i)
    {
        if (i > 0)
        {
            line += sep;
        }
        line += to_str(args.positional[i]);
    }
    line += end;
    interp.write_output(line);
    return Value::none();
}

Value builtin_len(Interpreter&, CallArgs& args)
{
    expect_positional(args, "len", 1, 1);
    return Value::integer(static_cast<std::int64_t>(length(args.positional[0])));
}

Value builtin_abs(Interpreter&, CallArgs& args)
{
    expect_positional(args, "abs", 1, 1);
    const Value& x = args.positional[0];
    if (x.is_integral())
    {
        const std::int64_t v = x.integral();
        return Value::integer(v < 0 ? checked_sub(0, v) : v);
    }
    if (x.is_float())
    {
        return Value::real(std::fabs(x.as_float()));
    }
    if (x.is_complex())
    {
        return Value::real(std::abs(x.as_complex()));
    }
    raise("TypeError", "bad operand type for abs(): '" + type_name(x) + "'");
}

Value extreme(Interpreter& interp, CallArgs& args, const std::string& name, bool want_max)
{
    auto key = take_keyword(args, "key");
    auto fallback = take_keyword(args, "default");
    reject_keywords(args, name);
    if (args.positional.empty())
    {
        raise("TypeError", name + " expected at least 1 argument, got 0");
    }
    if (args.positional.size() > 1 && fallback.has_value())
    {
        raise("TypeError", "Cannot specify a default for " + name + "() with multiple positional arguments");
    }
    std::vector<Value> items =
        args.positional.size() == 1 ? interp.collect(args.positional[0]) : std::move(args.positional);
    if (items.empty())
    {
        if (fallback.has_value())
        {
            return *fallback;
        }
        raise("ValueError", name + "() iterable argument is empty");
    }
    const bool keyed = key.has_value() && !key->is_none();
    std::size_t best = 0;
    Value best_key = keyed ? interp.call(*key, std::vector<Value>{items[0]}) : items[0];
    for (std::size_t i = 1; i < items.size(); ++i)
    {
        Value k = keyed ? interp.call(*key, std::vector<Value>{items[i]}) : items[i];
        if (want_max ? less_than(best_key, k) : less_than(k, best_key))
        {
            best = i;
            best_key = std::move(k);
        }
    }
    return items[best];
}

Value builtin_sum(Interpreter& interp, CallArgs& args)
{
    auto bound = bind_native(args, "sum", {"iterable", "start"}, 1);
    Value total = bound[1].has_value() ? *bound[1] : Value::integer(0);
    if (total.is(ObjectKind::Str))
    {
        raise("TypeError", "sum() can't sum strings [use ''.join(seq) instead]");
    }
    if (total.is(ObjectKind::Bytes))
    {
        raise("TypeError", "sum() can't sum bytes [use b''.join(seq) instead]");
    }
    Value iterator = make_iter(*bound[0]);
    while (auto item = interp.next(iterator))
    {
        total = binary_op(cinder::lexer::TokenKind::Plus, total, *item);
    }
    return total;
}

Value builtin_sorted(Interpreter& interp, CallArgs& args)
{
    if (args.positional.size() != 1)
    {
        raise("TypeError", "sorted expected 1 argument, got " + std::to_string(args.positional.size()));
    }
    auto key = take_keyword(args, "key");
    auto reverse = take_keyword(args, "reverse");
    reject_keywords(args, "sorted");
    std::vector<Value> items = interp.collect(args.positional[0]);
    sort_values(interp, items, key.value_or(Value::none()), reverse.has_value() && truthy(*reverse));
    return make_list(std::move(items));
}

Value builtin_reversed(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "reversed", 1, 1);
    const Value& seq = args.positional[0];
    std::vector<Value> items;
    std::string name = "reversed";
    if (seq.is(ObjectKind::List))
    {
        name = "list_reverseiterator";
        items = seq.as<ListObject>()->items;
    }
    else if (seq.is(ObjectKind::Range))
    {
        name = "range_iterator";
        items = interp.collect(seq);
    }
    else if (seq.is(ObjectKind::Tuple) || seq.is(ObjectKind::Str) || seq.is(ObjectKind::Bytes) ||
             seq.is(ObjectKind::Array))
    {
        items = interp.collect(seq);
    }
    else if (seq.is(ObjectKind::Dict) || seq.is(ObjectKind::DictView))
    {
        name = "dict_reversekeyiterator";
        items = interp.collect(seq);
    }
    else
    {
        raise("TypeError", "'" + type_name(seq) + "' object is not reversible");
    }
    auto values = std::make_shared<std::vector<Value>>(std::move(items));
    auto remaining = std::make_shared<std::size_t>(values->size());
    return make_iterator(name, [values, remaining](Interpreter&) -> std::optional<Value> {
        if (*remaining == 0)
        {
            return std::nullopt;
        }
        return (*values)[--*remaining];
    });
}

Value builtin_enumerate(Interpreter&, CallArgs& args)
{
    auto bound = bind_native(args, "enumerate", {"iterable", "start"}, 1);
    Value inner = make_iter(*bound[0]);
    auto counter = std::make_shared<std::int64_t>(bound[1].has_value() ? int_arg(*bound[1], "enumerate") : 0);
    return make_wrapping_iterator("enumerate", {inner}, [inner, counter](Interpreter& interp) -> std::optional<Value> {
        auto item = interp.next(inner);
        if (!item.has_value())
        {
            return std::nullopt;
        }
        Value index = Value::integer(*counter);
        *counter = checked_add(*counter, 1);
        return make_tuple({index, std::move(*item)});
    });
}

Value builtin_zip(Interpreter&, CallArgs& args)
{
    auto strict = take_keyword(args, "strict");
    reject_keywords(args, "zip");
    std::vector<Value> iterators;
    for (const auto& iterable : args.positional)
    {
        iterators.push_back(make_iter(iterable));
    }
    const bool is_strict = strict.has_value() && truthy(*strict);
    return make_wrapping_iterator("zip", iterators, [iterators, is_strict](Interpreter& interp) -> std::optional<Value> {
        if (iterators.empty())
        {
            return std::nullopt;
        }
        std::vector<Value> row;
        row.reserve(iterators.size());
        for (std::size_t i = 0; i < iterators.size(); ++i)
        {
            auto item = interp.next(iterators[i]);
            if (!item.has_value())
            {
                if (is_strict)
                {
                    if (i > 0)
                    {
                        raise("ValueError", "zip() argument " + std::to_string(i + 1) + " is shorter than argument" +
                                                (i == 1 ? " 1" : "s 1-" + std::to_string(i)));
                    }
                    for (std::size_t j = 1; j < iterators.size(); ++j)
                    {
                        if (interp.next(iterators[j]).has_value())
                        {
                            raise("ValueError", "zip() argument " + std::to_string(j + 1) +
                                                    " is longer than argument" +
                                                    (j == 1 ? " 1" : "s 1-" + std::to_string(j)));
                        }
                    }
                }
                return std::nullopt;
            }
            row.push_back(std::move(*item));
        }
        return make_tuple(std::move(row));
    });
}

Value builtin_map(Interpreter&, CallArgs& args)
{
    reject_keywords(args, "map");
    if (args.positional.size() < 2)
    {
        raise("TypeError", "map() must have at least two arguments.");
    }
    Value fn = args.positional[0];
    std::vector<Value> iterators;
    for (std::size_t i = 1; i < args.positional.size(); ++i)
    {
        iterators.push_back(make_iter(args.positional[i]));
    }
    return make_wrapping_iterator("map", iterators, [fn, iterators](Interpreter& interp) -> std::optional<Value> {
        std::vector<Value> call_args;
        call_args.reserve(iterators.size());
        for (const auto& it : iterators)
        {
            auto item = interp.next(it);
            if (!item.has_value())
            {
                return std::nullopt;
            }
            call_args.push_back(std::move(*item));
        }
        return interp.call(fn, std::move(call_args));
    });
}

Value builtin_filter(Interpreter&, CallArgs& args)
{
    expect_positional(args, "filter", 2, 2);
    Value fn = args.positional[0];
    Value inner = make_iter(args.positional[1]);
    return make_wrapping_iterator("filter", {inner}, [fn, inner](Interpreter& interp) -> std::optional<Value> {
        while (auto item = interp.next(inner))
        {
            const bool keep = fn.is_none() ? truthy(*item) : truthy(interp.call(fn, std::vector<Value>{*item}));
            if (keep)
            {
                return item;
            }
        }
        return std::nullopt;
    });
}

Value builtin_any(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "any", 1, 1);
    Value iterator = make_iter(args.positional[0]);
    while (auto item = interp.next(iterator))
    {
        if (truthy(*item))
        {
            return Value::boolean(true);
        }
    }
    return Value::boolean(false);
}

Value builtin_all(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "all", 1, 1);
    Value iterator = make_iter(args.positional[0]);
    while (auto item = interp.next(iterator))
    {
        if (!truthy(*item))
        {
            return Value::boolean(false);
        }
    }
    return Value::boolean(true);
}

std::int64_t round_int(std::int64_t value, std::int64_t ndigits)
{
    if (ndigits >= 0)
    {
        return value;
    }
    std::int64_t scale = 1;
    for (std::int64_t i = 0; i < -ndigits; ++i)
    {
        if (scale > std::numeric_limits<std::int64_t>::max() / 10)
        {
            return 0;
        }
        scale *= 10;
    }
    std::int64_t q = value / scale;
    std::int64_t r = value % scale;
    if (r < 0)
    {
        r += scale;
        q -= 1;
    }
    // Ties go to the even multiple.
    if (r * 2 > scale || (r * 2 == scale && q % 2 != 0))
    {
        q += 1;
    }
    return checked_mul(q, scale);
}

double round_float(double value, std::int64_t ndigits)
{
    if (!std::isfinite(value) || ndigits > 323)
    {
        return value;
    }
    if (ndigits < -308)
    {
        return std::copysign(0.0, value);
    }
    if (ndigits >= 0)
    {
        // printf rounds the exact binary value half-to-even, as Python does.
        char buf[512];
        std::snprintf(buf, sizeof(buf), "%.*f", static_cast<int>(ndigits), value);
        return std::strtod(buf, nullptr);
    }
    const double scale = std::pow(10.0, static_cast<double>(-ndigits));
    const double rounded = std::nearbyint(value / scale) * scale;
    return std::isfinite(rounded) ? rounded : value;
}

Value builtin_round(Interpreter&, CallArgs& args)
{
    auto bound = bind_native(args, "round", {"number", "ndigits"}, 1);
    const Value& x = *bound[0];
    const bool has_digits = bound[1].has_value() && !bound[1]->is_none();
    if (x.is_integral())
    {
        return Value::integer(has_digits ? round_int(x.integral(), int_arg(*bound[1], "round")) : x.integral());
    }
    if (x.is_float())
    {
        if (!has_digits)
        {
            return Value::integer(float_to_int(std::nearbyint(x.as_float())));
        }
        return Value::real(round_float(x.as_float(), int_arg(*bound[1], "round")));
    }
    raise("TypeError", "type " + type_name(x) + " doesn't define __round__ method");
}

std::int64_t mul_mod(std::int64_t a, std::int64_t b, std::int64_t m)
{
    return static_cast<std::int64_t>((static_cast<__int128>(a) * b) % m);
}

std::int64_t positive_mod(std::int64_t a, std::int64_t m)
{
    std::int64_t r = a % m;
    return r < 0 ? r + m : r;
}

Value builtin_pow(Interpreter&, CallArgs& args)
{
    auto bound = bind_native(args, "pow", {"base", "exp", "mod"}, 2);
    if (!bound[2].has_value() || bound[2]->is_none())
    {
        return power(*bound[0], *bound[1]);
    }
    if (!bound[0]->is_integral() || !bound[1]->is_integral() || !bound[2]->is_integral())
    {
        raise("TypeError", "pow() 3rd argument not allowed unless all arguments are integers");
    }
    std::int64_t modulus = bound[2]->integral();
    if (modulus == 0)
    {
        raise("ValueError", "pow() 3rd argument cannot be 0");
    }
    const bool negative_mod = modulus < 0;
    const std::int64_t m = negative_mod ? checked_sub(0, modulus) : modulus;
    std::int64_t base = positive_mod(bound[0]->integral(), m);
    std::int64_t exponent = bound[1]->integral();
    if (exponent < 0)
    {
        // Modular inverse by the extended Euclidean algorithm.
        std::int64_t old_r = base;
        std::int64_t r = m;
        std::int64_t old_s = 1;
        std::int64_t s = 0;
        while (r != 0)
        {
            const std::int64_t q = old_r / r;
            std::int64_t t = old_r - q * r;
            old_r = r;
            r = t;
            t = old_s - q * s;
            old_s = s;
            s = t;
        }
        if (old_r != 1)
        {
            raise("ValueError", "base is not invertible for the given modulus");
        }
        base = positive_mod(old_s, m);
        exponent = checked_sub(0, exponent);
    }
    std::int64_t result = m == 1 ? 0 : 1;
    while (exponent > 0)
    {
        if ((exponent & 1) != 0)
        {
            result = mul_mod(result, base, m);
        }
        base = mul_mod(base, base, m);
        exponent >>= 1;
    }
    if (negative_mod && result != 0)
    {
        result -= m;
    }
    return Value::integer(result);
}

Value builtin_divmod(Interpreter&, CallArgs& args)
{
    expect_positional(args, "divmod", 2, 2);
    const Value& a = args.positional[0];
    const Value& b = args.positional[1];
    if (!a.is_real() || !b.is_real())
    {
        raise("TypeError", "unsupported operand type(s) for divmod(): '" + type_name(a) + "' and '" +
                               type_name(b) + "'");
    }
    Value q = binary_op(cinder::lexer::TokenKind::DoubleSlash, a, b);
    Value r = binary_op(cinder::lexer::TokenKind::Percent, a, b);
    return make_tuple({q, r});
}

Value builtin_repr(Interpreter&, CallArgs& args)
{
    expect_positional(args, "repr", 1, 1);
    return make_str(repr(args.positional[0]));
}

Value builtin_hash(Interpreter&, CallArgs& args)
{
    expect_positional(args, "hash", 1, 1);
    const Value& x = args.positional[0];
    if (x.is_integral())
    {
        return Value::integer(x.integral());
    }
    if (x.is_float() && std::isfinite(x.as_float()) && std::trunc(x.as_float()) == x.as_float() &&
        std::fabs(x.as_float()) < 9.2e18)
    {
        return Value::integer(static_cast<std::int64_t>(x.as_float()));
    }
    return Value::integer(static_cast<std::int64_t>(hash_value(x) >> 1));
}

Value builtin_chr(Interpreter&, CallArgs& args)
{
    expect_positional(args, "chr", 1, 1);
    const std::int64_t cp = int_arg(args.positional[0], "chr");
    if (cp < 0 || cp > 0x10FFFF)
    {
        raise("ValueError", "chr() arg not in range(0x110000)");
    }
    std::string out;
    cinder::parser::append_utf8(out, static_cast<std::uint32_t>(cp));
    return make_str(std::move(out));
}

Value builtin_ord(Interpreter&, CallArgs& args)
{
    expect_positional(args, "ord", 1, 1);
    const Value& c = args.positional[0];
    if (const auto* s = c.as<StrObject>())
    {
        if (s->length != 1)
        {
            raise("TypeError", "ord() expected a character, but string of length " + std::to_string(s->length) +
                                   " found");
        }
        return Value::integer(utf8_decode(s->value).front());
    }
    if (const auto* b = c.as<BytesObject>())
    {
        if (b->value.size() != 1)
        {
            raise("TypeError", "ord() expected a character, but string of length " +
                                   std::to_string(b->value.size()) + " found");
        }
        return Value::integer(static_cast<unsigned char>(b->value[0]));
    }
    raise("TypeError", "ord() expected string of length 1, but " + type_name(c) + " found");
}

NativeFunction radix(const char* name, const char* spec)
{
    return [name, spec](Interpreter&, CallArgs& args) {
        expect_positional(args, name, 1, 1);
        const Value& x = args.positional[0];
        if (!x.is_integral())
        {
            raise("TypeError", "'" + type_name(x) + "' object cannot be interpreted as an integer");
        }
        return make_str(format_value(Value::integer(x.integral()), spec));
    };
}

Value builtin_format(Interpreter&, CallArgs& args)
{
    expect_positional(args, "format", 1, 2);
    std::string spec;
    if (args.positional.size() == 2)
    {
        spec = str_arg(args.positional[1], "format");
    }
    return make_str(format_value(args.positional[0], spec));
}

Value builtin_iter(Interpreter&, CallArgs& args)
{
    expect_positional(args, "iter", 1, 1);
    return make_iter(args.positional[0]);
}

Value builtin_next(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "next", 1, 2);
    auto item = interp.next(args.positional[0]);
    if (item.has_value())
    {
        return *item;
    }
    if (args.positional.size() == 2)
    {
        return args.positional[1];
    }
    raise("StopIteration", "");
}

Value builtin_id(Interpreter&, CallArgs& args)
{
    expect_positional(args, "id", 1, 1);
    const Value& x = args.positional[0];
    if (x.is_object())
    {
        return Value::integer(static_cast<std::int64_t>(reinterpret_cast<std::uintptr_t>(x.as_object().get())));
    }
    return Value::integer(static_cast<std::int64_t>((hash_value(x) ^ x.storage().index()) >> 1));
}

Value builtin_callable(Interpreter&, CallArgs& args)
{
    expect_positional(args, "callable", 1, 1);
    const Value& x = args.positional[0];
    return Value::boolean(x.is(ObjectKind::Function) || x.is(ObjectKind::Builtin) ||
                          x.is(ObjectKind::BoundMethod) || x.is(ObjectKind::Type) ||
                          x.is(ObjectKind::ExceptionType));
}

Value builtin_isinstance(Interpreter&, CallArgs& args)
{
    expect_positional(args, "isinstance", 2, 2);
    const Value& types = args.positional[1];
    if (const auto* tuple = types.as<TupleObject>())
    {
        for (const auto& t : tuple->items)
        {
            if (is_instance(args.positional[0], t))
            {
                return Value::boolean(true);
            }
        }
        return Value::boolean(false);
    }
    return Value::boolean(is_instance(args.positional[0], types));
}

// --- reflection and dynamic execution ---

Value snapshot(const Environment& env)
{
    std::vector<std::string> names;
    names.reserve(env.vars.size());
    for (const auto& [name, value] : env.vars)
    {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    Value dict = make_dict();
    auto& table = dict.as<DictObject>()->table;
    for (const auto& name : names)
    {
        table.insert(make_str(name), env.vars.at(name));
    }
    recharge(dict);
    return dict;
}

// Namespace for eval()/exec(): the caller's globals, or a module scope seeded from a dict.
EnvPtr dynamic_scope(Interpreter& interp, const std::optional<Value>& globals, const char* function)
{
    if (!globals.has_value() || globals->is_none())
    {
        return interp.current_globals();
    }
    const auto* dict = globals->as<DictObject>();
    if (dict == nullptr)
    {
        raise("TypeError", std::string(function) + "() globals must be a dict, not " + type_name(*globals));
    }
    auto env = std::make_shared<Environment>();
    env->builtins = interp.current_globals()->builtins;
    for (const auto& e : dict->table.entries())
    {
        if (e.live)
        {
            const auto* key = e.key.as<StrObject>();
            if (key != nullptr)
            {
                env->vars.insert_or_assign(key->value, e.value);
            }
        }
    }
    return env;
}

void write_back(const EnvPtr& env, const std::optional<Value>& globals)
{
    if (!globals.has_value() || globals->is_none())
    {
        return;
    }
    const Value& target = *globals;
    auto& table = target.as<DictObject>()->table;
    for (const auto& [name, value] : env->vars)
    {
        table.insert(make_str(name), value);
    }
    recharge(target);
}

[[noreturn]] void raise_syntax(const std::vector<cinder::diag::Diagnostic>& diagnostics)
{
    raise("SyntaxError", diagnostics.empty() ? std::string("invalid syntax") : diagnostics.front().message);
}

const std::string& source_text(const Value& source, const char* function)
{
    if (const auto* s = source.as<StrObject>())
    {
        return s->value;
    }
    raise("TypeError", std::string(function) + "() arg 1 must be a string, bytes or code object");
}

Value builtin_eval(Interpreter& interp, CallArgs& args)
{
    auto bound = bind_native(args, "eval", {"source", "globals", "locals"}, 1);
    const std::string& text = source_text(*bound[0], "eval");
    auto parsed = cinder::parser::parse_expression_source(text);
    if (auto* diags = std::get_if<std::vector<cinder::diag::Diagnostic>>(&parsed))
    {
        raise_syntax(*diags);
    }
    auto unit = std::make_shared<const Unit>(cinder::source::from_string(text),
                                             std::move(std::get<cinder::parser::Expr>(parsed)));
    EnvPtr env = dynamic_scope(interp, bound[1], "eval");
    Value result = interp.eval_expression(unit, env);
    write_back(env, bound[1]);
    return result;
}

Value builtin_exec(Interpreter& interp, CallArgs& args)
{
    auto bound = bind_native(args, "exec", {"source", "globals", "locals"}, 1);
    const std::string& text = source_text(*bound[0], "exec");
    auto parsed = cinder::parser::parse_source(text);
    if (auto* diags = std::get_if<std::vector<cinder::diag::Diagnostic>>(&parsed))
    {
        raise_syntax(*diags);
    }
    auto unit = std::make_shared<const Unit>(cinder::source::from_string(text),
                                             std::move(std::get<cinder::parser::Program>(parsed)));
    EnvPtr env = dynamic_scope(interp, bound[1], "exec");
    (void)interp.exec_program(unit, env);
    write_back(env, bound[1]);
    return Value::none();
}

Value builtin_globals(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "globals", 0, 0);
    return snapshot(*interp.current_globals());
}

Value builtin_locals(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "locals", 0, 0);
    return snapshot(*interp.current_env());
}

Value builtin_dir(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "dir", 0, 1);
    std::vector<std::string> names;
    if (args.positional.empty())
    {
        for (const auto& [name, value] : interp.current_env()->vars)
        {
            names.push_back(name);
        }
    }
    else if (const auto* module = args.positional[0].as<ModuleObject>())
    {
        for (const auto& [name, value] : module->members)
        {
            names.push_back(name);
        }
    }
    else
    {
        names = method_names(args.positional[0]);
    }
    std::sort(names.begin(), names.end());
    std::vector<Value> items;
    items.reserve(names.size());
    for (auto& name : names)
    {
        items.push_back(make_str(std::move(name)));
    }
    return make_list(std::move(items));
}

Value builtin_vars(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "vars", 0, 1);
    if (args.positional.empty())
    {
        return snapshot(*interp.current_env());
    }
    if (const auto* module = args.positional[0].as<ModuleObject>())
    {
        Value dict = make_dict();
        auto& table = dict.as<DictObject>()->table;
        for (const auto& [name, value] : module->members)
        {
            table.insert(make_str(name), value);
        }
        recharge(dict);
        return dict;
    }
    raise("TypeError", "vars() argument must have __dict__ attribute");
}

Value builtin_getattr(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "getattr", 2, 3);
    const std::string& name = str_arg(args.positional[1], "getattr");
    try
    {
        return interp.get_attribute(args.positional[0], name);
    }
    catch (const ScriptError& error)
    {
        if (args.positional.size() == 3 && error.is_a("AttributeError"))
        {
            return args.positional[2];
        }
        throw;
    }
}

Value builtin_hasattr(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "hasattr", 2, 2);
    const std::string& name = str_arg(args.positional[1], "hasattr");
    try
    {
        (void)interp.get_attribute(args.positional[0], name);
        return Value::boolean(true);
    }
    catch (const ScriptError& error)
    {
        if (error.is_a("AttributeError"))
        {
            return Value::boolean(false);
        }
        throw;
    }
}

NativeFunction attribute_writer(const char* function, std::size_t arity)
{
    return [function, arity](Interpreter& interp, CallArgs& args) -> Value {
        expect_positional(args, function, arity, arity);
        const Value& target = args.positional[0];
        const std::string& name = str_arg(args.positional[1], function);
        if (const auto* module = target.as<ModuleObject>())
        {
            raise("AttributeError", "module '" + module->name + "' attribute '" + name + "' is read-only");
        }
        (void)interp.get_attribute(target, name);
        raise("AttributeError", "'" + type_name(target) + "' object attribute '" + name + "' is read-only");
    };
}

Value builtin_input(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "input", 0, 1);
    if (!args.positional.empty())
    {
        interp.write_output(to_str(args.positional[0]));
    }
    raise("EOFError", "EOF when reading a line");
}

const Builtins& builtin_table()
{
    static const Builtins* table = [] {
        auto* t = new Builtins();
        auto& r = type_registry();
        for (const char* name :
             {"int", "float", "complex", "str", "bool", "list", "tuple", "set", "dict", "bytes", "range", "type"})
        {
            t->emplace(name, r.get(name));
        }
        auto add = [&](const char* name, NativeFunction fn) { t->emplace(name, native(name, std::move(fn))); };
        add("print", builtin_print);
        add("len", builtin_len);
        add("abs", builtin_abs);
        add("min", [](Interpreter& interp, CallArgs& args) { return extreme(interp, args, "min", false); });
        add("max", [](Interpreter& interp, CallArgs& args) { return extreme(interp, args, "max", true); });
        add("sum", builtin_sum);
        add("sorted", builtin_sorted);
        add("reversed", builtin_reversed);
        add("enumerate", builtin_enumerate);
        add("zip", builtin_zip);
        add("map", builtin_map);
        add("filter", builtin_filter);
        add("any", builtin_any);
        add("all", builtin_all);
        add("round", builtin_round);
        add("pow", builtin_pow);
        add("divmod", builtin_divmod);
        add("repr", builtin_repr);
        add("isinstance", builtin_isinstance);
        add("hash", builtin_hash);
        add("chr", builtin_chr);
        add("ord", builtin_ord);
        add("hex", radix("hex", "#x"));
        add("bin", radix("bin", "#b"));
        add("oct", radix("oct", "#o"));
        add("format", builtin_format);
        add("iter", builtin_iter);
        add("next", builtin_next);
        add("id", builtin_id);
        add("callable", builtin_callable);
        add("eval", builtin_eval);
        add("exec", builtin_exec);
        add("globals", builtin_globals);
        add("locals", builtin_locals);
        add("dir", builtin_dir);
        add("vars", builtin_vars);
        add("getattr", builtin_getattr);
        add("setattr", attribute_writer("setattr", 3));
        add("delattr", attribute_writer("delattr", 2));
        add("hasattr", builtin_hasattr);
        add("input", builtin_input);
        for (const auto& type : builtin_exception_types())
        {
            t->emplace(type->name, Value::object(type));
        }
        return t;
    }();
    return *table;
}

} // namespace

Builtins make_builtins()
{
    return builtin_table();
}

Value builtin_type(std::string_view name)
{
    auto& r = type_registry();
    std::lock_guard<std::mutex> lock(r.mutex);
    auto it = r.types.find(std::string(name));
    return it == r.types.end() ? Value::none() : it->second;
}

Value type_of(const Value& value)
{
    if (const auto* exception = value.as<ExceptionObject>())
    {
        return Value::object(exception->type);
    }
    return type_registry().get(type_name(value));
}

bool is_instance(const Value& value, const Value& type)
{
    if (const auto* exception_type = type.as<ExceptionTypeObject>())
    {
        const auto* exception = value.as<ExceptionObject>();
        return exception != nullptr && exception->type->is_subclass_of(*exception_type);
    }
    if (const auto* t = type.as<TypeObject>())
    {
        if (t->name == "int" && value.is_bool())
        {
            return true;
        }
        return type_name(value) == t->name;
    }
    raise("TypeError", "isinstance() arg 2 must be a type, a tuple of types, or a union");
}

} // namespace cinder::runtime
