#include <algorithm>
#include <cctype>
#include <charconv>
#include <cinder/parser/literal.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/ops.h>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace cinder::runtime
{

namespace
{

constexpr std::size_t kMaxReprDepth = 500;

thread_local std::vector<const Object*> g_repr_stack;

class ReprGuard
{
  public:
    explicit ReprGuard(const Object* obj)
    {
        if (g_repr_stack.size() >= kMaxReprDepth)
        {
            raise("RecursionError", "maximum recursion depth exceeded while getting the repr of an object");
        }
        g_repr_stack.push_back(obj);
    }
    ~ReprGuard() { g_repr_stack.pop_back(); }

    ReprGuard(const ReprGuard&) = delete;
    ReprGuard& operator=(const ReprGuard&) = delete;
};

bool in_repr(const Object* obj)
{
    return std::find(g_repr_stack.begin(), g_repr_stack.end(), obj) != g_repr_stack.end();
}

std::string address_of(const void* ptr)
{
    char buf[32];
    auto res = std::to_chars(buf, buf + sizeof(buf), reinterpret_cast<std::uintptr_t>(ptr), 16);
    return "0x" + std::string(buf, res.ptr);
}

std::string hex_byte(unsigned char c)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out = "\\x";
    out += kDigits[c >> 4];
    out += kDigits[c & 0xF];
    return out;
}

std::string strip_point_zero(std::string text)
{
    if (text.size() > 2 && text.compare(text.size() - 2, 2, ".0") == 0)
    {
        text.resize(text.size() - 2);
    }
    return text;
}

std::string complex_repr(std::complex<double> c)
{
    std::string imag = strip_point_zero(float_repr(c.imag()));
    if (c.real() == 0.0 && !std::signbit(c.real()))
    {
        return imag + "j";
    }
    if (imag.front() != '-')
    {
        imag = "+" + imag;
    }
    return "(" + strip_point_zero(float_repr(c.real())) + imag + "j)";
}

std::string bytes_repr(const std::string& bytes)
{
    const bool has_single = bytes.find('\'') != std::string::npos;
    const bool has_double = bytes.find('"') != std::string::npos;
    const char quote = has_single && !has_double ? '"' : '\'';

    std::string out = "b";
    out += quote;
    for (char ch : bytes)
    {
        const auto c = static_cast<unsigned char>(ch);
        if (ch == quote || ch == '\\')
        {
            out += '\\';
            out += ch;
        }
        else if (ch == '\n')
        {
            out += "\\n";
        }
        else if (ch == '\r')
        {
            out += "\\r";
        }
        else if (ch == '\t')
        {
            out += "\\t";
        }
        else if (c < 0x20 || c >= 0x7f)
        {
            out += hex_byte(c);
        }
        else
        {
            out += ch;
        }
    }
    out += quote;
    return out;
}

template <typename Range>
std::string join_reprs(const Range& items)
{
    std::string out;
    bool first = true;
    for (const auto& item : items)
    {
        if (!first)
        {
            out += ", ";
        }
        first = false;
        out += repr(item);
    }
    return out;
}

std::string dict_items_repr(const HashTable& table)
{
    std::string out;
    bool first = true;
    for (const auto& entry : table.entries())
    {
        if (!entry.live)
        {
            continue;
        }
        if (!first)
        {
            out += ", ";
        }
        first = false;
        out += repr(entry.key) + ": " + repr(entry.value);
    }
    return out;
}

std::string set_items_repr(const HashTable& table)
{
    std::string out;
    bool first = true;
    for (const auto& entry : table.entries())
    {
        if (!entry.live)
        {
            continue;
        }
        if (!first)
        {
            out += ", ";
        }
        first = false;
        out += repr(entry.key);
    }
    return out;
}

std::string view_repr(const DictViewObject& view)
{
    std::string out;
    const char* name = "dict_keys";
    if (view.which == DictViewObject::Which::Values)
    {
        name = "dict_values";
    }
    else if (view.which == DictViewObject::Which::Items)
    {
        name = "dict_items";
    }
    out = std::string(name) + "([";
    bool first = true;
    for (const auto& entry : view.dict->table.entries())
    {
        if (!entry.live)
        {
            continue;
        }
        if (!first)
        {
            out += ", ";
        }
        first = false;
        switch (view.which)
        {
        case DictViewObject::Which::Keys:
            out += repr(entry.key);
            break;
        case DictViewObject::Which::Values:
            out += repr(entry.value);
            break;
        case DictViewObject::Which::Items:
            out += "(" + repr(entry.key) + ", " + repr(entry.value) + ")";
            break;
        }
    }
    out += "])";
    return out;
}

std::string object_repr(const Value& value)
{
    const Object* obj = value.as_object().get();
    switch (obj->kind)
    {
    case ObjectKind::Str:
        return quote_str(static_cast<const StrObject*>(obj)->value);
    case ObjectKind::Bytes:
        return bytes_repr(static_cast<const BytesObject*>(obj)->value);
    case ObjectKind::List: {
        if (in_repr(obj))
        {
            return "[...]";
        }
        ReprGuard guard(obj);
        return "[" + join_reprs(static_cast<const ListObject*>(obj)->items) + "]";
    }
    case ObjectKind::Tuple: {
        const auto& items = static_cast<const TupleObject*>(obj)->items;
        ReprGuard guard(obj);
        if (items.size() == 1)
        {
            return "(" + repr(items.front()) + ",)";
        }
        return "(" + join_reprs(items) + ")";
    }
    case ObjectKind::Dict: {
        if (in_repr(obj))
        {
            return "{...}";
        }
        ReprGuard guard(obj);
        return "{" + dict_items_repr(static_cast<const DictObject*>(obj)->table) + "}";
    }
    case ObjectKind::Set: {
        const auto& table = static_cast<const SetObject*>(obj)->table;
        if (table.empty())
        {
            return "set()";
        }
        ReprGuard guard(obj);
        return "{" + set_items_repr(table) + "}";
    }
    case ObjectKind::Range: {
        const auto* r = static_cast<const RangeObject*>(obj);
        std::string out = "range(" + std::to_string(r->start) + ", " + std::to_string(r->stop);
        if (r->step != 1)
        {
            out += ", " + std::to_string(r->step);
        }
        return out + ")";
    }
    case ObjectKind::Array: {
        const auto* a = static_cast<const ArrayObject*>(obj);
        std::string out = "array('";
        out += a->typecode;
        out += "'";
        if (!a->items.empty())
        {
            out += ", [" + join_reprs(a->items) + "]";
        }
        return out + ")";
    }
    case ObjectKind::DictView: {
        if (in_repr(obj))
        {
            return "...";
        }
        ReprGuard guard(obj);
        return view_repr(*static_cast<const DictViewObject*>(obj));
    }
    case ObjectKind::Function:
        return "<function " + static_cast<const FunctionObject*>(obj)->name + " at " +
               address_of(obj) + ">";
    case ObjectKind::Builtin:
        return "<built-in function " + static_cast<const BuiltinObject*>(obj)->name + ">";
    case ObjectKind::BoundMethod: {
        const auto* m = static_cast<const BoundMethodObject*>(obj);
        return "<built-in method " + m->name + " of " + type_name(m->self) + " object>";
    }
    case ObjectKind::Module:
        return "<module '" + static_cast<const ModuleObject*>(obj)->name + "' (built-in)>";
    case ObjectKind::Type:
        return "<class '" + static_cast<const TypeObject*>(obj)->name + "'>";
    case ObjectKind::ExceptionType:
        return "<class '" + static_cast<const ExceptionTypeObject*>(obj)->name + "'>";
    case ObjectKind::Exception: {
        const auto* e = static_cast<const ExceptionObject*>(obj);
        ReprGuard guard(obj);
        return e->type->name + "(" + join_reprs(e->args) + ")";
    }
    case ObjectKind::Iterator:
        return "<" + static_cast<const IteratorObject*>(obj)->type_name + " object at " +
               address_of(obj) + ">";
    }
    return "<object>";
}

// --- format-spec mini-language ---

struct Spec
{
    char fill = ' ';
    char align = 0;
    char sign = '-';
    bool alternate = false;
    std::size_t width = 0;
    char grouping = 0;
    int precision = -1;
    char type = 0;
};

std::size_t parse_digits(std::string_view text, std::size_t& i)
{
    std::size_t value = 0;
    while (i < text.size() && text[i] >= '0' && text[i] <= '9')
    {
        value = value * 10 + static_cast<std::size_t>(text[i] - '0');
        if (value > 100000)
        {
            raise("ValueError", "Too many decimal digits in format string");
        }
        ++i;
    }
    return value;
}

bool is_align(char c)
{
    return c == '<' || c == '>' || c == '=' || c == '^';
}

Spec parse_spec(std::string_view text)
{
    Spec spec;
    std::size_t i = 0;
    if (text.size() >= 2 && is_align(text[1]))
    {
        spec.fill = text[0];
        spec.align = text[1];
        i = 2;
    }
    else if (!text.empty() && is_align(text[0]))
    {
        spec.align = text[0];
        i = 1;
    }
    if (i < text.size() && (text[i] == '+' || text[i] == '-' || text[i] == ' '))
    {
        spec.sign = text[i++];
    }
    if (i < text.size() && text[i] == '#')
    {
        spec.alternate = true;
        ++i;
    }
    if (i < text.size() && text[i] == '0')
    {
        if (spec.align == 0)
        {
            spec.fill = '0';
            spec.align = '=';
        }
        ++i;
    }
    spec.width = parse_digits(text, i);
    if (i < text.size() && (text[i] == ',' || text[i] == '_'))
    {
        spec.grouping = text[i++];
    }
    if (i < text.size() && text[i] == '.')
    {
        ++i;
        const std::size_t start = i;
        spec.precision = static_cast<int>(parse_digits(text, i));
        if (i == start)
        {
            raise("ValueError", "Format specifier missing precision");
        }
    }
    if (i < text.size())
    {
        spec.type = text[i++];
    }
    if (i != text.size())
    {
        raise("ValueError", "Invalid format specifier '" + std::string(text) + "'");
    }
    return spec;
}

std::string pad(std::string_view sign_and_prefix, std::string_view body, const Spec& spec,
                char default_align)
{
    const std::size_t length = utf8_length(sign_and_prefix) + utf8_length(body);
    if (length >= spec.width)
    {
        return std::string(sign_and_prefix) + std::string(body);
    }
    const std::size_t fill_count = spec.width - length;
    const std::string fill(fill_count, spec.fill);
    switch (spec.align != 0 ? spec.align : default_align)
    {
    case '<':
        return std::string(sign_and_prefix) + std::string(body) + fill;
    case '^': {
        const std::size_t left = fill_count / 2;
        return std::string(left, spec.fill) + std::string(sign_and_prefix) + std::string(body) +
               std::string(fill_count - left, spec.fill);
    }
    case '=':
        return std::string(sign_and_prefix) + fill + std::string(body);
    default:
        return fill + std::string(sign_and_prefix) + std::string(body);
    }
}

std::string group_digits(const std::string& digits, char separator, std::size_t every)
{
    if (separator == 0 || digits.size() <= every)
    {
        return digits;
    }
    std::string out;
    const std::size_t lead = digits.size() % every;
    for (std::size_t i = 0; i < digits.size(); ++i)
    {
        if (i != 0 && (i - lead) % every == 0 && i >= lead)
        {
            out += separator;
        }
        out += digits[i];
    }
    return out;
}

std::string unsigned_digits(std::uint64_t magnitude, int base, bool upper)
{
    char buf[72];
    auto res = std::to_chars(buf, buf + sizeof(buf), magnitude, base);
    std::string out(buf, res.ptr);
    if (upper)
    {
        std::transform(out.begin(), out.end(), out.begin(),
                       [](char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); });
    }
    return out;
}

std::uint64_t magnitude_of(std::int64_t v)
{
    return v < 0 ? 0ULL - static_cast<std::uint64_t>(v) : static_cast<std::uint64_t>(v);
}

std::string sign_text(bool negative, char sign)
{
    if (negative)
    {
        return "-";
    }
    if (sign == '+')
    {
        return "+";
    }
    if (sign == ' ')
    {
        return " ";
    }
    return "";
}

std::string c_double(char type, int precision, bool alternate, double v)
{
    std::string fmt = "%";
    if (alternate)
    {
        fmt += '#';
    }
    fmt += ".*";
    fmt += type;
    const int n = std::snprintf(nullptr, 0, fmt.c_str(), precision, v);
    std::string out(static_cast<std::size_t>(n), '\0');
    std::snprintf(out.data(), out.size() + 1, fmt.c_str(), precision, v);
    return out;
}

std::string format_float_body(double magnitude, const Spec& spec)
{
    char type = spec.type;
    int precision = spec.precision;
    std::string body;
    switch (type)
    {
    case 0:
        if (precision < 0)
        {
            body = float_repr(magnitude);
        }
        else
        {
            body = c_double('g', precision == 0 ? 1 : precision, spec.alternate, magnitude);
            if (std::isfinite(magnitude) && body.find_first_of(".e") == std::string::npos)
            {
                body += ".0";
            }
        }
        break;
    case 'n':
        body = c_double('g', precision < 0 ? 6 : precision, spec.alternate, magnitude);
        break;
    case '%':
        body = c_double('f', precision < 0 ? 6 : precision, spec.alternate, magnitude * 100.0) + "%";
        break;
    case 'e':
    case 'E':
    case 'f':
    case 'F':
    case 'g':
    case 'G':
        body = c_double(type, precision < 0 ? 6 : precision, spec.alternate, magnitude);
        break;
    default:
        raise("ValueError", std::string("Unknown format code '") + type + "' for object of type 'float'");
    }

    if (spec.grouping != 0 && std::isfinite(magnitude))
    {
        const std::size_t end = body.find_first_of(".e%");
        const std::string integer = body.substr(0, end);
        const std::string rest = end == std::string::npos ? "" : body.substr(end);
        body = group_digits(integer, spec.grouping, 3) + rest;
    }
    return body;
}

std::string format_float(double v, const Spec& spec)
{
    const bool negative = std::signbit(v) && !std::isnan(v);
    const std::string body = format_float_body(std::fabs(v), spec);
    return pad(sign_text(negative, spec.sign), body, spec, '>');
}

std::string format_int(std::int64_t v, const Spec& spec)
{
    switch (spec.type)
    {
    case 'e':
    case 'E':
    case 'f':
    case 'F':
    case 'g':
    case 'G':
    case '%':
        return format_float(static_cast<double>(v), spec);
    default:
        break;
    }
    if (spec.precision >= 0)
    {
        raise("ValueError", "Precision not allowed in integer format specifier");
    }

    const std::uint64_t magnitude = magnitude_of(v);
    std::string prefix;
    std::string digits;
    switch (spec.type)
    {
    case 0:
    case 'd':
    case 'n':
        digits = group_digits(unsigned_digits(magnitude, 10, false), spec.grouping, 3);
        break;
    case 'b':
        prefix = spec.alternate ? "0b" : "";
        digits = group_digits(unsigned_digits(magnitude, 2, false), spec.grouping, 4);
        break;
    case 'o':
        prefix = spec.alternate ? "0o" : "";
        digits = group_digits(unsigned_digits(magnitude, 8, false), spec.grouping, 4);
        break;
    case 'x':
        prefix = spec.alternate ? "0x" : "";
        digits = group_digits(unsigned_digits(magnitude, 16, false), spec.grouping, 4);
        break;
    case 'X':
        prefix = spec.alternate ? "0X" : "";
        digits = group_digits(unsigned_digits(magnitude, 16, true), spec.grouping, 4);
        break;
    case 'c': {
        if (v < 0 || v > 0x10FFFF)
        {
            raise("OverflowError", "%c arg not in range(0x110000)");
        }
        std::string ch;
        cinder::parser::append_utf8(ch, static_cast<std::uint32_t>(v));
        Spec plain = spec;
        plain.type = 0;
        return pad("", ch, plain, '<');
    }
    default:
        raise("ValueError", std::string("Unknown format code '") + spec.type + "' for object of type 'int'");
    }
    return pad(sign_text(v < 0, spec.sign) + prefix, digits, spec, '>');
}

std::string format_string(const std::string& text, const Spec& spec)
{
    if (spec.type != 0 && spec.type != 's')
    {
        raise("ValueError", std::string("Unknown format code '") + spec.type + "' for object of type 'str'");
    }
    if (spec.sign != '-')
    {
        raise("ValueError", "Sign not allowed in string format specifier");
    }
    if (spec.align == '=')
    {
        raise("ValueError", "'=' alignment not allowed in string format specifier");
    }
    std::string body = text;
    if (spec.precision >= 0)
    {
        body = body.substr(0, utf8_offset(body, static_cast<std::size_t>(spec.precision)));
    }
    return pad("", body, spec, '<');
}

std::string format_complex(std::complex<double> c, const Spec& spec)
{
    Spec part = spec;
    part.width = 0;
    part.align = 0;
    part.fill = ' ';
    if (part.type == 0)
    {
        part.type = 'g';
    }
    std::string real = format_float(c.real(), part);
    part.sign = '+';
    std::string imag = format_float(c.imag(), part);
    return pad("", real + imag + "j", spec, '>');
}

// --- printf-style ---

std::string percent_number(char conv, const Value& arg, int flags_width, int precision, bool left,
                           bool zero, char sign, bool alternate)
{
    Spec spec;
    spec.width = static_cast<std::size_t>(std::max(flags_width, 0));
    spec.sign = sign;
    spec.alternate = alternate;
    if (left)
    {
        spec.align = '<';
    }
    else if (zero)
    {
        spec.fill = '0';
        spec.align = '=';
    }
    else
    {
        spec.align = '>';
    }

    if (conv == 'd' || conv == 'i' || conv == 'u' || conv == 'x' || conv == 'X' || conv == 'o')
    {
        std::int64_t v = 0;
        if (arg.is_integral())
        {
            v = arg.integral();
        }
        else if (arg.is_float())
        {
            v = float_to_int(std::trunc(arg.as_float()));
        }
        else
        {
            raise("TypeError", std::string("%") + conv + " format: a real number is required, not " +
                                   type_name(arg));
        }
        const int base = conv == 'o' ? 8 : (conv == 'x' || conv == 'X') ? 16 : 10;
        std::string digits = unsigned_digits(magnitude_of(v), base, conv == 'X');
        if (precision >= 0 && digits.size() < static_cast<std::size_t>(precision))
        {
            digits = std::string(static_cast<std::size_t>(precision) - digits.size(), '0') + digits;
        }
        std::string prefix;
        if (alternate && conv == 'x')
        {
            prefix = "0x";
        }
        else if (alternate && conv == 'X')
        {
            prefix = "0X";
        }
        else if (alternate && conv == 'o')
        {
            prefix = "0o";
        }
        return pad(sign_text(v < 0, sign) + prefix, digits, spec, '>');
    }

    if (!arg.is_real())
    {
        raise("TypeError", std::string("must be real number, not ") + type_name(arg));
    }
    const double v = arg.to_double();
    spec.type = conv;
    spec.precision = precision < 0 ? 6 : precision;
    const bool negative = std::signbit(v) && !std::isnan(v);
    return pad(sign_text(negative, sign), format_float_body(std::fabs(v), spec), spec, '>');
}

} // namespace

std::string float_repr(double value)
{
    if (std::isnan(value))
    {
        return "nan";
    }
    if (std::isinf(value))
    {
        return value > 0 ? "inf" : "-inf";
    }

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    std::string sci(buf, res.ptr);
    const bool negative = sci.front() == '-';
    if (negative)
    {
        sci.erase(0, 1);
    }
    const std::size_t epos = sci.find('e');
    std::string digits = sci.substr(0, epos);
    digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());
    const int exponent = std::stoi(sci.substr(epos + 1));

    std::string out;
    if (exponent >= -4 && exponent < 16)
    {
        if (exponent >= 0)
        {
            const auto int_len = static_cast<std::size_t>(exponent) + 1;
            if (digits.size() <= int_len)
            {
                out = digits + std::string(int_len - digits.size(), '0') + ".0";
            }
            else
            {
                out = digits.substr(0, int_len) + "." + digits.substr(int_len);
            }
        }
        else
        {
            out = "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') + digits;
        }
    }
    else
    {
        out = digits.substr(0, 1);
        if (digits.size() > 1)
        {
            out += "." + digits.substr(1);
        }
        out += exponent < 0 ? "e-" : "e+";
        const int magnitude = exponent < 0 ? -exponent : exponent;
        if (magnitude < 10)
        {
            out += '0';
        }
        out += std::to_string(magnitude);
    }
    return negative ? "-" + out : out;
}

std::string quote_str(std::string_view text)
{
    const bool has_single = text.find('\'') != std::string_view::npos;
    const bool has_double = text.find('"') != std::string_view::npos;
    const char quote = has_single && !has_double ? '"' : '\'';

    std::string out;
    out.reserve(text.size() + 2);
    out += quote;
    for (char ch : text)
    {
        const auto c = static_cast<unsigned char>(ch);
        if (ch == quote || ch == '\\')
        {
            out += '\\';
            out += ch;
        }
        else if (ch == '\n')
        {
            out += "\\n";
        }
        else if (ch == '\r')
        {
            out += "\\r";
        }
        else if (ch == '\t')
        {
            out += "\\t";
        }
        else if (c < 0x20 || c == 0x7f)
        {
            out += hex_byte(c);
        }
        else
        {
            out += ch;
        }
    }
    out += quote;
    return out;
}

std::string repr(const Value& value)
{
    return std::visit(
        [&](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>)
            {
                return "None";
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
                return v ? "True" : "False";
            }
            else if constexpr (std::is_same_v<T, std::int64_t>)
            {
                return std::to_string(v);
            }
            else if constexpr (std::is_same_v<T, double>)
            {
                return float_repr(v);
            }
            else if constexpr (std::is_same_v<T, std::complex<double>>)
            {
                return complex_repr(v);
            }
            else
            {
                return object_repr(value);
            }
        },
        value.storage());
}

std::string to_str(const Value& value)
{
    if (const auto* s = value.as<StrObject>())
    {
        return s->value;
    }
    if (const auto* e = value.as<ExceptionObject>())
    {
        return exception_message(*e);
    }
    return repr(value);
}

std::string type_name(const Value& value)
{
    return std::visit(
        [&](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>)
            {
                return "NoneType";
            }
            else if constexpr (std::is_same_v<T, bool>)
            {
                return "bool";
            }
            else if constexpr (std::is_same_v<T, std::int64_t>)
            {
                return "int";
            }
            else if constexpr (std::is_same_v<T, double>)
            {
                return "float";
            }
            else if constexpr (std::is_same_v<T, std::complex<double>>)
            {
                return "complex";
            }
            else
            {
                switch (v->kind)
                {
                case ObjectKind::Str:
                    return "str";
                case ObjectKind::Bytes:
                    return "bytes";
                case ObjectKind::List:
                    return "list";
                case ObjectKind::Tuple:
                    return "tuple";
                case ObjectKind::Dict:
                    return "dict";
                case ObjectKind::Set:
                    return "set";
                case ObjectKind::Range:
                    return "range";
                case ObjectKind::Array:
                    return "array";
                case ObjectKind::DictView:
                    switch (static_cast<const DictViewObject*>(v.get())->which)
                    {
                    case DictViewObject::Which::Keys:
                        return "dict_keys";
                    case DictViewObject::Which::Values:
                        return "dict_values";
                    case DictViewObject::Which::Items:
                        return "dict_items";
                    }
                    return "dict_keys";
                case ObjectKind::Function:
                    return "function";
                case ObjectKind::Builtin:
                case ObjectKind::BoundMethod:
                    return "builtin_function_or_method";
                case ObjectKind::Module:
                    return "module";
                case ObjectKind::Type:
                case ObjectKind::ExceptionType:
                    return "type";
                case ObjectKind::Exception:
                    return static_cast<const ExceptionObject*>(v.get())->type->name;
                case ObjectKind::Iterator:
                    return static_cast<const IteratorObject*>(v.get())->type_name;
                }
                return "object";
            }
        },
        value.storage());
}

std::string format_value(const Value& value, std::string_view spec_text)
{
    if (spec_text.empty())
    {
        return to_str(value);
    }
    const Spec spec = parse_spec(spec_text);
    if (value.is_integral())
    {
        return format_int(value.integral(), spec);
    }
    if (value.is_float())
    {
        return format_float(value.as_float(), spec);
    }
    if (value.is_complex())
    {
        return format_complex(value.as_complex(), spec);
    }
    if (const auto* s = value.as<StrObject>())
    {
        return format_string(s->value, spec);
    }
    raise("TypeError", "unsupported format string passed to " + type_name(value) + ".__format__");
}

std::string percent_format(std::string_view fmt, const Value& args)
{
    std::vector<Value> positional;
    const DictObject* mapping = nullptr;
    if (const auto* tuple = args.as<TupleObject>())
    {
        positional = tuple->items;
    }
    else
    {
        mapping = args.as<DictObject>();
        positional.push_back(args);
    }

    std::size_t next_arg = 0;
    auto star_arg = [](const Value& v) -> int {
        if (!v.is_integral())
        {
            raise("TypeError", "* wants int");
        }
        return static_cast<int>(v.integral());
    };
    auto take = [&]() -> Value {
        if (next_arg >= positional.size())
        {
            raise("TypeError", "not enough arguments for format string");
        }
        return positional[next_arg++];
    };

    std::string out;
    std::size_t i = 0;
    while (i < fmt.size())
    {
        const char ch = fmt[i];
        if (ch != '%')
        {
            out += ch;
            ++i;
            continue;
        }
        ++i;
        if (i >= fmt.size())
        {
            raise("ValueError", "incomplete format");
        }

        std::optional<Value> keyed;
        if (fmt[i] == '(')
        {
            const std::size_t close = fmt.find(')', i);
            if (close == std::string_view::npos)
            {
                raise("ValueError", "incomplete format key");
            }
            if (mapping == nullptr)
            {
                raise("TypeError", "format requires a mapping");
            }
            const Value key = make_str(std::string(fmt.substr(i + 1, close - i - 1)));
            const HashEntry* entry = mapping->table.find(key);
            if (entry == nullptr)
            {
                raise_with_args("KeyError", {key});
            }
            keyed = entry->value;
            i = close + 1;
        }

        bool left = false;
        bool zero = false;
        bool alternate = false;
        char sign = '-';
        while (i < fmt.size())
        {
            const char flag = fmt[i];
            if (flag == '-')
            {
                left = true;
            }
            else if (flag == '0')
            {
                zero = true;
            }
            else if (flag == '#')
            {
                alternate = true;
            }
            else if (flag == '+')
            {
                sign = '+';
            }
            else if (flag == ' ')
            {
                if (sign != '+')
                {
                    sign = ' ';
                }
            }
            else
            {
                break;
            }
            ++i;
        }

        int width = -1;
        if (i < fmt.size() && fmt[i] == '*')
        {
            width = star_arg(take());
            if (width < 0)
            {
                left = true;
                width = -width;
            }
            ++i;
        }
        else if (i < fmt.size() && fmt[i] >= '0' && fmt[i] <= '9')
        {
            width = static_cast<int>(parse_digits(fmt, i));
        }

        int precision = -1;
        if (i < fmt.size() && fmt[i] == '.')
        {
            ++i;
            if (i < fmt.size() && fmt[i] == '*')
            {
                precision = star_arg(take());
                ++i;
            }
            else
            {
                precision = static_cast<int>(parse_digits(fmt, i));
            }
        }
        while (i < fmt.size() && (fmt[i] == 'h' || fmt[i] == 'l' || fmt[i] == 'L'))
        {
            ++i;
        }
        if (i >= fmt.size())
        {
            raise("ValueError", "incomplete format");
        }

        const char conv = fmt[i++];
        if (conv == '%')
        {
            out += '%';
            continue;
        }
        const Value arg = keyed ? *keyed : take();

        Spec text_spec;
        text_spec.width = static_cast<std::size_t>(std::max(width, 0));
        text_spec.align = left ? '<' : '>';
        switch (conv)
        {
        case 's':
        case 'r':
        case 'a': {
            std::string text = conv == 's' ? to_str(arg) : repr(arg);
            if (precision >= 0)
            {
                text = text.substr(0, utf8_offset(text, static_cast<std::size_t>(precision)));
            }
            out += pad("", text, text_spec, '>');
            break;
        }
        case 'c': {
            std::string text;
            if (const auto* s = arg.as<StrObject>(); s != nullptr && s->length == 1)
            {
                text = s->value;
            }
            else if (arg.is_integral())
            {
                text = format_int(arg.integral(), Spec{.type = 'c'});
            }
            else
            {
                raise("TypeError", "%c requires int or char");
            }
            out += pad("", text, text_spec, '>');
            break;
        }
        case 'd':
        case 'i':
        case 'u':
        case 'x':
        case 'X':
        case 'o':
        case 'e':
        case 'E':
        case 'f':
        case 'F':
        case 'g':
        case 'G':
            out += percent_number(conv, arg, width, precision, left, zero, sign, alternate);
            break;
        default: {
            char detail[64];
            std::snprintf(detail, sizeof(detail), "unsupported format character '%c' (0x%x) at index %zu",
                          conv, static_cast<unsigned>(static_cast<unsigned char>(conv)), i - 1);
            raise("ValueError", detail);
        }
        }
    }

    if (mapping == nullptr && next_arg < positional.size())
    {
        raise("TypeError", "not all arguments converted during string formatting");
    }
    return out;
}

} // namespace cinder::runtime
