#include <algorithm>
#include <cinder/parser/literal.h>
#include <cinder/runtime/args.h>
#include <cinder/runtime/errors.h>
#include <cinder/runtime/format.h>
#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/memory_budget.h>
#include <cinder/runtime/methods.h>
#include <cinder/runtime/ops.h>
#include <cmath>
#include <map>
#include <numeric>

namespace cinder::runtime
{

namespace
{

using MethodTable = std::map<std::string, NativeMethod, std::less<>>;

// --- text helpers shared by str and bytes ---

/** @brief Read-only view of a str or bytes receiver; indices are code points for str. */
struct Text
{
    const std::string& data;
    bool unicode;
    std::size_t length;

    static Text of(const Value& self)
    {
        if (const auto* s = self.as<StrObject>())
        {
            return Text{.data = s->value, .unicode = !s->ascii, .length = s->length};
        }
        const auto* b = self.as<BytesObject>();
        return Text{.data = b->value, .unicode = false, .length = b->value.size()};
    }

    [[nodiscard]] std::size_t to_byte(std::size_t index) const
    {
        return unicode ? utf8_offset(data, index) : index;
    }

    [[nodiscard]] std::size_t to_index(std::size_t byte) const
    {
        return unicode ? utf8_length(std::string_view(data).substr(0, byte)) : byte;
    }
};

bool is_str(const Value& self)
{
    return self.is(ObjectKind::Str);
}

Value wrap_text(const Value& self, std::string text)
{
    return is_str(self) ? make_str(std::move(text)) : make_bytes(std::move(text));
}

const std::string& text_arg(const Value& self, const Value& arg, const char* function)
{
    if (is_str(self))
    {
        if (const auto* s = arg.as<StrObject>())
        {
            return s->value;
        }
        raise("TypeError", std::string(function) + "() argument must be str, not " + type_name(arg));
    }
    if (const auto* b = arg.as<BytesObject>())
    {
        return b->value;
    }
    raise("TypeError", "a bytes-like object is required, not '" + type_name(arg) + "'");
}

std::vector<std::uint32_t> points_of(const Value& self, const std::string& text)
{
    if (is_str(self))
    {
        return utf8_decode(text);
    }
    std::vector<std::uint32_t> out;
    out.reserve(text.size());
    for (const char c : text)
    {
        out.push_back(static_cast<unsigned char>(c));
    }
    return out;
}

std::string encode_points(const Value& self, const std::vector<std::uint32_t>& points)
{
    std::string out;
    out.reserve(points.size());
    for (const auto cp : points)
    {
        if (is_str(self))
        {
            cinder::parser::append_utf8(out, cp);
        }
        else
        {
            out += static_cast<char>(cp);
        }
    }
    return out;
}

bool is_space(std::uint32_t c)
{
    return c == ' ' || (c >= '\t' && c <= '\r') || (c >= 0x1c && c <= 0x1f) || c == 0x85 || c == 0xa0 ||
           c == 0x1680 || (c >= 0x2000 && c <= 0x200a) || c == 0x2028 || c == 0x2029 || c == 0x202f ||
           c == 0x205f || c == 0x3000;
}

bool is_digit(std::uint32_t c)
{
    return c >= '0' && c <= '9';
}

std::uint32_t to_upper(std::uint32_t c)
{
    if ((c >= 'a' && c <= 'z') || (c >= 0xe0 && c <= 0xfe && c != 0xf7) || (c >= 0x3b1 && c <= 0x3c9 && c != 0x3c2) ||
        (c >= 0x430 && c <= 0x44f))
    {
        return c - 0x20;
    }
    if (c >= 0x450 && c <= 0x45f)
    {
        return c - 0x50;
    }
    return c;
}

std::uint32_t to_lower(std::uint32_t c)
{
    if ((c >= 'A' && c <= 'Z') || (c >= 0xc0 && c <= 0xde && c != 0xd7) || (c >= 0x391 && c <= 0x3a9 && c != 0x3a2) ||
        (c >= 0x410 && c <= 0x42f))
    {
        return c + 0x20;
    }
    if (c >= 0x400 && c <= 0x40f)
    {
        return c + 0x50;
    }
    return c;
}

bool is_upper(std::uint32_t c)
{
    return to_lower(c) != c;
}

bool is_lower(std::uint32_t c)
{
    return to_upper(c) != c;
}

bool is_alpha(std::uint32_t c, bool unicode)
{
    if (c < 0x80)
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }
    return unicode && !is_space(c);
}

/** @brief Python-style `start`/`end` arguments clamped to [0, length]. */
std::pair<std::size_t, std::size_t> clamp_range(const std::vector<Value>& args, std::size_t first,
                                                std::size_t length)
{
    auto resolve = [length](const Value& v, std::size_t fallback) -> std::size_t {
        if (v.is_none())
        {
            return fallback;
        }
        std::int64_t i = to_index(v, "slice indices");
        const auto n = static_cast<std::int64_t>(length);
        if (i < 0)
        {
            i = std::max<std::int64_t>(0, i + n);
        }
        return static_cast<std::size_t>(std::min(i, n));
    };
    std::size_t start = 0;
    std::size_t end = length;
    if (args.size() > first)
    {
        start = resolve(args[first], 0);
    }
    if (args.size() > first + 1)
    {
        end = resolve(args[first + 1], length);
    }
    return {start, end};
}

// Byte position of `sub` inside [start, end) of `self`, searching forward or backward.
std::optional<std::size_t> locate(const Value& self, CallArgs& args, const char* function, bool reverse)
{
    expect_positional(args, function, 1, 3);
    const Text text = Text::of(self);
    const std::string& sub = text_arg(self, args.positional[0], function);
    auto [start, end] = clamp_range(args.positional, 1, text.length);
    if (start > end)
    {
        return std::nullopt;
    }
    const std::size_t bstart = text.to_byte(start);
    const std::size_t bend = text.to_byte(end);
    const std::string_view window = std::string_view(text.data).substr(bstart, bend - bstart);
    const std::size_t at = reverse ? window.rfind(sub) : window.find(sub);
    if (at == std::string_view::npos)
    {
        return std::nullopt;
    }
    return bstart + at;
}

Value text_find(Interpreter&, const Value& self, CallArgs& args)
{
    auto at = locate(self, args, "find", false);
    return Value::integer(at ? static_cast<std::int64_t>(Text::of(self).to_index(*at)) : -1);
}

Value text_rfind(Interpreter&, const Value& self, CallArgs& args)
{
    auto at = locate(self, args, "rfind", true);
    return Value::integer(at ? static_cast<std::int64_t>(Text::of(self).to_index(*at)) : -1);
}

Value text_index(Interpreter&, const Value& self, CallArgs& args)
{
    auto at = locate(self, args, "index", false);
    if (!at)
    {
        raise("ValueError", is_str(self) ? "substring not found" : "subsection not found");
    }
    return Value::integer(static_cast<std::int64_t>(Text::of(self).to_index(*at)));
}

Value text_rindex(Interpreter&, const Value& self, CallArgs& args)
{
    auto at = locate(self, args, "rindex", true);
    if (!at)
    {
        raise("ValueError", is_str(self) ? "substring not found" : "subsection not found");
    }
    return Value::integer(static_cast<std::int64_t>(Text::of(self).to_index(*at)));
}

Value text_count(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "count", 1, 3);
    const Text text = Text::of(self);
    const std::string& sub = text_arg(self, args.positional[0], "count");
    auto [start, end] = clamp_range(args.positional, 1, text.length);
    if (start > end)
    {
        return Value::integer(0);
    }
    if (sub.empty())
    {
        return Value::integer(static_cast<std::int64_t>(end - start + 1));
    }
    const std::size_t bstart = text.to_byte(start);
    const std::string_view window = std::string_view(text.data).substr(bstart, text.to_byte(end) - bstart);
    std::int64_t n = 0;
    for (std::size_t at = window.find(sub); at != std::string_view::npos; at = window.find(sub, at + sub.size()))
    {
        ++n;
    }
    return Value::integer(n);
}

Value affix_match(const Value& self, CallArgs& args, const char* function, bool suffix)
{
    expect_positional(args, function, 1, 3);
    const Text text = Text::of(self);
    auto [start, end] = clamp_range(args.positional, 1, text.length);
    if (start > end)
    {
        return Value::boolean(false);
    }
    const std::size_t bstart = text.to_byte(start);
    const std::string_view window = std::string_view(text.data).substr(bstart, text.to_byte(end) - bstart);
    auto matches = [&](const Value& candidate) {
        const std::string& affix = text_arg(self, candidate, function);
        if (affix.size() > window.size())
        {
            return false;
        }
        return suffix ? window.substr(window.size() - affix.size()) == affix : window.substr(0, affix.size()) == affix;
    };
    if (const auto* options = args.positional[0].as<TupleObject>())
    {
        return Value::boolean(std::any_of(options->items.begin(), options->items.end(), matches));
    }
    if (!args.positional[0].is(ObjectKind::Str) && !args.positional[0].is(ObjectKind::Bytes))
    {
        raise("TypeError", std::string(function) + " first arg must be " + (is_str(self) ? "str" : "bytes") +
                               " or a tuple of " + (is_str(self) ? "str" : "bytes") + ", not " +
                               type_name(args.positional[0]));
    }
    return Value::boolean(matches(args.positional[0]));
}

Value text_startswith(Interpreter&, const Value& self, CallArgs& args)
{
    return affix_match(self, args, "startswith", false);
}

Value text_endswith(Interpreter&, const Value& self, CallArgs& args)
{
    return affix_match(self, args, "endswith", true);
}

Value text_replace(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "replace", 2, 3);
    const std::string& text = Text::of(self).data;
    const std::string& old_text = text_arg(self, args.positional[0], "replace");
    const std::string& new_text = text_arg(self, args.positional[1], "replace");
    std::int64_t remaining = args.positional.size() == 3 ? int_arg(args.positional[2], "replace") : -1;

    std::string out;
    if (old_text.empty())
    {
        const auto points = points_of(self, text);
        std::vector<std::uint32_t> one(1);
        for (std::size_t i = 0; i <= points.size(); ++i)
        {
            if (remaining != 0)
            {
                check_allocation(out.size() + new_text.size());
                out += new_text;
                --remaining;
            }
            if (i < points.size())
            {
                one[0] = points[i];
                out += encode_points(self, one);
            }
        }
        return wrap_text(self, std::move(out));
    }
    std::size_t pos = 0;
    while (remaining != 0)
    {
        const std::size_t at = text.find(old_text, pos);
        if (at == std::string::npos)
        {
            break;
        }
        check_allocation(out.size() + (at - pos) + new_text.size());
        out.append(text, pos, at - pos);
        out += new_text;
        pos = at + old_text.size();
        --remaining;
    }
    out.append(text, pos, std::string::npos);
    return wrap_text(self, std::move(out));
}

std::vector<std::string> split_whitespace(const Value& self, const std::string& text, std::int64_t maxsplit,
                                          bool reverse)
{
    auto points = points_of(self, text);
    if (reverse)
    {
        std::reverse(points.begin(), points.end());
    }
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i < points.size())
    {
        while (i < points.size() && is_space(points[i]))
        {
            ++i;
        }
        if (i == points.size())
        {
            break;
        }
        std::vector<std::uint32_t> word;
        if (maxsplit >= 0 && static_cast<std::int64_t>(parts.size()) == maxsplit)
        {
            std::size_t last = points.size();
            while (last > i && is_space(points[last - 1]))
            {
                --last;
            }
            word.assign(points.begin() + static_cast<std::ptrdiff_t>(i),
                        points.begin() + static_cast<std::ptrdiff_t>(last));
            i = points.size();
        }
        else
        {
            while (i < points.size() && !is_space(points[i]))
            {
                word.push_back(points[i++]);
            }
        }
        if (reverse)
        {
            std::reverse(word.begin(), word.end());
        }
        parts.push_back(encode_points(self, word));
    }
    if (reverse)
    {
        std::reverse(parts.begin(), parts.end());
    }
    return parts;
}

std::vector<std::string> split_on(const std::string& text, const std::string& sep, std::int64_t maxsplit,
                                  bool reverse)
{
    std::vector<std::string> parts;
    if (!reverse)
    {
        std::size_t pos = 0;
        while (maxsplit < 0 || static_cast<std::int64_t>(parts.size()) < maxsplit)
        {
            const std::size_t at = text.find(sep, pos);
            if (at == std::string::npos)
            {
                break;
            }
            parts.push_back(text.substr(pos, at - pos));
            pos = at + sep.size();
        }
        parts.push_back(text.substr(pos));
        return parts;
    }
    std::size_t end = text.size();
    while (maxsplit < 0 || static_cast<std::int64_t>(parts.size()) < maxsplit)
    {
        if (end < sep.size())
        {
            break;
        }
        const std::size_t at = text.rfind(sep, end - sep.size());
        if (at == std::string::npos)
        {
            break;
        }
        parts.push_back(text.substr(at + sep.size(), end - at - sep.size()));
        end = at;
    }
    parts.push_back(text.substr(0, end));
    std::reverse(parts.begin(), parts.end());
    return parts;
}

Value split_impl(const Value& self, CallArgs& args, const char* function, bool reverse)
{
    auto bound = bind_native(args, function, {"sep", "maxsplit"}, 0);
    const std::string& text = Text::of(self).data;
    const std::int64_t maxsplit = bound[1].has_value() ? int_arg(*bound[1], function) : -1;
    std::vector<std::string> parts;
    if (!bound[0].has_value() || bound[0]->is_none())
    {
        parts = split_whitespace(self, text, maxsplit, reverse);
    }
    else
    {
        const std::string& sep = text_arg(self, *bound[0], function);
        if (sep.empty())
        {
            raise("ValueError", "empty separator");
        }
        parts = split_on(text, sep, maxsplit, reverse);
    }
    std::vector<Value> items;
    items.reserve(parts.size());
    for (auto& part : parts)
    {
        items.push_back(wrap_text(self, std::move(part)));
    }
    return make_list(std::move(items));
}

Value text_split(Interpreter&, const Value& self, CallArgs& args)
{
    return split_impl(self, args, "split", false);
}

Value text_rsplit(Interpreter&, const Value& self, CallArgs& args)
{
    return split_impl(self, args, "rsplit", true);
}

Value text_splitlines(Interpreter&, const Value& self, CallArgs& args)
{
    auto bound = bind_native(args, "splitlines", {"keepends"}, 0);
    const bool keepends = bound[0].has_value() && truthy(*bound[0]);
    const std::string& text = Text::of(self).data;
    std::vector<Value> lines;
    std::size_t start = 0;
    std::size_t i = 0;
    while (i < text.size())
    {
        const char c = text[i];
        std::size_t eol = 0;
        if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
        {
            eol = 2;
        }
        else if (c == '\n' || c == '\r' || (is_str(self) && (c == '\v' || c == '\f' || (c >= 0x1c && c <= 0x1e))))
        {
            eol = 1;
        }
        if (eol == 0)
        {
            ++i;
            continue;
        }
        lines.push_back(wrap_text(self, text.substr(start, (keepends ? i + eol : i) - start)));
        i += eol;
        start = i;
    }
    if (start < text.size())
    {
        lines.push_back(wrap_text(self, text.substr(start)));
    }
    return make_list(std::move(lines));
}

Value strip_impl(const Value& self, CallArgs& args, const char* function, bool left, bool right)
{
    expect_positional(args, function, 0, 1);
    const auto points = points_of(self, Text::of(self).data);
    std::vector<std::uint32_t> chars;
    const bool whitespace = args.positional.empty() || args.positional[0].is_none();
    if (!whitespace)
    {
        chars = points_of(self, text_arg(self, args.positional[0], function));
    }
    auto strip_it = [&](std::uint32_t c) {
        return whitespace ? is_space(c) : std::find(chars.begin(), chars.end(), c) != chars.end();
    };
    std::size_t begin = 0;
    std::size_t end = points.size();
    while (left && begin < end && strip_it(points[begin]))
    {
        ++begin;
    }
    while (right && end > begin && strip_it(points[end - 1]))
    {
        --end;
    }
    return wrap_text(self, encode_points(self, std::vector<std::uint32_t>(
                                                   points.begin() + static_cast<std::ptrdiff_t>(begin),
                                                   points.begin() + static_cast<std::ptrdiff_t>(end))));
}

Value text_strip(Interpreter&, const Value& self, CallArgs& args)
{
    return strip_impl(self, args, "strip", true, true);
}

Value text_lstrip(Interpreter&, const Value& self, CallArgs& args)
{
    return strip_impl(self, args, "lstrip", true, false);
}

Value text_rstrip(Interpreter&, const Value& self, CallArgs& args)
{
    return strip_impl(self, args, "rstrip", false, true);
}

template <typename F> Value map_points(const Value& self, CallArgs& args, const char* function, F f)
{
    expect_positional(args, function, 0, 0);
    auto points = points_of(self, Text::of(self).data);
    const bool unicode = is_str(self);
    for (std::size_t i = 0; i < points.size(); ++i)
    {
        if (unicode || points[i] < 0x80)
        {
            points[i] = f(points, i);
        }
    }
    return wrap_text(self, encode_points(self, points));
}

Value text_upper(Interpreter&, const Value& self, CallArgs& args)
{
    return map_points(self, args, "upper", [](const auto& p, std::size_t i) { return to_upper(p[i]); });
}

Value text_lower(Interpreter&, const Value& self, CallArgs& args)
{
    return map_points(self, args, "lower", [](const auto& p, std::size_t i) { return to_lower(p[i]); });
}

Value text_swapcase(Interpreter&, const Value& self, CallArgs& args)
{
    return map_points(self, args, "swapcase", [](const auto& p, std::size_t i) {
        return is_upper(p[i]) ? to_lower(p[i]) : to_upper(p[i]);
    });
}

Value text_capitalize(Interpreter&, const Value& self, CallArgs& args)
{
    return map_points(self, args, "capitalize",
                      [](const auto& p, std::size_t i) { return i == 0 ? to_upper(p[i]) : to_lower(p[i]); });
}

Value text_title(Interpreter&, const Value& self, CallArgs& args)
{
    return map_points(self, args, "title", [](const auto& p, std::size_t i) {
        const bool after_cased = i > 0 && (is_upper(p[i - 1]) || is_lower(p[i - 1]));
        return after_cased ? to_lower(p[i]) : to_upper(p[i]);
    });
}

template <typename Pred> Value all_points(const Value& self, CallArgs& args, const char* function, Pred pred)
{
    expect_positional(args, function, 0, 0);
    const auto points = points_of(self, Text::of(self).data);
    if (points.empty())
    {
        return Value::boolean(false);
    }
    return Value::boolean(std::all_of(points.begin(), points.end(), pred));
}

Value text_isdigit(Interpreter&, const Value& self, CallArgs& args)
{
    return all_points(self, args, "isdigit", is_digit);
}

Value text_isalpha(Interpreter&, const Value& self, CallArgs& args)
{
    const bool unicode = is_str(self);
    return all_points(self, args, "isalpha", [unicode](std::uint32_t c) { return is_alpha(c, unicode); });
}

Value text_isalnum(Interpreter&, const Value& self, CallArgs& args)
{
    const bool unicode = is_str(self);
    return all_points(self, args, "isalnum",
                      [unicode](std::uint32_t c) { return is_digit(c) || is_alpha(c, unicode); });
}

Value text_isspace(Interpreter&, const Value& self, CallArgs& args)
{
    return all_points(self, args, "isspace", is_space);
}

Value text_isascii(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "isascii", 0, 0);
    const std::string& text = Text::of(self).data;
    return Value::boolean(std::all_of(text.begin(), text.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; }));
}

Value cased_check(const Value& self, CallArgs& args, const char* function, bool want_upper)
{
    expect_positional(args, function, 0, 0);
    bool cased = false;
    for (const auto c : points_of(self, Text::of(self).data))
    {
        if (want_upper ? is_lower(c) : is_upper(c))
        {
            return Value::boolean(false);
        }
        cased = cased || (want_upper ? is_upper(c) : is_lower(c));
    }
    return Value::boolean(cased);
}

Value text_isupper(Interpreter&, const Value& self, CallArgs& args)
{
    return cased_check(self, args, "isupper", true);
}

Value text_islower(Interpreter&, const Value& self, CallArgs& args)
{
    return cased_check(self, args, "islower", false);
}

Value str_istitle(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "istitle", 0, 0);
    bool previous_cased = false;
    bool any = false;
    for (const auto c : points_of(self, Text::of(self).data))
    {
        if (is_upper(c))
        {
            if (previous_cased)
            {
                return Value::boolean(false);
            }
            previous_cased = true;
            any = true;
        }
        else if (is_lower(c))
        {
            if (!previous_cased)
            {
                return Value::boolean(false);
            }
            previous_cased = true;
            any = true;
        }
        else
        {
            previous_cased = false;
        }
    }
    return Value::boolean(any);
}

Value str_isidentifier(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "isidentifier", 0, 0);
    const auto points = points_of(self, Text::of(self).data);
    if (points.empty() || is_digit(points[0]))
    {
        return Value::boolean(false);
    }
    return Value::boolean(std::all_of(points.begin(), points.end(), [](std::uint32_t c) {
        return c == '_' || is_digit(c) || is_alpha(c, true);
    }));
}

Value pad(const Value& self, CallArgs& args, const char* function, int align)
{
    expect_positional(args, function, 1, 2);
    const std::int64_t width = int_arg(args.positional[0], function);
    std::uint32_t fill = ' ';
    if (args.positional.size() == 2)
    {
        const auto fill_points = points_of(self, text_arg(self, args.positional[1], function));
        if (fill_points.size() != 1)
        {
            raise("TypeError", is_str(self) ? std::string("The fill character must be exactly one character long")
                                            : std::string(function) + "() argument 2 must be a byte string of length 1");
        }
        fill = fill_points[0];
    }
    const Text text = Text::of(self);
    if (width <= static_cast<std::int64_t>(text.length))
    {
        return self;
    }
    const auto total = static_cast<std::size_t>(width) - text.length;
    check_allocation(total, 4);
    std::size_t left = 0;
    if (align == 0)
    {
        left = total / 2 + (total & static_cast<std::size_t>(width) & 1);
    }
    else if (align > 0)
    {
        left = total;
    }
    const std::string fill_text = encode_points(self, std::vector<std::uint32_t>(1, fill));
    std::string out;
    for (std::size_t i = 0; i < left; ++i)
    {
        out += fill_text;
    }
    out += text.data;
    for (std::size_t i = left; i < total; ++i)
    {
        out += fill_text;
    }
    return wrap_text(self, std::move(out));
}

Value text_center(Interpreter&, const Value& self, CallArgs& args)
{
    return pad(self, args, "center", 0);
}

Value text_ljust(Interpreter&, const Value& self, CallArgs& args)
{
    return pad(self, args, "ljust", -1);
}

Value text_rjust(Interpreter&, const Value& self, CallArgs& args)
{
    return pad(self, args, "rjust", 1);
}

Value text_zfill(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "zfill", 1, 1);
    const std::int64_t width = int_arg(args.positional[0], "zfill");
    const Text text = Text::of(self);
    if (width <= static_cast<std::int64_t>(text.length))
    {
        return self;
    }
    const auto fill = static_cast<std::size_t>(width) - text.length;
    check_allocation(fill);
    std::string out = text.data;
    const std::size_t at = !out.empty() && (out[0] == '+' || out[0] == '-') ? 1 : 0;
    out.insert(at, fill, '0');
    return wrap_text(self, std::move(out));
}

Value partition_impl(const Value& self, CallArgs& args, const char* function, bool reverse)
{
    expect_positional(args, function, 1, 1);
    const std::string& text = Text::of(self).data;
    const std::string& sep = text_arg(self, args.positional[0], function);
    if (sep.empty())
    {
        raise("ValueError", "empty separator");
    }
    const std::size_t at = reverse ? text.rfind(sep) : text.find(sep);
    if (at == std::string::npos)
    {
        Value empty = wrap_text(self, "");
        return reverse ? make_tuple({empty, empty, self}) : make_tuple({self, empty, empty});
    }
    return make_tuple({wrap_text(self, text.substr(0, at)), wrap_text(self, sep),
                       wrap_text(self, text.substr(at + sep.size()))});
}

Value text_partition(Interpreter&, const Value& self, CallArgs& args)
{
    return partition_impl(self, args, "partition", false);
}

Value text_rpartition(Interpreter&, const Value& self, CallArgs& args)
{
    return partition_impl(self, args, "rpartition", true);
}

Value text_removeprefix(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "removeprefix", 1, 1);
    const std::string& text = Text::of(self).data;
    const std::string& prefix = text_arg(self, args.positional[0], "removeprefix");
    if (text.compare(0, prefix.size(), prefix) == 0)
    {
        return wrap_text(self, text.substr(prefix.size()));
    }
    return self;
}

Value text_removesuffix(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "removesuffix", 1, 1);
    const std::string& text = Text::of(self).data;
    const std::string& suffix = text_arg(self, args.positional[0], "removesuffix");
    if (!suffix.empty() && text.size() >= suffix.size() &&
        text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0)
    {
        return wrap_text(self, text.substr(0, text.size() - suffix.size()));
    }
    return self;
}

Value text_expandtabs(Interpreter&, const Value& self, CallArgs& args)
{
    auto bound = bind_native(args, "expandtabs", {"tabsize"}, 0);
    const std::int64_t tabsize = bound[0].has_value() ? int_arg(*bound[0], "expandtabs") : 8;
    std::vector<std::uint32_t> out;
    std::int64_t column = 0;
    for (const auto c : points_of(self, Text::of(self).data))
    {
        if (c == '\t')
        {
            if (tabsize > 0)
            {
                const std::int64_t spaces = tabsize - column % tabsize;
                check_allocation(out.size() + static_cast<std::size_t>(spaces), 4);
                out.insert(out.end(), static_cast<std::size_t>(spaces), ' ');
                column += spaces;
            }
            continue;
        }
        out.push_back(c);
        column = (c == '\n' || c == '\r') ? 0 : column + 1;
    }
    return wrap_text(self, encode_points(self, out));
}

Value text_join(Interpreter& interp, const Value& self, CallArgs& args)
{
    expect_positional(args, "join", 1, 1);
    if (is_str(self))
    {
        return make_str(join_strings(interp, self.as<StrObject>()->value, args.positional[0]));
    }
    const std::string& sep = self.as<BytesObject>()->value;
    std::string out;
    std::size_t index = 0;
    Value iterator = make_iter(args.positional[0]);
    while (auto item = interp.next(iterator))
    {
        const auto* b = item->as<BytesObject>();
        if (b == nullptr)
        {
            raise("TypeError", "sequence item " + std::to_string(index) + ": expected a bytes-like object, " +
                                   type_name(*item) + " found");
        }
        if (index > 0)
        {
            out += sep;
        }
        check_allocation(out.size() + b->value.size());
        out += b->value;
        ++index;
    }
    return make_bytes(std::move(out));
}

Value str_encode(Interpreter&, const Value& self, CallArgs& args)
{
    auto bound = bind_native(args, "encode", {"encoding", "errors"}, 0);
    if (bound[0].has_value())
    {
        std::string name = str_arg(*bound[0], "encode");
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "ascii")
        {
            const auto points = utf8_decode(self.as<StrObject>()->value);
            auto bad = std::find_if(points.begin(), points.end(), [](std::uint32_t c) { return c >= 0x80; });
            if (bad != points.end())
            {
                raise("UnicodeEncodeError", "'ascii' codec can't encode character in position " +
                                                std::to_string(bad - points.begin()) + ": ordinal not in range(128)");
            }
        }
        else if (name != "utf-8" && name != "utf8")
        {
            raise("LookupError", "unknown encoding: " + str_arg(*bound[0], "encode"));
        }
    }
    return make_bytes(self.as<StrObject>()->value);
}

// --- str.format ---

Value resolve_field(Interpreter& interp, std::string_view field, CallArgs& args, std::size_t& auto_index,
                    int& numbering, const Value* mapping)
{
    std::size_t end = field.find_first_of(".[");
    const std::string_view head = field.substr(0, end);
    Value value;
    if (head.empty() || std::all_of(head.begin(), head.end(), [](char c) { return c >= '0' && c <= '9'; }))
    {
        std::size_t index = 0;
        if (head.empty())
        {
            if (numbering == 2)
            {
                raise("ValueError", "cannot switch from manual field specification to automatic field numbering");
            }
            numbering = 1;
            index = auto_index++;
        }
        else
        {
            if (numbering == 1)
            {
                raise("ValueError", "cannot switch from automatic field numbering to manual field specification");
            }
            numbering = 2;
            index = static_cast<std::size_t>(std::stoull(std::string(head)));
        }
        if (mapping != nullptr || index >= args.positional.size())
        {
            raise("IndexError", "Replacement index " + std::to_string(index) +
                                    " out of range for positional args tuple");
        }
        value = args.positional[index];
    }
    else if (mapping != nullptr)
    {
        value = get_item(interp, *mapping, make_str(std::string(head)));
    }
    else
    {
        auto it = std::find_if(args.keywords.begin(), args.keywords.end(),
                               [&](const auto& kw) { return kw.first == head; });
        if (it == args.keywords.end())
        {
            raise_with_args("KeyError", {make_str(std::string(head))});
        }
        value = it->second;
    }

    while (end != std::string_view::npos && end < field.size())
    {
        if (field[end] == '.')
        {
            const std::size_t next = field.find_first_of(".[", end + 1);
            const std::string_view attr = field.substr(end + 1, next == std::string_view::npos ? next : next - end - 1);
            if (attr.empty())
            {
                raise("ValueError", "Empty attribute in format string");
            }
            value = interp.get_attribute(value, std::string(attr));
            end = next;
            continue;
        }
        const std::size_t close = field.find(']', end);
        if (close == std::string_view::npos)
        {
            raise("ValueError", "Missing ']' in format string");
        }
        const std::string key(field.substr(end + 1, close - end - 1));
        const bool numeric = !key.empty() && std::all_of(key.begin(), key.end(), [](char c) { return c >= '0' && c <= '9'; });
        value = get_item(interp, value,
                         numeric ? Value::integer(static_cast<std::int64_t>(std::stoll(key))) : make_str(key));
        end = close + 1;
        if (end < field.size() && field[end] != '.' && field[end] != '[')
        {
            raise("ValueError", "Only '.' or '[' may follow ']' in format field specifier");
        }
    }
    return value;
}

std::string format_template(Interpreter& interp, std::string_view fmt, CallArgs& args, const Value* mapping,
                            std::size_t& auto_index, int& numbering, int depth)
{
    if (depth > 2)
    {
        raise("ValueError", "Max string recursion exceeded");
    }
    std::string out;
    std::size_t i = 0;
    while (i < fmt.size())
    {
        const char c = fmt[i];
        if (c == '}')
        {
            if (i + 1 < fmt.size() && fmt[i + 1] == '}')
            {
                out += '}';
                i += 2;
                continue;
            }
            raise("ValueError", "Single '}' encountered in format string");
        }
        if (c != '{')
        {
            out += c;
            ++i;
            continue;
        }
        if (i + 1 < fmt.size() && fmt[i + 1] == '{')
        {
            out += '{';
            i += 2;
            continue;
        }
        // Find the matching close brace, allowing one level of nesting inside the spec.
        std::size_t j = i + 1;
        int nesting = 1;
        while (j < fmt.size() && nesting > 0)
        {
            if (fmt[j] == '{')
            {
                ++nesting;
            }
            else if (fmt[j] == '}')
            {
                --nesting;
            }
            if (nesting > 0)
            {
                ++j;
            }
        }
        if (j >= fmt.size())
        {
            raise("ValueError", "Single '{' encountered in format string");
        }
        std::string_view inner = fmt.substr(i + 1, j - i - 1);
        i = j + 1;

        std::string_view spec;
        char conversion = 0;
        std::size_t bracket = 0;
        std::size_t split = std::string_view::npos;
        for (std::size_t k = 0; k < inner.size(); ++k)
        {
            if (inner[k] == '[')
            {
                ++bracket;
            }
            else if (inner[k] == ']' && bracket > 0)
            {
                --bracket;
            }
            else if (bracket == 0 && (inner[k] == '!' || inner[k] == ':'))
            {
                split = k;
                break;
            }
        }
        std::string_view field = inner.substr(0, split);
        if (split != std::string_view::npos)
        {
            std::string_view rest = inner.substr(split);
            if (rest[0] == '!')
            {
                if (rest.size() < 2 || (rest.size() > 2 && rest[2] != ':'))
                {
                    raise("ValueError", "expected ':' after conversion specifier");
                }
                conversion = rest[1];
                rest.remove_prefix(2);
            }
            if (!rest.empty())
            {
                spec = rest.substr(1);
            }
        }

        Value value = resolve_field(interp, field, args, auto_index, numbering, mapping);
        if (conversion == 'r' || conversion == 'a')
        {
            value = make_str(repr(value));
        }
        else if (conversion == 's')
        {
            value = make_str(to_str(value));
        }
        else if (conversion != 0)
        {
            raise("ValueError", std::string("Unknown conversion specifier ") + conversion);
        }
        std::string resolved_spec(spec);
        if (resolved_spec.find('{') != std::string::npos)
        {
            resolved_spec = format_template(interp, spec, args, mapping, auto_index, numbering, depth + 1);
        }
        out += format_value(value, resolved_spec);
        check_allocation(out.size());
    }
    return out;
}

Value str_format(Interpreter& interp, const Value& self, CallArgs& args)
{
    std::size_t auto_index = 0;
    int numbering = 0;
    return make_str(format_template(interp, self.as<StrObject>()->value, args, nullptr, auto_index, numbering, 0));
}

Value str_format_map(Interpreter& interp, const Value& self, CallArgs& args)
{
    expect_positional(args, "format_map", 1, 1);
    const Value mapping = args.positional[0];
    CallArgs empty;
    std::size_t auto_index = 0;
    int numbering = 0;
    return make_str(format_template(interp, self.as<StrObject>()->value, empty, &mapping, auto_index, numbering, 0));
}

// --- bytes ---

Value bytes_decode(Interpreter&, const Value& self, CallArgs& args)
{
    auto bound = bind_native(args, "decode", {"encoding", "errors"}, 0);
    const std::string& data = self.as<BytesObject>()->value;
    std::string errors = bound[1].has_value() ? str_arg(*bound[1], "decode") : "strict";
    if (bound[0].has_value())
    {
        std::string name = str_arg(*bound[0], "decode");
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name != "utf-8" && name != "utf8" && name != "ascii")
        {
            raise("LookupError", "unknown encoding: " + str_arg(*bound[0], "decode"));
        }
    }
    if (utf8_valid(data))
    {
        return make_str(data);
    }
    if (errors == "replace")
    {
        std::string out;
        for (const auto cp : utf8_decode(data))
        {
            cinder::parser::append_utf8(out, cp);
        }
        return make_str(std::move(out));
    }
    if (errors == "ignore")
    {
        std::string out;
        for (const auto cp : utf8_decode(data))
        {
            if (cp != 0xfffd)
            {
                cinder::parser::append_utf8(out, cp);
            }
        }
        return make_str(std::move(out));
    }
    raise("UnicodeDecodeError", "'utf-8' codec can't decode bytes: invalid utf-8 data");
}

Value bytes_hex(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "hex", 0, 0);
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    for (const char c : self.as<BytesObject>()->value)
    {
        const auto b = static_cast<unsigned char>(c);
        out += kDigits[b >> 4];
        out += kDigits[b & 0xf];
    }
    return make_str(std::move(out));
}

// --- sequences ---

std::size_t find_value(Interpreter& interp, const std::vector<Value>& items, CallArgs& args, const char* function,
                       const std::string& missing)
{
    expect_positional(args, function, 1, 3);
    auto [start, end] = clamp_range(args.positional, 1, items.size());
    for (std::size_t i = start; i < end && i < items.size(); ++i)
    {
        interp.tick();
        if (values_equal(items[i], args.positional[0]))
        {
            return i;
        }
    }
    raise("ValueError", missing);
}

std::int64_t count_value(Interpreter& interp, const std::vector<Value>& items, CallArgs& args, const char* function)
{
    expect_positional(args, function, 1, 1);
    std::int64_t n = 0;
    for (const auto& item : items)
    {
        interp.tick();
        if (values_equal(item, args.positional[0]))
        {
            ++n;
        }
    }
    return n;
}

std::vector<Value>& list_items(const Value& self)
{
    return self.as<ListObject>()->items;
}

Value list_append(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "append", 1, 1);
    auto& items = list_items(self);
    check_allocation(items.size() + 1, sizeof(Value));
    items.push_back(args.positional[0]);
    recharge(self);
    return Value::none();
}

Value list_extend(Interpreter& interp, const Value& self, CallArgs& args)
{
    expect_positional(args, "extend", 1, 1);
    std::vector<Value> extra = interp.collect(args.positional[0]);
    auto& items = list_items(self);
    check_allocation(items.size() + extra.size(), sizeof(Value));
    items.insert(items.end(), std::make_move_iterator(extra.begin()), std::make_move_iterator(extra.end()));
    recharge(self);
    return Value::none();
}

Value list_insert(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "insert", 2, 2);
    auto& items = list_items(self);
    std::int64_t index = to_index(args.positional[0]);
    const auto n = static_cast<std::int64_t>(items.size());
    if (index < 0)
    {
        index = std::max<std::int64_t>(0, index + n);
    }
    index = std::min(index, n);
    check_allocation(items.size() + 1, sizeof(Value));
    items.insert(items.begin() + index, args.positional[1]);
    recharge(self);
    return Value::none();
}

Value list_pop(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "pop", 0, 1);
    auto& items = list_items(self);
    if (items.empty())
    {
        raise("IndexError", "pop from empty list");
    }
    const std::int64_t index = args.positional.empty() ? -1 : to_index(args.positional[0]);
    const std::size_t at = normalize_index(index, items.size(), "pop");
    Value out = std::move(items[at]);
    items.erase(items.begin() + static_cast<std::ptrdiff_t>(at));
    recharge(self);
    return out;
}

Value list_remove(Interpreter& interp, const Value& self, CallArgs& args)
{
    expect_positional(args, "remove", 1, 1);
    auto& items = list_items(self);
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        interp.tick();
        if (values_equal(items[i], args.positional[0]))
        {
            items.erase(items.begin() + static_cast<std::ptrdiff_t>(i));
            recharge(self);
            return Value::none();
        }
    }
    raise("ValueError", "list.remove(x): x not in list");
}

Value list_index(Interpreter& interp, const Value& self, CallArgs& args)
{
    const std::string missing = args.positional.empty() ? "" : repr(args.positional[0]) + " is not in list";
    return Value::integer(static_cast<std::int64_t>(find_value(interp, list_items(self), args, "index", missing)));
}

Value list_count(Interpreter& interp, const Value& self, CallArgs& args)
{
    return Value::integer(count_value(interp, list_items(self), args, "count"));
}

Value list_clear(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "clear", 0, 0);
    // Move the items out first so destructors never observe a half-cleared list.
    std::vector<Value> doomed;
    doomed.swap(list_items(self));
    recharge(self);
    return Value::none();
}

Value list_copy(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "copy", 0, 0);
    return make_list(list_items(self));
}

Value list_reverse(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "reverse", 0, 0);
    auto& items = list_items(self);
    std::reverse(items.begin(), items.end());
    return Value::none();
}

Value list_sort(Interpreter& interp, const Value& self, CallArgs& args)
{
    if (!args.positional.empty())
    {
        raise("TypeError", "sort() takes no positional arguments");
    }
    auto bound = bind_native(args, "sort", {"key", "reverse"}, 0);
    std::vector<Value> items = list_items(self);
    sort_values(interp, items, bound[0].value_or(Value::none()), bound[1].has_value() && truthy(*bound[1]));
    list_items(self) = std::move(items);
    return Value::none();
}

Value tuple_index(Interpreter& interp, const Value& self, CallArgs& args)
{
    return Value::integer(static_cast<std::int64_t>(
        find_value(interp, self.as<TupleObject>()->items, args, "index", "tuple.index(x): x not in tuple")));
}

Value tuple_count(Interpreter& interp, const Value& self, CallArgs& args)
{
    return Value::integer(count_value(interp, self.as<TupleObject>()->items, args, "count"));
}

std::optional<std::int64_t> range_position(const RangeObject& range, const Value& v)
{
    if (!v.is_integral())
    {
        return std::nullopt;
    }
    const std::int64_t x = v.integral();
    const std::int64_t n = range.size();
    if (n == 0)
    {
        return std::nullopt;
    }
    const std::int64_t offset = x - range.start;
    if (offset % range.step != 0)
    {
        return std::nullopt;
    }
    const std::int64_t index = offset / range.step;
    if (index < 0 || index >= n)
    {
        return std::nullopt;
    }
    return index;
}

Value range_index(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "index", 1, 1);
    auto at = range_position(*self.as<RangeObject>(), args.positional[0]);
    if (!at)
    {
        raise("ValueError", repr(args.positional[0]) + " is not in range");
    }
    return Value::integer(*at);
}

Value range_count(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "count", 1, 1);
    return Value::integer(range_position(*self.as<RangeObject>(), args.positional[0]) ? 1 : 0);
}

// --- array ---

ArrayObject& array_of(const Value& self)
{
    return *self.as<ArrayObject>();
}

Value array_append(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "append", 1, 1);
    auto& array = array_of(self);
    Value item = check_array_item(array, args.positional[0]);
    check_allocation(array.items.size() + 1, sizeof(Value));
    array.items.push_back(std::move(item));
    recharge(self);
    return Value::none();
}

Value array_extend(Interpreter& interp, const Value& self, CallArgs& args)
{
    expect_positional(args, "extend", 1, 1);
    auto& array = array_of(self);
    if (const auto* other = args.positional[0].as<ArrayObject>(); other != nullptr && other->typecode != array.typecode)
    {
        raise("TypeError", "can only extend with array of same kind");
    }
    std::vector<Value> extra = interp.collect(args.positional[0]);
    for (auto& item : extra)
    {
        item = check_array_item(array, item);
    }
    check_allocation(array.items.size() + extra.size(), sizeof(Value));
    array.items.insert(array.items.end(), extra.begin(), extra.end());
    recharge(self);
    return Value::none();
}

Value array_insert(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "insert", 2, 2);
    auto& array = array_of(self);
    std::int64_t index = to_index(args.positional[0]);
    const auto n = static_cast<std::int64_t>(array.items.size());
    if (index < 0)
    {
        index = std::max<std::int64_t>(0, index + n);
    }
    index = std::min(index, n);
    Value item = check_array_item(array, args.positional[1]);
    array.items.insert(array.items.begin() + index, std::move(item));
    recharge(self);
    return Value::none();
}

Value array_pop(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "pop", 0, 1);
    auto& items = array_of(self).items;
    if (items.empty())
    {
        raise("IndexError", "pop from empty array");
    }
    const std::int64_t index = args.positional.empty() ? -1 : to_index(args.positional[0]);
    const std::size_t at = normalize_index(index, items.size(), "pop");
    Value out = items[at];
    items.erase(items.begin() + static_cast<std::ptrdiff_t>(at));
    recharge(self);
    return out;
}

Value array_remove(Interpreter& interp, const Value& self, CallArgs& args)
{
    auto& items = array_of(self).items;
    const std::size_t at = find_value(interp, items, args, "remove", "array.remove(x): x not in array");
    items.erase(items.begin() + static_cast<std::ptrdiff_t>(at));
    recharge(self);
    return Value::none();
}

Value array_index(Interpreter& interp, const Value& self, CallArgs& args)
{
    return Value::integer(static_cast<std::int64_t>(
        find_value(interp, array_of(self).items, args, "index", "array.index(x): x not in array")));
}

Value array_count(Interpreter& interp, const Value& self, CallArgs& args)
{
    return Value::integer(count_value(interp, array_of(self).items, args, "count"));
}

Value array_reverse(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "reverse", 0, 0);
    auto& items = array_of(self).items;
    std::reverse(items.begin(), items.end());
    return Value::none();
}

Value array_tolist(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "tolist", 0, 0);
    return make_list(array_of(self).items);
}

// --- dict ---

HashTable& dict_table(const Value& self)
{
    return self.as<DictObject>()->table;
}

Value dict_view(const Value& self, CallArgs& args, const char* function, DictViewObject::Which which)
{
    expect_positional(args, function, 0, 0);
    return make_dict_view(self.shared<DictObject>(), which);
}

Value dict_keys(Interpreter&, const Value& self, CallArgs& args)
{
    return dict_view(self, args, "keys", DictViewObject::Which::Keys);
}

Value dict_values(Interpreter&, const Value& self, CallArgs& args)
{
    return dict_view(self, args, "values", DictViewObject::Which::Values);
}

Value dict_items(Interpreter&, const Value& self, CallArgs& args)
{
    return dict_view(self, args, "items", DictViewObject::Which::Items);
}

Value dict_get(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "get", 1, 2);
    if (const auto* entry = dict_table(self).find(args.positional[0]))
    {
        return entry->value;
    }
    return args.positional.size() == 2 ? args.positional[1] : Value::none();
}

Value dict_pop(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "pop", 1, 2);
    auto& table = dict_table(self);
    if (const auto* entry = table.find(args.positional[0]))
    {
        Value out = entry->value;
        table.erase(args.positional[0]);
        recharge(self);
        return out;
    }
    if (args.positional.size() == 2)
    {
        return args.positional[1];
    }
    raise_with_args("KeyError", {args.positional[0]});
}

Value dict_popitem(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "popitem", 0, 0);
    auto& table = dict_table(self);
    const auto& entries = table.entries();
    for (auto it = entries.rbegin(); it != entries.rend(); ++it)
    {
        if (it->live)
        {
            Value key = it->key;
            Value value = it->value;
            table.erase(key);
            recharge(self);
            return make_tuple({std::move(key), std::move(value)});
        }
    }
    raise("KeyError", "popitem(): dictionary is empty");
}

Value dict_setdefault(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "setdefault", 1, 2);
    auto& table = dict_table(self);
    if (const auto* entry = table.find(args.positional[0]))
    {
        return entry->value;
    }
    Value fallback = args.positional.size() == 2 ? args.positional[1] : Value::none();
    table.insert(args.positional[0], fallback);
    recharge(self);
    return fallback;
}

Value dict_update(Interpreter& interp, const Value& self, CallArgs& args)
{
    if (args.positional.size() > 1)
    {
        raise("TypeError", "update expected at most 1 argument, got " + std::to_string(args.positional.size()));
    }
    auto& table = dict_table(self);
    if (!args.positional.empty())
    {
        update_dict(interp, table, args.positional[0]);
    }
    for (auto& [name, value] : args.keywords)
    {
        table.insert(make_str(name), std::move(value));
    }
    recharge(self);
    return Value::none();
}

Value dict_clear(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "clear", 0, 0);
    HashTable doomed;
    std::swap(doomed, dict_table(self));
    recharge(self);
    return Value::none();
}

Value dict_copy(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "copy", 0, 0);
    check_allocation(dict_table(self).footprint());
    Value copy = make_dict();
    dict_table(copy) = dict_table(self);
    recharge(copy);
    return copy;
}

Value dict_fromkeys(Interpreter& interp, CallArgs& args)
{
    expect_positional(args, "fromkeys", 1, 2);
    Value out = make_dict();
    auto& table = dict_table(out);
    const Value fill = args.positional.size() == 2 ? args.positional[1] : Value::none();
    Value iterator = make_iter(args.positional[0]);
    while (auto key = interp.next(iterator))
    {
        table.insert(*key, fill);
    }
    recharge(out);
    return out;
}

// --- set ---

HashTable& set_table(const Value& self)
{
    return self.as<SetObject>()->table;
}

/** @brief Keys of any iterable as a temporary table. */
HashTable table_from(Interpreter& interp, const Value& iterable)
{
    if (const auto* set = iterable.as<SetObject>())
    {
        return set->table;
    }
    HashTable out;
    Value iterator = make_iter(iterable);
    while (auto item = interp.next(iterator))
    {
        out.insert(*item, Value::none());
    }
    return out;
}

Value set_add(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "add", 1, 1);
    if (set_table(self).insert(args.positional[0], Value::none()))
    {
        recharge(self);
    }
    return Value::none();
}

Value set_remove(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "remove", 1, 1);
    if (!set_table(self).erase(args.positional[0]))
    {
        raise_with_args("KeyError", {args.positional[0]});
    }
    recharge(self);
    return Value::none();
}

Value set_discard(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "discard", 1, 1);
    if (set_table(self).erase(args.positional[0]))
    {
        recharge(self);
    }
    return Value::none();
}

Value set_pop(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "pop", 0, 0);
    auto& table = set_table(self);
    for (const auto& entry : table.entries())
    {
        if (entry.live)
        {
            Value key = entry.key;
            table.erase(key);
            recharge(self);
            return key;
        }
    }
    raise("KeyError", "pop from an empty set");
}

Value set_clear(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "clear", 0, 0);
    HashTable doomed;
    std::swap(doomed, set_table(self));
    recharge(self);
    return Value::none();
}

Value set_copy(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "copy", 0, 0);
    check_allocation(set_table(self).footprint());
    Value copy = make_set();
    set_table(copy) = set_table(self);
    recharge(copy);
    return copy;
}

enum class SetOp
{
    Union,
    Intersection,
    Difference,
    Symmetric,
};

HashTable combine(Interpreter& interp, const HashTable& base, const std::vector<Value>& others, SetOp op)
{
    HashTable result = base;
    for (const auto& other_value : others)
    {
        const HashTable other = table_from(interp, other_value);
        switch (op)
        {
        case SetOp::Union:
            for (const auto& e : other.entries())
            {
                if (e.live)
                {
                    result.insert(e.key, Value::none());
                }
            }
            break;
        case SetOp::Intersection: {
            HashTable kept;
            for (const auto& e : result.entries())
            {
                if (e.live && other.find(e.key) != nullptr)
                {
                    kept.insert(e.key, Value::none());
                }
            }
            result = std::move(kept);
            break;
        }
        case SetOp::Difference:
            for (const auto& e : other.entries())
            {
                if (e.live)
                {
                    result.erase(e.key);
                }
            }
            break;
        case SetOp::Symmetric:
            for (const auto& e : other.entries())
            {
                if (e.live && !result.erase(e.key))
                {
                    result.insert(e.key, Value::none());
                }
            }
            break;
        }
        check_allocation(result.footprint());
    }
    return result;
}

Value set_combine(Interpreter& interp, const Value& self, CallArgs& args, const char* function, SetOp op)
{
    reject_keywords(args, function);
    if (op == SetOp::Symmetric)
    {
        expect_positional(args, function, 1, 1);
    }
    Value out = make_set();
    set_table(out) = combine(interp, set_table(self), args.positional, op);
    recharge(out);
    return out;
}

Value set_combine_update(Interpreter& interp, const Value& self, CallArgs& args, const char* function, SetOp op)
{
    reject_keywords(args, function);
    if (op == SetOp::Symmetric)
    {
        expect_positional(args, function, 1, 1);
    }
    set_table(self) = combine(interp, set_table(self), args.positional, op);
    recharge(self);
    return Value::none();
}

Value set_union(Interpreter& interp, const Value& self, CallArgs& args)
{
    return set_combine(interp, self, args, "union", SetOp::Union);
}

Value set_intersection(Interpreter& interp, const Value& self, CallArgs& args)
{
    return set_combine(interp, self, args, "intersection", SetOp::Intersection);
}

Value set_difference(Interpreter& interp, const Value& self, CallArgs& args)
{
    return set_combine(interp, self, args, "difference", SetOp::Difference);
}

Value set_symmetric_difference(Interpreter& interp, const Value& self, CallArgs& args)
{
    return set_combine(interp, self, args, "symmetric_difference", SetOp::Symmetric);
}

Value set_update(Interpreter& interp, const Value& self, CallArgs& args)
{
    return set_combine_update(interp, self, args, "update", SetOp::Union);
}

Value set_intersection_update(Interpreter& interp, const Value& self, CallArgs& args)
{
    return set_combine_update(interp, self, args, "intersection_update", SetOp::Intersection);
}

Value set_difference_update(Interpreter& interp, const Value& self, CallArgs& args)
{
    return set_combine_update(interp, self, args, "difference_update", SetOp::Difference);
}

Value set_symmetric_difference_update(Interpreter& interp, const Value& self, CallArgs& args)
{
    return set_combine_update(interp, self, args, "symmetric_difference_update", SetOp::Symmetric);
}

bool all_in(const HashTable& items, const HashTable& container)
{
    for (const auto& e : items.entries())
    {
        if (e.live && container.find(e.key) == nullptr)
        {
            return false;
        }
    }
    return true;
}

Value set_issubset(Interpreter& interp, const Value& self, CallArgs& args)
{
    expect_positional(args, "issubset", 1, 1);
    return Value::boolean(all_in(set_table(self), table_from(interp, args.positional[0])));
}

Value set_issuperset(Interpreter& interp, const Value& self, CallArgs& args)
{
    expect_positional(args, "issuperset", 1, 1);
    return Value::boolean(all_in(table_from(interp, args.positional[0]), set_table(self)));
}

Value set_isdisjoint(Interpreter& interp, const Value& self, CallArgs& args)
{
    expect_positional(args, "isdisjoint", 1, 1);
    const HashTable other = table_from(interp, args.positional[0]);
    for (const auto& e : set_table(self).entries())
    {
        if (e.live && other.find(e.key) != nullptr)
        {
            return Value::boolean(false);
        }
    }
    return Value::boolean(true);
}

// --- numbers ---

Value int_bit_length(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "bit_length", 0, 0);
    const std::int64_t v = self.integral();
    std::uint64_t magnitude = v < 0 ? 0 - static_cast<std::uint64_t>(v) : static_cast<std::uint64_t>(v);
    std::int64_t bits = 0;
    while (magnitude != 0)
    {
        ++bits;
        magnitude >>= 1;
    }
    return Value::integer(bits);
}

Value int_bit_count(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "bit_count", 0, 0);
    const std::int64_t v = self.integral();
    const std::uint64_t magnitude = v < 0 ? 0 - static_cast<std::uint64_t>(v) : static_cast<std::uint64_t>(v);
    return Value::integer(__builtin_popcountll(magnitude));
}

Value int_conjugate(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "conjugate", 0, 0);
    return Value::integer(self.integral());
}

Value int_as_integer_ratio(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "as_integer_ratio", 0, 0);
    return make_tuple({Value::integer(self.integral()), Value::integer(1)});
}

Value int_is_integer(Interpreter&, const Value&, CallArgs& args)
{
    expect_positional(args, "is_integer", 0, 0);
    return Value::boolean(true);
}

Value float_is_integer(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "is_integer", 0, 0);
    const double v = self.as_float();
    return Value::boolean(std::isfinite(v) && std::trunc(v) == v);
}

Value float_as_integer_ratio(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "as_integer_ratio", 0, 0);
    const double v = self.as_float();
    if (std::isinf(v))
    {
        raise("OverflowError", "cannot convert Infinity to integer ratio");
    }
    if (std::isnan(v))
    {
        raise("ValueError", "cannot convert NaN to integer ratio");
    }
    int exponent = 0;
    double mantissa = std::frexp(v, &exponent);
    for (int i = 0; i < 300 && mantissa != std::floor(mantissa); ++i)
    {
        mantissa *= 2.0;
        --exponent;
    }
    std::int64_t numerator = float_to_int(mantissa);
    std::int64_t denominator = 1;
    if (exponent > 0)
    {
        for (int i = 0; i < exponent; ++i)
        {
            numerator = checked_mul(numerator, 2);
        }
    }
    else
    {
        for (int i = 0; i < -exponent; ++i)
        {
            denominator = checked_mul(denominator, 2);
        }
    }
    const std::int64_t g = std::gcd(numerator, denominator);
    return make_tuple({Value::integer(numerator / g), Value::integer(denominator / g)});
}

Value float_conjugate(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "conjugate", 0, 0);
    return self;
}

Value complex_conjugate(Interpreter&, const Value& self, CallArgs& args)
{
    expect_positional(args, "conjugate", 0, 0);
    return Value::complex(std::conj(self.as_complex()));
}

// --- tables ---

const MethodTable& str_methods()
{
    static const MethodTable table = {
        {"capitalize", text_capitalize}, {"casefold", text_lower},
        {"center", text_center},         {"count", text_count},
        {"encode", str_encode},          {"endswith", text_endswith},
        {"expandtabs", text_expandtabs}, {"find", text_find},
        {"format", str_format},          {"format_map", str_format_map},
        {"index", text_index},           {"isalnum", text_isalnum},
        {"isalpha", text_isalpha},       {"isascii", text_isascii},
        {"isdecimal", text_isdigit},     {"isdigit", text_isdigit},
        {"isidentifier", str_isidentifier}, {"islower", text_islower},
        {"isnumeric", text_isdigit},     {"isspace", text_isspace},
        {"istitle", str_istitle},        {"isupper", text_isupper},
        {"join", text_join},             {"ljust", text_ljust},
        {"lower", text_lower},           {"lstrip", text_lstrip},
        {"partition", text_partition},   {"removeprefix", text_removeprefix},
        {"removesuffix", text_removesuffix}, {"replace", text_replace},
        {"rfind", text_rfind},           {"rindex", text_rindex},
        {"rjust", text_rjust},           {"rpartition", text_rpartition},
        {"rsplit", text_rsplit},         {"rstrip", text_rstrip},
        {"split", text_split},           {"splitlines", text_splitlines},
        {"startswith", text_startswith}, {"strip", text_strip},
        {"swapcase", text_swapcase},     {"title", text_title},
        {"upper", text_upper},           {"zfill", text_zfill},
    };
    return table;
}

const MethodTable& bytes_methods()
{
    static const MethodTable table = {
        {"center", text_center},         {"count", text_count},
        {"decode", bytes_decode},        {"endswith", text_endswith},
        {"find", text_find},             {"hex", bytes_hex},
        {"index", text_index},           {"isalnum", text_isalnum},
        {"isalpha", text_isalpha},       {"isdigit", text_isdigit},
        {"islower", text_islower},       {"isspace", text_isspace},
        {"isupper", text_isupper},       {"join", text_join},
        {"ljust", text_ljust},           {"lower", text_lower},
        {"lstrip", text_lstrip},         {"partition", text_partition},
        {"removeprefix", text_removeprefix}, {"removesuffix", text_removesuffix},
        {"replace", text_replace},       {"rfind", text_rfind},
        {"rindex", text_rindex},         {"rjust", text_rjust},
        {"rpartition", text_rpartition}, {"rsplit", text_rsplit},
        {"rstrip", text_rstrip},         {"split", text_split},
        {"splitlines", text_splitlines}, {"startswith", text_startswith},
        {"strip", text_strip},           {"upper", text_upper},
        {"zfill", text_zfill},
    };
    return table;
}

const MethodTable& list_methods()
{
    static const MethodTable table = {
        {"append", list_append}, {"clear", list_clear},   {"copy", list_copy},
        {"count", list_count},   {"extend", list_extend}, {"index", list_index},
        {"insert", list_insert}, {"pop", list_pop},       {"remove", list_remove},
        {"reverse", list_reverse}, {"sort", list_sort},
    };
    return table;
}

const MethodTable& tuple_methods()
{
    static const MethodTable table = {{"count", tuple_count}, {"index", tuple_index}};
    return table;
}

const MethodTable& range_methods()
{
    static const MethodTable table = {{"count", range_count}, {"index", range_index}};
    return table;
}

const MethodTable& array_methods()
{
    static const MethodTable table = {
        {"append", array_append}, {"count", array_count},   {"extend", array_extend},
        {"index", array_index},   {"insert", array_insert}, {"pop", array_pop},
        {"remove", array_remove}, {"reverse", array_reverse}, {"tolist", array_tolist},
    };
    return table;
}

const MethodTable& dict_methods()
{
    static const MethodTable table = {
        {"clear", dict_clear}, {"copy", dict_copy},     {"get", dict_get},
        {"items", dict_items}, {"keys", dict_keys},     {"pop", dict_pop},
        {"popitem", dict_popitem}, {"setdefault", dict_setdefault}, {"update", dict_update},
        {"values", dict_values},
    };
    return table;
}

const MethodTable& set_methods()
{
    static const MethodTable table = {
        {"add", set_add},
        {"clear", set_clear},
        {"copy", set_copy},
        {"difference", set_difference},
        {"difference_update", set_difference_update},
        {"discard", set_discard},
        {"intersection", set_intersection},
        {"intersection_update", set_intersection_update},
        {"isdisjoint", set_isdisjoint},
        {"issubset", set_issubset},
        {"issuperset", set_issuperset},
        {"pop", set_pop},
        {"remove", set_remove},
        {"symmetric_difference", set_symmetric_difference},
        {"symmetric_difference_update", set_symmetric_difference_update},
        {"union", set_union},
        {"update", set_update},
    };
    return table;
}

const MethodTable& int_methods()
{
    static const MethodTable table = {
        {"as_integer_ratio", int_as_integer_ratio}, {"bit_count", int_bit_count},
        {"bit_length", int_bit_length},             {"conjugate", int_conjugate},
        {"is_integer", int_is_integer},
    };
    return table;
}

const MethodTable& float_methods()
{
    static const MethodTable table = {
        {"as_integer_ratio", float_as_integer_ratio},
        {"conjugate", float_conjugate},
        {"is_integer", float_is_integer},
    };
    return table;
}

const MethodTable& complex_methods()
{
    static const MethodTable table = {{"conjugate", complex_conjugate}};
    return table;
}

const MethodTable* methods_for_type(std::string_view name)
{
    static const std::map<std::string, const MethodTable*, std::less<>> by_name = {
        {"str", &str_methods()},     {"bytes", &bytes_methods()}, {"list", &list_methods()},
        {"tuple", &tuple_methods()}, {"range", &range_methods()}, {"dict", &dict_methods()},
        {"set", &set_methods()},     {"int", &int_methods()},     {"bool", &int_methods()},
        {"float", &float_methods()}, {"complex", &complex_methods()},
    };
    auto it = by_name.find(name);
    return it == by_name.end() ? nullptr : it->second;
}

const MethodTable* methods_for(const Value& self)
{
    if (self.is_integral())
    {
        return &int_methods();
    }
    if (self.is_float())
    {
        return &float_methods();
    }
    if (self.is_complex())
    {
        return &complex_methods();
    }
    if (!self.is_object())
    {
        return nullptr;
    }
    switch (self.as_object()->kind)
    {
    case ObjectKind::Str:
        return &str_methods();
    case ObjectKind::Bytes:
        return &bytes_methods();
    case ObjectKind::List:
        return &list_methods();
    case ObjectKind::Tuple:
        return &tuple_methods();
    case ObjectKind::Range:
        return &range_methods();
    case ObjectKind::Array:
        return &array_methods();
    case ObjectKind::Dict:
        return &dict_methods();
    case ObjectKind::Set:
        return &set_methods();
    default:
        return nullptr;
    }
}

/** @brief `str.upper` looked up on the type: a builtin taking the receiver first. */
std::optional<Value> unbound_method(const TypeObject& type, const std::string& name)
{
    if (type.name == "dict" && name == "fromkeys")
    {
        return make_builtin("fromkeys", dict_fromkeys);
    }
    const MethodTable* table = methods_for_type(type.name);
    if (table == nullptr)
    {
        return std::nullopt;
    }
    auto it = table->find(name);
    if (it == table->end())
    {
        return std::nullopt;
    }
    const NativeMethod fn = it->second;
    const std::string qualified = type.name + "." + name;
    const std::string owner = type.name;
    return make_builtin(name, [fn, qualified, owner](Interpreter& interp, CallArgs& args) -> Value {
        if (args.positional.empty())
        {
            raise("TypeError", "unbound method " + qualified + "() needs an argument");
        }
        Value self = args.positional.front();
        const bool matches = owner == type_name(self) || (owner == "int" && self.is_bool());
        if (!matches)
        {
            raise("TypeError", "descriptor '" + qualified.substr(owner.size() + 1) + "' for '" + owner +
                                   "' objects doesn't apply to a '" + type_name(self) + "' object");
        }
        args.positional.erase(args.positional.begin());
        return fn(interp, self, args);
    });
}

} // namespace

std::optional<Value> find_method(const Value& self, const std::string& name)
{
    if (const auto* type = self.as<TypeObject>())
    {
        return unbound_method(*type, name);
    }
    const MethodTable* table = methods_for(self);
    if (table == nullptr)
    {
        return std::nullopt;
    }
    auto it = table->find(name);
    if (it == table->end())
    {
        return std::nullopt;
    }
    return make_bound_method(self, name, it->second);
}

std::vector<std::string> method_names(const Value& self)
{
    std::vector<std::string> names;
    if (const MethodTable* table = methods_for(self))
    {
        for (const auto& [name, fn] : *table)
        {
            names.push_back(name);
        }
    }
    return names;
}

void sort_values(Interpreter& interp, std::vector<Value>& items, const Value& key, bool reverse)
{
    std::vector<std::pair<Value, std::size_t>> keyed;
    keyed.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        keyed.emplace_back(key.is_none() ? items[i] : interp.call(key, std::vector<Value>{items[i]}), i);
    }
    // Reversing before and after keeps equal elements in their original order.
    if (reverse)
    {
        std::reverse(keyed.begin(), keyed.end());
    }
    std::stable_sort(keyed.begin(), keyed.end(), [&interp](const auto& a, const auto& b) {
        interp.tick();
        return less_than(a.first, b.first);
    });
    if (reverse)
    {
        std::reverse(keyed.begin(), keyed.end());
    }
    std::vector<Value> sorted;
    sorted.reserve(items.size());
    for (const auto& [k, index] : keyed)
    {
        sorted.push_back(items[index]);
    }
    items = std::move(sorted);
}

std::string join_strings(Interpreter& interp, const std::string& sep, const Value& iterable)
{
    std::string out;
    std::size_t index = 0;
    Value iterator = make_iter(iterable);
    while (auto item = interp.next(iterator))
    {
        const auto* s = item->as<StrObject>();
        if (s == nullptr)
        {
            raise("TypeError", "sequence item " + std::to_string(index) + ": expected str instance, " +
                                   type_name(*item) + " found");
        }
        if (index > 0)
        {
            out += sep;
        }
        check_allocation(out.size() + s->value.size());
        out += s->value;
        ++index;
    }
    return out;
}

void update_dict(Interpreter& interp, HashTable& table, const Value& source)
{
    if (const auto* dict = source.as<DictObject>())
    {
        for (const auto& e : dict->table.entries())
        {
            if (e.live)
            {
                table.insert(e.key, e.value);
            }
        }
        return;
    }
    Value iterator = make_iter(source);
    std::size_t index = 0;
    while (auto item = interp.next(iterator))
    {
        if (!item->is(ObjectKind::List) && !item->is(ObjectKind::Tuple))
        {
            raise("TypeError", "cannot convert dictionary update sequence element #" + std::to_string(index) +
                                   " to a sequence");
        }
        std::vector<Value> pair = interp.collect(*item);
        if (pair.size() != 2)
        {
            raise("ValueError", "dictionary update sequence element #" + std::to_string(index) + " has length " +
                                    std::to_string(pair.size()) + "; 2 is required");
        }
        table.insert(pair[0], std::move(pair[1]));
        ++index;
    }
}

} // namespace cinder::runtime
