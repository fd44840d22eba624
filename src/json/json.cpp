#include <algorithm>
#include <cctype>
#include <charconv>
#include <cinder/json/json.h>
#include <cinder/parser/literal.h>
#include <cmath>
#include <cstdlib>

namespace cinder::json
{
namespace
{

int hex_digit(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

struct JsonParser
{
    std::string_view input;
    std::size_t pos = 0;
    int depth = 0;

    static constexpr int kMaxDepth = 512;

    [[nodiscard]] bool eof() const { return pos >= input.size(); }

    void skip_ws()
    {
        while (!eof() && std::isspace(static_cast<unsigned char>(input[pos])))
        {
            ++pos;
        }
    }

    bool consume(char expected)
    {
        skip_ws();
        if (eof() || input[pos] != expected)
        {
            return false;
        }
        ++pos;
        return true;
    }

    std::optional<Json> parse_value()
    {
        skip_ws();
        if (eof())
        {
            return std::nullopt;
        }
        const char c = input[pos];
        if (c == 'n')
        {
            if (input.substr(pos, 4) == "null")
            {
                pos += 4;
                return Json{nullptr};
            }
            return std::nullopt;
        }
        if (c == 't')
        {
            if (input.substr(pos, 4) == "true")
            {
                pos += 4;
                return Json{true};
            }
            return std::nullopt;
        }
        if (c == 'f')
        {
            if (input.substr(pos, 5) == "false")
            {
                pos += 5;
                return Json{false};
            }
            return std::nullopt;
        }
        if (c == '"')
        {
            auto s = parse_string();
            if (!s.has_value())
            {
                return std::nullopt;
            }
            return Json{std::move(*s)};
        }
        if (c == '{' || c == '[')
        {
            if (++depth > kMaxDepth)
            {
                return std::nullopt;
            }
            auto nested = (c == '{') ? parse_object() : parse_array();
            --depth;
            return nested;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)))
        {
            return parse_number();
        }
        return std::nullopt;
    }

    std::optional<std::uint32_t> parse_hex4()
    {
        if (pos + 4 > input.size())
        {
            return std::nullopt;
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i)
        {
            const int h = hex_digit(input[pos++]);
            if (h < 0)
            {
                return std::nullopt;
            }
            value = value * 16 + static_cast<std::uint32_t>(h);
        }
        return value;
    }

    std::optional<std::string> parse_string()
    {
        if (!consume('"'))
        {
            return std::nullopt;
        }
        std::string out;
        while (!eof())
        {
            const char c = input[pos++];
            if (c == '"')
            {
                return out;
            }
            if (c != '\\')
            {
                out.push_back(c);
                continue;
            }
            if (eof())
            {
                return std::nullopt;
            }
            const char esc = input[pos++];
            switch (esc)
            {
            case '"':
                out.push_back('"');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case '/':
                out.push_back('/');
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u':
            {
                auto cp = parse_hex4();
                if (!cp.has_value())
                {
                    return std::nullopt;
                }
                std::uint32_t code = *cp;
                // Surrogate pair.
                if (code >= 0xD800 && code <= 0xDBFF && input.substr(pos, 2) == "\\u")
                {
                    pos += 2;
                    auto low = parse_hex4();
                    if (!low.has_value() || *low < 0xDC00 || *low > 0xDFFF)
                    {
                        return std::nullopt;
                    }
                    code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                }
                cinder::parser::append_utf8(out, code);
                break;
            }
            default:
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<Json> parse_number()
    {
        skip_ws();
        const std::size_t start = pos;
        bool is_float = false;
        if (input[pos] == '-')
        {
            ++pos;
        }
        while (!eof() && std::isdigit(static_cast<unsigned char>(input[pos])))
        {
            ++pos;
        }
        if (!eof() && input[pos] == '.')
        {
            is_float = true;
            ++pos;
            while (!eof() && std::isdigit(static_cast<unsigned char>(input[pos])))
            {
                ++pos;
            }
        }
        if (!eof() && (input[pos] == 'e' || input[pos] == 'E'))
        {
            is_float = true;
            ++pos;
            if (!eof() && (input[pos] == '+' || input[pos] == '-'))
            {
                ++pos;
            }
            while (!eof() && std::isdigit(static_cast<unsigned char>(input[pos])))
            {
                ++pos;
            }
        }

        const std::string num(input.substr(start, pos - start));
        if (!is_float)
        {
            std::int64_t value = 0;
            const auto [ptr, ec] = std::from_chars(num.data(), num.data() + num.size(), value);
            if (ec == std::errc() && ptr == num.data() + num.size())
            {
                return Json{value};
            }
        }
        char* end_ptr = nullptr;
        const double value = std::strtod(num.c_str(), &end_ptr);
        if (end_ptr == num.c_str())
        {
            return std::nullopt;
        }
        return Json{value};
    }

    std::optional<Json> parse_array()
    {
        if (!consume('['))
        {
            return std::nullopt;
        }
        Json::Array items;
        skip_ws();
        if (consume(']'))
        {
            return Json{std::move(items)};
        }
        while (true)
        {
            auto value = parse_value();
            if (!value.has_value())
            {
                return std::nullopt;
            }
            items.push_back(std::move(*value));
            skip_ws();
            if (consume(']'))
            {
                break;
            }
            if (!consume(','))
            {
                return std::nullopt;
            }
        }
        return Json{std::move(items)};
    }

    std::optional<Json> parse_object()
    {
        if (!consume('{'))
        {
            return std::nullopt;
        }
        Json obj = make_object();
        skip_ws();
        if (consume('}'))
        {
            return obj;
        }
        while (true)
        {
            skip_ws();
            auto key = parse_string();
            if (!key.has_value())
            {
                return std::nullopt;
            }
            if (!consume(':'))
            {
                return std::nullopt;
            }
            auto val = parse_value();
            if (!val.has_value())
            {
                return std::nullopt;
            }
            obj.set(std::move(*key), std::move(*val));
            skip_ws();
            if (consume('}'))
            {
                break;
            }
            if (!consume(','))
            {
                return std::nullopt;
            }
        }
        return obj;
    }
};

void serialize_into(const Json& value, std::string& out, const std::optional<int>& indent,
                    bool spaced, int level)
{
    const auto newline = [&](int lvl)
    {
        out.push_back('\n');
        out.append(static_cast<std::size_t>(*indent) * static_cast<std::size_t>(lvl), ' ');
    };
    const char* item_sep = (spaced && !indent.has_value()) ? ", " : ",";
    const char* key_sep = spaced ? ": " : ":";

    if (value.is_null())
    {
        out += "null";
        return;
    }
    if (const auto* b = value.as_bool())
    {
        out += *b ? "true" : "false";
        return;
    }
    if (value.is_int())
    {
        out += std::to_string(std::get<std::int64_t>(value.value));
        return;
    }
    if (value.is_double())
    {
        const double d = std::get<double>(value.value);
        out += std::isfinite(d) ? format_double(d) : "null";
        return;
    }
    if (const auto* s = value.as_string())
    {
        out += "\"" + escape(*s) + "\"";
        return;
    }
    if (const auto* arr = value.as_array())
    {
        out += "[";
        for (std::size_t i = 0; i < arr->size(); ++i)
        {
            if (i > 0)
            {
                out += item_sep;
            }
            if (indent.has_value())
            {
                newline(level + 1);
            }
            serialize_into((*arr)[i], out, indent, spaced, level + 1);
        }
        if (indent.has_value() && !arr->empty())
        {
            newline(level);
        }
        out += "]";
        return;
    }

    const auto& obj = *value.as_object();
    out += "{";
    bool first = true;
    for (const auto& [key, member] : obj)
    {
        if (!first)
        {
            out += item_sep;
        }
        first = false;
        if (indent.has_value())
        {
            newline(level + 1);
        }
        out += "\"" + escape(key) + "\"" + key_sep;
        serialize_into(member, out, indent, spaced, level + 1);
    }
    if (indent.has_value() && !obj.empty())
    {
        newline(level);
    }
    out += "}";
}

} // namespace

std::optional<double> Json::as_number() const
{
    if (const auto* i = std::get_if<std::int64_t>(&value))
    {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value))
    {
        return *d;
    }
    return std::nullopt;
}

const Json* Json::find(std::string_view key) const
{
    const auto* obj = as_object();
    if (obj == nullptr)
    {
        return nullptr;
    }
    for (const auto& [k, v] : *obj)
    {
        if (k == key)
        {
            return &v;
        }
    }
    return nullptr;
}

void Json::set(std::string key, Json member)
{
    if (is_null())
    {
        value = Object{};
    }
    auto* obj = as_object();
    if (obj == nullptr)
    {
        return;
    }
    for (auto& [k, v] : *obj)
    {
        if (k == key)
        {
            v = std::move(member);
            return;
        }
    }
    obj->emplace_back(std::move(key), std::move(member));
}

Json make_object()
{
    return Json{Json::Object{}};
}

std::optional<Json> parse(std::string_view input)
{
    JsonParser parser{input};
    auto result = parser.parse_value();
    if (!result.has_value())
    {
        return std::nullopt;
    }
    parser.skip_ws();
    if (!parser.eof())
    {
        return std::nullopt;
    }
    return result;
}

std::variant<Json, ParseError> parse_document(std::string_view input)
{
    JsonParser parser{input};
    auto result = parser.parse_value();
    if (!result.has_value())
    {
        return ParseError{.message = "Expecting value", .offset = std::min(parser.pos, input.size())};
    }
    parser.skip_ws();
    if (!parser.eof())
    {
        return ParseError{.message = "Extra data", .offset = parser.pos};
    }
    return std::move(*result);
}

std::string escape(std::string_view input)
{
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(input.size() + 8);
    for (const char c : input)
    {
        switch (c)
        {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20)
            {
                out += "\\u00";
                out.push_back(kHex[(static_cast<unsigned char>(c) >> 4) & 0xF]);
                out.push_back(kHex[static_cast<unsigned char>(c) & 0xF]);
            }
            else
            {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

std::string format_double(double value)
{
    char buf[64];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    std::string text = (ec == std::errc()) ? std::string(buf, ptr) : std::to_string(value);
    if (text.find_first_of(".eEn") == std::string::npos)
    {
        text += ".0";
    }
    return text;
}

std::string serialize(const Json& value)
{
    std::string out;
    serialize_into(value, out, std::nullopt, false, 0);
    return out;
}

std::string serialize_pretty(const Json& value, std::optional<int> indent)
{
    std::string out;
    serialize_into(value, out, indent, true, 0);
    return out;
}

std::optional<std::string> get_string(const Json& obj, std::string_view key)
{
    const Json* member = obj.find(key);
    if (member == nullptr || !member->is_string())
    {
        return std::nullopt;
    }
    return *member->as_string();
}

std::optional<double> get_number(const Json& obj, std::string_view key)
{
    const Json* member = obj.find(key);
    if (member == nullptr)
    {
        return std::nullopt;
    }
    return member->as_number();
}

std::optional<Json> get_object(const Json& obj, std::string_view key)
{
    const Json* member = obj.find(key);
    if (member == nullptr || !member->is_object())
    {
        return std::nullopt;
    }
    return *member;
}

std::optional<Json> get_array(const Json& obj, std::string_view key)
{
    const Json* member = obj.find(key);
    if (member == nullptr || !member->is_array())
    {
        return std::nullopt;
    }
    return *member;
}

} // namespace cinder::json
