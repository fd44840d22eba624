#include <cctype>
#include <charconv>
#include <cinder/parser/literal.h>
#include <cstdlib>
#include <string>

namespace cinder::parser
{
namespace
{

int hex_value(char c)
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

std::string strip_underscores(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (const char c : text)
    {
        if (c != '_')
        {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

StringLiteralInfo classify_string_literal(std::string_view lexeme)
{
    StringLiteralInfo info;
    std::size_t i = 0;
    while (i < lexeme.size() && lexeme[i] != '\'' && lexeme[i] != '"')
    {
        switch (std::tolower(static_cast<unsigned char>(lexeme[i])))
        {
        case 'r':
            info.raw = true;
            break;
        case 'b':
            info.bytes = true;
            break;
        case 'f':
            info.formatted = true;
            break;
        default:
            break;
        }
        ++i;
    }

    std::size_t quote_len = 1;
    if (i + 2 < lexeme.size() && lexeme[i + 1] == lexeme[i] && lexeme[i + 2] == lexeme[i] &&
        lexeme.size() - i >= 6)
    {
        quote_len = 3;
    }

    info.body_offset = i + quote_len;
    const std::size_t body_len = lexeme.size() - info.body_offset - quote_len;
    info.body = lexeme.substr(info.body_offset, body_len);
    return info;
}

void append_utf8(std::string& out, std::uint32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

DecodeResult decode_escapes(std::string_view body, bool bytes, std::size_t offset)
{
    std::string out;
    out.reserve(body.size());

    for (std::size_t i = 0; i < body.size(); ++i)
    {
        const char c = body[i];
        if (bytes && static_cast<unsigned char>(c) >= 0x80)
        {
            return cinder::diag::error_at({offset + i, offset + i + 1},
                                          "bytes can only contain ASCII literal characters");
        }
        if (c != '\\' || i + 1 >= body.size())
        {
            out.push_back(c);
            continue;
        }

        const std::size_t esc_start = i;
        const char e = body[++i];
        switch (e)
        {
        case '\n':
            break;
        case '\r':
            if (i + 1 < body.size() && body[i + 1] == '\n')
            {
                ++i;
            }
            break;
        case '\\':
            out.push_back('\\');
            break;
        case '\'':
            out.push_back('\'');
            break;
        case '"':
            out.push_back('"');
            break;
        case 'a':
            out.push_back('\a');
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
        case 'v':
            out.push_back('\v');
            break;
        case 'x':
        {
            if (i + 2 >= body.size() || hex_value(body[i + 1]) < 0 || hex_value(body[i + 2]) < 0)
            {
                return cinder::diag::error_at({offset + esc_start, offset + i + 1},
                                              "truncated \\xXX escape");
            }
            const auto value =
                static_cast<std::uint32_t>(hex_value(body[i + 1]) * 16 + hex_value(body[i + 2]));
            i += 2;
            if (bytes)
            {
                out.push_back(static_cast<char>(value));
            }
            else
            {
                append_utf8(out, value);
            }
            break;
        }
        case 'u':
        case 'U':
        {
            if (bytes)
            {
                out.push_back('\\');
                out.push_back(e);
                break;
            }
            const std::size_t digits = (e == 'u') ? 4 : 8;
            std::uint32_t value = 0;
            for (std::size_t k = 1; k <= digits; ++k)
            {
                const int h = (i + k < body.size()) ? hex_value(body[i + k]) : -1;
                if (h < 0)
                {
                    return cinder::diag::error_at({offset + esc_start, offset + i + k},
                                                  e == 'u' ? "truncated \\uXXXX escape"
                                                           : "truncated \\UXXXXXXXX escape");
                }
                value = value * 16 + static_cast<std::uint32_t>(h);
            }
            if (value > 0x10FFFF)
            {
                return cinder::diag::error_at({offset + esc_start, offset + i + digits + 1},
                                              "illegal Unicode character");
            }
            i += digits;
            append_utf8(out, value);
            break;
        }
        default:
            if (e >= '0' && e <= '7')
            {
                std::uint32_t value = static_cast<std::uint32_t>(e - '0');
                std::size_t k = 1;
                while (k < 3 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7')
                {
                    value = value * 8 + static_cast<std::uint32_t>(body[i + 1] - '0');
                    ++i;
                    ++k;
                }
                if (bytes)
                {
                    out.push_back(static_cast<char>(value & 0xFF));
                }
                else
                {
                    append_utf8(out, value);
                }
                break;
            }
            out.push_back('\\');
            out.push_back(e);
            break;
        }
    }

    return out;
}

IntLiteralResult parse_int_literal(std::string_view lexeme, cinder::source::Span span)
{
    std::string digits = strip_underscores(lexeme);
    int base = 10;
    if (digits.size() > 1 && digits[0] == '0')
    {
        const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(digits[1])));
        if (p == 'x')
        {
            base = 16;
        }
        else if (p == 'o')
        {
            base = 8;
        }
        else if (p == 'b')
        {
            base = 2;
        }
        if (base != 10)
        {
            digits.erase(0, 2);
        }
    }

    std::int64_t value = 0;
    const auto* first = digits.data();
    const auto* last = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(first, last, value, base);
    if (ec == std::errc::result_out_of_range)
    {
        return cinder::diag::error_at(span, "integer literal does not fit in 64 bits");
    }
    if (ec != std::errc() || ptr != last)
    {
        return cinder::diag::error_at(span, "invalid integer literal");
    }
    return value;
}

double parse_float_literal(std::string_view lexeme)
{
    std::string text = strip_underscores(lexeme);
    if (!text.empty() && (text.back() == 'j' || text.back() == 'J'))
    {
        text.pop_back();
    }
    return std::strtod(text.c_str(), nullptr);
}

} // namespace cinder::parser
