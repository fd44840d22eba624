#include <cctype>
#include <cinder/lexer/lexer.h>
#include <cstddef>
#include <optional>
#include <string>

namespace cinder::lexer
{
namespace
{

constexpr std::size_t kMaxBracketDepth = 200;
constexpr std::size_t kMaxIndentLevels = 100;

struct Keyword
{
    std::string_view text;
    TokenKind kind;
};

constexpr Keyword kKeywords[] = {
    {"False", TokenKind::KwFalse},
    {"None", TokenKind::KwNone},
    {"True", TokenKind::KwTrue},
    {"and", TokenKind::KwAnd},
    {"as", TokenKind::KwAs},
    {"assert", TokenKind::KwAssert},
    {"break", TokenKind::KwBreak},
    {"continue", TokenKind::KwContinue},
    {"def", TokenKind::KwDef},
    {"del", TokenKind::KwDel},
    {"elif", TokenKind::KwElif},
    {"else", TokenKind::KwElse},
    {"except", TokenKind::KwExcept},
    {"finally", TokenKind::KwFinally},
    {"for", TokenKind::KwFor},
    {"from", TokenKind::KwFrom},
    {"global", TokenKind::KwGlobal},
    {"if", TokenKind::KwIf},
    {"import", TokenKind::KwImport},
    {"in", TokenKind::KwIn},
    {"is", TokenKind::KwIs},
    {"lambda", TokenKind::KwLambda},
    {"nonlocal", TokenKind::KwNonlocal},
    {"not", TokenKind::KwNot},
    {"or", TokenKind::KwOr},
    {"pass", TokenKind::KwPass},
    {"raise", TokenKind::KwRaise},
    {"return", TokenKind::KwReturn},
    {"try", TokenKind::KwTry},
    {"while", TokenKind::KwWhile},
    {"class", TokenKind::KwReserved},
    {"with", TokenKind::KwReserved},
    {"yield", TokenKind::KwReserved},
    {"async", TokenKind::KwReserved},
    {"await", TokenKind::KwReserved},
};

struct Operator
{
    std::string_view text;
    TokenKind kind;
};

// Longest first so that prefixes never shadow a longer operator.
constexpr Operator kOperators[] = {
    {"**=", TokenKind::DoubleStarEqual},
    {"//=", TokenKind::DoubleSlashEqual},
    {"<<=", TokenKind::LeftShiftEqual},
    {">>=", TokenKind::RightShiftEqual},
    {"**", TokenKind::DoubleStar},
    {"//", TokenKind::DoubleSlash},
    {"<<", TokenKind::LeftShift},
    {">>", TokenKind::RightShift},
    {"<=", TokenKind::LessEqual},
    {">=", TokenKind::GreaterEqual},
    {"==", TokenKind::EqualEqual},
    {"!=", TokenKind::BangEqual},
    {"->", TokenKind::Arrow},
    {"+=", TokenKind::PlusEqual},
    {"-=", TokenKind::MinusEqual},
    {"*=", TokenKind::StarEqual},
    {"/=", TokenKind::SlashEqual},
    {"%=", TokenKind::PercentEqual},
    {"&=", TokenKind::AmpEqual},
    {"|=", TokenKind::PipeEqual},
    {"^=", TokenKind::CaretEqual},
    {"(", TokenKind::LParen},
    {")", TokenKind::RParen},
    {"[", TokenKind::LBracket},
    {"]", TokenKind::RBracket},
    {"{", TokenKind::LBrace},
    {"}", TokenKind::RBrace},
    {",", TokenKind::Comma},
    {":", TokenKind::Colon},
    {";", TokenKind::Semicolon},
    {".", TokenKind::Dot},
    {"@", TokenKind::At},
    {"+", TokenKind::Plus},
    {"-", TokenKind::Minus},
    {"*", TokenKind::Star},
    {"/", TokenKind::Slash},
    {"%", TokenKind::Percent},
    {"~", TokenKind::Tilde},
    {"&", TokenKind::Amp},
    {"|", TokenKind::Pipe},
    {"^", TokenKind::Caret},
    {"<", TokenKind::Less},
    {">", TokenKind::Greater},
    {"=", TokenKind::Equal},
};

class Lexer
{
  public:
    explicit Lexer(std::string_view input) : input_(input) {}

    [[nodiscard]] LexResult lex_all()
    {
        indents_.push_back(0);
        at_line_start_ = true;

        while (true)
        {
            if (at_line_start_ && depth_ == 0)
            {
                if (auto err = handle_indentation())
                {
                    return *err;
                }
                if (is_at_end())
                {
                    break;
                }
            }

            if (auto err = skip_trivia())
            {
                return *err;
            }

            if (is_at_end())
            {
                break;
            }

            const std::size_t start = pos_;
            const char c = peek();

            if (c == '\n' || c == '\r')
            {
                consume_line_break();
                if (depth_ == 0)
                {
                    end_logical_line(start);
                }
                continue;
            }

            if (auto prefix_len = string_prefix_length(); prefix_len.has_value())
            {
                if (auto err = lex_string(start, *prefix_len))
                {
                    return *err;
                }
                continue;
            }

            if (is_ident_start(c))
            {
                advance();
                while (!is_at_end() && is_ident_continue(peek()))
                {
                    advance();
                }
                const std::string_view lexeme = input_.substr(start, pos_ - start);
                push(keyword_or_ident(lexeme), start, pos_);
                continue;
            }

            if (is_digit(c) || (c == '.' && is_digit(peek_next())))
            {
                if (auto err = lex_number(start))
                {
                    return *err;
                }
                continue;
            }

            if (auto err = lex_operator(start))
            {
                return *err;
            }
        }

        const std::size_t end = input_.size();
        if (!tokens_.empty() && tokens_.back().kind != TokenKind::Newline &&
            tokens_.back().kind != TokenKind::Dedent && tokens_.back().kind != TokenKind::Indent)
        {
            push(TokenKind::Newline, end, end);
        }
        while (indents_.size() > 1)
        {
            indents_.pop_back();
            push(TokenKind::Dedent, end, end);
        }
        push(TokenKind::Eof, end, end);
        return std::move(tokens_);
    }

  private:
    std::string_view input_;
    std::size_t pos_ = 0;
    std::vector<Token> tokens_;
    std::vector<std::size_t> indents_;
    std::vector<std::size_t> open_brackets_;
    std::size_t depth_ = 0;
    bool at_line_start_ = true;

    [[nodiscard]] bool is_at_end() const { return pos_ >= input_.size(); }
    [[nodiscard]] char peek() const { return is_at_end() ? '\0' : input_[pos_]; }

    [[nodiscard]] char peek_next() const
    {
        const std::size_t n = pos_ + 1;
        return (n < input_.size()) ? input_[n] : '\0';
    }

    [[nodiscard]] char peek_at(std::size_t offset) const
    {
        const std::size_t n = pos_ + offset;
        return (n < input_.size()) ? input_[n] : '\0';
    }

    void advance() { ++pos_; }

    static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

    static bool is_ident_start(char c)
    {
        const unsigned char uc = static_cast<unsigned char>(c);
        // Bytes >= 0x80 are accepted so UTF-8 identifiers lex as one name.
        return (std::isalpha(uc) != 0) || c == '_' || uc >= 0x80;
    }

    static bool is_ident_continue(char c)
    {
        const unsigned char uc = static_cast<unsigned char>(c);
        return (std::isalnum(uc) != 0) || c == '_' || uc >= 0x80;
    }

    static TokenKind keyword_or_ident(std::string_view lexeme)
    {
        for (const auto& kw : kKeywords)
        {
            if (kw.text == lexeme)
            {
                return kw.kind;
            }
        }
        return TokenKind::Identifier;
    }

    void push(TokenKind kind, std::size_t start, std::size_t end)
    {
        tokens_.push_back(
            Token{.kind = kind, .lexeme = input_.substr(start, end - start), .span = {start, end}});
    }

    [[nodiscard]] cinder::diag::Diagnostic make_error(std::size_t start, std::size_t end,
                                                      std::string_view message) const
    {
        return cinder::diag::error_at(cinder::source::Span{start, end}, std::string(message));
    }

    void consume_line_break()
    {
        if (peek() == '\r' && peek_next() == '\n')
        {
            pos_ += 2;
            return;
        }
        advance();
    }

    void end_logical_line(std::size_t at)
    {
        if (!tokens_.empty() && tokens_.back().kind != TokenKind::Newline &&
            tokens_.back().kind != TokenKind::Indent && tokens_.back().kind != TokenKind::Dedent)
        {
            push(TokenKind::Newline, at, at);
        }
        at_line_start_ = true;
    }

    // Measures leading whitespace of the next non-blank line and emits Indent/Dedent.
    [[nodiscard]] std::optional<cinder::diag::Diagnostic> handle_indentation()
    {
        while (!is_at_end())
        {
            const std::size_t line_start = pos_;
            std::size_t width = 0;
            while (!is_at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\f'))
            {
                if (peek() == '\t')
                {
                    width = (width / 8 + 1) * 8;
                }
                else if (peek() == ' ')
                {
                    ++width;
                }
                advance();
            }

            if (is_at_end())
            {
                return std::nullopt;
            }

            const char c = peek();
            if (c == '#')
            {
                while (!is_at_end() && peek() != '\n' && peek() != '\r')
                {
                    advance();
                }
                continue;
            }
            if (c == '\n' || c == '\r')
            {
                consume_line_break();
                continue;
            }
            if (c == '\\' && (peek_next() == '\n' || peek_next() == '\r'))
            {
                // A continuation on an otherwise empty line joins with the next one.
                advance();
                consume_line_break();
                continue;
            }

            at_line_start_ = false;
            if (width > indents_.back())
            {
                if (indents_.size() > kMaxIndentLevels)
                {
                    return make_error(line_start, pos_, "too many levels of indentation");
                }
                indents_.push_back(width);
                push(TokenKind::Indent, line_start, pos_);
                return std::nullopt;
            }
            while (width < indents_.back())
            {
                indents_.pop_back();
                push(TokenKind::Dedent, pos_, pos_);
            }
            if (width != indents_.back())
            {
                return make_error(line_start, pos_,
                                  "unindent does not match any outer indentation level");
            }
            return std::nullopt;
        }
        return std::nullopt;
    }

    // Skips spaces, comments, and backslash continuations within a logical line.
    [[nodiscard]] std::optional<cinder::diag::Diagnostic> skip_trivia()
    {
        while (!is_at_end())
        {
            const char c = peek();

            if (c == ' ' || c == '\t' || c == '\f')
            {
                advance();
                continue;
            }

            if (c == '#')
            {
                while (!is_at_end() && peek() != '\n' && peek() != '\r')
                {
                    advance();
                }
                continue;
            }

            if (c == '\\')
            {
                const char next = peek_next();
                if (next == '\n' || next == '\r')
                {
                    advance();
                    consume_line_break();
                    continue;
                }
                if (next == '\0')
                {
                    return make_error(pos_, pos_ + 1, "unexpected end of input after '\\'");
                }
                return make_error(pos_, pos_ + 1, "unexpected character after line continuation");
            }

            if ((c == '\n' || c == '\r') && depth_ > 0)
            {
                consume_line_break();
                continue;
            }

            break;
        }
        return std::nullopt;
    }

    // Returns the length of a string prefix (0 for a bare quote) when a string starts here.
    [[nodiscard]] std::optional<std::size_t> string_prefix_length() const
    {
        std::size_t n = 0;
        bool raw = false;
        bool bytes = false;
        bool fmt = false;
        while (n < 3)
        {
            const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(peek_at(n))));
            if (c == '\'' || c == '"')
            {
                return n;
            }
            if (c == 'r' && !raw)
            {
                raw = true;
            }
            else if (c == 'b' && !bytes && !fmt)
            {
                bytes = true;
            }
            else if (c == 'f' && !fmt && !bytes)
            {
                fmt = true;
            }
            else if (c == 'u' && n == 0)
            {
                const char q = peek_at(1);
                return (q == '\'' || q == '"') ? std::optional<std::size_t>(1) : std::nullopt;
            }
            else
            {
                return std::nullopt;
            }
            ++n;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<cinder::diag::Diagnostic> lex_string(std::size_t start,
                                                                     std::size_t prefix_len)
    {
        pos_ += prefix_len;

        const char quote = peek();
        const bool triple = peek_next() == quote && peek_at(2) == quote;
        pos_ += triple ? 3 : 1;

        while (true)
        {
            if (is_at_end())
            {
                return make_error(start, pos_,
                                  triple ? "unterminated triple-quoted string literal"
                                         : "unterminated string literal");
            }

            const char ch = peek();
            if (ch == '\\')
            {
                advance();
                if (is_at_end())
                {
                    continue;
                }
                // Escaped quotes never terminate, raw or not; decoding happens in the parser.
                consume_escaped();
                continue;
            }

            if (ch == quote)
            {
                if (!triple)
                {
                    advance();
                    break;
                }
                if (peek_next() == quote && peek_at(2) == quote)
                {
                    pos_ += 3;
                    break;
                }
                advance();
                continue;
            }

            if ((ch == '\n' || ch == '\r') && !triple)
            {
                return make_error(start, pos_, "unterminated string literal");
            }

            advance();
        }

        push(TokenKind::StringLiteral, start, pos_);
        return std::nullopt;
    }

    void consume_escaped()
    {
        if (peek() == '\r' && peek_next() == '\n')
        {
            pos_ += 2;
            return;
        }
        advance();
    }

    void consume_digits(int (*is_valid)(int))
    {
        while (!is_at_end())
        {
            const char c = peek();
            if (c == '_' && is_valid(static_cast<unsigned char>(peek_next())) != 0)
            {
                advance();
                continue;
            }
            if (is_valid(static_cast<unsigned char>(c)) == 0)
            {
                break;
            }
            advance();
        }
    }

    static int is_octal(int c) { return (c >= '0' && c <= '7') ? 1 : 0; }
    static int is_binary(int c) { return (c == '0' || c == '1') ? 1 : 0; }
    static int is_decimal(int c) { return (c >= '0' && c <= '9') ? 1 : 0; }
    static int is_hex(int c) { return std::isxdigit(c); }

    [[nodiscard]] std::optional<cinder::diag::Diagnostic> lex_number(std::size_t start)
    {
        TokenKind kind = TokenKind::IntLiteral;

        if (peek() == '0' && std::string_view("xXoObB").find(peek_next()) != std::string_view::npos)
        {
            const char base = static_cast<char>(std::tolower(static_cast<unsigned char>(peek_next())));
            pos_ += 2;
            const std::size_t digits_start = pos_;
            if (base == 'x')
            {
                consume_digits(is_hex);
            }
            else if (base == 'o')
            {
                consume_digits(is_octal);
            }
            else
            {
                consume_digits(is_binary);
            }
            if (pos_ == digits_start)
            {
                return make_error(start, pos_, "invalid integer literal");
            }
            if (is_ident_continue(peek()))
            {
                return make_error(start, pos_ + 1, "invalid digit in integer literal");
            }
            push(kind, start, pos_);
            return std::nullopt;
        }

        consume_digits(is_decimal);
        if (peek() == '.' && (is_digit(peek_next()) || !is_ident_start(peek_next())))
        {
            kind = TokenKind::FloatLiteral;
            advance();
            consume_digits(is_decimal);
        }
        if (peek() == 'e' || peek() == 'E')
        {
            std::size_t look = 1;
            if (peek_at(look) == '+' || peek_at(look) == '-')
            {
                ++look;
            }
            if (is_digit(peek_at(look)))
            {
                kind = TokenKind::FloatLiteral;
                pos_ += look;
                consume_digits(is_decimal);
            }
        }
        if (peek() == 'j' || peek() == 'J')
        {
            kind = TokenKind::ImagLiteral;
            advance();
        }
        if (is_ident_continue(peek()))
        {
            return make_error(start, pos_ + 1, "invalid decimal literal");
        }

        push(kind, start, pos_);
        return std::nullopt;
    }

    [[nodiscard]] std::optional<cinder::diag::Diagnostic> lex_operator(std::size_t start)
    {
        const std::string_view rest = input_.substr(pos_);
        for (const auto& op : kOperators)
        {
            if (rest.substr(0, op.text.size()) != op.text)
            {
                continue;
            }
            pos_ += op.text.size();

            switch (op.kind)
            {
            case TokenKind::LParen:
            case TokenKind::LBracket:
            case TokenKind::LBrace:
                if (depth_ >= kMaxBracketDepth)
                {
                    return make_error(start, pos_, "too many nested parentheses");
                }
                ++depth_;
                open_brackets_.push_back(start);
                break;
            case TokenKind::RParen:
            case TokenKind::RBracket:
            case TokenKind::RBrace:
                if (depth_ == 0)
                {
                    return make_error(start, pos_, "unmatched '" + std::string(op.text) + "'");
                }
                --depth_;
                open_brackets_.pop_back();
                break;
            default:
                break;
            }

            push(op.kind, start, pos_);
            return std::nullopt;
        }

        if (peek() == '!')
        {
            return make_error(start, start + 1, "invalid syntax: '!' is not an operator");
        }
        return make_error(start, start + 1, "invalid character");
    }

  public:
    [[nodiscard]] std::optional<cinder::diag::Diagnostic> unclosed_bracket() const
    {
        if (depth_ == 0 || open_brackets_.empty())
        {
            return std::nullopt;
        }
        const std::size_t at = open_brackets_.back();
        return make_error(at, at + 1, "'" + std::string(1, input_[at]) + "' was never closed");
    }
};

} // namespace

LexResult lex(std::string_view input)
{
    Lexer lexer(input);
    auto result = lexer.lex_all();
    if (std::holds_alternative<std::vector<Token>>(result))
    {
        if (auto err = lexer.unclosed_bracket())
        {
            return *err;
        }
    }
    return result;
}

} // namespace cinder::lexer
