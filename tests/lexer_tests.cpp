#include <cinder/lexer/lexer.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_token(const std::vector<cinder::lexer::Token>& tokens, std::size_t index,
                         cinder::lexer::TokenKind kind, std::string_view lexeme)
{
    if (index >= tokens.size())
    {
        fail("missing token at index " + std::to_string(index));
    }

    const auto& t = tokens[index];
    if (t.kind != kind)
    {
        fail("token kind mismatch at index " + std::to_string(index) + ": got " +
             std::string(cinder::lexer::to_string(t.kind)));
    }
    if (t.lexeme != lexeme)
    {
        fail("token lexeme mismatch at index " + std::to_string(index) + ": got '" + std::string(t.lexeme) +
             "'");
    }
}

static const std::vector<cinder::lexer::Token>& expect_tokens(const cinder::lexer::LexResult& res,
                                                              const char* what)
{
    if (!std::holds_alternative<std::vector<cinder::lexer::Token>>(res))
    {
        fail(std::string("expected success for ") + what + ": " +
             std::get<cinder::diag::Diagnostic>(res).message);
    }
    return std::get<std::vector<cinder::lexer::Token>>(res);
}

static void expect_error(const cinder::lexer::LexResult& res, std::string_view message, const char* what)
{
    if (!std::holds_alternative<cinder::diag::Diagnostic>(res))
    {
        fail(std::string("expected lex error for ") + what);
    }
    const auto& diag = std::get<cinder::diag::Diagnostic>(res);
    if (diag.message.find(message) == std::string::npos)
    {
        fail(std::string("unexpected message for ") + what + ": " + diag.message);
    }
}

int main()
{
    using namespace cinder::lexer;

    {
        const std::string src = "def f(x):\n    return x ** 2\n";
        const auto res = lex(src);
        const auto& toks = expect_tokens(res, "function");
        expect_token(toks, 0, TokenKind::KwDef, "def");
        expect_token(toks, 1, TokenKind::Identifier, "f");
        expect_token(toks, 2, TokenKind::LParen, "(");
        expect_token(toks, 3, TokenKind::Identifier, "x");
        expect_token(toks, 4, TokenKind::RParen, ")");
        expect_token(toks, 5, TokenKind::Colon, ":");
        expect_token(toks, 6, TokenKind::Newline, "");
        expect_token(toks, 7, TokenKind::Indent, "    ");
        expect_token(toks, 8, TokenKind::KwReturn, "return");
        expect_token(toks, 9, TokenKind::Identifier, "x");
        expect_token(toks, 10, TokenKind::DoubleStar, "**");
        expect_token(toks, 11, TokenKind::IntLiteral, "2");
        expect_token(toks, 12, TokenKind::Newline, "");
        expect_token(toks, 13, TokenKind::Dedent, "");
        expect_token(toks, 14, TokenKind::Eof, "");
    }

    // Brackets suspend line breaks; comments and blank lines vanish.
    {
        const std::string src = "# header\n\nxs = [1,\n      2]  # trailing\n";
        const auto res = lex(src);
        const auto& toks = expect_tokens(res, "bracketed continuation");
        expect_token(toks, 0, TokenKind::Identifier, "xs");
        expect_token(toks, 1, TokenKind::Equal, "=");
        expect_token(toks, 2, TokenKind::LBracket, "[");
        expect_token(toks, 3, TokenKind::IntLiteral, "1");
        expect_token(toks, 4, TokenKind::Comma, ",");
        expect_token(toks, 5, TokenKind::IntLiteral, "2");
        expect_token(toks, 6, TokenKind::RBracket, "]");
        expect_token(toks, 7, TokenKind::Newline, "");
        expect_token(toks, 8, TokenKind::Eof, "");
    }

    // Missing final newline still yields a Newline before Eof.
    {
        const auto res = lex("print('hi'); 2+2");
        const auto& toks = expect_tokens(res, "semicolon statements");
        expect_token(toks, 0, TokenKind::Identifier, "print");
        expect_token(toks, 1, TokenKind::LParen, "(");
        expect_token(toks, 2, TokenKind::StringLiteral, "'hi'");
        expect_token(toks, 3, TokenKind::RParen, ")");
        expect_token(toks, 4, TokenKind::Semicolon, ";");
        expect_token(toks, 5, TokenKind::IntLiteral, "2");
        expect_token(toks, 6, TokenKind::Plus, "+");
        expect_token(toks, 7, TokenKind::IntLiteral, "2");
        expect_token(toks, 8, TokenKind::Newline, "");
        expect_token(toks, 9, TokenKind::Eof, "");
    }

    // Literal forms keep their prefixes in the lexeme.
    {
        const auto res = lex("b'\\x00' f\"{x}\" r'\\d' 0x1F 1_000 3.5e-2 4j");
        const auto& toks = expect_tokens(res, "literals");
        expect_token(toks, 0, TokenKind::StringLiteral, "b'\\x00'");
        expect_token(toks, 1, TokenKind::StringLiteral, "f\"{x}\"");
        expect_token(toks, 2, TokenKind::StringLiteral, "r'\\d'");
        expect_token(toks, 3, TokenKind::IntLiteral, "0x1F");
        expect_token(toks, 4, TokenKind::IntLiteral, "1_000");
        expect_token(toks, 5, TokenKind::FloatLiteral, "3.5e-2");
        expect_token(toks, 6, TokenKind::ImagLiteral, "4j");
    }

    {
        const auto res = lex("s = '''one\ntwo'''\n");
        const auto& toks = expect_tokens(res, "triple-quoted string");
        expect_token(toks, 2, TokenKind::StringLiteral, "'''one\ntwo'''");
        expect_token(toks, 3, TokenKind::Newline, "");
    }

    {
        const auto res = lex("x //= 3\ny <<= 1\nz != w\n");
        const auto& toks = expect_tokens(res, "compound operators");
        expect_token(toks, 1, TokenKind::DoubleSlashEqual, "//=");
        expect_token(toks, 5, TokenKind::LeftShiftEqual, "<<=");
        expect_token(toks, 9, TokenKind::BangEqual, "!=");
    }

    {
        const auto res = lex("class A: pass\n");
        const auto& toks = expect_tokens(res, "reserved word");
        expect_token(toks, 0, TokenKind::KwReserved, "class");
    }

    // Nested blocks close with one Dedent each.
    {
        const auto res = lex("if a:\n    if b:\n        c\nd\n");
        const auto& toks = expect_tokens(res, "nested blocks");
        std::size_t dedents = 0;
        for (const auto& t : toks)
        {
            if (t.kind == TokenKind::Dedent)
            {
                ++dedents;
            }
        }
        if (dedents != 2)
        {
            fail("expected two dedents, got " + std::to_string(dedents));
        }
    }

    expect_error(lex("x = 'abc\n"), "unterminated string literal", "unterminated string");
    expect_error(lex("s = \"\"\"never closed\n"), "unterminated triple-quoted string literal",
                 "unterminated triple string");
    expect_error(lex("if a:\n        b\n    c\n"), "unindent does not match any outer indentation level",
                 "bad dedent");
    expect_error(lex("x = (1, 2\n"), "'(' was never closed", "unclosed bracket");
    expect_error(lex("x = 1)\n"), "unmatched ')'", "unmatched bracket");
    expect_error(lex("x = $\n"), "invalid character", "stray character");
    expect_error(lex("x = 0b102\n"), "invalid digit in integer literal", "bad binary digit");
    expect_error(lex("x = " + std::string(201, '[') + "\n"), "too many nested parentheses", "bracket depth");
    {
        std::string deep;
        for (std::size_t level = 0; level <= 101; ++level)
        {
            deep += std::string(level, ' ') + "if x:\n";
        }
        expect_error(lex(deep), "too many levels of indentation", "indentation depth");
    }

    {
        const auto res = lex("y = 1\nx = 'oops\n");
        const auto& diag = std::get<cinder::diag::Diagnostic>(res);
        if (!diag.span.has_value() || diag.span->start != 10)
        {
            fail("lex error should point at the opening quote");
        }
    }

    std::cout << "OK\n";
    return 0;
}
