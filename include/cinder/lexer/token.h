#pragma once

#include <cinder/source/span.h>
#include <string_view>

namespace cinder::lexer
{

enum class TokenKind
{
    Eof,

    // Layout
    Newline,
    Indent,
    Dedent,

    Identifier,
    IntLiteral,
    FloatLiteral,
    ImagLiteral,
    StringLiteral, // lexeme keeps prefix and quotes

    // Keywords
    KwFalse,
    KwNone,
    KwTrue,
    KwAnd,
    KwAs,
    KwAssert,
    KwBreak,
    KwContinue,
    KwDef,
    KwDel,
    KwElif,
    KwElse,
    KwExcept,
    KwFinally,
    KwFor,
    KwFrom,
    KwGlobal,
    KwIf,
    KwImport,
    KwIn,
    KwIs,
    KwLambda,
    KwNonlocal,
    KwNot,
    KwOr,
    KwPass,
    KwRaise,
    KwReturn,
    KwTry,
    KwWhile,

    // Reserved words outside the sandbox dialect (class, with, yield, async, await).
    KwReserved,

    // Punctuation
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,
    Comma,
    Colon,
    Semicolon,
    Dot,
    Arrow, // ->
    At,

    // Operators
    Plus,
    Minus,
    Star,
    DoubleStar,
    Slash,
    DoubleSlash,
    Percent,
    Tilde,
    Amp,
    Pipe,
    Caret,
    LeftShift,
    RightShift,

    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    EqualEqual,
    BangEqual,

    // Assignment
    Equal,
    PlusEqual,
    MinusEqual,
    StarEqual,
    DoubleStarEqual,
    SlashEqual,
    DoubleSlashEqual,
    PercentEqual,
    AmpEqual,
    PipeEqual,
    CaretEqual,
    LeftShiftEqual,
    RightShiftEqual,
};

struct Token
{
    TokenKind kind = TokenKind::Eof;
    std::string_view lexeme;
    cinder::source::Span span;
};

/** @brief True for `=` and every augmented assignment operator. */
[[nodiscard]] constexpr bool is_assignment(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::Equal:
    case TokenKind::PlusEqual:
    case TokenKind::MinusEqual:
    case TokenKind::StarEqual:
    case TokenKind::DoubleStarEqual:
    case TokenKind::SlashEqual:
    case TokenKind::DoubleSlashEqual:
    case TokenKind::PercentEqual:
    case TokenKind::AmpEqual:
    case TokenKind::PipeEqual:
    case TokenKind::CaretEqual:
    case TokenKind::LeftShiftEqual:
    case TokenKind::RightShiftEqual:
        return true;
    default:
        return false;
    }
}

[[nodiscard]] constexpr std::string_view to_string(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::Eof:
        return "eof";
    case TokenKind::Newline:
        return "newline";
    case TokenKind::Indent:
        return "indent";
    case TokenKind::Dedent:
        return "dedent";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::IntLiteral:
        return "int";
    case TokenKind::FloatLiteral:
        return "float";
    case TokenKind::ImagLiteral:
        return "imaginary";
    case TokenKind::StringLiteral:
        return "string";
    case TokenKind::KwFalse:
        return "kw_false";
    case TokenKind::KwNone:
        return "kw_none";
    case TokenKind::KwTrue:
        return "kw_true";
    case TokenKind::KwAnd:
        return "kw_and";
    case TokenKind::KwAs:
        return "kw_as";
    case TokenKind::KwAssert:
        return "kw_assert";
    case TokenKind::KwBreak:
        return "kw_break";
    case TokenKind::KwContinue:
        return "kw_continue";
    case TokenKind::KwDef:
        return "kw_def";
    case TokenKind::KwDel:
        return "kw_del";
    case TokenKind::KwElif:
        return "kw_elif";
    case TokenKind::KwElse:
        return "kw_else";
    case TokenKind::KwExcept:
        return "kw_except";
    case TokenKind::KwFinally:
        return "kw_finally";
    case TokenKind::KwFor:
        return "kw_for";
    case TokenKind::KwFrom:
        return "kw_from";
    case TokenKind::KwGlobal:
        return "kw_global";
    case TokenKind::KwIf:
        return "kw_if";
    case TokenKind::KwImport:
        return "kw_import";
    case TokenKind::KwIn:
        return "kw_in";
    case TokenKind::KwIs:
        return "kw_is";
    case TokenKind::KwLambda:
        return "kw_lambda";
    case TokenKind::KwNonlocal:
        return "kw_nonlocal";
    case TokenKind::KwNot:
        return "kw_not";
    case TokenKind::KwOr:
        return "kw_or";
    case TokenKind::KwPass:
        return "kw_pass";
    case TokenKind::KwRaise:
        return "kw_raise";
    case TokenKind::KwReturn:
        return "kw_return";
    case TokenKind::KwTry:
        return "kw_try";
    case TokenKind::KwWhile:
        return "kw_while";
    case TokenKind::KwReserved:
        return "kw_reserved";
    case TokenKind::LParen:
        return "l_paren";
    case TokenKind::RParen:
        return "r_paren";
    case TokenKind::LBracket:
        return "l_bracket";
    case TokenKind::RBracket:
        return "r_bracket";
    case TokenKind::LBrace:
        return "l_brace";
    case TokenKind::RBrace:
        return "r_brace";
    case TokenKind::Comma:
        return "comma";
    case TokenKind::Colon:
        return "colon";
    case TokenKind::Semicolon:
        return "semicolon";
    case TokenKind::Dot:
        return "dot";
    case TokenKind::Arrow:
        return "arrow";
    case TokenKind::At:
        return "at";
    case TokenKind::Plus:
        return "plus";
    case TokenKind::Minus:
        return "minus";
    case TokenKind::Star:
        return "star";
    case TokenKind::DoubleStar:
        return "double_star";
    case TokenKind::Slash:
        return "slash";
    case TokenKind::DoubleSlash:
        return "double_slash";
    case TokenKind::Percent:
        return "percent";
    case TokenKind::Tilde:
        return "tilde";
    case TokenKind::Amp:
        return "amp";
    case TokenKind::Pipe:
        return "pipe";
    case TokenKind::Caret:
        return "caret";
    case TokenKind::LeftShift:
        return "left_shift";
    case TokenKind::RightShift:
        return "right_shift";
    case TokenKind::Less:
        return "less";
    case TokenKind::LessEqual:
        return "less_equal";
    case TokenKind::Greater:
        return "greater";
    case TokenKind::GreaterEqual:
        return "greater_equal";
    case TokenKind::EqualEqual:
        return "equal_equal";
    case TokenKind::BangEqual:
        return "bang_equal";
    case TokenKind::Equal:
        return "equal";
    case TokenKind::PlusEqual:
        return "plus_equal";
    case TokenKind::MinusEqual:
        return "minus_equal";
    case TokenKind::StarEqual:
        return "star_equal";
    case TokenKind::DoubleStarEqual:
        return "double_star_equal";
    case TokenKind::SlashEqual:
        return "slash_equal";
    case TokenKind::DoubleSlashEqual:
        return "double_slash_equal";
    case TokenKind::PercentEqual:
        return "percent_equal";
    case TokenKind::AmpEqual:
        return "amp_equal";
    case TokenKind::PipeEqual:
        return "pipe_equal";
    case TokenKind::CaretEqual:
        return "caret_equal";
    case TokenKind::LeftShiftEqual:
        return "left_shift_equal";
    case TokenKind::RightShiftEqual:
        return "right_shift_equal";
    }
    return "unknown";
}

} // namespace cinder::lexer
