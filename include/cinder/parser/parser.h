#pragma once

#include <cinder/diag/diagnostic.h>
#include <cinder/lexer/token.h>
#include <cinder/parser/ast.h>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file parser.h
 * @brief Public parser API returning parse results or diagnostics.
 */

namespace cinder::parser
{

/** @brief Result of parsing: either a Program or diagnostics. */
using ParseResult = std::variant<Program, std::vector<cinder::diag::Diagnostic>>;

/** @brief Result of parsing a standalone expression. */
using ExprResult = std::variant<Expr, std::vector<cinder::diag::Diagnostic>>;

/** @brief Parse a sequence of tokens into a Program or diagnostics. */
[[nodiscard]] ParseResult parse(std::span<const cinder::lexer::Token> tokens);

/**
 * @brief Parse tokens that must form exactly one expression (optionally a bare tuple).
 *
 * Leading indentation is ignored, matching how a single line is evaluated on its own.
 */
[[nodiscard]] ExprResult parse_expression(std::span<const cinder::lexer::Token> tokens);

/** @brief Lex and parse script text in one step. */
[[nodiscard]] ParseResult parse_source(std::string_view text);

/** @brief Lex and parse a standalone expression in one step. */
[[nodiscard]] ExprResult parse_expression_source(std::string_view text);

/** @brief Dump a Program to an s-expression string (for debugging/tests). */
[[nodiscard]] std::string dump(const Program& program);

/** @brief Dump a single expression to an s-expression string. */
[[nodiscard]] std::string dump(const Expr& expr);

} // namespace cinder::parser
