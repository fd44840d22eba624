#pragma once

#include <cinder/diag/diagnostic.h>
#include <cinder/lexer/token.h>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file lexer.h
 * @brief Public lexer API: tokenizes script text into Token sequences or a diagnostic.
 *
 * Layout is indentation sensitive: the token stream carries Newline, Indent and Dedent
 * tokens for logical lines, and brackets suspend line breaks.
 */

namespace cinder::lexer
{

/** @brief Result of lexing: token vector on success, diagnostic on failure. */
using LexResult = std::variant<std::vector<Token>, cinder::diag::Diagnostic>;

/**
 * @brief Lex the provided input into tokens.
 *
 * On success the stream ends with Newline (when the last logical line is not empty), the
 * Dedents that close open blocks, and a terminal Eof token.
 */
[[nodiscard]] LexResult lex(std::string_view input);

} // namespace cinder::lexer
