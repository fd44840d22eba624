#pragma once

#include <cinder/diag/diagnostic.h>
#include <cinder/source/span.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

/**
 * @file literal.h
 * @brief Decoding of numeric and string literal lexemes.
 */

namespace cinder::parser
{

/** @brief Shape of a string literal lexeme: prefix flags and the text between the quotes. */
struct StringLiteralInfo
{
    bool raw = false;
    bool bytes = false;
    bool formatted = false;
    std::size_t body_offset = 0; // offset of body within the lexeme
    std::string_view body;
};

[[nodiscard]] StringLiteralInfo classify_string_literal(std::string_view lexeme);

using DecodeResult = std::variant<std::string, cinder::diag::Diagnostic>;

/**
 * @brief Decode backslash escapes in `body`.
 *
 * `offset` is the absolute position of `body` in the source, used for diagnostic spans. In
 * bytes mode `\x` produces a raw byte and non-ASCII characters are rejected; otherwise escapes
 * produce UTF-8. Unknown escapes keep their backslash.
 */
[[nodiscard]] DecodeResult decode_escapes(std::string_view body, bool bytes, std::size_t offset);

/** @brief Append the UTF-8 encoding of code point `cp` to `out`. */
void append_utf8(std::string& out, std::uint32_t cp);

using IntLiteralResult = std::variant<std::int64_t, cinder::diag::Diagnostic>;

/** @brief Parse an integer lexeme (`0x`, `0o`, `0b` prefixes, `_` separators). */
[[nodiscard]] IntLiteralResult parse_int_literal(std::string_view lexeme,
                                                 cinder::source::Span span);

/** @brief Parse a float or imaginary lexeme; a trailing `j` is ignored. */
[[nodiscard]] double parse_float_literal(std::string_view lexeme);

} // namespace cinder::parser
