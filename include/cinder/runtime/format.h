#pragma once

#include <cinder/runtime/value.h>
#include <string>
#include <string_view>

/**
 * @file format.h
 * @brief Text conversions: repr(), str(), format specs and printf-style `%` formatting.
 */

namespace cinder::runtime
{

/** @brief repr() of any value. Self-referential containers print as `[...]`. */
[[nodiscard]] std::string repr(const Value& value);

/** @brief str() of any value. */
[[nodiscard]] std::string to_str(const Value& value);

/** @brief Shortest round-trip repr of a float (`1.0`, `1e-05`, `inf`). */
[[nodiscard]] std::string float_repr(double value);

/** @brief repr() of a str: quoted with the quote style scripts expect. */
[[nodiscard]] std::string quote_str(std::string_view text);

/** @brief Name reported by type(value).__name__ and in error messages. */
[[nodiscard]] std::string type_name(const Value& value);

/** @brief format(value, spec) using the format-spec mini-language. */
[[nodiscard]] std::string format_value(const Value& value, std::string_view spec);

/** @brief `fmt % args`; `args` is a tuple, a dict (for `%(name)s`) or a single value. */
[[nodiscard]] std::string percent_format(std::string_view fmt, const Value& args);

} // namespace cinder::runtime
