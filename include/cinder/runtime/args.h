#pragma once

#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/value.h>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file args.h
 * @brief Argument binding helpers for native functions and methods.
 */

namespace cinder::runtime
{

/**
 * @brief Bind positional and keyword arguments to `names`.
 *
 * The first `required` names must be supplied. Raises TypeError for surplus positionals,
 * unknown or duplicate keywords and missing required arguments.
 */
[[nodiscard]] std::vector<std::optional<Value>> bind_native(CallArgs& args, std::string_view function,
                                                            std::initializer_list<std::string_view> names,
                                                            std::size_t required);

/** @brief Raise TypeError unless the call has between `min` and `max` positionals and no keywords. */
void expect_positional(const CallArgs& args, std::string_view function, std::size_t min,
                       std::size_t max);

/** @brief Remove and return a keyword argument. */
[[nodiscard]] std::optional<Value> take_keyword(CallArgs& args, std::string_view name);

/** @brief Raise TypeError when any keyword argument remains. */
void reject_keywords(const CallArgs& args, std::string_view function);

[[nodiscard]] double float_arg(const Value& value, std::string_view function);
[[nodiscard]] std::int64_t int_arg(const Value& value, std::string_view function);
[[nodiscard]] const std::string& str_arg(const Value& value, std::string_view function);

} // namespace cinder::runtime
