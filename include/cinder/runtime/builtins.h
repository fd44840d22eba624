#pragma once

#include <cinder/runtime/interpreter.h>
#include <cinder/runtime/value.h>
#include <string_view>

/**
 * @file builtins.h
 * @brief The builtin function and type table.
 */

namespace cinder::runtime
{

/**
 * @brief Every builtin name, including exception types.
 *
 * The sandbox strips dangerous entries before a script sees this table.
 */
[[nodiscard]] Builtins make_builtins();

/** @brief Shared type object for a builtin type name (`int`, `str`, ...); None when unknown. */
[[nodiscard]] Value builtin_type(std::string_view name);

/** @brief Type object describing `value` (what `type(value)` returns). */
[[nodiscard]] Value type_of(const Value& value);

/** @brief isinstance(value, type) for a single type object. */
[[nodiscard]] bool is_instance(const Value& value, const Value& type);

} // namespace cinder::runtime
