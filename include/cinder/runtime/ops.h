#pragma once

#include <cinder/lexer/token.h>
#include <cinder/parser/ast.h>
#include <cinder/runtime/value.h>
#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @file ops.h
 * @brief Operator semantics shared by the interpreter, builtins and methods.
 */

namespace cinder::runtime
{

[[nodiscard]] bool truthy(const Value& value);

/** @brief Binary arithmetic / bitwise operator; `op` is a binary TokenKind (plus, star, ...). */
[[nodiscard]] Value binary_op(cinder::lexer::TokenKind op, const Value& lhs, const Value& rhs);

/** @brief In-place variant used by augmented assignment (mutates lists, sets and dicts). */
[[nodiscard]] Value inplace_op(Interpreter& interp, cinder::lexer::TokenKind op, const Value& lhs,
                               const Value& rhs);

/** @brief Unary minus, plus, invert or `not`. */
[[nodiscard]] Value unary_op(cinder::lexer::TokenKind op, const Value& operand);

[[nodiscard]] bool compare(Interpreter& interp, cinder::parser::CompareOp op, const Value& lhs,
                           const Value& rhs);

[[nodiscard]] bool values_equal(const Value& lhs, const Value& rhs);

/** @brief Ordering used by `<`, sorted() and min()/max(); raises TypeError for mixed kinds. */
[[nodiscard]] bool less_than(const Value& lhs, const Value& rhs);

[[nodiscard]] bool identical(const Value& lhs, const Value& rhs);

/** @brief Hash compatible with values_equal; raises TypeError for unhashable values. */
[[nodiscard]] std::size_t hash_value(const Value& value);

[[nodiscard]] bool contains(Interpreter& interp, const Value& container, const Value& item);

/** @brief Coerce an int-like value for indexing and counts. */
[[nodiscard]] std::int64_t to_index(const Value& value, const char* what = "indices");

/** @brief Resolve a possibly negative index; raises IndexError with `what` when out of range. */
[[nodiscard]] std::size_t normalize_index(std::int64_t index, std::size_t size, const char* what);

/** @brief Concrete slice positions for a sequence of `size` elements. */
struct SliceBounds
{
    std::int64_t start = 0;
    std::int64_t stop = 0;
    std::int64_t step = 1;
    std::size_t count = 0;
};

[[nodiscard]] SliceBounds resolve_slice(const Value& lower, const Value& upper, const Value& step,
                                        std::size_t size);

/** @brief `container[key]`. */
[[nodiscard]] Value get_item(Interpreter& interp, const Value& container, const Value& key);

/** @brief `container[lower:upper:step]`. */
[[nodiscard]] Value get_slice(const Value& container, const Value& lower, const Value& upper,
                              const Value& step);

void set_item(const Value& container, const Value& key, Value value);
void set_slice(Interpreter& interp, const Value& container, const Value& lower, const Value& upper,
               const Value& step, const Value& values);
void delete_item(const Value& container, const Value& key);
void delete_slice(const Value& container, const Value& lower, const Value& upper, const Value& step);

/** @brief Coerce `v` to the element type of `array`; raises TypeError on mismatch. */
[[nodiscard]] Value check_array_item(const ArrayObject& array, const Value& v);

/** @brief iter(value); raises TypeError for non-iterables. */
[[nodiscard]] Value make_iter(const Value& iterable);

/** @brief Number of elements for sized containers; raises TypeError otherwise. */
[[nodiscard]] std::size_t length(const Value& value);

/** @brief Checked 64-bit integer helpers; raise OverflowError. */
[[nodiscard]] std::int64_t checked_add(std::int64_t a, std::int64_t b);
[[nodiscard]] std::int64_t checked_sub(std::int64_t a, std::int64_t b);
[[nodiscard]] std::int64_t checked_mul(std::int64_t a, std::int64_t b);
[[nodiscard]] Value power(const Value& base, const Value& exponent);

/** @brief Value of an int-valued float; raises OverflowError / ValueError for inf and nan. */
[[nodiscard]] std::int64_t float_to_int(double value);

} // namespace cinder::runtime
