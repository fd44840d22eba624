#pragma once

#include <cstddef>

/**
 * @file span.h
 * @brief Byte-span locations within script text.
 */

namespace cinder::source
{

/**
 * @brief Represents a byte-range within a script.
 *
 * Offsets are byte-based and [start, end) where start is inclusive and end is exclusive.
 */
struct Span
{
    std::size_t start = 0; // inclusive byte offset
    std::size_t end = 0;   // exclusive byte offset

    /** @brief Returns the length (in bytes) of the span. */
    [[nodiscard]] constexpr std::size_t length() const { return end - start; }

    /** @brief Returns a copy shifted right by `offset` bytes. */
    [[nodiscard]] constexpr Span shifted(std::size_t offset) const
    {
        return Span{.start = start + offset, .end = end + offset};
    }
};

/** @brief Smallest span covering both `a` and `b` (assumes `a` precedes `b`). */
[[nodiscard]] constexpr Span cover(const Span& a, const Span& b)
{
    return Span{.start = a.start, .end = b.end};
}

} // namespace cinder::source
