#pragma once

#include <cstddef>

/**
 * @file span.h
 * @brief Byte-range locations within snippet source text.
 */

namespace examkit::source
{

/**
 * @brief A [start, end) byte range within a snippet.
 */
struct Span
{
    std::size_t start = 0; // inclusive byte offset
    std::size_t end = 0;   // exclusive byte offset

    [[nodiscard]] constexpr std::size_t length() const { return end - start; }
};

/** @brief Smallest span covering `first` through `last`. */
[[nodiscard]] constexpr Span cover(const Span& first, const Span& last)
{
    return Span{.start = first.start, .end = last.end};
}

} // namespace examkit::source
