#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

/**
 * @file canonical.h
 * @brief Text normalization used for duplicate detection and option ordering.
 */

namespace examkit::mc
{

/**
 * @brief Collapse whitespace runs to one space, trim, and case-fold.
 *
 * Folding covers ASCII and the Latin-1, Greek and Cyrillic letters of UTF-8 text; the
 * micro, ohm and angstrom signs fold like the letters `μ`, `Ω` and `Å`. Other bytes,
 * including malformed UTF-8, are kept as they are.
 */
[[nodiscard]] std::string canonicalize(std::string_view text);

/** @brief Strip leading and trailing whitespace. */
[[nodiscard]] std::string trim(std::string_view text);

/**
 * @brief Value of the numeric token at the start of `text`, if any.
 *
 * Commas are removed first, so `1,250 kg` reads as 1250. The token is an optional sign,
 * digits with an optional fraction (or a bare `.5`), and an exponent when digits follow
 * the `e`. Leading whitespace is skipped. Values that overflow a double do not count.
 */
[[nodiscard]] std::optional<double> leading_number(std::string_view text);

/** @brief Number of whitespace-separated words. */
[[nodiscard]] std::size_t word_count(std::string_view text);

} // namespace examkit::mc
