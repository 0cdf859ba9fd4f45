#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

/**
 * @file line_map.h
 * @brief Offset to line/column mapping for snippet text.
 */

namespace examkit::source
{

/** @brief A 1-based line/column pair; columns count bytes. */
struct LineCol
{
    std::size_t line = 1;
    std::size_t col = 1;
};

/**
 * @brief Precomputed line starts of a text, used when rendering diagnostics.
 *
 * The map keeps a view of the text; the text must outlive the map.
 */
class LineMap
{
  public:
    explicit LineMap(std::string_view text);

    [[nodiscard]] LineCol offset_to_line_col(std::size_t offset) const;
    [[nodiscard]] std::size_t line_start_offset(std::size_t line) const;
    [[nodiscard]] std::size_t line_count() const { return line_starts_.size(); }

    /** @brief Text of the given 1-based line without its terminator. */
    [[nodiscard]] std::string_view line_text(std::size_t line) const;

  private:
    std::string_view text_;
    std::vector<std::size_t> line_starts_;
};

} // namespace examkit::source
