#include <algorithm>
#include <examkit/source/line_map.h>

namespace examkit::source
{

LineMap::LineMap(std::string_view text) : text_(text)
{
    line_starts_.push_back(0);
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\n')
        {
            line_starts_.push_back(i + 1);
        }
    }
}

LineCol LineMap::offset_to_line_col(std::size_t offset) const
{
    offset = std::min(offset, text_.size());

    // Last line start <= offset; line_starts_ always begins with 0.
    const auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    const auto index = static_cast<std::size_t>(std::distance(line_starts_.begin(), it) - 1);
    return LineCol{.line = index + 1, .col = 1 + (offset - line_starts_[index])};
}

std::size_t LineMap::line_start_offset(std::size_t line) const
{
    if (line == 0)
    {
        return 0;
    }
    if (line > line_starts_.size())
    {
        return text_.size();
    }
    return line_starts_[line - 1];
}

std::string_view LineMap::line_text(std::size_t line) const
{
    const std::size_t start = line_start_offset(line);
    if (start >= text_.size())
    {
        return {};
    }
    std::size_t end = text_.find('\n', start);
    if (end == std::string_view::npos)
    {
        end = text_.size();
    }
    if (end > start && text_[end - 1] == '\r')
    {
        --end;
    }
    return text_.substr(start, end - start);
}

} // namespace examkit::source
