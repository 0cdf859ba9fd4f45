#include <algorithm>
#include <cstddef>
#include <examkit/diag/render.h>
#include <examkit/source/line_map.h>
#include <sstream>
#include <string_view>

namespace examkit::diag
{
namespace
{

constexpr std::string_view severity_string(Severity s)
{
    switch (s)
    {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Note:
        return "note";
    }
    return "error";
}

void render_notes(std::ostringstream& out, const Diagnostic& diagnostic,
                  const examkit::source::LineMap& map)
{
    for (const auto& note : diagnostic.notes)
    {
        out << "note: ";
        if (note.span.has_value())
        {
            const auto lc = map.offset_to_line_col(note.span->start);
            out << lc.line << ":" << lc.col << ": ";
        }
        out << note.message << "\n";
    }
}

} // namespace

std::string render(const Diagnostic& diagnostic, const examkit::source::SourceFile& file)
{
    std::ostringstream out;
    const examkit::source::LineMap map(file.contents);

    if (!diagnostic.span.has_value())
    {
        out << file.path << ": " << severity_string(diagnostic.severity) << ": "
            << diagnostic.message << "\n";
        render_notes(out, diagnostic, map);
        return out.str();
    }

    const auto span = *diagnostic.span;
    const auto lc = map.offset_to_line_col(span.start);
    out << file.path << ":" << lc.line << ":" << lc.col << ": "
        << severity_string(diagnostic.severity) << ": " << diagnostic.message << "\n";

    const std::string_view line_text = map.line_text(lc.line);
    out << "  |\n";
    out << "  | " << line_text << "\n";

    // Underline the span on its first line only; always at least one caret.
    const std::size_t caret_start = std::min(lc.col - 1, line_text.size());
    const std::size_t room = std::max<std::size_t>(1, line_text.size() - caret_start);
    const std::size_t caret_len = std::clamp<std::size_t>(span.length(), 1, room);

    out << "  | " << std::string(caret_start, ' ') << std::string(caret_len, '^') << "\n";

    render_notes(out, diagnostic, map);
    return out.str();
}

std::string render_brief(const Diagnostic& diagnostic, const examkit::source::SourceFile& file)
{
    std::ostringstream out;
    out << file.path;
    if (diagnostic.span.has_value())
    {
        const examkit::source::LineMap map(file.contents);
        const auto lc = map.offset_to_line_col(diagnostic.span->start);
        out << ":" << lc.line << ":" << lc.col;
    }
    out << ": " << diagnostic.message;
    return out.str();
}

} // namespace examkit::diag
