#pragma once

#include <examkit/diag/diagnostic.h>
#include <examkit/source/source_file.h>
#include <string>

namespace examkit::diag
{

/** @brief Multi-line rendering with the offending source line and a caret underline. */
[[nodiscard]] std::string render(const Diagnostic& diagnostic,
                                 const examkit::source::SourceFile& file);

/** @brief Single-line `path:line:col: message` form, used inside error messages. */
[[nodiscard]] std::string render_brief(const Diagnostic& diagnostic,
                                       const examkit::source::SourceFile& file);

} // namespace examkit::diag
