#pragma once

#include <examkit/source/span.h>
#include <optional>
#include <string>
#include <vector>

/**
 * @file diagnostic.h
 * @brief Diagnostics produced while compiling snippets.
 */

namespace examkit::diag
{

enum class Severity
{
    Error,
    Warning,
    Note,
};

/** @brief Secondary message attached to a diagnostic (e.g. a previous definition). */
struct Related
{
    std::string message;
    std::optional<examkit::source::Span> span;
};

struct Diagnostic
{
    Severity severity = Severity::Error;
    std::string message;
    std::optional<examkit::source::Span> span;
    std::vector<Related> notes;
};

[[nodiscard]] inline Diagnostic error_at(examkit::source::Span span, std::string message)
{
    Diagnostic d;
    d.severity = Severity::Error;
    d.message = std::move(message);
    d.span = span;
    return d;
}

} // namespace examkit::diag
