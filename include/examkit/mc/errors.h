#pragma once

#include <examkit/diag/diagnostic.h>
#include <examkit/sandbox/sandbox.h>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file errors.h
 * @brief Error taxonomy shared by the evaluators, the harness and the retry loop.
 */

namespace examkit::mc
{

enum class ErrorKind
{
    CompileError,
    MissingEntryPoint,
    RuntimeError,
    ContractViolation,
};

[[nodiscard]] std::string_view to_string(ErrorKind kind);

/**
 * @brief A snippet failed to evaluate.
 *
 * `message` always carries the underlying cause verbatim. `field` names the offending
 * result field for contract violations and is empty otherwise.
 */
struct EvaluationError
{
    ErrorKind kind = ErrorKind::RuntimeError;
    std::string message;
    std::string field;
    std::string source_id;
    std::vector<examkit::diag::Diagnostic> diagnostics;

    /** @brief `'<source_id>': <message>`, or just the message when no source is known. */
    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] EvaluationError from_sandbox_error(examkit::sandbox::SandboxError error,
                                                 std::string source_id);

[[nodiscard]] EvaluationError contract_violation(std::string field, std::string message,
                                                 std::string source_id);

} // namespace examkit::mc
