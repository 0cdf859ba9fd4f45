#include <examkit/mc/errors.h>
#include <utility>

namespace examkit::mc
{

std::string_view to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::CompileError:
        return "compile error";
    case ErrorKind::MissingEntryPoint:
        return "missing entry point";
    case ErrorKind::RuntimeError:
        return "runtime error";
    case ErrorKind::ContractViolation:
        return "contract violation";
    }
    return "runtime error";
}

std::string EvaluationError::describe() const
{
    if (source_id.empty())
    {
        return message;
    }
    return "'" + source_id + "': " + message;
}

EvaluationError from_sandbox_error(examkit::sandbox::SandboxError error, std::string source_id)
{
    ErrorKind kind = ErrorKind::RuntimeError;
    switch (error.kind)
    {
    case examkit::sandbox::SandboxErrorKind::CompileError:
        kind = ErrorKind::CompileError;
        break;
    case examkit::sandbox::SandboxErrorKind::MissingEntryPoint:
        kind = ErrorKind::MissingEntryPoint;
        break;
    case examkit::sandbox::SandboxErrorKind::RuntimeError:
        kind = ErrorKind::RuntimeError;
        break;
    }

    return EvaluationError{
        .kind = kind,
        .message = std::move(error.message),
        .field = {},
        .source_id = std::move(source_id),
        .diagnostics = std::move(error.diagnostics),
    };
}

EvaluationError contract_violation(std::string field, std::string message, std::string source_id)
{
    return EvaluationError{
        .kind = ErrorKind::ContractViolation,
        .message = std::move(message),
        .field = std::move(field),
        .source_id = std::move(source_id),
        .diagnostics = {},
    };
}

} // namespace examkit::mc
