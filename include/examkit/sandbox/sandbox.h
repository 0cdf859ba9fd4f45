#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <examkit/diag/diagnostic.h>
#include <examkit/runtime/capabilities.h>
#include <examkit/runtime/symbol_table.h>
#include <examkit/source/source_file.h>
#include <examkit/vm/value.h>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file sandbox.h
 * @brief Compile and run one snippet against the curated builtins, under per-call caps.
 *
 * Every call lexes, parses, resolves and emits a fresh chunk and runs it in a fresh VM.
 * Nothing survives between calls; the caller's parameters are copied into an immutable
 * record before the snippet sees them.
 */

namespace examkit::sandbox
{

/** @brief Per-call caps and granted capabilities. */
struct SandboxPolicy
{
    std::size_t fuel = 1'000'000;
    std::chrono::milliseconds timeout{2000};
    std::size_t max_call_depth = 64;
    std::size_t max_string_bytes = 64 * 1024;
    unsigned solver_timeout_ms = 1000;
    examkit::runtime::Capabilities capabilities = examkit::runtime::default_capabilities();
};

enum class SandboxErrorKind
{
    CompileError,
    MissingEntryPoint,
    RuntimeError,
};

[[nodiscard]] std::string_view to_string(SandboxErrorKind kind);

struct SandboxError
{
    SandboxErrorKind kind = SandboxErrorKind::RuntimeError;
    std::string message;
    std::vector<examkit::diag::Diagnostic> diagnostics;
};

/** @brief Parameter values: integer, double or short string. */
using Scalar = std::variant<std::int64_t, double, std::string>;
using Parameters = std::map<std::string, Scalar>;

/** @brief A fresh record holding `params`, keys in sorted order. */
[[nodiscard]] examkit::vm::Value params_to_record(const Parameters& params);

/** @brief Name and parameter names of the function a snippet must define. */
struct EntryPoint
{
    std::string name;
    std::vector<std::string> params;

    /** @brief `solve(params)` */
    [[nodiscard]] std::string signature() const;
};

using ExecuteResult = std::variant<examkit::vm::Value, SandboxError>;

class SandboxExecutor
{
  public:
    explicit SandboxExecutor(SandboxPolicy policy = {})
        : SandboxExecutor(examkit::runtime::standard_symbols(), std::move(policy))
    {
    }

    SandboxExecutor(const examkit::runtime::SymbolTable& symbols, SandboxPolicy policy)
        : symbols_(symbols), policy_(std::move(policy))
    {
    }
    SandboxExecutor(const examkit::runtime::SymbolTable&&, SandboxPolicy) = delete;

    /**
     * @brief Compile `code` and call `entry` with `args`.
     *
     * Fails with CompileError when the code is empty or does not compile,
     * MissingEntryPoint when no function named `entry.name` takes `args.size()`
     * parameters, and RuntimeError when execution raises or exceeds a cap.
     */
    [[nodiscard]] ExecuteResult execute(const examkit::source::SourceFile& code,
                                        const EntryPoint& entry,
                                        std::vector<examkit::vm::Value> args) const;

    /** @brief Single-argument form: calls `entry_point(params)`. */
    [[nodiscard]] ExecuteResult execute(const examkit::source::SourceFile& code,
                                        std::string_view entry_point,
                                        const Parameters& params) const;

    [[nodiscard]] const SandboxPolicy& policy() const { return policy_; }

  private:
    const examkit::runtime::SymbolTable& symbols_;
    SandboxPolicy policy_;
};

} // namespace examkit::sandbox
