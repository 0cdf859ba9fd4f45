#pragma once

#include <chrono>
#include <cstddef>
#include <examkit/runtime/symbol_table.h>
#include <examkit/source/span.h>
#include <examkit/vm/bytecode.h>
#include <optional>
#include <string>
#include <vector>

/**
 * @file vm.h
 * @brief Bytecode interpreter with per-run resource limits.
 */

namespace examkit::vm
{

/** @brief Resource limits applied to one VM run. */
struct Limits
{
    std::size_t fuel = 1'000'000; // instructions
    std::chrono::milliseconds timeout{2000};
    std::size_t max_call_depth = 64;
    std::size_t max_string_bytes = 64 * 1024;
    unsigned solver_timeout_ms = 1000;
};

/** @brief Result of executing a chunk in the VM. */
struct VmResult
{
    bool ok = true;
    Value value = Value::unit_v();
    std::string error;
    std::optional<examkit::source::Span> error_span;
};

/**
 * @brief Deterministic stack VM. One instance may run many calls; state is reset per call.
 */
class VM
{
  public:
    VM(const examkit::runtime::SymbolTable& symbols, Limits limits)
        : symbols_(symbols), limits_(limits)
    {
    }

    /**
     * @brief Call `chunk.functions[function_index]` with `args` and run to completion.
     *
     * Fails when the arity does not match, when a limit is exceeded, or when any
     * instruction raises a runtime error.
     */
    [[nodiscard]] VmResult call(const Chunk& chunk, std::size_t function_index,
                                std::vector<Value> args);

    /** @brief Instructions executed by the most recent call. */
    [[nodiscard]] std::size_t fuel_used() const { return fuel_used_; }

  private:
    struct Frame
    {
        std::size_t function = 0;
        std::size_t return_ip = 0;
        std::size_t base = 0; // first local slot in locals_
        std::size_t stack_base = 0;
    };

    const examkit::runtime::SymbolTable& symbols_;
    Limits limits_;
    std::vector<Value> stack_;
    std::vector<Value> locals_;
    std::vector<Frame> frames_;
    std::size_t fuel_used_ = 0;

    void push(Value value);
    std::optional<Value> pop();
};

} // namespace examkit::vm
