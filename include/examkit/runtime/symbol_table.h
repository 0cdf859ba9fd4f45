#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <examkit/runtime/capabilities.h>
#include <examkit/vm/value.h>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

/**
 * @file symbol_table.h
 * @brief Read-only catalogue of builtins callable from snippets.
 */

namespace examkit::runtime
{

/** @brief Per-call limits a builtin must honor. */
struct BuiltinContext
{
    std::size_t max_string_bytes = 64 * 1024;
    unsigned solver_timeout_ms = 1000;
    // Wall-clock deadline of the enclosing run; unset when the caller has none.
    std::optional<std::chrono::steady_clock::time_point> deadline;

    /**
     * @brief Solver budget for one query: `solver_timeout_ms`, cut to the time left before
     * `deadline`. Never 0, which Z3 would read as "no limit".
     */
    [[nodiscard]] unsigned solver_budget_ms() const
    {
        if (!deadline.has_value())
        {
            return std::max(solver_timeout_ms, 1u);
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline - std::chrono::steady_clock::now());
        return static_cast<unsigned>(std::clamp<std::int64_t>(
            left.count(), 1, std::max(solver_timeout_ms, 1u)));
    }
};

/** @brief A builtin failure; the message is reported to the caller verbatim. */
struct BuiltinError
{
    std::string message;
};

using BuiltinResult = std::variant<examkit::vm::Value, BuiltinError>;
using BuiltinFn =
    std::function<BuiltinResult(std::span<const examkit::vm::Value>, const BuiltinContext&)>;

/**
 * @brief One named entry: either a callable with an arity range or a constant.
 */
struct Symbol
{
    std::string name;
    std::string capability;
    std::size_t min_arity = 0;
    std::optional<std::size_t> max_arity; // nullopt: variadic
    BuiltinFn fn;
    std::optional<examkit::vm::Value> constant;

    [[nodiscard]] bool is_constant() const { return constant.has_value(); }

    [[nodiscard]] bool accepts(std::size_t argc) const
    {
        return argc >= min_arity && (!max_arity.has_value() || argc <= *max_arity);
    }
};

/**
 * @brief Builtins keyed by name. Populated once, then shared read-only.
 */
class SymbolTable
{
  public:
    std::size_t add_function(std::string name, std::string_view capability,
                             std::size_t min_arity, std::optional<std::size_t> max_arity,
                             BuiltinFn fn);
    std::size_t add_constant(std::string name, std::string_view capability,
                             examkit::vm::Value value);

    [[nodiscard]] std::optional<std::size_t> find(std::string_view name) const;

    /** @brief Like find(), but hides symbols whose capability is not granted. */
    [[nodiscard]] std::optional<std::size_t> find_visible(std::string_view name,
                                                          const Capabilities& granted) const;

    [[nodiscard]] const Symbol& at(std::size_t index) const { return symbols_.at(index); }
    [[nodiscard]] std::size_t size() const { return symbols_.size(); }

  private:
    std::vector<Symbol> symbols_;
    std::unordered_map<std::string, std::size_t> by_name_;

    std::size_t add(Symbol symbol);
};

void register_core_builtins(SymbolTable& table);
void register_math_builtins(SymbolTable& table);

/** @brief Process-wide table with every capability's builtins; built on first use. */
[[nodiscard]] const SymbolTable& standard_symbols();

/** @brief "expects N argument(s)" style phrase for a symbol's arity range. */
[[nodiscard]] std::string describe_arity(const Symbol& symbol);

} // namespace examkit::runtime
