#pragma once

#include <examkit/runtime/symbol_table.h>
#include <string>
#include <string_view>
#include <variant>

/**
 * @file equivalence.h
 * @brief Algebraic equivalence of two expression strings, decided by Z3.
 */

namespace examkit::symbolic
{

struct EquivalenceError
{
    std::string message;
};

using EquivalenceResult = std::variant<bool, EquivalenceError>;

/**
 * @brief True when `lhs - rhs` vanishes wherever every denominator is non-zero.
 *
 * Parse failures, unsupported constructs and an inconclusive solver result are errors.
 */
[[nodiscard]] EquivalenceResult equivalent(std::string_view lhs, std::string_view rhs,
                                           unsigned timeout_ms);

/** @brief Register `sym_equal(a, b)` under the `symbolic` capability. */
void register_builtins(examkit::runtime::SymbolTable& table);

} // namespace examkit::symbolic
