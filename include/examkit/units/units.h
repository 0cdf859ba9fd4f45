#pragma once

#include <array>
#include <examkit/runtime/symbol_table.h>
#include <string>
#include <string_view>
#include <variant>

/**
 * @file units.h
 * @brief Physical dimension analysis for unit expressions such as `9.8 meter/second**2`.
 */

namespace examkit::units
{

/** @brief Exponents of the SI base dimensions, in `BaseDimension` order. */
using Dimension = std::array<int, 7>;

enum class BaseDimension
{
    Length,
    Mass,
    Time,
    Current,
    Temperature,
    Amount,
    Luminosity,
};

struct UnitError
{
    std::string message;
};

using DimensionResult = std::variant<Dimension, UnitError>;

/**
 * @brief Dimension of an optional leading magnitude followed by a unit expression.
 *
 * Supports `*`, `/`, juxtaposition (`kg m`), `**n` / `^n` with integer exponents and
 * parentheses. Numbers anywhere in the expression are dimensionless.
 */
[[nodiscard]] DimensionResult parse_dimension(std::string_view text);

/** @brief True when both expressions reduce to the same dimension. */
[[nodiscard]] std::variant<bool, UnitError> compatible(std::string_view value_expr,
                                                       std::string_view expected_units);

/** @brief Readable form such as `[length] / [time] ** 2`; `dimensionless` for all zeros. */
[[nodiscard]] std::string format_dimension(const Dimension& dimension);

/** @brief Register `units_compatible(value_expr, expected_units)` under `units`. */
void register_builtins(examkit::runtime::SymbolTable& table);

} // namespace examkit::units
