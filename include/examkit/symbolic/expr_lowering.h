#pragma once

#include <examkit/diag/diagnostic.h>
#include <examkit/parser/ast.h>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <z3++.h>

/**
 * @file expr_lowering.h
 * @brief Lower arithmetic snippet expressions into Z3 real arithmetic.
 */

namespace examkit::symbolic
{

/**
 * @brief State shared while lowering the two sides of one equivalence query.
 *
 * Every free name becomes a real constant, so both sides must be lowered with the same
 * context. Each divisor met is recorded in `denominators`.
 */
struct LoweringContext
{
    explicit LoweringContext(z3::context& context) : ctx(context) {}

    z3::context& ctx;
    std::unordered_map<std::string, z3::expr> vars;
    std::vector<z3::expr> denominators;
};

/** @brief Result of lowering: either a z3::expr or a diagnostic on error. */
using LoweringResult = std::variant<z3::expr, examkit::diag::Diagnostic>;

/**
 * @brief Lower `+ - * /`, unary minus, numeric literals, names, parentheses and `**`
 * with an integer literal exponent. Anything else is rejected with a diagnostic.
 */
[[nodiscard]] LoweringResult lower_expression(const examkit::parser::Expr& expr,
                                              LoweringContext& ctx);

/** @brief Exact rational text (`"602/100"`) for a decimal literal such as `6.02` or `1e-3`. */
[[nodiscard]] std::string decimal_to_rational(std::string_view lexeme);

} // namespace examkit::symbolic
