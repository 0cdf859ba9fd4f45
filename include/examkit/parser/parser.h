#pragma once

#include <examkit/diag/diagnostic.h>
#include <examkit/lexer/token.h>
#include <examkit/parser/ast.h>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file parser.h
 * @brief Public parser API returning parse results or diagnostics.
 */

namespace examkit::parser
{

/** @brief Result of parsing: either a Program or diagnostics. */
using ParseResult = std::variant<Program, std::vector<examkit::diag::Diagnostic>>;

/** @brief Result of parsing a standalone expression. */
using ExprParseResult = std::variant<Expr, std::vector<examkit::diag::Diagnostic>>;

/** @brief Parse a sequence of tokens into a Program or diagnostics. */
[[nodiscard]] ParseResult parse(std::span<const examkit::lexer::Token> tokens);

/**
 * @brief Parse tokens holding exactly one expression (followed by Eof).
 *
 * Used for expression strings handed to builtins such as `sym_equal`.
 */
[[nodiscard]] ExprParseResult parse_expression(std::span<const examkit::lexer::Token> tokens);

/** @brief Source spelling of an operator token, e.g. `**` for StarStar. */
[[nodiscard]] std::string_view op_text(examkit::lexer::TokenKind kind);

/** @brief Dump a Program to a human-readable string (for debugging/tests). */
[[nodiscard]] std::string dump(const Program& program);

/** @brief Dump a single expression in the same fully parenthesized form. */
[[nodiscard]] std::string dump(const Expr& expr);

} // namespace examkit::parser
