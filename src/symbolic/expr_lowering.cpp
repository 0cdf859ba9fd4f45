#include <cstdlib>
#include <examkit/lexer/token.h>
#include <examkit/parser/parser.h>
#include <examkit/symbolic/expr_lowering.h>
#include <optional>
#include <type_traits>

namespace examkit::symbolic
{
namespace
{

using examkit::diag::Diagnostic;
using examkit::lexer::TokenKind;

constexpr long kMaxExponent = 64;
constexpr long kMaxDecimalShift = 1000;

// Integer literal exponent, allowing `-n` and `(n)`.
std::optional<long> literal_exponent(const examkit::parser::Expr& expr)
{
    if (const auto* lit = std::get_if<examkit::parser::IntExpr>(&expr.node))
    {
        if (lit->lexeme.size() > 6)
        {
            return std::nullopt;
        }
        return std::strtol(std::string(lit->lexeme).c_str(), nullptr, 10);
    }
    if (const auto* group = std::get_if<examkit::parser::GroupExpr>(&expr.node))
    {
        return literal_exponent(*group->inner);
    }
    if (const auto* unary = std::get_if<examkit::parser::UnaryExpr>(&expr.node);
        unary != nullptr && unary->op == TokenKind::Minus)
    {
        if (const auto inner = literal_exponent(*unary->rhs))
        {
            return -*inner;
        }
    }
    return std::nullopt;
}

LoweringResult lower_power(const z3::expr& base, long exponent, LoweringContext& ctx)
{
    z3::expr out = ctx.ctx.real_val(1);
    for (long i = 0; i < std::labs(exponent); ++i)
    {
        out = out * base;
    }
    if (exponent < 0)
    {
        ctx.denominators.push_back(base);
        return ctx.ctx.real_val(1) / out;
    }
    return out;
}

LoweringResult lower_node(const examkit::parser::Expr& expr, LoweringContext& ctx)
{
    return std::visit(
        [&](const auto& node) -> LoweringResult
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, examkit::parser::IntExpr>)
            {
                const std::string literal(node.lexeme);
                return ctx.ctx.real_val(literal.c_str());
            }
            else if constexpr (std::is_same_v<Node, examkit::parser::FloatExpr>)
            {
                const std::string rational = decimal_to_rational(node.lexeme);
                if (rational.empty())
                {
                    return examkit::diag::error_at(expr.span, "numeric literal out of range");
                }
                return ctx.ctx.real_val(rational.c_str());
            }
            else if constexpr (std::is_same_v<Node, examkit::parser::NameExpr>)
            {
                const std::string name(node.name);
                if (auto it = ctx.vars.find(name); it != ctx.vars.end())
                {
                    return it->second;
                }
                z3::expr var = ctx.ctx.real_const(name.c_str());
                ctx.vars.emplace(name, var);
                return var;
            }
            else if constexpr (std::is_same_v<Node, examkit::parser::GroupExpr>)
            {
                return lower_node(*node.inner, ctx);
            }
            else if constexpr (std::is_same_v<Node, examkit::parser::UnaryExpr>)
            {
                if (node.op != TokenKind::Minus)
                {
                    return examkit::diag::error_at(expr.span,
                                                   "only unary '-' is supported in expressions");
                }
                auto rhs = lower_node(*node.rhs, ctx);
                if (std::holds_alternative<Diagnostic>(rhs))
                {
                    return rhs;
                }
                return -std::get<z3::expr>(rhs);
            }
            else if constexpr (std::is_same_v<Node, examkit::parser::BinaryExpr>)
            {
                auto lhs = lower_node(*node.lhs, ctx);
                if (std::holds_alternative<Diagnostic>(lhs))
                {
                    return lhs;
                }
                const z3::expr left = std::get<z3::expr>(lhs);

                if (node.op == TokenKind::StarStar)
                {
                    const auto exponent = literal_exponent(*node.rhs);
                    if (!exponent.has_value())
                    {
                        return examkit::diag::error_at(
                            node.rhs->span, "exponent must be an integer literal");
                    }
                    if (std::labs(*exponent) > kMaxExponent)
                    {
                        return examkit::diag::error_at(node.rhs->span, "exponent is too large");
                    }
                    return lower_power(left, *exponent, ctx);
                }

                auto rhs = lower_node(*node.rhs, ctx);
                if (std::holds_alternative<Diagnostic>(rhs))
                {
                    return rhs;
                }
                const z3::expr right = std::get<z3::expr>(rhs);

                switch (node.op)
                {
                case TokenKind::Plus:
                    return left + right;
                case TokenKind::Minus:
                    return left - right;
                case TokenKind::Star:
                    return left * right;
                case TokenKind::Slash:
                    ctx.denominators.push_back(right);
                    return left / right;
                default:
                    return examkit::diag::error_at(
                        expr.span, "operator '" +
                                       std::string(examkit::parser::op_text(node.op)) +
                                       "' is not supported in expressions");
                }
            }
            else
            {
                return examkit::diag::error_at(expr.span,
                                               "unsupported construct in expression");
            }
        },
        expr.node);
}

} // namespace

std::string decimal_to_rational(std::string_view lexeme)
{
    std::string mantissa;
    long fraction_digits = 0;
    long exponent = 0;

    std::size_t i = 0;
    for (; i < lexeme.size() && lexeme[i] >= '0' && lexeme[i] <= '9'; ++i)
    {
        mantissa.push_back(lexeme[i]);
    }
    if (i < lexeme.size() && lexeme[i] == '.')
    {
        for (++i; i < lexeme.size() && lexeme[i] >= '0' && lexeme[i] <= '9'; ++i)
        {
            mantissa.push_back(lexeme[i]);
            ++fraction_digits;
        }
    }
    if (i < lexeme.size() && (lexeme[i] == 'e' || lexeme[i] == 'E'))
    {
        const std::string exp_text(lexeme.substr(i + 1));
        if (exp_text.size() > 6)
        {
            return {};
        }
        exponent = std::strtol(exp_text.c_str(), nullptr, 10);
    }

    const auto first_digit = mantissa.find_first_not_of('0');
    mantissa = first_digit == std::string::npos ? "0" : mantissa.substr(first_digit);

    const long shift = exponent - fraction_digits;
    if (std::labs(shift) > kMaxDecimalShift)
    {
        return {};
    }
    if (shift >= 0)
    {
        return mantissa + std::string(static_cast<std::size_t>(shift), '0') + "/1";
    }
    return mantissa + "/1" + std::string(static_cast<std::size_t>(-shift), '0');
}

LoweringResult lower_expression(const examkit::parser::Expr& expr, LoweringContext& ctx)
{
    return lower_node(expr, ctx);
}

} // namespace examkit::symbolic
