#include <examkit/lexer/lexer.h>
#include <examkit/parser/parser.h>
#include <examkit/symbolic/equivalence.h>
#include <examkit/symbolic/expr_lowering.h>
#include <examkit/symbolic/solver.h>
#include <optional>

namespace examkit::symbolic
{
namespace
{

using examkit::diag::Diagnostic;
using examkit::vm::Value;
using examkit::vm::ValueKind;

// Tokens and the parsed tree view into `text`, which must stay alive while lowering.
struct ParsedSide
{
    std::vector<examkit::lexer::Token> tokens;
    std::optional<examkit::parser::Expr> expr;
};

std::optional<EquivalenceError> parse_side(std::string_view text, ParsedSide& out)
{
    auto lexed = examkit::lexer::lex(text);
    if (auto* d = std::get_if<Diagnostic>(&lexed))
    {
        return EquivalenceError{"cannot parse '" + std::string(text) + "': " + d->message};
    }
    out.tokens = std::get<std::vector<examkit::lexer::Token>>(std::move(lexed));

    auto parsed = examkit::parser::parse_expression(out.tokens);
    if (auto* diags = std::get_if<std::vector<Diagnostic>>(&parsed))
    {
        const std::string message = diags->empty() ? "parse error" : diags->front().message;
        return EquivalenceError{"cannot parse '" + std::string(text) + "': " + message};
    }
    out.expr = std::get<examkit::parser::Expr>(std::move(parsed));
    return std::nullopt;
}

EquivalenceResult decide(const ParsedSide& lhs, std::string_view lhs_text, const ParsedSide& rhs,
                         std::string_view rhs_text, unsigned timeout_ms)
{
    Solver solver;
    solver.set_timeout(timeout_ms);
    LoweringContext ctx(solver.context());

    auto left = lower_expression(*lhs.expr, ctx);
    if (auto* d = std::get_if<Diagnostic>(&left))
    {
        return EquivalenceError{"cannot compare '" + std::string(lhs_text) + "': " + d->message};
    }
    auto right = lower_expression(*rhs.expr, ctx);
    if (auto* d = std::get_if<Diagnostic>(&right))
    {
        return EquivalenceError{"cannot compare '" + std::string(rhs_text) + "': " + d->message};
    }

    for (const auto& denominator : ctx.denominators)
    {
        solver.add(denominator != solver.context().real_val(0));
    }
    if (!ctx.denominators.empty())
    {
        // No point where both sides are defined, e.g. `1/(x-x)`.
        switch (solver.check())
        {
        case CheckResult::Unsat:
            return false;
        case CheckResult::Sat:
            break;
        case CheckResult::Unknown:
            return EquivalenceError{"solver could not decide whether '" + std::string(lhs_text) +
                                    "' equals '" + std::string(rhs_text) + "'"};
        }
    }
    solver.add(std::get<z3::expr>(left) != std::get<z3::expr>(right));

    switch (solver.check())
    {
    case CheckResult::Unsat:
        return true;
    case CheckResult::Sat:
        return false;
    case CheckResult::Unknown:
        break;
    }
    return EquivalenceError{"solver could not decide whether '" + std::string(lhs_text) +
                            "' equals '" + std::string(rhs_text) + "'"};
}

} // namespace

EquivalenceResult equivalent(std::string_view lhs, std::string_view rhs, unsigned timeout_ms)
{
    ParsedSide left;
    if (auto err = parse_side(lhs, left))
    {
        return *err;
    }
    ParsedSide right;
    if (auto err = parse_side(rhs, right))
    {
        return *err;
    }

    try
    {
        return decide(left, lhs, right, rhs, timeout_ms);
    }
    catch (const z3::exception& ex)
    {
        return EquivalenceError{std::string("solver error: ") + ex.msg()};
    }
}

void register_builtins(examkit::runtime::SymbolTable& table)
{
    table.add_function(
        "sym_equal", examkit::runtime::kCapSymbolic, 2, 2,
        [](std::span<const Value> args,
           const examkit::runtime::BuiltinContext& ctx) -> examkit::runtime::BuiltinResult
        {
            for (const Value& arg : args)
            {
                if (arg.kind != ValueKind::String)
                {
                    return examkit::runtime::BuiltinError{
                        "sym_equal() expects expression strings, got " +
                        std::string(examkit::vm::kind_name(arg.kind))};
                }
            }

            auto result = equivalent(args[0].string_value, args[1].string_value,
                                     ctx.solver_budget_ms());
            if (auto* err = std::get_if<EquivalenceError>(&result))
            {
                return examkit::runtime::BuiltinError{"sym_equal: " + err->message};
            }
            return Value::bool_v(std::get<bool>(result));
        });
}

} // namespace examkit::symbolic
