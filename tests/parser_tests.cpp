#include <cstdlib>
#include <examkit/lexer/lexer.h>
#include <examkit/parser/parser.h>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static std::vector<examkit::lexer::Token> lex_or_fail(std::string_view src)
{
    auto lexed = examkit::lexer::lex(src);
    if (!std::holds_alternative<std::vector<examkit::lexer::Token>>(lexed))
    {
        fail("lex failed for: " + std::string(src));
    }
    return std::get<std::vector<examkit::lexer::Token>>(std::move(lexed));
}

static std::string dump_program(const std::string& src)
{
    const auto toks = lex_or_fail(src);
    const auto res = examkit::parser::parse(toks);
    if (!std::holds_alternative<examkit::parser::Program>(res))
    {
        fail("parse failed for: " + src + " (" +
             std::get<std::vector<examkit::diag::Diagnostic>>(res).front().message + ")");
    }
    return examkit::parser::dump(std::get<examkit::parser::Program>(res));
}

static std::string dump_expr(const std::string& src)
{
    const auto toks = lex_or_fail(src);
    const auto res = examkit::parser::parse_expression(toks);
    if (!std::holds_alternative<examkit::parser::Expr>(res))
    {
        fail("expression parse failed for: " + src);
    }
    return examkit::parser::dump(std::get<examkit::parser::Expr>(res));
}

static std::vector<examkit::diag::Diagnostic> parse_errors(const std::string& src)
{
    const auto toks = lex_or_fail(src);
    auto res = examkit::parser::parse(toks);
    if (!std::holds_alternative<std::vector<examkit::diag::Diagnostic>>(res))
    {
        fail("expected parse failure for: " + src);
    }
    return std::get<std::vector<examkit::diag::Diagnostic>>(std::move(res));
}

static void expect_eq(const std::string& got, const std::string& expected, const std::string& what)
{
    if (got != expected)
    {
        fail(what + ": got '" + got + "' expected '" + expected + "'");
    }
}

int main()
{
    // Functions, parameters, statements.
    expect_eq(dump_program("fn add(a, b) { return a + b; }"),
              "fn add(a, b) { return (a + b); }\n", "simple function");

    expect_eq(dump_program("fn solve(params) { let x = params.n; x = x * 2; return; }"),
              "fn solve(params) { let x = params.n; x = (x * 2); return; }\n",
              "let/assign/return");

    expect_eq(dump_program("fn f() {} fn g() { f(); }"), "fn f() { }\nfn g() { f(); }\n",
              "two functions");

    // Control flow; `else if` nests an if in an else block.
    expect_eq(dump_program("fn f(x) { if (x < 0) { return 0; } else if (x == 0) { return 1; } "
                           "else { return 2; } }"),
              "fn f(x) { if ((x < 0)) { return 0; } else { if ((x == 0)) { return 1; } else "
              "{ return 2; } } }\n",
              "if/else if/else");

    expect_eq(dump_program("fn f() { while (true) { { } } }"),
              "fn f() { while (true) { { } } }\n", "while with nested block");

    // Precedence and associativity.
    expect_eq(dump_expr("1 + 2 * 3"), "(1 + (2 * 3))", "mul binds tighter than add");
    expect_eq(dump_expr("1 - 2 - 3"), "((1 - 2) - 3)", "sub is left-assoc");
    expect_eq(dump_expr("2 ** 3 ** 2"), "(2 ** (3 ** 2))", "pow is right-assoc");
    expect_eq(dump_expr("-x ** 2"), "-(x ** 2)", "pow binds tighter than unary minus");
    expect_eq(dump_expr("2 ** -1"), "(2 ** -1)", "unary exponent");
    expect_eq(dump_expr("a || b && !c"), "(a || (b && !c))", "logical precedence");
    expect_eq(dump_expr("a < b == c >= d"), "((a < b) == (c >= d))", "comparison under equality");
    expect_eq(dump_expr("10 % 3 / 2"), "((10 % 3) / 2)", "factor operators");
    expect_eq(dump_expr("(1 + 2) * 3"), "(((1 + 2)) * 3)", "grouping");

    // Postfix: calls and member access chain.
    expect_eq(dump_expr("fmt(p.speed, 2).x"), "fmt(p.speed, 2).x", "call and member chain");

    // Record literals: identifier or string keys, trailing comma.
    expect_eq(dump_expr("{ final_answer_text: \"2 m/s\", \"explanation_md\": x, }"),
              "{ final_answer_text: \"2 m/s\", explanation_md: x }", "record literal");
    expect_eq(dump_expr("{}"), "{}", "empty record");

    // Ids are unique and non-zero across expressions.
    {
        const auto toks = lex_or_fail("fn f(a) { let b = a + 1; return b; }");
        const auto res = examkit::parser::parse(toks);
        const auto& program = std::get<examkit::parser::Program>(res);
        const auto& let = std::get<examkit::parser::LetStmt>(program.functions[0].body.stmts[0].node);
        if (let.id == 0 || let.value.id == 0 || let.id == let.value.id)
        {
            fail("expected distinct non-zero ids");
        }
    }

    // Errors.
    {
        const auto ds = parse_errors("let x = 1;");
        if (ds.front().message != "expected 'fn' at top level")
        {
            fail("unexpected top-level error: " + ds.front().message);
        }
    }
    {
        const auto ds = parse_errors("fn f() { return 1 }");
        if (ds.front().message != "expected ';' after return statement")
        {
            fail("unexpected missing-semicolon error: " + ds.front().message);
        }
    }
    {
        const auto ds = parse_errors("fn f() { return { a: 1, a: 2 }; }");
        if (ds.front().message != "duplicate key 'a' in record literal")
        {
            fail("unexpected duplicate-key error: " + ds.front().message);
        }
        if (ds.front().notes.empty() || ds.front().notes.front().message != "previous entry is here")
        {
            fail("expected note pointing at the previous key");
        }
    }
    {
        // Recovery: both broken functions are reported.
        const auto ds = parse_errors("fn f( { } fn g() { let = 1; }");
        if (ds.size() < 2)
        {
            fail("expected diagnostics from both functions");
        }
    }
    {
        const auto toks = lex_or_fail("1 + 2 3");
        const auto res = examkit::parser::parse_expression(toks);
        const auto* ds = std::get_if<std::vector<examkit::diag::Diagnostic>>(&res);
        if (ds == nullptr || ds->front().message != "unexpected token after expression")
        {
            fail("expected trailing-token error for standalone expression");
        }
    }
    // Nesting limits.
    {
        const std::string ok_nested = std::string(200, '(') + "1" + std::string(200, ')');
        const auto ok_toks = lex_or_fail(ok_nested);
        if (!std::holds_alternative<examkit::parser::Expr>(
                examkit::parser::parse_expression(ok_toks)))
        {
            fail("200 levels of grouping must parse");
        }

        auto expect_too_deep = [](const std::string& src, const std::string& message)
        {
            const auto ds = parse_errors(src);
            for (const auto& d : ds)
            {
                if (d.message == message)
                {
                    return;
                }
            }
            fail("expected '" + message + "', first diagnostic: " + ds.front().message);
        };
        const std::string deep_parens = "fn f() { return " + std::string(20000, '(') + "1" +
                                        std::string(20000, ')') + "; }";
        expect_too_deep(deep_parens, "expression nested too deeply");
        expect_too_deep("fn f(x) { return " + std::string(20000, '-') + "x; }",
                        "expression nested too deeply");

        std::string chain = "fn f(x) { return x";
        for (int i = 0; i < 5000; ++i)
        {
            chain += " + x";
        }
        expect_too_deep(chain + "; }", "expression nested too deeply");

        std::string members = "fn f(x) { return x";
        for (int i = 0; i < 5000; ++i)
        {
            members += ".a";
        }
        expect_too_deep(members + "; }", "expression nested too deeply");

        expect_too_deep("fn f() { " + std::string(20000, '{') + std::string(20000, '}') + " }",
                        "blocks nested too deeply");

        std::string else_chain = "fn f(x) { if (x) { }";
        for (int i = 0; i < 5000; ++i)
        {
            else_chain += " else if (x) { }";
        }
        expect_too_deep(else_chain + " }", "blocks nested too deeply");
    }
    {
        const auto toks = lex_or_fail("");
        const auto res = examkit::parser::parse_expression(toks);
        const auto* ds = std::get_if<std::vector<examkit::diag::Diagnostic>>(&res);
        if (ds == nullptr || ds->front().message != "expected expression")
        {
            fail("expected error for empty expression");
        }
    }

    std::cout << "OK\n";
    return 0;
}
