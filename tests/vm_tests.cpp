#include <chrono>
#include <cstdlib>
#include <examkit/compiler/emitter.h>
#include <examkit/lexer/lexer.h>
#include <examkit/parser/parser.h>
#include <examkit/resolver/resolver.h>
#include <examkit/runtime/symbol_table.h>
#include <examkit/vm/vm.h>
#include <iostream>
#include <string>
#include <vector>

using examkit::vm::Value;
using examkit::vm::ValueKind;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static examkit::vm::Chunk compile_or_fail(const std::string& src)
{
    const auto lexed = examkit::lexer::lex(src);
    if (!std::holds_alternative<std::vector<examkit::lexer::Token>>(lexed))
    {
        fail("lex failed for: " + src);
    }
    const auto& toks = std::get<std::vector<examkit::lexer::Token>>(lexed);
    const auto parsed = examkit::parser::parse(toks);
    if (!std::holds_alternative<examkit::parser::Program>(parsed))
    {
        fail("parse failed for: " + src);
    }
    const auto& program = std::get<examkit::parser::Program>(parsed);

    const auto& symbols = examkit::runtime::standard_symbols();
    const auto resolved =
        examkit::resolver::resolve(program, symbols, examkit::runtime::default_capabilities());
    if (!std::holds_alternative<examkit::resolver::Resolution>(resolved))
    {
        fail("resolve failed for: " + src + " (" +
             std::get<std::vector<examkit::diag::Diagnostic>>(resolved).front().message + ")");
    }

    auto emitted = examkit::compiler::emit_bytecode(
        program, std::get<examkit::resolver::Resolution>(resolved), symbols);
    if (!std::holds_alternative<examkit::vm::Chunk>(emitted))
    {
        fail("emit failed for: " + src);
    }
    return std::get<examkit::vm::Chunk>(std::move(emitted));
}

static examkit::vm::VmResult run_main(const std::string& src, examkit::vm::Limits limits = {},
                                      std::vector<Value> args = {})
{
    const auto chunk = compile_or_fail(src);
    const auto index = chunk.find_function("main");
    if (!index.has_value())
    {
        fail("expected a main function in: " + src);
    }
    examkit::vm::VM machine(examkit::runtime::standard_symbols(), limits);
    return machine.call(chunk, *index, std::move(args));
}

static Value expect_value(const std::string& src, std::vector<Value> args = {})
{
    auto res = run_main(src, {}, std::move(args));
    if (!res.ok)
    {
        fail("expected success for: " + src + " (" + res.error + ")");
    }
    return res.value;
}

static void expect_text(const std::string& src, const std::string& expected)
{
    const Value v = expect_value(src);
    const std::string got = examkit::vm::to_string(v);
    if (got != expected)
    {
        fail("for " + src + ": got '" + got + "' expected '" + expected + "'");
    }
}

static void expect_error(const std::string& src, const std::string& expected,
                         examkit::vm::Limits limits = {})
{
    const auto res = run_main(src, limits);
    if (res.ok)
    {
        fail("expected runtime error for: " + src);
    }
    if (res.error != expected)
    {
        fail("for " + src + ": got error '" + res.error + "' expected '" + expected + "'");
    }
}

int main()
{
    // Arithmetic.
    expect_text("fn main() { return 1 + 2 * 3; }", "7");
    expect_text("fn main() { return 7 / 2; }", "3.5");
    expect_text("fn main() { return 8 / 2; }", "4.0");
    expect_text("fn main() { return 7 % -3; }", "-2");
    expect_text("fn main() { return -7 % 3; }", "2");
    expect_text("fn main() { return 7.5 % 2; }", "1.5");
    expect_text("fn main() { return 2 ** 10; }", "1024");
    expect_text("fn main() { return 2 ** -1; }", "0.5");
    expect_text("fn main() { return 4 ** 0.5; }", "2.0");
    expect_text("fn main() { return -2 ** 2; }", "-4");
    expect_text("fn main() { return 1.5 + 1; }", "2.5");
    expect_text("fn main() { return 6.02e23 * 2; }", "1.204e+24");
    expect_text("fn main() { return \"m\" + \"/s\"; }", "m/s");

    // Comparison and logic.
    expect_text("fn main() { return 1 == 1.0; }", "true");
    expect_text("fn main() { return \"a\" < \"b\" && 2 >= 2; }", "true");
    expect_text("fn main() { return 1 != \"1\"; }", "true");
    expect_text("fn main() { return false && fail(\"not evaluated\"); }", "false");
    expect_text("fn main() { return true || fail(\"not evaluated\"); }", "true");
    expect_text("fn main() { return !(1 > 2); }", "true");

    // Control flow, locals, recursion.
    expect_text("fn main() { let i = 0; let s = 0; while (i < 100) { i = i + 1; s = s + i; } "
                "return s; }",
                "5050");
    expect_text("fn fact(n) { if (n <= 1) { return 1; } return n * fact(n - 1); } "
                "fn main() { return fact(10); }",
                "3628800");
    expect_text("fn sign(x) { if (x < 0) { return -1; } else if (x == 0) { return 0; } "
                "else { return 1; } } fn main() { return sign(-3) + sign(0) * 10 + sign(9) * 100; }",
                "99");
    expect_text("fn main() { let x = 1; { let x = x + 1; x = x * 10; } return x; }", "1");
    expect_text("fn main() { }", "()");

    // Records.
    expect_text("fn main() { let r = { a: 1, \"b c\": \"x\" }; return r; }", "{a: 1, b c: x}");
    expect_text("fn main() { let r = { inner: { v: 2.5 } }; return r.inner.v; }", "2.5");
    expect_text("fn main() { return { a: 1, b: 2 } == { b: 2, a: 1.0 }; }", "true");

    // Arguments.
    {
        const Value v = expect_value("fn main(p) { return p.n * 2; }",
                                     {examkit::vm::make_record({{"n", Value::int_v(21)}})});
        if (v.kind != ValueKind::Int || v.int_value != 42)
        {
            fail("expected 42 from record argument");
        }
    }

    // Runtime errors.
    expect_error("fn main() { return 1 / 0; }", "division by zero");
    expect_error("fn main() { return 1 % 0; }", "modulo by zero");
    expect_error("fn main() { return 9223372036854775807 + 1; }", "integer overflow");
    expect_error("fn main() { return 3 ** 40; }", "integer overflow");
    expect_error("fn main() { return 0 ** -1; }", "zero cannot be raised to a negative power");
    expect_error("fn main() { return (-8) ** 0.5; }",
                 "negative number cannot be raised to a fractional power");
    expect_error("fn main() { return 1 + \"a\"; }",
                 "unsupported operand types for +: 'int' and 'string'");
    expect_error("fn main() { return 1 < \"a\"; }", "cannot compare 'int' and 'string'");
    expect_error("fn main() { return { a: 1 }.b; }", "record has no field 'b'");
    expect_error("fn main() { let x = 3; return x.b; }", "cannot read field 'b' of 'int'");
    expect_error("fn main() { if (1) { return 1; } }", "condition must be bool, got 'int'");
    expect_error("fn main() { return fail(\"no valid distractor for these params\"); }",
                 "no valid distractor for these params");

    // Limits.
    {
        examkit::vm::Limits limits;
        limits.fuel = 1000;
        expect_error("fn main() { while (true) { } }", "out of fuel (limit 1000 instructions)",
                     limits);
    }
    {
        expect_error("fn f(n) { return f(n + 1); } fn main() { return f(0); }",
                     "maximum call depth of 64 exceeded");
    }
    {
        examkit::vm::Limits limits;
        limits.fuel = 1'000'000'000'000;
        limits.timeout = std::chrono::milliseconds(5);
        expect_error("fn main() { let i = 0; while (true) { i = i + 1; if (i > 1000000) { i = 0; } } }",
                     "execution timed out after 5 ms", limits);
    }
    {
        examkit::vm::Limits limits;
        limits.max_string_bytes = 8;
        expect_error("fn main() { return \"aaaaa\" + \"aaaaa\"; }",
                     "string exceeds maximum size of 8 bytes", limits);
    }

    // Spans point at the failing operation; fuel accounting is per call.
    {
        const std::string src = "fn main() {\n  return 1 / 0;\n}";
        const auto chunk = compile_or_fail(src);
        examkit::vm::VM machine(examkit::runtime::standard_symbols(), {});
        const auto res = machine.call(chunk, 0, {});
        if (res.ok || !res.error_span.has_value())
        {
            fail("expected a span on the division error");
        }
        if (src.substr(res.error_span->start, 1) != "1")
        {
            fail("expected span to start at the division expression");
        }
        if (machine.fuel_used() == 0)
        {
            fail("expected fuel to be consumed");
        }

        const auto again = machine.call(chunk, 0, {});
        if (again.ok || again.error != "division by zero")
        {
            fail("expected the VM to be reusable across calls");
        }
    }

    // Arity mismatch at the call boundary.
    {
        const auto chunk = compile_or_fail("fn main(p) { return p; }");
        examkit::vm::VM machine(examkit::runtime::standard_symbols(), {});
        const auto res = machine.call(chunk, 0, {});
        if (res.ok)
        {
            fail("expected arity mismatch to fail");
        }
    }

    // Value formatting.
    {
        if (examkit::vm::format_float(4.0) != "4.0" || examkit::vm::format_float(0.1) != "0.1" ||
            examkit::vm::format_float(1e20) != "1e+20")
        {
            fail("unexpected float formatting");
        }
        if (!(Value::int_v(2) == Value::float_v(2.0)) || Value::string_v("2") == Value::int_v(2))
        {
            fail("unexpected value equality");
        }
    }

    std::cout << "OK\n";
    return 0;
}
