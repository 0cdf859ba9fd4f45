#include <chrono>
#include <cstdlib>
#include <examkit/sandbox/sandbox.h>
#include <iostream>
#include <string>
#include <type_traits>

using examkit::sandbox::ExecuteResult;
using examkit::sandbox::Parameters;
using examkit::sandbox::SandboxError;
using examkit::sandbox::SandboxErrorKind;
using examkit::sandbox::SandboxExecutor;
using examkit::sandbox::SandboxPolicy;
using examkit::source::SourceFile;
using examkit::vm::Value;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static SourceFile snippet(std::string code)
{
    return SourceFile{.path = "answer", .contents = std::move(code)};
}

static Value expect_value(const ExecuteResult& res)
{
    if (const auto* err = std::get_if<SandboxError>(&res))
    {
        fail("expected a value, got error: " + err->message);
    }
    return std::get<Value>(res);
}

static SandboxError expect_error(const ExecuteResult& res, SandboxErrorKind kind,
                                        const std::string& message)
{
    const auto* err = std::get_if<SandboxError>(&res);
    if (err == nullptr)
    {
        fail("expected error '" + message + "', got value " +
             examkit::vm::to_string(std::get<Value>(res)));
    }
    if (err->kind != kind)
    {
        fail("expected kind '" + std::string(examkit::sandbox::to_string(kind)) + "', got '" +
             std::string(examkit::sandbox::to_string(err->kind)) + "' (" + err->message + ")");
    }
    if (err->message != message)
    {
        fail("expected message '" + message + "', got '" + err->message + "'");
    }
    return *err;
}

static_assert(!std::is_constructible_v<SandboxExecutor, examkit::runtime::SymbolTable,
                                       SandboxPolicy>,
              "an executor must not bind to a temporary symbol table");

int main()
{
    const SandboxExecutor executor;
    const Parameters params{{"mass", std::int64_t{2}}, {"g", 9.8}, {"unit", std::string("N")}};

    // happy path
    {
        const auto res = executor.execute(snippet(R"(fn solve(params) {
    let w = params.mass * params.g;
    return { value: w, label: fmt(w, 1) + " " + params.unit };
})"),
                                          "solve", params);
        const Value out = expect_value(res);
        const Value* label = out.record_value->find("label");
        if (label == nullptr || label->string_value != "19.6 N")
        {
            fail("unexpected label: " + examkit::vm::to_string(out));
        }
    }

    // helpers defined alongside the entry point
    {
        const auto res = executor.execute(snippet(R"(fn square(x) { return x * x; }
fn solve(params) { return square(params.mass) + 1; })"),
                                          "solve", params);
        if (!(expect_value(res) == Value::int_v(5)))
        {
            fail("expected helper call to yield 5");
        }
    }

    // params_to_record
    {
        const Value rec = examkit::sandbox::params_to_record(params);
        if (rec.kind != examkit::vm::ValueKind::Record || rec.record_value->fields.size() != 3)
        {
            fail("params_to_record must produce a three-field record");
        }
        const Value* g = rec.record_value->find("g");
        if (g == nullptr || !(*g == Value::float_v(9.8)))
        {
            fail("params_to_record lost the float parameter");
        }
        const Value* mass = rec.record_value->find("mass");
        if (mass == nullptr || mass->kind != examkit::vm::ValueKind::Int)
        {
            fail("params_to_record must keep integers as ints");
        }
    }

    // empty code
    {
        expect_error(executor.execute(snippet(""), "solve", params),
                     SandboxErrorKind::CompileError, "code is empty");
        expect_error(executor.execute(snippet("  \n\t\n"), "solve", params),
                     SandboxErrorKind::CompileError, "code is empty");
    }

    // compile errors carry the first diagnostic
    {
        const auto err = expect_error(executor.execute(snippet("fn solve(params) {\n"
                                                                "    return speed;\n"
                                                                "}\n"),
                                                        "solve", params),
                                       SandboxErrorKind::CompileError,
                                       "compile error: answer:2:12: unknown name 'speed'");
        if (err.diagnostics.size() != 1)
        {
            fail("expected the resolver diagnostic to be attached");
        }

        const auto many = std::get<SandboxError>(executor.execute(
            snippet("fn solve(params) { return a + b; }"), "solve", params));
        if (many.kind != SandboxErrorKind::CompileError ||
            many.message.find("(and 1 more)") == std::string::npos)
        {
            fail("expected the extra diagnostic count, got: " + many.message);
        }
    }

    // missing entry point
    {
        expect_error(executor.execute(snippet("fn answer(params) { return 1; }"), "solve", params),
                     SandboxErrorKind::MissingEntryPoint,
                     "code must define callable solve(params)");
        expect_error(executor.execute(snippet("fn solve() { return 1; }"), "solve", params),
                     SandboxErrorKind::MissingEntryPoint,
                     "code must define callable solve(params)");

        const examkit::sandbox::EntryPoint check{.name = "check",
                                                 .params = {"submission", "context"}};
        if (check.signature() != "check(submission, context)")
        {
            fail("unexpected signature: " + check.signature());
        }
    }

    // runtime errors
    {
        expect_error(executor.execute(snippet(R"(fn solve(params) {
    if (params.mass < 5) { fail("mass must be at least 5 kg"); }
    return 0;
})"),
                                      "solve", params),
                     SandboxErrorKind::RuntimeError, "runtime error: mass must be at least 5 kg");

        const auto err = expect_error(
            executor.execute(snippet("fn solve(params) { return params.volume; }"), "solve",
                             params),
            SandboxErrorKind::RuntimeError, "runtime error: record has no field 'volume'");
        if (err.diagnostics.empty() || !err.diagnostics.front().span.has_value())
        {
            fail("expected a located runtime diagnostic");
        }
    }

    // resource caps
    {
        SandboxPolicy policy;
        policy.fuel = 500;
        const SandboxExecutor tight(policy);
        const auto res =
            tight.execute(snippet("fn solve(params) { while (true) { } return 0; }"), "solve",
                          params);
        const auto* err = std::get_if<SandboxError>(&res);
        if (err == nullptr || err->kind != SandboxErrorKind::RuntimeError ||
            err->message.find("out of fuel") == std::string::npos)
        {
            fail("expected the fuel cap to stop an infinite loop");
        }

        const auto deep = executor.execute(
            snippet("fn down(n) { return down(n + 1); }\nfn solve(params) { return down(0); }"),
            "solve", params);
        const auto* deep_err = std::get_if<SandboxError>(&deep);
        if (deep_err == nullptr || deep_err->message.find("maximum call depth") == std::string::npos)
        {
            fail("expected unbounded recursion to hit the call depth cap");
        }
    }

    // the wall-clock limit also bounds time spent inside builtins
    {
        SandboxPolicy policy;
        policy.fuel = 10'000'000;
        policy.timeout = std::chrono::milliseconds(100);
        const SandboxExecutor timed(policy);

        const auto started = std::chrono::steady_clock::now();
        const auto res = timed.execute(snippet(R"(fn solve(params) {
    let i = 0;
    while (i < 400) {
        sym_equal("(a + b + c + d)**12 * (a - b)**6",
                  "(a - b)**6 * (a + b + c + d)**12 + x*y*z - z*y*x");
        i = i + 1;
    }
    return i;
})"),
                                       "solve", params);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        const auto* err = std::get_if<SandboxError>(&res);
        if (err == nullptr || err->kind != SandboxErrorKind::RuntimeError ||
            err->message.find("timed out") == std::string::npos)
        {
            fail("expected solver-heavy code to hit the time limit");
        }
        if (elapsed > std::chrono::milliseconds(1000))
        {
            fail("time limit overshot: " + std::to_string(elapsed.count()) + " ms");
        }
    }

    // deep nesting is an error, not a crash
    {
        const std::string nested = "fn solve(params) { return " + std::string(5000, '(') + "1" +
                                   std::string(5000, ')') + "; }";
        const auto compiled = executor.execute(snippet(nested), "solve", params);
        const auto* compile_err = std::get_if<SandboxError>(&compiled);
        if (compile_err == nullptr || compile_err->kind != SandboxErrorKind::CompileError ||
            compile_err->message.find("expression nested too deeply") == std::string::npos)
        {
            fail("expected deeply nested source to be a compile error");
        }

        const auto built = executor.execute(snippet(R"ek(fn solve(params) {
    let s = "x";
    let i = 0;
    while (i < 5000) {
        s = "(" + s + ")";
        i = i + 1;
    }
    return sym_equal(s, "x");
})ek"),
                                            "solve", params);
        const auto* built_err = std::get_if<SandboxError>(&built);
        if (built_err == nullptr || built_err->kind != SandboxErrorKind::RuntimeError ||
            built_err->message.find("expression nested too deeply") == std::string::npos)
        {
            fail("expected a deeply nested sym_equal argument to raise");
        }
    }

    // capabilities hide builtins at compile time
    {
        SandboxPolicy policy;
        policy.capabilities = {std::string(examkit::runtime::kCapCore)};
        const SandboxExecutor core_only(policy);
        expect_error(core_only.execute(snippet("fn solve(params) { return sqrt(4); }"), "solve",
                                       params),
                     SandboxErrorKind::CompileError, "compile error: answer:1:27: unknown name 'sqrt'");

        const auto ok = executor.execute(snippet("fn solve(params) { return sqrt(4.0); }"),
                                         "solve", params);
        if (!(expect_value(ok) == Value::float_v(2.0)))
        {
            fail("sqrt should be callable under the default policy");
        }
    }

    // the executor is reusable across snippets
    {
        for (int i = 0; i < 3; ++i)
        {
            const auto res = executor.execute(
                snippet("fn solve(params) { return params.mass * " + std::to_string(i) + "; }"),
                "solve", params);
            if (!(expect_value(res) == Value::int_v(2 * i)))
            {
                fail("unexpected result on reuse " + std::to_string(i));
            }
        }
    }

    std::cout << "OK\n";
    return 0;
}
