#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <examkit/compiler/emitter.h>
#include <examkit/diag/render.h>
#include <examkit/lexer/lexer.h>
#include <examkit/parser/parser.h>
#include <examkit/resolver/resolver.h>
#include <examkit/sandbox/sandbox.h>
#include <examkit/vm/vm.h>
#include <iostream>
#include <type_traits>

namespace examkit::sandbox
{

namespace
{

using examkit::vm::Value;

bool debug_enabled()
{
    return std::getenv("EXAMKIT_DEBUG_SANDBOX") != nullptr;
}

bool is_blank(std::string_view text)
{
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

SandboxError compile_error(const std::vector<examkit::diag::Diagnostic>& diags,
                           const examkit::source::SourceFile& file)
{
    SandboxError err;
    err.kind = SandboxErrorKind::CompileError;
    err.message = "compile error: " + examkit::diag::render_brief(diags.front(), file);
    if (diags.size() > 1)
    {
        err.message += " (and " + std::to_string(diags.size() - 1) + " more)";
    }
    err.diagnostics = diags;
    return err;
}

} // namespace

std::string_view to_string(SandboxErrorKind kind)
{
    switch (kind)
    {
    case SandboxErrorKind::CompileError:
        return "compile error";
    case SandboxErrorKind::MissingEntryPoint:
        return "missing entry point";
    case SandboxErrorKind::RuntimeError:
        return "runtime error";
    }
    return "runtime error";
}

Value params_to_record(const Parameters& params)
{
    std::vector<std::pair<std::string, Value>> fields;
    fields.reserve(params.size());
    for (const auto& [key, scalar] : params)
    {
        Value value = std::visit(
            [](const auto& v) -> Value
            {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::int64_t>)
                {
                    return Value::int_v(v);
                }
                else if constexpr (std::is_same_v<T, double>)
                {
                    return Value::float_v(v);
                }
                else
                {
                    return Value::string_v(v);
                }
            },
            scalar);
        fields.emplace_back(key, std::move(value));
    }
    return examkit::vm::make_record(std::move(fields));
}

std::string EntryPoint::signature() const
{
    std::string out = name + "(";
    for (std::size_t i = 0; i < params.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += params[i];
    }
    out += ")";
    return out;
}

ExecuteResult SandboxExecutor::execute(const examkit::source::SourceFile& code,
                                       const EntryPoint& entry, std::vector<Value> args) const
{
    if (is_blank(code.contents))
    {
        return SandboxError{.kind = SandboxErrorKind::CompileError,
                            .message = "code is empty",
                            .diagnostics = {}};
    }

    auto lexed = examkit::lexer::lex(code.contents);
    if (auto* d = std::get_if<examkit::diag::Diagnostic>(&lexed))
    {
        return compile_error({*d}, code);
    }
    const auto& tokens = std::get<std::vector<examkit::lexer::Token>>(lexed);

    auto parsed = examkit::parser::parse(tokens);
    if (auto* diags = std::get_if<std::vector<examkit::diag::Diagnostic>>(&parsed))
    {
        return compile_error(*diags, code);
    }
    const auto& program = std::get<examkit::parser::Program>(parsed);

    auto resolved = examkit::resolver::resolve(program, symbols_, policy_.capabilities);
    if (auto* diags = std::get_if<std::vector<examkit::diag::Diagnostic>>(&resolved))
    {
        return compile_error(*diags, code);
    }
    const auto& resolution = std::get<examkit::resolver::Resolution>(resolved);

    auto emitted = examkit::compiler::emit_bytecode(program, resolution, symbols_);
    if (auto* diags = std::get_if<std::vector<examkit::diag::Diagnostic>>(&emitted))
    {
        return compile_error(*diags, code);
    }
    const auto& chunk = std::get<examkit::vm::Chunk>(emitted);

    if (debug_enabled())
    {
        std::cerr << "[sandbox] compiled " << code.path << ": " << chunk.functions.size()
                  << " function(s), " << chunk.code.size() << " bytes\n";
    }

    const auto index = chunk.find_function(entry.name);
    if (!index.has_value() || chunk.functions[*index].arity != args.size())
    {
        return SandboxError{.kind = SandboxErrorKind::MissingEntryPoint,
                            .message = "code must define callable " + entry.signature(),
                            .diagnostics = {}};
    }

    examkit::vm::VM machine(symbols_, examkit::vm::Limits{
                                          .fuel = policy_.fuel,
                                          .timeout = policy_.timeout,
                                          .max_call_depth = policy_.max_call_depth,
                                          .max_string_bytes = policy_.max_string_bytes,
                                          .solver_timeout_ms = policy_.solver_timeout_ms,
                                      });
    auto result = machine.call(chunk, *index, std::move(args));

    if (debug_enabled())
    {
        std::cerr << "[sandbox] " << code.path << ": " << entry.name << " "
                  << (result.ok ? "returned" : "failed") << " after " << machine.fuel_used()
                  << " instruction(s)\n";
    }

    if (!result.ok)
    {
        SandboxError err;
        err.kind = SandboxErrorKind::RuntimeError;
        err.message = "runtime error: " + result.error;
        if (result.error_span.has_value())
        {
            err.diagnostics.push_back(examkit::diag::error_at(*result.error_span, result.error));
        }
        return err;
    }
    return std::move(result.value);
}

ExecuteResult SandboxExecutor::execute(const examkit::source::SourceFile& code,
                                       std::string_view entry_point,
                                       const Parameters& params) const
{
    return execute(code, EntryPoint{.name = std::string(entry_point), .params = {"params"}},
                   {params_to_record(params)});
}

} // namespace examkit::sandbox
