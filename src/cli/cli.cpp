#include <charconv>
#include <chrono>
#include <cstdint>
#include <examkit/cli/cli.h>
#include <examkit/diag/render.h>
#include <examkit/lexer/lexer.h>
#include <examkit/mc/evaluators.h>
#include <examkit/mc/harness.h>
#include <examkit/parser/parser.h>
#include <examkit/resolver/resolver.h>
#include <examkit/runtime/symbol_table.h>
#include <examkit/sandbox/sandbox.h>
#include <examkit/source/source_file.h>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace examkit::cli
{

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCollisions = 3;

constexpr std::string_view kVersion = "0.1.0";

void print_usage(std::ostream& out)
{
    out << "examkit: multiple-choice answer sandbox and consolidation harness\n\n";
    out << "usage:\n";
    out << "  examkit --help\n";
    out << "  examkit --version\n";
    out << "  examkit parse <file>\n";
    out << "  examkit check [--cap <capability>]... <file>\n";
    out << "  examkit answer [options] <file>\n";
    out << "  examkit distractor [options] <file>\n";
    out << "  examkit grade [options] [--submit <key>=<value>]... <file>\n";
    out << "  examkit consolidate [options] --answer <file> [--distractor <id>=<file>]...\n\n";
    out << "options:\n";
    out << "  --param <key>=<value>   snippet parameter (repeatable)\n";
    out << "  --fuel <n>              instruction budget per snippet\n";
    out << "  --timeout-ms <n>        wall-clock limit per snippet\n";
    out << "  --cap <capability>      grant a capability (repeatable; replaces the defaults)\n";
}

bool is_help_flag(std::string_view arg)
{
    return arg == "--help" || arg == "-h" || arg == "help";
}

int usage_error(const std::string& message)
{
    std::cerr << "error: " << message << "\n\n";
    print_usage(std::cerr);
    return kExitUsage;
}

/** @brief Integer first, then double, otherwise the raw text. */
sandbox::Scalar parse_scalar(std::string_view text)
{
    const char* first = text.data();
    const char* last = text.data() + text.size();

    std::int64_t i = 0;
    if (auto [ptr, ec] = std::from_chars(first, last, i); ec == std::errc{} && ptr == last)
    {
        return i;
    }

    double d = 0.0;
    if (auto [ptr, ec] = std::from_chars(first, last, d); ec == std::errc{} && ptr == last)
    {
        return d;
    }
    return std::string(text);
}

std::optional<std::size_t> parse_count(std::string_view text)
{
    std::size_t n = 0;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, n);
    if (ec != std::errc{} || ptr != last || text.empty())
    {
        return std::nullopt;
    }
    return n;
}

struct Options
{
    sandbox::SandboxPolicy policy;
    bool caps_given = false;
    sandbox::Parameters params;
    sandbox::Parameters submission;
    std::optional<std::string> answer_path;
    std::vector<std::pair<std::string, std::string>> distractor_paths; // id, path
    std::vector<std::string> positional;
};

/**
 * @brief Parse the options of `cmd`; returns a usage message on failure.
 *
 * Flags take their value from the next argument or after `=` (`--fuel=100`).
 */
std::optional<std::string> parse_options(std::string_view cmd,
                                         const std::vector<std::string_view>& args,
                                         Options& opts)
{
    const auto takes = [](std::string_view flag)
    {
        return flag == "--param" || flag == "--fuel" || flag == "--timeout-ms" ||
               flag == "--cap" || flag == "--submit" || flag == "--answer" ||
               flag == "--distractor";
    };

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        std::string_view a = args[i];
        if (!a.starts_with('-') || a == "-")
        {
            opts.positional.emplace_back(a);
            continue;
        }

        std::string_view flag = a;
        std::optional<std::string_view> value;
        if (const auto eq = a.find('='); eq != std::string_view::npos)
        {
            flag = a.substr(0, eq);
            value = a.substr(eq + 1);
        }
        if (!takes(flag))
        {
            return "unknown option: " + std::string(a);
        }
        if (!value.has_value())
        {
            if (i + 1 >= args.size())
            {
                return "expected a value after " + std::string(flag);
            }
            value = args[++i];
        }

        const bool for_grade = cmd == "grade";
        const bool for_consolidate = cmd == "consolidate";
        if (cmd == "check" && flag != "--cap")
        {
            return "option " + std::string(flag) + " is not valid for check";
        }

        if (flag == "--param" || flag == "--submit")
        {
            if (flag == "--submit" && !for_grade)
            {
                return "--submit is only valid for grade";
            }
            const auto eq = value->find('=');
            if (eq == std::string_view::npos || eq == 0)
            {
                return "expected <key>=<value> after " + std::string(flag);
            }
            auto& target = flag == "--param" ? opts.params : opts.submission;
            target[std::string(value->substr(0, eq))] = parse_scalar(value->substr(eq + 1));
        }
        else if (flag == "--fuel" || flag == "--timeout-ms")
        {
            const auto n = parse_count(*value);
            if (!n.has_value() || *n == 0)
            {
                return "expected a positive integer after " + std::string(flag);
            }
            if (flag == "--fuel")
            {
                opts.policy.fuel = *n;
            }
            else
            {
                opts.policy.timeout = std::chrono::milliseconds(*n);
            }
        }
        else if (flag == "--cap")
        {
            if (!runtime::is_known_capability(*value))
            {
                return "unknown capability: " + std::string(*value);
            }
            if (!opts.caps_given)
            {
                opts.policy.capabilities.clear();
                opts.caps_given = true;
            }
            opts.policy.capabilities.insert(std::string(*value));
        }
        else if (flag == "--answer")
        {
            if (!for_consolidate)
            {
                return "--answer is only valid for consolidate";
            }
            if (opts.answer_path.has_value())
            {
                return "expected a single --answer <file>";
            }
            opts.answer_path = std::string(*value);
        }
        else if (flag == "--distractor")
        {
            if (!for_consolidate)
            {
                return "--distractor is only valid for consolidate";
            }
            // `<id>=<file>`; a bare path uses the file stem as id.
            const auto eq = value->find('=');
            if (eq == 0 || eq + 1 == value->size())
            {
                return "expected <id>=<file> after --distractor";
            }
            if (eq == std::string_view::npos)
            {
                const std::string path(*value);
                opts.distractor_paths.emplace_back(std::filesystem::path(path).stem().string(),
                                                   path);
            }
            else
            {
                opts.distractor_paths.emplace_back(std::string(value->substr(0, eq)),
                                                   std::string(value->substr(eq + 1)));
            }
        }
    }
    return std::nullopt;
}

std::optional<source::SourceFile> load_or_report(const std::string& path)
{
    auto loaded = source::load_source_file(path);
    if (auto* err = std::get_if<source::LoadError>(&loaded))
    {
        const source::SourceFile pseudo_file{.path = path, .contents = ""};
        const diag::Diagnostic diag{
            .severity = diag::Severity::Error,
            .message = err->message,
            .span = std::nullopt,
            .notes = {},
        };
        std::cerr << diag::render(diag, pseudo_file);
        return std::nullopt;
    }
    return std::get<source::SourceFile>(std::move(loaded));
}

void report(const mc::EvaluationError& err, const source::SourceFile* file)
{
    std::cerr << "error: " << mc::to_string(err.kind) << " in " << err.describe() << "\n";
    if (file == nullptr)
    {
        return;
    }
    for (const auto& d : err.diagnostics)
    {
        std::cerr << diag::render(d, *file);
    }
}

int cmd_parse(const source::SourceFile& file)
{
    const auto lexed = lexer::lex(file.contents);
    if (std::holds_alternative<diag::Diagnostic>(lexed))
    {
        std::cerr << diag::render(std::get<diag::Diagnostic>(lexed), file);
        return kExitError;
    }

    const auto& toks = std::get<std::vector<lexer::Token>>(lexed);
    const auto parsed = parser::parse(toks);
    if (std::holds_alternative<std::vector<diag::Diagnostic>>(parsed))
    {
        for (const auto& d : std::get<std::vector<diag::Diagnostic>>(parsed))
        {
            std::cerr << diag::render(d, file);
        }
        return kExitError;
    }

    std::cout << parser::dump(std::get<parser::Program>(parsed)) << "\n";
    return kExitOk;
}

int cmd_check(const source::SourceFile& file, const runtime::Capabilities& caps)
{
    const auto lexed = lexer::lex(file.contents);
    if (std::holds_alternative<diag::Diagnostic>(lexed))
    {
        std::cerr << diag::render(std::get<diag::Diagnostic>(lexed), file);
        return kExitError;
    }

    const auto& toks = std::get<std::vector<lexer::Token>>(lexed);
    const auto parsed = parser::parse(toks);
    if (std::holds_alternative<std::vector<diag::Diagnostic>>(parsed))
    {
        for (const auto& d : std::get<std::vector<diag::Diagnostic>>(parsed))
        {
            std::cerr << diag::render(d, file);
        }
        return kExitError;
    }

    const auto& program = std::get<parser::Program>(parsed);
    const auto resolved = resolver::resolve(program, runtime::standard_symbols(), caps);
    if (std::holds_alternative<std::vector<diag::Diagnostic>>(resolved))
    {
        for (const auto& d : std::get<std::vector<diag::Diagnostic>>(resolved))
        {
            std::cerr << diag::render(d, file);
        }
        return kExitError;
    }

    std::cout << "examkit check: ok (" << program.functions.size() << " function"
              << (program.functions.size() == 1 ? "" : "s") << ")\n";
    return kExitOk;
}

int cmd_answer(const source::SourceFile& file, const Options& opts)
{
    const sandbox::SandboxExecutor executor(opts.policy);
    const auto evaluated = mc::evaluate_answer(executor, file.contents, opts.params);
    if (auto* err = std::get_if<mc::EvaluationError>(&evaluated))
    {
        report(*err, &file);
        return kExitError;
    }

    const auto& result = std::get<mc::AnswerResult>(evaluated);
    std::cout << "final_answer_text: " << result.final_answer_text << "\n";
    std::cout << "explanation_md: " << result.explanation_md << "\n";
    return kExitOk;
}

int cmd_distractor(const source::SourceFile& file, const Options& opts)
{
    const sandbox::SandboxExecutor executor(opts.policy);
    const auto evaluated = mc::evaluate_distractor(executor, file.contents, opts.params);
    if (auto* err = std::get_if<mc::EvaluationError>(&evaluated))
    {
        report(*err, &file);
        return kExitError;
    }

    const auto& result = std::get<mc::DistractorResult>(evaluated);
    std::cout << "distractor_md: " << result.distractor_md << "\n";
    std::cout << "rationale: " << result.rationale << "\n";
    if (result.repaired)
    {
        std::cout << "note: distractor_md and rationale were swapped\n";
    }
    return kExitOk;
}

int cmd_grade(const source::SourceFile& file, const Options& opts)
{
    const sandbox::SandboxExecutor executor(opts.policy);
    const auto evaluated =
        mc::evaluate_checker(executor, file.contents, opts.submission, opts.params);
    if (auto* err = std::get_if<mc::EvaluationError>(&evaluated))
    {
        report(*err, &file);
        return kExitError;
    }

    const auto& result = std::get<mc::CheckerResult>(evaluated);
    std::cout << "verdict: " << mc::to_string(result.verdict) << "\n";
    std::cout << "score: " << vm::format_float(result.score) << "\n";
    std::cout << "feedback: " << result.feedback << "\n";
    return kExitOk;
}

int cmd_consolidate(const Options& opts)
{
    const auto answer = load_or_report(*opts.answer_path);
    if (!answer.has_value())
    {
        return kExitError;
    }

    std::vector<source::SourceFile> files;
    std::vector<mc::DistractorSnippet> distractors;
    for (const auto& [id, path] : opts.distractor_paths)
    {
        auto loaded = load_or_report(path);
        if (!loaded.has_value())
        {
            return kExitError;
        }
        distractors.push_back(mc::DistractorSnippet{.source_id = id, .code = loaded->contents});
        files.push_back(std::move(*loaded));
    }

    const sandbox::SandboxExecutor executor(opts.policy);
    const mc::ConsolidationHarness harness(executor);
    const auto outcome = harness.consolidate(answer->contents, distractors, opts.params);
    if (auto* err = std::get_if<mc::EvaluationError>(&outcome))
    {
        const source::SourceFile* failing = err->source_id == "answer" ? &*answer : nullptr;
        for (std::size_t i = 0; i < distractors.size() && failing == nullptr; ++i)
        {
            if (distractors[i].source_id == err->source_id)
            {
                failing = &files[i];
            }
        }
        report(*err, failing);
        return kExitError;
    }

    const auto& result = std::get<mc::ConsolidationResult>(outcome);
    for (const auto& option : result.options)
    {
        std::cout << option.label << ". " << option.content_text
                  << (option.is_correct ? "  [correct]" : "") << "  (" << option.source_id
                  << ")\n";
    }
    for (const auto& collision : result.collisions)
    {
        std::cerr << "warning: " << collision.description() << "\n";
    }
    return result.collisions.empty() ? kExitOk : kExitCollisions;
}

} // namespace

int run(int argc, char** argv)
{
    if (argc <= 1)
    {
        print_usage(std::cerr);
        return kExitUsage;
    }

    const std::string_view cmd = argv[1];
    if (is_help_flag(cmd))
    {
        print_usage(std::cout);
        return kExitOk;
    }
    if (cmd == "--version" || cmd == "version")
    {
        std::cout << "examkit " << kVersion << "\n";
        return kExitOk;
    }

    if (cmd != "parse" && cmd != "check" && cmd != "answer" && cmd != "distractor" &&
        cmd != "grade" && cmd != "consolidate")
    {
        return usage_error("unknown command: " + std::string(cmd));
    }

    std::vector<std::string_view> args;
    for (int i = 2; i < argc; ++i)
    {
        args.push_back(argv[i]);
    }

    Options opts;
    if (cmd == "parse")
    {
        if (args.size() != 1 || args[0].starts_with("--"))
        {
            return usage_error("expected examkit parse <file>");
        }
        opts.positional.emplace_back(args[0]);
    }
    else if (auto problem = parse_options(cmd, args, opts))
    {
        return usage_error(*problem);
    }

    if (cmd == "consolidate")
    {
        if (!opts.positional.empty())
        {
            return usage_error("unexpected argument: " + opts.positional.front());
        }
        if (!opts.answer_path.has_value())
        {
            return usage_error("expected --answer <file>");
        }
        return cmd_consolidate(opts);
    }

    if (opts.positional.size() != 1)
    {
        return usage_error("expected a single <file>");
    }

    const auto file = load_or_report(opts.positional.front());
    if (!file.has_value())
    {
        return kExitError;
    }

    if (cmd == "parse")
    {
        return cmd_parse(*file);
    }
    if (cmd == "check")
    {
        return cmd_check(*file, opts.policy.capabilities);
    }
    if (cmd == "answer")
    {
        return cmd_answer(*file, opts);
    }
    if (cmd == "distractor")
    {
        return cmd_distractor(*file, opts);
    }
    return cmd_grade(*file, opts);
}

} // namespace examkit::cli
