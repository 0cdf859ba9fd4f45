#include <examkit/mc/canonical.h>
#include <examkit/mc/evaluators.h>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace examkit::mc
{

namespace
{

using examkit::vm::Record;
using examkit::vm::Value;
using examkit::vm::ValueKind;

constexpr std::size_t kShortAnswerMaxChars = 32;
constexpr std::size_t kShortAnswerMaxWords = 4;
constexpr std::size_t kExplanationMinWords = 4;

examkit::source::SourceFile snippet_file(std::string_view source_id, std::string_view code)
{
    return examkit::source::SourceFile{.path = "<" + std::string(source_id) + ">",
                                       .contents = std::string(code)};
}

// Runs the snippet and checks that it returned a record.
std::variant<std::shared_ptr<const Record>, EvaluationError>
run_for_record(const examkit::sandbox::SandboxExecutor& executor,
               const examkit::source::SourceFile& file,
               const examkit::sandbox::EntryPoint& entry, std::vector<Value> args,
               std::string_view source_id)
{
    auto executed = executor.execute(file, entry, std::move(args));
    if (auto* err = std::get_if<examkit::sandbox::SandboxError>(&executed))
    {
        return from_sandbox_error(std::move(*err), std::string(source_id));
    }

    const auto& value = std::get<Value>(executed);
    if (value.kind != ValueKind::Record)
    {
        return contract_violation(
            "", entry.signature() + " must return a record, got '" +
                    std::string(examkit::vm::kind_name(value.kind)) + "'",
            std::string(source_id));
    }
    return value.record_value;
}

std::optional<std::string> string_field(const Record& record, std::string_view key)
{
    const Value* value = record.find(key);
    if (value == nullptr || value->kind != ValueKind::String)
    {
        return std::nullopt;
    }
    return value->string_value;
}

// Non-empty trimmed string field, or the violation naming it.
std::variant<std::string, EvaluationError> required_text(const Record& record,
                                                         std::string_view key,
                                                         std::string_view entry,
                                                         std::string_view source_id)
{
    const Value* value = record.find(key);
    if (value == nullptr)
    {
        return contract_violation(std::string(key),
                                  std::string(entry) + " result is missing field '" +
                                      std::string(key) + "'",
                                  std::string(source_id));
    }
    if (value->kind != ValueKind::String)
    {
        return contract_violation(std::string(key),
                                  "field '" + std::string(key) + "' must be a string, got '" +
                                      std::string(examkit::vm::kind_name(value->kind)) + "'",
                                  std::string(source_id));
    }

    std::string text = trim(value->string_value);
    if (text.empty())
    {
        return contract_violation(std::string(key),
                                  "field '" + std::string(key) + "' must be a non-empty string",
                                  std::string(source_id));
    }
    return text;
}

} // namespace

std::string_view to_string(Verdict verdict)
{
    switch (verdict)
    {
    case Verdict::Correct:
        return "correct";
    case Verdict::Partial:
        return "partial";
    case Verdict::Incorrect:
        return "incorrect";
    }
    return "incorrect";
}

bool looks_like_short_answer(std::string_view text)
{
    const std::string trimmed = trim(text);
    return leading_number(trimmed).has_value() && trimmed.size() <= kShortAnswerMaxChars &&
           word_count(trimmed) <= kShortAnswerMaxWords;
}

bool looks_like_explanation(std::string_view text)
{
    const std::string trimmed = trim(text);
    if (trimmed.empty() || leading_number(trimmed).has_value())
    {
        return false;
    }
    const char last = trimmed.back();
    return word_count(trimmed) >= kExplanationMinWords || last == '.' || last == '!' ||
           last == '?';
}

Evaluation<AnswerResult> evaluate_answer(const examkit::sandbox::SandboxExecutor& executor,
                                         std::string_view code,
                                         const examkit::sandbox::Parameters& params,
                                         std::string_view source_id)
{
    const examkit::sandbox::EntryPoint entry{.name = "solve", .params = {"params"}};
    const auto file = snippet_file(source_id, code);

    auto ran = run_for_record(executor, file, entry,
                              {examkit::sandbox::params_to_record(params)}, source_id);
    if (auto* err = std::get_if<EvaluationError>(&ran))
    {
        return std::move(*err);
    }
    const Record& record = *std::get<std::shared_ptr<const Record>>(ran);

    // final_answer_text is the option itself, so it is reported first.
    auto answer = required_text(record, "final_answer_text", entry.signature(), source_id);
    if (auto* err = std::get_if<EvaluationError>(&answer))
    {
        return std::move(*err);
    }
    auto explanation = required_text(record, "explanation_md", entry.signature(), source_id);
    if (auto* err = std::get_if<EvaluationError>(&explanation))
    {
        return std::move(*err);
    }

    return AnswerResult{
        .explanation_md = std::move(std::get<std::string>(explanation)),
        .final_answer_text = std::move(std::get<std::string>(answer)),
    };
}

Evaluation<DistractorResult>
evaluate_distractor(const examkit::sandbox::SandboxExecutor& executor, std::string_view code,
                    const examkit::sandbox::Parameters& params, std::string_view source_id)
{
    const examkit::sandbox::EntryPoint entry{.name = "distractor", .params = {"params"}};
    const auto file = snippet_file(source_id, code);

    auto ran = run_for_record(executor, file, entry,
                              {examkit::sandbox::params_to_record(params)}, source_id);
    if (auto* err = std::get_if<EvaluationError>(&ran))
    {
        return std::move(*err);
    }
    std::shared_ptr<const Record> record = std::get<std::shared_ptr<const Record>>(ran);

    bool repaired = false;
    const auto content = string_field(*record, "distractor_md");
    const auto rationale = string_field(*record, "rationale");
    if (content.has_value() && rationale.has_value() && looks_like_explanation(*content) &&
        looks_like_short_answer(*rationale))
    {
        auto swapped = std::make_shared<Record>(*record);
        for (auto& [key, value] : swapped->fields)
        {
            if (key == "distractor_md")
            {
                value = Value::string_v(*rationale);
            }
            else if (key == "rationale")
            {
                value = Value::string_v(*content);
            }
        }
        record = std::move(swapped);
        repaired = true;
    }

    auto distractor_md = required_text(*record, "distractor_md", entry.signature(), source_id);
    if (auto* err = std::get_if<EvaluationError>(&distractor_md))
    {
        return std::move(*err);
    }
    auto why = required_text(*record, "rationale", entry.signature(), source_id);
    if (auto* err = std::get_if<EvaluationError>(&why))
    {
        return std::move(*err);
    }

    return DistractorResult{
        .distractor_md = std::move(std::get<std::string>(distractor_md)),
        .rationale = std::move(std::get<std::string>(why)),
        .repaired = repaired,
    };
}

Evaluation<CheckerResult> evaluate_checker(const examkit::sandbox::SandboxExecutor& executor,
                                           std::string_view code,
                                           const examkit::sandbox::Parameters& submission,
                                           const examkit::sandbox::Parameters& context,
                                           std::string_view source_id)
{
    const examkit::sandbox::EntryPoint entry{.name = "grade",
                                             .params = {"submission", "context"}};
    const auto file = snippet_file(source_id, code);

    auto ran = run_for_record(executor, file, entry,
                              {examkit::sandbox::params_to_record(submission),
                               examkit::sandbox::params_to_record(context)},
                              source_id);
    if (auto* err = std::get_if<EvaluationError>(&ran))
    {
        return std::move(*err);
    }
    const Record& record = *std::get<std::shared_ptr<const Record>>(ran);

    CheckerResult result;
    const auto verdict = string_field(record, "verdict");
    if (verdict == "correct")
    {
        result.verdict = Verdict::Correct;
    }
    else if (verdict == "partial")
    {
        result.verdict = Verdict::Partial;
    }
    else if (verdict == "incorrect")
    {
        result.verdict = Verdict::Incorrect;
    }
    else
    {
        return contract_violation("verdict",
                                  "verdict must be correct, partial, or incorrect",
                                  std::string(source_id));
    }

    result.score = result.verdict == Verdict::Correct ? 1.0 : 0.0;
    if (const Value* score = record.find("score"); score != nullptr)
    {
        if (!score->is_number())
        {
            return contract_violation("score",
                                      "field 'score' must be a number, got '" +
                                          std::string(examkit::vm::kind_name(score->kind)) +
                                          "'",
                                      std::string(source_id));
        }
        result.score = score->as_double();
    }

    if (const Value* feedback = record.find("feedback"); feedback != nullptr)
    {
        if (feedback->kind != ValueKind::String)
        {
            return contract_violation("feedback",
                                      "field 'feedback' must be a string, got '" +
                                          std::string(examkit::vm::kind_name(feedback->kind)) +
                                          "'",
                                      std::string(source_id));
        }
        result.feedback = feedback->string_value;
    }

    return result;
}

} // namespace examkit::mc
