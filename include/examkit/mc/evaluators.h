#pragma once

#include <examkit/mc/errors.h>
#include <examkit/sandbox/sandbox.h>
#include <string>
#include <string_view>
#include <variant>

/**
 * @file evaluators.h
 * @brief Role contracts for answer, distractor and checker snippets.
 *
 * Each evaluator runs one entry point through the sandbox and validates the record it
 * returns. String fields are returned trimmed.
 */

namespace examkit::mc
{

/** @brief Validated result of `solve(params)`. */
struct AnswerResult
{
    std::string explanation_md;
    std::string final_answer_text;
};

/** @brief Validated result of `distractor(params)`. */
struct DistractorResult
{
    std::string distractor_md;
    std::string rationale;
    bool repaired = false; // fields were swapped back into place
};

enum class Verdict
{
    Correct,
    Partial,
    Incorrect,
};

[[nodiscard]] std::string_view to_string(Verdict verdict);

/** @brief Validated result of `grade(submission, context)`. */
struct CheckerResult
{
    Verdict verdict = Verdict::Incorrect;
    double score = 0.0;
    std::string feedback;
};

template <typename T> using Evaluation = std::variant<T, EvaluationError>;

/** @brief Run `solve(params)`; both result fields must be non-empty strings. */
[[nodiscard]] Evaluation<AnswerResult>
evaluate_answer(const examkit::sandbox::SandboxExecutor& executor, std::string_view code,
                const examkit::sandbox::Parameters& params, std::string_view source_id = "answer");

/**
 * @brief Run `distractor(params)` and validate it like an answer.
 *
 * When `distractor_md` reads as an explanation and `rationale` as a short numeric answer,
 * the two values are swapped once before validation.
 */
[[nodiscard]] Evaluation<DistractorResult>
evaluate_distractor(const examkit::sandbox::SandboxExecutor& executor, std::string_view code,
                    const examkit::sandbox::Parameters& params,
                    std::string_view source_id = "distractor");

/**
 * @brief Run `grade(submission, context)`.
 *
 * `verdict` is required. `score` defaults to 1.0 for a correct verdict and 0.0 otherwise;
 * `feedback` defaults to the empty string.
 */
[[nodiscard]] Evaluation<CheckerResult>
evaluate_checker(const examkit::sandbox::SandboxExecutor& executor, std::string_view code,
                 const examkit::sandbox::Parameters& submission,
                 const examkit::sandbox::Parameters& context,
                 std::string_view source_id = "checker");

/** @brief Starts with a numeric token, at most 32 characters and at most 4 words. */
[[nodiscard]] bool looks_like_short_answer(std::string_view text);

/**
 * @brief At least 4 words or ends in `.`, `!` or `?`, and does not start with a
 * numeric token.
 */
[[nodiscard]] bool looks_like_explanation(std::string_view text);

} // namespace examkit::mc
