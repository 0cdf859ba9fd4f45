#include <cstdlib>
#include <examkit/mc/evaluators.h>
#include <iostream>
#include <string>

using examkit::mc::ErrorKind;
using examkit::mc::EvaluationError;
using examkit::sandbox::Parameters;
using examkit::sandbox::SandboxExecutor;

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

template <typename T> static T expect_ok(const examkit::mc::Evaluation<T>& res)
{
    if (const auto* err = std::get_if<EvaluationError>(&res))
    {
        fail("expected success, got: " + err->describe());
    }
    return std::get<T>(res);
}

template <typename T>
static EvaluationError expect_error(const examkit::mc::Evaluation<T>& res, ErrorKind kind)
{
    const auto* err = std::get_if<EvaluationError>(&res);
    if (err == nullptr)
    {
        fail("expected a '" + std::string(examkit::mc::to_string(kind)) + "' error");
    }
    if (err->kind != kind)
    {
        fail("expected kind '" + std::string(examkit::mc::to_string(kind)) + "', got '" +
             std::string(examkit::mc::to_string(err->kind)) + "': " + err->message);
    }
    return *err;
}

static void expect_message(const EvaluationError& err, const std::string& message)
{
    if (err.message != message)
    {
        fail("expected message '" + message + "', got '" + err.message + "'");
    }
}

int main()
{
    const SandboxExecutor executor;
    const Parameters params{{"p1", std::int64_t{100}}, {"t1", 300.0}, {"p2", std::int64_t{150}}};

    // answer: values come back trimmed
    {
        const auto res = examkit::mc::evaluate_answer(executor, R"(fn solve(params) {
    let t2 = params.t1 * params.p2 / params.p1;
    return {
        explanation_md: "  Gay-Lussac: T2 = T1 * p2 / p1.\n",
        final_answer_text: "  " + fmt(t2, 0) + " K  ",
    };
})",
                                                      params);
        const auto out = expect_ok(res);
        if (out.final_answer_text != "450 K")
        {
            fail("unexpected final_answer_text: '" + out.final_answer_text + "'");
        }
        if (out.explanation_md != "Gay-Lussac: T2 = T1 * p2 / p1.")
        {
            fail("unexpected explanation_md: '" + out.explanation_md + "'");
        }
    }

    // answer: contract violations name the field
    {
        const auto empty = expect_error(
            examkit::mc::evaluate_answer(executor,
                                         "fn solve(params) { return { final_answer_text: \"\" }; }",
                                         params),
            ErrorKind::ContractViolation);
        if (empty.field != "final_answer_text")
        {
            fail("expected the empty field to be named, got '" + empty.field + "'");
        }
        expect_message(empty, "field 'final_answer_text' must be a non-empty string");

        const auto missing = expect_error(
            examkit::mc::evaluate_answer(
                executor, "fn solve(params) { return { final_answer_text: \"450 K\" }; }", params),
            ErrorKind::ContractViolation);
        if (missing.field != "explanation_md")
        {
            fail("expected explanation_md to be reported missing");
        }
        expect_message(missing, "solve(params) result is missing field 'explanation_md'");

        const auto blank = expect_error(
            examkit::mc::evaluate_answer(
                executor,
                "fn solve(params) { return { final_answer_text: \"450 K\", explanation_md: \" \\n\" "
                "}; }",
                params),
            ErrorKind::ContractViolation);
        expect_message(blank, "field 'explanation_md' must be a non-empty string");

        const auto typed = expect_error(
            examkit::mc::evaluate_answer(
                executor,
                "fn solve(params) { return { final_answer_text: 450, explanation_md: \"x\" }; }",
                params),
            ErrorKind::ContractViolation);
        expect_message(typed, "field 'final_answer_text' must be a string, got 'int'");

        const auto scalar = expect_error(
            examkit::mc::evaluate_answer(executor, "fn solve(params) { return 450; }", params),
            ErrorKind::ContractViolation);
        expect_message(scalar, "solve(params) must return a record, got 'int'");
        if (!scalar.field.empty())
        {
            fail("a non-record result has no field to name");
        }
    }

    // answer: sandbox failures keep their kind and cause
    {
        const auto missing = expect_error(
            examkit::mc::evaluate_answer(executor, "fn compute(params) { return 1; }", params,
                                         "answer-v2"),
            ErrorKind::MissingEntryPoint);
        expect_message(missing, "code must define callable solve(params)");
        if (missing.source_id != "answer-v2" ||
            missing.describe() != "'answer-v2': code must define callable solve(params)")
        {
            fail("unexpected describe(): " + missing.describe());
        }

        const auto raised = expect_error(
            examkit::mc::evaluate_answer(
                executor, "fn solve(params) { return fail(\"p1 must be positive\"); }", params),
            ErrorKind::RuntimeError);
        expect_message(raised, "runtime error: p1 must be positive");

        const auto broken = expect_error(
            examkit::mc::evaluate_answer(executor, "fn solve(params) { return }", params),
            ErrorKind::CompileError);
        if (broken.message.rfind("compile error: <answer>:1:", 0) != 0 ||
            broken.diagnostics.empty())
        {
            fail("unexpected compile error: " + broken.message);
        }
    }

    // distractor: explanation in the content slot is swapped back
    {
        const auto res = examkit::mc::evaluate_distractor(executor, R"(fn distractor(params) {
    return {
        distractor_md: "Mistakenly applies inverse scaling between p and T.",
        rationale: "47.3 C",
    };
})",
                                                          params);
        const auto out = expect_ok(res);
        if (!out.repaired)
        {
            fail("expected the swap repair to be applied");
        }
        if (out.distractor_md != "47.3 C" ||
            out.rationale != "Mistakenly applies inverse scaling between p and T.")
        {
            fail("swap repair produced: '" + out.distractor_md + "' / '" + out.rationale + "'");
        }
    }

    // distractor: a well-formed result is left alone
    {
        const auto res = examkit::mc::evaluate_distractor(executor, R"(fn distractor(params) {
    return {
        distractor_md: "47.3 C",
        rationale: "Mistakenly applies inverse scaling between p and T.",
    };
})",
                                                          params);
        const auto out = expect_ok(res);
        if (out.repaired || out.distractor_md != "47.3 C")
        {
            fail("a correctly labeled distractor must not be swapped");
        }
    }

    // distractor: two sentences are not a swap candidate
    {
        const auto res = examkit::mc::evaluate_distractor(executor, R"(fn distractor(params) {
    return { distractor_md: "Uses Celsius throughout.", rationale: "Forgets to convert." };
})",
                                                          params);
        const auto out = expect_ok(res);
        if (out.repaired)
        {
            fail("the repair must only fire for a numeric rationale");
        }
    }

    // distractor: the swap does not rescue a missing field
    {
        const auto err = expect_error(
            examkit::mc::evaluate_distractor(
                executor,
                "fn distractor(params) { return { distractor_md: \"Divides instead of "
                "multiplying.\" }; }",
                params),
            ErrorKind::ContractViolation);
        if (err.field != "rationale")
        {
            fail("expected rationale to be reported missing");
        }
        expect_message(err, "distractor(params) result is missing field 'rationale'");

        const auto entry = expect_error(
            examkit::mc::evaluate_distractor(executor, "fn solve(params) { return {}; }", params),
            ErrorKind::MissingEntryPoint);
        expect_message(entry, "code must define callable distractor(params)");
    }

    // checker
    {
        const Parameters submission{{"answer", std::string("450 K")}};
        const Parameters context{{"expected", std::int64_t{450}}};

        const auto graded = examkit::mc::evaluate_checker(executor, R"(fn grade(submission, context) {
    if (float(submission.answer) == context.expected) {
        return { verdict: "correct", feedback: "matches" };
    }
    return { verdict: "incorrect" };
})",
                                                          submission, context);
        // "450 K" is not a plain number, so float() raises.
        const auto raised = expect_error(graded, ErrorKind::RuntimeError);
        expect_message(raised, "runtime error: could not convert string to float: '450 K'");

        const auto ok = expect_ok(examkit::mc::evaluate_checker(
            executor,
            "fn grade(submission, context) { return { verdict: \"correct\", feedback: \"matches\" "
            "}; }",
            submission, context));
        if (ok.verdict != examkit::mc::Verdict::Correct || ok.score != 1.0 ||
            ok.feedback != "matches")
        {
            fail("unexpected checker defaults for a correct verdict");
        }

        const auto partial = expect_ok(examkit::mc::evaluate_checker(
            executor,
            "fn grade(submission, context) { return { verdict: \"partial\", score: 0.5 }; }",
            submission, context));
        if (partial.verdict != examkit::mc::Verdict::Partial || partial.score != 0.5 ||
            !partial.feedback.empty())
        {
            fail("unexpected partial checker result");
        }

        const auto wrong = expect_ok(examkit::mc::evaluate_checker(
            executor, "fn grade(submission, context) { return { verdict: \"incorrect\" }; }",
            submission, context));
        if (wrong.score != 0.0 || examkit::mc::to_string(wrong.verdict) != "incorrect")
        {
            fail("an incorrect verdict defaults to a zero score");
        }

        const auto bad_verdict = expect_error(
            examkit::mc::evaluate_checker(
                executor, "fn grade(submission, context) { return { verdict: \"maybe\" }; }",
                submission, context),
            ErrorKind::ContractViolation);
        expect_message(bad_verdict, "verdict must be correct, partial, or incorrect");
        if (bad_verdict.field != "verdict")
        {
            fail("expected the verdict field to be named");
        }

        const auto bad_score = expect_error(
            examkit::mc::evaluate_checker(
                executor,
                "fn grade(submission, context) { return { verdict: \"correct\", score: \"high\" }; "
                "}",
                submission, context),
            ErrorKind::ContractViolation);
        expect_message(bad_score, "field 'score' must be a number, got 'string'");

        const auto bad_feedback = expect_error(
            examkit::mc::evaluate_checker(
                executor,
                "fn grade(submission, context) { return { verdict: \"correct\", feedback: 1 }; }",
                submission, context),
            ErrorKind::ContractViolation);
        expect_message(bad_feedback, "field 'feedback' must be a string, got 'int'");

        const auto one_arg = expect_error(
            examkit::mc::evaluate_checker(
                executor, "fn grade(submission) { return { verdict: \"correct\" }; }", submission,
                context),
            ErrorKind::MissingEntryPoint);
        expect_message(one_arg, "code must define callable grade(submission, context)");
    }

    std::cout << "OK\n";
    return 0;
}
