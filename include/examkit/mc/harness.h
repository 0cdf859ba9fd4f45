#pragma once

#include <cstddef>
#include <examkit/mc/errors.h>
#include <examkit/sandbox/sandbox.h>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file harness.h
 * @brief Multiple-choice consolidation: evaluate every option snippet, report duplicate
 * options, then sort and label the set deterministically.
 */

namespace examkit::mc
{

/** @brief One evaluated option before sorting. */
struct OptionCandidate
{
    std::string source_id;
    std::string content_text;
    bool is_correct = false;
    std::string rationale_text;
};

/** @brief A labeled option in display order. */
struct ConsolidatedOption
{
    std::string label;
    std::string content_text;
    bool is_correct = false;
    std::string rationale_text;
    std::string source_id;
};

/** @brief Two options with the same canonical text; `kept` was seen first. */
struct Collision
{
    std::string kept_source_id;
    std::string duplicate_source_id;
    std::string canonical_text;

    /** @brief `duplicate option between '<kept>' and '<duplicate>': <canonical_text>` */
    [[nodiscard]] std::string description() const;
};

struct DistractorSnippet
{
    std::string source_id;
    std::string code;
};

struct HarnessOptions
{
    std::vector<std::string> labels = default_labels();
    std::string overflow_label = "?";

    /** @brief `A` through `Z`. */
    [[nodiscard]] static std::vector<std::string> default_labels();
};

struct ConsolidationResult
{
    std::vector<ConsolidatedOption> options;
    std::vector<Collision> collisions;
};

using ConsolidationOutcome = std::variant<ConsolidationResult, EvaluationError>;

/** @brief Collisions among `candidates` in first-seen order. */
[[nodiscard]] std::vector<Collision> find_collisions(const std::vector<OptionCandidate>& candidates);

/**
 * @brief Sort for display and assign labels.
 *
 * Candidates with a leading number come first, ascending by value; the rest follow by
 * canonical text. Equal keys fall back to `source_id`, then input order.
 */
[[nodiscard]] std::vector<ConsolidatedOption> sort_and_label(std::vector<OptionCandidate> candidates,
                                                             const HarnessOptions& options);

/**
 * @brief Runs one answer snippet and N distractor snippets sequentially.
 *
 * The first failing snippet aborts the run; the error carries its source id. Duplicate
 * options are reported in ConsolidationResult::collisions and never abort.
 */
class ConsolidationHarness
{
  public:
    explicit ConsolidationHarness(const examkit::sandbox::SandboxExecutor& executor,
                                  HarnessOptions options = {})
        : executor_(executor), options_(std::move(options))
    {
    }
    explicit ConsolidationHarness(const examkit::sandbox::SandboxExecutor&&,
                                  HarnessOptions = {}) = delete;

    [[nodiscard]] ConsolidationOutcome
    consolidate(std::string_view answer_code, const std::vector<DistractorSnippet>& distractors,
                const examkit::sandbox::Parameters& params) const;

    [[nodiscard]] const HarnessOptions& options() const { return options_; }

  private:
    const examkit::sandbox::SandboxExecutor& executor_;
    HarnessOptions options_;
};

} // namespace examkit::mc
