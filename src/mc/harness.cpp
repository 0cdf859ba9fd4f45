#include <algorithm>
#include <cstdlib>
#include <examkit/mc/canonical.h>
#include <examkit/mc/evaluators.h>
#include <examkit/mc/harness.h>
#include <iostream>
#include <optional>
#include <unordered_map>

namespace examkit::mc
{

namespace
{

bool debug_enabled()
{
    return std::getenv("EXAMKIT_DEBUG_HARNESS") != nullptr;
}

struct SortKey
{
    std::optional<double> number;
    std::string canonical;
};

bool key_less(const SortKey& a, const SortKey& b)
{
    if (a.number.has_value() != b.number.has_value())
    {
        return a.number.has_value();
    }
    if (a.number.has_value())
    {
        return *a.number < *b.number;
    }
    return a.canonical < b.canonical;
}

bool key_equal(const SortKey& a, const SortKey& b)
{
    return !key_less(a, b) && !key_less(b, a);
}

} // namespace

std::string Collision::description() const
{
    return "duplicate option between '" + kept_source_id + "' and '" + duplicate_source_id +
           "': " + canonical_text;
}

std::vector<std::string> HarnessOptions::default_labels()
{
    std::vector<std::string> labels;
    labels.reserve(26);
    for (char c = 'A'; c <= 'Z'; ++c)
    {
        labels.emplace_back(1, c);
    }
    return labels;
}

std::vector<Collision> find_collisions(const std::vector<OptionCandidate>& candidates)
{
    std::vector<Collision> collisions;
    std::unordered_map<std::string, std::size_t> first_seen;
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        std::string canonical = canonicalize(candidates[i].content_text);
        const auto [it, inserted] = first_seen.emplace(canonical, i);
        if (!inserted)
        {
            collisions.push_back(Collision{
                .kept_source_id = candidates[it->second].source_id,
                .duplicate_source_id = candidates[i].source_id,
                .canonical_text = std::move(canonical),
            });
        }
    }
    return collisions;
}

std::vector<ConsolidatedOption> sort_and_label(std::vector<OptionCandidate> candidates,
                                               const HarnessOptions& options)
{
    struct Keyed
    {
        SortKey key;
        OptionCandidate candidate;
    };

    std::vector<Keyed> keyed;
    keyed.reserve(candidates.size());
    for (auto& candidate : candidates)
    {
        SortKey key{.number = leading_number(candidate.content_text),
                    .canonical = canonicalize(candidate.content_text)};
        keyed.push_back(Keyed{.key = std::move(key), .candidate = std::move(candidate)});
    }

    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const Keyed& a, const Keyed& b)
                     {
                         if (!key_equal(a.key, b.key))
                         {
                             return key_less(a.key, b.key);
                         }
                         return a.candidate.source_id < b.candidate.source_id;
                     });

    std::vector<ConsolidatedOption> out;
    out.reserve(keyed.size());
    for (std::size_t i = 0; i < keyed.size(); ++i)
    {
        auto& c = keyed[i].candidate;
        out.push_back(ConsolidatedOption{
            .label = i < options.labels.size() ? options.labels[i] : options.overflow_label,
            .content_text = std::move(c.content_text),
            .is_correct = c.is_correct,
            .rationale_text = std::move(c.rationale_text),
            .source_id = std::move(c.source_id),
        });
    }
    return out;
}

ConsolidationOutcome
ConsolidationHarness::consolidate(std::string_view answer_code,
                                  const std::vector<DistractorSnippet>& distractors,
                                  const examkit::sandbox::Parameters& params) const
{
    std::vector<OptionCandidate> candidates;
    candidates.reserve(distractors.size() + 1);

    auto answer = evaluate_answer(executor_, answer_code, params, "answer");
    if (auto* err = std::get_if<EvaluationError>(&answer))
    {
        if (debug_enabled())
        {
            std::cerr << "[harness] answer failed: " << err->message << "\n";
        }
        return std::move(*err);
    }
    auto& solved = std::get<AnswerResult>(answer);
    candidates.push_back(OptionCandidate{
        .source_id = "answer",
        .content_text = std::move(solved.final_answer_text),
        .is_correct = true,
        .rationale_text = std::move(solved.explanation_md),
    });

    for (const auto& snippet : distractors)
    {
        auto evaluated = evaluate_distractor(executor_, snippet.code, params, snippet.source_id);
        if (auto* err = std::get_if<EvaluationError>(&evaluated))
        {
            if (debug_enabled())
            {
                std::cerr << "[harness] distractor '" << snippet.source_id
                          << "' failed: " << err->message << "\n";
            }
            return std::move(*err);
        }
        auto& result = std::get<DistractorResult>(evaluated);
        if (debug_enabled() && result.repaired)
        {
            std::cerr << "[harness] distractor '" << snippet.source_id
                      << "': swapped distractor_md and rationale\n";
        }
        candidates.push_back(OptionCandidate{
            .source_id = snippet.source_id,
            .content_text = std::move(result.distractor_md),
            .is_correct = false,
            .rationale_text = std::move(result.rationale),
        });
    }

    ConsolidationResult result;
    result.collisions = find_collisions(candidates);
    result.options = sort_and_label(std::move(candidates), options_);

    if (debug_enabled())
    {
        for (const auto& option : result.options)
        {
            std::cerr << "[harness] " << option.label << " <- " << option.source_id << "\n";
        }
        for (const auto& collision : result.collisions)
        {
            std::cerr << "[harness] " << collision.description() << "\n";
        }
    }
    return result;
}

} // namespace examkit::mc
