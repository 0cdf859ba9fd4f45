#include <cstdlib>
#include <examkit/mc/retry.h>
#include <iostream>
#include <unordered_set>
#include <utility>

namespace examkit::mc
{

namespace
{

std::string* find_code(std::string& answer_code, std::vector<DistractorSnippet>& distractors,
                       const std::string& source_id)
{
    if (source_id == "answer")
    {
        return &answer_code;
    }
    for (auto& snippet : distractors)
    {
        if (snippet.source_id == source_id)
        {
            return &snippet.code;
        }
    }
    return nullptr;
}

} // namespace

RetryOutcome RetryOrchestrator::run(std::string answer_code,
                                    std::vector<DistractorSnippet> distractors,
                                    const examkit::sandbox::Parameters& params)
{
    const bool debug = std::getenv("EXAMKIT_DEBUG_HARNESS") != nullptr;

    RetryOutcome outcome{.last = ConsolidationResult{},
                         .attempts = 0,
                         .exhausted = false,
                         .answer_code = {},
                         .distractors = {}};

    while (outcome.attempts < max_attempts_)
    {
        ++outcome.attempts;
        outcome.last = harness_.consolidate(answer_code, distractors, params);

        // Snippets to replace, with the feedback for each.
        std::vector<std::pair<std::string, std::string>> wanted;
        if (auto* err = std::get_if<EvaluationError>(&outcome.last))
        {
            wanted.emplace_back(err->source_id, err->message);
        }
        else
        {
            const auto& result = std::get<ConsolidationResult>(outcome.last);
            std::unordered_set<std::string> seen;
            for (const auto& collision : result.collisions)
            {
                if (seen.insert(collision.duplicate_source_id).second)
                {
                    wanted.emplace_back(collision.duplicate_source_id, collision.description());
                }
            }
        }

        if (wanted.empty())
        {
            break;
        }
        if (outcome.attempts == max_attempts_)
        {
            outcome.exhausted = true;
            break;
        }

        // Replacements apply only when every wanted snippet has one.
        std::vector<std::pair<std::string*, std::string>> replacements;
        for (const auto& [source_id, feedback] : wanted)
        {
            std::string* code = find_code(answer_code, distractors, source_id);
            if (code == nullptr)
            {
                break;
            }

            auto replacement = regenerator_.regenerate(RegenerationRequest{
                .source_id = source_id,
                .current_code = *code,
                .feedback = feedback,
                .attempt = outcome.attempts,
            });
            if (!replacement.has_value())
            {
                break;
            }
            if (debug)
            {
                std::cerr << "[retry] attempt " << outcome.attempts << ": regenerated '"
                          << source_id << "'\n";
            }
            replacements.emplace_back(code, std::move(*replacement));
        }

        if (replacements.size() != wanted.size())
        {
            outcome.exhausted = true;
            break;
        }
        for (auto& [code, replacement] : replacements)
        {
            *code = std::move(replacement);
        }
    }

    outcome.answer_code = std::move(answer_code);
    outcome.distractors = std::move(distractors);
    return outcome;
}

} // namespace examkit::mc
