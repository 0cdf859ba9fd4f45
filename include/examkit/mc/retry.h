#pragma once

#include <algorithm>
#include <cstddef>
#include <examkit/mc/harness.h>
#include <optional>
#include <string>
#include <vector>

/**
 * @file retry.h
 * @brief Bounded regenerate-and-retry loop around the consolidation harness.
 */

namespace examkit::mc
{

/** @brief Asks for a replacement of one snippet. */
struct RegenerationRequest
{
    std::string source_id; // "answer" or a distractor id
    std::string current_code;
    std::string feedback; // error message or collision description, verbatim
    std::size_t attempt = 0;
};

/**
 * @brief Produces replacement snippets, typically by prompting a code generator.
 *
 * Returning nullopt means no replacement is available; the loop then stops.
 */
class SnippetRegenerator
{
  public:
    virtual ~SnippetRegenerator() = default;

    [[nodiscard]] virtual std::optional<std::string>
    regenerate(const RegenerationRequest& request) = 0;
};

struct RetryOutcome
{
    ConsolidationOutcome last;
    std::size_t attempts = 0;
    bool exhausted = false; // gave up with an error or collisions remaining
    std::string answer_code;
    std::vector<DistractorSnippet> distractors;
};

class RetryOrchestrator
{
  public:
    static constexpr std::size_t kDefaultMaxAttempts = 3;

    /** @brief `max_attempts` below 1 is raised to 1. */
    RetryOrchestrator(const ConsolidationHarness& harness, SnippetRegenerator& regenerator,
                      std::size_t max_attempts = kDefaultMaxAttempts)
        : harness_(harness), regenerator_(regenerator),
          max_attempts_(std::max<std::size_t>(max_attempts, 1))
    {
    }
    RetryOrchestrator(const ConsolidationHarness&&, SnippetRegenerator&,
                      std::size_t = kDefaultMaxAttempts) = delete;

    /**
     * @brief Consolidate until a run has no error and no collision, or attempts run out.
     *
     * The returned snippets are the ones used by the last run.
     */
    [[nodiscard]] RetryOutcome run(std::string answer_code,
                                   std::vector<DistractorSnippet> distractors,
                                   const examkit::sandbox::Parameters& params);

  private:
    const ConsolidationHarness& harness_;
    SnippetRegenerator& regenerator_;
    std::size_t max_attempts_;
};

} // namespace examkit::mc
