#pragma once

#include <z3++.h>

/**
 * @file solver.h
 * @brief Thin wrapper around Z3 used for symbolic equivalence checks.
 */

namespace examkit::symbolic
{

/** @brief Check result from the solver. */
enum class CheckResult
{
    Sat,
    Unsat,
    Unknown,
};

/**
 * @brief Owns one Z3 context and solver. Not shareable across threads; create one per query.
 */
class Solver
{
  public:
    Solver();

    [[nodiscard]] z3::context& context();
    void add(const z3::expr& constraint);
    /** @brief Bound each check(); an expired timeout yields CheckResult::Unknown. */
    void set_timeout(unsigned milliseconds);
    [[nodiscard]] CheckResult check();

  private:
    z3::context ctx_;
    z3::solver solver_;
};

} // namespace examkit::symbolic
