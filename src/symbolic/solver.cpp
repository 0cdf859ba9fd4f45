#include <examkit/symbolic/solver.h>

namespace examkit::symbolic
{

Solver::Solver() : solver_(ctx_) {}

z3::context& Solver::context()
{
    return ctx_;
}

void Solver::add(const z3::expr& constraint)
{
    solver_.add(constraint);
}

void Solver::set_timeout(unsigned milliseconds)
{
    z3::params params(ctx_);
    params.set("timeout", milliseconds);
    solver_.set(params);
}

CheckResult Solver::check()
{
    switch (solver_.check())
    {
    case z3::sat:
        return CheckResult::Sat;
    case z3::unsat:
        return CheckResult::Unsat;
    default:
        return CheckResult::Unknown;
    }
}

} // namespace examkit::symbolic
