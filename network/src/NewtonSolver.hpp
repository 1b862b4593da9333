#ifndef KADMOS_NETWORK_NEWTON_SOLVER_HPP
#define KADMOS_NETWORK_NEWTON_SOLVER_HPP

#include "LinearAlgebra.hpp"
#include "Network.hpp"
#include <string>
#include <vector>

namespace kadmos {
namespace network {

struct SolveOptions {
    int max_iterations = 60;
    double residual_tolerance = 1.0e-7;     // on the 2-norm of scaled residuals
    double step_tolerance = 1.0e-9;         // on the 2-norm of the Newton step
    double finite_difference_step = 1.0e-6; // relative to max(1, |x|)
    bool damping_enabled = true;
    int diagnostics_verbosity = 1;          // 0 silent, 1 per iteration, 2 detailed
    int print_worst = 5;
    int max_backtracks = 14;
};

enum class SolveStatus {
    Converged,
    LinearizationFailure,
    StagnationFailure,
    IterationBudgetExceeded,
    EvaluationFailure,
    InconsistentFixedState
};

std::string solveStatusName(SolveStatus status);

struct SolveResult {
    bool converged = false;
    int iterations = 0;
    double residual_norm = 0.0;
    std::string message;
    SolveStatus status = SolveStatus::IterationBudgetExceeded;
    std::vector<double> residual_history;   // pre-step norm of every iteration
};

/**
 * @brief Damped Newton-Raphson driver for a Network
 *
 * The Jacobian is built by forward differences, one free variable at a time.
 * Each step is the minimum-norm least-squares solution of J dx = -F, so networks
 * with redundant (consistent) equations are handled. With damping the step is
 * halved until the residual norm does not grow.
 *
 * Configuration problems throw ConfigurationException before the first evaluation;
 * numerical failures are reported in the returned SolveResult.
 */
class NewtonSolver {
public:
    explicit NewtonSolver(const SolveOptions& options = SolveOptions());
    ~NewtonSolver() = default;

    const SolveOptions& options() const { return options_; }
    void setOptions(const SolveOptions& options) { options_ = options; }

    SolveResult solve(Network& network) const;

    // Scaled residuals of the current state
    static HostVector scaledResiduals(const std::vector<Equation>& eqs);

    // Forward-difference Jacobian of the scaled residuals; restores all free variables
    HostMatrix jacobian(Network& network, const std::vector<Variable*>& free_vars,
                        const HostVector& f0) const;

private:
    SolveOptions options_;

    SolveResult iterate(Network& network, const std::vector<Variable*>& free_vars,
                        std::vector<double>& x_restore, SolveResult& progress) const;

    void printWorst(const std::vector<Equation>& eqs) const;
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_NEWTON_SOLVER_HPP
