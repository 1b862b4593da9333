#include "NewtonSolver.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace kadmos {
namespace network {

namespace {

std::vector<double> pack(const std::vector<Variable*>& vars) {
    std::vector<double> x(vars.size());
    for (size_t i = 0; i < vars.size(); ++i) {
        x[i] = vars[i]->value();
    }
    return x;
}

// Write and clip every free variable
void unpack(const std::vector<Variable*>& vars, const std::vector<double>& x) {
    for (size_t i = 0; i < vars.size(); ++i) {
        vars[i]->setValue(x[i]);
    }
}

} // namespace

std::string solveStatusName(SolveStatus status) {
    switch (status) {
        case SolveStatus::Converged: return "Converged";
        case SolveStatus::LinearizationFailure: return "LinearizationFailure";
        case SolveStatus::StagnationFailure: return "StagnationFailure";
        case SolveStatus::IterationBudgetExceeded: return "IterationBudgetExceeded";
        case SolveStatus::EvaluationFailure: return "EvaluationFailure";
        case SolveStatus::InconsistentFixedState: return "InconsistentFixedState";
    }
    return "Unknown";
}

NewtonSolver::NewtonSolver(const SolveOptions& options)
    : options_(options)
{
    if (options_.max_iterations < 0) {
        throw std::invalid_argument("max_iterations must not be negative");
    }
    if (!(options_.finite_difference_step > 0.0)) {
        throw std::invalid_argument("finite_difference_step must be positive");
    }
    if (options_.max_backtracks < 1) {
        throw std::invalid_argument("max_backtracks must be at least 1");
    }
}

HostVector NewtonSolver::scaledResiduals(const std::vector<Equation>& eqs) {
    HostVector f("scaled_residuals", eqs.size());
    for (size_t i = 0; i < eqs.size(); ++i) {
        f(i) = eqs[i].scaled();
    }
    return f;
}

HostMatrix NewtonSolver::jacobian(Network& network, const std::vector<Variable*>& free_vars,
                                  const HostVector& f0) const {
    const size_t m = f0.extent(0);
    const size_t n = free_vars.size();
    HostMatrix J("jacobian", m, n);

    std::vector<double> x0 = pack(free_vars);
    for (size_t j = 0; j < n; ++j) {
        double step = options_.finite_difference_step * std::max(1.0, std::abs(x0[j]));
        free_vars[j]->setValue(x0[j] + step);

        HostVector f1 = scaledResiduals(network.equations());
        if (f1.extent(0) != m) {
            unpack(free_vars, x0);
            throw std::runtime_error("equation count changed while building the Jacobian");
        }
        Kokkos::parallel_for("jacobian_column",
            Kokkos::RangePolicy<HostExecSpace>(0, static_cast<int>(m)),
            [=](const int i) {
                J(i, j) = (f1(i) - f0(i)) / step;
            });
        Kokkos::fence();

        free_vars[j]->setValue(x0[j]);
    }
    unpack(free_vars, x0);
    return J;
}

void NewtonSolver::printWorst(const std::vector<Equation>& eqs) const {
    std::vector<std::pair<double, const Equation*>> ranked;
    ranked.reserve(eqs.size());
    for (const Equation& eq : eqs) {
        ranked.emplace_back(std::abs(eq.scaled()), &eq);
    }
    size_t k = std::min(ranked.size(), static_cast<size_t>(std::max(0, options_.print_worst)));
    std::partial_sort(ranked.begin(), ranked.begin() + k, ranked.end(),
                      [](const std::pair<double, const Equation*>& a,
                         const std::pair<double, const Equation*>& b) { return a.first > b.first; });
    for (size_t i = 0; i < k; ++i) {
        std::cout << "    worst: " << ranked[i].second->name << " -> "
                  << std::scientific << std::setprecision(3) << ranked[i].first << std::endl;
    }
}

SolveResult NewtonSolver::solve(Network& network) const {
    std::vector<ConfigurationError> errors = network.validate();
    if (!errors.empty()) {
        throw ConfigurationException(errors);
    }

    std::vector<Variable*> free_vars = network.freeVariables();
    if (options_.diagnostics_verbosity > 0) {
        std::cout << "[kadmos] Unknowns: " << free_vars.size() << " (free variables)" << std::endl;
    }

    SolveResult progress;
    std::vector<double> x_restore = pack(free_vars);

    try {
        SolveResult result = iterate(network, free_vars, x_restore, progress);
        if (options_.diagnostics_verbosity > 0) {
            std::cout << "[kadmos] " << result.message << " after " << result.iterations
                      << " iterations, |F|=" << std::scientific << std::setprecision(3)
                      << result.residual_norm << std::endl;
        }
        return result;
    } catch (const ConfigurationException&) {
        throw;
    } catch (const PropertyRangeError& e) {
        progress.message = std::string("Property evaluation failed: ") + e.what();
    } catch (const std::runtime_error& e) {
        progress.message = std::string("Evaluation failed: ") + e.what();
    }

    unpack(free_vars, x_restore);
    progress.converged = false;
    progress.status = SolveStatus::EvaluationFailure;
    if (options_.diagnostics_verbosity > 0) {
        std::cerr << "[kadmos] " << progress.message << std::endl;
    }
    return progress;
}

SolveResult NewtonSolver::iterate(Network& network, const std::vector<Variable*>& free_vars,
                                  std::vector<double>& x_restore, SolveResult& progress) const {
    const int verbosity = options_.diagnostics_verbosity;
    const double tol = options_.residual_tolerance;

    if (free_vars.empty()) {
        HostVector f = scaledResiduals(network.equations());
        SolveResult result;
        result.residual_norm = norm2(f);
        result.iterations = 0;
        result.converged = result.residual_norm < tol;
        result.status = result.converged ? SolveStatus::Converged : SolveStatus::InconsistentFixedState;
        result.message = "No free variables";
        return result;
    }

    for (int it = 1; it <= options_.max_iterations; ++it) {
        x_restore = pack(free_vars);

        std::vector<Equation> eqs0 = network.equations();
        HostVector f0 = scaledResiduals(eqs0);
        double nrm0 = norm2(f0);

        progress.iterations = it - 1;
        progress.residual_norm = nrm0;
        progress.residual_history.push_back(nrm0);

        if (verbosity > 0) {
            std::cout << "[kadmos] iter " << std::setw(2) << std::setfill('0') << it << std::setfill(' ')
                      << ": |F|=" << std::scientific << std::setprecision(3) << nrm0
                      << " eqs=" << eqs0.size() << std::endl;
            if (verbosity > 1 && (it == 1 || it % 10 == 0)) {
                printWorst(eqs0);
            }
        }

        if (nrm0 < tol) {
            SolveResult result = progress;
            result.converged = true;
            result.iterations = it - 1;
            result.status = SolveStatus::Converged;
            result.message = "Converged (residual norm)";
            return result;
        }

        HostMatrix J = jacobian(network, free_vars, f0);

        HostVector rhs("rhs", f0.extent(0));
        for (size_t i = 0; i < f0.extent(0); ++i) {
            rhs(i) = -f0(i);
        }
        HostVector dx("dx", free_vars.size());
        LeastSquaresResult lstsq = solveLeastSquares(J, rhs, dx);
        if (!lstsq.success) {
            SolveResult result = progress;
            result.converged = false;
            result.iterations = it;
            result.status = SolveStatus::LinearizationFailure;
            result.message = "Linear solve failed: " + lstsq.message;
            return result;
        }

        double step_norm = norm2(dx);
        if (step_norm < options_.step_tolerance) {
            SolveResult result = progress;
            result.converged = true;
            result.iterations = it;
            result.status = SolveStatus::Converged;
            result.message = "Converged (step norm)";
            return result;
        }

        std::vector<double> x0 = pack(free_vars);
        std::vector<double> x_trial(x0.size());

        if (options_.damping_enabled) {
            bool improved = false;
            double alpha = 1.0;
            for (int trial = 0; trial < options_.max_backtracks; ++trial) {
                for (size_t j = 0; j < x0.size(); ++j) {
                    x_trial[j] = x0[j] + alpha * dx(j);
                }
                unpack(free_vars, x_trial);
                double nrm_trial = norm2(scaledResiduals(network.equations()));

                if (verbosity > 1) {
                    std::cout << "    line search: alpha=" << std::scientific << std::setprecision(3)
                              << alpha << " |F|=" << nrm_trial << std::endl;
                }
                if (nrm_trial <= nrm0) {
                    improved = true;
                    break;
                }
                alpha *= 0.5;
            }
            if (!improved) {
                unpack(free_vars, x0);
                SolveResult result = progress;
                result.converged = false;
                result.iterations = it;
                result.status = SolveStatus::StagnationFailure;
                result.message = "Damping failed to improve residual";
                return result;
            }
        } else {
            for (size_t j = 0; j < x0.size(); ++j) {
                x_trial[j] = x0[j] + dx(j);
            }
            unpack(free_vars, x_trial);
        }
        progress.iterations = it;
    }

    SolveResult result = progress;
    result.residual_norm = norm2(scaledResiduals(network.equations()));
    result.converged = false;
    result.iterations = options_.max_iterations;
    result.status = SolveStatus::IterationBudgetExceeded;
    result.message = "Max iterations reached";
    return result;
}

} // namespace network
} // namespace kadmos
