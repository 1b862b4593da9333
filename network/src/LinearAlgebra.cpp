#include "LinearAlgebra.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace kadmos {
namespace network {

namespace {

constexpr int MAX_SWEEPS = 60;

// Rotate columns p and q of M in place
void rotateColumns(const HostMatrix& M, int p, int q, double c, double s) {
    Kokkos::parallel_for("rotate_columns",
        Kokkos::RangePolicy<HostExecSpace>(0, static_cast<int>(M.extent(0))),
        [=](const int i) {
            double mp = M(i, p);
            double mq = M(i, q);
            M(i, p) = c * mp - s * mq;
            M(i, q) = s * mp + c * mq;
        });
    Kokkos::fence();
}

// One-sided Jacobi: on exit the columns of U are orthogonal and U = A V
int jacobiSweeps(const HostMatrix& U, const HostMatrix& V) {
    const int n = static_cast<int>(U.extent(1));
    const double tol = std::numeric_limits<double>::epsilon();

    for (int sweep = 1; sweep <= MAX_SWEEPS; ++sweep) {
        bool rotated = false;
        for (int p = 0; p < n - 1; ++p) {
            for (int q = p + 1; q < n; ++q) {
                double alpha = columnDot(U, p, U, p);
                double beta = columnDot(U, q, U, q);
                double gamma = columnDot(U, p, U, q);

                if (gamma == 0.0 || std::abs(gamma) <= tol * std::sqrt(alpha * beta)) {
                    continue;
                }
                rotated = true;

                double zeta = (beta - alpha) / (2.0 * gamma);
                double t = (zeta >= 0.0 ? 1.0 : -1.0) / (std::abs(zeta) + std::sqrt(1.0 + zeta * zeta));
                double c = 1.0 / std::sqrt(1.0 + t * t);
                double s = c * t;

                rotateColumns(U, p, q, c, s);
                rotateColumns(V, p, q, c, s);
            }
        }
        if (!rotated) {
            return sweep;
        }
    }
    return MAX_SWEEPS;
}

bool allFinite(const HostMatrix& A) {
    int bad = 0;
    const int cols = static_cast<int>(A.extent(1));
    Kokkos::parallel_reduce("count_nonfinite",
        Kokkos::RangePolicy<HostExecSpace>(0, static_cast<int>(A.extent(0))),
        [=](const int i, int& local) {
            for (int j = 0; j < cols; ++j) {
                if (!std::isfinite(A(i, j))) ++local;
            }
        }, bad);
    return bad == 0;
}

bool allFinite(const HostVector& v) {
    int bad = 0;
    Kokkos::parallel_reduce("count_nonfinite",
        Kokkos::RangePolicy<HostExecSpace>(0, static_cast<int>(v.extent(0))),
        [=](const int i, int& local) {
            if (!std::isfinite(v(i))) ++local;
        }, bad);
    return bad == 0;
}

} // namespace

double norm2(const HostVector& v) {
    double sum = 0.0;
    Kokkos::parallel_reduce("norm2",
        Kokkos::RangePolicy<HostExecSpace>(0, static_cast<int>(v.extent(0))),
        [=](const int i, double& local) {
            local += v(i) * v(i);
        }, sum);
    return std::sqrt(sum);
}

double columnDot(const HostMatrix& A, int j, const HostMatrix& B, int k) {
    double sum = 0.0;
    Kokkos::parallel_reduce("column_dot",
        Kokkos::RangePolicy<HostExecSpace>(0, static_cast<int>(A.extent(0))),
        [=](const int i, double& local) {
            local += A(i, j) * B(i, k);
        }, sum);
    return sum;
}

LeastSquaresResult solveLeastSquares(const HostMatrix& A, const HostVector& b, HostVector& x,
                                     double rcond) {
    LeastSquaresResult result;
    const int m = static_cast<int>(A.extent(0));
    const int n = static_cast<int>(A.extent(1));

    if (static_cast<int>(b.extent(0)) != m) {
        result.message = "right-hand side length does not match matrix rows";
        return result;
    }
    if (x.extent(0) != static_cast<size_t>(n)) {
        Kokkos::resize(x, n);
    }
    Kokkos::deep_copy(x, 0.0);

    if (m == 0 || n == 0) {
        result.message = "empty system";
        return result;
    }
    if (!allFinite(A) || !allFinite(b)) {
        result.message = "non-finite entries in linear system";
        return result;
    }

    // Factor the tall orientation: W = A (m >= n) or W = A^T (m < n)
    const bool transposed = m < n;
    const int rows = transposed ? n : m;
    const int cols = transposed ? m : n;

    HostMatrix U("lstsq_U", rows, cols);
    HostMatrix V("lstsq_V", cols, cols);
    for (int i = 0; i < rows; ++i) {
        for (int j = 0; j < cols; ++j) {
            U(i, j) = transposed ? A(j, i) : A(i, j);
        }
    }
    for (int j = 0; j < cols; ++j) {
        V(j, j) = 1.0;
    }

    jacobiSweeps(U, V);

    // Singular values are the column norms of U
    HostVector sigma("lstsq_sigma", cols);
    double sigma_max = 0.0;
    for (int j = 0; j < cols; ++j) {
        sigma(j) = std::sqrt(columnDot(U, j, U, j));
        sigma_max = std::max(sigma_max, sigma(j));
    }

    if (rcond < 0.0) {
        rcond = std::numeric_limits<double>::epsilon() * std::max(m, n);
    }
    const double cutoff = rcond * sigma_max;

    // W = Uhat S V^T with Uhat = U S^-1.
    // Not transposed: x = V S^-1 Uhat^T b = sum_j V_j (U_j . b) / s_j^2
    // Transposed (A = V S Uhat^T): x = Uhat S^-1 V^T b = sum_j U_j (V_j . b) / s_j^2
    for (int j = 0; j < cols; ++j) {
        if (!(sigma(j) > cutoff) || sigma(j) == 0.0) {
            continue;
        }
        ++result.rank;

        double proj = 0.0;
        const HostMatrix& left = transposed ? V : U;
        for (int i = 0; i < static_cast<int>(left.extent(0)); ++i) {
            proj += left(i, j) * b(i);
        }
        double coeff = proj / (sigma(j) * sigma(j));

        const HostMatrix& right = transposed ? U : V;
        for (int i = 0; i < n; ++i) {
            x(i) += coeff * right(i, j);
        }
    }

    if (result.rank == 0) {
        result.message = "matrix has zero numerical rank";
        return result;
    }
    if (!allFinite(x)) {
        result.message = "non-finite least-squares solution";
        return result;
    }

    result.success = true;
    result.message = "ok";
    return result;
}

} // namespace network
} // namespace kadmos
