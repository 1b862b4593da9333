#ifndef KADMOS_NETWORK_LINEAR_ALGEBRA_HPP
#define KADMOS_NETWORK_LINEAR_ALGEBRA_HPP

#include <Kokkos_Core.hpp>
#include <string>

namespace kadmos {
namespace network {

using HostExecSpace = Kokkos::DefaultHostExecutionSpace;
using HostMatrix = Kokkos::View<double**, Kokkos::LayoutLeft, Kokkos::HostSpace>;
using HostVector = Kokkos::View<double*, Kokkos::HostSpace>;

struct LeastSquaresResult {
    bool success = false;
    int rank = 0;               // numerical rank used for the solution
    std::string message;
};

// Euclidean norm
double norm2(const HostVector& v);

// Column j of A dotted with column k of B
double columnDot(const HostMatrix& A, int j, const HostMatrix& B, int k);

/**
 * @brief Minimum-norm least-squares solution of A x = b
 *
 * Uses a one-sided Jacobi SVD. Singular values below rcond * sigma_max are
 * discarded; a negative rcond selects machine epsilon times max(rows, cols).
 * Works for over- and under-determined systems. A and b are left untouched;
 * x is resized to the column count of A.
 */
LeastSquaresResult solveLeastSquares(const HostMatrix& A, const HostVector& b, HostVector& x,
                                     double rcond = -1.0);

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_LINEAR_ALGEBRA_HPP
