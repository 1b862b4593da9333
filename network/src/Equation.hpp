#ifndef KADMOS_NETWORK_EQUATION_HPP
#define KADMOS_NETWORK_EQUATION_HPP

#include "Constants.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace kadmos {
namespace network {

/**
 * @brief Named residual with its characteristic scale
 *
 * Satisfied when |residual| / max(scale, eps) falls below the solver tolerance.
 */
struct Equation {
    std::string name;
    double residual;
    double scale = 1.0;

    double scaled() const { return residual / std::max(std::abs(scale), SCALE_EPS); }
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_EQUATION_HPP
