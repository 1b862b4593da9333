#ifndef KADMOS_NETWORK_CORRELATIONS_HPP
#define KADMOS_NETWORK_CORRELATIONS_HPP

#include "Constants.hpp"
#include "WaterProperties.hpp"
#include <string>

namespace kadmos {
namespace network {

// Two-phase friction treatment
enum class FrictionModel {
    Homogeneous,
    Chisholm
};

FrictionModel frictionModelFromString(const std::string& name);
std::string frictionModelName(FrictionModel model);

// Lumped 1D flow path description shared by pipe-like components
struct FlowGeometry {
    double L;               // length [m]
    double D;               // hydraulic diameter [m]
    double A;               // flow area [m^2]
    double roughness;       // absolute roughness [m]
    double K;               // lumped form loss coefficient [-]
    double dz;              // elevation change, outlet minus inlet [m]
};

/**
 * @brief Pressure drop contributions of a pipe-like element [Pa]
 *
 * Positive values mean pressure decreases from inlet to outlet.
 */
struct PressureDropBreakdown {
    double friction = 0.0;
    double form = 0.0;
    double gravity = 0.0;
    double acceleration = 0.0;

    double total() const { return friction + form + gravity + acceleration; }
};

// Darcy friction factor: laminar 64/Re below RE_LAMINAR, Haaland above
double haalandFrictionFactor(double Re, double relative_roughness);

// K G^2 / (2 rho)
double formLoss(double m_dot, double rho, double K, double A);

// rho g dz
double gravityHead(double rho, double dz);

// G^2 (1/rho_out - 1/rho_in) for a constant-area element
double accelerationLoss(double m_dot, double A, double rho_in, double rho_out);

// m^2 (1/(rho_out A_out^2) - 1/(rho_in A_in^2)) across an area change
double accelerationLoss(double m_dot, double A_in, double A_out, double rho_in, double rho_out);

double homogeneousFriction(double m_dot, double rho, double mu, const FlowGeometry& geom);

// Chisholm C from the liquid-only and vapor-only Reynolds numbers
double chisholmConstant(double Re_lo, double Re_vo);

// Liquid-only two-phase multiplier phi_l^2
double chisholmMultiplier(double x, double rho_l, double rho_v, double mu_l, double mu_v,
                          double Re_lo, double Re_vo);

double chisholmFriction(double m_dot, double p, double h, const WaterProperties& props,
                        const FlowGeometry& geom);

/**
 * @brief Friction, form, gravity and acceleration drop of a pipe-like element
 *
 * Friction, form and gravity use the mid state ((p_in+p_out)/2, (h_in+h_out)/2);
 * acceleration uses the inlet and outlet densities.
 */
PressureDropBreakdown pressureDropBreakdown(double m_dot,
                                            double p_in, double h_in,
                                            double p_out, double h_out,
                                            const WaterProperties& props,
                                            const FlowGeometry& geom,
                                            FrictionModel model = FrictionModel::Homogeneous,
                                            bool include_acceleration = true,
                                            bool include_gravity = true);

// Single-phase heat transfer coefficient [W/m^2-K]; Nu = 3.66 below RE_LAMINAR
double dittusBoelter(double G, double D, double mu, double cp, double k, double n = 0.4);

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_CORRELATIONS_HPP
