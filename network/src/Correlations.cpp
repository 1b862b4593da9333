#include "Correlations.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace kadmos {
namespace network {

FrictionModel frictionModelFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "homogeneous") return FrictionModel::Homogeneous;
    if (lower == "chisholm") return FrictionModel::Chisholm;
    throw std::invalid_argument("Unknown two-phase friction model: " + name);
}

std::string frictionModelName(FrictionModel model) {
    switch (model) {
        case FrictionModel::Homogeneous: return "homogeneous";
        case FrictionModel::Chisholm: return "chisholm";
    }
    return "unknown";
}

double haalandFrictionFactor(double Re, double relative_roughness) {
    Re = std::abs(Re);
    if (Re <= 0.0) {
        return 0.0;
    }
    if (Re < RE_LAMINAR) {
        return 64.0 / Re;
    }
    double arg = std::pow(relative_roughness / 3.7, 1.11) + 6.9 / Re;
    double inv_sqrt_f = -1.8 * std::log10(arg);
    return 1.0 / (inv_sqrt_f * inv_sqrt_f);
}

double formLoss(double m_dot, double rho, double K, double A) {
    if (A <= 0.0 || rho <= 0.0) {
        return 0.0;
    }
    double G = m_dot / A;
    return K * G * G / (2.0 * rho);
}

double gravityHead(double rho, double dz) {
    return rho * GRAVITY_ACCEL * dz;
}

double accelerationLoss(double m_dot, double A, double rho_in, double rho_out) {
    if (A <= 0.0 || rho_in <= 0.0 || rho_out <= 0.0) {
        return 0.0;
    }
    double G = m_dot / A;
    return G * G * (1.0 / rho_out - 1.0 / rho_in);
}

double accelerationLoss(double m_dot, double A_in, double A_out, double rho_in, double rho_out) {
    if (rho_in <= 0.0 || rho_out <= 0.0 || A_in <= 0.0 || A_out <= 0.0) {
        return 0.0;
    }
    return m_dot * m_dot * (1.0 / (rho_out * A_out * A_out) - 1.0 / (rho_in * A_in * A_in));
}

double homogeneousFriction(double m_dot, double rho, double mu, const FlowGeometry& geom) {
    if (geom.A <= 0.0 || geom.D <= 0.0 || geom.L <= 0.0 || rho <= 0.0 || mu <= 0.0) {
        return 0.0;
    }
    double G = m_dot / geom.A;
    // Re = rho v D / mu with v = G / rho
    double Re = std::abs(G * geom.D / mu);
    double f = haalandFrictionFactor(Re, geom.roughness / geom.D);
    return f * (geom.L / geom.D) * G * G / (2.0 * rho);
}

double chisholmConstant(double Re_lo, double Re_vo) {
    bool liquid_laminar = Re_lo < RE_CHISHOLM_LAMINAR;
    bool vapor_laminar = Re_vo < RE_CHISHOLM_LAMINAR;
    if (!liquid_laminar && !vapor_laminar) {
        return 20.0;
    }
    if (liquid_laminar && vapor_laminar) {
        return 5.0;
    }
    return 12.0;
}

double chisholmMultiplier(double x, double rho_l, double rho_v, double mu_l, double mu_v,
                          double Re_lo, double Re_vo) {
    x = std::min(std::max(x, 1.0e-8), 1.0 - 1.0e-8);
    if (rho_l <= 0.0 || rho_v <= 0.0 || mu_l <= 0.0 || mu_v <= 0.0) {
        return 1.0;
    }

    // Lockhart-Martinelli parameter, turbulent-turbulent form
    double X_tt = std::pow((1.0 - x) / x, 0.9) *
                  std::pow(rho_v / rho_l, 0.5) *
                  std::pow(mu_l / mu_v, 0.1);
    double C = chisholmConstant(Re_lo, Re_vo);
    return 1.0 + C / X_tt + 1.0 / (X_tt * X_tt);
}

double chisholmFriction(double m_dot, double p, double h, const WaterProperties& props,
                        const FlowGeometry& geom) {
    if (geom.A <= 0.0 || geom.D <= 0.0 || geom.L <= 0.0) {
        return 0.0;
    }

    double x = props.quality(p, h);
    SaturationPair rho = props.saturatedDensity(p);
    SaturationPair mu = props.saturatedViscosity(p);

    double G = m_dot / geom.A;
    double Re_lo = std::abs(G * geom.D / std::max(mu.liquid, ZERO));
    double Re_vo = std::abs(G * geom.D / std::max(mu.vapor, ZERO));
    double eps_rel = geom.roughness / geom.D;

    double f_lo = haalandFrictionFactor(Re_lo, eps_rel);
    double dp_lo = f_lo * (geom.L / geom.D) * G * G / (2.0 * std::max(rho.liquid, ZERO));

    if (x <= 0.0) {
        return dp_lo;
    }
    if (x >= 1.0) {
        double f_vo = haalandFrictionFactor(Re_vo, eps_rel);
        return f_vo * (geom.L / geom.D) * G * G / (2.0 * std::max(rho.vapor, ZERO));
    }

    double phi_l2 = chisholmMultiplier(x, rho.liquid, rho.vapor, mu.liquid, mu.vapor, Re_lo, Re_vo);
    return phi_l2 * dp_lo;
}

PressureDropBreakdown pressureDropBreakdown(double m_dot,
                                            double p_in, double h_in,
                                            double p_out, double h_out,
                                            const WaterProperties& props,
                                            const FlowGeometry& geom,
                                            FrictionModel model,
                                            bool include_acceleration,
                                            bool include_gravity) {
    double p_avg = 0.5 * (p_in + p_out);
    double h_avg = 0.5 * (h_in + h_out);

    double rho_avg = props.density(p_avg, h_avg);
    double mu_avg = props.viscosity(p_avg, h_avg);

    PressureDropBreakdown dp;
    if (model == FrictionModel::Chisholm) {
        dp.friction = chisholmFriction(m_dot, p_avg, h_avg, props, geom);
    } else {
        dp.friction = homogeneousFriction(m_dot, rho_avg, mu_avg, geom);
    }

    dp.form = formLoss(m_dot, rho_avg, geom.K, geom.A);

    if (include_gravity) {
        dp.gravity = gravityHead(rho_avg, geom.dz);
    }

    if (include_acceleration) {
        double rho_in = props.density(p_in, h_in);
        double rho_out = props.density(p_out, h_out);
        dp.acceleration = accelerationLoss(m_dot, geom.A, rho_in, rho_out);
    }

    return dp;
}

double dittusBoelter(double G, double D, double mu, double cp, double k, double n) {
    if (D <= 0.0 || mu <= 0.0 || k <= 0.0 || cp <= 0.0) {
        return 0.0;
    }
    double Re = std::abs(G * D / mu);
    double Pr = cp * mu / k;

    double Nu;
    if (Re < RE_LAMINAR) {
        // Fully developed laminar, constant wall temperature
        Nu = 3.66;
    } else {
        Nu = 0.023 * std::pow(Re, 0.8) * std::pow(Pr, n);
    }
    return Nu * k / D;
}

} // namespace network
} // namespace kadmos
