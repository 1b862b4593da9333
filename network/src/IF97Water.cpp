#include "IF97Water.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace kadmos {
namespace network {

namespace {

struct Term {
    int I;
    int J;
    double n;
};

// Region 1 reducing values
constexpr double R1_PSTAR = 16.53e6;
constexpr double R1_TSTAR = 1386.0;

const Term REGION1[34] = {
    {0, -2, 0.14632971213167},     {0, -1, -0.84548187169114},
    {0, 0, -0.37563603672040e1},   {0, 1, 0.33855169168385e1},
    {0, 2, -0.95791963387872},     {0, 3, 0.15772038513228},
    {0, 4, -0.16616417199501e-1},  {0, 5, 0.81214629983568e-3},
    {1, -9, 0.28319080123804e-3},  {1, -7, -0.60706301565874e-3},
    {1, -1, -0.18990068218419e-1}, {1, 0, -0.32529748770505e-1},
    {1, 1, -0.21841717175414e-1},  {1, 3, -0.52838357969930e-4},
    {2, -3, -0.47184321073267e-3}, {2, 0, -0.30001780793026e-3},
    {2, 1, 0.47661393906987e-4},   {2, 3, -0.44141845330846e-5},
    {2, 17, -0.72694996297594e-15}, {3, -4, -0.31679644845054e-4},
    {3, 0, -0.28270797985312e-5},  {3, 6, -0.85205128120103e-9},
    {4, -5, -0.22425281908000e-5}, {4, -2, -0.65171222895601e-6},
    {4, 10, -0.14341729937924e-12}, {5, -8, -0.40516996860117e-6},
    {8, -11, -0.12734301741641e-8}, {8, -6, -0.17424871230634e-9},
    {21, -29, -0.68762131295531e-18}, {23, -31, 0.14478307828521e-19},
    {29, -38, 0.26335781662795e-22}, {30, -39, -0.11947622640071e-22},
    {31, -40, 0.18228094581404e-23}, {32, -41, -0.93537087292458e-25}
};

// Region 2 reducing values
constexpr double R2_PSTAR = 1.0e6;
constexpr double R2_TSTAR = 540.0;

const int REGION2_J0[9] = {0, 1, -5, -4, -3, -2, -1, 2, 3};
const double REGION2_N0[9] = {
    -0.96927686500217e1, 0.10086655968018e2, -0.56087911283020e-2,
    0.71452738081455e-1, -0.40710498223928, 0.14240819171444e1,
    -0.43839511319450e1, -0.28408632460772, 0.21268463753307e-1
};

const Term REGION2_RES[43] = {
    {1, 0, -0.17731742473213e-2},  {1, 1, -0.17834862292358e-1},
    {1, 2, -0.45996013696365e-1},  {1, 3, -0.57581259083432e-1},
    {1, 6, -0.50325278727930e-1},  {2, 1, -0.33032641670203e-4},
    {2, 2, -0.18948987516315e-3},  {2, 4, -0.39392777243355e-2},
    {2, 7, -0.43797295650573e-1},  {2, 36, -0.26674547914087e-4},
    {3, 0, 0.20481737692309e-7},   {3, 1, 0.43870667284435e-6},
    {3, 3, -0.32277677238570e-4},  {3, 6, -0.15033924542148e-2},
    {3, 35, -0.40668253562649e-1}, {4, 1, -0.78847309559367e-9},
    {4, 2, 0.12790717852285e-7},   {4, 3, 0.48225372718507e-6},
    {5, 7, 0.22922076337661e-5},   {6, 3, -0.16714766451061e-10},
    {6, 16, -0.21171472321355e-2}, {6, 35, -0.23895741934104e2},
    {7, 0, -0.59059564324270e-17}, {7, 11, -0.12621808899101e-5},
    {7, 25, -0.38946842435739e-1}, {8, 8, 0.11256211360459e-10},
    {8, 36, -0.82311340897998e1},  {9, 13, 0.19809712802088e-7},
    {10, 4, 0.10406965210174e-18}, {10, 10, -0.10234747095929e-12},
    {10, 14, -0.10018179379511e-8}, {16, 29, -0.80882908646985e-10},
    {16, 50, 0.10693031879409},    {18, 57, -0.33662250574171},
    {20, 20, 0.89185845355421e-24}, {20, 35, 0.30629316876232e-12},
    {20, 48, -0.42002467698208e-5}, {21, 21, -0.59056029685639e-25},
    {22, 53, 0.37826947613457e-5}, {23, 39, -0.12768608934681e-14},
    {24, 26, 0.73087610595061e-28}, {24, 40, 0.55414715350778e-16},
    {24, 58, -0.94369707241210e-6}
};

// Region 4 saturation-line coefficients n1..n10
const double REGION4[10] = {
    0.11670521452767e4, -0.72421316703206e6, -0.17073846940092e2,
    0.12020824702470e5, -0.32325550322333e7, 0.14915108613530e2,
    -0.48232657361591e4, 0.40511340542057e6, -0.23855557567849,
    0.65017534844798e3
};

// IAPWS 2008 viscosity
const double VISC_H0[4] = {1.67752, 2.20462, 0.6366564, -0.241605};
const double VISC_H1[6][7] = {
    {5.20094e-1, 2.22531e-1, -2.81378e-1, 1.61913e-1, -3.25372e-2, 0.0, 0.0},
    {8.50895e-2, 9.99115e-1, -9.06851e-1, 2.57399e-1, 0.0, 0.0, 0.0},
    {-1.08374, 1.88797, -7.72479e-1, 0.0, 0.0, 0.0, 0.0},
    {-2.89555e-1, 1.26613, -4.89837e-1, 0.0, 6.98452e-2, 0.0, -4.35673e-3},
    {0.0, 0.0, -2.57040e-1, 0.0, 0.0, 8.72102e-3, 0.0},
    {0.0, 1.20573e-1, 0.0, 0.0, 0.0, 0.0, -5.93264e-4}
};

// IAPWS 1998 industrial thermal conductivity
constexpr double COND_TSTAR = 647.26;
constexpr double COND_RHOSTAR = 317.7;

// Rounding resolutions of the cache keys
constexpr double KEY_P = 1.0e-2;
constexpr double KEY_H = 1.0e-3;
constexpr double KEY_S = 1.0e-4;

constexpr double T_LIQUID_MIN = 200.0;
constexpr double T_VAPOR_MAX = 4000.0;

} // namespace

IF97Water::IF97Water(size_t cache_capacity)
    : saturation_cache_(cache_capacity)
    , ph_cache_(cache_capacity)
    , ps_cache_(cache_capacity)
{
}

PhaseState IF97Water::region1(double p, double T) {
    double pi = p / R1_PSTAR;
    double tau = R1_TSTAR / T;
    double a = 7.1 - pi;
    double b = tau - 1.222;

    double g = 0.0, g_pi = 0.0, g_tau = 0.0, g_tautau = 0.0;
    for (const Term& t : REGION1) {
        double aI = std::pow(a, t.I);
        double bJ = std::pow(b, t.J);
        g += t.n * aI * bJ;
        if (t.I > 0) {
            g_pi -= t.n * t.I * std::pow(a, t.I - 1) * bJ;
        }
        if (t.J != 0) {
            g_tau += t.n * aI * t.J * std::pow(b, t.J - 1);
            g_tautau += t.n * aI * t.J * (t.J - 1) * std::pow(b, t.J - 2);
        }
    }

    PhaseState st;
    st.T = T;
    st.rho = p / (pi * g_pi * R_WATER * T);
    st.h = tau * g_tau * R_WATER * T;
    st.s = (tau * g_tau - g) * R_WATER;
    st.cp = -tau * tau * g_tautau * R_WATER;
    return st;
}

PhaseState IF97Water::region2(double p, double T) {
    double pi = p / R2_PSTAR;
    double tau = R2_TSTAR / T;

    // Ideal-gas part
    double g0 = std::log(pi);
    double g0_tau = 0.0, g0_tautau = 0.0;
    for (int i = 0; i < 9; ++i) {
        int J = REGION2_J0[i];
        double n = REGION2_N0[i];
        g0 += n * std::pow(tau, J);
        if (J != 0) {
            g0_tau += n * J * std::pow(tau, J - 1);
            g0_tautau += n * J * (J - 1) * std::pow(tau, J - 2);
        }
    }
    double g0_pi = 1.0 / pi;

    // Residual part
    double b = tau - 0.5;
    double gr = 0.0, gr_pi = 0.0, gr_tau = 0.0, gr_tautau = 0.0;
    for (const Term& t : REGION2_RES) {
        double piI = std::pow(pi, t.I);
        double bJ = std::pow(b, t.J);
        gr += t.n * piI * bJ;
        gr_pi += t.n * t.I * std::pow(pi, t.I - 1) * bJ;
        if (t.J != 0) {
            gr_tau += t.n * piI * t.J * std::pow(b, t.J - 1);
            gr_tautau += t.n * piI * t.J * (t.J - 1) * std::pow(b, t.J - 2);
        }
    }

    PhaseState st;
    st.T = T;
    st.rho = p / (pi * (g0_pi + gr_pi) * R_WATER * T);
    st.h = tau * (g0_tau + gr_tau) * R_WATER * T;
    st.s = (tau * (g0_tau + gr_tau) - (g0 + gr)) * R_WATER;
    st.cp = -tau * tau * (g0_tautau + gr_tautau) * R_WATER;
    return st;
}

double IF97Water::saturationPressure(double T) {
    const double* n = REGION4;
    double theta = T + n[8] / (T - n[9]);
    double A = theta * theta + n[0] * theta + n[1];
    double B = n[2] * theta * theta + n[3] * theta + n[4];
    double C = n[5] * theta * theta + n[6] * theta + n[7];
    double ratio = 2.0 * C / (-B + std::sqrt(B * B - 4.0 * A * C));
    return std::pow(ratio, 4) * 1.0e6;
}

double IF97Water::saturationTemperatureIF97(double p) {
    const double* n = REGION4;
    double beta = std::pow(p / 1.0e6, 0.25);
    double E = beta * beta + n[2] * beta + n[5];
    double F = n[0] * beta * beta + n[3] * beta + n[6];
    double G = n[1] * beta * beta + n[4] * beta + n[7];
    double D = 2.0 * G / (-F - std::sqrt(F * F - 4.0 * E * G));
    return 0.5 * (n[9] + D - std::sqrt((n[9] + D) * (n[9] + D) - 4.0 * (n[8] + n[9] * D)));
}

double IF97Water::viscosityIAPWS(double T, double rho) {
    double Tbar = T / TC;
    double rhobar = rho / RHOC;

    double denom = 0.0;
    for (int i = 0; i < 4; ++i) {
        denom += VISC_H0[i] / std::pow(Tbar, i);
    }
    double mu0 = 100.0 * std::sqrt(Tbar) / denom;

    double sum = 0.0;
    double x = 1.0 / Tbar - 1.0;
    double y = rhobar - 1.0;
    for (int i = 0; i < 6; ++i) {
        double xi = std::pow(x, i);
        for (int j = 0; j < 7; ++j) {
            if (VISC_H1[i][j] != 0.0) {
                sum += VISC_H1[i][j] * xi * std::pow(y, j);
            }
        }
    }
    double mu1 = std::exp(rhobar * sum);

    return mu0 * mu1 * 1.0e-6;
}

double IF97Water::conductivityIAPWS(double T, double rho) {
    double Tbar = T / COND_TSTAR;
    double rhobar = rho / COND_RHOSTAR;

    double lambda0 = std::sqrt(Tbar) *
        (0.0102811 + 0.0299621 * Tbar + 0.0156146 * Tbar * Tbar - 0.00422464 * Tbar * Tbar * Tbar);

    double lambda1 = -0.397070 + 0.400302 * rhobar +
        1.060000 * std::exp(-0.171587 * (rhobar + 2.392190) * (rhobar + 2.392190));

    double dT = std::abs(Tbar - 1.0) + 0.00308976;
    double Q = 2.0 + 0.0822994 / std::pow(dT, 0.6);
    double S = (Tbar >= 1.0) ? 1.0 / dT : 10.0932 / std::pow(dT, 0.6);

    double lambda2 =
        (0.0701309 / std::pow(Tbar, 10) + 0.0118520) * std::pow(rhobar, 1.8) *
            std::exp(0.642857 * (1.0 - std::pow(rhobar, 2.8))) +
        0.00169937 * S * std::pow(rhobar, Q) *
            std::exp((Q / (1.0 + Q)) * (1.0 - std::pow(rhobar, 1.0 + Q))) -
        1.0200 * std::exp(-4.11717 * std::pow(Tbar, 1.5) - 6.17937 / std::pow(rhobar, 5));

    return lambda0 + lambda1 + lambda2;
}

double IF97Water::surfaceTensionIAPWS(double T) {
    double tau = 1.0 - T / TC;
    if (tau <= 0.0) return 0.0;
    return 0.2358 * std::pow(tau, 1.256) * (1.0 - 0.625 * tau);
}

double IF97Water::checkedPressure(double p) {
    if (!std::isfinite(p) || p <= 0.0) {
        std::ostringstream msg;
        msg << "Invalid pressure for water properties: " << p << " Pa";
        throw PropertyRangeError(msg.str());
    }
    return p;
}

double IF97Water::clampSaturationPressure(double p) {
    return std::min(std::max(p, P_TRIPLE), PC * (1.0 - 1.0e-9));
}

SaturationState IF97Water::computeSaturation(double p) {
    SaturationState sat;
    sat.p = clampSaturationPressure(p);
    sat.T = saturationTemperatureIF97(sat.p);
    sat.liquid = region1(sat.p, sat.T);
    sat.vapor = region2(sat.p, sat.T);
    sat.mu_l = viscosityIAPWS(sat.T, sat.liquid.rho);
    sat.mu_v = viscosityIAPWS(sat.T, sat.vapor.rho);
    sat.k_l = conductivityIAPWS(sat.T, sat.liquid.rho);
    sat.k_v = conductivityIAPWS(sat.T, sat.vapor.rho);
    sat.sigma = surfaceTensionIAPWS(sat.T);
    return sat;
}

SaturationState IF97Water::saturation(double p) const {
    checkedPressure(p);
    RoundedKey key{roundToKey(p, KEY_P), 0};
    return saturation_cache_.getOrCompute(key, [&key]() {
        return computeSaturation(key.first * KEY_P);
    });
}

double IF97Water::solveTemperature(double p, double target, bool liquid, bool from_entropy,
                                   double t_lo, double t_hi) {
    auto evaluate = [&](double T) {
        return liquid ? region1(p, T) : region2(p, T);
    };
    auto residual = [&](const PhaseState& st) {
        return (from_entropy ? st.s : st.h) - target;
    };

    double f_lo = residual(evaluate(t_lo));
    double f_hi = residual(evaluate(t_hi));
    if (f_lo >= 0.0) return t_lo;
    if (f_hi <= 0.0) return t_hi;

    // Regula falsi start, then Newton with bisection fallback
    double T = t_lo - f_lo * (t_hi - t_lo) / (f_hi - f_lo);
    for (int iter = 0; iter < NMAXITS; ++iter) {
        PhaseState st = evaluate(T);
        double f = residual(st);
        if (f > 0.0) {
            t_hi = T;
        } else {
            t_lo = T;
        }

        double slope = from_entropy ? st.cp / T : st.cp;
        double T_new;
        if (slope > 0.0 && std::isfinite(slope)) {
            T_new = T - f / slope;
        } else {
            T_new = 0.5 * (t_lo + t_hi);
        }
        if (T_new <= t_lo || T_new >= t_hi) {
            T_new = 0.5 * (t_lo + t_hi);
        }

        if (std::abs(T_new - T) < 1.0e-10 * T) {
            return T_new;
        }
        T = T_new;
    }

    std::cout << "Warning: IF97 temperature inversion did not converge at p=" << p
              << " Pa, target=" << target << std::endl;
    return T;
}

IF97Water::FluidState IF97Water::computeState(double p, double h, const SaturationState& sat) {
    FluidState fs;
    double h_l = sat.liquid.h;
    double h_v = sat.vapor.h;

    if (h <= h_l) {
        fs.T = solveTemperature(p, h, true, false, T_LIQUID_MIN, sat.T);
        PhaseState st = region1(p, fs.T);
        fs.rho = st.rho;
        fs.s = st.s;
        fs.cp = st.cp;
        fs.mu = viscosityIAPWS(fs.T, fs.rho);
        fs.k = conductivityIAPWS(fs.T, fs.rho);
        fs.x = 0.0;
        fs.alpha = 0.0;
        return fs;
    }

    if (h >= h_v) {
        fs.T = solveTemperature(p, h, false, false, sat.T, T_VAPOR_MAX);
        PhaseState st = region2(p, fs.T);
        fs.rho = st.rho;
        fs.s = st.s;
        fs.cp = st.cp;
        fs.mu = viscosityIAPWS(fs.T, fs.rho);
        fs.k = conductivityIAPWS(fs.T, fs.rho);
        fs.x = 1.0;
        fs.alpha = 1.0;
        return fs;
    }

    // Homogeneous two-phase mixture
    double x = (h - h_l) / (h_v - h_l);
    double vl = (1.0 - x) / sat.liquid.rho;
    double vv = x / sat.vapor.rho;

    fs.T = sat.T;
    fs.x = x;
    fs.alpha = vv / (vv + vl);
    fs.rho = 1.0 / (vv + vl);
    fs.s = sat.liquid.s + x * (sat.vapor.s - sat.liquid.s);
    fs.cp = sat.liquid.cp;
    fs.mu = fs.alpha * sat.mu_v + (1.0 - fs.alpha) * sat.mu_l;
    fs.k = fs.alpha * sat.k_v + (1.0 - fs.alpha) * sat.k_l;
    return fs;
}

IF97Water::FluidState IF97Water::state(double p, double h) const {
    checkedPressure(p);
    if (!std::isfinite(h)) {
        throw PropertyRangeError("Invalid enthalpy for water properties");
    }

    RoundedKey key{roundToKey(p, KEY_P), roundToKey(h, KEY_H)};
    return ph_cache_.getOrCompute(key, [this, &key]() {
        double p_key = key.first * KEY_P;
        double h_key = key.second * KEY_H;
        return computeState(p_key, h_key, saturation(p_key));
    });
}

double IF97Water::saturationTemperature(double p) const { return saturation(p).T; }

double IF97Water::surfaceTension(double p) const { return saturation(p).sigma; }

SaturationPair IF97Water::saturatedEnthalpy(double p) const {
    SaturationState sat = saturation(p);
    return {sat.liquid.h, sat.vapor.h};
}

SaturationPair IF97Water::saturatedDensity(double p) const {
    SaturationState sat = saturation(p);
    return {sat.liquid.rho, sat.vapor.rho};
}

SaturationPair IF97Water::saturatedViscosity(double p) const {
    SaturationState sat = saturation(p);
    return {sat.mu_l, sat.mu_v};
}

SaturationPair IF97Water::saturatedConductivity(double p) const {
    SaturationState sat = saturation(p);
    return {sat.k_l, sat.k_v};
}

SaturationPair IF97Water::saturatedHeatCapacity(double p) const {
    SaturationState sat = saturation(p);
    return {sat.liquid.cp, sat.vapor.cp};
}

double IF97Water::temperature(double p, double h) const { return state(p, h).T; }
double IF97Water::entropy(double p, double h) const { return state(p, h).s; }
double IF97Water::quality(double p, double h) const { return state(p, h).x; }
double IF97Water::voidFraction(double p, double h) const { return state(p, h).alpha; }
double IF97Water::density(double p, double h) const { return state(p, h).rho; }
double IF97Water::viscosity(double p, double h) const { return state(p, h).mu; }
double IF97Water::conductivity(double p, double h) const { return state(p, h).k; }
double IF97Water::heatCapacity(double p, double h) const { return state(p, h).cp; }

double IF97Water::enthalpyFromQuality(double p, double x) const {
    SaturationState sat = saturation(p);
    x = std::min(std::max(x, 0.0), 1.0);
    return sat.liquid.h + x * (sat.vapor.h - sat.liquid.h);
}

double IF97Water::enthalpyFromTemperature(double p, double T) const {
    checkedPressure(p);
    if (!std::isfinite(T) || T <= 0.0) {
        throw PropertyRangeError("Invalid temperature for water properties");
    }
    SaturationState sat = saturation(p);
    if (T <= sat.T) {
        return region1(p, T).h;
    }
    return region2(p, T).h;
}

double IF97Water::enthalpyFromEntropy(double p, double s) const {
    checkedPressure(p);
    if (!std::isfinite(s)) {
        throw PropertyRangeError("Invalid entropy for water properties");
    }

    RoundedKey key{roundToKey(p, KEY_P), roundToKey(s, KEY_S)};
    return ps_cache_.getOrCompute(key, [this, &key]() {
        double p_key = key.first * KEY_P;
        double s_key = key.second * KEY_S;
        SaturationState sat = saturation(p_key);

        if (s_key <= sat.liquid.s) {
            double T = solveTemperature(p_key, s_key, true, true, T_LIQUID_MIN, sat.T);
            return region1(p_key, T).h;
        }
        if (s_key >= sat.vapor.s) {
            double T = solveTemperature(p_key, s_key, false, true, sat.T, T_VAPOR_MAX);
            return region2(p_key, T).h;
        }
        double x = (s_key - sat.liquid.s) / (sat.vapor.s - sat.liquid.s);
        return sat.liquid.h + x * (sat.vapor.h - sat.liquid.h);
    });
}

double IF97Water::densityFromQuality(double p, double x) const {
    SaturationState sat = saturation(p);
    x = std::min(std::max(x, 0.0), 1.0);
    return 1.0 / (x / sat.vapor.rho + (1.0 - x) / sat.liquid.rho);
}

void IF97Water::clearCache() {
    saturation_cache_.clear();
    ph_cache_.clear();
    ps_cache_.clear();
}

size_t IF97Water::cacheHits() const {
    return saturation_cache_.hits() + ph_cache_.hits() + ps_cache_.hits();
}

size_t IF97Water::cacheMisses() const {
    return saturation_cache_.misses() + ph_cache_.misses() + ps_cache_.misses();
}

} // namespace network
} // namespace kadmos
