#ifndef KADMOS_NETWORK_CONSTANTS_HPP
#define KADMOS_NETWORK_CONSTANTS_HPP

namespace kadmos {
namespace network {

// Mathematical constants
constexpr double PI = 3.14159265358979323846;

// Physical constants
constexpr double GRAVITY_ACCEL = 9.80665;           // gravity acceleration [m/s^2]

// Water critical point and triple point (IAPWS-IF97)
constexpr double PC = 22.064e6;                     // critical pressure [Pa]
constexpr double TC = 647.096;                      // critical temperature [K]
constexpr double RHOC = 322.0;                      // critical density [kg/m^3]
constexpr double P_TRIPLE = 611.213;                // lowest saturation pressure [Pa]
constexpr double T_TRIPLE = 273.15;                 // lowest liquid temperature [K]
constexpr double R_WATER = 461.526;                 // specific gas constant [J/kg-K]

// Flow regime thresholds
constexpr double RE_LAMINAR = 2300.0;               // Darcy friction laminar limit
constexpr double RE_CHISHOLM_LAMINAR = 2000.0;      // Chisholm C classification limit

// Residual scale floors
constexpr double SCALE_MASS = 1.0;                  // [kg/s]
constexpr double SCALE_PRESSURE = 1.0e5;            // [Pa]
constexpr double SCALE_ENTHALPY = 1.0e5;            // [J/kg]
constexpr double SCALE_ENERGY = 1.0e6;              // [W]
constexpr double SCALE_VOID = 1.0e-2;               // [-]

// Connection defaults (guess, lower bound, upper bound)
constexpr double M_GUESS = 100.0;
constexpr double M_LOWER = 1.0e-6;
constexpr double M_UPPER = 1.0e9;
constexpr double P_GUESS = 1.0e6;
constexpr double P_LOWER = 1.0e3;
constexpr double P_UPPER = 1.0e9;
constexpr double H_GUESS = 1.0e6;
constexpr double H_LOWER = 1.0e3;
constexpr double H_UPPER = 1.0e8;

// Numerical tolerances
constexpr double EPS = 1.0e-9;                      // mass flow below which Q/m is dropped
constexpr double SCALE_EPS = 1.0e-30;               // zero-scale guard
constexpr double ZERO = 1.0e-12;                    // denominator guard
constexpr int NMAXITS = 50;                         // property inversion iterations

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_CONSTANTS_HPP
