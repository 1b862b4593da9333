#ifndef KADMOS_NETWORK_IF97_WATER_HPP
#define KADMOS_NETWORK_IF97_WATER_HPP

#include "Constants.hpp"
#include "PropertyCache.hpp"
#include "WaterProperties.hpp"
#include <cstddef>

namespace kadmos {
namespace network {

// Single-phase state from one of the IF97 Gibbs equations
struct PhaseState {
    double T;       // temperature [K]
    double rho;     // density [kg/m^3]
    double h;       // enthalpy [J/kg]
    double s;       // entropy [J/kg-K]
    double cp;      // isobaric heat capacity [J/kg-K]
};

// Everything the components need on the saturation line at one pressure
struct SaturationState {
    double p;
    double T;
    PhaseState liquid;
    PhaseState vapor;
    double mu_l, mu_v;
    double k_l, k_v;
    double sigma;
};

/**
 * @brief Water and steam properties from the IAPWS-IF97 industrial formulation
 *
 * Implements region 1 (compressed liquid), region 2 (superheated vapor) and the
 * region 4 saturation line. Temperatures for given (p, h) or (p, s) are recovered
 * by bracketed Newton iteration on the forward Gibbs equations. Transport properties
 * use the IAPWS 2008 viscosity and the IAPWS 1998 industrial thermal conductivity
 * releases; surface tension uses the IAPWS 1994 release.
 *
 * Lookups go through bounded LRU caches keyed by the inputs rounded to fixed
 * precision; the rounded inputs are also what gets evaluated. The caches make
 * this class non-reentrant: share one instance per solving thread.
 */
class IF97Water : public WaterProperties {
public:
    explicit IF97Water(size_t cache_capacity = 8192);
    ~IF97Water() override = default;

    // Saturation line
    double saturationTemperature(double p) const override;
    double surfaceTension(double p) const override;
    SaturationPair saturatedEnthalpy(double p) const override;
    SaturationPair saturatedDensity(double p) const override;
    SaturationPair saturatedViscosity(double p) const override;
    SaturationPair saturatedConductivity(double p) const override;
    SaturationPair saturatedHeatCapacity(double p) const override;

    // Thermodynamic state from (p, h)
    double temperature(double p, double h) const override;
    double entropy(double p, double h) const override;
    double quality(double p, double h) const override;
    double voidFraction(double p, double h) const override;

    // Transport and mixture properties from (p, h)
    double density(double p, double h) const override;
    double viscosity(double p, double h) const override;
    double conductivity(double p, double h) const override;
    double heatCapacity(double p, double h) const override;

    // Inverse lookups
    double enthalpyFromQuality(double p, double x) const override;
    double enthalpyFromTemperature(double p, double T) const override;
    double enthalpyFromEntropy(double p, double s) const override;
    double densityFromQuality(double p, double x) const override;

    // Drop every memoised state
    void clearCache();
    size_t cacheHits() const;
    size_t cacheMisses() const;

    // Raw IF97 equations, SI units
    static PhaseState region1(double p, double T);
    static PhaseState region2(double p, double T);
    static double saturationPressure(double T);
    static double saturationTemperatureIF97(double p);
    static double viscosityIAPWS(double T, double rho);
    static double conductivityIAPWS(double T, double rho);
    static double surfaceTensionIAPWS(double T);

private:
    // Full (p, h) state, mixture values already applied inside the dome
    struct FluidState {
        double T;
        double rho;
        double s;
        double cp;
        double mu;
        double k;
        double x;
        double alpha;
    };

    mutable PropertyCache<SaturationState> saturation_cache_;
    mutable PropertyCache<FluidState> ph_cache_;
    mutable PropertyCache<double> ps_cache_;

    SaturationState saturation(double p) const;
    FluidState state(double p, double h) const;

    static double checkedPressure(double p);
    static double clampSaturationPressure(double p);
    static SaturationState computeSaturation(double p);
    static FluidState computeState(double p, double h, const SaturationState& sat);
    static double solveTemperature(double p, double target, bool liquid, bool from_entropy,
                                   double t_lo, double t_hi);
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_IF97_WATER_HPP
