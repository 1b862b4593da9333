#ifndef KADMOS_NETWORK_WATER_PROPERTIES_HPP
#define KADMOS_NETWORK_WATER_PROPERTIES_HPP

namespace kadmos {
namespace network {

// Saturated liquid / vapor value pair at one pressure
struct SaturationPair {
    double liquid;
    double vapor;
};

/**
 * @brief Water/steam property evaluator consumed by the network components
 *
 * All arguments and results are SI: pressure [Pa], enthalpy [J/kg],
 * entropy [J/kg-K], temperature [K]. For states inside the two-phase dome
 * (0 < x < 1) mixture values follow the homogeneous rules: density is the
 * quality-weighted specific-volume average, viscosity and conductivity are
 * void-weighted, heat capacity is the saturated liquid value and temperature
 * is the saturation temperature.
 */
class WaterProperties {
public:
    virtual ~WaterProperties() = default;

    // Saturation line
    virtual double saturationTemperature(double p) const = 0;
    virtual double surfaceTension(double p) const = 0;
    virtual SaturationPair saturatedEnthalpy(double p) const = 0;
    virtual SaturationPair saturatedDensity(double p) const = 0;
    virtual SaturationPair saturatedViscosity(double p) const = 0;
    virtual SaturationPair saturatedConductivity(double p) const = 0;
    virtual SaturationPair saturatedHeatCapacity(double p) const = 0;

    // Thermodynamic state from (p, h)
    virtual double temperature(double p, double h) const = 0;
    virtual double entropy(double p, double h) const = 0;
    virtual double quality(double p, double h) const = 0;
    virtual double voidFraction(double p, double h) const = 0;

    // Transport and mixture properties from (p, h)
    virtual double density(double p, double h) const = 0;
    virtual double viscosity(double p, double h) const = 0;
    virtual double conductivity(double p, double h) const = 0;
    virtual double heatCapacity(double p, double h) const = 0;

    // Inverse lookups
    virtual double enthalpyFromQuality(double p, double x) const = 0;
    virtual double enthalpyFromTemperature(double p, double T) const = 0;
    virtual double enthalpyFromEntropy(double p, double s) const = 0;
    virtual double densityFromQuality(double p, double x) const = 0;
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_WATER_PROPERTIES_HPP
