#ifndef KADMOS_NETWORK_HEAT_EXCHANGERS_HPP
#define KADMOS_NETWORK_HEAT_EXCHANGERS_HPP

#include "Component.hpp"
#include <optional>

namespace kadmos {
namespace network {

// Outlet state pin; at most one field may be set
struct OutletTarget {
    std::optional<double> quality;          // [-]
    std::optional<double> temperature;      // [K]
    std::optional<double> enthalpy;         // [J/kg]

    int count() const;
    double enthalpyAt(double p_out, const WaterProperties& props) const;

    static OutletTarget fromQuality(double x);
    static OutletTarget fromTemperature(double T);
    static OutletTarget fromEnthalpy(double h);
};

struct CondenserParameters {
    double dp = 0.0;                        // used when p_out is unset [Pa]
    std::optional<double> p_out;            // absolute outlet pressure [Pa]
    OutletTarget target = OutletTarget::fromQuality(0.0);
};

/**
 * @brief Condenser pinning the outlet to a thermodynamic target
 *
 * No heat transfer area is modelled; the heat rejected follows from the solution.
 * With no target set the outlet is saturated liquid.
 */
class Condenser : public Component {
public:
    explicit Condenser(const std::string& name, const CondenserParameters& params = CondenserParameters());

    ComponentType type() const override { return ComponentType::Condenser; }

    const CondenserParameters& parameters() const { return params_; }
    void setParameters(const CondenserParameters& params) { params_ = params; }

    // m_in (h_in - h_out) [W]
    double heatRejected() const;

    std::vector<ConfigurationError> validate() const override;
    std::vector<Equation> equations(const WaterProperties& props) const override;

private:
    CondenserParameters params_;
};

struct HeaterParameters {
    double dp = 0.0;
    std::optional<double> p_out;
    OutletTarget target;
};

// Heater enforcing outlet quality, temperature or enthalpy
class Heater : public Component {
public:
    explicit Heater(const std::string& name, const HeaterParameters& params = HeaterParameters());

    ComponentType type() const override { return ComponentType::Heater; }

    const HeaterParameters& parameters() const { return params_; }
    void setParameters(const HeaterParameters& params) { params_ = params; }

    // m_in (h_out - h_in) [W]
    double heatAdded() const;

    std::vector<ConfigurationError> validate() const override;
    std::vector<Equation> equations(const WaterProperties& props) const override;

private:
    HeaterParameters params_;
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_HEAT_EXCHANGERS_HPP
