#ifndef KADMOS_NETWORK_TURBOMACHINERY_HPP
#define KADMOS_NETWORK_TURBOMACHINERY_HPP

#include "Component.hpp"
#include <optional>

namespace kadmos {
namespace network {

struct TurbineParameters {
    double eta_is = 0.85;               // isentropic efficiency
    std::optional<double> p_out;        // absolute outlet pressure [Pa]
    std::optional<double> pr;           // pressure ratio p_out / p_in
};

/**
 * @brief Steam turbine with isentropic efficiency
 *
 * h_out = h_in - eta (h_in - h_s(p_out, s(p_in, h_in))). Exactly one of
 * p_out or pr must be given.
 */
class Turbine : public Component {
public:
    explicit Turbine(const std::string& name, const TurbineParameters& params = TurbineParameters());

    ComponentType type() const override { return ComponentType::Turbine; }

    const TurbineParameters& parameters() const { return params_; }
    void setParameters(const TurbineParameters& params) { params_ = params; }

    double outletPressure(double p_in) const;

    // m_in (h_in - h_out) [W]
    double shaftPower() const;

    std::vector<ConfigurationError> validate() const override;
    std::vector<Equation> equations(const WaterProperties& props) const override;

private:
    TurbineParameters params_;
};

struct PumpParameters {
    double eta = 0.8;                   // hydraulic efficiency
    std::optional<double> p_out;        // absolute outlet pressure [Pa]
    std::optional<double> dp;           // pressure rise [Pa]
};

// Liquid pump: h_out = h_in + (p_out - p_in) / (rho_in eta)
class Pump : public Component {
public:
    explicit Pump(const std::string& name, const PumpParameters& params = PumpParameters());

    ComponentType type() const override { return ComponentType::Pump; }

    const PumpParameters& parameters() const { return params_; }
    void setParameters(const PumpParameters& params) { params_ = params; }

    double outletPressure(double p_in) const;

    // m_in (h_out - h_in) [W]
    double shaftPower() const;

    std::vector<ConfigurationError> validate() const override;
    std::vector<Equation> equations(const WaterProperties& props) const override;

private:
    PumpParameters params_;
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_TURBOMACHINERY_HPP
