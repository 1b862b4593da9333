#include "Turbomachinery.hpp"
#include <algorithm>

namespace kadmos {
namespace network {

Turbine::Turbine(const std::string& name, const TurbineParameters& params)
    : Component(name)
    , params_(params)
{
}

double Turbine::outletPressure(double p_in) const {
    if (params_.p_out) {
        return *params_.p_out;
    }
    return params_.pr.value_or(1.0) * p_in;
}

double Turbine::shaftPower() const {
    const Connection& in = requireInlet("in");
    const Connection& out = requireOutlet("out");
    return in.m().value() * (in.h().value() - out.h().value());
}

std::vector<ConfigurationError> Turbine::validate() const {
    std::vector<ConfigurationError> errors;
    checkInlet("in", errors);
    checkOutlet("out", errors);
    if (params_.p_out && params_.pr) {
        errors.push_back(error("p_out", "specify either p_out or pr, not both"));
    } else if (!params_.p_out && !params_.pr) {
        errors.push_back(error("p_out", "specify p_out or pr"));
    }
    if (!(params_.eta_is > 0.0 && params_.eta_is <= 1.0)) {
        errors.push_back(error("eta_is", "isentropic efficiency must lie in (0, 1]"));
    }
    return errors;
}

std::vector<Equation> Turbine::equations(const WaterProperties& props) const {
    const Connection& in = requireInlet("in");
    const Connection& out = requireOutlet("out");
    throwIfInvalid();

    double m = in.m().value();
    double p_in = in.p().value();
    double h_in = in.h().value();
    double p_out = outletPressure(p_in);

    double s_in = props.entropy(p_in, h_in);
    double h_is = props.enthalpyFromEntropy(p_out, s_in);
    double h_out = h_in - params_.eta_is * (h_in - h_is);

    std::vector<Equation> eqs;
    eqs.push_back({name() + ".mass", out.m().value() - m, massScale(m)});
    eqs.push_back({name() + ".p_out", out.p().value() - p_out, pressureScale(p_out)});
    eqs.push_back({name() + ".energy", out.h().value() - h_out, enthalpyScale(h_out)});
    return eqs;
}

Pump::Pump(const std::string& name, const PumpParameters& params)
    : Component(name)
    , params_(params)
{
}

double Pump::outletPressure(double p_in) const {
    if (params_.p_out) {
        return *params_.p_out;
    }
    return p_in + params_.dp.value_or(0.0);
}

double Pump::shaftPower() const {
    const Connection& in = requireInlet("in");
    const Connection& out = requireOutlet("out");
    return in.m().value() * (out.h().value() - in.h().value());
}

std::vector<ConfigurationError> Pump::validate() const {
    std::vector<ConfigurationError> errors;
    checkInlet("in", errors);
    checkOutlet("out", errors);
    if (params_.p_out && params_.dp) {
        errors.push_back(error("p_out", "specify either p_out or dp, not both"));
    } else if (!params_.p_out && !params_.dp) {
        errors.push_back(error("p_out", "specify p_out or dp"));
    }
    if (!(params_.eta > 0.0)) {
        errors.push_back(error("eta", "efficiency must be positive"));
    }
    return errors;
}

std::vector<Equation> Pump::equations(const WaterProperties& props) const {
    const Connection& in = requireInlet("in");
    const Connection& out = requireOutlet("out");
    throwIfInvalid();

    double m = in.m().value();
    double p_in = in.p().value();
    double h_in = in.h().value();
    double p_out = outletPressure(p_in);

    double rho_in = props.density(p_in, h_in);
    double h_out = h_in + (p_out - p_in) / std::max(EPS, rho_in * params_.eta);

    std::vector<Equation> eqs;
    eqs.push_back({name() + ".mass", out.m().value() - m, massScale(m)});
    eqs.push_back({name() + ".p_out", out.p().value() - p_out, pressureScale(p_out)});
    eqs.push_back({name() + ".energy", out.h().value() - h_out, enthalpyScale(h_out)});
    return eqs;
}

} // namespace network
} // namespace kadmos
