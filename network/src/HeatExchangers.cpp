#include "HeatExchangers.hpp"

namespace kadmos {
namespace network {

int OutletTarget::count() const {
    return (quality ? 1 : 0) + (temperature ? 1 : 0) + (enthalpy ? 1 : 0);
}

double OutletTarget::enthalpyAt(double p_out, const WaterProperties& props) const {
    if (enthalpy) {
        return *enthalpy;
    }
    if (temperature) {
        return props.enthalpyFromTemperature(p_out, *temperature);
    }
    return props.enthalpyFromQuality(p_out, quality.value_or(0.0));
}

OutletTarget OutletTarget::fromQuality(double x) {
    OutletTarget t;
    t.quality = x;
    return t;
}

OutletTarget OutletTarget::fromTemperature(double T) {
    OutletTarget t;
    t.temperature = T;
    return t;
}

OutletTarget OutletTarget::fromEnthalpy(double h) {
    OutletTarget t;
    t.enthalpy = h;
    return t;
}

namespace {

void checkTarget(const Component& comp, const OutletTarget& target, bool required,
                 std::vector<ConfigurationError>& errors) {
    if (target.count() > 1) {
        errors.push_back({comp.name(), "target",
                          "specify only one of outlet quality, temperature or enthalpy"});
    } else if (required && target.count() == 0) {
        errors.push_back({comp.name(), "target",
                          "specify outlet quality, temperature or enthalpy"});
    }
    if (target.quality && !(*target.quality >= 0.0 && *target.quality <= 1.0)) {
        errors.push_back({comp.name(), "quality", "outlet quality must lie in [0, 1]"});
    }
    if (target.temperature && !(*target.temperature > 0.0)) {
        errors.push_back({comp.name(), "temperature", "outlet temperature must be positive"});
    }
}

// Mass, outlet pressure and outlet enthalpy rows common to both exchangers
std::vector<Equation> pinnedOutlet(const std::string& name, const Connection& in, const Connection& out,
                                   double p_out, double h_target) {
    double m = in.m().value();
    std::vector<Equation> eqs;
    eqs.push_back({name + ".mass", out.m().value() - m, massScale(m)});
    eqs.push_back({name + ".p_out", out.p().value() - p_out, pressureScale(p_out)});
    eqs.push_back({name + ".h_out", out.h().value() - h_target, enthalpyScale(h_target)});
    return eqs;
}

} // namespace

Condenser::Condenser(const std::string& name, const CondenserParameters& params)
    : Component(name)
    , params_(params)
{
}

double Condenser::heatRejected() const {
    const Connection& in = requireInlet("in");
    const Connection& out = requireOutlet("out");
    return in.m().value() * (in.h().value() - out.h().value());
}

std::vector<ConfigurationError> Condenser::validate() const {
    std::vector<ConfigurationError> errors;
    checkInlet("in", errors);
    checkOutlet("out", errors);
    checkTarget(*this, params_.target, false, errors);
    return errors;
}

std::vector<Equation> Condenser::equations(const WaterProperties& props) const {
    const Connection& in = requireInlet("in");
    const Connection& out = requireOutlet("out");
    throwIfInvalid();

    double p_out = params_.p_out ? *params_.p_out : in.p().value() - params_.dp;
    double h_target = params_.target.enthalpyAt(p_out, props);
    return pinnedOutlet(name(), in, out, p_out, h_target);
}

Heater::Heater(const std::string& name, const HeaterParameters& params)
    : Component(name)
    , params_(params)
{
}

double Heater::heatAdded() const {
    const Connection& in = requireInlet("in");
    const Connection& out = requireOutlet("out");
    return in.m().value() * (out.h().value() - in.h().value());
}

std::vector<ConfigurationError> Heater::validate() const {
    std::vector<ConfigurationError> errors;
    checkInlet("in", errors);
    checkOutlet("out", errors);
    checkTarget(*this, params_.target, true, errors);
    return errors;
}

std::vector<Equation> Heater::equations(const WaterProperties& props) const {
    const Connection& in = requireInlet("in");
    const Connection& out = requireOutlet("out");
    throwIfInvalid();

    double p_out = params_.p_out ? *params_.p_out : in.p().value() - params_.dp;
    double h_target = params_.target.enthalpyAt(p_out, props);
    return pinnedOutlet(name(), in, out, p_out, h_target);
}

} // namespace network
} // namespace kadmos
