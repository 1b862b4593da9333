#include "PhaseComponents.hpp"

namespace kadmos {
namespace network {

Separator::Separator(const std::string& name, const SeparatorParameters& params)
    : Component(name)
    , params_(params)
{
}

std::vector<ConfigurationError> Separator::validate() const {
    std::vector<ConfigurationError> errors;
    checkInlet("in", errors);
    checkOutlet("vap", errors);
    checkOutlet("liq", errors);
    if (!(params_.x_vap_target >= 0.0 && params_.x_vap_target <= 1.0)) {
        errors.push_back(error("x_vap_target", "quality target must lie in [0, 1]"));
    }
    if (!(params_.x_liq_target >= 0.0 && params_.x_liq_target <= 1.0)) {
        errors.push_back(error("x_liq_target", "quality target must lie in [0, 1]"));
    }
    return errors;
}

std::vector<Equation> Separator::equations(const WaterProperties& props) const {
    const Connection& in = requireInlet("in");
    const Connection& vap = requireOutlet("vap");
    const Connection& liq = requireOutlet("liq");
    throwIfInvalid();

    double m_in = in.m().value();
    double h_in = in.h().value();
    double p_out = in.p().value() - params_.dp;

    double h_v = props.enthalpyFromQuality(p_out, params_.x_vap_target);
    double h_l = props.enthalpyFromQuality(p_out, params_.x_liq_target);

    double m_v = vap.m().value();
    double m_l = liq.m().value();

    std::vector<Equation> eqs;
    eqs.push_back({name() + ".p_vap", vap.p().value() - p_out, pressureScale(p_out)});
    eqs.push_back({name() + ".p_liq", liq.p().value() - p_out, pressureScale(p_out)});
    eqs.push_back({name() + ".h_vap_target", vap.h().value() - h_v, enthalpyScale(h_v)});
    eqs.push_back({name() + ".h_liq_target", liq.h().value() - h_l, enthalpyScale(h_l)});
    eqs.push_back({name() + ".mass", m_in - (m_v + m_l), massScale(m_in)});
    eqs.push_back({name() + ".energy",
                   m_in * h_in - (m_v * vap.h().value() + m_l * liq.h().value()),
                   energyScale(m_in * h_in)});
    return eqs;
}

Mixer::Mixer(const std::string& name)
    : Component(name)
{
}

std::vector<ConfigurationError> Mixer::validate() const {
    std::vector<ConfigurationError> errors;
    checkOutlet("out", errors);
    if (inlets().size() < 2) {
        errors.push_back(error("", "mixer needs at least two inlets"));
    }
    for (const auto& port : inlets()) {
        if (!port.second) {
            errors.push_back(error(port.first, "inlet '" + port.first + "' not connected"));
        }
    }
    return errors;
}

std::vector<Equation> Mixer::equations(const WaterProperties& /*props*/) const {
    const Connection& out = requireOutlet("out");
    throwIfInvalid();

    double p_out = out.p().value();
    double m_sum = 0.0;
    double e_sum = 0.0;

    std::vector<Equation> eqs;
    for (const auto& port : inlets()) {
        const Connection& in = *port.second;
        eqs.push_back({name() + ".p_eq_" + port.first, p_out - in.p().value(), pressureScale(p_out)});
        m_sum += in.m().value();
        e_sum += in.m().value() * in.h().value();
    }

    eqs.push_back({name() + ".mass", out.m().value() - m_sum, massScale(m_sum)});
    eqs.push_back({name() + ".energy", out.m().value() * out.h().value() - e_sum, energyScale(e_sum)});
    return eqs;
}

} // namespace network
} // namespace kadmos
