#include "Boundaries.hpp"

namespace kadmos {
namespace network {

Source::Source(const std::string& name, std::optional<double> m,
               std::optional<double> p, std::optional<double> h)
    : Component(name)
    , m_(m)
    , p_(p)
    , h_(h)
{
}

std::vector<ConfigurationError> Source::validate() const {
    std::vector<ConfigurationError> errors;
    checkOutlet("out", errors);
    return errors;
}

std::vector<Equation> Source::equations(const WaterProperties& /*props*/) const {
    const Connection& out = requireOutlet("out");

    std::vector<Equation> eqs;
    if (m_) {
        eqs.push_back({name() + ".m_out", out.m().value() - *m_, massScale(*m_)});
    }
    if (p_) {
        eqs.push_back({name() + ".p_out", out.p().value() - *p_, pressureScale(*p_)});
    }
    if (h_) {
        eqs.push_back({name() + ".h_out", out.h().value() - *h_, enthalpyScale(*h_)});
    }
    return eqs;
}

Sink::Sink(const std::string& name, std::optional<double> p, std::optional<double> h)
    : Component(name)
    , p_(p)
    , h_(h)
{
}

std::vector<ConfigurationError> Sink::validate() const {
    std::vector<ConfigurationError> errors;
    checkInlet("in", errors);
    return errors;
}

std::vector<Equation> Sink::equations(const WaterProperties& /*props*/) const {
    const Connection& in = requireInlet("in");

    std::vector<Equation> eqs;
    if (p_) {
        eqs.push_back({name() + ".p_in", in.p().value() - *p_, pressureScale(*p_)});
    }
    if (h_) {
        eqs.push_back({name() + ".h_in", in.h().value() - *h_, enthalpyScale(*h_)});
    }
    return eqs;
}

} // namespace network
} // namespace kadmos
