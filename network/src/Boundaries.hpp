#ifndef KADMOS_NETWORK_BOUNDARIES_HPP
#define KADMOS_NETWORK_BOUNDARIES_HPP

#include "Component.hpp"
#include <optional>

namespace kadmos {
namespace network {

// Boundary source on outlet "out"; each given value becomes one pin equation
class Source : public Component {
public:
    explicit Source(const std::string& name,
                    std::optional<double> m = std::nullopt,
                    std::optional<double> p = std::nullopt,
                    std::optional<double> h = std::nullopt);

    ComponentType type() const override { return ComponentType::Source; }

    std::optional<double> massFlow() const { return m_; }
    std::optional<double> pressure() const { return p_; }
    std::optional<double> enthalpy() const { return h_; }

    std::vector<ConfigurationError> validate() const override;
    std::vector<Equation> equations(const WaterProperties& props) const override;

private:
    std::optional<double> m_;
    std::optional<double> p_;
    std::optional<double> h_;
};

// Boundary sink on inlet "in"
class Sink : public Component {
public:
    explicit Sink(const std::string& name,
                  std::optional<double> p = std::nullopt,
                  std::optional<double> h = std::nullopt);

    ComponentType type() const override { return ComponentType::Sink; }

    std::optional<double> pressure() const { return p_; }
    std::optional<double> enthalpy() const { return h_; }

    std::vector<ConfigurationError> validate() const override;
    std::vector<Equation> equations(const WaterProperties& props) const override;

private:
    std::optional<double> p_;
    std::optional<double> h_;
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_BOUNDARIES_HPP
