#ifndef KADMOS_NETWORK_PHASE_COMPONENTS_HPP
#define KADMOS_NETWORK_PHASE_COMPONENTS_HPP

#include "Component.hpp"

namespace kadmos {
namespace network {

struct SeparatorParameters {
    double dp = 0.0;                // drop from inlet to both outlets [Pa]
    double x_vap_target = 0.999;    // vapor outlet quality
    double x_liq_target = 0.001;    // liquid outlet quality
};

/**
 * @brief Steam separator splitting one inlet into vapor and liquid outlets
 *
 * Ports: inlet "in", outlets "vap" and "liq". Outlet qualities are pinned to
 * the targets; mass and energy balances determine the split.
 */
class Separator : public Component {
public:
    explicit Separator(const std::string& name, const SeparatorParameters& params = SeparatorParameters());

    ComponentType type() const override { return ComponentType::Separator; }

    const SeparatorParameters& parameters() const { return params_; }
    void setParameters(const SeparatorParameters& params) { params_ = params; }

    std::vector<ConfigurationError> validate() const override;
    std::vector<Equation> equations(const WaterProperties& props) const override;

private:
    SeparatorParameters params_;
};

/**
 * @brief Adiabatic junction of two or more inlets into outlet "out"
 *
 * Every inlet pressure equals the outlet pressure. Inlet port names are free.
 */
class Mixer : public Component {
public:
    explicit Mixer(const std::string& name);

    ComponentType type() const override { return ComponentType::Mixer; }

    std::vector<ConfigurationError> validate() const override;
    std::vector<Equation> equations(const WaterProperties& props) const override;
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_PHASE_COMPONENTS_HPP
