#ifndef KADMOS_NETWORK_FLOW_COMPONENTS_HPP
#define KADMOS_NETWORK_FLOW_COMPONENTS_HPP

#include "Component.hpp"
#include "Correlations.hpp"
#include <optional>

namespace kadmos {
namespace network {

struct PipeParameters {
    double L = 1.0;                             // length [m]
    double D = 0.1;                             // hydraulic diameter [m]
    std::optional<double> A;                    // flow area [m^2], pi D^2 / 4 when unset
    double roughness = 1.0e-5;                  // absolute roughness [m]
    double K = 0.0;                             // lumped form loss [-]
    double dz = 0.0;                            // elevation change [m], positive up
    double Q = 0.0;                             // heat added to the fluid [W]
    FrictionModel friction = FrictionModel::Homogeneous;
    bool include_acceleration = true;
};

/**
 * @brief One-in/one-out pipe with friction, form, gravity and acceleration drop
 *
 * Ports: inlet "in", outlet "out". Mixture properties come from (p, h) so the
 * element is two-phase aware.
 */
class Pipe : public Component {
public:
    explicit Pipe(const std::string& name, const PipeParameters& params = PipeParameters());

    ComponentType type() const override { return ComponentType::Pipe; }

    const PipeParameters& parameters() const { return params_; }
    void setParameters(const PipeParameters& params) { params_ = params; }

    double flowArea() const;

    std::vector<ConfigurationError> validate() const override;
    std::vector<Equation> equations(const WaterProperties& props) const override;

private:
    PipeParameters params_;
};

struct CoreChannelParameters {
    double L = 4.0;
    double D = 0.08;
    double A = 0.30;
    double roughness = 1.0e-5;
    double dz = 4.0;
    double K = 0.0;                             // base form loss
    double K_bundle = 0.0;                      // pin bundle loss as lumped K
    double K_grid = 0.0;                        // loss per spacer grid
    int n_grids = 0;
    FrictionModel friction = FrictionModel::Homogeneous;
    bool include_acceleration = true;
};

enum class CoreMode {
    FixedPower,
    TargetVoid
};

/**
 * @brief Heated boiling channel
 *
 * In FixedPower mode the duty variable <name>.Q is fixed by the caller. In
 * TargetVoid mode the duty is a free unknown and an extra equation drives the
 * outlet void fraction to the requested target.
 */
class CoreChannel : public Component {
public:
    static constexpr double DEFAULT_POWER = 1.0e8;     // [W]
    static constexpr double POWER_BOUND = 1.0e12;      // [W]

    explicit CoreChannel(const std::string& name,
                         const CoreChannelParameters& params = CoreChannelParameters());

    ComponentType type() const override { return ComponentType::CoreChannel; }

    const CoreChannelParameters& parameters() const { return params_; }
    void setParameters(const CoreChannelParameters& params) { params_ = params; }

    // Mode switches take effect on the next equation evaluation
    void setPower(double Q);
    void setExitVoidFraction(double alpha, double Q_guess = DEFAULT_POWER);

    CoreMode mode() const { return alpha_target_ ? CoreMode::TargetVoid : CoreMode::FixedPower; }
    std::optional<double> exitVoidTarget() const { return alpha_target_; }

    double power() const { return Q_.value(); }
    Variable& powerVariable() { return Q_; }
    const Variable& powerVariable() const { return Q_; }

    double totalLossCoefficient() const;

    std::vector<Variable*> variables() override;
    std::vector<ConfigurationError> validate() const override;
    std::vector<Equation> equations(const WaterProperties& props) const override;

private:
    CoreChannelParameters params_;
    Variable Q_;
    std::optional<double> alpha_target_;
};

struct OrificeParameters {
    std::optional<double> K;                    // loss coefficient model
    std::optional<double> Cd;                   // discharge coefficient model
    std::optional<double> A;                    // throat area [m^2], required by both
    double dz = 0.0;
};

/**
 * @brief Isenthalpic flow restriction
 *
 * Either dp = K G^2 / (2 rho_in) or dp = v^2 rho_in / (2 Cd^2) with v = m / (rho_in A).
 */
class OrificePlate : public Component {
public:
    explicit OrificePlate(const std::string& name, const OrificeParameters& params = OrificeParameters());

    ComponentType type() const override { return ComponentType::OrificePlate; }

    const OrificeParameters& parameters() const { return params_; }
    void setParameters(const OrificeParameters& params) { params_ = params; }

    // Throttling drop without the gravity head [Pa]
    double throttleDrop(double m_dot, double rho_in) const;

    std::vector<ConfigurationError> validate() const override;
    std::vector<Equation> equations(const WaterProperties& props) const override;

private:
    OrificeParameters params_;
};

struct AreaChangeParameters {
    double A_in = 1.0;
    double A_out = 1.0;
    double K = 0.0;                             // loss on the inlet velocity head
    double dz = 0.0;
};

// Sudden expansion or contraction, isenthalpic
class AreaChange : public Component {
public:
    explicit AreaChange(const std::string& name, const AreaChangeParameters& params = AreaChangeParameters());

    ComponentType type() const override { return ComponentType::AreaChange; }

    const AreaChangeParameters& parameters() const { return params_; }
    void setParameters(const AreaChangeParameters& params) { params_ = params; }

    std::vector<ConfigurationError> validate() const override;
    std::vector<Equation> equations(const WaterProperties& props) const override;

private:
    AreaChangeParameters params_;
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_FLOW_COMPONENTS_HPP
