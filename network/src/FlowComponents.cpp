#include "FlowComponents.hpp"
#include <cmath>
#include <stdexcept>

namespace kadmos {
namespace network {

namespace {

// Mass and energy rows shared by every heated/adiabatic pipe-like element
void addMassAndEnergy(const std::string& name, const Connection& in, const Connection& out,
                      double Q, std::vector<Equation>& eqs) {
    double m = in.m().value();
    eqs.push_back({name + ".mass", out.m().value() - m, massScale(m)});

    double dh = std::abs(m) > EPS ? Q / m : 0.0;
    double h_target = in.h().value() + dh;
    eqs.push_back({name + ".energy", out.h().value() - h_target, enthalpyScale(h_target)});
}

void checkGeometry(const Component& comp, double L, double D, double A,
                   std::vector<ConfigurationError>& errors) {
    if (!(L > 0.0)) {
        errors.push_back({comp.name(), "L", "length must be positive"});
    }
    if (!(D > 0.0)) {
        errors.push_back({comp.name(), "D", "hydraulic diameter must be positive"});
    }
    if (!(A > 0.0)) {
        errors.push_back({comp.name(), "A", "flow area must be positive"});
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Pipe
// ---------------------------------------------------------------------------

Pipe::Pipe(const std::string& name, const PipeParameters& params)
    : Component(name)
    , params_(params)
{
}

double Pipe::flowArea() const {
    if (params_.A) {
        return *params_.A;
    }
    return PI * params_.D * params_.D / 4.0;
}

std::vector<ConfigurationError> Pipe::validate() const {
    std::vector<ConfigurationError> errors;
    checkInlet("in", errors);
    checkOutlet("out", errors);
    checkGeometry(*this, params_.L, params_.D, flowArea(), errors);
    return errors;
}

std::vector<Equation> Pipe::equations(const WaterProperties& props) const {
    const Connection& in = requireInlet("in");
    const Connection& out = requireOutlet("out");
    throwIfInvalid();

    std::vector<Equation> eqs;
    addMassAndEnergy(name(), in, out, params_.Q, eqs);

    double p_in = in.p().value();
    FlowGeometry geom{params_.L, params_.D, flowArea(), params_.roughness, params_.K, params_.dz};
    PressureDropBreakdown dp = pressureDropBreakdown(in.m().value(),
                                                     p_in, in.h().value(),
                                                     out.p().value(), out.h().value(),
                                                     props, geom, params_.friction,
                                                     params_.include_acceleration, true);

    eqs.push_back({name() + ".dp", (p_in - out.p().value()) - dp.total(), pressureScale(p_in)});
    return eqs;
}

// ---------------------------------------------------------------------------
// CoreChannel
// ---------------------------------------------------------------------------

CoreChannel::CoreChannel(const std::string& name, const CoreChannelParameters& params)
    : Component(name)
    , params_(params)
    , Q_(name + ".Q", DEFAULT_POWER, true, -POWER_BOUND, POWER_BOUND)
{
}

void CoreChannel::setPower(double Q) {
    Q_.fix(Q);
    alpha_target_.reset();
}

void CoreChannel::setExitVoidFraction(double alpha, double Q_guess) {
    if (!(alpha >= 0.0 && alpha <= 1.0)) {
        throw std::invalid_argument(name() + ": exit void fraction target must lie in [0, 1]");
    }
    alpha_target_ = alpha;
    Q_.setValue(Q_guess);
    Q_.unfix();
}

double CoreChannel::totalLossCoefficient() const {
    return params_.K + params_.K_bundle + params_.n_grids * params_.K_grid;
}

std::vector<Variable*> CoreChannel::variables() {
    return {&Q_};
}

std::vector<ConfigurationError> CoreChannel::validate() const {
    std::vector<ConfigurationError> errors;
    checkInlet("in", errors);
    checkOutlet("out", errors);
    checkGeometry(*this, params_.L, params_.D, params_.A, errors);
    if (params_.n_grids < 0) {
        errors.push_back(error("n_grids", "number of spacer grids must not be negative"));
    }
    return errors;
}

std::vector<Equation> CoreChannel::equations(const WaterProperties& props) const {
    const Connection& in = requireInlet("in");
    const Connection& out = requireOutlet("out");
    throwIfInvalid();

    std::vector<Equation> eqs;
    addMassAndEnergy(name(), in, out, Q_.value(), eqs);

    double p_in = in.p().value();
    double p_out = out.p().value();
    double h_out = out.h().value();

    FlowGeometry geom{params_.L, params_.D, params_.A, params_.roughness,
                      totalLossCoefficient(), params_.dz};
    PressureDropBreakdown dp = pressureDropBreakdown(in.m().value(),
                                                     p_in, in.h().value(),
                                                     p_out, h_out,
                                                     props, geom, params_.friction,
                                                     params_.include_acceleration, true);

    eqs.push_back({name() + ".dp", (p_in - p_out) - dp.total(), pressureScale(p_in)});

    if (alpha_target_) {
        double alpha_out = props.voidFraction(p_out, h_out);
        eqs.push_back({name() + ".alpha_out", alpha_out - *alpha_target_,
                       std::max(SCALE_VOID, std::abs(*alpha_target_))});
    }
    return eqs;
}

// ---------------------------------------------------------------------------
// OrificePlate
// ---------------------------------------------------------------------------

OrificePlate::OrificePlate(const std::string& name, const OrificeParameters& params)
    : Component(name)
    , params_(params)
{
}

double OrificePlate::throttleDrop(double m_dot, double rho_in) const {
    double A = params_.A.value_or(0.0);
    if (params_.K) {
        double G = m_dot / A;
        return *params_.K * G * G / (2.0 * rho_in);
    }
    double Cd = params_.Cd.value_or(0.0);
    double v = m_dot / (rho_in * A);
    return v * v * rho_in / (2.0 * Cd * Cd);
}

std::vector<ConfigurationError> OrificePlate::validate() const {
    std::vector<ConfigurationError> errors;
    checkInlet("in", errors);
    checkOutlet("out", errors);

    if (params_.K && params_.Cd) {
        errors.push_back(error("K", "specify either K or Cd, not both"));
    } else if (!params_.K && !params_.Cd) {
        errors.push_back(error("K", "specify either K or (Cd and A)"));
    }
    if (!params_.A) {
        errors.push_back(error("A", "throat area must be provided"));
    } else if (!(*params_.A > 0.0)) {
        errors.push_back(error("A", "throat area must be positive"));
    }
    if (params_.Cd && !(*params_.Cd > 0.0)) {
        errors.push_back(error("Cd", "discharge coefficient must be positive"));
    }
    return errors;
}

std::vector<Equation> OrificePlate::equations(const WaterProperties& props) const {
    const Connection& in = requireInlet("in");
    const Connection& out = requireOutlet("out");
    throwIfInvalid();

    double m = in.m().value();
    double p_in = in.p().value();
    double h_in = in.h().value();
    double rho = props.density(p_in, h_in);

    double dp_total = throttleDrop(m, rho) + gravityHead(rho, params_.dz);

    std::vector<Equation> eqs;
    eqs.push_back({name() + ".mass", out.m().value() - m, massScale(m)});
    eqs.push_back({name() + ".h_isenthalpic", out.h().value() - h_in, enthalpyScale(h_in)});
    eqs.push_back({name() + ".dp", (p_in - out.p().value()) - dp_total, pressureScale(p_in)});
    return eqs;
}

// ---------------------------------------------------------------------------
// AreaChange
// ---------------------------------------------------------------------------

AreaChange::AreaChange(const std::string& name, const AreaChangeParameters& params)
    : Component(name)
    , params_(params)
{
}

std::vector<ConfigurationError> AreaChange::validate() const {
    std::vector<ConfigurationError> errors;
    checkInlet("in", errors);
    checkOutlet("out", errors);
    return errors;
}

std::vector<Equation> AreaChange::equations(const WaterProperties& props) const {
    const Connection& in = requireInlet("in");
    const Connection& out = requireOutlet("out");

    double m = in.m().value();
    double p_in = in.p().value();
    double h_in = in.h().value();
    double p_out = out.p().value();

    double rho_in = props.density(p_in, h_in);
    double rho_out = props.density(p_out, out.h().value());

    // Form loss on the upstream velocity head, gravity on the inlet density
    double dp_form = formLoss(m, rho_in, params_.K, params_.A_in);
    double dp_acc = accelerationLoss(m, params_.A_in, params_.A_out, rho_in, rho_out);
    double dp_grav = gravityHead(rho_in, params_.dz);
    double dp_total = dp_form + dp_acc + dp_grav;

    std::vector<Equation> eqs;
    eqs.push_back({name() + ".mass", out.m().value() - m, massScale(m)});
    eqs.push_back({name() + ".h_isenthalpic", out.h().value() - h_in, enthalpyScale(h_in)});
    eqs.push_back({name() + ".dp", (p_in - p_out) - dp_total, pressureScale(p_in)});
    return eqs;
}

} // namespace network
} // namespace kadmos
