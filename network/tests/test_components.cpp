#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "Boundaries.hpp"
#include "FlowComponents.hpp"
#include "HeatExchangers.hpp"
#include "IF97Water.hpp"
#include "PhaseComponents.hpp"
#include "Turbomachinery.hpp"

using namespace kadmos::network;

namespace {

std::shared_ptr<Connection> stream(const std::string& name, double m, double p, double h) {
    return std::make_shared<Connection>(name, ConnectionGuess{m, p, h});
}

const Equation& find(const std::vector<Equation>& eqs, const std::string& name) {
    for (const Equation& eq : eqs) {
        if (eq.name == name) {
            return eq;
        }
    }
    throw std::out_of_range("no equation " + name);
}

bool hasError(const std::vector<ConfigurationError>& errors, const std::string& item) {
    for (const ConfigurationError& err : errors) {
        if (err.item == item) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST(ComponentTest, TypeNames) {
    EXPECT_EQ(componentTypeName(ComponentType::CoreChannel), "CoreChannel");
    EXPECT_EQ(componentTypeName(ComponentType::OrificePlate), "OrificePlate");
    EXPECT_EQ(Pipe("p").typeName(), "Pipe");
    EXPECT_EQ(Mixer("m").type(), ComponentType::Mixer);
    EXPECT_THROW(Pipe(""), std::invalid_argument);
}

TEST(ComponentTest, MissingPortsAreReported) {
    IF97Water water;
    Pipe pipe("downcomer");

    std::vector<ConfigurationError> errors = pipe.validate();
    ASSERT_EQ(errors.size(), 2);
    EXPECT_EQ(errors[0].component, "downcomer");
    EXPECT_EQ(errors[0].item, "in");
    EXPECT_EQ(errors[1].item, "out");

    EXPECT_THROW(pipe.equations(water), PortNotConnected);

    pipe.connectInlet("in", stream("c_in", 10.0, 7.0e6, 1.2e6));
    try {
        pipe.equations(water);
        FAIL() << "expected PortNotConnected";
    } catch (const PortNotConnected& e) {
        EXPECT_EQ(e.component(), "downcomer");
        EXPECT_EQ(e.port(), "out");
    }
}

TEST(PipeTest, GeometryErrors) {
    PipeParameters params;
    params.L = 0.0;
    params.D = -0.1;
    params.A = 0.0;
    Pipe pipe("riser", params);
    pipe.connectInlet("in", stream("a", 10.0, 7.0e6, 1.2e6));
    pipe.connectOutlet("out", stream("b", 10.0, 7.0e6, 1.2e6));

    std::vector<ConfigurationError> errors = pipe.validate();
    EXPECT_TRUE(hasError(errors, "L"));
    EXPECT_TRUE(hasError(errors, "D"));
    EXPECT_TRUE(hasError(errors, "A"));

    IF97Water water;
    EXPECT_THROW(pipe.equations(water), ConfigurationException);
}

TEST(PipeTest, FlowAreaDefaultsToCircle) {
    PipeParameters params;
    params.D = 0.2;
    EXPECT_NEAR(Pipe("p", params).flowArea(), PI * 0.01, 1e-15);
    params.A = 0.05;
    EXPECT_DOUBLE_EQ(Pipe("p", params).flowArea(), 0.05);
}

TEST(PipeTest, MassAndEnergyResiduals) {
    IF97Water water;
    PipeParameters params;
    params.Q = 2.0e6;
    Pipe pipe("heated", params);

    auto in = stream("in", 20.0, 7.0e6, 1.0e6);
    auto out = stream("out", 20.0, 6.9e6, 1.1e6);
    pipe.connectInlet("in", in);
    pipe.connectOutlet("out", out);

    std::vector<Equation> eqs = pipe.equations(water);
    ASSERT_EQ(eqs.size(), 3);
    EXPECT_EQ(eqs[0].name, "heated.mass");
    EXPECT_EQ(eqs[1].name, "heated.energy");
    EXPECT_EQ(eqs[2].name, "heated.dp");

    EXPECT_EQ(find(eqs, "heated.mass").residual, 0.0);
    EXPECT_NEAR(find(eqs, "heated.energy").residual, 0.0, 1e-9);

    out->m().setValue(25.0);
    eqs = pipe.equations(water);
    EXPECT_DOUBLE_EQ(find(eqs, "heated.mass").residual, 5.0);
    EXPECT_DOUBLE_EQ(find(eqs, "heated.mass").scale, 20.0);
}

TEST(PipeTest, DropResidualMatchesBreakdown) {
    IF97Water water;
    PipeParameters params;
    params.L = 3.0;
    params.D = 0.1;
    params.K = 1.0;
    params.dz = 3.0;
    Pipe pipe("riser", params);

    auto in = stream("in", 30.0, 7.0e6, 1.0e6);
    auto out = stream("out", 30.0, 7.0e6, 1.0e6);
    pipe.connectInlet("in", in);
    pipe.connectOutlet("out", out);

    FlowGeometry geom{3.0, 0.1, pipe.flowArea(), params.roughness, 1.0, 3.0};
    PressureDropBreakdown dp = pressureDropBreakdown(30.0, 7.0e6, 1.0e6, 7.0e6, 1.0e6, water, geom);

    std::vector<Equation> eqs = pipe.equations(water);
    const Equation& eq = find(eqs, "riser.dp");
    EXPECT_NEAR(eq.residual, -dp.total(), 1e-9 * dp.total());
    EXPECT_DOUBLE_EQ(eq.scale, 7.0e6);
}

TEST(CoreChannelTest, ModeSwitching) {
    IF97Water water;
    CoreChannel core("core");
    core.connectInlet("in", stream("in", 1000.0, 7.0e6, 1.2e6));
    core.connectOutlet("out", stream("out", 1000.0, 6.9e6, 1.3e6));

    EXPECT_EQ(core.mode(), CoreMode::FixedPower);
    EXPECT_TRUE(core.powerVariable().isFixed());
    EXPECT_DOUBLE_EQ(core.power(), CoreChannel::DEFAULT_POWER);
    EXPECT_EQ(core.powerVariable().name(), "core.Q");
    EXPECT_EQ(core.equations(water).size(), 3);

    core.setExitVoidFraction(0.4, 5.0e7);
    EXPECT_EQ(core.mode(), CoreMode::TargetVoid);
    EXPECT_FALSE(core.powerVariable().isFixed());
    EXPECT_DOUBLE_EQ(core.power(), 5.0e7);
    ASSERT_TRUE(core.exitVoidTarget().has_value());
    EXPECT_DOUBLE_EQ(*core.exitVoidTarget(), 0.4);

    std::vector<Equation> eqs = core.equations(water);
    ASSERT_EQ(eqs.size(), 4);
    EXPECT_EQ(eqs.back().name, "core.alpha_out");
    double alpha = water.voidFraction(6.9e6, 1.3e6);
    EXPECT_NEAR(eqs.back().residual, alpha - 0.4, 1e-12);

    core.setPower(8.0e7);
    EXPECT_EQ(core.mode(), CoreMode::FixedPower);
    EXPECT_TRUE(core.powerVariable().isFixed());
    EXPECT_DOUBLE_EQ(core.power(), 8.0e7);
    EXPECT_FALSE(core.exitVoidTarget().has_value());
    EXPECT_EQ(core.equations(water).size(), 3);

    EXPECT_THROW(core.setExitVoidFraction(1.5), std::invalid_argument);
    EXPECT_THROW(core.setExitVoidFraction(-0.1), std::invalid_argument);
}

TEST(CoreChannelTest, PrivateVariableAndLosses) {
    CoreChannelParameters params;
    params.K = 2.0;
    params.K_bundle = 10.0;
    params.K_grid = 0.5;
    params.n_grids = 4;
    CoreChannel a("a", params);
    CoreChannel b("b", params);

    EXPECT_DOUBLE_EQ(a.totalLossCoefficient(), 14.0);

    // Each instance owns its duty variable
    ASSERT_EQ(a.variables().size(), 1);
    EXPECT_NE(a.variables()[0], b.variables()[0]);
    a.setPower(1.0e7);
    EXPECT_DOUBLE_EQ(b.power(), CoreChannel::DEFAULT_POWER);

    params.n_grids = -1;
    a.setParameters(params);
    EXPECT_TRUE(hasError(a.validate(), "n_grids"));
}

TEST(CoreChannelTest, HeatRaisesOutletEnthalpy) {
    IF97Water water;
    CoreChannel core("core");
    auto in = stream("in", 500.0, 7.0e6, 1.2e6);
    auto out = stream("out", 500.0, 6.9e6, 1.2e6);
    core.connectInlet("in", in);
    core.connectOutlet("out", out);
    core.setPower(5.0e7);

    // Target is h_in + Q / m = 1.3e6
    EXPECT_NEAR(find(core.equations(water), "core.energy").residual, -1.0e5, 1e-6);
}

TEST(OrificeTest, ConfigurationErrors) {
    OrificeParameters both;
    both.K = 10.0;
    both.Cd = 0.6;
    both.A = 0.1;
    EXPECT_TRUE(hasError(OrificePlate("o", both).validate(), "K"));

    OrificeParameters neither;
    neither.A = 0.1;
    EXPECT_TRUE(hasError(OrificePlate("o", neither).validate(), "K"));

    OrificeParameters no_area;
    no_area.K = 10.0;
    EXPECT_TRUE(hasError(OrificePlate("o", no_area).validate(), "A"));

    OrificeParameters bad_cd;
    bad_cd.Cd = 0.0;
    bad_cd.A = 0.1;
    EXPECT_TRUE(hasError(OrificePlate("o", bad_cd).validate(), "Cd"));
}

TEST(OrificeTest, LossAndDischargeModelsAgree) {
    OrificeParameters k_model;
    k_model.K = 1.0 / (0.6 * 0.6);
    k_model.A = 0.05;
    OrificeParameters cd_model;
    cd_model.Cd = 0.6;
    cd_model.A = 0.05;

    double dp_k = OrificePlate("k", k_model).throttleDrop(100.0, 750.0);
    double dp_cd = OrificePlate("cd", cd_model).throttleDrop(100.0, 750.0);
    EXPECT_GT(dp_k, 0.0);
    EXPECT_NEAR(dp_k, dp_cd, 1e-9 * dp_k);
}

TEST(OrificeTest, Isenthalpic) {
    IF97Water water;
    OrificeParameters params;
    params.K = 10.0;
    params.A = 0.1;
    OrificePlate orifice("orifice", params);
    orifice.connectInlet("in", stream("in", 1000.0, 7.0e6, 1.35e6));
    orifice.connectOutlet("out", stream("out", 1000.0, 6.9e6, 1.35e6));

    std::vector<Equation> eqs = orifice.equations(water);
    ASSERT_EQ(eqs.size(), 3);
    EXPECT_EQ(find(eqs, "orifice.h_isenthalpic").residual, 0.0);
    EXPECT_EQ(find(eqs, "orifice.mass").residual, 0.0);
}

TEST(AreaChangeTest, ExpansionRecoversPressure) {
    IF97Water water;
    AreaChangeParameters params;
    params.A_in = 0.01;
    params.A_out = 0.04;
    AreaChange expansion("expansion", params);
    expansion.connectInlet("in", stream("in", 50.0, 7.0e6, 1.0e6));
    expansion.connectOutlet("out", stream("out", 50.0, 7.0e6, 1.0e6));

    // Without form loss the drop is pure deceleration and negative
    EXPECT_GT(find(expansion.equations(water), "expansion.dp").residual, 0.0);
}

TEST(SeparatorTest, SplitConservation) {
    IF97Water water;
    SeparatorParameters params;
    params.dp = 1.0e5;
    params.x_vap_target = 0.99;
    params.x_liq_target = 0.01;
    Separator sep("separator", params);

    const double p_in = 6.7e6;
    const double p_out = p_in - params.dp;
    const double h_v = water.enthalpyFromQuality(p_out, 0.99);
    const double h_l = water.enthalpyFromQuality(p_out, 0.01);

    // 100 kg/s at 15 % quality splits by the lever rule
    const double h_in = water.enthalpyFromQuality(p_out, 0.15);
    const double m_in = 100.0;
    const double m_v = m_in * (h_in - h_l) / (h_v - h_l);
    const double m_l = m_in - m_v;

    sep.connectInlet("in", stream("in", m_in, p_in, h_in));
    sep.connectOutlet("vap", stream("vap", m_v, p_out, h_v));
    sep.connectOutlet("liq", stream("liq", m_l, p_out, h_l));

    std::vector<Equation> eqs = sep.equations(water);
    ASSERT_EQ(eqs.size(), 6);
    for (const Equation& eq : eqs) {
        EXPECT_NEAR(eq.scaled(), 0.0, 1e-9) << eq.name;
    }

    Separator unwired("unwired");
    std::vector<ConfigurationError> errors = unwired.validate();
    EXPECT_TRUE(hasError(errors, "in"));
    EXPECT_TRUE(hasError(errors, "vap"));
    EXPECT_TRUE(hasError(errors, "liq"));
}

TEST(MixerTest, NeedsTwoInlets) {
    IF97Water water;
    Mixer mixer("mixer");
    mixer.connectOutlet("out", stream("out", 10.0, 7.0e6, 1.0e6));
    mixer.connectInlet("a", stream("a", 10.0, 7.0e6, 1.0e6));

    EXPECT_FALSE(mixer.validate().empty());
    EXPECT_THROW(mixer.equations(water), ConfigurationException);
}

TEST(MixerTest, BalancesAndPressureEquality) {
    IF97Water water;
    Mixer mixer("mixer");
    mixer.connectInlet("a", stream("a", 900.0, 6.6e6, 1.1e6));
    mixer.connectInlet("b", stream("b", 100.0, 7.0e6, 1.0e6));
    mixer.connectOutlet("out", stream("out", 1000.0, 7.0e6, 1.09e6));

    std::vector<Equation> eqs = mixer.equations(water);
    ASSERT_EQ(eqs.size(), 4);
    EXPECT_EQ(eqs[0].name, "mixer.p_eq_a");
    EXPECT_EQ(eqs[1].name, "mixer.p_eq_b");
    EXPECT_DOUBLE_EQ(eqs[0].residual, 4.0e5);
    EXPECT_DOUBLE_EQ(eqs[1].residual, 0.0);
    EXPECT_NEAR(find(eqs, "mixer.mass").residual, 0.0, 1e-9);
    EXPECT_NEAR(find(eqs, "mixer.energy").scaled(), 0.0, 1e-12);
}

TEST(TurbineTest, OutletSpecification) {
    TurbineParameters both;
    both.p_out = 1.0e5;
    both.pr = 0.1;
    EXPECT_TRUE(hasError(Turbine("t", both).validate(), "p_out"));

    TurbineParameters neither;
    EXPECT_TRUE(hasError(Turbine("t", neither).validate(), "p_out"));

    TurbineParameters bad_eta;
    bad_eta.pr = 0.1;
    bad_eta.eta_is = 1.5;
    EXPECT_TRUE(hasError(Turbine("t", bad_eta).validate(), "eta_is"));

    TurbineParameters ratio;
    ratio.pr = 0.25;
    EXPECT_DOUBLE_EQ(Turbine("t", ratio).outletPressure(4.0e6), 1.0e6);
}

TEST(TurbineTest, ExpansionProducesWork) {
    IF97Water water;
    TurbineParameters params;
    params.p_out = 1.0e5;
    Turbine turbine("turbine", params);

    const double p_in = 6.6e6;
    const double h_in = water.enthalpyFromQuality(p_in, 0.99);
    auto in = stream("in", 100.0, p_in, h_in);
    auto out = stream("out", 100.0, 1.0e5, h_in);
    turbine.connectInlet("in", in);
    turbine.connectOutlet("out", out);

    std::vector<Equation> eqs = turbine.equations(water);
    const Equation& energy = find(eqs, "turbine.energy");
    double h_out = h_in - energy.residual;
    EXPECT_LT(h_out, h_in);

    double h_is = water.enthalpyFromEntropy(1.0e5, water.entropy(p_in, h_in));
    EXPECT_NEAR(h_out, h_in - 0.85 * (h_in - h_is), 1e-6);

    out->h().setValue(h_out);
    EXPECT_NEAR(turbine.shaftPower(), 100.0 * 0.85 * (h_in - h_is), 1e-3);
    EXPECT_GT(turbine.shaftPower(), 0.0);
}

TEST(PumpTest, RaisesEnthalpy) {
    IF97Water water;
    PumpParameters params;
    params.dp = 6.9e6;
    params.eta = 0.8;
    Pump pump("pump", params);

    const double p_in = 1.0e5;
    const double h_in = water.enthalpyFromQuality(p_in, 0.0) - 1.0e4;
    pump.connectInlet("in", stream("in", 100.0, p_in, h_in));
    auto out = stream("out", 100.0, 7.0e6, h_in);
    pump.connectOutlet("out", out);

    std::vector<Equation> eqs = pump.equations(water);
    EXPECT_DOUBLE_EQ(find(eqs, "pump.p_out").residual, 0.0);

    double rho = water.density(p_in, h_in);
    EXPECT_NEAR(find(eqs, "pump.energy").residual, -6.9e6 / (rho * 0.8), 1e-6);

    out->h().setValue(h_in + 6.9e6 / (rho * 0.8));
    EXPECT_NEAR(pump.shaftPower(), 100.0 * 6.9e6 / (rho * 0.8), 1e-3);

    PumpParameters both;
    both.p_out = 7.0e6;
    both.dp = 1.0e5;
    EXPECT_TRUE(hasError(Pump("p", both).validate(), "p_out"));
    PumpParameters neither;
    EXPECT_TRUE(hasError(Pump("p", neither).validate(), "p_out"));
}

TEST(HeatExchangerTest, TargetValidation) {
    HeaterParameters none;
    EXPECT_TRUE(hasError(Heater("h", none).validate(), "target"));

    HeaterParameters two;
    two.target.quality = 0.0;
    two.target.temperature = 500.0;
    EXPECT_TRUE(hasError(Heater("h", two).validate(), "target"));

    HeaterParameters bad_x;
    bad_x.target = OutletTarget::fromQuality(1.2);
    EXPECT_TRUE(hasError(Heater("h", bad_x).validate(), "quality"));

    // Condenser accepts an empty target and condenses to saturated liquid
    CondenserParameters empty;
    empty.target = OutletTarget();
    Condenser condenser("cond", empty);
    EXPECT_FALSE(hasError(condenser.validate(), "target"));
}

TEST(HeatExchangerTest, CondenserPinsOutlet) {
    IF97Water water;
    CondenserParameters params;
    params.dp = 2.0e4;
    Condenser condenser("condenser", params);

    const double h_in = 2.2e6;
    condenser.connectInlet("in", stream("in", 100.0, 1.2e5, h_in));
    auto out = stream("out", 100.0, 1.0e5, 4.0e5);
    condenser.connectOutlet("out", out);

    std::vector<Equation> eqs = condenser.equations(water);
    ASSERT_EQ(eqs.size(), 3);
    EXPECT_NEAR(find(eqs, "condenser.p_out").residual, 0.0, 1e-9);

    double h_sat = water.enthalpyFromQuality(1.0e5, 0.0);
    EXPECT_NEAR(find(eqs, "condenser.h_out").residual, 4.0e5 - h_sat, 1e-6);

    out->h().setValue(h_sat);
    EXPECT_NEAR(condenser.heatRejected(), 100.0 * (h_in - h_sat), 1e-3);

    // An absolute outlet pressure overrides dp
    params.p_out = 0.5e5;
    condenser.setParameters(params);
    EXPECT_NEAR(find(condenser.equations(water), "condenser.p_out").residual, 0.5e5, 1e-9);
}

TEST(HeatExchangerTest, HeaterTemperatureTarget) {
    IF97Water water;
    HeaterParameters params;
    params.target = OutletTarget::fromTemperature(520.0);
    Heater heater("heater", params);

    const double h_in = 5.0e5;
    const double h_target = water.enthalpyFromTemperature(7.0e6, 520.0);
    heater.connectInlet("in", stream("in", 100.0, 7.0e6, h_in));
    auto out = stream("out", 100.0, 7.0e6, h_target);
    heater.connectOutlet("out", out);

    std::vector<Equation> eqs = heater.equations(water);
    EXPECT_NEAR(find(eqs, "heater.h_out").residual, 0.0, 1e-9);
    EXPECT_NEAR(heater.heatAdded(), 100.0 * (h_target - h_in), 1e-3);
    EXPECT_NEAR(water.temperature(7.0e6, h_target), 520.0, 1e-3);
}

TEST(BoundaryTest, PinEquations) {
    IF97Water water;
    Source source("source", 10.0, 7.0e6);
    source.connectOutlet("out", stream("s", 12.0, 7.0e6, 1.0e6));

    std::vector<Equation> eqs = source.equations(water);
    ASSERT_EQ(eqs.size(), 2);
    EXPECT_EQ(eqs[0].name, "source.m_out");
    EXPECT_DOUBLE_EQ(eqs[0].residual, 2.0);
    EXPECT_EQ(eqs[1].name, "source.p_out");
    EXPECT_DOUBLE_EQ(eqs[1].residual, 0.0);

    Sink sink("sink", std::nullopt, 1.1e6);
    EXPECT_THROW(sink.equations(water), PortNotConnected);
    sink.connectInlet("in", stream("k", 12.0, 7.0e6, 1.0e6));
    eqs = sink.equations(water);
    ASSERT_EQ(eqs.size(), 1);
    EXPECT_EQ(eqs[0].name, "sink.h_in");
    EXPECT_DOUBLE_EQ(eqs[0].residual, -1.0e5);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
