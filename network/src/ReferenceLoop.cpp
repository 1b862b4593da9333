#include "ReferenceLoop.hpp"
#include <cmath>

namespace kadmos {
namespace network {

ReferenceLoop buildReferenceLoop(Network& net, const ReferenceLoopParameters& params) {
    const double p_r = params.p_reactor;
    const double p_c = params.p_condenser;
    ReferenceLoop loop;

    loop.mixer = net.addComponent(std::make_shared<Mixer>("mixer"));

    PipeParameters dc;
    dc.L = std::abs(params.downcomer_dz);
    dc.D = 1.0;
    dc.K = 1.0;
    dc.dz = params.downcomer_dz;
    dc.friction = params.friction;
    loop.downcomer = net.addComponent(std::make_shared<Pipe>("downcomer", dc));

    CoreChannelParameters cp;
    cp.L = 2.0;
    cp.D = 0.05;
    cp.A = 0.1;
    cp.K = 2.0;
    cp.dz = 2.0;
    cp.K_bundle = 10.0;
    cp.friction = params.friction;
    loop.core = net.addComponent(std::make_shared<CoreChannel>("core", cp));

    OrificeParameters op;
    op.K = 10.0;
    op.A = 0.1;
    loop.orifice = net.addComponent(std::make_shared<OrificePlate>("orifice", op));

    PipeParameters ch;
    ch.L = 5.0;
    ch.D = 1.0;
    ch.K = 1.0;
    ch.dz = 5.0;
    ch.friction = params.friction;
    loop.chimney = net.addComponent(std::make_shared<Pipe>("chimney", ch));

    SeparatorParameters sp;
    sp.dp = params.separator_dp;
    sp.x_vap_target = 0.99;
    sp.x_liq_target = 0.01;
    loop.separator = net.addComponent(std::make_shared<Separator>("separator", sp));

    TurbineParameters tp;
    tp.eta_is = 0.85;
    tp.p_out = p_c;
    loop.turbine = net.addComponent(std::make_shared<Turbine>("turbine", tp));

    CondenserParameters cnp;
    cnp.p_out = p_c;
    cnp.target = OutletTarget::fromQuality(0.0);
    loop.condenser = net.addComponent(std::make_shared<Condenser>("condenser", cnp));

    PumpParameters pp;
    pp.p_out = p_r;
    pp.eta = 0.8;
    loop.pump = net.addComponent(std::make_shared<Pump>("pump", pp));

    HeaterParameters hp;
    hp.target = OutletTarget::fromTemperature(520.0);
    loop.heater = net.addComponent(std::make_shared<Heater>("heater", hp));

    net.connect(*loop.mixer, "out", *loop.downcomer, "in", "c_mix_dc", {1000.0, p_r, 1.2e6});
    net.connect(*loop.downcomer, "out", *loop.core, "in", "c_dc_core", {1000.0, p_r, 1.2e6});
    net.connect(*loop.core, "out", *loop.orifice, "in", "c_core_orif", {1000.0, p_r - 1.0e5, 1.35e6});
    net.connect(*loop.orifice, "out", *loop.chimney, "in", "c_or_chim", {1000.0, p_r - 2.0e5, 1.35e6});
    net.connect(*loop.chimney, "out", *loop.separator, "in", "c_ch_sep", {1000.0, p_r - 3.0e5, 1.40e6});
    net.connect(*loop.separator, "liq", *loop.mixer, "a", "c_liq_mix", {900.0, p_r - 4.0e5, 1.1e6});
    net.connect(*loop.separator, "vap", *loop.turbine, "in", "c_vap_turb", {100.0, p_r - 4.0e5, 2.8e6});
    net.connect(*loop.turbine, "out", *loop.condenser, "in", "c_t_cond", {100.0, p_c, 2.2e6});
    auto cond_pump = net.connect(*loop.condenser, "out", *loop.pump, "in", "c_cond_pump", {100.0, p_c, 4.0e5});
    auto pump_heat = net.connect(*loop.pump, "out", *loop.heater, "in", "c_pump_heat", {100.0, p_r, 5.0e5});
    net.connect(*loop.heater, "out", *loop.mixer, "b", "c_heat_mix", {100.0, p_r, 1.1e6});

    cond_pump->fix(std::nullopt, p_c);
    pump_heat->fix(std::nullopt, p_r);

    return loop;
}

} // namespace network
} // namespace kadmos
