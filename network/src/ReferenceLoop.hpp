#ifndef KADMOS_NETWORK_REFERENCE_LOOP_HPP
#define KADMOS_NETWORK_REFERENCE_LOOP_HPP

#include "FlowComponents.hpp"
#include "HeatExchangers.hpp"
#include "Network.hpp"
#include "PhaseComponents.hpp"
#include "Turbomachinery.hpp"
#include <memory>

namespace kadmos {
namespace network {

struct ReferenceLoopParameters {
    double p_reactor = 7.0e6;       // pump outlet pressure [Pa]
    double p_condenser = 1.0e5;     // turbine and condenser outlet pressure [Pa]
    double downcomer_dz = -7.0;     // downcomer elevation change [m], length is |dz|
    double separator_dp = 1.0e4;    // separator drop [Pa]
    FrictionModel friction = FrictionModel::Homogeneous;
};

// Handles to the components of a built loop
struct ReferenceLoop {
    std::shared_ptr<Mixer> mixer;
    std::shared_ptr<Pipe> downcomer;
    std::shared_ptr<CoreChannel> core;
    std::shared_ptr<OrificePlate> orifice;
    std::shared_ptr<Pipe> chimney;
    std::shared_ptr<Separator> separator;
    std::shared_ptr<Turbine> turbine;
    std::shared_ptr<Condenser> condenser;
    std::shared_ptr<Pump> pump;
    std::shared_ptr<Heater> heater;
};

/**
 * @brief Natural circulation boiling loop with a steam cycle on the separator vapor line
 *
 * mixer -> downcomer -> core (+2 m) -> orifice -> chimney (+5 m) -> separator;
 * separator liquid returns to the mixer, separator vapor runs turbine -> condenser
 * -> pump -> heater -> mixer. The condenser outlet and pump outlet pressures are fixed.
 * With the default downcomer the loop elevations sum to zero.
 *
 * The core is left in its default fixed-power mode; callers choose the mode.
 */
ReferenceLoop buildReferenceLoop(Network& net,
                                 const ReferenceLoopParameters& params = ReferenceLoopParameters());

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_REFERENCE_LOOP_HPP
