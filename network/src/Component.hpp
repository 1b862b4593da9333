#ifndef KADMOS_NETWORK_COMPONENT_HPP
#define KADMOS_NETWORK_COMPONENT_HPP

#include "Connection.hpp"
#include "Equation.hpp"
#include "Errors.hpp"
#include "Variable.hpp"
#include "WaterProperties.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kadmos {
namespace network {

// Closed set of component variants
enum class ComponentType {
    Pipe,
    CoreChannel,
    OrificePlate,
    AreaChange,
    Separator,
    Mixer,
    Turbine,
    Condenser,
    Pump,
    Heater,
    Source,
    Sink
};

std::string componentTypeName(ComponentType type);

using PortMap = std::map<std::string, std::shared_ptr<Connection>>;

/**
 * @brief Lumped 0-D network element contributing residual equations
 *
 * A component owns named inlet and outlet ports, each bound to one Connection,
 * plus any private variables it declares. equations() is deterministic given the
 * current variable values and throws PortNotConnected for a missing port.
 */
class Component {
public:
    explicit Component(const std::string& name);
    virtual ~Component() = default;

    const std::string& name() const { return name_; }
    virtual ComponentType type() const = 0;
    std::string typeName() const { return componentTypeName(type()); }

    void connectInlet(const std::string& port, std::shared_ptr<Connection> conn);
    void connectOutlet(const std::string& port, std::shared_ptr<Connection> conn);

    const PortMap& inlets() const { return inlets_; }
    const PortMap& outlets() const { return outlets_; }

    // Private unknowns owned by this component (none by default)
    virtual std::vector<Variable*> variables();

    // Structured configuration problems; evaluates no property
    virtual std::vector<ConfigurationError> validate() const;

    virtual std::vector<Equation> equations(const WaterProperties& props) const = 0;

protected:
    const Connection& requireInlet(const std::string& port) const;
    const Connection& requireOutlet(const std::string& port) const;

    // Add an error to `errors` when the port is missing
    void checkInlet(const std::string& port, std::vector<ConfigurationError>& errors) const;
    void checkOutlet(const std::string& port, std::vector<ConfigurationError>& errors) const;
    ConfigurationError error(const std::string& item, const std::string& reason) const;

    // Throw the first error found by validate()
    void throwIfInvalid() const;

private:
    std::string name_;
    PortMap inlets_;
    PortMap outlets_;
};

// Residual scale floors
inline double massScale(double m) { return std::max(SCALE_MASS, std::abs(m)); }
inline double pressureScale(double p) { return std::max(SCALE_PRESSURE, std::abs(p)); }
inline double enthalpyScale(double h) { return std::max(SCALE_ENTHALPY, std::abs(h)); }
inline double energyScale(double mh) { return std::max(SCALE_ENERGY, std::abs(mh)); }

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_COMPONENT_HPP
