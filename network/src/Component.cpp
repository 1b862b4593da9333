#include "Component.hpp"

namespace kadmos {
namespace network {

std::string componentTypeName(ComponentType type) {
    switch (type) {
        case ComponentType::Pipe: return "Pipe";
        case ComponentType::CoreChannel: return "CoreChannel";
        case ComponentType::OrificePlate: return "OrificePlate";
        case ComponentType::AreaChange: return "AreaChange";
        case ComponentType::Separator: return "Separator";
        case ComponentType::Mixer: return "Mixer";
        case ComponentType::Turbine: return "Turbine";
        case ComponentType::Condenser: return "Condenser";
        case ComponentType::Pump: return "Pump";
        case ComponentType::Heater: return "Heater";
        case ComponentType::Source: return "Source";
        case ComponentType::Sink: return "Sink";
    }
    return "Unknown";
}

Component::Component(const std::string& name)
    : name_(name)
{
    if (name_.empty()) {
        throw std::invalid_argument("Component name must not be empty");
    }
}

void Component::connectInlet(const std::string& port, std::shared_ptr<Connection> conn) {
    inlets_[port] = std::move(conn);
}

void Component::connectOutlet(const std::string& port, std::shared_ptr<Connection> conn) {
    outlets_[port] = std::move(conn);
}

std::vector<Variable*> Component::variables() {
    return {};
}

std::vector<ConfigurationError> Component::validate() const {
    return {};
}

const Connection& Component::requireInlet(const std::string& port) const {
    auto it = inlets_.find(port);
    if (it == inlets_.end() || !it->second) {
        throw PortNotConnected(name_, port, true);
    }
    return *it->second;
}

const Connection& Component::requireOutlet(const std::string& port) const {
    auto it = outlets_.find(port);
    if (it == outlets_.end() || !it->second) {
        throw PortNotConnected(name_, port, false);
    }
    return *it->second;
}

void Component::checkInlet(const std::string& port, std::vector<ConfigurationError>& errors) const {
    auto it = inlets_.find(port);
    if (it == inlets_.end() || !it->second) {
        errors.push_back(error(port, "inlet '" + port + "' not connected"));
    }
}

void Component::checkOutlet(const std::string& port, std::vector<ConfigurationError>& errors) const {
    auto it = outlets_.find(port);
    if (it == outlets_.end() || !it->second) {
        errors.push_back(error(port, "outlet '" + port + "' not connected"));
    }
}

ConfigurationError Component::error(const std::string& item, const std::string& reason) const {
    return ConfigurationError{name_, item, reason};
}

void Component::throwIfInvalid() const {
    std::vector<ConfigurationError> errors = validate();
    if (!errors.empty()) {
        throw ConfigurationException(errors);
    }
}

} // namespace network
} // namespace kadmos
