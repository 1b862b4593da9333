#include "Errors.hpp"

namespace kadmos {
namespace network {

std::string ConfigurationError::message() const {
    std::string msg = component;
    if (!item.empty()) {
        msg += " [" + item + "]";
    }
    msg += ": " + reason;
    return msg;
}

ConfigurationException::ConfigurationException(const ConfigurationError& error)
    : ConfigurationException(std::vector<ConfigurationError>{error})
{
}

ConfigurationException::ConfigurationException(const std::vector<ConfigurationError>& errors)
    : std::runtime_error(joinMessages(errors))
    , errors_(errors)
{
}

std::string ConfigurationException::joinMessages(const std::vector<ConfigurationError>& errors) {
    if (errors.empty()) {
        return "Invalid configuration";
    }
    std::string msg = errors.front().message();
    for (size_t i = 1; i < errors.size(); ++i) {
        msg += "; " + errors[i].message();
    }
    return msg;
}

PortNotConnected::PortNotConnected(const std::string& component, const std::string& port, bool inlet)
    : ConfigurationException(ConfigurationError{component, port,
          std::string(inlet ? "inlet" : "outlet") + " '" + port + "' not connected"})
{
}

} // namespace network
} // namespace kadmos
