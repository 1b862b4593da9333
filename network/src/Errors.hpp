#ifndef KADMOS_NETWORK_ERRORS_HPP
#define KADMOS_NETWORK_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace kadmos {
namespace network {

/**
 * @brief One structured configuration problem found on a component or network
 *
 * `item` names the offending port or parameter (empty for whole-component problems).
 */
struct ConfigurationError {
    std::string component;
    std::string item;
    std::string reason;

    std::string message() const;
};

/**
 * @brief Thrown when a network cannot be evaluated as configured
 *
 * Carries every ConfigurationError found; what() joins their messages.
 */
class ConfigurationException : public std::runtime_error {
public:
    explicit ConfigurationException(const ConfigurationError& error);
    explicit ConfigurationException(const std::vector<ConfigurationError>& errors);

    const std::vector<ConfigurationError>& errors() const { return errors_; }

private:
    std::vector<ConfigurationError> errors_;

    static std::string joinMessages(const std::vector<ConfigurationError>& errors);
};

// Requested port has no connection attached
class PortNotConnected : public ConfigurationException {
public:
    PortNotConnected(const std::string& component, const std::string& port, bool inlet);

    const std::string& component() const { return errors().front().component; }
    const std::string& port() const { return errors().front().item; }
};

// Property backend asked for a state it cannot evaluate (non-finite or non-positive input)
class PropertyRangeError : public std::domain_error {
public:
    explicit PropertyRangeError(const std::string& what) : std::domain_error(what) {}
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_ERRORS_HPP
