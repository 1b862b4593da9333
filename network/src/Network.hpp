#ifndef KADMOS_NETWORK_NETWORK_HPP
#define KADMOS_NETWORK_NETWORK_HPP

#include "Component.hpp"
#include "Connection.hpp"
#include "Equation.hpp"
#include "Errors.hpp"
#include "WaterProperties.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kadmos {
namespace network {

/**
 * @brief Components joined by directed connections
 *
 * Pure aggregation: the network orders variables (connection m, p, h in insertion
 * order, then component private variables) and concatenates component equations
 * in insertion order. It performs no numerical work itself.
 */
class Network {
public:
    // Uses IF97Water when no evaluator is given
    explicit Network(std::shared_ptr<WaterProperties> props = nullptr);
    ~Network() = default;

    template <typename T>
    std::shared_ptr<T> addComponent(std::shared_ptr<T> comp) {
        registerComponent(comp);
        return comp;
    }

    // Throws ConfigurationException when the name is taken
    void addConnection(std::shared_ptr<Connection> conn);

    // Create a connection from src's outlet port to dst's inlet port
    std::shared_ptr<Connection> connect(Component& src, const std::string& src_port,
                                        Component& dst, const std::string& dst_port,
                                        const std::string& name,
                                        const ConnectionGuess& guess = ConnectionGuess());

    Connection& connection(const std::string& name);
    const Connection& connection(const std::string& name) const;
    bool hasConnection(const std::string& name) const;

    const std::vector<std::shared_ptr<Component>>& components() const { return components_; }
    const std::vector<std::shared_ptr<Connection>>& connections() const { return connections_; }
    std::shared_ptr<Component> component(const std::string& name) const;

    std::vector<Variable*> allVariables();
    std::vector<Variable*> freeVariables();

    std::vector<Equation> equations() const;
    std::vector<ConfigurationError> validate() const;

    const WaterProperties& properties() const { return *props_; }
    std::shared_ptr<WaterProperties> propertiesPtr() const { return props_; }

    std::string summary() const;

private:
    std::shared_ptr<WaterProperties> props_;
    std::vector<std::shared_ptr<Component>> components_;
    std::vector<std::shared_ptr<Connection>> connections_;
    std::map<std::string, size_t> connection_index_;

    void registerComponent(std::shared_ptr<Component> comp);
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_NETWORK_HPP
