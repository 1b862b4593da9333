#include "Network.hpp"
#include "IF97Water.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace kadmos {
namespace network {

Network::Network(std::shared_ptr<WaterProperties> props)
    : props_(props ? std::move(props) : std::make_shared<IF97Water>())
{
}

void Network::registerComponent(std::shared_ptr<Component> comp) {
    if (!comp) {
        throw std::invalid_argument("Cannot add a null component");
    }
    for (const auto& existing : components_) {
        if (existing->name() == comp->name()) {
            throw ConfigurationException(
                ConfigurationError{comp->name(), "", "component '" + comp->name() + "' already exists"});
        }
    }
    components_.push_back(std::move(comp));
}

void Network::addConnection(std::shared_ptr<Connection> conn) {
    if (!conn) {
        throw std::invalid_argument("Cannot add a null connection");
    }
    if (connection_index_.count(conn->name())) {
        throw ConfigurationException(
            ConfigurationError{conn->name(), "", "connection '" + conn->name() + "' already exists"});
    }
    connection_index_[conn->name()] = connections_.size();
    connections_.push_back(std::move(conn));
}

std::shared_ptr<Connection> Network::connect(Component& src, const std::string& src_port,
                                             Component& dst, const std::string& dst_port,
                                             const std::string& name,
                                             const ConnectionGuess& guess) {
    if (hasConnection(name)) {
        throw ConfigurationException(
            ConfigurationError{name, "", "connection '" + name + "' already exists"});
    }
    // A port carries exactly one connection
    auto bound = src.outlets().find(src_port);
    if (bound != src.outlets().end() && bound->second) {
        throw ConfigurationException(ConfigurationError{
            src.name(), src_port, "outlet already connected to '" + bound->second->name() + "'"});
    }
    bound = dst.inlets().find(dst_port);
    if (bound != dst.inlets().end() && bound->second) {
        throw ConfigurationException(ConfigurationError{
            dst.name(), dst_port, "inlet already connected to '" + bound->second->name() + "'"});
    }

    auto conn = std::make_shared<Connection>(name, guess);
    addConnection(conn);
    src.connectOutlet(src_port, conn);
    dst.connectInlet(dst_port, conn);
    return conn;
}

Connection& Network::connection(const std::string& name) {
    auto it = connection_index_.find(name);
    if (it == connection_index_.end()) {
        throw std::out_of_range("Unknown connection '" + name + "'");
    }
    return *connections_[it->second];
}

const Connection& Network::connection(const std::string& name) const {
    auto it = connection_index_.find(name);
    if (it == connection_index_.end()) {
        throw std::out_of_range("Unknown connection '" + name + "'");
    }
    return *connections_[it->second];
}

bool Network::hasConnection(const std::string& name) const {
    return connection_index_.count(name) > 0;
}

std::shared_ptr<Component> Network::component(const std::string& name) const {
    for (const auto& comp : components_) {
        if (comp->name() == name) {
            return comp;
        }
    }
    return nullptr;
}

std::vector<Variable*> Network::allVariables() {
    std::vector<Variable*> vars;
    for (auto& conn : connections_) {
        for (Variable* v : conn->variables()) {
            vars.push_back(v);
        }
    }
    for (auto& comp : components_) {
        for (Variable* v : comp->variables()) {
            vars.push_back(v);
        }
    }
    return vars;
}

std::vector<Variable*> Network::freeVariables() {
    std::vector<Variable*> free_vars;
    for (Variable* v : allVariables()) {
        if (!v->isFixed()) {
            free_vars.push_back(v);
        }
    }
    return free_vars;
}

std::vector<Equation> Network::equations() const {
    std::vector<Equation> eqs;
    for (const auto& comp : components_) {
        std::vector<Equation> comp_eqs = comp->equations(*props_);
        eqs.insert(eqs.end(), comp_eqs.begin(), comp_eqs.end());
    }
    return eqs;
}

std::vector<ConfigurationError> Network::validate() const {
    std::vector<ConfigurationError> errors;
    for (const auto& comp : components_) {
        std::vector<ConfigurationError> comp_errors = comp->validate();
        errors.insert(errors.end(), comp_errors.begin(), comp_errors.end());
    }
    return errors;
}

std::string Network::summary() const {
    std::ostringstream out;
    out << std::setprecision(4);
    out << "Network with " << components_.size() << " components and "
        << connections_.size() << " connections\n";
    out << "Connections:";
    for (const auto& conn : connections_) {
        out << "\n  - " << conn->name()
            << ": m=" << conn->m().value() << (conn->m().isFixed() ? " (fixed)" : "")
            << ", p=" << conn->p().value() << (conn->p().isFixed() ? " (fixed)" : "")
            << ", h=" << conn->h().value() << (conn->h().isFixed() ? " (fixed)" : "");
    }
    return out.str();
}

} // namespace network
} // namespace kadmos
