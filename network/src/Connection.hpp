#ifndef KADMOS_NETWORK_CONNECTION_HPP
#define KADMOS_NETWORK_CONNECTION_HPP

#include "Constants.hpp"
#include "Variable.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kadmos {
namespace network {

// Initial guesses for a new connection
struct ConnectionGuess {
    double m = M_GUESS;     // [kg/s]
    double p = P_GUESS;     // [Pa]
    double h = H_GUESS;     // [J/kg]
};

/**
 * @brief Directed flow link between an outlet port and an inlet port
 *
 * Holds the stream state as three independent variables:
 * mass flow m [kg/s], pressure p [Pa] and specific enthalpy h [J/kg].
 */
class Connection {
public:
    Connection(const std::string& name, const ConnectionGuess& guess = ConnectionGuess(),
               std::pair<double, double> m_bounds = {M_LOWER, M_UPPER},
               std::pair<double, double> p_bounds = {P_LOWER, P_UPPER},
               std::pair<double, double> h_bounds = {H_LOWER, H_UPPER});
    ~Connection() = default;

    const std::string& name() const { return name_; }

    Variable& m() { return m_; }
    Variable& p() { return p_; }
    Variable& h() { return h_; }
    const Variable& m() const { return m_; }
    const Variable& p() const { return p_; }
    const Variable& h() const { return h_; }

    // Fix any subset of the state; unset fields are left alone
    void fix(std::optional<double> m = std::nullopt,
             std::optional<double> p = std::nullopt,
             std::optional<double> h = std::nullopt);

    // Re-seed any subset of the state without changing fixed flags
    void guess(std::optional<double> m = std::nullopt,
               std::optional<double> p = std::nullopt,
               std::optional<double> h = std::nullopt);

    std::vector<Variable*> variables();

private:
    std::string name_;
    Variable m_;
    Variable p_;
    Variable h_;
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_CONNECTION_HPP
