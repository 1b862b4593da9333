#include "Connection.hpp"

namespace kadmos {
namespace network {

Connection::Connection(const std::string& name, const ConnectionGuess& guess,
                       std::pair<double, double> m_bounds,
                       std::pair<double, double> p_bounds,
                       std::pair<double, double> h_bounds)
    : name_(name)
    , m_(name + ".m", guess.m, false, m_bounds.first, m_bounds.second)
    , p_(name + ".p", guess.p, false, p_bounds.first, p_bounds.second)
    , h_(name + ".h", guess.h, false, h_bounds.first, h_bounds.second)
{
}

void Connection::fix(std::optional<double> m, std::optional<double> p, std::optional<double> h) {
    if (m) m_.fix(*m);
    if (p) p_.fix(*p);
    if (h) h_.fix(*h);
}

void Connection::guess(std::optional<double> m, std::optional<double> p, std::optional<double> h) {
    if (m) m_.setValue(*m);
    if (p) p_.setValue(*p);
    if (h) h_.setValue(*h);
}

std::vector<Variable*> Connection::variables() {
    return {&m_, &p_, &h_};
}

} // namespace network
} // namespace kadmos
