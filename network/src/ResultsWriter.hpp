#ifndef KADMOS_NETWORK_RESULTS_WRITER_HPP
#define KADMOS_NETWORK_RESULTS_WRITER_HPP

#include "Network.hpp"
#include "NewtonSolver.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace kadmos {
namespace network {

// Post-processed duty of one component [W]
struct ComponentDuty {
    std::string component;
    std::string quantity;       // core_power, shaft_power, heat_rejected, heat_added
    double value;
};

/**
 * @brief Reports a solved network
 *
 * printReport() writes a text summary; writeHDF5() stores connection states,
 * component duties and the solve metadata:
 *   /connections/{names,m,p,h,fixed}
 *   /components/{names,types}
 *   /duties/{components,quantities,values}
 *   /solve/{converged,iterations,residual_norm,status,message,residual_history}
 */
class ResultsWriter {
public:
    ResultsWriter(const Network& network, const SolveResult& result);
    ~ResultsWriter() = default;

    std::vector<ComponentDuty> duties() const;

    void printReport(std::ostream& out = std::cout) const;
    void writeHDF5(const std::string& filename) const;

private:
    const Network& network_;
    const SolveResult& result_;
};

} // namespace network
} // namespace kadmos

#endif // KADMOS_NETWORK_RESULTS_WRITER_HPP
