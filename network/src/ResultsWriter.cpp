#include "ResultsWriter.hpp"
#include "FlowComponents.hpp"
#include "HeatExchangers.hpp"
#include "Turbomachinery.hpp"
#include "hdf5_utils.hpp"
#include <iomanip>
#include <ios>
#include <memory>
#include <stdexcept>

namespace kadmos {
namespace network {

namespace {

// Restores flags, precision and fill of a stream on scope exit
class StreamFormatGuard {
public:
    explicit StreamFormatGuard(std::ostream& out) : out_(out), saved_(nullptr) { saved_.copyfmt(out); }
    ~StreamFormatGuard() { out_.copyfmt(saved_); }

private:
    std::ostream& out_;
    std::ios saved_;
};

} // namespace

ResultsWriter::ResultsWriter(const Network& network, const SolveResult& result)
    : network_(network)
    , result_(result)
{
}

std::vector<ComponentDuty> ResultsWriter::duties() const {
    std::vector<ComponentDuty> out;
    for (const auto& comp : network_.components()) {
        switch (comp->type()) {
            case ComponentType::CoreChannel: {
                auto core = std::static_pointer_cast<CoreChannel>(comp);
                out.push_back({core->name(), "core_power", core->power()});
                break;
            }
            case ComponentType::Turbine: {
                auto turbine = std::static_pointer_cast<Turbine>(comp);
                out.push_back({turbine->name(), "shaft_power", turbine->shaftPower()});
                break;
            }
            case ComponentType::Pump: {
                auto pump = std::static_pointer_cast<Pump>(comp);
                out.push_back({pump->name(), "shaft_power", pump->shaftPower()});
                break;
            }
            case ComponentType::Condenser: {
                auto condenser = std::static_pointer_cast<Condenser>(comp);
                out.push_back({condenser->name(), "heat_rejected", condenser->heatRejected()});
                break;
            }
            case ComponentType::Heater: {
                auto heater = std::static_pointer_cast<Heater>(comp);
                out.push_back({heater->name(), "heat_added", heater->heatAdded()});
                break;
            }
            default:
                break;
        }
    }
    return out;
}

void ResultsWriter::printReport(std::ostream& out) const {
    const WaterProperties& props = network_.properties();
    StreamFormatGuard guard(out);

    out << "\n" << std::string(60, '=') << std::endl;
    out << "KADMOS: steady-state thermal-hydraulic network" << std::endl;
    out << std::string(60, '=') << std::endl;

    out << "Status: " << solveStatusName(result_.status) << " (" << result_.message << ")" << std::endl;
    out << "Iterations: " << result_.iterations << std::endl;
    out << "Residual norm: " << std::scientific << std::setprecision(3) << result_.residual_norm << std::endl;

    out << "\nConnections:" << std::endl;
    out << std::left << std::setw(18) << "name"
        << std::right << std::setw(14) << "m [kg/s]"
        << std::setw(14) << "p [MPa]"
        << std::setw(14) << "h [kJ/kg]"
        << std::setw(10) << "x [-]"
        << std::setw(10) << "alpha [-]" << std::endl;
    out << std::string(80, '-') << std::endl;

    for (const auto& conn : network_.connections()) {
        double p = conn->p().value();
        double h = conn->h().value();
        out << std::left << std::setw(18) << conn->name() << std::right << std::fixed
            << std::setprecision(3) << std::setw(14) << conn->m().value()
            << std::setprecision(4) << std::setw(14) << p / 1.0e6
            << std::setprecision(2) << std::setw(14) << h / 1.0e3
            << std::setprecision(4) << std::setw(10) << props.quality(p, h)
            << std::setw(10) << props.voidFraction(p, h) << std::endl;
    }

    std::vector<ComponentDuty> component_duties = duties();
    if (!component_duties.empty()) {
        out << "\nComponent duties:" << std::endl;
        for (const auto& duty : component_duties) {
            out << "  " << duty.component << " " << duty.quantity << " [W]: "
                << std::scientific << std::setprecision(4) << duty.value << std::endl;
        }
    }
    out << std::string(60, '=') << std::endl;
}

void ResultsWriter::writeHDF5(const std::string& filename) const {
    HighFive::File file(filename, HighFive::File::Overwrite);

    const auto& connections = network_.connections();
    std::vector<std::string> names;
    std::vector<double> m, p, h;
    FlatHDF5Data fixed{std::vector<double>(), {connections.size(), 3}};
    for (const auto& conn : connections) {
        names.push_back(conn->name());
        m.push_back(conn->m().value());
        p.push_back(conn->p().value());
        h.push_back(conn->h().value());
        fixed.data.push_back(conn->m().isFixed() ? 1.0 : 0.0);
        fixed.data.push_back(conn->p().isFixed() ? 1.0 : 0.0);
        fixed.data.push_back(conn->h().isFixed() ? 1.0 : 0.0);
    }
    write_hdf5_strings(file, "/connections/names", names);
    write_hdf5_vector(file, "/connections/m", m);
    write_hdf5_vector(file, "/connections/p", p);
    write_hdf5_vector(file, "/connections/h", h);
    write_flat_hdf5_dataset(file, "/connections/fixed", fixed);

    std::vector<std::string> comp_names, comp_types;
    for (const auto& comp : network_.components()) {
        comp_names.push_back(comp->name());
        comp_types.push_back(comp->typeName());
    }
    write_hdf5_strings(file, "/components/names", comp_names);
    write_hdf5_strings(file, "/components/types", comp_types);

    std::vector<std::string> duty_components, duty_quantities;
    std::vector<double> duty_values;
    for (const auto& duty : duties()) {
        duty_components.push_back(duty.component);
        duty_quantities.push_back(duty.quantity);
        duty_values.push_back(duty.value);
    }
    write_hdf5_strings(file, "/duties/components", duty_components);
    write_hdf5_strings(file, "/duties/quantities", duty_quantities);
    write_hdf5_vector(file, "/duties/values", duty_values);

    write_hdf5_scalar(file, "/solve/converged", result_.converged ? 1.0 : 0.0);
    write_hdf5_scalar(file, "/solve/iterations", static_cast<double>(result_.iterations));
    write_hdf5_scalar(file, "/solve/residual_norm", result_.residual_norm);
    write_hdf5_strings(file, "/solve/status", {solveStatusName(result_.status)});
    write_hdf5_strings(file, "/solve/message", {result_.message});
    write_hdf5_vector(file, "/solve/residual_history", result_.residual_history);
}

} // namespace network
} // namespace kadmos
