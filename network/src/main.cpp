#include <Kokkos_Core.hpp>
#include <highfive/H5Exception.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include "argument_parser.hpp"
#include "Errors.hpp"
#include "Network.hpp"
#include "NewtonSolver.hpp"
#include "ReferenceLoop.hpp"
#include "ResultsWriter.hpp"

using namespace kadmos::network;

int main(int argc, char* argv[]) {
    Kokkos::initialize(argc, argv);
    int status = 0;
    {
        ArgumentParser parser = ArgumentParser::kadmos_loop_parser(argv[0]);

        if (!parser.parse(argc, argv)) {
            Kokkos::finalize();
            return 1;
        }

        try {
            SolveOptions options;
            options.max_iterations = parser.get_int("max_iter");
            options.residual_tolerance = parser.get_double("tol");
            options.step_tolerance = parser.get_double("xtol");
            options.finite_difference_step = parser.get_double("fd_eps");
            options.damping_enabled = !parser.get_flag("no-damping");
            options.diagnostics_verbosity = parser.get_int("verbosity");

            ReferenceLoopParameters loop_params;
            loop_params.friction = frictionModelFromString(parser.get_option("friction"));
            Network net;
            auto core = buildReferenceLoop(net, loop_params).core;

            if (parser.get_option("mode") == "target-void") {
                core->setExitVoidFraction(parser.get_double("target_void"), parser.get_double("power"));
            } else {
                core->setPower(parser.get_double("power"));
            }

            if (options.diagnostics_verbosity > 0) {
                std::cout << "Kokkos execution spaces enabled:\n";
                #ifdef KOKKOS_ENABLE_SERIAL
                    std::cout << "  - SERIAL\n";
                #endif
                #ifdef KOKKOS_ENABLE_OPENMP
                    std::cout << "  - OPENMP\n";
                #endif
                std::cout << "Core mode: " << parser.get_option("mode")
                          << ", friction: " << parser.get_option("friction") << std::endl;
            }

            NewtonSolver solver(options);
            SolveResult result = solver.solve(net);

            std::cout << net.summary() << std::endl;

            ResultsWriter writer(net, result);
            writer.printReport();

            std::string output = parser.get_option("output");
            if (!output.empty()) {
                writer.writeHDF5(output);
                std::cout << "Results written to " << output << std::endl;
            }

            if (!result.converged) {
                std::cerr << "Error: " << result.message << " ("
                          << solveStatusName(result.status) << ")" << std::endl;
                status = 2;
            }
        } catch (const ConfigurationException& e) {
            std::cerr << "Configuration error: " << e.what() << std::endl;
            status = 1;
        } catch (const PropertyRangeError& e) {
            std::cerr << "Property error: " << e.what() << std::endl;
            status = 1;
        } catch (const HighFive::Exception& e) {
            std::cerr << "HDF5 error: " << e.what() << std::endl;
            status = 1;
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            status = 1;
        }
    }
    Kokkos::finalize();
    return status;
}
