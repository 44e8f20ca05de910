#include <iostream>
#include <iomanip>
#include <string>
#include "polybasis/config_reader.h"
#include "polybasis/validator.h"
#include "polybasis/lagrange_basis.h"

using namespace polybasis;

int main(int argc, char** argv) {
    try {
        std::cout << "=== Lagrange Basis: Reading from Files Example ===\n\n";

        std::string config_path = argc > 1 ? argv[1] : "data/config.yaml";
        std::cout << "Reading configuration from: " << config_path << "\n\n";

        BasisConfig config;
        if (config_path.size() >= 5 && config_path.substr(config_path.size() - 5) == ".yaml") {
            config = ConfigReader::read_from_yaml(config_path);
        } else {
            config = ConfigReader::read_from_file(config_path);
        }

        std::cout << "=== Configuration Summary ===\n";
        std::cout << "Interval: [" << config.interval_start << ", " << config.interval_end << "]\n";
        std::cout << "Nodes: " << config.nodes.size();
        if (!config.nodes_file.empty()) {
            std::cout << " (from " << config.nodes_file << ")";
        }
        std::cout << "\n";
        std::cout << "Verify tolerance: " << config.verify_tolerance << "\n\n";

        ValidationReport report = Validator::validate_full(config);
        std::cout << report.format();
        if (report.has_errors()) {
            return 1;
        }

        LagrangeBasis basis(NodeGrid(config.nodes, Interval(config.interval_start, config.interval_end)));
        std::cout << basis.get_info() << "\n";

        if (!basis.verify_interpolation(config.verify_tolerance)) {
            std::cerr << "Warning: interpolation property violated at tolerance "
                      << config.verify_tolerance << "\n";
        }

        std::cout << std::scientific << std::setprecision(6);
        for (double x : config.evaluation_points) {
            std::cout << "x = " << x << "\n";
            for (std::size_t k = 0; k < basis.size(); ++k) {
                std::cout << "  l_" << (k + 1) << ": value " << basis.eval_element(k, x)
                          << ", derivative " << basis.eval_element_derivative(k, x)
                          << ", antiderivative " << basis.eval_element_antiderivative(k, x) << "\n";
            }
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
