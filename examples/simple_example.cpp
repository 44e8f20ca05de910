#include <iostream>
#include <iomanip>
#include <vector>
#include <cmath>
#include "polybasis/lagrange_basis.h"

using namespace polybasis;

int main() {
    try {
        std::cout << "=== Lagrange Basis Example ===\n\n";

        // Узлы Чебышёва второго рода на [-1, 1], n = 5
        const int n = 5;
        std::vector<double> nodes(n);
        for (int i = 0; i < n; ++i) {
            nodes[i] = -std::cos(M_PI * i / (n - 1));
        }
        nodes.front() = -1.0;
        nodes.back() = 1.0;

        LagrangeBasis basis(nodes);
        std::cout << basis.get_info() << "\n";

        if (!basis.verify_interpolation(1e-12)) {
            std::cerr << "Error: basis does not satisfy l_i(x_k) = delta_ik\n";
            return 1;
        }
        std::cout << "Interpolation property verified.\n\n";

        // Интерполяция f(x) = exp(x): коэффициенты разложения - значения в узлах
        std::vector<double> values(n);
        for (int i = 0; i < n; ++i) {
            values[i] = std::exp(nodes[i]);
        }

        std::cout << std::setw(8) << "x"
                  << std::setw(16) << "p(x)"
                  << std::setw(16) << "exp(x)"
                  << std::setw(16) << "p'(x)"
                  << std::setw(16) << "int_-1^x p" << "\n";
        for (double x = -1.0; x <= 1.0 + 1e-12; x += 0.25) {
            std::cout << std::fixed << std::setprecision(4) << std::setw(8) << x
                      << std::setprecision(8)
                      << std::setw(16) << basis.eval_expansion(values, x)
                      << std::setw(16) << std::exp(x)
                      << std::setw(16) << basis.eval_expansion_derivative(values, x)
                      << std::setw(16) << basis.eval_expansion_antiderivative(values, x) << "\n";
        }
        std::cout << "\nExact integral over [-1, 1]: " << (std::exp(1.0) - std::exp(-1.0)) << "\n";

        // Тот же набор узлов на [0, 2]
        LagrangeBasis shifted = basis.rescaled(Interval(0.0, 2.0));
        std::cout << "\nRescaled basis:\n" << shifted.get_info();

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
