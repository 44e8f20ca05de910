#include "polybasis/vandermonde.h"
#include <stdexcept>
#include <string>

namespace polybasis {

Eigen::MatrixXd vandermonde_matrix(const std::vector<double>& nodes) {
    const int n = static_cast<int>(nodes.size());
    Eigen::MatrixXd V(n, n);

    for (int i = 0; i < n; ++i) {
        double power = 1.0;
        for (int k = 0; k < n; ++k) {
            V(k, i) = power;
            power *= nodes[i];
        }
    }
    return V;
}

Eigen::MatrixXd vandermonde_matrix_inverse(const std::vector<double>& nodes) {
    if (nodes.empty()) {
        throw std::invalid_argument("Empty nodes array");
    }

    Eigen::MatrixXd V = vandermonde_matrix(nodes);
    Eigen::FullPivLU<Eigen::MatrixXd> lu(V);
    lu.setThreshold(VANDERMONDE_PIVOT_THRESHOLD);
    if (!lu.isInvertible()) {
        throw std::runtime_error("Vandermonde matrix is singular (rank "
                                 + std::to_string(lu.rank()) + " of "
                                 + std::to_string(nodes.size()) + ")");
    }

    Eigen::MatrixXd inv = lu.inverse();
    if (!inv.allFinite()) {
        throw std::runtime_error("Vandermonde matrix inverse contains non-finite entries");
    }
    return inv;
}

} // namespace polybasis
