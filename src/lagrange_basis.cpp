#include "polybasis/lagrange_basis.h"
#include "polybasis/vandermonde.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace polybasis {

LagrangeBasis::LagrangeBasis(const NodeGrid& nodes)
    : n_(nodes.size())
    , nodes_(nodes)
    , half_length_(nodes.support().half_length()) {
    if (n_ == 0) {
        throw std::invalid_argument("Empty nodes array");
    }

    const Interval& interval = nodes_.support();
    for (std::size_t i = 0; i < n_; ++i) {
        if (!interval.contains(nodes_[i])) {
            std::ostringstream oss;
            oss << "Node " << (i + 1) << " (x = " << nodes_[i] << ") lies outside ["
                << interval.a << ", " << interval.b << "]";
            throw std::domain_error(oss.str());
        }
    }

    local_nodes_.resize(n_);
    for (std::size_t i = 0; i < n_; ++i) {
        local_nodes_[i] = interval.to_local(nodes_[i]);
    }

    compute_differences();
    vdminv_ = vandermonde_matrix_inverse(local_nodes_);
}

LagrangeBasis::LagrangeBasis(const std::vector<double>& nodes)
    : LagrangeBasis(NodeGrid(nodes)) {}

LagrangeBasis::LagrangeBasis(const std::vector<double>& nodes, double a, double b)
    : LagrangeBasis(NodeGrid(nodes).mapped_to(Interval(a, b))) {}

void LagrangeBasis::compute_differences() {
    denom_.assign(n_, 1.0);
    diffs_.assign(n_ * n_, 0.0);

    for (std::size_t i = 0; i < n_; ++i) {
        for (std::size_t j = 0; j < n_; ++j) {
            if (i == j) continue;
            double d = 1.0 / (local_nodes_[i] - local_nodes_[j]);
            if (!std::isfinite(d)) {
                throw std::invalid_argument("Interpolation nodes must be distinct");
            }
            diffs_[i * n_ + j] = d;
            denom_[i] *= d;
        }
        if (denom_[i] == 0.0 || !std::isfinite(denom_[i])) {
            std::ostringstream oss;
            oss << "Normalizing factor of node " << (i + 1) << " is not representable ("
                << denom_[i] << ")";
            throw std::invalid_argument(oss.str());
        }
    }
}

double LagrangeBasis::denominator(LagrangeIndex idx) const {
    // Π_{j≠i} 1/(ξ_i - ξ_j) = h^{-(n-1)} Π_{j≠i} 1/(t_i - t_j)
    return denom_[idx.value() - 1] / std::pow(half_length_, static_cast<double>(n_ - 1));
}

Polynomial LagrangeBasis::monomial_polynomial(LagrangeIndex idx) const {
    // Коэффициенты l_i по возрастанию степеней: c = V^{-T} e_i, т.е. строка i матрицы V^{-1}
    const Eigen::Index row = static_cast<Eigen::Index>(idx.value() - 1);
    std::vector<double> ascending(n_);
    for (std::size_t k = 0; k < n_; ++k) {
        ascending[k] = vdminv_(row, static_cast<Eigen::Index>(k));
    }
    return Polynomial::from_ascending(ascending);
}

std::unique_ptr<IPolynomialBasis> LagrangeBasis::similar(const NodeGrid& nodes) const {
    return std::make_unique<LagrangeBasis>(nodes);
}

LagrangeBasis LagrangeBasis::rescaled(const Interval& target) const {
    return LagrangeBasis(nodes_.mapped_to(target));
}

bool LagrangeBasis::verify_interpolation(double tolerance) const {
    for (std::size_t i = 0; i < n_; ++i) {
        for (std::size_t k = 0; k < n_; ++k) {
            double expected = (i == k) ? 1.0 : 0.0;
            double value = unsafe_eval_element(native_index(i), nodes_[k]);
            if (!std::isfinite(value) || std::abs(value - expected) > tolerance) {
                return false;
            }
        }
    }
    return true;
}

std::string LagrangeBasis::get_info() const {
    std::ostringstream oss;
    oss << std::setprecision(6);
    oss << "Lagrange basis: n = " << n_ << ", degree = " << degree() << "\n";
    oss << "  Interval: [" << support().a << ", " << support().b << "]\n";
    oss << "  Nodes:";
    for (double x : nodes_.points()) {
        oss << " " << x;
    }
    oss << "\n";

    double min_gap = 0.0;
    if (n_ > 1) {
        std::vector<double> sorted = nodes_.points();
        std::sort(sorted.begin(), sorted.end());
        min_gap = sorted[1] - sorted[0];
        for (std::size_t i = 2; i < n_; ++i) {
            min_gap = std::min(min_gap, sorted[i] - sorted[i - 1]);
        }
    }
    oss << "  Minimal node gap: " << min_gap << "\n";

    double max_denom = 0.0;
    for (double d : denom_) {
        max_denom = std::max(max_denom, std::abs(d));
    }
    oss << "  Max |denom| (local t): " << max_denom << "\n";

    oss << std::scientific << std::setprecision(3);
    oss << "  ||V^-1||_inf: " << vdminv_.cwiseAbs().rowwise().sum().maxCoeff() << "\n";
    return oss.str();
}

} // namespace polybasis
