#include "polybasis/lagrange_basis.h"

namespace polybasis {

double LagrangeBasis::unsafe_eval_element(LagrangeIndex idx, double x) const {
    const std::size_t i = idx.value() - 1;
    const double t = support().to_local(x);

    double y = 1.0;
    for (std::size_t j = 0; j < n_; ++j) {
        if (j == i) continue;
        y *= t - local_nodes_[j];
    }
    return y * denom_[i];
}

double LagrangeBasis::unsafe_eval_element_derivative(LagrangeIndex idx, double x) const {
    const std::size_t i = idx.value() - 1;
    const double t = support().to_local(x);

    // Производная произведения n-1 множителей (t - t_k) * diffs[i][k]:
    // сумма по l произведений, в которых l-й множитель заменён на diffs[i][l]
    double y = 0.0;
    for (std::size_t l = 0; l < n_; ++l) {
        if (l == i) continue;
        double z = diff(i, l);
        for (std::size_t k = 0; k < n_; ++k) {
            if (k == i || k == l) continue;
            z *= (t - local_nodes_[k]) * diff(i, k);
        }
        y += z;
    }
    return y / half_length_;
}

double LagrangeBasis::unsafe_eval_element_antiderivative(LagrangeIndex idx, double x) const {
    const Interval& interval = support();
    Polynomial antiderivative = monomial_polynomial(idx).integral();
    return half_length_ * (antiderivative.evaluate(interval.to_local(x))
                           - antiderivative.evaluate(interval.to_local(interval.left_endpoint())));
}

} // namespace polybasis
