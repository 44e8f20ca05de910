#include "polybasis/polynomial.h"

namespace polybasis {

Polynomial::Polynomial(const std::vector<double>& coeffs)
    : coeffs_(coeffs) {
    strip_leading_zeros();
}

Polynomial Polynomial::from_ascending(const std::vector<double>& coeffs) {
    return Polynomial(std::vector<double>(coeffs.rbegin(), coeffs.rend()));
}

void Polynomial::strip_leading_zeros() {
    // Удаляем только точные нули: малые старшие коэффициенты значимы
    if (coeffs_.empty()) {
        coeffs_.push_back(0.0);
    }
    while (coeffs_.size() > 1 && coeffs_.front() == 0.0) {
        coeffs_.erase(coeffs_.begin());
    }
    degree_ = static_cast<int>(coeffs_.size()) - 1;
}

double Polynomial::evaluate(double x) const {
    // Схема Горнера для численной устойчивости
    double result = 0.0;
    for (double coeff : coeffs_) {
        result = result * x + coeff;
    }
    return result;
}

double Polynomial::derivative(double x) const {
    if (degree_ == 0) return 0.0;

    // coeffs_[i] соответствует a_{n-i}
    double result = 0.0;
    int n = degree_;
    for (int i = 0; i < n; ++i) {
        int power = n - i;
        result = result * x + power * coeffs_[i];
    }
    return result;
}

double Polynomial::second_derivative(double x) const {
    if (degree_ < 2) return 0.0;

    double result = 0.0;
    int n = degree_;
    for (int i = 0; i < n - 1; ++i) {
        int power = n - i;
        double coeff = power * (power - 1) * coeffs_[i];
        result = result * x + coeff;
    }
    return result;
}

Polynomial Polynomial::integral() const {
    // [a_n, ..., a_0] -> [a_n/(n+1), ..., a_0/1, 0]
    std::vector<double> result(coeffs_.size() + 1, 0.0);
    int n = degree_;
    for (int i = 0; i <= n; ++i) {
        int power = n - i;
        result[i] = coeffs_[i] / (power + 1);
    }
    return Polynomial(result);
}

double Polynomial::coefficient(int k) const {
    if (k < 0 || k > degree_) return 0.0;
    return coeffs_[degree_ - k];
}

} // namespace polybasis
