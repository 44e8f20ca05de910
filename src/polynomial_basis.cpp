#include "polybasis/polynomial_basis.h"
#include <stdexcept>
#include <string>

namespace polybasis {

void IPolynomialBasis::check_index(std::size_t k) const {
    if (k >= size()) {
        throw std::out_of_range("Basis index " + std::to_string(k)
                                + " out of range [0, " + std::to_string(size()) + ")");
    }
}

void IPolynomialBasis::check_coefficients(const std::vector<double>& coeffs) const {
    if (coeffs.size() != size()) {
        throw std::invalid_argument("Expansion has " + std::to_string(coeffs.size())
                                    + " coefficients, basis has " + std::to_string(size())
                                    + " elements");
    }
}

double IPolynomialBasis::eval_element(std::size_t k, double x) const {
    check_index(k);
    return unsafe_eval(k, x);
}

double IPolynomialBasis::eval_element_derivative(std::size_t k, double x) const {
    if (!has_derivative()) {
        throw std::logic_error("Basis does not support derivatives");
    }
    check_index(k);
    return unsafe_eval_derivative(k, x);
}

double IPolynomialBasis::eval_element_antiderivative(std::size_t k, double x) const {
    if (!has_antiderivative()) {
        throw std::logic_error("Basis does not support antiderivatives");
    }
    check_index(k);
    return unsafe_eval_antiderivative(k, x);
}

double IPolynomialBasis::eval_expansion(const std::vector<double>& coeffs, double x) const {
    check_coefficients(coeffs);
    double result = 0.0;
    for (std::size_t k = 0; k < coeffs.size(); ++k) {
        if (coeffs[k] == 0.0) continue;
        result += coeffs[k] * unsafe_eval(k, x);
    }
    return result;
}

double IPolynomialBasis::eval_expansion_derivative(const std::vector<double>& coeffs, double x) const {
    if (!has_derivative()) {
        throw std::logic_error("Basis does not support derivatives");
    }
    check_coefficients(coeffs);
    double result = 0.0;
    for (std::size_t k = 0; k < coeffs.size(); ++k) {
        if (coeffs[k] == 0.0) continue;
        result += coeffs[k] * unsafe_eval_derivative(k, x);
    }
    return result;
}

double IPolynomialBasis::eval_expansion_antiderivative(const std::vector<double>& coeffs, double x) const {
    if (!has_antiderivative()) {
        throw std::logic_error("Basis does not support antiderivatives");
    }
    check_coefficients(coeffs);
    double result = 0.0;
    for (std::size_t k = 0; k < coeffs.size(); ++k) {
        if (coeffs[k] == 0.0) continue;
        result += coeffs[k] * unsafe_eval_antiderivative(k, x);
    }
    return result;
}

std::vector<double> IPolynomialBasis::eval_all(double x) const {
    std::vector<double> values(size());
    for (std::size_t k = 0; k < values.size(); ++k) {
        values[k] = unsafe_eval(k, x);
    }
    return values;
}

} // namespace polybasis
