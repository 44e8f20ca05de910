#ifndef POLYBASIS_POLYNOMIAL_BASIS_H
#define POLYBASIS_POLYNOMIAL_BASIS_H

#include "types.h"
#include "node_grid.h"
#include <vector>
#include <string>
#include <memory>
#include <cstddef>

namespace polybasis {

/**
 * @brief Абстрактный интерфейс полиномиального базиса {φ_0, ..., φ_{N-1}} на интервале
 *
 * Разделение на два уровня:
 * - unsafe_* : вычисление без проверки индекса, реализуется конкретным базисом;
 * - eval_*   : проверка индекса и возможностей базиса, затем вызов unsafe_*.
 *
 * Индекс k здесь линейный, 0..size()-1. Перевод в собственную нумерацию
 * базиса выполняет конкретная реализация.
 */
class IPolynomialBasis {
public:
    virtual ~IPolynomialBasis() = default;

    // ============== Возможности базиса ==============

    virtual bool has_derivative() const noexcept = 0;
    virtual bool has_antiderivative() const noexcept = 0;

    /**
     * @brief Интервал определения базиса
     */
    virtual const Interval& support() const noexcept = 0;

    /**
     * @brief Число базисных функций
     */
    virtual std::size_t size() const noexcept = 0;

    /**
     * @brief Наибольшая степень базисных функций
     */
    virtual int degree() const noexcept = 0;

    // ============== Вычисление без проверок ==============

    /**
     * @brief φ_k(x) без проверки индекса
     * @pre k < size()
     */
    virtual double unsafe_eval(std::size_t k, double x) const = 0;

    /**
     * @brief φ_k'(x) без проверки индекса
     * @pre k < size(), has_derivative()
     */
    virtual double unsafe_eval_derivative(std::size_t k, double x) const = 0;

    /**
     * @brief ∫_a^x φ_k(t) dt без проверки индекса
     * @pre k < size(), has_antiderivative()
     */
    virtual double unsafe_eval_antiderivative(std::size_t k, double x) const = 0;

    /**
     * @brief Базис того же вида на других узлах
     */
    virtual std::unique_ptr<IPolynomialBasis> similar(const NodeGrid& nodes) const = 0;

    /**
     * @brief Текстовое описание для отладки
     */
    virtual std::string get_info() const = 0;

    // ============== Вычисление с проверками ==============

    /**
     * @brief Значение φ_k(x)
     * @throws std::out_of_range при k >= size()
     */
    double eval_element(std::size_t k, double x) const;

    /**
     * @brief Производная φ_k'(x)
     * @throws std::out_of_range при k >= size()
     * @throws std::logic_error если базис не поддерживает производные
     */
    double eval_element_derivative(std::size_t k, double x) const;

    /**
     * @brief Первообразная ∫_a^x φ_k(t) dt, a - левая граница интервала
     * @throws std::out_of_range при k >= size()
     * @throws std::logic_error если базис не поддерживает первообразные
     */
    double eval_element_antiderivative(std::size_t k, double x) const;

    // ============== Разложения по базису ==============

    /**
     * @brief Значение разложения Σ_k c_k φ_k(x)
     * @param coeffs коэффициенты, по одному на базисную функцию
     * @param x точка вычисления
     * @throws std::invalid_argument если coeffs.size() != size()
     */
    double eval_expansion(const std::vector<double>& coeffs, double x) const;

    double eval_expansion_derivative(const std::vector<double>& coeffs, double x) const;

    double eval_expansion_antiderivative(const std::vector<double>& coeffs, double x) const;

    /**
     * @brief Значения всех базисных функций в точке x
     */
    std::vector<double> eval_all(double x) const;

protected:
    void check_index(std::size_t k) const;
    void check_coefficients(const std::vector<double>& coeffs) const;
};

} // namespace polybasis

#endif // POLYBASIS_POLYNOMIAL_BASIS_H
