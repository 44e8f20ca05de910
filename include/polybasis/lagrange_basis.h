#ifndef POLYBASIS_LAGRANGE_BASIS_H
#define POLYBASIS_LAGRANGE_BASIS_H

#include "polynomial_basis.h"
#include "polynomial.h"
#include "node_grid.h"
#include <Eigen/Dense>
#include <vector>
#include <string>
#include <memory>
#include <cstddef>

namespace polybasis {

/**
 * @brief Собственный индекс базиса Лагранжа: номер узла 1..n
 */
class LagrangeIndex {
private:
    std::size_t value_;

public:
    explicit LagrangeIndex(std::size_t value) : value_(value) {}

    std::size_t value() const { return value_; }

    bool operator==(const LagrangeIndex& other) const { return value_ == other.value_; }
    bool operator!=(const LagrangeIndex& other) const { return value_ != other.value_; }
};

/**
 * @brief Базис интерполяционных полиномов Лагранжа
 *
 * l_i(x) = Π_{j≠i} (x - ξ_j) / (ξ_i - ξ_j), i = 1..n
 *
 * При построении один раз вычисляются:
 * - diffs[i][j] = 1 / (ξ_i - ξ_j) - обратные разности узлов (диагональ не используется);
 * - denom[i] = Π_{j≠i} diffs[i][j] - нормирующие множители;
 * - V^{-1} - обратная матрица Вандермонда, для перехода к мономиальному базису
 *   при вычислении первообразных.
 *
 * Все таблицы хранятся в локальной переменной t = (x - c) / h интервала [a, b]
 * (c - центр, h - половина длины), узлы t_i лежат в [-1, 1]. Так степени узлов
 * в матрице Вандермонда и произведения разностей не зависят от положения и
 * длины интервала. l_i(x) = Π_{j≠i} (t - t_j) / (t_i - t_j), d/dx = (1/h) d/dt,
 * ∫ dx = h ∫ dt.
 *
 * После построения объект не изменяется и может читаться из нескольких потоков.
 */
class LagrangeBasis : public IPolynomialBasis {
private:
    std::size_t n_;                 // число узлов
    NodeGrid nodes_;                // узлы и интервал
    double half_length_;            // h = (b - a) / 2

    std::vector<double> local_nodes_;  // t_i = (ξ_i - c) / h
    std::vector<double> denom_;        // нормирующие множители по t
    std::vector<double> diffs_;        // 1 / (t_i - t_j), n×n по строкам
    Eigen::MatrixXd vdminv_;           // обратная матрица Вандермонда узлов t_i

    double diff(std::size_t i, std::size_t j) const { return diffs_[i * n_ + j]; }

    void compute_differences();

public:
    /**
     * @brief Построение базиса по сетке узлов
     * @param nodes узлы и интервал, которому они должны принадлежать
     * @throws std::invalid_argument если узлов нет или среди них есть совпадающие
     * @throws std::domain_error если узел лежит вне интервала
     * @throws std::runtime_error если матрица Вандермонда не обращается
     */
    explicit LagrangeBasis(const NodeGrid& nodes);

    /**
     * @brief Построение базиса по узлам на интервале [-1, 1]
     */
    explicit LagrangeBasis(const std::vector<double>& nodes);

    /**
     * @brief Узлы заданы на [-1, 1] и переносятся на [a, b]
     */
    LagrangeBasis(const std::vector<double>& nodes, double a, double b);

    // ============== Описание базиса ==============

    bool has_derivative() const noexcept override { return true; }
    bool has_antiderivative() const noexcept override { return true; }
    const Interval& support() const noexcept override { return nodes_.support(); }
    std::size_t size() const noexcept override { return n_; }
    int degree() const noexcept override { return static_cast<int>(n_) - 1; }

    const std::vector<double>& nodes() const { return nodes_.points(); }
    const NodeGrid& grid() const { return nodes_; }
    std::size_t num_nodes() const { return n_; }

    /**
     * @brief Перевод линейного индекса 0..n-1 в номер узла 1..n
     */
    LagrangeIndex native_index(std::size_t k) const { return LagrangeIndex(k + 1); }
    std::size_t linear_index(LagrangeIndex idx) const { return idx.value() - 1; }

    // ============== Предвычисленные таблицы ==============

    /**
     * @brief Π_{j≠i} 1 / (ξ_i - ξ_j)
     *
     * Пересчитывается из таблицы по t; для широких интервалов с большим
     * числом узлов может выйти за диапазон double.
     */
    double denominator(LagrangeIndex idx) const;

    /**
     * @brief 1 / (ξ_i - ξ_j), i ≠ j
     */
    double reciprocal_difference(LagrangeIndex i, LagrangeIndex j) const {
        return diff(i.value() - 1, j.value() - 1) / half_length_;
    }

    /**
     * @brief Узлы в локальной переменной t
     */
    const std::vector<double>& local_nodes() const { return local_nodes_; }

    /**
     * @brief Обратная матрица Вандермонда V(k, i) = t_i^k
     */
    const Eigen::MatrixXd& vandermonde_inverse() const { return vdminv_; }

    // ============== Вычисление базисных функций ==============
    //
    // Индекс не проверяется: вызывающий код гарантирует 1 <= idx.value() <= n.
    // Проверку выполняют eval_element* базового класса.

    /**
     * @brief l_i(x) = denom[i] * Π_{j≠i} (t - t_j)
     */
    double unsafe_eval_element(LagrangeIndex idx, double x) const;

    /**
     * @brief l_i'(x) = (1/h) Σ_{l≠i} diffs[i][l] * Π_{k≠i,l} (t - t_k) * diffs[i][k]
     */
    double unsafe_eval_element_derivative(LagrangeIndex idx, double x) const;

    /**
     * @brief ∫_a^x l_i(s) ds = h (L_i(t(x)) - L_i(t(a))), L_i - первообразная мономиального представления
     */
    double unsafe_eval_element_antiderivative(LagrangeIndex idx, double x) const;

    double unsafe_eval(std::size_t k, double x) const override {
        return unsafe_eval_element(native_index(k), x);
    }
    double unsafe_eval_derivative(std::size_t k, double x) const override {
        return unsafe_eval_element_derivative(native_index(k), x);
    }
    double unsafe_eval_antiderivative(std::size_t k, double x) const override {
        return unsafe_eval_element_antiderivative(native_index(k), x);
    }

    /**
     * @brief l_i как полином от локальной переменной t: коэффициенты c_k = (V^{-1})(i, k)
     *
     * l_i(x) = monomial_polynomial(idx).evaluate(support().to_local(x))
     */
    Polynomial monomial_polynomial(LagrangeIndex idx) const;

    // ============== Производные базисы ==============

    std::unique_ptr<IPolynomialBasis> similar(const NodeGrid& nodes) const override;

    /**
     * @brief Новый базис на узлах, аффинно перенесённых на интервал target
     */
    LagrangeBasis rescaled(const Interval& target) const;

    // ============== Диагностика ==============

    /**
     * @brief Проверка l_i(ξ_k) = δ_ik с заданной точностью
     */
    bool verify_interpolation(double tolerance = 1e-10) const;

    std::string get_info() const override;
};

} // namespace polybasis

#endif // POLYBASIS_LAGRANGE_BASIS_H
