#ifndef POLYBASIS_VANDERMONDE_H
#define POLYBASIS_VANDERMONDE_H

#include <Eigen/Dense>
#include <vector>

namespace polybasis {

/**
 * @brief Порог вырожденности для LU-разложения матрицы Вандермонда
 *
 * Ведущий элемент p считается нулевым, если |p| <= VANDERMONDE_PIVOT_THRESHOLD * |p_max|.
 * Порог рассчитан на узлы из [-1, 1]: на больших интервалах степени узлов
 * теряют точность раньше, чем матрица становится вырожденной.
 */
constexpr double VANDERMONDE_PIVOT_THRESHOLD = 1e-15;

/**
 * @brief Матрица Вандермонда V(k, i) = ξ_i^k, k, i = 0..n-1
 *
 * Столбец i содержит степени узла ξ_i. Для коэффициентов c полинома
 * p(x) = Σ c_k x^k выполняется (V^T c)_i = p(ξ_i).
 * @param nodes узлы
 * @return матрица n×n
 */
Eigen::MatrixXd vandermonde_matrix(const std::vector<double>& nodes);

/**
 * @brief Обращение матрицы Вандермонда через LU-разложение с полным выбором главного элемента
 * @param nodes узлы, желательно в локальной переменной на [-1, 1]
 * @return V^{-1}
 * @throws std::invalid_argument при пустом наборе узлов
 * @throws std::runtime_error если матрица вырождена или обратная содержит NaN/Inf
 */
Eigen::MatrixXd vandermonde_matrix_inverse(const std::vector<double>& nodes);

} // namespace polybasis

#endif // POLYBASIS_VANDERMONDE_H
