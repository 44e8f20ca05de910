#ifndef POLYBASIS_NODE_GRID_H
#define POLYBASIS_NODE_GRID_H

#include "types.h"
#include <vector>
#include <cstddef>

namespace polybasis {

/**
 * @brief Упорядоченный набор узлов вместе с интервалом, которому они должны принадлежать
 *
 * Узлы хранятся в том порядке, в котором заданы: порядок узлов определяет
 * нумерацию базисных функций. Сетка не сортирует и не объединяет узлы,
 * принадлежность интервалу проверяет базис при построении.
 */
class NodeGrid {
private:
    std::vector<double> points_;  // узлы ξ_1..ξ_n
    Interval support_;            // интервал [a, b]

public:
    /**
     * @brief Конструктор по узлам и интервалу
     * @param points узлы
     * @param support интервал
     * @throws std::invalid_argument если среди узлов есть NaN/Inf
     */
    NodeGrid(const std::vector<double>& points, const Interval& support);

    /**
     * @brief Узлы на эталонном интервале [-1, 1]
     */
    explicit NodeGrid(const std::vector<double>& points);

    const std::vector<double>& points() const { return points_; }
    const Interval& support() const { return support_; }

    std::size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    double operator[](std::size_t i) const { return points_[i]; }

    double min_point() const;
    double max_point() const;

    /**
     * @brief Аффинное отображение узлов с текущего интервала на новый
     *
     * x' = c + (x - a) * (d - c) / (b - a), где [a, b] - текущий интервал, [c, d] - новый.
     * @param target новый интервал
     * @return новая сетка на интервале target
     */
    NodeGrid mapped_to(const Interval& target) const;
};

} // namespace polybasis

#endif // POLYBASIS_NODE_GRID_H
