#ifndef POLYBASIS_TYPES_H
#define POLYBASIS_TYPES_H

#include <vector>
#include <string>
#include <cmath>
#include <stdexcept>

namespace polybasis {

/**
 * @brief Замкнутый интервал [a, b], на котором определён базис
 */
struct Interval {
    double a;   // левая граница
    double b;   // правая граница

    Interval(double a, double b)
        : a(a), b(b) {
        if (!std::isfinite(a) || !std::isfinite(b)) {
            throw std::invalid_argument("Interval endpoints must be finite");
        }
        if (a >= b) {
            throw std::invalid_argument("Interval must satisfy a < b");
        }
    }

    /**
     * @brief Эталонный интервал [-1, 1]
     */
    static Interval chebyshev() { return Interval(-1.0, 1.0); }

    double left_endpoint() const { return a; }
    double right_endpoint() const { return b; }
    double length() const { return b - a; }
    double center() const { return (a + b) / 2.0; }
    double half_length() const { return (b - a) / 2.0; }

    /**
     * @brief Локальная переменная t = (x - center) / half_length, [a, b] -> [-1, 1]
     */
    double to_local(double x) const { return (x - center()) / half_length(); }

    /**
     * @brief Принадлежность точки замкнутому интервалу
     */
    bool contains(double x) const { return x >= a && x <= b; }

    bool operator==(const Interval& other) const { return a == other.a && b == other.b; }
    bool operator!=(const Interval& other) const { return !(*this == other); }
};

/**
 * @brief Конфигурация построения базиса Лагранжа
 */
struct BasisConfig {
    // Интервал определения [a, b]
    double interval_start;
    double interval_end;

    std::vector<double> nodes;              // узлы ξ_1..ξ_n
    std::string nodes_file;                 // CSV с узлами (если задан, заменяет nodes)

    double verify_tolerance;                // допуск для проверки свойства Кронекера
    std::vector<double> evaluation_points;  // точки для вывода таблицы значений

    BasisConfig()
        : interval_start(-1.0)
        , interval_end(1.0)
        , verify_tolerance(1e-10) {}
};

} // namespace polybasis

#endif // POLYBASIS_TYPES_H
