#ifndef POLYBASIS_POLYNOMIAL_H
#define POLYBASIS_POLYNOMIAL_H

#include <vector>

namespace polybasis {

/**
 * @brief Класс для работы с алгебраическим полиномом
 *
 * Полином представляется в виде: P(x) = a_n * x^n + a_{n-1} * x^{n-1} + ... + a_1 * x + a_0
 * Коэффициенты хранятся в порядке убывания степеней: [a_n, a_{n-1}, ..., a_0]
 */
class Polynomial {
private:
    std::vector<double> coeffs_;  // коэффициенты [a_n, a_{n-1}, ..., a_0]
    int degree_;                   // степень полинома

    void strip_leading_zeros();

public:
    /**
     * @brief Конструктор по коэффициентам
     * @param coeffs вектор коэффициентов в порядке убывания степеней
     */
    Polynomial(const std::vector<double>& coeffs);

    /**
     * @brief Построение по коэффициентам в порядке возрастания степеней [a_0, a_1, ..., a_n]
     */
    static Polynomial from_ascending(const std::vector<double>& coeffs);

    /**
     * @brief Вычисление значения полинома в точке x (схема Горнера)
     * @param x точка вычисления
     * @return значение P(x)
     */
    double evaluate(double x) const;

    /**
     * @brief Вычисление первой производной в точке x
     * @param x точка вычисления
     * @return значение P'(x)
     */
    double derivative(double x) const;

    /**
     * @brief Вычисление второй производной в точке x
     * @param x точка вычисления
     * @return значение P''(x)
     */
    double second_derivative(double x) const;

    /**
     * @brief Неопределённый интеграл с нулевой постоянной
     *
     * Почленно по степенному правилу: a_k x^k -> a_k / (k+1) x^{k+1}.
     * Результат имеет степень на единицу больше (кроме нулевого полинома).
     * @return полином L(x), L(0) = 0, L'(x) = P(x)
     */
    Polynomial integral() const;

    /**
     * @brief Получение вектора коэффициентов
     * @return константная ссылка на коэффициенты
     */
    const std::vector<double>& coefficients() const { return coeffs_; }

    /**
     * @brief Коэффициент при x^k (0, если k > degree)
     */
    double coefficient(int k) const;

    /**
     * @brief Получение степени полинома
     * @return степень
     */
    int degree() const { return degree_; }
};

} // namespace polybasis

#endif // POLYBASIS_POLYNOMIAL_H
