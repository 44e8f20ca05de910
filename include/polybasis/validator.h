#ifndef POLYBASIS_VALIDATOR_H
#define POLYBASIS_VALIDATOR_H

#include "types.h"
#include <string>
#include <vector>
#include <sstream>

namespace polybasis {

/**
 * @brief Уровень серьёзности проблемы валидации
 */
enum class ValidationLevel {
    Error,     ///< Критическая ошибка, базис построить нельзя
    Warning    ///< Базис строится, но точность может пострадать
};

/**
 * @brief Структура для описания проблемы валидации
 */
struct ValidationIssue {
    ValidationLevel level;      ///< Уровень серьёзности
    std::string message;        ///< Описание проблемы
    std::string recommendation; ///< Рекомендация по исправлению

    ValidationIssue(ValidationLevel lvl, const std::string& msg, const std::string& rec = "")
        : level(lvl), message(msg), recommendation(rec) {}
};

/**
 * @brief Результаты валидации конфигурации базиса
 */
struct ValidationReport {
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;

    // Статистика
    size_t nodes_count = 0;
    int degree = 0;
    double min_node_gap = 0.0;

    bool has_errors() const { return !errors.empty(); }
    bool has_warnings() const { return !warnings.empty(); }

    std::string format(bool include_recommendations = true) const {
        std::ostringstream oss;

        if (errors.empty() && warnings.empty()) {
            return "Validation passed successfully.\n";
        }

        oss << "Validation Report:\n";
        oss << "=================\n\n";

        oss << "Summary:\n";
        oss << "  - Nodes: " << nodes_count << "\n";
        oss << "  - Degree: " << degree << "\n";
        if (nodes_count > 1) {
            oss << "  - Minimal node gap: " << min_node_gap << "\n";
        }
        oss << "\n";

        append_issues(oss, "Errors", errors, include_recommendations);
        append_issues(oss, "Warnings", warnings, include_recommendations);

        return oss.str();
    }

private:
    static void append_issues(std::ostringstream& oss, const char* title,
                              const std::vector<ValidationIssue>& issues,
                              bool include_recommendations) {
        if (issues.empty()) return;
        oss << title << " (" << issues.size() << "):\n";
        for (size_t i = 0; i < issues.size(); ++i) {
            oss << "  " << (i + 1) << ". " << issues[i].message;
            if (include_recommendations && !issues[i].recommendation.empty()) {
                oss << "\n      Recommendation: " << issues[i].recommendation;
            }
            oss << "\n";
        }
        oss << "\n";
    }
};

/**
 * @brief Проверка конфигурации до построения базиса
 *
 * Ошибки соответствуют исключениям, которые выбросит конструктор LagrangeBasis,
 * предупреждения - условиям, при которых обратная матрица Вандермонда теряет точность.
 */
class Validator {
public:
    /// Степень, начиная с которой выдаётся предупреждение
    static constexpr int HIGH_DEGREE_THRESHOLD = 20;

    /**
     * @brief Упрощённый интерфейс
     * @param config конфигурация
     * @param strict_mode если true, предупреждения считаются ошибками
     * @return пустая строка, если валидация прошла успешно, иначе сообщение
     */
    static std::string validate(const BasisConfig& config, bool strict_mode = false);

    /**
     * @brief Полная проверка с детальным отчётом
     */
    static ValidationReport validate_full(const BasisConfig& config, bool strict_mode = false);

    /**
     * @brief Интервал: конечные границы, a < b
     */
    static std::string check_interval(const BasisConfig& config);

    /**
     * @brief Все узлы конечны и лежат в [a, b]
     */
    static std::string check_nodes_in_interval(const BasisConfig& config);

    /**
     * @brief Есть хотя бы один узел
     */
    static std::string check_nonempty_nodes(const BasisConfig& config);

    /**
     * @brief Узлы попарно различны
     */
    static std::string check_unique_nodes(const BasisConfig& config);

    /**
     * @brief Узлы, расстояние между которыми мало относительно длины интервала
     */
    static std::string check_close_nodes(const BasisConfig& config, double relative_tolerance = 1e-8);

    /**
     * @brief Высокая степень
     */
    static std::string check_degree(const BasisConfig& config);

private:
    static double min_gap(const std::vector<double>& nodes);
};

} // namespace polybasis

#endif // POLYBASIS_VALIDATOR_H
