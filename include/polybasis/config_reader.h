#ifndef POLYBASIS_CONFIG_READER_H
#define POLYBASIS_CONFIG_READER_H

#include "types.h"
#include <string>
#include <vector>

namespace polybasis {

/**
 * @brief Класс для чтения и записи конфигурации базиса Лагранжа
 *
 * Поддерживаемые форматы:
 * 1. Простой текстовый формат "ключ = значение"
 * 2. YAML конфигурация, узлы могут быть вынесены в CSV файл
 */
class ConfigReader {
public:
    /**
     * @brief Чтение конфигурации из простого текстового файла
     *
     * Формат:
     *   interval_start = -1
     *   interval_end = 1
     *   verify_tolerance = 1e-10
     *   nodes_count = 3
     *   -1
     *   0
     *   1
     *   eval_points_count = 1
     *   0.5
     *
     * @param filename путь к файлу конфигурации
     * @return структура BasisConfig
     * @throws std::runtime_error при ошибке чтения или парсинга
     */
    static BasisConfig read_from_file(const std::string& filename);

    /**
     * @brief Чтение конфигурации из YAML файла
     *
     * Разделы:
     * - basis: interval {a, b}, nodes, verify_tolerance
     * - data_sources: nodes - путь к CSV с узлами (относительно YAML файла)
     * - evaluation: points
     *
     * @param yaml_filename путь к YAML файлу
     * @return структура BasisConfig
     * @throws std::runtime_error при ошибке чтения или парсинга
     */
    static BasisConfig read_from_yaml(const std::string& yaml_filename);

    /**
     * @brief Запись конфигурации в простой текстовый файл
     * @throws std::runtime_error при ошибке записи
     */
    static void write_to_file(const BasisConfig& config, const std::string& filename);

    /**
     * @brief Чтение узлов из CSV файла (первая колонка), заголовок необязателен
     * @param filename путь к CSV файлу
     * @return узлы в порядке следования строк
     */
    static std::vector<double> read_nodes_csv(const std::string& filename);

private:
    static bool parse_key_value(const std::string& line, std::string& key, std::string& value);
    static bool is_comment_or_empty(const std::string& line);
    static std::string trim(const std::string& str);
    static char detect_csv_delimiter(const std::string& sample_line);
    static bool has_csv_header(const std::string& line, char delimiter);
    static double parse_double(const std::string& token, int line_number);
};

} // namespace polybasis

#endif // POLYBASIS_CONFIG_READER_H
