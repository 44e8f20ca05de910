#include "polybasis/config_reader.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <limits>
#include <cctype>
#include <yaml-cpp/yaml.h>

namespace polybasis {

std::string ConfigReader::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool ConfigReader::is_comment_or_empty(const std::string& line) {
    std::string trimmed = trim(line);
    return trimmed.empty() || trimmed[0] == '#';
}

bool ConfigReader::parse_key_value(const std::string& line, std::string& key, std::string& value) {
    std::string trimmed = trim(line);
    size_t equals_pos = trimmed.find('=');
    if (equals_pos == std::string::npos) {
        return false;
    }

    key = trim(trimmed.substr(0, equals_pos));
    value = trim(trimmed.substr(equals_pos + 1));
    return !key.empty();
}

char ConfigReader::detect_csv_delimiter(const std::string& sample_line) {
    int comma_count = 0, semicolon_count = 0, tab_count = 0;
    for (char c : sample_line) {
        if (c == ',') comma_count++;
        else if (c == ';') semicolon_count++;
        else if (c == '\t') tab_count++;
    }

    if (comma_count >= semicolon_count && comma_count >= tab_count) return ',';
    if (semicolon_count >= comma_count && semicolon_count >= tab_count) return ';';
    return '\t';
}

bool ConfigReader::has_csv_header(const std::string& line, char delimiter) {
    std::istringstream iss(trim(line));
    std::string token;
    std::getline(iss, token, delimiter);
    token = trim(token);

    // Первый токен не число - считаем строку заголовком
    try {
        size_t pos = 0;
        std::stod(token, &pos);
        return pos != token.size();
    } catch (const std::invalid_argument&) {
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

double ConfigReader::parse_double(const std::string& token, int line_number) {
    std::string trimmed = trim(token);
    try {
        size_t pos = 0;
        double value = std::stod(trimmed, &pos);
        if (pos != trimmed.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid numeric value '" + trimmed + "' at line "
                                 + std::to_string(line_number) + ": " + e.what());
    }
}

std::vector<double> ConfigReader::read_nodes_csv(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open nodes CSV file: " + filename);
    }

    std::vector<double> nodes;
    std::string line;
    int line_number = 0;
    bool header_processed = false;
    char delimiter = ',';

    while (std::getline(file, line)) {
        line_number++;
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (!header_processed) {
            delimiter = detect_csv_delimiter(line);
            header_processed = true;
            if (has_csv_header(line, delimiter)) {
                continue;
            }
        }

        std::istringstream iss(line);
        std::string x_str;
        if (!std::getline(iss, x_str, delimiter)) {
            throw std::runtime_error("Missing node column at line " + std::to_string(line_number));
        }
        nodes.push_back(parse_double(x_str, line_number));
    }

    return nodes;
}

namespace {

// Путь к файлу данных из YAML задаётся относительно каталога YAML файла
std::string resolve_relative(const std::string& base_file, const std::string& path) {
    if (path.empty() || path[0] == '/') return path;
    size_t slash = base_file.find_last_of('/');
    if (slash == std::string::npos) return path;
    return base_file.substr(0, slash + 1) + path;
}

} // namespace

BasisConfig ConfigReader::read_from_yaml(const std::string& yaml_filename) {
    BasisConfig config;

    try {
        YAML::Node yaml_config = YAML::LoadFile(yaml_filename);

        if (!yaml_config["basis"]) {
            throw std::runtime_error("Missing 'basis' section in YAML config");
        }

        const YAML::Node& basis = yaml_config["basis"];

        if (basis["interval"]) {
            config.interval_start = basis["interval"]["a"].as<double>(config.interval_start);
            config.interval_end = basis["interval"]["b"].as<double>(config.interval_end);
        }

        if (basis["nodes"]) {
            config.nodes = basis["nodes"].as<std::vector<double>>();
        }

        config.verify_tolerance = basis["verify_tolerance"].as<double>(config.verify_tolerance);

        if (yaml_config["data_sources"] && yaml_config["data_sources"]["nodes"]) {
            config.nodes_file = resolve_relative(yaml_filename,
                                                 yaml_config["data_sources"]["nodes"].as<std::string>());
            config.nodes = read_nodes_csv(config.nodes_file);
        }

        if (yaml_config["evaluation"] && yaml_config["evaluation"]["points"]) {
            config.evaluation_points = yaml_config["evaluation"]["points"].as<std::vector<double>>();
        }

    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error in " + yaml_filename + ": " + std::string(e.what()));
    }

    return config;
}

BasisConfig ConfigReader::read_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    BasisConfig config;
    std::string line;
    int line_number = 0;

    // Куда складываются строки после счётчика
    std::vector<double>* pending_list = nullptr;
    const char* pending_name = "";
    int remaining = 0;

    while (std::getline(file, line)) {
        line_number++;
        line = trim(line);

        if (is_comment_or_empty(line)) {
            continue;
        }

        if (pending_list != nullptr && remaining > 0) {
            pending_list->push_back(parse_double(line, line_number));
            remaining--;
            continue;
        }
        pending_list = nullptr;

        std::string key, value;
        if (!parse_key_value(line, key, value)) {
            throw std::runtime_error("Invalid key-value format at line " + std::to_string(line_number));
        }

        if (key == "interval_start") {
            config.interval_start = parse_double(value, line_number);
        } else if (key == "interval_end") {
            config.interval_end = parse_double(value, line_number);
        } else if (key == "verify_tolerance") {
            config.verify_tolerance = parse_double(value, line_number);
        } else if (key == "nodes_file") {
            config.nodes_file = resolve_relative(filename, value);
            config.nodes = read_nodes_csv(config.nodes_file);
        } else if (key == "nodes_count" || key == "eval_points_count") {
            int count = static_cast<int>(parse_double(value, line_number));
            if (count < 0) {
                throw std::runtime_error("Negative " + key + " at line " + std::to_string(line_number));
            }
            pending_list = (key == "nodes_count") ? &config.nodes : &config.evaluation_points;
            pending_name = (key == "nodes_count") ? "nodes" : "eval_points";
            pending_list->clear();
            pending_list->reserve(count);
            remaining = count;
        }
        // Неизвестные ключи игнорируются
    }

    if (pending_list != nullptr && remaining > 0) {
        throw std::runtime_error(std::string("Not enough ") + pending_name + " data in " + filename);
    }

    return config;
}

void ConfigReader::write_to_file(const BasisConfig& config, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filename);
    }

    file.precision(std::numeric_limits<double>::max_digits10);

    file << "# Lagrange basis configuration\n";
    file << "# Generated by ConfigReader\n\n";

    file << "interval_start = " << config.interval_start << "\n";
    file << "interval_end = " << config.interval_end << "\n";
    file << "verify_tolerance = " << config.verify_tolerance << "\n\n";

    file << "# Nodes, one per line\n";
    file << "nodes_count = " << config.nodes.size() << "\n";
    for (double x : config.nodes) {
        file << x << "\n";
    }
    file << "\n";

    file << "# Evaluation points, one per line\n";
    file << "eval_points_count = " << config.evaluation_points.size() << "\n";
    for (double x : config.evaluation_points) {
        file << x << "\n";
    }

    if (!file) {
        throw std::runtime_error("Error while writing file: " + filename);
    }
}

} // namespace polybasis
