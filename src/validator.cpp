#include "polybasis/validator.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace polybasis {

// ==================== Основные методы валидации ====================

std::string Validator::validate(const BasisConfig& config, bool strict_mode) {
    ValidationReport report = validate_full(config, strict_mode);

    if (report.has_errors()) {
        return report.format(false);
    }

    return "";
}

ValidationReport Validator::validate_full(const BasisConfig& config, bool strict_mode) {
    ValidationReport report;

    report.nodes_count = config.nodes.size();
    report.degree = static_cast<int>(config.nodes.size()) - 1;
    report.min_node_gap = min_gap(config.nodes);

    std::string interval_check = check_interval(config);
    if (!interval_check.empty()) {
        report.errors.emplace_back(ValidationLevel::Error, interval_check,
            "Check that interval_start and interval_end are finite numbers and interval_start < interval_end.");
    }

    std::string empty_check = check_nonempty_nodes(config);
    if (!empty_check.empty()) {
        report.errors.emplace_back(ValidationLevel::Error, empty_check,
            "Provide at least one node.");
    }

    // Принадлежность интервалу имеет смысл только для корректного интервала
    if (interval_check.empty()) {
        std::string nodes_check = check_nodes_in_interval(config);
        if (!nodes_check.empty()) {
            report.errors.emplace_back(ValidationLevel::Error, nodes_check,
                "Move all nodes inside the interval [a, b] or correct the interval boundaries.");
        }
    }

    std::string unique_check = check_unique_nodes(config);
    if (!unique_check.empty()) {
        report.errors.emplace_back(ValidationLevel::Error, unique_check,
            "Each node must appear once. Remove duplicate nodes.");
    } else {
        std::string close_check = check_close_nodes(config);
        if (!close_check.empty()) {
            report.warnings.emplace_back(ValidationLevel::Warning, close_check,
                "Close nodes make the basis functions very large between them. Consider spreading the nodes.");
        }
    }

    std::string degree_check = check_degree(config);
    if (!degree_check.empty()) {
        report.warnings.emplace_back(ValidationLevel::Warning, degree_check,
            "Antiderivatives go through the monomial basis and lose accuracy at high degree.");
    }

    if (strict_mode && report.has_warnings()) {
        for (const auto& w : report.warnings) {
            report.errors.emplace_back(ValidationLevel::Error, w.message, w.recommendation);
        }
        report.warnings.clear();
    }

    return report;
}

// ==================== Отдельные проверки ====================

std::string Validator::check_interval(const BasisConfig& config) {
    if (!std::isfinite(config.interval_start) || !std::isfinite(config.interval_end)) {
        return "Interval boundaries must be finite numbers";
    }
    if (config.interval_start >= config.interval_end) {
        std::ostringstream oss;
        oss << "Invalid interval: interval_start (" << config.interval_start
            << ") must be less than interval_end (" << config.interval_end << ")";
        return oss.str();
    }
    return "";
}

std::string Validator::check_nodes_in_interval(const BasisConfig& config) {
    std::ostringstream oss;
    int bad = 0;
    for (size_t i = 0; i < config.nodes.size(); ++i) {
        double x = config.nodes[i];
        if (!std::isfinite(x)) {
            oss << (bad ? "; " : "") << "node " << (i + 1) << " is not finite";
            ++bad;
        } else if (x < config.interval_start || x > config.interval_end) {
            oss << (bad ? "; " : "") << "node " << (i + 1) << " (x = " << x << ") is outside ["
                << config.interval_start << ", " << config.interval_end << "]";
            ++bad;
        }
    }
    return bad ? oss.str() : "";
}

std::string Validator::check_nonempty_nodes(const BasisConfig& config) {
    if (config.nodes.empty()) {
        return "No nodes given";
    }
    return "";
}

std::string Validator::check_unique_nodes(const BasisConfig& config) {
    for (size_t i = 0; i < config.nodes.size(); ++i) {
        for (size_t j = i + 1; j < config.nodes.size(); ++j) {
            if (config.nodes[i] == config.nodes[j]) {
                std::ostringstream oss;
                oss << "Duplicate nodes " << (i + 1) << " and " << (j + 1)
                    << " (x = " << config.nodes[i] << ")";
                return oss.str();
            }
        }
    }
    return "";
}

std::string Validator::check_close_nodes(const BasisConfig& config, double relative_tolerance) {
    if (config.nodes.size() < 2) return "";

    double length = config.interval_end - config.interval_start;
    if (!std::isfinite(length) || length <= 0.0) return "";

    double gap = min_gap(config.nodes);
    if (gap < relative_tolerance * length) {
        std::ostringstream oss;
        oss << "Nodes are nearly coincident: minimal gap " << gap
            << " is below " << relative_tolerance << " of the interval length";
        return oss.str();
    }
    return "";
}

std::string Validator::check_degree(const BasisConfig& config) {
    int degree = static_cast<int>(config.nodes.size()) - 1;
    if (degree > HIGH_DEGREE_THRESHOLD) {
        std::ostringstream oss;
        oss << "High degree: " << degree << " > " << HIGH_DEGREE_THRESHOLD;
        return oss.str();
    }
    return "";
}

double Validator::min_gap(const std::vector<double>& nodes) {
    if (nodes.size() < 2) return 0.0;

    std::vector<double> sorted = nodes;
    std::sort(sorted.begin(), sorted.end());
    double gap = std::numeric_limits<double>::infinity();
    for (size_t i = 1; i < sorted.size(); ++i) {
        gap = std::min(gap, sorted[i] - sorted[i - 1]);
    }
    return gap;
}

} // namespace polybasis
