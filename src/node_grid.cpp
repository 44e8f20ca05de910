#include "polybasis/node_grid.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace polybasis {

NodeGrid::NodeGrid(const std::vector<double>& points, const Interval& support)
    : points_(points)
    , support_(support) {
    for (double p : points_) {
        if (!std::isfinite(p)) {
            throw std::invalid_argument("Nodes must be finite numbers");
        }
    }
}

NodeGrid::NodeGrid(const std::vector<double>& points)
    : NodeGrid(points, Interval::chebyshev()) {}

double NodeGrid::min_point() const {
    if (points_.empty()) return std::numeric_limits<double>::quiet_NaN();
    return *std::min_element(points_.begin(), points_.end());
}

double NodeGrid::max_point() const {
    if (points_.empty()) return std::numeric_limits<double>::quiet_NaN();
    return *std::max_element(points_.begin(), points_.end());
}

NodeGrid NodeGrid::mapped_to(const Interval& target) const {
    double scale = target.length() / support_.length();

    std::vector<double> mapped(points_.size());
    for (std::size_t i = 0; i < points_.size(); ++i) {
        mapped[i] = target.a + (points_[i] - support_.a) * scale;
    }

    // Концы интервала должны переходить точно в концы, иначе узел на границе
    // может оказаться чуть за пределами нового интервала из-за округления
    for (std::size_t i = 0; i < points_.size(); ++i) {
        if (points_[i] == support_.a) mapped[i] = target.a;
        else if (points_[i] == support_.b) mapped[i] = target.b;
    }

    return NodeGrid(mapped, target);
}

} // namespace polybasis
