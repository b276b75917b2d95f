#include "axis_alignment.hpp"
#include <cmath>
#include <numbers>

namespace lasercut {

namespace {

constexpr double DEG_TO_RAD = std::numbers::pi / 180.0;

// Undirected edge angle folded into [0, pi/2]
double fold_angle(double angle) {
    while (angle < 0.0) angle += std::numbers::pi;
    while (angle >= std::numbers::pi) angle -= std::numbers::pi;
    if (angle > std::numbers::pi / 2.0) angle = std::numbers::pi - angle;
    return angle;
}

}  // namespace

double compute_axis_alignment_angle(const std::vector<Vec2>& points, const AlignmentConfig& config) {
    if (points.size() < 3) {
        return 0.0;
    }

    double axis_tolerance = config.axis_tolerance_deg * DEG_TO_RAD;
    double diagonal_angle = config.diagonal_angle_deg * DEG_TO_RAD;
    double diagonal_tolerance = config.diagonal_tolerance_deg * DEG_TO_RAD;

    double total_weight = 0.0;
    double axis_weight = 0.0;
    double diagonal_weight = 0.0;
    double weighted_diagonal_angle = 0.0;

    size_t n = points.size();
    for (size_t i = 0; i < n; ++i) {
        Vec2 edge = points[(i + 1) % n] - points[i];
        double length = edge.length();
        if (length < config.min_edge_length) {
            continue;
        }

        double angle = fold_angle(std::atan2(edge.y, edge.x));
        total_weight += length;
        if (std::abs(angle) < axis_tolerance || std::abs(angle - std::numbers::pi / 2.0) < axis_tolerance) {
            axis_weight += length;
        }
        if (std::abs(angle - diagonal_angle) < diagonal_tolerance) {
            diagonal_weight += length;
            weighted_diagonal_angle += angle * length;
        }
    }

    if (total_weight <= 0.0) {
        return 0.0;
    }
    if (axis_weight > total_weight * config.axis_aligned_fraction) {
        return 0.0;
    }
    if (diagonal_weight > 0.0 && diagonal_weight >= total_weight * config.diagonal_fraction) {
        return -(weighted_diagonal_angle / diagonal_weight);
    }
    return 0.0;
}

}  // namespace lasercut
