#include "curve_evaluator.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace lasercut {

namespace {

constexpr double TWO_PI = 2.0 * std::numbers::pi;

// Resolved in-plane axes of a 3D placement
struct PlaneAxes {
    Vec3 center;
    Vec3 normal;
    Vec3 x_dir;
    Vec3 y_dir;
};

Vec3 normalized_or_raw(const Vec3& v) {
    double len = v.length();
    return len > 1e-10 ? v / len : v;
}

PlaneAxes resolve_axes(const Placement& placement) {
    PlaneAxes axes;
    axes.center = placement.location.value_or(vec3::zero());
    axes.normal = normalized_or_raw(placement.axis.value_or(vec3::unit_z()));
    axes.x_dir = normalized_or_raw(placement.ref_direction.value_or(vec3::unit_x()));
    axes.y_dir = axes.normal.cross(axes.x_dir);
    return axes;
}

double angle_on_circle(const Vec3& p, const PlaneAxes& axes) {
    Vec3 d = p - axes.center;
    return std::atan2(d.dot(axes.y_dir), d.dot(axes.x_dir));
}

double angle_on_ellipse(const Vec3& p, const PlaneAxes& axes, double a, double b) {
    Vec3 d = p - axes.center;
    return std::atan2(d.dot(axes.y_dir) / b, d.dot(axes.x_dir) / a);
}

Arc3D circle_arc(const curve::Circle& circle, const Vec3& start, const Vec3& end, bool orientation) {
    Arc3D arc;
    arc.start = start;
    arc.end = end;
    arc.radius = circle.radius;

    if (!circle.position) {
        // No usable placement: assume a half circle between the endpoints
        arc.center = (start + end) * 0.5;
        arc.normal = vec3::unit_z();
        arc.ref_direction = vec3::unit_x();
        arc.start_angle = 0.0;
        arc.end_angle = std::numbers::pi;
        arc.clockwise = false;
        return arc;
    }

    PlaneAxes axes = resolve_axes(*circle.position);
    arc.center = axes.center;
    arc.normal = axes.normal;
    arc.ref_direction = axes.x_dir;
    arc.start_angle = angle_on_circle(start, axes);
    arc.end_angle = angle_on_circle(end, axes);
    while (arc.end_angle <= arc.start_angle) {
        arc.end_angle += TWO_PI;
    }
    arc.clockwise = !orientation;
    return arc;
}

std::vector<Vec3> sample_circle(const curve::Circle& circle,
                                const std::optional<Vec3>& start_vertex,
                                const std::optional<Vec3>& end_vertex,
                                int samples) {
    std::vector<Vec3> points;
    if (!circle.position) {
        if (start_vertex) points.push_back(*start_vertex);
        return points;
    }

    PlaneAxes axes = resolve_axes(*circle.position);
    double start_angle = start_vertex ? angle_on_circle(*start_vertex, axes) : 0.0;
    double end_angle = end_vertex ? angle_on_circle(*end_vertex, axes) : TWO_PI;
    while (end_angle <= start_angle) {
        end_angle += TWO_PI;
    }

    points.reserve(samples + 1);
    for (int i = 0; i <= samples; ++i) {
        double angle = start_angle + (end_angle - start_angle) * i / samples;
        points.push_back(axes.center +
                         (axes.x_dir * std::cos(angle) + axes.y_dir * std::sin(angle)) * circle.radius);
    }
    return points;
}

std::vector<Vec3> sample_ellipse(const curve::Ellipse& ellipse,
                                 const std::optional<Vec3>& start_vertex,
                                 const std::optional<Vec3>& end_vertex,
                                 int samples) {
    std::vector<Vec3> points;
    if (!ellipse.position) {
        if (start_vertex) points.push_back(*start_vertex);
        return points;
    }

    PlaneAxes axes = resolve_axes(*ellipse.position);
    double a = ellipse.semi_axis_1;
    double b = ellipse.semi_axis_2;
    double start_angle = start_vertex ? angle_on_ellipse(*start_vertex, axes, a, b) : 0.0;
    double end_angle = end_vertex ? angle_on_ellipse(*end_vertex, axes, a, b) : TWO_PI;
    while (end_angle <= start_angle) {
        end_angle += TWO_PI;
    }

    points.reserve(samples + 1);
    for (int i = 0; i <= samples; ++i) {
        double angle = start_angle + (end_angle - start_angle) * i / samples;
        points.push_back(axes.center + axes.x_dir * (a * std::cos(angle)) +
                         axes.y_dir * (b * std::sin(angle)));
    }
    return points;
}

std::vector<Vec3> sample_bspline(const curve::BSpline& spline, int samples) {
    std::vector<Vec3> points;
    if (spline.control_points.empty()) {
        return points;
    }

    int degree = spline.degree;
    int n = static_cast<int>(spline.control_points.size()) - 1;
    if (degree < 0 || degree > n) {
        return points;
    }

    // A valid knot vector has exactly n + degree + 2 entries
    size_t knot_count = static_cast<size_t>(n) + static_cast<size_t>(degree) + 2;
    std::vector<double> knots = expand_knots(spline.knots, spline.knot_multiplicities, knot_count);
    // Malformed splines (short or decreasing knot vectors, empty domain) produce nothing
    if (knots.size() < knot_count || !std::is_sorted(knots.begin(), knots.end())) {
        return points;
    }

    double t_min = knots[degree];
    double t_max = knots[n + 1];
    if (!(t_max > t_min)) {
        return points;
    }
    points.reserve(samples + 1);
    for (int i = 0; i <= samples; ++i) {
        double t = t_min + (t_max - t_min) * i / samples;
        if (i == samples) {
            t = t_max - 1e-10;
        }
        points.push_back(evaluate_bspline(spline.control_points, knots, degree, t));
    }
    return points;
}

}  // namespace

Segment3D extract_segment(const Curve* curve,
                          const std::optional<Vec3>& start_vertex,
                          const std::optional<Vec3>& end_vertex,
                          bool orientation) {
    if (curve == nullptr || !start_vertex || !end_vertex) {
        return Line3D{start_vertex.value_or(vec3::zero()), end_vertex.value_or(vec3::zero())};
    }

    Vec3 start = orientation ? *start_vertex : *end_vertex;
    Vec3 end = orientation ? *end_vertex : *start_vertex;

    if (const auto* circle = std::get_if<curve::Circle>(curve)) {
        return circle_arc(*circle, start, end, orientation);
    }

    // Splines and ellipses are cut as chords between their vertices
    return Line3D{start, end};
}

std::vector<Vec3> sample_curve(const Curve* curve,
                               const std::optional<Vec3>& start_vertex,
                               const std::optional<Vec3>& end_vertex,
                               bool orientation,
                               int samples_per_curve) {
    std::vector<Vec3> points;
    if (curve == nullptr) {
        if (start_vertex) points.push_back(*start_vertex);
        return points;
    }

    int samples = std::max(1, samples_per_curve);
    bool sampled = true;
    std::visit([&](auto&& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, curve::BSpline>) {
            points = sample_bspline(c, samples);
        } else if constexpr (std::is_same_v<T, curve::Circle>) {
            points = sample_circle(c, start_vertex, end_vertex, samples);
        } else if constexpr (std::is_same_v<T, curve::Ellipse>) {
            points = sample_ellipse(c, start_vertex, end_vertex, samples);
        } else {
            sampled = false;
        }
    }, *curve);

    if (sampled) {
        if (!orientation) {
            std::reverse(points.begin(), points.end());
        }
        return points;
    }

    if (start_vertex) {
        points.push_back(orientation ? *start_vertex : end_vertex.value_or(*start_vertex));
    }
    return points;
}

bool is_curved_geometry(const Curve* curve) {
    if (curve == nullptr) {
        return false;
    }
    return std::holds_alternative<curve::Circle>(*curve) ||
           std::holds_alternative<curve::Ellipse>(*curve) ||
           std::holds_alternative<curve::BSpline>(*curve);
}

std::vector<double> expand_knots(const std::vector<double>& knots,
                                 const std::vector<int>& multiplicities,
                                 size_t max_count) {
    std::vector<double> expanded;
    size_t count = std::min(knots.size(), multiplicities.size());
    size_t total = 0;
    for (size_t i = 0; i < count; ++i) {
        if (multiplicities[i] > 0) {
            total += static_cast<size_t>(multiplicities[i]);
        }
        if (total > max_count) {
            return {};
        }
    }
    expanded.reserve(total);
    for (size_t i = 0; i < count; ++i) {
        for (int j = 0; j < multiplicities[i]; ++j) {
            expanded.push_back(knots[i]);
        }
    }
    return expanded;
}

int find_knot_span(int n, int degree, double t, const std::vector<double>& knots) {
    if (t >= knots[n + 1]) {
        return n;
    }
    if (t <= knots[degree]) {
        return degree;
    }
    int low = degree;
    int high = n + 1;
    int mid = (low + high) / 2;
    while (t < knots[mid] || t >= knots[mid + 1]) {
        if (t < knots[mid]) {
            high = mid;
        } else {
            low = mid;
        }
        mid = (low + high) / 2;
    }
    return mid;
}

Vec3 evaluate_bspline(const std::vector<Vec3>& control_points,
                      const std::vector<double>& knots,
                      int degree,
                      double t) {
    int n = static_cast<int>(control_points.size()) - 1;
    if (degree < 0 || degree > n || knots.size() < static_cast<size_t>(n + degree + 2)) {
        throw std::invalid_argument("B-spline of degree " + std::to_string(degree) + " with " +
                                    std::to_string(control_points.size()) + " control points and " +
                                    std::to_string(knots.size()) + " knots cannot be evaluated");
    }
    int k = find_knot_span(n, degree, t, knots);

    std::vector<Vec3> d(degree + 1);
    for (int j = 0; j <= degree; ++j) {
        int idx = k - degree + j;
        if (idx >= 0 && idx <= n) {
            d[j] = control_points[idx];
        }
    }

    for (int r = 1; r <= degree; ++r) {
        for (int j = degree; j >= r; --j) {
            int i = k - degree + j;
            double denom = knots[i + degree - r + 1] - knots[i];
            double alpha = std::abs(denom) > 1e-10 ? (t - knots[i]) / denom : 0.0;
            d[j] = d[j - 1] * (1.0 - alpha) + d[j] * alpha;
        }
    }
    return d[degree];
}

}  // namespace lasercut
