#include "segment.hpp"
#include <common/number_format.hpp>
#include <algorithm>
#include <sstream>
#include <type_traits>

namespace lasercut {

namespace {

constexpr double TWO_PI = 2.0 * std::numbers::pi;

std::string line_command(const Vec2& start, const Vec2& end) {
    return "l " + format_pair(end.x - start.x, end.y - start.y);
}

}  // namespace

Vec3 segment_start(const Segment3D& segment) {
    return std::visit([](auto&& s) { return s.start; }, segment);
}

Vec3 segment_end(const Segment3D& segment) {
    return std::visit([](auto&& s) { return s.end; }, segment);
}

Vec2 segment_start(const Segment2D& segment) {
    return std::visit([](auto&& s) { return s.start; }, segment);
}

Vec2 segment_end(const Segment2D& segment) {
    return std::visit([](auto&& s) { return s.end; }, segment);
}

Segment3D reversed(const Segment3D& segment) {
    return std::visit([](auto&& s) -> Segment3D {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Line3D>) {
            return Line3D{s.end, s.start};
        } else {
            Arc3D arc = s;
            arc.start = s.end;
            arc.end = s.start;
            arc.start_angle = s.end_angle;
            arc.end_angle = s.start_angle;
            arc.clockwise = !s.clockwise;
            return arc;
        }
    }, segment);
}

Segment2D project_to_2d(const Segment3D& segment, const Frame& frame) {
    return std::visit([&frame](auto&& s) -> Segment2D {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Line3D>) {
            return Line2D{frame.project(s.start), frame.project(s.end)};
        } else {
            Arc2D arc;
            arc.start = frame.project(s.start);
            arc.end = frame.project(s.end);
            arc.center = frame.project(s.center);

            Vec2 to_start = arc.start - arc.center;
            Vec2 to_end = arc.end - arc.center;
            double radius = to_start.length();
            arc.radius_x = radius;
            arc.radius_y = radius;

            double start_angle = std::atan2(to_start.y, to_start.x);
            double end_angle = std::atan2(to_end.y, to_end.x);

            // An arc normal facing away from the viewer mirrors its direction
            bool clockwise = s.normal.dot(frame.normal()) >= 0.0 ? s.clockwise : !s.clockwise;

            double sweep = clockwise ? start_angle - end_angle : end_angle - start_angle;
            while (sweep <= 0.0) {
                sweep += TWO_PI;
            }
            arc.angular_sweep = clockwise ? -sweep : sweep;
            return arc;
        }
    }, segment);
}

Segment2D rotate(const Segment2D& segment, double angle, double cx, double cy) {
    Vec2 pivot{cx, cy};
    return std::visit([&](auto&& s) -> Segment2D {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Line2D>) {
            return Line2D{s.start.rotated_about(pivot, angle), s.end.rotated_about(pivot, angle)};
        } else {
            Arc2D arc = s;
            arc.start = s.start.rotated_about(pivot, angle);
            arc.end = s.end.rotated_about(pivot, angle);
            arc.center = s.center.rotated_about(pivot, angle);
            arc.x_axis_rotation_deg = s.x_axis_rotation_deg + angle * 180.0 / std::numbers::pi;
            return arc;
        }
    }, segment);
}

Segment2D translate(const Segment2D& segment, double dx, double dy) {
    Vec2 offset{dx, dy};
    return std::visit([&offset](auto&& s) -> Segment2D {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Line2D>) {
            return Line2D{s.start + offset, s.end + offset};
        } else {
            Arc2D arc = s;
            arc.start = s.start + offset;
            arc.end = s.end + offset;
            arc.center = s.center + offset;
            return arc;
        }
    }, segment);
}

int polyline_sample_count(double angular_sweep) {
    double degrees = std::abs(angular_sweep) * 180.0 / std::numbers::pi;
    int count = static_cast<int>(std::lround(degrees / 3.0));
    return std::clamp(count, 16, 120);
}

std::vector<Vec2> sample_arc_points(const Arc2D& arc) {
    std::vector<Vec2> points;
    points.push_back(arc.start);
    if (std::abs(arc.angular_sweep) < DEGENERATE_SWEEP) {
        points.push_back(arc.end);
        return points;
    }

    int count = polyline_sample_count(arc.angular_sweep);
    double start_angle = std::atan2(arc.start.y - arc.center.y, arc.start.x - arc.center.x);
    for (int i = 1; i < count; ++i) {
        double t = static_cast<double>(i) / count;
        double angle = start_angle + arc.angular_sweep * t;
        points.push_back({arc.center.x + arc.radius_x * std::cos(angle),
                          arc.center.y + arc.radius_y * std::sin(angle)});
    }
    points.push_back(arc.end);
    return points;
}

std::string to_path_command(const Segment2D& segment) {
    return std::visit([](auto&& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Line2D>) {
            return line_command(s.start, s.end);
        } else {
            if (std::abs(s.angular_sweep) < DEGENERATE_SWEEP) {
                return line_command(s.start, s.end);
            }
            std::vector<Vec2> points = sample_arc_points(s);
            std::ostringstream ss;
            for (size_t i = 1; i < points.size(); ++i) {
                if (i > 1) ss << " ";
                ss << line_command(points[i - 1], points[i]);
            }
            return ss.str();
        }
    }, segment);
}

std::string to_arc_path_command(const Segment2D& segment) {
    return std::visit([](auto&& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Line2D>) {
            return line_command(s.start, s.end);
        } else {
            if (std::abs(s.angular_sweep) < DEGENERATE_SWEEP) {
                return line_command(s.start, s.end);
            }
            std::ostringstream ss;
            ss << "a " << format_pair(s.radius_x, s.radius_y)
               << " 0 " << (s.large_arc_flag() ? 1 : 0)
               << " " << (s.sweep_flag() ? 1 : 0)
               << " " << format_pair(s.end.x - s.start.x, s.end.y - s.start.y);
            return ss.str();
        }
    }, segment);
}

}  // namespace lasercut
