#ifndef LASERCUT_SEGMENT_SEGMENT_HPP
#define LASERCUT_SEGMENT_SEGMENT_HPP

#include "frame.hpp"
#include <math/vec2.hpp>
#include <math/vec3.hpp>
#include <cmath>
#include <numbers>
#include <string>
#include <variant>
#include <vector>

namespace lasercut {

// Arcs whose |angular_sweep| is below this (radians) are emitted as straight lines
constexpr double DEGENERATE_SWEEP = 0.01;

// ============================================================
// 3D segments (boundary edges in model space)
// ============================================================

struct Line3D {
    Vec3 start;
    Vec3 end;
};

// Circular arc. start_angle/end_angle are measured in the
// (ref_direction, normal x ref_direction) frame around center.
struct Arc3D {
    Vec3 start;
    Vec3 end;
    Vec3 center;
    double radius = 0.0;
    Vec3 normal = vec3::unit_z();
    Vec3 ref_direction = vec3::unit_x();
    double start_angle = 0.0;
    double end_angle = 0.0;
    bool clockwise = false;  // as seen looking down -normal
};

using Segment3D = std::variant<Line3D, Arc3D>;

// ============================================================
// 2D segments (drawing space)
// ============================================================

struct Line2D {
    Vec2 start;
    Vec2 end;
};

struct Arc2D {
    Vec2 start;
    Vec2 end;
    Vec2 center;
    double radius_x = 0.0;
    double radius_y = 0.0;
    double x_axis_rotation_deg = 0.0;
    double angular_sweep = 0.0;  // radians, positive = counter-clockwise

    // Both flags follow angular_sweep; there is no way to set them
    bool large_arc_flag() const { return std::abs(angular_sweep) > std::numbers::pi; }
    bool sweep_flag() const { return angular_sweep > 0.0; }
};

using Segment2D = std::variant<Line2D, Arc2D>;

// Endpoint accessors
Vec3 segment_start(const Segment3D& segment);
Vec3 segment_end(const Segment3D& segment);
Vec2 segment_start(const Segment2D& segment);
Vec2 segment_end(const Segment2D& segment);

// Same geometry traversed the other way
Segment3D reversed(const Segment3D& segment);

// Project into the frame's plane. Arc direction is resolved against the
// frame normal so the 2D sweep keeps the visual turning direction.
Segment2D project_to_2d(const Segment3D& segment, const Frame& frame);

// Rigid rotation by angle (radians, counter-clockwise) about (cx, cy)
Segment2D rotate(const Segment2D& segment, double angle, double cx, double cy);

Segment2D translate(const Segment2D& segment, double dx, double dy);

// Relative path command approximating arcs by line segments
std::string to_path_command(const Segment2D& segment);

// Relative path command using the SVG elliptical arc command for arcs
std::string to_arc_path_command(const Segment2D& segment);

// Number of line segments used to approximate an arc in polyline output
int polyline_sample_count(double angular_sweep);

// Points along an arc from start to end following angular_sweep.
// First point is start, last is end.
std::vector<Vec2> sample_arc_points(const Arc2D& arc);

}  // namespace lasercut

#endif // LASERCUT_SEGMENT_SEGMENT_HPP
