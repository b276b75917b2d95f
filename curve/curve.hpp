#ifndef LASERCUT_CURVE_CURVE_HPP
#define LASERCUT_CURVE_CURVE_HPP

#include <math/vec3.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lasercut {

// AXIS2_PLACEMENT_3D. Missing members fall back to origin, +Z and +X.
struct Placement {
    std::optional<Vec3> location;
    std::optional<Vec3> axis;
    std::optional<Vec3> ref_direction;
};

// Geometric curve primitives carried by model edges
namespace curve {

struct Line {
    std::optional<Vec3> point;
    std::optional<Vec3> direction;
};

struct Circle {
    std::optional<Placement> position;  // nullopt when the placement is not 3D
    double radius = 0.0;
};

struct Ellipse {
    std::optional<Placement> position;
    double semi_axis_1 = 0.0;
    double semi_axis_2 = 0.0;
};

struct BSpline {
    int degree = 0;
    std::vector<Vec3> control_points;
    std::vector<int> knot_multiplicities;
    std::vector<double> knots;
    bool rational = false;  // weights present in the file; evaluated as non-rational
};

// Any curve type we do not evaluate (polylines, offset curves, ...)
struct Unknown {
    std::string type_name;
};

}  // namespace curve

using Curve = std::variant<curve::Line, curve::Circle, curve::Ellipse, curve::BSpline, curve::Unknown>;

}  // namespace lasercut

#endif // LASERCUT_CURVE_CURVE_HPP
