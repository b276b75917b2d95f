#ifndef LASERCUT_MATH_VEC2_HPP
#define LASERCUT_MATH_VEC2_HPP

#include <cmath>

namespace lasercut {

// Point or offset in the drawing plane (millimetres)
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vec2 operator/(double scalar) const {
        return {x / scalar, y / scalar};
    }

    constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // z component of the 3D cross product
    constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    double length() const {
        return std::sqrt(x * x + y * y);
    }

    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    // Rotate counter-clockwise by angle (radians) about center
    Vec2 rotated_about(const Vec2& center, double angle) const {
        double c = std::cos(angle);
        double s = std::sin(angle);
        double dx = x - center.x;
        double dy = y - center.y;
        return {center.x + dx * c - dy * s, center.y + dx * s + dy * c};
    }

    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }
};

}  // namespace lasercut

#endif // LASERCUT_MATH_VEC2_HPP
