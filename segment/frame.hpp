#ifndef LASERCUT_SEGMENT_FRAME_HPP
#define LASERCUT_SEGMENT_FRAME_HPP

#include <math/vec2.hpp>
#include <math/vec3.hpp>

namespace lasercut {

// Orthonormal 2D coordinate system embedded in 3D space.
// u and v are unit length and perpendicular; u x v is the viewing normal.
struct Frame {
    Vec3 origin;
    Vec3 u = vec3::unit_x();
    Vec3 v = vec3::unit_y();

    // (p - origin) expressed in (u, v)
    Vec2 project(const Vec3& p) const {
        Vec3 d = p - origin;
        return {d.dot(u), d.dot(v)};
    }

    Vec3 normal() const {
        return u.cross(v);
    }
};

}  // namespace lasercut

#endif // LASERCUT_SEGMENT_FRAME_HPP
