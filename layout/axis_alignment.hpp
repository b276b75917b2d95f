#ifndef LASERCUT_LAYOUT_AXIS_ALIGNMENT_HPP
#define LASERCUT_LAYOUT_AXIS_ALIGNMENT_HPP

#include <math/vec2.hpp>
#include <vector>

namespace lasercut {

// Thresholds of the axis-alignment heuristic. Angles in degrees,
// fractions of total qualifying edge length.
struct AlignmentConfig {
    double min_edge_length = 1.0;         // mm; shorter edges are ignored
    double axis_tolerance_deg = 5.0;
    double axis_aligned_fraction = 0.6;   // above this the part is left alone
    double diagonal_angle_deg = 45.0;
    double diagonal_tolerance_deg = 10.0;
    double diagonal_fraction = 0.3;       // at or above this the diagonal is straightened
};

// Rotation (radians) that brings a dominant diagonal edge direction of the
// closed polygon onto the horizontal axis, or exactly 0 when the polygon is
// already axis aligned or has no strong diagonal.
double compute_axis_alignment_angle(const std::vector<Vec2>& points,
                                    const AlignmentConfig& config = {});

}  // namespace lasercut

#endif // LASERCUT_LAYOUT_AXIS_ALIGNMENT_HPP
