#ifndef LASERCUT_LAYOUT_LAYOUT_ENGINE_HPP
#define LASERCUT_LAYOUT_LAYOUT_ENGINE_HPP

#include <process/message_sink.hpp>
#include <process/processing_options.hpp>
#include <segment/frame.hpp>
#include <segment/segment.hpp>
#include <svg/svg_builder.hpp>
#include <topology/topology_resolver.hpp>
#include <vector>

namespace lasercut {

// Rotations smaller than this (radians) are not applied
constexpr double MIN_ALIGNMENT_ROTATION = 0.01;

// Frame in the plane of a boundary: origin p0, u along p0->p1, v completing
// a right-handed system with the polygon normal. Falls back to the world
// XY axes for fewer than 3 points or degenerate geometry.
Frame build_projection_frame(const std::vector<Vec3>& points);

// Shoelace area of a 3D polygon in a frame built from its own points
double projected_area(const std::vector<Vec3>& points);

// Output of laying out one solid. Messages are buffered so solids can be
// processed independently and merged in order.
struct SolidLayoutResult {
    SvgGroup group;
    std::vector<ProcessMessage> messages;
    bool face_found = false;
};

// Turns one thin solid into a group of cut paths: picks the largest planar
// face, projects it into its own plane, straightens strong diagonals and
// moves the outline to the origin.
class LayoutEngine {
public:
    LayoutEngine(const TopologyResolver& resolver, const ProcessingOptions& options);

    SolidLayoutResult layout_solid(const SolidFaces& solid) const;

private:
    const TopologyResolver& resolver_;
    const ProcessingOptions& options_;
};

}  // namespace lasercut

#endif // LASERCUT_LAYOUT_LAYOUT_ENGINE_HPP
