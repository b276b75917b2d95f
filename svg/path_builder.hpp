#ifndef LASERCUT_SVG_PATH_BUILDER_HPP
#define LASERCUT_SVG_PATH_BUILDER_HPP

#include <segment/segment.hpp>
#include <string>
#include <vector>

namespace lasercut {

// Loops whose end is farther than this from their start get an explicit Z
constexpr double PATH_CLOSE_TOLERANCE = 0.001;

// Path data for a segment loop: absolute move to the first start point,
// then one relative command per segment. Arcs are flattened to lines.
std::string build_path_from_segments(const std::vector<Segment2D>& segments);

// As above, but arcs become SVG elliptical arc commands
std::string build_path_from_segments_as_curves(const std::vector<Segment2D>& segments);

}  // namespace lasercut

#endif // LASERCUT_SVG_PATH_BUILDER_HPP
