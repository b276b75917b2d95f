#include "path_builder.hpp"
#include <common/number_format.hpp>
#include <cmath>
#include <sstream>

namespace lasercut {

namespace {

template <typename CommandFn>
std::string build_path(const std::vector<Segment2D>& segments, CommandFn command) {
    if (segments.empty()) {
        return "";
    }

    Vec2 first = segment_start(segments.front());
    std::ostringstream ss;
    ss << "M " << format_pair(first.x, first.y);
    for (const auto& segment : segments) {
        ss << " " << command(segment);
    }

    Vec2 last = segment_end(segments.back());
    if (std::abs(last.x - first.x) > PATH_CLOSE_TOLERANCE ||
        std::abs(last.y - first.y) > PATH_CLOSE_TOLERANCE) {
        ss << " Z";
    }
    return ss.str();
}

}  // namespace

std::string build_path_from_segments(const std::vector<Segment2D>& segments) {
    return build_path(segments, [](const Segment2D& s) { return to_path_command(s); });
}

std::string build_path_from_segments_as_curves(const std::vector<Segment2D>& segments) {
    return build_path(segments, [](const Segment2D& s) { return to_arc_path_command(s); });
}

}  // namespace lasercut
