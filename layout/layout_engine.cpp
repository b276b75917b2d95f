#include "layout_engine.hpp"
#include "axis_alignment.hpp"
#include <common/number_format.hpp>
#include <svg/path_builder.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <optional>

namespace lasercut {

namespace {

constexpr double DEGENERATE_LENGTH = 1e-10;

std::vector<Vec3> start_points(const std::vector<Segment3D>& segments) {
    std::vector<Vec3> points;
    points.reserve(segments.size());
    for (const auto& s : segments) {
        points.push_back(segment_start(s));
    }
    return points;
}

std::vector<Vec2> start_points(const std::vector<Segment2D>& segments) {
    std::vector<Vec2> points;
    points.reserve(segments.size());
    for (const auto& s : segments) {
        points.push_back(segment_start(s));
    }
    return points;
}

std::vector<Segment2D> project_all(const std::vector<Segment3D>& segments, const Frame& frame) {
    std::vector<Segment2D> projected;
    projected.reserve(segments.size());
    for (const auto& s : segments) {
        projected.push_back(project_to_2d(s, frame));
    }
    return projected;
}

template <typename Transform>
void transform_all(std::vector<Segment2D>& outer, std::vector<std::vector<Segment2D>>& holes,
                   Transform transform) {
    for (auto& s : outer) {
        s = transform(s);
    }
    for (auto& hole : holes) {
        for (auto& s : hole) {
            s = transform(s);
        }
    }
}

struct FaceCandidate {
    FaceLoops loops;
    double area = 0.0;
};

}  // namespace

Frame build_projection_frame(const std::vector<Vec3>& points) {
    if (points.size() < 3) {
        return Frame{};
    }

    const Vec3& p0 = points[0];
    Vec3 first_edge = points[1] - p0;
    Vec3 second_edge = points[2] - p0;

    Vec3 normal = first_edge.cross(second_edge);
    if (first_edge.length() < DEGENERATE_LENGTH || normal.length() < DEGENERATE_LENGTH) {
        return Frame{p0, vec3::unit_x(), vec3::unit_y()};
    }

    Frame frame;
    frame.origin = p0;
    frame.u = first_edge.normalized();
    frame.v = normal.normalized().cross(frame.u).normalized();
    return frame;
}

double projected_area(const std::vector<Vec3>& points) {
    if (points.size() < 3) {
        return 0.0;
    }
    Frame frame = build_projection_frame(points);

    double twice_area = 0.0;
    size_t n = points.size();
    for (size_t i = 0; i < n; ++i) {
        Vec2 a = frame.project(points[i]);
        Vec2 b = frame.project(points[(i + 1) % n]);
        twice_area += a.cross(b);
    }
    return std::abs(twice_area) / 2.0;
}

LayoutEngine::LayoutEngine(const TopologyResolver& resolver, const ProcessingOptions& options)
    : resolver_(resolver), options_(options) {}

SolidLayoutResult LayoutEngine::layout_solid(const SolidFaces& solid) const {
    SolidLayoutResult result;
    result.group.id = solid.name;
    auto debug = [&result](std::string text) {
        result.messages.push_back({std::move(text), true});
    };

    // 1. Largest planar face
    std::optional<FaceCandidate> best;
    for (FaceId face : solid.faces) {
        if (!resolver_.is_planar(face)) {
            continue;
        }
        FaceLoops loops = resolver_.extract_face_loops_as_segments(face);
        if (loops.outer.size() < 2) {
            continue;
        }
        double area = projected_area(start_points(loops.outer));
        debug("[FACE] " + solid.name + ": Planar face with " + std::to_string(loops.outer.size()) +
              " segments, area=" + format_fixed(area, 1));
        if (area > 0.0 && (!best || area > best->area)) {
            best = FaceCandidate{std::move(loops), area};
        }
    }

    if (!best) {
        debug("[" + solid.name + "] No valid planar face found");
        return result;
    }
    result.face_found = true;

    // 2-3. Project into the face's own plane
    Frame frame = build_projection_frame(start_points(best->loops.outer));
    std::vector<Segment2D> outer = project_all(best->loops.outer, frame);
    std::vector<std::vector<Segment2D>> holes;
    holes.reserve(best->loops.holes.size());
    for (const auto& hole : best->loops.holes) {
        holes.push_back(project_all(hole, frame));
    }

    // 4. Straighten a dominant diagonal
    std::vector<Vec2> outline = start_points(outer);
    double angle = compute_axis_alignment_angle(outline, options_.alignment);
    if (std::abs(angle) > MIN_ALIGNMENT_ROTATION) {
        debug("[ALIGN] " + solid.name + ": Rotating by " + format_fixed(angle * 180.0 / std::numbers::pi, 1) +
              " degrees for axis alignment");
        Vec2 center;
        for (const auto& p : outline) {
            center = center + p;
        }
        center = center / static_cast<double>(outline.size());
        transform_all(outer, holes, [&](const Segment2D& s) { return rotate(s, angle, center.x, center.y); });
    }

    // 5. Move the outline's lower-left corner to the origin
    outline = start_points(outer);
    double min_x = outline.front().x;
    double min_y = outline.front().y;
    for (const auto& p : outline) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
    }
    transform_all(outer, holes, [&](const Segment2D& s) { return translate(s, -min_x, -min_y); });

    // 6. Emit
    result.group.paths.push_back({build_path_from_segments_as_curves(outer), OUTLINE_STROKE, CUT_STROKE_WIDTH, "none"});
    debug("[SVG] " + solid.name + ": Generated outline from " + std::to_string(outer.size()) + " curve segments");

    for (const auto& hole : holes) {
        if (hole.empty()) {
            continue;
        }
        std::string d = build_path_from_segments_as_curves(hole);
        if (d.empty()) {
            continue;
        }
        result.group.paths.push_back({d, HOLE_STROKE, CUT_STROKE_WIDTH, "none"});
        debug("[SVG] " + solid.name + ": Generated hole from " + std::to_string(hole.size()) + " curve segments");
    }

    return result;
}

}  // namespace lasercut
