#include "step_topology_resolver.hpp"
#include <common/logging.hpp>
#include <curve/curve_evaluator.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>
#include <tuple>

namespace lasercut {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

Vec3 centroid(const std::vector<Vec3>& points) {
    Vec3 sum;
    for (const auto& p : points) {
        sum += p;
    }
    return sum / static_cast<double>(points.size());
}

// Closest well-aligned pair of face centroids
struct FacePair {
    size_t first = 0;
    size_t second = 0;
    double separation = std::numeric_limits<double>::max();
};

}  // namespace

StepTopologyResolver::StepTopologyResolver(step::StepModel model) : model_(std::move(model)) {}

std::vector<SolidFaces> StepTopologyResolver::resolve_solids() const {
    std::vector<SolidFaces> solids;

    for (const auto& solid : model_.solids()) {
        if (solid.faces.empty()) {
            continue;
        }
        std::string name = is_blank(solid.name) ? "Solid_" + std::to_string(solids.size()) : solid.name;
        solids.push_back({name, solid.faces});
    }
    if (!solids.empty()) {
        return solids;
    }

    const auto& faces = model_.advanced_faces();
    if (faces.empty()) {
        return solids;
    }

    logging::get_logger()->debug("[SOLID] No MANIFOLD_SOLID_BREP found. Creating pseudo-solids from {} faces.",
                                 faces.size());
    for (size_t start = 0; start < faces.size(); start += FACES_PER_PSEUDO_SOLID) {
        size_t end = std::min(start + FACES_PER_PSEUDO_SOLID, faces.size());
        SolidFaces solid;
        solid.name = "Solid" + std::to_string(start / FACES_PER_PSEUDO_SOLID + 1);
        solid.faces.assign(faces.begin() + start, faces.begin() + end);
        solids.push_back(std::move(solid));
    }
    return solids;
}

std::vector<Vec3> StepTopologyResolver::outer_loop_vertices(FaceId face_id) const {
    std::vector<Vec3> vertices;
    const step::Face* face = model_.face(face_id);
    if (!face) {
        return vertices;
    }
    const step::EdgeLoop* loop = outer_loop(*face);
    if (!loop) {
        return vertices;
    }

    for (step::EntityId oriented_id : loop->edges) {
        const step::OrientedEdge* oriented = model_.oriented_edge(oriented_id);
        const step::Edge* edge = oriented && oriented->edge ? model_.edge(*oriented->edge) : nullptr;
        if (!edge) {
            continue;
        }
        auto vertex_id = oriented->orientation ? edge->start_vertex : edge->end_vertex;
        if (vertex_id) {
            if (auto location = model_.vertex_location(*vertex_id)) {
                vertices.push_back(*location);
            }
        }
    }
    return vertices;
}

BoundingInfo StepTopologyResolver::extract_bounding_dimensions(const std::vector<FaceId>& faces) const {
    auto log = logging::get_logger();
    BoundingInfo info;

    std::vector<std::vector<Vec3>> face_vertices;
    for (FaceId face : faces) {
        auto vertices = outer_loop_vertices(face);
        if (!vertices.empty()) {
            face_vertices.push_back(std::move(vertices));
        }
    }

    // Thin face pair: closest pair of centroids separated along one dominant axis
    FacePair thin_pair;
    FacePair loose_pair;
    for (size_t i = 0; i < face_vertices.size(); ++i) {
        Vec3 ci = centroid(face_vertices[i]);
        for (size_t j = i + 1; j < face_vertices.size(); ++j) {
            Vec3 d = centroid(face_vertices[j]) - ci;
            double separation = d.length();
            double max_component = std::max({std::abs(d.x), std::abs(d.y), std::abs(d.z)});
            double alignment = max_component / (separation + 1e-6);

            if (separation >= THIN_PAIR_MIN_SEPARATION && separation <= THIN_PAIR_MAX_SEPARATION &&
                alignment > 0.85 && separation < thin_pair.separation) {
                thin_pair = {i, j, separation};
            }
            if (alignment > 0.80 && separation < loose_pair.separation) {
                loose_pair = {i, j, separation};
            }
        }
    }
    const FacePair& chosen = thin_pair.separation < std::numeric_limits<double>::max() ? thin_pair : loose_pair;
    if (chosen.separation < std::numeric_limits<double>::max()) {
        info.thin_pair_separation = chosen.separation;
        log->debug("[TOPO] Found pair of faces with separation: {:.1f}mm", chosen.separation);
    }

    // Deduplicate on a 0.01mm grid, keeping first occurrences in face order
    std::set<std::tuple<long long, long long, long long>> seen;
    for (const auto& vertices : face_vertices) {
        for (const auto& v : vertices) {
            auto key = std::make_tuple(std::llround(v.x / VERTEX_MERGE_TOLERANCE),
                                       std::llround(v.y / VERTEX_MERGE_TOLERANCE),
                                       std::llround(v.z / VERTEX_MERGE_TOLERANCE));
            if (seen.insert(key).second) {
                info.vertices.push_back(v);
            }
        }
    }

    if (!info.vertices.empty()) {
        Vec3 min_corner = info.vertices.front();
        Vec3 max_corner = info.vertices.front();
        for (const auto& v : info.vertices) {
            min_corner = {std::min(min_corner.x, v.x), std::min(min_corner.y, v.y), std::min(min_corner.z, v.z)};
            max_corner = {std::max(max_corner.x, v.x), std::max(max_corner.y, v.y), std::max(max_corner.z, v.z)};
        }
        info.width = max_corner.x - min_corner.x;
        info.height = max_corner.y - min_corner.y;
        info.depth = max_corner.z - min_corner.z;
        log->debug("[TOPO] Computed dimensions: {:.1f} x {:.1f} x {:.1f} from {} unique vertices",
                   info.width, info.height, info.depth, info.vertices.size());
    }

    // Rotated plates have no axis-aligned thin extent; trust the face pair instead
    if (info.thin_pair_separation && *info.thin_pair_separation >= THIN_PAIR_MIN_SEPARATION &&
        *info.thin_pair_separation <= THIN_PAIR_REPLACE_MAX_SEPARATION) {
        double* extents[3] = {&info.width, &info.height, &info.depth};
        double** smallest = std::min_element(std::begin(extents), std::end(extents),
                                             [](double* a, double* b) { return *a < *b; });
        **smallest = *info.thin_pair_separation;
        log->debug("[TOPO] Adjusted dimensions: {:.1f} x {:.1f} x {:.1f}", info.width, info.height, info.depth);
    }

    return info;
}

std::optional<step::EntityId> StepTopologyResolver::outer_bound_id(const step::Face& face) const {
    for (step::EntityId id : face.bounds) {
        const step::FaceBound* bound = model_.bound(id);
        if (bound && bound->outer) {
            return id;
        }
    }
    if (!face.bounds.empty()) {
        return face.bounds.front();
    }
    return std::nullopt;
}

const step::EdgeLoop* StepTopologyResolver::outer_loop(const step::Face& face) const {
    auto bound_id = outer_bound_id(face);
    const step::FaceBound* bound = bound_id ? model_.bound(*bound_id) : nullptr;
    return bound && bound->loop ? model_.loop(*bound->loop) : nullptr;
}

std::optional<StepTopologyResolver::EdgeTraversal> StepTopologyResolver::traversal(
    step::EntityId oriented_edge) const {
    const step::OrientedEdge* oriented = model_.oriented_edge(oriented_edge);
    const step::Edge* edge = oriented && oriented->edge ? model_.edge(*oriented->edge) : nullptr;
    if (!edge) {
        return std::nullopt;
    }

    EdgeTraversal t;
    t.curve = edge->curve ? model_.curve(*edge->curve) : nullptr;
    t.start = edge->start_vertex ? model_.vertex_location(*edge->start_vertex) : std::nullopt;
    t.end = edge->end_vertex ? model_.vertex_location(*edge->end_vertex) : std::nullopt;
    t.orientation = oriented->orientation;
    // Curve parameterised against the edge: present it in curve order
    if (!edge->same_sense) {
        std::swap(t.start, t.end);
        t.orientation = !t.orientation;
    }
    return t;
}

std::vector<Segment3D> StepTopologyResolver::loop_segments(const step::FaceBound& bound) const {
    std::vector<Segment3D> segments;
    const step::EdgeLoop* loop = bound.loop ? model_.loop(*bound.loop) : nullptr;
    if (!loop) {
        return segments;
    }

    for (step::EntityId oriented_id : loop->edges) {
        if (auto edge = traversal(oriented_id)) {
            segments.push_back(extract_segment(edge->curve, edge->start, edge->end, edge->orientation));
        }
    }

    if (!bound.orientation) {
        std::reverse(segments.begin(), segments.end());
        for (auto& segment : segments) {
            segment = reversed(segment);
        }
    }
    return segments;
}

FaceLoops StepTopologyResolver::extract_face_loops_as_segments(FaceId face_id) const {
    FaceLoops loops;
    const step::Face* face = model_.face(face_id);
    if (!face) {
        return loops;
    }

    auto outer_id = outer_bound_id(*face);
    for (step::EntityId id : face->bounds) {
        const step::FaceBound* bound = model_.bound(id);
        if (!bound) {
            continue;
        }
        auto segments = loop_segments(*bound);
        if (outer_id && id == *outer_id) {
            loops.outer = std::move(segments);
        } else if (!segments.empty()) {
            loops.holes.push_back(std::move(segments));
        }
    }
    return loops;
}

std::vector<Vec3> StepTopologyResolver::sample_outer_loop(FaceId face_id, int samples_per_curve) const {
    std::vector<Vec3> points;
    const step::Face* face = model_.face(face_id);
    const step::EdgeLoop* loop = face ? outer_loop(*face) : nullptr;
    if (!loop) {
        return points;
    }

    for (step::EntityId oriented_id : loop->edges) {
        auto edge = traversal(oriented_id);
        if (!edge) {
            continue;
        }
        for (const auto& p : sample_curve(edge->curve, edge->start, edge->end, edge->orientation,
                                          samples_per_curve)) {
            if (points.empty() || points.back().distance_to(p) > 1e-9) {
                points.push_back(p);
            }
        }
    }
    if (points.size() > 1 && points.front().distance_to(points.back()) <= 1e-9) {
        points.pop_back();
    }
    return points;
}

size_t StepTopologyResolver::curved_edge_count(FaceId face_id) const {
    size_t count = 0;
    const step::Face* face = model_.face(face_id);
    if (!face) {
        return count;
    }
    for (step::EntityId bound_id : face->bounds) {
        const step::FaceBound* bound = model_.bound(bound_id);
        const step::EdgeLoop* loop = bound && bound->loop ? model_.loop(*bound->loop) : nullptr;
        if (!loop) {
            continue;
        }
        for (step::EntityId oriented_id : loop->edges) {
            auto edge = traversal(oriented_id);
            if (edge && is_curved_geometry(edge->curve)) {
                ++count;
            }
        }
    }
    return count;
}

bool StepTopologyResolver::is_planar(FaceId face_id) const {
    const step::Face* face = model_.face(face_id);
    return face && face->surface == step::SurfaceKind::Plane;
}

}  // namespace lasercut
