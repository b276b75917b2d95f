#ifndef LASERCUT_TOPOLOGY_STEP_TOPOLOGY_RESOLVER_HPP
#define LASERCUT_TOPOLOGY_STEP_TOPOLOGY_RESOLVER_HPP

#include "topology_resolver.hpp"
#include <step/step_model.hpp>

namespace lasercut {

// Vertices closer than this (per axis, mm) are treated as the same point
constexpr double VERTEX_MERGE_TOLERANCE = 0.01;

// Face pairs whose centroid separation lies in this range are thin-pair candidates
constexpr double THIN_PAIR_MIN_SEPARATION = 2.0;
constexpr double THIN_PAIR_MAX_SEPARATION = 8.0;
// A detected pair up to this separation replaces the smallest extent
constexpr double THIN_PAIR_REPLACE_MAX_SEPARATION = 10.0;

// Faces per pseudo-solid when a file has faces but no solid entities
constexpr size_t FACES_PER_PSEUDO_SOLID = 6;

class StepTopologyResolver : public TopologyResolver {
public:
    explicit StepTopologyResolver(step::StepModel model);

    std::vector<SolidFaces> resolve_solids() const override;
    BoundingInfo extract_bounding_dimensions(const std::vector<FaceId>& faces) const override;
    FaceLoops extract_face_loops_as_segments(FaceId face) const override;
    bool is_planar(FaceId face) const override;

    const step::StepModel& model() const { return model_; }

    // Vertex locations of the face's outer loop, in loop order
    std::vector<Vec3> outer_loop_vertices(FaceId face) const;

    // Outer loop as a closed polyline, curved edges sampled with
    // samples_per_curve intervals. The closing point is not repeated.
    std::vector<Vec3> sample_outer_loop(FaceId face, int samples_per_curve) const;

    // Edges of all bounds of the face carrying circle, ellipse or spline geometry
    size_t curved_edge_count(FaceId face) const;

private:
    step::StepModel model_;

    std::optional<step::EntityId> outer_bound_id(const step::Face& face) const;
    const step::EdgeLoop* outer_loop(const step::Face& face) const;
    std::vector<Segment3D> loop_segments(const step::FaceBound& bound) const;

    // Edge endpoints and orientation presented in the curve's own direction
    struct EdgeTraversal {
        const Curve* curve = nullptr;
        std::optional<Vec3> start;
        std::optional<Vec3> end;
        bool orientation = true;
    };
    std::optional<EdgeTraversal> traversal(step::EntityId oriented_edge) const;
};

}  // namespace lasercut

#endif // LASERCUT_TOPOLOGY_STEP_TOPOLOGY_RESOLVER_HPP
