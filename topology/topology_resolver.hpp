#ifndef LASERCUT_TOPOLOGY_TOPOLOGY_RESOLVER_HPP
#define LASERCUT_TOPOLOGY_TOPOLOGY_RESOLVER_HPP

#include <math/vec3.hpp>
#include <segment/segment.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lasercut {

using FaceId = uint64_t;

// A solid body and the faces of its outer shell
struct SolidFaces {
    std::string name;
    std::vector<FaceId> faces;
};

struct BoundingInfo {
    std::vector<Vec3> vertices;  // deduplicated outer-loop vertices
    double width = 0.0;          // x extent
    double height = 0.0;         // y extent
    double depth = 0.0;          // z extent
    // Centroid separation of the detected thin face pair, if any
    std::optional<double> thin_pair_separation;
};

// Boundary loops of one face, each an ordered list of segments
struct FaceLoops {
    std::vector<Segment3D> outer;
    std::vector<std::vector<Segment3D>> holes;
};

// Read-only access to the B-Rep topology of a model.
// Faces are referred to by id; implementations own the underlying model.
class TopologyResolver {
public:
    virtual ~TopologyResolver() = default;

    // All solids in model order
    virtual std::vector<SolidFaces> resolve_solids() const = 0;

    // Extents of a set of faces, with thin-pair correction for rotated plates
    virtual BoundingInfo extract_bounding_dimensions(const std::vector<FaceId>& faces) const = 0;

    virtual FaceLoops extract_face_loops_as_segments(FaceId face) const = 0;

    // True when the face lies on a PLANE surface
    virtual bool is_planar(FaceId face) const = 0;
};

}  // namespace lasercut

#endif // LASERCUT_TOPOLOGY_TOPOLOGY_RESOLVER_HPP
