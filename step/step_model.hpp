#ifndef LASERCUT_STEP_STEP_MODEL_HPP
#define LASERCUT_STEP_STEP_MODEL_HPP

#include "entity.hpp"
#include <curve/curve.hpp>
#include <math/vec3.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lasercut {
namespace step {

enum class SurfaceKind {
    Plane,
    Cylinder,
    Cone,
    Sphere,
    Torus,
    BSpline,
    Other,
    Missing   // face geometry reference did not resolve
};

const char* surface_kind_name(SurfaceKind kind);

// EDGE_CURVE
struct Edge {
    std::optional<EntityId> start_vertex;
    std::optional<EntityId> end_vertex;
    std::optional<EntityId> curve;
    bool same_sense = true;
};

// ORIENTED_EDGE
struct OrientedEdge {
    std::optional<EntityId> edge;
    bool orientation = true;
};

// EDGE_LOOP, oriented edge ids in loop order
struct EdgeLoop {
    std::vector<EntityId> edges;
};

// FACE_BOUND / FACE_OUTER_BOUND
struct FaceBound {
    std::optional<EntityId> loop;
    bool orientation = true;
    bool outer = false;
};

// ADVANCED_FACE / FACE_SURFACE
struct Face {
    std::string name;
    std::vector<EntityId> bounds;
    SurfaceKind surface = SurfaceKind::Missing;
    bool same_sense = true;
};

// MANIFOLD_SOLID_BREP / BREP_WITH_VOIDS
struct Solid {
    EntityId id = 0;
    std::string name;
    std::vector<EntityId> faces;  // faces of the outer shell
};

// Typed view of the B-Rep entities in a STEP data section.
//
// Records are addressed by entity id. Lookups of ids that are missing or
// refer to an entity of the wrong type return nullptr / nullopt.
class StepModel {
public:
    static StepModel build(const EntityTable& table);

    std::optional<Vec3> point(EntityId id) const;
    std::optional<Vec3> vertex_location(EntityId id) const;
    const Curve* curve(EntityId id) const;
    const Edge* edge(EntityId id) const;
    const OrientedEdge* oriented_edge(EntityId id) const;
    const EdgeLoop* loop(EntityId id) const;
    const FaceBound* bound(EntityId id) const;
    const Face* face(EntityId id) const;

    // Solids in entity id order
    const std::vector<Solid>& solids() const { return solids_; }

    // ADVANCED_FACE ids in entity id order
    const std::vector<EntityId>& advanced_faces() const { return advanced_faces_; }

    // Number of entity instances in the source data section
    size_t entity_count() const { return entity_count_; }

private:
    std::map<EntityId, Vec3> points_;
    std::map<EntityId, Vec3> directions_;
    std::map<EntityId, Placement> placements_;
    std::map<EntityId, std::optional<Vec3>> vertices_;
    std::map<EntityId, Curve> curves_;
    std::map<EntityId, Edge> edges_;
    std::map<EntityId, OrientedEdge> oriented_edges_;
    std::map<EntityId, EdgeLoop> loops_;
    std::map<EntityId, FaceBound> bounds_;
    std::map<EntityId, Face> faces_;
    std::map<EntityId, std::vector<EntityId>> shells_;
    std::vector<Solid> solids_;
    std::vector<EntityId> advanced_faces_;
    size_t entity_count_ = 0;

    friend class ModelBuilder;
};

}  // namespace step
}  // namespace lasercut

#endif // LASERCUT_STEP_STEP_MODEL_HPP
