#include "step_model.hpp"
#include <common/logging.hpp>
#include <cmath>
#include <functional>

namespace lasercut {
namespace step {

const char* surface_kind_name(SurfaceKind kind) {
    switch (kind) {
        case SurfaceKind::Plane: return "plane";
        case SurfaceKind::Cylinder: return "cylinder";
        case SurfaceKind::Cone: return "cone";
        case SurfaceKind::Sphere: return "sphere";
        case SurfaceKind::Torus: return "torus";
        case SurfaceKind::BSpline: return "bspline";
        case SurfaceKind::Other: return "other";
        case SurfaceKind::Missing: return "missing";
    }
    return "other";
}

namespace {

// Nesting limit for curve wrappers (SURFACE_CURVE -> TRIMMED_CURVE -> ...)
constexpr int MAX_CURVE_DEPTH = 8;

// Largest B-spline degree or knot multiplicity taken from a file
constexpr int MAX_SPLINE_COUNT = 1 << 16;

// Non-negative whole numbers up to MAX_SPLINE_COUNT; anything else is unresolved
std::optional<int> spline_count(double value) {
    if (!(value >= 0.0 && value <= MAX_SPLINE_COUNT) || std::floor(value) != value) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

const Parameter* param_at(const std::vector<Parameter>& params, size_t index) {
    return index < params.size() ? &params[index] : nullptr;
}

std::optional<EntityId> ref_at(const std::vector<Parameter>& params, size_t index) {
    const Parameter* p = param_at(params, index);
    if (p && p->is_reference()) {
        return p->ref;
    }
    return std::nullopt;
}

// Plain numbers and typed measures such as POSITIVE_LENGTH_MEASURE(5.)
std::optional<double> number_at(const std::vector<Parameter>& params, size_t index) {
    const Parameter* p = param_at(params, index);
    if (!p) return std::nullopt;
    if (p->is_number()) return p->number;
    if (p->kind == Parameter::Kind::Typed && p->items.size() == 1 && p->items[0].is_number()) {
        return p->items[0].number;
    }
    return std::nullopt;
}

bool logical_at(const std::vector<Parameter>& params, size_t index, bool fallback) {
    const Parameter* p = param_at(params, index);
    if (p && p->kind == Parameter::Kind::Enumeration) {
        if (p->text == "T") return true;
        if (p->text == "F") return false;
    }
    return fallback;
}

std::string string_at(const std::vector<Parameter>& params, size_t index) {
    const Parameter* p = param_at(params, index);
    if (p && p->kind == Parameter::Kind::String) {
        return p->text;
    }
    return "";
}

std::vector<EntityId> refs_in_list(const std::vector<Parameter>& params, size_t index) {
    std::vector<EntityId> refs;
    const Parameter* p = param_at(params, index);
    if (p && p->is_list()) {
        for (const auto& item : p->items) {
            if (item.is_reference()) {
                refs.push_back(item.ref);
            }
        }
    }
    return refs;
}

// (x, y[, z]) coordinate list; 2D points get z = 0
std::optional<Vec3> coordinates_at(const std::vector<Parameter>& params, size_t index) {
    const Parameter* p = param_at(params, index);
    if (!p || !p->is_list() || p->items.size() < 2) {
        return std::nullopt;
    }
    double c[3] = {0.0, 0.0, 0.0};
    for (size_t i = 0; i < p->items.size() && i < 3; ++i) {
        if (!p->items[i].is_number()) {
            return std::nullopt;
        }
        c[i] = p->items[i].number;
    }
    return Vec3{c[0], c[1], c[2]};
}

bool is_unsupported_curve_type(const std::string& type) {
    return type.find("CURVE") != std::string::npos || type == "POLYLINE" ||
           type == "HYPERBOLA" || type == "PARABOLA";
}

SurfaceKind surface_kind_of(const EntityRecord* record) {
    if (!record) return SurfaceKind::Missing;
    if (record->is_complex()) {
        return record->find_part("B_SPLINE_SURFACE") ? SurfaceKind::BSpline : SurfaceKind::Other;
    }
    const std::string& type = record->type();
    if (type == "PLANE") return SurfaceKind::Plane;
    if (type == "CYLINDRICAL_SURFACE") return SurfaceKind::Cylinder;
    if (type == "CONICAL_SURFACE") return SurfaceKind::Cone;
    if (type == "SPHERICAL_SURFACE") return SurfaceKind::Sphere;
    if (type == "TOROIDAL_SURFACE" || type == "DEGENERATE_TOROIDAL_SURFACE") return SurfaceKind::Torus;
    if (type == "B_SPLINE_SURFACE_WITH_KNOTS" || type == "B_SPLINE_SURFACE" ||
        type == "BEZIER_SURFACE") {
        return SurfaceKind::BSpline;
    }
    return SurfaceKind::Other;
}

}  // namespace

// Converts an EntityTable into a StepModel, one entity family per pass so
// every reference can be checked against the records it must point to.
class ModelBuilder {
public:
    ModelBuilder(const EntityTable& table, StepModel& model) : table_(table), model_(model) {}

    void run() {
        model_.entity_count_ = table_.size();
        for_each_simple({"CARTESIAN_POINT"}, [this](EntityId id, const EntityPart& part) {
            if (auto c = coordinates_at(part.params, 1)) model_.points_[id] = *c;
            else note_unresolved(id, "coordinates");
        });
        for_each_simple({"DIRECTION"}, [this](EntityId id, const EntityPart& part) {
            if (auto c = coordinates_at(part.params, 1)) model_.directions_[id] = *c;
            else note_unresolved(id, "direction ratios");
        });
        for_each_simple({"AXIS2_PLACEMENT_3D"}, [this](EntityId id, const EntityPart& part) {
            Placement placement;
            placement.location = lookup(model_.points_, ref_at(part.params, 1));
            placement.axis = lookup(model_.directions_, ref_at(part.params, 2));
            placement.ref_direction = lookup(model_.directions_, ref_at(part.params, 3));
            model_.placements_[id] = placement;
        });
        for_each_simple({"VERTEX_POINT"}, [this](EntityId id, const EntityPart& part) {
            auto location = lookup(model_.points_, ref_at(part.params, 1));
            if (!location) note_unresolved(id, "vertex point");
            model_.vertices_[id] = location;
        });
        for_each_simple({"EDGE_CURVE"}, [this](EntityId id, const EntityPart& part) {
            Edge edge;
            edge.start_vertex = existing(model_.vertices_, ref_at(part.params, 1));
            edge.end_vertex = existing(model_.vertices_, ref_at(part.params, 2));
            if (auto curve_id = ref_at(part.params, 3)) {
                if (auto curve = resolve_curve(*curve_id, 0)) {
                    model_.curves_[*curve_id] = std::move(*curve);
                    edge.curve = curve_id;
                } else {
                    note_unresolved(id, "edge geometry");
                }
            }
            edge.same_sense = logical_at(part.params, 4, true);
            model_.edges_[id] = edge;
        });
        for_each_simple({"ORIENTED_EDGE"}, [this](EntityId id, const EntityPart& part) {
            OrientedEdge oriented;
            oriented.edge = existing(model_.edges_, ref_at(part.params, 3));
            if (!oriented.edge) note_unresolved(id, "edge element");
            oriented.orientation = logical_at(part.params, 4, true);
            model_.oriented_edges_[id] = oriented;
        });
        for_each_simple({"EDGE_LOOP"}, [this](EntityId id, const EntityPart& part) {
            EdgeLoop loop;
            for (EntityId edge_id : refs_in_list(part.params, 1)) {
                if (model_.oriented_edges_.count(edge_id)) loop.edges.push_back(edge_id);
                else note_unresolved(id, "oriented edge");
            }
            model_.loops_[id] = std::move(loop);
        });
        for_each_simple({"FACE_BOUND", "FACE_OUTER_BOUND"}, [this](EntityId id, const EntityPart& part) {
            FaceBound bound;
            bound.loop = existing(model_.loops_, ref_at(part.params, 1));
            bound.orientation = logical_at(part.params, 2, true);
            bound.outer = part.type == "FACE_OUTER_BOUND";
            model_.bounds_[id] = bound;
        });
        for_each_simple({"ADVANCED_FACE", "FACE_SURFACE"}, [this](EntityId id, const EntityPart& part) {
            Face face;
            face.name = string_at(part.params, 0);
            for (EntityId bound_id : refs_in_list(part.params, 1)) {
                if (model_.bounds_.count(bound_id)) face.bounds.push_back(bound_id);
                else note_unresolved(id, "face bound");
            }
            auto surface_id = ref_at(part.params, 2);
            face.surface = surface_kind_of(surface_id ? table_.find(*surface_id) : nullptr);
            face.same_sense = logical_at(part.params, 3, true);
            model_.faces_[id] = std::move(face);
            if (part.type == "ADVANCED_FACE") {
                model_.advanced_faces_.push_back(id);
            }
        });
        for_each_simple({"CLOSED_SHELL", "OPEN_SHELL"}, [this](EntityId id, const EntityPart& part) {
            std::vector<EntityId> faces;
            for (EntityId face_id : refs_in_list(part.params, 1)) {
                if (model_.faces_.count(face_id)) faces.push_back(face_id);
                else note_unresolved(id, "shell face");
            }
            model_.shells_[id] = std::move(faces);
        });
        for_each_simple({"MANIFOLD_SOLID_BREP", "BREP_WITH_VOIDS"}, [this](EntityId id, const EntityPart& part) {
            Solid solid;
            solid.id = id;
            solid.name = string_at(part.params, 0);
            auto shell_id = ref_at(part.params, 1);
            if (shell_id && model_.shells_.count(*shell_id)) {
                solid.faces = model_.shells_.at(*shell_id);
            } else {
                note_unresolved(id, "outer shell");
            }
            model_.solids_.push_back(std::move(solid));
        });

        if (unresolved_ > 0) {
            logging::get_logger()->debug("[MODEL] {} unresolved references ignored", unresolved_);
        }
    }

private:
    const EntityTable& table_;
    StepModel& model_;
    size_t unresolved_ = 0;

    using PartVisitor = std::function<void(EntityId, const EntityPart&)>;

    void for_each_simple(std::initializer_list<const char*> types, const PartVisitor& visit) {
        for (const auto& [id, record] : table_.entities) {
            if (record.is_complex()) continue;
            for (const char* type : types) {
                if (record.type() == type) {
                    visit(id, record.parts.front());
                    break;
                }
            }
        }
    }

    template <typename T>
    static std::optional<T> lookup(const std::map<EntityId, T>& records, std::optional<EntityId> id) {
        if (!id) return std::nullopt;
        auto it = records.find(*id);
        if (it == records.end()) return std::nullopt;
        return it->second;
    }

    template <typename T>
    static std::optional<EntityId> existing(const std::map<EntityId, T>& records, std::optional<EntityId> id) {
        if (id && records.count(*id)) return id;
        return std::nullopt;
    }

    void note_unresolved(EntityId id, const char* what) {
        ++unresolved_;
        logging::get_logger()->trace("[MODEL] #{}: unresolved {}", id, what);
    }

    std::optional<Placement> placement_at(const std::vector<Parameter>& params, size_t index) const {
        return lookup(model_.placements_, ref_at(params, index));
    }

    std::optional<Curve> resolve_curve(EntityId id, int depth) {
        const EntityRecord* record = table_.find(id);
        if (!record || depth > MAX_CURVE_DEPTH) {
            return std::nullopt;
        }

        if (record->is_complex()) {
            return resolve_complex_curve(*record);
        }

        const std::string& type = record->type();
        const auto& params = record->parts.front().params;

        if (type == "LINE") {
            curve::Line line;
            line.point = lookup(model_.points_, ref_at(params, 1));
            if (auto vector_id = ref_at(params, 2)) {
                if (const EntityRecord* vector = table_.find(*vector_id);
                    vector && vector->type() == "VECTOR") {
                    line.direction = lookup(model_.directions_, ref_at(vector->parts.front().params, 1));
                }
            }
            return line;
        }
        if (type == "CIRCLE") {
            curve::Circle circle;
            circle.position = placement_at(params, 1);
            circle.radius = number_at(params, 2).value_or(0.0);
            return circle;
        }
        if (type == "ELLIPSE") {
            curve::Ellipse ellipse;
            ellipse.position = placement_at(params, 1);
            ellipse.semi_axis_1 = number_at(params, 2).value_or(0.0);
            ellipse.semi_axis_2 = number_at(params, 3).value_or(0.0);
            return ellipse;
        }
        if (type == "B_SPLINE_CURVE_WITH_KNOTS") {
            curve::BSpline spline;
            read_bspline_header(params, 1, spline);
            read_bspline_knots(params, 6, spline);
            return spline;
        }
        if (type == "SURFACE_CURVE" || type == "SEAM_CURVE" || type == "TRIMMED_CURVE") {
            auto basis = ref_at(params, 1);
            return basis ? resolve_curve(*basis, depth + 1) : std::nullopt;
        }
        if (is_unsupported_curve_type(type)) {
            return curve::Unknown{type};
        }
        return std::nullopt;
    }

    // (B_SPLINE_CURVE(...) B_SPLINE_CURVE_WITH_KNOTS(...) RATIONAL_B_SPLINE_CURVE(...) ...)
    std::optional<Curve> resolve_complex_curve(const EntityRecord& record) {
        const EntityPart* header = record.find_part("B_SPLINE_CURVE");
        const EntityPart* knots = record.find_part("B_SPLINE_CURVE_WITH_KNOTS");
        if (header && knots) {
            curve::BSpline spline;
            read_bspline_header(header->params, 0, spline);
            read_bspline_knots(knots->params, 0, spline);
            spline.rational = record.find_part("RATIONAL_B_SPLINE_CURVE") != nullptr;
            return spline;
        }
        if (header) {
            return curve::Unknown{"B_SPLINE_CURVE"};
        }
        return std::nullopt;
    }

    // degree, control point list
    void read_bspline_header(const std::vector<Parameter>& params, size_t first, curve::BSpline& spline) {
        // An unusable degree leaves the spline unevaluable
        auto degree = number_at(params, first);
        spline.degree = degree ? spline_count(*degree).value_or(-1) : -1;
        for (EntityId point_id : refs_in_list(params, first + 1)) {
            // Unresolved control points stand at the origin
            spline.control_points.push_back(lookup(model_.points_, point_id).value_or(vec3::zero()));
        }
    }

    // knot multiplicities, knot values
    void read_bspline_knots(const std::vector<Parameter>& params, size_t first, curve::BSpline& spline) {
        if (const Parameter* mults = param_at(params, first); mults && mults->is_list()) {
            for (const auto& m : mults->items) {
                auto count = m.is_number() ? spline_count(m.number) : std::nullopt;
                if (!count) {
                    // Knot values cannot be matched to multiplicities any more
                    spline.knot_multiplicities.clear();
                    break;
                }
                spline.knot_multiplicities.push_back(*count);
            }
        }
        if (const Parameter* knots = param_at(params, first + 1); knots && knots->is_list()) {
            for (const auto& k : knots->items) {
                if (k.is_number()) spline.knots.push_back(k.number);
            }
        }
    }
};

StepModel StepModel::build(const EntityTable& table) {
    StepModel model;
    ModelBuilder builder(table, model);
    builder.run();
    return model;
}

std::optional<Vec3> StepModel::point(EntityId id) const {
    auto it = points_.find(id);
    if (it == points_.end()) return std::nullopt;
    return it->second;
}

std::optional<Vec3> StepModel::vertex_location(EntityId id) const {
    auto it = vertices_.find(id);
    if (it == vertices_.end()) return std::nullopt;
    return it->second;
}

const Curve* StepModel::curve(EntityId id) const {
    auto it = curves_.find(id);
    return it == curves_.end() ? nullptr : &it->second;
}

const Edge* StepModel::edge(EntityId id) const {
    auto it = edges_.find(id);
    return it == edges_.end() ? nullptr : &it->second;
}

const OrientedEdge* StepModel::oriented_edge(EntityId id) const {
    auto it = oriented_edges_.find(id);
    return it == oriented_edges_.end() ? nullptr : &it->second;
}

const EdgeLoop* StepModel::loop(EntityId id) const {
    auto it = loops_.find(id);
    return it == loops_.end() ? nullptr : &it->second;
}

const FaceBound* StepModel::bound(EntityId id) const {
    auto it = bounds_.find(id);
    return it == bounds_.end() ? nullptr : &it->second;
}

const Face* StepModel::face(EntityId id) const {
    auto it = faces_.find(id);
    return it == faces_.end() ? nullptr : &it->second;
}

}  // namespace step
}  // namespace lasercut
