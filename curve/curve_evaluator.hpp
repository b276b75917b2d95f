#ifndef LASERCUT_CURVE_CURVE_EVALUATOR_HPP
#define LASERCUT_CURVE_CURVE_EVALUATOR_HPP

#include "curve.hpp"
#include <segment/segment.hpp>
#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

namespace lasercut {

// Build the exact boundary segment for an edge.
//
// curve may be null. start_vertex/end_vertex are the edge vertex locations
// (nullopt when the vertex or its point could not be resolved). When
// orientation is false the edge is traversed from end_vertex to start_vertex.
// Circles with a 3D placement become Arc3D; everything else becomes Line3D.
// Never throws.
Segment3D extract_segment(const Curve* curve,
                          const std::optional<Vec3>& start_vertex,
                          const std::optional<Vec3>& end_vertex,
                          bool orientation);

// Sample a curve into 3D points. Circles and ellipses are sampled over the
// arc between the vertices, B-splines over their whole knot domain, lines
// yield only their start point. The result is reversed when orientation is false.
std::vector<Vec3> sample_curve(const Curve* curve,
                               const std::optional<Vec3>& start_vertex,
                               const std::optional<Vec3>& end_vertex,
                               bool orientation,
                               int samples_per_curve = 32);

// True for circles, ellipses and B-splines
bool is_curved_geometry(const Curve* curve);

// ============================================================
// B-spline helpers
// ============================================================

// Knot values repeated by their multiplicities. Returns an empty vector
// when the expansion would exceed max_count entries.
std::vector<double> expand_knots(const std::vector<double>& knots,
                                 const std::vector<int>& multiplicities,
                                 size_t max_count = std::numeric_limits<size_t>::max());

// Index k with knots[k] <= t < knots[k+1]; t at or past knots[n+1] gives n.
// n is the index of the last control point.
int find_knot_span(int n, int degree, double t, const std::vector<double>& knots);

// de Boor evaluation at parameter t over an expanded knot vector.
// Throws std::invalid_argument unless 0 <= degree <= n and the knot vector
// has at least n + degree + 2 entries.
Vec3 evaluate_bspline(const std::vector<Vec3>& control_points,
                      const std::vector<double>& knots,
                      int degree,
                      double t);

}  // namespace lasercut

#endif // LASERCUT_CURVE_CURVE_EVALUATOR_HPP
