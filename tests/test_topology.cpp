#include <gtest/gtest.h>
#include <step/parser.hpp>
#include <topology/step_topology_resolver.hpp>
#include <layout/dimensions.hpp>
#include <cmath>
#include <numbers>
#include "test_helpers.hpp"

using namespace lasercut;
using test::StepFileBuilder;

namespace {

StepTopologyResolver resolver_for(const StepFileBuilder& b) {
    return StepTopologyResolver(step::StepModel::build(step::parse_step_text(b.build())));
}

}  // namespace

// ============== Solids ==============

TEST(TopologyTest, ResolvesNamedSolidsInOrder) {
    StepFileBuilder b;
    test::make_plate(b, "First", vec3::zero(), 10.0, 10.0, 3.0);
    test::make_plate(b, "Second", Vec3(20.0, 0.0, 0.0), 10.0, 10.0, 3.0);
    auto resolver = resolver_for(b);

    auto solids = resolver.resolve_solids();
    ASSERT_EQ(solids.size(), 2u);
    EXPECT_EQ(solids[0].name, "First");
    EXPECT_EQ(solids[1].name, "Second");
    EXPECT_EQ(solids[0].faces.size(), 6u);
}

TEST(TopologyTest, BlankSolidNamesAreNumbered) {
    StepFileBuilder b;
    test::make_plate(b, "", vec3::zero(), 10.0, 10.0, 3.0);
    test::make_plate(b, "  ", Vec3(20.0, 0.0, 0.0), 10.0, 10.0, 3.0);
    auto solids = resolver_for(b).resolve_solids();
    ASSERT_EQ(solids.size(), 2u);
    EXPECT_EQ(solids[0].name, "Solid_0");
    EXPECT_EQ(solids[1].name, "Solid_1");
}

TEST(TopologyTest, LooseFacesBecomePseudoSolids) {
    StepFileBuilder b;
    auto faces = test::add_plate_faces(b, vec3::zero(), 10.0, 10.0, 3.0);
    auto more = test::add_plate_faces(b, Vec3(20.0, 0.0, 0.0), 10.0, 10.0, 3.0);
    b.polygon_face({Vec3(40.0, 0.0, 0.0), Vec3(41.0, 0.0, 0.0), Vec3(41.0, 1.0, 0.0)});
    auto solids = resolver_for(b).resolve_solids();

    ASSERT_EQ(solids.size(), 3u);
    EXPECT_EQ(solids[0].name, "Solid1");
    EXPECT_EQ(solids[0].faces, faces);
    EXPECT_EQ(solids[1].name, "Solid2");
    EXPECT_EQ(solids[1].faces, more);
    EXPECT_EQ(solids[2].name, "Solid3");
    EXPECT_EQ(solids[2].faces.size(), 1u);
}

TEST(TopologyTest, EmptyModelHasNoSolids) {
    StepFileBuilder b;
    b.point(vec3::zero());
    EXPECT_TRUE(resolver_for(b).resolve_solids().empty());
}

// ============== Bounding dimensions ==============

TEST(TopologyTest, AxisAlignedPlateDimensions) {
    StepFileBuilder b;
    test::make_plate(b, "Plate", vec3::zero(), 50.0, 30.0, 3.0, Vec3(25.0, 15.0, 3.0), 5.0);
    auto resolver = resolver_for(b);
    auto solids = resolver.resolve_solids();
    ASSERT_EQ(solids.size(), 1u);

    BoundingInfo info = resolver.extract_bounding_dimensions(solids[0].faces);
    EXPECT_DOUBLE_EQ(info.width, 50.0);
    EXPECT_DOUBLE_EQ(info.height, 30.0);
    EXPECT_DOUBLE_EQ(info.depth, 3.0);
    EXPECT_EQ(info.vertices.size(), 8u);
    ASSERT_TRUE(info.thin_pair_separation.has_value());
    EXPECT_NEAR(*info.thin_pair_separation, 3.0, 1e-9);
}

TEST(TopologyTest, TiltedPlateUsesFacePairSeparation) {
    // 40 x 20 x 4 plate rotated 20 degrees about the y axis: no extent is thin
    StepFileBuilder b;
    const double angle = 20.0 * std::numbers::pi / 180.0;
    const double c = std::cos(angle);
    const double s = std::sin(angle);
    auto tilt = [c, s](double x, double y, double z) { return Vec3(x * c + z * s, y, z * c - x * s); };
    const double w = 40.0, h = 20.0, t = 4.0;
    std::vector<StepFileBuilder::Id> faces;
    faces.push_back(b.polygon_face({tilt(0, 0, t), tilt(w, 0, t), tilt(w, h, t), tilt(0, h, t)}));
    faces.push_back(b.polygon_face({tilt(0, 0, 0), tilt(0, h, 0), tilt(w, h, 0), tilt(w, 0, 0)}));
    faces.push_back(b.polygon_face({tilt(0, 0, 0), tilt(w, 0, 0), tilt(w, 0, t), tilt(0, 0, t)}));
    faces.push_back(b.polygon_face({tilt(w, 0, 0), tilt(w, h, 0), tilt(w, h, t), tilt(w, 0, t)}));
    faces.push_back(b.polygon_face({tilt(w, h, 0), tilt(0, h, 0), tilt(0, h, t), tilt(w, h, t)}));
    faces.push_back(b.polygon_face({tilt(0, h, 0), tilt(0, 0, 0), tilt(0, 0, t), tilt(0, h, t)}));
    auto resolver = resolver_for(b);

    BoundingInfo info = resolver.extract_bounding_dimensions(faces);
    ASSERT_TRUE(info.thin_pair_separation.has_value());
    EXPECT_NEAR(*info.thin_pair_separation, 4.0, 1e-4);
    // The smallest extent (z, about 17.4) is replaced in place; x and y keep theirs
    EXPECT_NEAR(info.width, w * c + t * s, 1e-4);
    EXPECT_NEAR(info.height, 20.0, 1e-4);
    EXPECT_NEAR(info.depth, 4.0, 1e-4);

    Dimensions dimensions{info.width, info.height, info.depth};
    EXPECT_TRUE(dimensions.has_thin_dimension(3.5, 4.5));
}

TEST(TopologyTest, ThickBlockKeepsExtents) {
    StepFileBuilder b;
    auto faces = test::add_plate_faces(b, vec3::zero(), 50.0, 30.0, 20.0);
    BoundingInfo info = resolver_for(b).extract_bounding_dimensions(faces);
    EXPECT_DOUBLE_EQ(info.width, 50.0);
    EXPECT_DOUBLE_EQ(info.height, 30.0);
    EXPECT_DOUBLE_EQ(info.depth, 20.0);
}

TEST(TopologyTest, EmptyFaceListGivesZeroExtents) {
    StepFileBuilder b;
    BoundingInfo info = resolver_for(b).extract_bounding_dimensions({});
    EXPECT_TRUE(info.vertices.empty());
    EXPECT_DOUBLE_EQ(info.width, 0.0);
    EXPECT_FALSE(info.thin_pair_separation.has_value());
}

// ============== Face loops ==============

TEST(TopologyTest, FaceLoopsWithHole) {
    StepFileBuilder b;
    auto faces = test::add_plate_faces(b, vec3::zero(), 50.0, 30.0, 3.0, Vec3(25.0, 15.0, 3.0), 5.0);
    auto resolver = resolver_for(b);

    EXPECT_TRUE(resolver.is_planar(faces[0]));
    FaceLoops loops = resolver.extract_face_loops_as_segments(faces[0]);
    ASSERT_EQ(loops.outer.size(), 4u);
    EXPECT_EQ(segment_start(loops.outer[0]), Vec3(0.0, 0.0, 3.0));
    EXPECT_EQ(segment_end(loops.outer[0]), Vec3(50.0, 0.0, 3.0));
    EXPECT_EQ(segment_end(loops.outer[3]), Vec3(0.0, 0.0, 3.0));

    ASSERT_EQ(loops.holes.size(), 1u);
    ASSERT_EQ(loops.holes[0].size(), 1u);
    const auto* arc = std::get_if<Arc3D>(&loops.holes[0][0]);
    ASSERT_NE(arc, nullptr);
    EXPECT_EQ(arc->start, Vec3(30.0, 15.0, 3.0));
    EXPECT_EQ(arc->center, Vec3(25.0, 15.0, 3.0));
    EXPECT_TRUE(arc->clockwise);
}

TEST(TopologyTest, ReversedBoundReversesLoop) {
    StepFileBuilder b;
    Vec3 p[3] = {Vec3(0.0, 0.0, 0.0), Vec3(10.0, 0.0, 0.0), Vec3(0.0, 10.0, 0.0)};
    StepFileBuilder::Id v[3] = {b.vertex(p[0]), b.vertex(p[1]), b.vertex(p[2])};
    std::vector<StepFileBuilder::Id> edges;
    for (int i = 0; i < 3; ++i) {
        int j = (i + 1) % 3;
        edges.push_back(b.oriented(b.line_edge(v[i], p[i], v[j], p[j])));
    }
    auto bound = b.bound(b.loop(edges), true, false);
    auto face = b.face({bound}, b.plane(vec3::zero(), vec3::unit_z()));
    auto resolver = resolver_for(b);

    FaceLoops loops = resolver.extract_face_loops_as_segments(face);
    ASSERT_EQ(loops.outer.size(), 3u);
    EXPECT_EQ(segment_start(loops.outer[0]), p[0]);
    EXPECT_EQ(segment_end(loops.outer[0]), p[2]);
    EXPECT_EQ(segment_end(loops.outer[2]), p[0]);
}

TEST(TopologyTest, EdgeAgainstCurveSenseIsTraversedCorrectly) {
    // Half-disc: diameter line from (-5,0) to (5,0), then the upper arc back.
    // The arc's EDGE_CURVE runs (-5,0) -> (5,0) with same_sense .F.; the
    // oriented edge uses it reversed so the loop closes.
    StepFileBuilder b;
    Vec3 left(-5.0, 0.0, 0.0);
    Vec3 right(5.0, 0.0, 0.0);
    auto vl = b.vertex(left);
    auto vr = b.vertex(right);
    auto diameter = b.oriented(b.line_edge(vl, left, vr, right));
    auto arc_edge = b.circle_edge(vl, vr, vec3::zero(), 5.0, vec3::unit_z(), false);
    auto arc = b.oriented(arc_edge, false);
    auto face = b.face({b.bound(b.loop({diameter, arc}), true)}, b.plane(vec3::zero(), vec3::unit_z()));
    auto resolver = resolver_for(b);

    FaceLoops loops = resolver.extract_face_loops_as_segments(face);
    ASSERT_EQ(loops.outer.size(), 2u);
    const auto* a = std::get_if<Arc3D>(&loops.outer[1]);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->start, right);
    EXPECT_EQ(a->end, left);
    // right -> left through +y is counter-clockwise about +z
    EXPECT_FALSE(a->clockwise);

    auto samples = resolver.sample_outer_loop(face, 8);
    ASSERT_FALSE(samples.empty());
    bool upper_half = false;
    for (const auto& s : samples) {
        EXPECT_GE(s.y, -1e-9);
        if (s.y > 4.0) upper_half = true;
    }
    EXPECT_TRUE(upper_half);
}

TEST(TopologyTest, SampleOuterLoopAndCurvedEdges) {
    StepFileBuilder b;
    auto faces = test::add_plate_faces(b, vec3::zero(), 50.0, 30.0, 3.0, Vec3(25.0, 15.0, 3.0), 5.0);
    auto resolver = resolver_for(b);

    auto outline = resolver.sample_outer_loop(faces[0], 16);
    ASSERT_EQ(outline.size(), 4u);
    EXPECT_EQ(outline[0], Vec3(0.0, 0.0, 3.0));
    EXPECT_EQ(outline[2], Vec3(50.0, 30.0, 3.0));

    EXPECT_EQ(resolver.curved_edge_count(faces[0]), 1u);
    EXPECT_EQ(resolver.curved_edge_count(faces[1]), 0u);
}

TEST(TopologyTest, CircularFaceSamplesWithoutDuplicateClosure) {
    StepFileBuilder b;
    auto face = b.face({b.circular_hole(vec3::zero(), 10.0)}, b.plane(vec3::zero(), vec3::unit_z()));
    auto resolver = resolver_for(b);
    auto outline = resolver.sample_outer_loop(face, 32);
    EXPECT_EQ(outline.size(), 32u);
}

TEST(TopologyTest, NonPlanarFace) {
    StepFileBuilder b;
    auto cylinder = b.add("CYLINDRICAL_SURFACE(''," + StepFileBuilder::ref(b.placement(vec3::zero())) + ",5.)");
    auto face = b.face({}, cylinder);
    auto resolver = resolver_for(b);
    EXPECT_FALSE(resolver.is_planar(face));
    EXPECT_FALSE(resolver.is_planar(12345));
    EXPECT_TRUE(resolver.extract_face_loops_as_segments(face).outer.empty());
}
