// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_test_p.h>
#if defined(PA_TEST)

#include <polyarc/geometry/intersect_p.h>

// pa::Geometry - Intersection Tests
// =================================

namespace pa {
namespace Tests {

static constexpr double kEps = 1e-9;
static constexpr double kTol = 1e-5;

static void expect_point_near(const PAPoint& a, const PAPoint& b, double eps = kEps) {
  EXPECT_NEAR(a.x, b.x, eps) << "y=" << a.y;
  EXPECT_NEAR(a.y, b.y, eps) << "x=" << a.x;
}

UNIT(geometry_intersect_line_line, PA_TEST_GROUP_GEOMETRY_INTERSECTION) {
  using Geometry::IntersectType;

  INFO("Crossing lines");
  {
    Geometry::SegIntersect r = Geometry::line_line_intersect(PAPoint(0, 0), PAPoint(2, 2), PAPoint(0, 2), PAPoint(2, 0), kTol);
    EXPECT_EQ(r.type, IntersectType::kCrossing);
    EXPECT_EQ(r.count, 1u);
    expect_point_near(r.p0, PAPoint(1, 1));
  }

  INFO("Lines meeting at an end point snap to it exactly");
  {
    Geometry::SegIntersect r = Geometry::line_line_intersect(PAPoint(0, 0), PAPoint(1, 0), PAPoint(1, 0.000001), PAPoint(1, 5), kTol);
    EXPECT_EQ(r.type, IntersectType::kCrossing);
    EXPECT_EQ(r.p0, PAPoint(1, 0));
  }

  INFO("Parallel and disjoint lines");
  {
    EXPECT_FALSE(Geometry::line_line_intersect(PAPoint(0, 0), PAPoint(4, 0), PAPoint(0, 1), PAPoint(4, 1), kTol).has_intersection());
    EXPECT_FALSE(Geometry::line_line_intersect(PAPoint(0, 0), PAPoint(1, 1), PAPoint(3, 0), PAPoint(2, 1), kTol).has_intersection());
  }

  INFO("Collinear overlap is ordered along the first line");
  {
    Geometry::SegIntersect r = Geometry::line_line_intersect(PAPoint(4, 0), PAPoint(0, 0), PAPoint(1, 0), PAPoint(6, 0), kTol);
    EXPECT_EQ(r.type, IntersectType::kOverlap);
    EXPECT_EQ(r.p0, PAPoint(4, 0));
    EXPECT_EQ(r.p1, PAPoint(1, 0));
  }

  INFO("Collinear lines touching at one end point");
  {
    Geometry::SegIntersect r = Geometry::line_line_intersect(PAPoint(0, 0), PAPoint(2, 0), PAPoint(2, 0), PAPoint(3, 0), kTol);
    EXPECT_EQ(r.type, IntersectType::kTangent);
    EXPECT_EQ(r.p0, PAPoint(2, 0));
  }
}

UNIT(geometry_intersect_line_arc, PA_TEST_GROUP_GEOMETRY_INTERSECTION) {
  using Geometry::IntersectType;

  // Clockwise half circle from (0, 0) to (2, 0) above the chord, center (1, 0), radius 1.
  Geometry::Segment upper = Geometry::make_segment(PAVertex(0, 0, -1), PAVertex(2, 0));

  INFO("Line crossing the arc twice");
  {
    Geometry::SegIntersect r = Geometry::line_arc_intersect(PAPoint(-1, 0.5), PAPoint(3, 0.5), upper, kTol);
    double dx = Math::sqrt(0.75);
    EXPECT_EQ(r.type, IntersectType::kCrossing);
    EXPECT_EQ(r.count, 2u);
    expect_point_near(r.p0, PAPoint(1 - dx, 0.5));
    expect_point_near(r.p1, PAPoint(1 + dx, 0.5));
  }

  INFO("Line crossing the circle outside of the arc sweep");
  {
    EXPECT_FALSE(Geometry::line_arc_intersect(PAPoint(-1, -0.5), PAPoint(3, -0.5), upper, kTol).has_intersection());
  }

  INFO("Line tangent to the arc");
  {
    Geometry::SegIntersect r = Geometry::line_arc_intersect(PAPoint(-1, 1), PAPoint(3, 1), upper, kTol);
    EXPECT_EQ(r.type, IntersectType::kTangent);
    expect_point_near(r.p0, PAPoint(1, 1));
  }

  INFO("Arc first, points ordered along the arc");
  {
    // The clockwise arc starts at (0, 0), so the left crossing comes first even if the line goes right to left.
    Geometry::SegIntersect r = Geometry::seg_intersect(PAVertex(0, 0, -1), PAVertex(2, 0), PAVertex(3, 0.5), PAVertex(-1, 0.5), kTol);
    EXPECT_EQ(r.count, 2u);
    EXPECT_LT(r.p0.x, r.p1.x);

    Geometry::SegIntersect s = Geometry::seg_intersect(PAVertex(3, 0.5), PAVertex(-1, 0.5), PAVertex(0, 0, -1), PAVertex(2, 0), kTol);
    EXPECT_EQ(s.count, 2u);
    EXPECT_GT(s.p0.x, s.p1.x);
  }
}

UNIT(geometry_intersect_arc_arc, PA_TEST_GROUP_GEOMETRY_INTERSECTION) {
  using Geometry::IntersectType;

  INFO("Arcs crossing at one point");
  {
    // Upper half circles centered at (1, 0) and (2, 0), both radius 1.
    Geometry::Segment a = Geometry::make_segment(PAVertex(0, 0, -1), PAVertex(2, 0));
    Geometry::Segment b = Geometry::make_segment(PAVertex(1, 0, -1), PAVertex(3, 0));

    Geometry::SegIntersect r = Geometry::arc_arc_intersect(a, b, kTol);
    EXPECT_EQ(r.type, IntersectType::kCrossing);
    EXPECT_EQ(r.count, 1u);
    expect_point_near(r.p0, PAPoint(1.5, Math::sqrt(0.75)));
  }

  INFO("Arcs of touching circles");
  {
    Geometry::Segment a = Geometry::make_segment(PAVertex(0, 0, -1), PAVertex(2, 0));
    Geometry::Segment b = Geometry::make_segment(PAVertex(2, 2, 1), PAVertex(4, 2));

    // Circles centered at (1, 0) and (3, 2) with radius 1 don't touch.
    EXPECT_FALSE(Geometry::arc_arc_intersect(a, b, kTol).has_intersection());

    Geometry::Segment c = Geometry::make_segment(PAVertex(1, 1, 1), PAVertex(1, 3));
    Geometry::SegIntersect r = Geometry::arc_arc_intersect(a, c, kTol);
    EXPECT_EQ(r.type, IntersectType::kTangent);
    expect_point_near(r.p0, PAPoint(1, 1));
  }

  INFO("Co-circular arcs overlap");
  {
    double quarter = Geometry::bulge_from_angle(Math::kPI_DIV_2);
    double half = Geometry::bulge_from_angle(Math::kPI);

    // Unit circle around the origin, [0, 180] and [90, 270] degrees.
    Geometry::Segment a = Geometry::make_segment(PAVertex(1, 0, half), PAVertex(-1, 0));
    Geometry::Segment b = Geometry::make_segment(PAVertex(0, 1, half), PAVertex(0, -1));

    Geometry::SegIntersect r = Geometry::arc_arc_intersect(a, b, kTol);
    EXPECT_EQ(r.type, IntersectType::kOverlap);
    expect_point_near(r.p0, PAPoint(0, 1));
    expect_point_near(r.p1, PAPoint(-1, 0));

    // Two halves of the same circle only meet at their end points.
    Geometry::Segment c = Geometry::make_segment(PAVertex(-1, 0, half), PAVertex(1, 0));
    Geometry::SegIntersect s = Geometry::arc_arc_intersect(a, c, kTol);
    EXPECT_EQ(s.type, IntersectType::kCrossing);
    EXPECT_EQ(s.count, 2u);

    // Quarter arc touching the half arc at its end.
    Geometry::Segment d = Geometry::make_segment(PAVertex(-1, 0, quarter), PAVertex(0, -1));
    Geometry::SegIntersect t = Geometry::arc_arc_intersect(a, d, kTol);
    EXPECT_EQ(t.type, IntersectType::kTangent);
    expect_point_near(t.p0, PAPoint(-1, 0));
  }

  INFO("Concentric arcs with different radius");
  {
    Geometry::Segment a = Geometry::make_segment(PAVertex(0, 0, 1), PAVertex(2, 0));
    Geometry::Segment b = Geometry::make_segment(PAVertex(0.5, 0, 1), PAVertex(1.5, 0));
    EXPECT_FALSE(Geometry::arc_arc_intersect(a, b, kTol).has_intersection());
  }
}

UNIT(geometry_line_circle_primitives, PA_TEST_GROUP_GEOMETRY_INTERSECTION) {
  INFO("line_line_params()");
  {
    Geometry::LineLineParams r = Geometry::line_line_params(PAPoint(0, 0), PAPoint(1, 0), PAPoint(3, -1), PAPoint(3, 1), kTol);
    EXPECT_EQ(r.relation, Geometry::LineRelation::kIntersect);
    EXPECT_NEAR(r.t, 3.0, 1e-12);
    EXPECT_NEAR(r.u, 0.5, 1e-12);

    EXPECT_EQ(Geometry::line_line_params(PAPoint(0, 0), PAPoint(1, 0), PAPoint(0, 1), PAPoint(1, 1), kTol).relation, Geometry::LineRelation::kParallel);
    EXPECT_EQ(Geometry::line_line_params(PAPoint(0, 0), PAPoint(1, 0), PAPoint(5, 0), PAPoint(7, 0), kTol).relation, Geometry::LineRelation::kCollinear);
  }

  INFO("line_circle_params()");
  {
    Geometry::LineCircleParams r = Geometry::line_circle_params(PAPoint(-2, 0), PAPoint(2, 0), PAPoint(0, 0), 1.0, kTol);
    ASSERT_EQ(r.count, 2u);
    EXPECT_NEAR(r.t[0], 0.25, 1e-12);
    EXPECT_NEAR(r.t[1], 0.75, 1e-12);

    r = Geometry::line_circle_params(PAPoint(-2, 1), PAPoint(-1, 1), PAPoint(0, 0), 1.0, kTol);
    ASSERT_EQ(r.count, 1u);
    EXPECT_NEAR(r.t[0], 2.0, 1e-12);

    EXPECT_EQ(Geometry::line_circle_params(PAPoint(-2, 2), PAPoint(2, 2), PAPoint(0, 0), 1.0, kTol).count, 0u);
  }

  INFO("circle_circle_points()");
  {
    Geometry::CircleCirclePoints r = Geometry::circle_circle_points(PAPoint(0, 0), 1.0, PAPoint(1, 0), 1.0, kTol);
    ASSERT_EQ(r.count, 2u);
    expect_point_near(r.pts[0], PAPoint(0.5, Math::sqrt(0.75)));
    expect_point_near(r.pts[1], PAPoint(0.5, -Math::sqrt(0.75)));

    r = Geometry::circle_circle_points(PAPoint(0, 0), 1.0, PAPoint(3, 0), 2.0, kTol);
    ASSERT_EQ(r.count, 1u);
    expect_point_near(r.pts[0], PAPoint(1, 0));

    EXPECT_EQ(Geometry::circle_circle_points(PAPoint(0, 0), 1.0, PAPoint(0, 0), 1.0, kTol).count, 0u);
    EXPECT_EQ(Geometry::circle_circle_points(PAPoint(0, 0), 1.0, PAPoint(5, 0), 1.0, kTol).count, 0u);
  }
}

} // {Tests}
} // {pa}

#endif // PA_TEST
