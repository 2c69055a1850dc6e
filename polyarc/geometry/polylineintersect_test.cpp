// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_test_p.h>
#if defined(PA_TEST)

#include <polyarc/geometry/polylineintersect_p.h>
#include <polyarc/support/algorithm_p.h>

// pa::Geometry - Polyline Intersect Tests
// =======================================

namespace pa {
namespace Tests {

static constexpr double kTol = 1e-5;

static PAPolyline make_square(double x, double y, double size) {
  return PAPolyline({ PAVertex(x, y), PAVertex(x + size, y), PAVertex(x + size, y + size), PAVertex(x, y + size) }, true);
}

static void sort_basic(std::vector<Geometry::BasicIntersect>& intersects) {
  quick_sort(intersects.data(), intersects.size(), [](const Geometry::BasicIntersect& a, const Geometry::BasicIntersect& b) noexcept -> int {
    if (a.start_index1 != b.start_index1)
      return a.start_index1 < b.start_index1 ? -1 : 1;
    if (a.start_index2 != b.start_index2)
      return a.start_index2 < b.start_index2 ? -1 : 1;
    return 0;
  });
}

UNIT(geometry_polyline_self_intersects, PA_TEST_GROUP_GEOMETRY_INTERSECTION) {
  INFO("Local self intersects skip the shared vertex");
  {
    std::vector<Geometry::BasicIntersect> out;

    Geometry::find_local_self_intersects(out, make_square(0, 0, 1), kTol);
    EXPECT_TRUE(out.empty());

    // Path that doubles back over its first segment.
    PAPolyline back({ PAVertex(0, 0), PAVertex(2, 0), PAVertex(1, 0) }, false);
    Geometry::find_local_self_intersects(out, back, kTol);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].start_index1, 0u);
    EXPECT_EQ(out[0].start_index2, 1u);
    EXPECT_EQ(out[0].point, PAPoint(1, 0));

    // Both halves of a circle share both of their vertices.
    out.clear();
    PAPolyline circle({ PAVertex(0, 0, 1), PAVertex(2, 0, 1) }, true);
    Geometry::find_local_self_intersects(out, circle, kTol);
    EXPECT_TRUE(out.empty());
  }

  INFO("Global self intersects of a bow tie");
  {
    PAPolyline bow_tie({ PAVertex(0, 0), PAVertex(2, 2), PAVertex(2, 0), PAVertex(0, 2) }, true);

    Geometry::AABBIndex index;
    Geometry::build_segment_index(index, bow_tie, kTol);
    EXPECT_EQ(index.item_count(), 4u);

    std::vector<Geometry::BasicIntersect> out;
    Geometry::find_global_self_intersects(out, bow_tie, index, kTol);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].start_index1, 0u);
    EXPECT_EQ(out[0].start_index2, 2u);
    EXPECT_NEAR(out[0].point.x, 1.0, 1e-12);
    EXPECT_NEAR(out[0].point.y, 1.0, 1e-12);
  }

  INFO("is_self_intersecting()");
  {
    PAPolyline bow_tie({ PAVertex(0, 0), PAVertex(2, 2), PAVertex(2, 0), PAVertex(0, 2) }, true);
    PAPolyline circle({ PAVertex(0, 0, 1), PAVertex(2, 0, 1) }, true);
    PAPolyline open_loop({ PAVertex(0, 0), PAVertex(4, 0), PAVertex(4, 2), PAVertex(2, 2), PAVertex(2, -1) }, false);
    PAPolyline open_path({ PAVertex(0, 0), PAVertex(4, 0), PAVertex(4, 2), PAVertex(2, 2) }, false);

    EXPECT_TRUE(Geometry::is_self_intersecting(bow_tie, kTol));
    EXPECT_TRUE(Geometry::is_self_intersecting(open_loop, kTol));
    EXPECT_FALSE(Geometry::is_self_intersecting(make_square(0, 0, 1), kTol));
    EXPECT_FALSE(Geometry::is_self_intersecting(circle, kTol));
    EXPECT_FALSE(Geometry::is_self_intersecting(open_path, kTol));
  }
}

UNIT(geometry_polyline_intersects, PA_TEST_GROUP_GEOMETRY_INTERSECTION) {
  INFO("Crossing squares");
  {
    PAPolyline a = make_square(0, 0, 1);
    PAPolyline b = make_square(0.5, 0.5, 1);

    Geometry::AABBIndex index;
    Geometry::build_segment_index(index, a, kTol);

    Geometry::IntersectsResult out;
    Geometry::find_intersects(out, a, b, index, kTol);
    sort_basic(out.basic);

    EXPECT_TRUE(out.overlapping.empty());
    ASSERT_EQ(out.basic.size(), 2u);

    EXPECT_EQ(out.basic[0].start_index1, 1u);
    EXPECT_EQ(out.basic[0].start_index2, 0u);
    EXPECT_EQ(out.basic[0].point, PAPoint(1, 0.5));

    EXPECT_EQ(out.basic[1].start_index1, 2u);
    EXPECT_EQ(out.basic[1].start_index2, 3u);
    EXPECT_EQ(out.basic[1].point, PAPoint(0.5, 1));
  }

  INFO("Point at a shared vertex is reported once");
  {
    PAPolyline a = make_square(0, 0, 1);
    PAPolyline b({ PAVertex(0.5, 1.5), PAVertex(1.5, 0.5), PAVertex(2, 2) }, true);

    Geometry::AABBIndex index;
    Geometry::build_segment_index(index, a, kTol);

    Geometry::IntersectsResult out;
    Geometry::find_intersects(out, a, b, index, kTol);

    ASSERT_EQ(out.basic.size(), 1u);
    EXPECT_EQ(out.basic[0].start_index1, 2u);
    EXPECT_EQ(out.basic[0].point, PAPoint(1, 1));
  }

  INFO("Squares sharing an edge overlap");
  {
    PAPolyline a = make_square(0, 0, 1);
    PAPolyline b = make_square(1, 0, 1);

    Geometry::AABBIndex index;
    Geometry::build_segment_index(index, a, kTol);

    Geometry::IntersectsResult out;
    Geometry::find_intersects(out, a, b, index, kTol);

    ASSERT_EQ(out.overlapping.size(), 1u);
    EXPECT_EQ(out.overlapping[0].start_index1, 1u);
    EXPECT_EQ(out.overlapping[0].start_index2, 3u);
    EXPECT_EQ(out.overlapping[0].point1, PAPoint(1, 0));
    EXPECT_EQ(out.overlapping[0].point2, PAPoint(1, 1));

    // Both ends of the shared edge are also reported once as basic intersects.
    sort_basic(out.basic);
    ASSERT_EQ(out.basic.size(), 2u);
    EXPECT_EQ(out.basic[0].point, PAPoint(1, 0));
    EXPECT_EQ(out.basic[1].point, PAPoint(1, 1));
  }
}

} // {Tests}
} // {pa}

#endif // PA_TEST
