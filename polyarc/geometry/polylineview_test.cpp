// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_test_p.h>
#if defined(PA_TEST)

#include <polyarc/geometry/polylineutils_p.h>

// pa::Geometry - Polyline View Tests
// ==================================

namespace pa {
namespace Tests {

static constexpr double kEps = 1e-9;

static void expect_vertex_near(const PAVertex& a, const PAVertex& b, double eps = kEps) {
  EXPECT_NEAR(a.x, b.x, eps);
  EXPECT_NEAR(a.y, b.y, eps);
  EXPECT_NEAR(a.bulge, b.bulge, eps);
}

UNIT(geometry_polyline_ref, PA_TEST_GROUP_GEOMETRY_CONTAINERS) {
  PAPolyline rect({ PAVertex(0, 0), PAVertex(4, 0), PAVertex(4, 2), PAVertex(0, 2) }, true);

  INFO("PolylineRef mirrors the referenced polyline");
  {
    Geometry::PolylineRef ref(rect);
    EXPECT_EQ(ref.size(), 4u);
    EXPECT_TRUE(ref.is_closed());
    EXPECT_EQ(ref.segment_count(), 4u);
    EXPECT_EQ(ref.at(2), PAVertex(4, 2));
    EXPECT_EQ(Geometry::next_index(ref, 3), 0u);
    EXPECT_EQ(Geometry::prev_index(ref, 0), 3u);

    Geometry::PolylineRef open_ref(rect.vertex_data(), 3, false);
    EXPECT_EQ(open_ref.segment_count(), 2u);
    EXPECT_EQ(Geometry::PolylineRef(rect.vertex_data(), 1, true).segment_count(), 0u);
  }

  INFO("Segment range visits every segment, the closing segment last");
  {
    size_t count = 0;
    PAVertex last_v1;
    PAVertex last_v2;

    for (PASegmentVertices seg : Geometry::PolylineRef(rect).segments()) {
      last_v1 = seg.v1;
      last_v2 = seg.v2;
      count++;
    }

    EXPECT_EQ(count, 4u);
    EXPECT_EQ(last_v1, PAVertex(0, 2));
    EXPECT_EQ(last_v2, PAVertex(0, 0));
  }
}

UNIT(geometry_polyline_subview, PA_TEST_GROUP_GEOMETRY_CONTAINERS) {
  constexpr double kTol = 1e-5;
  PAPolyline rect({ PAVertex(0, 0), PAVertex(4, 0), PAVertex(4, 2), PAVertex(0, 2) }, true);
  PAPolyline circle({ PAVertex(0, 0, 1), PAVertex(2, 0, 1) }, true);

  INFO("Slice over several segments of a rectangle");
  {
    Geometry::SliceData data;
    ASSERT_TRUE(Geometry::make_slice(data, rect, 0, PAPoint(2, 0), 2, PAPoint(2, 2), kTol));

    Geometry::PolylineSubView<PAPolyline> view(rect, data);
    ASSERT_EQ(view.size(), 4u);
    EXPECT_FALSE(view.is_closed());
    EXPECT_EQ(view.at(0), PAVertex(2, 0));
    EXPECT_EQ(view.at(1), PAVertex(4, 0));
    EXPECT_EQ(view.at(2), PAVertex(4, 2));
    EXPECT_EQ(view.at(3), PAVertex(2, 2));
    EXPECT_NEAR(Geometry::path_length(view), 6.0, kEps);

    Geometry::PolylineSubView<PAPolyline> inverted(rect, data, true);
    EXPECT_EQ(inverted.at(0), PAVertex(2, 2));
    EXPECT_EQ(inverted.at(1), PAVertex(4, 2));
    EXPECT_EQ(inverted.at(2), PAVertex(4, 0));
    EXPECT_EQ(inverted.at(3), PAVertex(2, 0));
  }

  INFO("Slice that wraps around the whole loop");
  {
    Geometry::SliceData data;
    ASSERT_TRUE(Geometry::make_slice(data, rect, 0, PAPoint(2, 0), 4, PAPoint(1, 0), kTol));

    Geometry::PolylineSubView<PAPolyline> view(rect, data);
    ASSERT_EQ(view.size(), 6u);
    EXPECT_EQ(view.at(4), PAVertex(0, 0));
    EXPECT_EQ(view.at(5), PAVertex(1, 0));
    EXPECT_NEAR(Geometry::path_length(view), 11.0, kEps);
  }

  INFO("Start point at the end of its segment moves to the next segment");
  {
    Geometry::SliceData data;
    ASSERT_TRUE(Geometry::make_slice(data, rect, 0, PAPoint(4, 0), 1, PAPoint(4, 1), kTol));
    EXPECT_EQ(data.start_index, 1u);
    EXPECT_EQ(data.end_index_offset, 0u);

    Geometry::PolylineSubView<PAPolyline> view(rect, data);
    ASSERT_EQ(view.size(), 2u);
    EXPECT_EQ(view.at(0), PAVertex(4, 0));
    EXPECT_EQ(view.at(1), PAVertex(4, 1));
  }

  INFO("Collapsed slice is rejected");
  {
    Geometry::SliceData data;
    EXPECT_FALSE(Geometry::make_slice(data, rect, 0, PAPoint(2, 0), 0, PAPoint(2, 0), kTol));
  }

  INFO("Slice of a circle keeps the arcs");
  {
    double q = Geometry::bulge_from_angle(Math::kPI_DIV_2);

    Geometry::SliceData data;
    ASSERT_TRUE(Geometry::make_slice(data, circle, 0, PAPoint(1, -1), 1, PAPoint(1, 1), kTol));

    Geometry::PolylineSubView<PAPolyline> view(circle, data);
    ASSERT_EQ(view.size(), 3u);
    expect_vertex_near(view.at(0), PAVertex(1, -1, q));
    expect_vertex_near(view.at(1), PAVertex(2, 0, q));
    expect_vertex_near(view.at(2), PAVertex(1, 1, 0));
    EXPECT_NEAR(Geometry::path_length(view), Math::kPI, 1e-9);

    Geometry::PolylineSubView<PAPolyline> inverted(circle, data, true);
    expect_vertex_near(inverted.at(0), PAVertex(1, 1, -q));
    expect_vertex_near(inverted.at(1), PAVertex(2, 0, -q));
    expect_vertex_near(inverted.at(2), PAVertex(1, -1, 0));

    // The inverted slice traces the same points backwards.
    PAPoint mid = Geometry::seg_midpoint(inverted.at(0), inverted.at(1));
    EXPECT_NEAR(Geometry::length(mid, PAPoint(1, 0)), 1.0, 1e-9);
    EXPECT_GT(mid.y, 0.0);
  }
}

} // {Tests}
} // {pa}

#endif // PA_TEST
