// This file is part of polyarc project
//
// See polyarc.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <polyarc/core/api-build_test_p.h>
#if defined(PA_TEST)

#include <polyarc/core/polyline.h>
#include <polyarc/support/math_p.h>

#include <cmath>
#include <thread>

// PAPolyline - Tests
// ==================

namespace pa {
namespace Tests {

static constexpr double kEps = 1e-9;

static PAPolyline make_unit_square(double x, double y) {
  return PAPolyline({ PAVertex(x, y), PAVertex(x + 1, y), PAVertex(x + 1, y + 1), PAVertex(x, y + 1) }, true);
}

static double sum_area(const PAPolylineArray& polylines) {
  double sum = 0.0;
  for (const PAPolyline& polyline : polylines)
    sum += polyline.area();
  return sum;
}

static bool contains_vertex(const PAPolyline& polyline, double x, double y) {
  for (size_t i = 0; i < polyline.size(); i++) {
    if (std::fabs(polyline[i].x - x) < 1e-9 && std::fabs(polyline[i].y - y) < 1e-9)
      return true;
  }
  return false;
}

UNIT(polyline_container, PA_TEST_GROUP_GEOMETRY_CONTAINERS) {
  INFO("Construction and exact extraction");
  {
    PAVertex data[] = { PAVertex(0, 0, 0.5), PAVertex(3, 1), PAVertex(-1, 2, -0.25) };
    PAPolyline p(data, 3, true);

    EXPECT_EQ(p.size(), 3u);
    EXPECT_TRUE(p.is_closed());
    EXPECT_EQ(p.segment_count(), 3u);
    for (size_t i = 0; i < 3; i++)
      EXPECT_EQ(p.vertex_data()[i], data[i]);

    PAPolyline q;
    EXPECT_SUCCESS(q.assign_vertices(p.vertex_data(), p.size(), false));
    EXPECT_EQ(q.size(), 3u);
    EXPECT_FALSE(q.is_closed());
    EXPECT_EQ(q.segment_count(), 2u);

    // Assigning own data.
    EXPECT_SUCCESS(q.assign_vertices(q.vertex_data() + 1, 2, false));
    EXPECT_EQ(q.size(), 2u);
    EXPECT_EQ(q[0], data[1]);

    EXPECT_EQ(q.assign_vertices(nullptr, 2, false), PAResult(PA_ERROR_INVALID_VALUE));
  }

  INFO("Inverting direction twice restores the polyline");
  {
    PAPolyline p({ PAVertex(0, 0, 0.5), PAVertex(3, 1), PAVertex(-1, 2, -0.25) }, true);
    PAPolyline q = p;

    q.invert_direction();
    EXPECT_NE(q, p);
    EXPECT_NEAR(q.area(), -p.area(), kEps);

    q.invert_direction();
    EXPECT_EQ(q, p);

    PAPolyline open({ PAVertex(0, 0, 1), PAVertex(2, 0), PAVertex(2, 2) }, false);
    PAPolyline open_copy = open;
    open_copy.invert_direction();
    EXPECT_NEAR(open_copy.path_length(), open.path_length(), kEps);
    open_copy.invert_direction();
    EXPECT_EQ(open_copy, open);
  }

  INFO("Queries");
  {
    PAPolyline circle({ PAVertex(0, 0, 1), PAVertex(2, 0, 1) }, true);

    EXPECT_NEAR(circle.area(), Math::kPI, kEps);
    EXPECT_NEAR(circle.path_length(), Math::kPI_MUL_2, kEps);
    EXPECT_EQ(circle.orientation(), PA_ORIENTATION_COUNTER_CLOCKWISE);
    EXPECT_EQ(circle.winding_number(PAPoint(1, 0.5)), 1);
    EXPECT_EQ(circle.winding_number(PAPoint(3, 0)), 0);

    PABox box = circle.bounding_box();
    EXPECT_NEAR(box.y0, -1.0, kEps);
    EXPECT_NEAR(box.y1, 1.0, kEps);

    PAClosestPoint cp;
    EXPECT_SUCCESS(circle.closest_point(&cp, PAPoint(1, 3)));
    EXPECT_NEAR(cp.point.x, 1.0, 1e-9);
    EXPECT_NEAR(cp.point.y, 1.0, 1e-9);
    EXPECT_NEAR(cp.distance, 2.0, 1e-9);
    EXPECT_EQ(cp.segment_index, 1u);

    EXPECT_EQ(PAPolyline().closest_point(&cp, PAPoint(0, 0)), PAResult(PA_ERROR_TOO_FEW_VERTICES));
  }

  INFO("Editing");
  {
    PAPolyline p({ PAVertex(0, 0), PAVertex(0, 0), PAVertex(1, 0), PAVertex(2, 0), PAVertex(2, 2), PAVertex(0, 0) }, true);

    PAPolyline cleaned = p;
    EXPECT_SUCCESS(cleaned.remove_repeat_pos());
    EXPECT_EQ(cleaned.size(), 4u);

    EXPECT_SUCCESS(cleaned.remove_redundant());
    EXPECT_EQ(cleaned.size(), 3u);
    EXPECT_NEAR(cleaned.area(), 2.0, kEps);

    PAPolyline rotated = make_unit_square(0, 0);
    EXPECT_SUCCESS(rotated.rotate_start(1, PAPoint(1, 0.5)));
    EXPECT_EQ(rotated.size(), 5u);
    EXPECT_EQ(rotated[0].pos(), PAPoint(1, 0.5));
    EXPECT_NEAR(rotated.area(), 1.0, kEps);

    PAPolyline open({ PAVertex(0, 0), PAVertex(1, 0) }, false);
    EXPECT_EQ(open.rotate_start(0, PAPoint(0.5, 0)), PAResult(PA_ERROR_INVALID_VALUE));
    EXPECT_EQ(rotated.rotate_start(10, PAPoint(0, 0)), PAResult(PA_ERROR_INVALID_VALUE));

    PAPolyline moved = make_unit_square(0, 0);
    moved.scale(2.0);
    moved.translate(1.0, -1.0);
    EXPECT_EQ(moved[2].pos(), PAPoint(3, 1));
    EXPECT_NEAR(moved.area(), 4.0, kEps);
  }

  INFO("Arcs to approximate lines");
  {
    PAPolyline circle({ PAVertex(0, 0, 1), PAVertex(2, 0, 1) }, true);
    PAPolyline lines;

    EXPECT_SUCCESS(circle.arcs_to_approx_lines(&lines, 0.01));
    EXPECT_TRUE(lines.is_closed());
    EXPECT_GT(lines.size(), 8u);
    for (size_t i = 0; i < lines.size(); i++)
      EXPECT_EQ(lines[i].bulge, 0.0);
    EXPECT_LT(circle.area() - lines.area(), 0.1);
    EXPECT_GT(circle.area(), lines.area());

    EXPECT_EQ(circle.arcs_to_approx_lines(&lines, 0.0), PAResult(PA_ERROR_INVALID_VALUE));
  }
}

UNIT(polyline_validation, PA_TEST_GROUP_GEOMETRY_CONTAINERS) {
  INFO("pa_polyline_validate()");
  {
    EXPECT_SUCCESS(make_unit_square(0, 0).validate());

    PAPolyline single({ PAVertex(0, 0) }, false);
    EXPECT_EQ(single.validate(), PAResult(PA_ERROR_TOO_FEW_VERTICES));

    PAPolyline nan_vertex({ PAVertex(0, 0), PAVertex(std::nan(""), 1) }, false);
    EXPECT_EQ(nan_vertex.validate(), PAResult(PA_ERROR_INVALID_GEOMETRY));

    PAPolyline inf_bulge({ PAVertex(0, 0, INFINITY), PAVertex(1, 1) }, false);
    EXPECT_EQ(inf_bulge.validate(), PAResult(PA_ERROR_INVALID_GEOMETRY));

    PAPolyline degenerate({ PAVertex(0, 0, 0.5), PAVertex(0, 0), PAVertex(1, 1) }, false);
    EXPECT_EQ(degenerate.validate(), PAResult(PA_ERROR_DEGENERATE_ARC));

    EXPECT_EQ(make_unit_square(0, 0).validate(0.0), PAResult(PA_ERROR_INVALID_VALUE));
  }

  INFO("Offset errors");
  {
    PAPolylineArray out;
    out.push_back(make_unit_square(5, 5));

    PAPolyline single({ PAVertex(0, 0) }, true);
    EXPECT_EQ(pa_polyline_offset(&out, single, 1.0, nullptr), PAResult(PA_ERROR_TOO_FEW_VERTICES));
    EXPECT_TRUE(out.empty());

    // Repeated positions are removed first.
    PAPolyline repeated({ PAVertex(0, 0), PAVertex(0, 0) }, false);
    EXPECT_EQ(pa_polyline_offset(&out, repeated, 1.0, nullptr), PAResult(PA_ERROR_TOO_FEW_VERTICES));

    PAPolyline square = make_unit_square(0, 0);
    EXPECT_EQ(pa_polyline_offset(&out, square, std::nan(""), nullptr), PAResult(PA_ERROR_INVALID_VALUE));
    EXPECT_EQ(pa_polyline_offset(nullptr, square, 1.0, nullptr), PAResult(PA_ERROR_INVALID_VALUE));

    PAPolyline nan_input({ PAVertex(0, 0), PAVertex(1, std::nan("")), PAVertex(0, 1) }, true);
    EXPECT_EQ(pa_polyline_offset(&out, nan_input, 1.0, nullptr), PAResult(PA_ERROR_INVALID_GEOMETRY));
    EXPECT_EQ(square.combine(&out, nan_input, PA_BOOLEAN_OPERATOR_UNION), PAResult(PA_ERROR_INVALID_GEOMETRY));
    EXPECT_TRUE(out.empty());

    PAOffsetOptions options = pa_default_offset_options;
    options.tolerance = -1.0;
    EXPECT_EQ(square.offset(&out, 0.5, &options), PAResult(PA_ERROR_INVALID_VALUE));

    options = pa_default_offset_options;
    options.flags = 0x80u;
    EXPECT_EQ(square.offset(&out, 0.5, &options), PAResult(PA_ERROR_INVALID_VALUE));
  }

  INFO("Boolean errors");
  {
    PAPolylineArray out;
    PAPolyline square = make_unit_square(0, 0);

    PAPolyline open({ PAVertex(0, 0), PAVertex(1, 0), PAVertex(1, 1) }, false);
    EXPECT_EQ(square.combine(&out, open, PA_BOOLEAN_OPERATOR_UNION), PAResult(PA_ERROR_NOT_CLOSED));

    // Lobes of different size, the area is not zero.
    PAPolyline figure_eight({ PAVertex(0, 0), PAVertex(4, 4), PAVertex(4, 0), PAVertex(0, 2) }, true);
    EXPECT_EQ(square.combine(&out, figure_eight, PA_BOOLEAN_OPERATOR_UNION), PAResult(PA_ERROR_SELF_INTERSECTING));

    PAPolyline flat({ PAVertex(0, 0), PAVertex(1, 0), PAVertex(2, 0) }, true);
    EXPECT_EQ(square.combine(&out, flat, PA_BOOLEAN_OPERATOR_UNION), PAResult(PA_ERROR_INVALID_GEOMETRY));

    EXPECT_EQ(square.combine(&out, square, PABooleanOperator(7)), PAResult(PA_ERROR_INVALID_VALUE));
    EXPECT_TRUE(out.empty());
  }
}

UNIT(polyline_offset, PA_TEST_GROUP_GEOMETRY_OFFSET) {
  INFO("Circle offset outward, inward and collapsed");
  {
    PAPolyline circle({ PAVertex(0, 0, 1), PAVertex(2, 0, 1) }, true);
    PAPolylineArray out;

    EXPECT_SUCCESS(circle.offset(&out, 0.5));
    ASSERT_EQ(out.size(), 1u);
    ASSERT_EQ(out[0].size(), 2u);
    EXPECT_NEAR(out[0][0].x, -0.5, kEps);
    EXPECT_NEAR(out[0][1].x, 2.5, kEps);
    EXPECT_NEAR(out[0][0].bulge, 1.0, kEps);
    EXPECT_NEAR(out[0][1].bulge, 1.0, kEps);

    PABox box = out[0].bounding_box();
    EXPECT_NEAR((box.x0 + box.x1) * 0.5, 1.0, kEps);
    EXPECT_NEAR(box.x1 - box.x0, 3.0, kEps);

    EXPECT_SUCCESS(circle.offset(&out, -0.5));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NEAR(out[0].area(), Math::kPI * 0.25, kEps);

    EXPECT_SUCCESS(circle.offset(&out, -1.2));
    EXPECT_TRUE(out.empty());
  }

  INFO("Rectangle offset inward and outward");
  {
    PAPolyline rect({ PAVertex(0, 0), PAVertex(4, 0), PAVertex(4, 2), PAVertex(0, 2) }, true);
    PAPolylineArray out;

    EXPECT_SUCCESS(rect.offset(&out, -0.5));
    ASSERT_EQ(out.size(), 1u);
    ASSERT_EQ(out[0].size(), 4u);
    EXPECT_TRUE(contains_vertex(out[0], 0.5, 0.5));
    EXPECT_TRUE(contains_vertex(out[0], 3.5, 0.5));
    EXPECT_TRUE(contains_vertex(out[0], 3.5, 1.5));
    EXPECT_TRUE(contains_vertex(out[0], 0.5, 1.5));
    EXPECT_NEAR(out[0].area(), 3.0, kEps);

    EXPECT_SUCCESS(rect.offset(&out, 0.5));
    ASSERT_EQ(out.size(), 1u);
    ASSERT_EQ(out[0].size(), 8u);

    size_t arc_count = 0;
    for (size_t i = 0; i < out[0].size(); i++) {
      if (out[0][i].bulge != 0.0) {
        EXPECT_NEAR(out[0][i].bulge, 0.41421356237, 1e-9);
        arc_count++;
      }
    }
    EXPECT_EQ(arc_count, 4u);
    EXPECT_NEAR(out[0].area(), 14.0 + Math::kPI * 0.25, 1e-9);
  }

  INFO("Clockwise input is offset inward by a positive distance");
  {
    PAPolyline rect({ PAVertex(0, 0), PAVertex(0, 2), PAVertex(4, 2), PAVertex(4, 0) }, true);
    PAPolylineArray out;

    EXPECT_SUCCESS(rect.offset(&out, 0.5));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NEAR(out[0].area(), -3.0, kEps);
  }

  INFO("Distances within the tolerance are not a collapse");
  {
    PAPolyline rect({ PAVertex(0, 0), PAVertex(4, 0), PAVertex(4, 2), PAVertex(0, 2) }, true);
    PAPolylineArray out;

    EXPECT_SUCCESS(rect.offset(&out, -5e-6));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_TRUE(out[0].is_closed());
    EXPECT_NEAR(out[0].area(), (4.0 - 1e-5) * (2.0 - 1e-5), 1e-9);

    EXPECT_SUCCESS(rect.offset(&out, 5e-6));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NEAR(out[0].area(), 8.0 + 12.0 * 5e-6, 1e-6);
  }

  INFO("Zero distance returns the input");
  {
    PAPolyline rect({ PAVertex(0, 0), PAVertex(4, 0), PAVertex(4, 2), PAVertex(0, 2) }, true);
    PAPolylineArray out;

    EXPECT_SUCCESS(rect.offset(&out, 0.0));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], rect);
  }
}

UNIT(polyline_combine, PA_TEST_GROUP_GEOMETRY_BOOLEAN) {
  PAPolyline a = make_unit_square(0, 0);
  PAPolyline b = make_unit_square(0.5, 0.5);

  INFO("Intersection of shifted unit squares");
  {
    PAPolylineArray out;
    EXPECT_SUCCESS(a.combine(&out, b, PA_BOOLEAN_OPERATOR_INTERSECTION));
    ASSERT_EQ(out.size(), 1u);
    ASSERT_EQ(out[0].size(), 4u);
    EXPECT_TRUE(contains_vertex(out[0], 0.5, 0.5));
    EXPECT_TRUE(contains_vertex(out[0], 1.0, 0.5));
    EXPECT_TRUE(contains_vertex(out[0], 1.0, 1.0));
    EXPECT_TRUE(contains_vertex(out[0], 0.5, 1.0));
  }

  INFO("Union area equals the sum of areas minus the intersection area");
  {
    PAPolyline c({ PAVertex(0.6, 0.5, 1), PAVertex(1.4, 0.5, 1) }, true);

    PAPolylineArray union_out;
    PAPolylineArray intersection_out;
    EXPECT_SUCCESS(a.combine(&union_out, c, PA_BOOLEAN_OPERATOR_UNION));
    EXPECT_SUCCESS(a.combine(&intersection_out, c, PA_BOOLEAN_OPERATOR_INTERSECTION));

    EXPECT_NEAR(sum_area(union_out), a.area() + c.area() - sum_area(intersection_out), 1e-6);
  }

  INFO("Combining a polyline with itself");
  {
    PAPolylineArray out;

    EXPECT_SUCCESS(a.combine(&out, a, PA_BOOLEAN_OPERATOR_UNION));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NEAR(out[0].area(), a.area(), kEps);

    EXPECT_SUCCESS(a.combine(&out, a, PA_BOOLEAN_OPERATOR_INTERSECTION));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_NEAR(out[0].area(), a.area(), kEps);

    EXPECT_SUCCESS(a.combine(&out, a, PA_BOOLEAN_OPERATOR_DIFFERENCE));
    EXPECT_TRUE(out.empty());

    EXPECT_SUCCESS(a.combine(&out, a, PA_BOOLEAN_OPERATOR_XOR));
    EXPECT_TRUE(out.empty());
  }

  INFO("Disjoint inputs");
  {
    PAPolyline far = make_unit_square(5, 5);
    PAPolylineArray out;

    EXPECT_SUCCESS(a.combine(&out, far, PA_BOOLEAN_OPERATOR_UNION));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], a);
    EXPECT_EQ(out[1], far);

    EXPECT_SUCCESS(a.combine(&out, far, PA_BOOLEAN_OPERATOR_INTERSECTION));
    EXPECT_TRUE(out.empty());
  }
}

UNIT(polyline_intersects, PA_TEST_GROUP_GEOMETRY_INTERSECTION) {
  PAPolyline a = make_unit_square(0, 0);
  PAPolyline b = make_unit_square(0.5, 0.5);

  PAPointArray points;
  EXPECT_SUCCESS(pa_polyline_find_intersects(&points, a, b, 1e-5));
  EXPECT_EQ(points.size(), 2u);

  EXPECT_SUCCESS(pa_polyline_find_intersects(&points, a, make_unit_square(5, 5), 1e-5));
  EXPECT_TRUE(points.empty());

  bool result = false;
  PAPolyline bow_tie({ PAVertex(0, 0), PAVertex(2, 2), PAVertex(2, 0), PAVertex(0, 2) }, true);
  EXPECT_SUCCESS(pa_polyline_is_self_intersecting(&result, bow_tie, 1e-5));
  EXPECT_TRUE(result);

  EXPECT_SUCCESS(pa_polyline_is_self_intersecting(&result, a, 1e-5));
  EXPECT_FALSE(result);

  EXPECT_EQ(pa_polyline_is_self_intersecting(&result, a, 0.0), PAResult(PA_ERROR_INVALID_VALUE));
}

UNIT(polyline_parallel_calls, PA_TEST_GROUP_GEOMETRY_OFFSET) {
  // Calls share no state, each thread must get the same result as a single threaded call.
  PAPolyline rect({ PAVertex(0, 0), PAVertex(4, 0), PAVertex(4, 2), PAVertex(0, 2) }, true);
  PAPolyline square = make_unit_square(3.5, 1.5);

  PAPolylineArray expected_offset;
  PAPolylineArray expected_union;
  EXPECT_SUCCESS(rect.offset(&expected_offset, 0.25));
  EXPECT_SUCCESS(rect.combine(&expected_union, square, PA_BOOLEAN_OPERATOR_UNION));

  constexpr size_t kThreadCount = 4;
  PAResult results[kThreadCount] {};
  bool matches[kThreadCount] {};

  std::vector<std::thread> threads;
  for (size_t t = 0; t < kThreadCount; t++) {
    threads.emplace_back([&, t]() {
      bool ok = true;
      PAResult err = PA_SUCCESS;

      for (uint32_t i = 0; i < 50 && err == PA_SUCCESS; i++) {
        PAPolylineArray offset_out;
        PAPolylineArray union_out;

        err = rect.offset(&offset_out, 0.25);
        if (err == PA_SUCCESS)
          err = rect.combine(&union_out, square, PA_BOOLEAN_OPERATOR_UNION);

        ok &= offset_out == expected_offset && union_out == expected_union;
      }

      results[t] = err;
      matches[t] = ok;
    });
  }

  for (std::thread& thread : threads)
    thread.join();

  for (size_t t = 0; t < kThreadCount; t++) {
    EXPECT_SUCCESS(results[t]);
    EXPECT_TRUE(matches[t]);
  }
}

} // {Tests}
} // {pa}

#endif // PA_TEST
