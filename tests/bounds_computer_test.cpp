/*!
 * \file bounds_computer_test.cpp
 * \brief file bounds_computer_test.cpp
 *
 * Copyright 2016 by Intel.
 *
 * Contact: kevin.rogovin@intel.com
 *
 * This Source Code Form is subject to the
 * terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with
 * this file, You can obtain one at
 * http://mozilla.org/MPL/2.0/.
 *
 * \author Kevin Rogovin <kevin.rogovin@intel.com>
 *
 */


#include <cstring>
#include <vector>
#include <type_traits>
#include <gtest/gtest.h>
#include <pathsvg/bounds_computer.hpp>
#include <pathsvg/path.hpp>
#include <pathsvg/path_data.hpp>
#include <pathsvg/path_translator.hpp>
#include <pathsvg/document/node.hpp>

using namespace pathsvg;

TEST(BoundsComputer, IdentityKeepsBounds)
{
  std::vector<BoundsSource> sources;
  CanvasGeometry canvas;

  sources.push_back(BoundsSource(Rect(0.0f, 0.0f, 10.0f, 20.0f)));
  sources.push_back(BoundsSource());
  sources.push_back(BoundsSource(Rect(-5.0f, 2.0f, 1.0f, 4.0f)));

  ASSERT_EQ(routine_success, compute_canvas(make_c_array(sources), Transform(), &canvas));
  EXPECT_EQ(15.0f, canvas.m_width);
  EXPECT_EQ(20.0f, canvas.m_height);
  EXPECT_EQ(Rect(-5.0f, 0.0f, 10.0f, 20.0f), canvas.m_view_rect);
}

TEST(BoundsComputer, RotatedUnitSquare)
{
  std::vector<BoundsSource> sources;
  CanvasGeometry canvas;

  sources.push_back(BoundsSource(Rect(0.0f, 0.0f, 1.0f, 1.0f)));
  ASSERT_EQ(routine_success,
            compute_canvas(make_c_array(sources), Transform::from_rotate(90.0f), &canvas));

  /* (x, y) maps to (-y, x) */
  EXPECT_NEAR(-1.0f, canvas.m_view_rect.min_x(), 1e-6f);
  EXPECT_NEAR(0.0f, canvas.m_view_rect.max_x(), 1e-6f);
  EXPECT_NEAR(0.0f, canvas.m_view_rect.min_y(), 1e-6f);
  EXPECT_NEAR(1.0f, canvas.m_view_rect.max_y(), 1e-6f);
}

TEST(BoundsComputer, RotationUsesAllCorners)
{
  std::vector<BoundsSource> sources;
  CanvasGeometry canvas;

  sources.push_back(BoundsSource(Rect(0.0f, 0.0f, 10.0f, 20.0f)));
  ASSERT_EQ(routine_success,
            compute_canvas(make_c_array(sources), Transform::from_rotate(45.0f), &canvas));

  /* the diagonal of the rotated rectangle spans more than either side */
  EXPECT_NEAR(30.0f / 1.41421356f, canvas.m_width, 1e-3f);
  EXPECT_NEAR(30.0f / 1.41421356f, canvas.m_height, 1e-3f);
}

TEST(BoundsComputer, EmptyInputFallsBack)
{
  std::vector<BoundsSource> sources;
  CanvasGeometry canvas;
  Error error;

  EXPECT_EQ(routine_fail,
            compute_canvas(make_c_array(sources), Transform(), &canvas, &error));
  EXPECT_EQ(256.0f, canvas.m_width);
  EXPECT_EQ(256.0f, canvas.m_height);
  EXPECT_EQ(Error::wrong_bounding_box_error, error.kind());
}

TEST(BoundsComputer, FallbackDoesNotChangeViewRect)
{
  std::vector<BoundsSource> sources;
  CanvasGeometry canvas;
  Error error;

  /* a horizontal segment has no height */
  sources.push_back(BoundsSource(Rect(0.0f, 3.0f, 10.0f, 3.0f)));
  EXPECT_EQ(routine_fail,
            compute_canvas(make_c_array(sources), Transform(), &canvas, &error));
  EXPECT_EQ(10.0f, canvas.m_width);
  EXPECT_EQ(256.0f, canvas.m_height);
  EXPECT_EQ(0.0f, canvas.m_view_rect.height());

  EXPECT_EQ(Error::wrong_bounding_box_error, error.kind());
  EXPECT_EQ(0.0f, error.min_x());
  EXPECT_EQ(10.0f, error.max_x());
  EXPECT_EQ(3.0f, error.min_y());
  EXPECT_EQ(3.0f, error.max_y());
}

TEST(BoundsComputer, Idempotent)
{
  std::vector<BoundsSource> sources;
  CanvasGeometry a, b;
  Transform tr(Transform::from_rotate(33.0f).pre_concat(Transform::from_scale(1.5f, 0.25f)));

  sources.push_back(BoundsSource(Rect(1.0f, 2.0f, 7.0f, 9.0f)));
  sources.push_back(BoundsSource(Rect(-3.0f, -1.0f, 0.5f, 0.5f)));

  ASSERT_EQ(routine_success, compute_canvas(make_c_array(sources), tr, &a));
  ASSERT_EQ(routine_success, compute_canvas(make_c_array(sources), tr, &b));
  EXPECT_EQ(0, std::memcmp(&a.m_width, &b.m_width, sizeof(float)));
  EXPECT_EQ(0, std::memcmp(&a.m_height, &b.m_height, sizeof(float)));
  EXPECT_EQ(a.m_view_rect, b.m_view_rect);
}

TEST(BoundsComputer, CubicShiftedByTranslation)
{
  Path path;
  PathData data;
  Rect local;
  std::vector<BoundsSource> sources;
  CanvasGeometry plain, moved;

  path.begin(vec2(0.0f, 0.0f))
    .cubic_to(vec2(2.0f, 6.0f), vec2(8.0f, -2.0f), vec2(10.0f, 4.0f))
    .end(false);
  ASSERT_EQ(routine_success, translate_path(path, &data));

  /* rebuild the bounds from the points of the commands */
  local = Rect(data.command(0).m_pts[0], data.command(0).m_pts[0]);
  for (unsigned int c = 0; c < data.number_commands(); ++c)
    {
      PathCommand cmd(data.command(c));
      for (unsigned int p = 0; p < cmd.number_points(); ++p)
        {
          local.union_rect(Rect(cmd.m_pts[p], cmd.m_pts[p]));
        }
    }
  EXPECT_EQ(Rect(0.0f, -2.0f, 10.0f, 6.0f), local);

  sources.push_back(BoundsSource(local));
  ASSERT_EQ(routine_success, compute_canvas(make_c_array(sources), Transform(), &plain));
  ASSERT_EQ(routine_success,
            compute_canvas(make_c_array(sources), Transform::from_translate(3.0f, -7.0f), &moved));

  EXPECT_EQ(plain.m_view_rect.min_x() + 3.0f, moved.m_view_rect.min_x());
  EXPECT_EQ(plain.m_view_rect.max_x() + 3.0f, moved.m_view_rect.max_x());
  EXPECT_EQ(plain.m_view_rect.min_y() - 7.0f, moved.m_view_rect.min_y());
  EXPECT_EQ(plain.m_view_rect.max_y() - 7.0f, moved.m_view_rect.max_y());
  EXPECT_EQ(plain.m_width, moved.m_width);
  EXPECT_EQ(plain.m_height, moved.m_height);
}

TEST(BoundsComputer, NodeOverload)
{
  PathDataBuilder b;
  PathData data;
  std::vector<reference_counted_ptr<Node> > nodes;
  CanvasGeometry canvas;

  b.move_to(vec2(0.0f, 0.0f));
  b.line_to(vec2(4.0f, 2.0f));
  ASSERT_EQ(routine_success, b.finish(&data));

  nodes.push_back(PATHSVGnew PathNode(data, Transform::from_translate(1.0f, 1.0f)));
  nodes.push_back(PATHSVGnew TextNode("ignored", 12.0f));

  ASSERT_EQ(routine_success, compute_canvas(make_c_array(nodes), Transform(), &canvas));
  EXPECT_EQ(Rect(1.0f, 1.0f, 5.0f, 3.0f), canvas.m_view_rect);
}

TEST(BoundsComputer, ViewsOnlyConvertToConstOfSameType)
{
  /* a view of sources must not be usable as a view of nodes,
   * otherwise the two compute_canvas() overloads are ambiguous
   */
  EXPECT_TRUE((std::is_convertible<c_array<BoundsSource>,
                                   c_array<const BoundsSource> >::value));
  EXPECT_FALSE((std::is_convertible<c_array<BoundsSource>,
                                    c_array<const reference_counted_ptr<Node> > >::value));
  EXPECT_TRUE((std::is_convertible<c_array<reference_counted_ptr<Node> >,
                                   c_array<const reference_counted_ptr<Node> > >::value));
  EXPECT_FALSE((std::is_convertible<c_array<reference_counted_ptr<Node> >,
                                    c_array<const BoundsSource> >::value));
  EXPECT_FALSE((std::is_convertible<c_array<const BoundsSource>,
                                    c_array<BoundsSource> >::value));
}

TEST(BoundsComputer, MutableVectorsPickMatchingOverload)
{
  std::vector<BoundsSource> sources;
  std::vector<reference_counted_ptr<Node> > nodes;
  c_array<BoundsSource> source_view;
  c_array<reference_counted_ptr<Node> > node_view;
  CanvasGeometry from_sources, from_nodes;
  PathDataBuilder b;
  PathData data;

  b.move_to(vec2(-2.0f, 0.0f));
  b.line_to(vec2(2.0f, 6.0f));
  ASSERT_EQ(routine_success, b.finish(&data));

  sources.push_back(BoundsSource(Rect(-2.0f, 0.0f, 2.0f, 6.0f)));
  nodes.push_back(PATHSVGnew PathNode(data, Transform()));
  source_view = make_c_array(sources);
  node_view = make_c_array(nodes);

  ASSERT_EQ(routine_success, compute_canvas(source_view, Transform(), &from_sources));
  ASSERT_EQ(routine_success, compute_canvas(node_view, Transform(), &from_nodes));
  EXPECT_EQ(from_sources.m_view_rect, from_nodes.m_view_rect);
  EXPECT_EQ(4.0f, from_nodes.m_width);
  EXPECT_EQ(6.0f, from_nodes.m_height);
}
