/*!
 * \file path_data_test.cpp
 * \brief file path_data_test.cpp
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


#include <limits>
#include <gtest/gtest.h>
#include <pathsvg/path_data.hpp>

using namespace pathsvg;

TEST(PathDataBuilder, MoveAfterMoveReplaces)
{
  PathDataBuilder b;
  PathData data;

  b.move_to(vec2(0.0f, 0.0f));
  b.move_to(vec2(5.0f, 5.0f));
  b.line_to(vec2(6.0f, 6.0f));
  EXPECT_EQ(2u, b.number_commands());

  ASSERT_EQ(routine_success, b.finish(&data));
  ASSERT_EQ(2u, data.number_commands());
  EXPECT_EQ(PathCommand::move_to_verb, data.command(0).m_verb);
  EXPECT_EQ(vec2(5.0f, 5.0f), data.command(0).m_pts[0]);
}

TEST(PathDataBuilder, CloseIgnoredWhenEmptyOrRepeated)
{
  PathDataBuilder b;
  PathData data;

  b.close();
  EXPECT_EQ(0u, b.number_commands());

  b.move_to(vec2(0.0f, 0.0f));
  b.line_to(vec2(1.0f, 0.0f));
  b.close();
  b.close();
  EXPECT_EQ(3u, b.number_commands());

  ASSERT_EQ(routine_success, b.finish(&data));
  EXPECT_EQ(PathCommand::close_verb, data.command(2).m_verb);
}

TEST(PathDataBuilder, DrawingAfterCloseInjectsMove)
{
  PathDataBuilder b;
  PathData data;

  b.move_to(vec2(1.0f, 2.0f));
  b.line_to(vec2(3.0f, 2.0f));
  b.close();
  b.line_to(vec2(4.0f, 4.0f));

  ASSERT_EQ(routine_success, b.finish(&data));
  ASSERT_EQ(5u, data.number_commands());
  EXPECT_EQ(PathCommand::move_to_verb, data.command(3).m_verb);
  EXPECT_EQ(vec2(1.0f, 2.0f), data.command(3).m_pts[0]);
  EXPECT_EQ(PathCommand::line_to_verb, data.command(4).m_verb);
}

TEST(PathDataBuilder, DrawingFirstStartsAtOrigin)
{
  PathDataBuilder b;
  PathData data;

  b.quad_to(vec2(1.0f, 1.0f), vec2(2.0f, 0.0f));
  ASSERT_EQ(routine_success, b.finish(&data));
  ASSERT_EQ(2u, data.number_commands());
  EXPECT_EQ(vec2(0.0f, 0.0f), data.command(0).m_pts[0]);
}

TEST(PathDataBuilder, FinishRejectsInvalid)
{
  PathDataBuilder b;
  PathData data;
  float nan(std::numeric_limits<float>::quiet_NaN());

  EXPECT_EQ(routine_fail, b.finish(&data));

  b.move_to(vec2(1.0f, 1.0f));
  EXPECT_EQ(routine_fail, b.finish(&data));

  b.move_to(vec2(0.0f, 0.0f));
  b.cubic_to(vec2(1.0f, nan), vec2(2.0f, 1.0f), vec2(3.0f, 0.0f));
  EXPECT_EQ(routine_fail, b.finish(&data));

  /* a failed finish leaves the builder empty */
  EXPECT_EQ(0u, b.number_commands());
  EXPECT_TRUE(data.empty());
}

TEST(PathData, BoundsCoverControlPoints)
{
  PathDataBuilder b;
  PathData data;

  b.move_to(vec2(0.0f, 0.0f));
  b.cubic_to(vec2(-2.0f, 5.0f), vec2(7.0f, -3.0f), vec2(4.0f, 1.0f));
  ASSERT_EQ(routine_success, b.finish(&data));

  EXPECT_EQ(Rect(-2.0f, -3.0f, 7.0f, 5.0f), data.bounds());
  EXPECT_EQ(4u, data.points().size());
}

TEST(PathData, CopiesAreIndependent)
{
  PathDataBuilder b;
  PathData a, c;

  b.move_to(vec2(0.0f, 0.0f));
  b.line_to(vec2(1.0f, 1.0f));
  ASSERT_EQ(routine_success, b.finish(&a));

  PathData copy(a);
  c = a;

  b.move_to(vec2(5.0f, 5.0f));
  b.line_to(vec2(6.0f, 7.0f));
  b.line_to(vec2(8.0f, 9.0f));
  ASSERT_EQ(routine_success, b.finish(&a));

  EXPECT_EQ(2u, copy.number_commands());
  EXPECT_EQ(2u, c.number_commands());
  EXPECT_EQ(3u, a.number_commands());
}
