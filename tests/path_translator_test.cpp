/*!
 * \file path_translator_test.cpp
 * \brief file path_translator_test.cpp
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


#include <vector>
#include <limits>
#include <gtest/gtest.h>
#include <pathsvg/path.hpp>
#include <pathsvg/path_data.hpp>
#include <pathsvg/path_translator.hpp>

using namespace pathsvg;

namespace
{
  std::vector<enum PathCommand::verb_t>
  verbs_of(const PathData &data)
  {
    c_array<const enum PathCommand::verb_t> v(data.verbs());
    return std::vector<enum PathCommand::verb_t>(v.begin(), v.end());
  }
}

TEST(PathTranslator, ClosedTriangleFromBuilder)
{
  Path path;
  PathData data;

  path.begin(vec2(0.0f, 0.0f))
    .line_to(vec2(1.0f, 0.0f))
    .line_to(vec2(1.0f, 1.0f))
    .end(true);

  ASSERT_EQ(routine_success, translate_path(path, &data));

  std::vector<enum PathCommand::verb_t> expected =
    {
      PathCommand::move_to_verb,
      PathCommand::line_to_verb,
      PathCommand::line_to_verb,
      PathCommand::line_to_verb,
      PathCommand::close_verb,
    };
  EXPECT_EQ(expected, verbs_of(data));

  /* the closing line goes back to the first point */
  PathCommand closing(data.command(3));
  EXPECT_EQ(vec2(0.0f, 0.0f), closing.m_pts[0]);
}

TEST(PathTranslator, QuadraticSegmentKeepsControlPoint)
{
  Path path;
  PathData data;

  path.begin(vec2(0.0f, 0.0f))
    .line_to(vec2(4.0f, 0.0f))
    .quadratic_to(vec2(8.0f, 4.0f), vec2(4.0f, 8.0f))
    .end(true);

  ASSERT_EQ(routine_success, translate_path(path, &data));
  ASSERT_EQ(5u, data.number_commands());

  PathCommand quad(data.command(2));
  EXPECT_EQ(PathCommand::quad_to_verb, quad.m_verb);
  EXPECT_EQ(vec2(8.0f, 4.0f), quad.m_pts[0]);
  EXPECT_EQ(vec2(4.0f, 8.0f), quad.m_pts[1]);
}

TEST(PathTranslator, OpenSubpathHasNoClose)
{
  Path path;
  PathData data;

  path.begin(vec2(0.0f, 0.0f))
    .cubic_to(vec2(1.0f, 2.0f), vec2(3.0f, 2.0f), vec2(4.0f, 0.0f))
    .end(false);

  ASSERT_EQ(routine_success, translate_path(path, &data));

  std::vector<enum PathCommand::verb_t> expected =
    {
      PathCommand::move_to_verb,
      PathCommand::cubic_to_verb,
    };
  EXPECT_EQ(expected, verbs_of(data));
}

TEST(PathTranslator, DiscontinuityAddsOneMove)
{
  std::vector<PathEvent> continuous =
    {
      PathEvent::begin(vec2(0.0f, 0.0f)),
      PathEvent::line(vec2(0.0f, 0.0f), vec2(1.0f, 0.0f)),
      PathEvent::line(vec2(1.0f, 0.0f), vec2(2.0f, 2.0f)),
      PathEvent::end(vec2(2.0f, 2.0f), vec2(0.0f, 0.0f), false),
    };
  std::vector<PathEvent> broken =
    {
      PathEvent::begin(vec2(0.0f, 0.0f)),
      PathEvent::line(vec2(0.0f, 0.0f), vec2(1.0f, 0.0f)),
      PathEvent::line(vec2(5.0f, 5.0f), vec2(2.0f, 2.0f)),
      PathEvent::end(vec2(2.0f, 2.0f), vec2(0.0f, 0.0f), false),
    };
  PathData a, b;

  ASSERT_EQ(routine_success, translate_events(make_c_array(continuous), &a));
  ASSERT_EQ(routine_success, translate_events(make_c_array(broken), &b));
  EXPECT_EQ(a.number_commands() + 1, b.number_commands());

  PathCommand repair(b.command(2));
  EXPECT_EQ(PathCommand::move_to_verb, repair.m_verb);
  EXPECT_EQ(vec2(5.0f, 5.0f), repair.m_pts[0]);
  EXPECT_EQ(PathCommand::line_to_verb, b.command(3).m_verb);
}

TEST(PathTranslator, EachDiscontinuityCounts)
{
  std::vector<PathEvent> events =
    {
      PathEvent::begin(vec2(0.0f, 0.0f)),
      PathEvent::line(vec2(0.0f, 0.0f), vec2(1.0f, 0.0f)),
      PathEvent::quadratic(vec2(3.0f, 0.0f), vec2(4.0f, 1.0f), vec2(5.0f, 0.0f)),
      PathEvent::cubic(vec2(7.0f, 0.0f), vec2(8.0f, 1.0f), vec2(9.0f, 1.0f), vec2(10.0f, 0.0f)),
      PathEvent::end(vec2(11.0f, 0.0f), vec2(0.0f, 0.0f), false),
    };
  PathData data;

  /* M L, M Q, M C, and the end event moves to its last point */
  ASSERT_EQ(routine_success, translate_events(make_c_array(events), &data));
  EXPECT_EQ(7u, data.number_commands());
  EXPECT_EQ(PathCommand::move_to_verb, data.command(6).m_verb);
  EXPECT_EQ(vec2(11.0f, 0.0f), data.command(6).m_pts[0]);
}

TEST(PathTranslator, SubpathsStayIndependent)
{
  Path path;
  PathData data;

  path.begin(vec2(0.0f, 0.0f))
    .line_to(vec2(1.0f, 0.0f))
    .end(false);
  path.begin(vec2(10.0f, 10.0f))
    .line_to(vec2(11.0f, 10.0f))
    .end(true);

  ASSERT_EQ(routine_success, translate_path(path, &data));

  std::vector<enum PathCommand::verb_t> expected =
    {
      PathCommand::move_to_verb,
      PathCommand::line_to_verb,
      PathCommand::move_to_verb,
      PathCommand::line_to_verb,
      PathCommand::line_to_verb,
      PathCommand::close_verb,
    };
  EXPECT_EQ(expected, verbs_of(data));
  EXPECT_EQ(vec2(10.0f, 10.0f), data.command(2).m_pts[0]);
  EXPECT_EQ(vec2(10.0f, 10.0f), data.command(4).m_pts[0]);
}

TEST(PathTranslator, DegenerateSegmentsAccepted)
{
  Path path;
  PathData data;

  path.begin(vec2(3.0f, 3.0f))
    .line_to(vec2(3.0f, 3.0f))
    .end(false);

  EXPECT_EQ(routine_success, translate_path(path, &data));
  EXPECT_EQ(2u, data.number_commands());
}

TEST(PathTranslator, EmptyInputFails)
{
  Path path;
  PathData data;

  EXPECT_EQ(routine_fail, translate_path(path, &data));

  path.begin(vec2(1.0f, 1.0f)).end(false);
  EXPECT_EQ(routine_fail, translate_path(path, &data));
}

TEST(PathTranslator, NonFinitePointFails)
{
  Path path;
  PathData data;
  float inf(std::numeric_limits<float>::infinity());

  path.begin(vec2(0.0f, 0.0f))
    .line_to(vec2(inf, 0.0f))
    .end(false);
  EXPECT_EQ(routine_fail, translate_path(path, &data));
}
