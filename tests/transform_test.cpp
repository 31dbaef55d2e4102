/*!
 * \file transform_test.cpp
 * \brief file transform_test.cpp
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


#include <gtest/gtest.h>
#include <pathsvg/util/transform.hpp>

using namespace pathsvg;

TEST(Transform, DefaultIsIdentity)
{
  Transform tr;

  EXPECT_TRUE(tr.is_identity());
  EXPECT_EQ(vec2(3.0f, -4.0f), tr.map_point(vec2(3.0f, -4.0f)));
}

TEST(Transform, TranslateThenScale)
{
  Transform tr;

  /* pre_concat applies the argument first */
  tr = Transform::from_translate(10.0f, 20.0f).pre_concat(Transform::from_scale(2.0f, 3.0f));
  EXPECT_EQ(vec2(12.0f, 23.0f), tr.map_point(vec2(1.0f, 1.0f)));

  tr = Transform::from_translate(10.0f, 20.0f).post_concat(Transform::from_scale(2.0f, 3.0f));
  EXPECT_EQ(vec2(22.0f, 63.0f), tr.map_point(vec2(1.0f, 1.0f)));
}

TEST(Transform, RotateQuarterTurn)
{
  Transform tr(Transform::from_rotate(90.0f));
  vec2 p(tr.map_point(vec2(1.0f, 0.0f)));

  EXPECT_NEAR(0.0f, p.x(), 1e-6f);
  EXPECT_NEAR(1.0f, p.y(), 1e-6f);
  EXPECT_TRUE(tr.is_invertible());
}

TEST(Transform, SkewAndDegenerate)
{
  Transform skew(Transform::from_skew(0.5f, 0.0f));

  EXPECT_EQ(vec2(1.5f, 1.0f), skew.map_point(vec2(1.0f, 1.0f)));
  EXPECT_FALSE(Transform::from_scale(0.0f, 1.0f).is_invertible());
  EXPECT_TRUE(skew != Transform());
}

TEST(Transform, MapRectIsAxisAligned)
{
  Transform tr(Transform::from_rotate(180.0f));
  Rect r(tr.map_rect(Rect(1.0f, 2.0f, 3.0f, 5.0f)));

  EXPECT_NEAR(-3.0f, r.min_x(), 1e-5f);
  EXPECT_NEAR(-1.0f, r.max_x(), 1e-5f);
  EXPECT_NEAR(-5.0f, r.min_y(), 1e-5f);
  EXPECT_NEAR(-2.0f, r.max_y(), 1e-5f);
}
