/*!
 * \file transform.cpp
 * \brief file transform.cpp
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

#include <pathsvg/util/transform.hpp>
#include <pathsvg/util/math.hpp>

//////////////////////////////
// pathsvg::Transform methods
pathsvg::Transform
pathsvg::Transform::
from_translate(float tx, float ty)
{
  return Transform(1.0f, 0.0f, 0.0f, 1.0f, tx, ty);
}

pathsvg::Transform
pathsvg::Transform::
from_scale(float sx, float sy)
{
  return Transform(sx, 0.0f, 0.0f, sy, 0.0f, 0.0f);
}

pathsvg::Transform
pathsvg::Transform::
from_rotate(float degrees)
{
  float s, c, r;

  r = degrees_to_radians(degrees);
  s = t_sin(r);
  c = t_cos(r);
  return Transform(c, s, -s, c, 0.0f, 0.0f);
}

pathsvg::Transform
pathsvg::Transform::
from_skew(float kx, float ky)
{
  return Transform(1.0f, ky, kx, 1.0f, 0.0f, 0.0f);
}

pathsvg::Transform
pathsvg::Transform::
pre_concat(const Transform &b) const
{
  const Transform &a(*this);

  /* R = A * B, i.e. B is applied first */
  return Transform(a.m_sx * b.m_sx + a.m_kx * b.m_ky,
                   a.m_ky * b.m_sx + a.m_sy * b.m_ky,
                   a.m_sx * b.m_kx + a.m_kx * b.m_sy,
                   a.m_ky * b.m_kx + a.m_sy * b.m_sy,
                   a.m_sx * b.m_tx + a.m_kx * b.m_ty + a.m_tx,
                   a.m_ky * b.m_tx + a.m_sy * b.m_ty + a.m_ty);
}

pathsvg::Transform
pathsvg::Transform::
post_concat(const Transform &other) const
{
  return other.pre_concat(*this);
}

pathsvg::vec2
pathsvg::Transform::
map_point(const vec2 &p) const
{
  return vec2(m_sx * p.x() + m_kx * p.y() + m_tx,
              m_ky * p.x() + m_sy * p.y() + m_ty);
}

pathsvg::Rect
pathsvg::Transform::
map_rect(const Rect &r) const
{
  vec2 p;
  Rect R;

  p = map_point(r.corner(0));
  R.m_min_point = R.m_max_point = p;
  for (unsigned int c = 1; c < Rect::number_corners; ++c)
    {
      p = map_point(r.corner(c));
      R.union_rect(Rect(p, p));
    }
  return R;
}

bool
pathsvg::Transform::
is_identity(void) const
{
  return m_sx == 1.0f && m_ky == 0.0f
    && m_kx == 0.0f && m_sy == 1.0f
    && m_tx == 0.0f && m_ty == 0.0f;
}

bool
pathsvg::Transform::
is_finite(void) const
{
  return t_isfinite(m_sx) && t_isfinite(m_ky)
    && t_isfinite(m_kx) && t_isfinite(m_sy)
    && t_isfinite(m_tx) && t_isfinite(m_ty);
}

bool
pathsvg::Transform::
is_invertible(void) const
{
  float det;

  det = m_sx * m_sy - m_kx * m_ky;
  return det != 0.0f && t_isfinite(det);
}

bool
pathsvg::Transform::
operator==(const Transform &rhs) const
{
  return m_sx == rhs.m_sx && m_ky == rhs.m_ky
    && m_kx == rhs.m_kx && m_sy == rhs.m_sy
    && m_tx == rhs.m_tx && m_ty == rhs.m_ty;
}
