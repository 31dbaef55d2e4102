/*!
 * \file paint.cpp
 * \brief file paint.cpp
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


#include <pathsvg/document/paint.hpp>
#include <pathsvg/util/math.hpp>
#include <private/util_private.hpp>

namespace
{
  float
  clamp_opacity(float v)
  {
    /* NaN compares false, giving 0 */
    return (v > 0.0f) ? pathsvg::t_min(v, 1.0f) : 0.0f;
  }
}

pathsvg::Fill
pathsvg::
make_fill(const Color &color, float opacity)
{
  Fill R;

  R.m_color = color;
  R.m_opacity = clamp_opacity(opacity);
  return R;
}

pathsvg::Stroke
pathsvg::
make_stroke(const Color &color, float opacity, float width)
{
  Stroke R;

  R.m_color = color;
  R.m_opacity = clamp_opacity(opacity);
  if (width > 0.0f && t_isfinite(width))
    {
      R.m_width = width;
    }
  else
    {
      PATHSVGwarning("Invalid stroke width " << width << ", using 1");
    }
  return R;
}
