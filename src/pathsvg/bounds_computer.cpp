/*!
 * \file bounds_computer.cpp
 * \brief file bounds_computer.cpp
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
#include <vector>
#include <pathsvg/bounds_computer.hpp>
#include <pathsvg/document/node.hpp>
#include <pathsvg/util/math.hpp>

namespace
{
  const float fallback_canvas_size = 256.0f;

  bool
  valid_size(float w, float h)
  {
    return w > 0.0f && h > 0.0f
      && pathsvg::t_isfinite(w) && pathsvg::t_isfinite(h);
  }
}

enum pathsvg::return_code
pathsvg::
compute_canvas(c_array<const BoundsSource> primitives,
               const Transform &global,
               CanvasGeometry *out, Error *out_error)
{
  const float inf(std::numeric_limits<float>::infinity());
  float min_x(inf), max_x(-inf), min_y(inf), max_y(-inf);

  for (const BoundsSource &src : primitives)
    {
      if (!src.m_present)
        {
          continue;
        }

      for (unsigned int c = 0; c < Rect::number_corners; ++c)
        {
          vec2 p;

          p = global.map_point(src.m_rect.corner(c));
          min_x = t_min(min_x, p.x());
          max_x = t_max(max_x, p.x());
          min_y = t_min(min_y, p.y());
          max_y = t_max(max_y, p.y());
        }
    }

  out->m_width = (max_x - min_x > 0.0f) ? max_x - min_x : fallback_canvas_size;
  out->m_height = (max_y - min_y > 0.0f) ? max_y - min_y : fallback_canvas_size;
  out->m_view_rect = Rect(min_x, min_y, max_x, max_y);

  if (!valid_size(out->m_width, out->m_height)
      || !out->m_view_rect.is_valid_nonempty())
    {
      if (out_error)
        {
          *out_error = Error::wrong_bounding_box(min_x, max_x, min_y, max_y);
        }
      return routine_fail;
    }

  return routine_success;
}

enum pathsvg::return_code
pathsvg::
compute_canvas(c_array<const reference_counted_ptr<Node> > nodes,
               const Transform &global,
               CanvasGeometry *out, Error *out_error)
{
  std::vector<BoundsSource> sources;

  sources.reserve(nodes.size());
  for (const reference_counted_ptr<Node> &n : nodes)
    {
      Rect bb;

      if (n->calculate_bbox(&bb))
        {
          sources.push_back(BoundsSource(bb));
        }
      else
        {
          sources.push_back(BoundsSource());
        }
    }
  return compute_canvas(make_c_array(static_cast<const std::vector<BoundsSource>&>(sources)),
                        global, out, out_error);
}
