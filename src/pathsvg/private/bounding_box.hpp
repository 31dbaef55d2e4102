/*!
 * \file bounding_box.hpp
 * \brief file bounding_box.hpp
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


#pragma once

#include <pathsvg/util/vecN.hpp>
#include <pathsvg/util/math.hpp>
#include <pathsvg/util/rect.hpp>
#include <pathsvg/util/math.hpp>

namespace pathsvg
{
  /*!
   * Accumulates the smallest axis aligned box containing
   * a set of points; starts empty.
   */
  template<typename T>
  class BoundingBox
  {
  public:
    typedef vecN<T, 2> pt_type;

    BoundingBox(void):
      m_empty(true)
    {}

    void
    union_point(const pt_type &pt)
    {
      if (m_empty)
        {
          m_empty = false;
          m_min = m_max = pt;
          return;
        }

      for (unsigned int c = 0; c < 2; ++c)
        {
          m_min[c] = t_min(m_min[c], pt[c]);
          m_max[c] = t_max(m_max[c], pt[c]);
        }
    }

    void
    union_rect(const RectT<T> &r)
    {
      union_point(r.m_min_point);
      union_point(r.m_max_point);
    }

    bool
    empty(void) const
    {
      return m_empty;
    }

    const pt_type&
    min_point(void) const
    {
      return m_min;
    }

    const pt_type&
    max_point(void) const
    {
      return m_max;
    }

    RectT<T>
    as_rect(void) const
    {
      return RectT<T>(m_min, m_max);
    }

  private:
    pt_type m_min, m_max;
    bool m_empty;
  };
}
