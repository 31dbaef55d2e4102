/*!
 * \file rect.hpp
 * \brief file rect.hpp
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

namespace pathsvg
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * \brief
   * An axis aligned rectangle given by its min and max
   * points. No ordering between the two points is enforced;
   * use is_valid_nonempty() to check that the rectangle
   * actually covers an area.
   */
  template<typename T>
  class RectT
  {
  public:
    /*!
     * Number of corners, see corner().
     */
    static const unsigned int number_corners = 4;

    RectT(void):
      m_min_point(T(0), T(0)),
      m_max_point(T(0), T(0))
    {}

    RectT(const vecN<T, 2> &pmin, const vecN<T, 2> &pmax):
      m_min_point(pmin),
      m_max_point(pmax)
    {}

    /*!
     * Ctor from the left, top, right and bottom edges.
     */
    RectT(T left, T top, T right, T bottom):
      m_min_point(left, top),
      m_max_point(right, bottom)
    {}

    T
    min_x(void) const { return m_min_point.x(); }

    T
    min_y(void) const { return m_min_point.y(); }

    T
    max_x(void) const { return m_max_point.x(); }

    T
    max_y(void) const { return m_max_point.y(); }

    T
    width(void) const
    {
      return max_x() - min_x();
    }

    T
    height(void) const
    {
      return max_y() - min_y();
    }

    /*!
     * Returns a corner of the rectangle; bit 0 of c selects
     * the max-x side and bit 1 the max-y side, so corner(0)
     * is the min point and corner(3) the max point.
     * \param c corner index, must be less than number_corners
     */
    vecN<T, 2>
    corner(unsigned int c) const
    {
      PATHSVGassert(c < number_corners);
      return vecN<T, 2>((c & 1u) ? max_x() : min_x(),
                        (c & 2u) ? max_y() : min_y());
    }

    /*!
     * True when all four coordinates are finite and the
     * width and height are finite and strictly positive.
     */
    bool
    is_valid_nonempty(void) const
    {
      return t_isfinite(min_x()) && t_isfinite(min_y())
        && t_isfinite(max_x()) && t_isfinite(max_y())
        && t_isfinite(width()) && t_isfinite(height())
        && width() > T(0) && height() > T(0);
    }

    /*!
     * Grow this rectangle to also cover r.
     */
    RectT&
    union_rect(const RectT &r)
    {
      m_min_point = vecN<T, 2>(t_min(min_x(), r.min_x()), t_min(min_y(), r.min_y()));
      m_max_point = vecN<T, 2>(t_max(max_x(), r.max_x()), t_max(max_y(), r.max_y()));
      return *this;
    }

    bool
    operator==(const RectT &rhs) const
    {
      return m_min_point == rhs.m_min_point
        && m_max_point == rhs.m_max_point;
    }

    vecN<T, 2> m_min_point;
    vecN<T, 2> m_max_point;
  };

  typedef RectT<float> Rect;

/*! @} */
} //namespace pathsvg
