/*!
 * \file transform.hpp
 * \brief file transform.hpp
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
#include <pathsvg/util/rect.hpp>

namespace pathsvg
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * \brief
   * A Transform represents a 2D affine transformation.
   * A point (x, y) is mapped to
   * \code
   * (sx * x + kx * y + tx, ky * x + sy * y + ty)
   * \endcode
   * The six values are in the same order as the
   * SVG matrix(a b c d e f) notation, i.e.
   * a = sx, b = ky, c = kx, d = sy, e = tx, f = ty.
   */
  class Transform
  {
  public:
    /*!
     * Ctor, initializes as the identity.
     */
    Transform(void):
      m_sx(1.0f), m_ky(0.0f),
      m_kx(0.0f), m_sy(1.0f),
      m_tx(0.0f), m_ty(0.0f)
    {}

    /*!
     * Ctor from the six coefficients in SVG matrix order.
     */
    Transform(float sx, float ky, float kx, float sy, float tx, float ty):
      m_sx(sx), m_ky(ky),
      m_kx(kx), m_sy(sy),
      m_tx(tx), m_ty(ty)
    {}

    /*!
     * Returns a translation transformation.
     */
    static
    Transform
    from_translate(float tx, float ty);

    /*!
     * Returns a scaling transformation.
     */
    static
    Transform
    from_scale(float sx, float sy);

    /*!
     * Returns a rotation about the origin.
     * \param degrees angle in degrees, positive values
     *                rotate from the x-axis towards the y-axis
     */
    static
    Transform
    from_rotate(float degrees);

    /*!
     * Returns a skew transformation.
     * \param kx multiplier of y added to x
     * \param ky multiplier of x added to y
     */
    static
    Transform
    from_skew(float kx, float ky);

    /*!
     * Returns the transformation that applies \p other
     * first and then this transformation.
     */
    Transform
    pre_concat(const Transform &other) const;

    /*!
     * Returns the transformation that applies this
     * transformation first and then \p other.
     */
    Transform
    post_concat(const Transform &other) const;

    /*!
     * Map a point by this transformation.
     */
    vec2
    map_point(const vec2 &p) const;

    /*!
     * Returns the smallest Rect containing the image of
     * the four corners of a Rect under this transformation.
     */
    Rect
    map_rect(const Rect &r) const;

    /*!
     * Returns true if this transformation is exactly
     * the identity.
     */
    bool
    is_identity(void) const;

    /*!
     * Returns true if each coefficient is finite.
     */
    bool
    is_finite(void) const;

    /*!
     * Returns true if this transformation has a
     * non-zero and finite determinant.
     */
    bool
    is_invertible(void) const;

    bool
    operator==(const Transform &rhs) const;

    bool
    operator!=(const Transform &rhs) const
    {
      return !operator==(rhs);
    }

    float m_sx, m_ky;
    float m_kx, m_sy;
    float m_tx, m_ty;
  };

/*! @} */
}
