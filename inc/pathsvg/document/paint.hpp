/*!
 * \file paint.hpp
 * \brief file paint.hpp
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
#include <pathsvg/util/util.hpp>

namespace pathsvg
{
/*!\addtogroup Document
 * @{
 */

  /*!
   * \brief
   * An RGB color with 8 bits per channel.
   */
  class Color
  {
  public:
    /*!
     * Ctor, initializes as black.
     */
    Color(void):
      m_red(0), m_green(0), m_blue(0)
    {}

    /*!
     * Ctor.
     */
    Color(uint8_t r, uint8_t g, uint8_t b):
      m_red(r), m_green(g), m_blue(b)
    {}

    static
    Color
    black(void)
    {
      return Color(0, 0, 0);
    }

    static
    Color
    white(void)
    {
      return Color(255, 255, 255);
    }

    bool
    operator==(const Color &rhs) const
    {
      return m_red == rhs.m_red
        && m_green == rhs.m_green
        && m_blue == rhs.m_blue;
    }

    bool
    operator!=(const Color &rhs) const
    {
      return !operator==(rhs);
    }

    uint8_t m_red, m_green, m_blue;
  };

  /*!
   * \brief
   * How the interior of a path is filled.
   */
  class Fill
  {
  public:
    /*!
     * Enumeration of fill rules.
     */
    enum fill_rule_t
      {
        nonzero_fill_rule,
        evenodd_fill_rule,
      };

    Fill(void):
      m_opacity(1.0f),
      m_fill_rule(nonzero_fill_rule)
    {}

    /*!
     * Color of the fill.
     */
    Color m_color;

    /*!
     * Opacity of the fill, in the range [0, 1].
     */
    float m_opacity;

    /*!
     * Fill rule.
     */
    enum fill_rule_t m_fill_rule;
  };

  /*!
   * \brief
   * How the outline of a path is stroked.
   */
  class Stroke
  {
  public:
    /*!
     * Enumeration of cap styles.
     */
    enum cap_t
      {
        butt_cap,
        round_cap,
        square_cap,
      };

    /*!
     * Enumeration of join styles.
     */
    enum join_t
      {
        miter_join,
        round_join,
        bevel_join,
      };

    Stroke(void):
      m_opacity(1.0f),
      m_width(1.0f),
      m_miter_limit(4.0f),
      m_cap(butt_cap),
      m_join(miter_join)
    {}

    /*!
     * Color of the stroke.
     */
    Color m_color;

    /*!
     * Opacity of the stroke, in the range [0, 1].
     */
    float m_opacity;

    /*!
     * Width of the stroke, always positive.
     */
    float m_width;

    float m_miter_limit;
    enum cap_t m_cap;
    enum join_t m_join;
  };

  /*!
   * Create a \ref Fill of a color with an opacity; the
   * opacity is clamped to [0, 1].
   */
  Fill
  make_fill(const Color &color, float opacity);

  /*!
   * Create a \ref Stroke of a color, opacity and width;
   * the opacity is clamped to [0, 1]. A width that is
   * not finite and positive is replaced by 1 and a
   * warning is printed.
   */
  Stroke
  make_stroke(const Color &color, float opacity, float width);

/*! @} */
}
