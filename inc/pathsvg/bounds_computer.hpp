/*!
 * \file bounds_computer.hpp
 * \brief file bounds_computer.hpp
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

#include <pathsvg/util/rect.hpp>
#include <pathsvg/util/transform.hpp>
#include <pathsvg/util/c_array.hpp>
#include <pathsvg/util/reference_counted.hpp>
#include <pathsvg/error.hpp>

namespace pathsvg
{
  class Node;

/*!\addtogroup Document
 * @{
 */

  /*!
   * \brief
   * A BoundsSource is the optional local bounds of one drawing
   * primitive, i.e. its bounds with its own transformation
   * applied but without the global transformation.
   */
  class BoundsSource
  {
  public:
    /*!
     * Ctor, a primitive without bounds.
     */
    BoundsSource(void):
      m_present(false)
    {}

    /*!
     * Ctor, a primitive with bounds.
     */
    explicit
    BoundsSource(const Rect &r):
      m_present(true),
      m_rect(r)
    {}

    /*!
     * If false, the primitive has no bounds and
     * does not contribute to the canvas.
     */
    bool m_present;

    /*!
     * Local bounds of the primitive, only
     * meaningful if \ref m_present is true.
     */
    Rect m_rect;
  };

  /*!
   * \brief
   * The size and view rectangle of a document.
   */
  class CanvasGeometry
  {
  public:
    CanvasGeometry(void):
      m_width(0.0f),
      m_height(0.0f)
    {}

    /*!
     * Width of the canvas; when the bounds have no
     * positive width, this is the fallback 256.
     */
    float m_width;

    /*!
     * Height of the canvas; when the bounds have no
     * positive height, this is the fallback 256.
     */
    float m_height;

    /*!
     * Rectangle the canvas displays, always the union
     * of the transformed bounds; it is not adjusted when
     * \ref m_width or \ref m_height take the fallback value.
     */
    Rect m_view_rect;
  };

  /*!
   * Compute the canvas of a set of primitives placed under a
   * single global transformation: the four corners of the
   * bounds of each primitive are mapped by the transformation
   * and the smallest containing rectangle is the view rectangle.
   * All fields of \p out are always written; the function fails
   * with \ref Error::wrong_bounding_box_error if the width or
   * height is not finite and positive or if the view rectangle
   * does not have a finite, strictly positive area. In particular
   * a set without any bounds gives a width and height of 256 but
   * fails.
   * \param primitives local bounds of each primitive
   * \param global transformation applied to all primitives
   * \param out location to which to write the canvas geometry
   * \param out_error if non-null, location to which to write the
   *                  Error on failure
   */
  enum return_code
  compute_canvas(c_array<const BoundsSource> primitives,
                 const Transform &global,
                 CanvasGeometry *out, Error *out_error = nullptr);

  /*!
   * Overload of compute_canvas() that takes the bounds of
   * each node, see Node::calculate_bbox().
   */
  enum return_code
  compute_canvas(c_array<const reference_counted_ptr<Node> > nodes,
                 const Transform &global,
                 CanvasGeometry *out, Error *out_error = nullptr);

/*! @} */
}
