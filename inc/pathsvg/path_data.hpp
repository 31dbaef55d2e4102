/*!
 * \file path_data.hpp
 * \brief file path_data.hpp
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
#include <pathsvg/util/transform.hpp>
#include <pathsvg/util/c_array.hpp>
#include <pathsvg/util/util.hpp>

namespace pathsvg
{
/*!\addtogroup Paths
 * @{
 */

  /*!
   * \brief
   * A PathCommand is one absolute drawing command of a \ref
   * PathData.
   */
  class PathCommand
  {
  public:
    /*!
     * Enumeration to specify the verb of a command.
     */
    enum verb_t
      {
        move_to_verb, /*!< start a new contour at m_pts[0] */
        line_to_verb, /*!< line to m_pts[0] */
        quad_to_verb, /*!< quadratic curve, control m_pts[0], end m_pts[1] */
        cubic_to_verb, /*!< cubic curve, controls m_pts[0], m_pts[1], end m_pts[2] */
        close_verb, /*!< close the contour, no points */
      };

    /*!
     * Returns the number of points a verb carries.
     */
    static
    unsigned int
    number_points(enum verb_t v);

    /*!
     * Returns the number of points this command carries.
     */
    unsigned int
    number_points(void) const
    {
      return number_points(m_verb);
    }

    /*!
     * Verb of the command.
     */
    enum verb_t m_verb;

    /*!
     * Points of the command, only the first
     * number_points() are meaningful.
     */
    vecN<vec2, 3> m_pts;
  };

  /*!
   * \brief
   * A PathData is a validated sequence of absolute drawing
   * commands together with the bounds of its points. A PathData
   * is built by a \ref PathDataBuilder; a default constructed
   * PathData is empty.
   */
  class PathData
  {
  public:
    /*!
     * Ctor, an empty PathData.
     */
    PathData(void);

    /*!
     * Copy ctor.
     */
    PathData(const PathData &obj);

    ~PathData();

    /*!
     * Assignment operator.
     */
    PathData&
    operator=(const PathData &rhs);

    /*!
     * Swap operation.
     */
    void
    swap(PathData &obj);

    /*!
     * Returns the number of commands.
     */
    unsigned int
    number_commands(void) const;

    /*!
     * Returns the named command.
     * \param I index of command with 0 <= I < number_commands()
     */
    PathCommand
    command(unsigned int I) const;

    /*!
     * Returns the verbs of the commands.
     */
    c_array<const enum PathCommand::verb_t>
    verbs(void) const;

    /*!
     * Returns all the points of all commands, in order.
     */
    c_array<const vec2>
    points(void) const;

    /*!
     * Returns true if the PathData has no commands.
     */
    bool
    empty(void) const;

    /*!
     * Returns the smallest rectangle containing all points
     * (end points and control points) of the PathData.
     */
    const Rect&
    bounds(void) const;

    /*!
     * Compute the smallest rectangle that contains all points
     * of the PathData after mapping them by a transformation.
     * \param tr transformation to apply to the points
     * \param out_bb location to which to write the bounds
     * \returns false if the PathData is empty
     */
    bool
    transformed_bounds(const Transform &tr, Rect *out_bb) const;

  private:
    friend class PathDataBuilder;
    void *m_d;
  };

  /*!
   * \brief
   * A PathDataBuilder accumulates drawing commands and
   * validates them into a \ref PathData. The builder
   * normalizes the command sequence as follows:
   *  - a move_to() directly following a move_to() replaces
   *    the point of the earlier move_to(),
   *  - drawing before any move_to() or after a close()
   *    first inserts a move_to() at the start of the last
   *    contour (or at the origin if there is none),
   *  - a close() is ignored if there are no commands or the
   *    last command is already a close.
   */
  class PathDataBuilder:noncopyable
  {
  public:
    PathDataBuilder(void);

    ~PathDataBuilder();

    /*!
     * Start a new contour.
     */
    PathDataBuilder&
    move_to(const vec2 &pt);

    /*!
     * Add a line from the current point.
     */
    PathDataBuilder&
    line_to(const vec2 &pt);

    /*!
     * Add a quadratic Bezier curve from the current point.
     */
    PathDataBuilder&
    quad_to(const vec2 &ctrl, const vec2 &pt);

    /*!
     * Add a cubic Bezier curve from the current point.
     */
    PathDataBuilder&
    cubic_to(const vec2 &ctrl1, const vec2 &ctrl2, const vec2 &pt);

    /*!
     * Close the current contour.
     */
    PathDataBuilder&
    close(void);

    /*!
     * Returns the number of commands added so far.
     */
    unsigned int
    number_commands(void) const;

    /*!
     * Validate the commands and on success move them into a
     * PathData, leaving the builder empty. Fails if there are
     * no commands, if there is only a single command (i.e. a
     * lone move_to()) or if any point is not finite; on
     * failure the builder is left empty and \p out is not
     * modified.
     * \param out PathData to which to move the commands
     */
    enum return_code
    finish(PathData *out);

    /*!
     * Remove all commands.
     */
    void
    clear(void);

  private:
    void *m_d;
  };
/*! @} */
}
