/*!
 * \file path.hpp
 * \brief file path.hpp
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
#include <pathsvg/util/c_array.hpp>
#include <pathsvg/util/util.hpp>

namespace pathsvg
{
/*!\addtogroup Paths
 * @{
 */

  /*!
   * \brief
   * A PathEvent is one element of a path event stream. A
   * stream describes one or more subpaths, each starting
   * with a \ref begin_event and finishing with an \ref
   * end_event. Each event records the point where it starts
   * so that a consumer does not need to track a current point.
   */
  class PathEvent
  {
  public:
    /*!
     * Enumeration to specify the type of a PathEvent.
     */
    enum type_t
      {
        /*!
         * Start a new subpath at \ref m_to.
         */
        begin_event,

        /*!
         * Line segment from \ref m_from to \ref m_to.
         */
        line_event,

        /*!
         * Quadratic Bezier curve from \ref m_from to \ref m_to
         * with control point \ref m_ctrl1.
         */
        quadratic_event,

        /*!
         * Cubic Bezier curve from \ref m_from to \ref m_to
         * with control points \ref m_ctrl1 and \ref m_ctrl2.
         */
        cubic_event,

        /*!
         * End the current subpath; the last point of the
         * subpath is \ref m_to, its first point is \ref
         * m_first and \ref m_close indicates if the subpath
         * is to be closed.
         */
        end_event,
      };

    /*!
     * Ctor, initializes as a \ref begin_event at the origin.
     */
    PathEvent(void):
      m_type(begin_event),
      m_close(false)
    {}

    /*!
     * Create a \ref begin_event.
     * \param at starting point of the subpath
     */
    static
    PathEvent
    begin(const vec2 &at);

    /*!
     * Create a \ref line_event.
     */
    static
    PathEvent
    line(const vec2 &from, const vec2 &to);

    /*!
     * Create a \ref quadratic_event.
     */
    static
    PathEvent
    quadratic(const vec2 &from, const vec2 &ctrl, const vec2 &to);

    /*!
     * Create a \ref cubic_event.
     */
    static
    PathEvent
    cubic(const vec2 &from, const vec2 &ctrl1,
          const vec2 &ctrl2, const vec2 &to);

    /*!
     * Create an \ref end_event.
     * \param last last point of the subpath
     * \param first first point of the subpath
     * \param close if true, the subpath is closed
     */
    static
    PathEvent
    end(const vec2 &last, const vec2 &first, bool close);

    /*!
     * The type of the event
     */
    enum type_t m_type;

    /*!
     * Start point of a segment event; for an \ref end_event
     * it is the same as \ref m_to.
     */
    vec2 m_from;

    /*!
     * First control point of a \ref quadratic_event
     * or \ref cubic_event.
     */
    vec2 m_ctrl1;

    /*!
     * Second control point of a \ref cubic_event.
     */
    vec2 m_ctrl2;

    /*!
     * End point of a segment, point of a \ref begin_event
     * or last point of the subpath for an \ref end_event.
     */
    vec2 m_to;

    /*!
     * First point of the subpath, only meaningful
     * for an \ref end_event.
     */
    vec2 m_first;

    /*!
     * For an \ref end_event, true if the subpath is closed.
     */
    bool m_close;
  };

  /*!
   * \brief
   * A Path is a sequence of \ref PathEvent values. A Path is
   * built either with the begin(), line_to(), quadratic_to(),
   * cubic_to() and end() methods which record events that are
   * always continuous, or by adding events verbatim with
   * add_event().
   */
  class Path:noncopyable
  {
  public:
    /*!
     * Ctor, an empty Path.
     */
    Path(void);

    ~Path();

    /*!
     * Start a new subpath. If a subpath is still open,
     * it is first ended without closing it.
     * \param at first point of the new subpath
     */
    Path&
    begin(const vec2 &at);

    /*!
     * Add a line segment from the current point. If no
     * subpath is open, a subpath is started at the current
     * point (or at the origin for an empty Path).
     */
    Path&
    line_to(const vec2 &to);

    /*!
     * Add a quadratic Bezier curve from the current point.
     */
    Path&
    quadratic_to(const vec2 &ctrl, const vec2 &to);

    /*!
     * Add a cubic Bezier curve from the current point.
     */
    Path&
    cubic_to(const vec2 &ctrl1, const vec2 &ctrl2, const vec2 &to);

    /*!
     * End the open subpath; does nothing if no subpath is open.
     * \param close if true, the subpath is closed
     */
    Path&
    end(bool close);

    /*!
     * Append an event as is; no continuity checks are performed.
     */
    Path&
    add_event(const PathEvent &ev);

    /*!
     * Append a sequence of events as is.
     */
    Path&
    add_events(c_array<const PathEvent> evs);

    /*!
     * Remove all events.
     */
    void
    clear(void);

    /*!
     * Returns the events of the Path; the returned value is
     * valid until the Path is modified.
     */
    c_array<const PathEvent>
    events(void) const;

    /*!
     * Returns true if a subpath started with begin() has not
     * yet been ended.
     */
    bool
    subpath_open(void) const;

  private:
    void *m_d;
  };
/*! @} */
}
