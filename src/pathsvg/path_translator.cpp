/*!
 * \file path_translator.cpp
 * \brief file path_translator.cpp
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


#include <pathsvg/path_translator.hpp>

namespace
{
  class CurrentPoint
  {
  public:
    CurrentPoint(void):
      m_present(false)
    {}

    /* returns true if a point has been emitted and
     * it is not exactly the same as p
     */
    bool
    discontinuous(const pathsvg::vec2 &p) const
    {
      return m_present && p != m_pt;
    }

    void
    set(const pathsvg::vec2 &p)
    {
      m_pt = p;
      m_present = true;
    }

  private:
    bool m_present;
    pathsvg::vec2 m_pt;
  };
}

enum pathsvg::return_code
pathsvg::
translate_events(c_array<const PathEvent> events, PathData *out)
{
  PathDataBuilder builder;
  CurrentPoint current;

  for (const PathEvent &ev : events)
    {
      switch (ev.m_type)
        {
        case PathEvent::begin_event:
          builder.move_to(ev.m_to);
          break;

        case PathEvent::line_event:
          if (current.discontinuous(ev.m_from))
            {
              builder.move_to(ev.m_from);
            }
          builder.line_to(ev.m_to);
          break;

        case PathEvent::quadratic_event:
          if (current.discontinuous(ev.m_from))
            {
              builder.move_to(ev.m_from);
            }
          builder.quad_to(ev.m_ctrl1, ev.m_to);
          break;

        case PathEvent::cubic_event:
          if (current.discontinuous(ev.m_from))
            {
              builder.move_to(ev.m_from);
            }
          builder.cubic_to(ev.m_ctrl1, ev.m_ctrl2, ev.m_to);
          break;

        case PathEvent::end_event:
          if (current.discontinuous(ev.m_to))
            {
              builder.move_to(ev.m_to);
            }
          if (ev.m_close)
            {
              builder.line_to(ev.m_first);
              builder.close();
            }
          break;
        }
      current.set(ev.m_to);
    }

  return builder.finish(out);
}

enum pathsvg::return_code
pathsvg::
translate_path(const Path &path, PathData *out)
{
  return translate_events(path.events(), out);
}
