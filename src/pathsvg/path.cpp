/*!
 * \file path.cpp
 * \brief file path.cpp
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


#include <vector>
#include <pathsvg/path.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>

namespace
{
  class PathPrivate
  {
  public:
    PathPrivate(void):
      m_open(false),
      m_current(0.0f, 0.0f),
      m_first(0.0f, 0.0f)
    {}

    void
    ensure_open(void)
    {
      if (!m_open)
        {
          start(m_current);
        }
    }

    void
    start(const pathsvg::vec2 &at)
    {
      m_events.push_back(pathsvg::PathEvent::begin(at));
      m_open = true;
      m_current = m_first = at;
    }

    std::vector<pathsvg::PathEvent> m_events;
    bool m_open;
    pathsvg::vec2 m_current, m_first;
  };
}

///////////////////////////////
// pathsvg::PathEvent methods
pathsvg::PathEvent
pathsvg::PathEvent::
begin(const vec2 &at)
{
  PathEvent R;

  R.m_type = begin_event;
  R.m_from = R.m_to = R.m_first = at;
  return R;
}

pathsvg::PathEvent
pathsvg::PathEvent::
line(const vec2 &from, const vec2 &to)
{
  PathEvent R;

  R.m_type = line_event;
  R.m_from = from;
  R.m_to = to;
  return R;
}

pathsvg::PathEvent
pathsvg::PathEvent::
quadratic(const vec2 &from, const vec2 &ctrl, const vec2 &to)
{
  PathEvent R;

  R.m_type = quadratic_event;
  R.m_from = from;
  R.m_ctrl1 = ctrl;
  R.m_to = to;
  return R;
}

pathsvg::PathEvent
pathsvg::PathEvent::
cubic(const vec2 &from, const vec2 &ctrl1,
      const vec2 &ctrl2, const vec2 &to)
{
  PathEvent R;

  R.m_type = cubic_event;
  R.m_from = from;
  R.m_ctrl1 = ctrl1;
  R.m_ctrl2 = ctrl2;
  R.m_to = to;
  return R;
}

pathsvg::PathEvent
pathsvg::PathEvent::
end(const vec2 &last, const vec2 &first, bool close)
{
  PathEvent R;

  R.m_type = end_event;
  R.m_from = R.m_to = last;
  R.m_first = first;
  R.m_close = close;
  return R;
}

//////////////////////////
// pathsvg::Path methods
pathsvg::Path::
Path(void)
{
  m_d = PATHSVGnew PathPrivate();
}

pathsvg::Path::
~Path()
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  PATHSVGdelete(d);
  m_d = nullptr;
}

pathsvg::Path&
pathsvg::Path::
begin(const vec2 &at)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);

  end(false);
  d->start(at);
  return *this;
}

pathsvg::Path&
pathsvg::Path::
line_to(const vec2 &to)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);

  d->ensure_open();
  d->m_events.push_back(PathEvent::line(d->m_current, to));
  d->m_current = to;
  return *this;
}

pathsvg::Path&
pathsvg::Path::
quadratic_to(const vec2 &ctrl, const vec2 &to)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);

  d->ensure_open();
  d->m_events.push_back(PathEvent::quadratic(d->m_current, ctrl, to));
  d->m_current = to;
  return *this;
}

pathsvg::Path&
pathsvg::Path::
cubic_to(const vec2 &ctrl1, const vec2 &ctrl2, const vec2 &to)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);

  d->ensure_open();
  d->m_events.push_back(PathEvent::cubic(d->m_current, ctrl1, ctrl2, to));
  d->m_current = to;
  return *this;
}

pathsvg::Path&
pathsvg::Path::
end(bool close)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);

  if (d->m_open)
    {
      d->m_events.push_back(PathEvent::end(d->m_current, d->m_first, close));
      d->m_open = false;
      if (close)
        {
          d->m_current = d->m_first;
        }
    }
  return *this;
}

pathsvg::Path&
pathsvg::Path::
add_event(const PathEvent &ev)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);

  d->m_events.push_back(ev);
  switch (ev.m_type)
    {
    case PathEvent::begin_event:
      d->m_open = true;
      d->m_current = d->m_first = ev.m_to;
      break;
    case PathEvent::end_event:
      d->m_open = false;
      d->m_current = (ev.m_close) ? ev.m_first : ev.m_to;
      break;
    default:
      d->m_current = ev.m_to;
    }
  return *this;
}

pathsvg::Path&
pathsvg::Path::
add_events(c_array<const PathEvent> evs)
{
  for (const PathEvent &ev : evs)
    {
      add_event(ev);
    }
  return *this;
}

void
pathsvg::Path::
clear(void)
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  d->m_events.clear();
  d->m_open = false;
  d->m_current = d->m_first = vec2(0.0f, 0.0f);
}

pathsvg::c_array<const pathsvg::PathEvent>
pathsvg::Path::
events(void) const
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  return make_c_array(static_cast<const std::vector<PathEvent>&>(d->m_events));
}

bool
pathsvg::Path::
subpath_open(void) const
{
  PathPrivate *d;
  d = static_cast<PathPrivate*>(m_d);
  return d->m_open;
}
