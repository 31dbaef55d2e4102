/*!
 * \file path_data.cpp
 * \brief file path_data.cpp
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
#include <algorithm>
#include <pathsvg/path_data.hpp>
#include <pathsvg/util/math.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>
#include <private/util_private.hpp>
#include <private/bounding_box.hpp>

namespace
{
  class PathDataPrivate
  {
  public:
    void
    clear(void)
    {
      m_verbs.clear();
      m_points.clear();
      m_offsets.clear();
      m_bounds = pathsvg::Rect();
    }

    std::vector<enum pathsvg::PathCommand::verb_t> m_verbs;
    std::vector<pathsvg::vec2> m_points;

    /* m_offsets[i] is the index into m_points of the
     * first point of command i
     */
    std::vector<unsigned int> m_offsets;
    pathsvg::Rect m_bounds;
  };

  class PathDataBuilderPrivate
  {
  public:
    PathDataBuilderPrivate(void):
      m_move_to_required(true),
      m_last_move_to_index(0)
    {}

    void
    clear(void)
    {
      m_data.clear();
      m_move_to_required = true;
      m_last_move_to_index = 0;
    }

    void
    inject_move_to_if_needed(void);

    void
    add(enum pathsvg::PathCommand::verb_t v,
        const pathsvg::vec2 *pts);

    PathDataPrivate m_data;
    bool m_move_to_required;
    unsigned int m_last_move_to_index;
  };
}

////////////////////////////////////////
// PathDataBuilderPrivate methods
void
PathDataBuilderPrivate::
inject_move_to_if_needed(void)
{
  if (m_move_to_required)
    {
      pathsvg::vec2 pt(0.0f, 0.0f);

      if (m_last_move_to_index < m_data.m_points.size())
        {
          pt = m_data.m_points[m_last_move_to_index];
        }
      m_data.m_offsets.push_back(m_data.m_points.size());
      m_data.m_verbs.push_back(pathsvg::PathCommand::move_to_verb);
      m_last_move_to_index = m_data.m_points.size();
      m_data.m_points.push_back(pt);
      m_move_to_required = false;
    }
}

void
PathDataBuilderPrivate::
add(enum pathsvg::PathCommand::verb_t v, const pathsvg::vec2 *pts)
{
  inject_move_to_if_needed();
  m_data.m_offsets.push_back(m_data.m_points.size());
  m_data.m_verbs.push_back(v);
  for (unsigned int i = 0, endi = pathsvg::PathCommand::number_points(v); i < endi; ++i)
    {
      m_data.m_points.push_back(pts[i]);
    }
}

/////////////////////////////////
// pathsvg::PathCommand methods
unsigned int
pathsvg::PathCommand::
number_points(enum verb_t v)
{
  switch (v)
    {
    case move_to_verb:
    case line_to_verb:
      return 1;
    case quad_to_verb:
      return 2;
    case cubic_to_verb:
      return 3;
    default:
      return 0;
    }
}

//////////////////////////////
// pathsvg::PathData methods
pathsvg::PathData::
PathData(void)
{
  m_d = PATHSVGnew PathDataPrivate();
}

PATHSVGpimpl_value_semantics(pathsvg::PathData, PathData, PathDataPrivate)

pathsvg::PathData::
~PathData()
{
  PathDataPrivate *d;
  d = static_cast<PathDataPrivate*>(m_d);
  PATHSVGdelete(d);
  m_d = nullptr;
}


unsigned int
pathsvg::PathData::
number_commands(void) const
{
  PathDataPrivate *d;
  d = static_cast<PathDataPrivate*>(m_d);
  return d->m_verbs.size();
}

pathsvg::PathCommand
pathsvg::PathData::
command(unsigned int I) const
{
  PathDataPrivate *d;
  PathCommand R;

  d = static_cast<PathDataPrivate*>(m_d);
  PATHSVGassert(I < d->m_verbs.size());

  R.m_verb = d->m_verbs[I];
  for (unsigned int i = 0, endi = R.number_points(); i < endi; ++i)
    {
      R.m_pts[i] = d->m_points[d->m_offsets[I] + i];
    }
  return R;
}

pathsvg::c_array<const enum pathsvg::PathCommand::verb_t>
pathsvg::PathData::
verbs(void) const
{
  const PathDataPrivate *d;
  d = static_cast<const PathDataPrivate*>(m_d);
  return make_c_array(d->m_verbs);
}

pathsvg::c_array<const pathsvg::vec2>
pathsvg::PathData::
points(void) const
{
  const PathDataPrivate *d;
  d = static_cast<const PathDataPrivate*>(m_d);
  return make_c_array(d->m_points);
}

bool
pathsvg::PathData::
empty(void) const
{
  PathDataPrivate *d;
  d = static_cast<PathDataPrivate*>(m_d);
  return d->m_verbs.empty();
}

const pathsvg::Rect&
pathsvg::PathData::
bounds(void) const
{
  PathDataPrivate *d;
  d = static_cast<PathDataPrivate*>(m_d);
  return d->m_bounds;
}

bool
pathsvg::PathData::
transformed_bounds(const Transform &tr, Rect *out_bb) const
{
  PathDataPrivate *d;
  BoundingBox<float> bb;

  d = static_cast<PathDataPrivate*>(m_d);
  for (const vec2 &p : d->m_points)
    {
      bb.union_point(tr.map_point(p));
    }

  if (bb.empty())
    {
      return false;
    }

  out_bb->m_min_point = bb.min_point();
  out_bb->m_max_point = bb.max_point();
  return true;
}

/////////////////////////////////////
// pathsvg::PathDataBuilder methods
pathsvg::PathDataBuilder::
PathDataBuilder(void)
{
  m_d = PATHSVGnew PathDataBuilderPrivate();
}

pathsvg::PathDataBuilder::
~PathDataBuilder()
{
  PathDataBuilderPrivate *d;
  d = static_cast<PathDataBuilderPrivate*>(m_d);
  PATHSVGdelete(d);
  m_d = nullptr;
}

pathsvg::PathDataBuilder&
pathsvg::PathDataBuilder::
move_to(const vec2 &pt)
{
  PathDataBuilderPrivate *d;
  d = static_cast<PathDataBuilderPrivate*>(m_d);

  if (!d->m_data.m_verbs.empty()
      && d->m_data.m_verbs.back() == PathCommand::move_to_verb)
    {
      d->m_last_move_to_index = d->m_data.m_points.size() - 1;
      d->m_data.m_points.back() = pt;
    }
  else
    {
      d->m_last_move_to_index = d->m_data.m_points.size();
      d->m_data.m_offsets.push_back(d->m_data.m_points.size());
      d->m_data.m_verbs.push_back(PathCommand::move_to_verb);
      d->m_data.m_points.push_back(pt);
    }
  d->m_move_to_required = false;
  return *this;
}

pathsvg::PathDataBuilder&
pathsvg::PathDataBuilder::
line_to(const vec2 &pt)
{
  PathDataBuilderPrivate *d;
  d = static_cast<PathDataBuilderPrivate*>(m_d);
  d->add(PathCommand::line_to_verb, &pt);
  return *this;
}

pathsvg::PathDataBuilder&
pathsvg::PathDataBuilder::
quad_to(const vec2 &ctrl, const vec2 &pt)
{
  PathDataBuilderPrivate *d;
  vec2 pts[2] = { ctrl, pt };

  d = static_cast<PathDataBuilderPrivate*>(m_d);
  d->add(PathCommand::quad_to_verb, pts);
  return *this;
}

pathsvg::PathDataBuilder&
pathsvg::PathDataBuilder::
cubic_to(const vec2 &ctrl1, const vec2 &ctrl2, const vec2 &pt)
{
  PathDataBuilderPrivate *d;
  vec2 pts[3] = { ctrl1, ctrl2, pt };

  d = static_cast<PathDataBuilderPrivate*>(m_d);
  d->add(PathCommand::cubic_to_verb, pts);
  return *this;
}

pathsvg::PathDataBuilder&
pathsvg::PathDataBuilder::
close(void)
{
  PathDataBuilderPrivate *d;
  d = static_cast<PathDataBuilderPrivate*>(m_d);

  if (!d->m_data.m_verbs.empty()
      && d->m_data.m_verbs.back() != PathCommand::close_verb)
    {
      d->m_data.m_offsets.push_back(d->m_data.m_points.size());
      d->m_data.m_verbs.push_back(PathCommand::close_verb);
    }
  d->m_move_to_required = true;
  return *this;
}

unsigned int
pathsvg::PathDataBuilder::
number_commands(void) const
{
  PathDataBuilderPrivate *d;
  d = static_cast<PathDataBuilderPrivate*>(m_d);
  return d->m_data.m_verbs.size();
}

enum pathsvg::return_code
pathsvg::PathDataBuilder::
finish(PathData *out)
{
  PathDataBuilderPrivate *d;
  BoundingBox<float> bb;
  bool all_finite(true);

  d = static_cast<PathDataBuilderPrivate*>(m_d);

  /* a lone move_to has no geometry */
  if (d->m_data.m_verbs.size() <= 1)
    {
      d->clear();
      return routine_fail;
    }

  for (const vec2 &p : d->m_data.m_points)
    {
      all_finite = all_finite && t_isfinite(p.x()) && t_isfinite(p.y());
      bb.union_point(p);
    }

  if (!all_finite)
    {
      d->clear();
      return routine_fail;
    }

  PathDataPrivate *out_d;

  out_d = static_cast<PathDataPrivate*>(out->m_d);
  std::swap(*out_d, d->m_data);
  out_d->m_bounds.m_min_point = bb.min_point();
  out_d->m_bounds.m_max_point = bb.max_point();
  d->clear();

  return routine_success;
}

void
pathsvg::PathDataBuilder::
clear(void)
{
  PathDataBuilderPrivate *d;
  d = static_cast<PathDataBuilderPrivate*>(m_d);
  d->clear();
}
