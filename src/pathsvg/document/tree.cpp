/*!
 * \file tree.cpp
 * \brief file tree.cpp
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


#include <pathsvg/document/tree.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>

namespace
{
  class TreePrivate
  {
  public:
    TreePrivate(const pathsvg::CanvasGeometry &geometry,
                const pathsvg::reference_counted_ptr<pathsvg::GroupNode> &root):
      m_geometry(geometry),
      m_root(root)
    {
      if (!m_root)
        {
          m_root = PATHSVGnew pathsvg::GroupNode();
        }
    }

    pathsvg::CanvasGeometry m_geometry;
    pathsvg::reference_counted_ptr<pathsvg::GroupNode> m_root;
  };
}

////////////////////////////
// pathsvg::Tree methods
pathsvg::Tree::
Tree(const CanvasGeometry &geometry,
     const reference_counted_ptr<GroupNode> &root)
{
  m_d = PATHSVGnew TreePrivate(geometry, root);
}

pathsvg::Tree::
~Tree()
{
  TreePrivate *d;
  d = static_cast<TreePrivate*>(m_d);
  PATHSVGdelete(d);
  m_d = nullptr;
}

float
pathsvg::Tree::
width(void) const
{
  TreePrivate *d;
  d = static_cast<TreePrivate*>(m_d);
  return d->m_geometry.m_width;
}

float
pathsvg::Tree::
height(void) const
{
  TreePrivate *d;
  d = static_cast<TreePrivate*>(m_d);
  return d->m_geometry.m_height;
}

const pathsvg::Rect&
pathsvg::Tree::
view_rect(void) const
{
  TreePrivate *d;
  d = static_cast<TreePrivate*>(m_d);
  return d->m_geometry.m_view_rect;
}

const pathsvg::reference_counted_ptr<pathsvg::GroupNode>&
pathsvg::Tree::
root(void) const
{
  TreePrivate *d;
  d = static_cast<TreePrivate*>(m_d);
  return d->m_root;
}
