/*!
 * \file node.cpp
 * \brief file node.cpp
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


#include <string>
#include <vector>
#include <pathsvg/document/node.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>
#include <private/util_private.hpp>
#include <private/bounding_box.hpp>

namespace
{
  class NodePrivate
  {
  public:
    NodePrivate(enum pathsvg::Node::node_type_t tp,
                const pathsvg::Transform &tr):
      m_type(tp),
      m_transform(tr),
      m_parent(nullptr)
    {}

    enum pathsvg::Node::node_type_t m_type;
    pathsvg::Transform m_transform;
    std::string m_id;
    pathsvg::GroupNode *m_parent;
  };

  class GroupNodePrivate
  {
  public:
    std::vector<pathsvg::reference_counted_ptr<pathsvg::Node> > m_children;
  };

  /* optional value of a copyable type */
  template<typename T>
  class Optional
  {
  public:
    Optional(void):
      m_present(false)
    {}

    const T*
    get(void) const
    {
      return (m_present) ? &m_value : nullptr;
    }

    void
    set(const T *v)
    {
      m_present = (v != nullptr);
      if (v)
        {
          m_value = *v;
        }
    }

  private:
    bool m_present;
    T m_value;
  };

  class PathNodePrivate
  {
  public:
    explicit
    PathNodePrivate(const pathsvg::PathData &data):
      m_data(data)
    {}

    pathsvg::PathData m_data;
    Optional<pathsvg::Fill> m_fill;
    Optional<pathsvg::Stroke> m_stroke;
  };

  class ImageNodePrivate
  {
  public:
    ImageNodePrivate(const pathsvg::reference_counted_ptr<const pathsvg::DataBuffer> &png,
                     const pathsvg::Rect &view_rect):
      m_png(png),
      m_view_rect(view_rect)
    {}

    pathsvg::reference_counted_ptr<const pathsvg::DataBuffer> m_png;
    pathsvg::Rect m_view_rect;
  };

  class TextNodePrivate
  {
  public:
    TextNodePrivate(pathsvg::c_string text, float font_size):
      m_text(text ? text : ""),
      m_font_size(font_size),
      m_dominant_baseline(pathsvg::TextNode::auto_baseline)
    {}

    std::string m_text;
    float m_font_size;
    std::vector<std::string> m_font_families;
    enum pathsvg::TextNode::dominant_baseline_t m_dominant_baseline;
    Optional<pathsvg::Fill> m_fill;
    Optional<pathsvg::Stroke> m_stroke;
  };
}

//////////////////////////////
// pathsvg::Node methods
pathsvg::Node::
Node(enum node_type_t tp, const Transform &tr)
{
  m_d = PATHSVGnew NodePrivate(tp, tr);
}

pathsvg::Node::
~Node()
{
  NodePrivate *d;
  d = static_cast<NodePrivate*>(m_d);
  PATHSVGdelete(d);
  m_d = nullptr;
}

PATHSVGpimpl_get(pathsvg::Node, NodePrivate, enum pathsvg::Node::node_type_t, type)

const pathsvg::Transform&
pathsvg::Node::
transform(void) const
{
  NodePrivate *d;
  d = static_cast<NodePrivate*>(m_d);
  return d->m_transform;
}

PATHSVGpimpl_set(pathsvg::Node, NodePrivate, const pathsvg::Transform&, transform)

pathsvg::c_string
pathsvg::Node::
id(void) const
{
  NodePrivate *d;
  d = static_cast<NodePrivate*>(m_d);
  return d->m_id.c_str();
}

pathsvg::Node&
pathsvg::Node::
id(c_string v)
{
  NodePrivate *d;
  d = static_cast<NodePrivate*>(m_d);
  d->m_id = (v) ? v : "";
  return *this;
}

const pathsvg::GroupNode*
pathsvg::Node::
parent(void) const
{
  NodePrivate *d;
  d = static_cast<NodePrivate*>(m_d);
  return d->m_parent;
}

pathsvg::Transform
pathsvg::Node::
abs_transform(void) const
{
  Transform R(transform());

  for (const Node *p = parent(); p; p = p->parent())
    {
      R = p->transform().pre_concat(R);
    }
  return R;
}

bool
pathsvg::Node::
calculate_bbox(Rect *out_bb) const
{
  return compute_bbox(abs_transform(), out_bb);
}

//////////////////////////////////
// pathsvg::GroupNode methods
pathsvg::GroupNode::
GroupNode(const Transform &tr):
  Node(group_node, tr)
{
  m_d = PATHSVGnew GroupNodePrivate();
}

pathsvg::GroupNode::
~GroupNode()
{
  GroupNodePrivate *d;
  d = static_cast<GroupNodePrivate*>(m_d);
  clear();
  PATHSVGdelete(d);
  m_d = nullptr;
}

enum pathsvg::return_code
pathsvg::GroupNode::
append(const reference_counted_ptr<Node> &child)
{
  GroupNodePrivate *d;
  NodePrivate *child_d;

  d = static_cast<GroupNodePrivate*>(m_d);
  if (!child)
    {
      return routine_fail;
    }

  child_d = static_cast<NodePrivate*>(child->Node::m_d);
  if (child_d->m_parent)
    {
      return routine_fail;
    }

  for (const Node *p = this; p; p = p->parent())
    {
      if (p == child.get())
        {
          return routine_fail;
        }
    }

  child_d->m_parent = this;
  d->m_children.push_back(child);
  return routine_success;
}

enum pathsvg::return_code
pathsvg::GroupNode::
replace_child(unsigned int I, const reference_counted_ptr<Node> &node)
{
  GroupNodePrivate *d;
  reference_counted_ptr<Node> old_child;
  NodePrivate *old_d;

  d = static_cast<GroupNodePrivate*>(m_d);
  PATHSVGassert(I < d->m_children.size());
  if (I >= d->m_children.size())
    {
      return routine_fail;
    }

  old_child = d->m_children[I];
  old_d = static_cast<NodePrivate*>(old_child->Node::m_d);

  if (!node)
    {
      old_d->m_parent = nullptr;
      d->m_children.erase(d->m_children.begin() + I);
      return routine_success;
    }

  NodePrivate *node_d;
  node_d = static_cast<NodePrivate*>(node->Node::m_d);
  if (node_d->m_parent)
    {
      return routine_fail;
    }

  for (const Node *p = this; p; p = p->parent())
    {
      if (p == node.get())
        {
          return routine_fail;
        }
    }

  old_d->m_parent = nullptr;
  node_d->m_parent = this;
  d->m_children[I] = node;
  return routine_success;
}

void
pathsvg::GroupNode::
clear(void)
{
  GroupNodePrivate *d;
  d = static_cast<GroupNodePrivate*>(m_d);

  for (const reference_counted_ptr<Node> &c : d->m_children)
    {
      NodePrivate *cd;
      cd = static_cast<NodePrivate*>(c->Node::m_d);
      cd->m_parent = nullptr;
    }
  d->m_children.clear();
}

pathsvg::c_array<const pathsvg::reference_counted_ptr<pathsvg::Node> >
pathsvg::GroupNode::
children(void) const
{
  const GroupNodePrivate *d;
  d = static_cast<const GroupNodePrivate*>(m_d);
  return make_c_array(d->m_children);
}

bool
pathsvg::GroupNode::
compute_bbox(const Transform &tr, Rect *out_bb) const
{
  GroupNodePrivate *d;
  BoundingBox<float> bb;

  d = static_cast<GroupNodePrivate*>(m_d);
  for (const reference_counted_ptr<Node> &c : d->m_children)
    {
      Rect r;

      if (c->compute_bbox(tr.pre_concat(c->transform()), &r))
        {
          bb.union_rect(r);
        }
    }

  if (bb.empty())
    {
      return false;
    }

  *out_bb = bb.as_rect();
  return true;
}

////////////////////////////////
// pathsvg::PathNode methods
pathsvg::PathNode::
PathNode(const PathData &data, const Transform &tr):
  Node(path_node, tr)
{
  m_d = PATHSVGnew PathNodePrivate(data);
}

pathsvg::PathNode::
~PathNode()
{
  PathNodePrivate *d;
  d = static_cast<PathNodePrivate*>(m_d);
  PATHSVGdelete(d);
  m_d = nullptr;
}

const pathsvg::PathData&
pathsvg::PathNode::
data(void) const
{
  PathNodePrivate *d;
  d = static_cast<PathNodePrivate*>(m_d);
  return d->m_data;
}

const pathsvg::Fill*
pathsvg::PathNode::
fill(void) const
{
  PathNodePrivate *d;
  d = static_cast<PathNodePrivate*>(m_d);
  return d->m_fill.get();
}

pathsvg::PathNode&
pathsvg::PathNode::
fill(const Fill *v)
{
  PathNodePrivate *d;
  d = static_cast<PathNodePrivate*>(m_d);
  d->m_fill.set(v);
  return *this;
}

const pathsvg::Stroke*
pathsvg::PathNode::
stroke(void) const
{
  PathNodePrivate *d;
  d = static_cast<PathNodePrivate*>(m_d);
  return d->m_stroke.get();
}

pathsvg::PathNode&
pathsvg::PathNode::
stroke(const Stroke *v)
{
  PathNodePrivate *d;
  d = static_cast<PathNodePrivate*>(m_d);
  d->m_stroke.set(v);
  return *this;
}

bool
pathsvg::PathNode::
compute_bbox(const Transform &tr, Rect *out_bb) const
{
  return data().transformed_bounds(tr, out_bb);
}

/////////////////////////////////
// pathsvg::ImageNode methods
pathsvg::ImageNode::
ImageNode(const reference_counted_ptr<const DataBuffer> &png,
          const Rect &view_rect, const Transform &tr):
  Node(image_node, tr)
{
  m_d = PATHSVGnew ImageNodePrivate(png, view_rect);
}

pathsvg::ImageNode::
~ImageNode()
{
  ImageNodePrivate *d;
  d = static_cast<ImageNodePrivate*>(m_d);
  PATHSVGdelete(d);
  m_d = nullptr;
}

const pathsvg::reference_counted_ptr<const pathsvg::DataBuffer>&
pathsvg::ImageNode::
png(void) const
{
  ImageNodePrivate *d;
  d = static_cast<ImageNodePrivate*>(m_d);
  return d->m_png;
}

const pathsvg::Rect&
pathsvg::ImageNode::
view_rect(void) const
{
  ImageNodePrivate *d;
  d = static_cast<ImageNodePrivate*>(m_d);
  return d->m_view_rect;
}

bool
pathsvg::ImageNode::
compute_bbox(const Transform &tr, Rect *out_bb) const
{
  *out_bb = tr.map_rect(view_rect());
  return true;
}

////////////////////////////////
// pathsvg::TextNode methods
pathsvg::TextNode::
TextNode(c_string text, float font_size, const Transform &tr):
  Node(text_node, tr)
{
  m_d = PATHSVGnew TextNodePrivate(text, font_size);
}

pathsvg::TextNode::
~TextNode()
{
  TextNodePrivate *d;
  d = static_cast<TextNodePrivate*>(m_d);
  PATHSVGdelete(d);
  m_d = nullptr;
}

pathsvg::c_string
pathsvg::TextNode::
text(void) const
{
  TextNodePrivate *d;
  d = static_cast<TextNodePrivate*>(m_d);
  return d->m_text.c_str();
}

PATHSVGpimpl_get(pathsvg::TextNode, TextNodePrivate, float, font_size)
PATHSVGpimpl_setget(pathsvg::TextNode, TextNodePrivate,
                 enum pathsvg::TextNode::dominant_baseline_t, dominant_baseline)

pathsvg::TextNode&
pathsvg::TextNode::
add_font_family(c_string v)
{
  TextNodePrivate *d;
  d = static_cast<TextNodePrivate*>(m_d);
  if (v)
    {
      d->m_font_families.push_back(v);
    }
  return *this;
}

unsigned int
pathsvg::TextNode::
number_font_families(void) const
{
  TextNodePrivate *d;
  d = static_cast<TextNodePrivate*>(m_d);
  return d->m_font_families.size();
}

pathsvg::c_string
pathsvg::TextNode::
font_family(unsigned int I) const
{
  TextNodePrivate *d;
  d = static_cast<TextNodePrivate*>(m_d);
  PATHSVGassert(I < d->m_font_families.size());
  return d->m_font_families[I].c_str();
}

const pathsvg::Fill*
pathsvg::TextNode::
fill(void) const
{
  TextNodePrivate *d;
  d = static_cast<TextNodePrivate*>(m_d);
  return d->m_fill.get();
}

pathsvg::TextNode&
pathsvg::TextNode::
fill(const Fill *v)
{
  TextNodePrivate *d;
  d = static_cast<TextNodePrivate*>(m_d);
  d->m_fill.set(v);
  return *this;
}

const pathsvg::Stroke*
pathsvg::TextNode::
stroke(void) const
{
  TextNodePrivate *d;
  d = static_cast<TextNodePrivate*>(m_d);
  return d->m_stroke.get();
}

pathsvg::TextNode&
pathsvg::TextNode::
stroke(const Stroke *v)
{
  TextNodePrivate *d;
  d = static_cast<TextNodePrivate*>(m_d);
  d->m_stroke.set(v);
  return *this;
}

bool
pathsvg::TextNode::
compute_bbox(const Transform &tr, Rect *out_bb) const
{
  PATHSVGunused(tr);
  PATHSVGunused(out_bb);
  return false;
}

pathsvg::c_string
pathsvg::TextNode::
label(enum dominant_baseline_t v)
{
  switch (v)
    {
    case auto_baseline: return "auto";
    case alphabetic_baseline: return "alphabetic";
    case ideographic_baseline: return "ideographic";
    case hanging_baseline: return "hanging";
    case mathematical_baseline: return "mathematical";
    case central_baseline: return "central";
    case middle_baseline: return "middle";
    case text_after_edge_baseline: return "text-after-edge";
    case text_before_edge_baseline: return "text-before-edge";
    }
  return "auto";
}
