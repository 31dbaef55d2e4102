/*!
 * \file writer.cpp
 * \brief file writer.cpp
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
#include <utility>
#include <pathsvg/writer.hpp>
#include <pathsvg/path_data.hpp>
#include <pathsvg/path_translator.hpp>
#include <pathsvg/bounds_computer.hpp>
#include <pathsvg/document/svg_writer.hpp>
#include <pathsvg/text/text_to_path.hpp>
#include <pathsvg/util/math.hpp>
#include <private/util_private.hpp>

namespace
{
  class WriterBasePrivate
  {
  public:
    std::vector<pathsvg::reference_counted_ptr<pathsvg::Node> > m_nodes;
    pathsvg::Transform m_transform;
  };

  class TextPathWriterPrivate
  {
  public:
    explicit
    TextPathWriterPrivate(const pathsvg::reference_counted_ptr<pathsvg::FontDatabase> &fonts
                          = pathsvg::reference_counted_ptr<pathsvg::FontDatabase>()):
      m_fonts(fonts)
    {}

    pathsvg::reference_counted_ptr<pathsvg::FontDatabase> m_fonts;
  };

  void
  set_error(pathsvg::Error *out_error, const pathsvg::Error &e)
  {
    if (out_error)
      {
        *out_error = e;
      }
  }

  pathsvg::reference_counted_ptr<pathsvg::FontDatabase>
  create_database_from_source(const pathsvg::reference_counted_ptr<const pathsvg::DataBuffer> &src,
                              pathsvg::reference_counted_ptr<pathsvg::FontDatabase> db)
  {
    if (!db)
      {
        db = PATHSVGnew pathsvg::FontDatabase();
      }

    if (db->load_font_source(src) == pathsvg::routine_fail)
      {
        PATHSVGwarning("Unable to load any font face from font source\n");
      }
    return db;
  }
}

///////////////////////////////////////
// creation functions
enum pathsvg::return_code
pathsvg::
create_png_node(const reference_counted_ptr<const DataBuffer> &data,
                const Transform &transform, float width, float height,
                reference_counted_ptr<ImageNode> *out,
                Error *out_error)
{
  Rect R(transform.m_tx, transform.m_ty,
         transform.m_tx + width, transform.m_ty + height);

  if (!R.is_valid_nonempty())
    {
      set_error(out_error,
                Error::wrong_bounding_box(transform.m_tx - width * 0.5f,
                                          transform.m_tx + width * 0.5f,
                                          transform.m_ty - height * 0.5f,
                                          transform.m_ty + height * 0.5f));
      return routine_fail;
    }

  *out = PATHSVGnew ImageNode(data, R);
  return routine_success;
}

enum pathsvg::return_code
pathsvg::
create_text_node(c_string text, const Transform &transform,
                 const Fill *fill, const Stroke *stroke,
                 c_array<const c_string> font_families,
                 float font_size,
                 enum TextNode::dominant_baseline_t dominant_baseline,
                 reference_counted_ptr<TextNode> *out,
                 Error *out_error)
{
  if (!t_isfinite(font_size) || font_size <= 0.0f)
    {
      set_error(out_error, Error(Error::font_failure_error,
                                 "font size must be finite and positive"));
      return routine_fail;
    }

  reference_counted_ptr<TextNode> node;

  node = PATHSVGnew TextNode(text, font_size, transform);
  for (c_string family : font_families)
    {
      if (family)
        {
          node->add_font_family(family);
        }
    }
  node->fill(fill);
  node->stroke(stroke);
  node->dominant_baseline(dominant_baseline);
  *out = node;

  return routine_success;
}

///////////////////////////////////////
// pathsvg::WriterBase methods
pathsvg::WriterBase::
WriterBase(void)
{
  m_d = PATHSVGnew WriterBasePrivate();
}

pathsvg::WriterBase::
WriterBase(WriterBase &&obj)
{
  m_d = obj.m_d;
  obj.m_d = PATHSVGnew WriterBasePrivate();
}

pathsvg::WriterBase::
~WriterBase()
{
  WriterBasePrivate *d;
  d = static_cast<WriterBasePrivate*>(m_d);
  PATHSVGdelete(d);
  m_d = nullptr;
}

enum pathsvg::return_code
pathsvg::WriterBase::
push(const Path &path, const Fill *fill, const Stroke *stroke,
     const Transform *transform, Error *out_error)
{
  WriterBasePrivate *d;
  PathData data;

  d = static_cast<WriterBasePrivate*>(m_d);
  if (translate_path(path, &data) == routine_fail)
    {
      set_error(out_error, Error(Error::svg_failure_error,
                                 "path does not give valid drawing commands"));
      return routine_fail;
    }

  reference_counted_ptr<PathNode> node;

  node = PATHSVGnew PathNode(data, transform ? *transform : Transform());
  node->fill(fill);
  node->stroke(stroke);
  d->m_nodes.push_back(node);

  return routine_success;
}

enum pathsvg::return_code
pathsvg::WriterBase::
push_node(const reference_counted_ptr<Node> &node)
{
  WriterBasePrivate *d;

  d = static_cast<WriterBasePrivate*>(m_d);
  if (!node || node->parent())
    {
      return routine_fail;
    }

  for (const reference_counted_ptr<Node> &p : d->m_nodes)
    {
      if (p == node)
        {
          return routine_fail;
        }
    }

  d->m_nodes.push_back(node);
  return routine_success;
}

enum pathsvg::return_code
pathsvg::WriterBase::
push_png(const reference_counted_ptr<const DataBuffer> &data,
         const Transform &transform, float width, float height,
         Error *out_error)
{
  reference_counted_ptr<ImageNode> node;
  enum return_code R;

  R = create_png_node(data, transform, width, height, &node, out_error);
  if (R == routine_success)
    {
      R = push_node(node);
    }
  return R;
}

enum pathsvg::return_code
pathsvg::WriterBase::
push_group(c_array<const reference_counted_ptr<Node> > nodes,
           const Transform &transform)
{
  reference_counted_ptr<GroupNode> group;

  group = PATHSVGnew GroupNode(transform);
  for (const reference_counted_ptr<Node> &p : nodes)
    {
      if (group->append(p) == routine_fail)
        {
          /* release the nodes already taken so that
           * they can be pushed elsewhere
           */
          group->clear();
          return routine_fail;
        }
    }
  return push_node(group);
}

pathsvg::WriterBase&
pathsvg::WriterBase::
transform(const Transform &v)
{
  WriterBasePrivate *d;
  d = static_cast<WriterBasePrivate*>(m_d);
  d->m_transform = v;
  return *this;
}

const pathsvg::Transform&
pathsvg::WriterBase::
transform(void) const
{
  WriterBasePrivate *d;
  d = static_cast<WriterBasePrivate*>(m_d);
  return d->m_transform;
}

unsigned int
pathsvg::WriterBase::
number_nodes(void) const
{
  WriterBasePrivate *d;
  d = static_cast<WriterBasePrivate*>(m_d);
  return d->m_nodes.size();
}

enum pathsvg::return_code
pathsvg::WriterBase::
prepare(reference_counted_ptr<Tree> *out, Error *out_error)
{
  WriterBasePrivate *d;
  std::vector<reference_counted_ptr<Node> > nodes;
  Transform global;
  CanvasGeometry canvas;

  d = static_cast<WriterBasePrivate*>(m_d);
  std::swap(nodes, d->m_nodes);
  std::swap(global, d->m_transform);

  if (compute_canvas(make_c_array(nodes), global, &canvas, out_error) == routine_fail)
    {
      return routine_fail;
    }

  reference_counted_ptr<GroupNode> group, root;

  group = PATHSVGnew GroupNode(global);
  for (const reference_counted_ptr<Node> &p : nodes)
    {
      if (group->append(p) == routine_fail)
        {
          group->clear();
          set_error(out_error, Error(Error::svg_failure_error,
                                     "node pushed to writer was given a parent"));
          return routine_fail;
        }
    }

  root = PATHSVGnew GroupNode();
  if (root->append(group) == routine_fail)
    {
      set_error(out_error, Error(Error::svg_failure_error));
      return routine_fail;
    }

  *out = PATHSVGnew Tree(canvas, root);
  return routine_success;
}

///////////////////////////////////////
// pathsvg::PathWriter methods
pathsvg::PathWriter::
PathWriter(void)
{}

pathsvg::PathWriter::
~PathWriter()
{}

enum pathsvg::return_code
pathsvg::PathWriter::
write(c_string filename, Error *out_error)
{
  reference_counted_ptr<Tree> tree;

  if (prepare(&tree, out_error) == routine_fail)
    {
      return routine_fail;
    }
  return write_svg_file(*tree, filename, out_error);
}

pathsvg::TextPathWriter
pathsvg::PathWriter::
add_fonts(const reference_counted_ptr<FontDatabase> &fonts)
{
  return TextPathWriter(std::move(*this), fonts);
}

pathsvg::TextPathWriter
pathsvg::PathWriter::
add_fonts_dir(c_string dirname)
{
  reference_counted_ptr<FontDatabase> fonts;

  fonts = PATHSVGnew FontDatabase();
  if (fonts->load_fonts_dir(dirname) == 0)
    {
      PATHSVGwarning("No font faces found in \"" << dirname << "\"\n");
    }
  return TextPathWriter(std::move(*this), fonts);
}

pathsvg::TextPathWriter
pathsvg::PathWriter::
add_fonts_source(const reference_counted_ptr<const DataBuffer> &src)
{
  return TextPathWriter(std::move(*this),
                        create_database_from_source(src, reference_counted_ptr<FontDatabase>()));
}

///////////////////////////////////////
// pathsvg::TextPathWriter methods
pathsvg::TextPathWriter::
TextPathWriter(void)
{
  m_text_d = PATHSVGnew TextPathWriterPrivate();
}

pathsvg::TextPathWriter::
TextPathWriter(WriterBase &&src,
               const reference_counted_ptr<FontDatabase> &fonts):
  WriterBase(std::move(src))
{
  m_text_d = PATHSVGnew TextPathWriterPrivate(fonts);
}

pathsvg::TextPathWriter::
TextPathWriter(TextPathWriter &&obj):
  WriterBase(std::move(obj))
{
  m_text_d = obj.m_text_d;
  obj.m_text_d = PATHSVGnew TextPathWriterPrivate();
}

pathsvg::TextPathWriter::
~TextPathWriter()
{
  TextPathWriterPrivate *d;
  d = static_cast<TextPathWriterPrivate*>(m_text_d);
  PATHSVGdelete(d);
  m_text_d = nullptr;
}

enum pathsvg::return_code
pathsvg::TextPathWriter::
push_text(c_string text, c_array<const c_string> font_families,
          float font_size, const Transform &transform,
          const Fill *fill, const Stroke *stroke,
          enum TextNode::dominant_baseline_t dominant_baseline,
          Error *out_error)
{
  reference_counted_ptr<TextNode> node;
  enum return_code R;

  R = create_text_node(text, transform, fill, stroke, font_families,
                       font_size, dominant_baseline, &node, out_error);
  if (R == routine_success)
    {
      R = push_node(node);
    }
  return R;
}

pathsvg::TextPathWriter&
pathsvg::TextPathWriter::
add_fonts(const reference_counted_ptr<FontDatabase> &fonts)
{
  TextPathWriterPrivate *d;
  d = static_cast<TextPathWriterPrivate*>(m_text_d);
  d->m_fonts = fonts;
  return *this;
}

pathsvg::TextPathWriter&
pathsvg::TextPathWriter::
add_fonts_source(const reference_counted_ptr<const DataBuffer> &src)
{
  TextPathWriterPrivate *d;
  d = static_cast<TextPathWriterPrivate*>(m_text_d);
  d->m_fonts = create_database_from_source(src, d->m_fonts);
  return *this;
}

const pathsvg::reference_counted_ptr<pathsvg::FontDatabase>&
pathsvg::TextPathWriter::
fonts(void) const
{
  TextPathWriterPrivate *d;
  d = static_cast<TextPathWriterPrivate*>(m_text_d);
  return d->m_fonts;
}

enum pathsvg::return_code
pathsvg::TextPathWriter::
write(c_string filename, Error *out_error)
{
  TextPathWriterPrivate *d;
  reference_counted_ptr<FontDatabase> fonts;
  reference_counted_ptr<Tree> tree;

  d = static_cast<TextPathWriterPrivate*>(m_text_d);
  if (!d->m_fonts)
    {
      set_error(out_error, Error(Error::no_fonts_error));
      return routine_fail;
    }

  std::swap(fonts, d->m_fonts);
  if (prepare(&tree, out_error) == routine_fail)
    {
      return routine_fail;
    }

  convert_text(*tree, *fonts);
  return write_svg_file(*tree, filename, out_error);
}
