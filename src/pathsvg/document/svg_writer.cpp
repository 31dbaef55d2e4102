/*!
 * \file svg_writer.cpp
 * \brief file svg_writer.cpp
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


#include <fstream>
#include <sstream>
#include <string>
#include <cerrno>
#include <cstring>
#include <cstdint>
#include <pathsvg/document/svg_writer.hpp>

namespace
{
  class Indent
  {
  public:
    explicit
    Indent(unsigned int depth):
      m_depth(depth)
    {}

    Indent
    next(void) const
    {
      return Indent(m_depth + 1);
    }

    unsigned int m_depth;
  };

  std::ostream&
  operator<<(std::ostream &str, const Indent &obj)
  {
    for (unsigned int i = 0; i < obj.m_depth; ++i)
      {
        str << "  ";
      }
    return str;
  }

  class Escaped
  {
  public:
    explicit
    Escaped(pathsvg::c_string s):
      m_s(s)
    {}

    pathsvg::c_string m_s;
  };

  std::ostream&
  operator<<(std::ostream &str, const Escaped &obj)
  {
    for (pathsvg::c_string p = obj.m_s; *p; ++p)
      {
        switch (*p)
          {
          case '&': str << "&amp;"; break;
          case '<': str << "&lt;"; break;
          case '>': str << "&gt;"; break;
          case '"': str << "&quot;"; break;
          case '\'': str << "&apos;"; break;
          default: str << *p;
          }
      }
    return str;
  }

  class HexColor
  {
  public:
    explicit
    HexColor(const pathsvg::Color &c):
      m_c(c)
    {}

    pathsvg::Color m_c;
  };

  std::ostream&
  operator<<(std::ostream &str, const HexColor &obj)
  {
    static const char digits[] = "0123456789abcdef";
    uint8_t v[3] = { obj.m_c.m_red, obj.m_c.m_green, obj.m_c.m_blue };

    str << '#';
    for (unsigned int i = 0; i < 3; ++i)
      {
        str << digits[v[i] >> 4u] << digits[v[i] & 0xFu];
      }
    return str;
  }

  void
  write_base64(pathsvg::c_array<const uint8_t> bytes, std::ostream &dst)
  {
    static const char table[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    size_t i, sz(bytes.size());

    for (i = 0; i + 2 < sz; i += 3)
      {
        uint32_t v;

        v = (uint32_t(bytes[i]) << 16u) | (uint32_t(bytes[i + 1]) << 8u) | uint32_t(bytes[i + 2]);
        dst << table[(v >> 18u) & 0x3Fu] << table[(v >> 12u) & 0x3Fu]
            << table[(v >> 6u) & 0x3Fu] << table[v & 0x3Fu];
      }

    if (i + 1 == sz)
      {
        uint32_t v;

        v = uint32_t(bytes[i]) << 16u;
        dst << table[(v >> 18u) & 0x3Fu] << table[(v >> 12u) & 0x3Fu] << "==";
      }
    else if (i + 2 == sz)
      {
        uint32_t v;

        v = (uint32_t(bytes[i]) << 16u) | (uint32_t(bytes[i + 1]) << 8u);
        dst << table[(v >> 18u) & 0x3Fu] << table[(v >> 12u) & 0x3Fu]
            << table[(v >> 6u) & 0x3Fu] << '=';
      }
  }

  void
  write_transform_attribute(const pathsvg::Transform &tr, std::ostream &dst)
  {
    if (!tr.is_identity())
      {
        dst << " transform=\"matrix(" << tr.m_sx << " " << tr.m_ky
            << " " << tr.m_kx << " " << tr.m_sy
            << " " << tr.m_tx << " " << tr.m_ty << ")\"";
      }
  }

  void
  write_id_attribute(const pathsvg::Node &node, std::ostream &dst)
  {
    if (node.id()[0] != 0)
      {
        dst << " id=\"" << Escaped(node.id()) << "\"";
      }
  }

  void
  write_paint_attributes(const pathsvg::Fill *fill,
                         const pathsvg::Stroke *stroke,
                         std::ostream &dst)
  {
    if (fill)
      {
        dst << " fill=\"" << HexColor(fill->m_color) << "\"";
        if (fill->m_opacity != 1.0f)
          {
            dst << " fill-opacity=\"" << fill->m_opacity << "\"";
          }
        if (fill->m_fill_rule == pathsvg::Fill::evenodd_fill_rule)
          {
            dst << " fill-rule=\"evenodd\"";
          }
      }
    else
      {
        dst << " fill=\"none\"";
      }

    if (stroke)
      {
        static const pathsvg::c_string caps[] = { "butt", "round", "square" };
        static const pathsvg::c_string joins[] = { "miter", "round", "bevel" };

        dst << " stroke=\"" << HexColor(stroke->m_color) << "\"";
        if (stroke->m_opacity != 1.0f)
          {
            dst << " stroke-opacity=\"" << stroke->m_opacity << "\"";
          }
        if (stroke->m_width != 1.0f)
          {
            dst << " stroke-width=\"" << stroke->m_width << "\"";
          }
        if (stroke->m_cap != pathsvg::Stroke::butt_cap)
          {
            dst << " stroke-linecap=\"" << caps[stroke->m_cap] << "\"";
          }
        if (stroke->m_join != pathsvg::Stroke::miter_join)
          {
            dst << " stroke-linejoin=\"" << joins[stroke->m_join] << "\"";
          }
        if (stroke->m_miter_limit != 4.0f)
          {
            dst << " stroke-miterlimit=\"" << stroke->m_miter_limit << "\"";
          }
      }
  }

  void
  write_node(const pathsvg::Node &node, Indent indent, std::ostream &dst);

  void
  write_children(const pathsvg::GroupNode &group, Indent indent, std::ostream &dst)
  {
    for (const pathsvg::reference_counted_ptr<pathsvg::Node> &c : group.children())
      {
        write_node(*c, indent, dst);
      }
  }

  void
  write_group(const pathsvg::GroupNode &node, Indent indent, std::ostream &dst)
  {
    dst << indent << "<g";
    write_id_attribute(node, dst);
    write_transform_attribute(node.transform(), dst);
    if (node.children().empty())
      {
        dst << "/>\n";
        return;
      }
    dst << ">\n";
    write_children(node, indent.next(), dst);
    dst << indent << "</g>\n";
  }

  void
  write_path(const pathsvg::PathNode &node, Indent indent, std::ostream &dst)
  {
    dst << indent << "<path";
    write_id_attribute(node, dst);
    write_paint_attributes(node.fill(), node.stroke(), dst);
    write_transform_attribute(node.transform(), dst);
    dst << " d=\"";
    pathsvg::write_path_data(node.data(), dst);
    dst << "\"/>\n";
  }

  void
  write_image(const pathsvg::ImageNode &node, Indent indent, std::ostream &dst)
  {
    const pathsvg::Rect &r(node.view_rect());

    dst << indent << "<image";
    write_id_attribute(node, dst);
    dst << " x=\"" << r.min_x() << "\" y=\"" << r.min_y()
        << "\" width=\"" << r.width() << "\" height=\"" << r.height() << "\"";
    write_transform_attribute(node.transform(), dst);
    dst << " xlink:href=\"data:image/png;base64,";
    if (node.png())
      {
        write_base64(node.png()->data(), dst);
      }
    dst << "\"/>\n";
  }

  void
  write_text(const pathsvg::TextNode &node, Indent indent, std::ostream &dst)
  {
    dst << indent << "<text";
    write_id_attribute(node, dst);
    if (node.number_font_families() > 0)
      {
        dst << " font-family=\"";
        for (unsigned int i = 0; i < node.number_font_families(); ++i)
          {
            dst << ((i != 0) ? ", " : "") << "'"
                << Escaped(node.font_family(i)) << "'";
          }
        dst << "\"";
      }
    dst << " font-size=\"" << node.font_size() << "\"";
    if (node.dominant_baseline() != pathsvg::TextNode::auto_baseline)
      {
        dst << " dominant-baseline=\""
            << pathsvg::TextNode::label(node.dominant_baseline()) << "\"";
      }
    write_paint_attributes(node.fill(), node.stroke(), dst);
    write_transform_attribute(node.transform(), dst);
    dst << ">" << Escaped(node.text()) << "</text>\n";
  }

  void
  write_node(const pathsvg::Node &node, Indent indent, std::ostream &dst)
  {
    switch (node.type())
      {
      case pathsvg::Node::group_node:
        write_group(static_cast<const pathsvg::GroupNode&>(node), indent, dst);
        break;
      case pathsvg::Node::path_node:
        write_path(static_cast<const pathsvg::PathNode&>(node), indent, dst);
        break;
      case pathsvg::Node::image_node:
        write_image(static_cast<const pathsvg::ImageNode&>(node), indent, dst);
        break;
      case pathsvg::Node::text_node:
        write_text(static_cast<const pathsvg::TextNode&>(node), indent, dst);
        break;
      }
  }
}

void
pathsvg::
write_path_data(const PathData &data, std::ostream &dst)
{
  static const c_string labels[] = { "M", "L", "Q", "C", "Z" };

  for (unsigned int c = 0, endc = data.number_commands(); c < endc; ++c)
    {
      PathCommand cmd(data.command(c));

      dst << ((c != 0) ? " " : "") << labels[cmd.m_verb];
      for (unsigned int p = 0, endp = cmd.number_points(); p < endp; ++p)
        {
          dst << " " << cmd.m_pts[p].x() << " " << cmd.m_pts[p].y();
        }
    }
}

void
pathsvg::
write_svg(const Tree &tree, std::ostream &dst)
{
  const Rect &vr(tree.view_rect());
  const GroupNode &root(*tree.root());
  std::streamsize old_precision;

  old_precision = dst.precision(8);
  dst << "<svg width=\"" << tree.width() << "\" height=\"" << tree.height()
      << "\" viewBox=\"" << vr.min_x() << " " << vr.min_y()
      << " " << vr.width() << " " << vr.height() << "\""
      << " xmlns=\"http://www.w3.org/2000/svg\""
      << " xmlns:xlink=\"http://www.w3.org/1999/xlink\">\n";

  if (root.transform().is_identity() && root.id()[0] == 0)
    {
      write_children(root, Indent(1), dst);
    }
  else
    {
      write_group(root, Indent(1), dst);
    }

  dst << "</svg>\n";
  dst.precision(old_precision);
}

enum pathsvg::return_code
pathsvg::
write_svg_file(const Tree &tree, c_string filename, Error *out_error)
{
  std::ofstream file(filename, std::ios::binary | std::ios::trunc);

  if (!file)
    {
      if (out_error)
        {
          std::ostringstream str;

          str << "unable to open \"" << filename << "\": " << std::strerror(errno);
          *out_error = Error(Error::io_write_error, str.str().c_str());
        }
      return routine_fail;
    }

  write_svg(tree, file);
  file.flush();
  if (!file)
    {
      if (out_error)
        {
          std::ostringstream str;

          str << "unable to write \"" << filename << "\": " << std::strerror(errno);
          *out_error = Error(Error::io_write_error, str.str().c_str());
        }
      return routine_fail;
    }

  return routine_success;
}
