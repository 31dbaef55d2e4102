/*!
 * \file text_to_path.cpp
 * \brief file text_to_path.cpp
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
#include <mutex>
#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H
#include FT_TRUETYPE_TABLES_H

#include <pathsvg/text/text_to_path.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>
#include <private/util_private.hpp>

namespace
{
  enum conversion_t
    {
      converted,
      no_matching_font,
      no_geometry,
    };

  /* decode UTF-8, invalid sequences give U+FFFD */
  void
  decode_utf8(pathsvg::c_string str, std::vector<uint32_t> &out)
  {
    const uint8_t *p;

    p = reinterpret_cast<const uint8_t*>(str);
    while (*p)
      {
        uint32_t cp, len;

        if (*p < 0x80u)
          {
            cp = *p;
            len = 1;
          }
        else if ((*p & 0xE0u) == 0xC0u)
          {
            cp = *p & 0x1Fu;
            len = 2;
          }
        else if ((*p & 0xF0u) == 0xE0u)
          {
            cp = *p & 0x0Fu;
            len = 3;
          }
        else if ((*p & 0xF8u) == 0xF0u)
          {
            cp = *p & 0x07u;
            len = 4;
          }
        else
          {
            out.push_back(0xFFFDu);
            ++p;
            continue;
          }

        uint32_t i;
        for (i = 1; i < len && (p[i] & 0xC0u) == 0x80u; ++i)
          {
            cp = (cp << 6u) | (p[i] & 0x3Fu);
          }

        if (i != len)
          {
            out.push_back(0xFFFDu);
            p += i;
          }
        else
          {
            out.push_back(cp);
            p += len;
          }
      }
  }

  class GlyphPathCreator
  {
  public:
    static
    void
    decompose_to_path(FT_Outline *outline, pathsvg::PathDataBuilder &builder,
                      const pathsvg::vec2 &offset, float scale)
    {
      GlyphPathCreator datum(builder, offset, scale);
      FT_Outline_Funcs funcs;

      funcs.move_to = &ft_outline_move_to;
      funcs.line_to = &ft_outline_line_to;
      funcs.conic_to = &ft_outline_conic_to;
      funcs.cubic_to = &ft_outline_cubic_to;
      funcs.shift = 0;
      funcs.delta = 0;
      FT_Outline_Decompose(outline, &funcs, &datum);
      if (datum.m_contour_open)
        {
          builder.close();
        }
    }

  private:
    GlyphPathCreator(pathsvg::PathDataBuilder &builder,
                     const pathsvg::vec2 &offset, float scale):
      m_builder(builder),
      m_offset(offset),
      m_scale(scale),
      m_contour_open(false)
    {}

    /* font units are y-up, the output is y-down */
    pathsvg::vec2
    map(const FT_Vector *pt) const
    {
      return pathsvg::vec2(m_offset.x() + m_scale * float(pt->x),
                           m_offset.y() - m_scale * float(pt->y));
    }

    static
    int
    ft_outline_move_to(const FT_Vector *pt, void *user)
    {
      GlyphPathCreator *p;
      p = static_cast<GlyphPathCreator*>(user);
      if (p->m_contour_open)
        {
          p->m_builder.close();
        }
      p->m_builder.move_to(p->map(pt));
      p->m_contour_open = true;
      return 0;
    }

    static
    int
    ft_outline_line_to(const FT_Vector *pt, void *user)
    {
      GlyphPathCreator *p;
      p = static_cast<GlyphPathCreator*>(user);
      p->m_builder.line_to(p->map(pt));
      return 0;
    }

    static
    int
    ft_outline_conic_to(const FT_Vector *control_pt,
                        const FT_Vector *pt, void *user)
    {
      GlyphPathCreator *p;
      p = static_cast<GlyphPathCreator*>(user);
      p->m_builder.quad_to(p->map(control_pt), p->map(pt));
      return 0;
    }

    static
    int
    ft_outline_cubic_to(const FT_Vector *control_pt0,
                        const FT_Vector *control_pt1,
                        const FT_Vector *pt, void *user)
    {
      GlyphPathCreator *p;
      p = static_cast<GlyphPathCreator*>(user);
      p->m_builder.cubic_to(p->map(control_pt0),
                            p->map(control_pt1),
                            p->map(pt));
      return 0;
    }

    pathsvg::PathDataBuilder &m_builder;
    pathsvg::vec2 m_offset;
    float m_scale;
    bool m_contour_open;
  };

  /* amount, in font units, by which the glyphs are moved down
   * so that the named baseline lies on y = 0
   */
  float
  baseline_shift(FT_Face face, enum pathsvg::TextNode::dominant_baseline_t b)
  {
    float ascent(face->ascender), descent(face->descender);

    switch (b)
      {
      case pathsvg::TextNode::auto_baseline:
      case pathsvg::TextNode::alphabetic_baseline:
        return 0.0f;

      case pathsvg::TextNode::hanging_baseline:
        return 0.8f * ascent;

      case pathsvg::TextNode::mathematical_baseline:
        return 0.5f * ascent;

      case pathsvg::TextNode::central_baseline:
        return 0.5f * (ascent + descent);

      case pathsvg::TextNode::middle_baseline:
        {
          TT_OS2 *os2;

          os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
          if (os2 && os2->version >= 2 && os2->sxHeight > 0)
            {
              return 0.5f * float(os2->sxHeight);
            }
          return 0.25f * ascent;
        }

      case pathsvg::TextNode::text_before_edge_baseline:
        return ascent;

      case pathsvg::TextNode::ideographic_baseline:
      case pathsvg::TextNode::text_after_edge_baseline:
        return descent;
      }
    return 0.0f;
  }

  enum conversion_t
  convert_text_node(const pathsvg::TextNode &text,
                    const pathsvg::FontDatabase &db,
                    pathsvg::PathData *out)
  {
    std::vector<pathsvg::c_string> families;
    pathsvg::reference_counted_ptr<pathsvg::FreeTypeFace> face;

    for (unsigned int i = 0, endi = text.number_font_families(); i < endi; ++i)
      {
        families.push_back(text.font_family(i));
      }

    face = db.query(pathsvg::make_c_array(static_cast<const std::vector<pathsvg::c_string>&>(families)));
    if (!face)
      {
        return no_matching_font;
      }

    std::lock_guard<pathsvg::FreeTypeFace> lock(*face);
    FT_Face ft(face->face());
    std::vector<uint32_t> code_points;
    pathsvg::PathDataBuilder builder;
    float scale, pen_x(0.0f), shift;
    FT_Int32 load_flags;

    if (ft->units_per_EM == 0)
      {
        return no_geometry;
      }

    load_flags = FT_LOAD_NO_SCALE | FT_LOAD_NO_HINTING
      | FT_LOAD_NO_BITMAP | FT_LOAD_IGNORE_TRANSFORM;

    scale = text.font_size() / float(ft->units_per_EM);
    shift = scale * baseline_shift(ft, text.dominant_baseline());

    decode_utf8(text.text(), code_points);
    for (uint32_t cp : code_points)
      {
        FT_UInt glyph_code;

        glyph_code = FT_Get_Char_Index(ft, cp);
        if (FT_Load_Glyph(ft, glyph_code, load_flags) != 0)
          {
            continue;
          }

        if (ft->glyph->format == FT_GLYPH_FORMAT_OUTLINE)
          {
            GlyphPathCreator::decompose_to_path(&ft->glyph->outline, builder,
                                                pathsvg::vec2(pen_x, shift), scale);
          }
        pen_x += scale * float(ft->glyph->metrics.horiAdvance);
      }

    return (builder.finish(out) == pathsvg::routine_success) ?
      converted : no_geometry;
  }

  unsigned int
  convert_group(pathsvg::GroupNode &group, const pathsvg::FontDatabase &db)
  {
    unsigned int return_value(0);

    for (unsigned int c = 0; c < group.children().size();)
      {
        pathsvg::reference_counted_ptr<pathsvg::Node> child(group.children()[c]);

        if (child->type() == pathsvg::Node::group_node)
          {
            return_value += convert_group(*child.static_cast_ptr<pathsvg::GroupNode>(), db);
            ++c;
          }
        else if (child->type() == pathsvg::Node::text_node)
          {
            const pathsvg::TextNode *text;
            pathsvg::PathData data;
            enum conversion_t R;

            text = static_cast<const pathsvg::TextNode*>(child.get());
            R = convert_text_node(*text, db, &data);
            if (R == converted)
              {
                pathsvg::reference_counted_ptr<pathsvg::PathNode> path;

                path = PATHSVGnew pathsvg::PathNode(data, text->transform());
                path->fill(text->fill());
                path->stroke(text->stroke());
                path->id(text->id());
                if (group.replace_child(c, path) == pathsvg::routine_success)
                  {
                    ++return_value;
                  }
                else
                  {
                    PATHSVGwarning("Unable to replace text \"" << text->text() << "\" by its outlines");
                  }
                ++c;
              }
            else
              {
                if (R == no_matching_font)
                  {
                    PATHSVGwarning("No font found for text \"" << text->text() << "\", text dropped");
                  }
                if (group.replace_child(c, pathsvg::reference_counted_ptr<pathsvg::Node>()) != pathsvg::routine_success)
                  {
                    ++c;
                  }
              }
          }
        else
          {
            ++c;
          }
      }
    return return_value;
  }
}

enum pathsvg::return_code
pathsvg::
text_to_path_data(const TextNode &text, const FontDatabase &db,
                  PathData *out)
{
  return (convert_text_node(text, db, out) == converted) ?
    routine_success :
    routine_fail;
}

unsigned int
pathsvg::
convert_text(Tree &tree, const FontDatabase &db)
{
  return convert_group(*tree.root(), db);
}
