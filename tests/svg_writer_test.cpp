/*!
 * \file svg_writer_test.cpp
 * \brief file svg_writer_test.cpp
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


#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <pathsvg/path_data.hpp>
#include <pathsvg/bounds_computer.hpp>
#include <pathsvg/document/tree.hpp>
#include <pathsvg/document/svg_writer.hpp>

using namespace pathsvg;

namespace
{
  CanvasGeometry
  canvas(float x, float y, float w, float h)
  {
    CanvasGeometry R;

    R.m_width = w;
    R.m_height = h;
    R.m_view_rect = Rect(x, y, x + w, y + h);
    return R;
  }

  std::string
  to_svg(const Tree &tree)
  {
    std::ostringstream str;
    write_svg(tree, str);
    return str.str();
  }

  bool
  contains(const std::string &haystack, const std::string &needle)
  {
    return haystack.find(needle) != std::string::npos;
  }
}

TEST(SvgWriter, PathDataText)
{
  PathDataBuilder b;
  PathData data;
  std::ostringstream str;

  b.move_to(vec2(0.0f, 1.0f));
  b.line_to(vec2(2.0f, 3.0f));
  b.quad_to(vec2(4.0f, 5.0f), vec2(6.0f, 7.0f));
  b.cubic_to(vec2(8.0f, 9.0f), vec2(10.0f, 11.0f), vec2(12.0f, 13.0f));
  b.close();
  ASSERT_EQ(routine_success, b.finish(&data));

  write_path_data(data, str);
  EXPECT_EQ("M 0 1 L 2 3 Q 4 5 6 7 C 8 9 10 11 12 13 Z", str.str());
}

TEST(SvgWriter, RootElement)
{
  Tree tree(canvas(-1.0f, 2.0f, 30.0f, 40.0f));
  std::string svg(to_svg(tree));

  EXPECT_EQ(0u, svg.find("<svg width=\"30\" height=\"40\" viewBox=\"-1 2 30 40\""));
  EXPECT_TRUE(contains(svg, "xmlns=\"http://www.w3.org/2000/svg\""));
  EXPECT_TRUE(contains(svg, "xmlns:xlink=\"http://www.w3.org/1999/xlink\""));
  EXPECT_TRUE(contains(svg, "</svg>"));
}

TEST(SvgWriter, GroupsPathsAndPaint)
{
  PathDataBuilder b;
  PathData data;
  reference_counted_ptr<GroupNode> group(PATHSVGnew GroupNode(Transform::from_translate(5.0f, 6.0f)));
  reference_counted_ptr<PathNode> filled, stroked;
  Tree tree(canvas(0.0f, 0.0f, 10.0f, 10.0f));
  Fill fill(make_fill(Color(255, 128, 0), 0.5f));
  Stroke stroke(make_stroke(Color(0, 0, 255), 1.0f, 2.5f));

  b.move_to(vec2(0.0f, 0.0f));
  b.line_to(vec2(1.0f, 1.0f));
  ASSERT_EQ(routine_success, b.finish(&data));

  filled = PATHSVGnew PathNode(data);
  filled->fill(&fill);
  stroked = PATHSVGnew PathNode(data, Transform::from_scale(2.0f, 2.0f));
  stroked->stroke(&stroke);
  stroked->id("edge");

  ASSERT_EQ(routine_success, group->append(filled));
  ASSERT_EQ(routine_success, group->append(stroked));
  ASSERT_EQ(routine_success, tree.root()->append(group));

  std::string svg(to_svg(tree));
  EXPECT_TRUE(contains(svg, "<g transform=\"matrix(1 0 0 1 5 6)\">"));
  EXPECT_TRUE(contains(svg, "<path fill=\"#ff8000\" fill-opacity=\"0.5\" d=\"M 0 0 L 1 1\"/>"));
  EXPECT_TRUE(contains(svg, "<path id=\"edge\" fill=\"none\" stroke=\"#0000ff\" stroke-width=\"2.5\""
                       " transform=\"matrix(2 0 0 2 0 0)\" d=\"M 0 0 L 1 1\"/>"));
  EXPECT_TRUE(contains(svg, "</g>"));
}

TEST(SvgWriter, ImageIsBase64)
{
  const uint8_t bytes[] = { 'a', 'b', 'c', 'd' };
  reference_counted_ptr<const DataBuffer> png;
  Tree tree(canvas(0.0f, 0.0f, 10.0f, 10.0f));

  png = PATHSVGnew DataBuffer(c_array<const uint8_t>(bytes, 4));
  ASSERT_EQ(routine_success,
            tree.root()->append(PATHSVGnew ImageNode(png, Rect(1.0f, 2.0f, 4.0f, 6.0f))));

  std::string svg(to_svg(tree));
  EXPECT_TRUE(contains(svg, "<image x=\"1\" y=\"2\" width=\"3\" height=\"4\""
                       " xlink:href=\"data:image/png;base64,YWJjZA==\"/>"));
}

TEST(SvgWriter, TextIsEscaped)
{
  reference_counted_ptr<TextNode> text(PATHSVGnew TextNode("a<b & c", 12.0f));
  Tree tree(canvas(0.0f, 0.0f, 10.0f, 10.0f));

  text->add_font_family("Noto Sans").add_font_family("serif");
  text->dominant_baseline(TextNode::central_baseline);
  ASSERT_EQ(routine_success, tree.root()->append(text));

  std::string svg(to_svg(tree));
  EXPECT_TRUE(contains(svg, "font-family=\"'Noto Sans', 'serif'\""));
  EXPECT_TRUE(contains(svg, "font-size=\"12\""));
  EXPECT_TRUE(contains(svg, "dominant-baseline=\"central\""));
  EXPECT_TRUE(contains(svg, ">a&lt;b &amp; c</text>"));
}

TEST(SvgWriter, UnwritableFileReportsIoError)
{
  Tree tree(canvas(0.0f, 0.0f, 10.0f, 10.0f));
  Error error;

  EXPECT_EQ(routine_fail,
            write_svg_file(tree, "/nonexistent-directory/out.svg", &error));
  EXPECT_EQ(Error::io_write_error, error.kind());
  EXPECT_NE(std::string::npos, std::string(error.message()).find("/nonexistent-directory/out.svg"));
}
