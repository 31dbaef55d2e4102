/*!
 * \file writer_test.cpp
 * \brief file writer_test.cpp
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


#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <pathsvg/writer.hpp>
#include <pathsvg/document/paint.hpp>

using namespace pathsvg;

namespace
{
  void
  triangle(Path &path, float x, float y)
  {
    path.begin(vec2(x, y))
      .line_to(vec2(x + 10.0f, y))
      .line_to(vec2(x + 10.0f, y + 10.0f))
      .end(true);
  }

  std::string
  read_file(const std::string &filename)
  {
    std::ifstream file(filename.c_str());
    std::ostringstream str;

    str << file.rdbuf();
    return str.str();
  }

  std::string
  temp_file(c_string name)
  {
    return ::testing::TempDir() + name;
  }
}

TEST(Writer, PushTranslatesPaths)
{
  PathWriter writer;
  Path path, empty;
  Fill fill(make_fill(Color::black(), 1.0f));
  Error error;

  triangle(path, 0.0f, 0.0f);
  EXPECT_EQ(routine_success, writer.push(path, &fill, nullptr, nullptr, &error));
  EXPECT_EQ(1u, writer.number_nodes());

  EXPECT_EQ(routine_fail, writer.push(empty, &fill, nullptr, nullptr, &error));
  EXPECT_EQ(Error::svg_failure_error, error.kind());
  EXPECT_EQ(1u, writer.number_nodes());
}

TEST(Writer, PushPngChecksRectangle)
{
  const uint8_t bytes[] = { 1, 2, 3 };
  reference_counted_ptr<const DataBuffer> png(PATHSVGnew DataBuffer(c_array<const uint8_t>(bytes, 3)));
  PathWriter writer;
  Error error;

  EXPECT_EQ(routine_success,
            writer.push_png(png, Transform::from_translate(1.0f, 2.0f), 4.0f, 6.0f, &error));

  EXPECT_EQ(routine_fail,
            writer.push_png(png, Transform::from_translate(10.0f, 20.0f), 4.0f, 0.0f, &error));
  EXPECT_EQ(Error::wrong_bounding_box_error, error.kind());
  EXPECT_EQ(8.0f, error.min_x());
  EXPECT_EQ(12.0f, error.max_x());
  EXPECT_EQ(20.0f, error.min_y());
  EXPECT_EQ(20.0f, error.max_y());
  EXPECT_EQ(1u, writer.number_nodes());
}

TEST(Writer, CreatePngNodeUsesTranslationOnly)
{
  reference_counted_ptr<ImageNode> node;
  Transform tr(Transform::from_translate(3.0f, 4.0f).pre_concat(Transform::from_scale(5.0f, 5.0f)));

  ASSERT_EQ(routine_success,
            create_png_node(reference_counted_ptr<const DataBuffer>(), tr, 2.0f, 1.0f, &node));
  EXPECT_EQ(Rect(3.0f, 4.0f, 5.0f, 5.0f), node->view_rect());
  EXPECT_TRUE(node->transform().is_identity());
}

TEST(Writer, PushNodeRequiresOrphan)
{
  PathWriter writer;
  reference_counted_ptr<GroupNode> group(PATHSVGnew GroupNode());
  reference_counted_ptr<Node> text(PATHSVGnew TextNode("x", 10.0f));

  ASSERT_EQ(routine_success, group->append(text));
  EXPECT_EQ(routine_fail, writer.push_node(text));
  EXPECT_EQ(routine_fail, writer.push_node(reference_counted_ptr<Node>()));
  EXPECT_EQ(routine_success, writer.push_node(group));
  EXPECT_EQ(routine_fail, writer.push_node(group));
  EXPECT_EQ(1u, writer.number_nodes());
}

TEST(Writer, PushGroupIsAtomic)
{
  PathWriter writer;
  reference_counted_ptr<GroupNode> owner(PATHSVGnew GroupNode());
  std::vector<reference_counted_ptr<Node> > nodes;

  nodes.push_back(PATHSVGnew TextNode("a", 10.0f));
  nodes.push_back(PATHSVGnew TextNode("b", 10.0f));
  ASSERT_EQ(routine_success, owner->append(nodes[1]));

  EXPECT_EQ(routine_fail, writer.push_group(make_c_array(nodes), Transform()));
  EXPECT_TRUE(nodes[0]->parent() == nullptr);
  EXPECT_EQ(0u, writer.number_nodes());

  owner->clear();
  EXPECT_EQ(routine_success,
            writer.push_group(make_c_array(nodes), Transform::from_scale(2.0f, 2.0f)));
  EXPECT_EQ(1u, writer.number_nodes());
}

TEST(Writer, PrepareBuildsDocument)
{
  PathWriter writer;
  Path path;
  reference_counted_ptr<Tree> tree;
  Error error;

  triangle(path, 0.0f, 0.0f);
  ASSERT_EQ(routine_success, writer.push(path, nullptr, nullptr, nullptr, &error));
  triangle(path, 0.0f, 0.0f);
  ASSERT_EQ(routine_success, writer.push(path, nullptr, nullptr, nullptr, &error));
  writer.transform(Transform::from_translate(100.0f, 50.0f));

  ASSERT_EQ(routine_success, writer.prepare(&tree, &error));
  ASSERT_TRUE(tree);

  /* root > group carrying the global transformation > nodes */
  ASSERT_EQ(1u, tree->root()->children().size());
  const reference_counted_ptr<Node> &top(tree->root()->children()[0]);
  ASSERT_EQ(Node::group_node, top->type());
  EXPECT_EQ(Transform::from_translate(100.0f, 50.0f), top->transform());
  EXPECT_EQ(2u, static_cast<const GroupNode&>(*top).children().size());

  EXPECT_EQ(10.0f, tree->width());
  EXPECT_EQ(10.0f, tree->height());
  EXPECT_EQ(Rect(100.0f, 50.0f, 110.0f, 60.0f), tree->view_rect());

  /* the writer is left empty */
  EXPECT_EQ(0u, writer.number_nodes());
  EXPECT_TRUE(writer.transform().is_identity());
}

TEST(Writer, EmptyWriterFails)
{
  PathWriter writer;
  Error error;

  EXPECT_EQ(routine_fail, writer.write(temp_file("pathsvg_empty.svg").c_str(), &error));
  EXPECT_EQ(Error::wrong_bounding_box_error, error.kind());
}

TEST(Writer, WritesSvgFile)
{
  PathWriter writer;
  Path path;
  Stroke stroke(make_stroke(Color(255, 0, 0), 1.0f, 2.0f));
  std::string filename(temp_file("pathsvg_paths.svg"));
  Error error;

  triangle(path, 5.0f, 5.0f);
  ASSERT_EQ(routine_success, writer.push(path, nullptr, &stroke, nullptr, &error));
  ASSERT_EQ(routine_success, writer.write(filename.c_str(), &error));

  std::string svg(read_file(filename));
  EXPECT_NE(std::string::npos, svg.find("viewBox=\"5 5 10 10\""));
  EXPECT_NE(std::string::npos, svg.find("stroke=\"#ff0000\""));
  EXPECT_NE(std::string::npos, svg.find("d=\"M 5 5 L 15 5 L 15 15 L 5 5 Z\""));
  std::remove(filename.c_str());
}

TEST(Writer, TextRequiresFonts)
{
  TextPathWriter writer;
  Path path;
  Error error;
  c_string families[] = { "sans-serif" };

  triangle(path, 0.0f, 0.0f);
  ASSERT_EQ(routine_success, writer.push(path, nullptr, nullptr, nullptr, &error));
  ASSERT_EQ(routine_success,
            writer.push_text("hi", c_array<const c_string>(families, 1), 12.0f,
                             Transform(), nullptr, nullptr,
                             TextNode::auto_baseline, &error));

  EXPECT_EQ(routine_fail, writer.write(temp_file("pathsvg_nofonts.svg").c_str(), &error));
  EXPECT_EQ(Error::no_fonts_error, error.kind());
  EXPECT_EQ(2u, writer.number_nodes());
}

TEST(Writer, TextNeedsPositiveSize)
{
  TextPathWriter writer;
  Error error;
  c_string families[] = { "serif" };

  EXPECT_EQ(routine_fail,
            writer.push_text("hi", c_array<const c_string>(families, 1), 0.0f,
                             Transform(), nullptr, nullptr,
                             TextNode::auto_baseline, &error));
  EXPECT_EQ(Error::font_failure_error, error.kind());
  EXPECT_EQ(0u, writer.number_nodes());
}

TEST(Writer, AddFontsMovesState)
{
  PathWriter writer;
  Path path;
  reference_counted_ptr<FontDatabase> fonts(PATHSVGnew FontDatabase());
  Transform global(Transform::from_scale(3.0f, 3.0f));
  Error error;

  triangle(path, 0.0f, 0.0f);
  ASSERT_EQ(routine_success, writer.push(path, nullptr, nullptr, nullptr, &error));
  writer.transform(global);

  TextPathWriter text_writer(writer.add_fonts(fonts));
  EXPECT_EQ(1u, text_writer.number_nodes());
  EXPECT_EQ(global, text_writer.transform());
  EXPECT_TRUE(text_writer.fonts() == fonts);
  EXPECT_EQ(0u, writer.number_nodes());
}

TEST(Writer, UnmatchedTextIsDropped)
{
  PathWriter writer;
  Path path;
  Fill fill(make_fill(Color::black(), 1.0f));
  std::string filename(temp_file("pathsvg_text.svg"));
  Error error;
  c_string families[] = { "No Such Family For Tests" };

  triangle(path, 0.0f, 0.0f);
  ASSERT_EQ(routine_success, writer.push(path, &fill, nullptr, nullptr, &error));

  /* a database without any face matches nothing */
  TextPathWriter text_writer(writer.add_fonts(PATHSVGnew FontDatabase()));
  ASSERT_EQ(routine_success,
            text_writer.push_text("hello", c_array<const c_string>(families, 1), 12.0f,
                                  Transform(), &fill, nullptr,
                                  TextNode::auto_baseline, &error));
  ASSERT_EQ(routine_success, text_writer.write(filename.c_str(), &error));

  std::string svg(read_file(filename));
  EXPECT_EQ(std::string::npos, svg.find("<text"));
  EXPECT_NE(std::string::npos, svg.find("<path"));
  EXPECT_EQ(0u, text_writer.number_nodes());
  std::remove(filename.c_str());
}
