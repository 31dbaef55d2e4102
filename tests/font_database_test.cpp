/*!
 * \file font_database_test.cpp
 * \brief file font_database_test.cpp
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
#include <mutex>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <strings.h>
#include <sys/stat.h>
#include <gtest/gtest.h>
#include <pathsvg/path_data.hpp>
#include <pathsvg/document/tree.hpp>
#include <pathsvg/bounds_computer.hpp>
#include <pathsvg/text/font_database.hpp>
#include <pathsvg/text/freetype_face.hpp>
#include <pathsvg/text/text_to_path.hpp>
#include <pathsvg/writer.hpp>
#include <pathsvg/document/paint.hpp>

using namespace pathsvg;

namespace
{
  /* extension of a font file, empty if it is not one
   * load_fonts_dir() picks up
   */
  std::string
  font_extension(const std::string &filename)
  {
    std::string::size_type dot(filename.rfind('.'));
    if (dot == std::string::npos)
      {
        return std::string();
      }

    std::string ext(filename.substr(dot));
    if (strcasecmp(ext.c_str(), ".ttf") == 0
        || strcasecmp(ext.c_str(), ".otf") == 0
        || strcasecmp(ext.c_str(), ".ttc") == 0
        || strcasecmp(ext.c_str(), ".otc") == 0)
      {
        return ext;
      }
    return std::string();
  }

  bool
  copy_file(const std::string &src, const std::string &dst)
  {
    std::ifstream in(src.c_str(), std::ios::binary);
    std::ofstream out(dst.c_str(), std::ios::binary);

    if (!in || !out)
      {
        return false;
      }
    out << in.rdbuf();
    return static_cast<bool>(out);
  }

  void
  write_text_file(const std::string &filename, const char *text)
  {
    std::ofstream out(filename.c_str());
    out << text;
  }

  std::string
  read_file(const std::string &filename)
  {
    std::ifstream file(filename.c_str());
    std::ostringstream str;

    str << file.rdbuf();
    return str.str();
  }

  CanvasGeometry
  unit_canvas(void)
  {
    CanvasGeometry R;

    R.m_width = 1.0f;
    R.m_height = 1.0f;
    R.m_view_rect = Rect(0.0f, 0.0f, 1.0f, 1.0f);
    return R;
  }
}

/* a database with the system fonts, shared by the tests of the
 * suite as listing the fonts is slow; released when the suite
 * ends so nothing outlives main()
 */
class SystemFonts:public ::testing::Test
{
protected:
  static
  void
  SetUpTestSuite(void)
  {
    m_db = PATHSVGnew FontDatabase();
    m_db->load_system_fonts();
  }

  static
  void
  TearDownTestSuite(void)
  {
    m_db.clear();
  }

  void
  SetUp(void) override
  {
    if (m_db->len() == 0)
      {
        GTEST_SKIP() << "fontconfig lists no fonts";
      }
  }

  /* file of the first system face, empty if it cannot be opened */
  static
  std::string
  system_font_file(void)
  {
    reference_counted_ptr<FreeTypeFace> face(m_db->face(0));
    return (face) ? face->source().filename() : std::string();
  }

  /* Lays out under TempDir() a directory holding a copy of
   * a system font file, a text file and a subdirectory with
   * a second copy of the font file. Returns the directory,
   * empty if the font file could not be copied; the path of
   * the top level copy is written to out_font.
   */
  static
  std::string
  make_font_dir(c_string name, std::string *out_font)
  {
    std::string src(system_font_file());
    std::string ext(font_extension(src));
    std::string dir(::testing::TempDir() + name);

    if (ext.empty())
      {
        return std::string();
      }

    mkdir(dir.c_str(), 0700);
    mkdir((dir + "/sub").c_str(), 0700);
    *out_font = dir + "/a" + ext;
    if (!copy_file(src, *out_font)
        || !copy_file(src, dir + "/sub/b" + ext))
      {
        return std::string();
      }
    write_text_file(dir + "/notes.txt", "not a font");
    return dir;
  }

  static reference_counted_ptr<FontDatabase> m_db;
};

reference_counted_ptr<FontDatabase> SystemFonts::m_db;

TEST(FontDatabase, MissingInputs)
{
  reference_counted_ptr<FontDatabase> db(PATHSVGnew FontDatabase());

  EXPECT_EQ(routine_fail, db->load_font_file("/nonexistent-directory/font.ttf"));
  EXPECT_EQ(0u, db->load_fonts_dir("/nonexistent-directory"));
  EXPECT_EQ(0u, db->len());

  c_string families[] = { "serif", "Anything" };
  EXPECT_FALSE(db->query(c_array<const c_string>(families, 2)));
}

TEST(FontDatabase, GarbageSourceRejected)
{
  const uint8_t bytes[] = "this is not a font file";
  reference_counted_ptr<FontDatabase> db(PATHSVGnew FontDatabase());
  reference_counted_ptr<const DataBuffer> src;

  src = PATHSVGnew DataBuffer(c_array<const uint8_t>(bytes, sizeof(bytes)));
  EXPECT_EQ(routine_fail, db->load_font_source(src));
  EXPECT_EQ(0u, db->len());
}

TEST(FreeTypeFace, OpenFailures)
{
  const uint8_t bytes[] = "not a font";
  reference_counted_ptr<FreeTypeLib> lib(PATHSVGnew FreeTypeLib());
  reference_counted_ptr<const DataBuffer> src;

  ASSERT_TRUE(lib->valid());
  src = PATHSVGnew DataBuffer(c_array<const uint8_t>(bytes, sizeof(bytes)));

  EXPECT_FALSE(FreeTypeFace::open(lib, FaceSource(src, 0)));
  EXPECT_FALSE(FreeTypeFace::open(lib, FaceSource("/nonexistent-directory/font.ttf", 0)));
  EXPECT_FALSE(FreeTypeFace::open(reference_counted_ptr<FreeTypeLib>(), FaceSource(src, 0)));
}

TEST_F(SystemFonts, SourceOfRegisteredFace)
{
  const reference_counted_ptr<FontDatabase> &db(m_db);

  reference_counted_ptr<FreeTypeFace> face(db->face(0));
  ASSERT_TRUE(face);

  /* reopening from the recorded source gives the same family */
  reference_counted_ptr<FreeTypeFace> again;
  again = FreeTypeFace::open(db->lib(), face->source());
  ASSERT_TRUE(again);

  std::lock_guard<FreeTypeFace> lock_a(*face);
  std::lock_guard<FreeTypeFace> lock_b(*again);
  EXPECT_EQ(face->face()->num_glyphs, again->face()->num_glyphs);
  EXPECT_STREQ(face->face()->family_name, again->face()->family_name);
}

TEST(FontDatabase, GenericFamilies)
{
  EXPECT_TRUE(FontDatabase::is_generic_family("serif"));
  EXPECT_TRUE(FontDatabase::is_generic_family("sans-serif"));
  EXPECT_TRUE(FontDatabase::is_generic_family("monospace"));
  EXPECT_TRUE(FontDatabase::is_generic_family("cursive"));
  EXPECT_TRUE(FontDatabase::is_generic_family("fantasy"));
  EXPECT_FALSE(FontDatabase::is_generic_family("DejaVu Sans"));
  EXPECT_FALSE(FontDatabase::is_generic_family(nullptr));
}

TEST_F(SystemFonts, QueryIgnoresCase)
{
  const reference_counted_ptr<FontDatabase> &db(m_db);

  std::string family(db->family(0));
  for (char &c : family)
    {
      c = std::toupper(static_cast<unsigned char>(c));
    }

  c_string families[] = { "No Such Family For Tests", family.c_str() };
  EXPECT_TRUE(db->query(c_array<const c_string>(families, 2)));
}

TEST_F(SystemFonts, TextBecomesOutlines)
{
  const reference_counted_ptr<FontDatabase> &db(m_db);

  reference_counted_ptr<TextNode> text(PATHSVGnew TextNode("Hello", 20.0f));
  PathData data;
  Rect bb;

  text->add_font_family(db->family(0));
  ASSERT_EQ(routine_success, text_to_path_data(*text, *db, &data));
  EXPECT_FALSE(data.empty());

  /* glyphs of an alphabetic baseline sit above y = 0 */
  bb = data.bounds();
  EXPECT_LT(bb.min_y(), 0.0f);
  EXPECT_GT(bb.width(), 0.0f);
}

TEST_F(SystemFonts, HangingBaselineMovesGlyphsDown)
{
  const reference_counted_ptr<FontDatabase> &db(m_db);

  reference_counted_ptr<TextNode> text(PATHSVGnew TextNode("H", 20.0f));
  PathData alphabetic, hanging;

  text->add_font_family(db->family(0));
  ASSERT_EQ(routine_success, text_to_path_data(*text, *db, &alphabetic));
  text->dominant_baseline(TextNode::hanging_baseline);
  ASSERT_EQ(routine_success, text_to_path_data(*text, *db, &hanging));

  EXPECT_GT(hanging.bounds().min_y(), alphabetic.bounds().min_y());
  EXPECT_FLOAT_EQ(alphabetic.bounds().min_x(), hanging.bounds().min_x());
}

TEST_F(SystemFonts, ConvertTextReplacesNodes)
{
  const reference_counted_ptr<FontDatabase> &db(m_db);

  Tree tree(unit_canvas());
  reference_counted_ptr<GroupNode> group(PATHSVGnew GroupNode());
  reference_counted_ptr<TextNode> found(PATHSVGnew TextNode("abc", 12.0f, Transform::from_translate(4.0f, 5.0f)));
  reference_counted_ptr<TextNode> lost(PATHSVGnew TextNode("xyz", 12.0f));

  found->add_font_family(db->family(0));
  lost->add_font_family("No Such Family For Tests");
  ASSERT_EQ(routine_success, group->append(found));
  ASSERT_EQ(routine_success, group->append(lost));
  ASSERT_EQ(routine_success, tree.root()->append(group));

  EXPECT_EQ(1u, convert_text(tree, *db));
  ASSERT_EQ(1u, group->children().size());

  const Node &converted(*group->children()[0]);
  EXPECT_EQ(Node::path_node, converted.type());
  EXPECT_EQ(Transform::from_translate(4.0f, 5.0f), converted.transform());
}

TEST_F(SystemFonts, SystemFontCountMatchesLen)
{
  reference_counted_ptr<FontDatabase> db(PATHSVGnew FontDatabase());
  unsigned int count;

  count = db->load_system_fonts();
  EXPECT_EQ(count, db->len());
  EXPECT_EQ(m_db->len(), db->len());

  /* every face listed is already registered */
  EXPECT_EQ(0u, db->load_system_fonts());
  EXPECT_EQ(count, db->len());
}

TEST_F(SystemFonts, LoadFontsDirScansSubdirectories)
{
  std::string font;
  std::string dir(make_font_dir("pathsvg_fonts_scan", &font));
  if (dir.empty())
    {
      GTEST_SKIP() << "no copyable font file";
    }

  /* number of faces in one copy of the file */
  reference_counted_ptr<FontDatabase> single(PATHSVGnew FontDatabase());
  ASSERT_EQ(routine_success, single->load_font_file(font.c_str()));
  unsigned int per_file(single->len());
  ASSERT_GT(per_file, 0u);

  /* both copies are found, the text file is skipped */
  reference_counted_ptr<FontDatabase> db(PATHSVGnew FontDatabase());
  EXPECT_EQ(2u * per_file, db->load_fonts_dir(dir.c_str()));
  EXPECT_EQ(2u * per_file, db->len());
  EXPECT_STREQ(single->family(0), db->family(0));

  /* loading the same files again registers nothing */
  EXPECT_EQ(0u, db->load_fonts_dir(dir.c_str()));
  EXPECT_EQ(routine_fail, db->load_font_file(font.c_str()));
  EXPECT_EQ(2u * per_file, db->len());
}

TEST_F(SystemFonts, LoadFontSourceFromMemory)
{
  std::string src(system_font_file());
  if (src.empty())
    {
      GTEST_SKIP() << "first system face cannot be opened";
    }

  reference_counted_ptr<const DataBuffer> buffer(PATHSVGnew DataBuffer(src.c_str()));
  reference_counted_ptr<FontDatabase> db(PATHSVGnew FontDatabase());

  ASSERT_TRUE(buffer->loaded());
  ASSERT_EQ(routine_success, db->load_font_source(buffer));
  EXPECT_GT(db->len(), 0u);

  c_string families[] = { db->family(0) };
  EXPECT_TRUE(db->query(c_array<const c_string>(families, 1)));

  /* the same buffer is only registered once */
  unsigned int count(db->len());
  EXPECT_EQ(routine_fail, db->load_font_source(buffer));
  EXPECT_EQ(count, db->len());
}

TEST_F(SystemFonts, WriterFontsFromDirectory)
{
  std::string font;
  std::string dir(make_font_dir("pathsvg_fonts_writer", &font));
  if (dir.empty())
    {
      GTEST_SKIP() << "no copyable font file";
    }

  PathWriter writer;
  TextPathWriter text_writer(writer.add_fonts_dir(dir.c_str()));
  std::string filename(::testing::TempDir() + "pathsvg_dir_text.svg");
  Fill fill(make_fill(Color::black(), 1.0f));
  Error error;

  ASSERT_TRUE(text_writer.fonts());
  ASSERT_GT(text_writer.fonts()->len(), 0u);

  c_string families[] = { "No Such Family For Tests", text_writer.fonts()->family(0) };
  ASSERT_EQ(routine_success,
            text_writer.push_text("Hello", c_array<const c_string>(families, 2), 16.0f,
                                  Transform::from_translate(0.0f, 20.0f), &fill, nullptr,
                                  TextNode::auto_baseline, &error));
  ASSERT_EQ(routine_success, text_writer.write(filename.c_str(), &error));

  std::string svg(read_file(filename));
  EXPECT_EQ(std::string::npos, svg.find("<text"));
  EXPECT_NE(std::string::npos, svg.find("<path"));
  std::remove(filename.c_str());
}

TEST_F(SystemFonts, WriterFontsFromSource)
{
  std::string src(system_font_file());
  if (src.empty())
    {
      GTEST_SKIP() << "first system face cannot be opened";
    }

  reference_counted_ptr<const DataBuffer> buffer(PATHSVGnew DataBuffer(src.c_str()));
  std::string filename(::testing::TempDir() + "pathsvg_source_text.svg");
  Fill fill(make_fill(Color::black(), 1.0f));
  Error error;

  ASSERT_TRUE(buffer->loaded());

  PathWriter writer;
  TextPathWriter text_writer(writer.add_fonts_source(buffer));
  ASSERT_TRUE(text_writer.fonts());
  ASSERT_GT(text_writer.fonts()->len(), 0u);

  c_string families[] = { text_writer.fonts()->family(0) };
  ASSERT_EQ(routine_success,
            text_writer.push_text("abc", c_array<const c_string>(families, 1), 12.0f,
                                  Transform(), &fill, nullptr,
                                  TextNode::auto_baseline, &error));
  EXPECT_EQ(1u, text_writer.number_nodes());
  ASSERT_EQ(routine_success, text_writer.write(filename.c_str(), &error));

  std::string svg(read_file(filename));
  EXPECT_EQ(std::string::npos, svg.find("<text"));
  EXPECT_NE(std::string::npos, svg.find("<path"));
  EXPECT_EQ(0u, text_writer.number_nodes());
  std::remove(filename.c_str());
}
