#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <pathsvg/util/util.hpp>
#include <pathsvg/util/data_buffer.hpp>
#include <pathsvg/writer.hpp>
#include <pathsvg/document/paint.hpp>

#include "generic_command_line.hpp"
#include "read_path.hpp"

using namespace pathsvg;

namespace
{
  /* read a color of the form #rrggbb or rrggbb */
  bool
  parse_color(const std::string &str, Color *out)
  {
    std::string hex(str);
    unsigned int v;

    if (!hex.empty() && hex[0] == '#')
      {
        hex = hex.substr(1);
      }

    if (hex.length() != 6
        || hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos)
      {
        return false;
      }

    std::istringstream istr(hex);
    istr >> std::hex >> v;
    *out = Color((v >> 16u) & 0xFF, (v >> 8u) & 0xFF, v & 0xFF);
    return true;
  }

  void
  default_path(Path &path)
  {
    path.begin(vec2(0.0f, 0.0f))
      .line_to(vec2(100.0f, 0.0f))
      .quadratic_to(vec2(150.0f, 50.0f), vec2(100.0f, 100.0f))
      .cubic_to(vec2(70.0f, 140.0f), vec2(30.0f, 60.0f), vec2(0.0f, 100.0f))
      .end(true);

    path.begin(vec2(30.0f, 30.0f))
      .line_to(vec2(70.0f, 30.0f))
      .line_to(vec2(50.0f, 70.0f))
      .end(true);
  }
}

class pathsvg_demo:pathsvg::noncopyable
{
public:
  pathsvg_demo(void);

  int
  main(int argc, char **argv);

private:
  bool
  load_path(Path &path);

  Transform
  global_transform(void) const;

  bool
  make_paint(Fill *fill, Stroke *stroke) const;

  reference_counted_ptr<FontDatabase>
  load_fonts(void) const;

  bool
  wants_text(void) const;

  int
  write(WriterBase &writer, Error *error);

  command_line_register m_register;

  command_separator m_output_section;
  command_line_argument_value<std::string> m_output;
  command_line_argument_value<std::string> m_path_file;

  command_separator m_transform_section;
  command_line_argument_value<float> m_scale;
  command_line_argument_value<float> m_rotate;
  command_line_argument_value<float> m_translate_x, m_translate_y;
  command_line_argument_value<float> m_skew_x, m_skew_y;

  command_separator m_paint_section;
  command_line_argument_value<std::string> m_fill_color;
  command_line_argument_value<float> m_fill_opacity;
  command_line_argument_value<bool> m_even_odd;
  command_line_argument_value<std::string> m_stroke_color;
  command_line_argument_value<float> m_stroke_opacity;
  command_line_argument_value<float> m_stroke_width;

  command_separator m_image_section;
  command_line_argument_value<std::string> m_png_file;
  command_line_argument_value<float> m_png_x, m_png_y;
  command_line_argument_value<float> m_png_width, m_png_height;

  command_separator m_text_section;
  command_line_argument_value<std::string> m_font_file;
  command_line_argument_value<std::string> m_font_dir;
  command_line_argument_value<bool> m_system_fonts;
  command_line_argument_value<std::string> m_text;
  command_line_argument_value<float> m_font_size;
  command_line_list<std::string> m_font_families;
  enumerated_command_line_argument_value<enum TextNode::dominant_baseline_t> m_dominant_baseline;
  command_line_argument_value<float> m_text_x, m_text_y;

  command_line_argument_value<bool> m_print_help;
};

pathsvg_demo::
pathsvg_demo(void):
  m_output_section("Output", m_register),
  m_output("pathsvg_demo.svg", "output", "SVG file to write", m_register),
  m_path_file("", "path_file",
              "If non-empty, file from which to read the outlines of the path, "
              "the format is: [ and ] enclose a closed outline, { and } enclose "
              "an open outline, [[ and ]] enclose the control points between two "
              "points; otherwise a built-in path is drawn", m_register),
  m_transform_section("Global transformation", m_register),
  m_scale(1.0f, "scale", "scale factor applied to the whole drawing", m_register),
  m_rotate(0.0f, "rotate", "rotation in degrees applied to the whole drawing", m_register),
  m_translate_x(0.0f, "translate_x", "x-translation applied to the whole drawing", m_register),
  m_translate_y(0.0f, "translate_y", "y-translation applied to the whole drawing", m_register),
  m_skew_x(0.0f, "skew_x", "x-skew factor applied to the whole drawing", m_register),
  m_skew_y(0.0f, "skew_y", "y-skew factor applied to the whole drawing", m_register),
  m_paint_section("Paint", m_register),
  m_fill_color("#3060c0", "fill_color",
               "color of the fill as #rrggbb, the value none disables the fill",
               m_register),
  m_fill_opacity(1.0f, "fill_opacity", "opacity of the fill", m_register),
  m_even_odd(false, "even_odd", "if true fill with the even-odd rule", m_register),
  m_stroke_color("#000000", "stroke_color",
                 "color of the stroke as #rrggbb, the value none disables the stroke",
                 m_register),
  m_stroke_opacity(1.0f, "stroke_opacity", "opacity of the stroke", m_register),
  m_stroke_width(2.0f, "stroke_width", "width of the stroke", m_register),
  m_image_section("Image", m_register),
  m_png_file("", "png_file", "if non-empty, PNG file to place in the drawing", m_register),
  m_png_x(0.0f, "png_x", "x-coordinate of the min-corner of the image", m_register),
  m_png_y(0.0f, "png_y", "y-coordinate of the min-corner of the image", m_register),
  m_png_width(64.0f, "png_width", "width of the image", m_register),
  m_png_height(64.0f, "png_height", "height of the image", m_register),
  m_text_section("Text", m_register),
  m_font_file("", "font_file", "if non-empty, font file to load", m_register),
  m_font_dir("", "font_dir", "if non-empty, directory from which to load fonts recursively", m_register),
  m_system_fonts(false, "system_fonts", "if true, load the fonts listed by fontconfig", m_register),
  m_text("", "text", "if non-empty, text to draw; the text is converted to paths", m_register),
  m_font_size(24.0f, "font_size", "font size of the text", m_register),
  m_font_families("font_family",
                  "add a font family to try for the text, the families are tried "
                  "in the order given; if none is given sans-serif is used",
                  m_register),
  m_dominant_baseline(TextNode::auto_baseline, "auto", "dominant_baseline",
                      "baseline of the text placed at text_y", m_register),
  m_text_x(0.0f, "text_x", "x-coordinate of the start of the text", m_register),
  m_text_y(140.0f, "text_y", "y-coordinate of the baseline of the text", m_register),
  m_print_help(false, "help", "print the detailed description of every option", m_register)
{
  const enum TextNode::dominant_baseline_t values[] =
    {
      TextNode::alphabetic_baseline,
      TextNode::ideographic_baseline,
      TextNode::hanging_baseline,
      TextNode::mathematical_baseline,
      TextNode::central_baseline,
      TextNode::middle_baseline,
      TextNode::text_after_edge_baseline,
      TextNode::text_before_edge_baseline,
    };

  for (enum TextNode::dominant_baseline_t v : values)
    {
      m_dominant_baseline.add_entry(TextNode::label(v), v);
    }
}

bool
pathsvg_demo::
load_path(Path &path)
{
  if (m_path_file.m_value.empty())
    {
      default_path(path);
      return true;
    }

  std::ifstream file(m_path_file.m_value.c_str());
  if (!file)
    {
      std::cerr << "Unable to open path file \"" << m_path_file.m_value << "\"\n";
      return false;
    }

  std::ostringstream contents;
  contents << file.rdbuf();
  if (read_path(path, contents.str()) == 0)
    {
      std::cerr << "No outlines in path file \"" << m_path_file.m_value << "\"\n";
      return false;
    }
  return true;
}

Transform
pathsvg_demo::
global_transform(void) const
{
  Transform tr;

  tr = Transform::from_translate(m_translate_x.m_value, m_translate_y.m_value);
  tr = tr.pre_concat(Transform::from_rotate(m_rotate.m_value));
  tr = tr.pre_concat(Transform::from_scale(m_scale.m_value, m_scale.m_value));
  tr = tr.pre_concat(Transform::from_skew(m_skew_x.m_value, m_skew_y.m_value));
  return tr;
}

bool
pathsvg_demo::
make_paint(Fill *fill, Stroke *stroke) const
{
  Color c;

  if (m_fill_color.m_value != "none")
    {
      if (!parse_color(m_fill_color.m_value, &c))
        {
          std::cerr << "Bad fill color \"" << m_fill_color.m_value << "\"\n";
          return false;
        }
      *fill = make_fill(c, m_fill_opacity.m_value);
      fill->m_fill_rule = (m_even_odd.m_value) ?
        Fill::evenodd_fill_rule :
        Fill::nonzero_fill_rule;
    }

  if (m_stroke_color.m_value != "none")
    {
      if (!parse_color(m_stroke_color.m_value, &c))
        {
          std::cerr << "Bad stroke color \"" << m_stroke_color.m_value << "\"\n";
          return false;
        }
      *stroke = make_stroke(c, m_stroke_opacity.m_value, m_stroke_width.m_value);
    }
  return true;
}

bool
pathsvg_demo::
wants_text(void) const
{
  return !m_text.m_value.empty()
    || !m_font_file.m_value.empty()
    || !m_font_dir.m_value.empty()
    || m_system_fonts.m_value;
}

reference_counted_ptr<FontDatabase>
pathsvg_demo::
load_fonts(void) const
{
  reference_counted_ptr<FontDatabase> fonts;

  fonts = PATHSVGnew FontDatabase();
  if (!m_font_file.m_value.empty()
      && fonts->load_font_file(m_font_file.m_value.c_str()) == routine_fail)
    {
      std::cerr << "Unable to load font file \"" << m_font_file.m_value << "\"\n";
    }

  if (!m_font_dir.m_value.empty())
    {
      std::cout << fonts->load_fonts_dir(m_font_dir.m_value.c_str())
                << " faces loaded from \"" << m_font_dir.m_value << "\"\n";
    }

  if (m_system_fonts.m_value)
    {
      std::cout << fonts->load_system_fonts() << " system faces loaded\n";
    }
  return fonts;
}

int
pathsvg_demo::
write(WriterBase &writer, Error *error)
{
  Path path;
  Fill fill;
  Stroke stroke;
  Transform global(global_transform());
  bool has_fill(m_fill_color.m_value != "none");
  bool has_stroke(m_stroke_color.m_value != "none");

  if (!load_path(path) || !make_paint(&fill, &stroke))
    {
      return -1;
    }

  writer.transform(global);
  if (writer.push(path, has_fill ? &fill : nullptr,
                  has_stroke ? &stroke : nullptr,
                  nullptr, error) == routine_fail)
    {
      std::cerr << "Unable to add path: " << error->message() << "\n";
      return -1;
    }

  if (!m_png_file.m_value.empty())
    {
      reference_counted_ptr<const DataBuffer> png;

      png = PATHSVGnew DataBuffer(m_png_file.m_value.c_str());
      if (!png->loaded())
        {
          std::cerr << "Unable to read \"" << m_png_file.m_value << "\"\n";
          return -1;
        }

      if (writer.push_png(png,
                          Transform::from_translate(m_png_x.m_value, m_png_y.m_value),
                          m_png_width.m_value, m_png_height.m_value,
                          error) == routine_fail)
        {
          std::cerr << "Unable to add image: " << error->message() << "\n";
          return -1;
        }
    }
  return 0;
}

int
pathsvg_demo::
main(int argc, char **argv)
{
  Error error;

  if (argc == 2 && std::string(argv[1]) == "-help")
    {
      std::cout << "\n\nUsage: " << argv[0];
      m_register.print_help(std::cout);
      m_register.print_detailed_help(std::cout);
      return 0;
    }

  m_register.parse_command_line(argc, argv);
  if (m_print_help.m_value)
    {
      m_register.print_detailed_help(std::cout);
      return 0;
    }

  c_string filename(m_output.m_value.c_str());
  enum return_code R;

  if (!wants_text())
    {
      PathWriter writer;

      if (write(writer, &error) != 0)
        {
          return -1;
        }
      R = writer.write(filename, &error);
    }
  else
    {
      TextPathWriter writer(PathWriter().add_fonts(load_fonts()));

      if (write(writer, &error) != 0)
        {
          return -1;
        }

      if (!m_text.m_value.empty())
        {
          std::vector<c_string> families;
          Fill fill;
          Stroke stroke;

          for (const std::string &f : m_font_families.m_values)
            {
              families.push_back(f.c_str());
            }

          if (families.empty())
            {
              families.push_back("sans-serif");
            }

          if (!make_paint(&fill, &stroke))
            {
              return -1;
            }

          R = writer.push_text(m_text.m_value.c_str(), make_c_array(families),
                               m_font_size.m_value,
                               Transform::from_translate(m_text_x.m_value, m_text_y.m_value),
                               (m_fill_color.m_value != "none") ? &fill : nullptr,
                               (m_stroke_color.m_value != "none") ? &stroke : nullptr,
                               m_dominant_baseline.m_value, &error);
          if (R == routine_fail)
            {
              std::cerr << "Unable to add text: " << error.message() << "\n";
              return -1;
            }
        }
      R = writer.write(filename, &error);
    }

  if (R == routine_fail)
    {
      std::cerr << "Unable to write \"" << filename << "\": "
                << error.message() << "\n";
      return -1;
    }

  std::cout << "Wrote \"" << filename << "\"\n";
  return 0;
}

int
main(int argc, char **argv)
{
  pathsvg_demo D;
  return D.main(argc, argv);
}
