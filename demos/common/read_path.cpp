#include <iostream>
#include <sstream>
#include <vector>

#include "read_path.hpp"

namespace
{
  /* a point of an outline together with the control
   * points of the curve leaving it
   */
  class outline_point
  {
  public:
    explicit
    outline_point(const pathsvg::vec2 &pt):
      m_pt(pt)
    {}

    pathsvg::vec2 m_pt;
    std::vector<pathsvg::vec2> m_controls;
  };

  class outline
  {
  public:
    explicit
    outline(bool closed):
      m_closed(closed)
    {}

    void
    add_coordinate(const pathsvg::vec2 &p, bool is_control)
    {
      if (!is_control)
        {
          m_points.push_back(outline_point(p));
        }
      else if (!m_points.empty())
        {
          m_points.back().m_controls.push_back(p);
        }
      else
        {
          std::cerr << "Ignoring control point before the first point\n";
        }
    }

    bool m_closed;
    std::vector<outline_point> m_points;
  };

  void
  emit_edge(pathsvg::Path &path, const outline_point &from,
            const pathsvg::vec2 &to)
  {
    const std::vector<pathsvg::vec2> &c(from.m_controls);

    if (c.empty())
      {
        path.line_to(to);
      }
    else if (c.size() == 1)
      {
        path.quadratic_to(c[0], to);
      }
    else
      {
        if (c.size() > 2)
          {
            std::cerr << "Ignoring " << c.size() - 2
                      << " extra control points\n";
          }
        path.cubic_to(c[0], c[1], to);
      }
  }

  void
  emit_outline(pathsvg::Path &path, const outline &O)
  {
    const std::vector<outline_point> &pts(O.m_points);

    path.begin(pts.front().m_pt);
    for (unsigned int i = 1; i < pts.size(); ++i)
      {
        emit_edge(path, pts[i - 1], pts[i].m_pt);
      }

    /* a closed outline whose last point carries control
     * points curves back to the first point
     */
    if (O.m_closed && !pts.back().m_controls.empty())
      {
        emit_edge(path, pts.back(), pts.front().m_pt);
      }
    path.end(O.m_closed);
  }

  /* splits the source into tokens, treating '(', ')' and
   * ',' as white space
   */
  std::vector<std::string>
  tokenize(const std::string &source)
  {
    std::string cleaned;
    std::vector<std::string> R;
    std::string token;

    cleaned.reserve(source.size());
    for (char ch : source)
      {
        cleaned.push_back((ch == '(' || ch == ')' || ch == ',') ? ' ' : ch);
      }

    std::istringstream istr(cleaned);
    while (istr >> token)
      {
        R.push_back(token);
      }
    return R;
  }
}

unsigned int
read_path(pathsvg::Path &path, const std::string &source)
{
  std::vector<outline> outlines;
  bool in_outline(false), in_controls(false);
  bool have_x(false);
  float x(0.0f);

  for (const std::string &token : tokenize(source))
    {
      if (token == "[" || token == "{")
        {
          outlines.push_back(outline(token == "["));
          in_outline = true;
          in_controls = false;
          have_x = false;
        }
      else if (token == "]" || token == "}")
        {
          in_outline = false;
        }
      else if (token == "[[" || token == "]]")
        {
          in_controls = (token == "[[");
        }
      else
        {
          std::istringstream value_str(token);
          float v;

          if (!(value_str >> v) || !in_outline)
            {
              std::cerr << "Ignoring token \"" << token << "\"\n";
            }
          else if (!have_x)
            {
              x = v;
              have_x = true;
            }
          else
            {
              outlines.back().add_coordinate(pathsvg::vec2(x, v), in_controls);
              have_x = false;
            }
        }
    }

  unsigned int count(0);
  for (const outline &O : outlines)
    {
      if (!O.m_points.empty())
        {
          emit_outline(path, O);
          ++count;
        }
    }
  return count;
}
