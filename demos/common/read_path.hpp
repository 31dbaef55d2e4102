#ifndef PATHSVG_DEMO_READ_PATH_HPP
#define PATHSVG_DEMO_READ_PATH_HPP

#include <string>
#include <pathsvg/path.hpp>

/*!
  Adds to a pathsvg::Path the outlines described by a string.
  The format of the input is:

   [ marks the start of a closed outline
   ] marks the end of a closed outline
   { marks the start of an open outline
   } marks the end of an open outline
   [[ marks the start of a sequence of control points
   ]] marks the end of a sequence of control points
   value0 value1 marks a coordinate (control point or edge point)

  Parentheses and commas are treated as white space. Between two
  edge points, no control point gives a line, one control point a
  quadratic curve and two control points a cubic curve; further
  control points are ignored.

  \returns the number of outlines added
 */
unsigned int
read_path(pathsvg::Path &path, const std::string &source);

#endif
