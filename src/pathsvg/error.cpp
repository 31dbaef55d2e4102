/*!
 * \file error.cpp
 * \brief file error.cpp
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
#include <sstream>
#include <algorithm>
#include <pathsvg/error.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>
#include <private/util_private.hpp>

namespace
{
  class ErrorPrivate
  {
  public:
    explicit
    ErrorPrivate(enum pathsvg::Error::kind_t k = pathsvg::Error::no_error):
      m_kind(k),
      m_min_x(0.0f),
      m_max_x(0.0f),
      m_min_y(0.0f),
      m_max_y(0.0f)
    {}

    enum pathsvg::Error::kind_t m_kind;
    float m_min_x, m_max_x, m_min_y, m_max_y;
    std::string m_detail;
    std::string m_message;
  };
}

////////////////////////////
// pathsvg::Error methods
pathsvg::Error::
Error(void)
{
  m_d = PATHSVGnew ErrorPrivate();
}

pathsvg::Error::
Error(enum kind_t k, c_string detail)
{
  ErrorPrivate *d;

  d = PATHSVGnew ErrorPrivate(k);
  d->m_detail = (detail) ? detail : "";
  m_d = d;
}

PATHSVGpimpl_value_semantics(pathsvg::Error, Error, ErrorPrivate)

pathsvg::Error::
~Error()
{
  ErrorPrivate *d;
  d = static_cast<ErrorPrivate*>(m_d);
  PATHSVGdelete(d);
  m_d = nullptr;
}


pathsvg::Error
pathsvg::Error::
wrong_bounding_box(float min_x, float max_x, float min_y, float max_y)
{
  Error R(wrong_bounding_box_error);
  ErrorPrivate *d;

  d = static_cast<ErrorPrivate*>(R.m_d);
  d->m_min_x = min_x;
  d->m_max_x = max_x;
  d->m_min_y = min_y;
  d->m_max_y = max_y;
  return R;
}

PATHSVGpimpl_get(pathsvg::Error, ErrorPrivate, enum pathsvg::Error::kind_t, kind)
PATHSVGpimpl_get(pathsvg::Error, ErrorPrivate, float, min_x)
PATHSVGpimpl_get(pathsvg::Error, ErrorPrivate, float, max_x)
PATHSVGpimpl_get(pathsvg::Error, ErrorPrivate, float, min_y)
PATHSVGpimpl_get(pathsvg::Error, ErrorPrivate, float, max_y)

pathsvg::c_string
pathsvg::Error::
detail(void) const
{
  ErrorPrivate *d;
  d = static_cast<ErrorPrivate*>(m_d);
  return d->m_detail.c_str();
}

pathsvg::c_string
pathsvg::Error::
message(void) const
{
  ErrorPrivate *d;
  std::ostringstream str;

  d = static_cast<ErrorPrivate*>(m_d);
  str << label(d->m_kind);
  if (d->m_kind == wrong_bounding_box_error)
    {
      str << " (min_x = " << d->m_min_x
          << ", max_x = " << d->m_max_x
          << ", min_y = " << d->m_min_y
          << ", max_y = " << d->m_max_y << ")";
    }

  if (!d->m_detail.empty())
    {
      str << ": " << d->m_detail;
    }

  d->m_message = str.str();
  return d->m_message.c_str();
}

pathsvg::c_string
pathsvg::Error::
label(enum kind_t k)
{
#define EASY(X) case X: return #X

  switch (k)
    {
      EASY(no_error);
      EASY(wrong_bounding_box_error);
      EASY(no_fonts_error);
      EASY(svg_failure_error);
      EASY(font_failure_error);
      EASY(io_write_error);
    }

#undef EASY

  return "unknown_error";
}
