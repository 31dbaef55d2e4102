/*!
 * \file freetype_lib.cpp
 * \brief file freetype_lib.cpp
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


#include <mutex>
#include <pathsvg/text/freetype_lib.hpp>
#include <pathsvg/text/freetype_face.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>
#include <private/util_private.hpp>

namespace
{
  class FreeTypeLibPrivate
  {
  public:
    FreeTypeLibPrivate(void):
      m_lib(nullptr)
    {
      FT_Error error_code;

      error_code = FT_Init_FreeType(&m_lib);
      if (error_code != 0)
        {
          PATHSVGwarning("FT_Init_FreeType failed with error " << error_code);
          m_lib = nullptr;
        }
    }

    ~FreeTypeLibPrivate()
    {
      if (m_lib)
        {
          FT_Done_FreeType(m_lib);
        }
    }

    std::mutex m_mutex;
    FT_Library m_lib;
  };
}

pathsvg::FreeTypeLib::
FreeTypeLib(void)
{
  m_d = PATHSVGnew FreeTypeLibPrivate();
}

pathsvg::FreeTypeLib::
~FreeTypeLib()
{
  FreeTypeLibPrivate *d;
  d = static_cast<FreeTypeLibPrivate*>(m_d);
  PATHSVGdelete(d);
}

bool
pathsvg::FreeTypeLib::
valid(void) const
{
  const FreeTypeLibPrivate *d;
  d = static_cast<const FreeTypeLibPrivate*>(m_d);
  return d->m_lib != nullptr;
}

FT_Face
pathsvg::FreeTypeLib::
open_face(const FaceSource &src)
{
  FreeTypeLibPrivate *d;
  FT_Face face(nullptr);
  FT_Error error_code;

  d = static_cast<FreeTypeLibPrivate*>(m_d);
  if (!d->m_lib)
    {
      return nullptr;
    }

  std::lock_guard<std::mutex> lock(d->m_mutex);
  if (src.memory())
    {
      c_array<const uint8_t> bytes(src.memory()->data());
      error_code = FT_New_Memory_Face(d->m_lib, bytes.c_ptr(),
                                      static_cast<FT_Long>(bytes.size()),
                                      src.face_index(), &face);
    }
  else
    {
      error_code = FT_New_Face(d->m_lib, src.filename().c_str(),
                               src.face_index(), &face);
    }

  if (error_code != 0)
    {
      /* FreeType leaves face as nullptr when it fails */
      return nullptr;
    }
  return face;
}

void
pathsvg::FreeTypeLib::
close_face(FT_Face face)
{
  FreeTypeLibPrivate *d;

  d = static_cast<FreeTypeLibPrivate*>(m_d);
  if (face)
    {
      std::lock_guard<std::mutex> lock(d->m_mutex);
      FT_Done_Face(face);
    }
}
