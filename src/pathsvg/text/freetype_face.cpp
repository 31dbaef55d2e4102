/*!
 * \file freetype_face.cpp
 * \brief file freetype_face.cpp
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
#include <pathsvg/text/freetype_face.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>

namespace
{
  class FreeTypeFacePrivate
  {
  public:
    FreeTypeFacePrivate(FT_Face face,
                        const pathsvg::reference_counted_ptr<pathsvg::FreeTypeLib> &lib,
                        const pathsvg::FaceSource &src):
      m_face(face),
      m_lib(lib),
      m_source(src)
    {}

    ~FreeTypeFacePrivate()
    {
      m_lib->close_face(m_face);
    }

    std::mutex m_mutex;
    FT_Face m_face;
    pathsvg::reference_counted_ptr<pathsvg::FreeTypeLib> m_lib;

    /* holds a reference to the bytes of memory fonts */
    pathsvg::FaceSource m_source;
  };
}

pathsvg::reference_counted_ptr<pathsvg::FreeTypeFace>
pathsvg::FreeTypeFace::
open(const reference_counted_ptr<FreeTypeLib> &lib,
     const FaceSource &src)
{
  FT_Face face;

  if (!lib)
    {
      return reference_counted_ptr<FreeTypeFace>();
    }

  face = lib->open_face(src);
  if (!face)
    {
      return reference_counted_ptr<FreeTypeFace>();
    }
  return PATHSVGnew FreeTypeFace(face, lib, src);
}

pathsvg::FreeTypeFace::
FreeTypeFace(FT_Face face,
             const reference_counted_ptr<FreeTypeLib> &lib,
             const FaceSource &src)
{
  m_d = PATHSVGnew FreeTypeFacePrivate(face, lib, src);
}

pathsvg::FreeTypeFace::
~FreeTypeFace()
{
  FreeTypeFacePrivate *d;
  d = static_cast<FreeTypeFacePrivate*>(m_d);
  PATHSVGdelete(d);
}

FT_Face
pathsvg::FreeTypeFace::
face(void)
{
  FreeTypeFacePrivate *d;
  d = static_cast<FreeTypeFacePrivate*>(m_d);
  return d->m_face;
}

const pathsvg::FaceSource&
pathsvg::FreeTypeFace::
source(void) const
{
  const FreeTypeFacePrivate *d;
  d = static_cast<const FreeTypeFacePrivate*>(m_d);
  return d->m_source;
}

void
pathsvg::FreeTypeFace::
lock(void)
{
  FreeTypeFacePrivate *d;
  d = static_cast<FreeTypeFacePrivate*>(m_d);
  d->m_mutex.lock();
}

void
pathsvg::FreeTypeFace::
unlock(void)
{
  FreeTypeFacePrivate *d;
  d = static_cast<FreeTypeFacePrivate*>(m_d);
  d->m_mutex.unlock();
}
