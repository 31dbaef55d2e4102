/*!
 * \file freetype_face.hpp
 * \brief file freetype_face.hpp
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


#pragma once

#include <string>
#include <ft2build.h>
#include FT_FREETYPE_H
#include <pathsvg/util/data_buffer.hpp>
#include <pathsvg/text/freetype_lib.hpp>

namespace pathsvg
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * \brief
   * Names one face of a font file: either a file on disk or
   * a DataBuffer holding the file's bytes, together with the
   * index of the face within the file.
   */
  class FaceSource
  {
  public:
    FaceSource(const std::string &filename, int face_index):
      m_filename(filename),
      m_face_index(face_index)
    {}

    /*!
     * Ctor for a font held in memory. Faces opened from the
     * source keep a reference to the DataBuffer.
     */
    FaceSource(const reference_counted_ptr<const DataBuffer> &memory,
               int face_index):
      m_memory(memory),
      m_face_index(face_index)
    {}

    /*!
     * Same source, different face index.
     */
    FaceSource
    with_face_index(int face_index) const
    {
      FaceSource R(*this);
      R.m_face_index = face_index;
      return R;
    }

    const std::string&
    filename(void) const
    {
      return m_filename;
    }

    const reference_counted_ptr<const DataBuffer>&
    memory(void) const
    {
      return m_memory;
    }

    int
    face_index(void) const
    {
      return m_face_index;
    }

  private:
    std::string m_filename;
    reference_counted_ptr<const DataBuffer> m_memory;
    int m_face_index;
  };

  /*!
   * \brief
   * Reference counted owner of an FT_Face.
   *
   * An FT_Face is not thread safe; lock the FreeTypeFace
   * (for example with std::lock_guard<FreeTypeFace>) while
   * using face().
   */
  class FreeTypeFace:public reference_counted<FreeTypeFace>::concurrent
  {
  public:
    /*!
     * Open a face, returns nullptr if FreeType cannot open it.
     * \param lib library through which to open the face
     * \param src which face to open
     */
    static
    reference_counted_ptr<FreeTypeFace>
    open(const reference_counted_ptr<FreeTypeLib> &lib,
         const FaceSource &src);

    ~FreeTypeFace();

    FT_Face
    face(void);

    /*!
     * The FaceSource from which the face was opened.
     */
    const FaceSource&
    source(void) const;

    void
    lock(void);

    void
    unlock(void);

  private:
    FreeTypeFace(FT_Face face,
                 const reference_counted_ptr<FreeTypeLib> &lib,
                 const FaceSource &src);

    void *m_d;
  };

/*! @} */
}
