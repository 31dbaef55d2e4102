/*!
 * \file freetype_lib.hpp
 * \brief file freetype_lib.hpp
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

#include <ft2build.h>
#include FT_FREETYPE_H
#include <pathsvg/util/reference_counted.hpp>

namespace pathsvg
{
/*!\addtogroup Text
 * @{
 */

  class FaceSource;

  /*!
   * \brief
   * Reference counted owner of an FT_Library.
   *
   * FreeType requires that creating and destroying FT_Face
   * objects of one FT_Library is serialized; FreeTypeLib does
   * so by routing both through open_face() and close_face().
   * Using a single FT_Face from several threads additionally
   * needs the lock of that face, see FreeTypeFace.
   */
  class FreeTypeLib:public reference_counted<FreeTypeLib>::concurrent
  {
  public:
    /*!
     * Ctor. If FT_Init_FreeType fails a warning is printed
     * and valid() returns false.
     */
    FreeTypeLib(void);

    ~FreeTypeLib();

    /*!
     * True if the FT_Library was initialized.
     */
    bool
    valid(void) const;

    /*!
     * Open the face named by a FaceSource, returns nullptr
     * on failure or if !valid(). The returned face must be
     * released with close_face().
     */
    FT_Face
    open_face(const FaceSource &src);

    /*!
     * Release a face returned by open_face().
     */
    void
    close_face(FT_Face face);

  private:
    void *m_d;
  };

/*! @} */
}
