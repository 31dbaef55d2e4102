/*!
 * \file font_database.hpp
 * \brief file font_database.hpp
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

#include <pathsvg/util/reference_counted.hpp>
#include <pathsvg/util/data_buffer.hpp>
#include <pathsvg/util/c_array.hpp>
#include <pathsvg/text/freetype_lib.hpp>
#include <pathsvg/text/freetype_face.hpp>

namespace pathsvg
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * \brief
   * A FontDatabase is a collection of scalable font faces that
   * can be selected by family name. Faces are registered from
   * memory, from files, from directories or from the fonts
   * known to fontconfig; the FT_Face of a registered face is
   * only created when the face is first requested.
   */
  class FontDatabase:public reference_counted<FontDatabase>::concurrent
  {
  public:
    /*!
     * Ctor.
     * \param lib FreeTypeLib used to create the faces; if nullptr
     *            a new FreeTypeLib is created
     */
    explicit
    FontDatabase(const reference_counted_ptr<FreeTypeLib> &lib
                 = reference_counted_ptr<FreeTypeLib>());

    ~FontDatabase();

    /*!
     * Returns the FreeTypeLib used to create faces.
     */
    const reference_counted_ptr<FreeTypeLib>&
    lib(void) const;

    /*!
     * Register every scalable face of a font file held in
     * memory (a collection may hold several faces). Registering
     * the same DataBuffer twice does nothing and prints a warning.
     * \param src font file bytes
     * \returns routine_fail if no face could be registered
     */
    enum return_code
    load_font_source(const reference_counted_ptr<const DataBuffer> &src);

    /*!
     * Register every scalable face of a font file. Registering
     * the same file twice does nothing and prints a warning.
     * \param filename name of the font file
     * \returns routine_fail if no face could be registered
     */
    enum return_code
    load_font_file(c_string filename);

    /*!
     * Register the faces of every font file (ttf, otf, ttc
     * and otc) found under a directory and its subdirectories.
     * \param dirname directory to scan
     * \returns the number of faces registered
     */
    unsigned int
    load_fonts_dir(c_string dirname);

    /*!
     * Register the scalable faces listed by fontconfig.
     * \returns the number of faces registered
     */
    unsigned int
    load_system_fonts(void);

    /*!
     * Returns the number of registered faces.
     */
    unsigned int
    len(void) const;

    /*!
     * Returns the family name of a registered face.
     * \param I index of face with 0 <= I < len()
     */
    c_string
    family(unsigned int I) const;

    /*!
     * Returns the FreeTypeFace of a registered face, creating it
     * on first request. Returns nullptr if the face cannot be
     * created.
     * \param I index of face with 0 <= I < len()
     */
    reference_counted_ptr<FreeTypeFace>
    face(unsigned int I) const;

    /*!
     * Select a face from a list of families tried in order. A
     * family matches a registered face if the names are equal
     * ignoring case; the generic families serif, sans-serif,
     * monospace, cursive and fantasy are first resolved to an
     * actual family through fontconfig. Among the faces of a
     * family, a face that is neither bold nor italic is
     * preferred.
     * \param families family names to try
     * \returns the face or nullptr if no family matches
     */
    reference_counted_ptr<FreeTypeFace>
    query(c_array<const c_string> families) const;

    /*!
     * Returns true if a family name is one of the generic
     * families serif, sans-serif, monospace, cursive or
     * fantasy.
     */
    static
    bool
    is_generic_family(c_string family);

  private:
    void *m_d;
  };

/*! @} */
}
