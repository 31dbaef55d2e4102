/*!
 * \file error.hpp
 * \brief file error.hpp
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

#include <pathsvg/util/util.hpp>

namespace pathsvg
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * \brief
   * An Error describes why an operation returned
   * \ref routine_fail.
   */
  class Error
  {
  public:
    /*!
     * Enumeration to classify an Error.
     */
    enum kind_t
      {
        /*!
         * No error.
         */
        no_error,

        /*!
         * The bounds of a document or of an image do not form
         * a rectangle with finite, strictly positive area;
         * min_x(), max_x(), min_y() and max_y() give the
         * offending values.
         */
        wrong_bounding_box_error,

        /*!
         * Text conversion was requested without any font
         * source attached.
         */
        no_fonts_error,

        /*!
         * A path did not translate into valid drawing commands.
         */
        svg_failure_error,

        /*!
         * A text primitive has an invalid font size or
         * a font could not be loaded.
         */
        font_failure_error,

        /*!
         * The output file could not be written; detail()
         * names the file and the cause.
         */
        io_write_error,
      };

    /*!
     * Ctor, initializes as \ref no_error.
     */
    Error(void);

    /*!
     * Ctor.
     * \param k kind of the error
     * \param detail optional detail text, may be nullptr
     */
    explicit
    Error(enum kind_t k, c_string detail = nullptr);

    /*!
     * Copy ctor.
     */
    Error(const Error &obj);

    ~Error();

    /*!
     * Assignment operator.
     */
    Error&
    operator=(const Error &rhs);

    /*!
     * Swap operation.
     */
    void
    swap(Error &obj);

    /*!
     * Create a \ref wrong_bounding_box_error.
     */
    static
    Error
    wrong_bounding_box(float min_x, float max_x, float min_y, float max_y);

    /*!
     * Returns the kind of the Error.
     */
    enum kind_t
    kind(void) const;

    /*!
     * For a \ref wrong_bounding_box_error, the minimum x-coordinate.
     */
    float
    min_x(void) const;

    /*!
     * For a \ref wrong_bounding_box_error, the maximum x-coordinate.
     */
    float
    max_x(void) const;

    /*!
     * For a \ref wrong_bounding_box_error, the minimum y-coordinate.
     */
    float
    min_y(void) const;

    /*!
     * For a \ref wrong_bounding_box_error, the maximum y-coordinate.
     */
    float
    max_y(void) const;

    /*!
     * Returns the detail text of the Error, an empty
     * string if there is none.
     */
    c_string
    detail(void) const;

    /*!
     * Returns a human readable description of the Error. The
     * returned string is valid until the Error is modified
     * or destroyed.
     */
    c_string
    message(void) const;

    /*!
     * Returns a string for a \ref kind_t value.
     */
    static
    c_string
    label(enum kind_t k);

  private:
    void *m_d;
  };

/*! @} */
}
