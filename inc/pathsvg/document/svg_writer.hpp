/*!
 * \file svg_writer.hpp
 * \brief file svg_writer.hpp
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

#include <iosfwd>
#include <pathsvg/document/tree.hpp>
#include <pathsvg/error.hpp>

namespace pathsvg
{
/*!\addtogroup Document
 * @{
 */

  /*!
   * Write a \ref Tree as SVG text to a stream. The children
   * of the root of the tree are written directly under the
   * svg element (inside a g element if the root has a
   * transformation); every other GroupNode is written as a g
   * element, a PathNode as a path element, an ImageNode as an
   * image element with the PNG embedded as base64 data and a
   * TextNode as a text element.
   * \param tree document to write
   * \param dst stream to which to write
   */
  void
  write_svg(const Tree &tree, std::ostream &dst);

  /*!
   * Write a \ref Tree as SVG text to a file, replacing the file
   * if it exists.
   * \param tree document to write
   * \param filename name of the file to write
   * \param out_error if non-null, location to which to write an
   *                  \ref Error::io_write_error on failure
   */
  enum return_code
  write_svg_file(const Tree &tree, c_string filename,
                 Error *out_error = nullptr);

  /*!
   * Write the drawing commands of a \ref PathData in the
   * notation of the d attribute of an SVG path element,
   * e.g. "M 0 0 L 1 1 Z".
   */
  void
  write_path_data(const PathData &data, std::ostream &dst);

/*! @} */
}
