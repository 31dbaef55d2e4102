/*!
 * \file text_to_path.hpp
 * \brief file text_to_path.hpp
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

#include <pathsvg/document/tree.hpp>
#include <pathsvg/text/font_database.hpp>

namespace pathsvg
{
/*!\addtogroup Text
 * @{
 */

  /*!
   * Compute the outlines of the glyphs of a \ref TextNode in
   * the coordinate system of the node (i.e. without its
   * transformation). The face is the first match of the node's
   * font families in a \ref FontDatabase; glyphs are placed left
   * to right starting at the origin, scaled by the font size
   * divided by the units per EM of the face, with the y-axis
   * pointing down and the dominant baseline of the node placed
   * at y = 0. Kerning is not applied.
   * \param text text to convert
   * \param db fonts from which to select the face
   * \param out location to which to write the outlines
   * \returns routine_fail if no face matches or if the text has
   *          no visible glyph outline
   */
  enum return_code
  text_to_path_data(const TextNode &text, const FontDatabase &db,
                    PathData *out);

  /*!
   * Replace every \ref TextNode of a \ref Tree by a \ref PathNode
   * drawing its glyph outlines with the fill, stroke and
   * transformation of the TextNode. A TextNode for which no face
   * matches is removed and a warning is printed; a TextNode
   * without visible glyphs is removed silently.
   * \param tree tree to modify
   * \param db fonts from which to select faces
   * \returns the number of TextNode objects replaced by a PathNode
   */
  unsigned int
  convert_text(Tree &tree, const FontDatabase &db);

/*! @} */
}
