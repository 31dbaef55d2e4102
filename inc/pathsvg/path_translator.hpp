/*!
 * \file path_translator.hpp
 * \brief file path_translator.hpp
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

#include <pathsvg/path.hpp>
#include <pathsvg/path_data.hpp>

namespace pathsvg
{
/*!\addtogroup Paths
 * @{
 */

  /*!
   * Translate a stream of \ref PathEvent values into absolute
   * drawing commands. Each event is handled in order, tracking
   * the last point emitted:
   *  - a begin event gives a move_to,
   *  - a segment event whose start point differs (exactly) from
   *    the last point emitted is preceded by a move_to to its
   *    start point,
   *  - an end event whose last point differs from the last point
   *    emitted gives a move_to to it; if the end event closes the
   *    subpath, a line_to back to the first point and a close are
   *    added.
   * Control points are passed through unchanged.
   * \param events event stream to translate
   * \param out location to which to write the commands; not
   *            modified on failure
   * \returns routine_fail if the commands do not form a valid
   *          \ref PathData, see PathDataBuilder::finish()
   */
  enum return_code
  translate_events(c_array<const PathEvent> events, PathData *out);

  /*!
   * Equivalent to
   * \code
   * translate_events(path.events(), out)
   * \endcode
   */
  enum return_code
  translate_path(const Path &path, PathData *out);

/*! @} */
}
