/*!
 * \file math.hpp
 * \brief file math.hpp
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

#include <cmath>

namespace pathsvg
{
/*!\addtogroup Utility
 * @{
 */

  /*!
   * Returns the smaller of two values, a if they compare equal.
   */
  template<typename T>
  inline
  const T&
  t_min(const T &a, const T &b)
  {
    return (b < a) ? b : a;
  }

  /*!
   * Returns the larger of two values, a if they compare equal.
   */
  template<typename T>
  inline
  const T&
  t_max(const T &a, const T &b)
  {
    return (a < b) ? b : a;
  }

  inline
  float
  t_sin(float x)
  {
    return std::sin(x);
  }

  inline
  float
  t_cos(float x)
  {
    return std::cos(x);
  }

  /*!
   * Returns false for infinities and NaN.
   */
  inline
  bool
  t_isfinite(float x)
  {
    return std::isfinite(x);
  }

  /*!
   * Converts an angle in degrees to radians.
   */
  inline
  float
  degrees_to_radians(float degrees)
  {
    return degrees * (3.14159265358979323846f / 180.0f);
  }

/*! @} */
}
