/*!
 * \file vecN.hpp
 * \brief file vecN.hpp
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
 * Fixed size array of N values of type T, stored inline.
 * Indexing is checked in debug builds.
 */
template<typename T, size_t N>
class vecN
{
public:
  typedef T value_type;
  typedef size_t size_type;
  typedef T* iterator;
  typedef const T* const_iterator;

  /*!
   * Ctor, each element is value initialized.
   */
  vecN(void):
    m_data()
  {}

  /*!
   * Ctor, each element is set to v.
   */
  explicit
  vecN(const T &v)
  {
    for (size_type i = 0; i < N; ++i)
      {
        m_data[i] = v;
      }
  }

  /*!
   * Ctor for the two element case.
   */
  vecN(const T &px, const T &py)
  {
    PATHSVGstatic_assert(N == 2);
    m_data[0] = px;
    m_data[1] = py;
  }

  T&
  operator[](size_type i)
  {
    PATHSVGassert(i < N);
    return m_data[i];
  }

  const T&
  operator[](size_type i) const
  {
    PATHSVGassert(i < N);
    return m_data[i];
  }

  T&
  x(void) { return m_data[0]; }

  const T&
  x(void) const { return m_data[0]; }

  T&
  y(void)
  {
    PATHSVGstatic_assert(N >= 2);
    return m_data[1];
  }

  const T&
  y(void) const
  {
    PATHSVGstatic_assert(N >= 2);
    return m_data[1];
  }

  static
  size_type
  size(void) { return N; }

  iterator
  begin(void) { return m_data; }

  iterator
  end(void) { return m_data + N; }

  const_iterator
  begin(void) const { return m_data; }

  const_iterator
  end(void) const { return m_data + N; }

  /*!
   * Exact element-wise comparison.
   */
  bool
  operator==(const vecN &rhs) const
  {
    for (size_type i = 0; i < N; ++i)
      {
        if (!(m_data[i] == rhs.m_data[i]))
          {
            return false;
          }
      }
    return true;
  }

  bool
  operator!=(const vecN &rhs) const
  {
    return !(*this == rhs);
  }

private:
  T m_data[N];
};

/*!
 * A point or vector in the plane.
 */
typedef vecN<float, 2> vec2;

/*! @} */
} //namespace
