/*!
 * \file c_array.hpp
 * \brief file c_array.hpp
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

#include <vector>
#include <type_traits>
#include <pathsvg/util/util.hpp>

namespace pathsvg
{

/*!\addtogroup Utility
 * @{
 */

/*!
 * \brief
 * Non-owning view of a run of elements: a pointer together
 * with a count. Element access is bounds-checked in debug
 * builds. A c_array never outlives the storage it views.
 */
template<typename T>
class c_array
{
public:
  typedef T value_type;
  typedef T* iterator;
  typedef size_t size_type;

  /*!
   * True when a U* may be viewed as a T*, i.e. U and T differ
   * at most by constness.
   */
  template<typename U>
  struct compatible:
    std::integral_constant<bool,
                           std::is_same<typename std::remove_const<U>::type,
                                        typename std::remove_const<T>::type>::value
                           && std::is_convertible<U*, T*>::value>
  {};

  c_array(void):
    m_ptr(nullptr),
    m_size(0)
  {}

  /*!
   * View the sz elements starting at p.
   */
  template<typename U>
  c_array(U *p, size_type sz,
          typename std::enable_if<compatible<U>::value>::type* = nullptr):
    m_ptr(p),
    m_size(sz)
  {}

  /*!
   * Conversion, typically from c_array<U> to c_array<const U>.
   */
  template<typename U>
  c_array(const c_array<U> &rhs,
          typename std::enable_if<compatible<U>::value>::type* = nullptr):
    m_ptr(rhs.c_ptr()),
    m_size(rhs.size())
  {}

  T*
  c_ptr(void) const
  {
    return m_ptr;
  }

  size_type
  size(void) const
  {
    return m_size;
  }

  bool
  empty(void) const
  {
    return m_size == 0;
  }

  T&
  operator[](size_type i) const
  {
    PATHSVGassert(i < m_size);
    return m_ptr[i];
  }

  iterator
  begin(void) const
  {
    return m_ptr;
  }

  iterator
  end(void) const
  {
    return m_ptr + m_size;
  }

private:
  T *m_ptr;
  size_type m_size;
};

/*!
 * View the contents of a vector; invalidated by any
 * operation that reallocates the vector.
 */
template<typename T>
c_array<T>
make_c_array(std::vector<T> &v)
{
  return v.empty() ?
    c_array<T>() :
    c_array<T>(v.data(), v.size());
}

template<typename T>
c_array<const T>
make_c_array(const std::vector<T> &v)
{
  return v.empty() ?
    c_array<const T>() :
    c_array<const T>(v.data(), v.size());
}

/*! @} */

} //namespace
