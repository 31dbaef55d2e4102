/*!
 * \file util_private.hpp
 * \brief file util_private.hpp
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

#include <iostream>
#include <utility>
#include <vector>
#include <pathsvg/util/c_array.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>

/*
 * Non-fatal conditions are reported to std::cerr prefixed
 * by the source location; X is streamed, so it may chain
 * several values with <<.
 */
#define PATHSVGwarning(X) do {                                  \
    std::cerr << "Warning: [" << __FILE__ << ", "               \
              << __LINE__ << "] " << X << "\n";                  \
  } while(0)

/*
 * Helpers for classes that keep their data behind a void *m_d
 * pointing to a Private class. The getter and setter macros
 * expand to the definition of a method that reads or writes
 * the field m_<member> of the Private class.
 */
#define PATHSVGpimpl_get(cls, priv, type, member)                \
  type                                                          \
  cls::                                                         \
  member(void) const                                            \
  {                                                             \
    return static_cast<const priv*>(m_d)->m_##member;           \
  }

#define PATHSVGpimpl_set(cls, priv, type, member)                \
  cls&                                                          \
  cls::                                                         \
  member(type value)                                            \
  {                                                             \
    static_cast<priv*>(m_d)->m_##member = value;                \
    return *this;                                               \
  }

#define PATHSVGpimpl_setget(cls, priv, type, member)             \
  PATHSVGpimpl_set(cls, priv, type, member)                      \
  PATHSVGpimpl_get(cls, priv, type, member)

/*
 * Defines the copy ctor, swap() and copy assignment of a
 * value class whose Private class is copyable.
 */
#define PATHSVGpimpl_value_semantics(cls, name, priv)            \
  cls::                                                         \
  name(const name &rhs):                                        \
    m_d(PATHSVGnew priv(*static_cast<const priv*>(rhs.m_d)))     \
  {}                                                            \
                                                                \
  void                                                          \
  cls::                                                         \
  swap(name &rhs)                                               \
  {                                                             \
    std::swap(m_d, rhs.m_d);                                    \
  }                                                             \
                                                                \
  cls&                                                          \
  cls::                                                         \
  operator=(const name &rhs)                                    \
  {                                                             \
    name tmp(rhs);                                              \
    swap(tmp);                                                  \
    return *this;                                               \
  }
