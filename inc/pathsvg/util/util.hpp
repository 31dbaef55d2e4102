/*!
 * \file util.hpp
 * \brief file util.hpp
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

#include <stdint.h>
#include <stddef.h>

namespace pathsvg
{
/*!\addtogroup Utility
  @{
 */

  /*!
    C-string type used across the public interface;
    strings are UTF-8 encoded and nul-terminated.
   */
  typedef const char *c_string;

  /*!
    Result of fallible operations. When a function also
    takes an Error* argument, the Error is written only
    on \ref routine_fail.
   */
  enum return_code
    {
      routine_fail,    /*!< the operation did not happen */
      routine_success  /*!< the operation completed */
    };

  /*!
    Base class making a class non-copyable and non-assignable.
   */
  class noncopyable
  {
  public:
    noncopyable(void)
    {}

  private:
    noncopyable(const noncopyable&);

    noncopyable&
    operator=(const noncopyable&);
  };

  /*!
    Reports a failed PATHSVGassert and aborts,
    only to be called by PATHSVGassert.
   */
  void
  assert_fail(c_string condition, c_string file, int line);

/*! @} */
}

/*!\addtogroup Utility
  @{
 */

/*!\def PATHSVGunused
  Marks a value as intentionally unused.
 */
#define PATHSVGunused(X) do { (void)(X); } while(0)

/*!\def PATHSVGassert
  Checks a programming invariant in debug builds (PATHSVG_DEBUG
  defined), aborting with the file and line of the check if it
  does not hold. The condition is not evaluated in release builds.
 */
#ifdef PATHSVG_DEBUG
#define PATHSVGassert(X) do {                                   \
    if (!(X)) {                                                 \
      pathsvg::assert_fail(#X, __FILE__, __LINE__);             \
    } } while(0)
#else
#define PATHSVGassert(X) do {} while(0)
#endif

/*!\def PATHSVGstatic_assert
  static_assert with the condition as message.
 */
#define PATHSVGstatic_assert(X) static_assert(X, #X)

/*! @} */
