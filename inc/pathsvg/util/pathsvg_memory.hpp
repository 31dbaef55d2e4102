/*!
 * \file pathsvg_memory.hpp
 * \brief file pathsvg_memory.hpp
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

#include <cstddef>

/*!\addtogroup Utility
 * @{
 */

/*!\def PATHSVGnew
 * Objects of PathSVG are created with PATHSVGnew in place of new.
 * In debug builds (PATHSVG_DEBUG defined) every allocation made
 * with PATHSVGnew records the file and line that made it, and the
 * allocations never released by PATHSVGdelete are listed at exit.
 * Arrays cannot be created with PATHSVGnew.
 */
#define PATHSVGnew \
  ::new(__FILE__, __LINE__)

/*!\def PATHSVGdelete
 * Destroy an object created with \ref PATHSVGnew. In debug builds,
 * releasing an address that PATHSVGnew did not return is reported.
 * \param ptr object to destroy, may be nullptr
 */
#define PATHSVGdelete(ptr) \
  pathsvg::memory::destroy(ptr, __FILE__, __LINE__)

/*! @} */

/*!
 * Allocation function behind PATHSVGnew, do not call directly.
 */
void*
operator new(std::size_t n, const char *file, int line) throw ();

/*!
 * Matching deallocation of the allocation function behind
 * PATHSVGnew, called only if a constructor throws.
 */
void
operator delete(void *ptr, const char *file, int line) throw ();

namespace pathsvg
{
  namespace memory
  {
    /*!
     * Allocate memory, tracking it in debug builds.
     */
    void*
    allocate(std::size_t size, const char *file, int line);

    /*!
     * Release memory returned by allocate().
     */
    void
    release(void *ptr, const char *file, int line);

    /*!
     * Number of allocations made by allocate() and not yet
     * released. Only tracked in debug builds (PATHSVG_DEBUG);
     * always 0 otherwise.
     */
    unsigned int
    number_live_allocations(void);

    /*!
     * Implementation of PATHSVGdelete, do not call directly.
     */
    template<typename T>
    void
    destroy(T *ptr, const char *file, int line)
    {
      if (ptr)
        {
          ptr->~T();
          release(const_cast<void*>(static_cast<const void*>(ptr)), file, line);
        }
    }
  }
}
