/*!
 * \file pathsvg_memory.cpp
 * \brief file pathsvg_memory.cpp
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


#include <cstdlib>
#include <iostream>
#include <map>
#include <mutex>

#include <pathsvg/util/util.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>

#ifdef PATHSVG_DEBUG

namespace
{
  class AllocationSite
  {
  public:
    AllocationSite(const char *file = "", int line = 0):
      m_file(file),
      m_line(line)
    {}

    const char *m_file;
    int m_line;
  };

  /* The tracker is created on the first allocation and never
   * destroyed, so that objects held by static pointers may be
   * released after exit() has started; the leak report runs
   * from an atexit() handler instead of a destructor.
   */
  class AllocationTracker:pathsvg::noncopyable
  {
  public:
    void
    add(const void *ptr, const char *file, int line)
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_live[ptr] = AllocationSite(file, line);
    }

    /* returns false if ptr was not tracked */
    bool
    remove(const void *ptr)
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      return m_live.erase(ptr) != 0;
    }

    unsigned int
    number_live(void)
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      return m_live.size();
    }

    void
    print_live(std::ostream &dst)
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (m_live.empty())
        {
          return;
        }

      dst << "PathSVG: " << m_live.size()
          << " allocations not released at exit:\n";
      for (const auto &e : m_live)
        {
          dst << "\t" << e.first << " allocated at ["
              << e.second.m_file << ", " << e.second.m_line << "]\n";
        }
    }

    static
    AllocationTracker&
    get(void)
    {
      static AllocationTracker *R = create();
      return *R;
    }

  private:
    AllocationTracker(void)
    {}

    static
    AllocationTracker*
    create(void)
    {
      AllocationTracker *p;

      p = new AllocationTracker();
      std::atexit(&report_at_exit);
      return p;
    }

    static
    void
    report_at_exit(void)
    {
      get().print_live(std::cerr);
    }

  private:
    std::mutex m_mutex;
    std::map<const void*, AllocationSite> m_live;
  };
}

#endif

void*
pathsvg::memory::
allocate(std::size_t size, const char *file, int line)
{
  void *p;

  p = std::malloc((size > 0) ? size : 1);

  #ifdef PATHSVG_DEBUG
    {
      if (p)
        {
          AllocationTracker::get().add(p, file, line);
        }
      else
        {
          std::cerr << "PathSVG: allocation of " << size << " bytes at ["
                    << file << ", " << line << "] failed\n";
        }
    }
  #else
    {
      PATHSVGunused(file);
      PATHSVGunused(line);
    }
  #endif

  return p;
}

void
pathsvg::memory::
release(void *ptr, const char *file, int line)
{
  #ifdef PATHSVG_DEBUG
    {
      if (ptr && !AllocationTracker::get().remove(ptr))
        {
          std::cerr << "PathSVG: release at [" << file << ", " << line
                    << "] of untracked address " << ptr << "\n";
        }
    }
  #else
    {
      PATHSVGunused(file);
      PATHSVGunused(line);
    }
  #endif

  std::free(ptr);
}

unsigned int
pathsvg::memory::
number_live_allocations(void)
{
  #ifdef PATHSVG_DEBUG
    {
      return AllocationTracker::get().number_live();
    }
  #else
    {
      return 0;
    }
  #endif
}

void*
operator new(std::size_t n, const char *file, int line) throw ()
{
  return pathsvg::memory::allocate(n, file, line);
}

void
operator delete(void *ptr, const char *file, int line) throw ()
{
  pathsvg::memory::release(ptr, file, line);
}
