/*!
 * \file reference_counted.hpp
 * \brief file reference_counted.hpp
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

#include <atomic>
#include <utility>
#include <pathsvg/util/util.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>

namespace pathsvg
{
/*!\addtogroup Utility
  @{
 */

  /*!
    \brief
    Reference counter for objects that are only
    referenced from a single thread.
   */
  class reference_count_non_concurrent:noncopyable
  {
  public:
    reference_count_non_concurrent(void):
      m_count(0)
    {}

    void
    acquire(void)
    {
      ++m_count;
    }

    /*!
      Returns true if the last reference was released.
     */
    bool
    release(void)
    {
      PATHSVGassert(m_count > 0);
      return --m_count == 0;
    }

  private:
    unsigned int m_count;
  };

  /*!
    \brief
    Reference counter whose operations are atomic,
    for objects shared between threads.
   */
  class reference_count_atomic:noncopyable
  {
  public:
    reference_count_atomic(void):
      m_count(0)
    {}

    void
    acquire(void)
    {
      m_count.fetch_add(1, std::memory_order_relaxed);
    }

    /*!
      Returns true if the last reference was released.
     */
    bool
    release(void)
    {
      /* fetch_sub returns the value before the decrement */
      return m_count.fetch_sub(1, std::memory_order_acq_rel) == 1;
    }

  private:
    std::atomic<unsigned int> m_count;
  };

  /*!
    \brief
    Intrusive pointer to an object derived from
    reference_counted<T>::non_concurrent or
    reference_counted<T>::concurrent; the object is
    deleted with \ref PATHSVGdelete when the last
    reference_counted_ptr to it goes away.

    A class T used with reference_counted_ptr must provide
    the static functions T::add_reference(const T*) and
    T::remove_reference(const T*).
   */
  template<typename T>
  class reference_counted_ptr
  {
  private:
    typedef void (reference_counted_ptr::*unspecified_bool_type)(void) const;

    void
    bool_function(void) const
    {}

    void
    acquire(T *p)
    {
      m_p = p;
      if (m_p)
        {
          T::add_reference(m_p);
        }
    }

    void
    release(void)
    {
      if (m_p)
        {
          T::remove_reference(m_p);
          m_p = nullptr;
        }
    }

  public:
    /*!
      Ctor, a null pointer.
     */
    reference_counted_ptr(void):
      m_p(nullptr)
    {}

    /*!
      Ctor, takes a reference to an object.
      \param p object to reference, may be nullptr
     */
    reference_counted_ptr(T *p)
    {
      acquire(p);
    }

    reference_counted_ptr(const reference_counted_ptr &obj)
    {
      acquire(obj.m_p);
    }

    /*!
      Ctor from a reference_counted_ptr<U> where
      U* converts to T*.
     */
    template<typename U>
    reference_counted_ptr(const reference_counted_ptr<U> &obj)
    {
      acquire(obj.get());
    }

    reference_counted_ptr(reference_counted_ptr &&obj):
      m_p(obj.m_p)
    {
      obj.m_p = nullptr;
    }

    ~reference_counted_ptr()
    {
      release();
    }

    reference_counted_ptr&
    operator=(reference_counted_ptr rhs)
    {
      swap(rhs);
      return *this;
    }

    /*!
      Returns the object pointed to.
     */
    T*
    get(void) const
    {
      return m_p;
    }

    T&
    operator*(void) const
    {
      PATHSVGassert(m_p);
      return *m_p;
    }

    T*
    operator->(void) const
    {
      PATHSVGassert(m_p);
      return m_p;
    }

    void
    swap(reference_counted_ptr &obj)
    {
      std::swap(m_p, obj.m_p);
    }

    /*!
      Drop the reference, making this a null pointer.
     */
    void
    clear(void)
    {
      release();
    }

    /*!
      Allows if (ptr) to test for a non-null pointer.
     */
    operator unspecified_bool_type() const
    {
      return (m_p) ? &reference_counted_ptr::bool_function : nullptr;
    }

    template<typename U>
    bool
    operator==(const reference_counted_ptr<U> &rhs) const
    {
      return m_p == rhs.get();
    }

    template<typename U>
    bool
    operator!=(const reference_counted_ptr<U> &rhs) const
    {
      return m_p != rhs.get();
    }

    template<typename U>
    bool
    operator==(U *rhs) const
    {
      return m_p == rhs;
    }

    /*!
      Returns a reference_counted_ptr<U> to the same object
      using static_cast<U*>.
     */
    template<typename U>
    reference_counted_ptr<U>
    static_cast_ptr(void) const
    {
      return reference_counted_ptr<U>(static_cast<U*>(m_p));
    }

  private:
    T *m_p;
  };

  /*!
    \brief
    Base class of reference counted objects.
    \tparam T object type that is reference counted
    \tparam Counter reference_count_non_concurrent or
                    reference_count_atomic
   */
  template<typename T, typename Counter>
  class reference_counted_base:noncopyable
  {
  public:
    virtual
    ~reference_counted_base()
    {}

    static
    void
    add_reference(const reference_counted_base *p)
    {
      p->m_counter.acquire();
    }

    static
    void
    remove_reference(const reference_counted_base *p)
    {
      if (p->m_counter.release())
        {
          reference_counted_base *q;
          q = const_cast<reference_counted_base*>(p);
          PATHSVGdelete(q);
        }
    }

  private:
    mutable Counter m_counter;
  };

  /*!
    \brief
    Selects the base class of a reference counted type T:
    derive from reference_counted<T>::non_concurrent or
    reference_counted<T>::concurrent.
   */
  template<typename T>
  class reference_counted
  {
  public:
    typedef reference_counted_base<T, reference_count_non_concurrent> non_concurrent;
    typedef reference_counted_base<T, reference_count_atomic> concurrent;
  };

/*! @} */
}
