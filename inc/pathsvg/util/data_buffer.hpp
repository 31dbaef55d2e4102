/*!
 * \file data_buffer.hpp
 * \brief file data_buffer.hpp
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

#include <pathsvg/util/reference_counted.hpp>
#include <pathsvg/util/c_array.hpp>
#include <pathsvg/util/util.hpp>

namespace pathsvg {

/*!\addtogroup Utility
 * @{
 */

  /*!
   * \brief
   * DataBuffer represents a block of bytes held in memory,
   * copied from a file or from caller supplied data. The
   * bytes are immutable once the DataBuffer is constructed,
   * so a DataBuffer can be shared between threads.
   */
  class DataBuffer:public reference_counted<DataBuffer>::concurrent
  {
  public:
    /*!
     * Ctor. Copies a file into memory. If the file cannot be
     * read, the DataBuffer is empty and loaded() returns false.
     * \param filename name of file to open
     */
    explicit
    DataBuffer(c_string filename);

    /*!
     * Ctor. Allocates the memory and initializes it with data.
     */
    explicit
    DataBuffer(c_array<const uint8_t> init_data);

    ~DataBuffer();

    /*!
     * Returns the bytes of the DataBuffer.
     */
    c_array<const uint8_t>
    data(void) const;

    /*!
     * Returns false if the DataBuffer was constructed from
     * a file that could not be read.
     */
    bool
    loaded(void) const;

  private:
    void *m_d;
  };

/*! @} */
} //namespace pathsvg
