/*!
 * \file data_buffer.cpp
 * \brief file data_buffer.cpp
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


#include <vector>
#include <fstream>
#include <cstring>
#include <pathsvg/util/data_buffer.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>

namespace
{
  class DataBufferPrivate
  {
  public:
    DataBufferPrivate(void):
      m_loaded(true)
    {}

    std::vector<uint8_t> m_bytes;
    bool m_loaded;
  };
}

pathsvg::DataBuffer::
DataBuffer(c_array<const uint8_t> init_data)
{
  DataBufferPrivate *d;

  d = PATHSVGnew DataBufferPrivate();
  m_d = d;

  d->m_bytes.resize(init_data.size());
  if (!d->m_bytes.empty())
    {
      std::memcpy(&d->m_bytes[0], init_data.c_ptr(), init_data.size());
    }
}

pathsvg::DataBuffer::
DataBuffer(c_string filename)
{
  DataBufferPrivate *d;

  d = PATHSVGnew DataBufferPrivate();
  m_d = d;

  std::ifstream file(filename, std::ios::binary);
  if (!file)
    {
      d->m_loaded = false;
      return;
    }

  std::ifstream::pos_type sz;

  file.seekg(0, std::ios::end);
  sz = file.tellg();
  if (sz < 0)
    {
      d->m_loaded = false;
      return;
    }

  d->m_bytes.resize(static_cast<size_t>(sz));
  if (!d->m_bytes.empty())
    {
      file.seekg(0, std::ios::beg);
      file.read(reinterpret_cast<char*>(&d->m_bytes[0]), d->m_bytes.size());
      d->m_loaded = static_cast<bool>(file);
    }
}

pathsvg::DataBuffer::
~DataBuffer()
{
  DataBufferPrivate *d;
  d = static_cast<DataBufferPrivate*>(m_d);
  PATHSVGdelete(d);
}

pathsvg::c_array<const uint8_t>
pathsvg::DataBuffer::
data(void) const
{
  DataBufferPrivate *d;
  d = static_cast<DataBufferPrivate*>(m_d);
  return make_c_array(static_cast<const std::vector<uint8_t>&>(d->m_bytes));
}

bool
pathsvg::DataBuffer::
loaded(void) const
{
  DataBufferPrivate *d;
  d = static_cast<DataBufferPrivate*>(m_d);
  return d->m_loaded;
}
