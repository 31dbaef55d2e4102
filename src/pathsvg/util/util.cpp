/*!
 * \file util.cpp
 * \brief file util.cpp
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


#include <iostream>
#include <cstdlib>
#include <pathsvg/util/util.hpp>

void
pathsvg::
assert_fail(c_string condition, c_string file, int line)
{
  std::cerr << "PathSVG: [" << file << ", " << line << "] assertion \""
            << condition << "\" failed\n" << std::flush;
  std::abort();
}
