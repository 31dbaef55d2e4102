/*!
 * \file tree.hpp
 * \brief file tree.hpp
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

#include <pathsvg/document/node.hpp>
#include <pathsvg/bounds_computer.hpp>

namespace pathsvg
{
/*!\addtogroup Document
 * @{
 */

  /*!
   * \brief
   * A Tree is a complete document: a canvas size, the
   * rectangle the canvas displays and a root \ref GroupNode.
   */
  class Tree:public reference_counted<Tree>::non_concurrent
  {
  public:
    /*!
     * Ctor.
     * \param geometry size and view rectangle of the document
     * \param root root of the document; if nullptr an empty
     *             GroupNode is used
     */
    explicit
    Tree(const CanvasGeometry &geometry,
         const reference_counted_ptr<GroupNode> &root = reference_counted_ptr<GroupNode>());

    ~Tree();

    /*!
     * Width of the canvas.
     */
    float
    width(void) const;

    /*!
     * Height of the canvas.
     */
    float
    height(void) const;

    /*!
     * Rectangle the canvas displays.
     */
    const Rect&
    view_rect(void) const;

    /*!
     * Root of the document.
     */
    const reference_counted_ptr<GroupNode>&
    root(void) const;

  private:
    void *m_d;
  };

/*! @} */
}
