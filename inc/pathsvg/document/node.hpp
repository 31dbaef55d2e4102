/*!
 * \file node.hpp
 * \brief file node.hpp
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
#include <pathsvg/util/transform.hpp>
#include <pathsvg/util/data_buffer.hpp>
#include <pathsvg/util/rect.hpp>
#include <pathsvg/util/c_array.hpp>
#include <pathsvg/path_data.hpp>
#include <pathsvg/document/paint.hpp>

namespace pathsvg
{
  class GroupNode;

/*!\addtogroup Document
 * @{
 */

  /*!
   * \brief
   * A Node is an element of a document tree. A Node has
   * a local transformation and is a child of at most one
   * \ref GroupNode.
   */
  class Node:public reference_counted<Node>::non_concurrent
  {
  public:
    /*!
     * Enumeration to specify the type of a Node.
     */
    enum node_type_t
      {
        group_node, /*!< Node is a GroupNode */
        path_node, /*!< Node is a PathNode */
        image_node, /*!< Node is an ImageNode */
        text_node, /*!< Node is a TextNode */
      };

    virtual
    ~Node();

    /*!
     * Returns the type of the Node.
     */
    enum node_type_t
    type(void) const;

    /*!
     * Returns the local transformation of the Node.
     */
    const Transform&
    transform(void) const;

    /*!
     * Set the local transformation of the Node.
     */
    Node&
    transform(const Transform &v);

    /*!
     * Returns the id of the Node, an empty string
     * if it has none.
     */
    c_string
    id(void) const;

    /*!
     * Set the id of the Node.
     */
    Node&
    id(c_string v);

    /*!
     * Returns the GroupNode of which this Node is
     * a child, or nullptr if it is not a child.
     */
    const GroupNode*
    parent(void) const;

    /*!
     * Returns the transformation from this Node to the
     * root of the tree it belongs to, i.e. the composition
     * of the local transformations of the node and of
     * its ancestors.
     */
    Transform
    abs_transform(void) const;

    /*!
     * Compute the bounding box of the Node in the coordinate
     * system of the root of its tree. Text nodes and empty
     * groups do not have a bounding box.
     * \param out_bb location to which to write the bounding box
     * \returns false if the Node does not have a bounding box
     */
    bool
    calculate_bbox(Rect *out_bb) const;

    /*!
     * To be implemented by a derived class to compute the
     * bounding box of the Node in a coordinate system.
     * \param tr transformation from the Node's coordinates
     *           (including its local transformation)
     * \param out_bb location to which to write the bounding box
     * \returns false if the Node does not have a bounding box
     */
    virtual
    bool
    compute_bbox(const Transform &tr, Rect *out_bb) const = 0;

  protected:
    /*!
     * Ctor.
     * \param tp type of the Node
     * \param tr local transformation of the Node
     */
    Node(enum node_type_t tp, const Transform &tr);

  private:
    friend class GroupNode;
    void *m_d;
  };

  /*!
   * \brief
   * A GroupNode is a Node whose children are drawn
   * under its transformation.
   */
  class GroupNode:public Node
  {
  public:
    /*!
     * Ctor.
     * \param tr local transformation of the group
     */
    explicit
    GroupNode(const Transform &tr = Transform());

    ~GroupNode();

    /*!
     * Append a child. Fails if the child already has a
     * parent or if the child is this node or one of its
     * ancestors.
     */
    enum return_code
    append(const reference_counted_ptr<Node> &child);

    /*!
     * Replace a child by another Node. Fails under the same
     * conditions as append().
     * \param I index of child with 0 <= I < children().size()
     * \param node Node to take the place of the child; if
     *             nullptr the child is removed
     */
    enum return_code
    replace_child(unsigned int I, const reference_counted_ptr<Node> &node);

    /*!
     * Remove all children.
     */
    void
    clear(void);

    /*!
     * Returns the children of the group. The returned
     * value is valid until the children are modified.
     */
    c_array<const reference_counted_ptr<Node> >
    children(void) const;

    virtual
    bool
    compute_bbox(const Transform &tr, Rect *out_bb) const;

  private:
    void *m_d;
  };

  /*!
   * \brief
   * A PathNode is a Node drawing a \ref PathData
   * with an optional fill and an optional stroke.
   */
  class PathNode:public Node
  {
  public:
    /*!
     * Ctor.
     * \param data geometry of the path
     * \param tr local transformation of the path
     */
    explicit
    PathNode(const PathData &data, const Transform &tr = Transform());

    ~PathNode();

    /*!
     * Returns the geometry of the path.
     */
    const PathData&
    data(void) const;

    /*!
     * Returns the fill of the path or nullptr
     * if the path is not filled.
     */
    const Fill*
    fill(void) const;

    /*!
     * Set the fill of the path.
     * \param v fill to copy, nullptr to not fill the path
     */
    PathNode&
    fill(const Fill *v);

    /*!
     * Returns the stroke of the path or nullptr
     * if the path is not stroked.
     */
    const Stroke*
    stroke(void) const;

    /*!
     * Set the stroke of the path.
     * \param v stroke to copy, nullptr to not stroke the path
     */
    PathNode&
    stroke(const Stroke *v);

    virtual
    bool
    compute_bbox(const Transform &tr, Rect *out_bb) const;

  private:
    void *m_d;
  };

  /*!
   * \brief
   * An ImageNode is a Node drawing an encoded
   * PNG image within a rectangle.
   */
  class ImageNode:public Node
  {
  public:
    /*!
     * Ctor.
     * \param png encoded PNG image
     * \param view_rect rectangle in which the image is drawn
     * \param tr local transformation of the image
     */
    ImageNode(const reference_counted_ptr<const DataBuffer> &png,
              const Rect &view_rect,
              const Transform &tr = Transform());

    ~ImageNode();

    /*!
     * Returns the encoded bytes of the image.
     */
    const reference_counted_ptr<const DataBuffer>&
    png(void) const;

    /*!
     * Returns the rectangle in which the image is drawn.
     */
    const Rect&
    view_rect(void) const;

    virtual
    bool
    compute_bbox(const Transform &tr, Rect *out_bb) const;

  private:
    void *m_d;
  };

  /*!
   * \brief
   * A TextNode is a Node drawing one run of text in
   * a single style, laid out left to right.
   */
  class TextNode:public Node
  {
  public:
    /*!
     * Enumeration specifying which baseline of the
     * font is placed on the y-coordinate 0.
     */
    enum dominant_baseline_t
      {
        auto_baseline,
        alphabetic_baseline,
        ideographic_baseline,
        hanging_baseline,
        mathematical_baseline,
        central_baseline,
        middle_baseline,
        text_after_edge_baseline,
        text_before_edge_baseline,
      };

    /*!
     * Ctor.
     * \param text UTF-8 encoded text
     * \param font_size size of the font, must be positive
     * \param tr local transformation of the text
     */
    TextNode(c_string text, float font_size,
             const Transform &tr = Transform());

    ~TextNode();

    /*!
     * Returns the UTF-8 encoded text.
     */
    c_string
    text(void) const;

    /*!
     * Returns the font size.
     */
    float
    font_size(void) const;

    /*!
     * Add a font family name to the list of families
     * to try in order; generic names such as "serif"
     * or "monospace" are allowed.
     */
    TextNode&
    add_font_family(c_string v);

    /*!
     * Returns the number of font families.
     */
    unsigned int
    number_font_families(void) const;

    /*!
     * Returns the named font family.
     * \param I index with 0 <= I < number_font_families()
     */
    c_string
    font_family(unsigned int I) const;

    /*!
     * Returns the dominant baseline of the text.
     */
    enum dominant_baseline_t
    dominant_baseline(void) const;

    /*!
     * Set the dominant baseline of the text.
     */
    TextNode&
    dominant_baseline(enum dominant_baseline_t v);

    /*!
     * Returns the fill of the text or nullptr.
     */
    const Fill*
    fill(void) const;

    /*!
     * Set the fill of the text.
     */
    TextNode&
    fill(const Fill *v);

    /*!
     * Returns the stroke of the text or nullptr.
     */
    const Stroke*
    stroke(void) const;

    /*!
     * Set the stroke of the text.
     */
    TextNode&
    stroke(const Stroke *v);

    /*!
     * Text does not have a bounding box until it is
     * converted to paths; always returns false.
     */
    virtual
    bool
    compute_bbox(const Transform &tr, Rect *out_bb) const;

    /*!
     * Returns a string for a \ref dominant_baseline_t value
     * as used by the dominant-baseline SVG attribute.
     */
    static
    c_string
    label(enum dominant_baseline_t v);

  private:
    void *m_d;
  };

/*! @} */
}
