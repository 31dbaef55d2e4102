/*!
 * \file writer.hpp
 * \brief file writer.hpp
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
#include <pathsvg/util/data_buffer.hpp>
#include <pathsvg/util/transform.hpp>
#include <pathsvg/util/c_array.hpp>
#include <pathsvg/error.hpp>
#include <pathsvg/path.hpp>
#include <pathsvg/document/node.hpp>
#include <pathsvg/document/tree.hpp>
#include <pathsvg/text/font_database.hpp>

namespace pathsvg
{
  class TextPathWriter;

/*!\addtogroup Writer
 * @{
 */

  /*!
   * Create an \ref ImageNode drawing an encoded PNG image. The image
   * is placed in the rectangle with min-corner the translation of
   * \p transform and the given size; the other coefficients of \p
   * transform are ignored and the created node has the identity as
   * its transformation.
   * \param data encoded PNG image
   * \param transform transformation whose translation places the image
   * \param width width of the image
   * \param height height of the image
   * \param out location to which to write the created node
   * \param out_error if non-null, location to which to write an \ref
   *                  Error::wrong_bounding_box_error with the bounds of
   *                  the rectangle of size (width, height) centered at
   *                  the translation when the rectangle has no finite,
   *                  strictly positive area
   */
  enum return_code
  create_png_node(const reference_counted_ptr<const DataBuffer> &data,
                  const Transform &transform, float width, float height,
                  reference_counted_ptr<ImageNode> *out,
                  Error *out_error = nullptr);

  /*!
   * Create a \ref TextNode.
   * \param text UTF-8 encoded text
   * \param transform transformation of the node
   * \param fill fill of the text, nullptr to not fill
   * \param stroke stroke of the text, nullptr to not stroke
   * \param font_families families to try in order
   * \param font_size size of the font
   * \param dominant_baseline baseline placed at y = 0
   * \param out location to which to write the created node
   * \param out_error if non-null, location to which to write an \ref
   *                  Error::font_failure_error when font_size is not
   *                  finite and positive
   */
  enum return_code
  create_text_node(c_string text, const Transform &transform,
                   const Fill *fill, const Stroke *stroke,
                   c_array<const c_string> font_families,
                   float font_size,
                   enum TextNode::dominant_baseline_t dominant_baseline,
                   reference_counted_ptr<TextNode> *out,
                   Error *out_error = nullptr);

  /*!
   * \brief
   * WriterBase holds the state common to \ref PathWriter and \ref
   * TextPathWriter: the list of pushed nodes and the global
   * transformation. The nodes are appended, in the order pushed,
   * to a group carrying the global transformation which itself is
   * the only child of the root of the document.
   *
   * A writer is single use: prepare() and the write() methods of
   * the derived classes take the pushed nodes, leaving the writer
   * empty with the identity as global transformation.
   */
  class WriterBase:noncopyable
  {
  public:
    virtual
    ~WriterBase();

    /*!
     * Translate a \ref Path and push it as a \ref PathNode.
     * \param path path to translate, see translate_path()
     * \param fill fill of the path, nullptr to not fill
     * \param stroke stroke of the path, nullptr to not stroke
     * \param transform transformation of the path, nullptr
     *                  for the identity
     * \param out_error if non-null, location to which to write an
     *                  \ref Error::svg_failure_error if the path
     *                  does not translate into valid drawing commands
     */
    enum return_code
    push(const Path &path, const Fill *fill, const Stroke *stroke,
         const Transform *transform, Error *out_error = nullptr);

    /*!
     * Push a node as is. Fails if the node is nullptr or
     * already has a parent.
     */
    enum return_code
    push_node(const reference_counted_ptr<Node> &node);

    /*!
     * Create an \ref ImageNode with create_png_node() and push it.
     */
    enum return_code
    push_png(const reference_counted_ptr<const DataBuffer> &data,
             const Transform &transform, float width, float height,
             Error *out_error = nullptr);

    /*!
     * Push a group of nodes under their own transformation.
     * Fails, pushing nothing, if a node is nullptr or
     * already has a parent.
     * \param nodes children of the group
     * \param transform transformation of the group
     */
    enum return_code
    push_group(c_array<const reference_counted_ptr<Node> > nodes,
               const Transform &transform);

    /*!
     * Set the global transformation, applied to all
     * pushed nodes as a group; the default is the identity.
     */
    WriterBase&
    transform(const Transform &v);

    /*!
     * Returns the global transformation.
     */
    const Transform&
    transform(void) const;

    /*!
     * Returns the number of nodes pushed.
     */
    unsigned int
    number_nodes(void) const;

    /*!
     * Build the document from the pushed nodes; the canvas
     * is computed by compute_canvas() from the bounding boxes
     * of the nodes and the global transformation. The pushed
     * nodes are taken even on failure.
     * \param out location to which to write the document
     * \param out_error if non-null, location to which to write
     *                  the Error on failure
     */
    enum return_code
    prepare(reference_counted_ptr<Tree> *out, Error *out_error = nullptr);

  protected:
    WriterBase(void);

    /*!
     * Move ctor, takes the nodes and global
     * transformation of another writer.
     */
    WriterBase(WriterBase &&obj);

    void *m_d;
  };

  /*!
   * \brief
   * A PathWriter assembles paths, images and groups into an SVG
   * document. A PathWriter has no text operations; attaching
   * fonts with add_fonts(), add_fonts_dir() or add_fonts_source()
   * gives a \ref TextPathWriter that takes over the pushed nodes.
   */
  class PathWriter:public WriterBase
  {
  public:
    PathWriter(void);

    ~PathWriter();

    /*!
     * Build the document with prepare() and write it to a file.
     * Text nodes pushed with push_node() are written as text
     * elements, not converted to paths.
     */
    enum return_code
    write(c_string filename, Error *out_error = nullptr);

    /*!
     * Returns a TextPathWriter that uses a FontDatabase,
     * moving the pushed nodes and the global transformation
     * into it.
     */
    TextPathWriter
    add_fonts(const reference_counted_ptr<FontDatabase> &fonts);

    /*!
     * Returns a TextPathWriter that uses a new FontDatabase with
     * the fonts of a directory, see FontDatabase::load_fonts_dir(),
     * moving the pushed nodes and the global transformation into it.
     */
    TextPathWriter
    add_fonts_dir(c_string dirname);

    /*!
     * Returns a TextPathWriter that uses a new FontDatabase with
     * the faces of a font file held in memory, moving the pushed
     * nodes and the global transformation into it.
     */
    TextPathWriter
    add_fonts_source(const reference_counted_ptr<const DataBuffer> &src);
  };

  /*!
   * \brief
   * A TextPathWriter is a writer that can push text; on write()
   * all text is converted to paths with the attached fonts.
   */
  class TextPathWriter:public WriterBase
  {
  public:
    /*!
     * Ctor, a TextPathWriter without fonts; write() fails
     * with \ref Error::no_fonts_error until fonts are
     * attached with add_fonts() or add_fonts_source().
     */
    TextPathWriter(void);

    /*!
     * Ctor, taking the nodes and global transformation
     * of another writer.
     */
    TextPathWriter(WriterBase &&src,
                   const reference_counted_ptr<FontDatabase> &fonts);

    /*!
     * Move ctor.
     */
    TextPathWriter(TextPathWriter &&obj);

    ~TextPathWriter();

    /*!
     * Create a \ref TextNode with create_text_node() and push it.
     */
    enum return_code
    push_text(c_string text, c_array<const c_string> font_families,
              float font_size, const Transform &transform,
              const Fill *fill, const Stroke *stroke,
              enum TextNode::dominant_baseline_t dominant_baseline,
              Error *out_error = nullptr);

    /*!
     * Replace the FontDatabase.
     */
    TextPathWriter&
    add_fonts(const reference_counted_ptr<FontDatabase> &fonts);

    /*!
     * Add the faces of a font file held in memory to the
     * FontDatabase, creating the FontDatabase if there is none.
     */
    TextPathWriter&
    add_fonts_source(const reference_counted_ptr<const DataBuffer> &src);

    /*!
     * Returns the FontDatabase, nullptr if none is attached.
     */
    const reference_counted_ptr<FontDatabase>&
    fonts(void) const;

    /*!
     * Build the document with prepare(), convert all text to
     * paths with convert_text() and write it to a file. Fails
     * with \ref Error::no_fonts_error, taking nothing, if no
     * FontDatabase is attached.
     */
    enum return_code
    write(c_string filename, Error *out_error = nullptr);

  private:
    void *m_text_d;
  };

/*! @} */
}
