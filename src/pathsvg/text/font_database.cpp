/*!
 * \file font_database.cpp
 * \brief file font_database.cpp
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


#include <string>
#include <vector>
#include <set>
#include <sstream>
#include <cstring>
#include <mutex>
#include <utility>
#include <strings.h>
#include <dirent.h>
#include <fontconfig/fontconfig.h>

#include <pathsvg/text/font_database.hpp>
#include <pathsvg/util/pathsvg_memory.hpp>
#include <private/util_private.hpp>

namespace
{
  class FontConfig
  {
  public:
    static
    FcConfig*
    get(void)
    {
      static FontConfig R;
      return R.m_fc;
    }

    static
    std::string
    get_string(FcPattern *pattern, const char *label, std::string default_value = std::string())
    {
      FcChar8 *value(nullptr);
      if (FcPatternGetString(pattern, label, 0, &value) == FcResultMatch)
        {
          return std::string((const char*)value);
        }
      else
        {
          return default_value;
        }
    }

    static
    int
    get_int(FcPattern *pattern, const char *label, int default_value = 0)
    {
      int value(0);
      if (FcPatternGetInteger(pattern, label, 0, &value) == FcResultMatch)
        {
          return value;
        }
      else
        {
          return default_value;
        }
    }

    /* resolve a family name (typically a generic family) to
     * the family of the face fontconfig would select for it
     */
    static
    std::string
    match_family(pathsvg::c_string family)
    {
      FcConfig *config = get();
      FcPattern *pattern, *font_pattern;
      FcResult r;
      std::string return_value;

      if (!config)
        {
          return return_value;
        }

      pattern = FcPatternCreate();
      FcPatternAddString(pattern, FC_FAMILY, (const FcChar8*)family);
      FcPatternAddBool(pattern, FC_SCALABLE, FcTrue);
      FcConfigSubstitute(config, pattern, FcMatchPattern);
      FcDefaultSubstitute(pattern);

      font_pattern = FcFontMatch(config, pattern, &r);
      if (font_pattern)
        {
          return_value = get_string(font_pattern, FC_FAMILY);
          FcPatternDestroy(font_pattern);
        }
      FcPatternDestroy(pattern);
      return return_value;
    }

  private:
    FontConfig(void)
    {
      m_fc = FcInitLoadConfigAndFonts();
      if (!m_fc)
        {
          PATHSVGwarning("FcInitLoadConfigAndFonts failed");
        }
    }

    ~FontConfig(void)
    {
      if (m_fc)
        {
          FcConfigDestroy(m_fc);
        }
    }

    FcConfig *m_fc;
  };

  class FaceEntry
  {
  public:
    FaceEntry(const std::string &family, bool plain,
              const pathsvg::FaceSource &src):
      m_family(family),
      m_plain(plain),
      m_source(src),
      m_creation_failed(false)
    {}

    std::string m_family;

    /* neither bold nor italic */
    bool m_plain;

    pathsvg::FaceSource m_source;

    /* created on first request */
    pathsvg::reference_counted_ptr<pathsvg::FreeTypeFace> m_face;
    bool m_creation_failed;
  };

  /* identifies a source to detect loading the same face twice;
   * file sources use the file name, memory sources the address
   * of the DataBuffer
   */
  typedef std::pair<std::string, int> SourceKey;

  class FontDatabasePrivate
  {
  public:
    explicit
    FontDatabasePrivate(const pathsvg::reference_counted_ptr<pathsvg::FreeTypeLib> &lib):
      m_lib(lib)
    {
      if (!m_lib)
        {
          m_lib = PATHSVGnew pathsvg::FreeTypeLib();
        }
    }

    unsigned int
    add_faces(const SourceKey &key,
              const pathsvg::reference_counted_ptr<const pathsvg::DataBuffer> &src,
              pathsvg::c_string filename);

    int
    find_family(const std::string &family) const;

    pathsvg::reference_counted_ptr<pathsvg::FreeTypeFace>
    fetch_face(unsigned int I);

    pathsvg::reference_counted_ptr<pathsvg::FreeTypeLib> m_lib;
    std::vector<FaceEntry> m_entries;
    std::set<SourceKey> m_loaded;
    std::mutex m_mutex;
  };

  pathsvg::FaceSource
  make_source(const pathsvg::reference_counted_ptr<const pathsvg::DataBuffer> &src,
              pathsvg::c_string filename)
  {
    if (src)
      {
        return pathsvg::FaceSource(src, 0);
      }
    return pathsvg::FaceSource(filename, 0);
  }

  bool
  has_font_extension(const std::string &filename)
  {
    static const pathsvg::c_string extensions[] =
      {
        ".ttf", ".otf", ".ttc", ".otc"
      };

    for (pathsvg::c_string ext : extensions)
      {
        size_t len(std::strlen(ext));
        if (filename.size() > len
            && strcasecmp(filename.c_str() + filename.size() - len, ext) == 0)
          {
            return true;
          }
      }
    return false;
  }

  bool
  is_directory(const std::string &path)
  {
    DIR *dir;

    dir = opendir(path.c_str());
    if (dir)
      {
        closedir(dir);
        return true;
      }
    return false;
  }
}

//////////////////////////////////////
// FontDatabasePrivate methods
unsigned int
FontDatabasePrivate::
add_faces(const SourceKey &key,
          const pathsvg::reference_counted_ptr<const pathsvg::DataBuffer> &src,
          pathsvg::c_string filename)
{
  pathsvg::FaceSource source(make_source(src, filename));
  pathsvg::reference_counted_ptr<pathsvg::FreeTypeFace> face;
  unsigned int return_value(0);
  FT_Long num_faces;

  if (m_loaded.find(key) != m_loaded.end())
    {
      PATHSVGwarning("Font source \"" << key.first << "\" already loaded");
      return 0;
    }

  face = pathsvg::FreeTypeFace::open(m_lib, source);
  if (!face)
    {
      return 0;
    }

  m_loaded.insert(key);
  num_faces = face->face()->num_faces;
  for (FT_Long i = 0; i < num_faces; ++i)
    {
      if (i != 0)
        {
          face = pathsvg::FreeTypeFace::open(m_lib, source.with_face_index(static_cast<int>(i)));
        }

      if (!face || !FT_IS_SCALABLE(face->face()))
        {
          continue;
        }

      FT_Face ft(face->face());
      std::string family((ft->family_name) ? ft->family_name : "");
      bool plain;

      plain = (ft->style_flags & (FT_STYLE_FLAG_BOLD | FT_STYLE_FLAG_ITALIC)) == 0;
      m_entries.push_back(FaceEntry(family, plain, face->source()));
      m_entries.back().m_face = face;
      ++return_value;
    }
  return return_value;
}

int
FontDatabasePrivate::
find_family(const std::string &family) const
{
  int fallback(-1);

  for (unsigned int i = 0; i < m_entries.size(); ++i)
    {
      if (strcasecmp(m_entries[i].m_family.c_str(), family.c_str()) == 0)
        {
          if (m_entries[i].m_plain)
            {
              return i;
            }
          else if (fallback == -1)
            {
              fallback = i;
            }
        }
    }
  return fallback;
}

pathsvg::reference_counted_ptr<pathsvg::FreeTypeFace>
FontDatabasePrivate::
fetch_face(unsigned int I)
{
  FaceEntry &e(m_entries[I]);

  if (!e.m_face && !e.m_creation_failed)
    {
      e.m_face = pathsvg::FreeTypeFace::open(m_lib, e.m_source);
      if (!e.m_face)
        {
          e.m_creation_failed = true;
          PATHSVGwarning("Unable to create face of family \"" << e.m_family << "\"");
        }
    }
  return e.m_face;
}

/////////////////////////////////////
// pathsvg::FontDatabase methods
pathsvg::FontDatabase::
FontDatabase(const reference_counted_ptr<FreeTypeLib> &lib)
{
  m_d = PATHSVGnew FontDatabasePrivate(lib);
}

pathsvg::FontDatabase::
~FontDatabase()
{
  FontDatabasePrivate *d;
  d = static_cast<FontDatabasePrivate*>(m_d);
  PATHSVGdelete(d);
  m_d = nullptr;
}

const pathsvg::reference_counted_ptr<pathsvg::FreeTypeLib>&
pathsvg::FontDatabase::
lib(void) const
{
  FontDatabasePrivate *d;
  d = static_cast<FontDatabasePrivate*>(m_d);
  return d->m_lib;
}

enum pathsvg::return_code
pathsvg::FontDatabase::
load_font_source(const reference_counted_ptr<const DataBuffer> &src)
{
  FontDatabasePrivate *d;
  std::ostringstream label;
  unsigned int cnt;

  d = static_cast<FontDatabasePrivate*>(m_d);
  if (!src || src->data().empty())
    {
      PATHSVGwarning("Empty font source");
      return routine_fail;
    }

  label << "memory:" << static_cast<const void*>(src.get());

  std::lock_guard<std::mutex> lock(d->m_mutex);
  cnt = d->add_faces(SourceKey(label.str(), 0), src, nullptr);
  if (cnt == 0)
    {
      PATHSVGwarning("No scalable face in font source " << label.str());
      return routine_fail;
    }
  return routine_success;
}

enum pathsvg::return_code
pathsvg::FontDatabase::
load_font_file(c_string filename)
{
  FontDatabasePrivate *d;
  unsigned int cnt;

  d = static_cast<FontDatabasePrivate*>(m_d);
  if (!filename)
    {
      return routine_fail;
    }

  std::lock_guard<std::mutex> lock(d->m_mutex);
  cnt = d->add_faces(SourceKey(filename, 0),
                     reference_counted_ptr<const DataBuffer>(),
                     filename);
  if (cnt == 0)
    {
      PATHSVGwarning("Unable to load a scalable face from \"" << filename << "\"");
      return routine_fail;
    }
  return routine_success;
}

unsigned int
pathsvg::FontDatabase::
load_fonts_dir(c_string dirname)
{
  FontDatabasePrivate *d;
  DIR *dir;
  struct dirent *entry;
  std::string path(dirname ? dirname : "");
  unsigned int return_value(0);

  d = static_cast<FontDatabasePrivate*>(m_d);
  dir = opendir(path.c_str());
  if (!dir)
    {
      PATHSVGwarning("Unable to open font directory \"" << path << "\"");
      return 0;
    }

  if (path.empty() || path.back() != '/')
    {
      path.push_back('/');
    }

  for (entry = readdir(dir); entry != nullptr; entry = readdir(dir))
    {
      std::string file(entry->d_name);

      if (file == "." || file == "..")
        {
          continue;
        }

      file = path + file;
      if (is_directory(file))
        {
          return_value += load_fonts_dir(file.c_str());
        }
      else if (has_font_extension(file))
        {
          std::lock_guard<std::mutex> lock(d->m_mutex);
          return_value += d->add_faces(SourceKey(file, 0),
                                       reference_counted_ptr<const DataBuffer>(),
                                       file.c_str());
        }
    }
  closedir(dir);

  return return_value;
}

unsigned int
pathsvg::FontDatabase::
load_system_fonts(void)
{
  FontDatabasePrivate *d;
  FcConfig *config = FontConfig::get();
  FcObjectSet *object_set;
  FcFontSet *font_set;
  FcPattern *pattern;
  unsigned int return_value(0);

  d = static_cast<FontDatabasePrivate*>(m_d);
  if (!config)
    {
      return 0;
    }

  object_set = FcObjectSetBuild(FC_FAMILY, FC_WEIGHT, FC_SLANT,
                                FC_FILE, FC_INDEX, nullptr);
  pattern = FcPatternCreate();
  FcPatternAddBool(pattern, FC_SCALABLE, FcTrue);
  font_set = FcFontList(config, pattern, object_set);

  std::lock_guard<std::mutex> lock(d->m_mutex);
  for (int i = 0; font_set && i < font_set->nfont; ++i)
    {
      FcPattern *font(font_set->fonts[i]);
      std::string filename, family;
      int face_index;
      bool plain;

      filename = FontConfig::get_string(font, FC_FILE);
      face_index = FontConfig::get_int(font, FC_INDEX);

      /* the upper bits of FC_INDEX name an instance of a
       * variable font, which is not a face of its own
       */
      if (filename.empty() || (face_index >> 16) != 0)
        {
          continue;
        }

      SourceKey key(filename, face_index);
      if (d->m_loaded.find(key) != d->m_loaded.end())
        {
          continue;
        }

      family = FontConfig::get_string(font, FC_FAMILY);
      plain = FontConfig::get_int(font, FC_WEIGHT, FC_WEIGHT_REGULAR) < FC_WEIGHT_BOLD
        && FontConfig::get_int(font, FC_SLANT, FC_SLANT_ROMAN) < FC_SLANT_ITALIC;

      d->m_loaded.insert(key);
      d->m_entries.push_back(FaceEntry(family, plain, FaceSource(filename, face_index)));
      ++return_value;
    }

  if (font_set)
    {
      FcFontSetDestroy(font_set);
    }
  FcPatternDestroy(pattern);
  FcObjectSetDestroy(object_set);

  return return_value;
}

unsigned int
pathsvg::FontDatabase::
len(void) const
{
  FontDatabasePrivate *d;
  d = static_cast<FontDatabasePrivate*>(m_d);

  std::lock_guard<std::mutex> lock(d->m_mutex);
  return d->m_entries.size();
}

pathsvg::c_string
pathsvg::FontDatabase::
family(unsigned int I) const
{
  FontDatabasePrivate *d;
  d = static_cast<FontDatabasePrivate*>(m_d);

  std::lock_guard<std::mutex> lock(d->m_mutex);
  PATHSVGassert(I < d->m_entries.size());
  return d->m_entries[I].m_family.c_str();
}

pathsvg::reference_counted_ptr<pathsvg::FreeTypeFace>
pathsvg::FontDatabase::
face(unsigned int I) const
{
  FontDatabasePrivate *d;
  d = static_cast<FontDatabasePrivate*>(m_d);

  std::lock_guard<std::mutex> lock(d->m_mutex);
  if (I >= d->m_entries.size())
    {
      return reference_counted_ptr<FreeTypeFace>();
    }
  return d->fetch_face(I);
}

pathsvg::reference_counted_ptr<pathsvg::FreeTypeFace>
pathsvg::FontDatabase::
query(c_array<const c_string> families) const
{
  FontDatabasePrivate *d;
  d = static_cast<FontDatabasePrivate*>(m_d);

  for (c_string f : families)
    {
      std::string family(f ? f : "");
      int I;

      if (is_generic_family(family.c_str()))
        {
          family = FontConfig::match_family(family.c_str());
        }

      if (family.empty())
        {
          continue;
        }

      std::lock_guard<std::mutex> lock(d->m_mutex);
      I = d->find_family(family);
      if (I >= 0)
        {
          reference_counted_ptr<FreeTypeFace> face;

          face = d->fetch_face(I);
          if (face)
            {
              return face;
            }
        }
    }
  return reference_counted_ptr<FreeTypeFace>();
}

bool
pathsvg::FontDatabase::
is_generic_family(c_string family)
{
  static const c_string generics[] =
    {
      "serif", "sans-serif", "monospace", "cursive", "fantasy"
    };

  if (!family)
    {
      return false;
    }

  for (c_string g : generics)
    {
      if (strcasecmp(family, g) == 0)
        {
          return true;
        }
    }
  return false;
}
