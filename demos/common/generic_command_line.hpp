/*
  Copyright (c) 2009, Kevin Rogovin All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are
met:

    * Redistributions of source code must retain the above copyright
    * notice, this list of conditions and the following disclaimer.
    * Redistributions in binary form must reproduce the above
    * copyright notice, this list of conditions and the following
    * disclaimer in the documentation and/or other materials provided
    * with the distribution.  Neither the name of the Kevin Rogovin or
    * kRogue Technologies  nor the names of its contributors may
    * be used to endorse or promote products derived from this
    * software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
"AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
(INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/


/** \file generic_command_line.hpp */
#pragma once

#include <iostream>
#include <vector>
#include <map>
#include <string>
#include <sstream>
#include <pathsvg/util/util.hpp>

class command_line_argument;

/*!
  A command_line_register owns no arguments; each
  command_line_argument adds itself to a register on
  construction and removes itself on destruction.
 */
class command_line_register:pathsvg::noncopyable
{
public:
  command_line_register(void)
  {}

  ~command_line_register();

  /*!
    Parse the arguments of main(). Every argument is offered
    to the registered arguments in registration order; the
    return value is the number of arguments that none took.
    argv[0] is skipped.
   */
  int
  parse_command_line(int argc, char **argv);

  void
  print_help(std::ostream&) const;

  void
  print_detailed_help(std::ostream&) const;

private:
  friend class command_line_argument;

  std::vector<command_line_argument*> m_children;
};

class command_line_argument:pathsvg::noncopyable
{
public:
  explicit
  command_line_argument(command_line_register &parent);

  virtual
  ~command_line_argument();

  /*!
    Examine args[location], returning how many arguments
    were consumed; 0 means the argument is not for this.
   */
  virtual
  int
  check_arg(const std::vector<std::string> &args, int location) = 0;

  virtual
  void
  print_command_line_description(std::ostream&) const = 0;

  virtual
  void
  print_detailed_description(std::ostream&) const = 0;

  /*!
    Accepts either "name=value" as one argument or "name"
    followed by "value". On a match, the value is written
    and the number of arguments used (1 or 2) is returned.
   */
  static
  int
  match_name_value(const std::string &name,
                   const std::vector<std::string> &args, int location,
                   std::string *value);

  /*!
    Word-wraps desc to an indented block below a heading.
   */
  static
  std::string
  format_description(const std::string &heading, const std::string &desc);

private:
  friend class command_line_register;

  command_line_register *m_parent;
};

/*
  prints a section heading in the detailed help
 */
class command_separator:public command_line_argument
{
public:
  command_separator(const std::string &label,
                    command_line_register &parent):
    command_line_argument(parent),
    m_label(label)
  {}

  virtual
  int
  check_arg(const std::vector<std::string>&, int)
  {
    return 0;
  }

  virtual
  void
  print_command_line_description(std::ostream&) const
  {}

  virtual
  void
  print_detailed_description(std::ostream &ostr) const
  {
    ostr << "\n\n[" << m_label << "]\n";
  }

private:
  std::string m_label;
};

template<typename T>
bool
readvalue_from_string(T &value, const std::string &str)
{
  std::istringstream istr(str);
  T v;

  if (!(istr >> v))
    {
      return false;
    }
  value = v;
  return true;
}

template<>
inline
bool
readvalue_from_string(std::string &value, const std::string &str)
{
  value = str;
  return true;
}

template<>
inline
bool
readvalue_from_string(bool &value, const std::string &str)
{
  if (str == "on" || str == "true" || str == "1")
    {
      value = true;
    }
  else if (str == "off" || str == "false" || str == "0")
    {
      value = false;
    }
  else
    {
      return false;
    }
  return true;
}

template<typename T>
void
writevalue_to_stream(const T &value, std::ostream &ostr)
{
  ostr << value;
}

template<>
inline
void
writevalue_to_stream(const bool &value, std::ostream &ostr)
{
  ostr << ((value) ? "true" : "false");
}

/*!
  Base of the options that are given as name=value
  or "name value"; a derived class implements take_value()
  and default_label().
 */
class command_line_option:public command_line_argument
{
public:
  command_line_option(const std::string &name, const std::string &desc,
                      command_line_register &parent):
    command_line_argument(parent),
    m_name(name),
    m_description(desc)
  {}

  const std::string&
  name(void) const
  {
    return m_name;
  }

  virtual
  int
  check_arg(const std::vector<std::string> &args, int location);

  virtual
  void
  print_command_line_description(std::ostream &ostr) const;

  virtual
  void
  print_detailed_description(std::ostream &ostr) const;

protected:
  /*!
    Handle the value given on the command line; returns
    false if it cannot be used, in which case a warning
    is printed.
   */
  virtual
  bool
  take_value(const std::string &value) = 0;

  /*!
    Text shown as the default in the detailed help,
    empty for none.
   */
  virtual
  std::string
  default_label(void) const = 0;

  /*!
    Extra text appended to the description.
   */
  virtual
  std::string
  description_suffix(void) const
  {
    return std::string();
  }

private:
  std::string m_name, m_description;
};

template<typename T>
class command_line_argument_value:public command_line_option
{
public:
  T m_value;

  command_line_argument_value(T v, const std::string &nm,
                              const std::string &desc,
                              command_line_register &p):
    command_line_option(nm, desc, p),
    m_value(v),
    m_set_by_command_line(false)
  {}

  bool
  set_by_command_line(void) const
  {
    return m_set_by_command_line;
  }

protected:
  virtual
  bool
  take_value(const std::string &value)
  {
    if (readvalue_from_string(m_value, value))
      {
        m_set_by_command_line = true;
        return true;
      }
    return false;
  }

  virtual
  std::string
  default_label(void) const
  {
    std::ostringstream str;
    writevalue_to_stream(m_value, str);
    return str.str();
  }

private:
  bool m_set_by_command_line;
};

/*!
  Option whose value is one label of a fixed set,
  each label naming a value of T.
 */
template<typename T>
class enumerated_command_line_argument_value:public command_line_option
{
public:
  T m_value;

  enumerated_command_line_argument_value(T v, const std::string &v_label,
                                         const std::string &nm, const std::string &desc,
                                         command_line_register &p):
    command_line_option(nm, desc, p),
    m_value(v),
    m_label(v_label)
  {
    m_entries[v_label] = v;
  }

  enumerated_command_line_argument_value&
  add_entry(const std::string &label, T v)
  {
    m_entries[label] = v;
    return *this;
  }

  const std::string&
  value_label(void) const
  {
    return m_label;
  }

protected:
  virtual
  bool
  take_value(const std::string &value)
  {
    typename std::map<std::string, T>::const_iterator iter;

    iter = m_entries.find(value);
    if (iter == m_entries.end())
      {
        return false;
      }
    m_value = iter->second;
    m_label = value;
    return true;
  }

  virtual
  std::string
  default_label(void) const
  {
    return m_label;
  }

  virtual
  std::string
  description_suffix(void) const
  {
    std::string R(" One of:");

    for (const auto &e : m_entries)
      {
        R += " " + e.first;
      }
    return R;
  }

private:
  std::map<std::string, T> m_entries;
  std::string m_label;
};

/*!
  Option that may be repeated; each occurrence
  appends to m_values.
 */
template<typename T>
class command_line_list:public command_line_option
{
public:
  std::vector<T> m_values;

  command_line_list(const std::string &nm, const std::string &desc,
                    command_line_register &p):
    command_line_option(nm, desc, p)
  {}

protected:
  virtual
  bool
  take_value(const std::string &value)
  {
    T v;

    if (!readvalue_from_string(v, value))
      {
        return false;
      }
    m_values.push_back(v);
    return true;
  }

  virtual
  std::string
  default_label(void) const
  {
    return std::string();
  }
};
