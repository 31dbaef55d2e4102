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


#include <algorithm>
#include "generic_command_line.hpp"

namespace
{
  const unsigned int help_indent = 8;
  const unsigned int help_width = 72;
}

/////////////////////////////////////
// command_line_register methods
command_line_register::
~command_line_register()
{
  for (command_line_argument *p : m_children)
    {
      p->m_parent = nullptr;
    }
}

int
command_line_register::
parse_command_line(int argc, char **argv)
{
  std::vector<std::string> args(argv + std::min(argc, 1), argv + argc);
  int location(0), unused(0);
  int count(static_cast<int>(args.size()));

  while (location < count)
    {
      int taken(0);

      for (unsigned int i = 0; taken == 0 && i < m_children.size(); ++i)
        {
          taken = m_children[i]->check_arg(args, location);
        }

      if (taken == 0)
        {
          std::cerr << "Ignoring unrecognized argument \""
                    << args[location] << "\"\n";
          ++unused;
          taken = 1;
        }
      location += taken;
    }
  return unused;
}

void
command_line_register::
print_help(std::ostream &ostr) const
{
  for (command_line_argument *p : m_children)
    {
      p->print_command_line_description(ostr);
    }
  ostr << "\n";
}

void
command_line_register::
print_detailed_help(std::ostream &ostr) const
{
  for (command_line_argument *p : m_children)
    {
      p->print_detailed_description(ostr);
    }
  ostr << "\n";
}

/////////////////////////////
// command_line_argument methods
command_line_argument::
command_line_argument(command_line_register &parent):
  m_parent(&parent)
{
  parent.m_children.push_back(this);
}

command_line_argument::
~command_line_argument()
{
  if (m_parent)
    {
      std::vector<command_line_argument*> &c(m_parent->m_children);
      c.erase(std::remove(c.begin(), c.end(), this), c.end());
    }
}

int
command_line_argument::
match_name_value(const std::string &name,
                 const std::vector<std::string> &args, int location,
                 std::string *value)
{
  const std::string &arg(args[location]);
  std::string::size_type eq;

  eq = arg.find('=');
  if (eq != std::string::npos)
    {
      if (arg.compare(0, eq, name) != 0 || eq != name.size())
        {
          return 0;
        }
      *value = arg.substr(eq + 1);
      return 1;
    }

  if (arg == name && location + 1 < static_cast<int>(args.size()))
    {
      *value = args[location + 1];
      return 2;
    }
  return 0;
}

std::string
command_line_argument::
format_description(const std::string &heading, const std::string &desc)
{
  std::istringstream words(desc);
  std::string word, R;
  unsigned int column;

  R = "\n  " + heading + "\n" + std::string(help_indent, ' ');
  column = help_indent;
  while (words >> word)
    {
      if (column > help_indent && column + 1 + word.size() > help_width)
        {
          R += "\n" + std::string(help_indent, ' ');
          column = help_indent;
        }
      else if (column > help_indent)
        {
          R += " ";
          ++column;
        }
      R += word;
      column += word.size();
    }
  return R;
}

///////////////////////////////
// command_line_option methods
int
command_line_option::
check_arg(const std::vector<std::string> &args, int location)
{
  std::string value;
  int R;

  R = match_name_value(m_name, args, location, &value);
  if (R > 0 && !take_value(value))
    {
      std::cerr << "Unable to use \"" << value << "\" as value of "
                << m_name << ", keeping " << default_label() << "\n";
    }
  return R;
}

void
command_line_option::
print_command_line_description(std::ostream &ostr) const
{
  ostr << " [" << m_name << "=value]";
}

void
command_line_option::
print_detailed_description(std::ostream &ostr) const
{
  std::string heading(m_name), def(default_label());

  if (!def.empty())
    {
      heading += " (default " + def + ")";
    }
  ostr << format_description(heading, m_description + description_suffix());
}
