/*
 * Matchbox - Structural pattern matching over garbage-collected values
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#include "matchbox/value.hpp"

#include <format>


enum class mode {
  write,
  display,
};


static void
_print(mode mode, std::ostream &os, mbx::value val);

template <std::ranges::range Range>
static void
_print_elements(mode mode, std::ostream &os, Range &&range)
{
  bool first = true;
  for (const mbx::value x : range)
  {
    if (not first)
      os << ", ";
    first = false;
    _print(mode, os, x);
  }
}

static void
_print_string(mode mode, std::ostream &os, std::string_view str)
{
  if (mode == mode::display)
  {
    os << str;
    return;
  }

  os << '"';
  for (const char c : str)
  {
    switch (c)
    {
      case '"':
      case '\\':
        os.put('\\');
        os.put(c);
        break;

      case '\a':
      case '\b':
      case '\f':
      case '\n':
      case '\r':
      case '\t':
      case '\v':
      case '\e':
        os << std::format("\\x{:02x}", int(c));
        break;

      default:
        os.put(c);
    }
  }
  os << '"';
}

static void
_print(mode mode, std::ostream &os, mbx::value val)
{
  using namespace mbx;

  switch (val->t)
  {
    case tag::nil:
      os << "nil";
      break;

    case tag::boolean:
      os << (is(val, True) ? "true" : "false");
      break;

    case tag::num:
      os << std::format("{}", num_val(val));
      break;

    case tag::str:
      _print_string(mode, os, str_view(val));
      break;

    case tag::sym:
      os << sym_name(val);
      break;

    case tag::seq: {
      const value family = seq_family(val);
      if (is(family, types::list))
      {
        os << '[';
        _print_elements(mode, os, elements(val));
        os << ']';
      }
      else
      {
        if (not is(family, types::tuple))
          os << type_name(family);
        os << '(';
        _print_elements(mode, os, elements(val));
        if (is(family, types::tuple) and length(val) == 1)
          os << ',';
        os << ')';
      }
      break;
    }

    case tag::set:
      if (length(val) == 0)
      {
        os << "set()";
        break;
      }
      os << '{';
      _print_elements(mode, os, elements(val));
      os << '}';
      break;

    case tag::map: {
      os << '{';
      bool first = true;
      for (const auto &[k, v] : entries(val))
      {
        if (not first)
          os << ", ";
        first = false;
        _print(mode, os, k);
        os << ": ";
        _print(mode, os, v);
      }
      os << '}';
      break;
    }

    case tag::type:
      os << "<type " << type_name(val) << '>';
      break;

    case tag::instance:
      os << '<' << type_name(type_of(val)) << ' ';
      _print(mode, os, instance_payload(val));
      os << '>';
      break;

    case tag::unmatched:
      os << "<unmatched>";
      break;
  }
}


void
mbx::write(std::ostream &os, value val)
{ _print(mode::write, os, val); }

void
mbx::display(std::ostream &os, value val)
{ _print(mode::display, os, val); }
