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


#pragma once

#include "matchbox/value.hpp"
#include "matchbox/pattern.hpp"

#include <algorithm>
#include <sstream>
#include <format>

/**
 * \file format.hpp
 * std::format support for values and patterns
 *
 * `{}` writes a value with strings quoted, `{:d}` displays it with strings
 * written raw.
 *
 * \ingroup utils
 */


namespace std {

/**
 * Formatter for mbx::value
 *
 * \ingroup utils
 */
template <>
struct formatter<mbx::value, char> {
  enum class style { write, display } style = style::write;

  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end())
    {
      if (*it == 'w')
      {
        style = style::write;
        it++;
      }
      else if (*it == 'd')
      {
        style = style::display;
        it++;
      }
    }
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for mbx::value"};

    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(mbx::value x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    switch (style)
    {
      case style::write: mbx::write(buffer, x); break;
      case style::display: mbx::display(buffer, x); break;
    }
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
};


/**
 * Formatter for mbx::pattern
 *
 * \ingroup utils
 */
template <>
struct formatter<mbx::pattern, char> {
  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for mbx::pattern"};
    return it;
  }

  template <class FmtContext>
  FmtContext::iterator
  format(const mbx::pattern &x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    mbx::write(buffer, x);
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
};

} // namespace std
