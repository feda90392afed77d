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


#include "matchbox/matcher.hpp"
#include "matchbox/match.hpp"
#include "matchbox/logging.hpp"


mbx::matcher::matcher(size_t nvariables)
: m_matched {false}
{
  m_variables.reserve(nvariables);
  for (size_t i = 0; i < nvariables; ++i)
    m_variables.emplace_back();
}


bool
mbx::matcher::match(const pattern &pat, value subject)
{
  for (const variable &var : m_variables)
    var.reset();
  m_matched = false;

  const stl::vector<variable> participants = unique_variables(pat);

  debug("match {} against {}", pat, subject);
  bindings result;
  m_matched = mbx::match(pat, subject, result);
  if (not m_matched)
  {
    debug("no match");
    return false;
  }

  indent _;
  for (const variable &var : participants)
  {
    if (result.contains(var.id()))
    {
      var.bind(result.at(var.id()));
      debug("?{} = {}", var.id(), var.bound_value());
    }
  }
  return true;
}
