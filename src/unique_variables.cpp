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


#include "matchbox/match.hpp"
#include "matchbox/exceptions.hpp"

#include <unordered_set>


static void
_collect(mbx::pattern root, mbx::pattern pat,
         std::unordered_set<mbx::variable_id> &seen,
         mbx::stl::vector<mbx::variable> &found)
{
  using namespace mbx;

  switch (pat.kind())
  {
    case pattern_kind::var: {
      const variable var = pattern_variable(pat);
      if (not seen.insert(var.id()).second)
        throw repeated_variable {var, root};
      found.push_back(var);
      _collect(root, var.subpattern(), seen, found);
      break;
    }

    case pattern_kind::seq:
    case pattern_kind::set:
      for (const pattern elt : elements(pat))
        _collect(root, elt, seen, found);
      break;

    case pattern_kind::map:
      for (const auto &[k, v] : entries(pat))
      {
        _collect(root, k, seen, found);
        _collect(root, v, seen, found);
      }
      break;

    case pattern_kind::literal:
    case pattern_kind::type_check:
    case pattern_kind::wildcard:
      break;
  }
}


mbx::stl::vector<mbx::variable>
mbx::unique_variables(pattern pat)
{
  std::unordered_set<variable_id> seen;
  stl::vector<variable> found;
  _collect(pat, pat, seen, found);
  return found;
}
