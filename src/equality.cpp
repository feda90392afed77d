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

#include <algorithm>


static bool
_contains(mbx::value set, mbx::value x)
{
  return std::ranges::any_of(mbx::elements(set),
                             [x](mbx::value y) { return mbx::equal(x, y); });
}


bool
mbx::equal(value a, value b) noexcept
{
  if (is(a, b))
    return true;

  if (a->t != b->t or chash(a) != chash(b))
    return false;

  switch (a->t)
  {
    case tag::num:
      return num_val(a) == num_val(b);

    case tag::str:
      return str_view(a) == str_view(b);

    case tag::sym:
      return sym_name(a) == sym_name(b);

    case tag::seq: {
      if (not is(seq_family(a), seq_family(b)) or length(a) != length(b))
        return false;
      for (size_t i = 0; i < a->seq.size; ++i)
      {
        if (not equal(value {a->seq.data[i]}, value {b->seq.data[i]}))
          return false;
      }
      return true;
    }

    case tag::set:
      // Members are distinct, so equal sizes and inclusion mean equality
      return length(a) == length(b) and
             std::ranges::all_of(elements(a),
                                 [b](value x) { return _contains(b, x); });

    case tag::map: {
      if (length(a) != length(b))
        return false;
      for (const auto &[k, v] : entries(a))
      {
        value other = nil;
        if (not lookup(b, k, other) or not equal(v, other))
          return false;
      }
      return true;
    }

    // Compared by identity
    case tag::nil:
    case tag::boolean:
    case tag::type:
    case tag::instance:
    case tag::unmatched:
      return false;
  }

  return false;
}
