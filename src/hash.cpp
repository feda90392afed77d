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
#include "matchbox/hash.hpp"

#include <exception>


// Salts keep equal-looking payloads of different tags apart
static constexpr size_t sym_salt = 0x73796d;
static constexpr size_t set_salt = 0x736574;
static constexpr size_t map_salt = 0x6d6170;


size_t
mbx::hash(value x)
{
  std::hash<std::string_view> strhash;
  switch (x->t)
  {
    case tag::nil: return 0;
    case tag::boolean: return std::hash<bool> {}(x->boolean) + 1;
    case tag::num: return std::hash<long double> {}(x->num);
    case tag::str: return strhash(str_view(x));
    case tag::sym: return strhash(sym_name(x)) ^ sym_salt;

    case tag::seq: {
      size_t seed = chash(value {x->seq.family});
      for (size_t i = 0; i < x->seq.size; ++i)
        hash_combine(seed, chash(value {x->seq.data[i]}));
      return seed;
    }

    case tag::set: {
      // Order-independent: sets with equal members hash equally
      size_t sum = set_salt;
      for (size_t i = 0; i < x->set.size; ++i)
        sum += chash(value {x->set.data[i]});
      return sum;
    }

    case tag::map: {
      size_t sum = map_salt;
      for (size_t i = 0; i < x->map.size; ++i)
      {
        size_t entry = chash(value {x->map.keys[i]});
        hash_combine(entry, chash(value {x->map.vals[i]}));
        sum += entry;
      }
      return sum;
    }

    case tag::type:
    case tag::instance:
    case tag::unmatched:
      return std::hash<const void*> {}(&*x);
  }
  std::terminate();
}
