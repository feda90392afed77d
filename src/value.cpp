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
#include "matchbox/stl/unordered_map.hpp"
#include "matchbox/stl/unordered_set.hpp"
#include "matchbox/stl/vector.hpp"

#include <algorithm>
#include <cstring>
#include <exception>


static const char*
_copy_string(std::string_view str)
{
  char *data = static_cast<char*>(mbx::allocate_atomic(str.length() + 1));
  if (data == nullptr)
    throw std::bad_alloc {};
  std::memcpy(data, str.data(), str.length());
  data[str.length()] = '\0';
  return data;
}

static mbx::object**
_copy_objects(const mbx::stl::vector<mbx::value> &values)
{
  mbx::object **data = mbx::allocate_array<mbx::object*>(values.size());
  for (size_t i = 0; i < values.size(); ++i)
    data[i] = &*values[i];
  return data;
}


mbx::value
mbx::num(long double val)
{
  value ret {make_atomic<object>(tag::num)};
  ret->num = val;
  ret->hash = hash(ret);
  return ret;
}

mbx::value
mbx::str(std::string_view str)
{
  value ret {make<object>(tag::str)};
  ret->str.data = _copy_string(str);
  ret->str.len = str.length();
  ret->hash = hash(ret);
  return ret;
}

mbx::value
mbx::sym(std::string_view str)
{
  value ret {make<object>(tag::sym)};
  ret->sym.data = _copy_string(str);
  ret->sym.len = str.length();
  ret->hash = hash(ret);
  return ret;
}

mbx::value
mbx::make_seq(value family, std::span<const value> elements)
{
  if (not isfamily(family))
    throw std::invalid_argument {"make_seq() - not a sequence family"};

  value ret {make<object>(tag::seq)};
  ret->seq.family = &*family;
  ret->seq.data = allocate_array<object*>(elements.size());
  ret->seq.size = elements.size();
  std::ranges::transform(elements, ret->seq.data,
                         [](value x) { return &*x; });
  ret->hash = hash(ret);
  return ret;
}

mbx::value
mbx::make_set(std::span<const value> elements)
{
  stl::unordered_set<value> seen;
  stl::vector<value> unique;
  unique.reserve(elements.size());
  for (const value x : elements)
  {
    if (seen.insert(x).second)
      unique.push_back(x);
  }

  value ret {make<object>(tag::set)};
  ret->set.data = _copy_objects(unique);
  ret->set.size = unique.size();
  ret->hash = hash(ret);
  return ret;
}

mbx::value
mbx::make_dict(std::span<const std::pair<value, value>> entries)
{
  stl::unordered_map<value, size_t> position;
  stl::vector<value> keys, vals;
  keys.reserve(entries.size());
  vals.reserve(entries.size());
  for (const auto &[k, v] : entries)
  {
    const auto [it, isnew] = position.emplace(k, keys.size());
    if (isnew)
    {
      keys.push_back(k);
      vals.push_back(v);
    }
    else
      vals[it->second] = v;
  }

  value ret {make<object>(tag::map)};
  ret->map.keys = _copy_objects(keys);
  ret->map.vals = _copy_objects(vals);
  ret->map.size = keys.size();
  ret->hash = hash(ret);
  return ret;
}

static mbx::value
_make_type(std::string_view name, mbx::value parent, bool family)
{
  if (not mbx::istype(parent))
    throw std::invalid_argument {"make_type() - parent is not a type"};

  mbx::value ret {mbx::make<mbx::object>(mbx::tag::type)};
  ret->type.name = _copy_string(name);
  ret->type.len = name.length();
  ret->type.parent = &*parent;
  ret->type.family = family;
  ret->hash = mbx::hash(ret);
  return ret;
}

mbx::value
mbx::make_type(std::string_view name, value parent)
{ return _make_type(name, parent, false); }

mbx::value
mbx::make_family(std::string_view name)
{ return _make_type(name, types::object, true); }

mbx::value
mbx::instance(value type, value payload)
{
  if (not istype(type) or isfamily(type))
    throw std::invalid_argument {"instance() - not an instance type"};

  value ret {make<object>(tag::instance)};
  ret->instance.type = &*type;
  ret->instance.payload = &*payload;
  ret->hash = hash(ret);
  return ret;
}


bool
mbx::lookup(value x, value k, value &result)
{
  for (const auto &[key, val] : entries(x))
  {
    if (equal(key, k))
    {
      result = val;
      return true;
    }
  }
  return false;
}


mbx::value
mbx::type_of(value x)
{
  switch (x->t)
  {
    case tag::nil: return types::nil;
    case tag::boolean: return types::boolean;
    case tag::num: return types::num;
    case tag::str: return types::str;
    case tag::sym: return types::sym;
    case tag::seq: return value {x->seq.family};
    case tag::set: return types::set;
    case tag::map: return types::dict;
    case tag::type: return types::type;
    case tag::instance: return value {x->instance.type};
    case tag::unmatched: return types::object;
  }
  std::terminate();
}

bool
mbx::isinstance(value x, value type)
{
  if (not istype(type))
    throw std::invalid_argument {"isinstance() - not a type"};

  for (value t = type_of(x); istype(t); t = type_parent(t))
  {
    if (is(t, type))
      return true;
  }
  return false;
}
