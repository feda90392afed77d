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


#include "matchbox/pattern.hpp"
#include "matchbox/exceptions.hpp"
#include "matchbox/format.hpp"
#include "matchbox/hash.hpp"
#include "matchbox/stl/unordered_map.hpp"
#include "matchbox/stl/unordered_set.hpp"
#include "matchbox/stl/vector.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <vector>


static constexpr size_t type_check_salt = 0x74797065;
static constexpr size_t var_salt = 0x766172;
static constexpr size_t set_salt = 0x736574;
static constexpr size_t map_salt = 0x6d6170;

static mbx::pattern_node wildcard_node {mbx::pattern_kind::wildcard};


namespace {

struct pattern_hash {
  size_t
  operator () (const mbx::pattern &p) const noexcept
  { return p->hash; }
};

using pattern_set = mbx::stl::unordered_set<mbx::pattern, pattern_hash>;
using pattern_index = mbx::stl::unordered_map<mbx::pattern, size_t, pattern_hash>;

} // anonymous namespace


static size_t
_hash(const mbx::pattern_node &node)
{
  using namespace mbx;

  switch (node.kind)
  {
    case pattern_kind::wildcard: return 0;
    case pattern_kind::literal: return chash(value {node.literal});
    case pattern_kind::type_check:
      return std::hash<const void*> {}(node.type) ^ type_check_salt;
    case pattern_kind::var:
      return std::hash<variable_id> {}(node.var->id) ^ var_salt;

    case pattern_kind::seq: {
      size_t seed = chash(value {node.seq.family});
      for (size_t i = 0; i < node.seq.size; ++i)
        hash_combine(seed, node.seq.data[i]->hash);
      return seed;
    }

    case pattern_kind::set: {
      size_t sum = set_salt;
      for (size_t i = 0; i < node.set.size; ++i)
        sum += node.set.data[i]->hash;
      return sum;
    }

    case pattern_kind::map: {
      size_t sum = map_salt;
      for (size_t i = 0; i < node.map.size; ++i)
      {
        size_t entry = node.map.keys[i]->hash;
        hash_combine(entry, node.map.vals[i]->hash);
        sum += entry;
      }
      return sum;
    }
  }
  std::terminate();
}

static mbx::pattern_node**
_copy_nodes(const mbx::stl::vector<mbx::pattern> &patterns)
{
  mbx::pattern_node **data =
      mbx::allocate_array<mbx::pattern_node*>(patterns.size());
  for (size_t i = 0; i < patterns.size(); ++i)
    data[i] = &*patterns[i];
  return data;
}

static mbx::pattern
_finalize(mbx::pattern_node *node)
{
  node->hash = _hash(*node);
  return mbx::pattern {node};
}


////////////////////////////////////////////////////////////////////////////////
//
//                           Constructors
//
mbx::pattern::pattern() noexcept
: m_node {&wildcard_node}
{ }

mbx::pattern::pattern(any_t) noexcept
: m_node {&wildcard_node}
{ }

mbx::pattern::pattern(const variable &var)
: m_node {nullptr}
{
  pattern_node *node = make<pattern_node>(pattern_kind::var);
  node->var = var.cell();
  m_node = &*_finalize(node);
}

static mbx::pattern
_from_value(mbx::value x)
{
  using namespace mbx;

  switch (x->t)
  {
    case tag::type:
      return pattern::type_check(x);

    case tag::seq: {
      stl::vector<pattern> elts;
      for (const value elt : elements(x))
        elts.emplace_back(elt);
      return make_seq_pattern(seq_family(x), elts);
    }

    case tag::set: {
      stl::vector<pattern> elts;
      for (const value elt : elements(x))
        elts.emplace_back(elt);
      return make_set_pattern(elts);
    }

    case tag::map: {
      stl::vector<std::pair<pattern, pattern>> entrs;
      for (const auto &[k, v] : entries(x))
        entrs.emplace_back(pattern {k}, pattern {v});
      return make_dict_pattern(entrs);
    }

    default:
      return pattern::literal(x);
  }
}

mbx::pattern::pattern(value x)
: m_node {&*_from_value(x)}
{ }

mbx::pattern
mbx::pattern::literal(value x)
{
  pattern_node *node = make<pattern_node>(pattern_kind::literal);
  node->literal = &*x;
  return _finalize(node);
}

mbx::pattern
mbx::pattern::type_check(value type)
{
  if (not istype(type))
    throw bad_pattern {std::format("type_check() - not a type: {}", type)};

  pattern_node *node = make<pattern_node>(pattern_kind::type_check);
  node->type = &*type;
  return _finalize(node);
}

mbx::pattern
mbx::make_seq_pattern(value family, std::span<const pattern> elements)
{
  if (not isfamily(family))
    throw bad_pattern {std::format(
        "make_seq_pattern() - not a sequence family: {}", family)};

  pattern_node *node = make<pattern_node>(pattern_kind::seq);
  node->seq.family = &*family;
  node->seq.data = allocate_array<pattern_node*>(elements.size());
  node->seq.size = elements.size();
  for (size_t i = 0; i < elements.size(); ++i)
    node->seq.data[i] = &*elements[i];
  return _finalize(node);
}

mbx::pattern
mbx::make_set_pattern(std::span<const pattern> elements)
{
  pattern_set seen;
  stl::vector<pattern> unique;
  for (const pattern &elt : elements)
  {
    if (seen.insert(elt).second)
      unique.push_back(elt);
  }

  pattern_node *node = make<pattern_node>(pattern_kind::set);
  node->set.data = _copy_nodes(unique);
  node->set.size = unique.size();
  return _finalize(node);
}

mbx::pattern
mbx::make_dict_pattern(std::span<const std::pair<pattern, pattern>> entries)
{
  pattern_index position;
  stl::vector<pattern> keys, vals;
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

  pattern_node *node = make<pattern_node>(pattern_kind::map);
  node->map.keys = _copy_nodes(keys);
  node->map.vals = _copy_nodes(vals);
  node->map.size = keys.size();
  return _finalize(node);
}


////////////////////////////////////////////////////////////////////////////////
//
//                             Equality
//
static bool
_contains(std::span<mbx::pattern_node* const> nodes, mbx::pattern x)
{
  return std::ranges::any_of(nodes, [x](mbx::pattern_node *p) {
    return mbx::pattern {p} == x;
  });
}

bool
mbx::pattern::operator == (const pattern &other) const noexcept
{
  const pattern_node &a = *m_node, &b = *other;

  if (&a == &b)
    return true;

  if (a.kind != b.kind or a.hash != b.hash)
    return false;

  switch (a.kind)
  {
    case pattern_kind::wildcard:
      return true;

    case pattern_kind::literal:
      return equal(value {a.literal}, value {b.literal});

    case pattern_kind::type_check:
      return a.type == b.type;

    case pattern_kind::var:
      return a.var == b.var;

    case pattern_kind::seq:
      if (a.seq.family != b.seq.family or a.seq.size != b.seq.size)
        return false;
      for (size_t i = 0; i < a.seq.size; ++i)
      {
        if (not (pattern {a.seq.data[i]} == pattern {b.seq.data[i]}))
          return false;
      }
      return true;

    case pattern_kind::set: {
      if (a.set.size != b.set.size)
        return false;
      const std::span<pattern_node* const> bnodes {b.set.data, b.set.size};
      for (size_t i = 0; i < a.set.size; ++i)
      {
        if (not _contains(bnodes, pattern {a.set.data[i]}))
          return false;
      }
      return true;
    }

    case pattern_kind::map:
      if (a.map.size != b.map.size)
        return false;
      for (size_t i = 0; i < a.map.size; ++i)
      {
        const pattern key {a.map.keys[i]};
        bool found = false;
        for (size_t j = 0; j < b.map.size and not found; ++j)
        {
          if (pattern {b.map.keys[j]} == key)
          {
            if (not (pattern {a.map.vals[i]} == pattern {b.map.vals[j]}))
              return false;
            found = true;
          }
        }
        if (not found)
          return false;
      }
      return true;
  }

  return false;
}


////////////////////////////////////////////////////////////////////////////////
//
//                             Accessors
//
static void
_expect(mbx::pattern pat, mbx::pattern_kind kind, const char *accessor)
{
  if (pat.kind() != kind)
    throw mbx::bad_pattern {
        std::format("{}() - wrong kind of pattern: {}", accessor, pat)};
}

mbx::value
mbx::literal_value(pattern pat)
{
  _expect(pat, pattern_kind::literal, "literal_value");
  return value {pat->literal};
}

mbx::value
mbx::checked_type(pattern pat)
{
  _expect(pat, pattern_kind::type_check, "checked_type");
  return value {pat->type};
}

mbx::variable
mbx::pattern_variable(pattern pat)
{
  _expect(pat, pattern_kind::var, "pattern_variable");
  return variable {pat->var};
}

mbx::value
mbx::pattern_family(pattern pat)
{
  _expect(pat, pattern_kind::seq, "pattern_family");
  return value {pat->seq.family};
}

size_t
mbx::length(pattern pat)
{
  switch (pat.kind())
  {
    case pattern_kind::seq: return pat->seq.size;
    case pattern_kind::set: return pat->set.size;
    case pattern_kind::map: return pat->map.size;
    default:
      throw bad_pattern {
          std::format("length() - not a container pattern: {}", pat)};
  }
}

std::span<mbx::pattern_node* const>
mbx::pattern_nodes(pattern pat)
{
  switch (pat.kind())
  {
    case pattern_kind::seq: return {pat->seq.data, pat->seq.size};
    case pattern_kind::set: return {pat->set.data, pat->set.size};
    default:
      throw bad_pattern {std::format(
          "elements() - not a sequence or set pattern: {}", pat)};
  }
}

std::pair<std::span<mbx::pattern_node* const>,
          std::span<mbx::pattern_node* const>>
mbx::pattern_entry_nodes(pattern pat)
{
  _expect(pat, pattern_kind::map, "entries");
  return {{pat->map.keys, pat->map.size}, {pat->map.vals, pat->map.size}};
}


////////////////////////////////////////////////////////////////////////////////
//
//                             Printing
//
static void
_write(std::ostream &os, mbx::pattern pat, std::vector<mbx::variable_id> &path);

template <std::ranges::range Range>
static void
_write_elements(std::ostream &os, Range &&range,
                std::vector<mbx::variable_id> &path)
{
  bool first = true;
  for (const mbx::pattern elt : range)
  {
    if (not first)
      os << ", ";
    first = false;
    _write(os, elt, path);
  }
}

static void
_write(std::ostream &os, mbx::pattern pat, std::vector<mbx::variable_id> &path)
{
  using namespace mbx;

  switch (pat.kind())
  {
    case pattern_kind::wildcard:
      os << '_';
      break;

    case pattern_kind::literal:
      write(os, literal_value(pat));
      break;

    case pattern_kind::type_check:
      os << '<' << type_name(checked_type(pat)) << '>';
      break;

    case pattern_kind::var: {
      const variable var = pattern_variable(pat);
      os << '?' << var.id();
      const pattern sub = var.subpattern();
      // A variable may (erroneously) be nested in its own subpattern
      if (sub.kind() == pattern_kind::wildcard or
          std::ranges::find(path, var.id()) != path.end())
        break;
      path.push_back(var.id());
      os << '[';
      _write(os, sub, path);
      os << ']';
      path.pop_back();
      break;
    }

    case pattern_kind::seq: {
      const value family = pattern_family(pat);
      if (is(family, types::list))
      {
        os << '[';
        _write_elements(os, elements(pat), path);
        os << ']';
      }
      else
      {
        if (not is(family, types::tuple))
          os << type_name(family);
        os << '(';
        _write_elements(os, elements(pat), path);
        if (is(family, types::tuple) and length(pat) == 1)
          os << ',';
        os << ')';
      }
      break;
    }

    case pattern_kind::set:
      os << '{';
      _write_elements(os, elements(pat), path);
      os << '}';
      break;

    case pattern_kind::map: {
      os << '{';
      bool first = true;
      for (const auto &[k, v] : entries(pat))
      {
        if (not first)
          os << ", ";
        first = false;
        _write(os, k, path);
        os << ": ";
        _write(os, v, path);
      }
      os << '}';
      break;
    }
  }
}

void
mbx::write(std::ostream &os, pattern pat)
{
  std::vector<variable_id> path;
  _write(os, pat, path);
}
