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


/**
 * \file match.inl
 * Template implementation of matchbox/match.hpp members
 */
#pragma once

#include "matchbox/match.hpp"
#include "matchbox/assignment.hpp"
#include "matchbox/logging.hpp"
#include "matchbox/utilities/ranges.hpp"

#include <exception>


namespace mbx::detail {

template <binding_mapping Mapping>
void
merge_bindings(Mapping &into, const Mapping &from)
{
  for (const auto &[id, val] : from)
    into.insert_or_assign(id, val);
}


/**
 * Match sequences of equal length element by element
 */
template <binding_mapping Mapping>
bool
match_ordered(pattern pat, value subject, Mapping &result)
{
  Mapping acc;
  for (const auto [elt, subelt] : utl::zip(elements(pat), elements(subject)))
  {
    if (not mbx::match(elt, subelt, acc))
      return false;
  }
  merge_bindings(result, acc);
  return true;
}


/**
 * Assign each of \p npatterns pattern elements to a distinct one of
 * \p nsubjects subject elements
 *
 * \param cellmatch `cellmatch(i, j, cell)` matches i'th pattern element
 *        against j'th subject element, storing bindings into `cell`
 */
template <binding_mapping Mapping, typename CellMatch>
bool
match_unordered(size_t npatterns, size_t nsubjects, CellMatch &&cellmatch,
                Mapping &result)
{
  if (npatterns > nsubjects)
    return false;

  debug("compatibility table {}x{}", npatterns, nsubjects);
  compatibility_table table {npatterns, nsubjects};
  stl::vector<Mapping> cells (npatterns * nsubjects);
  for (size_t i = 0; i < npatterns; ++i)
  {
    for (size_t j = 0; j < nsubjects; ++j)
    {
      if (cellmatch(i, j, cells[i * nsubjects + j]))
        table.set(i, j);
    }
  }

  const auto assignment = find_assignment(table);
  if (not assignment)
    return false;

  for (size_t i = 0; i < npatterns; ++i)
    merge_bindings(result, cells[i * nsubjects + (*assignment)[i]]);
  return true;
}

template <binding_mapping Mapping>
bool
match_set(pattern pat, value subject, Mapping &result)
{
  const auto patelts = elements(pat);
  const auto subelts = elements(subject);
  return match_unordered(
      length(pat), length(subject),
      [&](size_t i, size_t j, Mapping &cell) {
        return mbx::match(patelts[i], subelts[j], cell);
      },
      result);
}

/**
 * Match mapping entries as unordered (key, value) pairs
 *
 * A pattern entry accepts any subject entry whose key and value both match;
 * keys are not required to be equal.
 */
template <binding_mapping Mapping>
bool
match_map(pattern pat, value subject, Mapping &result)
{
  const auto patentries = entries(pat);
  const auto subentries = entries(subject);
  return match_unordered(
      length(pat), length(subject),
      [&](size_t i, size_t j, Mapping &cell) {
        const auto [kpat, vpat] = patentries[i];
        const auto [k, v] = subentries[j];
        return mbx::match(kpat, k, cell) and mbx::match(vpat, v, cell);
      },
      result);
}

} // namespace mbx::detail


template <mbx::binding_mapping Mapping>
bool
mbx::match(pattern pat, value subject, Mapping &result)
{
  switch (pat.kind())
  {
    case pattern_kind::set:
      if (not isset(subject) or length(subject) < length(pat))
        return false;
      return detail::match_set(pat, subject, result);

    case pattern_kind::map:
      if (not ismap(subject) or length(subject) < length(pat))
        return false;
      return detail::match_map(pat, subject, result);

    case pattern_kind::seq:
      if (not isseq(subject) or
          not is(seq_family(subject), pattern_family(pat)) or
          length(subject) != length(pat))
        return false;
      return detail::match_ordered(pat, subject, result);

    case pattern_kind::type_check:
      return isinstance(subject, checked_type(pat));

    case pattern_kind::var: {
      const variable var = pattern_variable(pat);
      Mapping sub;
      if (not match(var.subpattern(), subject, sub))
        return false;
      detail::merge_bindings(result, sub);
      result.insert_or_assign(var.id(), subject);
      return true;
    }

    case pattern_kind::wildcard:
      return true;

    case pattern_kind::literal:
      return equal(literal_value(pat), subject);
  }
  std::terminate();
}
