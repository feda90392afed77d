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


#include "matchbox/assignment.hpp"
#include "matchbox/logging.hpp"

#include <algorithm>
#include <numeric>


size_t
mbx::compatibility_table::count(size_t row) const
{
  size_t n = 0;
  for (size_t column = 0; column < m_columns; ++column)
    n += (*this)(row, column);
  return n;
}


std::optional<std::vector<size_t>>
mbx::find_assignment(const compatibility_table &table)
{
  const size_t m = table.rows();
  const size_t n = table.columns();

  if (m > n)
    return std::nullopt;

  // Most constrained rows go first
  std::vector<size_t> counts (m);
  for (size_t row = 0; row < m; ++row)
    counts[row] = table.count(row);
  std::vector<size_t> order (m);
  std::iota(order.begin(), order.end(), 0);
  std::ranges::stable_sort(order, {}, [&counts](size_t row) {
    return counts[row];
  });

  // cursor[p]: candidate column for the p'th row in `order`
  std::vector<size_t> cursor (m, 0);
  std::vector<bool> claimed (n, false);
  size_t p = 0;
  while (p < m)
  {
    if (cursor[p] == n)
    { // Candidates exhausted: backtrack
      if (p == 0)
      {
        debug("no assignment of {} rows to {} columns", m, n);
        return std::nullopt;
      }
      cursor[p] = 0;
      p -= 1;
      claimed[cursor[p]] = false;
      cursor[p] += 1;
      continue;
    }

    if (claimed[cursor[p]] or not table(order[p], cursor[p]))
    {
      cursor[p] += 1;
      continue;
    }

    claimed[cursor[p]] = true;
    p += 1;
  }

  std::vector<size_t> assignment (m);
  for (size_t i = 0; i < m; ++i)
    assignment[order[i]] = cursor[i];
  return assignment;
}
