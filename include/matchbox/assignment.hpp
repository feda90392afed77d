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

#include <cstddef>
#include <optional>
#include <vector>

/**
 * \file assignment.hpp
 * Search for an injective assignment of pattern elements to subject elements
 *
 * This is the core of matching unordered containers: given which pattern
 * element is individually compatible with which subject element, find one
 * assignment of every pattern element to a distinct compatible subject
 * element.
 *
 * \ingroup match
 */


namespace mbx {

/**
 * Boolean compatibility table
 *
 * Rows are pattern elements, columns are subject elements.
 *
 * \ingroup match
 */
class compatibility_table {
  public:
  compatibility_table(size_t rows, size_t columns)
  : m_rows {rows}, m_columns {columns}, m_cells(rows * columns, false)
  { }

  size_t
  rows() const noexcept
  { return m_rows; }

  size_t
  columns() const noexcept
  { return m_columns; }

  bool
  operator () (size_t row, size_t column) const
  { return m_cells.at(row * m_columns + column); }

  void
  set(size_t row, size_t column, bool compatible = true)
  { m_cells.at(row * m_columns + column) = compatible; }

  /**
   * Number of columns compatible with the given row
   */
  size_t
  count(size_t row) const;

  private:
  size_t m_rows, m_columns;
  std::vector<bool> m_cells;
}; // class mbx::compatibility_table


/**
 * Find an injective assignment of rows to compatible columns
 *
 * Rows are tried in order of ascending number of compatible columns (ties
 * keep row order), columns in ascending order; the search backtracks
 * iteratively. The first complete assignment found is returned, so the
 * result is fully determined by the table.
 *
 * \param table Compatibility table
 * \return For each row (in the original row order) the chosen column, or
 *         nothing if no complete assignment exists
 *
 * \ingroup match
 */
[[nodiscard]] std::optional<std::vector<size_t>>
find_assignment(const compatibility_table &table);

} // namespace mbx
