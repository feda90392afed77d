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

/**
 * \file variable.hpp
 * Capture variables
 *
 * \ingroup pattern
 */


namespace mbx {

/**
 * Identifier of a variable, unique within the process
 *
 * Bindings are keyed by it.
 *
 * \ingroup pattern
 */
using variable_id = size_t;

struct pattern_node;
class pattern;

/**
 * Storage of a variable
 *
 * \ingroup pattern
 */
struct variable_cell {
  variable_id id;
  pattern_node *subpattern;
  object *value;
}; // struct mbx::variable_cell


/**
 * Capture variable
 *
 * A handle to a garbage-collected cell; copies of a handle refer to the same
 * variable. Two variables created separately are never interchangeable.
 *
 * \ingroup pattern
 */
class variable {
  public:
  /**
   * Create a fresh variable with a new id, wildcard subpattern and no value
   */
  variable();

  explicit variable(variable_cell *cell) noexcept
  : m_cell {cell}
  { assert(cell != nullptr); }

  [[nodiscard]] variable_cell*
  cell() const noexcept
  { return m_cell; }

  [[nodiscard]] variable_id
  id() const noexcept
  { return m_cell->id; }

  /**
   * Subpattern a subject must satisfy to be captured by this variable
   */
  [[nodiscard]] pattern
  subpattern() const noexcept;

  /**
   * Value captured by the last successful match (or `unmatched`)
   */
  [[nodiscard]] mbx::value
  bound_value() const noexcept
  { return mbx::value {m_cell->value}; }

  [[nodiscard]] bool
  is_bound() const noexcept
  { return not is(bound_value(), unmatched); }

  void
  bind(mbx::value val) const noexcept
  { m_cell->value = &*val; }

  /**
   * Forget captured value
   *
   * The subpattern is kept.
   */
  void
  reset() const noexcept
  { m_cell->value = &*unmatched; }

  /**
   * Constrain the variable with a subpattern
   *
   * Assigns the subpattern of the variable (replacing the previous one) and
   * returns a pattern capturing into this variable.
   */
  pattern
  operator [] (const pattern &subpattern) const;

  [[nodiscard]] bool
  operator == (const variable &other) const noexcept
  { return m_cell == other.m_cell; }

  private:
  variable_cell *m_cell;
}; // class mbx::variable

} // namespace mbx
