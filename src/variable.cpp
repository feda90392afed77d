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


#include "matchbox/variable.hpp"
#include "matchbox/pattern.hpp"

#include <atomic>


static std::atomic<mbx::variable_id> g_next_id {1};


mbx::variable::variable()
: m_cell {make<variable_cell>(g_next_id++, &*pattern {any}, &*unmatched)}
{ }

mbx::pattern
mbx::variable::subpattern() const noexcept
{ return pattern {m_cell->subpattern}; }

mbx::pattern
mbx::variable::operator [] (const pattern &subpattern) const
{
  m_cell->subpattern = &*subpattern;
  return pattern {*this};
}
