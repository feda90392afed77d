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


#include "matchbox/exceptions.hpp"
#include "matchbox/format.hpp"


mbx::repeated_variable::repeated_variable(const variable &var, pattern where)
: bad_pattern {std::format("Variable ?{} occurs more than once in pattern",
                           var.id())},
  m_variable {var},
  m_pattern {where}
{ }


void
mbx::repeated_variable::display(std::ostream &os) const noexcept
{
  // Write basic error report
  os << what();

  // Write the offending pattern
  os << "\nin pattern: " << m_pattern;
}
