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

#include "matchbox/pattern.hpp"
#include "matchbox/variable.hpp"

#include <stdexcept>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>


namespace mbx {

/**
 * Malformed pattern or misuse of the pattern API
 *
 * \ingroup pattern
 */
struct bad_pattern: std::runtime_error {
  bad_pattern(std::string_view what): runtime_error(std::string(what)) { }
}; // struct mbx::bad_pattern


/**
 * Same variable occurs more than once within a pattern
 *
 * Raised before any matching is attempted.
 *
 * \ingroup pattern
 */
struct repeated_variable: bad_pattern {
  /**
   * \param var The repeated variable
   * \param where Pattern that was being checked
   */
  repeated_variable(const variable &var, pattern where);

  [[nodiscard]] const variable&
  which() const noexcept
  { return m_variable; }

  [[nodiscard]] const pattern&
  where() const noexcept
  { return m_pattern; }

  void
  display(std::ostream &os) const noexcept;

  std::string
  display() const
  {
    std::ostringstream buf;
    display(buf);
    return buf.str();
  }

  private:
  variable m_variable;
  pattern m_pattern;
}; // struct mbx::repeated_variable

} // namespace mbx
