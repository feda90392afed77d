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
#include "matchbox/pattern.hpp"
#include "matchbox/variable.hpp"
#include "matchbox/stl/vector.hpp"

#include <cstddef>
#include <ranges>
#include <span>
#include <tuple>
#include <type_traits>

/**
 * \file matcher.hpp
 * Stateful façade over the pattern matcher
 *
 * \ingroup match
 */


namespace mbx {

/**
 * Owner of a fixed number of variables, reused across match attempts
 *
 * Usage example:
 * \code
 * auto [m, vars] = mbx::matcher {1};
 * const mbx::variable x = vars[0];
 * if (m(mbx::tuple_pattern(1, x, 3), mbx::tuple(1, 2, 3)))
 *   assert(x.bound_value() == mbx::num(2));
 * \endcode
 *
 * A matcher and its variables are mutable state: concurrent match attempts
 * on the same matcher (or sharing variables) must be serialized by the
 * caller.
 *
 * \ingroup match
 */
class matcher {
  public:
  /**
   * Create a matcher with \p nvariables fresh variables
   */
  explicit matcher(size_t nvariables = 0);

  matcher(const matcher&) = delete;
  matcher& operator = (const matcher&) = delete;

  matcher(matcher&&) = default;
  matcher& operator = (matcher&&) = default;

  /**
   * Match a subject against a pattern
   *
   * Resets all owned variables, checks that no variable occurs twice in
   * \p pat, and matches. Only on success are variables of the pattern bound;
   * this includes variables not owned by the matcher.
   *
   * \return Whether the subject matches
   * \throws repeated_variable If \p pat contains some variable twice; no
   *         matching is attempted then
   */
  bool
  match(const pattern &pat, value subject);

  /**
   * Same as match(), returning the matcher itself
   */
  matcher&
  operator () (const pattern &pat, value subject)
  {
    match(pat, subject);
    return *this;
  }

  /**
   * Result of the last match attempt
   */
  [[nodiscard]] bool
  matched() const noexcept
  { return m_matched; }

  explicit
  operator bool () const noexcept
  { return m_matched; }

  [[nodiscard]] size_t
  size() const noexcept
  { return m_variables.size(); }

  /**
   * Variables in declaration order
   */
  [[nodiscard]] std::span<const variable>
  variables() const noexcept
  { return {m_variables.data(), m_variables.size()}; }

  [[nodiscard]] const variable&
  operator [] (size_t i) const
  { return m_variables.at(i); }

  /**
   * Lazy view of the values of the variables, in declaration order
   *
   * A variable that was not bound yields `unmatched`.
   */
  [[nodiscard]] auto
  values() const
  {
    return variables() | std::views::transform([](const variable &var) {
      return var.bound_value();
    });
  }

  /**
   * Destructuring into the matcher itself and its variables
   */
  template <size_t I>
  decltype(auto)
  get() noexcept
  {
    static_assert(I < 2);
    if constexpr (I == 0)
      return (*this);
    else
      return variables();
  }

  private:
  stl::vector<variable> m_variables;
  bool m_matched;
}; // class mbx::matcher

} // namespace mbx


namespace std {

template <>
struct tuple_size<mbx::matcher>: std::integral_constant<size_t, 2> { };

template <>
struct tuple_element<0, mbx::matcher> { using type = mbx::matcher; };

template <>
struct tuple_element<1, mbx::matcher> {
  using type = std::span<const mbx::variable>;
};

} // namespace std
