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
#include <iterator>
#include <ranges>
#include <utility>


namespace mbx::utl {

/**
 * Pairwise view of two ranges
 *
 * Iteration stops at the end of the shorter range.
 */
template <std::ranges::range Left, std::ranges::range Right>
struct zip_view: std::ranges::view_interface<zip_view<Left, Right>> {
  Left m_left;
  Right m_right;

  using left_iterator = std::ranges::iterator_t<const Left>;
  using right_iterator = std::ranges::iterator_t<const Right>;

  using left_value_type = std::ranges::range_value_t<Left>;
  using right_value_type = std::ranges::range_value_t<Right>;


  struct iterator {
    using difference_type = ptrdiff_t;
    using value_type = std::pair<left_value_type, right_value_type>;

    iterator() = default;

    iterator(left_iterator left, right_iterator right)
    : m_left_iter {left}, m_right_iter {right}
    { }

    value_type
    operator * () const
    { return value_type {*m_left_iter, *m_right_iter}; }

    iterator&
    operator ++ ()
    {
      ++m_left_iter;
      ++m_right_iter;
      return *this;
    }

    iterator
    operator ++ (int)
    {
      iterator old = *this;
      ++*this;
      return old;
    }

    bool
    operator == (const iterator &other) const
    {
      return m_left_iter == other.m_left_iter or
             m_right_iter == other.m_right_iter;
    }

    left_iterator m_left_iter;
    right_iterator m_right_iter;
  }; // struct mbx::utl::zip_view::iterator
  static_assert(std::input_iterator<iterator>);

  zip_view(const Left &left, const Right &right)
  : m_left {left}, m_right {right}
  { }

  iterator
  begin() const
  { return iterator {std::ranges::begin(m_left), std::ranges::begin(m_right)}; }

  iterator
  end() const
  { return iterator {std::ranges::end(m_left), std::ranges::end(m_right)}; }
}; // struct mbx::utl::zip_view


template <std::ranges::viewable_range Left, std::ranges::viewable_range Right>
auto
zip(Left &&left, Right &&right)
{
  return zip_view<std::views::all_t<Left>, std::views::all_t<Right>> {
      std::views::all(std::forward<Left>(left)),
      std::views::all(std::forward<Right>(right))};
}

} // namespace mbx::utl
