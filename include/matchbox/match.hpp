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
#include "matchbox/hash.hpp" // IWYU pragma: export
#include "matchbox/stl/unordered_map.hpp"
#include "matchbox/stl/vector.hpp"
#include "matchbox/format.hpp" // IWYU pragma: export

#include <concepts>
#include <ranges>


namespace mbx {


/**
 * Mapping from variable ids to captured values
 *
 * \ingroup match
 */
template <typename T>
concept binding_mapping = std::default_initializable<T> and
                          std::ranges::range<T> and
                          requires(T &x, const T &cx, variable_id k, value v)
{
  { cx.contains(k) } -> std::convertible_to<bool>;
  { cx.at(k) } -> std::convertible_to<value>;
  { x.insert_or_assign(k, v) };
};

/**
 * Default binding mapping
 *
 * \ingroup match
 */
using bindings = stl::unordered_map<variable_id, value>;


/**
 * Match a subject against a pattern
 *
 * Pattern kinds are tried in this order: set, mapping, sequence, type check,
 * variable, wildcard, literal. A mismatch of shape, length or sequence
 * family is a plain failure.
 *
 * Bindings of a failed match are never added to \p result; bindings of a
 * successful match are added to it.
 *
 * \note The pattern must not contain a variable more than once; see
 *       unique_variables().
 *
 * \ingroup match
 */
template <binding_mapping Mapping>
bool
match(pattern pat, value subject, Mapping &result);

inline bool
match(pattern pat, value subject)
{
  bindings _;
  return match(pat, subject, _);
}


/**
 * Collect variables of a pattern, making sure none occurs twice
 *
 * Descends into subpatterns of variables and into elements of container
 * patterns.
 *
 * \return Variables of the pattern in traversal order
 * \throws repeated_variable If some variable occurs more than once
 *
 * \ingroup match
 */
stl::vector<variable>
unique_variables(pattern pat);


} // namespace mbx

#include "matchbox/match.inl"
