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
#include "matchbox/variable.hpp"

#include <array>
#include <initializer_list>
#include <ostream>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>

/**
 * \file pattern.hpp
 * Pattern trees
 *
 * \ingroup pattern
 */


namespace mbx {

/**
 * Kinds of pattern nodes
 *
 * \ingroup pattern
 */
enum class pattern_kind {
  literal,    /**< Equal to a value */
  type_check, /**< Instance of a type */
  wildcard,   /**< Anything */
  var,        /**< Capture into a variable */
  seq,        /**< Ordered container of the same family and length */
  set,        /**< Unordered container of distinct element patterns */
  map,        /**< Unordered collection of key/value pattern pairs */
};

/**
 * Wildcard marker type
 *
 * \ingroup pattern
 */
struct any_t { };

/**
 * Wildcard: converts to a pattern matching any subject
 *
 * \ingroup pattern
 */
constexpr any_t any;


/**
 * Pattern node
 *
 * \ingroup pattern
 */
struct pattern_node {
  /**
   * Constructor
   *
   * \note This constructor is unsafe: payload is left uninitialized
   */
  constexpr pattern_node(pattern_kind kind): kind {kind}, hash {0} { }

  pattern_kind kind;
  size_t hash;
  union {
    object *literal;
    object *type;
    variable_cell *var;
    struct { object *family; pattern_node **data; size_t size; } seq;
    struct { pattern_node **data; size_t size; } set;
    struct { pattern_node **keys; pattern_node **vals; size_t size; } map;
  };
}; // struct mbx::pattern_node


/**
 * Pattern class representing a reference to an immutable pattern node
 *
 * \ingroup pattern
 */
class pattern {
  public:
  explicit pattern(pattern_node *node): m_node {node} { assert(node); }

  /**
   * Wildcard pattern
   */
  pattern() noexcept;

  /**
   * Wildcard pattern
   */
  pattern(any_t) noexcept;

  /**
   * Capture site of a variable
   */
  pattern(const variable &var);

  /**
   * Convert a value into a pattern
   *
   * A type becomes a type check; a sequence, a set or a mapping becomes a
   * container pattern over its converted elements; anything else becomes a
   * literal.
   */
  pattern(value x);

  /**
   * Literal pattern, never converted into a type check or a container
   * pattern
   */
  [[nodiscard]] static pattern
  literal(value x);

  /**
   * Type check pattern
   *
   * \throws bad_pattern If \p type is not a type
   */
  [[nodiscard]] static pattern
  type_check(value type);

  constexpr pattern_node*
  operator -> () const noexcept
  { return m_node; }

  constexpr pattern_node&
  operator * () const noexcept
  { return *m_node; }

  [[nodiscard]] pattern_kind
  kind() const noexcept
  { return m_node->kind; }

  /**
   * Pattern equality
   *
   * Literals compare by value equality; type checks and variables by
   * identity; containers structurally.
   */
  [[nodiscard]] bool
  operator == (const pattern &other) const noexcept;

  private:
  pattern_node *m_node;
}; // class mbx::pattern


/**
 * \name Container pattern constructors
 * \{
 */

/**
 * Create a sequence pattern
 *
 * \throws bad_pattern If \p family is not a sequence family
 *
 * \ingroup pattern
 */
[[nodiscard]] pattern
make_seq_pattern(value family, std::span<const pattern> elements);

/**
 * Create a set pattern
 *
 * Duplicate element patterns (by pattern equality) are dropped.
 *
 * \ingroup pattern
 */
[[nodiscard]] pattern
make_set_pattern(std::span<const pattern> elements);

/**
 * Create a mapping pattern
 *
 * For a repeated key pattern the last value pattern wins.
 *
 * \ingroup pattern
 */
[[nodiscard]] pattern
make_dict_pattern(std::span<const std::pair<pattern, pattern>> entries);

/**
 * Convert anything accepted by mbx::from() or by a pattern constructor into
 * a pattern
 *
 * \ingroup pattern
 */
template <typename T>
[[nodiscard]] pattern
to_pattern(T &&x)
{
  if constexpr (std::is_convertible_v<T, pattern>)
    return pattern(std::forward<T>(x));
  else
    return pattern(from(std::forward<T>(x)));
}

template <typename ...Elements>
[[nodiscard]] pattern
seq_pattern(value family, Elements&& ...elements)
{
  const std::array<pattern, sizeof...(Elements)> elts {
      to_pattern(std::forward<Elements>(elements))...};
  return make_seq_pattern(family, elts);
}

template <typename ...Elements>
[[nodiscard]] pattern
tuple_pattern(Elements&& ...elements)
{ return seq_pattern(types::tuple, std::forward<Elements>(elements)...); }

template <typename ...Elements>
[[nodiscard]] pattern
list_pattern(Elements&& ...elements)
{ return seq_pattern(types::list, std::forward<Elements>(elements)...); }

template <typename ...Elements>
[[nodiscard]] pattern
set_pattern(Elements&& ...elements)
{
  const std::array<pattern, sizeof...(Elements)> elts {
      to_pattern(std::forward<Elements>(elements))...};
  return make_set_pattern(elts);
}

[[nodiscard]] inline pattern
dict_pattern(std::initializer_list<std::pair<pattern, pattern>> entries)
{ return make_dict_pattern({entries.begin(), entries.size()}); }

/** \} */

/**
 * \name Accessors
 *
 * Each accessor throws bad_pattern when applied to a pattern of another kind.
 *
 * \{
 */

[[nodiscard]] value
literal_value(pattern pat);

[[nodiscard]] value
checked_type(pattern pat);

[[nodiscard]] variable
pattern_variable(pattern pat);

[[nodiscard]] value
pattern_family(pattern pat);

/**
 * Number of elements of a sequence or set pattern, or of entries of a
 * mapping pattern
 *
 * \ingroup pattern
 */
[[nodiscard]] size_t
length(pattern pat);

/**
 * View of element patterns of a sequence or set pattern
 *
 * \ingroup pattern
 */
[[nodiscard]] std::span<pattern_node* const>
pattern_nodes(pattern pat);

[[nodiscard]] inline auto
elements(pattern pat)
{
  return pattern_nodes(pat) |
         std::views::transform([](pattern_node *p) { return pattern {p}; });
}

/**
 * View of key/value pattern pairs of a mapping pattern
 *
 * \ingroup pattern
 */
[[nodiscard]] std::pair<std::span<pattern_node* const>,
                        std::span<pattern_node* const>>
pattern_entry_nodes(pattern pat);

[[nodiscard]] inline auto
entries(pattern pat)
{
  const auto nodes = pattern_entry_nodes(pat);
  return std::views::iota(size_t {0}, nodes.first.size()) |
         std::views::transform([nodes](size_t i) {
           return std::pair<pattern, pattern> {pattern {nodes.first[i]},
                                               pattern {nodes.second[i]}};
         });
}

/** \} */

/**
 * Write a pattern in human readable form
 *
 * \ingroup pattern
 */
void
write(std::ostream &os, pattern pat);

inline std::ostream&
operator << (std::ostream &os, const pattern &pat)
{ write(os, pat); return os; }

} // namespace mbx
