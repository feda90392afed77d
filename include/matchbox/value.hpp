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

#include "matchbox/memory.hpp"

#include <array>
#include <cassert>
#include <concepts>
#include <initializer_list>
#include <ostream>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>


/**
 * \file value.hpp
 * Runtime values that patterns are matched against
 *
 * A value is a cheap handle to an immutable garbage-collected object. The
 * object tag classifies the value into one of the shapes the matcher
 * understands: scalars, sequences tagged with a family, sets, mappings,
 * types and typed instances.
 *
 * \ingroup core
 */


namespace mbx {


/**
 * Tag enumeration for object types
 *
 * \ingroup core
 */
enum class tag {
  nil,
  boolean,
  num,
  str,
  sym,
  seq,       /**< Ordered sequence tagged with a family type */
  set,       /**< Unordered collection of distinct values */
  map,       /**< Unordered collection of key/value entries */
  type,      /**< Type object; sequence families are types too */
  instance,  /**< Instance of a user-defined type */
  unmatched, /**< Value of a variable that is not bound */
};

struct object;

/**
 * Value class representing a reference to an object
 *
 * \ingroup core
 */
class value {
  public:
  /**
   * Constructor
   *
   * \param ptr Pointer to the object
   */
  explicit value(object *ptr): m_ptr {ptr} { assert(ptr != nullptr); }

  /**
   * Default constructor; refers to `nil`
   */
  value();

  constexpr object*
  operator -> () const noexcept
  { return m_ptr; }

  constexpr object&
  operator * () const noexcept
  { return *m_ptr; }

  /**
   * Structural equality (see mbx::equal())
   */
  [[nodiscard]] bool
  operator == (mbx::value other) const noexcept;

  private:
  object *m_ptr; /**< Pointer to the object */
}; // class mbx::value


/**
 * Object structure behind a value
 *
 * \ingroup core
 */
struct object {
  /**
   * Constructor
   *
   * \note This constructor is unsafe: payload is left uninitialized
   * \param tag Type tag for the object
   */
  object(tag tag): t {tag}, hash {0} { }

  tag t; /**< Type tag */
  size_t hash; /**< Cached hash, computed once on construction */
  union {
    struct { const char *data; size_t len; } sym;
    struct { const char *data; size_t len; } str;
    long double num;
    bool boolean;
    struct { object *family; object **data; size_t size; } seq;
    struct { object **data; size_t size; } set;
    struct { object **keys; object **vals; size_t size; } map;
    struct { const char *name; size_t len; object *parent; bool family; } type;
    struct { object *type; object *payload; } instance;
  };
}; // struct mbx::object


/**
 * Compute hash of a value from scratch
 *
 * Constructors store the result in `object::hash`; use chash() to read it.
 *
 * \ingroup core
 */
[[nodiscard]] size_t
hash(value x);

/**
 * Read cached hash of a value
 *
 * \ingroup core
 */
[[nodiscard]] inline size_t
chash(value x) noexcept
{ return x->hash; }


extern const value nil; /**< Nil constant */
extern const value True, False; /**< Boolean constants */

/**
 * Sentinel held by a variable that did not capture anything
 *
 * \ingroup core
 */
extern const value unmatched;


/**
 * Built-in types
 *
 * `types::object` is the root of every type. `tuple` and `list` are the two
 * built-in sequence families.
 *
 * \ingroup core
 */
namespace types {
extern const value object;
extern const value nil;
extern const value boolean;
extern const value num;
extern const value str;
extern const value sym;
extern const value set;
extern const value dict;
extern const value type;
extern const value tuple;
extern const value list;
} // namespace mbx::types


/**
 * \name Fundamental constructors
 * \{
 */

[[nodiscard]] inline value
boolean(bool x) noexcept
{ return x ? True : False; }

[[nodiscard]] value
num(long double val);

[[nodiscard]] value
str(std::string_view str);

[[nodiscard]] value
sym(std::string_view str);

/**
 * Create a sequence of the given family
 *
 * \param family Sequence family (see make_family())
 * \param elements Elements of the sequence, in order
 * \throws std::invalid_argument If \p family is not a sequence family
 *
 * \ingroup core
 */
[[nodiscard]] value
make_seq(value family, std::span<const value> elements);

/**
 * Create a set
 *
 * Duplicate elements (by equality) are dropped; the first occurrence keeps
 * its position.
 *
 * \ingroup core
 */
[[nodiscard]] value
make_set(std::span<const value> elements);

/**
 * Create a mapping
 *
 * For a repeated key the last value wins, at the position of the first
 * occurrence of the key.
 *
 * \ingroup core
 */
[[nodiscard]] value
make_dict(std::span<const std::pair<value, value>> entries);

/**
 * Create a new type
 *
 * \param name Name of the type (for printing only; types compare by identity)
 * \param parent Parent type for isinstance()
 *
 * \ingroup core
 */
[[nodiscard]] value
make_type(std::string_view name, value parent = types::object);

/**
 * Create a new sequence family
 *
 * Sequences of different families never compare equal and never match each
 * other's patterns.
 *
 * \ingroup core
 */
[[nodiscard]] value
make_family(std::string_view name);

/**
 * Create an instance of a user-defined type
 *
 * Instances compare by identity.
 *
 * \param type Type of the instance; must not be a sequence family
 * \param payload Arbitrary data attached to the instance
 *
 * \ingroup core
 */
[[nodiscard]] value
instance(value type, value payload = nil);

/** \} */

/**
 * \name Overloaded constructors from C++ types (casts)
 * \{
 */

template <std::integral T>
[[nodiscard]] value
from(T x)
{
  if constexpr (std::same_as<T, bool>)
    return boolean(x);
  else
    return num(static_cast<long double>(x));
}

template <std::floating_point T>
[[nodiscard]] value
from(T x)
{ return num(static_cast<long double>(x)); }

[[nodiscard]] inline value
from(const char *x)
{ return str(x); }

[[nodiscard]] inline value
from(const std::string &x)
{ return str(x); }

[[nodiscard]] inline value
from(value x)
{ return x; }

/** \} */

/**
 * \name Container constructors
 * \{
 */

/**
 * Create a sequence of the given family from C++ values
 *
 * \ingroup core
 */
template <typename ...Elements>
[[nodiscard]] value
seq(value family, Elements&& ...elements)
{
  const std::array<value, sizeof...(Elements)> elts {
      from(std::forward<Elements>(elements))...};
  return make_seq(family, elts);
}

template <typename ...Elements>
[[nodiscard]] value
tuple(Elements&& ...elements)
{ return seq(types::tuple, std::forward<Elements>(elements)...); }

template <typename ...Elements>
[[nodiscard]] value
list(Elements&& ...elements)
{ return seq(types::list, std::forward<Elements>(elements)...); }

template <typename ...Elements>
[[nodiscard]] value
set(Elements&& ...elements)
{
  const std::array<value, sizeof...(Elements)> elts {
      from(std::forward<Elements>(elements))...};
  return make_set(elts);
}

[[nodiscard]] inline value
dict(std::initializer_list<std::pair<value, value>> entries)
{ return make_dict({entries.begin(), entries.size()}); }

/** \} */

/**
 * \name Type tests
 * \{
 */

[[nodiscard]] inline bool
isnil(value x) noexcept
{ return x->t == tag::nil; }

[[nodiscard]] inline bool
isbool(value x) noexcept
{ return x->t == tag::boolean; }

[[nodiscard]] inline bool
isnum(value x) noexcept
{ return x->t == tag::num; }

[[nodiscard]] inline bool
isstr(value x) noexcept
{ return x->t == tag::str; }

[[nodiscard]] inline bool
issym(value x) noexcept
{ return x->t == tag::sym; }

[[nodiscard]] inline bool
isseq(value x) noexcept
{ return x->t == tag::seq; }

[[nodiscard]] inline bool
isset(value x) noexcept
{ return x->t == tag::set; }

[[nodiscard]] inline bool
ismap(value x) noexcept
{ return x->t == tag::map; }

[[nodiscard]] inline bool
istype(value x) noexcept
{ return x->t == tag::type; }

[[nodiscard]] inline bool
isinst(value x) noexcept
{ return x->t == tag::instance; }

/**
 * Check if a value is a sequence family type
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
isfamily(value x) noexcept
{ return istype(x) and x->type.family; }

/** \} */

/**
 * \name Accessors
 * \{
 */

/**
 * Get the numeric value
 *
 * \throws std::invalid_argument If the value is not a number
 *
 * \ingroup core
 */
[[nodiscard]] inline long double
num_val(value x)
{
  if (not isnum(x))
    throw std::invalid_argument {"num_val() - not a number"};
  return x->num;
}

/**
 * Get contents of a string
 *
 * \throws std::invalid_argument If the value is not a string
 *
 * \ingroup core
 */
[[nodiscard]] inline std::string_view
str_view(value x)
{
  if (not isstr(x))
    throw std::invalid_argument {"str_view() - not a string"};
  return std::string_view {x->str.data, x->str.len};
}

/**
 * Get the name of a symbol
 *
 * \throws std::invalid_argument If the value is not a symbol
 *
 * \ingroup core
 */
[[nodiscard]] inline std::string_view
sym_name(value x)
{
  if (not issym(x))
    throw std::invalid_argument {"sym_name() - not a symbol"};
  return std::string_view {x->sym.data, x->sym.len};
}

[[nodiscard]] inline std::string_view
type_name(value x)
{
  if (not istype(x))
    throw std::invalid_argument {"type_name() - not a type"};
  return std::string_view {x->type.name, x->type.len};
}

/**
 * Get the parent of a type
 *
 * \return Parent type, or `nil` for `types::object`
 * \throws std::invalid_argument If the value is not a type
 *
 * \ingroup core
 */
[[nodiscard]] inline value
type_parent(value x)
{
  if (not istype(x))
    throw std::invalid_argument {"type_parent() - not a type"};
  return x->type.parent ? value {x->type.parent} : nil;
}

[[nodiscard]] inline value
seq_family(value x)
{
  if (not isseq(x))
    throw std::invalid_argument {"seq_family() - not a sequence"};
  return value {x->seq.family};
}

[[nodiscard]] inline value
instance_payload(value x)
{
  if (not isinst(x))
    throw std::invalid_argument {"instance_payload() - not an instance"};
  return value {x->instance.payload};
}

/**
 * Number of elements of a sequence or set, or of entries of a mapping
 *
 * \throws std::invalid_argument If the value is not a container
 *
 * \ingroup core
 */
[[nodiscard]] inline size_t
length(value x)
{
  switch (x->t)
  {
    case tag::seq: return x->seq.size;
    case tag::set: return x->set.size;
    case tag::map: return x->map.size;
    default:
      throw std::invalid_argument {"length() - not a container"};
  }
}

/**
 * View of the elements of a sequence or set
 *
 * Set elements come in insertion order.
 *
 * \throws std::invalid_argument If the value is neither a sequence nor a set
 *
 * \ingroup core
 */
[[nodiscard]] inline auto
elements(value x)
{
  std::span<object* const> data;
  switch (x->t)
  {
    case tag::seq: data = {x->seq.data, x->seq.size}; break;
    case tag::set: data = {x->set.data, x->set.size}; break;
    default:
      throw std::invalid_argument {"elements() - not a sequence or a set"};
  }
  return data | std::views::transform([](object *p) { return value {p}; });
}

/**
 * View of the key/value entries of a mapping
 *
 * \throws std::invalid_argument If the value is not a mapping
 *
 * \ingroup core
 */
[[nodiscard]] inline auto
entries(value x)
{
  if (not ismap(x))
    throw std::invalid_argument {"entries() - not a mapping"};
  return std::views::iota(size_t {0}, x->map.size) |
         std::views::transform([x](size_t i) {
           return std::pair<value, value> {value {x->map.keys[i]},
                                           value {x->map.vals[i]}};
         });
}

[[nodiscard]] inline value
seq_ref(value x, size_t k)
{
  if (not isseq(x))
    throw std::invalid_argument {"seq_ref() - not a sequence"};
  if (k >= x->seq.size)
    throw std::out_of_range {"seq_ref() - index out of range"};
  return value {x->seq.data[k]};
}

/**
 * Look up a key in a mapping
 *
 * \param x Mapping
 * \param k Key to look up (by equality)
 * \param result Output parameter to store the value if found
 * \return True if the key was found
 *
 * \ingroup core
 */
bool
lookup(value x, value k, value &result);

/** \} */

/**
 * \name Types and equality
 * \{
 */

/**
 * Get type of a value
 *
 * For a sequence this is its family; for an instance, its type.
 *
 * \ingroup core
 */
[[nodiscard]] value
type_of(value x);

/**
 * Check if \p x is an instance of \p type or of any of its descendants
 *
 * \throws std::invalid_argument If \p type is not a type
 *
 * \ingroup core
 */
[[nodiscard]] bool
isinstance(value x, value type);

/**
 * Check if two values are the same object
 *
 * \ingroup core
 */
[[nodiscard]] inline bool
is(value a, value b) noexcept
{ return &*a == &*b; }

/**
 * Check if two values are equal
 *
 * Structural for scalars and containers; identity for types, instances and
 * singletons. No coercion between tags or sequence families.
 *
 * \ingroup core
 */
[[nodiscard]] bool
equal(value a, value b) noexcept;

/** \} */

/**
 * \name Printing
 * \{
 */

/**
 * Write value in a format that keeps strings quoted
 *
 * \ingroup core
 */
void
write(std::ostream &os, value val);

/**
 * Write value in a human appealing format (strings are written raw)
 *
 * \ingroup core
 */
void
display(std::ostream &os, value val);

inline std::ostream&
operator << (std::ostream &os, const value &val)
{ write(os, val); return os; }

/** \} */

} // namespace mbx

inline
mbx::value::value()
: m_ptr {&*mbx::nil}
{ }

inline bool
mbx::value::operator == (mbx::value other) const noexcept
{ return mbx::equal(*this, other); }
