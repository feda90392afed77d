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

#include <gc.h>

#include <cstddef>
#include <new>
#include <utility>
#include <type_traits>

/**
 * \file memory.hpp
 * Garbage-collected storage for values, pattern nodes and variable cells
 *
 * Everything reachable from a `mbx::value`, `mbx::pattern` or
 * `mbx::variable` handle lives in the Boehm GC heap. Containers that hold
 * such handles must use gc_allocator so the collector can see them.
 *
 * \ingroup memory
 */

/**
 * \namespace mbx
 * The main namespace for the Matchbox library
 */
namespace mbx {

/**
 * Create a garbage-collected object
 *
 * \tparam T The type of object to create
 * \param args Constructor arguments
 * \return Pointer to the newly created object
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make(Args&& ...args)
{
  T* obj = static_cast<T*>(GC_malloc(sizeof(T)));
  if (obj == nullptr)
    throw std::bad_alloc {};
  new (obj) T {std::forward<Args>(args)...};
  return obj;
}

/**
 * Create a garbage-collected object that holds no GC pointers
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make_atomic(Args&& ...args)
{
  T* obj = static_cast<T*>(GC_malloc_atomic(sizeof(T)));
  if (obj == nullptr)
    throw std::bad_alloc {};
  new (obj) T {std::forward<Args>(args)...};
  return obj;
}

/**
 * Allocate an array of \p n elements of type \p T in the GC heap
 *
 * Used for element arrays of containers and patterns, so the elements
 * themselves are traced by the collector.
 *
 * \ingroup memory
 */
template <typename T>
T*
allocate_array(size_t n)
{
  if (n == 0)
    return nullptr;
  T *arr = static_cast<T*>(GC_malloc(n * sizeof(T)));
  if (arr == nullptr)
    throw std::bad_alloc {};
  return arr;
}

inline void*
allocate_atomic(size_t size)
{ return GC_malloc_atomic(size); }


/**
 * STL-compatible allocator backed by the garbage collector
 *
 * \tparam T The value type to allocate
 *
 * \ingroup memory
 */
template <typename T>
struct gc_allocator {
  using pointer = T*;
  using const_pointer = const T*;
  using void_pointer = void*;
  using value_type = T;
  using size_type = size_t;
  using difference_type = ptrdiff_t;

  template <typename U>
  struct rebind {
    using other = gc_allocator<U>;
  };

  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  gc_allocator() noexcept = default;

  template <typename U>
  gc_allocator(const gc_allocator<U> &) noexcept
  { }

  pointer
  allocate(size_type n)
  {
    const pointer p = static_cast<T*>(GC_malloc(n * sizeof(T)));
    if (p == nullptr)
      throw std::bad_alloc {};
    return p;
  }

  void
  deallocate(pointer p, [[maybe_unused]] size_type n)
  { GC_free(p); }

  template <typename U>
  bool
  operator == (const gc_allocator<U> &) const noexcept
  { return true; }

  template <typename U>
  bool
  operator != (const gc_allocator<U> &) const noexcept
  { return false; }
}; // struct mbx::gc_allocator


} // namespace mbx
