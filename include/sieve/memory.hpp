/*
 * Sieve - runtime value validation and coercion engine
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

#include <concepts>
#include <cstddef>
#include <cstring>
#include <string_view>
#include <utility>
#include <type_traits>

/**
 * \file memory.hpp
 * Memory management for sieve values
 *
 * Values are allocated with the Boehm GC collector. Containers that store
 * values outside of GC memory must use one of the allocators defined here so
 * that the collector can see the references.
 *
 * \ingroup memory
 */

/**
 * \namespace sieve
 * The main namespace of the sieve library
 */
namespace sieve {

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
  new (obj) T {std::forward<Args>(args)...};
  return obj;
}

/**
 * Create a garbage-collected object that holds no pointers
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make_atomic(Args&& ...args)
{
  T* obj = static_cast<T*>(GC_malloc_atomic(sizeof(T)));
  new (obj) T {std::forward<Args>(args)...};
  return obj;
}

inline void*
allocate(size_t size)
{ return GC_malloc(size); }

inline void*
allocate_atomic(size_t size)
{ return GC_malloc_atomic(size); }

/**
 * Copy character data into atomic GC memory (null-terminated)
 *
 * \ingroup memory
 */
inline char*
copy_chars(std::string_view str)
{
  char *data = static_cast<char*>(allocate_atomic(str.length() + 1));
  std::memcpy(data, str.data(), str.length());
  data[str.length()] = '\0';
  return data;
}


template <typename T>
concept raw_allocator = requires(T a)
{
  { a(size_t{}) } -> std::convertible_to<void*>;
};

/**
 * STL-compatible allocator on top of the garbage collector
 *
 * \ingroup memory
 */
template <typename T, raw_allocator RawAllocator>
struct gc_allocator_base {
  using pointer = T*;
  using const_pointer = const T*;
  using void_pointer = void*;
  using value_type = T;
  using size_type = size_t;
  using difference_type = ptrdiff_t;

  template <typename U>
  struct rebind {
    using other = gc_allocator_base<U, RawAllocator>;
  };

  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  gc_allocator_base(const RawAllocator &rawalloc = RawAllocator { })
  : m_rawalloc {rawalloc}
  { }

  template <typename U>
  gc_allocator_base(const gc_allocator_base<U, RawAllocator> &other)
  : m_rawalloc {other.raw_allocator()}
  { }

  const RawAllocator&
  raw_allocator() const noexcept
  { return m_rawalloc; }

  pointer
  allocate(size_type n)
  { return static_cast<T*>(m_rawalloc(n * sizeof(T))); }

  void
  deallocate(pointer p, [[maybe_unused]] size_type n)
  { GC_free(p); }

  bool
  operator == (const gc_allocator_base &) const noexcept
  { return true; }

  bool
  operator != (const gc_allocator_base &) const noexcept
  { return false; }

  private:
  RawAllocator m_rawalloc;
}; // struct sieve::gc_allocator_base

namespace detail {
struct allocate_wrapper {
  void* operator () (size_t nb) const noexcept { return sieve::allocate(nb); }
}; // struct sieve::detail::allocate_wrapper
} // namespace sieve::detail

template <typename T>
using gc_allocator = gc_allocator_base<T, detail::allocate_wrapper>;

} // namespace sieve
