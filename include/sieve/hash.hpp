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

#include "sieve/value.hpp"

#include <functional>


namespace sieve {

template <class T>
inline void
hash_combine(size_t &seed, const T &v)
{
  std::hash<T> hasher;
  seed ^= hasher(v) + 0x9e3779b9 + (seed<<6) + (seed>>2);
}

/**
 * Hash of a value cached at construction
 */
[[nodiscard]] inline size_t
chash(value x) noexcept
{ return x->hash; }

} // namespace sieve


namespace std {

template <>
struct hash<sieve::value> {
  size_t
  operator () (const sieve::value &x) const noexcept
  { return sieve::chash(x); }
};

} // namespace std
