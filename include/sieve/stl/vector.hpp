#pragma once

#include "sieve/memory.hpp"

#include <vector>


namespace sieve::stl {

template <typename T>
using vector = std::vector<T, gc_allocator<T>>;

} // namespace sieve::stl
