#pragma once

#include <vector>

namespace opgraph::memory {

template <typename T, typename Allocator = std::allocator<T>>
using vector = std::vector<T, Allocator>;

} // namespace opgraph::memory
