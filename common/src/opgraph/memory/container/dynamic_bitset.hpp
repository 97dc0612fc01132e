#pragma once

#include <vector>

namespace opgraph::memory {

/// Requirements:
/// - Initalized to false.
/// - Fixed size, sized once by the node or edge count of a graph.
using dynamic_bitset = std::vector<bool>;

} // namespace opgraph::memory
