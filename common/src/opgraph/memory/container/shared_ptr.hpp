#pragma once

#include <memory>

namespace opgraph::memory {

template <typename T> using shared_ptr = std::shared_ptr<T>;

} // namespace opgraph::memory
