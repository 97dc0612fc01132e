#pragma once

#include <string_view>

namespace opgraph::memory {

using string_view = std::string_view;

} // namespace opgraph::memory
