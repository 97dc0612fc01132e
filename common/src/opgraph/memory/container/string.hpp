#pragma once

#include <string>

namespace opgraph::memory {

using string = std::string;

} // namespace opgraph::memory
