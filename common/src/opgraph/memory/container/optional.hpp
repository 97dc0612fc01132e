#pragma once

#include <fmt/std.h> // includes formatter
#include <optional>

namespace opgraph::memory {

template <typename T> using optional = std::optional<T>;
static constexpr std::nullopt_t nullopt = std::nullopt;

} // namespace opgraph::memory
