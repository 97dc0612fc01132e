#pragma once

#include "opgraph/memory/container/hashmap.hpp"
#include "opgraph/memory/container/string.hpp"
#include "opgraph/memory/container/vector.hpp"
#include <any>

namespace opgraph {

// Values flowing through a network are opaque to the engine.
using Value = std::any;

using ValueMap = memory::hash_map<memory::string, Value>;

// Prior values of a name, oldest first.
using Overwrites = memory::hash_map<memory::string, memory::vector<Value>>;

template <typename T> const T &value_cast(const Value &value) {
  return std::any_cast<const T &>(value);
}

template <typename T> const T &value_cast(const ValueMap &values,
                                          const memory::string &name) {
  return std::any_cast<const T &>(values.at(name));
}

} // namespace opgraph
