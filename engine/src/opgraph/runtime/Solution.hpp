#pragma once

#include "opgraph/operation/Value.hpp"

namespace opgraph {

struct Solution {
  ValueMap values;
};

struct ExecutionResult {
  Solution solution;
  Overwrites overwrites;
};

} // namespace opgraph
