#pragma once

#include "opgraph/compiler/Plan.hpp"
#include "opgraph/memory/container/string.hpp"
#include "opgraph/network/Network.hpp"

namespace opgraph::io {

// Graphviz DOT rendering, data nodes are ellipses and operations boxes.
memory::string to_dot(const Network &network);

// Like to_dot(network) with the plan's steps numbered in execution order,
// its inputs and outputs highlighted and everything it pruned greyed out.
memory::string to_dot(const Plan &plan);

} // namespace opgraph::io
