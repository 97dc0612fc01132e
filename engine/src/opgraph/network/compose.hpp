#pragma once

#include "opgraph/algorithm/find_cycle.hpp"
#include "opgraph/diag/errors.hpp"
#include "opgraph/memory/container/vector.hpp"
#include "opgraph/network/Network.hpp"
#include "opgraph/operation/Operation.hpp"

namespace opgraph {

// Builds and validates a network from operations in declaration order.
//
// Throws:
// - std::invalid_argument if an operation handle is null.
// - DuplicateOperationError if two operations share a name.
// - EmptyOutputError if an operation provides nothing.
// - CyclicGraphError if an operation depends on its own outputs.
Network compose(const memory::vector<OperationHandle> &operations);

namespace details::network {

// Names the operations and data of a cycle found in the graph of a
// network, path is [A, y, B, x, A].
CyclicGraphError make_cycle_error(const Network::Graph &graph,
                                  const algorithm::HyperCycle &cycle);

} // namespace details::network

} // namespace opgraph
