#pragma once

#include "opgraph/memory/container/dynamic_bitset.hpp"
#include "opgraph/memory/container/optional.hpp"
#include "opgraph/memory/container/vector.hpp"
#include "opgraph/memory/hypergraph/ConstHypergraph.hpp"
#include "opgraph/memory/hypergraph/Id.hpp"

#include <functional>
#include <queue>

namespace opgraph::algorithm {

// Orders the active hyperedges of a graph such that an edge comes after
// every active edge producing one of its sources.
//
// Kahn's algorithm with a min-heap as frontier: among all ready edges the
// one with the smallest EdgeId is emitted first, so the result is the
// lexicographically smallest valid order.
//
// Returns nullopt if the active edges contain a cycle.
template <typename V, typename E>
memory::optional<memory::vector<memory::EdgeId>>
topological_edge_sort(const memory::ConstHypergraph<V, E> &graph,
                      const memory::dynamic_bitset &active) {
  using EdgeId = memory::EdgeId;
  const std::size_t M = graph.edgeCount();

  // Distinct dependency edges per edge, via a stamp per visited producer.
  memory::vector<std::uint32_t> indegree(M, 0);
  memory::vector<memory::vector<EdgeId>> successors(M);
  memory::vector<std::uint64_t> stamp(M, EdgeId::NullId);

  std::size_t activeCount = 0;
  for (std::size_t ei = 0; ei < M; ++ei) {
    if (!active[ei]) {
      continue;
    }
    ++activeCount;
    const EdgeId e{ei};
    for (memory::NodeId u : graph.src(e)) {
      for (EdgeId f : graph.incoming(u)) {
        if (!active[*f] || stamp[*f] == ei) {
          continue;
        }
        stamp[*f] = ei;
        successors[*f].push_back(e);
        ++indegree[ei];
      }
    }
  }

  std::priority_queue<EdgeId, memory::vector<EdgeId>, std::greater<EdgeId>>
      ready;
  for (std::size_t ei = 0; ei < M; ++ei) {
    if (active[ei] && indegree[ei] == 0) {
      ready.push(EdgeId{ei});
    }
  }

  memory::vector<EdgeId> order;
  order.reserve(activeCount);
  while (!ready.empty()) {
    EdgeId f = ready.top();
    ready.pop();
    order.push_back(f);
    for (EdgeId e : successors[*f]) {
      if (--indegree[*e] == 0) {
        ready.push(e);
      }
    }
  }

  if (order.size() != activeCount) {
    return memory::nullopt;
  }
  return order;
}

template <typename V, typename E>
memory::optional<memory::vector<memory::EdgeId>>
topological_edge_sort(const memory::ConstHypergraph<V, E> &graph) {
  return topological_edge_sort(
      graph, memory::dynamic_bitset(graph.edgeCount(), true));
}

} // namespace opgraph::algorithm
