#pragma once

#include "opgraph/memory/container/dynamic_bitset.hpp"
#include "opgraph/memory/container/span.hpp"
#include "opgraph/memory/container/vector.hpp"
#include "opgraph/memory/hypergraph/ConstHypergraph.hpp"
#include "opgraph/memory/hypergraph/Id.hpp"

namespace opgraph::algorithm {

// Collects all active edges which may contribute to one of the targets,
// walking node -> producing edges -> their sources -> ...
//
// Nodes marked in `given` are known to be available, their producers are
// not visited.
template <typename V, typename E>
memory::dynamic_bitset
backward_reachable(const memory::ConstHypergraph<V, E> &graph,
                   memory::span<const memory::NodeId> targets,
                   const memory::dynamic_bitset &given,
                   const memory::dynamic_bitset &active) {
  memory::dynamic_bitset visitedNodes(graph.nodeCount(), false);
  memory::dynamic_bitset reached(graph.edgeCount(), false);
  memory::vector<memory::NodeId> stack(targets.begin(), targets.end());

  while (!stack.empty()) {
    memory::NodeId v = stack.back();
    stack.pop_back();
    if (visitedNodes[*v]) {
      continue;
    }
    visitedNodes[*v] = true;
    if (given[*v]) {
      continue;
    }
    for (memory::EdgeId e : graph.incoming(v)) {
      if (!active[*e] || reached[*e]) {
        continue;
      }
      reached[*e] = true;
      for (memory::NodeId u : graph.src(e)) {
        if (!visitedNodes[*u]) {
          stack.push_back(u);
        }
      }
    }
  }
  return reached;
}

struct Feasibility {
  // Edges which can fire.
  memory::dynamic_bitset edges;
  // Nodes which are given or produced by a firing edge.
  memory::dynamic_bitset nodes;
};

// Forward fixed point over the candidate edges: an edge fires once all of
// its sources are available, afterwards its destinations are available.
template <typename V, typename E>
Feasibility forward_feasible(const memory::ConstHypergraph<V, E> &graph,
                             const memory::dynamic_bitset &given,
                             const memory::dynamic_bitset &candidates) {
  const std::size_t M = graph.edgeCount();

  Feasibility result{memory::dynamic_bitset(M, false), given};

  // Remaining unavailable sources per candidate edge.
  memory::vector<std::size_t> missing(M, 0);
  memory::vector<memory::EdgeId> ready;
  for (std::size_t ei = 0; ei < M; ++ei) {
    if (!candidates[ei]) {
      continue;
    }
    const memory::EdgeId e{ei};
    for (memory::NodeId u : graph.src(e)) {
      if (!result.nodes[*u]) {
        ++missing[ei];
      }
    }
    if (missing[ei] == 0) {
      ready.push_back(e);
    }
  }

  while (!ready.empty()) {
    memory::EdgeId e = ready.back();
    ready.pop_back();
    result.edges[*e] = true;
    for (memory::NodeId v : graph.dst(e)) {
      if (result.nodes[*v]) {
        continue;
      }
      result.nodes[*v] = true;
      for (memory::EdgeId g : graph.outgoing(v)) {
        if (!candidates[*g] || result.edges[*g]) {
          continue;
        }
        // g is listed once per occurrence of v in its sources.
        if (--missing[*g] == 0) {
          ready.push_back(g);
        }
      }
    }
  }
  return result;
}

} // namespace opgraph::algorithm
