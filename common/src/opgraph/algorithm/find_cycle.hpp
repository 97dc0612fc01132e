#pragma once

#include "opgraph/memory/container/dynamic_bitset.hpp"
#include "opgraph/memory/container/optional.hpp"
#include "opgraph/memory/container/vector.hpp"
#include "opgraph/memory/hypergraph/ConstHypergraph.hpp"
#include "opgraph/memory/hypergraph/Id.hpp"

#include <cstdint>

namespace opgraph::algorithm {

// A cycle edges[0] -> nodes[0] -> edges[1] -> ... -> nodes[n-1] -> edges[0].
// nodes[i] is a destination of edges[i] and a source of edges[(i+1) % n].
struct HyperCycle {
  memory::vector<memory::EdgeId> edges;
  memory::vector<memory::NodeId> nodes;
};

// Searches for a cycle among the active edges, where an edge f leads to an
// edge g if a destination of f is a source of g.
//
// Iterative three-color DFS, roots are visited in EdgeId order so the
// reported cycle is deterministic.
template <typename V, typename E>
memory::optional<HyperCycle>
find_cycle(const memory::ConstHypergraph<V, E> &graph,
           const memory::dynamic_bitset &active) {
  using EdgeId = memory::EdgeId;
  using NodeId = memory::NodeId;
  enum class Color : std::uint8_t { White, Gray, Black };

  struct Frame {
    EdgeId edge;
    std::size_t dstPos;
    std::size_t outPos;
  };

  const std::size_t M = graph.edgeCount();
  memory::vector<Color> color(M, Color::White);
  memory::vector<Frame> stack;

  for (std::size_t root = 0; root < M; ++root) {
    if (!active[root] || color[root] != Color::White) {
      continue;
    }
    color[root] = Color::Gray;
    stack.push_back(Frame{EdgeId{root}, 0, 0});

    while (!stack.empty()) {
      Frame &top = stack.back();
      const auto dsts = graph.dst(top.edge);
      bool descended = false;
      // NOTE: push_back invalidates top, check descended first.
      while (!descended && top.dstPos < dsts.size()) {
        const auto outs = graph.outgoing(dsts[top.dstPos]);
        while (top.outPos < outs.size()) {
          const EdgeId g = outs[top.outPos++];
          if (!active[*g]) {
            continue;
          }
          if (color[*g] == Color::Gray) {
            // Back edge: the cycle is the stack suffix starting at g.
            std::size_t k = stack.size() - 1;
            while (stack[k].edge != g) {
              --k;
            }
            HyperCycle cycle;
            for (std::size_t i = k; i < stack.size(); ++i) {
              cycle.edges.push_back(stack[i].edge);
              cycle.nodes.push_back(graph.dst(stack[i].edge)[stack[i].dstPos]);
            }
            return cycle;
          }
          if (color[*g] == Color::White) {
            color[*g] = Color::Gray;
            descended = true;
            break;
          }
        }
        if (descended) {
          // Keep dstPos on the node we descend through, it is part of a
          // potential cycle path.
          const EdgeId child = outs[top.outPos - 1];
          stack.push_back(Frame{child, 0, 0});
        } else {
          ++top.dstPos;
          top.outPos = 0;
        }
      }
      if (!descended) {
        color[*stack.back().edge] = Color::Black;
        stack.pop_back();
      }
    }
  }
  return memory::nullopt;
}

template <typename V, typename E>
memory::optional<HyperCycle>
find_cycle(const memory::ConstHypergraph<V, E> &graph) {
  return find_cycle(graph, memory::dynamic_bitset(graph.edgeCount(), true));
}

} // namespace opgraph::algorithm
