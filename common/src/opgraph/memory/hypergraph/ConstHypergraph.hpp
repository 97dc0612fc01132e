#pragma once

#include "opgraph/memory/container/span.hpp"
#include "opgraph/memory/container/vector.hpp"
#include "opgraph/memory/hypergraph/Id.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace opgraph::memory {

// Immutable directed hypergraph in compressed (CSR) form.
// Every hyperedge has an ordered list of source nodes and an ordered list
// of destination nodes. Ids are dense: NodeId{i} is the i-th node given to
// the constructor and EdgeId{j} the j-th edge.
//
// incoming(v) lists all edges with v in their destinations, outgoing(v)
// all edges with v in their sources. Both are sorted by EdgeId.
template <typename V, typename E> class ConstHypergraph {
public:
  struct EdgeDesc {
    E payload;
    memory::vector<NodeId> srcs;
    memory::vector<NodeId> dsts;
  };

  ConstHypergraph() = default;

  ConstHypergraph(memory::vector<V> nodes, memory::vector<EdgeDesc> edges)
      : m_nodeData(std::move(nodes)) {
    const std::size_t nodeCount = m_nodeData.size();
    const std::size_t edgeCount = edges.size();

    // Pass 1: Count indeg, outdeg, srclen and dstlen.
    memory::vector<std::size_t> indeg(nodeCount, 0);
    memory::vector<std::size_t> outdeg(nodeCount, 0);
    std::size_t srcTotal = 0;
    std::size_t dstTotal = 0;
    for (std::size_t e = 0; e < edgeCount; ++e) {
      for (NodeId u : edges[e].srcs) {
        checkNode(u, e);
        ++outdeg[*u];
      }
      for (NodeId v : edges[e].dsts) {
        checkNode(v, e);
        ++indeg[*v];
      }
      srcTotal += edges[e].srcs.size();
      dstTotal += edges[e].dsts.size();
    }

    // Pass 2: Prefix sums. Incoming ranges come first in m_edgeIds,
    //         outgoing ranges are placed behind them.
    memory::vector<std::size_t> indegPrefix(nodeCount + 1, 0);
    memory::vector<std::size_t> outdegPrefix(nodeCount + 1, 0);
    for (std::size_t v = 0; v < nodeCount; ++v) {
      indegPrefix[v + 1] = indegPrefix[v] + indeg[v];
      outdegPrefix[v + 1] = outdegPrefix[v] + outdeg[v];
    }
    const std::size_t incomingTotal = indegPrefix.back();
    for (std::size_t v = 0; v <= nodeCount; ++v) {
      outdegPrefix[v] += incomingTotal;
    }

    m_nodes.reserve(nodeCount);
    for (std::size_t v = 0; v < nodeCount; ++v) {
      m_nodes.push_back(Node{indegPrefix[v], indegPrefix[v + 1],
                             outdegPrefix[v], outdegPrefix[v + 1]});
    }
    m_edgeIds.resize(outdegPrefix.back(), EdgeId{0});
    m_nodeIds.reserve(srcTotal + dstTotal);
    m_edges.reserve(edgeCount);
    m_edgeData.reserve(edgeCount);

    // Pass 3: Copy edge payloads and populate id arrays.
    //         Edges are visited in id order, which keeps every
    //         incoming / outgoing range sorted.
    for (std::size_t e = 0; e < edgeCount; ++e) {
      Edge edge;
      edge.srcBegin = m_nodeIds.size();
      for (NodeId u : edges[e].srcs) {
        m_nodeIds.push_back(u);
        m_edgeIds[outdegPrefix[*u]++] = EdgeId{e};
      }
      edge.srcEnd = m_nodeIds.size();
      edge.dstBegin = m_nodeIds.size();
      for (NodeId v : edges[e].dsts) {
        m_nodeIds.push_back(v);
        m_edgeIds[indegPrefix[*v]++] = EdgeId{e};
      }
      edge.dstEnd = m_nodeIds.size();
      m_edges.push_back(edge);
      m_edgeData.push_back(std::move(edges[e].payload));
    }
  }

  memory::span<const EdgeId> incoming(NodeId node) const {
    const Node &n = m_nodes[*node];
    return rangeOf(m_edgeIds, n.incomingBegin, n.incomingEnd);
  }

  memory::span<const EdgeId> outgoing(NodeId node) const {
    const Node &n = m_nodes[*node];
    return rangeOf(m_edgeIds, n.outgoingBegin, n.outgoingEnd);
  }

  memory::span<const NodeId> src(EdgeId edge) const {
    const Edge &e = m_edges[*edge];
    return rangeOf(m_nodeIds, e.srcBegin, e.srcEnd);
  }

  memory::span<const NodeId> dst(EdgeId edge) const {
    const Edge &e = m_edges[*edge];
    return rangeOf(m_nodeIds, e.dstBegin, e.dstEnd);
  }

  const V &get(NodeId node) const { return m_nodeData[*node]; }
  const E &get(EdgeId edge) const { return m_edgeData[*edge]; }

  std::size_t nodeCount() const { return m_nodes.size(); }
  std::size_t edgeCount() const { return m_edges.size(); }

private:
  struct Node {
    std::size_t incomingBegin;
    std::size_t incomingEnd;
    std::size_t outgoingBegin;
    std::size_t outgoingEnd;
  };

  struct Edge {
    std::size_t srcBegin;
    std::size_t srcEnd;
    std::size_t dstBegin;
    std::size_t dstEnd;
  };

  template <typename T>
  static memory::span<const T> rangeOf(const memory::vector<T> &v,
                                       std::size_t begin, std::size_t end) {
    return memory::span<const T>{
        v.begin() + static_cast<std::ptrdiff_t>(begin),
        v.begin() + static_cast<std::ptrdiff_t>(end)};
  }

  void checkNode(NodeId node, std::size_t edge) const {
    if (!node || *node >= m_nodeData.size()) {
      throw std::out_of_range(fmt::format(
          "ConstHypergraph: edge #{} references unknown node {}", edge,
          node));
    }
  }

  memory::vector<NodeId> m_nodeIds;
  memory::vector<EdgeId> m_edgeIds;
  memory::vector<Node> m_nodes;
  memory::vector<Edge> m_edges;
  memory::vector<V> m_nodeData;
  memory::vector<E> m_edgeData;
};

} // namespace opgraph::memory
