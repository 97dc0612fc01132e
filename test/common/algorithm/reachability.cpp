#include "opgraph/algorithm/reachability.hpp"
#include <gtest/gtest.h>

using namespace opgraph::memory;
using namespace opgraph::algorithm;

using Graph = ConstHypergraph<int, int>;

// e0: n0 -> n1
// e1: n1 -> n2
// e2: n3 -> n2       (n3 is never given)
// e3: n0 -> n4       (does not lead to n2)
static Graph two_producers() {
  vector<Graph::EdgeDesc> edges;
  edges.push_back({0, {NodeId{0}}, {NodeId{1}}});
  edges.push_back({1, {NodeId{1}}, {NodeId{2}}});
  edges.push_back({2, {NodeId{3}}, {NodeId{2}}});
  edges.push_back({3, {NodeId{0}}, {NodeId{4}}});
  return Graph{{0, 1, 2, 3, 4}, std::move(edges)};
}

TEST(algorithm_reachability, backward_collects_all_producers) {
  Graph G = two_producers();
  dynamic_bitset given(G.nodeCount(), false);
  given[0] = true;
  const dynamic_bitset all(G.edgeCount(), true);
  vector<NodeId> targets{NodeId{2}};

  auto reached = backward_reachable(G, span<const NodeId>(targets), given, all);
  EXPECT_TRUE(reached[0]);
  EXPECT_TRUE(reached[1]);
  EXPECT_TRUE(reached[2]);
  EXPECT_FALSE(reached[3]);
}

TEST(algorithm_reachability, backward_stops_at_given_nodes) {
  Graph G = two_producers();
  dynamic_bitset given(G.nodeCount(), false);
  given[1] = true;
  const dynamic_bitset all(G.edgeCount(), true);
  vector<NodeId> targets{NodeId{2}};

  auto reached = backward_reachable(G, span<const NodeId>(targets), given, all);
  EXPECT_FALSE(reached[0]);
  EXPECT_TRUE(reached[1]);
}

TEST(algorithm_reachability, forward_fires_only_satisfied_edges) {
  Graph G = two_producers();
  dynamic_bitset given(G.nodeCount(), false);
  given[0] = true;
  const dynamic_bitset all(G.edgeCount(), true);

  auto feasible = forward_feasible(G, given, all);
  EXPECT_TRUE(feasible.edges[0]);
  EXPECT_TRUE(feasible.edges[1]);
  EXPECT_FALSE(feasible.edges[2]);
  EXPECT_TRUE(feasible.edges[3]);
  EXPECT_TRUE(feasible.nodes[2]);
  EXPECT_FALSE(feasible.nodes[3]);
}

TEST(algorithm_reachability, forward_waits_for_every_source) {
  // e0: n0 -> n1
  // e1: n1, n2 -> n3
  vector<Graph::EdgeDesc> edges;
  edges.push_back({0, {NodeId{0}}, {NodeId{1}}});
  edges.push_back({1, {NodeId{1}, NodeId{2}}, {NodeId{3}}});
  Graph G{{0, 1, 2, 3}, std::move(edges)};

  dynamic_bitset given(G.nodeCount(), false);
  given[0] = true;
  const dynamic_bitset all(G.edgeCount(), true);
  auto partial = forward_feasible(G, given, all);
  EXPECT_TRUE(partial.edges[0]);
  EXPECT_FALSE(partial.edges[1]);

  given[2] = true;
  auto full = forward_feasible(G, given, all);
  EXPECT_TRUE(full.edges[1]);
  EXPECT_TRUE(full.nodes[3]);
}
