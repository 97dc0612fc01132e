#include "opgraph/algorithm/topological_sort.hpp"
#include <gtest/gtest.h>

using namespace opgraph::memory;
using namespace opgraph::algorithm;

using Graph = ConstHypergraph<int, int>;

static Graph chain_and_side() {
  // e0: n0 -> n1
  // e1: n1 -> n2
  // e2: n0 -> n3       (independent of e1)
  // e3: n2, n3 -> n4
  vector<Graph::EdgeDesc> edges;
  edges.push_back({0, {NodeId{0}}, {NodeId{1}}});
  edges.push_back({1, {NodeId{1}}, {NodeId{2}}});
  edges.push_back({2, {NodeId{0}}, {NodeId{3}}});
  edges.push_back({3, {NodeId{2}, NodeId{3}}, {NodeId{4}}});
  return Graph{{0, 1, 2, 3, 4}, std::move(edges)};
}

TEST(algorithm_topological_sort, smallest_ready_edge_first) {
  Graph G = chain_and_side();
  auto order = topological_edge_sort(G);
  ASSERT_TRUE(order.has_value());
  ASSERT_EQ(order->size(), 4u);
  EXPECT_EQ((*order)[0], EdgeId{0});
  EXPECT_EQ((*order)[1], EdgeId{1});
  EXPECT_EQ((*order)[2], EdgeId{2});
  EXPECT_EQ((*order)[3], EdgeId{3});
}

TEST(algorithm_topological_sort, respects_dependencies_over_edge_order) {
  // e0 needs n1 which only e1 provides.
  vector<Graph::EdgeDesc> edges;
  edges.push_back({0, {NodeId{1}}, {NodeId{2}}});
  edges.push_back({1, {NodeId{0}}, {NodeId{1}}});
  Graph G{{0, 1, 2}, std::move(edges)};

  auto order = topological_edge_sort(G);
  ASSERT_TRUE(order.has_value());
  ASSERT_EQ(order->size(), 2u);
  EXPECT_EQ((*order)[0], EdgeId{1});
  EXPECT_EQ((*order)[1], EdgeId{0});
}

TEST(algorithm_topological_sort, inactive_edges_are_skipped) {
  Graph G = chain_and_side();
  dynamic_bitset active(G.edgeCount(), true);
  active[1] = false;
  auto order = topological_edge_sort(G, active);
  ASSERT_TRUE(order.has_value());
  ASSERT_EQ(order->size(), 3u);
  EXPECT_EQ((*order)[0], EdgeId{0});
  EXPECT_EQ((*order)[1], EdgeId{2});
  EXPECT_EQ((*order)[2], EdgeId{3});
}

TEST(algorithm_topological_sort, cycle_yields_nullopt) {
  vector<Graph::EdgeDesc> edges;
  edges.push_back({0, {NodeId{0}}, {NodeId{1}}});
  edges.push_back({1, {NodeId{1}}, {NodeId{0}}});
  Graph G{{0, 1}, std::move(edges)};
  EXPECT_FALSE(topological_edge_sort(G).has_value());
}

TEST(algorithm_topological_sort, shared_producer_counted_once) {
  // e1 needs n1 and n2, both provided by e0.
  vector<Graph::EdgeDesc> edges;
  edges.push_back({0, {NodeId{0}}, {NodeId{1}, NodeId{2}}});
  edges.push_back({1, {NodeId{1}, NodeId{2}}, {NodeId{3}}});
  Graph G{{0, 1, 2, 3}, std::move(edges)};

  auto order = topological_edge_sort(G);
  ASSERT_TRUE(order.has_value());
  ASSERT_EQ(order->size(), 2u);
  EXPECT_EQ((*order)[0], EdgeId{0});
  EXPECT_EQ((*order)[1], EdgeId{1});
}
