#include "opgraph/algorithm/find_cycle.hpp"
#include <gtest/gtest.h>

using namespace opgraph::memory;
using namespace opgraph::algorithm;

using Graph = ConstHypergraph<int, int>;

TEST(algorithm_find_cycle, acyclic) {
  vector<Graph::EdgeDesc> edges;
  edges.push_back({0, {NodeId{0}}, {NodeId{1}}});
  edges.push_back({1, {NodeId{1}}, {NodeId{2}}});
  edges.push_back({2, {NodeId{0}, NodeId{2}}, {NodeId{3}}});
  Graph G{{0, 1, 2, 3}, std::move(edges)};
  EXPECT_FALSE(find_cycle(G).has_value());
}

TEST(algorithm_find_cycle, two_edge_cycle) {
  // e0: n0 -> n1, e1: n1 -> n0
  vector<Graph::EdgeDesc> edges;
  edges.push_back({0, {NodeId{0}}, {NodeId{1}}});
  edges.push_back({1, {NodeId{1}}, {NodeId{0}}});
  Graph G{{0, 1}, std::move(edges)};

  auto cycle = find_cycle(G);
  ASSERT_TRUE(cycle.has_value());
  ASSERT_EQ(cycle->edges.size(), 2u);
  ASSERT_EQ(cycle->nodes.size(), 2u);
  EXPECT_EQ(cycle->edges[0], EdgeId{0});
  EXPECT_EQ(cycle->nodes[0], NodeId{1});
  EXPECT_EQ(cycle->edges[1], EdgeId{1});
  EXPECT_EQ(cycle->nodes[1], NodeId{0});
}

TEST(algorithm_find_cycle, self_loop) {
  vector<Graph::EdgeDesc> edges;
  edges.push_back({0, {NodeId{0}}, {NodeId{0}}});
  Graph G{{0}, std::move(edges)};

  auto cycle = find_cycle(G);
  ASSERT_TRUE(cycle.has_value());
  ASSERT_EQ(cycle->edges.size(), 1u);
  EXPECT_EQ(cycle->edges[0], EdgeId{0});
  EXPECT_EQ(cycle->nodes[0], NodeId{0});
}

TEST(algorithm_find_cycle, cycle_behind_multi_destination_edge) {
  // e0: n0 -> n1, n2
  // e1: n2 -> n3
  // e2: n3 -> n0
  vector<Graph::EdgeDesc> edges;
  edges.push_back({0, {NodeId{0}}, {NodeId{1}, NodeId{2}}});
  edges.push_back({1, {NodeId{2}}, {NodeId{3}}});
  edges.push_back({2, {NodeId{3}}, {NodeId{0}}});
  Graph G{{0, 1, 2, 3}, std::move(edges)};

  auto cycle = find_cycle(G);
  ASSERT_TRUE(cycle.has_value());
  ASSERT_EQ(cycle->edges.size(), 3u);
  EXPECT_EQ(cycle->nodes[0], NodeId{2});
  EXPECT_EQ(cycle->nodes[1], NodeId{3});
  EXPECT_EQ(cycle->nodes[2], NodeId{0});

  // Every consecutive pair is really connected.
  for (std::size_t i = 0; i < cycle->edges.size(); ++i) {
    const NodeId via = cycle->nodes[i];
    const EdgeId next = cycle->edges[(i + 1) % cycle->edges.size()];
    bool produced = false;
    for (NodeId d : G.dst(cycle->edges[i]))
      produced |= (d == via);
    bool consumed = false;
    for (NodeId s : G.src(next))
      consumed |= (s == via);
    EXPECT_TRUE(produced);
    EXPECT_TRUE(consumed);
  }
}

TEST(algorithm_find_cycle, inactive_edge_breaks_cycle) {
  vector<Graph::EdgeDesc> edges;
  edges.push_back({0, {NodeId{0}}, {NodeId{1}}});
  edges.push_back({1, {NodeId{1}}, {NodeId{0}}});
  Graph G{{0, 1}, std::move(edges)};

  dynamic_bitset active(G.edgeCount(), true);
  active[1] = false;
  EXPECT_FALSE(find_cycle(G, active).has_value());
}
