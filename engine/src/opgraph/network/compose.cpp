#include "opgraph/network/compose.hpp"
#include "opgraph/diag/logging.hpp"
#include "opgraph/memory/container/hashmap.hpp"
#include <fmt/ranges.h>
#include <stdexcept>

namespace opgraph {

Network compose(const memory::vector<OperationHandle> &operations) {
  using Graph = Network::Graph;

  auto controlBlock = std::make_shared<details::network::NetworkControlBlock>();

  // 1. Structural checks.
  for (std::size_t i = 0; i < operations.size(); ++i) {
    const OperationHandle &op = operations[i];
    if (op == nullptr) {
      throw std::invalid_argument(
          fmt::format("compose: operation #{} is null", i));
    }
    auto [it, inserted] =
        controlBlock->operationByName.emplace(op->name(), memory::EdgeId{i});
    if (!inserted) {
      throw DuplicateOperationError(op->name());
    }
    if (op->provides().empty()) {
      throw EmptyOutputError(op->name());
    }
  }

  // 2. Intern data names, needs before provides.
  memory::vector<DataNode> nodes;
  auto intern = [&](const memory::string &name) -> memory::NodeId {
    auto [it, inserted] =
        controlBlock->dataByName.emplace(name, memory::NodeId{nodes.size()});
    if (inserted) {
      nodes.push_back(DataNode{name});
    }
    return it->second;
  };

  memory::vector<Graph::EdgeDesc> edges;
  edges.reserve(operations.size());
  for (const OperationHandle &op : operations) {
    Graph::EdgeDesc edge{OperationNode{op}, {}, {}};
    edge.srcs.reserve(op->needs().size());
    for (const auto &need : op->needs()) {
      edge.srcs.push_back(intern(need));
    }
    edge.dsts.reserve(op->provides().size());
    for (const auto &provide : op->provides()) {
      edge.dsts.push_back(intern(provide));
    }
    edges.push_back(std::move(edge));
  }

  controlBlock->graph = Graph{std::move(nodes), std::move(edges)};

  Network network{std::move(controlBlock)};

  // 3. Cycle check over op -> data -> op.
  if (auto cycle = algorithm::find_cycle(network.graph())) {
    throw details::network::make_cycle_error(network.graph(), *cycle);
  }

  OPGRAPH_DEBUG("composed network with {} operations and {} data nodes",
                network.operationCount(), network.dataCount());
  return network;
}

namespace details::network {

CyclicGraphError make_cycle_error(const Network::Graph &graph,
                                  const algorithm::HyperCycle &cycle) {
  memory::vector<memory::string> operations;
  memory::vector<memory::string> path;
  for (std::size_t i = 0; i < cycle.edges.size(); ++i) {
    const memory::string &op = graph.get(cycle.edges[i]).operation->name();
    operations.push_back(op);
    path.push_back(op);
    path.push_back(graph.get(cycle.nodes[i]).name);
  }
  if (!operations.empty()) {
    path.push_back(operations.front());
  }
  OPGRAPH_ERROR("cycle detected: {}", fmt::join(path, " -> "));
  return CyclicGraphError(std::move(operations), std::move(path));
}

} // namespace details::network

} // namespace opgraph
