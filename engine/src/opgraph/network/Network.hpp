#pragma once

#include "opgraph/memory/container/hashmap.hpp"
#include "opgraph/memory/container/optional.hpp"
#include "opgraph/memory/container/shared_ptr.hpp"
#include "opgraph/memory/container/span.hpp"
#include "opgraph/memory/container/string.hpp"
#include "opgraph/memory/container/vector.hpp"
#include "opgraph/memory/hypergraph/ConstHypergraph.hpp"
#include "opgraph/memory/hypergraph/Id.hpp"
#include "opgraph/operation/Operation.hpp"
#include <fmt/format.h>

namespace opgraph {

struct DataNode {
  memory::string name;
};

struct OperationNode {
  OperationHandle operation;
};

class Network;

namespace details::network {

struct NetworkControlBlock {
  memory::ConstHypergraph<DataNode, OperationNode> graph;
  memory::hash_map<memory::string, memory::NodeId> dataByName;
  memory::hash_map<memory::string, memory::EdgeId> operationByName;
};

} // namespace details::network

// Immutable bipartite graph of data nodes and operation nodes.
//
// Data nodes are the nodes of a hypergraph, operations are its hyperedges
// (sources = needs, destinations = provides). EdgeId{i} is the i-th
// operation given to compose(), NodeId{j} the j-th distinct name
// encountered while walking the operations in declaration order.
//
// Copies share the same immutable state, a Network can be read from many
// threads without synchronization.
class Network {
public:
  using Graph = memory::ConstHypergraph<DataNode, OperationNode>;

  Network();

  const Graph &graph() const { return m_controlBlock->graph; }

  std::size_t dataCount() const { return graph().nodeCount(); }
  std::size_t operationCount() const { return graph().edgeCount(); }

  const memory::string &dataName(memory::NodeId data) const {
    return graph().get(data).name;
  }

  const Operation &operation(memory::EdgeId op) const {
    return *graph().get(op).operation;
  }

  const OperationHandle &operationHandle(memory::EdgeId op) const {
    return graph().get(op).operation;
  }

  memory::optional<memory::NodeId> findData(const memory::string &name) const;

  memory::optional<memory::EdgeId>
  findOperation(const memory::string &name) const;

  // Operations providing data, in declaration order.
  memory::span<const memory::EdgeId> producers(memory::NodeId data) const {
    return graph().incoming(data);
  }

  // Operations needing data, in declaration order.
  memory::span<const memory::EdgeId> consumers(memory::NodeId data) const {
    return graph().outgoing(data);
  }

  memory::span<const memory::NodeId> needs(memory::EdgeId op) const {
    return graph().src(op);
  }

  memory::span<const memory::NodeId> provides(memory::EdgeId op) const {
    return graph().dst(op);
  }

  memory::vector<memory::string> dataNames() const;

  memory::vector<OperationHandle> operations() const;

  memory::string to_string() const;

private:
  friend Network compose(const memory::vector<OperationHandle> &operations);

  explicit Network(
      memory::shared_ptr<const details::network::NetworkControlBlock>
          controlBlock)
      : m_controlBlock(std::move(controlBlock)) {}

  memory::shared_ptr<const details::network::NetworkControlBlock>
      m_controlBlock;
};

} // namespace opgraph

template <>
struct fmt::formatter<opgraph::Network> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const opgraph::Network &network, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(network.to_string(), ctx);
  }
};
