#include "opgraph/compiler/compile.hpp"
#include "opgraph/algorithm/find_cycle.hpp"
#include "opgraph/algorithm/reachability.hpp"
#include "opgraph/algorithm/topological_sort.hpp"
#include "opgraph/diag/errors.hpp"
#include "opgraph/diag/logging.hpp"
#include "opgraph/memory/container/dynamic_bitset.hpp"
#include "opgraph/network/compose.hpp"
#include <fmt/ranges.h>
#include <unordered_set>

namespace opgraph {

static memory::vector<memory::string>
unique_names(const memory::vector<memory::string> &names) {
  memory::vector<memory::string> result;
  std::unordered_set<memory::string> seen;
  for (const auto &name : names) {
    if (seen.insert(name).second) {
      result.push_back(name);
    }
  }
  return result;
}

static memory::dynamic_bitset
given_nodes(const Network &network,
            const memory::vector<memory::string> &inputs) {
  memory::dynamic_bitset given(network.dataCount(), false);
  for (const auto &input : inputs) {
    // Inputs unknown to the network are carried along but never read.
    if (auto id = network.findData(input)) {
      given[**id] = true;
    }
  }
  return given;
}

namespace details::compiler {

memory::vector<memory::EdgeId>
order_steps(const Network::Graph &graph,
            const memory::dynamic_bitset &selected) {
  auto order = algorithm::topological_edge_sort(graph, selected);
  if (order.has_value()) {
    return std::move(*order);
  }
  if (auto cycle = algorithm::find_cycle(graph, selected)) {
    throw details::network::make_cycle_error(graph, *cycle);
  }
  throw InternalConsistencyError(
      "topological sort failed on a subgraph without cycles", {});
}

} // namespace details::compiler

Plan compile(const Network &network,
             const memory::vector<memory::string> &inputs,
             const memory::vector<memory::string> &outputs) {
  const auto &graph = network.graph();
  memory::vector<memory::string> requestedInputs = unique_names(inputs);
  memory::vector<memory::string> requestedOutputs = unique_names(outputs);
  const std::unordered_set<memory::string> isInput(requestedInputs.begin(),
                                                   requestedInputs.end());

  memory::dynamic_bitset given = given_nodes(network, requestedInputs);

  memory::vector<memory::NodeId> targets;
  for (const auto &output : requestedOutputs) {
    if (isInput.contains(output)) {
      continue;
    }
    if (auto id = network.findData(output)) {
      targets.push_back(*id);
    }
  }

  // 1. Backward: operations that may contribute to an output.
  const memory::dynamic_bitset all(graph.edgeCount(), true);
  memory::dynamic_bitset candidates =
      algorithm::backward_reachable(graph, targets, given, all);

  // 2. Forward: candidates whose needs can actually be satisfied.
  algorithm::Feasibility feasible =
      algorithm::forward_feasible(graph, given, candidates);

  // 3. Backward again over runnable operations only, drops operations
  //    which only fed an operation removed in 2.
  memory::dynamic_bitset selected =
      algorithm::backward_reachable(graph, targets, given, feasible.edges);

  memory::vector<memory::EdgeId> steps =
      details::compiler::order_steps(graph, selected);

  memory::dynamic_bitset produced(graph.nodeCount(), false);
  for (memory::EdgeId op : steps) {
    for (memory::NodeId provide : graph.dst(op)) {
      produced[*provide] = true;
    }
  }
  memory::vector<memory::string> unsatisfiable;
  for (const auto &output : requestedOutputs) {
    if (isInput.contains(output)) {
      continue;
    }
    auto id = network.findData(output);
    if (!id.has_value() || !produced[**id]) {
      unsatisfiable.push_back(output);
    }
  }
  if (!unsatisfiable.empty()) {
    OPGRAPH_DEBUG("compile failed, unreachable outputs [{}] from inputs [{}]",
                  fmt::join(unsatisfiable, ", "),
                  fmt::join(requestedInputs, ", "));
    throw UnsatisfiableOutputError(std::move(unsatisfiable));
  }

  Plan plan = details::compiler::make_plan(network, std::move(steps),
                                           std::move(requestedInputs),
                                           std::move(requestedOutputs));
  OPGRAPH_DEBUG("compiled plan [{}] for outputs [{}]",
                fmt::join(plan.stepNames(), ", "),
                fmt::join(plan.providedOutputs(), ", "));
  return plan;
}

Plan compile_all(const Network &network,
                 const memory::vector<memory::string> &inputs) {
  const auto &graph = network.graph();
  memory::vector<memory::string> requestedInputs = unique_names(inputs);
  memory::dynamic_bitset given = given_nodes(network, requestedInputs);

  const memory::dynamic_bitset all(graph.edgeCount(), true);
  algorithm::Feasibility feasible =
      algorithm::forward_feasible(graph, given, all);

  memory::vector<memory::EdgeId> steps =
      details::compiler::order_steps(graph, feasible.edges);

  memory::vector<memory::string> outputs;
  memory::dynamic_bitset listed(graph.nodeCount(), false);
  for (memory::EdgeId op : steps) {
    for (memory::NodeId provide : graph.dst(op)) {
      if (!listed[*provide]) {
        listed[*provide] = true;
        outputs.push_back(network.dataName(provide));
      }
    }
  }

  Plan plan = details::compiler::make_plan(network, std::move(steps),
                                           std::move(requestedInputs),
                                           std::move(outputs));
  OPGRAPH_DEBUG("compiled full plan [{}]", fmt::join(plan.stepNames(), ", "));
  return plan;
}

} // namespace opgraph
