#include "opgraph/compiler/Plan.hpp"
#include "opgraph/diag/errors.hpp"
#include <algorithm>
#include <fmt/ranges.h>
#include <unordered_set>

namespace opgraph {

memory::vector<memory::string> Plan::stepNames() const {
  memory::vector<memory::string> names;
  names.reserve(size());
  for (memory::EdgeId op : steps()) {
    names.push_back(network().operation(op).name());
  }
  return names;
}

memory::string Plan::to_string() const {
  memory::string str =
      fmt::format("Plan(inputs=[{}], outputs=[{}])\n",
                  fmt::join(requiredInputs(), ", "),
                  fmt::join(providedOutputs(), ", "));
  for (std::size_t i = 0; i < size(); ++i) {
    str += fmt::format("  {:>3}. {}\n", i + 1, step(i));
  }
  return str;
}

namespace details::compiler {

Plan make_plan(const Network &network, memory::vector<memory::EdgeId> steps,
               memory::vector<memory::string> requestedInputs,
               memory::vector<memory::string> providedOutputs) {
  const auto &graph = network.graph();
  auto cb = std::make_shared<PlanControlBlock>();
  cb->network = network;
  cb->active = memory::dynamic_bitset(graph.edgeCount(), false);
  cb->requestedInputs = std::move(requestedInputs);
  cb->providedOutputs = std::move(providedOutputs);

  const std::unordered_set<memory::string> isInput(
      cb->requestedInputs.begin(), cb->requestedInputs.end());
  std::unordered_set<memory::string> isRequired;

  memory::vector<std::uint64_t> stepIndex(graph.edgeCount(),
                                          memory::EdgeId::NullId);
  for (std::size_t i = 0; i < steps.size(); ++i) {
    cb->active[*steps[i]] = true;
    stepIndex[*steps[i]] = i;
  }

  // Required inputs: needs read before any earlier step produced them.
  memory::dynamic_bitset produced(graph.nodeCount(), false);
  memory::dynamic_bitset required(graph.nodeCount(), false);
  cb->dependencies.resize(steps.size());
  cb->dependents.resize(steps.size());
  for (std::size_t i = 0; i < steps.size(); ++i) {
    const memory::EdgeId op = steps[i];
    for (memory::NodeId need : graph.src(op)) {
      if (!produced[*need] && !required[*need]) {
        const memory::string &name = network.dataName(need);
        if (!isInput.contains(name)) {
          throw InternalConsistencyError(
              "step needs a value that is neither an input nor produced by "
              "an earlier step",
              {network.operation(op).name(), name});
        }
        required[*need] = true;
        isRequired.insert(name);
        cb->requiredInputs.push_back(name);
      }
      for (memory::EdgeId producer : graph.incoming(need)) {
        const std::uint64_t j = stepIndex[*producer];
        if (j == memory::EdgeId::NullId) {
          continue;
        }
        if (j >= i) {
          throw InternalConsistencyError(
              "step is ordered before one of its producers",
              {network.operation(op).name(),
               network.operation(producer).name()});
        }
        auto &deps = cb->dependencies[i];
        if (std::find(deps.begin(), deps.end(), j) == deps.end()) {
          deps.push_back(j);
          cb->dependents[j].push_back(i);
        }
      }
    }
    for (memory::NodeId provide : graph.dst(op)) {
      produced[*provide] = true;
    }
  }

  // Outputs passed through directly from the inputs.
  for (const auto &output : cb->providedOutputs) {
    auto id = network.findData(output);
    if (id.has_value() && produced[**id]) {
      continue;
    }
    if (!isInput.contains(output)) {
      throw InternalConsistencyError(
          "output is neither an input nor produced by a step", {output});
    }
    if (isRequired.insert(output).second) {
      cb->requiredInputs.push_back(output);
    }
  }

  for (auto &deps : cb->dependencies) {
    std::sort(deps.begin(), deps.end());
  }
  cb->steps = std::move(steps);
  return Plan{std::move(cb)};
}

} // namespace details::compiler

} // namespace opgraph
