#pragma once

#include "opgraph/memory/container/dynamic_bitset.hpp"
#include "opgraph/memory/container/shared_ptr.hpp"
#include "opgraph/memory/container/span.hpp"
#include "opgraph/memory/container/string.hpp"
#include "opgraph/memory/container/vector.hpp"
#include "opgraph/memory/hypergraph/Id.hpp"
#include "opgraph/network/Network.hpp"
#include <fmt/format.h>

namespace opgraph {

class Plan;

namespace details::compiler {

struct PlanControlBlock {
  Network network;
  memory::vector<memory::EdgeId> steps;
  memory::dynamic_bitset active;
  memory::vector<memory::string> requestedInputs;
  memory::vector<memory::string> requiredInputs;
  memory::vector<memory::string> providedOutputs;
  // Per step, indices of the earlier steps producing one of its needs.
  memory::vector<memory::vector<std::size_t>> dependencies;
  // Inverse of dependencies.
  memory::vector<memory::vector<std::size_t>> dependents;
};

Plan make_plan(const Network &network, memory::vector<memory::EdgeId> steps,
               memory::vector<memory::string> requestedInputs,
               memory::vector<memory::string> providedOutputs);

} // namespace details::compiler

// Ordered operations for one (inputs, outputs) request.
//
// Invariant: every need of a step is either a required input or provided
// by a strictly earlier step.
//
// A Plan holds no execution state. Copies share the same immutable state
// and may be executed concurrently.
class Plan {
public:
  const Network &network() const { return m_controlBlock->network; }

  memory::span<const memory::EdgeId> steps() const {
    return m_controlBlock->steps;
  }

  std::size_t size() const { return m_controlBlock->steps.size(); }
  bool empty() const { return m_controlBlock->steps.empty(); }

  const Operation &step(std::size_t index) const {
    return network().operation(m_controlBlock->steps[index]);
  }

  bool contains(memory::EdgeId op) const { return m_controlBlock->active[*op]; }

  memory::vector<memory::string> stepNames() const;

  // Input names as given to compile().
  const memory::vector<memory::string> &requestedInputs() const {
    return m_controlBlock->requestedInputs;
  }

  // Inputs the plan reads before any step produces them.
  const memory::vector<memory::string> &requiredInputs() const {
    return m_controlBlock->requiredInputs;
  }

  const memory::vector<memory::string> &providedOutputs() const {
    return m_controlBlock->providedOutputs;
  }

  memory::span<const std::size_t> dependencies(std::size_t index) const {
    return m_controlBlock->dependencies[index];
  }

  memory::span<const std::size_t> dependents(std::size_t index) const {
    return m_controlBlock->dependents[index];
  }

  memory::string to_string() const;

private:
  friend Plan details::compiler::make_plan(
      const Network &network, memory::vector<memory::EdgeId> steps,
      memory::vector<memory::string> requestedInputs,
      memory::vector<memory::string> providedOutputs);

  explicit Plan(
      memory::shared_ptr<const details::compiler::PlanControlBlock>
          controlBlock)
      : m_controlBlock(std::move(controlBlock)) {}

  memory::shared_ptr<const details::compiler::PlanControlBlock>
      m_controlBlock;
};

} // namespace opgraph

template <>
struct fmt::formatter<opgraph::Plan> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const opgraph::Plan &plan, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(plan.to_string(), ctx);
  }
};
