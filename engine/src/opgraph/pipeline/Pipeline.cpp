#include "opgraph/pipeline/Pipeline.hpp"
#include "opgraph/compiler/compile.hpp"
#include "opgraph/network/compose.hpp"
#include "opgraph/runtime/execute.hpp"
#include <algorithm>
#include <fmt/ranges.h>

namespace opgraph {

static memory::vector<memory::string> external_needs(const Network &network) {
  memory::vector<memory::string> needs;
  for (std::size_t n = 0; n < network.dataCount(); ++n) {
    const memory::NodeId data{n};
    if (network.producers(data).empty()) {
      needs.push_back(network.dataName(data));
    }
  }
  return needs;
}

static memory::vector<memory::string> produced_names(const Network &network) {
  memory::vector<memory::string> provides;
  for (std::size_t n = 0; n < network.dataCount(); ++n) {
    const memory::NodeId data{n};
    if (!network.producers(data).empty()) {
      provides.push_back(network.dataName(data));
    }
  }
  return provides;
}

static memory::vector<memory::string>
sorted_unique(memory::vector<memory::string> names) {
  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());
  return names;
}

// Both lists are treated as sets, plans differ only in the order of
// providedOutputs(). '\x1f' and '\x1e' separate names and the two lists.
static memory::string cache_key(const memory::vector<memory::string> &inputs,
                                const memory::vector<memory::string> &outputs) {
  return fmt::format("{}\x1e{}", fmt::join(sorted_unique(inputs), "\x1f"),
                     fmt::join(sorted_unique(outputs), "\x1f"));
}

Pipeline::Pipeline(memory::string name, Network network, Options options)
    : Operation(std::move(name), external_needs(network),
                produced_names(network)),
      m_network(std::move(network)), m_options(options),
      m_method(options.execution.method) {
  if (m_options.logLevel.has_value()) {
    diag::set_log_level(*m_options.logLevel);
  }
  OPGRAPH_DEBUG("pipeline '{}': needs [{}], provides [{}]", this->name(),
                fmt::join(needs(), ", "), fmt::join(provides(), ", "));
}

memory::shared_ptr<Pipeline>
Pipeline::compose(memory::string name,
                  const memory::vector<OperationHandle> &ops,
                  Options options) {
  return std::make_shared<Pipeline>(std::move(name), opgraph::compose(ops),
                                    options);
}

Plan Pipeline::compile(const memory::vector<memory::string> &inputs,
                       const memory::vector<memory::string> &outputs) const {
  const memory::string key = cache_key(inputs, outputs);
  {
    std::lock_guard lock{m_cacheMutex};
    auto it = m_planCache.find(key);
    if (it != m_planCache.end()) {
      OPGRAPH_TRACE("pipeline '{}': plan cache hit", name());
      return it->second;
    }
  }

  // Compiled outside of the lock, a concurrent miss for the same request
  // compiles an identical plan and the first insert wins.
  Plan plan = outputs.empty() ? opgraph::compile_all(m_network, inputs)
                              : opgraph::compile(m_network, inputs, outputs);

  std::lock_guard lock{m_cacheMutex};
  auto [it, inserted] = m_planCache.emplace(key, std::move(plan));
  if (inserted) {
    OPGRAPH_DEBUG("pipeline '{}': cached plan #{} with {} steps", name(),
                  m_planCache.size(), it->second.size());
  }
  return it->second;
}

ExecutionResult
Pipeline::compute(ValueMap values,
                  const memory::vector<memory::string> &outputs) const {
  memory::vector<memory::string> inputs;
  inputs.reserve(values.size());
  for (const auto &[key, _] : values) {
    inputs.push_back(key);
  }

  const Plan plan = compile(inputs, outputs);

  ExecutionOptions execution = m_options.execution;
  execution.method = executionMethod();
  ExecutionResult result = execute(plan, std::move(values), execution);

  if (!outputs.empty()) {
    ValueMap selected;
    selected.reserve(outputs.size());
    for (const auto &output : outputs) {
      auto it = result.solution.values.find(output);
      if (it != result.solution.values.end()) {
        selected.emplace(output, std::move(it->second));
      }
    }
    result.solution.values = std::move(selected);
  }
  return result;
}

ValueMap Pipeline::invoke(const ValueMap &inputs) const {
  ExecutionResult result = compute(inputs);
  ValueMap outputs;
  outputs.reserve(provides().size());
  for (const auto &name : provides()) {
    auto it = result.solution.values.find(name);
    if (it != result.solution.values.end()) {
      outputs.emplace(name, std::move(it->second));
    }
  }
  return outputs;
}

std::size_t Pipeline::cachedPlanCount() const {
  std::lock_guard lock{m_cacheMutex};
  return m_planCache.size();
}

} // namespace opgraph
