#pragma once

#include "opgraph/compiler/Plan.hpp"
#include "opgraph/memory/container/hashmap.hpp"
#include "opgraph/memory/container/optional.hpp"
#include "opgraph/memory/container/shared_ptr.hpp"
#include "opgraph/memory/container/string.hpp"
#include "opgraph/memory/container/vector.hpp"
#include "opgraph/network/Network.hpp"
#include "opgraph/operation/Operation.hpp"
#include "opgraph/runtime/Options.hpp"
#include "opgraph/runtime/Solution.hpp"
#include <atomic>
#include <mutex>

namespace opgraph {

// A composed network together with its execution options and a cache of
// compiled plans.
//
// A Pipeline is itself an Operation: it needs every name that none of its
// operations provides and provides every name its operations provide.
// It can therefore be composed into a larger network.
class Pipeline final : public Operation {
public:
  Pipeline(memory::string name, Network network, Options options = {});

  // compose() followed by the Pipeline constructor.
  static memory::shared_ptr<Pipeline>
  compose(memory::string name, const memory::vector<OperationHandle> &ops,
          Options options = {});

  const Network &network() const { return m_network; }

  ExecutionMethod executionMethod() const { return m_method.load(); }
  void setExecutionMethod(ExecutionMethod method) { m_method.store(method); }

  const Options &options() const { return m_options; }

  // Cached compile() of the request, inputs and outputs are each treated
  // as a set. An empty outputs list selects compile_all().
  Plan compile(const memory::vector<memory::string> &inputs,
               const memory::vector<memory::string> &outputs = {}) const;

  // Compiles for the names in values and executes. When outputs are
  // requested the solution only contains those, otherwise everything.
  ExecutionResult
  compute(ValueMap values,
          const memory::vector<memory::string> &outputs = {}) const;

  ValueMap invoke(const ValueMap &inputs) const override;

  std::size_t cachedPlanCount() const;

private:
  Network m_network;
  Options m_options;
  std::atomic<ExecutionMethod> m_method;

  mutable std::mutex m_cacheMutex;
  mutable memory::hash_map<memory::string, Plan> m_planCache;
};

} // namespace opgraph
