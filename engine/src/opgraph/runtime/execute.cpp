#include "opgraph/runtime/execute.hpp"
#include "opgraph/diag/errors.hpp"
#include "opgraph/diag/logging.hpp"
#include "opgraph/diag/operation_execution_error.hpp"
#include "opgraph/runtime/parallel_execute.hpp"
#include <fmt/ranges.h>
#include <stdexcept>

namespace opgraph {

namespace details::runtime {

ValueMap gather_inputs(const Plan &plan, std::size_t step,
                       const ValueMap &store) {
  const Operation &op = plan.step(step);
  ValueMap inputs;
  inputs.reserve(op.needs().size());
  for (const auto &need : op.needs()) {
    auto it = store.find(need);
    if (it == store.end()) {
      throw InternalConsistencyError(
          "value needed by a step is missing from the store",
          {op.name(), need});
    }
    inputs.emplace(need, it->second);
  }
  return inputs;
}

ValueMap invoke_step(const Plan &plan, std::size_t step,
                     const ValueMap &inputs) {
  const Operation &op = plan.step(step);
  OPGRAPH_TRACE("step {}/{}: {}", step + 1, plan.size(), op.name());

  ValueMap outputs;
  try {
    outputs = op.invoke(inputs);
  } catch (...) {
    throw OperationExecutionError(op.name(), std::current_exception(),
                                  op.needs(), op.provides(), inputs);
  }

  memory::vector<memory::string> missing;
  for (const auto &provide : op.provides()) {
    if (!outputs.contains(provide)) {
      missing.push_back(provide);
    }
  }
  if (!missing.empty()) {
    throw OperationExecutionError(
        op.name(),
        std::make_exception_ptr(std::runtime_error(
            fmt::format("declared outputs [{}] were not returned",
                        fmt::join(missing, ", ")))),
        op.needs(), op.provides(), inputs, std::move(outputs));
  }
  if (outputs.size() != op.provides().size()) {
    OPGRAPH_WARN("operation '{}' returned {} undeclared outputs, they are "
                 "discarded",
                 op.name(), outputs.size() - op.provides().size());
  }
  return outputs;
}

void merge_outputs(const Plan &plan, std::size_t step, ValueMap outputs,
                   ValueMap &store, Overwrites &overwrites) {
  const Operation &op = plan.step(step);
  for (const auto &provide : op.provides()) {
    Value &value = outputs.at(provide);
    auto it = store.find(provide);
    if (it == store.end()) {
      store.emplace(provide, std::move(value));
    } else {
      OPGRAPH_TRACE("'{}' overwrites '{}'", op.name(), provide);
      overwrites[provide].push_back(std::move(it->second));
      it->second = std::move(value);
    }
  }
}

} // namespace details::runtime

static void check_inputs(const Plan &plan, const ValueMap &values) {
  memory::vector<memory::string> missing;
  for (const auto &input : plan.requiredInputs()) {
    if (!values.contains(input)) {
      missing.push_back(input);
    }
  }
  if (!missing.empty()) {
    throw MissingInputError(std::move(missing));
  }
}

ExecutionResult execute(const Plan &plan, ValueMap values,
                        const ExecutionOptions &options) {
  check_inputs(plan, values);

  if (options.method == ExecutionMethod::Parallel && plan.size() > 1) {
    return details::runtime::execute_parallel(plan, std::move(values),
                                              options.workerCount);
  }

  OPGRAPH_DEBUG("executing {} steps sequentially", plan.size());
  ExecutionResult result;
  result.solution.values = std::move(values);
  for (std::size_t i = 0; i < plan.size(); ++i) {
    ValueMap inputs =
        details::runtime::gather_inputs(plan, i, result.solution.values);
    ValueMap outputs = details::runtime::invoke_step(plan, i, inputs);
    details::runtime::merge_outputs(plan, i, std::move(outputs),
                                    result.solution.values, result.overwrites);
  }
  return result;
}

} // namespace opgraph
