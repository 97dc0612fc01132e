#pragma once

#include "opgraph/compiler/Plan.hpp"
#include "opgraph/operation/Value.hpp"
#include "opgraph/runtime/Options.hpp"
#include "opgraph/runtime/Solution.hpp"

namespace opgraph {

// Runs the plan against values. The store starts as a copy of values and
// every step writes its outputs into it; replaced values are recorded in
// the overwrites, oldest first.
//
// Throws:
// - MissingInputError if values does not cover plan.requiredInputs().
// - OperationExecutionError if a step fails or breaks its output contract.
//   Nothing is returned for a failed call, the error carries the step's
//   input values.
ExecutionResult execute(const Plan &plan, ValueMap values,
                        const ExecutionOptions &options = {});

namespace details::runtime {

ValueMap gather_inputs(const Plan &plan, std::size_t step,
                       const ValueMap &store);

ValueMap invoke_step(const Plan &plan, std::size_t step,
                     const ValueMap &inputs);

void merge_outputs(const Plan &plan, std::size_t step, ValueMap outputs,
                   ValueMap &store, Overwrites &overwrites);

} // namespace details::runtime

} // namespace opgraph
