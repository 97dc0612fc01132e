#pragma once

#include "opgraph/compiler/Plan.hpp"
#include "opgraph/operation/Value.hpp"
#include "opgraph/runtime/Solution.hpp"

namespace opgraph::details::runtime {

// Invokes independent steps on up to workerCount threads. Outputs are
// committed to the store in plan order by the calling thread, so values
// and overwrites are identical to a sequential run.
//
// A step is started once all of its dependencies are committed. After the
// first failure no further steps are started, running steps are awaited
// and the failure of the earliest failed step (in plan order) is rethrown.
ExecutionResult execute_parallel(const Plan &plan, ValueMap values,
                                 unsigned int workerCount);

} // namespace opgraph::details::runtime
