#include "opgraph/runtime/Options.hpp"
#include "opgraph/diag/unreachable.hpp"
#include <stdexcept>

namespace opgraph {

ExecutionMethod parse_execution_method(memory::string_view method) {
  if (method == "sequential") {
    return ExecutionMethod::Sequential;
  }
  if (method == "parallel") {
    return ExecutionMethod::Parallel;
  }
  throw std::invalid_argument(
      fmt::format("invalid execution method '{}', must be one of "
                  "[sequential, parallel]",
                  method));
}

memory::string_view to_string(ExecutionMethod method) {
  switch (method) {
  case ExecutionMethod::Sequential:
    return "sequential";
  case ExecutionMethod::Parallel:
    return "parallel";
  }
  diag::unreachable("invalid ExecutionMethod");
}

} // namespace opgraph
