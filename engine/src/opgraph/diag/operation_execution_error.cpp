#include "opgraph/diag/operation_execution_error.hpp"
#include <fmt/ranges.h>

namespace opgraph {

static memory::string describe(std::exception_ptr cause) {
  if (!cause) {
    return "unknown failure";
  }
  try {
    std::rethrow_exception(cause);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

OperationExecutionError::OperationExecutionError(
    memory::string operation, std::exception_ptr cause,
    memory::vector<memory::string> needs,
    memory::vector<memory::string> provides, ValueMap inputs,
    ValueMap outputs)
    : Error(ErrorKind::OperationExecution,
            fmt::format("operation '{}' failed: {}\n"
                        "  needs:    [{}]\n"
                        "  provides: [{}]",
                        operation, describe(cause), fmt::join(needs, ", "),
                        fmt::join(provides, ", "))),
      m_operation(std::move(operation)), m_cause(std::move(cause)),
      m_needs(std::move(needs)), m_provides(std::move(provides)),
      m_inputs(std::move(inputs)), m_outputs(std::move(outputs)) {}

} // namespace opgraph
