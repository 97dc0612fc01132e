#pragma once

#include "opgraph/diag/errors.hpp"
#include "opgraph/memory/container/string.hpp"
#include "opgraph/memory/container/vector.hpp"
#include "opgraph/operation/Value.hpp"
#include <exception>

namespace opgraph {

// Wraps whatever an operation body threw, or a broken output contract.
//
// The values the operation received and whatever it returned before the
// failure was detected are salvaged, failures deep inside a network can be
// inspected from the caught error alone.
class OperationExecutionError : public Error {
public:
  OperationExecutionError(memory::string operation, std::exception_ptr cause,
                          memory::vector<memory::string> needs,
                          memory::vector<memory::string> provides,
                          ValueMap inputs, ValueMap outputs = {});

  const memory::string &operation() const { return m_operation; }
  std::exception_ptr cause() const { return m_cause; }
  const memory::vector<memory::string> &needs() const { return m_needs; }
  const memory::vector<memory::string> &provides() const { return m_provides; }

  // Values passed to the operation, keyed like needs().
  const ValueMap &inputs() const { return m_inputs; }

  // Values the operation returned, empty if it threw.
  const ValueMap &outputs() const { return m_outputs; }

  [[noreturn]] void rethrowCause() const { std::rethrow_exception(m_cause); }

private:
  memory::string m_operation;
  std::exception_ptr m_cause;
  memory::vector<memory::string> m_needs;
  memory::vector<memory::string> m_provides;
  ValueMap m_inputs;
  ValueMap m_outputs;
};

} // namespace opgraph
