#include "opgraph/diag/errors.hpp"
#include "opgraph/diag/unreachable.hpp"
#include <fmt/ranges.h>

namespace opgraph {

memory::string_view to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::DuplicateOperation:
    return "DuplicateOperationError";
  case ErrorKind::EmptyOutput:
    return "EmptyOutputError";
  case ErrorKind::CyclicGraph:
    return "CyclicGraphError";
  case ErrorKind::UnsatisfiableOutput:
    return "UnsatisfiableOutputError";
  case ErrorKind::MissingInput:
    return "MissingInputError";
  case ErrorKind::OperationExecution:
    return "OperationExecutionError";
  case ErrorKind::InternalConsistency:
    return "InternalConsistencyError";
  }
  diag::unreachable("invalid ErrorKind");
}

DuplicateOperationError::DuplicateOperationError(memory::string operation)
    : Error(ErrorKind::DuplicateOperation,
            fmt::format("operation name '{}' is declared more than once",
                        operation)),
      m_operation(std::move(operation)) {}

EmptyOutputError::EmptyOutputError(memory::string operation)
    : Error(ErrorKind::EmptyOutput,
            fmt::format("operation '{}' does not provide any output",
                        operation)),
      m_operation(std::move(operation)) {}

CyclicGraphError::CyclicGraphError(memory::vector<memory::string> operations,
                                   memory::vector<memory::string> path)
    : Error(ErrorKind::CyclicGraph,
            fmt::format("network contains a cycle: {}",
                        fmt::join(path, " -> "))),
      m_operations(std::move(operations)), m_path(std::move(path)) {}

UnsatisfiableOutputError::UnsatisfiableOutputError(
    memory::vector<memory::string> outputs)
    : Error(ErrorKind::UnsatisfiableOutput,
            fmt::format("unreachable outputs [{}] cannot be computed from "
                        "the given inputs",
                        fmt::join(outputs, ", "))),
      m_outputs(std::move(outputs)) {}

MissingInputError::MissingInputError(memory::vector<memory::string> inputs)
    : Error(ErrorKind::MissingInput,
            fmt::format("plan requires inputs [{}] which were not supplied",
                        fmt::join(inputs, ", "))),
      m_inputs(std::move(inputs)) {}

InternalConsistencyError::InternalConsistencyError(
    const memory::string &description, memory::vector<memory::string> names)
    : Error(ErrorKind::InternalConsistency,
            fmt::format("internal consistency violated: {} [{}]", description,
                        fmt::join(names, ", "))),
      m_names(std::move(names)) {}

} // namespace opgraph
