#pragma once

#include "opgraph/memory/container/string.hpp"
#include "opgraph/memory/container/string_view.hpp"
#include "opgraph/memory/container/vector.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace opgraph {

enum class ErrorKind {
  DuplicateOperation,
  EmptyOutput,
  CyclicGraph,
  UnsatisfiableOutput,
  MissingInput,
  OperationExecution,
  InternalConsistency,
};

memory::string_view to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const memory::string &what)
      : std::runtime_error(what), m_kind(kind) {}

  ErrorKind kind() const { return m_kind; }

private:
  ErrorKind m_kind;
};

class DuplicateOperationError : public Error {
public:
  explicit DuplicateOperationError(memory::string operation);

  const memory::string &operation() const { return m_operation; }

private:
  memory::string m_operation;
};

class EmptyOutputError : public Error {
public:
  explicit EmptyOutputError(memory::string operation);

  const memory::string &operation() const { return m_operation; }

private:
  memory::string m_operation;
};

class CyclicGraphError : public Error {
public:
  // path alternates operation and data names and closes on its first
  // operation: [A, y, B, x, A].
  CyclicGraphError(memory::vector<memory::string> operations,
                   memory::vector<memory::string> path);

  const memory::vector<memory::string> &operations() const {
    return m_operations;
  }
  const memory::vector<memory::string> &path() const { return m_path; }

private:
  memory::vector<memory::string> m_operations;
  memory::vector<memory::string> m_path;
};

class UnsatisfiableOutputError : public Error {
public:
  explicit UnsatisfiableOutputError(memory::vector<memory::string> outputs);

  const memory::vector<memory::string> &outputs() const { return m_outputs; }

private:
  memory::vector<memory::string> m_outputs;
};

class MissingInputError : public Error {
public:
  explicit MissingInputError(memory::vector<memory::string> inputs);

  const memory::vector<memory::string> &inputs() const { return m_inputs; }

private:
  memory::vector<memory::string> m_inputs;
};

// Engine bug, never a user error.
class InternalConsistencyError : public Error {
public:
  InternalConsistencyError(const memory::string &description,
                           memory::vector<memory::string> names);

  const memory::vector<memory::string> &names() const { return m_names; }

private:
  memory::vector<memory::string> m_names;
};

} // namespace opgraph

template <>
struct fmt::formatter<opgraph::ErrorKind> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(opgraph::ErrorKind kind, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(opgraph::to_string(kind),
                                                    ctx);
  }
};
