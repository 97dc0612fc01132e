#pragma once

#include "opgraph/memory/container/shared_ptr.hpp"
#include "opgraph/memory/container/span.hpp"
#include "opgraph/memory/container/string.hpp"
#include "opgraph/memory/container/vector.hpp"
#include "opgraph/operation/Value.hpp"
#include <fmt/format.h>
#include <functional>

namespace opgraph {

// A named computation over named values.
//
// needs() and provides() are ordered and free of duplicates. An operation
// must return a value for each name in provides(), the executor verifies
// this after every invocation.
//
// Implementations must be safe to invoke concurrently, a network may be
// executed by many threads at once.
class Operation {
public:
  Operation(memory::string name, memory::vector<memory::string> needs,
            memory::vector<memory::string> provides);

  virtual ~Operation() = default;

  Operation(const Operation &) = delete;
  Operation &operator=(const Operation &) = delete;

  const memory::string &name() const { return m_name; }
  const memory::vector<memory::string> &needs() const { return m_needs; }
  const memory::vector<memory::string> &provides() const { return m_provides; }

  // inputs contains exactly the names of needs().
  virtual ValueMap invoke(const ValueMap &inputs) const = 0;

  memory::string to_string() const;

private:
  memory::string m_name;
  memory::vector<memory::string> m_needs;
  memory::vector<memory::string> m_provides;
};

using OperationHandle = memory::shared_ptr<const Operation>;

class FunctionOperation final : public Operation {
public:
  using Body = std::function<ValueMap(const ValueMap &)>;

  FunctionOperation(memory::string name, memory::vector<memory::string> needs,
                    memory::vector<memory::string> provides, Body body);

  ValueMap invoke(const ValueMap &inputs) const override;

private:
  Body m_body;
};

// Receives its inputs ordered like needs() and returns its outputs ordered
// like provides().
class PositionalOperation final : public Operation {
public:
  using Body = std::function<memory::vector<Value>(memory::span<const Value>)>;

  PositionalOperation(memory::string name,
                      memory::vector<memory::string> needs,
                      memory::vector<memory::string> provides, Body body);

  ValueMap invoke(const ValueMap &inputs) const override;

private:
  Body m_body;
};

OperationHandle make_operation(memory::string name,
                               memory::vector<memory::string> needs,
                               memory::vector<memory::string> provides,
                               FunctionOperation::Body body);

OperationHandle make_positional_operation(
    memory::string name, memory::vector<memory::string> needs,
    memory::vector<memory::string> provides, PositionalOperation::Body body);

} // namespace opgraph

template <>
struct fmt::formatter<opgraph::Operation> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const opgraph::Operation &op, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(op.to_string(), ctx);
  }
};
