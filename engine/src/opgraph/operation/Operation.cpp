#include "opgraph/operation/Operation.hpp"
#include "opgraph/memory/container/string_view.hpp"
#include <fmt/ranges.h>
#include <stdexcept>
#include <unordered_set>

namespace opgraph {

static void check_unique(const memory::string &operation,
                         const memory::vector<memory::string> &names,
                         const char *what) {
  std::unordered_set<memory::string_view> seen;
  for (const auto &name : names) {
    if (!seen.insert(name).second) {
      throw std::invalid_argument(
          fmt::format("operation '{}' lists '{}' more than once in its {}",
                      operation, name, what));
    }
  }
}

Operation::Operation(memory::string name, memory::vector<memory::string> needs,
                     memory::vector<memory::string> provides)
    : m_name(std::move(name)), m_needs(std::move(needs)),
      m_provides(std::move(provides)) {
  if (m_name.empty()) {
    throw std::invalid_argument("operation name must not be empty");
  }
  check_unique(m_name, m_needs, "needs");
  check_unique(m_name, m_provides, "provides");
}

memory::string Operation::to_string() const {
  return fmt::format("Operation(name='{}', needs=[{}], provides=[{}])", m_name,
                     fmt::join(m_needs, ", "), fmt::join(m_provides, ", "));
}

FunctionOperation::FunctionOperation(memory::string name,
                                     memory::vector<memory::string> needs,
                                     memory::vector<memory::string> provides,
                                     Body body)
    : Operation(std::move(name), std::move(needs), std::move(provides)),
      m_body(std::move(body)) {
  if (!m_body) {
    throw std::invalid_argument(
        fmt::format("operation '{}' has no compute body", this->name()));
  }
}

ValueMap FunctionOperation::invoke(const ValueMap &inputs) const {
  return m_body(inputs);
}

PositionalOperation::PositionalOperation(
    memory::string name, memory::vector<memory::string> needs,
    memory::vector<memory::string> provides, Body body)
    : Operation(std::move(name), std::move(needs), std::move(provides)),
      m_body(std::move(body)) {
  if (!m_body) {
    throw std::invalid_argument(
        fmt::format("operation '{}' has no compute body", this->name()));
  }
}

ValueMap PositionalOperation::invoke(const ValueMap &inputs) const {
  memory::vector<Value> args;
  args.reserve(needs().size());
  for (const auto &need : needs()) {
    args.push_back(inputs.at(need));
  }

  memory::vector<Value> results =
      m_body(memory::span<const Value>(args.data(), args.size()));
  if (results.size() != provides().size()) {
    throw std::length_error(
        fmt::format("returned {} values for {} declared outputs",
                    results.size(), provides().size()));
  }

  ValueMap outputs;
  outputs.reserve(results.size());
  for (std::size_t i = 0; i < results.size(); ++i) {
    outputs.emplace(provides()[i], std::move(results[i]));
  }
  return outputs;
}

OperationHandle make_operation(memory::string name,
                               memory::vector<memory::string> needs,
                               memory::vector<memory::string> provides,
                               FunctionOperation::Body body) {
  return std::make_shared<FunctionOperation>(
      std::move(name), std::move(needs), std::move(provides), std::move(body));
}

OperationHandle make_positional_operation(
    memory::string name, memory::vector<memory::string> needs,
    memory::vector<memory::string> provides, PositionalOperation::Body body) {
  return std::make_shared<PositionalOperation>(
      std::move(name), std::move(needs), std::move(provides), std::move(body));
}

} // namespace opgraph
