#include "opgraph/network/Network.hpp"
#include "opgraph/memory/container/string_view.hpp"
#include <fmt/ranges.h>

namespace opgraph {

Network::Network()
    : m_controlBlock(
          std::make_shared<details::network::NetworkControlBlock>()) {}

memory::optional<memory::NodeId>
Network::findData(const memory::string &name) const {
  auto it = m_controlBlock->dataByName.find(name);
  if (it == m_controlBlock->dataByName.end()) {
    return memory::nullopt;
  }
  return it->second;
}

memory::optional<memory::EdgeId>
Network::findOperation(const memory::string &name) const {
  auto it = m_controlBlock->operationByName.find(name);
  if (it == m_controlBlock->operationByName.end()) {
    return memory::nullopt;
  }
  return it->second;
}

memory::vector<memory::string> Network::dataNames() const {
  memory::vector<memory::string> names;
  names.reserve(dataCount());
  for (std::size_t n = 0; n < dataCount(); ++n) {
    names.push_back(dataName(memory::NodeId{n}));
  }
  return names;
}

memory::vector<OperationHandle> Network::operations() const {
  memory::vector<OperationHandle> ops;
  ops.reserve(operationCount());
  for (std::size_t e = 0; e < operationCount(); ++e) {
    ops.push_back(operationHandle(memory::EdgeId{e}));
  }
  return ops;
}

memory::string Network::to_string() const {
  memory::string str = fmt::format("Network({} operations, {} data nodes)\n",
                                   operationCount(), dataCount());
  for (std::size_t e = 0; e < operationCount(); ++e) {
    const memory::EdgeId op{e};
    memory::vector<memory::string_view> needNames;
    for (memory::NodeId n : needs(op)) {
      needNames.push_back(dataName(n));
    }
    memory::vector<memory::string_view> provideNames;
    for (memory::NodeId n : provides(op)) {
      provideNames.push_back(dataName(n));
    }
    str += fmt::format("  {} {}: [{}] -> [{}]\n", op, operation(op).name(),
                       fmt::join(needNames, ", "),
                       fmt::join(provideNames, ", "));
  }
  return str;
}

} // namespace opgraph
