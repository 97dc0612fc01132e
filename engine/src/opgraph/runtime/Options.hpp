#pragma once

#include "opgraph/diag/logging.hpp"
#include "opgraph/memory/container/optional.hpp"
#include "opgraph/memory/container/string_view.hpp"
#include <fmt/format.h>

namespace opgraph {

enum class ExecutionMethod {
  Sequential,
  // Independent steps run on a per-call pool of worker threads.
  Parallel,
};

ExecutionMethod parse_execution_method(memory::string_view method);

memory::string_view to_string(ExecutionMethod method);

struct ExecutionOptions {
  ExecutionMethod method = ExecutionMethod::Sequential;
  // 0 selects std::thread::hardware_concurrency().
  unsigned int workerCount = 0;
};

struct Options {
  ExecutionOptions execution;
  // Applied to the shared "opgraph" logger when a Pipeline is built with
  // it. Unset leaves the current level alone.
  memory::optional<diag::LogLevel> logLevel;
};

} // namespace opgraph

template <>
struct fmt::formatter<opgraph::ExecutionMethod>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(opgraph::ExecutionMethod method, FormatContext &ctx) const {
    return fmt::formatter<std::string_view>::format(opgraph::to_string(method),
                                                    ctx);
  }
};
