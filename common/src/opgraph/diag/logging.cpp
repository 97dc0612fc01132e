#include "opgraph/diag/logging.hpp"
#include "opgraph/diag/unreachable.hpp"

namespace opgraph::diag {

void set_log_level(LogLevel level) {
  spdlog::level::level_enum lvl;
  switch (level) {
  case LogLevel::Off:
    lvl = spdlog::level::off;
    break;
  case LogLevel::Error:
    lvl = spdlog::level::err;
    break;
  case LogLevel::Warn:
    lvl = spdlog::level::warn;
    break;
  case LogLevel::Info:
    lvl = spdlog::level::info;
    break;
  case LogLevel::Debug:
    lvl = spdlog::level::debug;
    break;
  case LogLevel::Trace:
    lvl = spdlog::level::trace;
    break;
  default:
    diag::unreachable("invalid LogLevel");
  }
  opgraph_logger().set_level(lvl);
}

LogLevel log_level() {
  switch (opgraph_logger().level()) {
  case spdlog::level::trace:
    return LogLevel::Trace;
  case spdlog::level::debug:
    return LogLevel::Debug;
  case spdlog::level::info:
    return LogLevel::Info;
  case spdlog::level::warn:
    return LogLevel::Warn;
  case spdlog::level::err:
  case spdlog::level::critical:
    return LogLevel::Error;
  case spdlog::level::off:
  default:
    return LogLevel::Off;
  }
}

} // namespace opgraph::diag
