#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace opgraph::diag {

enum class LogLevel {
  Off,
  Error,
  Warn,
  Info,
  Debug,
  Trace,
};

inline spdlog::logger &opgraph_logger() {
  // thread-safe since C++11 for function-local statics
  static spdlog::logger &ref = []() -> spdlog::logger & {
    auto lg = spdlog::get("opgraph");
    if (!lg) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      lg = std::make_shared<spdlog::logger>("opgraph", sink);
      lg->set_level(spdlog::level::info);
      lg->set_pattern("[%^%-5l%$ %n] %v");
      lg->flush_on(spdlog::level::warn);
      spdlog::register_logger(lg);
    }
    return *lg;
  }();
  return ref;
}

// Applies to the shared "opgraph" logger, i.e. to every pipeline in the
// process.
void set_log_level(LogLevel level);

LogLevel log_level();

#define OPGRAPH_TRACE(...) ::opgraph::diag::opgraph_logger().trace(__VA_ARGS__)
#define OPGRAPH_DEBUG(...) ::opgraph::diag::opgraph_logger().debug(__VA_ARGS__)
#define OPGRAPH_INFO(...) ::opgraph::diag::opgraph_logger().info(__VA_ARGS__)
#define OPGRAPH_WARN(...) ::opgraph::diag::opgraph_logger().warn(__VA_ARGS__)
#define OPGRAPH_ERROR(...) ::opgraph::diag::opgraph_logger().error(__VA_ARGS__)

} // namespace opgraph::diag
