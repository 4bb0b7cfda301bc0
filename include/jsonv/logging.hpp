#pragma once

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#define JSONV_TRACE(...) ::jsonv::logging::logger().trace(__VA_ARGS__)
#define JSONV_DEBUG(...) ::jsonv::logging::logger().debug(__VA_ARGS__)
#define JSONV_INFO(...)  ::jsonv::logging::logger().info(__VA_ARGS__)
#define JSONV_WARN(...)  ::jsonv::logging::logger().warn(__VA_ARGS__)
#define JSONV_ERR(...)   ::jsonv::logging::logger().error(__VA_ARGS__)

namespace jsonv {
namespace logging {

constexpr const char* kLoggerName = "jsonv";

// The library logger. Reuses a logger registered under the same name so an
// application can install its own sinks before the first decode.
inline spdlog::logger& logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get(kLoggerName)) return existing;
    auto sink = spdlog::stderr_color_mt(kLoggerName);
    sink->set_level(spdlog::level::warn);
    sink->flush_on(spdlog::level::warn);
    return sink;
  }();
  return *instance;
}

inline void set_level(spdlog::level::level_enum lvl) { logger().set_level(lvl); }

inline void disable() { logger().set_level(spdlog::level::off); }

inline void enable() { logger().set_level(spdlog::level::warn); }

} // namespace logging
} // namespace jsonv
