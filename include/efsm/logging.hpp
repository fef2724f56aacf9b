#pragma once

#include <initializer_list>
#include <memory>
#include <string>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace efsm::logging {

inline constexpr const char* default_logger_name = "efsm";

// Process-wide logger shared by machines that are not given one. Reuses a
// logger already registered under the same name.
inline std::shared_ptr<spdlog::logger> default_logger() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    if (auto existing = spdlog::get(default_logger_name)) return existing;
    return spdlog::stdout_color_mt(default_logger_name);
  }();
  return logger;
}

// Discards everything; used when a machine is constructed with a null
// logger.
inline std::shared_ptr<spdlog::logger> null_logger() {
  static const std::shared_ptr<spdlog::logger> logger =
      std::make_shared<spdlog::logger>(
          "efsm-null", std::make_shared<spdlog::sinks::null_sink_mt>());
  return logger;
}

// Unregistered logger writing to the given sinks, e.g. a per-machine log
// file or an ostream sink in tests.
inline std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name, std::initializer_list<spdlog::sink_ptr> sinks) {
  return std::make_shared<spdlog::logger>(name, sinks);
}

inline void set_level(spdlog::level::level_enum level) {
  default_logger()->set_level(level);
}

// Applies the SPDLOG_LEVEL environment variable, e.g.
// SPDLOG_LEVEL=efsm=trace.
inline void configure_from_env() {
  default_logger();
  spdlog::cfg::load_env_levels();
}

}  // namespace efsm::logging
