// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "rput_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <vector>

#include "rput_log_macros.hpp"

namespace rput {
namespace logging {

namespace {

/**
 * Sinks this library attached to the Boost.Log core.
 * Host applications may run their own sinks on the same core; only the
 * ones recorded here are removed on shutdown.
 */
struct SinkRegistry {
  std::mutex mutex;
  std::vector<boost::shared_ptr<boost::log::sinks::sink>> attached;
  boost::shared_ptr<async_console_sink_t> console;
  bool initialized = false;

  void attach(const boost::shared_ptr<boost::log::sinks::sink>& sink) {
    boost::log::core::get()->add_sink(sink);
    attached.push_back(sink);
  }

  void detachAll() {
    if (console) {
      console->stop();
      console->flush();
    }
    for (const auto& sink : attached) {
      boost::log::core::get()->remove_sink(sink);
    }
    attached.clear();
    console.reset();
  }
};

SinkRegistry& registry() {
  static SinkRegistry instance;
  return instance;
}

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// Unset and empty variables both read as absent
const char* env_value(const char* name) {
  const char* value = std::getenv(name);
  return (value && value[0] != '\0') ? value : nullptr;
}

void override_level(const char* name, severity_level& level) {
  if (const char* value = env_value(name)) {
    if (auto parsed = parse_severity_level(value)) {
      level = *parsed;
    }
  }
}

void override_flag(const char* name, bool& flag) {
  const char* value = env_value(name);
  if (!value) {
    return;
  }
  const std::string v = lowercase(value);
  if (v == "true" || v == "1" || v == "yes" || v == "on") {
    flag = true;
  } else if (v == "false" || v == "0" || v == "no" || v == "off") {
    flag = false;
  }
}

}  // namespace

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  const std::string name = lowercase(level_str);
  if (name == "debug") {
    return severity_level::debug;
  }
  if (name == "info") {
    return severity_level::info;
  }
  if (name == "warn" || name == "warning") {
    return severity_level::warn;
  }
  if (name == "error") {
    return severity_level::error;
  }
  if (name == "fatal") {
    return severity_level::fatal;
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  // RPUT_LOG_CONSOLE_LEVEL is read last so it wins over RPUT_LOG_LEVEL
  override_level("RPUT_LOG_LEVEL", config.console_level);
  override_level("RPUT_LOG_CONSOLE_LEVEL", config.console_level);
  override_flag("RPUT_LOG_CONSOLE_ENABLED", config.console_enabled);
  override_flag("RPUT_LOG_COLORS", config.console_colors);
}

void init_logging(const LoggingConfig& config) {
  SinkRegistry& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.initialized) {
    return;
  }

  boost::log::add_common_attributes();

  if (config.console_enabled) {
    reg.console = create_console_sink(config.console_level, config.console_colors);
    reg.attach(reg.console);
  }
  reg.initialized = true;
}

void init_logging_default() {
  init_logging(LoggingConfig{});
}

void shutdown_logging() {
  SinkRegistry& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (!reg.initialized) {
    return;
  }
  reg.detachAll();
  reg.initialized = false;
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  SinkRegistry& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  reg.attach(sink);
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  SinkRegistry& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);

  boost::log::core::get()->remove_sink(sink);
  reg.attached.erase(
    std::remove(reg.attached.begin(), reg.attached.end(), sink), reg.attached.end()
  );
}

void flush_logging() {
  SinkRegistry& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.console) {
    reg.console->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig effective = config;
  apply_env_overrides(effective);

  shutdown_logging();
  init_logging(effective);
}

bool is_logging_initialized() {
  SinkRegistry& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  return reg.initialized;
}

}  // namespace logging
}  // namespace rput
