// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "uploader_config.hpp"

#include <utility>

#define RPUT_LOG_COMPONENT "uploader_config"
#include <rput_log_macros.hpp>

namespace rput {
namespace uploader {

using logging::kv;

namespace {

bool parseSettings(const YAML::Node& node, Settings& settings) {
  if (node["workers"]) {
    settings.workers = node["workers"].as<int>();
  }
  if (node["task_queue_size"]) {
    settings.task_queue_size = node["task_queue_size"].as<int>();
  }
  if (node["chunk_size"]) {
    settings.chunk_size = node["chunk_size"].as<int>();
  }
  if (node["try_times"]) {
    settings.try_times = node["try_times"].as<int>();
  }

  if (settings.workers < 0 || settings.task_queue_size < 0 || settings.chunk_size < 0 ||
      settings.try_times < 0) {
    RPUT_LOG_ERROR("Settings must not be negative");
    return false;
  }
  return true;
}

bool parseTransport(const YAML::Node& node, TransportConfig& transport) {
  if (node["up_hosts"]) {
    if (!node["up_hosts"].IsSequence()) {
      RPUT_LOG_ERROR("transport.up_hosts must be a sequence");
      return false;
    }
    transport.up_hosts.clear();
    for (const auto& host : node["up_hosts"]) {
      transport.up_hosts.push_back(host.as<std::string>());
    }
  }
  if (node["verify_ssl"]) {
    transport.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["connect_timeout_ms"]) {
    transport.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    transport.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  return true;
}

bool parseLogging(const YAML::Node& node, logging::LoggingConfig& log_config) {
  if (node["console_enabled"]) {
    log_config.console_enabled = node["console_enabled"].as<bool>();
  }
  if (node["console_colors"]) {
    log_config.console_colors = node["console_colors"].as<bool>();
  }
  if (node["console_level"]) {
    std::string level_str = node["console_level"].as<std::string>();
    auto level = logging::parse_severity_level(level_str);
    if (!level) {
      RPUT_LOG_ERROR("Unknown log level" << kv("console_level", level_str));
      return false;
    }
    log_config.console_level = *level;
  }
  return true;
}

}  // namespace

bool loadUploaderConfigFromFile(const std::string& path, UploaderConfig& config) {
  try {
    YAML::Node node = YAML::LoadFile(path);
    return loadUploaderConfigFromString(YAML::Dump(node), config);
  } catch (const YAML::Exception& e) {
    RPUT_LOG_ERROR("Failed to load config" << kv("path", path) << kv("error", e.what()));
    return false;
  }
}

bool loadUploaderConfigFromString(const std::string& yaml_content, UploaderConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    // config is left untouched unless every section parses
    UploaderConfig parsed = config;
    if (node["settings"] && !parseSettings(node["settings"], parsed.settings)) {
      return false;
    }
    if (node["transport"] && !parseTransport(node["transport"], parsed.transport)) {
      return false;
    }
    if (node["logging"] && !parseLogging(node["logging"], parsed.logging)) {
      return false;
    }
    config = std::move(parsed);
    return true;
  } catch (const YAML::Exception& e) {
    RPUT_LOG_ERROR("YAML parsing error" << kv("error", e.what()));
    return false;
  }
}

void applyUploaderConfig(const UploaderConfig& config) {
  setSettings(config.settings);
  logging::reconfigure_logging(config.logging);
}

}  // namespace uploader
}  // namespace rput
