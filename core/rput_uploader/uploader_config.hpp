// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_UPLOADER_CONFIG_HPP
#define RPUT_UPLOADER_CONFIG_HPP

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

#include <rput_log_init.hpp>

#include "put_settings.hpp"

namespace rput {
namespace uploader {

/**
 * HTTP block transport configuration
 */
struct TransportConfig {
  std::vector<std::string> up_hosts;  // e.g. "https://upload.example.com"; first one is used
  bool verify_ssl = true;

  // Timeouts (in milliseconds)
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;
};

/**
 * Everything a process configures before its first upload
 *
 * Example:
 *   settings:
 *     workers: 8
 *     task_queue_size: 32
 *     chunk_size: 524288
 *     try_times: 5
 *   transport:
 *     up_hosts: ["https://upload.example.com"]
 *     verify_ssl: true
 *     connect_timeout_ms: 10000
 *     request_timeout_ms: 300000
 *   logging:
 *     console_enabled: true
 *     console_colors: false
 *     console_level: debug
 */
struct UploaderConfig {
  Settings settings;
  TransportConfig transport;
  logging::LoggingConfig logging;
};

/**
 * Load configuration from a YAML file. Missing keys keep their defaults.
 *
 * @return false on I/O or YAML errors, or on negative settings
 */
bool loadUploaderConfigFromFile(const std::string& path, UploaderConfig& config);

/**
 * Load configuration from a YAML string
 */
bool loadUploaderConfigFromString(const std::string& yaml_content, UploaderConfig& config);

/**
 * Install config.settings as the process defaults and reconfigure logging
 */
void applyUploaderConfig(const UploaderConfig& config);

}  // namespace uploader
}  // namespace rput

#endif  // RPUT_UPLOADER_CONFIG_HPP
