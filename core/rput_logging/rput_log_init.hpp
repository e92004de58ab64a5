// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_LOG_INIT_HPP
#define RPUT_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "rput_console_sink.hpp"
#include "rput_log_severity.hpp"

namespace rput {
namespace logging {

/**
 * Logging configuration for rput consumers.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;
};

/**
 * Parse a string to severity_level.
 * Accepts: "debug", "info", "warn", "warning", "error", "fatal" (case-insensitive)
 *
 * @return The parsed severity_level, or std::nullopt if invalid
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 * Supported environment variables:
 *   RPUT_LOG_LEVEL           - Global level (alias of the console level)
 *   RPUT_LOG_CONSOLE_LEVEL   - Console sink level, wins over RPUT_LOG_LEVEL
 *   RPUT_LOG_CONSOLE_ENABLED - Enable console logging ("true" or "false")
 *   RPUT_LOG_COLORS          - Enable ANSI colors ("true" or "false")
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Initialize logging. Calling it again without shutdown_logging() is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Initialize with console INFO level and colors.
 */
void init_logging_default();

/**
 * Stop the async sink thread, flush pending records and detach all sinks.
 */
void shutdown_logging();

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

/**
 * Shut down existing sinks and reinitialize with the new config.
 * Environment variable overrides are applied automatically.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace rput

#endif  // RPUT_LOG_INIT_HPP
