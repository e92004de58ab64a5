// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_LOG_MACROS_HPP
#define RPUT_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <sstream>
#include <string>

#include "rput_log_severity.hpp"

namespace rput {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in rput_log_init.cpp
 */
logger_type& get_logger();

/**
 * Key-value formatter for structured records.
 * Usage: RPUT_LOG_INFO("block done" << kv("block", idx));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace rput

// Define RPUT_LOG_COMPONENT before including this header to tag records:
//   #define RPUT_LOG_COMPONENT "worker_pool"
//   #include <rput_log_macros.hpp>
#ifndef RPUT_LOG_COMPONENT
#define RPUT_LOG_COMPONENT "rput"
#endif

// DEBUG records are compiled out in release builds
#ifdef NDEBUG
#define RPUT_LOG_ENABLE_DEBUG 0
#else
#define RPUT_LOG_ENABLE_DEBUG 1
#endif

#define RPUT_LOG_DEBUG(msg)                                                                  \
  do {                                                                                       \
    if (RPUT_LOG_ENABLE_DEBUG) {                                                             \
      BOOST_LOG_SEV(::rput::logging::get_logger(), ::rput::logging::severity_level::debug)   \
        << "[" << RPUT_LOG_COMPONENT << "] " << msg;                                         \
    }                                                                                        \
  } while (0)

#define RPUT_LOG_INFO(msg)                                                                 \
  do {                                                                                     \
    BOOST_LOG_SEV(::rput::logging::get_logger(), ::rput::logging::severity_level::info)    \
      << "[" << RPUT_LOG_COMPONENT << "] " << msg;                                         \
  } while (0)

#define RPUT_LOG_WARN(msg)                                                                 \
  do {                                                                                     \
    BOOST_LOG_SEV(::rput::logging::get_logger(), ::rput::logging::severity_level::warn)    \
      << "[" << RPUT_LOG_COMPONENT << "] " << msg;                                         \
  } while (0)

#define RPUT_LOG_ERROR(msg)                                                                \
  do {                                                                                     \
    BOOST_LOG_SEV(::rput::logging::get_logger(), ::rput::logging::severity_level::error)   \
      << "[" << RPUT_LOG_COMPONENT << "] " << msg;                                         \
  } while (0)

#define RPUT_LOG_FATAL(msg)                                                                \
  do {                                                                                     \
    BOOST_LOG_SEV(::rput::logging::get_logger(), ::rput::logging::severity_level::fatal)   \
      << "[" << RPUT_LOG_COMPONENT << "] " << msg;                                         \
  } while (0)

// Attach the upload key to every record emitted from the current scope.
// Usage: RPUT_LOG_SCOPED_KEY(key);
#define RPUT_LOG_SCOPED_KEY(key_val) \
  BOOST_LOG_SCOPED_THREAD_ATTR("UploadKey", boost::log::attributes::constant<std::string>(key_val))

#endif  // RPUT_LOG_MACROS_HPP
