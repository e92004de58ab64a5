// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "put_settings.hpp"

#include <mutex>

namespace rput {
namespace uploader {

namespace {
std::mutex g_settings_mutex;
Settings g_settings;
}  // namespace

Settings normalizeSettings(const Settings& v) {
  Settings result = v;
  if (result.workers == 0) {
    result.workers = DEFAULT_WORKERS;
  }
  if (result.task_queue_size == 0) {
    result.task_queue_size = result.workers * 4;
  }
  if (result.chunk_size == 0) {
    result.chunk_size = DEFAULT_CHUNK_SIZE;
  }
  if (result.try_times == 0) {
    result.try_times = DEFAULT_TRY_TIMES;
  }
  return result;
}

void setSettings(const Settings& v) {
  Settings normalized = normalizeSettings(v);
  std::lock_guard<std::mutex> lock(g_settings_mutex);
  g_settings = normalized;
}

Settings settings() {
  std::lock_guard<std::mutex> lock(g_settings_mutex);
  return g_settings;
}

}  // namespace uploader
}  // namespace rput
