// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_PUT_SETTINGS_HPP
#define RPUT_PUT_SETTINGS_HPP

namespace rput {
namespace uploader {

constexpr int DEFAULT_WORKERS = 4;
constexpr int DEFAULT_CHUNK_SIZE = 256 * 1024;  // 256KB
constexpr int DEFAULT_TRY_TIMES = 3;

/**
 * Process-wide upload defaults
 *
 * workers and task_queue_size only take effect when the shared worker pool
 * is first created; chunk_size and try_times are read on every put.
 */
struct Settings {
  int task_queue_size = DEFAULT_WORKERS * 4;  // 0 means workers * 4
  int workers = DEFAULT_WORKERS;
  int chunk_size = DEFAULT_CHUNK_SIZE;
  int try_times = DEFAULT_TRY_TIMES;
};

/**
 * Substitute zero-valued fields with the built-in defaults
 */
Settings normalizeSettings(const Settings& v);

/**
 * Replace the process-wide defaults. Thread-safe.
 */
void setSettings(const Settings& v);

/**
 * Copy of the current process-wide defaults. Thread-safe.
 */
Settings settings();

}  // namespace uploader
}  // namespace rput

#endif  // RPUT_PUT_SETTINGS_HPP
