// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_RESUMABLE_UPLOADER_HPP
#define RPUT_RESUMABLE_UPLOADER_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "put_types.hpp"
#include "retry_handler.hpp"
#include "uploader_interfaces.hpp"
#include "worker_pool.hpp"

namespace rput {
namespace uploader {

/**
 * Resumable Uploader - splits a file into 4MB blocks and uploads them in parallel
 *
 * Features:
 * - One task per block on a shared, bounded worker pool
 * - Independent per-block retries; a failed block never aborts its siblings
 * - Resume by passing back the progress sequence of a failed call
 * - Finalize (makeFile) only once every block has succeeded
 *
 * Usage:
 *   ResumableUploader uploader(factory);
 *   PutExtra extra;
 *   PutRet ret;
 *   auto status = uploader.putFile(ret, uptoken, "videos/a.mp4", "/data/a.mp4", &extra);
 *   if (!status.ok()) {
 *     // persist extra.progresses and call putFile again later with it
 *   }
 *
 * Do not call put*() from a task running on the same worker pool: the call
 * blocks until its own block tasks have run.
 */
class ResumableUploader {
public:
  /**
   * @param factory Builds the token-scoped transport for each put
   * @param pool Worker pool to schedule block tasks on; nullptr selects defaultWorkerPool()
   * @param retry Backoff between block attempts; try_times is taken from each call instead
   */
  explicit ResumableUploader(
    std::shared_ptr<ITransportFactory> factory, WorkerPool* pool = nullptr,
    const RetryConfig& retry = {}
  );

  /**
   * Upload fsize bytes from reader under key
   *
   * @param ret Finalize result, set on success
   * @param uptoken Upload token
   * @param key Object key
   * @param reader Source of the file bytes; must outlive the call
   * @param fsize Number of bytes to upload
   * @param extra Optional call options; progresses is updated in place and
   *              stays valid for a resume after a failure
   */
  PutStatus put(
    PutRet& ret, const std::string& uptoken, const std::string& key, const IReaderAt& reader,
    int64_t fsize, PutExtra* extra = nullptr
  );

  /**
   * Same as put(), the server assigns the object key
   */
  PutStatus putWithoutKey(
    PutRet& ret, const std::string& uptoken, const IReaderAt& reader, int64_t fsize,
    PutExtra* extra = nullptr
  );

  /**
   * Upload a local file under key
   */
  PutStatus putFile(
    PutRet& ret, const std::string& uptoken, const std::string& key, const std::string& local_file,
    PutExtra* extra = nullptr
  );

  PutStatus putFileWithoutKey(
    PutRet& ret, const std::string& uptoken, const std::string& local_file,
    PutExtra* extra = nullptr
  );

private:
  PutStatus rput(
    PutRet& ret, const std::string& uptoken, const std::string& key, bool has_key,
    const IReaderAt& reader, int64_t fsize, PutExtra* extra
  );

  PutStatus rputFile(
    PutRet& ret, const std::string& uptoken, const std::string& key, bool has_key,
    const std::string& local_file, PutExtra* extra
  );

  std::shared_ptr<ITransportFactory> factory_;
  WorkerPool* pool_;
  RetryConfig retry_;
};

}  // namespace uploader
}  // namespace rput

#endif  // RPUT_RESUMABLE_UPLOADER_HPP
