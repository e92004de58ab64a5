// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "resumable_uploader.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>

#include "block_layout.hpp"
#include "put_settings.hpp"
#include "uploader_impl.hpp"

#define RPUT_LOG_COMPONENT "resumable_uploader"
#include <rput_log_macros.hpp>

namespace rput {
namespace uploader {

using logging::kv;

namespace {

// Counts block task completions; wait() returns once every block has reported
class CompletionLatch {
public:
  explicit CompletionLatch(int count)
      : remaining_(count) {}

  void countDown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (--remaining_ <= 0) {
      cv_.notify_all();
    }
  }

  void wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return remaining_ <= 0; });
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  int remaining_;
};

// Reports a block completion even if a callback throws
class CountDownGuard {
public:
  explicit CountDownGuard(CompletionLatch& latch)
      : latch_(latch) {}
  ~CountDownGuard() {
    latch_.countDown();
  }

  CountDownGuard(const CountDownGuard&) = delete;
  CountDownGuard& operator=(const CountDownGuard&) = delete;

private:
  CompletionLatch& latch_;
};

}  // namespace

ResumableUploader::ResumableUploader(
  std::shared_ptr<ITransportFactory> factory, WorkerPool* pool, const RetryConfig& retry
)
    : factory_(std::move(factory))
    , pool_(pool)
    , retry_(retry) {}

PutStatus ResumableUploader::put(
  PutRet& ret, const std::string& uptoken, const std::string& key, const IReaderAt& reader,
  int64_t fsize, PutExtra* extra
) {
  return rput(ret, uptoken, key, true, reader, fsize, extra);
}

PutStatus ResumableUploader::putWithoutKey(
  PutRet& ret, const std::string& uptoken, const IReaderAt& reader, int64_t fsize, PutExtra* extra
) {
  return rput(ret, uptoken, "", false, reader, fsize, extra);
}

PutStatus ResumableUploader::putFile(
  PutRet& ret, const std::string& uptoken, const std::string& key, const std::string& local_file,
  PutExtra* extra
) {
  return rputFile(ret, uptoken, key, true, local_file, extra);
}

PutStatus ResumableUploader::putFileWithoutKey(
  PutRet& ret, const std::string& uptoken, const std::string& local_file, PutExtra* extra
) {
  return rputFile(ret, uptoken, "", false, local_file, extra);
}

PutStatus ResumableUploader::rput(
  PutRet& ret, const std::string& uptoken, const std::string& key, bool has_key,
  const IReaderAt& reader, int64_t fsize, PutExtra* extra
) {
  WorkerPool& pool = pool_ ? *pool_ : defaultWorkerPool();

  if (fsize < 0) {
    return PutStatus::Failure(PutErrorCode::kInvalidArgument, "negative file size");
  }
  if (!factory_) {
    return PutStatus::Failure(PutErrorCode::kInvalidArgument, "no transport factory");
  }

  const int blk_cnt = blockCount(fsize);

  PutExtra local_extra;
  if (extra == nullptr) {
    extra = &local_extra;
  }
  if (extra->progresses.empty()) {
    extra->progresses.resize(blk_cnt);
  } else if (extra->progresses.size() != static_cast<size_t>(blk_cnt)) {
    RPUT_LOG_ERROR(
      "Progress length does not match block count" << kv("progresses", extra->progresses.size())
                                                   << kv("blocks", blk_cnt)
    );
    return PutStatus::Failure(PutErrorCode::kInvalidPutProgress);
  }

  Settings defaults = settings();
  if (extra->chunk_size == 0) {
    extra->chunk_size = defaults.chunk_size;
  }
  if (extra->try_times == 0) {
    extra->try_times = defaults.try_times;
  }
  if (!extra->notify) {
    extra->notify = [](int, int, const BlockPutResult&) {};
  }
  if (!extra->notify_err) {
    extra->notify_err = [](int, int, const PutStatus&) {};
  }

  const std::string log_key = has_key ? key : std::string("<server-assigned>");
  RPUT_LOG_SCOPED_KEY(log_key);

  PutStatus status;
  std::shared_ptr<IUploadTransport> transport = factory_->create(uptoken, status);
  if (!transport) {
    if (status.ok()) {
      status = PutStatus::Failure(PutErrorCode::kTransportError, "transport factory returned none");
    }
    RPUT_LOG_ERROR("Cannot create upload transport" << kv("error", status.message));
    return status;
  }

  RetryConfig retry_config = retry_;
  retry_config.try_times = extra->try_times;
  const RetryHandler retry(retry_config);

  RPUT_LOG_DEBUG("Starting resumable put" << kv("fsize", fsize) << kv("blocks", blk_cnt));

  CompletionLatch latch(blk_cnt);
  std::atomic<int> nfails{0};

  for (int blk_idx = 0; blk_idx < blk_cnt; ++blk_idx) {
    const int blk_size = blockSize(blk_idx, fsize);

    auto task = [&, blk_idx, blk_size] {
      CountDownGuard done(latch);
      // Scoped attributes are per thread; tag the worker's records too
      RPUT_LOG_SCOPED_KEY(log_key);

      PutStatus result = retry.run(
        [&] {
          return transport->putBlock(extra->progresses[blk_idx], reader, blk_idx, blk_size, *extra);
        },
        [&](int attempts_made, const PutStatus& err) {
          RPUT_LOG_INFO(
            "Retrying block" << kv("block", blk_idx) << kv("attempt", attempts_made + 1)
                             << kv("error", err.message)
          );
        }
      );

      if (!result.ok()) {
        RPUT_LOG_WARN(
          "Block failed" << kv("block", blk_idx) << kv("size", blk_size)
                         << kv("error", result.message)
        );
        nfails.fetch_add(1);
        extra->notify_err(blk_idx, blk_size, result);
      }
    };

    if (!pool.submit(std::move(task))) {
      RPUT_LOG_ERROR("Worker pool is shut down, block not scheduled" << kv("block", blk_idx));
      nfails.fetch_add(1);
      latch.countDown();
    }
  }

  latch.wait();

  if (nfails.load() != 0) {
    RPUT_LOG_ERROR(
      "Resumable put failed" << kv("failed_blocks", nfails.load()) << kv("blocks", blk_cnt)
    );
    return PutStatus::Failure(PutErrorCode::kPutFailed);
  }

  try {
    status = transport->makeFile(ret, key, has_key, fsize, *extra);
  } catch (const std::exception& e) {
    status = PutStatus::Failure(PutErrorCode::kTransportError, e.what());
  }

  if (!status.ok()) {
    RPUT_LOG_ERROR("Finalize failed" << kv("error", status.message));
    return status;
  }

  RPUT_LOG_DEBUG("Resumable put finished" << kv("fsize", fsize) << kv("hash", ret.hash));
  return status;
}

PutStatus ResumableUploader::rputFile(
  PutRet& ret, const std::string& uptoken, const std::string& key, bool has_key,
  const std::string& local_file, PutExtra* extra
) {
  FileReaderAt reader(local_file);
  if (!reader.isOpen()) {
    RPUT_LOG_ERROR("Cannot open local file" << kv("path", local_file));
    return PutStatus::Failure(PutErrorCode::kFileError, "cannot open local file: " + local_file);
  }

  int64_t fsize = reader.size();
  if (fsize < 0) {
    RPUT_LOG_ERROR("Cannot stat local file" << kv("path", local_file));
    return PutStatus::Failure(PutErrorCode::kFileError, "cannot stat local file: " + local_file);
  }

  return rput(ret, uptoken, key, has_key, reader, fsize, extra);
}

}  // namespace uploader
}  // namespace rput
