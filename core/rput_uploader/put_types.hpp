// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_PUT_TYPES_HPP
#define RPUT_PUT_TYPES_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace rput {
namespace uploader {

/**
 * Error classification for upload operations
 */
enum class PutErrorCode {
  kOk,
  kInvalidArgument,     // Bad caller input (empty token, no upload host, ...)
  kInvalidPutProgress,  // Progress sequence length does not match the block count
  kPutFailed,           // At least one block failed after exhausting its retries
  kUnmatchedChecksum,   // Server CRC32 or offset disagrees with the bytes sent
  kInvalidContext,      // Server discarded the block context; block restarts from scratch
  kFileError,           // Local file could not be opened or read
  kTransportError,      // No response from the server
  kServerError,         // Server answered with a non-2xx status
  kBadResponse          // Server answered 2xx with an undecodable body
};

inline const char* putErrorCodeToString(PutErrorCode code) {
  switch (code) {
    case PutErrorCode::kOk:
      return "ok";
    case PutErrorCode::kInvalidArgument:
      return "invalid argument";
    case PutErrorCode::kInvalidPutProgress:
      return "invalid put progress";
    case PutErrorCode::kPutFailed:
      return "resumable put failed";
    case PutErrorCode::kUnmatchedChecksum:
      return "unmatched checksum";
    case PutErrorCode::kInvalidContext:
      return "invalid context";
    case PutErrorCode::kFileError:
      return "file error";
    case PutErrorCode::kTransportError:
      return "transport error";
    case PutErrorCode::kServerError:
      return "server error";
    case PutErrorCode::kBadResponse:
      return "bad response";
    default:
      return "unknown";
  }
}

/**
 * Result of a fallible upload operation
 */
struct PutStatus {
  PutErrorCode code = PutErrorCode::kOk;
  std::string message;
  int http_code = 0;  // HTTP status when the error came from the server

  bool ok() const {
    return code == PutErrorCode::kOk;
  }

  static PutStatus Ok() {
    return {};
  }

  static PutStatus Failure(PutErrorCode code, const std::string& message = "", int http_code = 0) {
    PutStatus status;
    status.code = code;
    status.message = message.empty() ? putErrorCodeToString(code) : message;
    status.http_code = http_code;
    return status;
  }
};

inline std::ostream& operator<<(std::ostream& os, const PutStatus& status) {
  os << putErrorCodeToString(status.code);
  if (!status.message.empty() && status.message != putErrorCodeToString(status.code)) {
    os << ": " << status.message;
  }
  if (status.http_code != 0) {
    os << " (http " << status.http_code << ")";
  }
  return os;
}

/**
 * Server-side state of one block, as returned by the latest upload attempt.
 * A zero-valued entry means the block has not been started.
 */
struct BlockPutResult {
  std::string ctx;       // Server context token for the block
  std::string checksum;  // Server checksum of the bytes received so far
  uint32_t crc32 = 0;    // CRC32 of the last chunk accepted by the server
  uint32_t offset = 0;   // Bytes of this block the server holds
  std::string host;      // Host to send the next chunk of this block to
};

/**
 * Finalize result
 */
struct PutRet {
  std::string hash;
  std::string key;
  std::string body;  // Raw server response
};

using BlockNotify = std::function<void(int blk_idx, int blk_size, const BlockPutResult& ret)>;
using BlockNotifyErr = std::function<void(int blk_idx, int blk_size, const PutStatus& err)>;

/**
 * Per-call upload options. Zero values fall back to the process settings.
 *
 * Callbacks are invoked from worker threads, several blocks in parallel.
 */
struct PutExtra {
  std::map<std::string, std::string> params;  // Custom parameters; keys must start with "x:"
  std::string mime_type;
  int chunk_size = 0;
  int try_times = 0;
  std::vector<BlockPutResult> progresses;  // Empty for a fresh upload
  BlockNotify notify;
  BlockNotifyErr notify_err;
};

}  // namespace uploader
}  // namespace rput

#endif  // RPUT_PUT_TYPES_HPP
