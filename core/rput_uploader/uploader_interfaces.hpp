// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_UPLOADER_INTERFACES_HPP
#define RPUT_UPLOADER_INTERFACES_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "put_types.hpp"

namespace rput {
namespace uploader {

/**
 * Random-access byte source
 * Blocks are read concurrently, so implementations must be thread-safe.
 */
class IReaderAt {
public:
  virtual ~IReaderAt() = default;

  /**
   * Read up to size bytes starting at an absolute offset
   * @param buffer Destination buffer
   * @param size Number of bytes wanted
   * @param offset Absolute offset in the source
   * @param bytes_read Number of bytes actually read (short only at end of source)
   * @return false on I/O error
   */
  virtual bool readAt(char* buffer, size_t size, int64_t offset, size_t& bytes_read) const = 0;
};

/**
 * Token-scoped session with the object store
 */
class IUploadTransport {
public:
  virtual ~IUploadTransport() = default;

  /**
   * Upload one block, resuming from the state in ret
   *
   * Must be safe to call again with the ret left behind by a failed call.
   *
   * @param ret Block state, updated in place after every server response
   * @param reader Source of the file bytes
   * @param blk_idx Block index
   * @param blk_size Block size in bytes
   * @param extra Call options (chunk_size, try_times and notify are already resolved)
   */
  virtual PutStatus putBlock(
    BlockPutResult& ret, const IReaderAt& reader, int blk_idx, int blk_size, const PutExtra& extra
  ) = 0;

  /**
   * Commit all blocks listed in extra.progresses into one object
   *
   * @param ret Decoded server response
   * @param key Object key, ignored when has_key is false
   * @param has_key false to let the server assign the key
   * @param fsize Total file size
   * @param extra Call options holding the completed progress sequence
   */
  virtual PutStatus makeFile(
    PutRet& ret, const std::string& key, bool has_key, int64_t fsize, const PutExtra& extra
  ) = 0;
};

/**
 * One POST request of the block protocol
 */
struct HttpPost {
  std::string url;
  std::string authorization;
  std::string content_type;
  std::string body;
};

/**
 * Outcome of an HttpPost. sent is false when no HTTP answer was received.
 */
struct HttpReply {
  bool sent = false;
  int http_code = 0;
  std::string body;
  std::string error;  // Client-side failure reason when !sent
};

/**
 * Minimal HTTP client used by the block transport
 */
class IHttpPoster {
public:
  virtual ~IHttpPoster() = default;

  virtual HttpReply post(const HttpPost& request) const = 0;
};

/**
 * Builds an authenticated transport from an upload token
 */
class ITransportFactory {
public:
  virtual ~ITransportFactory() = default;

  /**
   * @param uptoken Upload token
   * @param status Set to the failure reason when nullptr is returned
   */
  virtual std::shared_ptr<IUploadTransport> create(const std::string& uptoken, PutStatus& status) = 0;
};

}  // namespace uploader
}  // namespace rput

#endif  // RPUT_UPLOADER_INTERFACES_HPP
