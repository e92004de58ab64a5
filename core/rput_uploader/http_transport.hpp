// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_HTTP_TRANSPORT_HPP
#define RPUT_HTTP_TRANSPORT_HPP

#include <memory>
#include <string>

#include "uploader_config.hpp"
#include "uploader_interfaces.hpp"

namespace rput {
namespace uploader {

/**
 * Block upload protocol over HTTP, built on the AWS SDK for C++ HTTP client
 *
 * Each block is created with `POST /mkblk/<blockSize>` carrying its first
 * chunk, then extended with `POST /bput/<ctx>/<offset>` one chunk at a time.
 * `POST /mkfile/<fsize>/...` with the comma-joined block contexts commits
 * the object. Every request carries `Authorization: UpToken <uptoken>`.
 *
 * Features:
 * - Chunk CRC32 verification against the server's answer
 * - Per-chunk retries (extra.try_times) inside one block attempt
 * - Stale block contexts (HTTP 701) reset the block so the next attempt restarts it
 * - One HTTP client shared by all sessions created from the factory
 */
class HttpTransportFactory : public ITransportFactory {
public:
  /**
   * @param config Upload hosts, TLS and timeout settings
   */
  explicit HttpTransportFactory(const TransportConfig& config);
  ~HttpTransportFactory() override;

  // Non-copyable, non-movable
  HttpTransportFactory(const HttpTransportFactory&) = delete;
  HttpTransportFactory& operator=(const HttpTransportFactory&) = delete;
  HttpTransportFactory(HttpTransportFactory&&) = delete;
  HttpTransportFactory& operator=(HttpTransportFactory&&) = delete;

  std::shared_ptr<IUploadTransport> create(const std::string& uptoken, PutStatus& status) override;

  const TransportConfig& config() const;

  class Impl;

private:
  // Shared with every transport so the client outlives the sessions using it
  std::shared_ptr<Impl> impl_;
};

}  // namespace uploader
}  // namespace rput

#endif  // RPUT_HTTP_TRANSPORT_HPP
