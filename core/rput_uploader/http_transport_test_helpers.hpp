// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_HTTP_TRANSPORT_TEST_HELPERS_HPP
#define RPUT_HTTP_TRANSPORT_TEST_HELPERS_HPP

// This header is for testing only - exposes the protocol encoding
// helpers defined in http_transport.cpp

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "put_types.hpp"
#include "uploader_interfaces.hpp"

namespace rput {
namespace uploader {

/**
 * URL-safe base64 ('-' and '_' alphabet, padded)
 */
std::string encodeUrlSafeBase64(const std::string& data);

/**
 * IEEE CRC32 of a buffer
 */
uint32_t chunkCrc32(const char* data, size_t size);

/**
 * Build the mkfile URL: /mkfile/<fsize>[/mimeType/<b64>][/key/<b64>][/x:name/<b64>...]
 * Params whose name does not start with "x:" are skipped.
 */
std::string buildMakeFileUrlImpl(
  const std::string& up_host, int64_t fsize, const std::string& key, bool has_key,
  const PutExtra& extra
);

/**
 * Comma-joined block contexts in block order
 */
std::string buildMakeFileBodyImpl(const std::vector<BlockPutResult>& progresses);

/**
 * Map an HTTP answer to a status; 701 maps to kInvalidContext
 */
PutStatus statusFromHttpResponseImpl(int http_code, const std::string& body);

/**
 * Decode {ctx, checksum, crc32, offset, host}
 */
PutStatus parseBlockPutResponseImpl(const std::string& body, BlockPutResult& ret);

/**
 * Decode {hash, key}; ret.body keeps the raw response
 */
PutStatus parsePutRetResponseImpl(const std::string& body, PutRet& ret);

/**
 * Block transport session over an arbitrary HTTP client
 * @param poster Sends the requests; HttpTransportFactory passes its AWS SDK client
 * @param up_host Host for mkblk/mkfile and for bput when the server names none
 * @param uptoken Upload token sent as "Authorization: UpToken <uptoken>"
 */
std::shared_ptr<IUploadTransport> createHttpUploadTransportImpl(
  std::shared_ptr<const IHttpPoster> poster, const std::string& up_host, const std::string& uptoken
);

}  // namespace uploader
}  // namespace rput

#endif  // RPUT_HTTP_TRANSPORT_TEST_HELPERS_HPP
