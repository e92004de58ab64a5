// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_UPLOADER_MOCKS_HPP
#define RPUT_UPLOADER_MOCKS_HPP

#include <gmock/gmock.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>

#include "uploader_interfaces.hpp"

namespace rput {
namespace uploader {
namespace test {

/**
 * Mock implementation of IUploadTransport for testing
 */
class MockUploadTransport : public IUploadTransport {
public:
  MOCK_METHOD(
    PutStatus, putBlock,
    (BlockPutResult & ret, const IReaderAt& reader, int blk_idx, int blk_size,
     const PutExtra& extra),
    (override)
  );
  MOCK_METHOD(
    PutStatus, makeFile,
    (PutRet & ret, const std::string& key, bool has_key, int64_t fsize, const PutExtra& extra),
    (override)
  );
};

/**
 * Mock implementation of ITransportFactory for testing
 */
class MockTransportFactory : public ITransportFactory {
public:
  MOCK_METHOD(
    std::shared_ptr<IUploadTransport>, create, (const std::string& uptoken, PutStatus& status),
    (override)
  );
};

/**
 * Mock implementation of IReaderAt for testing
 */
class MockReaderAt : public IReaderAt {
public:
  MOCK_METHOD(
    bool, readAt, (char* buffer, size_t size, int64_t offset, size_t& bytes_read), (const, override)
  );
};

/**
 * Mock implementation of IHttpPoster for testing
 */
class MockHttpPoster : public IHttpPoster {
public:
  MOCK_METHOD(HttpReply, post, (const HttpPost& request), (const, override));
};

/**
 * In-memory reader over a fixed byte string
 */
class MemoryReaderAt : public IReaderAt {
public:
  explicit MemoryReaderAt(std::string data)
      : data_(std::move(data)) {}

  bool readAt(char* buffer, size_t size, int64_t offset, size_t& bytes_read) const override {
    bytes_read = 0;
    if (offset < 0) {
      return false;
    }
    if (static_cast<size_t>(offset) >= data_.size()) {
      return true;
    }
    bytes_read = std::min(size, data_.size() - static_cast<size_t>(offset));
    std::memcpy(buffer, data_.data() + offset, bytes_read);
    return true;
  }

private:
  std::string data_;
};

}  // namespace test
}  // namespace uploader
}  // namespace rput

#endif  // RPUT_UPLOADER_MOCKS_HPP
