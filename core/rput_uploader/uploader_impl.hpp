// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_UPLOADER_IMPL_HPP
#define RPUT_UPLOADER_IMPL_HPP

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <string>

#include "uploader_interfaces.hpp"

namespace rput {
namespace uploader {

/**
 * IReaderAt over a local file using pread(2), so concurrent readers
 * never share a file position.
 */
class FileReaderAt : public IReaderAt {
public:
  explicit FileReaderAt(const std::string& path)
      : fd_(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {}

  ~FileReaderAt() override {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  FileReaderAt(const FileReaderAt&) = delete;
  FileReaderAt& operator=(const FileReaderAt&) = delete;

  bool isOpen() const {
    return fd_ >= 0;
  }

  /**
   * File size in bytes, or -1 if fstat fails
   */
  int64_t size() const {
    struct stat st;
    if (fd_ < 0 || ::fstat(fd_, &st) != 0) {
      return -1;
    }
    return static_cast<int64_t>(st.st_size);
  }

  bool readAt(char* buffer, size_t size, int64_t offset, size_t& bytes_read) const override {
    bytes_read = 0;
    while (bytes_read < size) {
      ssize_t n = ::pread(fd_, buffer + bytes_read, size - bytes_read, offset + bytes_read);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
      if (n == 0) {
        break;  // EOF
      }
      bytes_read += static_cast<size_t>(n);
    }
    return true;
  }

private:
  int fd_;
};

}  // namespace uploader
}  // namespace rput

#endif  // RPUT_UPLOADER_IMPL_HPP
