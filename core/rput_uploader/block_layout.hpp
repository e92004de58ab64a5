// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_BLOCK_LAYOUT_HPP
#define RPUT_BLOCK_LAYOUT_HPP

#include <cstdint>

namespace rput {
namespace uploader {

/**
 * Fixed block geometry: every block is 4 MiB except the last one,
 * which carries the remainder of the file.
 */
constexpr int BLOCK_BITS = 22;
constexpr int64_t BLOCK_SIZE = int64_t(1) << BLOCK_BITS;
constexpr int64_t BLOCK_MASK = BLOCK_SIZE - 1;

/**
 * Number of blocks needed for a file of fsize bytes (0 for an empty file)
 */
inline int blockCount(int64_t fsize) {
  return static_cast<int>((fsize + BLOCK_MASK) >> BLOCK_BITS);
}

/**
 * Absolute file offset of block blk_idx
 */
inline int64_t blockOffset(int blk_idx) {
  return static_cast<int64_t>(blk_idx) << BLOCK_BITS;
}

/**
 * Size of block blk_idx in a file of fsize bytes
 */
inline int blockSize(int blk_idx, int64_t fsize) {
  if (blk_idx == blockCount(fsize) - 1) {
    return static_cast<int>(fsize - blockOffset(blk_idx));
  }
  return static_cast<int>(BLOCK_SIZE);
}

}  // namespace uploader
}  // namespace rput

#endif  // RPUT_BLOCK_LAYOUT_HPP
