#pragma once
#ifndef GUTEX_BITMAP_H
#define GUTEX_BITMAP_H

#include <cstdint>
#include <vector>

/**
 * @file bitmap.h
 * @brief Block presence bitmap. Pure functions over a byte buffer.
 *
 * Bit i lives in byte i / 8 at position i % 8 (LSB first).
 */

namespace gutex {

using Bitmap = std::vector<std::uint8_t>;

struct ByteRange {
  std::int64_t start{0}; ///< Inclusive
  std::int64_t end{0};   ///< Inclusive

  bool operator==(const ByteRange &o) const {
    return start == o.start && end == o.end;
  }
  std::int64_t length() const { return end - start + 1; }
};

std::int64_t byteToBlock(std::int64_t byteOffset, std::int64_t blockSize);
/** First byte of @p blockIndex. */
std::int64_t blockToByte(std::int64_t blockIndex, std::int64_t blockSize);
std::int64_t totalBlocks(std::int64_t fileSize, std::int64_t blockSize);
/** Bytes needed to hold one bit per block of a @p fileSize file. */
std::size_t bitmapSize(std::int64_t fileSize, std::int64_t blockSize);

/** Out-of-range indices read as not cached. */
bool isBlockCached(const Bitmap &bitmap, std::int64_t blockIndex);

/** @return Copy of @p bitmap with @p blockIndex set; out-of-range is a no-op. */
Bitmap markBlockCached(const Bitmap &bitmap, std::int64_t blockIndex);

/** @return Copy of @p bitmap with blocks [first, last] set. */
Bitmap markBlockRangeCached(const Bitmap &bitmap, std::int64_t firstBlock,
                            std::int64_t lastBlock);

std::int64_t countCachedBlocks(const Bitmap &bitmap, std::int64_t totalBlocks);

/**
 * @brief Byte ranges inside [start, end] whose blocks are not cached.
 *
 * Ranges are block aligned. Two missing runs separated by at most
 * @p maxCoalesceGap bytes of cached blocks are merged into one range.
 */
std::vector<ByteRange> findUncachedBlockRanges(const Bitmap &bitmap,
                                               std::int64_t start,
                                               std::int64_t end,
                                               std::int64_t blockSize,
                                               std::int64_t maxCoalesceGap = 0);

/** Merge ranges that overlap or touch. Input order does not matter. */
std::vector<ByteRange> coalesceRanges(std::vector<ByteRange> ranges,
                                      std::int64_t maxGap = 0);

} // namespace gutex

#endif // GUTEX_BITMAP_H
