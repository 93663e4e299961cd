#include "cache/bitmap.h"

#include <algorithm>

namespace gutex {

std::int64_t byteToBlock(std::int64_t byteOffset, std::int64_t blockSize) {
  return byteOffset / blockSize;
}

std::int64_t blockToByte(std::int64_t blockIndex, std::int64_t blockSize) {
  return blockIndex * blockSize;
}

std::int64_t totalBlocks(std::int64_t fileSize, std::int64_t blockSize) {
  return (fileSize + blockSize - 1) / blockSize;
}

std::size_t bitmapSize(std::int64_t fileSize, std::int64_t blockSize) {
  return static_cast<std::size_t>((totalBlocks(fileSize, blockSize) + 7) / 8);
}

bool isBlockCached(const Bitmap &bitmap, std::int64_t blockIndex) {
  if (blockIndex < 0)
    return false;
  auto byteIndex = static_cast<std::size_t>(blockIndex / 8);
  if (byteIndex >= bitmap.size())
    return false;
  return (bitmap[byteIndex] >> (blockIndex % 8)) & 1;
}

Bitmap markBlockCached(const Bitmap &bitmap, std::int64_t blockIndex) {
  Bitmap out = bitmap;
  if (blockIndex < 0)
    return out;
  auto byteIndex = static_cast<std::size_t>(blockIndex / 8);
  if (byteIndex < out.size())
    out[byteIndex] |= static_cast<std::uint8_t>(1u << (blockIndex % 8));
  return out;
}

Bitmap markBlockRangeCached(const Bitmap &bitmap, std::int64_t firstBlock,
                            std::int64_t lastBlock) {
  Bitmap out = bitmap;
  const std::int64_t limit = static_cast<std::int64_t>(out.size()) * 8 - 1;
  for (std::int64_t b = std::max<std::int64_t>(firstBlock, 0);
       b <= std::min(lastBlock, limit); ++b)
    out[static_cast<std::size_t>(b / 8)] |= static_cast<std::uint8_t>(1u << (b % 8));
  return out;
}

std::int64_t countCachedBlocks(const Bitmap &bitmap, std::int64_t totalBlocks) {
  std::int64_t count = 0;
  for (std::int64_t b = 0; b < totalBlocks; ++b) {
    if (isBlockCached(bitmap, b))
      ++count;
  }
  return count;
}

std::vector<ByteRange> findUncachedBlockRanges(const Bitmap &bitmap,
                                               std::int64_t start,
                                               std::int64_t end,
                                               std::int64_t blockSize,
                                               std::int64_t maxCoalesceGap) {
  std::vector<ByteRange> ranges;
  if (end < start)
    return ranges;
  const std::int64_t startBlock = byteToBlock(start, blockSize);
  const std::int64_t endBlock = byteToBlock(end, blockSize);
  const std::int64_t maxGapBlocks = (maxCoalesceGap + blockSize - 1) / blockSize;

  std::int64_t rangeStart = -1;
  std::int64_t lastUncached = -1;
  auto close = [&] {
    ranges.push_back({blockToByte(rangeStart, blockSize),
                      blockToByte(lastUncached + 1, blockSize) - 1});
    rangeStart = -1;
    lastUncached = -1;
  };

  for (std::int64_t block = startBlock; block <= endBlock; ++block) {
    if (!isBlockCached(bitmap, block)) {
      if (rangeStart < 0)
        rangeStart = block;
      lastUncached = block;
    } else if (rangeStart >= 0 && block - lastUncached > maxGapBlocks) {
      close();
    }
  }
  if (rangeStart >= 0)
    close();
  return ranges;
}

std::vector<ByteRange> coalesceRanges(std::vector<ByteRange> ranges,
                                      std::int64_t maxGap) {
  if (ranges.empty())
    return ranges;
  std::sort(ranges.begin(), ranges.end(),
            [](const ByteRange &a, const ByteRange &b) { return a.start < b.start; });
  std::vector<ByteRange> out{ranges.front()};
  for (std::size_t i = 1; i < ranges.size(); ++i) {
    ByteRange &last = out.back();
    if (ranges[i].start <= last.end + maxGap + 1)
      last.end = std::max(last.end, ranges[i].end);
    else
      out.push_back(ranges[i]);
  }
  return out;
}

} // namespace gutex
