#pragma once
#ifndef GUTEX_SPARSE_FILE_H
#define GUTEX_SPARSE_FILE_H

#include <cstdint>
#include <string>

namespace gutex {

/**
 * @brief Pre-size @p path to exactly @p size bytes.
 *
 * Tries posix_fallocate first and falls back to ftruncate.
 * @throw CacheIoError if neither succeeds.
 */
void preallocateFile(const std::string &path, std::int64_t size);

/**
 * @brief Random-access handle on a resource's data file.
 *
 * Which regions hold real bytes is known only to the caller's bitmap.
 */
class SparseDataFile {
public:
  /** @throw CacheIoError when the file cannot be opened read/write. */
  explicit SparseDataFile(const std::string &path);
  ~SparseDataFile();

  SparseDataFile(const SparseDataFile &) = delete;
  SparseDataFile &operator=(const SparseDataFile &) = delete;

  /** Read exactly @p length bytes at @p offset; a short read throws. */
  std::string read(std::int64_t offset, std::int64_t length) const;

  /** Write @p data at @p offset and flush it to stable storage. */
  void write(std::int64_t offset, const std::string &data);

  std::int64_t size() const;
  const std::string &path() const { return path_; }

private:
  std::string path_;
  int fd_{-1};
};

/** Whole-file read. @throw CacheIoError when the file cannot be read. */
std::string readWholeFile(const std::string &path);

/** Write to a temp file then rename over @p path. */
void writeFileAtomic(const std::string &path, const std::string &data);

} // namespace gutex

#endif // GUTEX_SPARSE_FILE_H
