#include "cache/sparse_file.h"
#include "utilities/errors.h"
#include "utilities/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace gutex {

static std::string errnoText(int err) { return std::strerror(err); }

void preallocateFile(const std::string &path, std::int64_t size) {
  int fd = ::open(path.c_str(), O_RDWR | O_CREAT, 0644);
  if (fd < 0)
    throw CacheIoError("Failed to open '" + path + "': " + errnoText(errno));

  int fallocateRet = size > 0 ? posix_fallocate(fd, 0, static_cast<off_t>(size)) : 0;
  if (fallocateRet != 0) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "posix_fallocate for '" + path + "' failed: " +
                                  errnoText(fallocateRet) + ", using ftruncate");
  }
  // ftruncate also shrinks a stale file that was larger than wanted.
  if (ftruncate(fd, static_cast<off_t>(size)) != 0) {
    int err = errno;
    ::close(fd);
    throw CacheIoError("ftruncate of '" + path + "' to " + std::to_string(size) +
                       " failed: " + errnoText(err));
  }
  if (::close(fd) != 0)
    throw CacheIoError("close of '" + path + "' failed: " + errnoText(errno));
}

SparseDataFile::SparseDataFile(const std::string &path) : path_(path) {
  fd_ = ::open(path.c_str(), O_RDWR);
  if (fd_ < 0)
    throw CacheIoError("Failed to open '" + path + "': " + errnoText(errno));
}

SparseDataFile::~SparseDataFile() {
  if (fd_ >= 0)
    ::close(fd_);
}

std::string SparseDataFile::read(std::int64_t offset, std::int64_t length) const {
  std::string out(static_cast<std::size_t>(length), '\0');
  std::size_t done = 0;
  while (done < out.size()) {
    ssize_t n = ::pread(fd_, out.data() + done, out.size() - done,
                        static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw CacheIoError("pread on '" + path_ + "' failed: " + errnoText(errno));
    }
    if (n == 0)
      throw CacheIoError("Short read on '" + path_ + "' at offset " +
                         std::to_string(offset + done));
    done += static_cast<std::size_t>(n);
  }
  return out;
}

void SparseDataFile::write(std::int64_t offset, const std::string &data) {
  std::size_t done = 0;
  while (done < data.size()) {
    ssize_t n = ::pwrite(fd_, data.data() + done, data.size() - done,
                         static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw CacheIoError("pwrite on '" + path_ + "' failed: " + errnoText(errno));
    }
    done += static_cast<std::size_t>(n);
  }
  if (::fdatasync(fd_) != 0)
    throw CacheIoError("fdatasync on '" + path_ + "' failed: " + errnoText(errno));
}

std::int64_t SparseDataFile::size() const {
  struct stat st {};
  if (::fstat(fd_, &st) != 0)
    throw CacheIoError("fstat on '" + path_ + "' failed: " + errnoText(errno));
  return static_cast<std::int64_t>(st.st_size);
}

std::string readWholeFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    throw CacheIoError("Cannot open '" + path + "'");
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad())
    throw CacheIoError("Read of '" + path + "' failed");
  return ss.str();
}

void writeFileAtomic(const std::string &path, const std::string &data) {
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
      throw CacheIoError("Cannot create '" + tmp + "'");
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out)
      throw CacheIoError("Write of '" + tmp + "' failed");
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec)
    throw CacheIoError("Rename of '" + tmp + "' failed: " + ec.message());
}

} // namespace gutex
