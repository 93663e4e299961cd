#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace gutex {

static std::string cacheRoot = [] {
  const char *env = std::getenv("GUTEX_CACHE_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  const char *home = std::getenv("HOME");
  if (home && home[0] != '\0')
    return (std::filesystem::path(home) / ".cache" / "gutex").string();
  return std::string(".cache/gutex");
}();

void setCacheRoot(const std::string &dir) { cacheRoot = dir; }

const std::string &getCacheRoot() { return cacheRoot; }

std::string logsDir() { return getCacheRoot() + "/logs"; }

std::string sparseCacheDir() { return getCacheRoot() + "/sparse"; }

std::string mirrorListPath() { return getCacheRoot() + "/MIRRORS.ALL"; }

} // namespace gutex
