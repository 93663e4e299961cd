#pragma once

#include <string>

namespace gutex {

/** Override the cache root (tests, --config). */
void setCacheRoot(const std::string &dir);
const std::string &getCacheRoot();

std::string logsDir();
std::string sparseCacheDir();
std::string mirrorListPath();

} // namespace gutex
