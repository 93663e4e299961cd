#include "mirror/mirror_upstream.h"
#include "utilities/errors.h"

#include <stdexcept>

namespace gutex {

MirrorUpstream::MirrorUpstream(std::shared_ptr<OriginRacer> racer)
    : racer_(std::move(racer)) {
  if (!racer_)
    throw std::invalid_argument("MirrorUpstream requires an OriginRacer");
}

UpstreamHead MirrorUpstream::head(const std::string &resourceId) {
  auto result = racer_->headWithFallback(resourceId);
  return UpstreamHead{result.contentLength, result.etag, result.lastModified};
}

std::string MirrorUpstream::getRange(const std::string &resourceId,
                                     std::int64_t startByte,
                                     std::int64_t endByte) {
  if (startByte < 0 || endByte < startByte)
    throw std::invalid_argument("Invalid byte range " + std::to_string(startByte) +
                                "-" + std::to_string(endByte));
  GetOptions options;
  options.range = std::make_pair(startByte, endByte);
  auto result = racer_->getWithFallback(resourceId, options);

  if (result.statusCode == 200) {
    if (static_cast<std::int64_t>(result.body.size()) <= startByte)
      return "";
    return result.body.substr(static_cast<std::size_t>(startByte),
                              static_cast<std::size_t>(endByte - startByte + 1));
  }
  return std::move(result.body);
}

} // namespace gutex
