#pragma once
#ifndef GUTEX_MIRROR_UPSTREAM_H
#define GUTEX_MIRROR_UPSTREAM_H

#include "cache/upstream_fetcher.h"
#include "mirror/origin_racer.h"

#include <memory>

namespace gutex {

/**
 * @brief Serves SparseCache misses from the mirror network.
 */
class MirrorUpstream : public UpstreamFetcher {
public:
  explicit MirrorUpstream(std::shared_ptr<OriginRacer> racer);

  UpstreamHead head(const std::string &resourceId) override;

  /**
   * A mirror that ignores Range answers 200 with the whole file; the
   * requested window is cut out of it.
   */
  std::string getRange(const std::string &resourceId, std::int64_t startByte,
                       std::int64_t endByte) override;

private:
  std::shared_ptr<OriginRacer> racer_;
};

} // namespace gutex

#endif // GUTEX_MIRROR_UPSTREAM_H
