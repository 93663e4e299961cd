#pragma once
#ifndef GUTEX_MIRROR_TRANSPORT_H
#define GUTEX_MIRROR_TRANSPORT_H

#include "utilities/http.hpp"

#include <chrono>
#include <string>

namespace gutex {

/**
 * @brief Network seam of the OriginRacer.
 *
 * Implementations must be safe to call from several threads at once and
 * must give up after @p timeout by throwing TimeoutError. Any status code
 * is returned as-is; deciding what counts as success is the caller's job.
 */
class MirrorTransport {
public:
  virtual ~MirrorTransport() = default;

  virtual HTTP::HTTPRESPONSE send(HTTP::HttpMethod method,
                                  const std::string &url,
                                  const HTTP::HeaderMap &headers,
                                  std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief MirrorTransport over HTTP::Client, following redirects.
 */
class HttpTransport : public MirrorTransport {
public:
  explicit HttpTransport(int maxRedirects = 3);

  HTTP::HTTPRESPONSE send(HTTP::HttpMethod method, const std::string &url,
                          const HTTP::HeaderMap &headers,
                          std::chrono::milliseconds timeout) override;

private:
  int maxRedirects_;
};

} // namespace gutex

#endif // GUTEX_MIRROR_TRANSPORT_H
