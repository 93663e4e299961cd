#include "mirror/mirror_transport.h"
#include "utilities/errors.h"
#include "utilities/logger.h"

namespace gutex {

HttpTransport::HttpTransport(int maxRedirects) : maxRedirects_(maxRedirects) {}

HTTP::HTTPRESPONSE HttpTransport::send(HTTP::HttpMethod method,
                                       const std::string &url,
                                       const HTTP::HeaderMap &headers,
                                       std::chrono::milliseconds timeout) {
  // The deadline covers the whole redirect chain.
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::string current = url;
  for (int hop = 0;; ++hop) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0)
      throw TimeoutError("Request to " + url + " timed out after " +
                         std::to_string(timeout.count()) + "ms");

    HTTP::HTTPREQUEST request;
    request.method = method;
    request.headers = headers;
    HTTP::HTTPRESPONSE response =
        HTTP::Client::Send(request, HTTP::ParseUrl(current), remaining);

    const int status = response.statusCodeNumber;
    if (status < 300 || status >= 400 || status == 304)
      return response;

    auto location = HTTP::FindHeader(response.headers, "Location");
    if (!location)
      return response;
    if (hop >= maxRedirects_)
      throw GutexError("Too many redirects for " + url);
    current = HTTP::ResolveLocation(current, *location);
    Logger::getInstance().log(LogLevel::TRACE,
                              "Redirect " + std::to_string(status) + " to " + current);
  }
}

} // namespace gutex
