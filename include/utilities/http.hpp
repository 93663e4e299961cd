#pragma once
#ifndef GUTEX_HTTP_HPP
#define GUTEX_HTTP_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace gutex {

std::string trim(const std::string &str);

namespace HTTP {

enum class HttpMethod { GET, HEAD, INVALID };

HttpMethod StringToHttpMethod(const std::string &methodStr);
std::string HttpMethodToString(HttpMethod method);

/// Header map. Names are stored as received; use FindHeader for lookups.
using HeaderMap = std::unordered_map<std::string, std::string>;

struct HTTPREQUEST {
  HttpMethod method = HttpMethod::GET;
  std::string uri;
  std::string protocol = "HTTP/1.1";
  HeaderMap headers;
  std::string body;
};

struct HTTPRESPONSE {
  std::string protocol;
  int statusCodeNumber = 0;
  std::string reasonPhrase;
  std::string contentType;
  HeaderMap headers;
  std::string body;
  /// Final URL after redirects were followed.
  std::string url;
};

/**
 * @brief Components of an absolute http(s) URL.
 */
struct Url {
  std::string scheme; ///< "http" or "https"
  std::string host;
  std::string port;   ///< Always filled, defaults by scheme
  std::string target; ///< Path plus query, at least "/"

  std::string toString() const;
};

/**
 * @brief Parse an absolute http:// or https:// URL.
 * @throw std::invalid_argument for any other scheme or a missing host.
 */
Url ParseUrl(const std::string &url);

/**
 * @brief Resolve a redirect Location against the URL that produced it.
 *
 * Handles absolute URLs, scheme-relative ("//host/x"), absolute paths and
 * paths relative to the current directory.
 */
std::string ResolveLocation(const std::string &baseUrl,
                            const std::string &location);

/** Case-insensitive header lookup. */
std::optional<std::string> FindHeader(const HeaderMap &headers,
                                      const std::string &name);

/** "bytes=<start>-<end>" for an inclusive range. */
std::string FormatRangeHeader(std::int64_t start, std::int64_t end);

std::string GenerateHttpRequestString(const HTTPREQUEST &request);
HTTPRESPONSE ParseHttpResponse(const std::string &responseStr);

/**
 * @brief Minimal blocking HTTP/1.1 client.
 *
 * One connection per request (`Connection: close`), whole response read
 * into memory, TLS with peer verification for https. Every call carries a
 * deadline covering resolve, connect, handshake, write and read.
 */
class Client {
public:
  /**
   * @brief Send @p request to @p url.
   * @throw TimeoutError if the deadline expires.
   * @throw GutexError on resolve/connect/TLS/read failures.
   */
  static HTTPRESPONSE Send(HTTPREQUEST request, const Url &url,
                           std::chrono::milliseconds timeout);
};

} // namespace HTTP
} // namespace gutex

#endif // GUTEX_HTTP_HPP
